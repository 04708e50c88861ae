#ifndef HYPERDB_CATALOG_CATALOG_H_
#define HYPERDB_CATALOG_CATALOG_H_

#include <optional>
#include <string>
#include <vector>

#include "hyperdb/core/types.h"
#include "hyperdb/core/result.h"

namespace hyperdb {
namespace catalog {

/**
 * @brief Logical table partitioned by time and key
 */
struct Hypertable {
    std::string name;
    std::string time_column_name;
    std::vector<core::ColumnDescriptor> columns;

    core::ColumnType time_column_type() const;

    /**
     * @brief Builds the runtime schema descriptor; throws
     * InvalidArgumentError if the time column is not among the columns
     */
    core::RowSchema schema() const;
};

/**
 * @brief Time-bounded partitioning scheme of a hypertable
 *
 * Covers [start_time, end_time); a missing bound is unbounded.
 */
struct Epoch {
    core::EpochID id = 0;
    std::string hypertable_name;
    std::string partitioning_func;
    std::string partitioning_column;
    core::Keyspace partitioning_mod = 0;
    std::optional<core::Timestamp> start_time;
    std::optional<core::Timestamp> end_time;

    bool is_open() const { return !end_time.has_value(); }
    bool contains(core::Timestamp time) const;
    bool overlaps(const Epoch& other) const;
    std::string to_string() const;
};

/**
 * @brief Keyspace shard of one epoch, inclusive range [keyspace_start, keyspace_end]
 */
struct Partition {
    core::PartitionID id = 0;
    core::EpochID epoch_id = 0;
    core::Keyspace keyspace_start = 0;
    core::Keyspace keyspace_end = 0;

    bool contains(core::Keyspace key) const {
        return key >= keyspace_start && key <= keyspace_end;
    }
};

/**
 * @brief One physical copy set of a partition
 */
struct PartitionReplica {
    core::PartitionReplicaID id = 0;
    core::PartitionID partition_id = 0;
    std::string hypertable_name;
    core::ReplicaID replica_id = 0;
    std::string endpoint;       // node hosting this replica
};

/**
 * @brief Time-bounded storage segment of a partition
 *
 * Covers [start_time, end_time). An open chunk has no end_time; once closed
 * its range never changes.
 */
struct Chunk {
    core::ChunkID id = 0;
    core::PartitionID partition_id = 0;
    std::optional<core::Timestamp> start_time;
    std::optional<core::Timestamp> end_time;
    bool closed = false;

    bool contains(core::Timestamp time) const;
    std::string to_string() const;
};

/**
 * @brief Opaque location of a physical table on an endpoint
 */
struct PhysicalTarget {
    std::string endpoint;
    std::string schema_name;
    std::string table_name;

    std::string to_string() const;

    bool operator==(const PhysicalTarget& other) const;
    bool operator!=(const PhysicalTarget& other) const { return !(*this == other); }
    bool operator<(const PhysicalTarget& other) const;
};

/**
 * @brief Placement of one chunk on one partition replica
 */
struct ChunkReplicaNode {
    core::ChunkID chunk_id = 0;
    core::PartitionReplicaID partition_replica_id = 0;
    PhysicalTarget target;
};

/**
 * @brief A partition together with the replicas it is created with
 */
struct PartitionLayout {
    Partition partition;
    std::vector<PartitionReplica> replicas;
};

/**
 * @brief An epoch together with the partitions it is created with
 */
struct EpochLayout {
    Epoch epoch;
    std::vector<PartitionLayout> partitions;
};

/**
 * @brief Catalog service interface
 *
 * Lookups are transactionally consistent with the caller's unit of work.
 * List operations return their rows ordered by id, except epochs() and
 * chunks() which are ordered by start time.
 */
class Catalog {
public:
    virtual ~Catalog() = default;

    // Hypertables
    virtual core::Result<void> add_hypertable(const Hypertable& hypertable) = 0;
    virtual core::Result<Hypertable> get_hypertable(const std::string& name) const = 0;

    // Epochs
    /**
     * @brief Inserts an epoch with its partitions and partition replicas in
     * one step. Ids in the layout are ignored and assigned by the catalog.
     */
    virtual core::Result<Epoch> insert_epoch(const EpochLayout& layout) = 0;
    virtual core::Result<void> set_epoch_end(core::EpochID id, core::Timestamp end_time) = 0;
    virtual core::Result<Epoch> get_epoch(core::EpochID id) const = 0;
    virtual std::vector<Epoch> epochs(const std::string& hypertable_name) const = 0;

    // Partitions and their replicas
    virtual core::Result<Partition> get_partition(core::PartitionID id) const = 0;
    virtual std::vector<Partition> partitions(core::EpochID epoch_id) const = 0;

    virtual core::Result<PartitionReplica> get_partition_replica(core::PartitionReplicaID id) const = 0;
    virtual std::vector<PartitionReplica> partition_replicas(core::PartitionID partition_id) const = 0;

    // Chunks
    /**
     * @brief Inserts a chunk together with its replica nodes in one step.
     * The chunk_id of each node is filled in with the new chunk's id.
     */
    virtual core::Result<Chunk> insert_chunk(const Chunk& chunk,
                                             std::vector<ChunkReplicaNode> nodes) = 0;
    virtual core::Result<Chunk> get_chunk(core::ChunkID id) const = 0;
    virtual std::vector<Chunk> chunks(core::PartitionID partition_id) const = 0;

    /**
     * @brief Marks an open chunk closed at end_time; fails with
     * ALREADY_EXISTS when the chunk is already closed
     */
    virtual core::Result<Chunk> close_chunk(core::ChunkID id, core::Timestamp end_time) = 0;
    virtual std::vector<ChunkReplicaNode> chunk_replica_nodes(core::ChunkID chunk_id) const = 0;

    // Physical side tables
    virtual core::Result<PhysicalTarget> distinct_target(const std::string& hypertable_name,
                                                         core::ReplicaID replica_id,
                                                         const std::string& endpoint) const = 0;
    virtual core::Result<PhysicalTarget> root_target(const std::string& hypertable_name) const = 0;
};

} // namespace catalog
} // namespace hyperdb

#endif // HYPERDB_CATALOG_CATALOG_H_
