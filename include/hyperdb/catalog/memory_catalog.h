#ifndef HYPERDB_CATALOG_MEMORY_CATALOG_H_
#define HYPERDB_CATALOG_MEMORY_CATALOG_H_

#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include "hyperdb/catalog/catalog.h"

namespace hyperdb {
namespace catalog {

/**
 * @brief In-process catalog kept in ordered maps
 *
 * Every call is atomic with respect to other calls. Rows are committed as
 * soon as a call returns.
 */
class MemoryCatalog : public Catalog {
public:
    explicit MemoryCatalog(std::string root_endpoint = "local");

    core::Result<void> add_hypertable(const Hypertable& hypertable) override;
    core::Result<Hypertable> get_hypertable(const std::string& name) const override;

    core::Result<Epoch> insert_epoch(const EpochLayout& layout) override;
    core::Result<void> set_epoch_end(core::EpochID id, core::Timestamp end_time) override;
    core::Result<Epoch> get_epoch(core::EpochID id) const override;
    std::vector<Epoch> epochs(const std::string& hypertable_name) const override;

    core::Result<Partition> get_partition(core::PartitionID id) const override;
    std::vector<Partition> partitions(core::EpochID epoch_id) const override;

    core::Result<PartitionReplica> get_partition_replica(core::PartitionReplicaID id) const override;
    std::vector<PartitionReplica> partition_replicas(core::PartitionID partition_id) const override;

    core::Result<Chunk> insert_chunk(const Chunk& chunk,
                                     std::vector<ChunkReplicaNode> nodes) override;
    core::Result<Chunk> get_chunk(core::ChunkID id) const override;
    std::vector<Chunk> chunks(core::PartitionID partition_id) const override;
    core::Result<Chunk> close_chunk(core::ChunkID id, core::Timestamp end_time) override;
    std::vector<ChunkReplicaNode> chunk_replica_nodes(core::ChunkID chunk_id) const override;

    core::Result<PhysicalTarget> distinct_target(const std::string& hypertable_name,
                                                 core::ReplicaID replica_id,
                                                 const std::string& endpoint) const override;
    core::Result<PhysicalTarget> root_target(const std::string& hypertable_name) const override;

    /**
     * @brief Test hook: rewrites a partition's keyspace range in place,
     * simulating a catalog that changed underneath a running insert
     */
    core::Result<void> override_partition_range(core::PartitionID id,
                                                core::Keyspace keyspace_start,
                                                core::Keyspace keyspace_end);

private:
    std::string root_endpoint_;

    std::map<std::string, Hypertable> hypertables_;
    std::map<core::EpochID, Epoch> epochs_;
    std::map<core::PartitionID, Partition> partitions_;
    std::map<core::PartitionReplicaID, PartitionReplica> partition_replicas_;
    std::map<core::ChunkID, Chunk> chunks_;
    std::multimap<core::ChunkID, ChunkReplicaNode> chunk_replica_nodes_;

    core::EpochID next_epoch_id_ = 1;
    core::PartitionID next_partition_id_ = 1;
    core::PartitionReplicaID next_partition_replica_id_ = 1;
    core::ChunkID next_chunk_id_ = 1;

    mutable std::shared_mutex mutex_;
};

} // namespace catalog
} // namespace hyperdb

#endif // HYPERDB_CATALOG_MEMORY_CATALOG_H_
