#ifndef HYPERDB_ROUTER_FANOUT_ROUTER_H_
#define HYPERDB_ROUTER_FANOUT_ROUTER_H_

#include <optional>
#include <string>

#include "hyperdb/catalog/catalog.h"
#include "hyperdb/chunk/chunk_manager.h"
#include "hyperdb/core/types.h"
#include "hyperdb/core/result.h"
#include "hyperdb/partition/partition_resolver.h"
#include "hyperdb/replica/replica_store.h"
#include "hyperdb/router/distinct_indexer.h"
#include "hyperdb/staging/staging_buffer.h"
#include "hyperdb/txn/transaction.h"

namespace hyperdb {
namespace router {

/**
 * @brief Time window and keyspace range that select the staged rows of a chunk
 */
struct RoutingPredicate {
    catalog::Epoch epoch;
    catalog::Partition partition;
    std::optional<core::Timestamp> time_start;  // inclusive
    std::optional<core::Timestamp> time_end;    // exclusive

    bool matches(const core::RowSchema& schema,
                 const partition::PartitionResolver& resolver,
                 const core::Row& row) const;
    std::string to_string() const;
};

struct FanoutResult {
    size_t replicas = 0;
    size_t rows_moved = 0;          // rows removed from staging
    size_t replica_inserts = 0;     // rows written summed over replicas
    size_t distinct_added = 0;
};

/**
 * @brief Moves the staged rows of a resolved chunk into every replica of it
 *
 * For each replica node the routing predicate is rebuilt from the catalog,
 * the matching rows are recorded in the replica's distinct side table and
 * written to the replica's chunk table. Rows are removed from staging once,
 * after all replicas have been written, as a router-origin delete so that no
 * delete hook fires. Everything joins the caller's transaction.
 */
class FanoutRouter {
public:
    FanoutRouter(const catalog::Catalog& catalog,
                 const chunk::ChunkManager& chunks,
                 const partition::PartitionResolver& resolver,
                 replica::ReplicaStore& store,
                 DistinctIndexer& indexer);

    core::Result<FanoutResult> route(txn::Transaction& txn,
                                     const std::string& hypertable_name,
                                     const core::RowSchema& schema,
                                     staging::StagingBuffer& staging,
                                     const catalog::Chunk& chunk);

    /**
     * @brief Reads the chunk, its partition and epoch afresh and derives the
     * predicate from them
     */
    core::Result<RoutingPredicate> build_predicate(core::ChunkID chunk_id) const;

private:
    const catalog::Catalog& catalog_;
    const chunk::ChunkManager& chunks_;
    const partition::PartitionResolver& resolver_;
    replica::ReplicaStore& store_;
    DistinctIndexer& indexer_;
};

} // namespace router
} // namespace hyperdb

#endif // HYPERDB_ROUTER_FANOUT_ROUTER_H_
