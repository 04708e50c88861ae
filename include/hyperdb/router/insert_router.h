#ifndef HYPERDB_ROUTER_INSERT_ROUTER_H_
#define HYPERDB_ROUTER_INSERT_ROUTER_H_

#include <optional>
#include <string>

#include "hyperdb/catalog/catalog.h"
#include "hyperdb/chunk/chunk_manager.h"
#include "hyperdb/core/config.h"
#include "hyperdb/core/result.h"
#include "hyperdb/partition/epoch_manager.h"
#include "hyperdb/partition/partition_resolver.h"
#include "hyperdb/replica/replica_store.h"
#include "hyperdb/router/distinct_indexer.h"
#include "hyperdb/router/fanout_router.h"
#include "hyperdb/router/router_stats.h"
#include "hyperdb/staging/staging_buffer.h"
#include "hyperdb/txn/transaction.h"

namespace hyperdb {
namespace router {

/**
 * @brief Write-path entry point of a hypertable
 *
 * Drains a staging buffer into the replicas of the chunks its rows belong
 * to. The staged row first in scan order picks the (epoch, partition,
 * chunk) of the next group; the group is fanned out and the loop repeats
 * until no row with a time value is left. Rows without a time value are
 * then written unrouted to the hypertable's root table.
 *
 * On failure the transaction is marked rollback-only, so nothing the call
 * did survives.
 */
class InsertRouter {
public:
    InsertRouter(catalog::Catalog& catalog,
                 chunk::ChunkManager& chunks,
                 replica::ReplicaStore& store,
                 const partition::PartitioningRegistry& registry,
                 const core::RouterConfig& config = core::RouterConfig::Default());

    InsertRouter(const InsertRouter&) = delete;
    InsertRouter& operator=(const InsertRouter&) = delete;

    core::Result<void> insert(txn::Transaction& txn,
                              const std::string& hypertable_name,
                              staging::StagingBuffer& staging);

    RouterStats get_stats() const { return stats_; }
    std::string get_stats_string() const { return stats_.to_string(); }

    chunk::ChunkManager& chunks() { return chunks_; }
    const partition::EpochManager& epochs() const { return epochs_; }

private:
    struct RoutePoint {
        core::Timestamp time;
        catalog::Epoch epoch;
        catalog::Partition partition;
    };

    core::Result<void> route_all(txn::Transaction& txn,
                                 const std::string& hypertable_name,
                                 staging::StagingBuffer& staging);

    core::Result<std::optional<RoutePoint>> next_point(const std::string& hypertable_name,
                                                       const core::RowSchema& schema,
                                                       const staging::StagingBuffer& staging) const;

    core::Result<size_t> persist_unrouted(txn::Transaction& txn,
                                          const std::string& hypertable_name,
                                          const core::RowSchema& schema,
                                          staging::StagingBuffer& staging);

    catalog::Catalog& catalog_;
    chunk::ChunkManager& chunks_;
    replica::ReplicaStore& store_;
    core::RouterConfig config_;

    partition::PartitionResolver resolver_;
    partition::EpochManager epochs_;
    DistinctIndexer indexer_;
    FanoutRouter fanout_;

    RouterStats stats_;
};

} // namespace router
} // namespace hyperdb

#endif // HYPERDB_ROUTER_INSERT_ROUTER_H_
