#include "hyperdb/router/fanout_router.h"
#include "hyperdb/common/logger.h"
#include <algorithm>
#include <set>
#include <sstream>

namespace hyperdb {
namespace router {

bool RoutingPredicate::matches(const core::RowSchema& schema,
                               const partition::PartitionResolver& resolver,
                               const core::Row& row) const {
    auto time = schema.extract_time(row);
    if (!time.ok() || !time.value()) {
        return false;
    }
    core::Timestamp t = *time.value();
    if (time_start && t < *time_start) {
        return false;
    }
    if (time_end && t >= *time_end) {
        return false;
    }
    auto keyspace = resolver.keyspace_of(epoch, schema, row);
    return keyspace.ok() && partition.contains(keyspace.value());
}

std::string RoutingPredicate::to_string() const {
    std::ostringstream oss;
    oss << "time [" << (time_start ? std::to_string(*time_start) : "unbounded") << ", "
        << (time_end ? std::to_string(*time_end) : "unbounded") << ") and "
        << epoch.partitioning_func << "(" << epoch.partitioning_column << ", "
        << epoch.partitioning_mod << ") between " << partition.keyspace_start
        << " and " << partition.keyspace_end;
    return oss.str();
}

FanoutRouter::FanoutRouter(const catalog::Catalog& catalog,
                           const chunk::ChunkManager& chunks,
                           const partition::PartitionResolver& resolver,
                           replica::ReplicaStore& store,
                           DistinctIndexer& indexer)
    : catalog_(catalog), chunks_(chunks), resolver_(resolver), store_(store), indexer_(indexer) {}

core::Result<RoutingPredicate> FanoutRouter::build_predicate(core::ChunkID chunk_id) const {
    using PredicateResult = core::Result<RoutingPredicate>;

    auto chunk = catalog_.get_chunk(chunk_id);
    if (!chunk.ok()) {
        return PredicateResult::forward(chunk);
    }
    auto partition = catalog_.get_partition(chunk.value().partition_id);
    if (!partition.ok()) {
        return PredicateResult::forward(partition);
    }
    auto epoch = catalog_.get_epoch(partition.value().epoch_id);
    if (!epoch.ok()) {
        return PredicateResult::forward(epoch);
    }

    RoutingPredicate predicate;
    predicate.epoch = epoch.value();
    predicate.partition = partition.value();
    predicate.time_start = chunk.value().start_time;
    predicate.time_end = chunks_.routing_end(chunk.value());

    // Intersect with the epoch window
    if (predicate.epoch.start_time &&
        (!predicate.time_start || *predicate.time_start < *predicate.epoch.start_time)) {
        predicate.time_start = predicate.epoch.start_time;
    }
    if (predicate.epoch.end_time &&
        (!predicate.time_end || *predicate.time_end > *predicate.epoch.end_time)) {
        predicate.time_end = predicate.epoch.end_time;
    }
    return PredicateResult(std::move(predicate));
}

core::Result<FanoutResult> FanoutRouter::route(txn::Transaction& txn,
                                               const std::string& hypertable_name,
                                               const core::RowSchema& schema,
                                               staging::StagingBuffer& staging,
                                               const catalog::Chunk& chunk) {
    using FanoutOutcome = core::Result<FanoutResult>;

    auto nodes = catalog_.chunk_replica_nodes(chunk.id);
    if (nodes.empty()) {
        return FanoutOutcome::error("Should never happen: " + chunk.to_string() +
                                    " has no replica nodes", core::Error::Code::INTERNAL);
    }

    FanoutResult outcome;
    outcome.replicas = nodes.size();
    std::set<uint64_t> consumed;

    for (const auto& node : nodes) {
        auto replica = catalog_.get_partition_replica(node.partition_replica_id);
        if (!replica.ok()) {
            return FanoutOutcome::forward(replica);
        }

        // Routing metadata may have changed since the chunk was resolved
        auto predicate = build_predicate(node.chunk_id);
        if (!predicate.ok()) {
            return FanoutOutcome::forward(predicate);
        }

        const RoutingPredicate& p = predicate.value();
        auto matched = staging.select([&](const core::Row& row) {
            return p.matches(schema, resolver_, row);
        });

        std::vector<core::Row> rows;
        rows.reserve(matched.size());
        for (auto& staged : matched) {
            consumed.insert(staged.id);
            rows.push_back(std::move(staged.row));
        }

        auto distinct = indexer_.index(txn, hypertable_name, schema, replica.value(),
                                       node.target.endpoint, rows);
        if (!distinct.ok()) {
            return FanoutOutcome::forward(distinct);
        }
        outcome.distinct_added += distinct.value();

        auto written = store_.apply_batch(node.target, rows, txn);
        if (!written.ok()) {
            return FanoutOutcome::forward(written);
        }
        outcome.replica_inserts += written.value();

        HYPERDB_TRACE("Replica {} of {}: {} rows matching {} into {}",
                      replica.value().replica_id, chunk.to_string(), rows.size(),
                      p.to_string(), node.target.to_string());
    }

    auto removed = staging.erase(std::vector<uint64_t>(consumed.begin(), consumed.end()),
                                 txn, staging::DeleteOrigin::kRouter);
    if (!removed.ok()) {
        return FanoutOutcome::forward(removed);
    }
    outcome.rows_moved = removed.value();
    return FanoutOutcome(outcome);
}

} // namespace router
} // namespace hyperdb
