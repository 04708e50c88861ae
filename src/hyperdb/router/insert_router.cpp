#include "hyperdb/router/insert_router.h"
#include "hyperdb/common/logger.h"
#include "hyperdb/router/insert_guard.h"

namespace hyperdb {
namespace router {

InsertRouter::InsertRouter(catalog::Catalog& catalog,
                           chunk::ChunkManager& chunks,
                           replica::ReplicaStore& store,
                           const partition::PartitioningRegistry& registry,
                           const core::RouterConfig& config)
    : catalog_(catalog)
    , chunks_(chunks)
    , store_(store)
    , config_(config)
    , resolver_(registry)
    , epochs_(catalog, registry, config.partitioning)
    , indexer_(catalog, store)
    , fanout_(catalog, chunks, resolver_, store, indexer_) {}

core::Result<void> InsertRouter::insert(txn::Transaction& txn,
                                        const std::string& hypertable_name,
                                        staging::StagingBuffer& staging) {
    auto guard = InsertGuard::enter(txn);
    if (!guard.ok()) {
        if (guard.error_code() == core::Error::Code::REENTRANT_INSERT) {
            stats_.reentrant_rejections.fetch_add(1);
            HYPERDB_WARN("Rejected second insert into {} in transaction {}", hypertable_name, txn.id());
            txn.set_rollback_only(guard.error());
        }
        return guard;
    }

    stats_.inserts.fetch_add(1);
    auto result = route_all(txn, hypertable_name, staging);
    if (!result.ok()) {
        stats_.failed_inserts.fetch_add(1);
        HYPERDB_ERROR("Insert into {} failed [{} {}]: {}; aborting transaction {}",
                      hypertable_name, core::state_code(result.error_code()),
                      core::code_name(result.error_code()), result.error(), txn.id());
        txn.set_rollback_only(result.error());
    }
    return result;
}

core::Result<void> InsertRouter::route_all(txn::Transaction& txn,
                                           const std::string& hypertable_name,
                                           staging::StagingBuffer& staging) {
    auto hypertable = catalog_.get_hypertable(hypertable_name);
    if (!hypertable.ok()) {
        return core::Result<void>::forward(hypertable);
    }

    core::RowSchema schema;
    try {
        schema = hypertable.value().schema();
    } catch (const core::Error& e) {
        return core::Result<void>(e);
    }
    if (staging.schema().size() != schema.size()) {
        return core::Result<void>::error("Staged rows do not have the shape of " + hypertable_name,
                                         core::Error::Code::INVALID_ARGUMENT);
    }

    while (true) {
        auto point = next_point(hypertable_name, schema, staging);
        if (!point.ok()) {
            return core::Result<void>::forward(point);
        }
        if (!point.value()) {
            break;
        }
        const RoutePoint& p = *point.value();

        // Probe without the partition lock so the close check runs unlocked
        auto probe = chunks_.get_or_create(p.partition.id, p.time, false);
        if (!probe.ok()) {
            return core::Result<void>::forward(probe);
        }
        stats_.chunk_close_checks.fetch_add(1);
        auto closed = chunks_.close_if_needed(probe.value(), p.time);
        if (!closed.ok()) {
            return core::Result<void>::forward(closed);
        }

        // The chunk may close between the probe and this fetch; accepted for now
        auto chunk = chunks_.get_or_create(p.partition.id, p.time, true);
        if (!chunk.ok()) {
            return core::Result<void>::forward(chunk);
        }

        // A concurrent close can hand back a fresh open chunk whose window
        // ends before this row; close it too and fetch again
        while (chunks_.window_elapsed(chunk.value(), p.time)) {
            auto reclosed = chunks_.close_if_needed(chunk.value(), p.time);
            if (!reclosed.ok()) {
                return core::Result<void>::forward(reclosed);
            }
            chunk = chunks_.get_or_create(p.partition.id, p.time, true);
            if (!chunk.ok()) {
                return core::Result<void>::forward(chunk);
            }
        }

        auto fanout = fanout_.route(txn, hypertable_name, schema, staging, chunk.value());
        if (!fanout.ok()) {
            return core::Result<void>::forward(fanout);
        }
        const FanoutResult& moved = fanout.value();
        if (moved.rows_moved == 0) {
            return core::Result<void>::error("Should never happen: routing to " +
                                             chunk.value().to_string() + " moved no rows",
                                             core::Error::Code::INTERNAL);
        }

        stats_.groups_routed.fetch_add(1);
        stats_.rows_routed.fetch_add(moved.rows_moved);
        stats_.replica_inserts.fetch_add(moved.replica_inserts);
        stats_.distinct_values_added.fetch_add(moved.distinct_added);

        if (config_.log_routed_groups) {
            HYPERDB_DEBUG("Routed {} rows of {} via epoch {} partition {} into {} ({} replicas)",
                          moved.rows_moved, hypertable_name, p.epoch.id, p.partition.id,
                          chunk.value().to_string(), moved.replicas);
        }
    }

    auto unrouted = persist_unrouted(txn, hypertable_name, schema, staging);
    if (!unrouted.ok()) {
        return core::Result<void>::forward(unrouted);
    }
    stats_.rows_unrouted.fetch_add(unrouted.value());
    return core::Result<void>();
}

core::Result<std::optional<InsertRouter::RoutePoint>> InsertRouter::next_point(
    const std::string& hypertable_name,
    const core::RowSchema& schema,
    const staging::StagingBuffer& staging) const {
    using PointResult = core::Result<std::optional<RoutePoint>>;

    // Rows whose time cannot be read are picked too, so their error surfaces
    auto staged = staging.first_where([&](const core::Row& row) {
        auto time = schema.extract_time(row);
        return !time.ok() || time.value().has_value();
    });
    if (!staged) {
        return PointResult(std::optional<RoutePoint>());
    }

    auto time = schema.extract_time(staged->row);
    if (!time.ok()) {
        return PointResult::forward(time);
    }
    core::Timestamp t = *time.value();

    auto epoch = epochs_.find_epoch(hypertable_name, t);
    if (!epoch.ok()) {
        return PointResult::forward(epoch);
    }

    auto partition = resolver_.resolve(epoch.value(), catalog_.partitions(epoch.value().id),
                                       schema, staged->row);
    if (!partition.ok()) {
        return PointResult::forward(partition);
    }

    RoutePoint point{t, epoch.value(), partition.value()};
    return PointResult(std::optional<RoutePoint>(std::move(point)));
}

core::Result<size_t> InsertRouter::persist_unrouted(txn::Transaction& txn,
                                                    const std::string& hypertable_name,
                                                    const core::RowSchema& schema,
                                                    staging::StagingBuffer& staging) {
    auto staged = staging.select([&](const core::Row& row) {
        auto time = schema.extract_time(row);
        return time.ok() && !time.value().has_value();
    });
    if (staged.empty()) {
        return core::Result<size_t>(0);
    }

    auto root = catalog_.root_target(hypertable_name);
    if (!root.ok()) {
        return core::Result<size_t>::forward(root);
    }

    std::vector<core::Row> rows;
    std::vector<uint64_t> ids;
    for (auto& row : staged) {
        ids.push_back(row.id);
        rows.push_back(std::move(row.row));
    }

    auto written = store_.apply_batch(root.value(), rows, txn);
    if (!written.ok()) {
        return written;
    }
    return staging.erase(ids, txn, staging::DeleteOrigin::kRouter);
}

} // namespace router
} // namespace hyperdb
