#include "hyperdb/partition/epoch_manager.h"
#include "hyperdb/partition/partition_resolver.h"
#include "hyperdb/common/logger.h"
#include <algorithm>

namespace hyperdb {
namespace partition {

EpochManager::EpochManager(catalog::Catalog& catalog,
                           const PartitioningRegistry& registry,
                           const core::PartitioningConfig& config)
    : catalog_(catalog), registry_(registry), config_(config) {}

core::Result<catalog::Epoch> EpochManager::find_epoch(const std::string& hypertable_name,
                                                      core::Timestamp time) const {
    auto result = find_in(catalog_.epochs(hypertable_name), time);
    if (!result.ok()) {
        return core::Result<catalog::Epoch>::error(
            "Should never happen: no epoch of hypertable " + hypertable_name +
            " covers time " + std::to_string(time),
            core::Error::Code::EPOCH_NOT_FOUND);
    }
    return result;
}

core::Result<catalog::Epoch> EpochManager::find_in(const std::vector<catalog::Epoch>& sorted_epochs,
                                                   core::Timestamp time) {
    // First epoch whose start is after time; its predecessor is the only candidate
    auto it = std::upper_bound(sorted_epochs.begin(), sorted_epochs.end(), time,
                               [](core::Timestamp t, const catalog::Epoch& epoch) {
                                   return epoch.start_time && t < *epoch.start_time;
                               });
    if (it != sorted_epochs.begin()) {
        const catalog::Epoch& candidate = *std::prev(it);
        if (candidate.contains(time)) {
            return core::Result<catalog::Epoch>(candidate);
        }
    }
    return core::Result<catalog::Epoch>::error("No epoch covers time " + std::to_string(time),
                                               core::Error::Code::EPOCH_NOT_FOUND);
}

core::Result<catalog::EpochLayout> EpochManager::build_layout(const EpochSpec& spec) const {
    using LayoutResult = core::Result<catalog::EpochLayout>;

    auto hypertable = catalog_.get_hypertable(spec.hypertable_name);
    if (!hypertable.ok()) {
        return LayoutResult::forward(hypertable);
    }

    catalog::EpochLayout layout;
    catalog::Epoch& epoch = layout.epoch;
    epoch.hypertable_name = spec.hypertable_name;
    epoch.start_time = spec.start_time;
    epoch.end_time = spec.end_time;
    epoch.partitioning_func = spec.partitioning_func.empty() ? config_.default_function
                                                             : spec.partitioning_func;
    epoch.partitioning_mod = spec.partitioning_mod > 0 ? spec.partitioning_mod
                                                       : config_.default_modulus;
    epoch.partitioning_column = spec.partitioning_column;

    if (!registry_.has(epoch.partitioning_func)) {
        return LayoutResult::error("Unknown partitioning function " + epoch.partitioning_func,
                                   core::Error::Code::INVALID_ARGUMENT);
    }
    bool has_column = std::any_of(hypertable.value().columns.begin(), hypertable.value().columns.end(),
                                  [&](const core::ColumnDescriptor& column) {
                                      return column.name == epoch.partitioning_column;
                                  });
    if (!has_column) {
        return LayoutResult::error("Partitioning column " + epoch.partitioning_column +
                                   " is not a column of " + spec.hypertable_name,
                                   core::Error::Code::INVALID_ARGUMENT);
    }
    if (epoch.start_time && epoch.end_time && *epoch.end_time <= *epoch.start_time) {
        return LayoutResult::error("Epoch end must be after its start",
                                   core::Error::Code::INVALID_ARGUMENT);
    }
    if (spec.partition_count < 1 || spec.partition_count > epoch.partitioning_mod) {
        return LayoutResult::error("Partition count must be between 1 and the modulus",
                                   core::Error::Code::INVALID_ARGUMENT);
    }
    if (spec.replica_endpoints.empty()) {
        return LayoutResult::error("An epoch needs at least one replica endpoint",
                                   core::Error::Code::INVALID_ARGUMENT);
    }

    auto partitions = PartitionResolver::split_keyspace(epoch.partitioning_mod, spec.partition_count);
    if (!PartitionResolver::tiles_keyspace(partitions, epoch.partitioning_mod)) {
        return LayoutResult::error("Partition layout does not tile the keyspace",
                                   core::Error::Code::INTERNAL);
    }

    for (const auto& partition : partitions) {
        catalog::PartitionLayout partition_layout;
        partition_layout.partition = partition;
        for (size_t i = 0; i < spec.replica_endpoints.size(); ++i) {
            catalog::PartitionReplica replica;
            replica.hypertable_name = spec.hypertable_name;
            replica.replica_id = static_cast<core::ReplicaID>(i + 1);
            replica.endpoint = spec.replica_endpoints[i];
            partition_layout.replicas.push_back(replica);
        }
        layout.partitions.push_back(std::move(partition_layout));
    }
    return LayoutResult(std::move(layout));
}

core::Result<catalog::Epoch> EpochManager::create_epoch(const EpochSpec& spec) {
    auto layout = build_layout(spec);
    if (!layout.ok()) {
        return core::Result<catalog::Epoch>::forward(layout);
    }

    auto epoch = catalog_.insert_epoch(layout.value());
    if (epoch.ok()) {
        HYPERDB_INFO("Created {} for hypertable {} with {} partitions x {} replicas",
                     epoch.value().to_string(), spec.hypertable_name,
                     spec.partition_count, spec.replica_endpoints.size());
    }
    return epoch;
}

core::Result<void> EpochManager::close_epoch(core::EpochID epoch_id, core::Timestamp end_time) {
    auto result = catalog_.set_epoch_end(epoch_id, end_time);
    if (result.ok()) {
        HYPERDB_INFO("Closed epoch {} at {}", epoch_id, end_time);
    }
    return result;
}

core::Result<catalog::Epoch> EpochManager::repartition(const EpochSpec& successor) {
    if (!successor.start_time) {
        return core::Result<catalog::Epoch>::error("A successor epoch needs a start time",
                                                   core::Error::Code::INVALID_ARGUMENT);
    }

    // Validate before closing so a bad successor leaves the current epoch open
    auto layout = build_layout(successor);
    if (!layout.ok()) {
        return core::Result<catalog::Epoch>::forward(layout);
    }

    auto epochs = catalog_.epochs(successor.hypertable_name);
    auto open = std::find_if(epochs.begin(), epochs.end(),
                             [](const catalog::Epoch& epoch) { return epoch.is_open(); });
    if (open != epochs.end()) {
        auto closed = close_epoch(open->id, *successor.start_time);
        if (!closed.ok()) {
            return core::Result<catalog::Epoch>::forward(closed);
        }
    }
    return create_epoch(successor);
}

bool EpochManager::epochs_are_disjoint(const std::vector<catalog::Epoch>& epochs) {
    int open_count = 0;
    for (size_t i = 0; i < epochs.size(); ++i) {
        if (epochs[i].is_open()) {
            ++open_count;
        }
        for (size_t j = i + 1; j < epochs.size(); ++j) {
            if (epochs[i].overlaps(epochs[j])) {
                return false;
            }
        }
    }
    return open_count <= 1;
}

} // namespace partition
} // namespace hyperdb
