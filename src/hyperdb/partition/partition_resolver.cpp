#include "hyperdb/partition/partition_resolver.h"
#include <algorithm>

namespace hyperdb {
namespace partition {

PartitionResolver::PartitionResolver(const PartitioningRegistry& registry)
    : registry_(registry) {}

core::Result<core::Keyspace> PartitionResolver::keyspace_of(const catalog::Epoch& epoch,
                                                            const core::RowSchema& schema,
                                                            const core::Row& row) const {
    auto key = schema.get(row, epoch.partitioning_column);
    if (!key.ok()) {
        return core::Result<core::Keyspace>::forward(key);
    }
    return registry_.apply(epoch.partitioning_func, key.value(), epoch.partitioning_mod);
}

core::Result<catalog::Partition> PartitionResolver::resolve(
    const catalog::Epoch& epoch,
    const std::vector<catalog::Partition>& partitions,
    const core::RowSchema& schema,
    const core::Row& row) const {
    auto keyspace = keyspace_of(epoch, schema, row);
    if (!keyspace.ok()) {
        return core::Result<catalog::Partition>::forward(keyspace);
    }

    auto partition = find(partitions, keyspace.value());
    if (!partition.ok()) {
        return core::Result<catalog::Partition>::error(
            "Should never happen: could not find partition for keyspace value " +
            std::to_string(keyspace.value()) + " in " + epoch.to_string(),
            core::Error::Code::PARTITION_NOT_FOUND);
    }
    return partition;
}

core::Result<catalog::Partition> PartitionResolver::find(
    const std::vector<catalog::Partition>& partitions, core::Keyspace key) {
    for (const auto& partition : partitions) {
        if (partition.contains(key)) {
            return core::Result<catalog::Partition>(partition);
        }
    }
    return core::Result<catalog::Partition>::error(
        "No partition covers keyspace value " + std::to_string(key),
        core::Error::Code::PARTITION_NOT_FOUND);
}

bool PartitionResolver::tiles_keyspace(std::vector<catalog::Partition> partitions,
                                       core::Keyspace modulus) {
    if (partitions.empty() || modulus <= 0) {
        return false;
    }
    std::sort(partitions.begin(), partitions.end(),
              [](const catalog::Partition& a, const catalog::Partition& b) {
                  return a.keyspace_start < b.keyspace_start;
              });

    int64_t next = 0;
    for (const auto& partition : partitions) {
        if (partition.keyspace_start != next || partition.keyspace_end < partition.keyspace_start) {
            return false;
        }
        next = static_cast<int64_t>(partition.keyspace_end) + 1;
    }
    return next == modulus;
}

std::vector<catalog::Partition> PartitionResolver::split_keyspace(core::Keyspace modulus, int count) {
    std::vector<catalog::Partition> result;
    if (modulus <= 0 || count <= 0 || count > modulus) {
        return result;
    }
    result.reserve(count);
    for (int i = 0; i < count; ++i) {
        catalog::Partition partition;
        partition.keyspace_start = static_cast<core::Keyspace>(int64_t(modulus) * i / count);
        partition.keyspace_end = static_cast<core::Keyspace>(int64_t(modulus) * (i + 1) / count - 1);
        result.push_back(partition);
    }
    return result;
}

} // namespace partition
} // namespace hyperdb
