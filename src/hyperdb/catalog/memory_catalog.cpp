#include "hyperdb/catalog/memory_catalog.h"
#include <algorithm>
#include <mutex>

namespace hyperdb {
namespace catalog {

namespace {

template<typename T>
core::Result<T> not_found(const std::string& what, int64_t id) {
    return core::Result<T>::error(what + " " + std::to_string(id) + " not found",
                                  core::Error::Code::NOT_FOUND);
}

bool chunk_ranges_overlap(const Chunk& a, const Chunk& b) {
    bool a_before = a.end_time && b.start_time && *a.end_time <= *b.start_time;
    bool b_before = b.end_time && a.start_time && *b.end_time <= *a.start_time;
    return !a_before && !b_before;
}

} // namespace

MemoryCatalog::MemoryCatalog(std::string root_endpoint)
    : root_endpoint_(std::move(root_endpoint)) {}

core::Result<void> MemoryCatalog::add_hypertable(const Hypertable& hypertable) {
    // Building the schema validates the column list
    try {
        hypertable.schema();
    } catch (const core::Error& e) {
        return core::Result<void>(e);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!hypertables_.emplace(hypertable.name, hypertable).second) {
        return core::Result<void>::error("Hypertable " + hypertable.name + " already exists",
                                         core::Error::Code::ALREADY_EXISTS);
    }
    return core::Result<void>();
}

core::Result<Hypertable> MemoryCatalog::get_hypertable(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = hypertables_.find(name);
    if (it == hypertables_.end()) {
        return core::Result<Hypertable>::error("Hypertable " + name + " not found",
                                               core::Error::Code::NOT_FOUND);
    }
    return core::Result<Hypertable>(it->second);
}

core::Result<Epoch> MemoryCatalog::insert_epoch(const EpochLayout& layout) {
    const Epoch& epoch = layout.epoch;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (hypertables_.find(epoch.hypertable_name) == hypertables_.end()) {
        return core::Result<Epoch>::error("Hypertable " + epoch.hypertable_name + " not found",
                                          core::Error::Code::NOT_FOUND);
    }
    if (epoch.start_time && epoch.end_time && *epoch.end_time <= *epoch.start_time) {
        return core::Result<Epoch>::error("Epoch end must be after its start",
                                          core::Error::Code::INVALID_ARGUMENT);
    }

    for (const auto& [id, existing] : epochs_) {
        if (existing.hypertable_name != epoch.hypertable_name) {
            continue;
        }
        if (existing.overlaps(epoch)) {
            return core::Result<Epoch>::error("New epoch overlaps " + existing.to_string(),
                                              core::Error::Code::ALREADY_EXISTS);
        }
        if (existing.is_open() && epoch.is_open()) {
            return core::Result<Epoch>::error("Hypertable " + epoch.hypertable_name +
                                              " already has an open epoch",
                                              core::Error::Code::ALREADY_EXISTS);
        }
    }
    for (const auto& partition_layout : layout.partitions) {
        if (partition_layout.partition.keyspace_start > partition_layout.partition.keyspace_end) {
            return core::Result<Epoch>::error("Partition keyspace start is after its end",
                                              core::Error::Code::INVALID_ARGUMENT);
        }
    }

    Epoch stored = epoch;
    stored.id = next_epoch_id_++;
    epochs_.emplace(stored.id, stored);

    for (const auto& partition_layout : layout.partitions) {
        Partition partition = partition_layout.partition;
        partition.id = next_partition_id_++;
        partition.epoch_id = stored.id;
        partitions_.emplace(partition.id, partition);

        for (const auto& replica_layout : partition_layout.replicas) {
            PartitionReplica replica = replica_layout;
            replica.id = next_partition_replica_id_++;
            replica.partition_id = partition.id;
            replica.hypertable_name = stored.hypertable_name;
            partition_replicas_.emplace(replica.id, replica);
        }
    }
    return core::Result<Epoch>(stored);
}

core::Result<void> MemoryCatalog::set_epoch_end(core::EpochID id, core::Timestamp end_time) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = epochs_.find(id);
    if (it == epochs_.end()) {
        return core::Result<void>::error("Epoch " + std::to_string(id) + " not found",
                                         core::Error::Code::NOT_FOUND);
    }
    if (!it->second.is_open()) {
        return core::Result<void>::error(it->second.to_string() + " is already closed",
                                         core::Error::Code::ALREADY_EXISTS);
    }
    if (it->second.start_time && end_time <= *it->second.start_time) {
        return core::Result<void>::error("Epoch end must be after its start",
                                         core::Error::Code::INVALID_ARGUMENT);
    }

    Epoch candidate = it->second;
    candidate.end_time = end_time;
    for (const auto& [other_id, other] : epochs_) {
        if (other_id != id && other.hypertable_name == candidate.hypertable_name &&
            other.overlaps(candidate)) {
            return core::Result<void>::error("Closed epoch would overlap " + other.to_string(),
                                             core::Error::Code::ALREADY_EXISTS);
        }
    }
    it->second.end_time = end_time;
    return core::Result<void>();
}

core::Result<Epoch> MemoryCatalog::get_epoch(core::EpochID id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = epochs_.find(id);
    if (it == epochs_.end()) {
        return not_found<Epoch>("Epoch", id);
    }
    return core::Result<Epoch>(it->second);
}

std::vector<Epoch> MemoryCatalog::epochs(const std::string& hypertable_name) const {
    std::vector<Epoch> result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [id, epoch] : epochs_) {
            if (epoch.hypertable_name == hypertable_name) {
                result.push_back(epoch);
            }
        }
    }
    // Unbounded starts sort first
    std::sort(result.begin(), result.end(), [](const Epoch& a, const Epoch& b) {
        if (!a.start_time || !b.start_time) {
            return !a.start_time && b.start_time;
        }
        return *a.start_time < *b.start_time;
    });
    return result;
}

core::Result<Partition> MemoryCatalog::get_partition(core::PartitionID id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = partitions_.find(id);
    if (it == partitions_.end()) {
        return not_found<Partition>("Partition", id);
    }
    return core::Result<Partition>(it->second);
}

std::vector<Partition> MemoryCatalog::partitions(core::EpochID epoch_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Partition> result;
    for (const auto& [id, partition] : partitions_) {
        if (partition.epoch_id == epoch_id) {
            result.push_back(partition);
        }
    }
    return result;
}

core::Result<PartitionReplica> MemoryCatalog::get_partition_replica(core::PartitionReplicaID id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = partition_replicas_.find(id);
    if (it == partition_replicas_.end()) {
        return not_found<PartitionReplica>("Partition replica", id);
    }
    return core::Result<PartitionReplica>(it->second);
}

std::vector<PartitionReplica> MemoryCatalog::partition_replicas(core::PartitionID partition_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<PartitionReplica> result;
    for (const auto& [id, replica] : partition_replicas_) {
        if (replica.partition_id == partition_id) {
            result.push_back(replica);
        }
    }
    return result;
}

core::Result<Chunk> MemoryCatalog::insert_chunk(const Chunk& chunk,
                                                std::vector<ChunkReplicaNode> nodes) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (partitions_.find(chunk.partition_id) == partitions_.end()) {
        return not_found<Chunk>("Partition", chunk.partition_id);
    }
    for (const auto& [id, existing] : chunks_) {
        if (existing.partition_id != chunk.partition_id) {
            continue;
        }
        if (chunk_ranges_overlap(existing, chunk)) {
            return core::Result<Chunk>::error("New chunk overlaps " + existing.to_string(),
                                              core::Error::Code::ALREADY_EXISTS);
        }
        if (!existing.closed && !chunk.closed) {
            return core::Result<Chunk>::error("Partition " + std::to_string(chunk.partition_id) +
                                              " already has an open chunk",
                                              core::Error::Code::ALREADY_EXISTS);
        }
    }
    for (const auto& node : nodes) {
        if (partition_replicas_.find(node.partition_replica_id) == partition_replicas_.end()) {
            return not_found<Chunk>("Partition replica", node.partition_replica_id);
        }
    }

    Chunk stored = chunk;
    stored.id = next_chunk_id_++;
    chunks_.emplace(stored.id, stored);
    for (auto& node : nodes) {
        node.chunk_id = stored.id;
        chunk_replica_nodes_.emplace(stored.id, std::move(node));
    }
    return core::Result<Chunk>(stored);
}

core::Result<Chunk> MemoryCatalog::get_chunk(core::ChunkID id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = chunks_.find(id);
    if (it == chunks_.end()) {
        return not_found<Chunk>("Chunk", id);
    }
    return core::Result<Chunk>(it->second);
}

std::vector<Chunk> MemoryCatalog::chunks(core::PartitionID partition_id) const {
    std::vector<Chunk> result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [id, chunk] : chunks_) {
            if (chunk.partition_id == partition_id) {
                result.push_back(chunk);
            }
        }
    }
    std::sort(result.begin(), result.end(), [](const Chunk& a, const Chunk& b) {
        if (!a.start_time || !b.start_time) {
            return !a.start_time && b.start_time;
        }
        return *a.start_time < *b.start_time;
    });
    return result;
}

core::Result<Chunk> MemoryCatalog::close_chunk(core::ChunkID id, core::Timestamp end_time) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = chunks_.find(id);
    if (it == chunks_.end()) {
        return not_found<Chunk>("Chunk", id);
    }
    if (it->second.closed) {
        return core::Result<Chunk>::error(it->second.to_string() + " is already closed",
                                          core::Error::Code::ALREADY_EXISTS);
    }
    if (it->second.start_time && end_time <= *it->second.start_time) {
        return core::Result<Chunk>::error("Chunk end must be after its start",
                                          core::Error::Code::INVALID_ARGUMENT);
    }
    it->second.end_time = end_time;
    it->second.closed = true;
    return core::Result<Chunk>(it->second);
}

std::vector<ChunkReplicaNode> MemoryCatalog::chunk_replica_nodes(core::ChunkID chunk_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ChunkReplicaNode> result;
    auto range = chunk_replica_nodes_.equal_range(chunk_id);
    for (auto it = range.first; it != range.second; ++it) {
        result.push_back(it->second);
    }
    std::sort(result.begin(), result.end(), [](const ChunkReplicaNode& a, const ChunkReplicaNode& b) {
        return a.partition_replica_id < b.partition_replica_id;
    });
    return result;
}

core::Result<PhysicalTarget> MemoryCatalog::distinct_target(const std::string& hypertable_name,
                                                            core::ReplicaID replica_id,
                                                            const std::string& endpoint) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (hypertables_.find(hypertable_name) == hypertables_.end()) {
        return core::Result<PhysicalTarget>::error("Hypertable " + hypertable_name + " not found",
                                                   core::Error::Code::NOT_FOUND);
    }
    PhysicalTarget target;
    target.endpoint = endpoint;
    target.schema_name = "_hyper_distinct";
    target.table_name = hypertable_name + "_" + std::to_string(replica_id) + "_distinct";
    return core::Result<PhysicalTarget>(target);
}

core::Result<PhysicalTarget> MemoryCatalog::root_target(const std::string& hypertable_name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (hypertables_.find(hypertable_name) == hypertables_.end()) {
        return core::Result<PhysicalTarget>::error("Hypertable " + hypertable_name + " not found",
                                                   core::Error::Code::NOT_FOUND);
    }
    PhysicalTarget target;
    target.endpoint = root_endpoint_;
    target.schema_name = "public";
    target.table_name = hypertable_name;
    return core::Result<PhysicalTarget>(target);
}

core::Result<void> MemoryCatalog::override_partition_range(core::PartitionID id,
                                                           core::Keyspace keyspace_start,
                                                           core::Keyspace keyspace_end) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = partitions_.find(id);
    if (it == partitions_.end()) {
        return core::Result<void>::error("Partition " + std::to_string(id) + " not found",
                                         core::Error::Code::NOT_FOUND);
    }
    it->second.keyspace_start = keyspace_start;
    it->second.keyspace_end = keyspace_end;
    return core::Result<void>();
}

} // namespace catalog
} // namespace hyperdb
