#include "hyperdb/chunk/chunk_manager.h"
#include "hyperdb/common/logger.h"
#include "hyperdb/core/error.h"
#include <algorithm>
#include <limits>

namespace hyperdb {
namespace chunk {

ChunkManager::ChunkManager(catalog::Catalog& catalog,
                           replica::Provisioner& provisioner,
                           const core::ChunkConfig& config)
    : catalog_(catalog), provisioner_(provisioner), config_(config) {
    if (config_.chunk_length <= 0) {
        throw core::InvalidArgumentError("Chunk length must be positive");
    }
}

core::Timestamp ChunkManager::window_index(core::Timestamp time) const {
    core::Timestamp q = time / config_.chunk_length;
    if (time % config_.chunk_length != 0 && time < 0) {
        --q;
    }
    return q;
}

core::Timestamp ChunkManager::window_start(core::Timestamp time) const {
    core::Timestamp q = window_index(time);
    // The first window starts at the bottom of the time domain
    if (q < std::numeric_limits<core::Timestamp>::min() / config_.chunk_length) {
        return std::numeric_limits<core::Timestamp>::min();
    }
    return q * config_.chunk_length;
}

std::optional<core::Timestamp> ChunkManager::window_end(core::Timestamp time) const {
    core::Timestamp q = window_index(time);
    // The last window runs to the top of the time domain
    if (q >= std::numeric_limits<core::Timestamp>::max() / config_.chunk_length) {
        return std::nullopt;
    }
    return (q + 1) * config_.chunk_length;
}

std::optional<core::Timestamp> ChunkManager::routing_end(const catalog::Chunk& chunk) const {
    if (chunk.end_time) {
        return chunk.end_time;
    }
    if (!chunk.start_time) {
        return std::nullopt;
    }
    return window_end(*chunk.start_time);
}

bool ChunkManager::window_elapsed(const catalog::Chunk& chunk, core::Timestamp now) const {
    if (chunk.closed || !chunk.start_time) {
        return false;
    }
    auto end = window_end(*chunk.start_time);
    return end && now >= *end;
}

std::optional<catalog::Chunk> ChunkManager::find_covering(const std::vector<catalog::Chunk>& chunks,
                                                          core::Timestamp timestamp) {
    for (const auto& chunk : chunks) {
        if (chunk.contains(timestamp)) {
            return chunk;
        }
    }
    return std::nullopt;
}

core::Result<catalog::Chunk> ChunkManager::get_or_create(core::PartitionID partition_id,
                                                         core::Timestamp timestamp,
                                                         bool locked) {
    if (locked) {
        auto lock = locks_.acquire(partition_id);
        return create_locked(partition_id, timestamp);
    }

    auto existing = find_covering(catalog_.chunks(partition_id), timestamp);
    if (existing) {
        return core::Result<catalog::Chunk>(*existing);
    }

    auto lock = locks_.acquire(partition_id);
    return create_locked(partition_id, timestamp);
}

core::Result<catalog::Chunk> ChunkManager::create_locked(core::PartitionID partition_id,
                                                         core::Timestamp timestamp) {
    using ChunkResult = core::Result<catalog::Chunk>;

    // Another writer may have created the chunk while we waited for the lock
    auto chunks = catalog_.chunks(partition_id);
    auto existing = find_covering(chunks, timestamp);
    if (existing) {
        return ChunkResult(*existing);
    }

    auto partition = catalog_.get_partition(partition_id);
    if (!partition.ok()) {
        return ChunkResult::forward(partition);
    }
    auto epoch = catalog_.get_epoch(partition.value().epoch_id);
    if (!epoch.ok()) {
        return ChunkResult::forward(epoch);
    }
    if (!epoch.value().contains(timestamp)) {
        return ChunkResult::error("Time " + std::to_string(timestamp) + " is outside " +
                                  epoch.value().to_string() + " of partition " +
                                  std::to_string(partition_id),
                                  core::Error::Code::INVALID_ARGUMENT);
    }

    core::Timestamp start = window_start(timestamp);
    std::optional<core::Timestamp> end = window_end(timestamp);
    if (epoch.value().start_time) {
        start = std::max(start, *epoch.value().start_time);
    }
    if (epoch.value().end_time && (!end || *epoch.value().end_time < *end)) {
        end = epoch.value().end_time;
    }

    bool later_chunk_exists = false;
    for (const auto& chunk : chunks) {
        if (chunk.end_time && *chunk.end_time <= timestamp) {
            start = std::max(start, *chunk.end_time);
        }
        if (chunk.start_time && *chunk.start_time > timestamp) {
            if (!end || *chunk.start_time < *end) {
                end = chunk.start_time;
            }
            later_chunk_exists = true;
        }
    }

    // Only the newest window may be open; a late row fills its window closed
    if (later_chunk_exists) {
        return insert_chunk(partition.value(), start, end);
    }
    return insert_chunk(partition.value(), start, std::nullopt);
}

core::Result<catalog::Chunk> ChunkManager::insert_chunk(const catalog::Partition& partition,
                                                        core::Timestamp start,
                                                        std::optional<core::Timestamp> end) {
    using ChunkResult = core::Result<catalog::Chunk>;

    catalog::Chunk chunk;
    chunk.partition_id = partition.id;
    chunk.start_time = start;
    chunk.end_time = end;
    chunk.closed = end.has_value();

    auto replicas = catalog_.partition_replicas(partition.id);
    if (replicas.empty()) {
        return ChunkResult::error("Partition " + std::to_string(partition.id) + " has no replicas",
                                  core::Error::Code::INTERNAL);
    }

    std::vector<catalog::ChunkReplicaNode> nodes;
    nodes.reserve(replicas.size());
    for (const auto& replica : replicas) {
        auto target = provisioner_.provision(replica, chunk);
        if (!target.ok()) {
            return ChunkResult::forward(target);
        }
        catalog::ChunkReplicaNode node;
        node.partition_replica_id = replica.id;
        node.target = target.value();
        nodes.push_back(std::move(node));
    }

    auto created = catalog_.insert_chunk(chunk, std::move(nodes));
    if (created.ok()) {
        chunks_created_.fetch_add(1);
        HYPERDB_INFO("Created {} with {} replica nodes", created.value().to_string(), replicas.size());
    }
    return created;
}

core::Result<bool> ChunkManager::close_if_needed(const catalog::Chunk& chunk, core::Timestamp now) {
    using BoolResult = core::Result<bool>;

    // Chunks clipped by an epoch or a neighbour still close at their window boundary
    if (!window_elapsed(chunk, now)) {
        return BoolResult(false);
    }

    auto lock = locks_.acquire(chunk.partition_id);

    auto current = catalog_.get_chunk(chunk.id);
    if (!current.ok()) {
        return BoolResult::forward(current);
    }
    if (current.value().closed) {
        return BoolResult(false);
    }

    auto partition = catalog_.get_partition(chunk.partition_id);
    if (!partition.ok()) {
        return BoolResult::forward(partition);
    }
    auto epoch = catalog_.get_epoch(partition.value().epoch_id);
    if (!epoch.ok()) {
        return BoolResult::forward(epoch);
    }

    auto window = window_end(*current.value().start_time);
    if (!window) {
        return BoolResult(false);
    }
    core::Timestamp end = *window;
    if (epoch.value().end_time) {
        end = std::min(end, *epoch.value().end_time);
    }

    auto closed = catalog_.close_chunk(chunk.id, end);
    if (!closed.ok()) {
        if (closed.error_code() == core::Error::Code::ALREADY_EXISTS) {
            return BoolResult(false);
        }
        return BoolResult::forward(closed);
    }
    chunks_closed_.fetch_add(1);
    HYPERDB_INFO("Closed {}", closed.value().to_string());

    core::Timestamp fresh_start = std::max(window_start(now), end);
    if (!epoch.value().contains(fresh_start)) {
        return BoolResult(true);
    }
    if (find_covering(catalog_.chunks(chunk.partition_id), fresh_start)) {
        return BoolResult(true);
    }

    auto fresh = insert_chunk(partition.value(), fresh_start, std::nullopt);
    if (!fresh.ok()) {
        return BoolResult::forward(fresh);
    }
    return BoolResult(true);
}

} // namespace chunk
} // namespace hyperdb
