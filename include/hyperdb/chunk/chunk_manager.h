#ifndef HYPERDB_CHUNK_CHUNK_MANAGER_H_
#define HYPERDB_CHUNK_CHUNK_MANAGER_H_

#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include "hyperdb/catalog/catalog.h"
#include "hyperdb/chunk/partition_lock_table.h"
#include "hyperdb/core/config.h"
#include "hyperdb/core/result.h"
#include "hyperdb/replica/provisioner.h"

namespace hyperdb {
namespace chunk {

/**
 * @brief Maps (partition, time) to chunks, creating and closing them
 *
 * Chunk windows are aligned to multiples of chunk_length and clipped to the
 * owning epoch. A partition has at most one open chunk, which always holds
 * the newest window; a row that arrives for an older window without a chunk
 * gets a closed chunk for that window.
 *
 * The per-partition lock is held only while a chunk of that partition is
 * looked up authoritatively, created or closed, never across a whole insert.
 *
 * Lifecycle per chunk: OPEN -> CLOSED, no reopening.
 */
class ChunkManager {
public:
    ChunkManager(catalog::Catalog& catalog,
                 replica::Provisioner& provisioner,
                 const core::ChunkConfig& config = core::ChunkConfig::Default());

    ChunkManager(const ChunkManager&) = delete;
    ChunkManager& operator=(const ChunkManager&) = delete;

    /**
     * @brief Chunk of partition_id covering timestamp, created if absent.
     *
     * Unlocked: the lookup runs without the partition lock; only a creation
     * takes it. Locked: the lookup itself runs under the partition lock.
     * Either way existence is re-checked once the lock is held.
     */
    core::Result<catalog::Chunk> get_or_create(core::PartitionID partition_id,
                                               core::Timestamp timestamp,
                                               bool locked = false);

    /**
     * @brief Closes an open chunk once now reaches the end of its window and
     * opens a fresh chunk for the window holding now.
     *
     * Returns true when this call closed the chunk. Calling it again, or
     * concurrently, is harmless.
     */
    core::Result<bool> close_if_needed(const catalog::Chunk& chunk, core::Timestamp now);

    /**
     * @brief Exclusive end of the window the chunk accepts rows for: its end
     * time once closed, the end of its aligned window while open
     */
    std::optional<core::Timestamp> routing_end(const catalog::Chunk& chunk) const;

    /**
     * @brief True when an open chunk's window ends at or before now
     */
    bool window_elapsed(const catalog::Chunk& chunk, core::Timestamp now) const;

    core::Timestamp window_start(core::Timestamp time) const;
    // Exclusive; nullopt for the last window of the time domain
    std::optional<core::Timestamp> window_end(core::Timestamp time) const;
    core::Duration chunk_length() const { return config_.chunk_length; }

    uint64_t chunks_created() const { return chunks_created_.load(); }
    uint64_t chunks_closed() const { return chunks_closed_.load(); }
    const PartitionLockTable& locks() const { return locks_; }

private:
    // Floor of time / chunk_length
    core::Timestamp window_index(core::Timestamp time) const;

    static std::optional<catalog::Chunk> find_covering(const std::vector<catalog::Chunk>& chunks,
                                                       core::Timestamp timestamp);

    // Caller holds the partition lock
    core::Result<catalog::Chunk> create_locked(core::PartitionID partition_id,
                                               core::Timestamp timestamp);
    core::Result<catalog::Chunk> insert_chunk(const catalog::Partition& partition,
                                              core::Timestamp start,
                                              std::optional<core::Timestamp> end);

    catalog::Catalog& catalog_;
    replica::Provisioner& provisioner_;
    core::ChunkConfig config_;
    PartitionLockTable locks_;

    std::atomic<uint64_t> chunks_created_{0};
    std::atomic<uint64_t> chunks_closed_{0};
};

} // namespace chunk
} // namespace hyperdb

#endif // HYPERDB_CHUNK_CHUNK_MANAGER_H_
