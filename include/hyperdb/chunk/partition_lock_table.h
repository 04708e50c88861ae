#ifndef HYPERDB_CHUNK_PARTITION_LOCK_TABLE_H_
#define HYPERDB_CHUNK_PARTITION_LOCK_TABLE_H_

#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "hyperdb/core/types.h"

namespace hyperdb {
namespace chunk {

/**
 * @brief One exclusive lock per partition id, created on first use
 *
 * Locks are never removed, so a returned lock stays valid for the lifetime
 * of the table.
 */
class PartitionLockTable {
public:
    PartitionLockTable() = default;

    PartitionLockTable(const PartitionLockTable&) = delete;
    PartitionLockTable& operator=(const PartitionLockTable&) = delete;

    std::unique_lock<std::mutex> acquire(core::PartitionID partition_id);

    size_t size() const;
    uint64_t contended_acquisitions() const { return contended_.load(std::memory_order_relaxed); }

private:
    std::mutex& mutex_for(core::PartitionID partition_id);

    mutable std::mutex table_mutex_;
    std::unordered_map<core::PartitionID, std::unique_ptr<std::mutex>> locks_;
    std::atomic<uint64_t> contended_{0};
};

} // namespace chunk
} // namespace hyperdb

#endif // HYPERDB_CHUNK_PARTITION_LOCK_TABLE_H_
