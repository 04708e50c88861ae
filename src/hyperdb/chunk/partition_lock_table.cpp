#include "hyperdb/chunk/partition_lock_table.h"

namespace hyperdb {
namespace chunk {

std::mutex& PartitionLockTable::mutex_for(core::PartitionID partition_id) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto& slot = locks_[partition_id];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

std::unique_lock<std::mutex> PartitionLockTable::acquire(core::PartitionID partition_id) {
    std::mutex& mutex = mutex_for(partition_id);
    std::unique_lock<std::mutex> lock(mutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        contended_.fetch_add(1, std::memory_order_relaxed);
        lock.lock();
    }
    return lock;
}

size_t PartitionLockTable::size() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return locks_.size();
}

} // namespace chunk
} // namespace hyperdb
