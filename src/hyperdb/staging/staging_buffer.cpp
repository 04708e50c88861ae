#include "hyperdb/staging/staging_buffer.h"

namespace hyperdb {
namespace staging {

StagingBuffer::StagingBuffer(const core::RowSchema& schema)
    : schema_(schema) {}

core::Result<uint64_t> StagingBuffer::append(core::Row row) {
    if (row.size() != schema_.size()) {
        return core::Result<uint64_t>::error(
            "Staged row has " + std::to_string(row.size()) + " values, expected " +
            std::to_string(schema_.size()), core::Error::Code::INVALID_ARGUMENT);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    rows_.emplace(id, std::move(row));
    return core::Result<uint64_t>(id);
}

size_t StagingBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_.size();
}

bool StagingBuffer::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_.empty();
}

std::vector<StagedRow> StagingBuffer::rows() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StagedRow> result;
    result.reserve(rows_.size());
    for (const auto& [id, row] : rows_) {
        result.push_back(StagedRow{id, row});
    }
    return result;
}

std::optional<StagedRow> StagingBuffer::first_where(const RowPredicate& predicate) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, row] : rows_) {
        if (predicate(row)) {
            return StagedRow{id, row};
        }
    }
    return std::nullopt;
}

std::vector<StagedRow> StagingBuffer::select(const RowPredicate& predicate) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StagedRow> result;
    for (const auto& [id, row] : rows_) {
        if (predicate(row)) {
            result.push_back(StagedRow{id, row});
        }
    }
    return result;
}

core::Result<size_t> StagingBuffer::erase(const std::vector<uint64_t>& ids,
                                          txn::Transaction& txn,
                                          DeleteOrigin origin) {
    if (!txn.is_active()) {
        return core::Result<size_t>::error("Cannot remove staged rows outside an active transaction",
                                           core::Error::Code::TRANSACTION_ABORTED);
    }

    std::vector<StagedRow> removed;
    DeleteHook hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (uint64_t id : ids) {
            auto it = rows_.find(id);
            if (it == rows_.end()) {
                continue;
            }
            removed.push_back(StagedRow{id, std::move(it->second)});
            rows_.erase(it);
        }
        hook = delete_hook_;
    }

    if (!removed.empty()) {
        txn.add_undo([this, removed]() {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& staged : removed) {
                rows_.emplace(staged.id, staged.row);
            }
        });
    }

    if (origin == DeleteOrigin::kUser && hook) {
        for (const auto& staged : removed) {
            hook(staged.row);
        }
    }
    return core::Result<size_t>(removed.size());
}

core::Result<size_t> StagingBuffer::delete_where(const RowPredicate& predicate, txn::Transaction& txn) {
    std::vector<uint64_t> ids;
    for (const auto& staged : select(predicate)) {
        ids.push_back(staged.id);
    }
    return erase(ids, txn, DeleteOrigin::kUser);
}

void StagingBuffer::set_delete_hook(DeleteHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    delete_hook_ = std::move(hook);
}

} // namespace staging
} // namespace hyperdb
