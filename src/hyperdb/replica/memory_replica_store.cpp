#include "hyperdb/replica/memory_replica_store.h"
#include <algorithm>

namespace hyperdb {
namespace replica {

core::Result<size_t> MemoryReplicaStore::apply_batch(const catalog::PhysicalTarget& target,
                                                     const std::vector<core::Row>& rows,
                                                     txn::Transaction& txn) {
    if (!txn.is_active()) {
        return core::Result<size_t>::error("Cannot write to " + target.to_string() +
                                           " outside an active transaction",
                                           core::Error::Code::TRANSACTION_ABORTED);
    }
    if (is_unavailable(target.endpoint)) {
        return core::Result<size_t>::error("Endpoint " + target.endpoint + " is unavailable",
                                           core::Error::Code::INTERNAL);
    }
    if (rows.empty()) {
        return core::Result<size_t>(0);
    }

    uint64_t batch_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch_id = next_batch_id_++;
        auto& table = tables_[target];
        for (const auto& row : rows) {
            table.push_back(StoredRow{batch_id, row});
        }
    }
    batches_applied_.fetch_add(1);

    txn.add_undo([this, target, batch_id]() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tables_.find(target);
        if (it == tables_.end()) {
            return;
        }
        auto& table = it->second;
        table.erase(std::remove_if(table.begin(), table.end(),
                                   [batch_id](const StoredRow& stored) {
                                       return stored.batch_id == batch_id;
                                   }),
                    table.end());
    });
    return core::Result<size_t>(rows.size());
}

core::Result<size_t> MemoryReplicaStore::upsert_distinct(const catalog::PhysicalTarget& distinct_table,
                                                         const std::string& column,
                                                         const std::vector<std::string>& values,
                                                         txn::Transaction& txn) {
    if (!txn.is_active()) {
        return core::Result<size_t>::error("Cannot write to " + distinct_table.to_string() +
                                           " outside an active transaction",
                                           core::Error::Code::TRANSACTION_ABORTED);
    }
    if (is_unavailable(distinct_table.endpoint)) {
        return core::Result<size_t>::error("Endpoint " + distinct_table.endpoint + " is unavailable",
                                           core::Error::Code::INTERNAL);
    }

    size_t added = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& table = distinct_tables_[distinct_table];
        auto& column_claims = table.claims[column];
        for (const auto& value : values) {
            // Conflicts are absorbed, not reported, but still hold a claim
            if (column_claims[value]++ == 0) {
                table.log.emplace_back(column, value);
                ++added;
            }
        }
    }

    if (!values.empty()) {
        txn.add_undo([this, distinct_table, column, values]() {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = distinct_tables_.find(distinct_table);
            if (it == distinct_tables_.end()) {
                return;
            }
            auto& table = it->second;
            auto& column_claims = table.claims[column];
            for (const auto& value : values) {
                auto claim = column_claims.find(value);
                if (claim == column_claims.end() || --claim->second > 0) {
                    continue;
                }
                column_claims.erase(claim);
                auto pos = std::find(table.log.begin(), table.log.end(), std::make_pair(column, value));
                if (pos != table.log.end()) {
                    table.log.erase(pos);
                }
            }
        });
    }
    return core::Result<size_t>(added);
}

std::vector<core::Row> MemoryReplicaStore::rows(const catalog::PhysicalTarget& target) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::Row> result;
    auto it = tables_.find(target);
    if (it != tables_.end()) {
        for (const auto& stored : it->second) {
            result.push_back(stored.row);
        }
    }
    return result;
}

size_t MemoryReplicaStore::row_count(const catalog::PhysicalTarget& target) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tables_.find(target);
    return it == tables_.end() ? 0 : it->second.size();
}

size_t MemoryReplicaStore::total_rows() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& [target, table] : tables_) {
        total += table.size();
    }
    return total;
}

std::vector<catalog::PhysicalTarget> MemoryReplicaStore::targets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<catalog::PhysicalTarget> result;
    for (const auto& [target, table] : tables_) {
        if (!table.empty()) {
            result.push_back(target);
        }
    }
    return result;
}

std::vector<std::string> MemoryReplicaStore::distinct_values(const catalog::PhysicalTarget& distinct_table,
                                                             const std::string& column) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    auto it = distinct_tables_.find(distinct_table);
    if (it == distinct_tables_.end()) {
        return result;
    }
    auto column_it = it->second.claims.find(column);
    if (column_it != it->second.claims.end()) {
        for (const auto& [value, holders] : column_it->second) {
            result.push_back(value);
        }
    }
    return result;
}

std::vector<std::pair<std::string, std::string>> MemoryReplicaStore::distinct_log(
    const catalog::PhysicalTarget& distinct_table) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = distinct_tables_.find(distinct_table);
    if (it == distinct_tables_.end()) {
        return {};
    }
    return it->second.log;
}

void MemoryReplicaStore::set_unavailable(const std::string& endpoint, bool unavailable) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unavailable) {
        unavailable_.insert(endpoint);
    } else {
        unavailable_.erase(endpoint);
    }
}

bool MemoryReplicaStore::is_unavailable(const std::string& endpoint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unavailable_.count(endpoint) > 0;
}

} // namespace replica
} // namespace hyperdb
