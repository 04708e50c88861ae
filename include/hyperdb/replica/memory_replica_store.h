#ifndef HYPERDB_REPLICA_MEMORY_REPLICA_STORE_H_
#define HYPERDB_REPLICA_MEMORY_REPLICA_STORE_H_

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "hyperdb/replica/replica_store.h"

namespace hyperdb {
namespace replica {

/**
 * @brief In-process replica tables
 */
class MemoryReplicaStore : public ReplicaStore {
public:
    MemoryReplicaStore() = default;

    core::Result<size_t> apply_batch(const catalog::PhysicalTarget& target,
                                     const std::vector<core::Row>& rows,
                                     txn::Transaction& txn) override;

    core::Result<size_t> upsert_distinct(const catalog::PhysicalTarget& distinct_table,
                                         const std::string& column,
                                         const std::vector<std::string>& values,
                                         txn::Transaction& txn) override;

    // Inspection
    std::vector<core::Row> rows(const catalog::PhysicalTarget& target) const;
    size_t row_count(const catalog::PhysicalTarget& target) const;
    size_t total_rows() const;
    std::vector<catalog::PhysicalTarget> targets() const;

    /**
     * @brief Sorted distinct values recorded for a column
     */
    std::vector<std::string> distinct_values(const catalog::PhysicalTarget& distinct_table,
                                             const std::string& column) const;

    /**
     * @brief (column, value) pairs in the order they were added
     */
    std::vector<std::pair<std::string, std::string>> distinct_log(
        const catalog::PhysicalTarget& distinct_table) const;

    uint64_t batches_applied() const { return batches_applied_.load(); }

    /**
     * @brief Makes every write to an endpoint fail, for failure tests
     */
    void set_unavailable(const std::string& endpoint, bool unavailable);

private:
    struct StoredRow {
        uint64_t batch_id;
        core::Row row;
    };

    struct DistinctTable {
        // column -> value -> number of upserts holding it; committed upserts never release
        std::map<std::string, std::map<std::string, size_t>> claims;
        std::vector<std::pair<std::string, std::string>> log;
    };

    bool is_unavailable(const std::string& endpoint) const;

    std::map<catalog::PhysicalTarget, std::vector<StoredRow>> tables_;
    std::map<catalog::PhysicalTarget, DistinctTable> distinct_tables_;
    std::set<std::string> unavailable_;
    uint64_t next_batch_id_ = 1;
    std::atomic<uint64_t> batches_applied_{0};
    mutable std::mutex mutex_;
};

} // namespace replica
} // namespace hyperdb

#endif // HYPERDB_REPLICA_MEMORY_REPLICA_STORE_H_
