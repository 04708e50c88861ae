#ifndef HYPERDB_STAGING_STAGING_BUFFER_H_
#define HYPERDB_STAGING_STAGING_BUFFER_H_

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "hyperdb/core/types.h"
#include "hyperdb/core/result.h"
#include "hyperdb/txn/transaction.h"

namespace hyperdb {
namespace staging {

/**
 * @brief Who removes rows from staging. Only user deletes fire the delete hook.
 */
enum class DeleteOrigin {
    kUser,
    kRouter
};

struct StagedRow {
    uint64_t id;
    core::Row row;
};

/**
 * @brief Ephemeral store of newly submitted hypertable-shaped rows
 *
 * Rows are kept in submission (scan) order. Removals made inside a
 * transaction are restored, in place, if that transaction rolls back.
 */
class StagingBuffer {
public:
    using RowPredicate = std::function<bool(const core::Row&)>;
    using DeleteHook = std::function<void(const core::Row&)>;

    explicit StagingBuffer(const core::RowSchema& schema);

    StagingBuffer(const StagingBuffer&) = delete;
    StagingBuffer& operator=(const StagingBuffer&) = delete;

    /**
     * @brief Stages a row; fails with INVALID_ARGUMENT on a column count mismatch
     */
    core::Result<uint64_t> append(core::Row row);

    size_t size() const;
    bool empty() const;
    std::vector<StagedRow> rows() const;

    /**
     * @brief First row in scan order that satisfies the predicate
     */
    std::optional<StagedRow> first_where(const RowPredicate& predicate) const;

    std::vector<StagedRow> select(const RowPredicate& predicate) const;

    /**
     * @brief Removes the given rows, registering their restoration with txn.
     * Returns the number of rows removed; ids no longer staged are skipped.
     */
    core::Result<size_t> erase(const std::vector<uint64_t>& ids,
                               txn::Transaction& txn,
                               DeleteOrigin origin);

    /**
     * @brief User-level delete of every row matching the predicate
     */
    core::Result<size_t> delete_where(const RowPredicate& predicate, txn::Transaction& txn);

    void set_delete_hook(DeleteHook hook);

    const core::RowSchema& schema() const { return schema_; }

private:
    core::RowSchema schema_;
    std::map<uint64_t, core::Row> rows_;
    uint64_t next_id_ = 1;
    DeleteHook delete_hook_;
    mutable std::mutex mutex_;
};

} // namespace staging
} // namespace hyperdb

#endif // HYPERDB_STAGING_STAGING_BUFFER_H_
