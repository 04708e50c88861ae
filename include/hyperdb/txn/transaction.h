#ifndef HYPERDB_TXN_TRANSACTION_H_
#define HYPERDB_TXN_TRANSACTION_H_

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "hyperdb/core/result.h"

namespace hyperdb {
namespace txn {

/**
 * @brief One client unit of work
 *
 * Effects that must disappear on abort register an undo action. Rolling back
 * runs the actions in reverse registration order. A transaction destroyed
 * while still active is rolled back.
 *
 * A transaction belongs to one client thread and is not synchronized.
 */
class Transaction {
public:
    enum class State {
        ACTIVE,
        COMMITTED,
        ABORTED
    };

    Transaction();
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    uint64_t id() const { return id_; }
    State state() const { return state_; }
    bool is_active() const { return state_ == State::ACTIVE; }

    void add_undo(std::function<void()> undo);
    size_t undo_depth() const { return undo_log_.size(); }

    /**
     * @brief Commits, or rolls back and fails with TRANSACTION_ABORTED when
     * the transaction was marked rollback-only
     */
    core::Result<void> commit();
    void rollback();

    void set_rollback_only(const std::string& reason);
    bool rollback_only() const { return rollback_only_; }
    const std::string& abort_reason() const { return abort_reason_; }

    // Insert-in-progress marker, cleared when the transaction ends
    bool insert_in_progress() const { return insert_in_progress_; }
    void mark_insert_in_progress() { insert_in_progress_ = true; }

private:
    void finish(State state);

    uint64_t id_;
    State state_;
    std::vector<std::function<void()>> undo_log_;
    bool rollback_only_;
    std::string abort_reason_;
    bool insert_in_progress_;
};

const char* state_name(Transaction::State state);

} // namespace txn
} // namespace hyperdb

#endif // HYPERDB_TXN_TRANSACTION_H_
