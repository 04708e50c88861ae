#include "hyperdb/txn/transaction.h"
#include "hyperdb/common/logger.h"
#include <atomic>
#include <stdexcept>

namespace hyperdb {
namespace txn {

namespace {
std::atomic<uint64_t> g_next_transaction_id{1};
}

Transaction::Transaction()
    : id_(g_next_transaction_id.fetch_add(1))
    , state_(State::ACTIVE)
    , rollback_only_(false)
    , insert_in_progress_(false) {}

Transaction::~Transaction() {
    if (state_ == State::ACTIVE) {
        rollback();
    }
}

void Transaction::add_undo(std::function<void()> undo) {
    if (state_ != State::ACTIVE) {
        throw std::logic_error("Cannot register undo on a finished transaction");
    }
    undo_log_.push_back(std::move(undo));
}

core::Result<void> Transaction::commit() {
    if (state_ != State::ACTIVE) {
        return core::Result<void>::error(std::string("Transaction is ") + state_name(state_),
                                         core::Error::Code::TRANSACTION_ABORTED);
    }
    if (rollback_only_) {
        rollback();
        return core::Result<void>::error("Transaction rolled back: " + abort_reason_,
                                         core::Error::Code::TRANSACTION_ABORTED);
    }
    undo_log_.clear();
    finish(State::COMMITTED);
    return core::Result<void>();
}

void Transaction::rollback() {
    if (state_ != State::ACTIVE) {
        return;
    }
    HYPERDB_DEBUG("Rolling back transaction {} ({} undo actions)", id_, undo_log_.size());
    for (auto it = undo_log_.rbegin(); it != undo_log_.rend(); ++it) {
        (*it)();
    }
    undo_log_.clear();
    finish(State::ABORTED);
}

void Transaction::set_rollback_only(const std::string& reason) {
    if (!rollback_only_) {
        rollback_only_ = true;
        abort_reason_ = reason;
    }
}

void Transaction::finish(State state) {
    state_ = state;
    insert_in_progress_ = false;
}

const char* state_name(Transaction::State state) {
    switch (state) {
        case Transaction::State::ACTIVE:    return "active";
        case Transaction::State::COMMITTED: return "committed";
        case Transaction::State::ABORTED:   return "aborted";
    }
    return "unknown";
}

} // namespace txn
} // namespace hyperdb
