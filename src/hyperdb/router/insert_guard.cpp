#include "hyperdb/router/insert_guard.h"

namespace hyperdb {
namespace router {

core::Result<void> InsertGuard::enter(txn::Transaction& txn) {
    if (!txn.is_active()) {
        return core::Result<void>::error(std::string("Transaction is ") + txn::state_name(txn.state()),
                                         core::Error::Code::TRANSACTION_ABORTED);
    }
    if (txn.insert_in_progress()) {
        return core::Result<void>::error("insert() can only be called once per transaction",
                                         core::Error::Code::REENTRANT_INSERT);
    }
    txn.mark_insert_in_progress();
    return core::Result<void>();
}

} // namespace router
} // namespace hyperdb
