#ifndef HYPERDB_ROUTER_INSERT_GUARD_H_
#define HYPERDB_ROUTER_INSERT_GUARD_H_

#include "hyperdb/core/result.h"
#include "hyperdb/txn/transaction.h"

namespace hyperdb {
namespace router {

/**
 * @brief Allows one insert per transaction
 *
 * A second insert in the same transaction could wait on a chunk lock the
 * first one still holds, so it is rejected with REENTRANT_INSERT. This also
 * rejects inserts into two different hypertables within one transaction.
 * The marker is cleared when the transaction ends.
 */
class InsertGuard {
public:
    static core::Result<void> enter(txn::Transaction& txn);
};

} // namespace router
} // namespace hyperdb

#endif // HYPERDB_ROUTER_INSERT_GUARD_H_
