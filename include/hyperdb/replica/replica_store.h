#ifndef HYPERDB_REPLICA_REPLICA_STORE_H_
#define HYPERDB_REPLICA_REPLICA_STORE_H_

#include <string>
#include <vector>

#include "hyperdb/catalog/catalog.h"
#include "hyperdb/core/types.h"
#include "hyperdb/core/result.h"
#include "hyperdb/txn/transaction.h"

namespace hyperdb {
namespace replica {

/**
 * @brief Physical tables behind the replica endpoints
 *
 * Endpoints are assumed connected and durable. Writes join the caller's
 * transaction and disappear if it rolls back.
 */
class ReplicaStore {
public:
    virtual ~ReplicaStore() = default;

    /**
     * @brief Appends rows, in column order, to a chunk table.
     * Returns the number of rows written.
     */
    virtual core::Result<size_t> apply_batch(const catalog::PhysicalTarget& target,
                                             const std::vector<core::Row>& rows,
                                             txn::Transaction& txn) = 0;

    /**
     * @brief Inserts (column, value) pairs into a distinct side table in the
     * given order, skipping pairs already present. Returns the number of
     * pairs actually added.
     */
    virtual core::Result<size_t> upsert_distinct(const catalog::PhysicalTarget& distinct_table,
                                                 const std::string& column,
                                                 const std::vector<std::string>& values,
                                                 txn::Transaction& txn) = 0;
};

} // namespace replica
} // namespace hyperdb

#endif // HYPERDB_REPLICA_REPLICA_STORE_H_
