#ifndef HYPERDB_ROUTER_DISTINCT_INDEXER_H_
#define HYPERDB_ROUTER_DISTINCT_INDEXER_H_

#include <string>
#include <vector>

#include "hyperdb/catalog/catalog.h"
#include "hyperdb/core/types.h"
#include "hyperdb/core/result.h"
#include "hyperdb/replica/replica_store.h"
#include "hyperdb/txn/transaction.h"

namespace hyperdb {
namespace router {

/**
 * @brief Keeps the per-replica distinct side tables of distinct-flagged columns
 */
class DistinctIndexer {
public:
    DistinctIndexer(const catalog::Catalog& catalog, replica::ReplicaStore& store);

    /**
     * @brief Records the distinct values of a batch headed for one replica.
     *
     * Columns are visited in name order, values inserted in ascending text
     * order; nulls are skipped. Returns the number of new (column, value)
     * pairs.
     */
    core::Result<size_t> index(txn::Transaction& txn,
                               const std::string& hypertable_name,
                               const core::RowSchema& schema,
                               const catalog::PartitionReplica& replica,
                               const std::string& endpoint,
                               const std::vector<core::Row>& rows);

    /**
     * @brief Sorted, de-duplicated, non-null text values of one column
     */
    static std::vector<std::string> distinct_values(const std::vector<core::Row>& rows,
                                                    size_t column_index);

private:
    const catalog::Catalog& catalog_;
    replica::ReplicaStore& store_;
};

} // namespace router
} // namespace hyperdb

#endif // HYPERDB_ROUTER_DISTINCT_INDEXER_H_
