#include "hyperdb/router/distinct_indexer.h"
#include <set>

namespace hyperdb {
namespace router {

DistinctIndexer::DistinctIndexer(const catalog::Catalog& catalog, replica::ReplicaStore& store)
    : catalog_(catalog), store_(store) {}

std::vector<std::string> DistinctIndexer::distinct_values(const std::vector<core::Row>& rows,
                                                          size_t column_index) {
    std::set<std::string> values;
    for (const auto& row : rows) {
        if (column_index < row.size() && !core::is_null(row[column_index])) {
            values.insert(core::value_to_text(row[column_index]));
        }
    }
    return std::vector<std::string>(values.begin(), values.end());
}

core::Result<size_t> DistinctIndexer::index(txn::Transaction& txn,
                                            const std::string& hypertable_name,
                                            const core::RowSchema& schema,
                                            const catalog::PartitionReplica& replica,
                                            const std::string& endpoint,
                                            const std::vector<core::Row>& rows) {
    auto columns = schema.distinct_columns();
    if (columns.empty() || rows.empty()) {
        return core::Result<size_t>(0);
    }

    auto table = catalog_.distinct_target(hypertable_name, replica.replica_id, endpoint);
    if (!table.ok()) {
        return core::Result<size_t>::forward(table);
    }

    size_t added = 0;
    for (const auto& column : columns) {
        auto index = schema.index_of(column);
        if (!index) {
            continue;
        }
        auto values = distinct_values(rows, *index);
        if (values.empty()) {
            continue;
        }
        auto result = store_.upsert_distinct(table.value(), column, values, txn);
        if (!result.ok()) {
            return result;
        }
        added += result.value();
    }
    return core::Result<size_t>(added);
}

} // namespace router
} // namespace hyperdb
