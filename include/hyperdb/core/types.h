#ifndef HYPERDB_CORE_TYPES_H_
#define HYPERDB_CORE_TYPES_H_

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <variant>

#include "hyperdb/core/result.h"

namespace hyperdb {
namespace core {

/**
 * @brief Time value of a row, in the unit of the hypertable's time column
 * (seconds or counts for integer columns, microseconds for TIMESTAMP)
 */
using Timestamp = int64_t;

/**
 * @brief Length of a time span, in the same unit as Timestamp
 */
using Duration = int64_t;

/**
 * @brief Catalog identifiers
 */
using EpochID = int64_t;
using PartitionID = int64_t;
using PartitionReplicaID = int64_t;
using ChunkID = int64_t;
using ReplicaID = int32_t;

/**
 * @brief Position in the hashed keyspace, [0, modulus)
 */
using Keyspace = int32_t;

/**
 * @brief Semantic type of a hypertable column, known only at run time
 */
enum class ColumnType {
    BIGINT,
    INTEGER,
    DOUBLE,
    BOOLEAN,
    TEXT,
    TIMESTAMP   // microseconds since Unix epoch
};

const char* column_type_name(ColumnType type);

/**
 * @brief A single cell. std::monostate is SQL NULL.
 */
using Value = std::variant<std::monostate, int64_t, double, bool, std::string>;

inline bool is_null(const Value& value) {
    return std::holds_alternative<std::monostate>(value);
}

/**
 * @brief Text form of a value; nulls render as the empty string
 */
std::string value_to_text(const Value& value);

/**
 * @brief One hypertable-shaped row, values in column order
 */
using Row = std::vector<Value>;

/**
 * @brief Column of a hypertable
 */
struct ColumnDescriptor {
    std::string name;
    ColumnType type = ColumnType::TEXT;
    bool is_distinct = false;
};

/**
 * @brief Runtime schema descriptor of a hypertable
 *
 * Maps column names to positional accessors into a Row. Built once per
 * insert and passed through the resolution calls.
 */
class RowSchema {
public:
    RowSchema() = default;
    RowSchema(std::vector<ColumnDescriptor> columns,
              const std::string& time_column);

    const std::vector<ColumnDescriptor>& columns() const { return columns_; }
    size_t size() const { return columns_.size(); }

    std::optional<size_t> index_of(const std::string& name) const;
    const ColumnDescriptor& column(size_t index) const { return columns_.at(index); }

    const std::string& time_column() const { return time_column_; }
    ColumnType time_type() const { return columns_.at(time_index_).type; }

    /**
     * @brief Extracts the time value of a row
     *
     * Returns an empty optional for a null time; fails with INVALID_ARGUMENT
     * when the value does not fit the time column's type.
     */
    Result<std::optional<Timestamp>> extract_time(const Row& row) const;

    /**
     * @brief Value of a named column, fails with NOT_FOUND on an unknown name
     */
    Result<Value> get(const Row& row, const std::string& column) const;

    /**
     * @brief Names of the distinct-flagged columns, sorted by name
     */
    std::vector<std::string> distinct_columns() const;

    /**
     * @brief Comma separated column list, in column order
     */
    std::string column_list() const;

private:
    std::vector<ColumnDescriptor> columns_;
    std::map<std::string, size_t> positions_;
    std::string time_column_;
    size_t time_index_ = 0;
};

} // namespace core
} // namespace hyperdb

#endif // HYPERDB_CORE_TYPES_H_
