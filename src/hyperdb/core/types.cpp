#include "hyperdb/core/types.h"
#include "hyperdb/core/error.h"
#include <algorithm>
#include <sstream>

namespace hyperdb {
namespace core {

const char* column_type_name(ColumnType type) {
    switch (type) {
        case ColumnType::BIGINT:    return "bigint";
        case ColumnType::INTEGER:   return "integer";
        case ColumnType::DOUBLE:    return "double precision";
        case ColumnType::BOOLEAN:   return "boolean";
        case ColumnType::TEXT:      return "text";
        case ColumnType::TIMESTAMP: return "timestamp";
    }
    return "unknown";
}

std::string value_to_text(const Value& value) {
    if (auto v = std::get_if<int64_t>(&value)) {
        return std::to_string(*v);
    }
    if (auto v = std::get_if<double>(&value)) {
        std::ostringstream oss;
        oss.precision(17);
        oss << *v;
        return oss.str();
    }
    if (auto v = std::get_if<bool>(&value)) {
        return *v ? "true" : "false";
    }
    if (auto v = std::get_if<std::string>(&value)) {
        return *v;
    }
    return std::string();
}

RowSchema::RowSchema(std::vector<ColumnDescriptor> columns,
                     const std::string& time_column)
    : columns_(std::move(columns)), time_column_(time_column) {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name.empty()) {
            throw InvalidArgumentError("Column name cannot be empty");
        }
        if (!positions_.emplace(columns_[i].name, i).second) {
            throw InvalidArgumentError("Duplicate column name: " + columns_[i].name);
        }
    }

    auto it = positions_.find(time_column_);
    if (it == positions_.end()) {
        throw InvalidArgumentError("Time column not in schema: " + time_column_);
    }
    time_index_ = it->second;

    switch (columns_[time_index_].type) {
        case ColumnType::BIGINT:
        case ColumnType::INTEGER:
        case ColumnType::TIMESTAMP:
            break;
        default:
            throw InvalidArgumentError(std::string("Unsupported time column type: ") +
                                       column_type_name(columns_[time_index_].type));
    }
}

std::optional<size_t> RowSchema::index_of(const std::string& name) const {
    auto it = positions_.find(name);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<std::optional<Timestamp>> RowSchema::extract_time(const Row& row) const {
    if (row.size() != columns_.size()) {
        return Result<std::optional<Timestamp>>::error(
            "Row has " + std::to_string(row.size()) + " values, expected " +
            std::to_string(columns_.size()), Error::Code::INVALID_ARGUMENT);
    }

    const Value& value = row[time_index_];
    if (is_null(value)) {
        return Result<std::optional<Timestamp>>(std::optional<Timestamp>());
    }

    auto v = std::get_if<int64_t>(&value);
    if (!v) {
        return Result<std::optional<Timestamp>>::error(
            "Time column '" + time_column_ + "' does not hold a " +
            column_type_name(time_type()) + " value", Error::Code::INVALID_ARGUMENT);
    }
    return Result<std::optional<Timestamp>>(std::optional<Timestamp>(*v));
}

Result<Value> RowSchema::get(const Row& row, const std::string& column) const {
    auto index = index_of(column);
    if (!index) {
        return Result<Value>::error("Unknown column: " + column, Error::Code::NOT_FOUND);
    }
    if (*index >= row.size()) {
        return Result<Value>::error("Row too short for column: " + column,
                                    Error::Code::INVALID_ARGUMENT);
    }
    return Result<Value>(row[*index]);
}

std::vector<std::string> RowSchema::distinct_columns() const {
    std::vector<std::string> names;
    for (const auto& column : columns_) {
        if (column.is_distinct) {
            names.push_back(column.name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string RowSchema::column_list() const {
    std::ostringstream oss;
    bool first = true;
    for (const auto& column : columns_) {
        if (!first) {
            oss << ", ";
        }
        oss << column.name;
        first = false;
    }
    return oss.str();
}

} // namespace core
} // namespace hyperdb
