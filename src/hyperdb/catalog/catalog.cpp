#include "hyperdb/catalog/catalog.h"
#include "hyperdb/core/error.h"
#include <sstream>
#include <tuple>

namespace hyperdb {
namespace catalog {

namespace {

std::string bound_to_string(const std::optional<core::Timestamp>& bound) {
    return bound ? std::to_string(*bound) : std::string("unbounded");
}

} // namespace

core::ColumnType Hypertable::time_column_type() const {
    for (const auto& column : columns) {
        if (column.name == time_column_name) {
            return column.type;
        }
    }
    throw core::InvalidArgumentError("Hypertable " + name + " has no time column " + time_column_name);
}

core::RowSchema Hypertable::schema() const {
    return core::RowSchema(columns, time_column_name);
}

bool Epoch::contains(core::Timestamp time) const {
    if (start_time && time < *start_time) {
        return false;
    }
    if (end_time && time >= *end_time) {
        return false;
    }
    return true;
}

bool Epoch::overlaps(const Epoch& other) const {
    // [a, b) and [c, d) overlap unless one ends at or before the other starts
    bool this_before = end_time && other.start_time && *end_time <= *other.start_time;
    bool other_before = other.end_time && start_time && *other.end_time <= *start_time;
    return !this_before && !other_before;
}

std::string Epoch::to_string() const {
    std::ostringstream oss;
    oss << "epoch " << id << " [" << bound_to_string(start_time) << ", "
        << bound_to_string(end_time) << ") " << partitioning_func << "("
        << partitioning_column << ") mod " << partitioning_mod;
    return oss.str();
}

bool Chunk::contains(core::Timestamp time) const {
    if (start_time && time < *start_time) {
        return false;
    }
    if (end_time && time >= *end_time) {
        return false;
    }
    return true;
}

std::string Chunk::to_string() const {
    std::ostringstream oss;
    oss << "chunk " << id << " of partition " << partition_id << " ["
        << bound_to_string(start_time) << ", " << bound_to_string(end_time) << ")"
        << (closed ? " closed" : " open");
    return oss.str();
}

std::string PhysicalTarget::to_string() const {
    return endpoint + ":" + schema_name + "." + table_name;
}

bool PhysicalTarget::operator==(const PhysicalTarget& other) const {
    return endpoint == other.endpoint && schema_name == other.schema_name &&
           table_name == other.table_name;
}

bool PhysicalTarget::operator<(const PhysicalTarget& other) const {
    return std::tie(endpoint, schema_name, table_name) <
           std::tie(other.endpoint, other.schema_name, other.table_name);
}

} // namespace catalog
} // namespace hyperdb
