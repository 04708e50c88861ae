#include "hyperdb/router/router_stats.h"
#include <iomanip>
#include <sstream>

namespace hyperdb {
namespace router {

std::string RouterStats::to_string() const {
    std::ostringstream oss;
    oss << "Insert Router Statistics:\n";
    oss << "  Inserts: " << inserts.load() << "\n";
    oss << "  Failed inserts: " << failed_inserts.load() << "\n";
    oss << "  Reentrant rejections: " << reentrant_rejections.load() << "\n";
    oss << "  Groups routed: " << groups_routed.load() << "\n";
    oss << "  Rows routed: " << rows_routed.load() << "\n";
    oss << "  Replica inserts: " << replica_inserts.load() << "\n";
    oss << "  Fan-out factor: " << std::fixed << std::setprecision(2) << get_fanout_factor() << "\n";
    oss << "  Distinct values added: " << distinct_values_added.load() << "\n";
    oss << "  Unrouted rows: " << rows_unrouted.load() << "\n";
    oss << "  Chunk close checks: " << chunk_close_checks.load() << "\n";
    return oss.str();
}

} // namespace router
} // namespace hyperdb
