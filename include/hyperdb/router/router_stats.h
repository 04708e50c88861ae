#ifndef HYPERDB_ROUTER_ROUTER_STATS_H_
#define HYPERDB_ROUTER_ROUTER_STATS_H_

#include <atomic>
#include <cstddef>
#include <string>

namespace hyperdb {
namespace router {

/**
 * @brief Statistics for the insert router
 */
struct RouterStats {
    std::atomic<size_t> inserts{0};
    std::atomic<size_t> failed_inserts{0};
    std::atomic<size_t> reentrant_rejections{0};
    std::atomic<size_t> groups_routed{0};
    std::atomic<size_t> rows_routed{0};
    std::atomic<size_t> replica_inserts{0};
    std::atomic<size_t> distinct_values_added{0};
    std::atomic<size_t> rows_unrouted{0};
    std::atomic<size_t> chunk_close_checks{0};

    RouterStats() = default;
    RouterStats(const RouterStats& other) { copy_from(other); }

    RouterStats& operator=(const RouterStats& other) {
        if (this != &other) {
            copy_from(other);
        }
        return *this;
    }

    double get_fanout_factor() const {
        auto rows = rows_routed.load();
        return rows > 0 ? (double)replica_inserts.load() / rows : 0.0;
    }

    std::string to_string() const;

private:
    void copy_from(const RouterStats& other) {
        inserts.store(other.inserts.load());
        failed_inserts.store(other.failed_inserts.load());
        reentrant_rejections.store(other.reentrant_rejections.load());
        groups_routed.store(other.groups_routed.load());
        rows_routed.store(other.rows_routed.load());
        replica_inserts.store(other.replica_inserts.load());
        distinct_values_added.store(other.distinct_values_added.load());
        rows_unrouted.store(other.rows_unrouted.load());
        chunk_close_checks.store(other.chunk_close_checks.load());
    }
};

} // namespace router
} // namespace hyperdb

#endif // HYPERDB_ROUTER_ROUTER_STATS_H_
