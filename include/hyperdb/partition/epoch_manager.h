#ifndef HYPERDB_PARTITION_EPOCH_MANAGER_H_
#define HYPERDB_PARTITION_EPOCH_MANAGER_H_

#include <optional>
#include <string>
#include <vector>

#include "hyperdb/catalog/catalog.h"
#include "hyperdb/core/config.h"
#include "hyperdb/core/result.h"
#include "hyperdb/partition/partitioning.h"

namespace hyperdb {
namespace partition {

/**
 * @brief Parameters of a new epoch
 *
 * Empty function and zero modulus fall back to PartitioningConfig defaults.
 * One partition replica is created per entry of replica_endpoints, with
 * replica ids 1..N.
 */
struct EpochSpec {
    std::string hypertable_name;
    std::optional<core::Timestamp> start_time;
    std::optional<core::Timestamp> end_time;
    std::string partitioning_func;
    std::string partitioning_column;
    core::Keyspace partitioning_mod = 0;
    int partition_count = 1;
    std::vector<std::string> replica_endpoints;
};

/**
 * @brief Tracks the time-windowed partitioning schemes of hypertables
 */
class EpochManager {
public:
    EpochManager(catalog::Catalog& catalog,
                 const PartitioningRegistry& registry,
                 const core::PartitioningConfig& config = core::PartitioningConfig::Default());

    /**
     * @brief The epoch of the hypertable whose [start, end) window holds time.
     * Fails with EPOCH_NOT_FOUND when none does.
     */
    core::Result<catalog::Epoch> find_epoch(const std::string& hypertable_name,
                                            core::Timestamp time) const;

    /**
     * @brief Point lookup over epochs sorted by start time (binary search)
     */
    static core::Result<catalog::Epoch> find_in(const std::vector<catalog::Epoch>& sorted_epochs,
                                                core::Timestamp time);

    /**
     * @brief Creates an epoch and its partitions, which exactly tile the keyspace
     */
    core::Result<catalog::Epoch> create_epoch(const EpochSpec& spec);

    /**
     * @brief Ends an open epoch so that a successor may start at end_time
     */
    core::Result<void> close_epoch(core::EpochID epoch_id, core::Timestamp end_time);

    /**
     * @brief Closes the open epoch at successor.start_time and opens the
     * successor there with its new partitioning scheme
     */
    core::Result<catalog::Epoch> repartition(const EpochSpec& successor);

    /**
     * @brief Checks that a hypertable's epochs are pairwise disjoint with at
     * most one open epoch
     */
    static bool epochs_are_disjoint(const std::vector<catalog::Epoch>& epochs);

private:
    core::Result<catalog::EpochLayout> build_layout(const EpochSpec& spec) const;

    catalog::Catalog& catalog_;
    const PartitioningRegistry& registry_;
    core::PartitioningConfig config_;
};

} // namespace partition
} // namespace hyperdb

#endif // HYPERDB_PARTITION_EPOCH_MANAGER_H_
