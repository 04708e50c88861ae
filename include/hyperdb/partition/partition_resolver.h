#ifndef HYPERDB_PARTITION_PARTITION_RESOLVER_H_
#define HYPERDB_PARTITION_PARTITION_RESOLVER_H_

#include <vector>

#include "hyperdb/catalog/catalog.h"
#include "hyperdb/core/types.h"
#include "hyperdb/core/result.h"
#include "hyperdb/partition/partitioning.h"

namespace hyperdb {
namespace partition {

/**
 * @brief Maps a row's key to the partition of an epoch that owns it
 *
 * Pure: the result depends only on the epoch, its partitions and the row.
 */
class PartitionResolver {
public:
    explicit PartitionResolver(const PartitioningRegistry& registry);

    /**
     * @brief partitioning_func(key) mod modulus for the epoch's key column
     */
    core::Result<core::Keyspace> keyspace_of(const catalog::Epoch& epoch,
                                             const core::RowSchema& schema,
                                             const core::Row& row) const;

    /**
     * @brief Partition whose range contains the row's keyspace value.
     *
     * Fails with PARTITION_NOT_FOUND when no partition covers the value,
     * which only happens with an inconsistent catalog.
     */
    core::Result<catalog::Partition> resolve(const catalog::Epoch& epoch,
                                             const std::vector<catalog::Partition>& partitions,
                                             const core::RowSchema& schema,
                                             const core::Row& row) const;

    static core::Result<catalog::Partition> find(const std::vector<catalog::Partition>& partitions,
                                                 core::Keyspace key);

    /**
     * @brief True when the ranges tile [0, modulus) with no gap and no overlap
     */
    static bool tiles_keyspace(std::vector<catalog::Partition> partitions,
                               core::Keyspace modulus);

    /**
     * @brief Splits [0, modulus) into count contiguous ranges of near equal size
     */
    static std::vector<catalog::Partition> split_keyspace(core::Keyspace modulus, int count);

    const PartitioningRegistry& registry() const { return registry_; }

private:
    const PartitioningRegistry& registry_;
};

} // namespace partition
} // namespace hyperdb

#endif // HYPERDB_PARTITION_PARTITION_RESOLVER_H_
