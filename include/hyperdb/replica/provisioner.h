#ifndef HYPERDB_REPLICA_PROVISIONER_H_
#define HYPERDB_REPLICA_PROVISIONER_H_

#include <atomic>
#include <string>

#include "hyperdb/catalog/catalog.h"
#include "hyperdb/core/result.h"

namespace hyperdb {
namespace replica {

/**
 * @brief Supplies the physical table that holds one replica of a new chunk
 */
class Provisioner {
public:
    virtual ~Provisioner() = default;

    virtual core::Result<catalog::PhysicalTarget> provision(
        const catalog::PartitionReplica& replica,
        const catalog::Chunk& chunk) = 0;
};

/**
 * @brief Names chunk tables on the replica's own endpoint:
 * _hyper_<hypertable>_<replica>_<sequence>_data in schema _hyper_data
 */
class NamingProvisioner : public Provisioner {
public:
    NamingProvisioner() = default;

    core::Result<catalog::PhysicalTarget> provision(
        const catalog::PartitionReplica& replica,
        const catalog::Chunk& chunk) override;

private:
    std::atomic<uint64_t> sequence_{0};
};

} // namespace replica
} // namespace hyperdb

#endif // HYPERDB_REPLICA_PROVISIONER_H_
