#include "hyperdb/replica/provisioner.h"

namespace hyperdb {
namespace replica {

core::Result<catalog::PhysicalTarget> NamingProvisioner::provision(
    const catalog::PartitionReplica& replica,
    const catalog::Chunk& /*chunk*/) {
    if (replica.endpoint.empty()) {
        return core::Result<catalog::PhysicalTarget>::error(
            "Partition replica " + std::to_string(replica.id) + " has no endpoint",
            core::Error::Code::INVALID_ARGUMENT);
    }
    uint64_t sequence = sequence_.fetch_add(1) + 1;

    catalog::PhysicalTarget target;
    target.endpoint = replica.endpoint;
    target.schema_name = "_hyper_data";
    target.table_name = "_hyper_" + replica.hypertable_name + "_" +
                        std::to_string(replica.replica_id) + "_" +
                        std::to_string(sequence) + "_data";
    return core::Result<catalog::PhysicalTarget>(target);
}

} // namespace replica
} // namespace hyperdb
