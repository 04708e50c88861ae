#include <gtest/gtest.h>
#include "hyperdb/replica/provisioner.h"

namespace hyperdb {
namespace replica {
namespace {

catalog::PartitionReplica Replica(core::ReplicaID replica_id, const std::string& endpoint) {
    catalog::PartitionReplica replica;
    replica.id = 10 + replica_id;
    replica.partition_id = 1;
    replica.hypertable_name = "metrics";
    replica.replica_id = replica_id;
    replica.endpoint = endpoint;
    return replica;
}

TEST(NamingProvisionerTest, NamesTablesPerReplica) {
    NamingProvisioner provisioner;
    catalog::Chunk chunk;
    chunk.partition_id = 1;
    chunk.start_time = 0;

    auto first = provisioner.provision(Replica(1, "node1"), chunk);
    auto second = provisioner.provision(Replica(2, "node2"), chunk);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());

    EXPECT_EQ(first.value().endpoint, "node1");
    EXPECT_EQ(first.value().schema_name, "_hyper_data");
    EXPECT_EQ(first.value().table_name, "_hyper_metrics_1_1_data");
    EXPECT_EQ(second.value().table_name, "_hyper_metrics_2_2_data");
    EXPECT_NE(first.value(), second.value());
    EXPECT_EQ(first.value().to_string(), "node1:_hyper_data._hyper_metrics_1_1_data");
}

TEST(NamingProvisionerTest, RejectsReplicaWithoutEndpoint) {
    NamingProvisioner provisioner;
    auto result = provisioner.provision(Replica(1, ""), catalog::Chunk());
    EXPECT_EQ(result.error_code(), core::Error::Code::INVALID_ARGUMENT);
}

} // namespace
} // namespace replica
} // namespace hyperdb
