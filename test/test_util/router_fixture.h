#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "hyperdb/catalog/memory_catalog.h"
#include "hyperdb/chunk/chunk_manager.h"
#include "hyperdb/core/config.h"
#include "hyperdb/partition/epoch_manager.h"
#include "hyperdb/partition/partitioning.h"
#include "hyperdb/replica/memory_replica_store.h"
#include "hyperdb/replica/provisioner.h"

namespace hyperdb {
namespace testutil {

inline catalog::Hypertable MetricsHypertable(const std::string& name = "metrics") {
    catalog::Hypertable hypertable;
    hypertable.name = name;
    hypertable.time_column_name = "time";
    hypertable.columns = {
        {"time", core::ColumnType::BIGINT, false},
        {"device", core::ColumnType::TEXT, true},
        {"region", core::ColumnType::TEXT, true},
        {"value", core::ColumnType::DOUBLE, false},
    };
    return hypertable;
}

// time, device, region, value; a missing time stages a null
inline core::Row MetricsRow(std::optional<int64_t> time,
                            const std::string& device,
                            const std::string& region = "eu",
                            double value = 1.0) {
    core::Row row;
    if (time) {
        row.push_back(*time);
    } else {
        row.push_back(core::Value());
    }
    row.push_back(device);
    row.push_back(region);
    row.push_back(value);
    return row;
}

inline std::vector<std::string> Endpoints(int count) {
    std::vector<std::string> endpoints;
    for (int i = 1; i <= count; ++i) {
        endpoints.push_back("node" + std::to_string(i));
    }
    return endpoints;
}

// In-memory catalog, provisioner and replica store with one registered hypertable
class CatalogFixture : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = partition::PartitioningRegistry::WithBuiltins();
        catalog_ = std::make_unique<catalog::MemoryCatalog>();
        auto added = catalog_->add_hypertable(MetricsHypertable());
        ASSERT_TRUE(added.ok()) << added.error();
        epochs_ = std::make_unique<partition::EpochManager>(*catalog_, registry_);
    }

    partition::EpochSpec MakeSpec(std::optional<core::Timestamp> start,
                                  std::optional<core::Timestamp> end,
                                  int partitions = 1,
                                  int replicas = 1) const {
        partition::EpochSpec spec;
        spec.hypertable_name = "metrics";
        spec.start_time = start;
        spec.end_time = end;
        spec.partitioning_func = "get_partition_for_key";
        spec.partitioning_column = "device";
        spec.partitioning_mod = 1000;
        spec.partition_count = partitions;
        spec.replica_endpoints = Endpoints(replicas);
        return spec;
    }

    catalog::Epoch CreateEpoch(const partition::EpochSpec& spec) {
        auto epoch = epochs_->create_epoch(spec);
        EXPECT_TRUE(epoch.ok()) << epoch.error();
        return epoch.ok() ? epoch.value() : catalog::Epoch();
    }

    catalog::Partition FirstPartition(core::EpochID epoch_id) const {
        auto partitions = catalog_->partitions(epoch_id);
        EXPECT_FALSE(partitions.empty());
        return partitions.empty() ? catalog::Partition() : partitions.front();
    }

    partition::PartitioningRegistry registry_;
    std::unique_ptr<catalog::MemoryCatalog> catalog_;
    std::unique_ptr<partition::EpochManager> epochs_;
    replica::NamingProvisioner provisioner_;
    replica::MemoryReplicaStore store_;
};

} // namespace testutil
} // namespace hyperdb
