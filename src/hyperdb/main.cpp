#include <iostream>
#include <string>
#include <vector>

#include "hyperdb/catalog/memory_catalog.h"
#include "hyperdb/chunk/chunk_manager.h"
#include "hyperdb/common/logger.h"
#include "hyperdb/core/config.h"
#include "hyperdb/partition/epoch_manager.h"
#include "hyperdb/partition/partitioning.h"
#include "hyperdb/replica/memory_replica_store.h"
#include "hyperdb/replica/provisioner.h"
#include "hyperdb/router/insert_router.h"
#include "hyperdb/staging/staging_buffer.h"
#include "hyperdb/txn/transaction.h"

using namespace hyperdb;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --rows N            Rows to stage and route (default: 1000)\n"
              << "  --replicas N        Replicas per partition (default: 2)\n"
              << "  --partitions N      Partitions per epoch (default: 4)\n"
              << "  --chunk-length N    Chunk length in seconds (default: 3600)\n"
              << "  --log-level NAME    trace, debug, info, warn, error (default: info)\n"
              << "  --verbose           Log every routed group at debug level\n"
              << "  --help              Show this help\n";
}

catalog::Hypertable make_hypertable() {
    catalog::Hypertable hypertable;
    hypertable.name = "metrics";
    hypertable.time_column_name = "time";
    hypertable.columns = {
        {"time", core::ColumnType::BIGINT, false},
        {"device", core::ColumnType::TEXT, true},
        {"region", core::ColumnType::TEXT, true},
        {"value", core::ColumnType::DOUBLE, false},
    };
    return hypertable;
}

}  // namespace

int main(int argc, char** argv) {
    int num_rows = 1000;
    int num_replicas = 2;
    int num_partitions = 4;
    core::Duration chunk_length = 3600;
    bool verbose = false;
    spdlog::level::level_enum log_level = spdlog::level::info;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--rows" && i + 1 < argc) num_rows = std::stoi(argv[++i]);
            else if (arg == "--replicas" && i + 1 < argc) num_replicas = std::stoi(argv[++i]);
            else if (arg == "--partitions" && i + 1 < argc) num_partitions = std::stoi(argv[++i]);
            else if (arg == "--chunk-length" && i + 1 < argc) chunk_length = std::stoll(argv[++i]);
            else if (arg == "--log-level" && i + 1 < argc) {
                std::string name = argv[++i];
                if (!common::Logger::ParseLevel(name, log_level)) {
                    std::cerr << "Unknown log level: " << name << std::endl;
                    return 1;
                }
            }
            else if (arg == "--verbose") verbose = true;
            else if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid option value: " << e.what() << std::endl;
        return 1;
    }

    if (verbose && log_level > spdlog::level::debug) {
        log_level = spdlog::level::debug;
    }
    common::Logger::Init(log_level);

    core::RouterConfig config = core::RouterConfig::Default();
    config.chunk.chunk_length = chunk_length;
    config.log_routed_groups = verbose;

    catalog::MemoryCatalog catalog;
    replica::NamingProvisioner provisioner;
    replica::MemoryReplicaStore store;
    auto registry = partition::PartitioningRegistry::WithBuiltins();

    auto hypertable = make_hypertable();
    auto added = catalog.add_hypertable(hypertable);
    if (!added.ok()) {
        HYPERDB_CRITICAL("Failed to add hypertable: {}", added.error());
        return 1;
    }

    try {
        chunk::ChunkManager chunks(catalog, provisioner, config.chunk);
        router::InsertRouter router(catalog, chunks, store, registry, config);
        partition::EpochManager epochs(catalog, registry, config.partitioning);

        partition::EpochSpec spec;
        spec.hypertable_name = hypertable.name;
        spec.partitioning_column = "device";
        spec.partition_count = num_partitions;
        for (int r = 0; r < num_replicas; ++r) {
            spec.replica_endpoints.push_back("node" + std::to_string(r + 1));
        }
        auto epoch = epochs.create_epoch(spec);
        if (!epoch.ok()) {
            HYPERDB_CRITICAL("Failed to create epoch: {}", epoch.error());
            return 1;
        }

        auto schema = hypertable.schema();
        staging::StagingBuffer staging(schema);
        for (int i = 0; i < num_rows; ++i) {
            core::Row row;
            row.push_back(static_cast<int64_t>(i) * 60);
            row.push_back("device-" + std::to_string(i % 16));
            row.push_back(std::string(i % 3 == 0 ? "eu" : "us"));
            row.push_back(static_cast<double>(i) * 0.5);
            auto appended = staging.append(std::move(row));
            if (!appended.ok()) {
                HYPERDB_CRITICAL("Failed to stage row {}: {}", i, appended.error());
                return 1;
            }
        }
        HYPERDB_INFO("Staged {} rows for {}", staging.size(), hypertable.name);

        txn::Transaction txn;
        auto inserted = router.insert(txn, hypertable.name, staging);
        if (!inserted.ok()) {
            HYPERDB_ERROR("Insert failed [{}]: {}", core::state_code(inserted.error_code()),
                          inserted.error());
            txn.rollback();
            return 1;
        }
        auto committed = txn.commit();
        if (!committed.ok()) {
            HYPERDB_ERROR("Commit failed: {}", committed.error());
            return 1;
        }

        HYPERDB_INFO("Routed into {} chunks, {} rows stored across {} physical tables",
                     chunks.chunks_created(), store.total_rows(), store.targets().size());
        std::cout << router.get_stats_string();
    } catch (const core::Error& e) {
        HYPERDB_CRITICAL("Router setup failed: {}", e.what());
        return 1;
    }
    return 0;
}
