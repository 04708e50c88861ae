#pragma once

#include <cstdint>
#include <string>

#include "hyperdb/core/types.h"

namespace hyperdb {
namespace core {

/**
 * @brief Configuration for chunk placement and closing
 */
struct ChunkConfig {
    Duration chunk_length;      // Time span of one chunk, in time column units

    // Default constructor
    ChunkConfig() : chunk_length(0) {}

    static ChunkConfig Default() {
        ChunkConfig config;
        config.chunk_length = 86'400;           // 1 day of second-resolution time
        return config;
    }

    static ChunkConfig Microseconds() {
        ChunkConfig config;
        config.chunk_length = 86'400'000'000;   // 1 day of TIMESTAMP time
        return config;
    }
};

/**
 * @brief Defaults used when an epoch is created without explicit partitioning
 */
struct PartitioningConfig {
    std::string default_function;   // Partitioning function id
    Keyspace default_modulus;       // Size of the hashed keyspace

    // Default constructor
    PartitioningConfig() : default_modulus(0) {}

    static PartitioningConfig Default() {
        PartitioningConfig config;
        config.default_function = "get_partition_for_key";
        config.default_modulus = 32768;
        return config;
    }
};

/**
 * @brief Top-level configuration for the insert router
 */
struct RouterConfig {
    ChunkConfig chunk;
    PartitioningConfig partitioning;
    bool log_routed_groups;         // Emit a debug line per routed group

    RouterConfig() : log_routed_groups(false) {}

    static RouterConfig Default() {
        RouterConfig config;
        config.chunk = ChunkConfig::Default();
        config.partitioning = PartitioningConfig::Default();
        config.log_routed_groups = true;
        return config;
    }
};

} // namespace core
} // namespace hyperdb
