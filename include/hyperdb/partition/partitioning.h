#ifndef HYPERDB_PARTITION_PARTITIONING_H_
#define HYPERDB_PARTITION_PARTITIONING_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "hyperdb/core/types.h"
#include "hyperdb/core/result.h"

namespace hyperdb {
namespace partition {

/**
 * @brief 32-bit MurmurHash3 (x86 variant)
 */
uint32_t murmur3_32(const void* data, size_t length, uint32_t seed = 0);

/**
 * @brief Maps a key value into [0, modulus)
 */
using PartitioningFunction =
    std::function<core::Result<core::Keyspace>(const core::Value& key, core::Keyspace modulus)>;

/**
 * @brief Partitioning functions by id
 *
 * Built-ins:
 *  - get_partition_for_key: murmur3 of the key's text form, masked to 31 bits
 *  - get_partition_for_int: integer key value, floor modulo
 */
class PartitioningRegistry {
public:
    PartitioningRegistry() = default;

    static PartitioningRegistry WithBuiltins();

    core::Result<void> register_function(const std::string& name, PartitioningFunction fn);
    bool has(const std::string& name) const;
    std::vector<std::string> names() const;

    /**
     * @brief Applies the named function; fails with NOT_FOUND for an unknown
     * function and INVALID_ARGUMENT for a non-positive modulus
     */
    core::Result<core::Keyspace> apply(const std::string& name,
                                       const core::Value& key,
                                       core::Keyspace modulus) const;

private:
    std::map<std::string, PartitioningFunction> functions_;
};

core::Result<core::Keyspace> partition_for_key(const core::Value& key, core::Keyspace modulus);
core::Result<core::Keyspace> partition_for_int(const core::Value& key, core::Keyspace modulus);

} // namespace partition
} // namespace hyperdb

#endif // HYPERDB_PARTITION_PARTITIONING_H_
