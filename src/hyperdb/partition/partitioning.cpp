#include "hyperdb/partition/partitioning.h"
#include <cstring>

namespace hyperdb {
namespace partition {

namespace {

inline uint32_t rotl32(uint32_t x, int8_t r) {
    return (x << r) | (x >> (32 - r));
}

inline uint32_t fmix32(uint32_t h) {
    h ^= h >> 16;
    h *= 0x85ebca6b;
    h ^= h >> 13;
    h *= 0xc2b2ae35;
    h ^= h >> 16;
    return h;
}

} // namespace

uint32_t murmur3_32(const void* data, size_t length, uint32_t seed) {
    const uint8_t* bytes = static_cast<const uint8_t*>(data);
    const size_t nblocks = length / 4;
    const uint32_t c1 = 0xcc9e2d51;
    const uint32_t c2 = 0x1b873593;
    uint32_t h1 = seed;

    for (size_t i = 0; i < nblocks; ++i) {
        uint32_t k1;
        std::memcpy(&k1, bytes + i * 4, sizeof(k1));
        k1 *= c1;
        k1 = rotl32(k1, 15);
        k1 *= c2;

        h1 ^= k1;
        h1 = rotl32(h1, 13);
        h1 = h1 * 5 + 0xe6546b64;
    }

    const uint8_t* tail = bytes + nblocks * 4;
    uint32_t k1 = 0;
    switch (length & 3) {
        case 3: k1 ^= static_cast<uint32_t>(tail[2]) << 16; [[fallthrough]];
        case 2: k1 ^= static_cast<uint32_t>(tail[1]) << 8;  [[fallthrough]];
        case 1: k1 ^= tail[0];
                k1 *= c1;
                k1 = rotl32(k1, 15);
                k1 *= c2;
                h1 ^= k1;
    }

    h1 ^= static_cast<uint32_t>(length);
    return fmix32(h1);
}

core::Result<core::Keyspace> partition_for_key(const core::Value& key, core::Keyspace modulus) {
    std::string text = core::value_to_text(key);
    uint32_t hash = murmur3_32(text.data(), text.size()) & 0x7fffffff;
    return core::Result<core::Keyspace>(static_cast<core::Keyspace>(hash % static_cast<uint32_t>(modulus)));
}

core::Result<core::Keyspace> partition_for_int(const core::Value& key, core::Keyspace modulus) {
    auto v = std::get_if<int64_t>(&key);
    if (!v) {
        return core::Result<core::Keyspace>::error("get_partition_for_int needs an integer key",
                                                   core::Error::Code::INVALID_ARGUMENT);
    }
    int64_t r = *v % modulus;
    if (r < 0) {
        r += modulus;
    }
    return core::Result<core::Keyspace>(static_cast<core::Keyspace>(r));
}

PartitioningRegistry PartitioningRegistry::WithBuiltins() {
    PartitioningRegistry registry;
    registry.functions_["get_partition_for_key"] = partition_for_key;
    registry.functions_["get_partition_for_int"] = partition_for_int;
    return registry;
}

core::Result<void> PartitioningRegistry::register_function(const std::string& name,
                                                           PartitioningFunction fn) {
    if (name.empty() || !fn) {
        return core::Result<void>::error("Partitioning function needs a name and a body",
                                         core::Error::Code::INVALID_ARGUMENT);
    }
    if (!functions_.emplace(name, std::move(fn)).second) {
        return core::Result<void>::error("Partitioning function " + name + " already registered",
                                         core::Error::Code::ALREADY_EXISTS);
    }
    return core::Result<void>();
}

bool PartitioningRegistry::has(const std::string& name) const {
    return functions_.find(name) != functions_.end();
}

std::vector<std::string> PartitioningRegistry::names() const {
    std::vector<std::string> result;
    for (const auto& [name, fn] : functions_) {
        result.push_back(name);
    }
    return result;
}

core::Result<core::Keyspace> PartitioningRegistry::apply(const std::string& name,
                                                         const core::Value& key,
                                                         core::Keyspace modulus) const {
    if (modulus <= 0) {
        return core::Result<core::Keyspace>::error("Partitioning modulus must be positive",
                                                   core::Error::Code::INVALID_ARGUMENT);
    }
    auto it = functions_.find(name);
    if (it == functions_.end()) {
        return core::Result<core::Keyspace>::error("Unknown partitioning function " + name,
                                                   core::Error::Code::NOT_FOUND);
    }
    return it->second(key, modulus);
}

} // namespace partition
} // namespace hyperdb
