#include <gtest/gtest.h>
#include "hyperdb/core/config.h"
#include <string>

namespace hyperdb {
namespace core {
namespace {

TEST(ChunkConfigTest, DefaultConstruction) {
    ChunkConfig config;
    EXPECT_EQ(config.chunk_length, 0);
}

TEST(ChunkConfigTest, Presets) {
    EXPECT_EQ(ChunkConfig::Default().chunk_length, 86400);
    EXPECT_EQ(ChunkConfig::Microseconds().chunk_length, 86400000000LL);
}

TEST(PartitioningConfigTest, Defaults) {
    PartitioningConfig empty;
    EXPECT_EQ(empty.default_function, "");
    EXPECT_EQ(empty.default_modulus, 0);

    auto config = PartitioningConfig::Default();
    EXPECT_EQ(config.default_function, "get_partition_for_key");
    EXPECT_EQ(config.default_modulus, 32768);
}

TEST(RouterConfigTest, DefaultComposesSubConfigs) {
    RouterConfig empty;
    EXPECT_FALSE(empty.log_routed_groups);

    auto config = RouterConfig::Default();
    EXPECT_EQ(config.chunk.chunk_length, ChunkConfig::Default().chunk_length);
    EXPECT_EQ(config.partitioning.default_modulus, 32768);
    EXPECT_TRUE(config.log_routed_groups);
}

TEST(RouterConfigTest, CopyConstruction) {
    RouterConfig original = RouterConfig::Default();
    original.chunk.chunk_length = 3600;
    original.partitioning.default_function = "get_partition_for_int";

    RouterConfig copy(original);
    EXPECT_EQ(copy.chunk.chunk_length, 3600);
    EXPECT_EQ(copy.partitioning.default_function, "get_partition_for_int");
}

} // namespace
} // namespace core
} // namespace hyperdb
