#include <gtest/gtest.h>
#include "hyperdb/router/fanout_router.h"
#include "test_util/router_fixture.h"

namespace hyperdb {
namespace router {
namespace {

class FanoutRouterTest : public testutil::CatalogFixture {
protected:
    void SetUp() override {
        CatalogFixture::SetUp();
        core::ChunkConfig config;
        config.chunk_length = 3600;
        chunks_ = std::make_unique<chunk::ChunkManager>(*catalog_, provisioner_, config);
        resolver_ = std::make_unique<partition::PartitionResolver>(registry_);
        indexer_ = std::make_unique<DistinctIndexer>(*catalog_, store_);
        fanout_ = std::make_unique<FanoutRouter>(*catalog_, *chunks_, *resolver_, store_, *indexer_);
        schema_ = testutil::MetricsHypertable().schema();
        staging_ = std::make_unique<staging::StagingBuffer>(schema_);
    }

    std::unique_ptr<chunk::ChunkManager> chunks_;
    std::unique_ptr<partition::PartitionResolver> resolver_;
    std::unique_ptr<DistinctIndexer> indexer_;
    std::unique_ptr<FanoutRouter> fanout_;
    core::RowSchema schema_;
    std::unique_ptr<staging::StagingBuffer> staging_;
};

TEST_F(FanoutRouterTest, PredicateUsesChunkWindow) {
    auto epoch = CreateEpoch(MakeSpec(std::nullopt, std::nullopt, 2, 1));
    auto partition = FirstPartition(epoch.id);
    auto chunk = chunks_->get_or_create(partition.id, 100);
    ASSERT_TRUE(chunk.ok());

    auto predicate = fanout_->build_predicate(chunk.value().id);
    ASSERT_TRUE(predicate.ok());
    EXPECT_EQ(predicate.value().time_start, std::optional<core::Timestamp>(0));
    EXPECT_EQ(predicate.value().time_end, std::optional<core::Timestamp>(3600));
    EXPECT_EQ(predicate.value().partition.id, partition.id);
    EXPECT_NE(predicate.value().to_string().find("between 0 and 499"), std::string::npos);

    EXPECT_EQ(fanout_->build_predicate(999).error_code(), core::Error::Code::NOT_FOUND);
}

TEST_F(FanoutRouterTest, PredicateIsClippedToEpoch) {
    auto epoch = CreateEpoch(MakeSpec(1000, 2000));
    auto chunk = chunks_->get_or_create(FirstPartition(epoch.id).id, 1500);
    ASSERT_TRUE(chunk.ok());

    auto predicate = fanout_->build_predicate(chunk.value().id);
    ASSERT_TRUE(predicate.ok());
    EXPECT_EQ(predicate.value().time_start, std::optional<core::Timestamp>(1000));
    EXPECT_EQ(predicate.value().time_end, std::optional<core::Timestamp>(2000));
}

TEST_F(FanoutRouterTest, FansOutToEveryReplicaAndRemovesOnce) {
    auto epoch = CreateEpoch(MakeSpec(std::nullopt, std::nullopt, 1, 3));
    auto partition = FirstPartition(epoch.id);

    int hook_calls = 0;
    staging_->set_delete_hook([&hook_calls](const core::Row&) { ++hook_calls; });
    staging_->append(testutil::MetricsRow(10, "d1", "eu"));
    staging_->append(testutil::MetricsRow(20, "d2", "us"));
    staging_->append(testutil::MetricsRow(5000, "d1", "eu"));   // next window
    staging_->append(testutil::MetricsRow(std::nullopt, "d3")); // no time

    auto chunk = chunks_->get_or_create(partition.id, 10);
    ASSERT_TRUE(chunk.ok());

    txn::Transaction txn;
    auto result = fanout_->route(txn, "metrics", schema_, *staging_, chunk.value());
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ(result.value().replicas, 3u);
    EXPECT_EQ(result.value().rows_moved, 2u);
    EXPECT_EQ(result.value().replica_inserts, 6u);
    EXPECT_EQ(result.value().distinct_added, 12u);
    ASSERT_TRUE(txn.commit().ok());

    EXPECT_EQ(hook_calls, 0);
    EXPECT_EQ(staging_->size(), 2u);
    for (const auto& node : catalog_->chunk_replica_nodes(chunk.value().id)) {
        EXPECT_EQ(store_.row_count(node.target), 2u) << node.target.to_string();
    }
    EXPECT_EQ(store_.total_rows(), 6u);
}

TEST_F(FanoutRouterTest, FailedReplicaWriteRollsBackEverything) {
    auto epoch = CreateEpoch(MakeSpec(std::nullopt, std::nullopt, 1, 2));
    auto partition = FirstPartition(epoch.id);
    staging_->append(testutil::MetricsRow(10, "d1"));
    auto chunk = chunks_->get_or_create(partition.id, 10);
    ASSERT_TRUE(chunk.ok());

    store_.set_unavailable("node2", true);
    {
        txn::Transaction txn;
        auto result = fanout_->route(txn, "metrics", schema_, *staging_, chunk.value());
        EXPECT_EQ(result.error_code(), core::Error::Code::INTERNAL);
        txn.rollback();
    }

    EXPECT_EQ(staging_->size(), 1u);
    EXPECT_EQ(store_.total_rows(), 0u);
    EXPECT_TRUE(store_.distinct_values(catalog_->distinct_target("metrics", 1, "node1").value(),
                                       "device").empty());
}

TEST_F(FanoutRouterTest, ChunkWithoutNodesIsInternalError) {
    txn::Transaction txn;
    catalog::Chunk orphan;
    orphan.id = 77;
    auto result = fanout_->route(txn, "metrics", schema_, *staging_, orphan);
    EXPECT_EQ(result.error_code(), core::Error::Code::INTERNAL);
}

} // namespace
} // namespace router
} // namespace hyperdb
