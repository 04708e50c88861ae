#include <gtest/gtest.h>
#include "hyperdb/staging/staging_buffer.h"
#include "test_util/router_fixture.h"

namespace hyperdb {
namespace staging {
namespace {

class StagingBufferTest : public ::testing::Test {
protected:
    StagingBufferTest() : staging_(testutil::MetricsHypertable().schema()) {}

    StagingBuffer staging_;
};

TEST_F(StagingBufferTest, AppendAndSelect) {
    ASSERT_TRUE(staging_.append(testutil::MetricsRow(10, "a")).ok());
    ASSERT_TRUE(staging_.append(testutil::MetricsRow(20, "b")).ok());
    ASSERT_TRUE(staging_.append(testutil::MetricsRow(30, "a")).ok());
    EXPECT_EQ(staging_.size(), 3u);
    EXPECT_FALSE(staging_.empty());

    auto is_a = [](const core::Row& row) { return std::get<std::string>(row[1]) == "a"; };
    EXPECT_EQ(staging_.select(is_a).size(), 2u);

    auto first = staging_.first_where(is_a);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(std::get<int64_t>(first->row[0]), 10);

    // Selecting does not consume
    EXPECT_EQ(staging_.size(), 3u);
}

TEST_F(StagingBufferTest, RejectsMisshapenRows) {
    core::Row short_row = {int64_t(1)};
    auto result = staging_.append(short_row);
    EXPECT_EQ(result.error_code(), core::Error::Code::INVALID_ARGUMENT);
    EXPECT_TRUE(staging_.empty());
}

TEST_F(StagingBufferTest, EraseIsUndoneOnRollback) {
    auto id = staging_.append(testutil::MetricsRow(10, "a")).value();
    staging_.append(testutil::MetricsRow(20, "b"));

    txn::Transaction txn;
    auto removed = staging_.erase({id, 999}, txn, DeleteOrigin::kRouter);
    ASSERT_TRUE(removed.ok());
    EXPECT_EQ(removed.value(), 1u);
    EXPECT_EQ(staging_.size(), 1u);

    txn.rollback();
    EXPECT_EQ(staging_.size(), 2u);
    auto rows = staging_.rows();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].id, id);
}

TEST_F(StagingBufferTest, EraseSticksOnCommit) {
    auto id = staging_.append(testutil::MetricsRow(10, "a")).value();
    txn::Transaction txn;
    ASSERT_TRUE(staging_.erase({id}, txn, DeleteOrigin::kRouter).ok());
    ASSERT_TRUE(txn.commit().ok());
    EXPECT_TRUE(staging_.empty());
}

TEST_F(StagingBufferTest, DeleteHookFiresOnlyForUserDeletes) {
    int hook_calls = 0;
    staging_.set_delete_hook([&hook_calls](const core::Row&) { ++hook_calls; });

    auto routed = staging_.append(testutil::MetricsRow(10, "a")).value();
    staging_.append(testutil::MetricsRow(20, "b"));
    staging_.append(testutil::MetricsRow(30, "b"));

    txn::Transaction txn;
    ASSERT_TRUE(staging_.erase({routed}, txn, DeleteOrigin::kRouter).ok());
    EXPECT_EQ(hook_calls, 0);

    auto deleted = staging_.delete_where(
        [](const core::Row& row) { return std::get<std::string>(row[1]) == "b"; }, txn);
    ASSERT_TRUE(deleted.ok());
    EXPECT_EQ(deleted.value(), 2u);
    EXPECT_EQ(hook_calls, 2);
    EXPECT_TRUE(staging_.empty());
}

TEST_F(StagingBufferTest, EraseNeedsActiveTransaction) {
    auto id = staging_.append(testutil::MetricsRow(10, "a")).value();
    txn::Transaction txn;
    txn.rollback();
    auto result = staging_.erase({id}, txn, DeleteOrigin::kRouter);
    EXPECT_EQ(result.error_code(), core::Error::Code::TRANSACTION_ABORTED);
    EXPECT_EQ(staging_.size(), 1u);
}

} // namespace
} // namespace staging
} // namespace hyperdb
