#include <gtest/gtest.h>
#include "hyperdb/replica/memory_replica_store.h"

namespace hyperdb {
namespace replica {
namespace {

catalog::PhysicalTarget Target(const std::string& endpoint, const std::string& table) {
    return catalog::PhysicalTarget{endpoint, "_hyper_data", table};
}

std::vector<core::Row> Rows(int count) {
    std::vector<core::Row> rows;
    for (int i = 0; i < count; ++i) {
        rows.push_back(core::Row{int64_t(i), std::string("d") + std::to_string(i)});
    }
    return rows;
}

TEST(MemoryReplicaStoreTest, ApplyBatchCommitted) {
    MemoryReplicaStore store;
    auto target = Target("node1", "t1");

    txn::Transaction txn;
    auto written = store.apply_batch(target, Rows(3), txn);
    ASSERT_TRUE(written.ok());
    EXPECT_EQ(written.value(), 3u);
    ASSERT_TRUE(txn.commit().ok());

    EXPECT_EQ(store.row_count(target), 3u);
    EXPECT_EQ(store.total_rows(), 3u);
    EXPECT_EQ(store.targets().size(), 1u);
    EXPECT_EQ(store.batches_applied(), 1u);
}

TEST(MemoryReplicaStoreTest, RollbackRemovesOnlyThatBatch) {
    MemoryReplicaStore store;
    auto target = Target("node1", "t1");
    {
        txn::Transaction txn;
        ASSERT_TRUE(store.apply_batch(target, Rows(2), txn).ok());
        ASSERT_TRUE(txn.commit().ok());
    }
    {
        txn::Transaction txn;
        ASSERT_TRUE(store.apply_batch(target, Rows(5), txn).ok());
        EXPECT_EQ(store.row_count(target), 7u);
        txn.rollback();
    }
    EXPECT_EQ(store.row_count(target), 2u);
}

TEST(MemoryReplicaStoreTest, EmptyBatchWritesNothing) {
    MemoryReplicaStore store;
    txn::Transaction txn;
    auto written = store.apply_batch(Target("node1", "t1"), {}, txn);
    ASSERT_TRUE(written.ok());
    EXPECT_EQ(written.value(), 0u);
    EXPECT_TRUE(store.targets().empty());
    EXPECT_EQ(txn.undo_depth(), 0u);
}

TEST(MemoryReplicaStoreTest, UnavailableEndpointFails) {
    MemoryReplicaStore store;
    store.set_unavailable("node2", true);

    txn::Transaction txn;
    EXPECT_TRUE(store.apply_batch(Target("node1", "t1"), Rows(1), txn).ok());
    auto failed = store.apply_batch(Target("node2", "t2"), Rows(1), txn);
    EXPECT_EQ(failed.error_code(), core::Error::Code::INTERNAL);

    store.set_unavailable("node2", false);
    EXPECT_TRUE(store.apply_batch(Target("node2", "t2"), Rows(1), txn).ok());
}

TEST(MemoryReplicaStoreTest, DistinctUpsertAbsorbsConflicts) {
    MemoryReplicaStore store;
    catalog::PhysicalTarget table{"node1", "_hyper_distinct", "metrics_1_distinct"};

    txn::Transaction txn;
    auto first = store.upsert_distinct(table, "device", {"a", "b"}, txn);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.value(), 2u);

    auto second = store.upsert_distinct(table, "device", {"b", "c"}, txn);
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.value(), 1u);

    auto repeat = store.upsert_distinct(table, "device", {"a", "b", "c"}, txn);
    ASSERT_TRUE(repeat.ok());
    EXPECT_EQ(repeat.value(), 0u);
    ASSERT_TRUE(txn.commit().ok());

    EXPECT_EQ(store.distinct_values(table, "device"), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(store.distinct_log(table).size(), 3u);
    EXPECT_TRUE(store.distinct_values(table, "region").empty());
}

TEST(MemoryReplicaStoreTest, DistinctRollback) {
    MemoryReplicaStore store;
    catalog::PhysicalTarget table{"node1", "_hyper_distinct", "metrics_1_distinct"};
    {
        txn::Transaction txn;
        ASSERT_TRUE(store.upsert_distinct(table, "device", {"a"}, txn).ok());
        ASSERT_TRUE(txn.commit().ok());
    }
    {
        txn::Transaction txn;
        ASSERT_TRUE(store.upsert_distinct(table, "device", {"a", "z"}, txn).ok());
        txn.rollback();
    }
    EXPECT_EQ(store.distinct_values(table, "device"), (std::vector<std::string>{"a"}));
    EXPECT_EQ(store.distinct_log(table).size(), 1u);
}

TEST(MemoryReplicaStoreTest, DistinctRollbackKeepsValueCommittedElsewhere) {
    MemoryReplicaStore store;
    catalog::PhysicalTarget table{"node1", "_hyper_distinct", "metrics_1_distinct"};

    txn::Transaction first;
    auto added = store.upsert_distinct(table, "device", {"d1"}, first);
    ASSERT_TRUE(added.ok());
    EXPECT_EQ(added.value(), 1u);
    {
        txn::Transaction second;
        auto absorbed = store.upsert_distinct(table, "device", {"d1"}, second);
        ASSERT_TRUE(absorbed.ok());
        EXPECT_EQ(absorbed.value(), 0u);
        ASSERT_TRUE(second.commit().ok());
    }
    first.rollback();

    EXPECT_EQ(store.distinct_values(table, "device"), (std::vector<std::string>{"d1"}));
    EXPECT_EQ(store.distinct_log(table).size(), 1u);
}

TEST(MemoryReplicaStoreTest, DistinctRollbackOfBothClaimsDropsValue) {
    MemoryReplicaStore store;
    catalog::PhysicalTarget table{"node1", "_hyper_distinct", "metrics_1_distinct"};

    txn::Transaction first;
    txn::Transaction second;
    ASSERT_TRUE(store.upsert_distinct(table, "device", {"d1"}, first).ok());
    ASSERT_TRUE(store.upsert_distinct(table, "device", {"d1", "d2"}, second).ok());
    first.rollback();
    EXPECT_EQ(store.distinct_values(table, "device"), (std::vector<std::string>{"d1", "d2"}));
    second.rollback();

    EXPECT_TRUE(store.distinct_values(table, "device").empty());
    EXPECT_TRUE(store.distinct_log(table).empty());
}

TEST(MemoryReplicaStoreTest, WritesNeedActiveTransaction) {
    MemoryReplicaStore store;
    txn::Transaction txn;
    ASSERT_TRUE(txn.commit().ok());
    EXPECT_EQ(store.apply_batch(Target("node1", "t1"), Rows(1), txn).error_code(),
              core::Error::Code::TRANSACTION_ABORTED);
}

} // namespace
} // namespace replica
} // namespace hyperdb
