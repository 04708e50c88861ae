#include <gtest/gtest.h>
#include "hyperdb/router/insert_guard.h"

namespace hyperdb {
namespace router {
namespace {

TEST(InsertGuardTest, FirstEntrySetsMarker) {
    txn::Transaction txn;
    auto entered = InsertGuard::enter(txn);
    ASSERT_TRUE(entered.ok());
    EXPECT_TRUE(txn.insert_in_progress());
}

TEST(InsertGuardTest, SecondEntryIsReentrant) {
    txn::Transaction txn;
    ASSERT_TRUE(InsertGuard::enter(txn).ok());

    auto again = InsertGuard::enter(txn);
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error_code(), core::Error::Code::REENTRANT_INSERT);
    EXPECT_EQ(again.error(), "insert() can only be called once per transaction");
    EXPECT_STREQ(core::state_code(again.error_code()), "HD001");
}

TEST(InsertGuardTest, MarkerDoesNotLeakIntoNextTransaction) {
    {
        txn::Transaction txn;
        ASSERT_TRUE(InsertGuard::enter(txn).ok());
        ASSERT_TRUE(txn.commit().ok());
    }
    txn::Transaction next;
    EXPECT_TRUE(InsertGuard::enter(next).ok());
}

TEST(InsertGuardTest, FinishedTransactionIsRejected) {
    txn::Transaction txn;
    txn.rollback();
    EXPECT_EQ(InsertGuard::enter(txn).error_code(), core::Error::Code::TRANSACTION_ABORTED);
}

} // namespace
} // namespace router
} // namespace hyperdb
