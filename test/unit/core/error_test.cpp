#include <gtest/gtest.h>
#include "hyperdb/core/error.h"
#include <string>

namespace hyperdb {
namespace core {
namespace {

TEST(ErrorTest, Construction) {
    Error error("Invalid input", Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(error.code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(error.what(), std::string("Invalid input"));
}

TEST(ErrorTest, CopyConstruction) {
    Error original("Epoch missing", Error::Code::EPOCH_NOT_FOUND);
    Error copy(original);

    EXPECT_EQ(copy.code(), original.code());
    EXPECT_EQ(copy.what(), std::string(original.what()));
}

TEST(ErrorTest, SpecificErrorTypes) {
    InvalidArgumentError invalid_arg("Invalid argument");
    EXPECT_EQ(invalid_arg.code(), Error::Code::INVALID_ARGUMENT);

    NotFoundError not_found("Resource not found");
    EXPECT_EQ(not_found.code(), Error::Code::NOT_FOUND);

    AlreadyExistsError already_exists("Resource already exists");
    EXPECT_EQ(already_exists.code(), Error::Code::ALREADY_EXISTS);

    InternalError internal("Internal error");
    EXPECT_EQ(internal.code(), Error::Code::INTERNAL);
    EXPECT_EQ(internal.what(), std::string("Internal error"));
}

TEST(ErrorTest, StateCodes) {
    EXPECT_STREQ(state_code(Error::Code::UNKNOWN), "HD000");
    EXPECT_STREQ(state_code(Error::Code::REENTRANT_INSERT), "HD001");
    EXPECT_STREQ(state_code(Error::Code::INVALID_ARGUMENT), "HD002");
    EXPECT_STREQ(state_code(Error::Code::TRANSACTION_ABORTED), "HD007");
    EXPECT_STREQ(state_code(Error::Code::INTERNAL), "HD500");
    EXPECT_STREQ(state_code(Error::Code::EPOCH_NOT_FOUND), "HD501");
    EXPECT_STREQ(state_code(Error::Code::PARTITION_NOT_FOUND), "HD502");
}

TEST(ErrorTest, InternalInconsistencyClass) {
    EXPECT_TRUE(is_internal_inconsistency(Error::Code::INTERNAL));
    EXPECT_TRUE(is_internal_inconsistency(Error::Code::EPOCH_NOT_FOUND));
    EXPECT_TRUE(is_internal_inconsistency(Error::Code::PARTITION_NOT_FOUND));

    EXPECT_FALSE(is_internal_inconsistency(Error::Code::REENTRANT_INSERT));
    EXPECT_FALSE(is_internal_inconsistency(Error::Code::INVALID_ARGUMENT));
    EXPECT_FALSE(is_internal_inconsistency(Error::Code::TRANSACTION_ABORTED));
}

TEST(ErrorTest, CodeNames) {
    EXPECT_STREQ(code_name(Error::Code::REENTRANT_INSERT), "REENTRANT_INSERT");
    EXPECT_STREQ(code_name(Error::Code::PARTITION_NOT_FOUND), "PARTITION_NOT_FOUND");
    EXPECT_STREQ(code_name(Error::Code::NOT_FOUND), "NOT_FOUND");
}

} // namespace
} // namespace core
} // namespace hyperdb
