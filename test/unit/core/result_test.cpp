#include <gtest/gtest.h>
#include "hyperdb/core/result.h"
#include "hyperdb/core/error.h"
#include <string>
#include <vector>

namespace hyperdb {
namespace core {
namespace {

TEST(ResultTest, SuccessConstruction) {
    Result<int> result(42);
    EXPECT_TRUE(result.ok());
    EXPECT_FALSE(result.has_error());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorConstruction) {
    auto result = Result<int>::error("Invalid input", Error::Code::INVALID_ARGUMENT);
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.has_error());
    EXPECT_EQ(result.error(), "Invalid input");
    EXPECT_EQ(result.error_code(), Error::Code::INVALID_ARGUMENT);
}

TEST(ResultTest, DefaultErrorCodeIsUnknown) {
    auto result = Result<std::string>::error("Resource not found");
    EXPECT_EQ(result.error_code(), Error::Code::UNKNOWN);
}

TEST(ResultTest, VectorResult) {
    std::vector<int> vec = {1, 2, 3, 4, 5};
    Result<std::vector<int>> result(vec);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.value().size(), 5u);
}

TEST(ResultTest, MoveConstruction) {
    Result<std::string> original("moved string");
    Result<std::string> moved(std::move(original));

    EXPECT_TRUE(moved.ok());
    EXPECT_EQ(moved.value(), "moved string");
}

TEST(ResultTest, TakeValue) {
    Result<std::string> result("test value");
    std::string value = result.take_value();
    EXPECT_EQ(value, "test value");
}

TEST(ResultTest, VoidResult) {
    Result<void> result;
    EXPECT_TRUE(result.ok());
    EXPECT_FALSE(result.has_error());

    auto failed = Result<void>::error("Internal error", Error::Code::INTERNAL);
    EXPECT_FALSE(failed.ok());
    EXPECT_EQ(failed.error(), "Internal error");
    EXPECT_EQ(failed.error_code(), Error::Code::INTERNAL);
}

TEST(ResultTest, ErrorConstructor) {
    Error error("Custom error", Error::Code::INVALID_ARGUMENT);
    Result<int> result(error);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error(), "Custom error");
    EXPECT_EQ(result.error_code(), Error::Code::INVALID_ARGUMENT);
}

TEST(ResultTest, ForwardKeepsMessageAndCode) {
    auto inner = Result<int>::error("no epoch", Error::Code::EPOCH_NOT_FOUND);
    auto outer = Result<std::string>::forward(inner);
    EXPECT_FALSE(outer.ok());
    EXPECT_EQ(outer.error(), "no epoch");
    EXPECT_EQ(outer.error_code(), Error::Code::EPOCH_NOT_FOUND);

    auto as_void = Result<void>::forward(inner);
    EXPECT_EQ(as_void.error_code(), Error::Code::EPOCH_NOT_FOUND);
}

TEST(ResultTest, ExceptionOnErrorAccess) {
    Result<int> result(42);
    EXPECT_THROW(result.error(), std::runtime_error);

    Result<void> ok;
    EXPECT_THROW(ok.error(), std::runtime_error);
}

} // namespace
} // namespace core
} // namespace hyperdb
