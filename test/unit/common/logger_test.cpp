#include <gtest/gtest.h>
#include "hyperdb/common/logger.h"
#include <spdlog/sinks/ostream_sink.h>
#include <algorithm>
#include <sstream>

namespace hyperdb {
namespace common {
namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Init(spdlog::level::info);
        sink_ = std::make_shared<spdlog::sinks::ostream_sink_mt>(output_);
        sink_->set_pattern("%l %v");
        Logger::Get()->sinks().push_back(sink_);
    }

    void TearDown() override {
        auto& sinks = Logger::Get()->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
        Logger::SetLevel(spdlog::level::info);
    }

    std::ostringstream output_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
};

TEST_F(LoggerTest, GetReturnsNamedLogger) {
    auto logger = Logger::Get();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), Logger::kName);
    EXPECT_EQ(Logger::Get(), logger);
}

TEST_F(LoggerTest, MacrosRespectRuntimeLevel) {
    HYPERDB_INFO("routed {} rows", 3);
    HYPERDB_DEBUG("hidden at info");
    EXPECT_NE(output_.str().find("info routed 3 rows"), std::string::npos);
    EXPECT_EQ(output_.str().find("hidden"), std::string::npos);

    Logger::SetLevel(spdlog::level::debug);
    HYPERDB_DEBUG("group {}", 7);
    EXPECT_NE(output_.str().find("debug group 7"), std::string::npos);
}

TEST_F(LoggerTest, ParseLevel) {
    spdlog::level::level_enum level = spdlog::level::info;
    EXPECT_TRUE(Logger::ParseLevel("debug", level));
    EXPECT_EQ(level, spdlog::level::debug);
    EXPECT_TRUE(Logger::ParseLevel("off", level));
    EXPECT_EQ(level, spdlog::level::off);

    level = spdlog::level::warn;
    EXPECT_FALSE(Logger::ParseLevel("loud", level));
    EXPECT_EQ(level, spdlog::level::warn);
}

} // namespace
} // namespace common
} // namespace hyperdb
