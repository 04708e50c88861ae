#ifndef HYPERDB_COMMON_LOGGER_H_
#define HYPERDB_COMMON_LOGGER_H_

#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace hyperdb {
namespace common {

/**
 * @brief Process-wide "hyperdb" logger
 *
 * Get() works before Init(); the first call registers a colored console
 * logger at info level.
 */
class Logger {
public:
    static constexpr const char* kName = "hyperdb";

    static void Init(spdlog::level::level_enum level = spdlog::level::info);
    static void SetLevel(spdlog::level::level_enum level);
    static std::shared_ptr<spdlog::logger> Get();

    /**
     * @brief Level for a name such as "debug" or "warn"; false if unknown
     */
    static bool ParseLevel(const std::string& name, spdlog::level::level_enum& level);
};

} // namespace common
} // namespace hyperdb

// Macros for convenient logging; they carry the call site
#define HYPERDB_TRACE(...) SPDLOG_LOGGER_TRACE(::hyperdb::common::Logger::Get(), __VA_ARGS__)
#define HYPERDB_DEBUG(...) SPDLOG_LOGGER_DEBUG(::hyperdb::common::Logger::Get(), __VA_ARGS__)
#define HYPERDB_INFO(...)  SPDLOG_LOGGER_INFO(::hyperdb::common::Logger::Get(), __VA_ARGS__)
#define HYPERDB_WARN(...)  SPDLOG_LOGGER_WARN(::hyperdb::common::Logger::Get(), __VA_ARGS__)
#define HYPERDB_ERROR(...) SPDLOG_LOGGER_ERROR(::hyperdb::common::Logger::Get(), __VA_ARGS__)
#define HYPERDB_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::hyperdb::common::Logger::Get(), __VA_ARGS__)

#endif // HYPERDB_COMMON_LOGGER_H_
