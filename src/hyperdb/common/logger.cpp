#include "hyperdb/common/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <mutex>

namespace hyperdb {
namespace common {

namespace {

std::mutex& registration_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger> register_console() {
    std::lock_guard<std::mutex> lock(registration_mutex());
    auto logger = spdlog::get(Logger::kName);
    if (!logger) {
        logger = spdlog::stdout_color_mt(Logger::kName);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v");
        logger->set_level(spdlog::level::info);
    }
    return logger;
}

} // namespace

void Logger::Init(spdlog::level::level_enum level) {
    try {
        auto logger = register_console();
        logger->set_level(level);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    Get()->set_level(level);
}

std::shared_ptr<spdlog::logger> Logger::Get() {
    auto logger = spdlog::get(kName);
    if (logger) {
        return logger;
    }
    return register_console();
}

bool Logger::ParseLevel(const std::string& name, spdlog::level::level_enum& level) {
    auto parsed = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && name != "off") {
        return false;
    }
    level = parsed;
    return true;
}

} // namespace common
} // namespace hyperdb
