/**
 * @file logging.cpp
 * @brief Library logger
 */

#include "tokenward/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tokenward {

static spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::None: return spdlog::level::off;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Warning: return spdlog::level::warn;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::All: return spdlog::level::trace;
        default: return spdlog::level::warn;
    }
}

static LogLevel from_spdlog_level(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::off: return LogLevel::None;
        case spdlog::level::critical:
        case spdlog::level::err: return LogLevel::Error;
        case spdlog::level::warn: return LogLevel::Warning;
        case spdlog::level::info: return LogLevel::Info;
        case spdlog::level::debug: return LogLevel::Debug;
        case spdlog::level::trace: return LogLevel::All;
        default: return LogLevel::Warning;
    }
}

static std::shared_ptr<spdlog::logger> create_logger() {
    auto existing = spdlog::get(LOGGER_NAME);
    if (existing) {
        return existing;
    }

    auto created = spdlog::stderr_color_mt(LOGGER_NAME);
    created->set_level(to_spdlog_level(LogLevel::Warning));
    return created;
}

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = create_logger();
    return instance;
}

void set_log_level(LogLevel level) {
    logger()->set_level(to_spdlog_level(level));
}

LogLevel get_log_level() {
    return from_spdlog_level(logger()->level());
}

} // namespace tokenward
