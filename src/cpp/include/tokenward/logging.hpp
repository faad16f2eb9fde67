/**
 * @file logging.hpp
 * @brief Library logger
 */

#ifndef TOKENWARD_LOGGING_HPP
#define TOKENWARD_LOGGING_HPP

#include "types.hpp"
#include <memory>
#include <spdlog/spdlog.h>

namespace tokenward {

constexpr const char* LOGGER_NAME = "tokenward";

/**
 * Shared "tokenward" logger, created on first use with a stderr sink
 *
 * Applications may register their own spdlog logger under the same name
 * before first use to redirect output.
 */
std::shared_ptr<spdlog::logger> logger();

void set_log_level(LogLevel level);
LogLevel get_log_level();

} // namespace tokenward

#endif // TOKENWARD_LOGGING_HPP
