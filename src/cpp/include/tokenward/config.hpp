/**
 * @file config.hpp
 * @brief Process-level settings and default paths
 */

#ifndef TOKENWARD_CONFIG_HPP
#define TOKENWARD_CONFIG_HPP

#include "types.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace tokenward {

constexpr const char* ENV_STORAGE_DIR = "TOKENWARD_STORAGE_DIR";
constexpr const char* ENV_LOCK_TIMEOUT_MS = "TOKENWARD_LOCK_TIMEOUT_MS";
constexpr const char* ENV_LOG_LEVEL = "TOKENWARD_LOG_LEVEL";

/**
 * Settings overridable from the environment
 */
struct Settings {
    std::optional<std::string> storage_dir;
    std::chrono::milliseconds lock_timeout{DEFAULT_LOCK_TIMEOUT_MS};
    LogLevel log_level = LogLevel::Warning;
};

/**
 * Read TOKENWARD_STORAGE_DIR, TOKENWARD_LOCK_TIMEOUT_MS and TOKENWARD_LOG_LEVEL
 * @throws InvalidConfigError on a malformed value
 */
Settings load_settings_from_env();

/**
 * Per-application data directory
 *
 * $XDG_DATA_HOME/<app>, else $HOME/.local/share/<app>, else /tmp/<app>
 */
std::string default_storage_path(const std::string& app_name);

} // namespace tokenward

#endif // TOKENWARD_CONFIG_HPP
