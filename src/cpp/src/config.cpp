/**
 * @file config.cpp
 * @brief Process-level settings and default paths
 */

#include "tokenward/config.hpp"
#include "tokenward/errors.hpp"
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace tokenward {

static std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

static std::string get_home_directory() {
    if (auto home = get_env("HOME")) {
        return *home;
    }

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) return std::string(pw->pw_dir);
    return "";
}

std::string default_storage_path(const std::string& app_name) {
    if (app_name.empty() || app_name.find('/') != std::string::npos) {
        throw ValidationError("Application name must be non-empty and contain no '/'",
                              "app_name", app_name);
    }

    if (auto data_home = get_env("XDG_DATA_HOME")) {
        return *data_home + "/" + app_name;
    }

    std::string home = get_home_directory();
    if (!home.empty()) {
        return home + "/.local/share/" + app_name;
    }
    return "/tmp/" + app_name;
}

Settings load_settings_from_env() {
    Settings settings;

    settings.storage_dir = get_env(ENV_STORAGE_DIR);

    if (auto timeout = get_env(ENV_LOCK_TIMEOUT_MS)) {
        long long value = 0;
        size_t consumed = 0;
        try {
            value = std::stoll(*timeout, &consumed);
        } catch (const std::exception&) {
            throw InvalidConfigError("Invalid lock timeout: " + *timeout, ENV_LOCK_TIMEOUT_MS);
        }
        if (consumed != timeout->size() || value <= 0) {
            throw InvalidConfigError("Invalid lock timeout: " + *timeout, ENV_LOCK_TIMEOUT_MS);
        }
        settings.lock_timeout = std::chrono::milliseconds(value);
    }

    if (auto level = get_env(ENV_LOG_LEVEL)) {
        settings.log_level = string_to_log_level(*level);
    }

    return settings;
}

} // namespace tokenward
