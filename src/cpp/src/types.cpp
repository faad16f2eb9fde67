/**
 * @file types.cpp
 * @brief Credential model implementations for tokenward
 */

#include "tokenward/types.hpp"
#include "tokenward/errors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>

namespace tokenward {

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::None: return "none";
        case LogLevel::Error: return "error";
        case LogLevel::Warning: return "warning";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
        case LogLevel::All: return "all";
        default: return "warning";
    }
}

LogLevel string_to_log_level(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "none" || lower == "off") return LogLevel::None;
    if (lower == "error") return LogLevel::Error;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "info") return LogLevel::Info;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "all" || lower == "trace") return LogLevel::All;
    throw InvalidConfigError("Unknown log level: " + str, "log_level");
}

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// =============================================================================
// Session
// =============================================================================

Session Session::create(const std::string& state, const std::string& code_verifier) {
    Session session;
    session.state = state;
    session.code_verifier = code_verifier;
    session.created_at = unix_now();
    return session;
}

int64_t Session::age() const {
    return unix_now() - created_at;
}

Session Session::from_json(const json& j) {
    Session session;
    session.state = j.at("state").get<std::string>();
    session.code_verifier = j.at("code_verifier").get<std::string>();
    session.created_at = j.at("created_at").get<int64_t>();
    if (j.contains("redirect_uri") && !j["redirect_uri"].is_null()) {
        session.redirect_uri = j["redirect_uri"].get<std::string>();
    }
    return session;
}

json Session::to_json() const {
    json j = {
        {"state", state},
        {"code_verifier", code_verifier},
        {"created_at", created_at}
    };
    if (redirect_uri) {
        j["redirect_uri"] = *redirect_uri;
    }
    return j;
}

bool Session::operator==(const Session& other) const {
    return state == other.state &&
           code_verifier == other.code_verifier &&
           created_at == other.created_at &&
           redirect_uri == other.redirect_uri;
}

// =============================================================================
// Token
// =============================================================================

bool Token::is_expired() const {
    if (!expires_at.has_value()) return false;
    return unix_now() >= *expires_at;
}

bool Token::expires_within(int64_t seconds) const {
    if (!expires_at.has_value()) return false;
    return unix_now() + seconds >= *expires_at;
}

std::optional<double> Token::elapsed_fraction() const {
    if (!expires_in.has_value() || !expires_at.has_value() || *expires_in <= 0) {
        return std::nullopt;
    }

    int64_t remaining = *expires_at - unix_now();
    double fraction = static_cast<double>(*expires_in - remaining) /
                      static_cast<double>(*expires_in);
    return std::clamp(fraction, 0.0, 1.0);
}

bool Token::needs_refresh(double threshold) const {
    if (is_expired()) return true;
    auto fraction = elapsed_fraction();
    return fraction.has_value() && *fraction >= threshold;
}

Token Token::from_json(const json& j) {
    Token token;
    token.access_token = j.at("access_token").get<std::string>();
    token.token_type = j.value("token_type", DEFAULT_TOKEN_TYPE);

    if (j.contains("refresh_token") && !j["refresh_token"].is_null()) {
        token.refresh_token = j["refresh_token"].get<std::string>();
    }
    if (j.contains("expires_in") && !j["expires_in"].is_null()) {
        token.expires_in = j["expires_in"].get<int64_t>();
    }
    if (j.contains("expires_at") && !j["expires_at"].is_null()) {
        token.expires_at = j["expires_at"].get<int64_t>();
    }
    if (j.contains("scope") && !j["scope"].is_null()) {
        token.scope = j["scope"].get<std::string>();
    }
    return token;
}

json Token::to_json() const {
    json j = {
        {"access_token", access_token},
        {"token_type", token_type}
    };
    if (refresh_token) j["refresh_token"] = *refresh_token;
    if (expires_in) j["expires_in"] = *expires_in;
    if (expires_at) j["expires_at"] = *expires_at;
    if (scope) j["scope"] = *scope;
    return j;
}

bool Token::operator==(const Token& other) const {
    return access_token == other.access_token &&
           refresh_token == other.refresh_token &&
           token_type == other.token_type &&
           expires_in == other.expires_in &&
           expires_at == other.expires_at &&
           scope == other.scope;
}

// =============================================================================
// OAuthConfig
// =============================================================================

static std::string strip_trailing_slashes(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

static bool starts_with(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool is_secure_endpoint(const std::string& url) {
    if (starts_with(url, "https://")) return true;

    static const char* loopback_prefixes[] = {
        "http://localhost",
        "http://127.0.0.1",
        "http://[::1]"
    };

    for (const char* prefix : loopback_prefixes) {
        if (!starts_with(url, prefix)) continue;
        // Host must end here, e.g. reject http://localhost.evil.example
        size_t end = std::char_traits<char>::length(prefix);
        if (url.size() == end) return true;
        char next = url[end];
        if (next == ':' || next == '/' || next == '?') return true;
    }
    return false;
}

OAuthConfig OAuthConfig::github(const std::string& client_id) {
    OAuthConfig config;
    config.client_id = client_id;
    config.authorization_endpoint = "https://github.com/login/oauth/authorize";
    config.token_endpoint = "https://github.com/login/oauth/access_token";
    config.device_authorization_endpoint = "https://github.com/login/device/code";
    config.redirect_uri = LOOPBACK_REDIRECT_URI;
    return config;
}

OAuthConfig OAuthConfig::google(const std::string& client_id) {
    OAuthConfig config;
    config.client_id = client_id;
    config.authorization_endpoint = "https://accounts.google.com/o/oauth2/v2/auth";
    config.token_endpoint = "https://oauth2.googleapis.com/token";
    config.device_authorization_endpoint = "https://oauth2.googleapis.com/device/code";
    config.redirect_uri = LOOPBACK_REDIRECT_URI;
    return config;
}

OAuthConfig OAuthConfig::microsoft(const std::string& client_id, const std::string& tenant) {
    const std::string base = "https://login.microsoftonline.com/" + tenant + "/oauth2/v2.0";

    OAuthConfig config;
    config.client_id = client_id;
    config.authorization_endpoint = base + "/authorize";
    config.token_endpoint = base + "/token";
    config.device_authorization_endpoint = base + "/devicecode";
    config.redirect_uri = LOOPBACK_REDIRECT_URI;
    return config;
}

OAuthConfig OAuthConfig::gitlab(const std::string& client_id, const std::string& base_url) {
    const std::string base = strip_trailing_slashes(base_url);

    OAuthConfig config;
    config.client_id = client_id;
    config.authorization_endpoint = base + "/oauth/authorize";
    config.token_endpoint = base + "/oauth/token";
    config.redirect_uri = LOOPBACK_REDIRECT_URI;
    return config;
}

void OAuthConfig::validate() const {
    if (client_id.empty()) {
        throw InvalidConfigError("client_id is required", "client_id");
    }
    if (authorization_endpoint.empty()) {
        throw InvalidConfigError("authorization_endpoint is required", "authorization_endpoint");
    }
    if (token_endpoint.empty()) {
        throw InvalidConfigError("token_endpoint is required", "token_endpoint");
    }
    if (redirect_uri.empty()) {
        throw InvalidConfigError("redirect_uri is required", "redirect_uri");
    }

    if (!is_secure_endpoint(authorization_endpoint)) {
        throw InvalidConfigError("authorization_endpoint must use HTTPS", "authorization_endpoint");
    }
    if (!is_secure_endpoint(token_endpoint)) {
        throw InvalidConfigError("token_endpoint must use HTTPS", "token_endpoint");
    }
    if (device_authorization_endpoint && !is_secure_endpoint(*device_authorization_endpoint)) {
        throw InvalidConfigError("device_authorization_endpoint must use HTTPS",
                                 "device_authorization_endpoint");
    }
}

OAuthConfig OAuthConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw InvalidConfigError("OAuth configuration must be a JSON object");
    }

    OAuthConfig config;
    try {
        config.client_id = j.value("client_id", "");
        config.authorization_endpoint = j.value("authorization_endpoint", "");
        config.token_endpoint = j.value("token_endpoint", "");
        config.redirect_uri = j.value("redirect_uri", "");

        if (j.contains("scope") && !j["scope"].is_null()) {
            config.scope = j["scope"].get<std::string>();
        }
        if (j.contains("device_authorization_endpoint") &&
            !j["device_authorization_endpoint"].is_null()) {
            config.device_authorization_endpoint = j["device_authorization_endpoint"].get<std::string>();
        }
        if (j.contains("client_secret") && !j["client_secret"].is_null()) {
            config.client_secret = j["client_secret"].get<std::string>();
        }
    } catch (const json::exception& e) {
        throw InvalidConfigError(std::string("Malformed OAuth configuration: ") + e.what());
    }
    return config;
}

json OAuthConfig::to_json() const {
    json j = {
        {"client_id", client_id},
        {"authorization_endpoint", authorization_endpoint},
        {"token_endpoint", token_endpoint},
        {"redirect_uri", redirect_uri}
    };
    if (scope) j["scope"] = *scope;
    if (device_authorization_endpoint) j["device_authorization_endpoint"] = *device_authorization_endpoint;
    // client_secret is deliberately not serialized
    return j;
}

// =============================================================================
// DeviceAuthorization
// =============================================================================

DeviceAuthorization DeviceAuthorization::from_json(const json& j) {
    DeviceAuthorization auth;
    auth.device_code = j.at("device_code").get<std::string>();
    auth.user_code = j.at("user_code").get<std::string>();

    // Microsoft names it verification_url
    if (j.contains("verification_uri")) {
        auth.verification_uri = j["verification_uri"].get<std::string>();
    } else {
        auth.verification_uri = j.at("verification_url").get<std::string>();
    }
    if (j.contains("verification_uri_complete") && !j["verification_uri_complete"].is_null()) {
        auth.verification_uri_complete = j["verification_uri_complete"].get<std::string>();
    }

    auth.expires_in = j.value("expires_in", int64_t(0));
    int64_t interval = j.value("interval", DEVICE_DEFAULT_INTERVAL_SECONDS);
    if (interval < 1 || interval > DEVICE_MAX_INTERVAL_SECONDS) {
        interval = DEVICE_DEFAULT_INTERVAL_SECONDS;
    }
    auth.interval = interval;
    return auth;
}

} // namespace tokenward
