/**
 * @file types.hpp
 * @brief Credential model types for tokenward
 */

#ifndef TOKENWARD_TYPES_HPP
#define TOKENWARD_TYPES_HPP

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace tokenward {

using json = nlohmann::json;

// =============================================================================
// Constants
// =============================================================================

constexpr const char* DEFAULT_TOKEN_TYPE = "Bearer";
constexpr const char* PKCE_METHOD_S256 = "S256";
constexpr const char* GRANT_AUTHORIZATION_CODE = "authorization_code";
constexpr const char* GRANT_REFRESH_TOKEN = "refresh_token";
constexpr const char* GRANT_DEVICE_CODE = "urn:ietf:params:oauth:grant-type:device_code";
constexpr const char* FORM_CONTENT_TYPE = "application/x-www-form-urlencoded";
constexpr const char* LOOPBACK_REDIRECT_URI = "http://127.0.0.1/callback";
constexpr int64_t SESSION_MAX_AGE_SECONDS = 10 * 60;
constexpr int64_t DEVICE_DEFAULT_INTERVAL_SECONDS = 5;
constexpr int64_t DEVICE_MAX_INTERVAL_SECONDS = 300;
constexpr int64_t DEVICE_SLOW_DOWN_SECONDS = 5;
constexpr int64_t DEFAULT_LOCK_TIMEOUT_MS = 30 * 1000;
constexpr size_t MAX_RESPONSE_BYTES = 1024 * 1024;

// =============================================================================
// Enums
// =============================================================================

enum class LogLevel {
    None,
    Error,
    Warning,
    Info,
    Debug,
    All
};

// =============================================================================
// Utility Functions
// =============================================================================

std::string log_level_to_string(LogLevel level);
LogLevel string_to_log_level(const std::string& str);

/// Seconds since the Unix epoch
int64_t unix_now();

// =============================================================================
// Credential Types
// =============================================================================

/**
 * One pending authorization attempt, keyed by its state
 */
struct Session {
    std::string state;
    std::string code_verifier;
    int64_t created_at = 0;

    /// Redirect URI sent in the authorization request, when it differs from the config's
    std::optional<std::string> redirect_uri;

    static Session create(const std::string& state, const std::string& code_verifier);

    /// Age in seconds relative to now
    int64_t age() const;

    static Session from_json(const json& j);
    json to_json() const;

    bool operator==(const Session& other) const;
    bool operator!=(const Session& other) const { return !(*this == other); }
};

/**
 * An issued OAuth 2.0 credential
 *
 * A token without expires_at is never considered expired by elapsed-time
 * checks; revocation is left to the server.
 */
struct Token {
    std::string access_token;
    std::optional<std::string> refresh_token;
    std::string token_type = DEFAULT_TOKEN_TYPE;
    std::optional<int64_t> expires_in;
    std::optional<int64_t> expires_at;
    std::optional<std::string> scope;

    /**
     * Check whether the token is past its absolute expiration
     * @return true iff expires_at is set and now >= expires_at
     */
    bool is_expired() const;

    /**
     * Check whether the token expires within the given window
     * @param seconds Window length in seconds
     */
    bool expires_within(int64_t seconds) const;

    /**
     * Fraction of the issued lifetime that has already elapsed
     * @return Value in [0, 1], or nullopt without expires_in/expires_at
     */
    std::optional<double> elapsed_fraction() const;

    /**
     * Refresh policy check
     * @param threshold Elapsed-lifetime fraction at which to refresh
     * @return true if expired or elapsed_fraction() >= threshold
     */
    bool needs_refresh(double threshold) const;

    static Token from_json(const json& j);
    json to_json() const;

    bool operator==(const Token& other) const;
    bool operator!=(const Token& other) const { return !(*this == other); }
};

/**
 * OAuth 2.0 public or confidential client configuration
 */
struct OAuthConfig {
    std::string client_id;
    std::string authorization_endpoint;
    std::string token_endpoint;
    std::string redirect_uri;
    std::optional<std::string> scope;
    std::optional<std::string> device_authorization_endpoint;
    std::optional<std::string> client_secret;

    static OAuthConfig github(const std::string& client_id);
    static OAuthConfig google(const std::string& client_id);
    static OAuthConfig microsoft(const std::string& client_id, const std::string& tenant = "common");

    /**
     * Self-hosted or gitlab.com instance
     * @param base_url Instance root, trailing slash optional
     */
    static OAuthConfig gitlab(const std::string& client_id, const std::string& base_url = "https://gitlab.com");

    /**
     * Check required fields and endpoint security
     * @throws InvalidConfigError on the first offending field
     */
    void validate() const;

    static OAuthConfig from_json(const json& j);
    json to_json() const;
};

/// true for https:// URLs and plain http:// on a loopback host
bool is_secure_endpoint(const std::string& url);

/**
 * Result of starting an authorization code flow
 */
struct AuthFlowResult {
    std::string url;
    std::string state;
};

/**
 * Device authorization response (RFC 8628)
 */
struct DeviceAuthorization {
    std::string device_code;
    std::string user_code;
    std::string verification_uri;
    std::optional<std::string> verification_uri_complete;
    int64_t expires_in = 0;
    int64_t interval = DEVICE_DEFAULT_INTERVAL_SECONDS;

    static DeviceAuthorization from_json(const json& j);
};

} // namespace tokenward

#endif // TOKENWARD_TYPES_HPP
