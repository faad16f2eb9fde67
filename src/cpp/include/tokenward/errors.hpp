/**
 * @file errors.hpp
 * @brief Exception types for tokenward
 */

#ifndef TOKENWARD_ERRORS_HPP
#define TOKENWARD_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <optional>
#include <cstdint>

namespace tokenward {

/**
 * Base exception class for tokenward errors
 */
class TokenwardError : public std::runtime_error {
public:
    explicit TokenwardError(const std::string& message, const std::string& code = "")
        : std::runtime_error(message), code_(code) {}

    const std::string& code() const { return code_; }

protected:
    std::string code_;
};

/**
 * Missing or insecure OAuth configuration
 */
class InvalidConfigError : public TokenwardError {
public:
    InvalidConfigError(const std::string& message, const std::string& config_key = "")
        : TokenwardError(message, "INVALID_CONFIG"), config_key_(config_key) {}

    const std::string& config_key() const { return config_key_; }

private:
    std::string config_key_;
};

/**
 * Invalid argument passed by the caller
 */
class ValidationError : public TokenwardError {
public:
    ValidationError(
        const std::string& message,
        const std::string& field = "",
        const std::string& value = ""
    ) : TokenwardError(message, "VALIDATION_ERROR"),
        field_(field),
        value_(value) {}

    const std::string& field() const { return field_; }
    const std::string& value() const { return value_; }

private:
    std::string field_;
    std::string value_;
};

/**
 * Operation not available for the configured provider
 */
class UnsupportedOperationError : public TokenwardError {
public:
    explicit UnsupportedOperationError(const std::string& message)
        : TokenwardError(message, "UNSUPPORTED_OPERATION") {}
};

/**
 * Session errors
 */
class SessionError : public TokenwardError {
public:
    SessionError(const std::string& message, const std::string& code, const std::string& state)
        : TokenwardError(message, code), state_(state) {}

    const std::string& state() const { return state_; }

protected:
    std::string state_;
};

/**
 * No pending session for the presented state
 */
class SessionNotFoundError : public SessionError {
public:
    explicit SessionNotFoundError(const std::string& state)
        : SessionError("No pending session for state", "SESSION_NOT_FOUND", state) {}
};

/**
 * Pending session is older than the maximum session age
 */
class SessionExpiredError : public SessionError {
public:
    SessionExpiredError(const std::string& state, int64_t age_seconds)
        : SessionError("Session expired after " + std::to_string(age_seconds) + "s",
                       "SESSION_EXPIRED", state),
          age_seconds_(age_seconds) {}

    int64_t age_seconds() const { return age_seconds_; }

private:
    int64_t age_seconds_;
};

/**
 * Stored session does not belong to the presented state
 */
class StateMismatchError : public SessionError {
public:
    explicit StateMismatchError(const std::string& state)
        : SessionError("State parameter does not match the stored session", "STATE_MISMATCH", state) {}
};

/**
 * Token errors
 */
class TokenError : public TokenwardError {
public:
    TokenError(const std::string& message, const std::string& code, const std::string& key)
        : TokenwardError(message, code), key_(key) {}

    const std::string& key() const { return key_; }

protected:
    std::string key_;
};

/**
 * No token stored under the key
 */
class TokenNotFoundError : public TokenError {
public:
    explicit TokenNotFoundError(const std::string& key)
        : TokenError("Token not found: " + key, "TOKEN_NOT_FOUND", key) {}
};

/**
 * Token carries no refresh token
 */
class NoRefreshTokenError : public TokenError {
public:
    explicit NoRefreshTokenError(const std::string& key = "")
        : TokenError("No refresh token available", "NO_REFRESH_TOKEN", key) {}
};

/**
 * Network-level failure talking to an endpoint
 */
class TransportError : public TokenwardError {
public:
    explicit TransportError(const std::string& message, const std::string& endpoint = "")
        : TokenwardError(message, "TRANSPORT_ERROR"), endpoint_(endpoint) {}

    const std::string& endpoint() const { return endpoint_; }

private:
    std::string endpoint_;
};

/**
 * Authorization server rejected a token request
 */
class TokenEndpointError : public TokenwardError {
public:
    TokenEndpointError(
        const std::string& message,
        long status_code,
        const std::string& error_code,
        const std::optional<std::string>& error_description = std::nullopt,
        const std::string& response_body = ""
    ) : TokenwardError(message, "TOKEN_ENDPOINT_ERROR"),
        status_code_(status_code),
        error_code_(error_code),
        error_description_(error_description),
        response_body_(response_body) {}

    long status_code() const { return status_code_; }
    const std::string& error_code() const { return error_code_; }
    const std::optional<std::string>& error_description() const { return error_description_; }
    const std::string& response_body() const { return response_body_; }

protected:
    long status_code_;
    std::string error_code_;
    std::optional<std::string> error_description_;
    std::string response_body_;
};

/**
 * Registration endpoint rejected a client registration request
 */
class RegistrationError : public TokenEndpointError {
public:
    RegistrationError(
        const std::string& message,
        long status_code,
        const std::string& error_code,
        const std::optional<std::string>& error_description = std::nullopt,
        const std::string& response_body = ""
    ) : TokenEndpointError(message, status_code, error_code, error_description, response_body) {
        code_ = "REGISTRATION_ERROR";
    }
};

/**
 * User denied a device authorization
 */
class AuthorizationDeniedError : public TokenEndpointError {
public:
    AuthorizationDeniedError(
        long status_code,
        const std::optional<std::string>& error_description = std::nullopt,
        const std::string& response_body = ""
    ) : TokenEndpointError("Authorization denied", status_code, "access_denied",
                           error_description, response_body) {}
};

/**
 * Device code expired before the user completed authorization
 */
class DeviceCodeExpiredError : public TokenEndpointError {
public:
    explicit DeviceCodeExpiredError(long status_code = 0, const std::string& response_body = "")
        : TokenEndpointError("Device code expired", status_code, "expired_token",
                             std::nullopt, response_body) {}
};

/**
 * Refresh lock not acquired in time
 */
class LockTimeoutError : public TokenwardError {
public:
    LockTimeoutError(const std::string& key, long long timeout_ms)
        : TokenwardError("Timed out after " + std::to_string(timeout_ms) +
                         "ms waiting for refresh lock", "LOCK_TIMEOUT"),
          key_(key),
          timeout_ms_(timeout_ms) {}

    const std::string& key() const { return key_; }
    long long timeout_ms() const { return timeout_ms_; }

private:
    std::string key_;
    long long timeout_ms_;
};

/**
 * Storage medium or record malfunction
 */
class StorageError : public TokenwardError {
public:
    StorageError(const std::string& message, const std::string& key = "")
        : TokenwardError(message, "STORAGE_ERROR"), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

/**
 * Timeout
 */
class TimeoutError : public TokenwardError {
public:
    TimeoutError(std::optional<double> timeout = std::nullopt)
        : TokenwardError("Operation timed out", "TIMEOUT_ERROR"), timeout_(timeout) {}

    std::optional<double> timeout() const { return timeout_; }

private:
    std::optional<double> timeout_;
};

} // namespace tokenward

#endif // TOKENWARD_ERRORS_HPP
