/**
 * @file oauth.cpp
 * @brief OAuth 2.0 flow client implementation
 */

#include "tokenward/oauth.hpp"
#include "tokenward/callback_server.hpp"
#include "tokenward/errors.hpp"
#include "tokenward/logging.hpp"
#include "tokenward/pkce.hpp"
#include <algorithm>
#include <thread>

namespace tokenward {

// RFC 8628 leaves expires_in required; assume 15 minutes if a server omits it
static constexpr int64_t DEVICE_FALLBACK_EXPIRES_SECONDS = 15 * 60;

// =============================================================================
// Response handling
// =============================================================================

static json parse_body(const std::string& body) {
    // Discarded value instead of an exception for non-JSON bodies
    return json::parse(body, nullptr, false);
}

static std::optional<std::string> string_field(const json& body, const char* name) {
    if (body.is_object() && body.contains(name) && body[name].is_string()) {
        return body[name].get<std::string>();
    }
    return std::nullopt;
}

static std::optional<int64_t> seconds_field(const json& body, const char* name) {
    if (!body.is_object() || !body.contains(name)) return std::nullopt;

    const json& value = body[name];
    if (value.is_number_integer()) return value.get<int64_t>();
    if (value.is_number_float()) return static_cast<int64_t>(value.get<double>());
    if (value.is_string()) {
        // Some providers send expires_in as a string
        const std::string text = value.get<std::string>();
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }
        try {
            return std::stoll(text);
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

[[noreturn]] static void throw_endpoint_error(const HttpResponse& response, const json& body) {
    std::string error = string_field(body, "error").value_or("");
    std::optional<std::string> description = string_field(body, "error_description");

    std::string message = "Token endpoint returned " + std::to_string(response.status_code);
    if (!error.empty()) message += ": " + error;
    if (description) message += " (" + *description + ")";

    logger()->warn("{}", message);
    throw TokenEndpointError(message, response.status_code, error, description, response.body);
}

static bool has_error(const json& body) {
    return body.is_object() && body.contains("error");
}

static Token token_from_response(const HttpResponse& response, const std::optional<Token>& previous) {
    json body = parse_body(response.body);
    if (!response.is_success() || has_error(body)) {
        throw_endpoint_error(response, body);
    }

    auto access_token = string_field(body, "access_token");
    if (!access_token || access_token->empty()) {
        throw TokenEndpointError("Token response has no access_token", response.status_code,
                                 "invalid_response", std::nullopt, response.body);
    }

    Token token;
    token.access_token = *access_token;
    token.token_type = string_field(body, "token_type").value_or(DEFAULT_TOKEN_TYPE);

    token.refresh_token = string_field(body, "refresh_token");
    if (!token.refresh_token && previous) {
        token.refresh_token = previous->refresh_token;
    }

    token.scope = string_field(body, "scope");
    if (!token.scope && previous) {
        token.scope = previous->scope;
    }

    auto expires_in = seconds_field(body, "expires_in");
    if (expires_in && *expires_in >= 0) {
        token.expires_in = expires_in;
        token.expires_at = unix_now() + *expires_in;
    }
    return token;
}

static void require_key(const std::string& key, const char* field) {
    if (key.empty()) {
        throw ValidationError(std::string(field) + " must not be empty", field);
    }
}

struct LoopbackRedirect {
    uint16_t port = 0;
    std::string path = DEFAULT_CALLBACK_PATH;
};

static LoopbackRedirect parse_loopback_redirect(const std::string& uri) {
    static const char* loopback_origins[] = {"http://127.0.0.1", "http://localhost"};

    for (const char* origin : loopback_origins) {
        const std::string prefix(origin);
        if (uri.compare(0, prefix.size(), prefix) != 0) continue;

        std::string rest = uri.substr(prefix.size());
        LoopbackRedirect redirect;

        if (!rest.empty() && rest[0] == ':') {
            size_t slash = rest.find('/');
            std::string digits = rest.substr(1, slash == std::string::npos ? std::string::npos : slash - 1);
            if (digits.empty() || digits.size() > 5 ||
                digits.find_first_not_of("0123456789") != std::string::npos || std::stoi(digits) > 65535) {
                throw InvalidConfigError("Redirect URI has an invalid port: " + uri, "redirect_uri");
            }
            redirect.port = static_cast<uint16_t>(std::stoi(digits));
            rest = slash == std::string::npos ? "" : rest.substr(slash);
        }

        if (rest.empty()) {
            return redirect;
        }
        // Also rejects look-alike hosts such as http://localhost.example
        if (rest[0] != '/' || rest.find_first_of("?#") != std::string::npos) {
            throw InvalidConfigError("Redirect URI must be a loopback origin and path: " + uri, "redirect_uri");
        }
        redirect.path = rest;
        return redirect;
    }

    throw InvalidConfigError("A local callback needs an http://127.0.0.1 or http://localhost redirect URI",
                             "redirect_uri");
}

// =============================================================================
// OAuthClient
// =============================================================================

OAuthClient::OAuthClient(
    OAuthConfig config,
    std::shared_ptr<Storage> storage,
    std::shared_ptr<Transport> transport
) : config_(std::move(config)),
    storage_(std::move(storage)),
    transport_(std::move(transport)),
    sleep_([](std::chrono::seconds duration) { std::this_thread::sleep_for(duration); }) {
    if (!storage_) {
        throw ValidationError("Storage is required", "storage");
    }
    if (!transport_) {
        throw ValidationError("Transport is required", "transport");
    }
}

std::string OAuthClient::build_authorization_url(
    const OAuthConfig& config,
    const std::string& state,
    const std::string& code_challenge
) {
    std::string url = config.authorization_endpoint;
    url += config.authorization_endpoint.find('?') == std::string::npos ? '?' : '&';

    FormFields params = {
        {"response_type", "code"},
        {"client_id", config.client_id},
        {"redirect_uri", config.redirect_uri}
    };
    if (config.scope) {
        params.emplace_back("scope", *config.scope);
    }
    params.emplace_back("state", state);
    params.emplace_back("code_challenge", code_challenge);
    params.emplace_back("code_challenge_method", Pkce::method());

    return url + form_encode(params);
}

AuthFlowResult OAuthClient::start_auth_flow() {
    config_.validate();

    std::string state = random_urlsafe_string(32);
    Pkce pkce = Pkce::generate();

    storage_->save_session(state, Session::create(state, pkce.verifier));

    AuthFlowResult result;
    result.url = build_authorization_url(config_, state, pkce.challenge);
    result.state = state;

    logger()->debug("Started authorization flow, state {}", mask_secret(state));
    return result;
}

FormFields OAuthClient::client_fields() const {
    FormFields fields = {{"client_id", config_.client_id}};
    if (config_.client_secret) {
        fields.emplace_back("client_secret", *config_.client_secret);
    }
    return fields;
}

HttpResponse OAuthClient::post_form(const std::string& endpoint, const FormFields& fields) {
    HttpRequest request;
    request.method = "POST";
    request.url = endpoint;
    request.body = form_encode(fields);
    request.headers["Content-Type"] = FORM_CONTENT_TYPE;
    request.headers["Accept"] = "application/json";

    return transport_->execute(request);
}

Token OAuthClient::exchange_code(
    const std::string& state,
    const std::string& code,
    const std::string& token_key
) {
    require_key(state, "state");
    require_key(code, "code");
    require_key(token_key, "token_key");
    config_.validate();

    // Consumed before any network call so the state cannot be replayed
    auto session = storage_->take_session(state);
    if (!session) {
        throw SessionNotFoundError(state);
    }

    if (session->state != state) {
        throw StateMismatchError(state);
    }
    int64_t age = session->age();
    if (age > SESSION_MAX_AGE_SECONDS) {
        throw SessionExpiredError(state, age);
    }

    FormFields fields = {
        {"grant_type", GRANT_AUTHORIZATION_CODE},
        {"code", code},
        {"redirect_uri", session->redirect_uri.value_or(config_.redirect_uri)},
        {"code_verifier", session->code_verifier}
    };
    for (auto& field : client_fields()) {
        fields.push_back(std::move(field));
    }

    HttpResponse response = post_form(config_.token_endpoint, fields);
    Token token = token_from_response(response, std::nullopt);

    storage_->save_token(token_key, token);
    logger()->info("Stored token for '{}' ({})", token_key, mask_secret(token.access_token));
    return token;
}

Token OAuthClient::exchange_callback(const std::string& callback_url, const std::string& token_key) {
    auto params = parse_query(callback_url);

    auto error = params.find("error");
    if (error != params.end()) {
        std::optional<std::string> description;
        auto desc = params.find("error_description");
        if (desc != params.end()) description = desc->second;

        if (error->second == "access_denied") {
            throw AuthorizationDeniedError(0, description, callback_url);
        }
        throw TokenEndpointError("Authorization failed: " + error->second, 0,
                                 error->second, description, callback_url);
    }

    auto state = params.find("state");
    if (state == params.end()) {
        throw ValidationError("Callback URL has no state parameter", "state");
    }
    auto code = params.find("code");
    if (code == params.end()) {
        throw ValidationError("Callback URL has no code parameter", "code");
    }

    return exchange_code(state->second, code->second, token_key);
}

Token OAuthClient::authorize(
    const std::string& token_key,
    std::chrono::milliseconds timeout,
    const UrlHandler& open_url
) {
    require_key(token_key, "token_key");
    if (!open_url) {
        throw ValidationError("URL handler is required", "open_url");
    }
    config_.validate();

    LoopbackRedirect redirect = parse_loopback_redirect(config_.redirect_uri);
    CallbackServer server(redirect.port, redirect.path);

    std::string state = random_urlsafe_string(32);
    Pkce pkce = Pkce::generate();

    // The token request must repeat the redirect URI actually sent
    Session session = Session::create(state, pkce.verifier);
    session.redirect_uri = server.callback_url();
    storage_->save_session(state, session);

    OAuthConfig flow_config = config_;
    flow_config.redirect_uri = server.callback_url();

    CallbackResult callback;
    try {
        open_url(build_authorization_url(flow_config, state, pkce.challenge));
        logger()->info("Waiting for authorization redirect on {}", server.callback_url());
        callback = server.wait_for_callback(timeout);
    } catch (...) {
        storage_->delete_session(state);
        throw;
    }

    if (callback.error) {
        storage_->delete_session(state);
        if (*callback.error == "access_denied") {
            throw AuthorizationDeniedError(0, callback.error_description);
        }
        throw TokenEndpointError("Authorization failed: " + *callback.error, 0,
                                 *callback.error, callback.error_description);
    }
    if (callback.state != state) {
        storage_->delete_session(state);
        throw StateMismatchError(callback.state.value_or(""));
    }
    if (!callback.code || callback.code->empty()) {
        storage_->delete_session(state);
        throw ValidationError("Authorization redirect has no code parameter", "code");
    }

    return exchange_code(state, *callback.code, token_key);
}

Token OAuthClient::refresh(const Token& token) {
    if (!token.refresh_token || token.refresh_token->empty()) {
        throw NoRefreshTokenError();
    }
    config_.validate();

    FormFields fields = {
        {"grant_type", GRANT_REFRESH_TOKEN},
        {"refresh_token", *token.refresh_token}
    };
    for (auto& field : client_fields()) {
        fields.push_back(std::move(field));
    }

    logger()->debug("Refreshing token {}", mask_secret(token.access_token));

    HttpResponse response = post_form(config_.token_endpoint, fields);
    return token_from_response(response, token);
}

// =============================================================================
// Device authorization grant
// =============================================================================

DeviceAuthorization OAuthClient::start_device_flow() {
    if (!config_.device_authorization_endpoint) {
        throw UnsupportedOperationError("Provider has no device authorization endpoint");
    }
    config_.validate();

    FormFields fields = {{"client_id", config_.client_id}};
    if (config_.scope) {
        fields.emplace_back("scope", *config_.scope);
    }

    HttpResponse response = post_form(*config_.device_authorization_endpoint, fields);
    json body = parse_body(response.body);
    if (!response.is_success() || has_error(body)) {
        throw_endpoint_error(response, body);
    }

    try {
        return DeviceAuthorization::from_json(body);
    } catch (const json::exception& e) {
        throw TokenEndpointError(std::string("Malformed device authorization response: ") + e.what(),
                                 response.status_code, "invalid_response", std::nullopt, response.body);
    }
}

OAuthClient::DevicePoll OAuthClient::poll_device(const std::string& device_code) {
    require_key(device_code, "device_code");

    FormFields fields = {
        {"grant_type", GRANT_DEVICE_CODE},
        {"device_code", device_code}
    };
    for (auto& field : client_fields()) {
        fields.push_back(std::move(field));
    }

    HttpResponse response = post_form(config_.token_endpoint, fields);
    json body = parse_body(response.body);

    DevicePoll poll;
    auto error = string_field(body, "error");
    if (!error) {
        poll.token = token_from_response(response, std::nullopt);
        return poll;
    }

    if (*error == "authorization_pending") {
        return poll;
    }
    if (*error == "slow_down") {
        poll.slow_down = true;
        return poll;
    }
    if (*error == "access_denied") {
        throw AuthorizationDeniedError(response.status_code, string_field(body, "error_description"),
                                       response.body);
    }
    if (*error == "expired_token") {
        throw DeviceCodeExpiredError(response.status_code, response.body);
    }
    throw_endpoint_error(response, body);
}

std::optional<Token> OAuthClient::poll_device_token(const std::string& device_code) {
    return poll_device(device_code).token;
}

Token OAuthClient::authorize_device(const DeviceAuthorization& authorization, const std::string& token_key) {
    require_key(token_key, "token_key");

    int64_t interval = std::max(authorization.interval, DEVICE_DEFAULT_INTERVAL_SECONDS);
    int64_t lifetime = authorization.expires_in > 0 ? authorization.expires_in
                                                    : DEVICE_FALLBACK_EXPIRES_SECONDS;
    int64_t waited = 0;

    logger()->info("Waiting for device authorization at {}", authorization.verification_uri);

    while (waited < lifetime) {
        sleep_(std::chrono::seconds(interval));
        waited += interval;

        DevicePoll poll = poll_device(authorization.device_code);
        if (poll.token) {
            storage_->save_token(token_key, *poll.token);
            logger()->info("Stored token for '{}' ({})", token_key, mask_secret(poll.token->access_token));
            return *poll.token;
        }
        if (poll.slow_down) {
            interval = std::min(interval + DEVICE_SLOW_DOWN_SECONDS, DEVICE_MAX_INTERVAL_SECONDS);
            logger()->debug("Device polling slowed to {}s", interval);
        }
    }

    throw DeviceCodeExpiredError();
}

// =============================================================================
// Token passthroughs
// =============================================================================

void OAuthClient::save_token(const std::string& key, const Token& token) {
    require_key(key, "key");
    storage_->save_token(key, token);
}

std::optional<Token> OAuthClient::get_token(const std::string& key) const {
    require_key(key, "key");
    return storage_->get_token(key);
}

void OAuthClient::delete_token(const std::string& key) {
    require_key(key, "key");
    storage_->delete_token(key);
}

} // namespace tokenward
