/**
 * @file oauth.hpp
 * @brief OAuth 2.0 flow client
 */

#ifndef TOKENWARD_OAUTH_HPP
#define TOKENWARD_OAUTH_HPP

#include "encoding.hpp"
#include "storage.hpp"
#include "transport.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>

namespace tokenward {

/**
 * Authorization code (PKCE), refresh and device grants against one provider
 *
 * Sessions live only in storage. The client does no concurrency
 * coordination of its own; use TokenRefresher for that.
 */
class OAuthClient {
public:
    using SleepFunction = std::function<void(std::chrono::seconds)>;
    using UrlHandler = std::function<void(const std::string&)>;

    /**
     * Create a flow client
     * @param config Provider configuration
     * @param storage Session and token storage
     * @param transport HTTP transport for token endpoint calls
     */
    OAuthClient(
        OAuthConfig config,
        std::shared_ptr<Storage> storage,
        std::shared_ptr<Transport> transport
    );

    ~OAuthClient() = default;

    const OAuthConfig& config() const { return config_; }
    std::shared_ptr<Storage> storage() const { return storage_; }
    std::shared_ptr<Transport> transport() const { return transport_; }

    /**
     * Begin an authorization code flow
     *
     * Generates state and PKCE verifier, persists the session under the
     * state and builds the URL the user must visit.
     * @return Authorization URL and state
     * @throws InvalidConfigError if the configuration is incomplete
     */
    AuthFlowResult start_auth_flow();

    /**
     * Complete an authorization code flow
     *
     * The session is consumed before the token request, so a state can be
     * exchanged at most once.
     * @param state State returned by the callback
     * @param code Authorization code returned by the callback
     * @param token_key Key to store the token under
     * @return Issued token
     */
    Token exchange_code(const std::string& state, const std::string& code, const std::string& token_key);

    /**
     * Complete a flow from the full redirect URL received by the callback
     * @param callback_url Redirect URL including its query string
     * @param token_key Key to store the token under
     * @return Issued token
     * @throws AuthorizationDeniedError if the user denied access
     */
    Token exchange_callback(const std::string& callback_url, const std::string& token_key);

    /**
     * Run a complete authorization code flow through a loopback listener
     *
     * Listens on the host and port of the configured redirect URI (an
     * ephemeral port if it names none), hands the authorization URL to
     * open_url and exchanges the code the browser brings back.
     * @param token_key Key to store the token under
     * @param timeout Bound on waiting for the browser redirect
     * @param open_url Called once with the authorization URL
     * @return Issued token
     * @throws InvalidConfigError if the redirect URI is not http on 127.0.0.1 or localhost
     * @throws TimeoutError if no redirect arrives in time
     * @throws AuthorizationDeniedError if the user denied access
     * @throws StateMismatchError if the redirect carries another state
     */
    Token authorize(const std::string& token_key, std::chrono::milliseconds timeout, const UrlHandler& open_url);

    /**
     * Redeem a refresh token
     *
     * Carries the previous refresh_token and scope forward when the server
     * omits them. Does not persist the result.
     * @param token Token holding the refresh token
     * @return New token
     * @throws NoRefreshTokenError if token has no refresh token
     */
    Token refresh(const Token& token);

    /**
     * Request a device and user code (RFC 8628)
     * @throws UnsupportedOperationError if no device endpoint is configured
     */
    DeviceAuthorization start_device_flow();

    /**
     * Single poll of the token endpoint with a device code
     * @return Token once authorized, nullopt while authorization is pending
     * @throws AuthorizationDeniedError, DeviceCodeExpiredError
     */
    std::optional<Token> poll_device_token(const std::string& device_code);

    /**
     * Poll until the user completes the device authorization
     * @param authorization Result of start_device_flow()
     * @param token_key Key to store the token under
     * @return Issued token
     * @throws DeviceCodeExpiredError when expires_in elapses first
     */
    Token authorize_device(const DeviceAuthorization& authorization, const std::string& token_key);

    void save_token(const std::string& key, const Token& token);
    std::optional<Token> get_token(const std::string& key) const;
    void delete_token(const std::string& key);

    /**
     * Replace the sleep used between device polls
     */
    void set_sleep_function(SleepFunction sleep) { sleep_ = std::move(sleep); }

    /**
     * Build an authorization URL with an S256 challenge
     */
    static std::string build_authorization_url(
        const OAuthConfig& config,
        const std::string& state,
        const std::string& code_challenge
    );

private:
    struct DevicePoll {
        std::optional<Token> token;
        bool slow_down = false;
    };

    HttpResponse post_form(const std::string& endpoint, const FormFields& fields);
    FormFields client_fields() const;
    DevicePoll poll_device(const std::string& device_code);

    OAuthConfig config_;
    std::shared_ptr<Storage> storage_;
    std::shared_ptr<Transport> transport_;
    SleepFunction sleep_;
};

} // namespace tokenward

#endif // TOKENWARD_OAUTH_HPP
