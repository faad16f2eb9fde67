/**
 * @file registration.hpp
 * @brief Dynamic client registration (RFC 7591) and management (RFC 7592)
 */

#ifndef TOKENWARD_REGISTRATION_HPP
#define TOKENWARD_REGISTRATION_HPP

#include "transport.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tokenward {

/**
 * Client metadata sent to the registration endpoint
 *
 * Empty strings and lists are left out of the request.
 */
struct ClientMetadata {
    std::string client_name;
    std::vector<std::string> redirect_uris;
    std::vector<std::string> grant_types;
    std::vector<std::string> response_types;
    std::optional<std::string> scope;
    std::optional<std::string> token_endpoint_auth_method;
    std::optional<std::string> client_uri;
    std::optional<std::string> logo_uri;
    std::vector<std::string> contacts;
    std::optional<std::string> tos_uri;
    std::optional<std::string> policy_uri;
    std::optional<std::string> jwks_uri;

    /// Metadata for a public client using the authorization code and refresh grants
    static ClientMetadata native_app(const std::string& name, const std::string& redirect_uri);

    json to_json() const;
};

/**
 * Registration record returned by the authorization server
 */
struct ClientRegistration {
    std::string client_id;
    std::optional<std::string> client_secret;
    std::optional<int64_t> client_id_issued_at;
    /// 0 means the secret does not expire
    std::optional<int64_t> client_secret_expires_at;
    std::optional<std::string> registration_access_token;
    std::optional<std::string> registration_client_uri;

    /// Full response, including metadata echoed back by the server
    json raw;

    static ClientRegistration from_json(const json& j);
};

/**
 * Client for an authorization server's registration endpoint
 */
class DynamicRegistration {
public:
    /**
     * @param registration_endpoint https URL (http only on loopback)
     * @param transport HTTP transport
     * @throws InvalidConfigError if the endpoint is not secure
     */
    DynamicRegistration(std::string registration_endpoint, std::shared_ptr<Transport> transport);

    const std::string& registration_endpoint() const { return registration_endpoint_; }

    /**
     * Register a new client
     * @return Issued client_id and, for confidential clients, client_secret
     * @throws RegistrationError if the server rejects the metadata
     */
    ClientRegistration register_client(const ClientMetadata& metadata);

    /**
     * Read the current registration from its client configuration endpoint
     * @throws ValidationError if registration lacks registration_client_uri
     *         or registration_access_token
     */
    ClientRegistration read_client(const ClientRegistration& registration);

    /**
     * Replace the registered metadata
     */
    ClientRegistration update_client(const ClientRegistration& registration, const ClientMetadata& metadata);

    /**
     * Deregister the client
     */
    void delete_client(const ClientRegistration& registration);

private:
    HttpResponse send_request(HttpRequest request, const std::optional<std::string>& bearer);

    std::string registration_endpoint_;
    std::shared_ptr<Transport> transport_;
};

} // namespace tokenward

#endif // TOKENWARD_REGISTRATION_HPP
