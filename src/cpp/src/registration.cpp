/**
 * @file registration.cpp
 * @brief Dynamic client registration (RFC 7591) and management (RFC 7592)
 */

#include "tokenward/registration.hpp"
#include "tokenward/errors.hpp"
#include "tokenward/logging.hpp"

namespace tokenward {

static constexpr const char* JSON_CONTENT_TYPE = "application/json";

// =============================================================================
// ClientMetadata
// =============================================================================

ClientMetadata ClientMetadata::native_app(const std::string& name, const std::string& redirect_uri) {
    ClientMetadata metadata;
    metadata.client_name = name;
    metadata.redirect_uris = {redirect_uri};
    metadata.grant_types = {GRANT_AUTHORIZATION_CODE, GRANT_REFRESH_TOKEN};
    metadata.response_types = {"code"};
    metadata.token_endpoint_auth_method = "none";
    return metadata;
}

json ClientMetadata::to_json() const {
    json j = json::object();

    auto put = [&j](const char* name, const std::optional<std::string>& value) {
        if (value && !value->empty()) j[name] = *value;
    };
    auto put_list = [&j](const char* name, const std::vector<std::string>& values) {
        if (!values.empty()) j[name] = values;
    };

    if (!client_name.empty()) j["client_name"] = client_name;
    put_list("redirect_uris", redirect_uris);
    put_list("grant_types", grant_types);
    put_list("response_types", response_types);
    put("scope", scope);
    put("token_endpoint_auth_method", token_endpoint_auth_method);
    put("client_uri", client_uri);
    put("logo_uri", logo_uri);
    put_list("contacts", contacts);
    put("tos_uri", tos_uri);
    put("policy_uri", policy_uri);
    put("jwks_uri", jwks_uri);
    return j;
}

// =============================================================================
// ClientRegistration
// =============================================================================

ClientRegistration ClientRegistration::from_json(const json& j) {
    ClientRegistration registration;
    registration.client_id = j.at("client_id").get<std::string>();

    auto optional_string = [&j](const char* name) -> std::optional<std::string> {
        if (j.contains(name) && j[name].is_string()) return j[name].get<std::string>();
        return std::nullopt;
    };
    auto optional_int = [&j](const char* name) -> std::optional<int64_t> {
        if (j.contains(name) && j[name].is_number()) return j[name].get<int64_t>();
        return std::nullopt;
    };

    registration.client_secret = optional_string("client_secret");
    registration.client_id_issued_at = optional_int("client_id_issued_at");
    registration.client_secret_expires_at = optional_int("client_secret_expires_at");
    registration.registration_access_token = optional_string("registration_access_token");
    registration.registration_client_uri = optional_string("registration_client_uri");
    registration.raw = j;
    return registration;
}

// =============================================================================
// DynamicRegistration
// =============================================================================

[[noreturn]] static void throw_registration_error(const std::string& operation, const HttpResponse& response) {
    json body = json::parse(response.body, nullptr, false);

    std::string error;
    std::optional<std::string> description;
    if (body.is_object()) {
        if (body.contains("error") && body["error"].is_string()) {
            error = body["error"].get<std::string>();
        }
        if (body.contains("error_description") && body["error_description"].is_string()) {
            description = body["error_description"].get<std::string>();
        }
    }

    std::string message = operation + " returned " + std::to_string(response.status_code);
    if (!error.empty()) message += ": " + error;
    if (description) message += " (" + *description + ")";

    logger()->warn("{}", message);
    throw RegistrationError(message, response.status_code, error, description, response.body);
}

static ClientRegistration registration_from_response(const std::string& operation, const HttpResponse& response) {
    json body = json::parse(response.body, nullptr, false);
    if (!body.is_object() || !body.contains("client_id") || !body["client_id"].is_string()) {
        throw RegistrationError(operation + " response has no client_id", response.status_code,
                                "invalid_response", std::nullopt, response.body);
    }
    return ClientRegistration::from_json(body);
}

static const std::string& management_uri(const ClientRegistration& registration) {
    if (!registration.registration_client_uri || registration.registration_client_uri->empty()) {
        throw ValidationError("Registration has no registration_client_uri", "registration_client_uri");
    }
    if (!is_secure_endpoint(*registration.registration_client_uri)) {
        throw ValidationError("registration_client_uri must use https", "registration_client_uri",
                              *registration.registration_client_uri);
    }
    return *registration.registration_client_uri;
}

static const std::string& management_token(const ClientRegistration& registration) {
    if (!registration.registration_access_token || registration.registration_access_token->empty()) {
        throw ValidationError("Registration has no registration_access_token", "registration_access_token");
    }
    return *registration.registration_access_token;
}

DynamicRegistration::DynamicRegistration(std::string registration_endpoint, std::shared_ptr<Transport> transport)
    : registration_endpoint_(std::move(registration_endpoint)),
      transport_(std::move(transport)) {
    if (registration_endpoint_.empty()) {
        throw InvalidConfigError("registration_endpoint is required", "registration_endpoint");
    }
    if (!is_secure_endpoint(registration_endpoint_)) {
        throw InvalidConfigError("registration_endpoint must use https", "registration_endpoint");
    }
    if (!transport_) {
        throw ValidationError("Transport is required", "transport");
    }
}

HttpResponse DynamicRegistration::send_request(HttpRequest request, const std::optional<std::string>& bearer) {
    request.headers["Accept"] = JSON_CONTENT_TYPE;
    if (!request.body.empty()) {
        request.headers["Content-Type"] = JSON_CONTENT_TYPE;
    }
    if (bearer) {
        request.headers["Authorization"] = "Bearer " + *bearer;
    }
    return transport_->execute(request);
}

ClientRegistration DynamicRegistration::register_client(const ClientMetadata& metadata) {
    HttpRequest request;
    request.method = "POST";
    request.url = registration_endpoint_;
    request.body = metadata.to_json().dump();

    HttpResponse response = send_request(std::move(request), std::nullopt);
    if (response.status_code != 200 && response.status_code != 201) {
        throw_registration_error("Client registration", response);
    }

    ClientRegistration registration = registration_from_response("Client registration", response);
    logger()->info("Registered client {}", registration.client_id);
    return registration;
}

ClientRegistration DynamicRegistration::read_client(const ClientRegistration& registration) {
    HttpRequest request;
    request.method = "GET";
    request.url = management_uri(registration);

    HttpResponse response = send_request(std::move(request), management_token(registration));
    if (response.status_code != 200) {
        throw_registration_error("Client read", response);
    }
    return registration_from_response("Client read", response);
}

ClientRegistration DynamicRegistration::update_client(
    const ClientRegistration& registration,
    const ClientMetadata& metadata
) {
    // RFC 7592 requires the client_id in the replacement document
    json document = metadata.to_json();
    document["client_id"] = registration.client_id;

    HttpRequest request;
    request.method = "PUT";
    request.url = management_uri(registration);
    request.body = document.dump();

    HttpResponse response = send_request(std::move(request), management_token(registration));
    if (response.status_code != 200) {
        throw_registration_error("Client update", response);
    }
    return registration_from_response("Client update", response);
}

void DynamicRegistration::delete_client(const ClientRegistration& registration) {
    HttpRequest request;
    request.method = "DELETE";
    request.url = management_uri(registration);

    HttpResponse response = send_request(std::move(request), management_token(registration));
    if (response.status_code != 200 && response.status_code != 204) {
        throw_registration_error("Client delete", response);
    }
    logger()->info("Deregistered client {}", registration.client_id);
}

} // namespace tokenward
