#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <tokenward/errors.hpp>
#include <tokenward/registration.hpp>
#include "mocks/mock_transport.hpp"

using namespace tokenward;
using namespace tokenward::tests;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SaveArg;

// ============================================================================
// Test Fixture
// ============================================================================

class DynamicRegistrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<::testing::StrictMock<MockTransport>>();
        registration_ = std::make_unique<DynamicRegistration>("https://auth.example.com/register", transport_);
    }

    static ClientRegistration registered() {
        ClientRegistration registration;
        registration.client_id = "abc";
        registration.registration_access_token = "rat";
        registration.registration_client_uri = "https://auth.example.com/register/abc";
        return registration;
    }

    static std::string registration_body() {
        return json{
            {"client_id", "abc"},
            {"client_secret", "shh"},
            {"client_id_issued_at", 1700000000},
            {"client_secret_expires_at", 0},
            {"registration_access_token", "rat"},
            {"registration_client_uri", "https://auth.example.com/register/abc"},
            {"client_name", "tokenward test"}
        }.dump();
    }

    std::shared_ptr<::testing::StrictMock<MockTransport>> transport_;
    std::unique_ptr<DynamicRegistration> registration_;
};

// ============================================================================
// ClientMetadata
// ============================================================================

TEST_F(DynamicRegistrationTest, Metadata_OmitsEmptyFields) {
    ClientMetadata metadata;
    metadata.client_name = "cli";
    metadata.redirect_uris = {"http://127.0.0.1/callback"};
    metadata.scope = "";

    json j = metadata.to_json();

    EXPECT_EQ(j, (json{{"client_name", "cli"}, {"redirect_uris", json::array({"http://127.0.0.1/callback"})}}));
}

TEST_F(DynamicRegistrationTest, Metadata_NativeApp_PublicCodeClient) {
    json j = ClientMetadata::native_app("cli", LOOPBACK_REDIRECT_URI).to_json();

    EXPECT_EQ(j["grant_types"], json::array({"authorization_code", "refresh_token"}));
    EXPECT_EQ(j["response_types"], json::array({"code"}));
    EXPECT_EQ(j["token_endpoint_auth_method"], "none");
    EXPECT_EQ(j["redirect_uris"], json::array({LOOPBACK_REDIRECT_URI}));
}

// ============================================================================
// register_client
// ============================================================================

TEST_F(DynamicRegistrationTest, Register_PostsMetadataAndParsesResponse) {
    HttpRequest captured;
    EXPECT_CALL(*transport_, execute(_))
        .WillOnce(DoAll(SaveArg<0>(&captured), Return(json_response(201, registration_body()))));

    ClientMetadata metadata = ClientMetadata::native_app("tokenward test", LOOPBACK_REDIRECT_URI);
    metadata.contacts = {"ops@example.com"};
    ClientRegistration result = registration_->register_client(metadata);

    EXPECT_EQ(captured.method, "POST");
    EXPECT_EQ(captured.url, "https://auth.example.com/register");
    EXPECT_EQ(captured.headers["Content-Type"], "application/json");
    EXPECT_EQ(captured.headers.count("Authorization"), 0u);
    EXPECT_EQ(json::parse(captured.body), metadata.to_json());

    EXPECT_EQ(result.client_id, "abc");
    EXPECT_EQ(result.client_secret, std::optional<std::string>("shh"));
    EXPECT_EQ(result.client_id_issued_at, std::optional<int64_t>(1700000000));
    EXPECT_EQ(result.client_secret_expires_at, std::optional<int64_t>(0));
    EXPECT_EQ(result.registration_access_token, std::optional<std::string>("rat"));
    EXPECT_EQ(result.raw["client_name"], "tokenward test");
}

TEST_F(DynamicRegistrationTest, Register_Rejected_ThrowsRegistrationError) {
    const std::string body = R"({"error":"invalid_redirect_uri","error_description":"Not allowed"})";
    EXPECT_CALL(*transport_, execute(_)).WillOnce(Return(json_response(400, body)));

    try {
        registration_->register_client(ClientMetadata::native_app("cli", LOOPBACK_REDIRECT_URI));
        FAIL() << "Expected RegistrationError";
    } catch (const RegistrationError& e) {
        EXPECT_EQ(e.code(), "REGISTRATION_ERROR");
        EXPECT_EQ(e.status_code(), 400);
        EXPECT_EQ(e.error_code(), "invalid_redirect_uri");
        EXPECT_EQ(e.error_description(), std::optional<std::string>("Not allowed"));
        EXPECT_EQ(e.response_body(), body);
    }
}

TEST_F(DynamicRegistrationTest, Register_ResponseWithoutClientId_InvalidResponse) {
    EXPECT_CALL(*transport_, execute(_)).WillOnce(Return(json_response(201, R"({"client_secret":"shh"})")));

    try {
        registration_->register_client(ClientMetadata());
        FAIL() << "Expected RegistrationError";
    } catch (const RegistrationError& e) {
        EXPECT_EQ(e.error_code(), "invalid_response");
    }
}

TEST_F(DynamicRegistrationTest, Constructor_InsecureEndpoint_ThrowsInvalidConfig) {
    EXPECT_THROW(DynamicRegistration("http://auth.example.com/register", transport_), InvalidConfigError);
    EXPECT_THROW(DynamicRegistration("", transport_), InvalidConfigError);
    EXPECT_THROW(DynamicRegistration("https://auth.example.com/register", nullptr), ValidationError);
    EXPECT_NO_THROW(DynamicRegistration("http://127.0.0.1:9000/register", transport_));
}

// ============================================================================
// Client configuration endpoint
// ============================================================================

TEST_F(DynamicRegistrationTest, Read_UsesBearerOnClientUri) {
    HttpRequest captured;
    EXPECT_CALL(*transport_, execute(_))
        .WillOnce(DoAll(SaveArg<0>(&captured), Return(json_response(200, registration_body()))));

    ClientRegistration result = registration_->read_client(registered());

    EXPECT_EQ(captured.method, "GET");
    EXPECT_EQ(captured.url, "https://auth.example.com/register/abc");
    EXPECT_EQ(captured.headers["Authorization"], "Bearer rat");
    EXPECT_EQ(result.client_id, "abc");
}

TEST_F(DynamicRegistrationTest, Update_PutsMetadataWithClientId) {
    HttpRequest captured;
    EXPECT_CALL(*transport_, execute(_))
        .WillOnce(DoAll(SaveArg<0>(&captured), Return(json_response(200, registration_body()))));

    ClientMetadata metadata;
    metadata.client_name = "renamed";
    registration_->update_client(registered(), metadata);

    json sent = json::parse(captured.body);
    EXPECT_EQ(captured.method, "PUT");
    EXPECT_EQ(captured.headers["Authorization"], "Bearer rat");
    EXPECT_EQ(sent["client_id"], "abc");
    EXPECT_EQ(sent["client_name"], "renamed");
}

TEST_F(DynamicRegistrationTest, Delete_AcceptsNoContent) {
    HttpRequest captured;
    EXPECT_CALL(*transport_, execute(_))
        .WillOnce(DoAll(SaveArg<0>(&captured), Return(json_response(204, ""))));

    registration_->delete_client(registered());

    EXPECT_EQ(captured.method, "DELETE");
    EXPECT_EQ(captured.url, "https://auth.example.com/register/abc");
}

TEST_F(DynamicRegistrationTest, Delete_Unauthorized_ThrowsRegistrationError) {
    EXPECT_CALL(*transport_, execute(_)).WillOnce(Return(json_response(401, R"({"error":"invalid_token"})")));

    EXPECT_THROW(registration_->delete_client(registered()), RegistrationError);
}

TEST_F(DynamicRegistrationTest, Management_WithoutCredentials_FailsWithoutNetwork) {
    EXPECT_CALL(*transport_, execute(_)).Times(0);

    ClientRegistration no_token = registered();
    no_token.registration_access_token.reset();
    ClientRegistration no_uri = registered();
    no_uri.registration_client_uri.reset();

    EXPECT_THROW(registration_->read_client(no_token), ValidationError);
    EXPECT_THROW(registration_->delete_client(no_uri), ValidationError);
    EXPECT_THROW(registration_->update_client(no_uri, ClientMetadata()), ValidationError);
}
