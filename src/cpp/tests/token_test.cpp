#include <gtest/gtest.h>

#include <tokenward/errors.hpp>
#include <tokenward/types.hpp>
#include "support/test_support.hpp"

using namespace tokenward;
using namespace tokenward::tests;

// ============================================================================
// Expiration
// ============================================================================

TEST(TokenTest, IsExpired_NoExpiresAt_NeverExpires) {
    Token token;
    token.access_token = "at";

    EXPECT_FALSE(token.is_expired());
    EXPECT_FALSE(token.expires_within(1000000));
    EXPECT_FALSE(token.needs_refresh(0.0));
}

TEST(TokenTest, IsExpired_PastExpiresAt_True) {
    Token token;
    token.access_token = "at";
    token.expires_at = unix_now() - 1;

    EXPECT_TRUE(token.is_expired());
}

TEST(TokenTest, IsExpired_AtExpiresAt_True) {
    Token token;
    token.access_token = "at";
    token.expires_at = unix_now();

    EXPECT_TRUE(token.is_expired());
}

TEST(TokenTest, IsExpired_FutureExpiresAt_False) {
    Token token;
    token.access_token = "at";
    token.expires_at = unix_now() + 3600;

    EXPECT_FALSE(token.is_expired());
}

TEST(TokenTest, ExpiresWithin_ComparesWindowAgainstExpiresAt) {
    Token token;
    token.access_token = "at";
    token.expires_at = unix_now() + 60;

    EXPECT_TRUE(token.expires_within(120));
    EXPECT_FALSE(token.expires_within(10));
}

// ============================================================================
// Elapsed lifetime
// ============================================================================

TEST(TokenTest, ElapsedFraction_NinetyPercent) {
    Token token = make_token("at", 1000, 900);

    auto fraction = token.elapsed_fraction();
    ASSERT_TRUE(fraction.has_value());
    EXPECT_NEAR(*fraction, 0.9, 0.01);
}

TEST(TokenTest, ElapsedFraction_MissingFields_Absent) {
    Token token;
    token.access_token = "at";
    token.expires_at = unix_now() + 100;
    EXPECT_FALSE(token.elapsed_fraction().has_value());

    token.expires_at.reset();
    token.expires_in = 100;
    EXPECT_FALSE(token.elapsed_fraction().has_value());
}

TEST(TokenTest, ElapsedFraction_ZeroLifetime_Absent) {
    Token token;
    token.access_token = "at";
    token.expires_in = 0;
    token.expires_at = unix_now();

    EXPECT_FALSE(token.elapsed_fraction().has_value());
}

TEST(TokenTest, ElapsedFraction_ClampedToUnitInterval) {
    Token expired = make_token("at", 100, 500);
    EXPECT_DOUBLE_EQ(*expired.elapsed_fraction(), 1.0);

    // expires_at further out than expires_in, e.g. clock skew at issuance
    Token skewed = make_token("at", 100, -500);
    EXPECT_DOUBLE_EQ(*skewed.elapsed_fraction(), 0.0);
}

TEST(TokenTest, NeedsRefresh_NinetyPercentElapsed_RefreshesAtEightyThreshold) {
    Token token = make_token("at", 1000, 900);

    EXPECT_TRUE(token.needs_refresh(0.8));
    EXPECT_FALSE(token.needs_refresh(1.0));
}

TEST(TokenTest, NeedsRefresh_HalfElapsed_NoRefreshAtEightyThreshold) {
    Token token = make_token("at", 1000, 500);

    EXPECT_FALSE(token.needs_refresh(0.8));
    EXPECT_TRUE(token.needs_refresh(0.4));
}

TEST(TokenTest, NeedsRefresh_Expired_AlwaysTrue) {
    Token token = make_token("at", 1000, 1010);

    EXPECT_TRUE(token.needs_refresh(1.0));
}

// ============================================================================
// Serialization
// ============================================================================

TEST(TokenTest, ToJson_OmitsAbsentOptionalFields) {
    Token token;
    token.access_token = "at";

    json j = token.to_json();

    EXPECT_EQ(j["access_token"], "at");
    EXPECT_EQ(j["token_type"], "Bearer");
    EXPECT_FALSE(j.contains("refresh_token"));
    EXPECT_FALSE(j.contains("expires_in"));
    EXPECT_FALSE(j.contains("expires_at"));
    EXPECT_FALSE(j.contains("scope"));
}

TEST(TokenTest, FromJson_ReadsAllFields) {
    json j = {
        {"access_token", "at"},
        {"refresh_token", "rt"},
        {"token_type", "bearer"},
        {"expires_in", 3600},
        {"expires_at", 1700003600},
        {"scope", "repo user"}
    };

    Token token = Token::from_json(j);

    EXPECT_EQ(token.access_token, "at");
    EXPECT_EQ(token.refresh_token, std::optional<std::string>("rt"));
    EXPECT_EQ(token.token_type, "bearer");
    EXPECT_EQ(token.expires_in, std::optional<int64_t>(3600));
    EXPECT_EQ(token.expires_at, std::optional<int64_t>(1700003600));
    EXPECT_EQ(token.scope, std::optional<std::string>("repo user"));
    EXPECT_EQ(Token::from_json(token.to_json()), token);
}

TEST(TokenTest, FromJson_DefaultsTokenTypeToBearer) {
    Token token = Token::from_json(json{{"access_token", "at"}});

    EXPECT_EQ(token.token_type, "Bearer");
    EXPECT_FALSE(token.refresh_token.has_value());
}

TEST(TokenTest, FromJson_MissingAccessToken_Throws) {
    EXPECT_THROW(Token::from_json(json{{"token_type", "Bearer"}}), json::exception);
}

// ============================================================================
// Session
// ============================================================================

TEST(SessionTest, Create_StampsCurrentTime) {
    int64_t before = unix_now();
    Session session = Session::create("state", "verifier");

    EXPECT_EQ(session.state, "state");
    EXPECT_EQ(session.code_verifier, "verifier");
    EXPECT_GE(session.created_at, before);
    EXPECT_LE(session.age(), 1);
}

TEST(SessionTest, FromJson_MissingField_Throws) {
    EXPECT_THROW(Session::from_json(json{{"state", "s"}, {"created_at", 1}}), json::exception);
}

// ============================================================================
// OAuthConfig
// ============================================================================

TEST(OAuthConfigTest, Validate_CompleteHttpsConfig_Passes) {
    EXPECT_NO_THROW(test_config().validate());
}

TEST(OAuthConfigTest, Validate_MissingClientId_Throws) {
    OAuthConfig config = test_config();
    config.client_id.clear();

    try {
        config.validate();
        FAIL() << "Expected InvalidConfigError";
    } catch (const InvalidConfigError& e) {
        EXPECT_EQ(e.config_key(), "client_id");
        EXPECT_EQ(e.code(), "INVALID_CONFIG");
    }
}

TEST(OAuthConfigTest, Validate_PlainHttpRemoteEndpoint_Throws) {
    OAuthConfig config = test_config();
    config.token_endpoint = "http://auth.example.com/token";

    EXPECT_THROW(config.validate(), InvalidConfigError);
}

TEST(OAuthConfigTest, IsSecureEndpoint_AllowsLoopbackHttp) {
    EXPECT_TRUE(is_secure_endpoint("https://example.com/token"));
    EXPECT_TRUE(is_secure_endpoint("http://localhost:8080/token"));
    EXPECT_TRUE(is_secure_endpoint("http://127.0.0.1/token"));
    EXPECT_TRUE(is_secure_endpoint("http://[::1]:9000/token"));

    EXPECT_FALSE(is_secure_endpoint("http://localhost.evil.example/token"));
    EXPECT_FALSE(is_secure_endpoint("http://example.com/token"));
    EXPECT_FALSE(is_secure_endpoint("ftp://example.com/token"));
}

TEST(OAuthConfigTest, Presets_UseProviderEndpoints) {
    OAuthConfig github = OAuthConfig::github("id");
    EXPECT_EQ(github.authorization_endpoint, "https://github.com/login/oauth/authorize");
    EXPECT_EQ(github.token_endpoint, "https://github.com/login/oauth/access_token");
    EXPECT_EQ(github.device_authorization_endpoint,
              std::optional<std::string>("https://github.com/login/device/code"));

    OAuthConfig google = OAuthConfig::google("id");
    EXPECT_EQ(google.token_endpoint, "https://oauth2.googleapis.com/token");

    OAuthConfig microsoft = OAuthConfig::microsoft("id", "contoso");
    EXPECT_EQ(microsoft.token_endpoint,
              "https://login.microsoftonline.com/contoso/oauth2/v2.0/token");

    OAuthConfig gitlab = OAuthConfig::gitlab("id", "https://gitlab.example.com/");
    EXPECT_EQ(gitlab.authorization_endpoint, "https://gitlab.example.com/oauth/authorize");
    EXPECT_FALSE(gitlab.device_authorization_endpoint.has_value());

    for (const auto& config : {github, google, microsoft, gitlab}) {
        EXPECT_EQ(config.redirect_uri, "http://127.0.0.1/callback");
        EXPECT_NO_THROW(config.validate());
    }
}

TEST(OAuthConfigTest, FromJson_ReadsOptionalFields) {
    json j = {
        {"client_id", "id"},
        {"authorization_endpoint", "https://a.example.com/auth"},
        {"token_endpoint", "https://a.example.com/token"},
        {"redirect_uri", "http://localhost/cb"},
        {"scope", "openid"},
        {"client_secret", "s3cret"}
    };

    OAuthConfig config = OAuthConfig::from_json(j);

    EXPECT_EQ(config.client_id, "id");
    EXPECT_EQ(config.scope, std::optional<std::string>("openid"));
    EXPECT_EQ(config.client_secret, std::optional<std::string>("s3cret"));
    EXPECT_FALSE(config.to_json().contains("client_secret"));
}

TEST(OAuthConfigTest, FromJson_NotAnObject_Throws) {
    EXPECT_THROW(OAuthConfig::from_json(json::array()), InvalidConfigError);
    EXPECT_THROW(OAuthConfig::from_json(json{{"client_id", 42}}), InvalidConfigError);
}

TEST(DeviceAuthorizationTest, FromJson_ClampsIntervalIntoAcceptedRange) {
    json j = {
        {"device_code", "dc"},
        {"user_code", "ABCD-EFGH"},
        {"verification_uri", "https://example.com/device"},
        {"expires_in", 900},
        {"interval", 0}
    };

    DeviceAuthorization auth = DeviceAuthorization::from_json(j);

    EXPECT_EQ(auth.interval, 5);
    EXPECT_EQ(auth.expires_in, 900);
    EXPECT_FALSE(auth.verification_uri_complete.has_value());
}
