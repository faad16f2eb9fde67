#include <gtest/gtest.h>

#include <tokenward/encoding.hpp>
#include <tokenward/errors.hpp>
#include <tokenward/pkce.hpp>
#include <set>

using namespace tokenward;

// ============================================================================
// PKCE
// ============================================================================

TEST(PkceTest, S256Challenge_MatchesRfc7636AppendixB) {
    const std::string verifier = "dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk";

    EXPECT_EQ(compute_s256_challenge(verifier), "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM");
    EXPECT_EQ(Pkce::from_verifier(verifier).challenge, "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM");
}

TEST(PkceTest, Generate_ProducesUnpaddedUrlSafeVerifier) {
    Pkce pkce = Pkce::generate();

    EXPECT_EQ(pkce.verifier.size(), 43u);
    EXPECT_EQ(pkce.verifier.find_first_of("+/="), std::string::npos);
    EXPECT_EQ(pkce.challenge, compute_s256_challenge(pkce.verifier));
    EXPECT_STREQ(Pkce::method(), "S256");
}

TEST(PkceTest, Generate_VerifiersAreUnique) {
    std::set<std::string> verifiers;
    for (int i = 0; i < 100; ++i) {
        verifiers.insert(Pkce::generate().verifier);
    }

    EXPECT_EQ(verifiers.size(), 100u);
}

TEST(PkceTest, FromVerifier_RejectsBadVerifiers) {
    EXPECT_THROW(Pkce::from_verifier("short"), ValidationError);
    EXPECT_THROW(Pkce::from_verifier(std::string(129, 'a')), ValidationError);
    EXPECT_THROW(Pkce::from_verifier(std::string(42, 'a') + "+"), ValidationError);
    EXPECT_NO_THROW(Pkce::from_verifier(std::string(128, '~')));
}

// ============================================================================
// base64url
// ============================================================================

TEST(EncodingTest, Base64Url_UsesUrlAlphabetWithoutPadding) {
    const unsigned char bytes[] = {0xfb, 0xff};

    EXPECT_EQ(base64url_encode(bytes, sizeof(bytes)), "-_8");
    EXPECT_EQ(base64url_encode(std::vector<uint8_t>{'f'}), "Zg");
    EXPECT_EQ(base64url_encode(std::vector<uint8_t>{'f', 'o', 'o', 'b', 'a', 'r'}), "Zm9vYmFy");
    EXPECT_EQ(base64url_encode(std::vector<uint8_t>{}), "");
}

TEST(EncodingTest, RandomUrlsafeString_EncodesRequestedEntropy) {
    EXPECT_EQ(random_urlsafe_string(32).size(), 43u);
    EXPECT_EQ(random_urlsafe_string(16).size(), 22u);
    EXPECT_NE(random_urlsafe_string(), random_urlsafe_string());
    EXPECT_THROW(random_urlsafe_string(0), ValidationError);
}

// ============================================================================
// Percent-encoding
// ============================================================================

TEST(EncodingTest, UrlEncode_KeepsOnlyUnreservedCharacters) {
    EXPECT_EQ(url_encode("AZaz09-_.~"), "AZaz09-_.~");
    EXPECT_EQ(url_encode("a b&c=d/\xC3\xA9"), "a%20b%26c%3Dd%2F%C3%A9");
    EXPECT_EQ(url_encode("http://127.0.0.1/callback"), "http%3A%2F%2F127.0.0.1%2Fcallback");
}

TEST(EncodingTest, UrlDecode_ReversesEscapesAndPlus) {
    EXPECT_EQ(url_decode("a%20b+c%2fd"), "a b c/d");
    EXPECT_THROW(url_decode("abc%2"), ValidationError);
    EXPECT_THROW(url_decode("%zz"), ValidationError);
}

TEST(EncodingTest, FormEncode_PreservesFieldOrder) {
    FormFields fields = {
        {"grant_type", "refresh_token"},
        {"refresh_token", "a/b+c"},
        {"client_id", "id"}
    };

    EXPECT_EQ(form_encode(fields), "grant_type=refresh_token&refresh_token=a%2Fb%2Bc&client_id=id");
}

TEST(EncodingTest, ParseQuery_DecodesUrlQuery) {
    auto params = parse_query("http://127.0.0.1/callback?code=abc&state=x%2By&empty#fragment");

    EXPECT_EQ(params["code"], "abc");
    EXPECT_EQ(params["state"], "x+y");
    EXPECT_EQ(params.count("empty"), 1u);
    EXPECT_EQ(params.count("fragment"), 0u);
}

TEST(EncodingTest, ParseQuery_AcceptsBareFormBody) {
    auto params = parse_query("grant_type=authorization_code&code=c%201");

    EXPECT_EQ(params["grant_type"], "authorization_code");
    EXPECT_EQ(params["code"], "c 1");
}

TEST(EncodingTest, MaskSecret_ShowsOnlyEnds) {
    EXPECT_EQ(mask_secret("abcdefghijklmnop"), "abcd...mnop");
    EXPECT_EQ(mask_secret("short"), "*****");
    EXPECT_EQ(mask_secret(""), "");
}

TEST(EncodingTest, Sha256Hex_KnownDigest) {
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256_hex("").size(), 64u);
}
