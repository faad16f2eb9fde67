/**
 * @file pkce.cpp
 * @brief PKCE verifier and challenge generation
 */

#include "tokenward/pkce.hpp"
#include "tokenward/encoding.hpp"
#include "tokenward/errors.hpp"
#include "tokenward/types.hpp"
#include <openssl/sha.h>

namespace tokenward {

// 32 bytes encode to the 43-character minimum verifier length
static constexpr size_t VERIFIER_ENTROPY_BYTES = 32;
static constexpr size_t MIN_VERIFIER_LENGTH = 43;
static constexpr size_t MAX_VERIFIER_LENGTH = 128;

std::string compute_s256_challenge(const std::string& verifier) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(verifier.data()), verifier.size(), digest);
    return base64url_encode(digest, sizeof(digest));
}

Pkce Pkce::generate() {
    Pkce pkce;
    pkce.verifier = random_urlsafe_string(VERIFIER_ENTROPY_BYTES);
    pkce.challenge = compute_s256_challenge(pkce.verifier);
    return pkce;
}

Pkce Pkce::from_verifier(const std::string& verifier) {
    if (verifier.size() < MIN_VERIFIER_LENGTH || verifier.size() > MAX_VERIFIER_LENGTH) {
        throw ValidationError("code_verifier must be 43 to 128 characters", "code_verifier");
    }
    for (unsigned char c : verifier) {
        bool allowed = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                       (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_' || c == '~';
        if (!allowed) {
            throw ValidationError("code_verifier contains a reserved character", "code_verifier");
        }
    }

    Pkce pkce;
    pkce.verifier = verifier;
    pkce.challenge = compute_s256_challenge(verifier);
    return pkce;
}

const char* Pkce::method() {
    return PKCE_METHOD_S256;
}

} // namespace tokenward
