/**
 * @file pkce.hpp
 * @brief Proof Key for Code Exchange (RFC 7636)
 */

#ifndef TOKENWARD_PKCE_HPP
#define TOKENWARD_PKCE_HPP

#include <string>

namespace tokenward {

/**
 * PKCE verifier and its S256 challenge
 */
struct Pkce {
    std::string verifier;
    std::string challenge;

    /**
     * Generate a fresh pair from 32 random bytes
     */
    static Pkce generate();

    /**
     * Derive the challenge for an existing verifier
     * @throws ValidationError if the verifier is not 43-128 unreserved characters
     */
    static Pkce from_verifier(const std::string& verifier);

    static const char* method();
};

/**
 * BASE64URL(SHA256(ASCII(verifier)))
 */
std::string compute_s256_challenge(const std::string& verifier);

} // namespace tokenward

#endif // TOKENWARD_PKCE_HPP
