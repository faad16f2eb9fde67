/**
 * @file encoding.hpp
 * @brief URL, form and base64url encoding helpers
 */

#ifndef TOKENWARD_ENCODING_HPP
#define TOKENWARD_ENCODING_HPP

#include <string>
#include <vector>
#include <map>
#include <utility>
#include <cstdint>
#include <cstddef>

namespace tokenward {

using FormFields = std::vector<std::pair<std::string, std::string>>;

/**
 * Base64url without padding (RFC 4648 section 5)
 */
std::string base64url_encode(const unsigned char* data, size_t length);
std::string base64url_encode(const std::vector<uint8_t>& data);

/// Lowercase hex SHA-256 digest
std::string sha256_hex(const std::string& data);

/**
 * Percent-encode everything except A-Z a-z 0-9 - _ . ~
 */
std::string url_encode(const std::string& value);

/**
 * Decode %XX escapes and '+' as space
 * @throws ValidationError on a truncated or non-hex escape
 */
std::string url_decode(const std::string& value);

/// application/x-www-form-urlencoded body, fields in the given order
std::string form_encode(const FormFields& fields);

/**
 * Parse the query component of a URL (or a bare query string)
 * @return Decoded name/value pairs; later duplicates win
 */
std::map<std::string, std::string> parse_query(const std::string& url);

/**
 * Base64url string of num_bytes from the OpenSSL CSPRNG
 * @throws TokenwardError if the generator fails
 */
std::string random_urlsafe_string(size_t num_bytes = 32);

/**
 * Render a secret for logs: first and last 4 characters only
 */
std::string mask_secret(const std::string& secret);

} // namespace tokenward

#endif // TOKENWARD_ENCODING_HPP
