/**
 * @file encoding.cpp
 * @brief URL, form and base64url encoding helpers
 */

#include "tokenward/encoding.hpp"
#include "tokenward/errors.hpp"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <limits>

namespace tokenward {

static const char HEX_DIGITS[] = "0123456789ABCDEF";

static bool is_unreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == '~';
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::string base64url_encode(const unsigned char* data, size_t length) {
    if (length == 0) return "";
    if (length > static_cast<size_t>(std::numeric_limits<int>::max() / 4 * 3)) {
        throw ValidationError("Input too large for base64 encoding", "length");
    }

    std::string result;
    result.resize(((length + 2) / 3) * 4);

    int encoded = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&result[0]),
                                  data, static_cast<int>(length));
    result.resize(static_cast<size_t>(encoded));

    while (!result.empty() && result.back() == '=') {
        result.pop_back();
    }
    for (char& c : result) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return result;
}

std::string base64url_encode(const std::vector<uint8_t>& data) {
    return base64url_encode(data.data(), data.size());
}

std::string sha256_hex(const std::string& data) {
    static const char lower_hex[] = "0123456789abcdef";

    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);

    std::string result;
    result.reserve(SHA256_DIGEST_LENGTH * 2);
    for (unsigned char byte : digest) {
        result += lower_hex[byte >> 4];
        result += lower_hex[byte & 0x0F];
    }
    return result;
}

std::string url_encode(const std::string& value) {
    std::string result;
    result.reserve(value.size() * 3);

    for (unsigned char c : value) {
        if (is_unreserved(c)) {
            result += static_cast<char>(c);
        } else {
            result += '%';
            result += HEX_DIGITS[c >> 4];
            result += HEX_DIGITS[c & 0x0F];
        }
    }
    return result;
}

std::string url_decode(const std::string& value) {
    std::string result;
    result.reserve(value.size());

    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            result += ' ';
        } else if (c == '%') {
            if (i + 2 >= value.size()) {
                throw ValidationError("Truncated percent-escape", "value", value);
            }
            int high = hex_value(value[i + 1]);
            int low = hex_value(value[i + 2]);
            if (high < 0 || low < 0) {
                throw ValidationError("Invalid percent-escape", "value", value);
            }
            result += static_cast<char>((high << 4) | low);
            i += 2;
        } else {
            result += c;
        }
    }
    return result;
}

std::string form_encode(const FormFields& fields) {
    std::string body;
    for (const auto& [name, value] : fields) {
        if (!body.empty()) body += '&';
        body += url_encode(name);
        body += '=';
        body += url_encode(value);
    }
    return body;
}

std::map<std::string, std::string> parse_query(const std::string& url) {
    std::map<std::string, std::string> params;

    std::string query = url;
    size_t question = query.find('?');
    if (question != std::string::npos) {
        query = query.substr(question + 1);
    }
    size_t fragment = query.find('#');
    if (fragment != std::string::npos) {
        query = query.substr(0, fragment);
    }

    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();

        std::string pair = query.substr(pos, amp - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                params[url_decode(pair)] = "";
            } else {
                params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
            }
        }
        pos = amp + 1;
    }
    return params;
}

std::string random_urlsafe_string(size_t num_bytes) {
    if (num_bytes == 0 || num_bytes > 256) {
        throw ValidationError("Random byte count out of range", "num_bytes", std::to_string(num_bytes));
    }

    std::vector<uint8_t> buffer(num_bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(num_bytes)) != 1) {
        unsigned long error_code = ERR_get_error();
        throw TokenwardError("Failed to generate secure random bytes (OpenSSL error " +
                             std::to_string(error_code) + ")", "RANDOM_FAILURE");
    }
    return base64url_encode(buffer);
}

std::string mask_secret(const std::string& secret) {
    if (secret.size() <= 8) {
        return std::string(secret.size(), '*');
    }
    return secret.substr(0, 4) + "..." + secret.substr(secret.size() - 4);
}

} // namespace tokenward
