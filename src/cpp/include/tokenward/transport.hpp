/**
 * @file transport.hpp
 * @brief HTTP transport interface used for token endpoint calls
 */

#ifndef TOKENWARD_TRANSPORT_HPP
#define TOKENWARD_TRANSPORT_HPP

#include <map>
#include <string>

namespace tokenward {

struct HttpRequest {
    std::string method = "POST";
    std::string url;
    std::string body;
    std::map<std::string, std::string> headers;
};

struct HttpResponse {
    long status_code = 0;
    std::string body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
};

/**
 * Performs one HTTP exchange
 *
 * Implementations return any HTTP status as a response and throw
 * TransportError only when no response was received.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual HttpResponse execute(const HttpRequest& request) = 0;
};

} // namespace tokenward

#endif // TOKENWARD_TRANSPORT_HPP
