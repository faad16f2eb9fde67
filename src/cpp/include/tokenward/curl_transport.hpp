/**
 * @file curl_transport.hpp
 * @brief libcurl-backed transport
 */

#ifndef TOKENWARD_CURL_TRANSPORT_HPP
#define TOKENWARD_CURL_TRANSPORT_HPP

#include "transport.hpp"
#include "types.hpp"

namespace tokenward {

struct CurlTransportOptions {
    long timeout_seconds = 30;
    long connect_timeout_seconds = 10;
    std::string user_agent = "tokenward/0.1.0";
    size_t max_response_bytes = MAX_RESPONSE_BYTES;
};

/**
 * Blocking transport using a fresh curl easy handle per request
 *
 * Safe to share between threads.
 */
class CurlTransport : public Transport {
public:
    explicit CurlTransport(const CurlTransportOptions& options = CurlTransportOptions());
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse execute(const HttpRequest& request) override;

    const CurlTransportOptions& options() const { return options_; }

private:
    CurlTransportOptions options_;
};

} // namespace tokenward

#endif // TOKENWARD_CURL_TRANSPORT_HPP
