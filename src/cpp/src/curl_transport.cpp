/**
 * @file curl_transport.cpp
 * @brief libcurl-backed transport
 */

#include "tokenward/curl_transport.hpp"
#include "tokenward/errors.hpp"
#include "tokenward/logging.hpp"
#include <curl/curl.h>

namespace tokenward {

struct ResponseBuffer {
    std::string data;
    size_t limit = 0;
    bool overflowed = false;
};

static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* buffer = static_cast<ResponseBuffer*>(userp);
    size_t total = size * nmemb;

    if (buffer->data.size() + total > buffer->limit) {
        buffer->overflowed = true;
        return 0;  // aborts the transfer with CURLE_WRITE_ERROR
    }
    buffer->data.append(static_cast<char*>(contents), total);
    return total;
}

CurlTransport::CurlTransport(const CurlTransportOptions& options)
    : options_(options) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlTransport::~CurlTransport() {
    curl_global_cleanup();
}

HttpResponse CurlTransport::execute(const HttpRequest& request) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw TransportError("Failed to initialize CURL", request.url);
    }

    ResponseBuffer buffer;
    buffer.limit = options_.max_response_bytes;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        if (request.method != "POST") {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, options_.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());

    struct curl_slist* headers = nullptr;
    for (const auto& [name, value] : request.headers) {
        std::string header = name + ": " + value;
        headers = curl_slist_append(headers, header.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (buffer.overflowed) {
        throw TransportError("Response exceeds " + std::to_string(buffer.limit) + " bytes", request.url);
    }
    if (res != CURLE_OK) {
        logger()->warn("{} {} failed: {}", request.method, request.url, curl_easy_strerror(res));
        throw TransportError("CURL error: " + std::string(curl_easy_strerror(res)), request.url);
    }

    logger()->debug("{} {} -> {}", request.method, request.url, http_code);

    HttpResponse response;
    response.status_code = http_code;
    response.body = std::move(buffer.data);
    return response;
}

} // namespace tokenward
