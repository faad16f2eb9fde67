#pragma once

#include <tokenward/transport.hpp>
#include <gmock/gmock.h>

namespace tokenward::tests {

/**
 * @brief gmock Transport for request/response assertions
 */
class MockTransport : public Transport {
public:
    MOCK_METHOD(HttpResponse, execute, (const HttpRequest& request), (override));
};

inline HttpResponse json_response(long status, const std::string& body) {
    HttpResponse response;
    response.status_code = status;
    response.body = body;
    return response;
}

} // namespace tokenward::tests
