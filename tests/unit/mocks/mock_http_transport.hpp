#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

#include "provider/http_transport.hpp"

namespace avatarlink::tests {

using namespace avatarlink;
using namespace testing;

class MockHttpTransport : public provider::IHttpTransport {
public:
    MOCK_METHOD(provider::TransportResponse, post, (const provider::HttpRequestSpec &), (override));
    MOCK_METHOD(provider::TransportResponse, get, (const provider::HttpRequestSpec &), (override));
};

inline provider::TransportResponse http_response(int status, const std::string &body = "{}") {
    provider::TransportResponse response;
    response.status = status;
    response.body = body;
    return response;
}

inline provider::TransportResponse transport_failure(provider::TransportError error,
                                                     const std::string &message = "simulated") {
    provider::TransportResponse response;
    response.error = error;
    response.error_message = message;
    return response;
}

}  // namespace avatarlink::tests
