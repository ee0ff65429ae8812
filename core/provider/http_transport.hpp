#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace avatarlink {
namespace provider {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequestSpec {
    std::string base_url;  // scheme://host[:port]
    std::string path;
    HeaderList headers;
    std::string body;
    std::string content_type = "application/json";
    std::chrono::milliseconds timeout{5000};
};

enum class TransportError {
    NONE,        // an HTTP response was received (any status)
    TIMEOUT,     // connect or read timed out
    CONNECTION,  // refused, reset, DNS, TLS handshake
    INVALID_URL  // base_url could not be used
};

struct TransportResponse {
    TransportError error = TransportError::NONE;
    std::string error_message;
    int status = 0;
    std::string body;

    bool has_response() const { return error == TransportError::NONE; }
};

// Interface for outbound HTTP to enable mocking
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    virtual TransportResponse post(const HttpRequestSpec &request) = 0;
    virtual TransportResponse get(const HttpRequestSpec &request) = 0;
};

/**
 * @brief cpp-httplib backed transport
 *
 * A client is created per call, so concurrent callers share nothing and a
 * call only ever blocks its own thread. HTTPS needs cpp-httplib built with
 * OpenSSL support.
 */
class HttplibTransport : public IHttpTransport {
public:
    TransportResponse post(const HttpRequestSpec &request) override;
    TransportResponse get(const HttpRequestSpec &request) override;
};

}  // namespace provider
}  // namespace avatarlink
