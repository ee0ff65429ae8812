#include "http_transport.hpp"

// cpp-httplib; HTTPS endpoints require CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>

#include <memory>

#include "logging/logger.hpp"

namespace avatarlink {
namespace provider {

namespace {

std::unique_ptr<httplib::Client> make_client(const HttpRequestSpec &request) {
    auto client = std::make_unique<httplib::Client>(request.base_url);

    client->set_connection_timeout(request.timeout);
    client->set_read_timeout(request.timeout);
    client->set_write_timeout(request.timeout);
    client->set_keep_alive(false);

    return client;
}

httplib::Headers to_headers(const HeaderList &headers) {
    httplib::Headers out;
    for (const auto &[key, value] : headers) {
        out.emplace(key, value);
    }
    return out;
}

TransportResponse from_result(const httplib::Result &result) {
    TransportResponse response;

    if (result) {
        response.status = result->status;
        response.body = result->body;
        return response;
    }

    const auto err = result.error();
    response.error_message = httplib::to_string(err);

    switch (err) {
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            // httplib reports an expired read timeout as a read error
            response.error = TransportError::TIMEOUT;
            break;
        default:
            response.error = TransportError::CONNECTION;
            break;
    }
    return response;
}

TransportResponse invalid_url(const HttpRequestSpec &request) {
    TransportResponse response;
    response.error = TransportError::INVALID_URL;
    response.error_message = "Unusable base URL: " + request.base_url;
    return response;
}

}  // namespace

TransportResponse HttplibTransport::post(const HttpRequestSpec &request) {
    auto client = make_client(request);
    if (!client->is_valid()) {
        return invalid_url(request);
    }

    LOG_DEBUG("[Transport] POST " << request.base_url << request.path << " (" << request.body.size() << " bytes)");

    auto result = client->Post(request.path, to_headers(request.headers), request.body, request.content_type);
    return from_result(result);
}

TransportResponse HttplibTransport::get(const HttpRequestSpec &request) {
    auto client = make_client(request);
    if (!client->is_valid()) {
        return invalid_url(request);
    }

    LOG_DEBUG("[Transport] GET " << request.base_url << request.path);

    auto result = client->Get(request.path, to_headers(request.headers));
    return from_result(result);
}

}  // namespace provider
}  // namespace avatarlink
