#include "../../client/avatar_client.hpp"
#include "../../logging/logger.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace avatarlink {
namespace http {

//=============================================================================
// POST /v0/speak - Deliver one utterance
//=============================================================================
void HttpServer::handle_post_speak(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    if (!parse_json_body(req, res, body)) {
        return;
    }

    delivery::DeliveryRequest request;
    std::string error;
    if (!decode_speak_request(body, request, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    const delivery::DeliveryResult result = client_.speak(std::move(request));

    nlohmann::json response = encode_delivery_result(result);
    if (result.success) {
        response["status"] = make_status(StatusCode::OK);
        send_json(res, StatusCode::OK, response);
        return;
    }

    const StatusCode code = status_for_error_kind(result.error_kind);
    LOG_DEBUG("[HTTP] speak failed: " << delivery::error_kind_to_string(result.error_kind) << ": "
                                      << result.error_message);
    response["status"] = make_status(code, result.error_message);
    send_json(res, code, response);
}

}  // namespace http
}  // namespace avatarlink
