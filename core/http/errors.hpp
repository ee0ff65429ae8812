#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "delivery/delivery_types.hpp"

namespace avatarlink
{
    namespace http
    {

        /**
         * @brief API status codes mapped to HTTP status codes
         *
         * - OK -> HTTP 200
         * - INVALID_ARGUMENT -> HTTP 400
         * - NOT_FOUND -> HTTP 404
         * - RESOURCE_EXHAUSTED -> HTTP 429
         * - INTERNAL -> HTTP 500
         * - BAD_GATEWAY -> HTTP 502
         * - UNAVAILABLE -> HTTP 503
         * - DEADLINE_EXCEEDED -> HTTP 504
         */
        enum class StatusCode
        {
            OK,
            INVALID_ARGUMENT,
            NOT_FOUND,
            RESOURCE_EXHAUSTED,
            UNAVAILABLE,
            BAD_GATEWAY,
            DEADLINE_EXCEEDED,
            INTERNAL
        };

        inline int status_code_to_http(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return 200;
            case StatusCode::INVALID_ARGUMENT:
                return 400;
            case StatusCode::NOT_FOUND:
                return 404;
            case StatusCode::RESOURCE_EXHAUSTED:
                return 429;
            case StatusCode::UNAVAILABLE:
                return 503;
            case StatusCode::BAD_GATEWAY:
                return 502;
            case StatusCode::DEADLINE_EXCEEDED:
                return 504;
            case StatusCode::INTERNAL:
                return 500;
            default:
                return 500;
            }
        }

        inline std::string status_code_to_string(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return "OK";
            case StatusCode::INVALID_ARGUMENT:
                return "INVALID_ARGUMENT";
            case StatusCode::NOT_FOUND:
                return "NOT_FOUND";
            case StatusCode::RESOURCE_EXHAUSTED:
                return "RESOURCE_EXHAUSTED";
            case StatusCode::UNAVAILABLE:
                return "UNAVAILABLE";
            case StatusCode::BAD_GATEWAY:
                return "BAD_GATEWAY";
            case StatusCode::DEADLINE_EXCEEDED:
                return "DEADLINE_EXCEEDED";
            case StatusCode::INTERNAL:
                return "INTERNAL";
            default:
                return "INTERNAL";
            }
        }

        /**
         * @brief Map a failed delivery onto the API status model
         *
         * Caller defects are 400, local admission is 429, an expired deadline
         * is 504 and everything that went wrong upstream is 502.
         */
        inline StatusCode status_for_error_kind(delivery::ErrorKind kind)
        {
            switch (kind)
            {
            case delivery::ErrorKind::NONE:
                return StatusCode::OK;
            case delivery::ErrorKind::INVALID_REQUEST:
                return StatusCode::INVALID_ARGUMENT;
            case delivery::ErrorKind::RATE_LIMITED:
                return StatusCode::RESOURCE_EXHAUSTED;
            case delivery::ErrorKind::TIMEOUT:
                return StatusCode::DEADLINE_EXCEEDED;
            case delivery::ErrorKind::TRANSPORT_ERROR:
            case delivery::ErrorKind::PROVIDER_SERVER_ERROR:
            case delivery::ErrorKind::PROVIDER_REJECTED:
            case delivery::ErrorKind::ALL_PROVIDERS_EXHAUSTED:
                return StatusCode::BAD_GATEWAY;
            }
            return StatusCode::INTERNAL;
        }

        /**
         * @brief Build a JSON status object
         *
         * All HTTP responses include a top-level "status" object with code and message.
         */
        inline nlohmann::json make_status(StatusCode code, const std::string &message = "")
        {
            std::string msg = message.empty() ? (code == StatusCode::OK ? "ok" : status_code_to_string(code)) : message;
            return {
                {"code", status_code_to_string(code)},
                {"message", msg}};
        }

        inline nlohmann::json make_error_response(StatusCode code, const std::string &message)
        {
            return {
                {"status", make_status(code, message)}};
        }

        // Provider text is not guaranteed UTF-8; bad sequences become U+FFFD instead of throwing
        inline std::string to_wire(const nlohmann::json &body)
        {
            return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }

    } // namespace http
} // namespace avatarlink
