#pragma once

#include <httplib.h>

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

#include "../../events/event_emitter.hpp"
#include "../errors.hpp"

namespace avatarlink
{
    namespace http
    {

        inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body)
        {
            res.status = status_code_to_http(code);
            res.set_content(to_wire(body), "application/json");
        }

        inline void send_error(httplib::Response &res, StatusCode code, const std::string &message)
        {
            send_json(res, code, make_error_response(code, message));
        }

        // Parses the request body as a JSON object; answers 400 otherwise
        inline bool parse_json_body(const httplib::Request &req, httplib::Response &res, nlohmann::json &body)
        {
            try
            {
                body = nlohmann::json::parse(req.body);
            }
            catch (const nlohmann::json::parse_error &e)
            {
                send_error(res, StatusCode::INVALID_ARGUMENT, std::string("Invalid JSON: ") + e.what());
                return false;
            }

            if (!body.is_object())
            {
                send_error(res, StatusCode::INVALID_ARGUMENT, "Request body must be a JSON object");
                return false;
            }
            return true;
        }

        /**
         * @brief Build an event filter from ?provider=NAME&types=delivery,health,reload
         *
         * An absent "types" selects every event type. Unknown type names are an error.
         */
        inline bool parse_event_filter(const httplib::Request &req, events::EventFilter &filter, std::string &error)
        {
            filter = events::EventFilter::all();

            if (req.has_param("provider"))
            {
                filter.provider = req.get_param_value("provider");
            }

            if (!req.has_param("types"))
            {
                return true;
            }

            filter.deliveries = false;
            filter.health = false;
            filter.reloads = false;

            std::istringstream types(req.get_param_value("types"));
            std::string type;
            while (std::getline(types, type, ','))
            {
                if (type == "delivery")
                    filter.deliveries = true;
                else if (type == "health")
                    filter.health = true;
                else if (type == "reload")
                    filter.reloads = true;
                else if (!type.empty())
                {
                    error = "Unknown event type '" + type + "' (expected delivery, health or reload)";
                    return false;
                }
            }
            return true;
        }

    } // namespace http
} // namespace avatarlink
