#include "../../client/avatar_client.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace avatarlink {
namespace http {

//=============================================================================
// GET /v0/providers - Configured providers in priority order, with health
//=============================================================================
void HttpServer::handle_get_providers(const httplib::Request &, httplib::Response &res) {
    const auto descriptors = client_.descriptors();
    const auto health = client_.health_snapshot();

    nlohmann::json providers_json = nlohmann::json::array();
    for (const auto &descriptor : descriptors) {
        std::optional<health::HealthSnapshot> snapshot;
        auto it = health.find(descriptor.name);
        if (it != health.end()) {
            snapshot = it->second;
        }
        providers_json.push_back(encode_descriptor(descriptor, snapshot));
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"providers", providers_json}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v0/health - Health snapshot per provider
//=============================================================================
void HttpServer::handle_get_health(const httplib::Request &, httplib::Response &res) {
    const auto descriptors = client_.descriptors();
    const auto health = client_.health_snapshot();

    nlohmann::json providers_json = nlohmann::json::array();
    size_t healthy = 0;
    for (const auto &descriptor : descriptors) {
        auto it = health.find(descriptor.name);
        if (it == health.end()) {
            continue;
        }
        nlohmann::json entry = encode_health_snapshot(it->second);
        entry["provider"] = descriptor.name;
        providers_json.push_back(std::move(entry));

        if (it->second.state == health::HealthState::HEALTHY) {
            ++healthy;
        }
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"healthy_count", healthy},
                               {"provider_count", providers_json.size()},
                               {"providers", providers_json}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace avatarlink
