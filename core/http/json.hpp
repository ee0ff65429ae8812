#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "client/avatar_client.hpp"
#include "delivery/delivery_types.hpp"
#include "events/event_types.hpp"
#include "health/health_monitor.hpp"
#include "provider/provider_descriptor.hpp"

namespace avatarlink {
namespace http {

/**
 * @brief JSON encoding for API responses and SSE payloads
 *
 * Field names are snake_case. Enumerations are encoded as their upper-case
 * names (HEALTHY, PROVIDER_REJECTED, ...). Credentials are never encoded.
 */

nlohmann::json encode_delivery_result(const delivery::DeliveryResult &result);
nlohmann::json encode_provider_outcome(const delivery::ProviderOutcome &outcome);
nlohmann::json encode_health_snapshot(const health::HealthSnapshot &snapshot);
nlohmann::json encode_descriptor(const provider::ProviderDescriptor &descriptor,
                                 const std::optional<health::HealthSnapshot> &health);
nlohmann::json encode_stats(const client::ClientStats &stats);
nlohmann::json encode_event(const events::Event &event);

/**
 * @brief Decode a POST /v0/speak body
 *
 * Only "text" is required. Omitted payload fields keep their defaults;
 * "deadline_ms" (positive integer, at most 24h) is turned into an absolute
 * deadline relative to now.
 */
bool decode_speak_request(const nlohmann::json &json, delivery::DeliveryRequest &request, std::string &error,
                          delivery::Clock::time_point now = delivery::Clock::now());

}  // namespace http
}  // namespace avatarlink
