#include "json.hpp"

#include <type_traits>
#include <variant>

namespace avatarlink {
namespace http {

namespace {

// Longer caller deadlines are treated as client bugs
constexpr int64_t kMaxDeadlineMs = 24LL * 60 * 60 * 1000;

bool read_optional_string(const nlohmann::json &json, const char *key, std::string &out, std::string &error) {
    if (!json.contains(key) || json.at(key).is_null()) {
        return true;
    }
    if (!json.at(key).is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = json.at(key).get<std::string>();
    return true;
}

}  // namespace

nlohmann::json encode_provider_outcome(const delivery::ProviderOutcome &outcome) {
    nlohmann::json result = {{"provider", outcome.provider},
                             {"outcome", delivery::outcome_kind_to_string(outcome.kind)},
                             {"error_kind", delivery::error_kind_to_string(outcome.error_kind)},
                             {"attempts", outcome.attempts}};
    if (!outcome.message.empty()) {
        result["message"] = outcome.message;
    }
    if (outcome.http_status != 0) {
        result["http_status"] = outcome.http_status;
    }
    return result;
}

nlohmann::json encode_delivery_result(const delivery::DeliveryResult &result) {
    nlohmann::json json = {{"success", result.success},
                           {"fingerprint", result.fingerprint},
                           {"from_cache", result.from_cache},
                           {"latency_ms", result.latency_ms}};

    if (result.success) {
        json["provider"] = result.provider_used;

        // Providers answer with JSON; anything else is passed through as text
        auto parsed = nlohmann::json::parse(result.response_body, nullptr, false);
        if (parsed.is_discarded()) {
            json["response"] = result.response_body;
        } else {
            json["response"] = std::move(parsed);
        }
    } else {
        json["error_kind"] = delivery::error_kind_to_string(result.error_kind);
        json["error_message"] = result.error_message;
        json["retry_later"] = result.retry_later();
    }

    nlohmann::json outcomes = nlohmann::json::array();
    for (const auto &outcome : result.provider_outcomes) {
        outcomes.push_back(encode_provider_outcome(outcome));
    }
    json["provider_outcomes"] = outcomes;
    return json;
}

nlohmann::json encode_health_snapshot(const health::HealthSnapshot &snapshot) {
    nlohmann::json json = {{"state", health::health_state_to_string(snapshot.state)},
                           {"consecutive_failures", snapshot.consecutive_failures},
                           {"consecutive_successes", snapshot.consecutive_successes},
                           {"flap_count", snapshot.flap_count},
                           {"total_successes", snapshot.total_successes},
                           {"total_failures", snapshot.total_failures},
                           {"canary_in_flight", snapshot.canary_in_flight}};

    json["cooldown_remaining_ms"] =
        snapshot.cooldown_remaining_ms ? nlohmann::json(*snapshot.cooldown_remaining_ms) : nlohmann::json(nullptr);
    json["last_probe_ago_ms"] =
        snapshot.last_probe_ago_ms ? nlohmann::json(*snapshot.last_probe_ago_ms) : nlohmann::json(nullptr);
    json["last_outcome_ago_ms"] =
        snapshot.last_outcome_ago_ms ? nlohmann::json(*snapshot.last_outcome_ago_ms) : nlohmann::json(nullptr);
    json["last_latency_ms"] =
        snapshot.last_latency_ms ? nlohmann::json(*snapshot.last_latency_ms) : nlohmann::json(nullptr);
    if (!snapshot.last_error.empty()) {
        json["last_error"] = snapshot.last_error;
    }
    return json;
}

nlohmann::json encode_descriptor(const provider::ProviderDescriptor &descriptor,
                                 const std::optional<health::HealthSnapshot> &health) {
    nlohmann::json json = {{"name", descriptor.name},
                           {"dialect", provider::dialect_to_string(descriptor.dialect)},
                           {"base_url", descriptor.base_url},
                           {"speak_path", descriptor.speak_path},
                           {"priority", descriptor.priority},
                           {"timeout_ms", descriptor.timeout_ms},
                           {"languages", descriptor.languages},
                           {"emotions", descriptor.emotions},
                           {"credential_ref", descriptor.credential_ref},
                           {"has_credential", !descriptor.credential.empty()}};

    if (descriptor.rate_limit.enabled) {
        json["rate_limit"] = {{"requests_per_second", descriptor.rate_limit.requests_per_second},
                              {"burst", descriptor.rate_limit.burst}};
    } else {
        json["rate_limit"] = nullptr;
    }

    json["health"] = health ? encode_health_snapshot(*health) : nlohmann::json(nullptr);
    return json;
}

nlohmann::json encode_stats(const client::ClientStats &stats) {
    nlohmann::json per_provider = nlohmann::json::object();
    for (const auto &[name, count] : stats.provider_deliveries) {
        per_provider[name] = count;
    }

    return {{"requests", stats.requests},
            {"cache_hits", stats.cache_hits},
            {"successes", stats.successes},
            {"failures", stats.failures},
            {"invalid_requests", stats.invalid_requests},
            {"rate_limited", stats.rate_limited},
            {"in_flight", stats.in_flight},
            {"provider_deliveries", per_provider},
            {"cache_size", stats.cache_size},
            {"provider_count", stats.provider_count}};
}

nlohmann::json encode_event(const events::Event &event) {
    nlohmann::json data;

    std::visit(
        [&data](auto &&e) {
            using T = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<T, events::DeliveryOutcomeEvent>) {
                data["fingerprint"] = e.fingerprint;
                data["provider"] = e.provider;
                data["success"] = e.success;
                data["from_cache"] = e.from_cache;
                data["error_kind"] = e.error_kind;
                data["latency_ms"] = e.latency_ms;
                data["providers_tried"] = e.providers_tried;
            } else if constexpr (std::is_same_v<T, events::HealthTransitionEvent>) {
                data["provider"] = e.provider;
                data["old_state"] = e.old_state;
                data["new_state"] = e.new_state;
                data["reason"] = e.reason;
                data["flap_count"] = e.flap_count;
                data["cooldown_ms"] = e.cooldown_ms;
            } else if constexpr (std::is_same_v<T, events::ProviderReloadEvent>) {
                data["added"] = e.added;
                data["removed"] = e.removed;
                data["provider_count"] = e.provider_count;
            }
            data["timestamp_ms"] = e.timestamp_ms;
        },
        event);

    return data;
}

bool decode_speak_request(const nlohmann::json &json, delivery::DeliveryRequest &request, std::string &error,
                          delivery::Clock::time_point now) {
    try {
        if (!json.is_object()) {
            error = "Request body must be a JSON object";
            return false;
        }
        if (!json.contains("text")) {
            error = "Missing 'text'";
            return false;
        }
        if (!json.at("text").is_string()) {
            error = "'text' must be a string";
            return false;
        }

        delivery::SpeakPayload &payload = request.payload;
        payload.text = json.at("text").get<std::string>();

        if (!read_optional_string(json, "emotion", payload.emotion, error) ||
            !read_optional_string(json, "language", payload.language, error) ||
            !read_optional_string(json, "avatar_id", payload.avatar_id, error) ||
            !read_optional_string(json, "voice_id", payload.voice_id, error) ||
            !read_optional_string(json, "gesture", payload.gesture, error)) {
            return false;
        }

        if (json.contains("deadline_ms") && !json.at("deadline_ms").is_null()) {
            const auto &deadline = json.at("deadline_ms");
            if (!deadline.is_number_integer() || deadline.get<int64_t>() <= 0) {
                error = "'deadline_ms' must be a positive integer";
                return false;
            }
            if (deadline.get<int64_t>() > kMaxDeadlineMs) {
                error = "'deadline_ms' must not exceed " + std::to_string(kMaxDeadlineMs) + " (24h)";
                return false;
            }
            request.deadline = now + std::chrono::milliseconds(deadline.get<int64_t>());
        }

        return true;
    } catch (const std::exception &e) {
        error = std::string("JSON parse error: ") + e.what();
        return false;
    }
}

}  // namespace http
}  // namespace avatarlink
