#pragma once

/**
 * @file event_types.hpp
 * @brief Event types for the avatarlink observability layer
 *
 * Events are emitted by AvatarClient and consumed by:
 * - SSE endpoint (real-time streaming to dashboards)
 * - Telemetry sink (historical storage in InfluxDB)
 *
 * Events are immutable value types. Timestamps are epoch milliseconds
 * (consistent with the HTTP API).
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace avatarlink {
namespace events {

inline int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/**
 * @brief Terminal outcome of one speak() call
 *
 * Emitted once per request, including cache hits and validation failures.
 */
struct DeliveryOutcomeEvent {
    uint64_t event_id;
    std::string fingerprint;
    std::string provider;  // provider that served the request, empty on failure
    bool success;
    bool from_cache;
    std::string error_kind;  // "NONE" on success
    int64_t latency_ms;
    int providers_tried;
    int64_t timestamp_ms;
};

/**
 * @brief Health state change of one provider
 */
struct HealthTransitionEvent {
    uint64_t event_id;
    std::string provider;
    std::string old_state;  // HEALTHY | DEGRADED | UNHEALTHY
    std::string new_state;
    std::string reason;
    int flap_count;
    int64_t cooldown_ms;  // 0 unless entering UNHEALTHY
    int64_t timestamp_ms;
};

/**
 * @brief Provider set replaced by a configuration reload
 */
struct ProviderReloadEvent {
    uint64_t event_id;
    std::vector<std::string> added;
    std::vector<std::string> removed;
    size_t provider_count;
    int64_t timestamp_ms;
};

using Event = std::variant<DeliveryOutcomeEvent, HealthTransitionEvent, ProviderReloadEvent>;

inline const char *event_type_name(const Event &event) {
    return std::visit(
        [](auto &&e) -> const char * {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, DeliveryOutcomeEvent>)
                return "delivery";
            else if constexpr (std::is_same_v<T, HealthTransitionEvent>)
                return "health";
            else
                return "reload";
        },
        event);
}

// Provider an event concerns; empty for reloads
inline std::string provider_of(const Event &event) {
    if (const auto *delivery = std::get_if<DeliveryOutcomeEvent>(&event)) {
        return delivery->provider;
    }
    if (const auto *health = std::get_if<HealthTransitionEvent>(&event)) {
        return health->provider;
    }
    return {};
}

inline uint64_t get_event_id(const Event &event) {
    return std::visit([](auto &&e) { return e.event_id; }, event);
}

inline int64_t get_timestamp_ms(const Event &event) {
    return std::visit([](auto &&e) { return e.timestamp_ms; }, event);
}

}  // namespace events
}  // namespace avatarlink
