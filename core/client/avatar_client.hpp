#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "delivery/delivery_types.hpp"
#include "delivery/provider_selector.hpp"
#include "delivery/rate_limiter.hpp"
#include "delivery/response_cache.hpp"
#include "delivery/retry_engine.hpp"
#include "health/health_monitor.hpp"
#include "provider/http_transport.hpp"
#include "provider/provider_descriptor.hpp"
#include "provider/provider_registry.hpp"

namespace avatarlink {

namespace events {
class EventEmitter;
}

namespace client {

struct ClientOptions {
    std::string default_avatar_id;  // used when a request names no avatar
    size_t max_text_length = 2000;
    int default_deadline_ms = 0;  // 0 = no deadline unless the caller sets one

    delivery::RetryPolicy retry;
    health::HealthPolicy health;

    bool cache_enabled = true;
    int cache_ttl_ms = 5000;
    size_t cache_capacity = 1024;
    size_t cache_shards = 8;
};

struct ClientStats {
    uint64_t requests = 0;
    uint64_t cache_hits = 0;
    uint64_t successes = 0;  // cache hits included
    uint64_t failures = 0;   // invalid requests included
    uint64_t invalid_requests = 0;
    uint64_t rate_limited = 0;
    uint64_t in_flight = 0;
    std::map<std::string, uint64_t> provider_deliveries;  // successful provider calls per provider
    size_t cache_size = 0;
    size_t provider_count = 0;
};

/**
 * @brief Public entry point for delivering utterances to avatar providers
 *
 * speak() pipeline:
 *   validate -> fingerprint -> cache -> candidates -> per candidate:
 *   admission -> retry engine -> health update -> (success: cache + return)
 *
 * Failure handling per candidate:
 * - admission denied: next candidate, provider health untouched
 * - retryable failures exhausted / PROVIDER_REJECTED: health updated, next candidate
 * - INVALID_REQUEST: abort, no further candidates
 * - caller deadline: abort with TIMEOUT, provider not charged
 *
 * Every piece of mutable state (health, buckets, cache, stats) is owned by
 * this instance; separate clients share nothing.
 *
 * Thread safety: speak() may be called concurrently from any number of
 * threads. reload_providers() may run concurrently with speak(); in-flight
 * deliveries keep the adapters they already hold.
 */
class AvatarClient {
public:
    /**
     * @param transport Outbound HTTP used by every HTTP dialect adapter (must not be null)
     * @param sleeper Backoff sleeper override (tests)
     * @param random Jitter source override (tests)
     */
    AvatarClient(ClientOptions options, std::shared_ptr<provider::IHttpTransport> transport,
                 delivery::RetryEngine::Sleeper sleeper = delivery::RetryEngine::Sleeper(),
                 delivery::RetryEngine::RandomSource random = delivery::RetryEngine::RandomSource());

    AvatarClient(const AvatarClient &) = delete;
    AvatarClient &operator=(const AvatarClient &) = delete;

    /**
     * @brief Replace the provider set from descriptors
     *
     * Builds one adapter per descriptor, then swaps the set in. Health history
     * and rate-limit buckets survive for providers present before and after.
     * On error the previous set stays active.
     */
    bool reload_providers(const std::vector<provider::ProviderDescriptor> &descriptors, std::string &error);

    // Same as reload_providers, with ready-made adapters
    bool set_adapters(std::vector<std::shared_ptr<provider::ISpeakAdapter>> adapters, std::string &error);

    delivery::DeliveryResult speak(delivery::DeliveryRequest request);

    delivery::DeliveryResult speak(const std::string &text, const std::string &emotion, const std::string &language,
                                   std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Validation only (no provider traffic)
    bool validate_request(const delivery::DeliveryRequest &request, std::string &error) const;

    ClientStats stats() const;

    // speak() calls that have not returned yet
    uint64_t in_flight() const { return in_flight_.load(); }
    void clear_cache();

    std::vector<provider::ProviderDescriptor> descriptors() const;
    std::unordered_map<std::string, health::HealthSnapshot> health_snapshot() const;

    void set_event_emitter(const std::shared_ptr<events::EventEmitter> &emitter);

    const ClientOptions &options() const { return options_; }
    provider::ProviderRegistry &registry() { return registry_; }
    health::HealthMonitor &health_monitor() { return health_; }
    delivery::RateLimiter &rate_limiter() { return rate_limiter_; }

private:
    delivery::DeliveryResult finish(delivery::DeliveryResult result, delivery::Clock::time_point started,
                                    int providers_tried);
    void release_unused_canaries(const std::vector<delivery::Candidate> &candidates, size_t from);
    void emit_health_transition(const health::HealthTransition &transition);

    std::shared_ptr<events::EventEmitter> emitter() const;

    const ClientOptions options_;
    std::shared_ptr<provider::IHttpTransport> transport_;

    provider::ProviderRegistry registry_;
    health::HealthMonitor health_;
    delivery::RateLimiter rate_limiter_;
    std::unique_ptr<delivery::ResponseCache> cache_;  // null when caching is disabled
    delivery::RetryEngine retry_;
    delivery::ProviderSelector selector_;

    std::mutex reload_mutex_;

    mutable std::mutex emitter_mutex_;
    std::shared_ptr<events::EventEmitter> event_emitter_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> successes_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> invalid_requests_{0};
    std::atomic<uint64_t> rate_limited_{0};
    std::atomic<uint64_t> in_flight_{0};

    mutable std::mutex stats_mutex_;
    std::map<std::string, uint64_t> provider_deliveries_;
};

}  // namespace client
}  // namespace avatarlink
