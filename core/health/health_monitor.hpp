#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "delivery/delivery_types.hpp"

namespace avatarlink {
namespace health {

enum class HealthState { HEALTHY, DEGRADED, UNHEALTHY };

inline const char *health_state_to_string(HealthState state) {
    switch (state) {
        case HealthState::HEALTHY:
            return "HEALTHY";
        case HealthState::DEGRADED:
            return "DEGRADED";
        case HealthState::UNHEALTHY:
            return "UNHEALTHY";
    }
    return "UNHEALTHY";
}

struct HealthPolicy {
    int degrade_after_failures = 3;     // K: HEALTHY -> DEGRADED
    int unhealthy_after_failures = 2;   // M: DEGRADED -> UNHEALTHY
    int recover_after_successes = 2;    // N: -> HEALTHY
    int64_t cooldown_base_ms = 5000;    // first UNHEALTHY cooldown
    int64_t cooldown_max_ms = 300000;
    double cooldown_factor = 2.0;       // growth per flap
    int64_t flap_reset_ms = 600000;     // stable HEALTHY period that forgives past flaps
    int64_t canary_claim_timeout_ms = 30000;
};

// Immutable copy of one provider's health record, safe to hand across threads.
struct HealthSnapshot {
    HealthState state = HealthState::HEALTHY;
    int consecutive_failures = 0;
    int consecutive_successes = 0;
    int flap_count = 0;
    uint64_t total_successes = 0;
    uint64_t total_failures = 0;
    bool canary_in_flight = false;
    std::optional<int64_t> cooldown_remaining_ms;  // nullopt unless UNHEALTHY
    std::optional<int64_t> last_probe_ago_ms;      // nullopt if never probed
    std::optional<int64_t> last_outcome_ago_ms;    // nullopt until a charged outcome or success
    std::optional<int64_t> last_latency_ms;        // latency of that outcome
    std::string last_error;
};

struct HealthTransition {
    std::string provider;
    HealthState from;
    HealthState to;
    std::string reason;
    int flap_count;
    int64_t cooldown_ms;
};

/**
 * @brief Per-provider health state machine
 *
 * HEALTHY --K failures--> DEGRADED --M failures--> UNHEALTHY (cooldown starts)
 * DEGRADED --N successes--> HEALTHY
 * UNHEALTHY --success--> DEGRADED (never straight to HEALTHY)
 *
 * The UNHEALTHY cooldown is cooldown_base_ms * cooldown_factor^(flaps-1),
 * capped at cooldown_max_ms. Once it elapses, exactly one caller may claim
 * the provider as a canary via try_claim_canary(); a failed canary re-arms
 * a longer cooldown.
 *
 * Outcomes that reflect local policy or the caller rather than the provider
 * (INVALID_REQUEST, PROVIDER_REJECTED, RATE_LIMITED, caller deadline) are
 * not charged.
 *
 * Thread safety: each record has its own mutex; the map itself is guarded
 * by a shared_mutex that is only taken exclusively by reconcile(). The
 * transition callback is invoked after the record lock is released.
 */
class HealthMonitor {
public:
    using Clock = std::chrono::steady_clock;
    using TransitionCallback = std::function<void(const HealthTransition &)>;

    explicit HealthMonitor(HealthPolicy policy = HealthPolicy{});

    HealthMonitor(const HealthMonitor &) = delete;
    HealthMonitor &operator=(const HealthMonitor &) = delete;

    const HealthPolicy &policy() const { return policy_; }

    void set_transition_callback(TransitionCallback callback);

    /**
     * @brief Align records with the live provider set
     *
     * Adds HEALTHY records for new names, drops records for absent names and
     * leaves surviving records untouched.
     */
    void reconcile(const std::vector<std::string> &provider_names);

    void record_outcome(const std::string &provider, const delivery::AttemptOutcome &outcome,
                        Clock::time_point now = Clock::now());

    // Same as record_outcome, and stamps the last-probe time
    void record_probe(const std::string &provider, const delivery::AttemptOutcome &outcome,
                      Clock::time_point now = Clock::now());

    std::optional<HealthState> state_of(const std::string &provider) const;

    /**
     * @brief Claim the single canary slot of a cooled-down UNHEALTHY provider
     *
     * @return true if the caller now owns the canary attempt
     */
    bool try_claim_canary(const std::string &provider, Clock::time_point now = Clock::now());

    // Give back a claimed canary that was never attempted
    void release_canary(const std::string &provider);

    std::optional<HealthSnapshot> get_snapshot(const std::string &provider, Clock::time_point now = Clock::now()) const;

    std::unordered_map<std::string, HealthSnapshot> snapshot(Clock::time_point now = Clock::now()) const;

    size_t provider_count() const;

    static bool charges_provider(const delivery::AttemptOutcome &outcome);

private:
    struct ProviderHealth {
        mutable std::mutex mutex;
        HealthState state = HealthState::HEALTHY;
        int consecutive_failures = 0;
        int consecutive_successes = 0;
        int flap_count = 0;
        uint64_t total_successes = 0;
        uint64_t total_failures = 0;
        Clock::time_point cooldown_until{};
        Clock::time_point healthy_since{};
        Clock::time_point last_probe{};
        Clock::time_point last_outcome{};
        int64_t last_latency_ms = 0;
        bool canary_in_flight = false;
        Clock::time_point canary_claimed_at{};
        std::string last_error;
    };

    std::shared_ptr<ProviderHealth> find(const std::string &provider) const;

    std::optional<HealthTransition> apply_success(const std::string &provider, ProviderHealth &record,
                                                  Clock::time_point now);
    std::optional<HealthTransition> apply_failure(const std::string &provider, ProviderHealth &record,
                                                  const delivery::FailureCause &cause, Clock::time_point now);

    int64_t cooldown_for(int flap_count) const;
    void notify(const std::optional<HealthTransition> &transition);

    const HealthPolicy policy_;

    mutable std::shared_mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<ProviderHealth>> records_;

    std::mutex callback_mutex_;
    TransitionCallback on_transition_;
};

}  // namespace health
}  // namespace avatarlink
