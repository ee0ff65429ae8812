#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <random>
#include <vector>

#include "delivery/delivery_types.hpp"
#include "provider/i_speak_adapter.hpp"

namespace avatarlink {
namespace delivery {

struct RetryPolicy {
    int max_attempts = 3;  // per provider, first attempt included
    int base_delay_ms = 200;
    int max_delay_ms = 5000;
};

struct RetryReport {
    AttemptOutcome outcome;  // final outcome on this provider
    int attempts = 0;
    std::vector<std::chrono::milliseconds> delays;  // backoff actually slept, in order
};

/**
 * @brief Bounded retries against a single provider
 *
 * Retryable outcomes are retried with full-jitter exponential backoff:
 *   delay(n) = uniform(0, min(base * 2^(n-1), cap))
 * Fatal outcomes end the run immediately.
 *
 * With a caller deadline, each attempt's HTTP timeout is clamped to the
 * remaining budget, and a backoff that would outlive the deadline is not
 * started. Either way the run ends with AttemptOutcome::deadline_exceeded
 * (caller_deadline = true), which is never charged to the provider.
 *
 * The sleeper and random source are injectable so tests run instantly.
 * The engine holds no lock while calling the adapter or sleeping.
 */
class RetryEngine {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using RandomSource = std::function<double()>;  // uniform in [0, 1)

    explicit RetryEngine(RetryPolicy policy, Sleeper sleeper = Sleeper(), RandomSource random = RandomSource());

    RetryReport execute(provider::ISpeakAdapter &adapter, const DeliveryRequest &request);

    // Upper bound of the backoff after failed attempt n (1-based)
    std::chrono::milliseconds backoff_cap(int attempt) const;

    // Jittered delay after failed attempt n
    std::chrono::milliseconds next_delay(int attempt);

    const RetryPolicy &policy() const { return policy_; }

private:
    const RetryPolicy policy_;
    Sleeper sleeper_;
    RandomSource random_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

}  // namespace delivery
}  // namespace avatarlink
