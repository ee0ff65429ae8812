#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "provider/provider_descriptor.hpp"

namespace avatarlink {
namespace delivery {

/**
 * @brief Token bucket for one provider
 *
 * Refills continuously from elapsed time; no ticking thread. Tokens never
 * go negative: an acquire either takes a whole token or is denied.
 */
class TokenBucket {
public:
    using Clock = std::chrono::steady_clock;

    TokenBucket(double capacity, double refill_per_second, Clock::time_point now = Clock::now());

    bool try_acquire(Clock::time_point now = Clock::now());

    double available(Clock::time_point now = Clock::now());
    double capacity() const { return capacity_; }
    double refill_per_second() const { return refill_per_second_; }

private:
    void refill(Clock::time_point now);

    const double capacity_;
    const double refill_per_second_;

    std::mutex mutex_;
    double tokens_;
    Clock::time_point last_refill_;
};

/**
 * @brief Per-provider admission control
 *
 * Providers without an enabled policy are unlimited. Denial is local policy
 * and is never reported to the HealthMonitor.
 *
 * Each bucket has its own mutex; the bucket map is only locked exclusively
 * by reconcile().
 */
class RateLimiter {
public:
    using Clock = TokenBucket::Clock;

    RateLimiter() = default;

    RateLimiter(const RateLimiter &) = delete;
    RateLimiter &operator=(const RateLimiter &) = delete;

    /**
     * @brief Align buckets with a new provider set
     *
     * A provider whose policy is unchanged keeps its bucket (and current
     * token count); a changed policy starts a fresh, full bucket.
     */
    void reconcile(const std::vector<provider::ProviderDescriptor> &descriptors);

    bool try_acquire(const std::string &provider, Clock::time_point now = Clock::now());

    bool is_limited(const std::string &provider) const;

    // Tokens currently available; negative when the provider is unlimited
    double available(const std::string &provider, Clock::time_point now = Clock::now()) const;

private:
    struct Entry {
        provider::RateLimitPolicy policy;
        std::shared_ptr<TokenBucket> bucket;
    };

    std::shared_ptr<TokenBucket> find(const std::string &provider) const;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> buckets_;
};

}  // namespace delivery
}  // namespace avatarlink
