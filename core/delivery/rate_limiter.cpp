#include "rate_limiter.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace avatarlink {
namespace delivery {

TokenBucket::TokenBucket(double capacity, double refill_per_second, Clock::time_point now)
    : capacity_(std::max(1.0, capacity)),
      refill_per_second_(std::max(0.0, refill_per_second)),
      tokens_(capacity_),
      last_refill_(now) {}

void TokenBucket::refill(Clock::time_point now) {
    if (now <= last_refill_) {
        return;
    }
    const double elapsed_s = std::chrono::duration<double>(now - last_refill_).count();
    tokens_ = std::min(capacity_, tokens_ + elapsed_s * refill_per_second_);
    last_refill_ = now;
}

bool TokenBucket::try_acquire(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    refill(now);
    if (tokens_ < 1.0) {
        return false;
    }
    tokens_ -= 1.0;
    return true;
}

double TokenBucket::available(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    refill(now);
    return tokens_;
}

void RateLimiter::reconcile(const std::vector<provider::ProviderDescriptor> &descriptors) {
    std::unordered_map<std::string, Entry> next;

    std::unique_lock<std::shared_mutex> lock(mutex_);

    for (const auto &descriptor : descriptors) {
        const auto &policy = descriptor.rate_limit;
        if (!policy.enabled) {
            continue;
        }

        auto it = buckets_.find(descriptor.name);
        if (it != buckets_.end() && it->second.policy == policy) {
            next.emplace(descriptor.name, it->second);
            continue;
        }

        // burst 0 means "one second worth of requests"
        const double capacity = policy.burst > 0.0 ? policy.burst : policy.requests_per_second;
        next.emplace(descriptor.name,
                     Entry{policy, std::make_shared<TokenBucket>(capacity, policy.requests_per_second)});
        LOG_DEBUG("[RateLimiter] " << descriptor.name << ": " << policy.requests_per_second << " req/s, burst "
                                   << capacity);
    }

    buckets_ = std::move(next);
}

std::shared_ptr<TokenBucket> RateLimiter::find(const std::string &provider) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = buckets_.find(provider);
    if (it == buckets_.end()) {
        return nullptr;
    }
    return it->second.bucket;
}

bool RateLimiter::try_acquire(const std::string &provider, Clock::time_point now) {
    auto bucket = find(provider);
    if (!bucket) {
        return true;
    }
    return bucket->try_acquire(now);
}

bool RateLimiter::is_limited(const std::string &provider) const { return find(provider) != nullptr; }

double RateLimiter::available(const std::string &provider, Clock::time_point now) const {
    auto bucket = find(provider);
    if (!bucket) {
        return -1.0;
    }
    return bucket->available(now);
}

}  // namespace delivery
}  // namespace avatarlink
