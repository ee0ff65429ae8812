#include "retry_engine.hpp"

#include <algorithm>
#include <thread>

#include "logging/logger.hpp"

namespace avatarlink {
namespace delivery {

RetryEngine::RetryEngine(RetryPolicy policy, Sleeper sleeper, RandomSource random)
    : policy_(policy), sleeper_(std::move(sleeper)), random_(std::move(random)), rng_(std::random_device{}()) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

std::chrono::milliseconds RetryEngine::backoff_cap(int attempt) const {
    if (attempt < 1 || policy_.base_delay_ms <= 0) {
        return std::chrono::milliseconds(0);
    }

    // Doubling stops as soon as the cap is reached, so the shift never overflows
    int64_t delay = policy_.base_delay_ms;
    for (int i = 1; i < attempt && delay < policy_.max_delay_ms; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min<int64_t>(delay, policy_.max_delay_ms));
}

std::chrono::milliseconds RetryEngine::next_delay(int attempt) {
    const auto cap = backoff_cap(attempt);
    if (cap.count() <= 0) {
        return std::chrono::milliseconds(0);
    }

    double fraction = 0.0;
    if (random_) {
        fraction = random_();
    } else {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        fraction = std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
    }
    fraction = std::clamp(fraction, 0.0, 1.0);

    return std::chrono::milliseconds(static_cast<int64_t>(fraction * static_cast<double>(cap.count())));
}

RetryReport RetryEngine::execute(provider::ISpeakAdapter &adapter, const DeliveryRequest &request) {
    const auto &descriptor = adapter.descriptor();
    const auto provider_timeout = std::chrono::milliseconds(descriptor.timeout_ms);
    const int max_attempts = std::max(1, policy_.max_attempts);

    RetryReport report;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        auto timeout = provider_timeout;
        bool clamped = false;
        if (auto remaining = request.remaining()) {
            if (remaining->count() <= 0) {
                report.outcome = AttemptOutcome::deadline_exceeded("Deadline expired before attempt " +
                                                                   std::to_string(attempt) + " on " + descriptor.name);
                return report;
            }
            if (*remaining < timeout) {
                timeout = *remaining;
                clamped = true;
            }
        }

        report.attempts = attempt;
        const auto attempt_started = Clock::now();
        report.outcome = adapter.speak(request.payload, timeout);
        report.outcome.latency_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - attempt_started).count();

        if (report.outcome.is_success()) {
            if (attempt > 1) {
                LOG_INFO("[Retry] " << descriptor.name << " succeeded on attempt " << attempt << "/" << max_attempts);
            }
            return report;
        }

        // A timeout cut short by the caller's own budget is not the provider's fault
        if (clamped && report.outcome.cause.kind == ErrorKind::TIMEOUT && request.deadline_passed()) {
            report.outcome = AttemptOutcome::deadline_exceeded("Deadline expired during attempt " +
                                                               std::to_string(attempt) + " on " + descriptor.name);
            return report;
        }

        if (report.outcome.is_fatal()) {
            LOG_DEBUG("[Retry] " << descriptor.name << " attempt " << attempt << " fatal: "
                                 << error_kind_to_string(report.outcome.cause.kind));
            return report;
        }

        LOG_WARN("[Retry] Provider " << descriptor.name << " attempt " << attempt << "/" << max_attempts
                                     << " failed: " << error_kind_to_string(report.outcome.cause.kind) << " "
                                     << report.outcome.cause.message);

        if (attempt == max_attempts) {
            break;
        }

        const auto delay = next_delay(attempt);
        if (auto remaining = request.remaining()) {
            if (*remaining <= delay) {
                report.outcome = AttemptOutcome::deadline_exceeded("Deadline would expire during backoff on " +
                                                                   descriptor.name);
                return report;
            }
        }

        if (delay.count() > 0) {
            sleeper_(delay);
        }
        report.delays.push_back(delay);
    }

    return report;
}

}  // namespace delivery
}  // namespace avatarlink
