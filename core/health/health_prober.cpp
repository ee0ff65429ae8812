#include "health_prober.hpp"

#include <algorithm>
#include <chrono>

#include "logging/logger.hpp"

namespace avatarlink {
namespace health {

HealthProber::HealthProber(provider::ProviderRegistry &registry, HealthMonitor &monitor, ProbeConfig config)
    : registry_(registry), monitor_(monitor), config_(config), rng_(std::random_device{}()) {}

HealthProber::~HealthProber() { stop(); }

void HealthProber::start() {
    if (!config_.enabled) {
        LOG_INFO("[Prober] Active health probing disabled");
        return;
    }
    if (running_.exchange(true)) {
        return;
    }

    thread_ = std::thread(&HealthProber::run, this);
    LOG_INFO("[Prober] Started (interval=" << config_.interval_ms << "ms, jitter=" << config_.jitter_ms << "ms)");
}

void HealthProber::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO("[Prober] Stopped");
}

std::chrono::milliseconds HealthProber::next_interval() {
    int jitter = 0;
    if (config_.jitter_ms > 0) {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        std::uniform_int_distribution<int> dist(-config_.jitter_ms, config_.jitter_ms);
        jitter = dist(rng_);
    }
    return std::chrono::milliseconds(std::max(1, config_.interval_ms + jitter));
}

int HealthProber::probe_once(HealthMonitor::Clock::time_point now) {
    const auto timeout = std::chrono::milliseconds(config_.timeout_ms);
    int probed = 0;

    for (const auto &adapter : registry_.get_all_providers()) {
        const std::string &name = adapter->descriptor().name;
        auto state = monitor_.state_of(name);
        if (!state || *state == HealthState::HEALTHY) {
            continue;
        }

        if (*state == HealthState::UNHEALTHY && !monitor_.try_claim_canary(name, now)) {
            continue;  // still cooling down, or a live canary owns the slot
        }

        const auto probe_started = HealthMonitor::Clock::now();
        auto outcome = adapter->probe(timeout);
        const auto probe_latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                                       HealthMonitor::Clock::now() - probe_started)
                                       .count();
        if (!outcome.is_success() && !HealthMonitor::charges_provider(outcome)) {
            // Any non-2xx liveness answer means "not alive", whatever it would mean for a speak call
            outcome = delivery::AttemptOutcome::retryable(delivery::ErrorKind::PROVIDER_SERVER_ERROR,
                                                          "probe failed: " + outcome.cause.message,
                                                          outcome.cause.http_status);
        }
        outcome.latency_ms = probe_latency;
        LOG_DEBUG("[Prober] " << name << " (" << health_state_to_string(*state)
                              << "): " << delivery::outcome_kind_to_string(outcome.kind));

        monitor_.record_probe(name, outcome, HealthMonitor::Clock::now());
        probed++;
    }

    return probed;
}

void HealthProber::run() {
    while (running_.load()) {
        const auto wait = next_interval();
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, wait, [this] { return !running_.load(); });
        }
        if (!running_.load()) {
            break;
        }

        probe_once();
    }
}

}  // namespace health
}  // namespace avatarlink
