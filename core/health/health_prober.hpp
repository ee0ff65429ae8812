#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <random>
#include <thread>

#include "health/health_monitor.hpp"
#include "provider/provider_registry.hpp"

namespace avatarlink {
namespace health {

struct ProbeConfig {
    bool enabled = true;
    int interval_ms = 10000;
    int jitter_ms = 2000;  // each sleep is interval +/- uniform(0, jitter)
    int timeout_ms = 2000;
};

/**
 * @brief Background liveness checks for providers out of rotation
 *
 * Each cycle probes every DEGRADED provider, and every UNHEALTHY provider
 * whose cooldown has elapsed (through the monitor's canary slot, so a probe
 * and a live canary request never run at once). Probe outcomes feed the
 * HealthMonitor like any other outcome. HEALTHY providers are not probed.
 *
 * Probes run on the prober's own thread; speak() callers never wait on them.
 */
class HealthProber {
public:
    HealthProber(provider::ProviderRegistry &registry, HealthMonitor &monitor, ProbeConfig config);
    ~HealthProber();

    HealthProber(const HealthProber &) = delete;
    HealthProber &operator=(const HealthProber &) = delete;

    // Start probe thread. No-op when disabled or already running.
    void start();

    // Stop and join. Safe to call more than once.
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * @brief Run a single probe cycle on the calling thread
     *
     * @return Number of providers probed
     */
    int probe_once(HealthMonitor::Clock::time_point now = HealthMonitor::Clock::now());

    // Next sleep duration, jitter included
    std::chrono::milliseconds next_interval();

private:
    void run();

    provider::ProviderRegistry &registry_;
    HealthMonitor &monitor_;
    const ProbeConfig config_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

}  // namespace health
}  // namespace avatarlink
