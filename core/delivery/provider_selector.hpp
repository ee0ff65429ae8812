#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "delivery/delivery_types.hpp"
#include "health/health_monitor.hpp"
#include "provider/provider_registry.hpp"

namespace avatarlink {
namespace delivery {

struct Candidate {
    std::shared_ptr<provider::ISpeakAdapter> adapter;
    health::HealthState state = health::HealthState::HEALTHY;
    bool canary = false;  // holds the monitor's canary claim; release it if not attempted
};

/**
 * @brief Orders providers for one delivery
 *
 * 1. Drop providers that do not declare the request's language or emotion.
 * 2. HEALTHY tier, then DEGRADED tier, then at most one UNHEALTHY canary
 *    (only after its cooldown, claimed through HealthMonitor::try_claim_canary).
 * 3. Within a tier, higher priority first; providers tied on tier and
 *    priority are rotated round-robin across calls.
 *
 * UNHEALTHY providers still cooling down never appear.
 */
class ProviderSelector {
public:
    ProviderSelector(provider::ProviderRegistry &registry, health::HealthMonitor &monitor);

    std::vector<Candidate> candidates(const DeliveryRequest &request,
                                      health::HealthMonitor::Clock::time_point now = health::HealthMonitor::Clock::now());

private:
    void order_tier(std::vector<Candidate> &tier, uint64_t turn) const;

    provider::ProviderRegistry &registry_;
    health::HealthMonitor &monitor_;
    std::atomic<uint64_t> rotation_{0};
};

}  // namespace delivery
}  // namespace avatarlink
