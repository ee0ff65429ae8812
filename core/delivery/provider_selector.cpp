#include "provider_selector.hpp"

#include <algorithm>
#include <iterator>

#include "logging/logger.hpp"

namespace avatarlink {
namespace delivery {

using health::HealthState;

namespace {

int priority_of(const Candidate &candidate) { return candidate.adapter->descriptor().priority; }

}  // namespace

ProviderSelector::ProviderSelector(provider::ProviderRegistry &registry, health::HealthMonitor &monitor)
    : registry_(registry), monitor_(monitor) {}

void ProviderSelector::order_tier(std::vector<Candidate> &tier, uint64_t turn) const {
    std::stable_sort(tier.begin(), tier.end(),
                     [](const Candidate &a, const Candidate &b) { return priority_of(a) > priority_of(b); });

    // Rotate each run of equal priority so ties share the load
    auto group_begin = tier.begin();
    while (group_begin != tier.end()) {
        const int priority = priority_of(*group_begin);
        auto group_end = std::find_if(group_begin, tier.end(),
                                      [priority](const Candidate &c) { return priority_of(c) != priority; });
        const auto size = static_cast<uint64_t>(std::distance(group_begin, group_end));
        if (size > 1) {
            std::rotate(group_begin, group_begin + static_cast<std::ptrdiff_t>(turn % size), group_end);
        }
        group_begin = group_end;
    }
}

std::vector<Candidate> ProviderSelector::candidates(const DeliveryRequest &request,
                                                    health::HealthMonitor::Clock::time_point now) {
    std::vector<Candidate> healthy;
    std::vector<Candidate> degraded;
    std::vector<Candidate> unhealthy;

    for (auto &adapter : registry_.get_all_providers()) {
        const auto &descriptor = adapter->descriptor();
        if (!descriptor.supports_language(request.payload.language) ||
            !descriptor.supports_emotion(request.payload.emotion)) {
            continue;
        }

        const HealthState state = monitor_.state_of(descriptor.name).value_or(HealthState::HEALTHY);
        Candidate candidate{adapter, state, false};
        switch (state) {
            case HealthState::HEALTHY:
                healthy.push_back(std::move(candidate));
                break;
            case HealthState::DEGRADED:
                degraded.push_back(std::move(candidate));
                break;
            case HealthState::UNHEALTHY:
                unhealthy.push_back(std::move(candidate));
                break;
        }
    }

    const uint64_t turn = rotation_.fetch_add(1, std::memory_order_relaxed);
    order_tier(healthy, turn);
    order_tier(degraded, turn);
    std::stable_sort(unhealthy.begin(), unhealthy.end(),
                     [](const Candidate &a, const Candidate &b) { return priority_of(a) > priority_of(b); });

    std::vector<Candidate> ordered;
    ordered.reserve(healthy.size() + degraded.size() + 1);
    std::move(healthy.begin(), healthy.end(), std::back_inserter(ordered));
    std::move(degraded.begin(), degraded.end(), std::back_inserter(ordered));

    for (auto &candidate : unhealthy) {
        if (monitor_.try_claim_canary(candidate.adapter->descriptor().name, now)) {
            candidate.canary = true;
            LOG_DEBUG("[Selector] Offering " << candidate.adapter->descriptor().name << " as canary");
            ordered.push_back(std::move(candidate));
            break;
        }
    }

    return ordered;
}

}  // namespace delivery
}  // namespace avatarlink
