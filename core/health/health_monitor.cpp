#include "health_monitor.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

#include "logging/logger.hpp"

namespace avatarlink {
namespace health {

using delivery::AttemptOutcome;
using delivery::ErrorKind;

namespace {

int64_t ms_between(HealthMonitor::Clock::time_point from, HealthMonitor::Clock::time_point to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

}  // namespace

HealthMonitor::HealthMonitor(HealthPolicy policy) : policy_(policy) {}

void HealthMonitor::set_transition_callback(TransitionCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_transition_ = std::move(callback);
}

void HealthMonitor::reconcile(const std::vector<std::string> &provider_names) {
    const std::unordered_set<std::string> live(provider_names.begin(), provider_names.end());
    const auto now = Clock::now();

    std::unique_lock<std::shared_mutex> lock(map_mutex_);

    for (auto it = records_.begin(); it != records_.end();) {
        if (live.count(it->first) == 0) {
            LOG_INFO("[Health] Dropping health record for removed provider '" << it->first << "'");
            it = records_.erase(it);
        } else {
            ++it;
        }
    }

    for (const auto &name : provider_names) {
        if (records_.count(name) == 0) {
            auto record = std::make_shared<ProviderHealth>();
            record->healthy_since = now;
            records_.emplace(name, std::move(record));
            LOG_DEBUG("[Health] Tracking provider '" << name << "'");
        }
    }
}

bool HealthMonitor::charges_provider(const AttemptOutcome &outcome) {
    if (outcome.is_success()) {
        return true;
    }
    if (outcome.cause.caller_deadline) {
        return false;
    }
    switch (outcome.cause.kind) {
        case ErrorKind::INVALID_REQUEST:
        case ErrorKind::PROVIDER_REJECTED:
        case ErrorKind::RATE_LIMITED:
        case ErrorKind::NONE:
            return false;
        default:
            return true;
    }
}

void HealthMonitor::record_outcome(const std::string &provider, const AttemptOutcome &outcome,
                                   Clock::time_point now) {
    auto record = find(provider);
    if (!record) {
        LOG_DEBUG("[Health] Ignoring outcome for unknown provider '" << provider << "'");
        return;
    }

    std::optional<HealthTransition> transition;
    {
        std::lock_guard<std::mutex> lock(record->mutex);

        if (outcome.is_success() || charges_provider(outcome)) {
            record->last_outcome = now;
            record->last_latency_ms = outcome.latency_ms;
        }

        if (outcome.is_success()) {
            transition = apply_success(provider, *record, now);
        } else if (charges_provider(outcome)) {
            transition = apply_failure(provider, *record, outcome.cause, now);
        } else {
            // The canary ran but says nothing about the provider; let the next one try
            record->canary_in_flight = false;
        }
    }

    notify(transition);
}

void HealthMonitor::record_probe(const std::string &provider, const AttemptOutcome &outcome, Clock::time_point now) {
    auto record = find(provider);
    if (!record) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(record->mutex);
        record->last_probe = now;
    }
    record_outcome(provider, outcome, now);
}

std::optional<HealthTransition> HealthMonitor::apply_success(const std::string &provider, ProviderHealth &record,
                                                             Clock::time_point now) {
    record.total_successes++;
    record.consecutive_failures = 0;
    record.consecutive_successes++;
    const bool was_trial = record.canary_in_flight || now >= record.cooldown_until;
    record.canary_in_flight = false;

    const HealthState from = record.state;

    switch (record.state) {
        case HealthState::HEALTHY:
            if (record.flap_count > 0 && ms_between(record.healthy_since, now) >= policy_.flap_reset_ms) {
                LOG_INFO("[Health] Provider '" << provider << "' stable, flap count reset");
                record.flap_count = 0;
            }
            return std::nullopt;

        case HealthState::UNHEALTHY:
            // A straggler that started before the transition does not cut the cooldown short
            if (!was_trial) {
                return std::nullopt;
            }
            record.state = HealthState::DEGRADED;
            record.cooldown_until = Clock::time_point{};
            break;

        case HealthState::DEGRADED:
            if (record.consecutive_successes >= policy_.recover_after_successes) {
                record.state = HealthState::HEALTHY;
                record.healthy_since = now;
            }
            break;
    }

    if (record.state == from) {
        return std::nullopt;
    }

    LOG_INFO("[Health] Provider '" << provider << "' " << health_state_to_string(from) << " -> "
                                   << health_state_to_string(record.state));
    return HealthTransition{provider, from, record.state, "success", record.flap_count, 0};
}

std::optional<HealthTransition> HealthMonitor::apply_failure(const std::string &provider, ProviderHealth &record,
                                                             const delivery::FailureCause &cause,
                                                             Clock::time_point now) {
    record.total_failures++;
    record.consecutive_successes = 0;
    record.consecutive_failures++;
    record.last_error = std::string(delivery::error_kind_to_string(cause.kind)) + ": " + cause.message;

    const HealthState from = record.state;
    int64_t cooldown_ms = 0;

    switch (record.state) {
        case HealthState::HEALTHY:
            if (record.consecutive_failures >= policy_.degrade_after_failures) {
                record.state = HealthState::DEGRADED;
                record.consecutive_failures = 0;
            }
            break;

        case HealthState::DEGRADED:
            if (record.consecutive_failures >= policy_.unhealthy_after_failures) {
                record.state = HealthState::UNHEALTHY;
                record.flap_count++;
                cooldown_ms = cooldown_for(record.flap_count);
                record.cooldown_until = now + std::chrono::milliseconds(cooldown_ms);
            }
            break;

        case HealthState::UNHEALTHY: {
            // A failed trial after the cooldown (canary or probe) earns a longer cooldown.
            // Stragglers that started before the transition only bump the counters.
            const bool was_trial = record.canary_in_flight || now >= record.cooldown_until;
            record.canary_in_flight = false;
            if (was_trial) {
                record.flap_count++;
                cooldown_ms = cooldown_for(record.flap_count);
                record.cooldown_until = now + std::chrono::milliseconds(cooldown_ms);
                LOG_WARN("[Health] Provider '" << provider << "' canary failed, cooling down for " << cooldown_ms
                                               << "ms (flap " << record.flap_count << ")");
            }
            return std::nullopt;
        }
    }

    if (record.state == from) {
        return std::nullopt;
    }

    if (record.state == HealthState::UNHEALTHY) {
        LOG_WARN("[Health] Provider '" << provider << "' DEGRADED -> UNHEALTHY, cooling down for " << cooldown_ms
                                       << "ms (flap " << record.flap_count << "): " << record.last_error);
    } else {
        LOG_WARN("[Health] Provider '" << provider << "' " << health_state_to_string(from) << " -> "
                                       << health_state_to_string(record.state) << ": " << record.last_error);
    }
    return HealthTransition{provider, from, record.state, record.last_error, record.flap_count, cooldown_ms};
}

int64_t HealthMonitor::cooldown_for(int flap_count) const {
    const int exponent = std::max(0, flap_count - 1);
    const double raw = static_cast<double>(policy_.cooldown_base_ms) * std::pow(policy_.cooldown_factor, exponent);
    const double capped = std::min(raw, static_cast<double>(policy_.cooldown_max_ms));
    return static_cast<int64_t>(capped);
}

std::optional<HealthState> HealthMonitor::state_of(const std::string &provider) const {
    auto record = find(provider);
    if (!record) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(record->mutex);
    return record->state;
}

bool HealthMonitor::try_claim_canary(const std::string &provider, Clock::time_point now) {
    auto record = find(provider);
    if (!record) {
        return false;
    }

    std::lock_guard<std::mutex> lock(record->mutex);

    if (record->state != HealthState::UNHEALTHY || now < record->cooldown_until) {
        return false;
    }

    if (record->canary_in_flight &&
        ms_between(record->canary_claimed_at, now) < policy_.canary_claim_timeout_ms) {
        return false;
    }

    record->canary_in_flight = true;
    record->canary_claimed_at = now;
    return true;
}

void HealthMonitor::release_canary(const std::string &provider) {
    auto record = find(provider);
    if (!record) {
        return;
    }
    std::lock_guard<std::mutex> lock(record->mutex);
    record->canary_in_flight = false;
}

std::optional<HealthSnapshot> HealthMonitor::get_snapshot(const std::string &provider, Clock::time_point now) const {
    auto record = find(provider);
    if (!record) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(record->mutex);

    HealthSnapshot snap;
    snap.state = record->state;
    snap.consecutive_failures = record->consecutive_failures;
    snap.consecutive_successes = record->consecutive_successes;
    snap.flap_count = record->flap_count;
    snap.total_successes = record->total_successes;
    snap.total_failures = record->total_failures;
    snap.canary_in_flight = record->canary_in_flight;
    snap.last_error = record->last_error;

    if (record->state == HealthState::UNHEALTHY) {
        snap.cooldown_remaining_ms = std::max<int64_t>(0, ms_between(now, record->cooldown_until));
    }
    if (record->last_probe != Clock::time_point{}) {
        snap.last_probe_ago_ms = ms_between(record->last_probe, now);
    }
    if (record->last_outcome != Clock::time_point{}) {
        snap.last_outcome_ago_ms = ms_between(record->last_outcome, now);
        snap.last_latency_ms = record->last_latency_ms;
    }
    return snap;
}

std::unordered_map<std::string, HealthSnapshot> HealthMonitor::snapshot(Clock::time_point now) const {
    std::vector<std::string> names;
    {
        std::shared_lock<std::shared_mutex> lock(map_mutex_);
        names.reserve(records_.size());
        for (const auto &[name, record] : records_) {
            static_cast<void>(record);
            names.push_back(name);
        }
    }

    std::unordered_map<std::string, HealthSnapshot> result;
    result.reserve(names.size());
    for (const auto &name : names) {
        auto snap = get_snapshot(name, now);
        if (snap) {
            result.emplace(name, std::move(*snap));
        }
    }
    return result;
}

size_t HealthMonitor::provider_count() const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    return records_.size();
}

std::shared_ptr<HealthMonitor::ProviderHealth> HealthMonitor::find(const std::string &provider) const {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto it = records_.find(provider);
    if (it == records_.end()) {
        return nullptr;
    }
    return it->second;
}

void HealthMonitor::notify(const std::optional<HealthTransition> &transition) {
    if (!transition) {
        return;
    }

    TransitionCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = on_transition_;
    }
    if (callback) {
        callback(*transition);
    }
}

}  // namespace health
}  // namespace avatarlink
