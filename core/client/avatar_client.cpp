#include "avatar_client.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include "delivery/fingerprint.hpp"
#include "events/event_emitter.hpp"
#include "logging/logger.hpp"
#include "provider/speak_adapter.hpp"

namespace avatarlink {
namespace client {

using delivery::AttemptOutcome;
using delivery::Candidate;
using delivery::DeliveryRequest;
using delivery::DeliveryResult;
using delivery::ErrorKind;
using delivery::OutcomeKind;
using delivery::ProviderOutcome;

namespace {

bool is_blank(const std::string &text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

// [A-Za-z]{2,8}(-[A-Za-z0-9]{1,8})*
bool is_language_tag(const std::string &tag) {
    std::istringstream parts(tag);
    std::string part;
    bool first = true;
    size_t consumed = 0;

    while (std::getline(parts, part, '-')) {
        consumed += part.size() + 1;
        if (first) {
            if (part.size() < 2 || part.size() > 8) return false;
            if (!std::all_of(part.begin(), part.end(), [](unsigned char c) { return std::isalpha(c) != 0; }))
                return false;
            first = false;
        } else {
            if (part.empty() || part.size() > 8) return false;
            if (!std::all_of(part.begin(), part.end(), [](unsigned char c) { return std::isalnum(c) != 0; }))
                return false;
        }
    }

    // getline swallows a trailing '-'
    return !first && consumed == tag.size() + 1;
}

int64_t elapsed_ms(delivery::Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(delivery::Clock::now() - since).count();
}

std::string summarize(const std::vector<ProviderOutcome> &outcomes) {
    std::ostringstream out;
    for (size_t i = 0; i < outcomes.size(); ++i) {
        if (i > 0) out << "; ";
        out << outcomes[i].provider << "=" << delivery::error_kind_to_string(outcomes[i].error_kind);
        if (outcomes[i].http_status != 0) out << "(" << outcomes[i].http_status << ")";
    }
    return out.str();
}

}  // namespace

AvatarClient::AvatarClient(ClientOptions options, std::shared_ptr<provider::IHttpTransport> transport,
                           delivery::RetryEngine::Sleeper sleeper, delivery::RetryEngine::RandomSource random)
    : options_(std::move(options)),
      transport_(std::move(transport)),
      health_(options_.health),
      retry_(options_.retry, std::move(sleeper), std::move(random)),
      selector_(registry_, health_) {
    if (!transport_) {
        throw std::invalid_argument("AvatarClient requires an HTTP transport");
    }

    if (options_.cache_enabled) {
        cache_ = std::make_unique<delivery::ResponseCache>(
            options_.cache_capacity, std::chrono::milliseconds(options_.cache_ttl_ms), options_.cache_shards);
    }

    health_.set_transition_callback([this](const health::HealthTransition &t) { emit_health_transition(t); });
}

bool AvatarClient::reload_providers(const std::vector<provider::ProviderDescriptor> &descriptors,
                                    std::string &error) {
    std::vector<std::shared_ptr<provider::ISpeakAdapter>> adapters;
    adapters.reserve(descriptors.size());

    for (const auto &descriptor : descriptors) {
        try {
            adapters.push_back(provider::create_speak_adapter(descriptor, transport_));
        } catch (const std::invalid_argument &e) {
            error = "Provider '" + descriptor.name + "': " + e.what();
            return false;
        }
    }

    return set_adapters(std::move(adapters), error);
}

bool AvatarClient::set_adapters(std::vector<std::shared_ptr<provider::ISpeakAdapter>> adapters, std::string &error) {
    std::lock_guard<std::mutex> lock(reload_mutex_);

    const auto previous = registry_.get_provider_names();

    std::vector<provider::ProviderDescriptor> descriptors;
    std::vector<std::string> names;
    for (const auto &adapter : adapters) {
        if (!adapter) {
            error = "Provider adapter is null";
            return false;
        }
        descriptors.push_back(adapter->descriptor());
        names.push_back(adapter->descriptor().name);
    }

    if (!registry_.replace_all(std::move(adapters), error)) {
        return false;
    }

    health_.reconcile(names);
    rate_limiter_.reconcile(descriptors);

    const std::unordered_set<std::string> before(previous.begin(), previous.end());
    const std::unordered_set<std::string> after(names.begin(), names.end());

    events::ProviderReloadEvent event{0, {}, {}, names.size(), events::now_epoch_ms()};
    for (const auto &name : names) {
        if (before.count(name) == 0) event.added.push_back(name);
    }
    for (const auto &name : previous) {
        if (after.count(name) == 0) event.removed.push_back(name);
    }

    LOG_INFO("[Client] Provider set loaded: " << names.size() << " providers (" << event.added.size() << " added, "
                                              << event.removed.size() << " removed)");

    if (auto sink = emitter()) {
        sink->emit(std::move(event));
    }
    return true;
}

bool AvatarClient::validate_request(const DeliveryRequest &request, std::string &error) const {
    const auto &payload = request.payload;

    if (payload.text.empty() || is_blank(payload.text)) {
        error = "Text must not be empty";
        return false;
    }
    if (payload.text.size() > options_.max_text_length) {
        error = "Text exceeds " + std::to_string(options_.max_text_length) + " characters";
        return false;
    }
    if (payload.emotion.empty()) {
        error = "Emotion must not be empty";
        return false;
    }
    if (payload.language.empty()) {
        error = "Language must not be empty";
        return false;
    }
    if (!is_language_tag(payload.language)) {
        error = "Malformed language tag: '" + payload.language + "'";
        return false;
    }
    if (request.deadline_passed()) {
        error = "Deadline already passed";
        return false;
    }
    return true;
}

DeliveryResult AvatarClient::speak(const std::string &text, const std::string &emotion, const std::string &language,
                                   std::optional<std::chrono::milliseconds> timeout) {
    DeliveryRequest request;
    request.payload.text = text;
    request.payload.emotion = emotion;
    request.payload.language = language;
    if (timeout) {
        request.deadline = delivery::Clock::now() + *timeout;
    }
    return speak(std::move(request));
}

DeliveryResult AvatarClient::speak(DeliveryRequest request) {
    const auto started = delivery::Clock::now();
    requests_++;
    in_flight_++;

    if (!request.deadline && options_.default_deadline_ms > 0) {
        request.deadline = started + std::chrono::milliseconds(options_.default_deadline_ms);
    }
    if (request.payload.avatar_id.empty()) {
        request.payload.avatar_id = options_.default_avatar_id;
    }

    DeliveryResult result;

    std::string error;
    if (!validate_request(request, error)) {
        invalid_requests_++;
        LOG_DEBUG("[Client] Rejected request: " << error);
        result.error_kind = ErrorKind::INVALID_REQUEST;
        result.error_message = error;
        return finish(std::move(result), started, 0);
    }

    if (request.fingerprint.empty()) {
        request.fingerprint = delivery::compute_fingerprint(request.payload);
    }
    result.fingerprint = request.fingerprint;

    if (cache_) {
        if (auto hit = cache_->get(request.fingerprint)) {
            cache_hits_++;
            result.success = true;
            result.from_cache = true;
            result.provider_used = hit->provider;
            result.response_body = hit->response_body;
            return finish(std::move(result), started, 0);
        }
    }

    const auto candidates = selector_.candidates(request);
    if (candidates.empty()) {
        LOG_WARN("[Client] No provider available for language=" << request.payload.language
                                                                << " emotion=" << request.payload.emotion);
        result.error_kind = ErrorKind::ALL_PROVIDERS_EXHAUSTED;
        result.error_message = "No eligible provider for language '" + request.payload.language + "' and emotion '" +
                               request.payload.emotion + "'";
        return finish(std::move(result), started, 0);
    }

    int attempted = 0;
    int denied = 0;

    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto &candidate = candidates[i];
        const std::string &name = candidate.adapter->descriptor().name;

        if (request.deadline_passed()) {
            release_unused_canaries(candidates, i);
            result.error_kind = ErrorKind::TIMEOUT;
            result.error_message = "Deadline expired before trying " + name;
            return finish(std::move(result), started, attempted);
        }

        if (!rate_limiter_.try_acquire(name)) {
            denied++;
            if (candidate.canary) {
                health_.release_canary(name);
            }
            LOG_DEBUG("[Client] Admission denied for " << name);
            result.provider_outcomes.push_back(ProviderOutcome{name, OutcomeKind::RETRYABLE_FAILURE,
                                                               ErrorKind::RATE_LIMITED, "admission denied", 0, 0});
            continue;
        }

        attempted++;
        const auto report = retry_.execute(*candidate.adapter, request);
        const AttemptOutcome &outcome = report.outcome;

        health_.record_outcome(name, outcome);

        result.provider_outcomes.push_back(ProviderOutcome{name, outcome.kind, outcome.cause.kind,
                                                           outcome.is_success() ? "" : outcome.cause.message,
                                                           outcome.is_success() ? outcome.http_status
                                                                                : outcome.cause.http_status,
                                                           report.attempts});

        if (outcome.is_success()) {
            release_unused_canaries(candidates, i + 1);
            if (cache_) {
                cache_->put(request.fingerprint, name, outcome.response_body);
            }
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                provider_deliveries_[name]++;
            }
            result.success = true;
            result.provider_used = name;
            result.response_body = outcome.response_body;
            return finish(std::move(result), started, attempted);
        }

        if (outcome.cause.caller_deadline) {
            release_unused_canaries(candidates, i + 1);
            result.error_kind = ErrorKind::TIMEOUT;
            result.error_message = outcome.cause.message;
            return finish(std::move(result), started, attempted);
        }

        if (outcome.cause.kind == ErrorKind::INVALID_REQUEST) {
            // Another provider would refuse the same payload
            release_unused_canaries(candidates, i + 1);
            invalid_requests_++;
            LOG_WARN("[Client] " << name << " reported an invalid request, not failing over: "
                                 << outcome.cause.message);
            result.error_kind = ErrorKind::INVALID_REQUEST;
            result.error_message = outcome.cause.message;
            return finish(std::move(result), started, attempted);
        }

        LOG_WARN("[Client] Provider " << name << " failed (" << delivery::error_kind_to_string(outcome.cause.kind)
                                      << " after " << report.attempts << " attempts), failing over");
    }

    if (attempted == 0 && denied > 0) {
        rate_limited_++;
        result.error_kind = ErrorKind::RATE_LIMITED;
        result.error_message = "All " + std::to_string(denied) + " eligible providers are at their rate limit";
    } else {
        result.error_kind = ErrorKind::ALL_PROVIDERS_EXHAUSTED;
        result.error_message = "All providers failed: " + summarize(result.provider_outcomes);
    }
    LOG_ERROR("[Client] Delivery " << request.fingerprint.substr(0, 12) << " failed: " << result.error_message);
    return finish(std::move(result), started, attempted);
}

DeliveryResult AvatarClient::finish(DeliveryResult result, delivery::Clock::time_point started, int providers_tried) {
    result.latency_ms = elapsed_ms(started);

    if (result.success) {
        successes_++;
    } else {
        failures_++;
    }
    in_flight_--;

    if (auto sink = emitter()) {
        sink->emit(events::DeliveryOutcomeEvent{0, result.fingerprint, result.provider_used, result.success,
                                                result.from_cache, delivery::error_kind_to_string(result.error_kind),
                                                result.latency_ms, providers_tried, events::now_epoch_ms()});
    }
    return result;
}

void AvatarClient::release_unused_canaries(const std::vector<Candidate> &candidates, size_t from) {
    for (size_t i = from; i < candidates.size(); ++i) {
        if (candidates[i].canary) {
            health_.release_canary(candidates[i].adapter->descriptor().name);
        }
    }
}

void AvatarClient::emit_health_transition(const health::HealthTransition &t) {
    if (auto sink = emitter()) {
        sink->emit(events::HealthTransitionEvent{0, t.provider, health::health_state_to_string(t.from),
                                                 health::health_state_to_string(t.to), t.reason, t.flap_count,
                                                 t.cooldown_ms, events::now_epoch_ms()});
    }
}

ClientStats AvatarClient::stats() const {
    ClientStats out;
    out.requests = requests_.load();
    out.cache_hits = cache_hits_.load();
    out.successes = successes_.load();
    out.failures = failures_.load();
    out.invalid_requests = invalid_requests_.load();
    out.rate_limited = rate_limited_.load();
    out.in_flight = in_flight_.load();
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        out.provider_deliveries = provider_deliveries_;
    }
    out.cache_size = cache_ ? cache_->size() : 0;
    out.provider_count = registry_.provider_count();
    return out;
}

void AvatarClient::clear_cache() {
    if (cache_) {
        cache_->clear();
        LOG_INFO("[Client] Response cache cleared");
    }
}

std::vector<provider::ProviderDescriptor> AvatarClient::descriptors() const {
    std::vector<provider::ProviderDescriptor> out;
    for (const auto &adapter : registry_.get_all_providers()) {
        out.push_back(adapter->descriptor());
    }
    return out;
}

std::unordered_map<std::string, health::HealthSnapshot> AvatarClient::health_snapshot() const {
    return health_.snapshot();
}

void AvatarClient::set_event_emitter(const std::shared_ptr<events::EventEmitter> &emitter) {
    std::lock_guard<std::mutex> lock(emitter_mutex_);
    event_emitter_ = emitter;
}

std::shared_ptr<events::EventEmitter> AvatarClient::emitter() const {
    std::lock_guard<std::mutex> lock(emitter_mutex_);
    return event_emitter_;
}

}  // namespace client
}  // namespace avatarlink
