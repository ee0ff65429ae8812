#pragma once

/**
 * @file delivery_types.hpp
 * @brief Value types shared by the delivery pipeline
 *
 * Outcomes are plain values: a provider attempt never throws, it produces an
 * AttemptOutcome. The façade folds attempt outcomes into a DeliveryResult.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace avatarlink {
namespace delivery {

/**
 * @brief Error taxonomy for delivery failures
 *
 * - TIMEOUT, TRANSPORT_ERROR, PROVIDER_SERVER_ERROR: retryable on the same
 *   provider, fail over once attempts are exhausted
 * - PROVIDER_REJECTED: payload refused by one provider; fail over, no retry
 * - INVALID_REQUEST: caller defect; never retried, never failed over
 * - RATE_LIMITED: local admission denied; immediate failover
 * - ALL_PROVIDERS_EXHAUSTED: terminal, carries per-provider outcomes
 */
enum class ErrorKind {
    NONE,
    TIMEOUT,
    TRANSPORT_ERROR,
    PROVIDER_SERVER_ERROR,
    PROVIDER_REJECTED,
    INVALID_REQUEST,
    RATE_LIMITED,
    ALL_PROVIDERS_EXHAUSTED
};

inline const char *error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:
            return "NONE";
        case ErrorKind::TIMEOUT:
            return "TIMEOUT";
        case ErrorKind::TRANSPORT_ERROR:
            return "TRANSPORT_ERROR";
        case ErrorKind::PROVIDER_SERVER_ERROR:
            return "PROVIDER_SERVER_ERROR";
        case ErrorKind::PROVIDER_REJECTED:
            return "PROVIDER_REJECTED";
        case ErrorKind::INVALID_REQUEST:
            return "INVALID_REQUEST";
        case ErrorKind::RATE_LIMITED:
            return "RATE_LIMITED";
        case ErrorKind::ALL_PROVIDERS_EXHAUSTED:
            return "ALL_PROVIDERS_EXHAUSTED";
    }
    return "NONE";
}

enum class OutcomeKind { SUCCESS, RETRYABLE_FAILURE, FATAL_FAILURE };

inline const char *outcome_kind_to_string(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::SUCCESS:
            return "SUCCESS";
        case OutcomeKind::RETRYABLE_FAILURE:
            return "RETRYABLE_FAILURE";
        case OutcomeKind::FATAL_FAILURE:
            return "FATAL_FAILURE";
    }
    return "FATAL_FAILURE";
}

struct FailureCause {
    ErrorKind kind = ErrorKind::NONE;
    std::string message;
    int http_status = 0;           // 0 when no HTTP response was received
    bool caller_deadline = false;  // TIMEOUT caused by the caller's own deadline
};

// Result of a single attempt against a single provider
struct AttemptOutcome {
    OutcomeKind kind = OutcomeKind::FATAL_FAILURE;
    std::string response_body;  // SUCCESS only
    int http_status = 0;        // SUCCESS only
    FailureCause cause;         // failures only
    int64_t latency_ms = 0;     // wall time of the call, stamped by the caller

    bool is_success() const { return kind == OutcomeKind::SUCCESS; }
    bool is_retryable() const { return kind == OutcomeKind::RETRYABLE_FAILURE; }
    bool is_fatal() const { return kind == OutcomeKind::FATAL_FAILURE; }

    static AttemptOutcome success(std::string body, int status = 200) {
        AttemptOutcome outcome;
        outcome.kind = OutcomeKind::SUCCESS;
        outcome.response_body = std::move(body);
        outcome.http_status = status;
        return outcome;
    }

    static AttemptOutcome retryable(ErrorKind kind, std::string message, int status = 0) {
        AttemptOutcome outcome;
        outcome.kind = OutcomeKind::RETRYABLE_FAILURE;
        outcome.cause = FailureCause{kind, std::move(message), status, false};
        return outcome;
    }

    static AttemptOutcome fatal(ErrorKind kind, std::string message, int status = 0) {
        AttemptOutcome outcome;
        outcome.kind = OutcomeKind::FATAL_FAILURE;
        outcome.cause = FailureCause{kind, std::move(message), status, false};
        return outcome;
    }

    // The caller's deadline expired; not the provider's fault.
    static AttemptOutcome deadline_exceeded(std::string message) {
        AttemptOutcome outcome;
        outcome.kind = OutcomeKind::FATAL_FAILURE;
        outcome.cause = FailureCause{ErrorKind::TIMEOUT, std::move(message), 0, true};
        return outcome;
    }
};

// What gets spoken. avatar_id, voice_id and gesture are forwarded to dialects that use them.
struct SpeakPayload {
    std::string text;
    std::string emotion = "neutral";
    std::string language = "en";
    std::string avatar_id;
    std::string voice_id;  // optional, empty = provider default
    std::string gesture;   // optional
};

using Clock = std::chrono::steady_clock;

struct DeliveryRequest {
    SpeakPayload payload;
    std::string fingerprint;              // filled by the client when empty
    std::optional<Clock::time_point> deadline;

    // Remaining budget before the deadline; nullopt when no deadline is set.
    std::optional<std::chrono::milliseconds> remaining(Clock::time_point now = Clock::now()) const {
        if (!deadline) {
            return std::nullopt;
        }
        if (*deadline <= now) {
            return std::chrono::milliseconds(0);
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now);
    }

    bool deadline_passed(Clock::time_point now = Clock::now()) const { return deadline && *deadline <= now; }
};

// Final outcome on one provider tried during a delivery
struct ProviderOutcome {
    std::string provider;
    OutcomeKind kind = OutcomeKind::FATAL_FAILURE;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string message;
    int http_status = 0;
    int attempts = 0;  // 0 when admission was denied
};

struct DeliveryResult {
    bool success = false;
    std::string fingerprint;
    std::string provider_used;
    std::string response_body;
    bool from_cache = false;
    int64_t latency_ms = 0;

    ErrorKind error_kind = ErrorKind::NONE;
    std::string error_message;
    std::vector<ProviderOutcome> provider_outcomes;

    // "Try again later" as opposed to "fix the request"
    bool retry_later() const {
        return !success && error_kind != ErrorKind::INVALID_REQUEST && error_kind != ErrorKind::NONE;
    }
};

}  // namespace delivery
}  // namespace avatarlink
