#pragma once

/**
 * @file speak_adapter.hpp
 * @brief Dialect adapters for provider speak endpoints
 *
 * Every provider is reached through ISpeakAdapter. The adapter class is
 * chosen from ProviderDescriptor::dialect by create_speak_adapter():
 * - canonical / duix / sense_avatar / akool -> HttpSpeakAdapter (wire shape per dialect)
 * - mock                                   -> MockSpeakAdapter (no network)
 *
 * Response classification is shared by all HTTP dialects:
 *   2xx                  -> SUCCESS
 *   408                  -> RETRYABLE TIMEOUT
 *   429, 5xx             -> RETRYABLE PROVIDER_SERVER_ERROR
 *   400, 401, 403, 422   -> FATAL INVALID_REQUEST (caller defect, no failover)
 *   other 4xx            -> FATAL PROVIDER_REJECTED (fail over)
 *   transport timeout    -> RETRYABLE TIMEOUT
 *   connection failure   -> RETRYABLE TRANSPORT_ERROR
 */

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "provider/http_transport.hpp"
#include "provider/i_speak_adapter.hpp"

namespace avatarlink {
namespace provider {

struct WireRequest {
    std::string path;
    HeaderList headers;
    nlohmann::json body;
};

std::string default_speak_path(Dialect dialect);

// Maps the standard emotion vocabulary onto a dialect's own. Unknown -> dialect neutral.
std::string map_emotion(Dialect dialect, const std::string &emotion);

WireRequest build_wire_request(const ProviderDescriptor &descriptor, const delivery::SpeakPayload &payload);

delivery::AttemptOutcome classify_response(const TransportResponse &response);

class HttpSpeakAdapter : public ISpeakAdapter {
public:
    HttpSpeakAdapter(ProviderDescriptor descriptor, std::shared_ptr<IHttpTransport> transport);

    delivery::AttemptOutcome speak(const delivery::SpeakPayload &payload, std::chrono::milliseconds timeout) override;
    delivery::AttemptOutcome probe(std::chrono::milliseconds timeout) override;

    const ProviderDescriptor &descriptor() const override { return descriptor_; }

private:
    const ProviderDescriptor descriptor_;
    std::shared_ptr<IHttpTransport> transport_;
};

// In-process provider for local development and demos. Always succeeds.
class MockSpeakAdapter : public ISpeakAdapter {
public:
    explicit MockSpeakAdapter(ProviderDescriptor descriptor) : descriptor_(std::move(descriptor)) {}

    delivery::AttemptOutcome speak(const delivery::SpeakPayload &payload, std::chrono::milliseconds timeout) override;
    delivery::AttemptOutcome probe(std::chrono::milliseconds timeout) override;

    const ProviderDescriptor &descriptor() const override { return descriptor_; }

private:
    const ProviderDescriptor descriptor_;
};

std::shared_ptr<ISpeakAdapter> create_speak_adapter(const ProviderDescriptor &descriptor,
                                                    std::shared_ptr<IHttpTransport> transport);

}  // namespace provider
}  // namespace avatarlink
