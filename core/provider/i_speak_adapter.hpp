#pragma once

#include <chrono>
#include <string>

#include "delivery/delivery_types.hpp"
#include "provider/provider_descriptor.hpp"

namespace avatarlink {
namespace provider {

// Interface for a provider's speak endpoint to enable mocking
class ISpeakAdapter {
public:
    virtual ~ISpeakAdapter() = default;

    // One delivery attempt. Never throws for provider-side problems;
    // everything is reported through the returned outcome.
    virtual delivery::AttemptOutcome speak(const delivery::SpeakPayload &payload, std::chrono::milliseconds timeout) = 0;

    // Lightweight liveness check used by the background prober
    virtual delivery::AttemptOutcome probe(std::chrono::milliseconds timeout) = 0;

    virtual const ProviderDescriptor &descriptor() const = 0;
};

}  // namespace provider
}  // namespace avatarlink
