#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "provider/i_speak_adapter.hpp"

namespace avatarlink::tests {

using namespace avatarlink;
using namespace testing;

class MockSpeakAdapter : public provider::ISpeakAdapter {
public:
    explicit MockSpeakAdapter(provider::ProviderDescriptor descriptor) : descriptor_(std::move(descriptor)) {}

    MOCK_METHOD(delivery::AttemptOutcome, speak, (const delivery::SpeakPayload &, std::chrono::milliseconds),
                (override));
    MOCK_METHOD(delivery::AttemptOutcome, probe, (std::chrono::milliseconds), (override));

    const provider::ProviderDescriptor &descriptor() const override { return descriptor_; }

private:
    provider::ProviderDescriptor descriptor_;
};

inline provider::ProviderDescriptor make_descriptor(const std::string &name, int priority = 0) {
    provider::ProviderDescriptor descriptor;
    descriptor.name = name;
    descriptor.dialect = provider::Dialect::CANONICAL;
    descriptor.base_url = "http://" + name + ".test";
    descriptor.priority = priority;
    return descriptor;
}

inline std::shared_ptr<NiceMock<MockSpeakAdapter>> make_mock_adapter(const std::string &name, int priority = 0) {
    return std::make_shared<NiceMock<MockSpeakAdapter>>(make_descriptor(name, priority));
}

}  // namespace avatarlink::tests
