/**
 * speak_adapter_test.cpp - Dialect wire shapes and response classification
 */

#include "provider/speak_adapter.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "mocks/mock_http_transport.hpp"

using namespace avatarlink;
using namespace avatarlink::provider;
using namespace avatarlink::tests;
using delivery::ErrorKind;
using delivery::SpeakPayload;
using namespace testing;
using namespace std::chrono_literals;

namespace {

ProviderDescriptor descriptor_for(Dialect dialect, const std::string &credential = "secret") {
    ProviderDescriptor d;
    d.name = dialect_to_string(dialect);
    d.dialect = dialect;
    d.base_url = "https://avatar.example";
    d.credential = credential;
    return d;
}

SpeakPayload sample_payload() {
    SpeakPayload p;
    p.text = "Hello there";
    p.emotion = "happy";
    p.language = "en";
    p.avatar_id = "av-7";
    return p;
}

std::string header_value(const HeaderList &headers, const std::string &name) {
    auto it = std::find_if(headers.begin(), headers.end(), [&](const auto &h) { return h.first == name; });
    return it == headers.end() ? "" : it->second;
}

}  // namespace

// ============================================================================
// Wire shapes
// ============================================================================

TEST(SpeakAdapterTest, DuixWireShape) {
    WireRequest wire = build_wire_request(descriptor_for(Dialect::DUIX), sample_payload());

    EXPECT_EQ(wire.path, "/v1/avatar/speak");
    EXPECT_EQ(header_value(wire.headers, "Authorization"), "Bearer secret");
    EXPECT_EQ(wire.body["avatar_id"], "av-7");
    EXPECT_EQ(wire.body["text"], "Hello there");
    EXPECT_EQ(wire.body["emotion"], "joy");
    EXPECT_EQ(wire.body["language"], "en");
}

TEST(SpeakAdapterTest, SenseAvatarWireShape) {
    WireRequest wire = build_wire_request(descriptor_for(Dialect::SENSE_AVATAR), sample_payload());

    EXPECT_EQ(wire.path, "/v1/speak");
    EXPECT_EQ(header_value(wire.headers, "X-API-Key"), "secret");
    EXPECT_EQ(header_value(wire.headers, "Authorization"), "");
    EXPECT_EQ(wire.body["avatar"], "av-7");
    EXPECT_EQ(wire.body["lang"], "en");
    EXPECT_EQ(wire.body["emotion"], "happy");
}

TEST(SpeakAdapterTest, AkoolWireShape) {
    WireRequest wire = build_wire_request(descriptor_for(Dialect::AKOOL), sample_payload());

    EXPECT_EQ(wire.body["input_text"], "Hello there");
    EXPECT_FALSE(wire.body.contains("text"));
    EXPECT_EQ(header_value(wire.headers, "Authorization"), "Bearer secret");
}

TEST(SpeakAdapterTest, CanonicalWithoutCredentialSendsNoAuthHeader) {
    WireRequest wire = build_wire_request(descriptor_for(Dialect::CANONICAL, ""), sample_payload());

    EXPECT_EQ(wire.path, "/speak");
    EXPECT_EQ(header_value(wire.headers, "Authorization"), "");
    EXPECT_EQ(wire.body["emotion"], "happy");
}

TEST(SpeakAdapterTest, ConfiguredSpeakPathOverridesDialectDefault) {
    ProviderDescriptor d = descriptor_for(Dialect::DUIX);
    d.speak_path = "/custom/say";
    EXPECT_EQ(build_wire_request(d, sample_payload()).path, "/custom/say");
}

TEST(SpeakAdapterTest, OptionalFieldsOnlyWhenSet) {
    SpeakPayload p = sample_payload();
    WireRequest without = build_wire_request(descriptor_for(Dialect::CANONICAL), p);
    EXPECT_FALSE(without.body.contains("voice_id"));
    EXPECT_FALSE(without.body.contains("gesture"));

    p.voice_id = "warm-1";
    p.gesture = "wave";
    WireRequest with = build_wire_request(descriptor_for(Dialect::CANONICAL), p);
    EXPECT_EQ(with.body["voice_id"], "warm-1");
    EXPECT_EQ(with.body["gesture"], "wave");
}

TEST(SpeakAdapterTest, UnknownEmotionFallsBackToDialectNeutral) {
    EXPECT_EQ(map_emotion(Dialect::DUIX, "melancholic"), "neutral");
    EXPECT_EQ(map_emotion(Dialect::SENSE_AVATAR, "melancholic"), "normal");
    EXPECT_EQ(map_emotion(Dialect::CANONICAL, "melancholic"), "melancholic");
}

// ============================================================================
// Classification
// ============================================================================

TEST(SpeakAdapterTest, ClassifySuccess) {
    auto outcome = classify_response(http_response(201, R"({"ok":true})"));
    EXPECT_TRUE(outcome.is_success());
    EXPECT_EQ(outcome.http_status, 201);
    EXPECT_EQ(outcome.response_body, R"({"ok":true})");
}

TEST(SpeakAdapterTest, ClassifyRetryableStatuses) {
    auto timeout = classify_response(http_response(408));
    EXPECT_TRUE(timeout.is_retryable());
    EXPECT_EQ(timeout.cause.kind, ErrorKind::TIMEOUT);

    for (int status : {429, 500, 502, 503, 504}) {
        auto outcome = classify_response(http_response(status));
        EXPECT_TRUE(outcome.is_retryable()) << status;
        EXPECT_EQ(outcome.cause.kind, ErrorKind::PROVIDER_SERVER_ERROR) << status;
        EXPECT_EQ(outcome.cause.http_status, status);
    }
}

TEST(SpeakAdapterTest, ClassifyCallerDefects) {
    for (int status : {400, 401, 403, 422}) {
        auto outcome = classify_response(http_response(status));
        EXPECT_TRUE(outcome.is_fatal()) << status;
        EXPECT_EQ(outcome.cause.kind, ErrorKind::INVALID_REQUEST) << status;
    }
}

TEST(SpeakAdapterTest, ClassifyProviderRejections) {
    for (int status : {404, 409, 413, 302}) {
        auto outcome = classify_response(http_response(status));
        EXPECT_TRUE(outcome.is_fatal()) << status;
        EXPECT_EQ(outcome.cause.kind, ErrorKind::PROVIDER_REJECTED) << status;
    }
}

TEST(SpeakAdapterTest, ClassifyTransportFailures) {
    auto timeout = classify_response(transport_failure(TransportError::TIMEOUT));
    EXPECT_TRUE(timeout.is_retryable());
    EXPECT_EQ(timeout.cause.kind, ErrorKind::TIMEOUT);
    EXPECT_FALSE(timeout.cause.caller_deadline);

    auto refused = classify_response(transport_failure(TransportError::CONNECTION));
    EXPECT_TRUE(refused.is_retryable());
    EXPECT_EQ(refused.cause.kind, ErrorKind::TRANSPORT_ERROR);

    auto bad_url = classify_response(transport_failure(TransportError::INVALID_URL));
    EXPECT_TRUE(bad_url.is_fatal());
    EXPECT_EQ(bad_url.cause.kind, ErrorKind::PROVIDER_REJECTED);
}

TEST(SpeakAdapterTest, LongErrorBodiesAreTruncated) {
    auto outcome = classify_response(http_response(500, std::string(5000, 'x')));
    EXPECT_LT(outcome.cause.message.size(), 400u);
}

TEST(SpeakAdapterTest, TruncationKeepsMultibyteCharactersWhole) {
    // "xx" shifts the 3-byte characters so byte 256 lands mid-character
    std::string body = "xx";
    for (int i = 0; i < 200; ++i) {
        body += "\xe6\x9c\x8d";
    }

    auto outcome = classify_response(http_response(503, body));
    const std::string &message = outcome.cause.message;
    ASSERT_GE(message.size(), 3u);
    EXPECT_EQ(message.substr(message.size() - 3), "...");

    const std::string excerpt = message.substr(0, message.size() - 3);
    EXPECT_EQ((excerpt.size() - std::string("HTTP 503: xx").size()) % 3, 0u);
    EXPECT_NO_THROW((void)nlohmann::json({{"message", message}}).dump());
}

// ============================================================================
// Adapters
// ============================================================================

TEST(SpeakAdapterTest, HttpAdapterPostsToProvider) {
    auto transport = std::make_shared<StrictMock<MockHttpTransport>>();
    HttpSpeakAdapter adapter(descriptor_for(Dialect::DUIX), transport);

    EXPECT_CALL(*transport, post(_)).WillOnce(Invoke([](const HttpRequestSpec &request) {
        EXPECT_EQ(request.base_url, "https://avatar.example");
        EXPECT_EQ(request.path, "/v1/avatar/speak");
        EXPECT_EQ(request.timeout, 1500ms);
        auto body = nlohmann::json::parse(request.body);
        EXPECT_EQ(body["text"], "Hello there");
        return http_response(200, R"({"video":"v.mp4"})");
    }));

    auto outcome = adapter.speak(sample_payload(), 1500ms);
    ASSERT_TRUE(outcome.is_success());
    EXPECT_EQ(outcome.response_body, R"({"video":"v.mp4"})");
}

TEST(SpeakAdapterTest, ProbeUsesHealthPath) {
    auto transport = std::make_shared<StrictMock<MockHttpTransport>>();
    ProviderDescriptor d = descriptor_for(Dialect::SENSE_AVATAR);
    d.health_path = "/status";
    HttpSpeakAdapter adapter(d, transport);

    EXPECT_CALL(*transport, get(_)).WillOnce(Invoke([](const HttpRequestSpec &request) {
        EXPECT_EQ(request.path, "/status");
        EXPECT_EQ(header_value(request.headers, "X-API-Key"), "secret");
        return http_response(503);
    }));

    auto outcome = adapter.probe(500ms);
    EXPECT_TRUE(outcome.is_retryable());
}

TEST(SpeakAdapterTest, HttpAdapterRequiresTransport) {
    std::shared_ptr<IHttpTransport> no_transport;
    EXPECT_THROW(std::make_shared<HttpSpeakAdapter>(descriptor_for(Dialect::DUIX), no_transport),
                 std::invalid_argument);
}

TEST(SpeakAdapterTest, FactoryPicksMockAdapterWithoutNetwork) {
    auto adapter = create_speak_adapter(descriptor_for(Dialect::MOCK), nullptr);
    ASSERT_NE(adapter, nullptr);

    auto outcome = adapter->speak(sample_payload(), 100ms);
    ASSERT_TRUE(outcome.is_success());
    auto body = nlohmann::json::parse(outcome.response_body);
    EXPECT_EQ(body["status"], "success");
    EXPECT_EQ(body["data"]["text"], "Hello there");
}
