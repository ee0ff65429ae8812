#include "speak_adapter.hpp"

#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "logging/logger.hpp"

namespace avatarlink {
namespace provider {

using delivery::AttemptOutcome;
using delivery::ErrorKind;

namespace {

constexpr size_t kMaxErrorBodyChars = 256;

// Cuts on a UTF-8 character boundary so the excerpt stays valid text
std::string truncate_body(const std::string &body) {
    if (body.size() <= kMaxErrorBodyChars) {
        return body;
    }

    size_t cut = kMaxErrorBodyChars;
    while (cut > 0 && (static_cast<unsigned char>(body[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return body.substr(0, cut) + "...";
}

const std::unordered_map<std::string, std::string> &emotion_table(Dialect dialect) {
    static const std::unordered_map<std::string, std::string> kDuix = {
        {"neutral", "neutral"},    {"happy", "joy"},         {"sad", "sadness"},
        {"angry", "anger"},        {"surprised", "surprise"}, {"excited", "excitement"},
        {"confused", "confusion"}, {"serious", "serious"},    {"analytical", "thoughtful"},
        {"friendly", "friendly"},  {"playful", "playful"}};
    static const std::unordered_map<std::string, std::string> kSenseAvatar = {
        {"neutral", "normal"},      {"happy", "happy"},       {"sad", "sad"},       {"angry", "angry"},
        {"surprised", "surprised"}, {"excited", "energetic"}, {"serious", "formal"}, {"friendly", "gentle"}};
    static const std::unordered_map<std::string, std::string> kAkool = {
        {"neutral", "neutral"}, {"happy", "happy"},         {"sad", "sad"},
        {"excited", "excited"}, {"serious", "professional"}, {"friendly", "warm"}};
    static const std::unordered_map<std::string, std::string> kIdentity;

    switch (dialect) {
        case Dialect::DUIX:
            return kDuix;
        case Dialect::SENSE_AVATAR:
            return kSenseAvatar;
        case Dialect::AKOOL:
            return kAkool;
        default:
            return kIdentity;
    }
}

const char *neutral_emotion(Dialect dialect) { return dialect == Dialect::SENSE_AVATAR ? "normal" : "neutral"; }

}  // namespace

std::string default_speak_path(Dialect dialect) {
    switch (dialect) {
        case Dialect::DUIX:
            return "/v1/avatar/speak";
        case Dialect::SENSE_AVATAR:
            return "/v1/speak";
        case Dialect::AKOOL:
            return "/v1/avatar/speak";
        case Dialect::CANONICAL:
        case Dialect::MOCK:
            return "/speak";
    }
    return "/speak";
}

std::string map_emotion(Dialect dialect, const std::string &emotion) {
    if (dialect == Dialect::CANONICAL || dialect == Dialect::MOCK) {
        return emotion;
    }

    const auto &table = emotion_table(dialect);
    auto it = table.find(emotion);
    if (it == table.end()) {
        return neutral_emotion(dialect);
    }
    return it->second;
}

WireRequest build_wire_request(const ProviderDescriptor &descriptor, const delivery::SpeakPayload &payload) {
    WireRequest wire;
    wire.path = descriptor.speak_path.empty() ? default_speak_path(descriptor.dialect) : descriptor.speak_path;
    wire.headers.emplace_back("Accept", "application/json");

    const std::string emotion = map_emotion(descriptor.dialect, payload.emotion);

    switch (descriptor.dialect) {
        case Dialect::DUIX:
            wire.headers.emplace_back("Authorization", "Bearer " + descriptor.credential);
            wire.body = {{"avatar_id", payload.avatar_id},
                         {"text", payload.text},
                         {"emotion", emotion},
                         {"language", payload.language}};
            break;

        case Dialect::SENSE_AVATAR:
            wire.headers.emplace_back("X-API-Key", descriptor.credential);
            wire.body = {{"avatar", payload.avatar_id},
                         {"text", payload.text},
                         {"emotion", emotion},
                         {"lang", payload.language}};
            break;

        case Dialect::AKOOL:
            wire.headers.emplace_back("Authorization", "Bearer " + descriptor.credential);
            wire.body = {{"avatar_id", payload.avatar_id},
                         {"input_text", payload.text},
                         {"emotion", emotion},
                         {"language", payload.language}};
            break;

        case Dialect::CANONICAL:
        case Dialect::MOCK:
            if (!descriptor.credential.empty()) {
                wire.headers.emplace_back("Authorization", "Bearer " + descriptor.credential);
            }
            wire.body = {{"text", payload.text}, {"emotion", emotion}, {"language", payload.language}};
            break;
    }

    if (!payload.voice_id.empty()) {
        wire.body["voice_id"] = payload.voice_id;
    }
    if (!payload.gesture.empty()) {
        wire.body["gesture"] = payload.gesture;
    }

    return wire;
}

AttemptOutcome classify_response(const TransportResponse &response) {
    switch (response.error) {
        case TransportError::TIMEOUT:
            return AttemptOutcome::retryable(ErrorKind::TIMEOUT, "Request timed out: " + response.error_message);
        case TransportError::CONNECTION:
            return AttemptOutcome::retryable(ErrorKind::TRANSPORT_ERROR,
                                             "Connection failed: " + response.error_message);
        case TransportError::INVALID_URL:
            // Misconfigured descriptor; another provider may still work
            return AttemptOutcome::fatal(ErrorKind::PROVIDER_REJECTED, response.error_message);
        case TransportError::NONE:
            break;
    }

    const int status = response.status;
    const std::string detail = "HTTP " + std::to_string(status) + ": " + truncate_body(response.body);

    if (status >= 200 && status < 300) {
        return AttemptOutcome::success(response.body, status);
    }
    if (status == 408) {
        return AttemptOutcome::retryable(ErrorKind::TIMEOUT, detail, status);
    }
    if (status == 429 || status >= 500) {
        return AttemptOutcome::retryable(ErrorKind::PROVIDER_SERVER_ERROR, detail, status);
    }
    if (status == 400 || status == 401 || status == 403 || status == 422) {
        return AttemptOutcome::fatal(ErrorKind::INVALID_REQUEST, detail, status);
    }
    if (status >= 400) {
        return AttemptOutcome::fatal(ErrorKind::PROVIDER_REJECTED, detail, status);
    }

    // 1xx / 3xx: redirects are not followed for POST
    return AttemptOutcome::fatal(ErrorKind::PROVIDER_REJECTED, "Unexpected " + detail, status);
}

HttpSpeakAdapter::HttpSpeakAdapter(ProviderDescriptor descriptor, std::shared_ptr<IHttpTransport> transport)
    : descriptor_(std::move(descriptor)), transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("HttpSpeakAdapter requires a transport");
    }
}

AttemptOutcome HttpSpeakAdapter::speak(const delivery::SpeakPayload &payload, std::chrono::milliseconds timeout) {
    WireRequest wire = build_wire_request(descriptor_, payload);

    HttpRequestSpec request;
    request.base_url = descriptor_.base_url;
    request.path = wire.path;
    request.headers = std::move(wire.headers);
    request.body = wire.body.dump();
    request.timeout = timeout;

    auto outcome = classify_response(transport_->post(request));
    if (!outcome.is_success()) {
        LOG_DEBUG("[Adapter] " << descriptor_.name << " speak failed: "
                               << delivery::error_kind_to_string(outcome.cause.kind) << " " << outcome.cause.message);
    }
    return outcome;
}

AttemptOutcome HttpSpeakAdapter::probe(std::chrono::milliseconds timeout) {
    HttpRequestSpec request;
    request.base_url = descriptor_.base_url;
    request.path = descriptor_.health_path.empty() ? "/health" : descriptor_.health_path;
    request.timeout = timeout;
    if (!descriptor_.credential.empty()) {
        if (descriptor_.dialect == Dialect::SENSE_AVATAR) {
            request.headers.emplace_back("X-API-Key", descriptor_.credential);
        } else {
            request.headers.emplace_back("Authorization", "Bearer " + descriptor_.credential);
        }
    }

    return classify_response(transport_->get(request));
}

AttemptOutcome MockSpeakAdapter::speak(const delivery::SpeakPayload &payload, std::chrono::milliseconds) {
    nlohmann::json body = {{"status", "success"},
                           {"data",
                            {{"text", payload.text},
                             {"emotion", payload.emotion},
                             {"language", payload.language},
                             {"avatar_id", payload.avatar_id}}},
                           {"message", "Mock avatar service processed request"},
                           {"mock_video_url", "https://mock.avatar.local/video/" + payload.avatar_id}};
    return AttemptOutcome::success(body.dump());
}

AttemptOutcome MockSpeakAdapter::probe(std::chrono::milliseconds) {
    return AttemptOutcome::success(R"({"status":"ok"})");
}

std::shared_ptr<ISpeakAdapter> create_speak_adapter(const ProviderDescriptor &descriptor,
                                                    std::shared_ptr<IHttpTransport> transport) {
    if (descriptor.dialect == Dialect::MOCK) {
        return std::make_shared<MockSpeakAdapter>(descriptor);
    }
    return std::make_shared<HttpSpeakAdapter>(descriptor, std::move(transport));
}

}  // namespace provider
}  // namespace avatarlink
