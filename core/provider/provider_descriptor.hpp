#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <vector>

namespace avatarlink {
namespace provider {

// Wire format spoken by a provider. Selects the adapter; never inferred at runtime.
enum class Dialect { CANONICAL, DUIX, SENSE_AVATAR, AKOOL, MOCK };

inline const char *dialect_to_string(Dialect dialect) {
    switch (dialect) {
        case Dialect::CANONICAL:
            return "canonical";
        case Dialect::DUIX:
            return "duix";
        case Dialect::SENSE_AVATAR:
            return "sense_avatar";
        case Dialect::AKOOL:
            return "akool";
        case Dialect::MOCK:
            return "mock";
    }
    return "canonical";
}

inline std::optional<Dialect> parse_dialect(const std::string &value) {
    if (value == "canonical" || value == "local") return Dialect::CANONICAL;
    if (value == "duix") return Dialect::DUIX;
    if (value == "sense_avatar") return Dialect::SENSE_AVATAR;
    if (value == "akool") return Dialect::AKOOL;
    if (value == "mock") return Dialect::MOCK;
    return std::nullopt;
}

struct RateLimitPolicy {
    bool enabled = false;              // false = unlimited
    double requests_per_second = 0.0;  // refill rate
    double burst = 0.0;                // bucket capacity

    bool operator==(const RateLimitPolicy &other) const {
        return enabled == other.enabled && requests_per_second == other.requests_per_second && burst == other.burst;
    }
    bool operator!=(const RateLimitPolicy &other) const { return !(*this == other); }
};

/**
 * @brief Static identity of one avatar backend
 *
 * Built at configuration time and never mutated afterwards; a reload builds
 * a new set of descriptors and swaps it in wholesale.
 */
struct ProviderDescriptor {
    std::string name;  // unique, e.g. "duix-primary"
    Dialect dialect = Dialect::CANONICAL;
    std::string base_url;     // scheme://host[:port]
    std::string speak_path;   // empty = dialect default
    std::string health_path = "/health";
    std::string credential_ref;  // where the key came from ("env:DUIX_API_KEY", "inline", "")
    std::string credential;      // resolved secret, never logged
    int priority = 0;            // higher is preferred
    int timeout_ms = 5000;       // per-attempt HTTP timeout
    std::vector<std::string> languages;  // empty = any language
    std::vector<std::string> emotions;   // empty = any emotion
    RateLimitPolicy rate_limit;

    bool supports_language(const std::string &language) const {
        if (languages.empty()) {
            return true;
        }
        const std::string wanted = lower(language);
        const std::string primary = wanted.substr(0, wanted.find('-'));
        return std::any_of(languages.begin(), languages.end(), [&](const std::string &declared) {
            const std::string d = lower(declared);
            return d == wanted || d == primary;
        });
    }

    bool supports_emotion(const std::string &emotion) const {
        if (emotions.empty()) {
            return true;
        }
        const std::string wanted = lower(emotion);
        return std::any_of(emotions.begin(), emotions.end(),
                           [&](const std::string &declared) { return lower(declared) == wanted; });
    }

private:
    static std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
};

}  // namespace provider
}  // namespace avatarlink
