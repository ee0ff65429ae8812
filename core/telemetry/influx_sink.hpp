#pragma once

/**
 * @file influx_sink.hpp
 * @brief InfluxDB telemetry sink for delivery and health events
 *
 * Subscribes to the EventEmitter, converts events to InfluxDB line protocol
 * and writes them in batches over HTTP.
 *
 * Measurements:
 *   avatar_delivery,provider=<name>,success=<bool>,error_kind=<KIND>
 *       latency_ms=<i>,from_cache=<bool>,providers_tried=<i>,fingerprint="<hex>"
 *   avatar_health,provider=<name>
 *       old_state="<S>",new_state="<S>",flap_count=<i>,cooldown_ms=<i>,reason="<text>"
 *   avatar_provider_reload
 *       provider_count=<i>,added=<i>,removed=<i>
 *
 * Cache hits are tagged with provider=cache. Timestamps are epoch ms.
 */

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "../events/event_emitter.hpp"
#include "../events/event_types.hpp"
#include "../logging/logger.hpp"

namespace avatarlink {
namespace telemetry {

struct InfluxConfig {
    bool enabled = false;                       // Enable telemetry sink
    std::string url = "http://localhost:8086";  // InfluxDB URL
    std::string org = "avatarlink";             // InfluxDB organization
    std::string bucket = "avatarlink";          // InfluxDB bucket
    std::string token;                          // InfluxDB API token

    // Batching configuration
    size_t batch_size = 100;       // Flush when batch reaches this size
    int flush_interval_ms = 1000;  // Flush every N milliseconds

    int timeout_ms = 5000;  // HTTP request timeout

    size_t queue_size = 10000;            // Event queue size
    size_t max_retry_buffer_size = 1000;  // Max lines kept for the next flush after a failed write
};

inline std::string escape_tag(const std::string &s) {
    std::string result;
    result.reserve(s.size() + 10);
    for (char c : s) {
        if (c == ',' || c == '=' || c == ' ') {
            result += '\\';
        }
        result += c;
    }
    return result;
}

inline std::string escape_field_string(const std::string &s) {
    std::string result;
    result.reserve(s.size() + 10);
    for (char c : s) {
        if (c == '"' || c == '\\') {
            result += '\\';
        }
        result += c;
    }
    return result;
}

inline std::string format_delivery_line(const events::DeliveryOutcomeEvent &event) {
    std::ostringstream line;

    std::string provider = event.provider;
    if (event.from_cache) {
        provider = "cache";
    } else if (provider.empty()) {
        provider = "none";
    }

    line << "avatar_delivery"
         << ",provider=" << escape_tag(provider) << ",success=" << (event.success ? "true" : "false")
         << ",error_kind=" << escape_tag(event.error_kind);

    line << " latency_ms=" << event.latency_ms << "i"
         << ",from_cache=" << (event.from_cache ? "true" : "false") << ",providers_tried=" << event.providers_tried
         << "i"
         << ",fingerprint=\"" << escape_field_string(event.fingerprint) << "\"";

    line << " " << event.timestamp_ms;
    return line.str();
}

inline std::string format_health_line(const events::HealthTransitionEvent &event) {
    std::ostringstream line;

    line << "avatar_health,provider=" << escape_tag(event.provider);

    line << " old_state=\"" << escape_field_string(event.old_state) << "\""
         << ",new_state=\"" << escape_field_string(event.new_state) << "\""
         << ",flap_count=" << event.flap_count << "i"
         << ",cooldown_ms=" << event.cooldown_ms << "i"
         << ",reason=\"" << escape_field_string(event.reason) << "\"";

    line << " " << event.timestamp_ms;
    return line.str();
}

inline std::string format_reload_line(const events::ProviderReloadEvent &event) {
    std::ostringstream line;

    line << "avatar_provider_reload";
    line << " provider_count=" << event.provider_count << "i"
         << ",added=" << event.added.size() << "i"
         << ",removed=" << event.removed.size() << "i";

    line << " " << event.timestamp_ms;
    return line.str();
}

// Line protocol for any event
std::string format_line_protocol(const events::Event &event);

class InfluxSink {
public:
    explicit InfluxSink(const InfluxConfig &config)
        : config_(config), running_(false), connected_(false), total_written_(0), total_failed_(0) {}

    ~InfluxSink() { stop(); }

    InfluxSink(const InfluxSink &) = delete;
    InfluxSink &operator=(const InfluxSink &) = delete;

    /**
     * @brief Subscribe to the emitter and start the flush thread
     *
     * @return false if disabled, missing a token or already running
     */
    bool start(std::shared_ptr<events::EventEmitter> emitter);

    /**
     * @brief Stop the sink
     *
     * Flushes remaining events and stops background thread.
     */
    void stop();

    bool is_running() const { return running_.load(); }
    bool is_connected() const { return connected_.load(); }
    size_t total_written() const { return total_written_.load(); }
    size_t total_failed() const { return total_failed_.load(); }

    size_t current_batch_size() const {
        std::lock_guard<std::mutex> lock(batch_mutex_);
        return batch_.size();
    }

    size_t retry_buffer_size() const {
        std::lock_guard<std::mutex> lock(batch_mutex_);
        return retry_buffer_.size();
    }

private:
    void flush_loop();
    void flush_batch();

    // Retry buffer followed by the current batch; both are emptied
    std::vector<std::string> take_pending();
    bool write_lines(const std::vector<std::string> &lines, std::string &error);

    // Keep what fits in the retry buffer, count the rest as failed
    void buffer_failed(std::vector<std::string> &lines);

    InfluxConfig config_;
    std::shared_ptr<events::EventEmitter> emitter_;
    std::unique_ptr<events::Subscription> subscription_;

    std::atomic<bool> running_;
    std::atomic<bool> connected_;
    std::thread flush_thread_;
    std::unique_ptr<httplib::Client> client_;  // flush thread only

    mutable std::mutex batch_mutex_;
    std::vector<std::string> batch_;         // Line protocol strings
    std::vector<std::string> retry_buffer_;  // Lines from failed writes

    std::atomic<size_t> total_written_;
    std::atomic<size_t> total_failed_;

    // Last connection error time for rate-limited logging
    std::chrono::steady_clock::time_point last_error_log_;
};

}  // namespace telemetry
}  // namespace avatarlink
