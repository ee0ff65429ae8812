/**
 * @file influx_sink.cpp
 * @brief Implementation of InfluxDB telemetry sink
 */

#include "influx_sink.hpp"

#include <httplib.h>

#include <chrono>
#include <type_traits>
#include <variant>

namespace avatarlink {
namespace telemetry {

std::string format_line_protocol(const events::Event &event) {
    return std::visit(
        [](auto &&e) -> std::string {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, events::DeliveryOutcomeEvent>) {
                return format_delivery_line(e);
            } else if constexpr (std::is_same_v<T, events::HealthTransitionEvent>) {
                return format_health_line(e);
            } else {
                return format_reload_line(e);
            }
        },
        event);
}

bool InfluxSink::start(std::shared_ptr<events::EventEmitter> emitter) {
    if (running_.load()) {
        LOG_WARN("[InfluxSink] Already running");
        return false;
    }

    if (!config_.enabled) {
        LOG_INFO("[InfluxSink] Telemetry disabled in config");
        return false;
    }

    if (config_.token.empty()) {
        LOG_ERROR("[InfluxSink] No API token configured");
        return false;
    }

    if (!emitter) {
        LOG_ERROR("[InfluxSink] No event emitter");
        return false;
    }

    emitter_ = std::move(emitter);

    // Telemetry-sized queue
    subscription_ = emitter_->subscribe(events::EventFilter::all(), config_.queue_size, "telemetry-sink");

    if (!subscription_) {
        LOG_ERROR("[InfluxSink] Failed to subscribe to events");
        return false;
    }

    running_.store(true);
    flush_thread_ = std::thread(&InfluxSink::flush_loop, this);

    LOG_INFO("[InfluxSink] Started, writing to " << config_.url << "/" << config_.bucket);
    return true;
}

void InfluxSink::stop() {
    if (!running_.load()) return;

    running_.store(false);

    // Unsubscribe to unblock the pop() call
    if (subscription_) {
        subscription_->unsubscribe();
    }

    if (flush_thread_.joinable()) {
        flush_thread_.join();
    }

    subscription_.reset();
    emitter_.reset();

    LOG_INFO("[InfluxSink] Stopped. Written: " << total_written_ << ", Failed: " << total_failed_);
}

void InfluxSink::flush_loop() {
    const auto interval = std::chrono::milliseconds(config_.flush_interval_ms);
    auto next_flush = std::chrono::steady_clock::now() + interval;

    while (running_.load()) {
        if (auto event = subscription_->pop(100)) {
            std::lock_guard<std::mutex> lock(batch_mutex_);
            batch_.push_back(format_line_protocol(*event));
        }

        const auto now = std::chrono::steady_clock::now();
        const bool batch_full = current_batch_size() >= config_.batch_size;
        if (batch_full || now >= next_flush) {
            flush_batch();
            next_flush = now + interval;
        }
    }

    // Shutdown: one last attempt for whatever is pending
    flush_batch();
}

void InfluxSink::buffer_failed(std::vector<std::string> &lines) {
    std::lock_guard<std::mutex> lock(batch_mutex_);

    size_t kept = 0;
    for (auto &line : lines) {
        if (retry_buffer_.size() >= config_.max_retry_buffer_size) {
            break;
        }
        retry_buffer_.push_back(std::move(line));
        ++kept;
    }

    if (kept < lines.size()) {
        total_failed_.fetch_add(lines.size() - kept);
    }
}

std::vector<std::string> InfluxSink::take_pending() {
    std::lock_guard<std::mutex> lock(batch_mutex_);

    // Previously failed points first, so a series stays roughly in time order
    std::vector<std::string> pending;
    pending.swap(retry_buffer_);
    pending.reserve(pending.size() + batch_.size());
    for (auto &line : batch_) {
        pending.push_back(std::move(line));
    }
    batch_.clear();
    return pending;
}

bool InfluxSink::write_lines(const std::vector<std::string> &lines, std::string &error) {
    std::string body;
    for (const auto &line : lines) {
        body.append(line).push_back('\n');
    }

    if (!client_) {
        // https:// needs CPPHTTPLIB_OPENSSL_SUPPORT, which the build defines
        client_ = std::make_unique<httplib::Client>(config_.url);
        client_->set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
        client_->set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));
        client_->set_write_timeout(std::chrono::milliseconds(config_.timeout_ms));
        client_->set_default_headers({{"Authorization", "Token " + config_.token}});
    }

    const std::string path =
        "/api/v2/write?org=" + config_.org + "&bucket=" + config_.bucket + "&precision=ms";
    auto result = client_->Post(path, body, "text/plain; charset=utf-8");

    if (!result) {
        error = "connection error: " + httplib::to_string(result.error());
        return false;
    }
    if (result->status < 200 || result->status >= 300) {
        error = "HTTP " + std::to_string(result->status) + ": " + result->body;
        return false;
    }
    return true;
}

void InfluxSink::flush_batch() {
    std::vector<std::string> lines = take_pending();
    if (lines.empty()) {
        return;
    }

    std::string error;
    if (write_lines(lines, error)) {
        connected_.store(true);
        const size_t before = total_written_.fetch_add(lines.size());
        if ((before + lines.size()) / 1000 > before / 1000) {
            LOG_INFO("[InfluxSink] " << before + lines.size() << " points written to " << config_.bucket);
        }
        return;
    }

    connected_.store(false);
    buffer_failed(lines);

    // At most one warning every 10 seconds while InfluxDB is unreachable
    const auto now = std::chrono::steady_clock::now();
    if (now - last_error_log_ >= std::chrono::seconds(10)) {
        LOG_WARN("[InfluxSink] Write failed (" << error << "), " << retry_buffer_size()
                                               << " points held for retry");
        last_error_log_ = now;
    }
}

}  // namespace telemetry
}  // namespace avatarlink
