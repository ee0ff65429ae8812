#include <chrono>

#include "../../client/avatar_client.hpp"
#include "../../events/event_emitter.hpp"
#include "../../logging/logger.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace avatarlink {
namespace http {

namespace {

// Subscriber queue per stream; a dashboard that falls this far behind loses the oldest events
constexpr size_t kSseQueueSize = 100;
constexpr int kSsePollMs = 1000;
// Polls without an event before a keep-alive comment is sent
constexpr int kSseIdlePollsBeforeKeepalive = 15;

}  // namespace

//=============================================================================
// GET /v0/runtime/status
//=============================================================================
void HttpServer::handle_get_runtime_status(const httplib::Request &, httplib::Response &res) {
    const auto uptime =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_at_).count();

    const auto health = client_.health_snapshot();
    nlohmann::json providers = nlohmann::json::array();
    for (const auto &descriptor : client_.descriptors()) {
        const auto it = health.find(descriptor.name);
        providers.push_back(
            {{"provider", descriptor.name},
             {"state", it == health.end() ? "UNKNOWN" : health::health_state_to_string(it->second.state)},
             {"priority", descriptor.priority}});
    }

    const auto &options = client_.options();
    nlohmann::json policy = {{"max_attempts", options.retry.max_attempts},
                             {"cache_enabled", options.cache_enabled},
                             {"cache_ttl_ms", options.cache_ttl_ms},
                             {"default_deadline_ms", options.default_deadline_ms}};

    send_json(res, StatusCode::OK,
              {{"status", make_status(StatusCode::OK)},
               {"uptime_seconds", uptime},
               {"stats", encode_stats(client_.stats())},
               {"policy", policy},
               {"providers", providers},
               {"sse_clients", sse_client_count_.load()}});
}

//=============================================================================
// POST /v0/cache/clear
//=============================================================================
void HttpServer::handle_post_cache_clear(const httplib::Request &, httplib::Response &res) {
    const size_t cleared = client_.stats().cache_size;
    client_.clear_cache();
    LOG_INFO("[HTTP] Response cache cleared (" << cleared << " entries)");

    send_json(res, StatusCode::OK, {{"status", make_status(StatusCode::OK)}, {"cleared", cleared}});
}

//=============================================================================
// GET /v0/events (Server-Sent Events)
//=============================================================================
void HttpServer::handle_get_events(const httplib::Request &req, httplib::Response &res) {
    if (!event_emitter_) {
        send_error(res, StatusCode::UNAVAILABLE, "Event streaming not enabled");
        return;
    }

    events::EventFilter filter;
    std::string filter_error;
    if (!parse_event_filter(req, filter, filter_error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, filter_error);
        return;
    }

    const int active = sse_client_count_.load();
    if (active >= MAX_SSE_CLIENTS) {
        LOG_WARN("[SSE] Rejecting stream from " << req.remote_addr << ": " << MAX_SSE_CLIENTS << " already open");
        send_error(res, StatusCode::UNAVAILABLE, "Too many SSE clients");
        return;
    }

    const std::string stream_name = "sse-" + req.remote_addr + "-" + std::to_string(active + 1);
    std::shared_ptr<events::Subscription> subscription = event_emitter_->subscribe(filter, kSseQueueSize, stream_name);
    if (!subscription) {
        send_error(res, StatusCode::UNAVAILABLE, "Failed to subscribe to events");
        return;
    }

    sse_client_count_++;
    LOG_INFO("[SSE] Stream opened: " << stream_name
                                     << (filter.provider.empty() ? "" : " (provider " + filter.provider + ")"));

    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");

    auto idle_polls = std::make_shared<int>(0);

    res.set_chunked_content_provider(
        "text/event-stream",
        [this, subscription, stream_name, idle_polls](size_t, httplib::DataSink &sink) {
            if (!running_.load()) {
                return false;
            }

            std::string chunk;
            if (auto event = subscription->pop(kSsePollMs)) {
                chunk = format_sse_event(*event);
                *idle_polls = 0;
            } else if (++(*idle_polls) >= kSseIdlePollsBeforeKeepalive) {
                chunk = ": keepalive\n\n";
                *idle_polls = 0;
            } else {
                return true;
            }

            if (!sink.write(chunk.data(), chunk.size())) {
                LOG_DEBUG("[SSE] Client went away: " << stream_name);
                return false;
            }
            return true;
        },
        [this, stream_name, subscription](bool) {
            subscription->unsubscribe();
            sse_client_count_--;
            LOG_INFO("[SSE] Stream closed: " << stream_name << " (" << subscription->dropped_count()
                                             << " events dropped)");
        });
}

std::string HttpServer::format_sse_event(const events::Event &event) {
    std::string frame = "event: ";
    frame += events::event_type_name(event);
    frame += "\nid: " + std::to_string(events::get_event_id(event));
    frame += "\ndata: " + to_wire(encode_event(event)) + "\n\n";
    return frame;
}

}  // namespace http
}  // namespace avatarlink
