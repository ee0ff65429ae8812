#include "runtime.hpp"

#include <system_error>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace avatarlink {
namespace runtime {

client::ClientOptions to_client_options(const RuntimeConfig &config) {
    client::ClientOptions options;
    options.default_avatar_id = config.client.avatar_id;
    options.max_text_length = static_cast<size_t>(config.client.max_text_length);
    options.default_deadline_ms = config.client.default_deadline_ms;
    options.retry = config.retry;
    options.health = config.health;
    options.cache_enabled = config.cache.enabled;
    options.cache_ttl_ms = config.cache.ttl_ms;
    options.cache_capacity = static_cast<size_t>(config.cache.capacity);
    options.cache_shards = static_cast<size_t>(config.cache.shards);
    return options;
}

Runtime::Runtime(const RuntimeConfig &config, std::string config_path)
    : config_(config), config_path_(std::move(config_path)) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing avatarlink" << (config_.runtime.name.empty() ? "" : " '" + config_.runtime.name + "'"));

    // Default: 100 events per subscriber queue, max 32 SSE clients
    event_emitter_ = std::make_shared<events::EventEmitter>(100, 32);
    LOG_INFO("[Runtime] Event emitter created (max " << event_emitter_->max_subscribers() << " subscribers)");

    if (!init_client(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    if (!init_telemetry(error)) {
        return false;
    }

    if (!config_path_.empty()) {
        std::error_code ec;
        config_mtime_ = std::filesystem::last_write_time(config_path_, ec);
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_client(std::string &error) {
    transport_ = std::make_shared<provider::HttplibTransport>();
    client_ = std::make_unique<client::AvatarClient>(to_client_options(config_), transport_);
    client_->set_event_emitter(event_emitter_);

    std::string load_error;
    if (!client_->reload_providers(config_.providers, load_error)) {
        error = "Failed to load providers: " + load_error;
        return false;
    }

    prober_ = std::make_unique<health::HealthProber>(client_->registry(), client_->health_monitor(), config_.probe);
    return true;
}

bool Runtime::init_http(std::string &error) {
    if (config_.http.enabled) {
        LOG_INFO("[Runtime] Creating HTTP server");
        http_server_ = std::make_unique<http::HttpServer>(config_.http, *client_, event_emitter_);

        std::string http_error;
        if (!http_server_->start(http_error)) {
            error = "HTTP server failed to start: " + http_error;
            return false;
        }
        LOG_INFO("[Runtime] HTTP server started on " << config_.http.bind << ":" << http_server_->get_port());
    } else {
        LOG_INFO("[Runtime] HTTP server disabled in config");
    }
    return true;
}

bool Runtime::init_telemetry(std::string &error) {
    static_cast<void>(error);

    if (config_.telemetry.enabled) {
        LOG_INFO("[Runtime] Creating telemetry sink");

        telemetry::InfluxConfig influx_config;
        influx_config.enabled = true;
        influx_config.url = config_.telemetry.influx_url;
        influx_config.org = config_.telemetry.influx_org;
        influx_config.bucket = config_.telemetry.influx_bucket;
        influx_config.token = config_.telemetry.influx_token;
        influx_config.batch_size = config_.telemetry.batch_size;
        influx_config.flush_interval_ms = config_.telemetry.flush_interval_ms;
        influx_config.queue_size = config_.telemetry.queue_size;
        influx_config.max_retry_buffer_size = config_.telemetry.max_retry_buffer_size;

        telemetry_sink_ = std::make_unique<telemetry::InfluxSink>(influx_config);

        if (!telemetry_sink_->start(event_emitter_)) {
            // Telemetry is optional; delivery keeps working without it
            LOG_WARN("[Runtime] Telemetry sink failed to start");
        } else {
            LOG_INFO("[Runtime] Telemetry sink started");
        }
    } else {
        LOG_INFO("[Runtime] Telemetry disabled in config");
    }
    return true;
}

bool Runtime::config_changed() {
    if (config_path_.empty()) {
        return false;
    }

    std::error_code ec;
    const auto mtime = std::filesystem::last_write_time(config_path_, ec);
    if (ec) {
        return false;  // file briefly missing while an editor replaces it
    }
    if (mtime == config_mtime_) {
        return false;
    }
    config_mtime_ = mtime;
    return true;
}

bool Runtime::reload_config(std::string &error) {
    RuntimeConfig next;
    if (!load_config(config_path_, next, error)) {
        return false;
    }

    if (!client_->reload_providers(next.providers, error)) {
        return false;
    }

    if (next.logging.level != config_.logging.level) {
        logging::Logger::set_level(logging::string_to_level(next.logging.level));
        LOG_INFO("[Runtime] Log level changed to " << next.logging.level);
    }

    config_.providers = next.providers;
    config_.logging = next.logging;
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    prober_->start();

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    const auto reload_interval = std::chrono::milliseconds(config_.runtime.config_reload_interval_ms);
    auto last_reload_check = std::chrono::steady_clock::now();

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }

        if (reload_interval.count() <= 0) {
            continue;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now - last_reload_check < reload_interval) {
            continue;
        }
        last_reload_check = now;

        if (config_changed()) {
            LOG_INFO("[Runtime] Config file changed, reloading providers");
            std::string error;
            if (!reload_config(error)) {
                LOG_ERROR("[Runtime] Config reload rejected, keeping previous providers: " << error);
            }
        }
    }

    LOG_INFO("[Runtime] Shutting down");
}

void Runtime::drain_deliveries() {
    const auto limit = std::chrono::milliseconds(config_.runtime.shutdown_timeout_ms);
    const auto started = std::chrono::steady_clock::now();

    while (client_->in_flight() > 0 && std::chrono::steady_clock::now() - started < limit) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (client_->in_flight() > 0) {
        LOG_WARN("[Runtime] " << client_->in_flight() << " deliveries still in flight after "
                              << config_.runtime.shutdown_timeout_ms << "ms");
    }
}

void Runtime::shutdown() {
    if (prober_) {
        prober_->stop();
    }

    if (client_) {
        drain_deliveries();
    }

    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }

    if (telemetry_sink_) {
        LOG_INFO("[Runtime] Stopping telemetry sink");
        telemetry_sink_->stop();
    }
}

}  // namespace runtime
}  // namespace avatarlink
