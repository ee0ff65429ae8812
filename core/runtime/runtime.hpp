#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "client/avatar_client.hpp"
#include "config.hpp"
#include "events/event_emitter.hpp"
#include "health/health_prober.hpp"
#include "http/server.hpp"
#include "provider/http_transport.hpp"
#include "telemetry/influx_sink.hpp"

namespace avatarlink {
namespace runtime {

// Maps the client-facing config sections onto AvatarClient options
client::ClientOptions to_client_options(const RuntimeConfig &config);

class Runtime {
public:
    /**
     * @param config Loaded and validated configuration
     * @param config_path File to watch for hot reload (empty = no reload)
     */
    explicit Runtime(const RuntimeConfig &config, std::string config_path = "");
    ~Runtime();

    // Initialize all components (client, prober, HTTP, telemetry)
    bool initialize(std::string &error);

    // Main runtime loop (blocking)
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    void shutdown();

    /**
     * @brief Re-read the config file and apply the provider set and log level
     *
     * Other sections only take effect on restart. On any error the running
     * configuration is kept.
     */
    bool reload_config(std::string &error);

    client::AvatarClient &get_client() { return *client_; }
    events::EventEmitter &get_event_emitter() { return *event_emitter_; }

private:
    bool init_client(std::string &error);
    bool init_http(std::string &error);
    bool init_telemetry(std::string &error);

    // Waits up to shutdown_timeout_ms for speak() calls to return
    void drain_deliveries();

    // True when the config file's mtime moved since the last load
    bool config_changed();

    RuntimeConfig config_;
    const std::string config_path_;
    std::filesystem::file_time_type config_mtime_{};

    std::shared_ptr<provider::IHttpTransport> transport_;
    std::shared_ptr<events::EventEmitter> event_emitter_;  // Shared with client, HTTP and telemetry
    std::unique_ptr<client::AvatarClient> client_;
    std::unique_ptr<health::HealthProber> prober_;
    std::unique_ptr<http::HttpServer> http_server_;
    std::unique_ptr<telemetry::InfluxSink> telemetry_sink_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace avatarlink
