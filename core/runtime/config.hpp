#pragma once

#include <string>
#include <vector>

#include "delivery/retry_engine.hpp"
#include "health/health_monitor.hpp"
#include "health/health_prober.hpp"
#include "provider/provider_descriptor.hpp"

namespace avatarlink {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

// Runtime section configuration (runtime: in YAML)
struct RuntimeModeConfig {
    std::string name;                     // Instance identifier (optional)
    int config_reload_interval_ms = 2000;  // Config file mtime check period, 0 = no hot reload
    int shutdown_timeout_ms = 2000;
};

struct ClientConfig {
    std::string avatar_id;  // default avatar when a request names none
    int max_text_length = 2000;
    int default_deadline_ms = 0;  // 0 = none
};

struct CacheConfig {
    bool enabled = true;
    int ttl_ms = 5000;
    int capacity = 1024;
    int shards = 8;
};

struct HttpConfig {
    bool enabled = true;                                 // HTTP server enabled
    std::string bind = "127.0.0.1";                      // Bind address
    int port = 8080;                                     // HTTP port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    int thread_pool_size = 40;                           // Worker thread pool size
};

struct TelemetryConfig {
    bool enabled = false;  // Enable telemetry sink

    // InfluxDB settings
    std::string influx_url = "http://localhost:8086";
    std::string influx_org = "avatarlink";
    std::string influx_bucket = "avatarlink";
    std::string influx_token;  // falls back to $INFLUXDB_TOKEN

    // Batching configuration
    size_t batch_size = 100;       // Flush when batch reaches this size
    int flush_interval_ms = 1000;  // Flush every N milliseconds

    size_t queue_size = 10000;            // Event queue size
    size_t max_retry_buffer_size = 1000;  // Max points to buffer on write failure
};

struct RuntimeConfig {
    RuntimeModeConfig runtime;
    ClientConfig client;
    delivery::RetryPolicy retry;
    health::HealthPolicy health;
    health::ProbeConfig probe;
    CacheConfig cache;
    std::vector<provider::ProviderDescriptor> providers;
    HttpConfig http;
    TelemetryConfig telemetry;
    LoggingConfig logging;
};

// Loads and validates configuration from a YAML file
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace avatarlink
