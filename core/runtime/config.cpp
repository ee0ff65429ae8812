#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <unordered_set>

#include "logging/logger.hpp"

namespace avatarlink {
namespace runtime {

namespace {

bool has_http_scheme(const std::string &url) { return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0; }

std::vector<std::string> string_list(const YAML::Node &node) {
    std::vector<std::string> out;
    if (node.IsSequence()) {
        for (const auto &item : node) {
            out.push_back(item.as<std::string>());
        }
    } else if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    }
    return out;
}

bool parse_provider(const YAML::Node &node, provider::ProviderDescriptor &provider, std::string &error) {
    if (node["name"]) {
        provider.name = node["name"].as<std::string>();
    }

    if (node["dialect"]) {
        const auto dialect_str = node["dialect"].as<std::string>();
        auto dialect = provider::parse_dialect(dialect_str);
        if (!dialect) {
            error = "Provider '" + provider.name + "' has unknown dialect '" + dialect_str +
                    "': must be canonical, duix, sense_avatar, akool or mock";
            return false;
        }
        provider.dialect = *dialect;
    }

    if (node["base_url"]) {
        provider.base_url = node["base_url"].as<std::string>();
    }
    if (node["speak_path"]) {
        provider.speak_path = node["speak_path"].as<std::string>();
    }
    if (node["health_path"]) {
        provider.health_path = node["health_path"].as<std::string>();
    }
    if (node["priority"]) {
        provider.priority = node["priority"].as<int>();
    }
    if (node["timeout_ms"]) {
        provider.timeout_ms = node["timeout_ms"].as<int>();
    }
    if (node["languages"]) {
        provider.languages = string_list(node["languages"]);
    }
    if (node["emotions"]) {
        provider.emotions = string_list(node["emotions"]);
    }

    // Credentials: inline key, or the name of an environment variable holding it
    if (node["api_key"] && node["credential_env"]) {
        error = "Provider '" + provider.name + "' sets both api_key and credential_env";
        return false;
    }
    if (node["api_key"]) {
        provider.credential = node["api_key"].as<std::string>();
        provider.credential_ref = "inline";
    } else if (node["credential_env"]) {
        const auto var = node["credential_env"].as<std::string>();
        provider.credential_ref = "env:" + var;
        const char *value = std::getenv(var.c_str());
        if (value != nullptr) {
            provider.credential = value;
        } else {
            LOG_WARN("[Config] Provider '" << provider.name << "': environment variable " << var << " is not set");
        }
    }

    if (node["rate_limit"]) {
        const auto &rl = node["rate_limit"];
        provider.rate_limit.enabled = rl["enabled"] ? rl["enabled"].as<bool>() : true;
        if (rl["requests_per_second"]) {
            provider.rate_limit.requests_per_second = rl["requests_per_second"].as<double>();
        }
        if (rl["burst"]) {
            provider.rate_limit.burst = rl["burst"].as<double>();
        }
    }

    return true;
}

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    if (config.runtime.config_reload_interval_ms < 0) {
        error = "runtime.config_reload_interval_ms must be >= 0";
        return false;
    }

    if (config.client.max_text_length < 1) {
        error = "client.max_text_length must be at least 1";
        return false;
    }
    if (config.client.default_deadline_ms < 0) {
        error = "client.default_deadline_ms must be >= 0";
        return false;
    }

    if (config.retry.max_attempts < 1) {
        error = "retry.max_attempts must be at least 1";
        return false;
    }
    if (config.retry.base_delay_ms < 0 || config.retry.max_delay_ms < config.retry.base_delay_ms) {
        error = "retry delays must satisfy 0 <= base_delay_ms <= max_delay_ms";
        return false;
    }

    const auto &h = config.health;
    if (h.degrade_after_failures < 1 || h.unhealthy_after_failures < 1 || h.recover_after_successes < 1) {
        error = "health thresholds must be at least 1";
        return false;
    }
    if (h.cooldown_base_ms < 0 || h.cooldown_max_ms < h.cooldown_base_ms) {
        error = "health cooldowns must satisfy 0 <= cooldown_base_ms <= cooldown_max_ms";
        return false;
    }
    if (h.cooldown_factor < 1.0) {
        error = "health.cooldown_factor must be >= 1.0";
        return false;
    }
    if (h.canary_claim_timeout_ms < 1) {
        error = "health.canary_claim_timeout_ms must be positive";
        return false;
    }

    if (config.probe.enabled) {
        if (config.probe.interval_ms < 100) {
            error = "health.probe.interval_ms must be >= 100ms";
            return false;
        }
        if (config.probe.jitter_ms < 0 || config.probe.jitter_ms >= config.probe.interval_ms) {
            error = "health.probe.jitter_ms must be >= 0 and smaller than interval_ms";
            return false;
        }
        if (config.probe.timeout_ms < 100) {
            error = "health.probe.timeout_ms must be >= 100ms";
            return false;
        }
    }

    if (config.cache.enabled) {
        if (config.cache.ttl_ms < 0 || config.cache.capacity < 1 || config.cache.shards < 1) {
            error = "cache requires ttl_ms >= 0, capacity >= 1 and shards >= 1";
            return false;
        }
        if (config.cache.shards > config.cache.capacity) {
            error = "cache.shards (" + std::to_string(config.cache.shards) + ") must not exceed cache.capacity (" +
                    std::to_string(config.cache.capacity) + ")";
            return false;
        }
    }

    // Validate HTTP settings
    if (config.http.enabled) {
        if (config.http.port < 0 || config.http.port > 65535) {
            error = "HTTP port must be between 0 and 65535 (0 = ephemeral)";
            return false;
        }
        if (config.http.thread_pool_size < 1) {
            error = "HTTP thread_pool_size must be at least 1";
            return false;
        }
        if (config.http.cors_allowed_origins.empty()) {
            error = "http.cors_allowed_origins must not be empty";
            return false;
        }
    }

    // Validate Provider settings
    if (config.providers.empty()) {
        error = "Config must specify at least one provider";
        return false;
    }

    std::unordered_set<std::string> names;
    for (const auto &provider : config.providers) {
        if (provider.name.empty()) {
            error = "Provider missing 'name' field";
            return false;
        }
        if (!names.insert(provider.name).second) {
            error = "Duplicate provider name '" + provider.name + "'";
            return false;
        }
        if (provider.dialect != provider::Dialect::MOCK) {
            if (provider.base_url.empty()) {
                error = "Provider '" + provider.name + "' missing 'base_url' field";
                return false;
            }
            if (!has_http_scheme(provider.base_url)) {
                error = "Provider '" + provider.name + "' base_url must start with http:// or https://";
                return false;
            }
        }
        if (provider.timeout_ms < 100) {
            error = "Provider '" + provider.name + "' timeout must be >= 100ms";
            return false;
        }
        if (provider.rate_limit.enabled) {
            if (provider.rate_limit.requests_per_second <= 0.0) {
                error = "Provider '" + provider.name + "' rate_limit.requests_per_second must be > 0";
                return false;
            }
            if (provider.rate_limit.burst < 0.0) {
                error = "Provider '" + provider.name + "' rate_limit.burst must be >= 0";
                return false;
            }
        }
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"runtime", "client", "retry", "health",    "cache",
                                                     "providers", "http", "telemetry", "logging"};
        for (const auto &key_node : yaml) {
            const std::string key = key_node.first.as<std::string>();
            if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        if (yaml["runtime"]) {
            const auto &rt = yaml["runtime"];
            if (rt["name"]) {
                config.runtime.name = rt["name"].as<std::string>();
            }
            if (rt["config_reload_interval_ms"]) {
                config.runtime.config_reload_interval_ms = rt["config_reload_interval_ms"].as<int>();
            }
            if (rt["shutdown_timeout_ms"]) {
                config.runtime.shutdown_timeout_ms = rt["shutdown_timeout_ms"].as<int>();
            }
        }

        if (yaml["client"]) {
            const auto &c = yaml["client"];
            if (c["avatar_id"]) {
                config.client.avatar_id = c["avatar_id"].as<std::string>();
            }
            if (c["max_text_length"]) {
                config.client.max_text_length = c["max_text_length"].as<int>();
            }
            if (c["default_deadline_ms"]) {
                config.client.default_deadline_ms = c["default_deadline_ms"].as<int>();
            }
        }

        if (yaml["retry"]) {
            const auto &r = yaml["retry"];
            if (r["base_delay_ms"]) {
                config.retry.base_delay_ms = r["base_delay_ms"].as<int>();
            }
            if (r["max_delay_ms"]) {
                config.retry.max_delay_ms = r["max_delay_ms"].as<int>();
            }
            if (r["max_attempts"]) {
                config.retry.max_attempts = r["max_attempts"].as<int>();
            }
        }

        if (yaml["health"]) {
            const auto &h = yaml["health"];
            if (h["degrade_after_failures"]) {
                config.health.degrade_after_failures = h["degrade_after_failures"].as<int>();
            }
            if (h["unhealthy_after_failures"]) {
                config.health.unhealthy_after_failures = h["unhealthy_after_failures"].as<int>();
            }
            if (h["recover_after_successes"]) {
                config.health.recover_after_successes = h["recover_after_successes"].as<int>();
            }
            if (h["cooldown_base_ms"]) {
                config.health.cooldown_base_ms = h["cooldown_base_ms"].as<int64_t>();
            }
            if (h["cooldown_max_ms"]) {
                config.health.cooldown_max_ms = h["cooldown_max_ms"].as<int64_t>();
            }
            if (h["cooldown_factor"]) {
                config.health.cooldown_factor = h["cooldown_factor"].as<double>();
            }
            if (h["flap_reset_ms"]) {
                config.health.flap_reset_ms = h["flap_reset_ms"].as<int64_t>();
            }
            if (h["canary_claim_timeout_ms"]) {
                config.health.canary_claim_timeout_ms = h["canary_claim_timeout_ms"].as<int64_t>();
            }

            if (h["probe"]) {
                const auto &p = h["probe"];
                if (p["enabled"]) {
                    config.probe.enabled = p["enabled"].as<bool>();
                }
                if (p["interval_ms"]) {
                    config.probe.interval_ms = p["interval_ms"].as<int>();
                }
                if (p["jitter_ms"]) {
                    config.probe.jitter_ms = p["jitter_ms"].as<int>();
                }
                if (p["timeout_ms"]) {
                    config.probe.timeout_ms = p["timeout_ms"].as<int>();
                }
            }
        }

        if (yaml["cache"]) {
            const auto &c = yaml["cache"];
            if (c["enabled"]) {
                config.cache.enabled = c["enabled"].as<bool>();
            }
            if (c["ttl_ms"]) {
                config.cache.ttl_ms = c["ttl_ms"].as<int>();
            }
            if (c["capacity"]) {
                config.cache.capacity = c["capacity"].as<int>();
            }
            if (c["shards"]) {
                config.cache.shards = c["shards"].as<int>();
            }
        }

        if (yaml["providers"]) {
            config.providers.clear();  // Ensure idempotent parsing
            for (const auto &provider_node : yaml["providers"]) {
                provider::ProviderDescriptor provider;
                if (!parse_provider(provider_node, provider, error)) {
                    return false;
                }
                config.providers.push_back(std::move(provider));
            }
        }

        // Load HTTP config
        if (yaml["http"]) {
            if (yaml["http"]["enabled"]) {
                config.http.enabled = yaml["http"]["enabled"].as<bool>();
            }
            if (yaml["http"]["bind"]) {
                config.http.bind = yaml["http"]["bind"].as<std::string>();
            }
            if (yaml["http"]["port"]) {
                config.http.port = yaml["http"]["port"].as<int>();
            }
            if (yaml["http"]["cors_allowed_origins"]) {
                config.http.cors_allowed_origins = string_list(yaml["http"]["cors_allowed_origins"]);
                if (config.http.cors_allowed_origins.empty()) {
                    config.http.cors_allowed_origins.push_back("*");
                }
            }
            if (yaml["http"]["cors_allow_credentials"]) {
                config.http.cors_allow_credentials = yaml["http"]["cors_allow_credentials"].as<bool>();
            }
            if (yaml["http"]["thread_pool_size"]) {
                config.http.thread_pool_size = yaml["http"]["thread_pool_size"].as<int>();
            }
        }

        // Load telemetry config
        if (yaml["telemetry"]) {
            if (yaml["telemetry"]["enabled"]) {
                config.telemetry.enabled = yaml["telemetry"]["enabled"].as<bool>();
            }

            if (yaml["telemetry"]["influxdb"]) {
                auto influx = yaml["telemetry"]["influxdb"];

                if (influx["url"]) {
                    config.telemetry.influx_url = influx["url"].as<std::string>();
                }
                if (influx["org"]) {
                    config.telemetry.influx_org = influx["org"].as<std::string>();
                }
                if (influx["bucket"]) {
                    config.telemetry.influx_bucket = influx["bucket"].as<std::string>();
                }
                if (influx["token"]) {
                    config.telemetry.influx_token = influx["token"].as<std::string>();
                }
                if (influx["batch_size"]) {
                    config.telemetry.batch_size = influx["batch_size"].as<size_t>();
                }
                if (influx["flush_interval_ms"]) {
                    config.telemetry.flush_interval_ms = influx["flush_interval_ms"].as<int>();
                }
                if (influx["queue_size"]) {
                    config.telemetry.queue_size = influx["queue_size"].as<size_t>();
                }
                if (influx["max_retry_buffer_size"]) {
                    config.telemetry.max_retry_buffer_size = influx["max_retry_buffer_size"].as<size_t>();
                }
            }

            if (config.telemetry.enabled && config.telemetry.influx_token.empty()) {
                const char *token_env = std::getenv("INFLUXDB_TOKEN");
                if (token_env != nullptr) {
                    config.telemetry.influx_token = token_env;
                }
            }
        }

        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Loaded " << config.providers.size() << " provider(s)");
        for (const auto &provider : config.providers) {
            LOG_DEBUG("[Config]   " << provider.name << " (" << provider::dialect_to_string(provider.dialect)
                                    << ", priority " << provider.priority << ", credential "
                                    << (provider.credential_ref.empty() ? "none" : provider.credential_ref) << ")");
        }

        std::stringstream http_msg;
        http_msg << "[Config] HTTP: " << (config.http.enabled ? "enabled" : "disabled");
        if (config.http.enabled) {
            http_msg << " (" << config.http.bind << ":" << config.http.port << ")";
        }
        LOG_INFO(http_msg.str());

        LOG_INFO("[Config] Retry: " << config.retry.max_attempts << " attempts, backoff " << config.retry.base_delay_ms
                                    << "-" << config.retry.max_delay_ms << "ms");
        LOG_INFO("[Config] Cache: " << (config.cache.enabled ? "enabled" : "disabled") << " (ttl "
                                    << config.cache.ttl_ms << "ms, capacity " << config.cache.capacity << ")");

        std::stringstream telemetry_msg;
        telemetry_msg << "[Config] Telemetry: " << (config.telemetry.enabled ? "enabled" : "disabled");
        if (config.telemetry.enabled) {
            telemetry_msg << " (" << config.telemetry.influx_url << "/" << config.telemetry.influx_bucket << ")";
        }
        LOG_INFO(telemetry_msg.str());

        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace avatarlink
