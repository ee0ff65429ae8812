#include "runtime/config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace avatarlink::runtime;
using avatarlink::provider::Dialect;

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "avatarlink_config_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string create_config_file(const std::string& name, const std::string& content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }

    // Minimal valid config with one mock provider
    static RuntimeConfig valid_config() {
        RuntimeConfig config;
        avatarlink::provider::ProviderDescriptor mock;
        mock.name = "mock";
        mock.dialect = Dialect::MOCK;
        config.providers.push_back(mock);
        return config;
    }
};

TEST_F(ConfigTest, ValidMinimalConfig) {
    std::string config_content = R"(
http:
  enabled: true
  port: 8080

providers:
  - name: duix
    dialect: duix
    base_url: https://api.duix.test
    api_key: secret

logging:
  level: info
)";

    std::string config_path = create_config_file("minimal.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.http.port, 8080);
    ASSERT_EQ(config.providers.size(), 1);
    EXPECT_EQ(config.providers[0].name, "duix");
    EXPECT_EQ(config.providers[0].dialect, Dialect::DUIX);
    EXPECT_EQ(config.providers[0].credential, "secret");
    EXPECT_EQ(config.providers[0].credential_ref, "inline");

    // Defaults for sections that were left out
    EXPECT_EQ(config.retry.max_attempts, 3);
    EXPECT_EQ(config.health.degrade_after_failures, 3);
    EXPECT_TRUE(config.cache.enabled);
    EXPECT_EQ(config.cache.ttl_ms, 5000);
}

TEST_F(ConfigTest, FullProviderDefinition) {
    std::string config_content = R"(
http:
  enabled: false

providers:
  - name: sense
    dialect: sense_avatar
    base_url: http://sense.local:9000
    speak_path: /custom/speak
    health_path: /status
    priority: 20
    timeout_ms: 3000
    languages: [zh, en]
    emotions: [neutral, happy]
    rate_limit:
      requests_per_second: 2.5
      burst: 5
)";

    std::string config_path = create_config_file("full_provider.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    const auto& p = config.providers.at(0);
    EXPECT_EQ(p.dialect, Dialect::SENSE_AVATAR);
    EXPECT_EQ(p.speak_path, "/custom/speak");
    EXPECT_EQ(p.health_path, "/status");
    EXPECT_EQ(p.priority, 20);
    EXPECT_EQ(p.timeout_ms, 3000);
    EXPECT_EQ(p.languages, (std::vector<std::string>{"zh", "en"}));
    EXPECT_EQ(p.emotions, (std::vector<std::string>{"neutral", "happy"}));
    EXPECT_TRUE(p.rate_limit.enabled);
    EXPECT_DOUBLE_EQ(p.rate_limit.requests_per_second, 2.5);
    EXPECT_DOUBLE_EQ(p.rate_limit.burst, 5.0);
}

TEST_F(ConfigTest, CredentialFromEnvironment) {
    ::setenv("AVATARLINK_TEST_AKOOL_KEY", "from-env", 1);

    std::string config_content = R"(
http:
  enabled: false

providers:
  - name: akool
    dialect: akool
    base_url: https://openapi.akool.test
    credential_env: AVATARLINK_TEST_AKOOL_KEY
)";

    std::string config_path = create_config_file("env_credential.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.providers[0].credential, "from-env");
    EXPECT_EQ(config.providers[0].credential_ref, "env:AVATARLINK_TEST_AKOOL_KEY");

    ::unsetenv("AVATARLINK_TEST_AKOOL_KEY");
}

TEST_F(ConfigTest, BothCredentialSourcesRejected) {
    std::string config_content = R"(
providers:
  - name: akool
    dialect: akool
    base_url: https://openapi.akool.test
    api_key: inline
    credential_env: SOME_VAR
)";

    std::string config_path = create_config_file("both_credentials.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("both"), std::string::npos);
}

TEST_F(ConfigTest, UnknownDialect) {
    std::string config_content = R"(
providers:
  - name: other
    dialect: heygen
    base_url: https://example.test
)";

    std::string config_path = create_config_file("unknown_dialect.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("unknown dialect"), std::string::npos);
}

TEST_F(ConfigTest, InvalidLogLevel) {
    std::string config_content = R"(
http:
  enabled: false

providers:
  - name: mock
    dialect: mock

logging:
  level: verbose
)";

    std::string config_path = create_config_file("invalid_log.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("Invalid log level"), std::string::npos);
}

TEST_F(ConfigTest, NestedTelemetryStructure) {
    std::string config_content = R"(
http:
  enabled: false

providers:
  - name: mock
    dialect: mock

telemetry:
  enabled: true
  influxdb:
    url: http://localhost:8086
    org: testorg
    bucket: testbucket
    token: testtoken
    batch_size: 50
    flush_interval_ms: 500
    queue_size: 2000
    max_retry_buffer_size: 300
)";

    std::string config_path = create_config_file("nested_telemetry.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_TRUE(config.telemetry.enabled);
    EXPECT_EQ(config.telemetry.influx_url, "http://localhost:8086");
    EXPECT_EQ(config.telemetry.influx_org, "testorg");
    EXPECT_EQ(config.telemetry.influx_bucket, "testbucket");
    EXPECT_EQ(config.telemetry.influx_token, "testtoken");
    EXPECT_EQ(config.telemetry.batch_size, 50);
    EXPECT_EQ(config.telemetry.flush_interval_ms, 500);
    EXPECT_EQ(config.telemetry.queue_size, 2000);
    EXPECT_EQ(config.telemetry.max_retry_buffer_size, 300);
}

TEST_F(ConfigTest, DeliveryPolicySections) {
    std::string config_content = R"(
runtime:
  name: studio-a
  config_reload_interval_ms: 0

client:
  avatar_id: host-01
  max_text_length: 500
  default_deadline_ms: 8000

retry:
  max_attempts: 4
  base_delay_ms: 100
  max_delay_ms: 2000

health:
  degrade_after_failures: 2
  unhealthy_after_failures: 3
  recover_after_successes: 4
  cooldown_base_ms: 1000
  cooldown_max_ms: 60000
  cooldown_factor: 3.0
  flap_reset_ms: 120000
  canary_claim_timeout_ms: 15000
  probe:
    enabled: true
    interval_ms: 5000
    jitter_ms: 500
    timeout_ms: 1500

cache:
  ttl_ms: 10000
  capacity: 256
  shards: 4

http:
  enabled: false

providers:
  - name: mock
    dialect: mock
)";

    std::string config_path = create_config_file("policies.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.runtime.name, "studio-a");
    EXPECT_EQ(config.runtime.config_reload_interval_ms, 0);
    EXPECT_EQ(config.client.avatar_id, "host-01");
    EXPECT_EQ(config.client.max_text_length, 500);
    EXPECT_EQ(config.client.default_deadline_ms, 8000);
    EXPECT_EQ(config.retry.max_attempts, 4);
    EXPECT_EQ(config.retry.base_delay_ms, 100);
    EXPECT_EQ(config.retry.max_delay_ms, 2000);
    EXPECT_EQ(config.health.degrade_after_failures, 2);
    EXPECT_EQ(config.health.unhealthy_after_failures, 3);
    EXPECT_EQ(config.health.recover_after_successes, 4);
    EXPECT_EQ(config.health.cooldown_base_ms, 1000);
    EXPECT_DOUBLE_EQ(config.health.cooldown_factor, 3.0);
    EXPECT_EQ(config.health.flap_reset_ms, 120000);
    EXPECT_EQ(config.health.canary_claim_timeout_ms, 15000);
    EXPECT_TRUE(config.probe.enabled);
    EXPECT_EQ(config.probe.interval_ms, 5000);
    EXPECT_EQ(config.probe.jitter_ms, 500);
    EXPECT_EQ(config.probe.timeout_ms, 1500);
    EXPECT_EQ(config.cache.ttl_ms, 10000);
    EXPECT_EQ(config.cache.capacity, 256);
    EXPECT_EQ(config.cache.shards, 4);
}

TEST_F(ConfigTest, UnknownKeysDoNotFailLoad) {
    std::string config_content = R"(
http:
  enabled: false

providers:
  - name: mock
    dialect: mock

automation:
  enabled: true
)";

    std::string config_path = create_config_file("unknown_keys.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    EXPECT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
}

TEST_F(ConfigTest, MissingProvidersSection) {
    std::string config_content = R"(
http:
  enabled: false

logging:
  level: info
)";

    std::string config_path = create_config_file("no_providers.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("at least one provider"), std::string::npos);
}

TEST_F(ConfigTest, HTTPBindAddressConfiguration) {
    std::string config_content = R"(
http:
  enabled: true
  bind: 0.0.0.0
  port: 9090
  cors_allowed_origins:
    - http://localhost:3000
  thread_pool_size: 8

providers:
  - name: mock
    dialect: mock
)";

    std::string config_path = create_config_file("http_bind.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.http.bind, "0.0.0.0");
    EXPECT_EQ(config.http.port, 9090);
    EXPECT_EQ(config.http.cors_allowed_origins, (std::vector<std::string>{"http://localhost:3000"}));
    EXPECT_EQ(config.http.thread_pool_size, 8);
}

TEST_F(ConfigTest, ValidLogLevels) {
    for (const std::string level : {"debug", "info", "warn", "error"}) {
        std::string config_content = R"(
http:
  enabled: false

providers:
  - name: mock
    dialect: mock

logging:
  level: )" + level + "\n";

        std::string config_path = create_config_file("log_" + level + ".yaml", config_content);
        RuntimeConfig config;
        std::string error;

        EXPECT_TRUE(load_config(config_path, config, error)) << "Level: " << level << ", Error: " << error;
    }
}

TEST_F(ConfigTest, FileNotFound) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config("/nonexistent/path/config.yaml", config, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, MalformedYaml) {
    std::string config_path = create_config_file("broken.yaml", "providers: [\n  - name: x\n");
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_FALSE(error.empty());
}

// ===== Validation Tests =====

TEST_F(ConfigTest, DefaultsWithOneProviderAreValid) {
    std::string error;
    EXPECT_TRUE(validate_config(valid_config(), error)) << error;
}

TEST_F(ConfigTest, DuplicateProviderNames) {
    RuntimeConfig config = valid_config();
    config.providers.push_back(config.providers[0]);

    std::string error;
    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("Duplicate provider name"), std::string::npos);
}

TEST_F(ConfigTest, HttpDialectNeedsBaseUrlWithScheme) {
    RuntimeConfig config = valid_config();
    config.providers[0].dialect = Dialect::DUIX;

    std::string error;
    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("base_url"), std::string::npos);

    config.providers[0].base_url = "api.duix.test";
    EXPECT_FALSE(validate_config(config, error));

    config.providers[0].base_url = "https://api.duix.test";
    EXPECT_TRUE(validate_config(config, error)) << error;
}

TEST_F(ConfigTest, ProviderTimeoutTooShort) {
    RuntimeConfig config = valid_config();
    config.providers[0].timeout_ms = 50;

    std::string error;
    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("timeout"), std::string::npos);
}

TEST_F(ConfigTest, RateLimitNeedsPositiveRate) {
    RuntimeConfig config = valid_config();
    config.providers[0].rate_limit.enabled = true;
    config.providers[0].rate_limit.requests_per_second = 0.0;

    std::string error;
    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("requests_per_second"), std::string::npos);
}

TEST_F(ConfigTest, RetryBackoffMismatch) {
    RuntimeConfig config = valid_config();
    config.retry.base_delay_ms = 1000;
    config.retry.max_delay_ms = 500;

    std::string error;
    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("base_delay_ms"), std::string::npos);
}

TEST_F(ConfigTest, RetryInvalidMaxAttempts) {
    RuntimeConfig config = valid_config();
    config.retry.max_attempts = 0;

    std::string error;
    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("max_attempts"), std::string::npos);
}

TEST_F(ConfigTest, HealthThresholdsMustBePositive) {
    RuntimeConfig config = valid_config();
    config.health.unhealthy_after_failures = 0;

    std::string error;
    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("thresholds"), std::string::npos);
}

TEST_F(ConfigTest, CooldownFactorBelowOne) {
    RuntimeConfig config = valid_config();
    config.health.cooldown_factor = 0.5;

    std::string error;
    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("cooldown_factor"), std::string::npos);
}

TEST_F(ConfigTest, ProbeJitterMustBeBelowInterval) {
    RuntimeConfig config = valid_config();
    config.probe.enabled = true;
    config.probe.interval_ms = 1000;
    config.probe.jitter_ms = 1000;

    std::string error;
    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("jitter_ms"), std::string::npos);
}

TEST_F(ConfigTest, CacheSettingsIgnoredWhenDisabled) {
    RuntimeConfig config = valid_config();
    config.cache.capacity = 0;

    std::string error;
    EXPECT_FALSE(validate_config(config, error));

    config.cache.enabled = false;
    EXPECT_TRUE(validate_config(config, error)) << error;
}

TEST_F(ConfigTest, CacheShardsMustNotExceedCapacity) {
    RuntimeConfig config = valid_config();
    config.cache.capacity = 4;
    config.cache.shards = 8;

    std::string error;
    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("cache.shards"), std::string::npos);

    config.cache.shards = 4;
    EXPECT_TRUE(validate_config(config, error)) << error;
}

TEST_F(ConfigTest, HttpPortOutOfRange) {
    RuntimeConfig config = valid_config();
    config.http.port = 70000;

    std::string error;
    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("port"), std::string::npos);
}
