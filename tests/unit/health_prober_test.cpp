#include "health/health_prober.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "mocks/mock_speak_adapter.hpp"

using namespace avatarlink;
using namespace avatarlink::health;
using namespace avatarlink::tests;
using delivery::AttemptOutcome;
using delivery::ErrorKind;
using namespace testing;
using std::chrono::milliseconds;

class HealthProberTest : public Test {
protected:
    void SetUp() override {
        HealthPolicy policy;
        policy.degrade_after_failures = 1;
        policy.unhealthy_after_failures = 1;
        policy.recover_after_successes = 1;
        policy.cooldown_base_ms = 1000;
        monitor = std::make_unique<HealthMonitor>(policy);

        healthy = make_mock_adapter("healthy");
        flaky = make_mock_adapter("flaky");
        std::string error;
        ASSERT_TRUE(registry.replace_all({healthy, flaky}, error)) << error;
        monitor->reconcile(registry.get_provider_names());

        config.interval_ms = 20;
        config.jitter_ms = 0;
        config.timeout_ms = 250;
    }

    void fail_flaky(int times) {
        for (int i = 0; i < times; ++i) {
            monitor->record_outcome("flaky", AttemptOutcome::retryable(ErrorKind::TRANSPORT_ERROR, "refused"), now);
        }
    }

    provider::ProviderRegistry registry;
    std::unique_ptr<HealthMonitor> monitor;
    std::shared_ptr<NiceMock<MockSpeakAdapter>> healthy;
    std::shared_ptr<NiceMock<MockSpeakAdapter>> flaky;
    ProbeConfig config;
    const HealthMonitor::Clock::time_point now = HealthMonitor::Clock::now();
};

TEST_F(HealthProberTest, HealthyProvidersAreNotProbed) {
    EXPECT_CALL(*healthy, probe(_)).Times(0);
    EXPECT_CALL(*flaky, probe(_)).Times(0);

    HealthProber prober(registry, *monitor, config);
    EXPECT_EQ(prober.probe_once(now), 0);
}

TEST_F(HealthProberTest, DegradedProviderRecoversThroughProbe) {
    fail_flaky(1);
    ASSERT_EQ(monitor->state_of("flaky"), HealthState::DEGRADED);

    EXPECT_CALL(*flaky, probe(milliseconds(250))).WillOnce(Return(AttemptOutcome::success("{}")));

    HealthProber prober(registry, *monitor, config);
    EXPECT_EQ(prober.probe_once(now), 1);
    EXPECT_EQ(monitor->state_of("flaky"), HealthState::HEALTHY);
    EXPECT_TRUE(monitor->get_snapshot("flaky")->last_probe_ago_ms.has_value());
}

TEST_F(HealthProberTest, UnhealthyProviderWaitsForCooldown) {
    fail_flaky(2);
    ASSERT_EQ(monitor->state_of("flaky"), HealthState::UNHEALTHY);

    HealthProber prober(registry, *monitor, config);

    EXPECT_CALL(*flaky, probe(_)).Times(0);
    EXPECT_EQ(prober.probe_once(now + milliseconds(500)), 0);
    Mock::VerifyAndClearExpectations(flaky.get());

    EXPECT_CALL(*flaky, probe(_)).WillOnce(Return(AttemptOutcome::success("{}")));
    EXPECT_EQ(prober.probe_once(now + milliseconds(1000)), 1);
    EXPECT_EQ(monitor->state_of("flaky"), HealthState::DEGRADED);
}

TEST_F(HealthProberTest, ProbeSkipsProviderWhoseCanaryIsTaken) {
    fail_flaky(2);
    const auto after_cooldown = now + milliseconds(1000);
    ASSERT_TRUE(monitor->try_claim_canary("flaky", after_cooldown));

    EXPECT_CALL(*flaky, probe(_)).Times(0);
    HealthProber prober(registry, *monitor, config);
    EXPECT_EQ(prober.probe_once(after_cooldown), 0);
}

TEST_F(HealthProberTest, RejectedProbeCountsAsFailure) {
    fail_flaky(1);

    // A 404 on the health path would not be charged on a speak call
    EXPECT_CALL(*flaky, probe(_))
        .WillOnce(Return(AttemptOutcome::fatal(ErrorKind::PROVIDER_REJECTED, "HTTP 404", 404)));

    HealthProber prober(registry, *monitor, config);
    prober.probe_once(now);

    auto snap = monitor->get_snapshot("flaky");
    EXPECT_EQ(snap->state, HealthState::UNHEALTHY);
    EXPECT_NE(snap->last_error.find("probe failed"), std::string::npos);
}

TEST_F(HealthProberTest, NextIntervalStaysWithinJitter) {
    config.interval_ms = 1000;
    config.jitter_ms = 200;
    HealthProber prober(registry, *monitor, config);

    for (int i = 0; i < 100; ++i) {
        auto interval = prober.next_interval();
        EXPECT_GE(interval.count(), 800);
        EXPECT_LE(interval.count(), 1200);
    }
}

TEST_F(HealthProberTest, BackgroundThreadProbesDegradedProvider) {
    fail_flaky(1);

    std::atomic<int> probes{0};
    ON_CALL(*flaky, probe(_)).WillByDefault(Invoke([&probes](milliseconds) {
        ++probes;
        return AttemptOutcome::retryable(ErrorKind::TRANSPORT_ERROR, "still down");
    }));

    HealthProber prober(registry, *monitor, config);
    prober.start();
    EXPECT_TRUE(prober.is_running());

    for (int i = 0; i < 100 && probes.load() == 0; ++i) {
        std::this_thread::sleep_for(milliseconds(10));
    }
    prober.stop();

    EXPECT_FALSE(prober.is_running());
    EXPECT_GE(probes.load(), 1);
}

TEST_F(HealthProberTest, DisabledProberDoesNotStart) {
    config.enabled = false;
    HealthProber prober(registry, *monitor, config);
    prober.start();
    EXPECT_FALSE(prober.is_running());
    prober.stop();
}
