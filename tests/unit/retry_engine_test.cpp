/**
 * retry_engine_test.cpp - Bounded retries, backoff and deadline handling
 *
 * The sleeper is replaced by a recorder and jitter is fixed, so backoff
 * never sleeps for real.
 */

#include "delivery/retry_engine.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "mocks/mock_speak_adapter.hpp"

using namespace avatarlink;
using namespace avatarlink::delivery;
using namespace avatarlink::tests;
using namespace testing;
using std::chrono::milliseconds;

namespace {

AttemptOutcome unavailable() { return AttemptOutcome::retryable(ErrorKind::PROVIDER_SERVER_ERROR, "HTTP 503", 503); }

DeliveryRequest request_for(const std::string &text) {
    DeliveryRequest request;
    request.payload.text = text;
    return request;
}

}  // namespace

class RetryEngineTest : public Test {
protected:
    RetryEngine make_engine(double jitter = 0.5) {
        return RetryEngine(
            policy, [this](milliseconds delay) { slept.push_back(delay); }, [jitter]() { return jitter; });
    }

    RetryPolicy policy{3, 200, 5000};
    std::vector<milliseconds> slept;
    std::shared_ptr<NiceMock<MockSpeakAdapter>> adapter = make_mock_adapter("a");
};

TEST_F(RetryEngineTest, FirstAttemptSuccessDoesNotSleep) {
    EXPECT_CALL(*adapter, speak(_, _)).WillOnce(Return(AttemptOutcome::success("ok")));

    auto engine = make_engine();
    auto report = engine.execute(*adapter, request_for("hi"));

    EXPECT_TRUE(report.outcome.is_success());
    EXPECT_EQ(report.attempts, 1);
    EXPECT_TRUE(report.delays.empty());
    EXPECT_TRUE(slept.empty());
}

TEST_F(RetryEngineTest, FinalAttemptLatencyIsStamped) {
    EXPECT_CALL(*adapter, speak(_, _))
        .WillOnce(Return(unavailable()))
        .WillOnce(Invoke([](const SpeakPayload &, milliseconds) {
            std::this_thread::sleep_for(milliseconds(20));
            return AttemptOutcome::success("ok");
        }));

    auto engine = make_engine();
    auto report = engine.execute(*adapter, request_for("hi"));

    ASSERT_TRUE(report.outcome.is_success());
    EXPECT_GE(report.outcome.latency_ms, 20);
}

TEST_F(RetryEngineTest, RetriesRetryableUntilSuccess) {
    EXPECT_CALL(*adapter, speak(_, _))
        .WillOnce(Return(unavailable()))
        .WillOnce(Return(unavailable()))
        .WillOnce(Return(AttemptOutcome::success("ok")));

    auto engine = make_engine(0.5);
    auto report = engine.execute(*adapter, request_for("hi"));

    EXPECT_TRUE(report.outcome.is_success());
    EXPECT_EQ(report.attempts, 3);
    EXPECT_THAT(slept, ElementsAre(milliseconds(100), milliseconds(200)));
    EXPECT_EQ(report.delays, slept);
}

TEST_F(RetryEngineTest, StopsAfterMaxAttempts) {
    EXPECT_CALL(*adapter, speak(_, _)).Times(3).WillRepeatedly(Return(unavailable()));

    auto engine = make_engine();
    auto report = engine.execute(*adapter, request_for("hi"));

    EXPECT_TRUE(report.outcome.is_retryable());
    EXPECT_EQ(report.outcome.cause.kind, ErrorKind::PROVIDER_SERVER_ERROR);
    EXPECT_EQ(report.attempts, 3);
    EXPECT_EQ(slept.size(), 2u);  // no sleep after the last attempt
}

TEST_F(RetryEngineTest, InvalidRequestIsNeverRetried) {
    EXPECT_CALL(*adapter, speak(_, _))
        .Times(1)
        .WillOnce(Return(AttemptOutcome::fatal(ErrorKind::INVALID_REQUEST, "HTTP 422", 422)));

    auto engine = make_engine();
    auto report = engine.execute(*adapter, request_for("hi"));

    EXPECT_EQ(report.outcome.cause.kind, ErrorKind::INVALID_REQUEST);
    EXPECT_EQ(report.attempts, 1);
    EXPECT_TRUE(slept.empty());
}

TEST_F(RetryEngineTest, ProviderRejectionIsNotRetried) {
    EXPECT_CALL(*adapter, speak(_, _))
        .Times(1)
        .WillOnce(Return(AttemptOutcome::fatal(ErrorKind::PROVIDER_REJECTED, "HTTP 404", 404)));

    auto engine = make_engine();
    EXPECT_EQ(engine.execute(*adapter, request_for("hi")).attempts, 1);
}

TEST_F(RetryEngineTest, BackoffCapDoublesAndSaturates) {
    policy = RetryPolicy{10, 200, 1000};
    auto engine = make_engine();

    EXPECT_EQ(engine.backoff_cap(1), milliseconds(200));
    EXPECT_EQ(engine.backoff_cap(2), milliseconds(400));
    EXPECT_EQ(engine.backoff_cap(3), milliseconds(800));
    EXPECT_EQ(engine.backoff_cap(4), milliseconds(1000));
    EXPECT_EQ(engine.backoff_cap(60), milliseconds(1000));
}

TEST_F(RetryEngineTest, JitteredDelayNeverExceedsCap) {
    policy = RetryPolicy{10, 200, 1000};
    RetryEngine engine(policy, [](milliseconds) {});  // real random source

    for (int attempt = 1; attempt <= 8; ++attempt) {
        for (int i = 0; i < 50; ++i) {
            const auto delay = engine.next_delay(attempt);
            EXPECT_GE(delay.count(), 0);
            EXPECT_LE(delay, engine.backoff_cap(attempt));
        }
    }
}

TEST_F(RetryEngineTest, ExpiredDeadlineSkipsProvider) {
    EXPECT_CALL(*adapter, speak(_, _)).Times(0);

    DeliveryRequest request = request_for("hi");
    request.deadline = Clock::now() - milliseconds(1);

    auto engine = make_engine();
    auto report = engine.execute(*adapter, request);

    EXPECT_EQ(report.attempts, 0);
    EXPECT_EQ(report.outcome.cause.kind, ErrorKind::TIMEOUT);
    EXPECT_TRUE(report.outcome.cause.caller_deadline);
}

TEST_F(RetryEngineTest, AttemptTimeoutClampedToDeadline) {
    milliseconds seen{0};
    EXPECT_CALL(*adapter, speak(_, _)).WillOnce(DoAll(SaveArg<1>(&seen), Return(AttemptOutcome::success("ok"))));

    DeliveryRequest request = request_for("hi");
    request.deadline = Clock::now() + milliseconds(300);

    auto engine = make_engine();
    engine.execute(*adapter, request);

    EXPECT_GT(seen.count(), 0);
    EXPECT_LE(seen, milliseconds(300));
}

TEST_F(RetryEngineTest, BackoffThatWouldOutliveDeadlineEndsRun) {
    EXPECT_CALL(*adapter, speak(_, _)).Times(1).WillOnce(Return(unavailable()));

    DeliveryRequest request = request_for("hi");
    request.deadline = Clock::now() + milliseconds(50);

    // jitter 0.99 of a 200ms cap is far beyond the remaining 50ms
    auto engine = make_engine(0.99);
    auto report = engine.execute(*adapter, request);

    EXPECT_EQ(report.attempts, 1);
    EXPECT_TRUE(report.outcome.cause.caller_deadline);
    EXPECT_TRUE(slept.empty());
}
