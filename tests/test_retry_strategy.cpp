#include <gtest/gtest.h>
#include "agent/retry_strategy.hpp"
#include "errors.hpp"
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using std::chrono::milliseconds;

namespace {

RetryStrategy noJitter(int max_retries = 5) {
    return RetryStrategy(max_retries, milliseconds(100), milliseconds(30000), 2.0, false);
}

// Records requested delays instead of sleeping
struct RecordingSleeper {
    std::vector<milliseconds> delays;

    RetryStrategy::Sleeper sleeper() {
        return [this](milliseconds delay) {
            delays.push_back(delay);
            return true;
        };
    }
};

} // namespace

TEST(RetryStrategyTest, DefaultStrategyUsesDocumentedDefaults) {
    RetryStrategy strategy = RetryStrategy::defaultStrategy();
    EXPECT_EQ(strategy.maxRetries(), 5);
    EXPECT_EQ(strategy.initialDelay(), milliseconds(100));
    EXPECT_EQ(strategy.maxDelay(), milliseconds(30000));
    EXPECT_DOUBLE_EQ(strategy.backoffFactor(), 2.0);
    EXPECT_TRUE(strategy.jitterEnabled());
}

TEST(RetryStrategyTest, RejectsInvalidParameters) {
    EXPECT_THROW(RetryStrategy(-1, milliseconds(1), milliseconds(1), 2.0, false), std::invalid_argument);
    EXPECT_THROW(RetryStrategy(1, milliseconds(1), milliseconds(1), 0.9, false), std::invalid_argument);
    EXPECT_THROW(RetryStrategy(1, milliseconds(-1), milliseconds(1), 2.0, false), std::invalid_argument);
}

TEST(RetryStrategyTest, DelayGrowsExponentiallyUpToMax) {
    RetryStrategy strategy(10, milliseconds(100), milliseconds(1000), 2.0, false);

    EXPECT_EQ(strategy.calculateDelay(-1), milliseconds(0));
    EXPECT_EQ(strategy.calculateDelay(0), milliseconds(100));
    EXPECT_EQ(strategy.calculateDelay(1), milliseconds(200));
    EXPECT_EQ(strategy.calculateDelay(2), milliseconds(400));
    EXPECT_EQ(strategy.calculateDelay(3), milliseconds(800));
    EXPECT_EQ(strategy.calculateDelay(4), milliseconds(1000));
    EXPECT_EQ(strategy.calculateDelay(10), milliseconds(1000));
    EXPECT_EQ(strategy.calculateDelay(50), milliseconds(1000));

    milliseconds previous(0);
    for (int attempt = 0; attempt < 12; ++attempt) {
        milliseconds delay = strategy.calculateDelay(attempt);
        EXPECT_GE(delay, previous);
        EXPECT_LE(delay, strategy.maxDelay());
        previous = delay;
    }
}

TEST(RetryStrategyTest, JitterStaysWithinFivePercent) {
    RetryStrategy strategy(10, milliseconds(1000), milliseconds(4000), 2.0, true);
    for (int i = 0; i < 200; ++i) {
        milliseconds base = strategy.calculateDelay(0);
        EXPECT_GE(base.count(), 950);
        EXPECT_LE(base.count(), 1050);

        milliseconds capped = strategy.calculateDelay(5);
        EXPECT_GE(capped.count(), 3800);
        EXPECT_LE(capped.count(), 4200);
    }
}

TEST(RetryStrategyTest, JitterNeverRoundsPastCapOnSmallDelays) {
    RetryStrategy strategy(10, milliseconds(13), milliseconds(13), 1.0, true);
    for (int i = 0; i < 1000; ++i) {
        milliseconds delay = strategy.calculateDelay(0);
        EXPECT_LE(static_cast<double>(delay.count()), 13 * 1.05);
        EXPECT_GE(delay.count(), 12);
    }
}

TEST(RetryStrategyTest, ShouldRetryBelowMax) {
    RetryStrategy strategy = noJitter(3);
    EXPECT_TRUE(strategy.shouldRetry(0));
    EXPECT_TRUE(strategy.shouldRetry(2));
    EXPECT_FALSE(strategy.shouldRetry(3));
    EXPECT_FALSE(noJitter(0).shouldRetry(0));
}

TEST(RetryStrategyTest, ClassifiesStructuredKinds) {
    EXPECT_TRUE(RetryStrategy::isRetryable(DeliveryError(ErrorKind::Network, "boom")));
    EXPECT_TRUE(RetryStrategy::isRetryable(DeliveryError(ErrorKind::Timeout, "slow")));
    EXPECT_TRUE(RetryStrategy::isRetryable(DeliveryError(ErrorKind::ServerError, "HTTP 502", 502)));
    EXPECT_TRUE(RetryStrategy::isRetryable(DeliveryError(ErrorKind::RateLimited, "HTTP 429", 429)));

    EXPECT_FALSE(RetryStrategy::isRetryable(DeliveryError(ErrorKind::ClientError, "HTTP 400", 400)));
    EXPECT_FALSE(RetryStrategy::isRetryable(DeliveryError(ErrorKind::Validation, "bad url")));
    EXPECT_FALSE(RetryStrategy::isRetryable(EncryptionError("connection timeout")));
    EXPECT_FALSE(RetryStrategy::isRetryable(DeliveryError(ErrorKind::Cancelled, "closed")));
}

TEST(RetryStrategyTest, ClassifiesPlainErrorsByMessage) {
    EXPECT_TRUE(RetryStrategy::isRetryable(std::runtime_error("Connection refused")));
    EXPECT_TRUE(RetryStrategy::isRetryable(std::runtime_error("connection reset by peer")));
    EXPECT_TRUE(RetryStrategy::isRetryable(std::runtime_error("Read timeout after 30s")));
    EXPECT_TRUE(RetryStrategy::isRetryable(std::runtime_error("Network is unreachable")));
    EXPECT_TRUE(RetryStrategy::isRetryable(std::runtime_error("No route to host")));
    EXPECT_TRUE(RetryStrategy::isRetryable(std::runtime_error("Service temporarily unavailable")));
    EXPECT_TRUE(RetryStrategy::isRetryable(std::runtime_error("HTTP 503: down")));
    EXPECT_TRUE(RetryStrategy::isRetryable(std::runtime_error("HTTP 429: slow down")));
    EXPECT_TRUE(RetryStrategy::isRetryable(LogFluxError(ErrorKind::Unknown, "connection refused")));

    EXPECT_FALSE(RetryStrategy::isRetryable(std::runtime_error("HTTP 400: bad request")));
    EXPECT_FALSE(RetryStrategy::isRetryable(std::invalid_argument("node cannot be empty")));
    EXPECT_FALSE(RetryStrategy::isRetryable(std::runtime_error("")));
}

TEST(RetryStrategyTest, ExecuteReturnsImmediateSuccess) {
    RetryStrategy strategy = noJitter();
    RecordingSleeper recorder;
    int calls = 0;

    int result = strategy.execute([&] { calls++; return 42; }, recorder.sleeper());

    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(recorder.delays.empty());
}

TEST(RetryStrategyTest, ExecuteRetriesTransientFailures) {
    RetryStrategy strategy = noJitter(3);
    RecordingSleeper recorder;
    int calls = 0;

    std::string result = strategy.execute([&]() -> std::string {
        if (++calls <= 2) {
            throw DeliveryError(ErrorKind::ServerError, "HTTP 503: unavailable", 503);
        }
        return "ok";
    }, recorder.sleeper());

    EXPECT_EQ(result, "ok");
    EXPECT_EQ(calls, 3);
    ASSERT_EQ(recorder.delays.size(), 2u);
    EXPECT_EQ(recorder.delays[0], milliseconds(100));
    EXPECT_EQ(recorder.delays[1], milliseconds(200));
}

TEST(RetryStrategyTest, ExecuteRethrowsNonRetryableWithoutDelay) {
    RetryStrategy strategy = noJitter(3);
    RecordingSleeper recorder;
    int calls = 0;

    EXPECT_THROW(strategy.execute([&]() -> int {
        calls++;
        throw DeliveryError(ErrorKind::ClientError, "HTTP 400: bad request", 400);
    }, recorder.sleeper()), DeliveryError);

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(recorder.delays.empty());
}

TEST(RetryStrategyTest, ExecuteGivesUpAfterMaxRetries) {
    RetryStrategy strategy = noJitter(2);
    RecordingSleeper recorder;
    int calls = 0;

    try {
        strategy.execute([&]() -> int {
            calls++;
            throw DeliveryError(ErrorKind::Network, "connection refused");
        }, recorder.sleeper());
        FAIL() << "Expected RetryExhaustedError";
    } catch (const RetryExhaustedError& e) {
        EXPECT_EQ(e.attempts(), 3);
        EXPECT_EQ(e.kind(), ErrorKind::Network);
        EXPECT_NE(std::string(e.what()).find("connection refused"), std::string::npos);
        EXPECT_THROW(std::rethrow_exception(e.lastError()), DeliveryError);
    }

    EXPECT_EQ(calls, 3);
    EXPECT_EQ(recorder.delays.size(), 2u);
}

TEST(RetryStrategyTest, ExecuteStopsWhenSleepIsInterrupted) {
    RetryStrategy strategy = noJitter(5);
    int calls = 0;

    EXPECT_THROW(strategy.execute([&]() -> int {
        calls++;
        throw DeliveryError(ErrorKind::Timeout, "timed out");
    }, [](milliseconds) { return false; }), RetryInterruptedError);

    EXPECT_EQ(calls, 1);
}

TEST(RetryStrategyTest, ExecuteWithoutSleeperActuallyWaits) {
    RetryStrategy strategy(1, milliseconds(20), milliseconds(20), 1.0, false);
    int calls = 0;

    auto start = std::chrono::steady_clock::now();
    strategy.execute([&] {
        if (++calls == 1) {
            throw std::runtime_error("connection reset");
        }
        return true;
    });

    EXPECT_EQ(calls, 2);
    EXPECT_GE(std::chrono::steady_clock::now() - start, milliseconds(15));
}

TEST(ErrorKindTest, HttpStatusMapping) {
    EXPECT_EQ(classifyHttpStatus(429), ErrorKind::RateLimited);
    EXPECT_EQ(classifyHttpStatus(500), ErrorKind::ServerError);
    EXPECT_EQ(classifyHttpStatus(503), ErrorKind::ServerError);
    EXPECT_EQ(classifyHttpStatus(400), ErrorKind::ClientError);
    EXPECT_EQ(classifyHttpStatus(401), ErrorKind::ClientError);
    EXPECT_EQ(classifyHttpStatus(0), ErrorKind::ClientError);

    EXPECT_STREQ(errorKindName(ErrorKind::RateLimited), "rate_limited");
    EXPECT_STREQ(errorKindName(ErrorKind::Cancelled), "cancelled");
}
