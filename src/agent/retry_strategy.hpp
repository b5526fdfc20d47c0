#ifndef RETRY_STRATEGY_HPP
#define RETRY_STRATEGY_HPP

#include "../config.hpp"
#include "../errors.hpp"
#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <thread>

// Exponential backoff with optional +/-5% jitter.
//
// execute() makes at most maxRetries + 1 attempts. Failures that are not
// retryable are rethrown unchanged; a retryable failure that survives every
// attempt surfaces as RetryExhaustedError.
class RetryStrategy {
public:
    // Sleeps for the given delay. Returns false if the wait was interrupted.
    using Sleeper = std::function<bool(std::chrono::milliseconds)>;

    static constexpr double kJitterFraction = 0.05;

    RetryStrategy(int max_retries,
                  std::chrono::milliseconds initial_delay,
                  std::chrono::milliseconds max_delay,
                  double backoff_factor,
                  bool jitter_enabled);
    explicit RetryStrategy(const RetryConfig& config);

    static RetryStrategy defaultStrategy();

    std::chrono::milliseconds calculateDelay(int attempt) const;
    bool shouldRetry(int attempt) const { return attempt < max_retries_; }

    // Structured kinds first (Network, Timeout, ServerError, RateLimited),
    // then a lowercase match on the message for errors without a kind.
    static bool isRetryable(const std::exception& error);

    template <typename Operation>
    auto execute(Operation&& operation, const Sleeper& sleeper = Sleeper()) const
        -> decltype(operation()) {
        for (int attempt = 0;; ++attempt) {
            std::exception_ptr failure;
            ErrorKind failure_kind = ErrorKind::Unknown;
            std::string failure_message;

            try {
                return operation();
            } catch (const std::exception& e) {
                if (!isRetryable(e)) {
                    throw;
                }
                failure = std::current_exception();
                failure_kind = kindOf(e);
                failure_message = e.what();
            }

            if (!shouldRetry(attempt)) {
                throw RetryExhaustedError(attempt + 1, failure_kind, failure_message, failure);
            }

            std::chrono::milliseconds delay = calculateDelay(attempt);
            if (sleeper) {
                if (!sleeper(delay)) {
                    throw RetryInterruptedError("Retry interrupted after attempt " +
                                                std::to_string(attempt + 1) + ": " + failure_message);
                }
            } else {
                std::this_thread::sleep_for(delay);
            }
        }
    }

    int maxRetries() const { return max_retries_; }
    std::chrono::milliseconds initialDelay() const { return initial_delay_; }
    std::chrono::milliseconds maxDelay() const { return max_delay_; }
    double backoffFactor() const { return backoff_factor_; }
    bool jitterEnabled() const { return jitter_enabled_; }

private:
    int max_retries_;
    std::chrono::milliseconds initial_delay_;
    std::chrono::milliseconds max_delay_;
    double backoff_factor_;
    bool jitter_enabled_;

    static ErrorKind kindOf(const std::exception& error);
};

#endif // RETRY_STRATEGY_HPP
