#include "retry_strategy.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <random>
#include <stdexcept>

namespace {

const char* const kRetryablePatterns[] = {
    "connection refused",
    "connection reset",
    "connection timed out",
    "timeout",
    "timed out",
    "network is unreachable",
    "no route to host",
    "temporarily unavailable",
    "http 5",
    "http 429",
};

std::string toLower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

} // namespace

RetryStrategy::RetryStrategy(int max_retries,
                             std::chrono::milliseconds initial_delay,
                             std::chrono::milliseconds max_delay,
                             double backoff_factor,
                             bool jitter_enabled)
    : max_retries_(max_retries)
    , initial_delay_(initial_delay)
    , max_delay_(max_delay)
    , backoff_factor_(backoff_factor)
    , jitter_enabled_(jitter_enabled) {
    if (max_retries < 0) {
        throw std::invalid_argument("Max retries cannot be negative");
    }
    if (initial_delay.count() < 0 || max_delay.count() < 0) {
        throw std::invalid_argument("Retry delays cannot be negative");
    }
    if (backoff_factor < 1.0) {
        throw std::invalid_argument("Backoff factor must be >= 1.0");
    }
}

RetryStrategy::RetryStrategy(const RetryConfig& config)
    : RetryStrategy(config.max_retries,
                    config.initial_delay,
                    config.max_delay,
                    config.backoff_factor,
                    config.jitter_enabled) {}

RetryStrategy RetryStrategy::defaultStrategy() {
    return RetryStrategy(RetryConfig());
}

std::chrono::milliseconds RetryStrategy::calculateDelay(int attempt) const {
    if (attempt < 0) {
        return std::chrono::milliseconds(0);
    }
    if (attempt >= max_retries_) {
        return max_delay_;
    }

    double delay = static_cast<double>(initial_delay_.count()) * std::pow(backoff_factor_, attempt);
    delay = std::min(delay, static_cast<double>(max_delay_.count()));

    if (jitter_enabled_) {
        static thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_real_distribution<double> dist(-kJitterFraction, kJitterFraction);
        delay += delay * dist(gen);
    }

    return std::chrono::milliseconds(static_cast<int64_t>(std::max(0.0, std::floor(delay))));
}

bool RetryStrategy::isRetryable(const std::exception& error) {
    if (auto* logflux_error = dynamic_cast<const LogFluxError*>(&error)) {
        switch (logflux_error->kind()) {
            case ErrorKind::Network:
            case ErrorKind::Timeout:
            case ErrorKind::ServerError:
            case ErrorKind::RateLimited:
                return true;
            case ErrorKind::Unknown:
                break;  // fall through to message matching
            default:
                return false;
        }
    }

    std::string message = toLower(error.what());
    for (const char* pattern : kRetryablePatterns) {
        if (message.find(pattern) != std::string::npos) {
            return true;
        }
    }
    return false;
}

ErrorKind RetryStrategy::kindOf(const std::exception& error) {
    if (auto* logflux_error = dynamic_cast<const LogFluxError*>(&error)) {
        if (logflux_error->kind() != ErrorKind::Unknown) {
            return logflux_error->kind();
        }
    }

    std::string message = toLower(error.what());
    if (message.find("http 429") != std::string::npos) {
        return ErrorKind::RateLimited;
    }
    if (message.find("http 5") != std::string::npos) {
        return ErrorKind::ServerError;
    }
    if (message.find("timeout") != std::string::npos || message.find("timed out") != std::string::npos) {
        return ErrorKind::Timeout;
    }
    return ErrorKind::Network;
}
