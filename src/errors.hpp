#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

// Tag carried by every pipeline error so callers and the retry strategy can
// tell transient failures from permanent ones without parsing messages.
enum class ErrorKind {
    Encryption,
    QueueFull,
    Closed,
    Network,      // connection refused/reset, DNS, routing
    Timeout,
    ServerError,  // HTTP 5xx
    RateLimited,  // HTTP 429
    ClientError,  // HTTP 4xx other than 429
    Validation,
    Cancelled,
    Unknown
};

const char* errorKindName(ErrorKind kind);

class LogFluxError : public std::runtime_error {
public:
    LogFluxError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Bad secret, corrupt ciphertext, tag mismatch or unsupported scheme.
// Never retried.
class EncryptionError : public LogFluxError {
public:
    explicit EncryptionError(const std::string& message)
        : LogFluxError(ErrorKind::Encryption, message) {}
};

class QueueFullError : public LogFluxError {
public:
    explicit QueueFullError(const std::string& message)
        : LogFluxError(ErrorKind::QueueFull, message) {}
};

// Failure reported by a DeliveryPort. http_status is 0 when no response was received.
class DeliveryError : public LogFluxError {
public:
    DeliveryError(ErrorKind kind, const std::string& message, int http_status = 0)
        : LogFluxError(kind, message), http_status_(http_status) {}

    int httpStatus() const { return http_status_; }

private:
    int http_status_;
};

// Raised once a retryable failure persists through every allowed attempt
class RetryExhaustedError : public LogFluxError {
public:
    RetryExhaustedError(int attempts, ErrorKind last_kind, const std::string& last_message,
                        std::exception_ptr last_error)
        : LogFluxError(last_kind, "Delivery failed after " + std::to_string(attempts) +
                                      " attempts: " + last_message),
          attempts_(attempts), last_error_(std::move(last_error)) {}

    int attempts() const { return attempts_; }
    std::exception_ptr lastError() const { return last_error_; }

private:
    int attempts_;
    std::exception_ptr last_error_;
};

// A retry delay was cut short by pipeline shutdown
class RetryInterruptedError : public LogFluxError {
public:
    explicit RetryInterruptedError(const std::string& message)
        : LogFluxError(ErrorKind::Cancelled, message) {}
};

// Map an HTTP status code to its error kind (ClientError for anything unrecognized)
ErrorKind classifyHttpStatus(int status);

#endif // ERRORS_HPP
