#include "errors.hpp"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Encryption:  return "encryption";
        case ErrorKind::QueueFull:   return "queue_full";
        case ErrorKind::Closed:      return "closed";
        case ErrorKind::Network:     return "network";
        case ErrorKind::Timeout:     return "timeout";
        case ErrorKind::ServerError: return "server_error";
        case ErrorKind::RateLimited: return "rate_limited";
        case ErrorKind::ClientError: return "client_error";
        case ErrorKind::Validation:  return "validation";
        case ErrorKind::Cancelled:   return "cancelled";
        case ErrorKind::Unknown:     return "unknown";
    }
    return "unknown";
}

ErrorKind classifyHttpStatus(int status) {
    if (status == 429) {
        return ErrorKind::RateLimited;
    }
    if (status >= 500 && status <= 599) {
        return ErrorKind::ServerError;
    }
    return ErrorKind::ClientError;
}
