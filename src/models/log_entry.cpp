#include "log_entry.hpp"
#include <stdexcept>
#include <utility>

LogEntry::LogEntry(std::string node,
                   std::string payload,
                   LogLevel level,
                   std::chrono::system_clock::time_point timestamp,
                   int encryption_mode,
                   std::string iv,
                   std::string salt)
    : node_(std::move(node))
    , payload_(std::move(payload))
    , level_(level)
    , timestamp_(timestamp)
    , encryption_mode_(encryption_mode)
    , iv_(std::move(iv))
    , salt_(std::move(salt)) {

    if (node_.empty()) {
        throw std::invalid_argument("Node cannot be empty");
    }
    if (node_.size() > kMaxNodeLength) {
        throw std::invalid_argument("Node field exceeds maximum length of 255 characters");
    }
    if (payload_.empty()) {
        throw std::invalid_argument("Payload cannot be empty");
    }
    int level_value = static_cast<int>(level_);
    if (level_value < 0 || level_value > 4) {
        throw std::invalid_argument("Log level must be between 0 and 4");
    }
    if (encryption_mode_ < 1 || encryption_mode_ > 4) {
        throw std::invalid_argument("Encryption mode must be between 1 and 4");
    }
    if (iv_.empty() || salt_.empty()) {
        throw std::invalid_argument("IV and salt cannot be empty");
    }
}

LogEntry LogEntry::fromEncryption(const std::string& node,
                                  const EncryptionResult& encrypted,
                                  LogLevel level,
                                  std::chrono::system_clock::time_point timestamp) {
    return LogEntry(node,
                    encrypted.encrypted_payload,
                    level,
                    timestamp,
                    encrypted.encryption_mode,
                    encrypted.iv,
                    encrypted.salt);
}

EncryptionResult LogEntry::encryption() const {
    EncryptionResult result;
    result.encrypted_payload = payload_;
    result.iv = iv_;
    result.salt = salt_;
    result.encryption_mode = encryption_mode_;
    return result;
}

bool LogEntry::operator==(const LogEntry& other) const {
    return node_ == other.node_ &&
           payload_ == other.payload_ &&
           level_ == other.level_ &&
           timestamp_ == other.timestamp_ &&
           encryption_mode_ == other.encryption_mode_ &&
           iv_ == other.iv_ &&
           salt_ == other.salt_;
}
