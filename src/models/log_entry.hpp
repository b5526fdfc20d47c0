#ifndef LOG_ENTRY_HPP
#define LOG_ENTRY_HPP

#include "log_level.hpp"
#include "../crypto/encryptor.hpp"
#include <chrono>
#include <string>

// One encrypted, timestamped, leveled message awaiting delivery.
// Immutable once constructed; payload, iv and salt are base64 text.
class LogEntry {
public:
    static constexpr size_t kMaxNodeLength = 255;

    // Throws std::invalid_argument if any field is out of range
    LogEntry(std::string node,
             std::string payload,
             LogLevel level,
             std::chrono::system_clock::time_point timestamp,
             int encryption_mode,
             std::string iv,
             std::string salt);

    // Build an entry from the output of Encryptor::encryptToResult
    static LogEntry fromEncryption(const std::string& node,
                                   const EncryptionResult& encrypted,
                                   LogLevel level,
                                   std::chrono::system_clock::time_point timestamp);

    const std::string& node() const { return node_; }
    const std::string& payload() const { return payload_; }
    LogLevel level() const { return level_; }
    std::chrono::system_clock::time_point timestamp() const { return timestamp_; }
    int encryptionMode() const { return encryption_mode_; }
    const std::string& iv() const { return iv_; }
    const std::string& salt() const { return salt_; }

    // The cryptographic fields needed by Encryptor::decryptFromComponents
    EncryptionResult encryption() const;

    bool operator==(const LogEntry& other) const;
    bool operator!=(const LogEntry& other) const { return !(*this == other); }

private:
    std::string node_;
    std::string payload_;
    LogLevel level_;
    std::chrono::system_clock::time_point timestamp_;
    int encryption_mode_;
    std::string iv_;
    std::string salt_;
};

#endif // LOG_ENTRY_HPP
