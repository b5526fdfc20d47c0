#include "encryption_mode.hpp"
#include <cctype>
#include <stdexcept>

namespace encryption_mode {

std::string toString(EncryptionMode mode) {
    switch (mode) {
        case EncryptionMode::AES256_GCM_PBKDF2_SHA256_600K: return "AES256-GCM_PBKDF2-SHA256-600K";
        case EncryptionMode::AES256_GCM_SCRYPT:             return "AES256-GCM_SCRYPT";
        case EncryptionMode::AES256_GCM_ARGON2:             return "AES256-GCM_ARGON2";
        case EncryptionMode::CHACHA20_POLY1305_ARGON2:      return "ChaCha20-Poly1305_ARGON2";
    }
    return "UNKNOWN";
}

int toValue(EncryptionMode mode) {
    return static_cast<int>(mode);
}

EncryptionMode fromValue(int value) {
    if (value < 1 || value > 4) {
        throw std::invalid_argument("Invalid encryption mode value: " + std::to_string(value) +
                                    ". Valid values are 1-4.");
    }
    return static_cast<EncryptionMode>(value);
}

EncryptionMode fromName(const std::string& name) {
    for (int value = 1; value <= 4; ++value) {
        EncryptionMode mode = static_cast<EncryptionMode>(value);
        std::string candidate = toString(mode);
        if (candidate.size() != name.size()) {
            continue;
        }
        bool match = true;
        for (size_t i = 0; i < name.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(name[i])) !=
                std::tolower(static_cast<unsigned char>(candidate[i]))) {
                match = false;
                break;
            }
        }
        if (match) {
            return mode;
        }
    }
    throw std::invalid_argument("Invalid encryption mode name: " + name);
}

bool isImplemented(EncryptionMode mode) {
    return mode == EncryptionMode::AES256_GCM_PBKDF2_SHA256_600K;
}

} // namespace encryption_mode
