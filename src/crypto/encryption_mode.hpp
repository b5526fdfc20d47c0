#ifndef ENCRYPTION_MODE_HPP
#define ENCRYPTION_MODE_HPP

#include <string>

// Encryption schemes understood by the ingestion API. Only the PBKDF2 scheme
// is implemented; the others are reserved and rejected by the Encryptor.
enum class EncryptionMode {
    AES256_GCM_PBKDF2_SHA256_600K = 1,
    AES256_GCM_SCRYPT = 2,
    AES256_GCM_ARGON2 = 3,
    CHACHA20_POLY1305_ARGON2 = 4
};

namespace encryption_mode {

std::string toString(EncryptionMode mode);

int toValue(EncryptionMode mode);

// Throws std::invalid_argument outside 1-4
EncryptionMode fromValue(int value);

// Case-insensitive match on the names returned by toString()
EncryptionMode fromName(const std::string& name);

bool isImplemented(EncryptionMode mode);

} // namespace encryption_mode

#endif // ENCRYPTION_MODE_HPP
