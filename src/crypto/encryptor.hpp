#ifndef ENCRYPTOR_HPP
#define ENCRYPTOR_HPP

#include "encryption_mode.hpp"
#include <array>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Output of a single encryption. All byte fields are base64 encoded.
struct EncryptionResult {
    std::string encrypted_payload;  // ciphertext followed by the 16-byte GCM tag
    std::string iv;                 // 12 bytes
    std::string salt;               // 32 bytes
    int encryption_mode = 0;
};

// Per-message authenticated encryption bound to one shared secret.
//
// Every call draws a fresh salt and IV, derives a 256-bit key with
// PBKDF2-HMAC-SHA256 (600,000 iterations) and seals the message with
// AES-256-GCM. Derived keys are cached per (mode, salt) so decrypting an
// entry produced by the same instance skips the KDF. The cache is bounded and
// wiped on clearCache().
//
// Thread-safe. All failures throw EncryptionError.
class Encryptor {
public:
    static constexpr size_t kKeySize = 32;
    static constexpr size_t kIvSize = 12;
    static constexpr size_t kTagSize = 16;
    static constexpr size_t kSaltSize = 32;
    static constexpr int kPbkdf2Iterations = 600000;
    static constexpr size_t kDefaultCacheCapacity = 1024;

    explicit Encryptor(const std::string& secret,
                       EncryptionMode default_mode = EncryptionMode::AES256_GCM_PBKDF2_SHA256_600K,
                       size_t cache_capacity = kDefaultCacheCapacity);
    ~Encryptor();

    Encryptor(const Encryptor&) = delete;
    Encryptor& operator=(const Encryptor&) = delete;

    EncryptionResult encryptToResult(const std::string& message);
    EncryptionResult encryptToResult(const std::string& message, EncryptionMode mode);

    std::string decryptFromComponents(const std::string& encrypted_payload,
                                      const std::string& iv,
                                      const std::string& salt,
                                      int mode_value);
    std::string decrypt(const EncryptionResult& encrypted);

    // Single-string form: base64("payload.iv.salt.mode")
    std::string encrypt(const std::string& message);
    std::string decrypt(const std::string& packed);

    // Drop and wipe every cached key
    void clearCache();
    size_t cacheSize() const;

    static std::string base64Encode(const std::vector<uint8_t>& data);
    static std::vector<uint8_t> base64Decode(const std::string& text);

private:
    using Key = std::array<uint8_t, kKeySize>;

    std::string secret_;
    EncryptionMode default_mode_;
    size_t cache_capacity_;

    mutable std::mutex cache_mutex_;
    std::unordered_map<std::string, Key> key_cache_;
    std::deque<std::string> cache_order_;  // insertion order for eviction

    Key deriveKey(const std::vector<uint8_t>& salt, EncryptionMode mode);
    void cacheKey(const std::string& cache_key, const Key& key);
};

#endif // ENCRYPTOR_HPP
