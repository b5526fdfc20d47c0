#include "encryptor.hpp"
#include "../errors.hpp"
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

std::string buildOpenSSLErrorMessage(const char* context) {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return std::string(context) + ": unknown OpenSSL error";
    }
    char buf[256] = {0};
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(context) + ": " + buf;
}

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

std::vector<uint8_t> randomBytes(size_t size) {
    std::vector<uint8_t> out(size);
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
        throw EncryptionError(buildOpenSSLErrorMessage("RAND_bytes"));
    }
    return out;
}

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

Encryptor::Encryptor(const std::string& secret, EncryptionMode default_mode, size_t cache_capacity)
    : secret_(secret), default_mode_(default_mode), cache_capacity_(std::max<size_t>(cache_capacity, 1)) {
    if (isBlank(secret_)) {
        throw EncryptionError("Secret cannot be null or empty");
    }
}

Encryptor::~Encryptor() {
    clearCache();
    if (!secret_.empty()) {
        OPENSSL_cleanse(&secret_[0], secret_.size());
    }
}

EncryptionResult Encryptor::encryptToResult(const std::string& message) {
    return encryptToResult(message, default_mode_);
}

EncryptionResult Encryptor::encryptToResult(const std::string& message, EncryptionMode mode) {
    std::vector<uint8_t> salt = randomBytes(kSaltSize);
    std::vector<uint8_t> iv = randomBytes(kIvSize);

    Key key = deriveKey(salt, mode);

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw EncryptionError("Failed to allocate AES-GCM context");
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        throw EncryptionError(buildOpenSSLErrorMessage("EVP_EncryptInit_ex"));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1) {
        throw EncryptionError(buildOpenSSLErrorMessage("EVP_CTRL_GCM_SET_IVLEN"));
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1) {
        throw EncryptionError(buildOpenSSLErrorMessage("EVP_EncryptInit_ex key/iv"));
    }
    OPENSSL_cleanse(key.data(), key.size());

    std::vector<uint8_t> sealed(message.size() + kTagSize);
    int len = 0;
    int total = 0;
    if (!message.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), sealed.data(), &len,
                              reinterpret_cast<const unsigned char*>(message.data()),
                              static_cast<int>(message.size())) != 1) {
            throw EncryptionError(buildOpenSSLErrorMessage("EVP_EncryptUpdate"));
        }
        total = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), sealed.data() + total, &len) != 1) {
        throw EncryptionError(buildOpenSSLErrorMessage("EVP_EncryptFinal_ex"));
    }
    total += len;

    // GCM tag is appended after the ciphertext
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize),
                            sealed.data() + total) != 1) {
        throw EncryptionError(buildOpenSSLErrorMessage("EVP_CTRL_GCM_GET_TAG"));
    }
    sealed.resize(static_cast<size_t>(total) + kTagSize);

    EncryptionResult result;
    result.encrypted_payload = base64Encode(sealed);
    result.iv = base64Encode(iv);
    result.salt = base64Encode(salt);
    result.encryption_mode = encryption_mode::toValue(mode);
    return result;
}

std::string Encryptor::decryptFromComponents(const std::string& encrypted_payload,
                                             const std::string& iv,
                                             const std::string& salt,
                                             int mode_value) {
    if (encrypted_payload.empty() || iv.empty() || salt.empty()) {
        throw EncryptionError("Encrypted payload, IV, and salt cannot be empty");
    }

    std::vector<uint8_t> sealed = base64Decode(encrypted_payload);
    std::vector<uint8_t> iv_bytes = base64Decode(iv);
    std::vector<uint8_t> salt_bytes = base64Decode(salt);

    if (iv_bytes.size() != kIvSize) {
        throw EncryptionError("Invalid IV length: expected " + std::to_string(kIvSize) + " bytes");
    }
    if (salt_bytes.size() != kSaltSize) {
        throw EncryptionError("Invalid salt length: expected " + std::to_string(kSaltSize) + " bytes");
    }
    if (sealed.size() < kTagSize) {
        throw EncryptionError("Encrypted payload is shorter than the authentication tag");
    }

    EncryptionMode mode;
    try {
        mode = encryption_mode::fromValue(mode_value);
    } catch (const std::invalid_argument& e) {
        throw EncryptionError(std::string("Unsupported encryption mode: ") + e.what());
    }

    Key key = deriveKey(salt_bytes, mode);

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw EncryptionError("Failed to allocate AES-GCM context");
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        throw EncryptionError(buildOpenSSLErrorMessage("EVP_DecryptInit_ex"));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv_bytes.size()), nullptr) != 1) {
        throw EncryptionError(buildOpenSSLErrorMessage("EVP_CTRL_GCM_SET_IVLEN"));
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv_bytes.data()) != 1) {
        throw EncryptionError(buildOpenSSLErrorMessage("EVP_DecryptInit_ex key/iv"));
    }
    OPENSSL_cleanse(key.data(), key.size());

    size_t ciphertext_size = sealed.size() - kTagSize;
    std::vector<uint8_t> plaintext(ciphertext_size + kTagSize);
    int len = 0;
    int total = 0;
    if (ciphertext_size > 0) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, sealed.data(),
                              static_cast<int>(ciphertext_size)) != 1) {
            throw EncryptionError(buildOpenSSLErrorMessage("EVP_DecryptUpdate"));
        }
        total = len;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize),
                            sealed.data() + ciphertext_size) != 1) {
        throw EncryptionError(buildOpenSSLErrorMessage("EVP_CTRL_GCM_SET_TAG"));
    }
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) <= 0) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        throw EncryptionError("Failed to decrypt message: authentication failed");
    }
    total += len;

    std::string message(reinterpret_cast<const char*>(plaintext.data()), static_cast<size_t>(total));
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    return message;
}

std::string Encryptor::decrypt(const EncryptionResult& encrypted) {
    return decryptFromComponents(encrypted.encrypted_payload, encrypted.iv,
                                 encrypted.salt, encrypted.encryption_mode);
}

std::string Encryptor::encrypt(const std::string& message) {
    EncryptionResult result = encryptToResult(message);
    std::ostringstream combined;
    combined << result.encrypted_payload << "." << result.iv << "."
             << result.salt << "." << result.encryption_mode;
    std::string text = combined.str();
    return base64Encode(std::vector<uint8_t>(text.begin(), text.end()));
}

std::string Encryptor::decrypt(const std::string& packed) {
    if (isBlank(packed)) {
        throw EncryptionError("Encrypted data cannot be null or empty");
    }

    std::vector<uint8_t> decoded = base64Decode(packed);
    std::string combined(decoded.begin(), decoded.end());

    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(combined);
    while (std::getline(stream, part, '.')) {
        parts.push_back(part);
    }
    if (parts.size() != 4) {
        throw EncryptionError("Invalid encrypted data format");
    }

    int mode = 0;
    try {
        size_t consumed = 0;
        mode = std::stoi(parts[3], &consumed);
        if (consumed != parts[3].size()) {
            throw EncryptionError("Invalid encrypted data format");
        }
    } catch (const std::logic_error&) {
        throw EncryptionError("Invalid encrypted data format");
    }

    return decryptFromComponents(parts[0], parts[1], parts[2], mode);
}

void Encryptor::clearCache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    for (auto& kv : key_cache_) {
        OPENSSL_cleanse(kv.second.data(), kv.second.size());
    }
    key_cache_.clear();
    cache_order_.clear();
}

size_t Encryptor::cacheSize() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return key_cache_.size();
}

std::string Encryptor::base64Encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return std::string();
    }
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::vector<uint8_t> Encryptor::base64Decode(const std::string& text) {
    if (text.empty()) {
        return {};
    }
    if (text.size() % 4 != 0) {
        throw EncryptionError("Invalid base64 input length");
    }

    std::vector<uint8_t> out(3 * (text.size() / 4));
    int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0) {
        throw EncryptionError("Invalid base64 input");
    }

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (text[text.size() - 1] == '=') ++padding;
    if (text[text.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

Encryptor::Key Encryptor::deriveKey(const std::vector<uint8_t>& salt, EncryptionMode mode) {
    if (!encryption_mode::isImplemented(mode)) {
        throw EncryptionError(encryption_mode::toString(mode) + " key derivation not yet implemented");
    }

    std::string cache_key = std::to_string(encryption_mode::toValue(mode)) + ":" + base64Encode(salt);
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = key_cache_.find(cache_key);
        if (it != key_cache_.end()) {
            return it->second;
        }
    }

    // KDF runs outside the lock; concurrent derivations of the same salt are harmless
    Key key{};
    if (PKCS5_PBKDF2_HMAC(secret_.data(), static_cast<int>(secret_.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          kPbkdf2Iterations, EVP_sha256(),
                          static_cast<int>(key.size()), key.data()) != 1) {
        throw EncryptionError(buildOpenSSLErrorMessage("PKCS5_PBKDF2_HMAC"));
    }

    cacheKey(cache_key, key);
    return key;
}

void Encryptor::cacheKey(const std::string& cache_key, const Key& key) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (key_cache_.count(cache_key) != 0) {
        return;
    }
    while (key_cache_.size() >= cache_capacity_ && !cache_order_.empty()) {
        auto oldest = key_cache_.find(cache_order_.front());
        if (oldest != key_cache_.end()) {
            OPENSSL_cleanse(oldest->second.data(), oldest->second.size());
            key_cache_.erase(oldest);
        }
        cache_order_.pop_front();
    }
    key_cache_.emplace(cache_key, key);
    cache_order_.push_back(cache_key);
}
