#pragma once

#include <array>
#include <vector>
#include <span>
#include <string>
#include <cstdint>

namespace pqchat::crypto {

// Sizes shared by every algorithm family
constexpr size_t SYMMETRIC_KEY_SIZE = 32;
constexpr size_t SHA3_256_HASH_SIZE = 32;

constexpr size_t AES_GCM_IV_SIZE = 12;
constexpr size_t AES_GCM_TAG_SIZE = 16;
constexpr size_t SALSA20_NONCE_SIZE = 8;
constexpr size_t CHACHA20_NONCE_SIZE = 12;

constexpr size_t FINGERPRINT_HEX_LENGTH = SHA3_256_HASH_SIZE * 2;

using SymmetricKey = std::array<std::uint8_t, SYMMETRIC_KEY_SIZE>;
using Sha3Hash = std::array<std::uint8_t, SHA3_256_HASH_SIZE>;

using Bytes = std::vector<std::uint8_t>;

// Secure memory utilities
struct SecureBytes {
    std::vector<std::uint8_t> data;

    SecureBytes() = default;
    explicit SecureBytes(size_t size);
    SecureBytes(const std::vector<std::uint8_t>& bytes);
    SecureBytes(std::span<const std::uint8_t> bytes);

    ~SecureBytes();

    // Disable copy to prevent key material leakage
    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;

    SecureBytes(SecureBytes&& other) noexcept;
    SecureBytes& operator=(SecureBytes&& other) noexcept;

    // Explicit deep copy for the few places that must hold two owners
    SecureBytes clone() const;

    std::uint8_t* data_ptr() { return data.data(); }
    const std::uint8_t* data_ptr() const { return data.data(); }
    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }

    std::span<std::uint8_t> span() { return std::span(data); }
    std::span<const std::uint8_t> span() const { return std::span(data); }

    void clear();
    void resize(size_t new_size);
};

// Error types for crypto and key-establishment operations
enum class CryptoError {
    SUCCESS = 0,
    NOT_INITIALIZED,
    UNSUPPORTED_ALGORITHM,
    INVALID_KEY_MATERIAL,
    AUTHENTICATION_FAILED,
    MISSING_TRANSIENT_SECRET,
    KEYS_NOT_ESTABLISHED,
    INVALID_STATE,
    INVALID_MESSAGE,
    CHAT_NOT_FOUND,
    STORAGE_FAILED,
    TRANSPORT_FAILED,
    ENCRYPTION_FAILED,
    DECRYPTION_FAILED,
    KEY_GENERATION_FAILED,
    VERIFICATION_FAILED,
    RANDOM_GENERATION_FAILED,
    IO_FAILED
};

const char* to_string(CryptoError error);

struct CryptoResult {
    CryptoError error;
    std::string message;

    CryptoResult(CryptoError err = CryptoError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == CryptoError::SUCCESS; }
    operator bool() const { return success(); }
};

}
