#include "pqchat/crypto/crypto_types.hpp"
#include <algorithm>
#include <cstring>

#include <sodium.h>

namespace pqchat::crypto {

SecureBytes::SecureBytes(size_t size) : data(size) {
    sodium_memzero(data.data(), data.size());
}

SecureBytes::SecureBytes(const std::vector<std::uint8_t>& bytes) : data(bytes) {}

SecureBytes::SecureBytes(std::span<const std::uint8_t> bytes)
    : data(bytes.begin(), bytes.end()) {}

SecureBytes::~SecureBytes() {
    clear();
}

SecureBytes::SecureBytes(SecureBytes&& other) noexcept
    : data(std::move(other.data)) {
    other.data.clear();
}

SecureBytes& SecureBytes::operator=(SecureBytes&& other) noexcept {
    if (this != &other) {
        clear();
        data = std::move(other.data);
        other.data.clear();
    }
    return *this;
}

SecureBytes SecureBytes::clone() const {
    return SecureBytes(span());
}

void SecureBytes::clear() {
    if (!data.empty()) {
        sodium_memzero(data.data(), data.size());
        data.clear();
    }
}

void SecureBytes::resize(size_t new_size) {
    size_t old_size = data.size();
    if (new_size < old_size) {
        sodium_memzero(data.data() + new_size, old_size - new_size);
    }
    data.resize(new_size);

    if (new_size > old_size) {
        sodium_memzero(data.data() + old_size, new_size - old_size);
    }
}

const char* to_string(CryptoError error) {
    switch (error) {
        case CryptoError::SUCCESS: return "SUCCESS";
        case CryptoError::NOT_INITIALIZED: return "NOT_INITIALIZED";
        case CryptoError::UNSUPPORTED_ALGORITHM: return "UNSUPPORTED_ALGORITHM";
        case CryptoError::INVALID_KEY_MATERIAL: return "INVALID_KEY_MATERIAL";
        case CryptoError::AUTHENTICATION_FAILED: return "AUTHENTICATION_FAILED";
        case CryptoError::MISSING_TRANSIENT_SECRET: return "MISSING_TRANSIENT_SECRET";
        case CryptoError::KEYS_NOT_ESTABLISHED: return "KEYS_NOT_ESTABLISHED";
        case CryptoError::INVALID_STATE: return "INVALID_STATE";
        case CryptoError::INVALID_MESSAGE: return "INVALID_MESSAGE";
        case CryptoError::CHAT_NOT_FOUND: return "CHAT_NOT_FOUND";
        case CryptoError::STORAGE_FAILED: return "STORAGE_FAILED";
        case CryptoError::TRANSPORT_FAILED: return "TRANSPORT_FAILED";
        case CryptoError::ENCRYPTION_FAILED: return "ENCRYPTION_FAILED";
        case CryptoError::DECRYPTION_FAILED: return "DECRYPTION_FAILED";
        case CryptoError::KEY_GENERATION_FAILED: return "KEY_GENERATION_FAILED";
        case CryptoError::VERIFICATION_FAILED: return "VERIFICATION_FAILED";
        case CryptoError::RANDOM_GENERATION_FAILED: return "RANDOM_GENERATION_FAILED";
        case CryptoError::IO_FAILED: return "IO_FAILED";
    }
    return "UNKNOWN";
}

}
