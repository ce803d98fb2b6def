#include "pqchat/crypto/random.hpp"
#include "pqchat/core/logger.hpp"
#include <sodium.h>
#include <array>
#include <stdexcept>

namespace pqchat::crypto {

bool SecureRandom::initialized_ = false;

bool SecureRandom::initialize() {
    if (initialized_) {
        return true;
    }

    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }

    initialized_ = true;
    LOG_INFO("Cryptographic random number generator initialized");
    return true;
}

void SecureRandom::cleanup() {
    // libsodium doesn't require explicit cleanup
    initialized_ = false;
}

CryptoResult SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialized_) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "Random generator not initialized");
    }

    if (output.empty()) {
        return CryptoResult(CryptoError::RANDOM_GENERATION_FAILED, "Output buffer is empty");
    }

    randombytes_buf(output.data(), output.size());
    return CryptoResult();
}

CryptoResult SecureRandom::generate_bytes(std::vector<std::uint8_t>& output) {
    return generate_bytes(std::span(output));
}

SecureBytes SecureRandom::generate_bytes(size_t count) {
    SecureBytes result(count);
    auto crypto_result = generate_bytes(result.span());
    if (!crypto_result.success()) {
        throw std::runtime_error("Failed to generate random bytes: " + crypto_result.message);
    }
    return result;
}

std::string SecureRandom::generate_uuid() {
    std::array<std::uint8_t, 16> bytes;
    randombytes_buf(bytes.data(), bytes.size());
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    static constexpr char digits[] = "0123456789abcdef";
    std::string uuid;
    uuid.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            uuid.push_back('-');
        }
        uuid.push_back(digits[bytes[i] >> 4]);
        uuid.push_back(digits[bytes[i] & 0x0F]);
    }
    return uuid;
}

}
