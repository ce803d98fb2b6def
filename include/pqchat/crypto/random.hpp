#pragma once

#include "pqchat/crypto/crypto_types.hpp"
#include <span>
#include <vector>
#include <cstdint>

namespace pqchat::crypto {

class SecureRandom {
public:
    static bool initialize();
    static void cleanup();
    static bool is_initialized() { return initialized_; }

    static CryptoResult generate_bytes(std::span<std::uint8_t> output);
    static CryptoResult generate_bytes(std::vector<std::uint8_t>& output);
    static SecureBytes generate_bytes(size_t count);

    // Random RFC 4122 version 4 identifier, lower-case with dashes
    static std::string generate_uuid();

private:
    static bool initialized_;
};

}
