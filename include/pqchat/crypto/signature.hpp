#pragma once

#include "pqchat/crypto/algorithms.hpp"
#include "pqchat/crypto/crypto_types.hpp"
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pqchat::crypto {

class SignatureEngine {
public:
    static std::optional<std::string> resolve(SignatureAlgorithm algorithm);
    static bool is_available(SignatureAlgorithm algorithm);

    CryptoResult generate_keypair(
        SignatureAlgorithm algorithm,
        Bytes& out_public_key,
        SecureBytes& out_private_key
    ) const;

    CryptoResult sign(
        std::span<const std::uint8_t> message,
        std::span<const std::uint8_t> private_key,
        SignatureAlgorithm algorithm,
        Bytes& out_signature
    ) const;

    CryptoResult verify(
        std::span<const std::uint8_t> message,
        std::span<const std::uint8_t> signature,
        std::span<const std::uint8_t> public_key,
        SignatureAlgorithm algorithm
    ) const;

    CryptoResult sign_string(
        const std::string& message,
        std::span<const std::uint8_t> private_key,
        SignatureAlgorithm algorithm,
        Bytes& out_signature
    ) const;

    CryptoResult verify_string(
        const std::string& message,
        std::span<const std::uint8_t> signature,
        std::span<const std::uint8_t> public_key,
        SignatureAlgorithm algorithm
    ) const;
};

}
