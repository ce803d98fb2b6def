#pragma once

#include "pqchat/crypto/algorithms.hpp"
#include "pqchat/crypto/crypto_types.hpp"
#include <optional>
#include <span>
#include <string>

namespace pqchat::crypto {

struct KemParameters {
    std::string oqs_name;
    size_t public_key_size = 0;
    size_t private_key_size = 0;
    size_t capsule_size = 0;
    size_t shared_secret_size = 0;
};

// Post-quantum key encapsulation over liboqs. A fresh OQS_KEM object is
// created per call, so one engine is safe to share between threads.
class KemEngine {
public:
    // First liboqs identifier enabled in the linked build, if any
    static std::optional<std::string> resolve(KemAlgorithm algorithm);
    static bool is_available(KemAlgorithm algorithm);

    CryptoResult parameters(KemAlgorithm algorithm, KemParameters& out_parameters) const;

    CryptoResult generate_keypair(
        KemAlgorithm algorithm,
        Bytes& out_public_key,
        SecureBytes& out_private_key
    ) const;

    CryptoResult encapsulate(
        KemAlgorithm algorithm,
        std::span<const std::uint8_t> peer_public_key,
        SecureBytes& out_secret,
        Bytes& out_capsule
    ) const;

    CryptoResult decapsulate(
        KemAlgorithm algorithm,
        std::span<const std::uint8_t> capsule,
        std::span<const std::uint8_t> private_key,
        SecureBytes& out_secret
    ) const;
};

}
