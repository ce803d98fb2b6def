#pragma once

#include "pqchat/crypto/algorithms.hpp"
#include "pqchat/crypto/crypto_types.hpp"
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace pqchat::crypto {

// Framing of every ciphertext produced here:
//   AES-256   : iv(12) || ciphertext || tag(16)
//   SALSA20   : nonce(8) || ciphertext
//   CHACHA20  : nonce(12) || ciphertext
// The stream ciphers carry no integrity tag.
class EncryptionEngine {
public:
    EncryptionEngine();
    ~EncryptionEngine();

    static size_t nonce_size(SymmetricAlgorithm algorithm);
    static size_t overhead(SymmetricAlgorithm algorithm);

    CryptoResult encrypt(
        std::span<const std::uint8_t> plaintext,
        std::span<const std::uint8_t> key,
        SymmetricAlgorithm algorithm,
        Bytes& out_ciphertext
    ) const;

    CryptoResult decrypt(
        std::span<const std::uint8_t> ciphertext,
        std::span<const std::uint8_t> key,
        SymmetricAlgorithm algorithm,
        Bytes& out_plaintext
    ) const;

    CryptoResult encrypt_string(
        const std::string& plaintext,
        std::span<const std::uint8_t> key,
        SymmetricAlgorithm algorithm,
        Bytes& out_ciphertext
    ) const;

    CryptoResult decrypt_to_string(
        std::span<const std::uint8_t> ciphertext,
        std::span<const std::uint8_t> key,
        SymmetricAlgorithm algorithm,
        std::string& out_plaintext
    ) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
