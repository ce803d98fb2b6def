#pragma once

#include "pqchat/crypto/algorithms.hpp"
#include "pqchat/crypto/chat_keys.hpp"
#include "pqchat/crypto/crypto_types.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pqchat::crypto {

struct CryptoStatistics {
    std::uint64_t key_generations = 0;
    std::uint64_t encryptions = 0;
    std::uint64_t decryptions = 0;
    std::uint64_t signatures = 0;
    std::uint64_t verifications = 0;
    std::uint64_t kem_operations = 0;
    std::chrono::microseconds total_operation_time{0};
};

struct EncryptedFileResult {
    std::filesystem::path encrypted_path;
    std::string plaintext_hash;  // upper-case hex SHA3-256 of the source file
    std::uint64_t encrypted_size = 0;
};

// Algorithm-agnostic facade over the KEM, cipher, signature and hash engines.
// Construct one per process and pass it by reference; every operation fails
// with NOT_INITIALIZED until initialize() has succeeded.
class CryptoService {
public:
    CryptoService();
    ~CryptoService();

    CryptoService(const CryptoService&) = delete;
    CryptoService& operator=(const CryptoService&) = delete;

    CryptoResult initialize();
    void cleanup();
    bool is_initialized() const;

    // Key encapsulation
    CryptoResult generate_kem_keypair(
        KemAlgorithm algorithm,
        Bytes& out_public_key,
        SecureBytes& out_private_key
    );

    CryptoResult generate_kem_keypair(
        const std::string& algorithm,
        Bytes& out_public_key,
        SecureBytes& out_private_key
    );

    CryptoResult encapsulate(
        std::span<const std::uint8_t> peer_public_key,
        KemAlgorithm algorithm,
        SecureBytes& out_secret,
        Bytes& out_capsule
    );

    CryptoResult extract_secret(
        std::span<const std::uint8_t> capsule,
        std::span<const std::uint8_t> own_private_key,
        KemAlgorithm algorithm,
        SecureBytes& out_secret
    );

    // SHA3-256(secret_a || secret_b); the initiator's secret goes first
    CryptoResult derive_symmetric_key(
        std::span<const std::uint8_t> secret_a,
        std::span<const std::uint8_t> secret_b,
        SecureBytes& out_key
    );

    // Symmetric encryption
    CryptoResult encrypt(
        std::span<const std::uint8_t> data,
        std::span<const std::uint8_t> key,
        SymmetricAlgorithm algorithm,
        Bytes& out_ciphertext
    );

    CryptoResult encrypt(
        std::span<const std::uint8_t> data,
        std::span<const std::uint8_t> key,
        const std::string& algorithm,
        Bytes& out_ciphertext
    );

    CryptoResult decrypt(
        std::span<const std::uint8_t> ciphertext,
        std::span<const std::uint8_t> key,
        SymmetricAlgorithm algorithm,
        Bytes& out_plaintext
    );

    CryptoResult decrypt(
        std::span<const std::uint8_t> ciphertext,
        std::span<const std::uint8_t> key,
        const std::string& algorithm,
        Bytes& out_plaintext
    );

    CryptoResult encrypt_message(
        const std::string& message,
        std::span<const std::uint8_t> key,
        Bytes& out_ciphertext,
        SymmetricAlgorithm algorithm = SymmetricAlgorithm::AES_256
    );

    CryptoResult decrypt_message(
        std::span<const std::uint8_t> ciphertext,
        std::span<const std::uint8_t> key,
        std::string& out_message,
        SymmetricAlgorithm algorithm = SymmetricAlgorithm::AES_256
    );

    // Writes <path>.enc next to the source file
    CryptoResult encrypt_file(
        const std::filesystem::path& path,
        std::span<const std::uint8_t> key,
        SymmetricAlgorithm algorithm,
        EncryptedFileResult& out_result
    );

    CryptoResult decrypt_file(
        const std::filesystem::path& encrypted_path,
        const std::filesystem::path& output_path,
        std::span<const std::uint8_t> key,
        SymmetricAlgorithm algorithm,
        std::string& out_plaintext_hash
    );

    // Signatures
    CryptoResult generate_signature_keypair(
        SignatureAlgorithm algorithm,
        Bytes& out_public_key,
        SecureBytes& out_private_key
    );

    CryptoResult sign(
        std::span<const std::uint8_t> data,
        std::span<const std::uint8_t> private_key,
        SignatureAlgorithm algorithm,
        Bytes& out_signature
    );

    // Never throws; any failure, including an unknown algorithm, yields false
    bool verify(
        std::span<const std::uint8_t> data,
        std::span<const std::uint8_t> signature,
        std::span<const std::uint8_t> public_key,
        SignatureAlgorithm algorithm
    );

    bool verify(
        std::span<const std::uint8_t> data,
        std::span<const std::uint8_t> signature,
        std::span<const std::uint8_t> public_key,
        const std::string& algorithm
    );

    // Hashing and fingerprints
    CryptoResult hash(std::span<const std::uint8_t> data, Sha3Hash& out_hash);
    std::string hash_hex(std::span<const std::uint8_t> data);

    // Upper-case hex SHA3-256 over both keys in lexicographic byte order, so
    // the two parties of a chat compute the same value
    CryptoResult fingerprint(
        std::span<const std::uint8_t> public_key_self,
        std::span<const std::uint8_t> public_key_peer,
        std::string& out_fingerprint
    );

    CryptoResult generate_fingerprint(const ChatKeys& keys, std::string& out_fingerprint);

    static void secure_wipe(std::span<std::uint8_t> buffer);
    static void secure_wipe(SecureBytes& buffer);

    // Algorithm metadata and validation
    CryptoAlgorithms default_algorithms() const;
    bool is_algorithm_supported(const std::string& name, AlgorithmType type) const;
    bool validate_algorithms(const AlgorithmNames& algorithms) const;
    bool validate_algorithms(const CryptoAlgorithms& algorithms) const;
    CryptoResult resolve_algorithms(const AlgorithmNames& names, CryptoAlgorithms& out_algorithms) const;
    std::optional<AlgorithmInfo> algorithm_info(const std::string& name, AlgorithmType type) const;
    std::vector<std::string> supported_algorithms(AlgorithmType type) const;
    std::vector<AlgorithmInfo> recommended_algorithms() const;

    bool validate_symmetric_key(std::span<const std::uint8_t> key, SymmetricAlgorithm algorithm) const;
    bool validate_key_pair(
        std::span<const std::uint8_t> public_key,
        std::span<const std::uint8_t> private_key,
        KemAlgorithm algorithm
    ) const;

    // Chat key lifecycle
    CryptoResult initialize_chat_keys(KemAlgorithm algorithm, ChatKeys& out_keys);
    CryptoResult update_chat_keys_with_peer_key(ChatKeys& keys, std::span<const std::uint8_t> peer_public_key);

    // Derives the symmetric key and returns the cleaned instance
    CryptoResult complete_handshake(
        const ChatKeys& keys,
        std::span<const std::uint8_t> secret_a,
        std::span<const std::uint8_t> secret_b,
        ChatKeys& out_keys
    );

    void secure_clear_chat_keys(ChatKeys& keys);

    CryptoStatistics statistics() const;
    void reset_statistics();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
