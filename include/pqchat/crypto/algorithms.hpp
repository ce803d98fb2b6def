#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pqchat::crypto {

enum class AlgorithmType : std::uint8_t {
    KEM,
    SYMMETRIC,
    SIGNATURE
};

enum class KemAlgorithm : std::uint8_t {
    NTRU,
    KYBER,
    BIKE,
    HQC,
    SABER,
    MCELIECE,
    FRODO
};

enum class SymmetricAlgorithm : std::uint8_t {
    AES_256,
    SALSA20,
    CHACHA20
};

enum class SignatureAlgorithm : std::uint8_t {
    FALCON,
    DILITHIUM,
    RAINBOW
};

// Canonical upper-case names, e.g. "KYBER", "AES-256", "FALCON"
std::string to_string(AlgorithmType type);
std::string to_string(KemAlgorithm algorithm);
std::string to_string(SymmetricAlgorithm algorithm);
std::string to_string(SignatureAlgorithm algorithm);

// Case-insensitive parsing; nullopt for names outside the closed sets
std::optional<KemAlgorithm> parse_kem_algorithm(std::string_view name);
std::optional<SymmetricAlgorithm> parse_symmetric_algorithm(std::string_view name);
std::optional<SignatureAlgorithm> parse_signature_algorithm(std::string_view name);

const std::vector<KemAlgorithm>& all_kem_algorithms();
const std::vector<SymmetricAlgorithm>& all_symmetric_algorithms();
const std::vector<SignatureAlgorithm>& all_signature_algorithms();

// liboqs identifiers tried in order; the first one enabled in the linked build wins
const std::vector<const char*>& oqs_candidates(KemAlgorithm algorithm);
const std::vector<const char*>& oqs_candidates(SignatureAlgorithm algorithm);

struct CryptoAlgorithms {
    KemAlgorithm kem = KemAlgorithm::KYBER;
    SymmetricAlgorithm symmetric = SymmetricAlgorithm::AES_256;
    SignatureAlgorithm signature = SignatureAlgorithm::FALCON;

    static CryptoAlgorithms defaults() { return CryptoAlgorithms{}; }

    bool operator==(const CryptoAlgorithms& other) const = default;
};

// Algorithm names as they travel on the wire, before validation
struct AlgorithmNames {
    std::string kem;
    std::string symmetric;
    std::string signature;

    static AlgorithmNames from(const CryptoAlgorithms& algorithms);

    bool operator==(const AlgorithmNames& other) const = default;
};

struct AlgorithmInfo {
    std::string name;
    AlgorithmType type;
    std::uint32_t key_size;
    std::string description;
    bool recommended;
    std::string security_level;
};

// Read-only metadata table keyed by (name, type)
std::optional<AlgorithmInfo> find_algorithm_info(std::string_view name, AlgorithmType type);
const std::vector<AlgorithmInfo>& algorithm_catalog();

}
