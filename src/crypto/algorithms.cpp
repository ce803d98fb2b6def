#include "pqchat/crypto/algorithms.hpp"
#include "pqchat/core/utils.hpp"
#include <algorithm>

namespace pqchat::crypto {

namespace {
    using core::utils::StringUtils;

    template<typename Enum>
    std::optional<Enum> parse_from(std::string_view name, const std::vector<Enum>& members) {
        auto wanted = StringUtils::to_upper(StringUtils::trim(std::string(name)));
        for (auto member : members) {
            if (to_string(member) == wanted) {
                return member;
            }
        }
        return std::nullopt;
    }
}

std::string to_string(AlgorithmType type) {
    switch (type) {
        case AlgorithmType::KEM: return "KEM";
        case AlgorithmType::SYMMETRIC: return "symmetric";
        case AlgorithmType::SIGNATURE: return "signature";
    }
    return "unknown";
}

std::string to_string(KemAlgorithm algorithm) {
    switch (algorithm) {
        case KemAlgorithm::NTRU: return "NTRU";
        case KemAlgorithm::KYBER: return "KYBER";
        case KemAlgorithm::BIKE: return "BIKE";
        case KemAlgorithm::HQC: return "HQC";
        case KemAlgorithm::SABER: return "SABER";
        case KemAlgorithm::MCELIECE: return "MCELIECE";
        case KemAlgorithm::FRODO: return "FRODO";
    }
    return "UNKNOWN";
}

std::string to_string(SymmetricAlgorithm algorithm) {
    switch (algorithm) {
        case SymmetricAlgorithm::AES_256: return "AES-256";
        case SymmetricAlgorithm::SALSA20: return "SALSA20";
        case SymmetricAlgorithm::CHACHA20: return "CHACHA20";
    }
    return "UNKNOWN";
}

std::string to_string(SignatureAlgorithm algorithm) {
    switch (algorithm) {
        case SignatureAlgorithm::FALCON: return "FALCON";
        case SignatureAlgorithm::DILITHIUM: return "DILITHIUM";
        case SignatureAlgorithm::RAINBOW: return "RAINBOW";
    }
    return "UNKNOWN";
}

std::optional<KemAlgorithm> parse_kem_algorithm(std::string_view name) {
    return parse_from(name, all_kem_algorithms());
}

std::optional<SymmetricAlgorithm> parse_symmetric_algorithm(std::string_view name) {
    return parse_from(name, all_symmetric_algorithms());
}

std::optional<SignatureAlgorithm> parse_signature_algorithm(std::string_view name) {
    return parse_from(name, all_signature_algorithms());
}

const std::vector<KemAlgorithm>& all_kem_algorithms() {
    static const std::vector<KemAlgorithm> algorithms = {
        KemAlgorithm::NTRU, KemAlgorithm::KYBER, KemAlgorithm::BIKE, KemAlgorithm::HQC,
        KemAlgorithm::SABER, KemAlgorithm::MCELIECE, KemAlgorithm::FRODO
    };
    return algorithms;
}

const std::vector<SymmetricAlgorithm>& all_symmetric_algorithms() {
    static const std::vector<SymmetricAlgorithm> algorithms = {
        SymmetricAlgorithm::AES_256, SymmetricAlgorithm::SALSA20, SymmetricAlgorithm::CHACHA20
    };
    return algorithms;
}

const std::vector<SignatureAlgorithm>& all_signature_algorithms() {
    static const std::vector<SignatureAlgorithm> algorithms = {
        SignatureAlgorithm::FALCON, SignatureAlgorithm::DILITHIUM, SignatureAlgorithm::RAINBOW
    };
    return algorithms;
}

const std::vector<const char*>& oqs_candidates(KemAlgorithm algorithm) {
    static const std::vector<const char*> ntru = {"NTRU-HPS-4096-821", "NTRU-HRSS-701"};
    static const std::vector<const char*> kyber = {"ML-KEM-768", "Kyber768"};
    static const std::vector<const char*> bike = {"BIKE-L1"};
    static const std::vector<const char*> hqc = {"HQC-128"};
    static const std::vector<const char*> saber = {"Saber-KEM", "LightSaber-KEM"};
    static const std::vector<const char*> mceliece = {"Classic-McEliece-348864"};
    static const std::vector<const char*> frodo = {"FrodoKEM-976-AES", "FrodoKEM-640-AES"};

    switch (algorithm) {
        case KemAlgorithm::NTRU: return ntru;
        case KemAlgorithm::KYBER: return kyber;
        case KemAlgorithm::BIKE: return bike;
        case KemAlgorithm::HQC: return hqc;
        case KemAlgorithm::SABER: return saber;
        case KemAlgorithm::MCELIECE: return mceliece;
        case KemAlgorithm::FRODO: return frodo;
    }
    return kyber;
}

const std::vector<const char*>& oqs_candidates(SignatureAlgorithm algorithm) {
    static const std::vector<const char*> falcon = {"Falcon-512"};
    static const std::vector<const char*> dilithium = {"ML-DSA-65", "Dilithium3"};
    static const std::vector<const char*> rainbow = {"Rainbow-III-Classic", "rainbowIIIclassic"};

    switch (algorithm) {
        case SignatureAlgorithm::FALCON: return falcon;
        case SignatureAlgorithm::DILITHIUM: return dilithium;
        case SignatureAlgorithm::RAINBOW: return rainbow;
    }
    return falcon;
}

AlgorithmNames AlgorithmNames::from(const CryptoAlgorithms& algorithms) {
    return AlgorithmNames{
        to_string(algorithms.kem),
        to_string(algorithms.symmetric),
        to_string(algorithms.signature)
    };
}

const std::vector<AlgorithmInfo>& algorithm_catalog() {
    static const std::vector<AlgorithmInfo> catalog = {
        {"NTRU", AlgorithmType::KEM, 4096, "NTRU lattice-based KEM", true, "NIST Level 3"},
        {"KYBER", AlgorithmType::KEM, 768, "NIST standardized KEM (ML-KEM)", true, "NIST Level 3"},
        {"BIKE", AlgorithmType::KEM, 256, "Code-based KEM", true, "NIST Level 1"},
        {"HQC", AlgorithmType::KEM, 256, "Code-based KEM", true, "NIST Level 1"},
        {"SABER", AlgorithmType::KEM, 256, "Module lattice-based KEM", true, "NIST Level 3"},
        {"MCELIECE", AlgorithmType::KEM, 6688, "Classic McEliece code-based KEM", true, "NIST Level 1"},
        {"FRODO", AlgorithmType::KEM, 976, "Conservative unstructured lattice KEM", true, "NIST Level 3"},

        {"AES-256", AlgorithmType::SYMMETRIC, 256, "AES-256-GCM authenticated encryption", true, "256-bit"},
        {"SALSA20", AlgorithmType::SYMMETRIC, 256, "Salsa20 stream cipher, no integrity tag", true, "256-bit"},
        {"CHACHA20", AlgorithmType::SYMMETRIC, 256, "ChaCha20 stream cipher, no integrity tag", true, "256-bit"},

        {"FALCON", AlgorithmType::SIGNATURE, 512, "NIST standardized lattice signature", true, "NIST Level 1"},
        {"DILITHIUM", AlgorithmType::SIGNATURE, 3, "NIST standardized lattice signature (ML-DSA)", true, "NIST Level 3"},
        {"RAINBOW", AlgorithmType::SIGNATURE, 3, "Multivariate signature, broken in 2022", false, "NIST Level 3"},
    };
    return catalog;
}

std::optional<AlgorithmInfo> find_algorithm_info(std::string_view name, AlgorithmType type) {
    auto wanted = core::utils::StringUtils::to_upper(std::string(name));
    const auto& catalog = algorithm_catalog();
    auto it = std::find_if(catalog.begin(), catalog.end(), [&](const AlgorithmInfo& info) {
        return info.type == type && info.name == wanted;
    });
    if (it == catalog.end()) {
        return std::nullopt;
    }
    return *it;
}

}
