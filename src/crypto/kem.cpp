#include "pqchat/crypto/kem.hpp"
#include "pqchat/core/logger.hpp"
#include <oqs/oqs.h>
#include <memory>

namespace pqchat::crypto {

namespace {
    struct OQSKEMDeleter {
        void operator()(OQS_KEM* kem) const {
            if (kem) {
                OQS_KEM_free(kem);
            }
        }
    };

    using OqsKemPtr = std::unique_ptr<OQS_KEM, OQSKEMDeleter>;

    CryptoResult open_kem(KemAlgorithm algorithm, OqsKemPtr& out_kem) {
        auto oqs_name = KemEngine::resolve(algorithm);
        if (!oqs_name) {
            return CryptoResult(CryptoError::UNSUPPORTED_ALGORITHM,
                                "KEM " + to_string(algorithm) + " is not available in this liboqs build");
        }

        out_kem.reset(OQS_KEM_new(oqs_name->c_str()));
        if (!out_kem) {
            return CryptoResult(CryptoError::UNSUPPORTED_ALGORITHM,
                                "Failed to instantiate KEM " + *oqs_name);
        }
        return CryptoResult();
    }
}

std::optional<std::string> KemEngine::resolve(KemAlgorithm algorithm) {
    for (const char* candidate : oqs_candidates(algorithm)) {
        if (OQS_KEM_alg_is_enabled(candidate)) {
            return std::string(candidate);
        }
    }
    return std::nullopt;
}

bool KemEngine::is_available(KemAlgorithm algorithm) {
    return resolve(algorithm).has_value();
}

CryptoResult KemEngine::parameters(KemAlgorithm algorithm, KemParameters& out_parameters) const {
    OqsKemPtr kem;
    auto result = open_kem(algorithm, kem);
    if (!result) {
        return result;
    }

    out_parameters.oqs_name = kem->method_name;
    out_parameters.public_key_size = kem->length_public_key;
    out_parameters.private_key_size = kem->length_secret_key;
    out_parameters.capsule_size = kem->length_ciphertext;
    out_parameters.shared_secret_size = kem->length_shared_secret;
    return CryptoResult();
}

CryptoResult KemEngine::generate_keypair(
    KemAlgorithm algorithm,
    Bytes& out_public_key,
    SecureBytes& out_private_key) const {

    OqsKemPtr kem;
    auto result = open_kem(algorithm, kem);
    if (!result) {
        return result;
    }

    out_public_key.assign(kem->length_public_key, 0);
    SecureBytes private_key(kem->length_secret_key);

    if (OQS_KEM_keypair(kem.get(), out_public_key.data(), private_key.data_ptr()) != OQS_SUCCESS) {
        out_public_key.clear();
        return CryptoResult(CryptoError::KEY_GENERATION_FAILED,
                            "OQS_KEM_keypair failed for " + to_string(algorithm));
    }

    out_private_key = std::move(private_key);
    return CryptoResult();
}

CryptoResult KemEngine::encapsulate(
    KemAlgorithm algorithm,
    std::span<const std::uint8_t> peer_public_key,
    SecureBytes& out_secret,
    Bytes& out_capsule) const {

    OqsKemPtr kem;
    auto result = open_kem(algorithm, kem);
    if (!result) {
        return result;
    }

    if (peer_public_key.size() != kem->length_public_key) {
        return CryptoResult(CryptoError::INVALID_KEY_MATERIAL,
                            "Public key length " + std::to_string(peer_public_key.size()) +
                            " does not match " + to_string(algorithm) + " (" +
                            std::to_string(kem->length_public_key) + ")");
    }

    Bytes capsule(kem->length_ciphertext);
    SecureBytes secret(kem->length_shared_secret);

    if (OQS_KEM_encaps(kem.get(), capsule.data(), secret.data_ptr(), peer_public_key.data()) != OQS_SUCCESS) {
        return CryptoResult(CryptoError::INVALID_KEY_MATERIAL,
                            "OQS_KEM_encaps failed for " + to_string(algorithm));
    }

    out_capsule = std::move(capsule);
    out_secret = std::move(secret);
    return CryptoResult();
}

CryptoResult KemEngine::decapsulate(
    KemAlgorithm algorithm,
    std::span<const std::uint8_t> capsule,
    std::span<const std::uint8_t> private_key,
    SecureBytes& out_secret) const {

    OqsKemPtr kem;
    auto result = open_kem(algorithm, kem);
    if (!result) {
        return result;
    }

    if (capsule.size() != kem->length_ciphertext) {
        return CryptoResult(CryptoError::INVALID_KEY_MATERIAL,
                            "Capsule length " + std::to_string(capsule.size()) +
                            " does not match " + to_string(algorithm));
    }

    if (private_key.size() != kem->length_secret_key) {
        return CryptoResult(CryptoError::INVALID_KEY_MATERIAL,
                            "Private key length does not match " + to_string(algorithm));
    }

    SecureBytes secret(kem->length_shared_secret);
    if (OQS_KEM_decaps(kem.get(), secret.data_ptr(), capsule.data(), private_key.data()) != OQS_SUCCESS) {
        return CryptoResult(CryptoError::INVALID_KEY_MATERIAL,
                            "OQS_KEM_decaps failed for " + to_string(algorithm));
    }

    out_secret = std::move(secret);
    return CryptoResult();
}

}
