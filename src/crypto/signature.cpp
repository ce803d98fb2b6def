#include "pqchat/crypto/signature.hpp"
#include <oqs/oqs.h>
#include <memory>

namespace pqchat::crypto {

namespace {
    struct OQSSIGDeleter {
        void operator()(OQS_SIG* sig) const {
            if (sig) {
                OQS_SIG_free(sig);
            }
        }
    };

    using OqsSigPtr = std::unique_ptr<OQS_SIG, OQSSIGDeleter>;

    CryptoResult open_sig(SignatureAlgorithm algorithm, OqsSigPtr& out_sig) {
        auto oqs_name = SignatureEngine::resolve(algorithm);
        if (!oqs_name) {
            return CryptoResult(CryptoError::UNSUPPORTED_ALGORITHM,
                                "Signature " + to_string(algorithm) + " is not available in this liboqs build");
        }

        out_sig.reset(OQS_SIG_new(oqs_name->c_str()));
        if (!out_sig) {
            return CryptoResult(CryptoError::UNSUPPORTED_ALGORITHM,
                                "Failed to instantiate signature scheme " + *oqs_name);
        }
        return CryptoResult();
    }

    std::span<const std::uint8_t> as_bytes(const std::string& message) {
        return std::span(reinterpret_cast<const std::uint8_t*>(message.data()), message.size());
    }
}

std::optional<std::string> SignatureEngine::resolve(SignatureAlgorithm algorithm) {
    for (const char* candidate : oqs_candidates(algorithm)) {
        if (OQS_SIG_alg_is_enabled(candidate)) {
            return std::string(candidate);
        }
    }
    return std::nullopt;
}

bool SignatureEngine::is_available(SignatureAlgorithm algorithm) {
    return resolve(algorithm).has_value();
}

CryptoResult SignatureEngine::generate_keypair(
    SignatureAlgorithm algorithm,
    Bytes& out_public_key,
    SecureBytes& out_private_key) const {

    OqsSigPtr sig;
    auto result = open_sig(algorithm, sig);
    if (!result) {
        return result;
    }

    out_public_key.assign(sig->length_public_key, 0);
    SecureBytes private_key(sig->length_secret_key);

    if (OQS_SIG_keypair(sig.get(), out_public_key.data(), private_key.data_ptr()) != OQS_SUCCESS) {
        out_public_key.clear();
        return CryptoResult(CryptoError::KEY_GENERATION_FAILED,
                            "OQS_SIG_keypair failed for " + to_string(algorithm));
    }

    out_private_key = std::move(private_key);
    return CryptoResult();
}

CryptoResult SignatureEngine::sign(
    std::span<const std::uint8_t> message,
    std::span<const std::uint8_t> private_key,
    SignatureAlgorithm algorithm,
    Bytes& out_signature) const {

    if (message.empty()) {
        return CryptoResult(CryptoError::INVALID_MESSAGE, "Message cannot be empty");
    }

    OqsSigPtr sig;
    auto result = open_sig(algorithm, sig);
    if (!result) {
        return result;
    }

    if (private_key.size() != sig->length_secret_key) {
        return CryptoResult(CryptoError::INVALID_KEY_MATERIAL,
                            "Private key length does not match " + to_string(algorithm));
    }

    Bytes signature(sig->length_signature);
    size_t signature_len = 0;

    if (OQS_SIG_sign(sig.get(), signature.data(), &signature_len,
                     message.data(), message.size(), private_key.data()) != OQS_SUCCESS) {
        return CryptoResult(CryptoError::KEY_GENERATION_FAILED,
                            "OQS_SIG_sign failed for " + to_string(algorithm));
    }

    signature.resize(signature_len);
    out_signature = std::move(signature);
    return CryptoResult();
}

CryptoResult SignatureEngine::verify(
    std::span<const std::uint8_t> message,
    std::span<const std::uint8_t> signature,
    std::span<const std::uint8_t> public_key,
    SignatureAlgorithm algorithm) const {

    if (message.empty() || signature.empty()) {
        return CryptoResult(CryptoError::INVALID_MESSAGE, "Message and signature cannot be empty");
    }

    OqsSigPtr sig;
    auto result = open_sig(algorithm, sig);
    if (!result) {
        return result;
    }

    if (public_key.size() != sig->length_public_key) {
        return CryptoResult(CryptoError::INVALID_KEY_MATERIAL,
                            "Public key length does not match " + to_string(algorithm));
    }

    if (signature.size() > sig->length_signature) {
        return CryptoResult(CryptoError::VERIFICATION_FAILED, "Signature is too long");
    }

    if (OQS_SIG_verify(sig.get(), message.data(), message.size(),
                       signature.data(), signature.size(), public_key.data()) != OQS_SUCCESS) {
        return CryptoResult(CryptoError::VERIFICATION_FAILED, "Signature verification failed");
    }

    return CryptoResult();
}

CryptoResult SignatureEngine::sign_string(
    const std::string& message,
    std::span<const std::uint8_t> private_key,
    SignatureAlgorithm algorithm,
    Bytes& out_signature) const {

    return sign(as_bytes(message), private_key, algorithm, out_signature);
}

CryptoResult SignatureEngine::verify_string(
    const std::string& message,
    std::span<const std::uint8_t> signature,
    std::span<const std::uint8_t> public_key,
    SignatureAlgorithm algorithm) const {

    return verify(as_bytes(message), signature, public_key, algorithm);
}

}
