#include "pqchat/crypto/encryption.hpp"
#include <openssl/evp.h>
#include <sodium.h>
#include <memory>
#include <stdexcept>

namespace pqchat::crypto {

namespace {
    struct EvpCipherCtxDeleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            EVP_CIPHER_CTX_free(ctx);
        }
    };

    using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpCipherCtxDeleter>;

    CryptoResult aes_gcm_encrypt(
        std::span<const std::uint8_t> plaintext,
        std::span<const std::uint8_t> key,
        Bytes& out_ciphertext) {

        Bytes output(AES_GCM_IV_SIZE + plaintext.size() + AES_GCM_TAG_SIZE);
        randombytes_buf(output.data(), AES_GCM_IV_SIZE);

        EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return CryptoResult(CryptoError::ENCRYPTION_FAILED, "EVP_CIPHER_CTX_new failed");
        }

        if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(AES_GCM_IV_SIZE), nullptr) != 1 ||
            EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), output.data()) != 1) {
            return CryptoResult(CryptoError::ENCRYPTION_FAILED, "AES-256-GCM initialization failed");
        }

        std::uint8_t* body = output.data() + AES_GCM_IV_SIZE;
        int len = 0;
        int total = 0;

        if (!plaintext.empty()) {
            if (EVP_EncryptUpdate(ctx.get(), body, &len, plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
                return CryptoResult(CryptoError::ENCRYPTION_FAILED, "AES-256-GCM encryption failed");
            }
            total = len;
        }

        if (EVP_EncryptFinal_ex(ctx.get(), body + total, &len) != 1) {
            return CryptoResult(CryptoError::ENCRYPTION_FAILED, "AES-256-GCM finalization failed");
        }
        total += len;

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(AES_GCM_TAG_SIZE),
                                body + total) != 1) {
            return CryptoResult(CryptoError::ENCRYPTION_FAILED, "Failed to read AES-256-GCM tag");
        }

        out_ciphertext = std::move(output);
        return CryptoResult();
    }

    CryptoResult aes_gcm_decrypt(
        std::span<const std::uint8_t> ciphertext,
        std::span<const std::uint8_t> key,
        Bytes& out_plaintext) {

        if (ciphertext.size() < AES_GCM_IV_SIZE + AES_GCM_TAG_SIZE) {
            return CryptoResult(CryptoError::DECRYPTION_FAILED, "Ciphertext shorter than IV and tag");
        }

        auto iv = ciphertext.first(AES_GCM_IV_SIZE);
        auto tag = ciphertext.last(AES_GCM_TAG_SIZE);
        auto body = ciphertext.subspan(AES_GCM_IV_SIZE,
                                       ciphertext.size() - AES_GCM_IV_SIZE - AES_GCM_TAG_SIZE);

        EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return CryptoResult(CryptoError::DECRYPTION_FAILED, "EVP_CIPHER_CTX_new failed");
        }

        if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(AES_GCM_IV_SIZE), nullptr) != 1 ||
            EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1) {
            return CryptoResult(CryptoError::DECRYPTION_FAILED, "AES-256-GCM initialization failed");
        }

        Bytes plaintext(body.size());
        int len = 0;
        int total = 0;

        if (!body.empty()) {
            if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, body.data(), static_cast<int>(body.size())) != 1) {
                sodium_memzero(plaintext.data(), plaintext.size());
                return CryptoResult(CryptoError::DECRYPTION_FAILED, "AES-256-GCM decryption failed");
            }
            total = len;
        }

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(AES_GCM_TAG_SIZE),
                                const_cast<std::uint8_t*>(tag.data())) != 1) {
            sodium_memzero(plaintext.data(), plaintext.size());
            return CryptoResult(CryptoError::DECRYPTION_FAILED, "Failed to set AES-256-GCM tag");
        }

        if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) != 1) {
            // No partial plaintext leaves this function on a tag mismatch
            sodium_memzero(plaintext.data(), plaintext.size());
            return CryptoResult(CryptoError::AUTHENTICATION_FAILED, "AES-256-GCM tag mismatch");
        }
        total += len;

        plaintext.resize(static_cast<size_t>(total));
        out_plaintext = std::move(plaintext);
        return CryptoResult();
    }

    CryptoResult stream_xor(
        SymmetricAlgorithm algorithm,
        std::span<const std::uint8_t> input,
        const std::uint8_t* nonce,
        std::span<const std::uint8_t> key,
        std::uint8_t* output) {

        int result = 0;
        if (algorithm == SymmetricAlgorithm::SALSA20) {
            result = crypto_stream_salsa20_xor(output, input.data(), input.size(), nonce, key.data());
        } else {
            result = crypto_stream_chacha20_ietf_xor(output, input.data(), input.size(), nonce, key.data());
        }

        if (result != 0) {
            return CryptoResult(CryptoError::ENCRYPTION_FAILED, to_string(algorithm) + " keystream failed");
        }
        return CryptoResult();
    }
}

struct EncryptionEngine::Impl {
    bool initialized = false;

    Impl() {
        if (sodium_init() < 0) {
            throw std::runtime_error("Failed to initialize libsodium for encryption");
        }
        initialized = true;
    }
};

EncryptionEngine::EncryptionEngine()
    : impl_(std::make_unique<Impl>()) {
}

EncryptionEngine::~EncryptionEngine() = default;

size_t EncryptionEngine::nonce_size(SymmetricAlgorithm algorithm) {
    switch (algorithm) {
        case SymmetricAlgorithm::AES_256: return AES_GCM_IV_SIZE;
        case SymmetricAlgorithm::SALSA20: return SALSA20_NONCE_SIZE;
        case SymmetricAlgorithm::CHACHA20: return CHACHA20_NONCE_SIZE;
    }
    return 0;
}

size_t EncryptionEngine::overhead(SymmetricAlgorithm algorithm) {
    if (algorithm == SymmetricAlgorithm::AES_256) {
        return AES_GCM_IV_SIZE + AES_GCM_TAG_SIZE;
    }
    return nonce_size(algorithm);
}

CryptoResult EncryptionEngine::encrypt(
    std::span<const std::uint8_t> plaintext,
    std::span<const std::uint8_t> key,
    SymmetricAlgorithm algorithm,
    Bytes& out_ciphertext) const {

    if (!impl_->initialized) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "Encryption engine not initialized");
    }

    if (key.size() != SYMMETRIC_KEY_SIZE) {
        return CryptoResult(CryptoError::INVALID_KEY_MATERIAL,
                            "Symmetric key must be " + std::to_string(SYMMETRIC_KEY_SIZE) + " bytes");
    }

    if (algorithm == SymmetricAlgorithm::AES_256) {
        return aes_gcm_encrypt(plaintext, key, out_ciphertext);
    }

    auto prefix = nonce_size(algorithm);
    Bytes output(prefix + plaintext.size());
    randombytes_buf(output.data(), prefix);

    auto result = stream_xor(algorithm, plaintext, output.data(), key, output.data() + prefix);
    if (!result) {
        return result;
    }

    out_ciphertext = std::move(output);
    return CryptoResult();
}

CryptoResult EncryptionEngine::decrypt(
    std::span<const std::uint8_t> ciphertext,
    std::span<const std::uint8_t> key,
    SymmetricAlgorithm algorithm,
    Bytes& out_plaintext) const {

    if (!impl_->initialized) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "Encryption engine not initialized");
    }

    if (key.size() != SYMMETRIC_KEY_SIZE) {
        return CryptoResult(CryptoError::INVALID_KEY_MATERIAL,
                            "Symmetric key must be " + std::to_string(SYMMETRIC_KEY_SIZE) + " bytes");
    }

    if (algorithm == SymmetricAlgorithm::AES_256) {
        return aes_gcm_decrypt(ciphertext, key, out_plaintext);
    }

    auto prefix = nonce_size(algorithm);
    if (ciphertext.size() < prefix) {
        return CryptoResult(CryptoError::DECRYPTION_FAILED, "Ciphertext shorter than nonce");
    }

    auto body = ciphertext.subspan(prefix);
    Bytes plaintext(body.size());

    auto result = stream_xor(algorithm, body, ciphertext.data(), key, plaintext.data());
    if (!result) {
        return CryptoResult(CryptoError::DECRYPTION_FAILED, result.message);
    }

    out_plaintext = std::move(plaintext);
    return CryptoResult();
}

CryptoResult EncryptionEngine::encrypt_string(
    const std::string& plaintext,
    std::span<const std::uint8_t> key,
    SymmetricAlgorithm algorithm,
    Bytes& out_ciphertext) const {

    return encrypt(
        std::span(reinterpret_cast<const std::uint8_t*>(plaintext.data()), plaintext.size()),
        key,
        algorithm,
        out_ciphertext
    );
}

CryptoResult EncryptionEngine::decrypt_to_string(
    std::span<const std::uint8_t> ciphertext,
    std::span<const std::uint8_t> key,
    SymmetricAlgorithm algorithm,
    std::string& out_plaintext) const {

    Bytes plaintext_bytes;
    auto result = decrypt(ciphertext, key, algorithm, plaintext_bytes);
    if (!result) {
        return result;
    }

    out_plaintext.assign(
        reinterpret_cast<const char*>(plaintext_bytes.data()),
        plaintext_bytes.size()
    );
    sodium_memzero(plaintext_bytes.data(), plaintext_bytes.size());

    return CryptoResult();
}

}
