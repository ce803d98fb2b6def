#include "pqchat/crypto/crypto_service.hpp"
#include "pqchat/crypto/encryption.hpp"
#include "pqchat/crypto/hash.hpp"
#include "pqchat/crypto/kem.hpp"
#include "pqchat/crypto/random.hpp"
#include "pqchat/crypto/signature.hpp"
#include "pqchat/core/logger.hpp"
#include "pqchat/core/utils.hpp"
#include <oqs/oqs.h>
#include <sodium.h>
#include <algorithm>
#include <atomic>
#include <exception>

namespace pqchat::crypto {

namespace {
    using core::utils::StringUtils;
    using core::utils::FileUtils;

    class ScopedTimer {
    public:
        explicit ScopedTimer(std::atomic<std::int64_t>& total)
            : total_(total), start_(std::chrono::steady_clock::now()) {}

        ~ScopedTimer() {
            auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - start_);
            total_ += elapsed.count();
        }

    private:
        std::atomic<std::int64_t>& total_;
        std::chrono::steady_clock::time_point start_;
    };

    CryptoResult not_initialized() {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "Crypto service not initialized");
    }

    CryptoResult unsupported(const std::string& name, AlgorithmType type) {
        return CryptoResult(CryptoError::UNSUPPORTED_ALGORITHM,
                            "Unsupported " + to_string(type) + " algorithm: " + name);
    }
}

struct CryptoService::Impl {
    KemEngine kem_engine;
    SignatureEngine signature_engine;
    std::unique_ptr<EncryptionEngine> encryption_engine;

    std::atomic<bool> initialized{false};

    std::atomic<std::uint64_t> key_generations{0};
    std::atomic<std::uint64_t> encryptions{0};
    std::atomic<std::uint64_t> decryptions{0};
    std::atomic<std::uint64_t> signatures{0};
    std::atomic<std::uint64_t> verifications{0};
    std::atomic<std::uint64_t> kem_operations{0};
    std::atomic<std::int64_t> operation_time_us{0};
};

CryptoService::CryptoService()
    : impl_(std::make_unique<Impl>()) {
}

CryptoService::~CryptoService() {
    cleanup();
}

CryptoResult CryptoService::initialize() {
    if (impl_->initialized) {
        return CryptoResult();
    }

    if (!SecureRandom::initialize()) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "Failed to initialize libsodium");
    }

    OQS_init();

    try {
        impl_->encryption_engine = std::make_unique<EncryptionEngine>();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create encryption engine: {}", e.what());
        return CryptoResult(CryptoError::NOT_INITIALIZED, e.what());
    }

    impl_->initialized = true;
    LOG_INFO("Crypto service initialized (KEMs available: {}, signatures available: {})",
             StringUtils::join(supported_algorithms(AlgorithmType::KEM), ","),
             StringUtils::join(supported_algorithms(AlgorithmType::SIGNATURE), ","));
    return CryptoResult();
}

void CryptoService::cleanup() {
    if (impl_->initialized.exchange(false)) {
        impl_->encryption_engine.reset();
        LOG_DEBUG("Crypto service cleaned up");
    }
}

bool CryptoService::is_initialized() const {
    return impl_->initialized;
}

CryptoResult CryptoService::generate_kem_keypair(
    KemAlgorithm algorithm,
    Bytes& out_public_key,
    SecureBytes& out_private_key) {

    if (!impl_->initialized) return not_initialized();

    ScopedTimer timer(impl_->operation_time_us);
    auto result = impl_->kem_engine.generate_keypair(algorithm, out_public_key, out_private_key);
    if (result) {
        ++impl_->key_generations;
        LOG_DEBUG("Generated {} key pair (public key {} bytes)", to_string(algorithm), out_public_key.size());
    }
    return result;
}

CryptoResult CryptoService::generate_kem_keypair(
    const std::string& algorithm,
    Bytes& out_public_key,
    SecureBytes& out_private_key) {

    if (!impl_->initialized) return not_initialized();

    auto parsed = parse_kem_algorithm(algorithm);
    if (!parsed) {
        return unsupported(algorithm, AlgorithmType::KEM);
    }
    return generate_kem_keypair(*parsed, out_public_key, out_private_key);
}

CryptoResult CryptoService::encapsulate(
    std::span<const std::uint8_t> peer_public_key,
    KemAlgorithm algorithm,
    SecureBytes& out_secret,
    Bytes& out_capsule) {

    if (!impl_->initialized) return not_initialized();

    ScopedTimer timer(impl_->operation_time_us);
    auto result = impl_->kem_engine.encapsulate(algorithm, peer_public_key, out_secret, out_capsule);
    if (result) {
        ++impl_->kem_operations;
    }
    return result;
}

CryptoResult CryptoService::extract_secret(
    std::span<const std::uint8_t> capsule,
    std::span<const std::uint8_t> own_private_key,
    KemAlgorithm algorithm,
    SecureBytes& out_secret) {

    if (!impl_->initialized) return not_initialized();

    ScopedTimer timer(impl_->operation_time_us);
    auto result = impl_->kem_engine.decapsulate(algorithm, capsule, own_private_key, out_secret);
    if (result) {
        ++impl_->kem_operations;
    }
    return result;
}

CryptoResult CryptoService::derive_symmetric_key(
    std::span<const std::uint8_t> secret_a,
    std::span<const std::uint8_t> secret_b,
    SecureBytes& out_key) {

    if (!impl_->initialized) return not_initialized();

    if (secret_a.empty() || secret_b.empty()) {
        return CryptoResult(CryptoError::INVALID_KEY_MATERIAL, "Both shared secrets are required");
    }

    SecureBytes combined(secret_a.size() + secret_b.size());
    std::copy(secret_a.begin(), secret_a.end(), combined.data.begin());
    std::copy(secret_b.begin(), secret_b.end(), combined.data.begin() + secret_a.size());

    Sha3Hasher hasher;
    auto result = hasher.initialize();
    if (result) {
        result = hasher.update(combined.span());
    }

    Sha3Hash digest;
    if (result) {
        result = hasher.finalize(digest);
    }
    combined.clear();

    if (!result) {
        sodium_memzero(digest.data(), digest.size());
        return CryptoResult(CryptoError::KEY_GENERATION_FAILED, "Key derivation failed: " + result.message);
    }

    out_key = SecureBytes(std::span<const std::uint8_t>(digest));
    sodium_memzero(digest.data(), digest.size());
    return CryptoResult();
}

CryptoResult CryptoService::encrypt(
    std::span<const std::uint8_t> data,
    std::span<const std::uint8_t> key,
    SymmetricAlgorithm algorithm,
    Bytes& out_ciphertext) {

    if (!impl_->initialized) return not_initialized();

    ScopedTimer timer(impl_->operation_time_us);
    auto result = impl_->encryption_engine->encrypt(data, key, algorithm, out_ciphertext);
    if (result) {
        ++impl_->encryptions;
    }
    return result;
}

CryptoResult CryptoService::encrypt(
    std::span<const std::uint8_t> data,
    std::span<const std::uint8_t> key,
    const std::string& algorithm,
    Bytes& out_ciphertext) {

    if (!impl_->initialized) return not_initialized();

    auto parsed = parse_symmetric_algorithm(algorithm);
    if (!parsed) {
        return unsupported(algorithm, AlgorithmType::SYMMETRIC);
    }
    return encrypt(data, key, *parsed, out_ciphertext);
}

CryptoResult CryptoService::decrypt(
    std::span<const std::uint8_t> ciphertext,
    std::span<const std::uint8_t> key,
    SymmetricAlgorithm algorithm,
    Bytes& out_plaintext) {

    if (!impl_->initialized) return not_initialized();

    ScopedTimer timer(impl_->operation_time_us);
    auto result = impl_->encryption_engine->decrypt(ciphertext, key, algorithm, out_plaintext);
    if (result) {
        ++impl_->decryptions;
    }
    return result;
}

CryptoResult CryptoService::decrypt(
    std::span<const std::uint8_t> ciphertext,
    std::span<const std::uint8_t> key,
    const std::string& algorithm,
    Bytes& out_plaintext) {

    if (!impl_->initialized) return not_initialized();

    auto parsed = parse_symmetric_algorithm(algorithm);
    if (!parsed) {
        return unsupported(algorithm, AlgorithmType::SYMMETRIC);
    }
    return decrypt(ciphertext, key, *parsed, out_plaintext);
}

CryptoResult CryptoService::encrypt_message(
    const std::string& message,
    std::span<const std::uint8_t> key,
    Bytes& out_ciphertext,
    SymmetricAlgorithm algorithm) {

    return encrypt(
        std::span(reinterpret_cast<const std::uint8_t*>(message.data()), message.size()),
        key, algorithm, out_ciphertext);
}

CryptoResult CryptoService::decrypt_message(
    std::span<const std::uint8_t> ciphertext,
    std::span<const std::uint8_t> key,
    std::string& out_message,
    SymmetricAlgorithm algorithm) {

    Bytes plaintext;
    auto result = decrypt(ciphertext, key, algorithm, plaintext);
    if (!result) {
        return result;
    }

    out_message.assign(reinterpret_cast<const char*>(plaintext.data()), plaintext.size());
    secure_wipe(std::span(plaintext));
    return CryptoResult();
}

CryptoResult CryptoService::encrypt_file(
    const std::filesystem::path& path,
    std::span<const std::uint8_t> key,
    SymmetricAlgorithm algorithm,
    EncryptedFileResult& out_result) {

    if (!impl_->initialized) return not_initialized();

    auto content = FileUtils::read_binary(path);
    if (!content) {
        return CryptoResult(CryptoError::IO_FAILED, "Cannot read file: " + path.string());
    }

    Bytes ciphertext;
    auto result = encrypt(*content, key, algorithm, ciphertext);
    auto plaintext_hash = hash_hex(*content);
    secure_wipe(std::span(*content));
    if (!result) {
        return result;
    }

    auto encrypted_path = path;
    encrypted_path += ".enc";
    if (!FileUtils::write_binary(encrypted_path, ciphertext)) {
        return CryptoResult(CryptoError::IO_FAILED, "Cannot write file: " + encrypted_path.string());
    }

    out_result.encrypted_path = encrypted_path;
    out_result.plaintext_hash = plaintext_hash;
    out_result.encrypted_size = ciphertext.size();

    LOG_INFO("Encrypted {} with {} ({} bytes)", path.filename().string(), to_string(algorithm), ciphertext.size());
    return CryptoResult();
}

CryptoResult CryptoService::decrypt_file(
    const std::filesystem::path& encrypted_path,
    const std::filesystem::path& output_path,
    std::span<const std::uint8_t> key,
    SymmetricAlgorithm algorithm,
    std::string& out_plaintext_hash) {

    if (!impl_->initialized) return not_initialized();

    auto content = FileUtils::read_binary(encrypted_path);
    if (!content) {
        return CryptoResult(CryptoError::IO_FAILED, "Cannot read file: " + encrypted_path.string());
    }

    Bytes plaintext;
    auto result = decrypt(*content, key, algorithm, plaintext);
    if (!result) {
        return result;
    }

    bool written = FileUtils::write_binary(output_path, plaintext);
    out_plaintext_hash = hash_hex(plaintext);
    secure_wipe(std::span(plaintext));

    if (!written) {
        return CryptoResult(CryptoError::IO_FAILED, "Cannot write file: " + output_path.string());
    }
    return CryptoResult();
}

CryptoResult CryptoService::generate_signature_keypair(
    SignatureAlgorithm algorithm,
    Bytes& out_public_key,
    SecureBytes& out_private_key) {

    if (!impl_->initialized) return not_initialized();

    ScopedTimer timer(impl_->operation_time_us);
    auto result = impl_->signature_engine.generate_keypair(algorithm, out_public_key, out_private_key);
    if (result) {
        ++impl_->key_generations;
    }
    return result;
}

CryptoResult CryptoService::sign(
    std::span<const std::uint8_t> data,
    std::span<const std::uint8_t> private_key,
    SignatureAlgorithm algorithm,
    Bytes& out_signature) {

    if (!impl_->initialized) return not_initialized();

    ScopedTimer timer(impl_->operation_time_us);
    auto result = impl_->signature_engine.sign(data, private_key, algorithm, out_signature);
    if (result) {
        ++impl_->signatures;
    }
    return result;
}

bool CryptoService::verify(
    std::span<const std::uint8_t> data,
    std::span<const std::uint8_t> signature,
    std::span<const std::uint8_t> public_key,
    SignatureAlgorithm algorithm) {

    if (!impl_->initialized) {
        return false;
    }

    try {
        ScopedTimer timer(impl_->operation_time_us);
        ++impl_->verifications;
        auto result = impl_->signature_engine.verify(data, signature, public_key, algorithm);
        if (!result) {
            LOG_DEBUG("Signature verification failed: {}", result.message);
        }
        return result.success();
    } catch (const std::exception& e) {
        LOG_WARN("Signature verification raised: {}", e.what());
        return false;
    }
}

bool CryptoService::verify(
    std::span<const std::uint8_t> data,
    std::span<const std::uint8_t> signature,
    std::span<const std::uint8_t> public_key,
    const std::string& algorithm) {

    auto parsed = parse_signature_algorithm(algorithm);
    if (!parsed) {
        LOG_DEBUG("Signature verification with unknown algorithm {}", algorithm);
        return false;
    }
    return verify(data, signature, public_key, *parsed);
}

CryptoResult CryptoService::hash(std::span<const std::uint8_t> data, Sha3Hash& out_hash) {
    if (!impl_->initialized) return not_initialized();

    Sha3Hasher hasher;
    auto result = hasher.initialize();
    if (!result) return result;

    result = hasher.update(data);
    if (!result) return result;

    return hasher.finalize(out_hash);
}

std::string CryptoService::hash_hex(std::span<const std::uint8_t> data) {
    Sha3Hash digest;
    auto result = hash(data, digest);
    if (!result) {
        LOG_ERROR("Hashing failed: {}", result.message);
        return "";
    }
    return hash_utils::hash_to_hex(digest);
}

CryptoResult CryptoService::fingerprint(
    std::span<const std::uint8_t> public_key_self,
    std::span<const std::uint8_t> public_key_peer,
    std::string& out_fingerprint) {

    if (!impl_->initialized) return not_initialized();

    if (public_key_self.empty() || public_key_peer.empty()) {
        return CryptoResult(CryptoError::INVALID_KEY_MATERIAL, "Fingerprint requires both public keys");
    }

    bool self_first = std::lexicographical_compare(
        public_key_self.begin(), public_key_self.end(),
        public_key_peer.begin(), public_key_peer.end());

    auto first = self_first ? public_key_self : public_key_peer;
    auto second = self_first ? public_key_peer : public_key_self;

    Sha3Hasher hasher;
    auto result = hasher.initialize();
    if (result) result = hasher.update(first);
    if (result) result = hasher.update(second);

    Sha3Hash digest;
    if (result) result = hasher.finalize(digest);
    if (!result) return result;

    out_fingerprint = hash_utils::hash_to_hex(digest);
    return CryptoResult();
}

CryptoResult CryptoService::generate_fingerprint(const ChatKeys& keys, std::string& out_fingerprint) {
    if (!keys.has_key_pair() || !keys.has_peer_key()) {
        return CryptoResult(CryptoError::INVALID_KEY_MATERIAL, "Fingerprint requires own and peer public keys");
    }
    return fingerprint(keys.public_key_self, keys.public_key_peer, out_fingerprint);
}

void CryptoService::secure_wipe(std::span<std::uint8_t> buffer) {
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
}

void CryptoService::secure_wipe(SecureBytes& buffer) {
    buffer.clear();
}

CryptoAlgorithms CryptoService::default_algorithms() const {
    return CryptoAlgorithms::defaults();
}

bool CryptoService::is_algorithm_supported(const std::string& name, AlgorithmType type) const {
    switch (type) {
        case AlgorithmType::KEM: {
            auto parsed = parse_kem_algorithm(name);
            return parsed && KemEngine::is_available(*parsed);
        }
        case AlgorithmType::SYMMETRIC:
            return parse_symmetric_algorithm(name).has_value();
        case AlgorithmType::SIGNATURE: {
            auto parsed = parse_signature_algorithm(name);
            return parsed && SignatureEngine::is_available(*parsed);
        }
    }
    return false;
}

bool CryptoService::validate_algorithms(const AlgorithmNames& algorithms) const {
    CryptoAlgorithms resolved;
    return resolve_algorithms(algorithms, resolved).success();
}

bool CryptoService::validate_algorithms(const CryptoAlgorithms& algorithms) const {
    return KemEngine::is_available(algorithms.kem) && SignatureEngine::is_available(algorithms.signature);
}

CryptoResult CryptoService::resolve_algorithms(const AlgorithmNames& names, CryptoAlgorithms& out_algorithms) const {
    auto kem = parse_kem_algorithm(names.kem);
    if (!kem) return unsupported(names.kem, AlgorithmType::KEM);

    auto symmetric = parse_symmetric_algorithm(names.symmetric);
    if (!symmetric) return unsupported(names.symmetric, AlgorithmType::SYMMETRIC);

    auto signature = parse_signature_algorithm(names.signature);
    if (!signature) return unsupported(names.signature, AlgorithmType::SIGNATURE);

    if (!KemEngine::is_available(*kem)) {
        return CryptoResult(CryptoError::UNSUPPORTED_ALGORITHM,
                            "KEM " + to_string(*kem) + " is not available in this build");
    }
    if (!SignatureEngine::is_available(*signature)) {
        return CryptoResult(CryptoError::UNSUPPORTED_ALGORITHM,
                            "Signature " + to_string(*signature) + " is not available in this build");
    }

    out_algorithms = CryptoAlgorithms{*kem, *symmetric, *signature};
    return CryptoResult();
}

std::optional<AlgorithmInfo> CryptoService::algorithm_info(const std::string& name, AlgorithmType type) const {
    return find_algorithm_info(name, type);
}

std::vector<std::string> CryptoService::supported_algorithms(AlgorithmType type) const {
    std::vector<std::string> names;
    switch (type) {
        case AlgorithmType::KEM:
            for (auto algorithm : all_kem_algorithms()) {
                if (KemEngine::is_available(algorithm)) names.push_back(to_string(algorithm));
            }
            break;
        case AlgorithmType::SYMMETRIC:
            for (auto algorithm : all_symmetric_algorithms()) {
                names.push_back(to_string(algorithm));
            }
            break;
        case AlgorithmType::SIGNATURE:
            for (auto algorithm : all_signature_algorithms()) {
                if (SignatureEngine::is_available(algorithm)) names.push_back(to_string(algorithm));
            }
            break;
    }
    return names;
}

std::vector<AlgorithmInfo> CryptoService::recommended_algorithms() const {
    std::vector<AlgorithmInfo> result;
    for (const auto& info : algorithm_catalog()) {
        if (info.recommended && is_algorithm_supported(info.name, info.type)) {
            result.push_back(info);
        }
    }
    return result;
}

bool CryptoService::validate_symmetric_key(std::span<const std::uint8_t> key, SymmetricAlgorithm) const {
    // All three ciphers take 256-bit keys
    return key.size() == SYMMETRIC_KEY_SIZE;
}

bool CryptoService::validate_key_pair(
    std::span<const std::uint8_t> public_key,
    std::span<const std::uint8_t> private_key,
    KemAlgorithm algorithm) const {

    KemParameters parameters;
    if (!impl_->kem_engine.parameters(algorithm, parameters)) {
        return false;
    }
    return public_key.size() == parameters.public_key_size &&
           private_key.size() == parameters.private_key_size;
}

CryptoResult CryptoService::initialize_chat_keys(KemAlgorithm algorithm, ChatKeys& out_keys) {
    ChatKeys keys;
    keys.algorithm = algorithm;

    auto result = generate_kem_keypair(algorithm, keys.public_key_self, keys.private_key_self);
    if (!result) {
        return result;
    }

    out_keys = std::move(keys);
    return CryptoResult();
}

CryptoResult CryptoService::update_chat_keys_with_peer_key(ChatKeys& keys, std::span<const std::uint8_t> peer_public_key) {
    if (!impl_->initialized) return not_initialized();

    KemParameters parameters;
    auto result = impl_->kem_engine.parameters(keys.algorithm, parameters);
    if (!result) {
        return result;
    }

    if (peer_public_key.size() != parameters.public_key_size) {
        return CryptoResult(CryptoError::INVALID_KEY_MATERIAL,
                            "Peer public key does not match " + to_string(keys.algorithm));
    }

    keys.public_key_peer.assign(peer_public_key.begin(), peer_public_key.end());
    return CryptoResult();
}

CryptoResult CryptoService::complete_handshake(
    const ChatKeys& keys,
    std::span<const std::uint8_t> secret_a,
    std::span<const std::uint8_t> secret_b,
    ChatKeys& out_keys) {

    if (!impl_->initialized) return not_initialized();

    if (!keys.has_key_pair() || !keys.has_peer_key()) {
        return CryptoResult(CryptoError::INVALID_STATE, "Handshake requires own key pair and peer key");
    }

    SecureBytes symmetric_key;
    auto result = derive_symmetric_key(secret_a, secret_b, symmetric_key);
    if (!result) {
        return result;
    }

    ChatKeys completed;
    completed.symmetric_key = std::move(symmetric_key);
    completed.algorithm = keys.algorithm;
    completed.asymmetric_discarded = true;

    out_keys = std::move(completed);
    return CryptoResult();
}

void CryptoService::secure_clear_chat_keys(ChatKeys& keys) {
    keys.secure_wipe();
}

CryptoStatistics CryptoService::statistics() const {
    CryptoStatistics stats;
    stats.key_generations = impl_->key_generations;
    stats.encryptions = impl_->encryptions;
    stats.decryptions = impl_->decryptions;
    stats.signatures = impl_->signatures;
    stats.verifications = impl_->verifications;
    stats.kem_operations = impl_->kem_operations;
    stats.total_operation_time = std::chrono::microseconds(impl_->operation_time_us.load());
    return stats;
}

void CryptoService::reset_statistics() {
    impl_->key_generations = 0;
    impl_->encryptions = 0;
    impl_->decryptions = 0;
    impl_->signatures = 0;
    impl_->verifications = 0;
    impl_->kem_operations = 0;
    impl_->operation_time_us = 0;
}

}
