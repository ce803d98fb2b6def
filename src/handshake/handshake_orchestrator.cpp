#include "pqchat/handshake/handshake_orchestrator.hpp"
#include "pqchat/handshake/algorithm_provider.hpp"
#include "pqchat/handshake/chat_repository.hpp"
#include "pqchat/handshake/transcript.hpp"
#include "pqchat/handshake/transient_secret_store.hpp"
#include "pqchat/handshake/transport.hpp"
#include "pqchat/crypto/crypto_service.hpp"
#include "pqchat/core/config.hpp"
#include "pqchat/core/logger.hpp"
#include "pqchat/core/worker_pool.hpp"
#include <algorithm>
#include <array>
#include <condition_variable>
#include <exception>
#include <functional>
#include <map>
#include <mutex>

namespace pqchat::handshake {

using crypto::Bytes;
using crypto::CryptoError;
using crypto::CryptoResult;
using crypto::SecureBytes;

namespace {
    Bytes to_bytes(const crypto::Sha3Hash& hash) {
        return Bytes(hash.begin(), hash.end());
    }

    bool to_hash(const Bytes& bytes, crypto::Sha3Hash& out_hash) {
        if (bytes.size() != out_hash.size()) {
            return false;
        }
        std::copy(bytes.begin(), bytes.end(), out_hash.begin());
        return true;
    }

    bool await_send(std::future<bool> future, MessageType type, const std::string& chat_uuid) {
        try {
            if (future.get()) {
                return true;
            }
            LOG_WARN("Transport refused {} for chat {}", to_string(type), chat_uuid);
        } catch (const std::exception& e) {
            LOG_WARN("Transport failed to send {} for chat {}: {}", to_string(type), chat_uuid, e.what());
        }
        return false;
    }

    CryptoResult transport_failed(MessageType type) {
        return CryptoResult(CryptoError::TRANSPORT_FAILED, "Failed to send " + to_string(type));
    }
}

HandshakeOptions HandshakeOptions::from_config(const core::Config& config) {
    HandshakeOptions options;
    options.require_signatures = config.get_bool("handshake.require_signatures", options.require_signatures);
    options.include_algorithms = config.get_bool("handshake.include_algorithms", options.include_algorithms);
    return options;
}

struct HandshakeOrchestrator::Impl {
    std::string local_id;
    crypto::CryptoService& crypto;
    ChatRepository& repository;
    HandshakeTransport& transport;
    TransientSecretStore& secrets;
    const AlgorithmProvider& algorithm_provider;
    core::WorkerPool& worker_pool;
    HandshakeOptions options;

    mutable std::mutex identity_mutex;
    std::shared_ptr<const SignatureIdentity> identity;
    std::map<std::string, Bytes> trusted_peers;

    // Chats hash onto a fixed set of mutexes; a stripe is never replaced
    static constexpr size_t LOCK_STRIPES = 64;
    std::array<std::mutex, LOCK_STRIPES> chat_locks;

    std::mutex tasks_mutex;
    std::condition_variable tasks_idle;
    size_t tasks_in_flight = 0;

    Impl(std::string id, crypto::CryptoService& crypto_service, ChatRepository& repo,
         HandshakeTransport& transport_layer, TransientSecretStore& secret_store,
         const AlgorithmProvider& provider, core::WorkerPool& pool, HandshakeOptions opts)
        : local_id(std::move(id))
        , crypto(crypto_service)
        , repository(repo)
        , transport(transport_layer)
        , secrets(secret_store)
        , algorithm_provider(provider)
        , worker_pool(pool)
        , options(opts) {
    }

    std::mutex& lock_for(const std::string& chat_uuid) {
        return chat_locks[std::hash<std::string>{}(chat_uuid) % LOCK_STRIPES];
    }

    void task_queued() {
        std::lock_guard<std::mutex> lock(tasks_mutex);
        ++tasks_in_flight;
    }

    void task_done() {
        std::lock_guard<std::mutex> lock(tasks_mutex);
        if (--tasks_in_flight == 0) {
            tasks_idle.notify_all();
        }
    }

    void wait_for_tasks() {
        std::unique_lock<std::mutex> lock(tasks_mutex);
        if (tasks_in_flight > 0) {
            LOG_DEBUG("{}: waiting for {} dispatched handshake messages", local_id, tasks_in_flight);
        }
        tasks_idle.wait(lock, [this] { return tasks_in_flight == 0; });
    }

    std::shared_ptr<const SignatureIdentity> current_identity() const {
        std::lock_guard<std::mutex> lock(identity_mutex);
        return identity;
    }

    bool pinned_key_matches(const std::string& peer_id, std::span<const std::uint8_t> key) const {
        std::lock_guard<std::mutex> lock(identity_mutex);
        auto it = trusted_peers.find(peer_id);
        if (it == trusted_peers.end()) {
            return true;
        }
        return std::equal(it->second.begin(), it->second.end(), key.begin(), key.end());
    }

    Bytes own_signature_public_key() const {
        auto id = current_identity();
        return id ? id->public_key : Bytes{};
    }

    // Empty signature when this party has no signing identity
    CryptoResult sign_transcript(const char* context, const crypto::Sha3Hash& transcript, Bytes& out_signature) {
        auto id = current_identity();
        if (!id) {
            out_signature.clear();
            return CryptoResult();
        }

        auto data = create_signature_data(context, transcript);
        return crypto.sign(data, id->private_key.span(), id->algorithm, out_signature);
    }

    CryptoResult check_peer_signature(
        const std::string& chat_uuid,
        const std::string& peer_id,
        const char* context,
        const crypto::Sha3Hash& transcript,
        std::span<const std::uint8_t> signature,
        std::span<const std::uint8_t> peer_public_key,
        crypto::SignatureAlgorithm algorithm,
        bool& out_verified) {

        out_verified = false;

        if (signature.empty()) {
            if (options.require_signatures) {
                return CryptoResult(CryptoError::AUTHENTICATION_FAILED, "Peer sent an unsigned handshake message");
            }
            LOG_DEBUG("Chat {}: accepting unsigned message from {}", chat_uuid, peer_id);
            return CryptoResult();
        }

        if (peer_public_key.empty()) {
            return CryptoResult(CryptoError::AUTHENTICATION_FAILED, "Signature present but no peer signature key");
        }

        if (!pinned_key_matches(peer_id, peer_public_key)) {
            return CryptoResult(CryptoError::AUTHENTICATION_FAILED,
                                "Signature key of " + peer_id + " does not match the trusted key");
        }

        auto data = create_signature_data(context, transcript);
        if (!crypto.verify(data, signature, peer_public_key, algorithm)) {
            return CryptoResult(CryptoError::AUTHENTICATION_FAILED, "Handshake signature verification failed");
        }

        out_verified = true;
        return CryptoResult();
    }

    CryptoResult check_sender(const Chat& chat, const std::string& from) const {
        if (!chat.peer_id.empty() && chat.peer_id != from) {
            return CryptoResult(CryptoError::AUTHENTICATION_FAILED,
                                "Message for chat " + chat.uuid + " came from " + from +
                                ", expected " + chat.peer_id);
        }
        return CryptoResult();
    }

    CryptoResult fail(const std::string& chat_uuid, MessageType type, CryptoResult result) {
        LOG_WARN("Chat {}: {} rejected ({}): {}", chat_uuid, to_string(type),
                 crypto::to_string(result.error), result.message);
        return result;
    }
};

HandshakeOrchestrator::HandshakeOrchestrator(
    std::string local_id,
    crypto::CryptoService& crypto,
    ChatRepository& repository,
    HandshakeTransport& transport,
    TransientSecretStore& secret_store,
    const AlgorithmProvider& algorithm_provider,
    core::WorkerPool& worker_pool,
    HandshakeOptions options)
    : impl_(std::make_unique<Impl>(std::move(local_id), crypto, repository, transport,
                                   secret_store, algorithm_provider, worker_pool, options)) {
}

HandshakeOrchestrator::~HandshakeOrchestrator() {
    impl_->wait_for_tasks();
}

const std::string& HandshakeOrchestrator::local_id() const {
    return impl_->local_id;
}

void HandshakeOrchestrator::set_signature_identity(SignatureIdentity identity) {
    auto shared = std::make_shared<const SignatureIdentity>(std::move(identity));
    std::lock_guard<std::mutex> lock(impl_->identity_mutex);
    impl_->identity = std::move(shared);
}

CryptoResult HandshakeOrchestrator::generate_signature_identity(crypto::SignatureAlgorithm algorithm) {
    SignatureIdentity identity;
    identity.algorithm = algorithm;

    auto result = impl_->crypto.generate_signature_keypair(algorithm, identity.public_key, identity.private_key);
    if (!result) {
        return result;
    }

    set_signature_identity(std::move(identity));
    LOG_INFO("{}: generated {} signature identity", impl_->local_id, crypto::to_string(algorithm));
    return CryptoResult();
}

bool HandshakeOrchestrator::has_signature_identity() const {
    return impl_->current_identity() != nullptr;
}

void HandshakeOrchestrator::add_trusted_peer(const std::string& peer_id, Bytes signature_public_key) {
    std::lock_guard<std::mutex> lock(impl_->identity_mutex);
    impl_->trusted_peers[peer_id] = std::move(signature_public_key);
}

bool HandshakeOrchestrator::is_trusted_peer(const std::string& peer_id, std::span<const std::uint8_t> signature_public_key) const {
    std::lock_guard<std::mutex> lock(impl_->identity_mutex);
    auto it = impl_->trusted_peers.find(peer_id);
    return it != impl_->trusted_peers.end() &&
           std::equal(it->second.begin(), it->second.end(),
                      signature_public_key.begin(), signature_public_key.end());
}

CryptoResult HandshakeOrchestrator::initialize_chat(
    const std::string& chat_uuid,
    const std::string& name,
    const std::string& peer_id,
    std::optional<crypto::CryptoAlgorithms> algorithms) {

    if (!impl_->crypto.is_initialized()) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "Crypto service not initialized");
    }

    if (chat_uuid.empty() || peer_id.empty()) {
        return CryptoResult(CryptoError::INVALID_MESSAGE, "Chat UUID and peer id are required");
    }

    auto chosen = algorithms.value_or(impl_->algorithm_provider.preferred_algorithms());
    if (!impl_->crypto.validate_algorithms(chosen)) {
        return impl_->fail(chat_uuid, MessageType::INIT_REQUEST,
                           CryptoResult(CryptoError::UNSUPPORTED_ALGORITHM,
                                        "Algorithms not available: " + crypto::to_string(chosen.kem) +
                                        "/" + crypto::to_string(chosen.signature)));
    }

    InitRequest request;
    std::string send_to;
    {
        std::lock_guard<std::mutex> lock(impl_->lock_for(chat_uuid));

        auto existing = impl_->repository.get_chat(chat_uuid);
        if (existing && existing->is_established()) {
            LOG_DEBUG("Chat {} already established, nothing to initialize", chat_uuid);
            return CryptoResult();
        }

        if (existing && existing->role != ChatRole::INITIATOR &&
            existing->key_establishment_status != KeyEstablishmentStatus::UNINITIALIZED) {
            return impl_->fail(chat_uuid, MessageType::INIT_REQUEST,
                               CryptoResult(CryptoError::INVALID_STATE, "Chat is being established by the peer"));
        }

        Chat chat;
        if (existing && existing->key_establishment_status == KeyEstablishmentStatus::INITIALIZING &&
            existing->keys.has_key_pair()) {
            // Retry: re-send the original public key
            chat = std::move(*existing);
            LOG_INFO("Chat {}: re-sending InitRequest to {}", chat_uuid, chat.peer_id);
        } else {
            crypto::ChatKeys keys;
            auto result = impl_->crypto.initialize_chat_keys(chosen.kem, keys);
            if (!result) {
                return impl_->fail(chat_uuid, MessageType::INIT_REQUEST, result);
            }

            auto now = std::chrono::system_clock::now();
            chat.uuid = chat_uuid;
            chat.name = name.empty() ? chat_uuid : name;
            chat.peer_id = peer_id;
            chat.role = ChatRole::INITIATOR;
            chat.algorithms = chosen;
            chat.keys = std::move(keys);
            chat.key_establishment_status = KeyEstablishmentStatus::INITIALIZING;
            chat.peer_crypto.peer_id = peer_id;
            chat.created_at = existing ? existing->created_at : now;
            chat.last_activity = now;

            auto saved = impl_->repository.save_chat(chat);
            if (!saved) {
                chat.keys.secure_wipe();
                return impl_->fail(chat_uuid, MessageType::INIT_REQUEST, saved);
            }
            LOG_INFO("Chat {}: initiating key establishment with {} using {}/{}/{}", chat_uuid, peer_id,
                     crypto::to_string(chosen.kem), crypto::to_string(chosen.symmetric),
                     crypto::to_string(chosen.signature));
        }

        request.chat_uuid = chat.uuid;
        request.public_key = chat.keys.public_key_self;
        if (impl_->options.include_algorithms) {
            request.crypto_algorithms = crypto::AlgorithmNames::from(chat.algorithms);
        }
        request.signature_public_key = impl_->own_signature_public_key();
        send_to = chat.peer_id;
    }

    if (!await_send(impl_->transport.send_init_request(send_to, request), MessageType::INIT_REQUEST, chat_uuid)) {
        return transport_failed(MessageType::INIT_REQUEST);
    }
    return CryptoResult();
}

CryptoResult HandshakeOrchestrator::handle_init_request(const std::string& from, const InitRequest& message) {
    const auto type = MessageType::INIT_REQUEST;
    const auto& chat_uuid = message.chat_uuid;

    if (!impl_->crypto.is_initialized()) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "Crypto service not initialized");
    }

    if (chat_uuid.empty() || message.public_key.empty()) {
        return impl_->fail(chat_uuid, type, CryptoResult(CryptoError::INVALID_MESSAGE, "Missing chat UUID or public key"));
    }

    InitResponse response;
    {
        std::lock_guard<std::mutex> lock(impl_->lock_for(chat_uuid));

        auto now = std::chrono::system_clock::now();
        auto existing = impl_->repository.get_chat(chat_uuid);

        Chat chat;
        if (existing) {
            chat = std::move(*existing);
            auto sender = impl_->check_sender(chat, from);
            if (!sender) {
                return impl_->fail(chat_uuid, type, sender);
            }
            if (chat.is_established() || chat.keys.has_peer_key()) {
                LOG_DEBUG("Chat {}: duplicate InitRequest ignored", chat_uuid);
                return CryptoResult();
            }
            if (chat.role == ChatRole::INITIATOR &&
                chat.key_establishment_status != KeyEstablishmentStatus::UNINITIALIZED) {
                return impl_->fail(chat_uuid, type,
                                   CryptoResult(CryptoError::INVALID_STATE, "Both parties initiated the same chat"));
            }
        } else {
            chat.uuid = chat_uuid;
            chat.name = chat_uuid;
            chat.peer_id = from;
            chat.created_at = now;
        }

        chat.role = ChatRole::RESPONDER;
        chat.key_establishment_status = KeyEstablishmentStatus::INITIALIZING;
        chat.last_activity = now;

        crypto::CryptoAlgorithms algorithms;
        if (message.crypto_algorithms) {
            auto resolved = impl_->crypto.resolve_algorithms(*message.crypto_algorithms, algorithms);
            if (!resolved) {
                // Keep the chat visible as INITIALIZING without generating anything
                auto saved = impl_->repository.save_chat(chat);
                if (!saved) {
                    LOG_ERROR("Chat {}: failed to persist: {}", chat_uuid, saved.message);
                }
                return impl_->fail(chat_uuid, type, resolved);
            }
        } else {
            algorithms = impl_->algorithm_provider.preferred_algorithms();
            if (!impl_->crypto.validate_algorithms(algorithms)) {
                return impl_->fail(chat_uuid, type,
                                   CryptoResult(CryptoError::UNSUPPORTED_ALGORITHM, "Preferred algorithms not available"));
            }
        }

        if (message.signature_public_key.empty() && impl_->options.require_signatures) {
            return impl_->fail(chat_uuid, type,
                               CryptoResult(CryptoError::AUTHENTICATION_FAILED, "Peer has no signature key"));
        }
        if (!message.signature_public_key.empty() &&
            !impl_->pinned_key_matches(from, message.signature_public_key)) {
            return impl_->fail(chat_uuid, type,
                               CryptoResult(CryptoError::AUTHENTICATION_FAILED, "Untrusted peer signature key"));
        }

        crypto::ChatKeys keys;
        auto result = impl_->crypto.initialize_chat_keys(algorithms.kem, keys);
        if (!result) {
            return impl_->fail(chat_uuid, type, result);
        }

        result = impl_->crypto.update_chat_keys_with_peer_key(keys, message.public_key);
        if (!result) {
            keys.secure_wipe();
            return impl_->fail(chat_uuid, type, result);
        }

        SecureBytes secret_b;
        Bytes capsule_b;
        result = impl_->crypto.encapsulate(message.public_key, algorithms.kem, secret_b, capsule_b);
        if (!result) {
            keys.secure_wipe();
            return impl_->fail(chat_uuid, type, result);
        }

        auto transcript = create_response_transcript(
            chat_uuid, algorithms.kem, message.public_key, keys.public_key_self, capsule_b);

        Bytes signature;
        result = impl_->sign_transcript(RESPONSE_SIGNATURE_CONTEXT, transcript, signature);
        if (!result) {
            keys.secure_wipe();
            return impl_->fail(chat_uuid, type, result);
        }

        chat.algorithms = algorithms;
        chat.transcript_hash = to_bytes(transcript);
        chat.peer_crypto.peer_id = from;
        chat.peer_crypto.peer_algorithms = algorithms;
        chat.peer_crypto.signature_public_key = message.signature_public_key;
        if (!message.signature_public_key.empty()) {
            chat.peer_crypto.signature_algorithm = algorithms.signature;
        }
        chat.peer_crypto.last_updated = now;

        response.chat_uuid = chat_uuid;
        response.public_key = keys.public_key_self;
        response.kem_capsule = std::move(capsule_b);
        response.user_signature = std::move(signature);
        if (impl_->options.include_algorithms) {
            response.crypto_algorithms = crypto::AlgorithmNames::from(algorithms);
        }
        response.signature_public_key = impl_->own_signature_public_key();

        chat.keys = std::move(keys);
        impl_->secrets.put(chat_uuid, std::move(secret_b));

        auto saved = impl_->repository.save_chat(chat);
        if (!saved) {
            impl_->secrets.erase(chat_uuid);
            chat.keys.secure_wipe();
            return impl_->fail(chat_uuid, type, saved);
        }

        LOG_INFO("Chat {}: answered InitRequest from {} with {}", chat_uuid, from, crypto::to_string(algorithms.kem));
    }

    if (!await_send(impl_->transport.send_init_response(from, response), MessageType::INIT_RESPONSE, chat_uuid)) {
        return transport_failed(MessageType::INIT_RESPONSE);
    }
    return CryptoResult();
}

CryptoResult HandshakeOrchestrator::handle_init_response(const std::string& from, const InitResponse& message) {
    const auto type = MessageType::INIT_RESPONSE;
    const auto& chat_uuid = message.chat_uuid;

    if (!impl_->crypto.is_initialized()) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "Crypto service not initialized");
    }

    if (message.public_key.empty() || message.kem_capsule.empty()) {
        return impl_->fail(chat_uuid, type, CryptoResult(CryptoError::INVALID_MESSAGE, "Missing public key or capsule"));
    }

    InitConfirm confirm;
    std::string send_to;
    {
        std::lock_guard<std::mutex> lock(impl_->lock_for(chat_uuid));

        auto existing = impl_->repository.get_chat(chat_uuid);
        if (!existing) {
            return impl_->fail(chat_uuid, type, CryptoResult(CryptoError::CHAT_NOT_FOUND, "Unknown chat"));
        }
        Chat chat = std::move(*existing);

        auto sender = impl_->check_sender(chat, from);
        if (!sender) {
            return impl_->fail(chat_uuid, type, sender);
        }

        if (chat.is_established() || chat.keys.has_peer_key()) {
            LOG_DEBUG("Chat {}: duplicate InitResponse ignored", chat_uuid);
            return CryptoResult();
        }

        if (chat.role != ChatRole::INITIATOR || !chat.keys.has_key_pair()) {
            return impl_->fail(chat_uuid, type, CryptoResult(CryptoError::INVALID_STATE, "Chat is not awaiting a response"));
        }

        if (message.crypto_algorithms) {
            crypto::CryptoAlgorithms declared;
            auto resolved = impl_->crypto.resolve_algorithms(*message.crypto_algorithms, declared);
            if (!resolved) {
                return impl_->fail(chat_uuid, type, resolved);
            }
            if (declared.kem != chat.algorithms.kem) {
                return impl_->fail(chat_uuid, type,
                                   CryptoResult(CryptoError::UNSUPPORTED_ALGORITHM, "Responder switched KEM algorithm"));
            }
        }

        auto response_transcript = create_response_transcript(
            chat_uuid, chat.algorithms.kem, chat.keys.public_key_self, message.public_key, message.kem_capsule);

        bool responder_verified = false;
        auto result = impl_->check_peer_signature(
            chat_uuid, from, RESPONSE_SIGNATURE_CONTEXT, response_transcript, message.user_signature,
            message.signature_public_key, chat.algorithms.signature, responder_verified);
        if (!result) {
            return impl_->fail(chat_uuid, type, result);
        }

        auto working = chat.keys.clone();
        result = impl_->crypto.update_chat_keys_with_peer_key(working, message.public_key);
        if (!result) {
            working.secure_wipe();
            return impl_->fail(chat_uuid, type, result);
        }

        SecureBytes secret_b;
        result = impl_->crypto.extract_secret(message.kem_capsule, working.private_key_self.span(),
                                              chat.algorithms.kem, secret_b);
        if (!result) {
            working.secure_wipe();
            return impl_->fail(chat_uuid, type, result);
        }

        SecureBytes secret_a;
        Bytes capsule_a;
        result = impl_->crypto.encapsulate(message.public_key, chat.algorithms.kem, secret_a, capsule_a);
        if (!result) {
            working.secure_wipe();
            return impl_->fail(chat_uuid, type, result);
        }

        std::string fingerprint;
        result = impl_->crypto.generate_fingerprint(working, fingerprint);
        if (!result) {
            working.secure_wipe();
            return impl_->fail(chat_uuid, type, result);
        }

        crypto::ChatKeys established;
        result = impl_->crypto.complete_handshake(working, secret_a.span(), secret_b.span(), established);
        secret_a.clear();
        secret_b.clear();
        working.secure_wipe();
        if (!result) {
            return impl_->fail(chat_uuid, type, result);
        }

        auto final_transcript = create_final_transcript(response_transcript, capsule_a);

        Bytes signature;
        result = impl_->sign_transcript(CONFIRM_SIGNATURE_CONTEXT, final_transcript, signature);
        if (!result) {
            established.secure_wipe();
            return impl_->fail(chat_uuid, type, result);
        }

        auto now = std::chrono::system_clock::now();
        chat.keys.secure_wipe();
        chat.keys = std::move(established);
        chat.fingerprint = fingerprint;
        chat.transcript_hash = to_bytes(final_transcript);
        chat.key_establishment_status = KeyEstablishmentStatus::ESTABLISHED;
        chat.key_establishment_completed_at = now;
        chat.last_activity = now;
        chat.peer_crypto.peer_id = from;
        chat.peer_crypto.peer_algorithms = chat.algorithms;
        chat.peer_crypto.signature_public_key = message.signature_public_key;
        if (!message.signature_public_key.empty()) {
            chat.peer_crypto.signature_algorithm = chat.algorithms.signature;
        }
        chat.peer_crypto.verified = responder_verified;
        chat.peer_crypto.last_updated = now;

        auto saved = impl_->repository.save_chat(chat);
        if (!saved) {
            chat.keys.secure_wipe();
            return impl_->fail(chat_uuid, type, saved);
        }

        LOG_INFO("Chat {}: key established as initiator, fingerprint {}", chat_uuid, fingerprint);

        confirm.chat_uuid = chat_uuid;
        confirm.kem_capsule = std::move(capsule_a);
        confirm.signature = std::move(signature);
        send_to = from;
    }

    if (!await_send(impl_->transport.send_init_confirm(send_to, confirm), MessageType::INIT_CONFIRM, chat_uuid)) {
        return transport_failed(MessageType::INIT_CONFIRM);
    }
    return CryptoResult();
}

CryptoResult HandshakeOrchestrator::handle_init_confirm(const std::string& from, const InitConfirm& message) {
    const auto type = MessageType::INIT_CONFIRM;
    const auto& chat_uuid = message.chat_uuid;

    if (!impl_->crypto.is_initialized()) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "Crypto service not initialized");
    }

    if (message.kem_capsule.empty()) {
        return impl_->fail(chat_uuid, type, CryptoResult(CryptoError::INVALID_MESSAGE, "Missing capsule"));
    }

    InitSignature finish;
    {
        std::lock_guard<std::mutex> lock(impl_->lock_for(chat_uuid));

        auto existing = impl_->repository.get_chat(chat_uuid);
        if (!existing) {
            return impl_->fail(chat_uuid, type, CryptoResult(CryptoError::CHAT_NOT_FOUND, "Unknown chat"));
        }
        Chat chat = std::move(*existing);

        auto sender = impl_->check_sender(chat, from);
        if (!sender) {
            return impl_->fail(chat_uuid, type, sender);
        }

        if (chat.is_established()) {
            LOG_DEBUG("Chat {}: duplicate InitConfirm ignored", chat_uuid);
            return CryptoResult();
        }

        crypto::Sha3Hash response_transcript;
        if (chat.role != ChatRole::RESPONDER || !chat.keys.has_key_pair() || !chat.keys.has_peer_key() ||
            !to_hash(chat.transcript_hash, response_transcript)) {
            return impl_->fail(chat_uuid, type, CryptoResult(CryptoError::INVALID_STATE, "Chat is not awaiting a confirm"));
        }

        // Stays in the store until the ESTABLISHED record is saved
        auto secret_b = impl_->secrets.peek(chat_uuid);
        if (!secret_b) {
            return impl_->fail(chat_uuid, type,
                               CryptoResult(CryptoError::MISSING_TRANSIENT_SECRET, "No pending secret for chat"));
        }

        auto final_transcript = create_final_transcript(response_transcript, message.kem_capsule);

        bool initiator_verified = false;
        auto signature_algorithm = chat.peer_crypto.signature_algorithm.value_or(chat.algorithms.signature);
        auto result = impl_->check_peer_signature(
            chat_uuid, from, CONFIRM_SIGNATURE_CONTEXT, final_transcript, message.signature,
            chat.peer_crypto.signature_public_key, signature_algorithm, initiator_verified);
        if (!result) {
            return impl_->fail(chat_uuid, type, result);
        }

        SecureBytes secret_a;
        result = impl_->crypto.extract_secret(message.kem_capsule, chat.keys.private_key_self.span(),
                                              chat.algorithms.kem, secret_a);
        if (!result) {
            return impl_->fail(chat_uuid, type, result);
        }

        std::string fingerprint;
        result = impl_->crypto.generate_fingerprint(chat.keys, fingerprint);
        if (!result) {
            return impl_->fail(chat_uuid, type, result);
        }

        crypto::ChatKeys established;
        result = impl_->crypto.complete_handshake(chat.keys, secret_a.span(), secret_b->span(), established);
        secret_a.clear();
        secret_b->clear();
        if (!result) {
            return impl_->fail(chat_uuid, type, result);
        }

        Bytes signature;
        result = impl_->sign_transcript(FINISH_SIGNATURE_CONTEXT, final_transcript, signature);
        if (!result) {
            established.secure_wipe();
            return impl_->fail(chat_uuid, type, result);
        }

        auto now = std::chrono::system_clock::now();
        chat.keys.secure_wipe();
        chat.keys = std::move(established);
        chat.fingerprint = fingerprint;
        chat.transcript_hash = to_bytes(final_transcript);
        chat.key_establishment_status = KeyEstablishmentStatus::ESTABLISHED;
        chat.key_establishment_completed_at = now;
        chat.last_activity = now;
        chat.peer_crypto.verified = initiator_verified;
        chat.peer_crypto.last_updated = now;

        auto saved = impl_->repository.save_chat(chat);
        if (!saved) {
            chat.keys.secure_wipe();
            return impl_->fail(chat_uuid, type, saved);
        }
        impl_->secrets.erase(chat_uuid);

        LOG_INFO("Chat {}: key established as responder, fingerprint {}", chat_uuid, fingerprint);

        finish.chat_uuid = chat_uuid;
        finish.signature = std::move(signature);
        finish.signature_public_key = impl_->own_signature_public_key();
    }

    if (!await_send(impl_->transport.send_init_signature(from, finish), MessageType::INIT_SIGNATURE, chat_uuid)) {
        return transport_failed(MessageType::INIT_SIGNATURE);
    }
    return CryptoResult();
}

CryptoResult HandshakeOrchestrator::handle_init_signature(const std::string& from, const InitSignature& message) {
    const auto type = MessageType::INIT_SIGNATURE;
    const auto& chat_uuid = message.chat_uuid;

    std::lock_guard<std::mutex> lock(impl_->lock_for(chat_uuid));

    auto existing = impl_->repository.get_chat(chat_uuid);
    if (!existing) {
        return impl_->fail(chat_uuid, type, CryptoResult(CryptoError::CHAT_NOT_FOUND, "Unknown chat"));
    }
    const Chat& chat = *existing;

    auto sender = impl_->check_sender(chat, from);
    if (!sender) {
        return impl_->fail(chat_uuid, type, sender);
    }

    crypto::Sha3Hash final_transcript;
    if (chat.role != ChatRole::INITIATOR || !chat.is_established() ||
        !to_hash(chat.transcript_hash, final_transcript)) {
        return impl_->fail(chat_uuid, type, CryptoResult(CryptoError::INVALID_STATE, "Chat is not awaiting a signature"));
    }

    auto peer_crypto = chat.peer_crypto;
    if (!message.signature_public_key.empty()) {
        if (!peer_crypto.signature_public_key.empty() &&
            peer_crypto.signature_public_key != message.signature_public_key) {
            return impl_->fail(chat_uuid, type,
                               CryptoResult(CryptoError::AUTHENTICATION_FAILED, "Responder changed its signature key"));
        }
        peer_crypto.signature_public_key = message.signature_public_key;
    }

    auto signature_algorithm = peer_crypto.signature_algorithm.value_or(chat.algorithms.signature);

    bool finish_verified = false;
    auto result = impl_->check_peer_signature(
        chat_uuid, from, FINISH_SIGNATURE_CONTEXT, final_transcript, message.signature,
        peer_crypto.signature_public_key, signature_algorithm, finish_verified);
    if (!result) {
        return impl_->fail(chat_uuid, type, result);
    }

    if (!peer_crypto.signature_public_key.empty()) {
        peer_crypto.signature_algorithm = signature_algorithm;
    }
    peer_crypto.verified = peer_crypto.verified && finish_verified;
    peer_crypto.last_updated = std::chrono::system_clock::now();

    result = impl_->repository.update_peer_crypto(chat_uuid, peer_crypto);
    if (!result) {
        return impl_->fail(chat_uuid, type, result);
    }

    LOG_INFO("Chat {}: responder signature {}", chat_uuid, peer_crypto.verified ? "verified" : "not verified");
    return CryptoResult();
}

CryptoResult HandshakeOrchestrator::process(const std::string& from, std::span<const std::uint8_t> envelope) {
    try {
        std::span<const std::uint8_t> payload;
        auto type = decode_envelope(envelope, payload);

        switch (type) {
            case MessageType::INIT_REQUEST:
                return handle_init_request(from, InitRequest::deserialize(payload));
            case MessageType::INIT_RESPONSE:
                return handle_init_response(from, InitResponse::deserialize(payload));
            case MessageType::INIT_CONFIRM:
                return handle_init_confirm(from, InitConfirm::deserialize(payload));
            case MessageType::INIT_SIGNATURE:
                return handle_init_signature(from, InitSignature::deserialize(payload));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Dropping malformed handshake message from {}: {}", from, e.what());
        return CryptoResult(CryptoError::INVALID_MESSAGE, e.what());
    }

    return CryptoResult(CryptoError::INVALID_MESSAGE, "Unhandled message type");
}

bool HandshakeOrchestrator::dispatch(const std::string& from, std::vector<std::uint8_t> envelope) {
    // Released when the task has run or the pool discards it
    impl_->task_queued();
    Impl* impl = impl_.get();
    std::shared_ptr<void> in_flight(nullptr, [impl](void*) { impl->task_done(); });

    return impl_->worker_pool.post([this, in_flight, from, envelope = std::move(envelope)]() {
        auto result = process(from, envelope);
        if (!result) {
            LOG_DEBUG("Handshake message from {} dropped: {}", from, result.message);
        }
    });
}

CryptoResult HandshakeOrchestrator::delete_chat(const std::string& chat_uuid) {
    CryptoResult result;
    {
        std::lock_guard<std::mutex> lock(impl_->lock_for(chat_uuid));
        impl_->secrets.erase(chat_uuid);
        result = impl_->repository.delete_chat(chat_uuid);
    }

    if (result) {
        LOG_INFO("Chat {} deleted, key material wiped", chat_uuid);
    }
    return result;
}

size_t HandshakeOrchestrator::purge_expired_secrets() {
    auto evicted = impl_->secrets.evict_expired();
    if (evicted > 0) {
        LOG_INFO("Evicted {} expired transient secrets", evicted);
    }
    return evicted;
}

CryptoResult HandshakeOrchestrator::encrypt_message(
    const std::string& chat_uuid,
    const std::string& message,
    Bytes& out_ciphertext) {

    auto chat = impl_->repository.get_chat(chat_uuid);
    if (!chat) {
        return CryptoResult(CryptoError::CHAT_NOT_FOUND, "Unknown chat " + chat_uuid);
    }
    if (!chat->is_ready_for_messaging()) {
        return CryptoResult(CryptoError::KEYS_NOT_ESTABLISHED, "Chat keys not initialized");
    }

    return impl_->crypto.encrypt_message(message, chat->keys.symmetric_key.span(), out_ciphertext,
                                         chat->algorithms.symmetric);
}

CryptoResult HandshakeOrchestrator::decrypt_message(
    const std::string& chat_uuid,
    std::span<const std::uint8_t> ciphertext,
    std::string& out_message) {

    auto chat = impl_->repository.get_chat(chat_uuid);
    if (!chat) {
        return CryptoResult(CryptoError::CHAT_NOT_FOUND, "Unknown chat " + chat_uuid);
    }
    if (!chat->is_ready_for_messaging()) {
        return CryptoResult(CryptoError::KEYS_NOT_ESTABLISHED, "Chat keys not initialized");
    }

    return impl_->crypto.decrypt_message(ciphertext, chat->keys.symmetric_key.span(), out_message,
                                         chat->algorithms.symmetric);
}

std::optional<KeyEstablishmentStatus> HandshakeOrchestrator::status(const std::string& chat_uuid) const {
    auto chat = impl_->repository.get_chat(chat_uuid);
    if (!chat) {
        return std::nullopt;
    }
    return chat->key_establishment_status;
}

}
