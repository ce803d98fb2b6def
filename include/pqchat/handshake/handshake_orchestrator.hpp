#pragma once

#include "pqchat/crypto/algorithms.hpp"
#include "pqchat/crypto/crypto_types.hpp"
#include "pqchat/handshake/chat.hpp"
#include "pqchat/handshake/messages.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace pqchat::core {
class Config;
class WorkerPool;
}

namespace pqchat::crypto {
class CryptoService;
}

namespace pqchat::handshake {

class AlgorithmProvider;
class ChatRepository;
class HandshakeTransport;
class TransientSecretStore;

struct HandshakeOptions {
    // Reject peers that send empty signatures
    bool require_signatures = false;
    // Declare the algorithm triple in InitRequest / InitResponse
    bool include_algorithms = true;

    static HandshakeOptions from_config(const core::Config& config);
};

// Long-term signing key used to authenticate this party's handshake messages
struct SignatureIdentity {
    crypto::SignatureAlgorithm algorithm = crypto::SignatureAlgorithm::FALCON;
    crypto::Bytes public_key;
    crypto::SecureBytes private_key;
};

// Drives the four-message chat key establishment:
//   1. InitRequest   initiator -> responder  (initiator KEM public key)
//   2. InitResponse  responder -> initiator  (responder public key, capsule B)
//   3. InitConfirm   initiator -> responder  (capsule A, initiator ESTABLISHED)
//   4. InitSignature responder -> initiator  (responder ESTABLISHED)
// Work on one chat is serialized; duplicate messages are no-ops. A failed
// step leaves the chat and any pending secret as they were.
class HandshakeOrchestrator {
public:
    HandshakeOrchestrator(
        std::string local_id,
        crypto::CryptoService& crypto,
        ChatRepository& repository,
        HandshakeTransport& transport,
        TransientSecretStore& secret_store,
        const AlgorithmProvider& algorithm_provider,
        core::WorkerPool& worker_pool,
        HandshakeOptions options = {}
    );

    // Blocks until every message queued by dispatch() has run; never destroy
    // an orchestrator from one of its own worker tasks
    ~HandshakeOrchestrator();

    HandshakeOrchestrator(const HandshakeOrchestrator&) = delete;
    HandshakeOrchestrator& operator=(const HandshakeOrchestrator&) = delete;

    const std::string& local_id() const;

    void set_signature_identity(SignatureIdentity identity);
    crypto::CryptoResult generate_signature_identity(crypto::SignatureAlgorithm algorithm);
    bool has_signature_identity() const;

    // Pins the signature key expected from a peer
    void add_trusted_peer(const std::string& peer_id, crypto::Bytes signature_public_key);
    bool is_trusted_peer(const std::string& peer_id, std::span<const std::uint8_t> signature_public_key) const;

    // Initiator entry point; sends InitRequest. Re-sends it when the chat is
    // still INITIALIZING, is a no-op once ESTABLISHED.
    crypto::CryptoResult initialize_chat(
        const std::string& chat_uuid,
        const std::string& name,
        const std::string& peer_id,
        std::optional<crypto::CryptoAlgorithms> algorithms = std::nullopt
    );

    crypto::CryptoResult handle_init_request(const std::string& from, const InitRequest& message);
    crypto::CryptoResult handle_init_response(const std::string& from, const InitResponse& message);
    crypto::CryptoResult handle_init_confirm(const std::string& from, const InitConfirm& message);
    crypto::CryptoResult handle_init_signature(const std::string& from, const InitSignature& message);

    // Decodes one framed message and runs the matching handler in the caller's thread
    crypto::CryptoResult process(const std::string& from, std::span<const std::uint8_t> envelope);

    // Same as process() on the worker pool; failures are logged and dropped
    bool dispatch(const std::string& from, std::vector<std::uint8_t> envelope);

    // Wipes the chat's keys and any pending transient secret
    crypto::CryptoResult delete_chat(const std::string& chat_uuid);

    size_t purge_expired_secrets();

    crypto::CryptoResult encrypt_message(
        const std::string& chat_uuid,
        const std::string& message,
        crypto::Bytes& out_ciphertext
    );

    crypto::CryptoResult decrypt_message(
        const std::string& chat_uuid,
        std::span<const std::uint8_t> ciphertext,
        std::string& out_message
    );

    std::optional<KeyEstablishmentStatus> status(const std::string& chat_uuid) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
