#include <gtest/gtest.h>
#include "pqchat/handshake/handshake_orchestrator.hpp"
#include "pqchat/handshake/algorithm_provider.hpp"
#include "pqchat/handshake/loopback_transport.hpp"
#include "pqchat/handshake/transient_secret_store.hpp"
#include "pqchat/storage/sqlite_chat_store.hpp"
#include "pqchat/crypto/crypto_service.hpp"
#include "pqchat/core/worker_pool.hpp"
#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

using namespace pqchat;
using namespace pqchat::handshake;
using crypto::CryptoError;

namespace {

void remove_database(const std::string& path) {
    for (const auto& suffix : {"", "-wal", "-shm"}) {
        std::filesystem::remove(path + suffix);
    }
}

struct Endpoint {
    Endpoint(const std::string& id, const std::string& db_path, crypto::CryptoService& crypto,
             LoopbackNetwork& loopback, TransientSecretStore& secret_store,
             const AlgorithmProvider& provider, core::WorkerPool& pool, HandshakeOptions options = {})
        : network(loopback)
        , peer_id(id)
        , store(db_path)
        , transport(loopback, id)
        , orchestrator(id, crypto, store, transport, secret_store, provider, pool, options) {
        network.attach(peer_id, orchestrator);
    }

    ~Endpoint() {
        network.detach(peer_id);
    }

    LoopbackNetwork& network;
    std::string peer_id;
    storage::SqliteChatStore store;
    LoopbackTransport transport;
    HandshakeOrchestrator orchestrator;
};

}

class HandshakeIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        remove_database(alice_db_);
        remove_database(bob_db_);

        ASSERT_TRUE(crypto_.initialize().success());
        if (!crypto_.validate_algorithms(crypto::CryptoAlgorithms::defaults())) {
            GTEST_SKIP() << "KYBER/FALCON are not enabled in the linked liboqs";
        }

        start_endpoints();
    }

    void TearDown() override {
        pool_.wait_idle(std::chrono::seconds(30));
        alice_.reset();
        bob_.reset();
        remove_database(alice_db_);
        remove_database(bob_db_);
    }

    void start_endpoints(HandshakeOptions options = {}) {
        alice_ = std::make_unique<Endpoint>("alice", alice_db_, crypto_, network_, alice_secrets_,
                                            provider_, pool_, options);
        bob_ = std::make_unique<Endpoint>("bob", bob_db_, crypto_, network_, bob_secrets_,
                                          provider_, pool_, options);
        ASSERT_TRUE(alice_->store.initialize().success());
        ASSERT_TRUE(bob_->store.initialize().success());
    }

    void restart_endpoints(HandshakeOptions options = {}) {
        ASSERT_TRUE(pool_.wait_idle(std::chrono::seconds(30)));
        alice_.reset();
        bob_.reset();
        start_endpoints(options);
    }

    // Messages of these types are kept in held_ instead of being delivered
    void hold_messages(std::set<MessageType> types) {
        network_.set_interceptor([this, types](const std::string&, const std::string&, MessageType type,
                                               std::vector<std::uint8_t>& envelope) {
            if (types.count(type) == 0) {
                return true;
            }
            std::lock_guard<std::mutex> lock(held_mutex_);
            held_[type] = envelope;
            return false;
        });
    }

    std::vector<std::uint8_t> held(MessageType type) {
        std::lock_guard<std::mutex> lock(held_mutex_);
        auto it = held_.find(type);
        return it != held_.end() ? it->second : std::vector<std::uint8_t>{};
    }

    bool wait_for_handshakes() {
        return pool_.wait_idle(std::chrono::seconds(60));
    }

    void expect_established(const std::string& chat_uuid) {
        auto alice_chat = alice_->store.get_chat(chat_uuid);
        auto bob_chat = bob_->store.get_chat(chat_uuid);
        ASSERT_TRUE(alice_chat.has_value()) << chat_uuid;
        ASSERT_TRUE(bob_chat.has_value()) << chat_uuid;

        EXPECT_EQ(alice_chat->key_establishment_status, KeyEstablishmentStatus::ESTABLISHED) << chat_uuid;
        EXPECT_EQ(bob_chat->key_establishment_status, KeyEstablishmentStatus::ESTABLISHED) << chat_uuid;
        EXPECT_EQ(alice_chat->keys.symmetric_key.data, bob_chat->keys.symmetric_key.data) << chat_uuid;
        EXPECT_EQ(alice_chat->fingerprint, bob_chat->fingerprint) << chat_uuid;
        EXPECT_FALSE(alice_chat->keys.has_key_pair()) << chat_uuid;
        EXPECT_FALSE(bob_chat->keys.has_key_pair()) << chat_uuid;
    }

    void expect_conversation(const std::string& chat_uuid, const std::string& text) {
        crypto::Bytes ciphertext;
        ASSERT_TRUE(alice_->orchestrator.encrypt_message(chat_uuid, text, ciphertext).success());

        std::string plaintext;
        ASSERT_TRUE(bob_->orchestrator.decrypt_message(chat_uuid, ciphertext, plaintext).success());
        EXPECT_EQ(plaintext, text);
    }

    const std::string alice_db_ = "test_integration_alice.db";
    const std::string bob_db_ = "test_integration_bob.db";

    crypto::CryptoService crypto_;
    core::WorkerPool pool_{4};
    LoopbackNetwork network_{LoopbackNetwork::Delivery::WORKER_POOL};
    FixedAlgorithmProvider provider_;
    TransientSecretStore alice_secrets_;
    TransientSecretStore bob_secrets_;

    std::mutex held_mutex_;
    std::map<MessageType, std::vector<std::uint8_t>> held_;

    std::unique_ptr<Endpoint> alice_;
    std::unique_ptr<Endpoint> bob_;
};

TEST_F(HandshakeIntegrationTest, SingleHandshakeOverWorkerPool) {
    ASSERT_TRUE(alice_->orchestrator.initialize_chat("chat-1", "First chat", "bob").success());
    ASSERT_TRUE(wait_for_handshakes());

    expect_established("chat-1");
    expect_conversation("chat-1", "Hello over the worker pool");

    EXPECT_EQ(network_.delivered_count(MessageType::INIT_REQUEST), 1u);
    EXPECT_EQ(network_.delivered_count(MessageType::INIT_RESPONSE), 1u);
    EXPECT_EQ(network_.delivered_count(MessageType::INIT_CONFIRM), 1u);
    EXPECT_EQ(network_.delivered_count(MessageType::INIT_SIGNATURE), 1u);
    EXPECT_EQ(bob_secrets_.size(), 0u);
}

TEST_F(HandshakeIntegrationTest, ConcurrentHandshakesInBothDirections) {
    const int chats_per_thread = 4;
    const int num_threads = 4;
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, t, &failures]() {
            for (int i = 0; i < chats_per_thread; ++i) {
                auto uuid = "chat-" + std::to_string(t) + "-" + std::to_string(i);
                // Alternate initiators so both stores act in both roles
                auto result = (i % 2 == 0)
                    ? alice_->orchestrator.initialize_chat(uuid, "", "bob")
                    : bob_->orchestrator.initialize_chat(uuid, "", "alice");
                if (!result) {
                    ++failures;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    ASSERT_EQ(failures.load(), 0);
    ASSERT_TRUE(wait_for_handshakes());

    const size_t total = chats_per_thread * num_threads;
    EXPECT_EQ(alice_->store.chat_count(), total);
    EXPECT_EQ(bob_->store.chat_count(), total);
    EXPECT_EQ(network_.delivered_count(MessageType::INIT_SIGNATURE), total);
    EXPECT_EQ(alice_secrets_.size(), 0u);
    EXPECT_EQ(bob_secrets_.size(), 0u);

    for (const auto& uuid : alice_->store.list_chats()) {
        expect_established(uuid);
        expect_conversation(uuid, "message for " + uuid);
    }
}

TEST_F(HandshakeIntegrationTest, ConcurrentDuplicatesTakeEffectOnce) {
    const int copies = 16;
    hold_messages({MessageType::INIT_REQUEST, MessageType::INIT_CONFIRM});

    ASSERT_TRUE(alice_->orchestrator.initialize_chat("dup-chat", "", "bob").success());
    auto request = held(MessageType::INIT_REQUEST);
    ASSERT_FALSE(request.empty());

    for (int i = 0; i < copies; ++i) {
        ASSERT_TRUE(bob_->orchestrator.dispatch("alice", request));
    }
    ASSERT_TRUE(wait_for_handshakes());

    EXPECT_EQ(network_.delivered_count(MessageType::INIT_RESPONSE), 1u);
    EXPECT_EQ(bob_secrets_.size(), 1u);
    auto alice_chat = alice_->store.get_chat("dup-chat");
    auto bob_chat = bob_->store.get_chat("dup-chat");
    ASSERT_TRUE(alice_chat.has_value());
    ASSERT_TRUE(bob_chat.has_value());
    EXPECT_EQ(alice_chat->key_establishment_status, KeyEstablishmentStatus::ESTABLISHED);
    EXPECT_EQ(bob_chat->key_establishment_status, KeyEstablishmentStatus::INITIALIZING);

    auto confirm = held(MessageType::INIT_CONFIRM);
    ASSERT_FALSE(confirm.empty());

    for (int i = 0; i < copies; ++i) {
        ASSERT_TRUE(bob_->orchestrator.dispatch("alice", confirm));
    }
    ASSERT_TRUE(wait_for_handshakes());

    EXPECT_EQ(network_.delivered_count(MessageType::INIT_SIGNATURE), 1u);
    EXPECT_EQ(bob_secrets_.size(), 0u);
    expect_established("dup-chat");
    expect_conversation("dup-chat", "sent once, applied once");
}

TEST_F(HandshakeIntegrationTest, DeleteRacingDuplicateRequestsLeavesConsistentState) {
    hold_messages({MessageType::INIT_REQUEST, MessageType::INIT_RESPONSE});

    ASSERT_TRUE(alice_->orchestrator.initialize_chat("race-chat", "", "bob").success());
    auto request = held(MessageType::INIT_REQUEST);
    ASSERT_FALSE(request.empty());

    auto delete_on_bob = [this]() {
        auto result = bob_->orchestrator.delete_chat("race-chat");
        EXPECT_TRUE(result.success() || result.error == CryptoError::CHAT_NOT_FOUND) << result.message;
    };

    for (int i = 0; i < 16; ++i) {
        ASSERT_TRUE(bob_->orchestrator.dispatch("alice", request));
        if (i % 4 == 0) {
            delete_on_bob();
        }
    }
    ASSERT_TRUE(wait_for_handshakes());
    delete_on_bob();
    ASSERT_EQ(bob_secrets_.size(), 0u);

    EXPECT_FALSE(bob_->store.get_chat("race-chat").has_value());

    // A later copy starts a clean responder run that completes normally
    hold_messages({});
    ASSERT_TRUE(bob_->orchestrator.dispatch("alice", request));
    ASSERT_TRUE(wait_for_handshakes());

    EXPECT_EQ(bob_secrets_.size(), 0u);
    expect_established("race-chat");
    expect_conversation("race-chat", "consistent after deletes");
}

TEST_F(HandshakeIntegrationTest, EstablishedChatsSurviveRestart) {
    ASSERT_TRUE(alice_->orchestrator.initialize_chat("persistent", "", "bob").success());
    ASSERT_TRUE(wait_for_handshakes());

    crypto::Bytes ciphertext;
    ASSERT_TRUE(alice_->orchestrator.encrypt_message("persistent", "sent before restart", ciphertext).success());

    restart_endpoints();

    EXPECT_EQ(bob_->orchestrator.status("persistent"), KeyEstablishmentStatus::ESTABLISHED);

    std::string plaintext;
    ASSERT_TRUE(bob_->orchestrator.decrypt_message("persistent", ciphertext, plaintext).success());
    EXPECT_EQ(plaintext, "sent before restart");

    // Re-initializing an established chat sends nothing
    ASSERT_TRUE(alice_->orchestrator.initialize_chat("persistent", "", "bob").success());
    ASSERT_TRUE(wait_for_handshakes());
    EXPECT_EQ(network_.delivered_count(MessageType::INIT_REQUEST), 1u);
}

TEST_F(HandshakeIntegrationTest, ResponderRestartKeepsPendingHandshake) {
    std::mutex captured_mutex;
    std::vector<std::uint8_t> held_confirm;

    network_.set_interceptor([&](const std::string&, const std::string&, MessageType type,
                                 std::vector<std::uint8_t>& envelope) {
        if (type != MessageType::INIT_CONFIRM) {
            return true;
        }
        std::lock_guard<std::mutex> lock(captured_mutex);
        held_confirm = envelope;
        return false;
    });

    ASSERT_TRUE(alice_->orchestrator.initialize_chat("pending", "", "bob").success());
    ASSERT_TRUE(wait_for_handshakes());
    network_.set_interceptor(nullptr);

    ASSERT_FALSE(held_confirm.empty());
    EXPECT_EQ(bob_->orchestrator.status("pending"), KeyEstablishmentStatus::INITIALIZING);

    // The transient secret lives outside the chat store, so it outlives the restart here
    restart_endpoints();
    ASSERT_TRUE(bob_->orchestrator.process("alice", held_confirm).success());
    ASSERT_TRUE(wait_for_handshakes());

    expect_established("pending");
}

TEST_F(HandshakeIntegrationTest, LostTransientSecretBlocksConfirm) {
    std::vector<std::uint8_t> held_confirm;
    std::mutex captured_mutex;

    network_.set_interceptor([&](const std::string&, const std::string&, MessageType type,
                                 std::vector<std::uint8_t>& envelope) {
        if (type != MessageType::INIT_CONFIRM) {
            return true;
        }
        std::lock_guard<std::mutex> lock(captured_mutex);
        held_confirm = envelope;
        return false;
    });

    ASSERT_TRUE(alice_->orchestrator.initialize_chat("lost", "", "bob").success());
    ASSERT_TRUE(wait_for_handshakes());
    network_.set_interceptor(nullptr);

    bob_secrets_.clear();

    auto result = bob_->orchestrator.process("alice", held_confirm);
    EXPECT_EQ(result.error, CryptoError::MISSING_TRANSIENT_SECRET);
    EXPECT_EQ(bob_->orchestrator.status("lost"), KeyEstablishmentStatus::INITIALIZING);
    EXPECT_EQ(alice_->orchestrator.status("lost"), KeyEstablishmentStatus::ESTABLISHED);

    // Starting over under a new chat id still works
    ASSERT_TRUE(alice_->orchestrator.initialize_chat("lost-retry", "", "bob").success());
    ASSERT_TRUE(wait_for_handshakes());
    expect_established("lost-retry");
}

TEST_F(HandshakeIntegrationTest, SignedHandshakesUnderLoad) {
    HandshakeOptions strict;
    strict.require_signatures = true;
    restart_endpoints(strict);

    ASSERT_TRUE(alice_->orchestrator.generate_signature_identity(crypto::SignatureAlgorithm::FALCON).success());
    ASSERT_TRUE(bob_->orchestrator.generate_signature_identity(crypto::SignatureAlgorithm::FALCON).success());

    const int num_chats = 8;
    for (int i = 0; i < num_chats; ++i) {
        ASSERT_TRUE(alice_->orchestrator.initialize_chat("signed-" + std::to_string(i), "", "bob").success());
    }
    ASSERT_TRUE(wait_for_handshakes());

    for (int i = 0; i < num_chats; ++i) {
        auto uuid = "signed-" + std::to_string(i);
        expect_established(uuid);

        auto alice_chat = alice_->store.get_chat(uuid);
        auto bob_chat = bob_->store.get_chat(uuid);
        ASSERT_TRUE(alice_chat && bob_chat);
        EXPECT_TRUE(alice_chat->peer_crypto.verified) << uuid;
        EXPECT_TRUE(bob_chat->peer_crypto.verified) << uuid;
        EXPECT_EQ(alice_chat->peer_crypto.signature_algorithm, crypto::SignatureAlgorithm::FALCON);
    }
}
