#include <benchmark/benchmark.h>
#include "pqchat/crypto/crypto_service.hpp"
#include "pqchat/crypto/hash.hpp"
#include "pqchat/crypto/kem.hpp"
#include "pqchat/crypto/random.hpp"
#include "pqchat/crypto/signature.hpp"
#include "pqchat/handshake/handshake_orchestrator.hpp"
#include "pqchat/handshake/algorithm_provider.hpp"
#include "pqchat/handshake/chat_repository.hpp"
#include "pqchat/handshake/loopback_transport.hpp"
#include "pqchat/handshake/transient_secret_store.hpp"
#include "pqchat/core/worker_pool.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace pqchat::crypto;
using namespace pqchat::handshake;

class CryptoBenchmarkFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        service_ = std::make_unique<CryptoService>();
        service_->initialize();
        symmetric_key_ = SecureRandom::generate_bytes(SYMMETRIC_KEY_SIZE);
    }

    void TearDown(const ::benchmark::State& state) override {
        service_.reset();
    }

protected:
    bool require(benchmark::State& state, KemAlgorithm algorithm) {
        if (!service_->is_initialized() || !KemEngine::is_available(algorithm)) {
            state.SkipWithError("KEM not available in liboqs");
            return false;
        }
        return true;
    }

    bool require(benchmark::State& state, SignatureAlgorithm algorithm) {
        if (!service_->is_initialized() || !SignatureEngine::is_available(algorithm)) {
            state.SkipWithError("Signature scheme not available in liboqs");
            return false;
        }
        return true;
    }

    std::unique_ptr<CryptoService> service_;
    SecureBytes symmetric_key_;
};

// Key encapsulation
BENCHMARK_F(CryptoBenchmarkFixture, Kem_Kyber_KeyGeneration)(benchmark::State& state) {
    if (!require(state, KemAlgorithm::KYBER)) {
        return;
    }

    for (auto _ : state) {
        Bytes public_key;
        SecureBytes private_key;
        benchmark::DoNotOptimize(service_->generate_kem_keypair(KemAlgorithm::KYBER, public_key, private_key));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK_F(CryptoBenchmarkFixture, Kem_Kyber_Encapsulate)(benchmark::State& state) {
    if (!require(state, KemAlgorithm::KYBER)) {
        return;
    }

    Bytes public_key;
    SecureBytes private_key;
    service_->generate_kem_keypair(KemAlgorithm::KYBER, public_key, private_key);

    for (auto _ : state) {
        SecureBytes secret;
        Bytes capsule;
        benchmark::DoNotOptimize(service_->encapsulate(public_key, KemAlgorithm::KYBER, secret, capsule));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK_F(CryptoBenchmarkFixture, Kem_Kyber_Decapsulate)(benchmark::State& state) {
    if (!require(state, KemAlgorithm::KYBER)) {
        return;
    }

    Bytes public_key;
    SecureBytes private_key;
    service_->generate_kem_keypair(KemAlgorithm::KYBER, public_key, private_key);

    SecureBytes secret;
    Bytes capsule;
    service_->encapsulate(public_key, KemAlgorithm::KYBER, secret, capsule);

    for (auto _ : state) {
        SecureBytes extracted;
        benchmark::DoNotOptimize(service_->extract_secret(capsule, private_key.span(), KemAlgorithm::KYBER, extracted));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK_F(CryptoBenchmarkFixture, Kem_Frodo_KeyGeneration)(benchmark::State& state) {
    if (!require(state, KemAlgorithm::FRODO)) {
        return;
    }

    for (auto _ : state) {
        Bytes public_key;
        SecureBytes private_key;
        benchmark::DoNotOptimize(service_->generate_kem_keypair(KemAlgorithm::FRODO, public_key, private_key));
    }
    state.SetItemsProcessed(state.iterations());
}

// Signatures
BENCHMARK_F(CryptoBenchmarkFixture, Signature_Falcon_Sign)(benchmark::State& state) {
    if (!require(state, SignatureAlgorithm::FALCON)) {
        return;
    }

    Bytes public_key;
    SecureBytes private_key;
    service_->generate_signature_keypair(SignatureAlgorithm::FALCON, public_key, private_key);

    std::string test_data = "This is a test message for signature benchmarking";
    std::vector<uint8_t> data_bytes(test_data.begin(), test_data.end());

    for (auto _ : state) {
        Bytes signature;
        benchmark::DoNotOptimize(service_->sign(data_bytes, private_key.span(), SignatureAlgorithm::FALCON, signature));
    }
    state.SetBytesProcessed(state.iterations() * test_data.size());
}

BENCHMARK_F(CryptoBenchmarkFixture, Signature_Falcon_Verify)(benchmark::State& state) {
    if (!require(state, SignatureAlgorithm::FALCON)) {
        return;
    }

    Bytes public_key;
    SecureBytes private_key;
    service_->generate_signature_keypair(SignatureAlgorithm::FALCON, public_key, private_key);

    std::string test_data = "This is a test message for signature benchmarking";
    std::vector<uint8_t> data_bytes(test_data.begin(), test_data.end());

    Bytes signature;
    service_->sign(data_bytes, private_key.span(), SignatureAlgorithm::FALCON, signature);

    for (auto _ : state) {
        benchmark::DoNotOptimize(service_->verify(data_bytes, signature, public_key, SignatureAlgorithm::FALCON));
    }
    state.SetBytesProcessed(state.iterations() * test_data.size());
}

// Symmetric encryption; the argument is the plaintext size
BENCHMARK_DEFINE_F(CryptoBenchmarkFixture, Encryption_Aes256Gcm)(benchmark::State& state) {
    std::vector<uint8_t> plaintext(static_cast<size_t>(state.range(0)), 0x42);

    for (auto _ : state) {
        Bytes ciphertext;
        benchmark::DoNotOptimize(service_->encrypt(plaintext, symmetric_key_.span(), SymmetricAlgorithm::AES_256, ciphertext));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(CryptoBenchmarkFixture, Encryption_Aes256Gcm)->Arg(1024)->Arg(65536);

BENCHMARK_DEFINE_F(CryptoBenchmarkFixture, Decryption_Aes256Gcm)(benchmark::State& state) {
    std::vector<uint8_t> plaintext(static_cast<size_t>(state.range(0)), 0x42);

    // Pre-encrypt the data
    Bytes ciphertext;
    service_->encrypt(plaintext, symmetric_key_.span(), SymmetricAlgorithm::AES_256, ciphertext);

    for (auto _ : state) {
        Bytes decrypted;
        benchmark::DoNotOptimize(service_->decrypt(ciphertext, symmetric_key_.span(), SymmetricAlgorithm::AES_256, decrypted));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(CryptoBenchmarkFixture, Decryption_Aes256Gcm)->Arg(1024)->Arg(65536);

BENCHMARK_DEFINE_F(CryptoBenchmarkFixture, Encryption_ChaCha20)(benchmark::State& state) {
    std::vector<uint8_t> plaintext(static_cast<size_t>(state.range(0)), 0x42);

    for (auto _ : state) {
        Bytes ciphertext;
        benchmark::DoNotOptimize(service_->encrypt(plaintext, symmetric_key_.span(), SymmetricAlgorithm::CHACHA20, ciphertext));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(CryptoBenchmarkFixture, Encryption_ChaCha20)->Arg(1024)->Arg(65536);

BENCHMARK_DEFINE_F(CryptoBenchmarkFixture, Encryption_Salsa20)(benchmark::State& state) {
    std::vector<uint8_t> plaintext(static_cast<size_t>(state.range(0)), 0x42);

    for (auto _ : state) {
        Bytes ciphertext;
        benchmark::DoNotOptimize(service_->encrypt(plaintext, symmetric_key_.span(), SymmetricAlgorithm::SALSA20, ciphertext));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(CryptoBenchmarkFixture, Encryption_Salsa20)->Arg(1024)->Arg(65536);

// Hashing
static void Hash_SHA3_256(benchmark::State& state) {
    std::vector<uint8_t> data_bytes(static_cast<size_t>(state.range(0)), 0x42);

    for (auto _ : state) {
        benchmark::DoNotOptimize(Sha3Hasher::hash(data_bytes));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(Hash_SHA3_256)->Arg(32)->Arg(1024)->Arg(65536);

BENCHMARK_F(CryptoBenchmarkFixture, Fingerprint)(benchmark::State& state) {
    std::vector<uint8_t> key_a(1184, 0x11);
    std::vector<uint8_t> key_b(1184, 0x22);

    for (auto _ : state) {
        std::string fingerprint;
        benchmark::DoNotOptimize(service_->fingerprint(key_a, key_b, fingerprint));
    }
    state.SetItemsProcessed(state.iterations());
}

// Random number generation
static void RandomGeneration_Bytes_32(benchmark::State& state) {
    for (auto _ : state) {
        std::vector<uint8_t> random_bytes(32);
        benchmark::DoNotOptimize(SecureRandom::generate_bytes(random_bytes));
    }
    state.SetBytesProcessed(state.iterations() * 32);
}
BENCHMARK(RandomGeneration_Bytes_32);

// Complete four-message key establishment between two in-process parties
class HandshakeBenchmarkFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        crypto_ = std::make_unique<CryptoService>();
        crypto_->initialize();

        pool_ = std::make_unique<pqchat::core::WorkerPool>(1);
        network_ = std::make_unique<LoopbackNetwork>(LoopbackNetwork::Delivery::INLINE);

        alice_transport_ = std::make_unique<LoopbackTransport>(*network_, "alice");
        bob_transport_ = std::make_unique<LoopbackTransport>(*network_, "bob");

        alice_ = std::make_unique<HandshakeOrchestrator>("alice", *crypto_, alice_chats_, *alice_transport_,
                                                         alice_secrets_, provider_, *pool_);
        bob_ = std::make_unique<HandshakeOrchestrator>("bob", *crypto_, bob_chats_, *bob_transport_,
                                                       bob_secrets_, provider_, *pool_);
        network_->attach("alice", *alice_);
        network_->attach("bob", *bob_);
    }

    void TearDown(const ::benchmark::State& state) override {
        network_->detach("alice");
        network_->detach("bob");
        alice_.reset();
        bob_.reset();
        pool_.reset();
    }

protected:
    std::unique_ptr<CryptoService> crypto_;
    std::unique_ptr<pqchat::core::WorkerPool> pool_;
    std::unique_ptr<LoopbackNetwork> network_;
    std::unique_ptr<LoopbackTransport> alice_transport_;
    std::unique_ptr<LoopbackTransport> bob_transport_;
    InMemoryChatRepository alice_chats_;
    InMemoryChatRepository bob_chats_;
    TransientSecretStore alice_secrets_;
    TransientSecretStore bob_secrets_;
    FixedAlgorithmProvider provider_;
    std::unique_ptr<HandshakeOrchestrator> alice_;
    std::unique_ptr<HandshakeOrchestrator> bob_;
};

BENCHMARK_F(HandshakeBenchmarkFixture, CompleteHandshake)(benchmark::State& state) {
    if (!crypto_->validate_algorithms(CryptoAlgorithms::defaults())) {
        state.SkipWithError("KYBER/FALCON not available in liboqs");
        return;
    }

    size_t counter = 0;
    for (auto _ : state) {
        auto chat_uuid = "bench-" + std::to_string(counter++);
        benchmark::DoNotOptimize(alice_->initialize_chat(chat_uuid, "", "bob"));

        state.PauseTiming();
        alice_->delete_chat(chat_uuid);
        bob_->delete_chat(chat_uuid);
        state.ResumeTiming();
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK_F(HandshakeBenchmarkFixture, SignedHandshake)(benchmark::State& state) {
    if (!crypto_->validate_algorithms(CryptoAlgorithms::defaults())) {
        state.SkipWithError("KYBER/FALCON not available in liboqs");
        return;
    }

    alice_->generate_signature_identity(SignatureAlgorithm::FALCON);
    bob_->generate_signature_identity(SignatureAlgorithm::FALCON);

    size_t counter = 0;
    for (auto _ : state) {
        auto chat_uuid = "signed-" + std::to_string(counter++);
        benchmark::DoNotOptimize(alice_->initialize_chat(chat_uuid, "", "bob"));

        state.PauseTiming();
        alice_->delete_chat(chat_uuid);
        bob_->delete_chat(chat_uuid);
        state.ResumeTiming();
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK_MAIN();
