#include "pqchat/core/command_handler.hpp"
#include "pqchat/core/config.hpp"
#include "pqchat/core/logger.hpp"
#include "pqchat/core/utils.hpp"
#include "pqchat/core/worker_pool.hpp"
#include "pqchat/crypto/crypto_service.hpp"
#include "pqchat/crypto/kem.hpp"
#include "pqchat/crypto/random.hpp"
#include "pqchat/crypto/signature.hpp"
#include "pqchat/handshake/algorithm_provider.hpp"
#include "pqchat/handshake/chat_repository.hpp"
#include "pqchat/handshake/handshake_orchestrator.hpp"
#include "pqchat/handshake/loopback_transport.hpp"
#include "pqchat/handshake/transient_secret_store.hpp"
#include "pqchat/storage/sqlite_chat_store.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <optional>

namespace pqchat::core {

namespace {
    const char* yes_no(bool value) {
        return value ? "yes" : "no";
    }

    std::optional<crypto::AlgorithmType> parse_type_filter(const std::string& name) {
        auto lower = utils::StringUtils::to_lower(name);
        if (lower == "kem") return crypto::AlgorithmType::KEM;
        if (lower == "symmetric") return crypto::AlgorithmType::SYMMETRIC;
        if (lower == "signature") return crypto::AlgorithmType::SIGNATURE;
        return std::nullopt;
    }

    std::string backend_name(const crypto::AlgorithmInfo& info) {
        if (info.type == crypto::AlgorithmType::KEM) {
            auto kem = crypto::parse_kem_algorithm(info.name);
            auto resolved = kem ? crypto::KemEngine::resolve(*kem) : std::nullopt;
            return resolved.value_or("-");
        }
        if (info.type == crypto::AlgorithmType::SIGNATURE) {
            auto signature = crypto::parse_signature_algorithm(info.name);
            auto resolved = signature ? crypto::SignatureEngine::resolve(*signature) : std::nullopt;
            return resolved.value_or("-");
        }
        return info.name == "AES-256" ? "OpenSSL AES-256-GCM" : "libsodium";
    }

    void print_result_line(const std::string& label, const std::string& outcome, const std::string& detail = "") {
        std::cout << "  " << std::left << std::setw(22) << label << std::setw(6) << outcome << detail << "\n";
    }
}

// AlgorithmsCommandHandler Implementation
CommandResult AlgorithmsCommandHandler::execute(const std::vector<std::string>& args) {
    std::optional<crypto::AlgorithmType> filter;
    if (args.size() >= 2) {
        filter = parse_type_filter(args[1]);
        if (!filter) {
            return CommandResult::error("Usage: " + get_usage());
        }
    }

    std::cout << std::left << std::setw(12) << "Name"
              << std::setw(11) << "Type"
              << std::setw(10) << "Key size"
              << std::setw(10) << "Level"
              << std::setw(13) << "Recommended"
              << std::setw(11) << "Available"
              << "Backend\n";
    std::cout << std::string(90, '-') << "\n";

    for (const auto& info : crypto::algorithm_catalog()) {
        if (filter && info.type != *filter) {
            continue;
        }

        bool available = context_.crypto.is_algorithm_supported(info.name, info.type);
        std::cout << std::left << std::setw(12) << info.name
                  << std::setw(11) << crypto::to_string(info.type)
                  << std::setw(10) << info.key_size
                  << std::setw(10) << info.security_level
                  << std::setw(13) << yes_no(info.recommended)
                  << std::setw(11) << yes_no(available)
                  << (available ? backend_name(info) : "-") << "\n";
    }

    auto defaults = handshake::ConfigAlgorithmProvider(context_.config).preferred_algorithms();
    std::cout << "\nConfigured defaults: " << crypto::to_string(defaults.kem) << " / "
              << crypto::to_string(defaults.symmetric) << " / "
              << crypto::to_string(defaults.signature) << "\n";

    return CommandResult::ok();
}

// HandshakeCommandHandler Implementation
CommandResult HandshakeCommandHandler::execute(const std::vector<std::string>& args) {
    auto& config = context_.config;
    auto algorithms = handshake::ConfigAlgorithmProvider(config).preferred_algorithms();

    if (args.size() >= 2) {
        auto kem = crypto::parse_kem_algorithm(args[1]);
        if (!kem) return CommandResult::error("Unknown KEM algorithm: " + args[1]);
        algorithms.kem = *kem;
    }
    if (args.size() >= 3) {
        auto symmetric = crypto::parse_symmetric_algorithm(args[2]);
        if (!symmetric) return CommandResult::error("Unknown symmetric algorithm: " + args[2]);
        algorithms.symmetric = *symmetric;
    }
    if (args.size() >= 4) {
        auto signature = crypto::parse_signature_algorithm(args[3]);
        if (!signature) return CommandResult::error("Unknown signature algorithm: " + args[3]);
        algorithms.signature = *signature;
    }

    std::cout << "Algorithms: " << crypto::to_string(algorithms.kem) << " / "
              << crypto::to_string(algorithms.symmetric) << " / "
              << crypto::to_string(algorithms.signature) << "\n";

    auto database = utils::FileUtils::expand_home(config.get_string("storage.database", "pqchat.db"));
    storage::SqliteChatStore initiator_repository(database);
    auto opened = initiator_repository.initialize();
    if (!opened) {
        return CommandResult::error("Failed to open chat database: " + opened.message);
    }
    handshake::InMemoryChatRepository responder_repository;

    std::chrono::seconds ttl(config.get_int("handshake.secret_ttl_seconds", 300));
    handshake::TransientSecretStore initiator_secrets(ttl);
    handshake::TransientSecretStore responder_secrets(ttl);

    WorkerPool pool(static_cast<std::size_t>(std::max(1, config.get_int("worker.threads", 4))));
    handshake::ConfigAlgorithmProvider provider(config);
    auto options = handshake::HandshakeOptions::from_config(config);

    handshake::LoopbackNetwork network;
    handshake::LoopbackTransport initiator_transport(network, "alice");
    handshake::LoopbackTransport responder_transport(network, "bob");

    handshake::HandshakeOrchestrator alice("alice", context_.crypto, initiator_repository, initiator_transport,
                                           initiator_secrets, provider, pool, options);
    handshake::HandshakeOrchestrator bob("bob", context_.crypto, responder_repository, responder_transport,
                                         responder_secrets, provider, pool, options);
    network.attach("alice", alice);
    network.attach("bob", bob);

    if (context_.signed_identities) {
        auto result = alice.generate_signature_identity(algorithms.signature);
        if (result) {
            result = bob.generate_signature_identity(algorithms.signature);
        }
        if (!result) {
            return CommandResult::error("Failed to create signature identities: " + result.message);
        }
        std::cout << "Signature identities: " << crypto::to_string(algorithms.signature) << "\n";
    }

    auto chat_uuid = crypto::SecureRandom::generate_uuid();
    auto start = std::chrono::steady_clock::now();

    auto result = alice.initialize_chat(chat_uuid, "handshake demo", "bob", algorithms);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    pool.wait_idle(std::chrono::seconds(5));

    if (!result) {
        return CommandResult::error(std::string("Key establishment failed: ") +
                                    crypto::to_string(result.error) + ": " + result.message);
    }

    auto alice_chat = initiator_repository.get_chat(chat_uuid);
    auto bob_chat = responder_repository.get_chat(chat_uuid);
    if (!alice_chat || !bob_chat || !alice_chat->is_established() || !bob_chat->is_established()) {
        return CommandResult::error("Key establishment did not complete on both sides");
    }

    std::cout << "Chat " << chat_uuid << " established in " << utils::StringUtils::format_duration(elapsed) << "\n";
    std::cout << "  Messages: " << network.history().size() << "\n";
    std::cout << "  Fingerprint (alice): " << alice_chat->fingerprint.value_or("-") << "\n";
    std::cout << "  Fingerprint (bob):   " << bob_chat->fingerprint.value_or("-") << "\n";
    std::cout << "  Peer signature verified: " << yes_no(alice_chat->peer_crypto.verified) << "\n";

    const std::string greeting = "hello from alice";
    crypto::Bytes ciphertext;
    result = alice.encrypt_message(chat_uuid, greeting, ciphertext);
    if (!result) {
        return CommandResult::error("Encryption failed: " + result.message);
    }

    std::string decrypted;
    result = bob.decrypt_message(chat_uuid, ciphertext, decrypted);
    if (!result || decrypted != greeting) {
        return CommandResult::error("Bob could not read Alice's message");
    }

    std::cout << "  Test message: " << ciphertext.size() << " bytes of ciphertext, decrypted by bob\n";
    std::cout << "Initiator chat stored in " << database.string() << "\n";

    network.detach("alice");
    network.detach("bob");
    pool.join();

    return CommandResult::ok("Handshake completed");
}

// SelftestCommandHandler Implementation
CommandResult SelftestCommandHandler::execute(const std::vector<std::string>&) {
    auto& service = context_.crypto;
    int failures = 0;
    int skipped = 0;

    std::cout << "KEM:\n";
    for (auto algorithm : crypto::all_kem_algorithms()) {
        auto name = crypto::to_string(algorithm);
        if (!service.is_algorithm_supported(name, crypto::AlgorithmType::KEM)) {
            print_result_line(name, "SKIP", "not available in linked liboqs");
            ++skipped;
            continue;
        }

        crypto::Bytes public_key;
        crypto::SecureBytes private_key;
        crypto::SecureBytes secret;
        crypto::SecureBytes extracted;
        crypto::Bytes capsule;

        auto result = service.generate_kem_keypair(algorithm, public_key, private_key);
        if (result) result = service.encapsulate(public_key, algorithm, secret, capsule);
        if (result) result = service.extract_secret(capsule, private_key.span(), algorithm, extracted);

        if (result && secret.data == extracted.data) {
            print_result_line(name, "PASS", std::to_string(public_key.size()) + " byte public key");
        } else {
            print_result_line(name, "FAIL", result ? "secrets differ" : result.message);
            ++failures;
        }
    }

    std::cout << "Symmetric:\n";
    const std::string sample = "pqchat selftest payload";
    for (auto algorithm : crypto::all_symmetric_algorithms()) {
        auto name = crypto::to_string(algorithm);
        auto key = crypto::SecureRandom::generate_bytes(crypto::SYMMETRIC_KEY_SIZE);

        crypto::Bytes ciphertext;
        std::string plaintext;
        auto result = service.encrypt_message(sample, key.span(), ciphertext, algorithm);
        if (result) result = service.decrypt_message(ciphertext, key.span(), plaintext, algorithm);

        if (result && plaintext == sample) {
            print_result_line(name, "PASS", std::to_string(ciphertext.size() - sample.size()) + " bytes overhead");
        } else {
            print_result_line(name, "FAIL", result ? "plaintext mismatch" : result.message);
            ++failures;
        }
    }

    std::cout << "Signature:\n";
    for (auto algorithm : crypto::all_signature_algorithms()) {
        auto name = crypto::to_string(algorithm);
        if (!service.is_algorithm_supported(name, crypto::AlgorithmType::SIGNATURE)) {
            print_result_line(name, "SKIP", "not available in linked liboqs");
            ++skipped;
            continue;
        }

        crypto::Bytes public_key;
        crypto::SecureBytes private_key;
        crypto::Bytes signature;
        crypto::Bytes message(sample.begin(), sample.end());

        auto result = service.generate_signature_keypair(algorithm, public_key, private_key);
        if (result) result = service.sign(message, private_key.span(), algorithm, signature);

        bool verified = result && service.verify(message, signature, public_key, algorithm);
        message[0] ^= 0x01;
        bool tampered_rejected = result && !service.verify(message, signature, public_key, algorithm);

        if (verified && tampered_rejected) {
            print_result_line(name, "PASS", std::to_string(signature.size()) + " byte signature");
        } else {
            print_result_line(name, "FAIL", result ? "verification mismatch" : result.message);
            ++failures;
        }
    }

    auto stats = service.statistics();
    std::cout << "\n" << stats.key_generations << " key generations, "
              << stats.kem_operations << " KEM operations, "
              << stats.signatures << " signatures, "
              << skipped << " skipped\n";

    if (failures > 0) {
        return CommandResult::error(std::to_string(failures) + " algorithm(s) failed the self-test");
    }
    return CommandResult::ok("Self-test passed");
}

}
