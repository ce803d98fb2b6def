#pragma once

#include "pqchat/crypto/algorithms.hpp"
#include "pqchat/crypto/chat_keys.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace pqchat::handshake {

// Transitions only forward: UNINITIALIZED -> INITIALIZING -> ESTABLISHED
enum class KeyEstablishmentStatus : std::uint8_t {
    UNINITIALIZED = 0,
    INITIALIZING = 1,
    ESTABLISHED = 2
};

enum class ChatRole : std::uint8_t {
    INITIATOR = 0,
    RESPONDER = 1
};

std::string to_string(KeyEstablishmentStatus status);
std::optional<KeyEstablishmentStatus> parse_key_establishment_status(const std::string& name);
std::string to_string(ChatRole role);

struct Chat {
    std::string uuid;
    std::string name;
    std::string peer_id;
    ChatRole role = ChatRole::INITIATOR;
    crypto::CryptoAlgorithms algorithms;

    KeyEstablishmentStatus key_establishment_status = KeyEstablishmentStatus::UNINITIALIZED;
    std::optional<std::string> fingerprint;
    crypto::Bytes transcript_hash;

    crypto::ChatKeys keys;
    crypto::PeerCryptoInfo peer_crypto;

    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point last_activity{};
    std::optional<std::chrono::system_clock::time_point> key_establishment_completed_at;

    Chat() = default;
    Chat(Chat&&) noexcept = default;
    Chat& operator=(Chat&&) noexcept = default;

    bool is_established() const { return key_establishment_status == KeyEstablishmentStatus::ESTABLISHED; }
    bool is_ready_for_messaging() const { return is_established() && keys.has_symmetric_key(); }

    Chat clone() const;
};

}
