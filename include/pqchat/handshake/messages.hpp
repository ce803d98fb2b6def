#pragma once

#include "pqchat/crypto/algorithms.hpp"
#include "pqchat/crypto/crypto_types.hpp"
#include <concepts>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pqchat::handshake {

constexpr std::uint32_t PROTOCOL_MAGIC = 0x50514348; // "PQCH"
constexpr std::uint16_t PROTOCOL_VERSION = 1;
constexpr std::size_t ENVELOPE_HEADER_SIZE = 11;
constexpr std::size_t MAX_PAYLOAD_SIZE = 4 * 1024 * 1024;

enum class MessageType : std::uint8_t {
    INIT_REQUEST    = 0x01,
    INIT_RESPONSE   = 0x02,
    INIT_CONFIRM    = 0x03,
    INIT_SIGNATURE  = 0x04
};

std::string to_string(MessageType type);

template<typename T>
concept MessagePayload = requires(T t) {
    { t.serialize() } -> std::convertible_to<std::vector<std::uint8_t>>;
    { T::deserialize(std::declval<std::span<const std::uint8_t>>()) } -> std::same_as<T>;
};

// Message 1, initiator -> responder
struct InitRequest {
    std::string chat_uuid;
    crypto::Bytes public_key;
    std::optional<crypto::AlgorithmNames> crypto_algorithms;
    crypto::Bytes signature_public_key;

    std::vector<std::uint8_t> serialize() const;
    static InitRequest deserialize(std::span<const std::uint8_t> data);
};

// Message 2, responder -> initiator
struct InitResponse {
    std::string chat_uuid;
    crypto::Bytes public_key;
    crypto::Bytes kem_capsule;
    crypto::Bytes user_signature;
    std::optional<crypto::AlgorithmNames> crypto_algorithms;
    crypto::Bytes signature_public_key;

    std::vector<std::uint8_t> serialize() const;
    static InitResponse deserialize(std::span<const std::uint8_t> data);
};

// Message 3, initiator -> responder
struct InitConfirm {
    std::string chat_uuid;
    crypto::Bytes kem_capsule;
    crypto::Bytes signature;

    std::vector<std::uint8_t> serialize() const;
    static InitConfirm deserialize(std::span<const std::uint8_t> data);
};

// Message 4, responder -> initiator
struct InitSignature {
    std::string chat_uuid;
    crypto::Bytes signature;
    crypto::Bytes signature_public_key;

    std::vector<std::uint8_t> serialize() const;
    static InitSignature deserialize(std::span<const std::uint8_t> data);
};

// magic(4) | version(2) | type(1) | payload_size(4) | payload
std::vector<std::uint8_t> encode_envelope(MessageType type, std::span<const std::uint8_t> payload);

// Throws std::runtime_error on a malformed envelope
MessageType decode_envelope(std::span<const std::uint8_t> data, std::span<const std::uint8_t>& out_payload);

template<MessagePayload T>
std::vector<std::uint8_t> encode_message(MessageType type, const T& message) {
    auto payload = message.serialize();
    return encode_envelope(type, payload);
}

}

static_assert(pqchat::handshake::MessagePayload<pqchat::handshake::InitRequest>);
static_assert(pqchat::handshake::MessagePayload<pqchat::handshake::InitResponse>);
static_assert(pqchat::handshake::MessagePayload<pqchat::handshake::InitConfirm>);
static_assert(pqchat::handshake::MessagePayload<pqchat::handshake::InitSignature>);
