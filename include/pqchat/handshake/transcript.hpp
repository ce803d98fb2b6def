#pragma once

#include "pqchat/crypto/algorithms.hpp"
#include "pqchat/crypto/crypto_types.hpp"
#include <span>
#include <string>
#include <vector>

namespace pqchat::handshake {

// Domain-separation labels for the three handshake signatures
constexpr const char* RESPONSE_SIGNATURE_CONTEXT = "PQCHAT_INIT_RESPONSE_V1";
constexpr const char* CONFIRM_SIGNATURE_CONTEXT = "PQCHAT_INIT_CONFIRM_V1";
constexpr const char* FINISH_SIGNATURE_CONTEXT = "PQCHAT_INIT_FINISH_V1";

std::vector<std::uint8_t> create_signature_data(
    const std::string& context,
    std::span<const std::uint8_t> transcript_hash
);

// Hash of everything both parties know after message 2
crypto::Sha3Hash create_response_transcript(
    const std::string& chat_uuid,
    crypto::KemAlgorithm kem,
    std::span<const std::uint8_t> initiator_public_key,
    std::span<const std::uint8_t> responder_public_key,
    std::span<const std::uint8_t> responder_capsule
);

// Chains the initiator's capsule onto the response transcript
crypto::Sha3Hash create_final_transcript(
    const crypto::Sha3Hash& response_transcript,
    std::span<const std::uint8_t> initiator_capsule
);

}
