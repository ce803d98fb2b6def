#include "pqchat/handshake/transcript.hpp"
#include "pqchat/crypto/hash.hpp"

namespace pqchat::handshake {

namespace {
    constexpr const char* TRANSCRIPT_LABEL = "PQCHAT_CHAT_INIT_V1";

    void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        buffer.push_back((value >> 24) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }

    void write_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
        write_uint32(buffer, static_cast<std::uint32_t>(str.size()));
        buffer.insert(buffer.end(), str.begin(), str.end());
    }

    void write_bytes(std::vector<std::uint8_t>& buffer, std::span<const std::uint8_t> data) {
        write_uint32(buffer, static_cast<std::uint32_t>(data.size()));
        buffer.insert(buffer.end(), data.begin(), data.end());
    }
}

std::vector<std::uint8_t> create_signature_data(
    const std::string& context,
    std::span<const std::uint8_t> transcript_hash) {

    std::vector<std::uint8_t> signature_data;
    write_string(signature_data, context);
    signature_data.insert(signature_data.end(), transcript_hash.begin(), transcript_hash.end());
    return signature_data;
}

crypto::Sha3Hash create_response_transcript(
    const std::string& chat_uuid,
    crypto::KemAlgorithm kem,
    std::span<const std::uint8_t> initiator_public_key,
    std::span<const std::uint8_t> responder_public_key,
    std::span<const std::uint8_t> responder_capsule) {

    std::vector<std::uint8_t> transcript;
    write_string(transcript, TRANSCRIPT_LABEL);
    write_string(transcript, chat_uuid);
    write_string(transcript, crypto::to_string(kem));
    write_bytes(transcript, initiator_public_key);
    write_bytes(transcript, responder_public_key);
    write_bytes(transcript, responder_capsule);
    return crypto::Sha3Hasher::hash(transcript);
}

crypto::Sha3Hash create_final_transcript(
    const crypto::Sha3Hash& response_transcript,
    std::span<const std::uint8_t> initiator_capsule) {

    std::vector<std::uint8_t> transcript;
    write_string(transcript, TRANSCRIPT_LABEL);
    transcript.insert(transcript.end(), response_transcript.begin(), response_transcript.end());
    write_bytes(transcript, initiator_capsule);
    return crypto::Sha3Hasher::hash(transcript);
}

}
