#include "pqchat/handshake/messages.hpp"
#include <stdexcept>

namespace pqchat::handshake {

namespace {
    constexpr std::size_t MAX_FIELD_SIZE = 2 * 1024 * 1024;

    void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        buffer.push_back((value >> 24) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }

    void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
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

    void write_algorithms(std::vector<std::uint8_t>& buffer,
                          const std::optional<crypto::AlgorithmNames>& algorithms) {
        buffer.push_back(algorithms ? 1 : 0);
        if (algorithms) {
            write_string(buffer, algorithms->kem);
            write_string(buffer, algorithms->symmetric);
            write_string(buffer, algorithms->signature);
        }
    }

    std::uint8_t read_uint8(std::span<const std::uint8_t>& data) {
        if (data.empty()) throw std::runtime_error("Insufficient data for uint8");
        auto value = data[0];
        data = data.subspan(1);
        return value;
    }

    std::uint16_t read_uint16(std::span<const std::uint8_t>& data) {
        if (data.size() < 2) throw std::runtime_error("Insufficient data for uint16");
        std::uint16_t value = (static_cast<std::uint16_t>(data[0]) << 8) |
                             static_cast<std::uint16_t>(data[1]);
        data = data.subspan(2);
        return value;
    }

    std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
        if (data.size() < 4) throw std::runtime_error("Insufficient data for uint32");
        std::uint32_t value = (static_cast<std::uint32_t>(data[0]) << 24) |
                             (static_cast<std::uint32_t>(data[1]) << 16) |
                             (static_cast<std::uint32_t>(data[2]) << 8) |
                             static_cast<std::uint32_t>(data[3]);
        data = data.subspan(4);
        return value;
    }

    std::string read_string(std::span<const std::uint8_t>& data) {
        auto length = read_uint32(data);
        if (length > MAX_FIELD_SIZE || data.size() < length) throw std::runtime_error("Insufficient data for string");
        std::string str(reinterpret_cast<const char*>(data.data()), length);
        data = data.subspan(length);
        return str;
    }

    crypto::Bytes read_bytes(std::span<const std::uint8_t>& data) {
        auto length = read_uint32(data);
        if (length > MAX_FIELD_SIZE || data.size() < length) throw std::runtime_error("Insufficient data for bytes");
        crypto::Bytes bytes(data.begin(), data.begin() + length);
        data = data.subspan(length);
        return bytes;
    }

    std::optional<crypto::AlgorithmNames> read_algorithms(std::span<const std::uint8_t>& data) {
        auto present = read_uint8(data);
        if (present == 0) {
            return std::nullopt;
        }
        if (present != 1) throw std::runtime_error("Invalid algorithm presence flag");

        crypto::AlgorithmNames names;
        names.kem = read_string(data);
        names.symmetric = read_string(data);
        names.signature = read_string(data);
        return names;
    }

    void expect_consumed(std::span<const std::uint8_t> data) {
        if (!data.empty()) throw std::runtime_error("Trailing bytes after message");
    }
}

std::string to_string(MessageType type) {
    switch (type) {
        case MessageType::INIT_REQUEST: return "InitRequest";
        case MessageType::INIT_RESPONSE: return "InitResponse";
        case MessageType::INIT_CONFIRM: return "InitConfirm";
        case MessageType::INIT_SIGNATURE: return "InitSignature";
    }
    return "Unknown";
}

std::vector<std::uint8_t> InitRequest::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, chat_uuid);
    write_bytes(buffer, public_key);
    write_algorithms(buffer, crypto_algorithms);
    write_bytes(buffer, signature_public_key);
    return buffer;
}

InitRequest InitRequest::deserialize(std::span<const std::uint8_t> data) {
    InitRequest msg;
    auto span = data;

    msg.chat_uuid = read_string(span);
    msg.public_key = read_bytes(span);
    msg.crypto_algorithms = read_algorithms(span);
    msg.signature_public_key = read_bytes(span);
    expect_consumed(span);

    return msg;
}

std::vector<std::uint8_t> InitResponse::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, chat_uuid);
    write_bytes(buffer, public_key);
    write_bytes(buffer, kem_capsule);
    write_bytes(buffer, user_signature);
    write_algorithms(buffer, crypto_algorithms);
    write_bytes(buffer, signature_public_key);
    return buffer;
}

InitResponse InitResponse::deserialize(std::span<const std::uint8_t> data) {
    InitResponse msg;
    auto span = data;

    msg.chat_uuid = read_string(span);
    msg.public_key = read_bytes(span);
    msg.kem_capsule = read_bytes(span);
    msg.user_signature = read_bytes(span);
    msg.crypto_algorithms = read_algorithms(span);
    msg.signature_public_key = read_bytes(span);
    expect_consumed(span);

    return msg;
}

std::vector<std::uint8_t> InitConfirm::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, chat_uuid);
    write_bytes(buffer, kem_capsule);
    write_bytes(buffer, signature);
    return buffer;
}

InitConfirm InitConfirm::deserialize(std::span<const std::uint8_t> data) {
    InitConfirm msg;
    auto span = data;

    msg.chat_uuid = read_string(span);
    msg.kem_capsule = read_bytes(span);
    msg.signature = read_bytes(span);
    expect_consumed(span);

    return msg;
}

std::vector<std::uint8_t> InitSignature::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, chat_uuid);
    write_bytes(buffer, signature);
    write_bytes(buffer, signature_public_key);
    return buffer;
}

InitSignature InitSignature::deserialize(std::span<const std::uint8_t> data) {
    InitSignature msg;
    auto span = data;

    msg.chat_uuid = read_string(span);
    msg.signature = read_bytes(span);
    msg.signature_public_key = read_bytes(span);
    expect_consumed(span);

    return msg;
}

std::vector<std::uint8_t> encode_envelope(MessageType type, std::span<const std::uint8_t> payload) {
    if (payload.size() > MAX_PAYLOAD_SIZE) {
        throw std::runtime_error("Payload too large");
    }

    std::vector<std::uint8_t> buffer;
    buffer.reserve(ENVELOPE_HEADER_SIZE + payload.size());

    write_uint32(buffer, PROTOCOL_MAGIC);
    write_uint16(buffer, PROTOCOL_VERSION);
    buffer.push_back(static_cast<std::uint8_t>(type));
    write_uint32(buffer, static_cast<std::uint32_t>(payload.size()));
    buffer.insert(buffer.end(), payload.begin(), payload.end());

    return buffer;
}

MessageType decode_envelope(std::span<const std::uint8_t> data, std::span<const std::uint8_t>& out_payload) {
    auto span = data;

    if (read_uint32(span) != PROTOCOL_MAGIC) {
        throw std::runtime_error("Invalid protocol magic");
    }
    if (read_uint16(span) != PROTOCOL_VERSION) {
        throw std::runtime_error("Unsupported protocol version");
    }

    auto raw_type = read_uint8(span);
    if (raw_type < static_cast<std::uint8_t>(MessageType::INIT_REQUEST) ||
        raw_type > static_cast<std::uint8_t>(MessageType::INIT_SIGNATURE)) {
        throw std::runtime_error("Unknown message type");
    }

    auto payload_size = read_uint32(span);
    if (payload_size > MAX_PAYLOAD_SIZE || span.size() != payload_size) {
        throw std::runtime_error("Payload size mismatch");
    }

    out_payload = span;
    return static_cast<MessageType>(raw_type);
}

}
