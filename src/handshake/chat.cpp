#include "pqchat/handshake/chat.hpp"
#include "pqchat/core/utils.hpp"

namespace pqchat::handshake {

std::string to_string(KeyEstablishmentStatus status) {
    switch (status) {
        case KeyEstablishmentStatus::UNINITIALIZED: return "UNINITIALIZED";
        case KeyEstablishmentStatus::INITIALIZING: return "INITIALIZING";
        case KeyEstablishmentStatus::ESTABLISHED: return "ESTABLISHED";
    }
    return "UNKNOWN";
}

std::optional<KeyEstablishmentStatus> parse_key_establishment_status(const std::string& name) {
    auto upper = core::utils::StringUtils::to_upper(name);
    if (upper == "UNINITIALIZED") return KeyEstablishmentStatus::UNINITIALIZED;
    if (upper == "INITIALIZING") return KeyEstablishmentStatus::INITIALIZING;
    if (upper == "ESTABLISHED") return KeyEstablishmentStatus::ESTABLISHED;
    return std::nullopt;
}

std::string to_string(ChatRole role) {
    return role == ChatRole::INITIATOR ? "initiator" : "responder";
}

Chat Chat::clone() const {
    Chat copy;
    copy.uuid = uuid;
    copy.name = name;
    copy.peer_id = peer_id;
    copy.role = role;
    copy.algorithms = algorithms;
    copy.key_establishment_status = key_establishment_status;
    copy.fingerprint = fingerprint;
    copy.transcript_hash = transcript_hash;
    copy.keys = keys.clone();
    copy.peer_crypto = peer_crypto;
    copy.created_at = created_at;
    copy.last_activity = last_activity;
    copy.key_establishment_completed_at = key_establishment_completed_at;
    return copy;
}

}
