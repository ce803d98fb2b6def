#include "pqchat/handshake/chat_repository.hpp"

namespace pqchat::handshake {

using crypto::CryptoError;
using crypto::CryptoResult;

CryptoResult InMemoryChatRepository::save_chat(const Chat& chat) {
    if (chat.uuid.empty()) {
        return CryptoResult(CryptoError::STORAGE_FAILED, "Chat UUID cannot be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    chats_.insert_or_assign(chat.uuid, chat.clone());
    return CryptoResult();
}

std::optional<Chat> InMemoryChatRepository::get_chat(const std::string& chat_uuid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chats_.find(chat_uuid);
    if (it == chats_.end()) {
        return std::nullopt;
    }
    return it->second.clone();
}

CryptoResult InMemoryChatRepository::update_key_establishment(
    const std::string& chat_uuid,
    KeyEstablishmentStatus status,
    const std::optional<std::string>& fingerprint) {

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chats_.find(chat_uuid);
    if (it == chats_.end()) {
        return CryptoResult(CryptoError::CHAT_NOT_FOUND, "Chat not found: " + chat_uuid);
    }

    it->second.key_establishment_status = status;
    it->second.fingerprint = fingerprint;
    return CryptoResult();
}

CryptoResult InMemoryChatRepository::update_peer_crypto(
    const std::string& chat_uuid,
    const crypto::PeerCryptoInfo& peer_crypto) {

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chats_.find(chat_uuid);
    if (it == chats_.end()) {
        return CryptoResult(CryptoError::CHAT_NOT_FOUND, "Chat not found: " + chat_uuid);
    }

    it->second.peer_crypto = peer_crypto;
    return CryptoResult();
}

CryptoResult InMemoryChatRepository::delete_chat(const std::string& chat_uuid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chats_.find(chat_uuid);
    if (it == chats_.end()) {
        return CryptoResult(CryptoError::CHAT_NOT_FOUND, "Chat not found: " + chat_uuid);
    }

    it->second.keys.secure_wipe();
    chats_.erase(it);
    return CryptoResult();
}

std::vector<std::string> InMemoryChatRepository::list_chats() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> uuids;
    uuids.reserve(chats_.size());
    for (const auto& [uuid, chat] : chats_) {
        uuids.push_back(uuid);
    }
    return uuids;
}

}
