#pragma once

#include "pqchat/handshake/chat.hpp"
#include "pqchat/crypto/crypto_types.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pqchat::handshake {

class ChatRepository {
public:
    virtual ~ChatRepository() = default;

    // Insert or replace the whole record
    virtual crypto::CryptoResult save_chat(const Chat& chat) = 0;

    // Deep copy of the stored record
    virtual std::optional<Chat> get_chat(const std::string& chat_uuid) = 0;

    virtual crypto::CryptoResult update_key_establishment(
        const std::string& chat_uuid,
        KeyEstablishmentStatus status,
        const std::optional<std::string>& fingerprint
    ) = 0;

    virtual crypto::CryptoResult update_peer_crypto(
        const std::string& chat_uuid,
        const crypto::PeerCryptoInfo& peer_crypto
    ) = 0;

    virtual crypto::CryptoResult delete_chat(const std::string& chat_uuid) = 0;

    virtual std::vector<std::string> list_chats() = 0;
};

class InMemoryChatRepository : public ChatRepository {
public:
    crypto::CryptoResult save_chat(const Chat& chat) override;
    std::optional<Chat> get_chat(const std::string& chat_uuid) override;
    crypto::CryptoResult update_key_establishment(
        const std::string& chat_uuid,
        KeyEstablishmentStatus status,
        const std::optional<std::string>& fingerprint
    ) override;
    crypto::CryptoResult update_peer_crypto(
        const std::string& chat_uuid,
        const crypto::PeerCryptoInfo& peer_crypto
    ) override;
    crypto::CryptoResult delete_chat(const std::string& chat_uuid) override;
    std::vector<std::string> list_chats() override;

private:
    std::mutex mutex_;
    std::map<std::string, Chat> chats_;
};

}
