#pragma once

#include "pqchat/handshake/chat_repository.hpp"
#include "pqchat/crypto/crypto_types.hpp"
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace pqchat::storage {

// Chat records persisted in SQLite. Key material is stored as blobs and the
// database runs with secure_delete so removed rows are overwritten on disk.
class SqliteChatStore : public handshake::ChatRepository {
public:
    explicit SqliteChatStore(const std::filesystem::path& db_path);
    ~SqliteChatStore() override;

    SqliteChatStore(const SqliteChatStore&) = delete;
    SqliteChatStore& operator=(const SqliteChatStore&) = delete;

    crypto::CryptoResult initialize();
    bool is_open() const { return db_ != nullptr; }

    crypto::CryptoResult save_chat(const handshake::Chat& chat) override;
    std::optional<handshake::Chat> get_chat(const std::string& chat_uuid) override;

    crypto::CryptoResult update_key_establishment(
        const std::string& chat_uuid,
        handshake::KeyEstablishmentStatus status,
        const std::optional<std::string>& fingerprint
    ) override;

    crypto::CryptoResult update_peer_crypto(
        const std::string& chat_uuid,
        const crypto::PeerCryptoInfo& peer_crypto
    ) override;

    crypto::CryptoResult delete_chat(const std::string& chat_uuid) override;
    std::vector<std::string> list_chats() override;

    size_t chat_count();
    bool vacuum_database();

private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    std::mutex mutex_;

    bool create_tables();
    bool exec(const char* sql);
    crypto::CryptoResult write_peer_crypto(const std::string& chat_uuid, const crypto::PeerCryptoInfo& peer_crypto);
    bool read_peer_crypto(const std::string& chat_uuid, crypto::PeerCryptoInfo& out_peer_crypto);
    std::string last_error() const;
};

}
