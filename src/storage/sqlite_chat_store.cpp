#include "pqchat/storage/sqlite_chat_store.hpp"
#include "pqchat/core/logger.hpp"
#include "pqchat/core/utils.hpp"
#include <sqlite3.h>
#include <memory>

namespace pqchat::storage {

using crypto::CryptoError;
using crypto::CryptoResult;
using handshake::Chat;
using handshake::KeyEstablishmentStatus;
using core::utils::TimeUtils;

namespace {
    struct StatementDeleter {
        void operator()(sqlite3_stmt* stmt) const {
            if (stmt) {
                sqlite3_finalize(stmt);
            }
        }
    };

    using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

    Statement prepare(sqlite3* db, const char* sql) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            sqlite3_finalize(stmt);
            return nullptr;
        }
        return Statement(stmt);
    }

    void bind_blob(sqlite3_stmt* stmt, int index, std::span<const std::uint8_t> data) {
        if (data.empty()) {
            sqlite3_bind_zeroblob(stmt, index, 0);
        } else {
            sqlite3_bind_blob(stmt, index, data.data(), static_cast<int>(data.size()), SQLITE_STATIC);
        }
    }

    void bind_optional_text(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
        if (value) {
            sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_STATIC);
        } else {
            sqlite3_bind_null(stmt, index);
        }
    }

    std::span<const std::uint8_t> column_span(sqlite3_stmt* stmt, int column) {
        const auto* data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, column));
        int size = sqlite3_column_bytes(stmt, column);
        if (!data || size <= 0) {
            return {};
        }
        return std::span<const std::uint8_t>(data, static_cast<size_t>(size));
    }

    crypto::Bytes column_bytes(sqlite3_stmt* stmt, int column) {
        auto data = column_span(stmt, column);
        return crypto::Bytes(data.begin(), data.end());
    }

    std::optional<std::string> column_text(sqlite3_stmt* stmt, int column) {
        if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
            return std::nullopt;
        }
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
        return std::string(text ? text : "");
    }

    std::optional<crypto::CryptoAlgorithms> parse_algorithms(
        const std::optional<std::string>& kem,
        const std::optional<std::string>& symmetric,
        const std::optional<std::string>& signature) {

        if (!kem || !symmetric || !signature) {
            return std::nullopt;
        }

        auto parsed_kem = crypto::parse_kem_algorithm(*kem);
        auto parsed_symmetric = crypto::parse_symmetric_algorithm(*symmetric);
        auto parsed_signature = crypto::parse_signature_algorithm(*signature);
        if (!parsed_kem || !parsed_symmetric || !parsed_signature) {
            return std::nullopt;
        }

        crypto::CryptoAlgorithms algorithms;
        algorithms.kem = *parsed_kem;
        algorithms.symmetric = *parsed_symmetric;
        algorithms.signature = *parsed_signature;
        return algorithms;
    }
}

SqliteChatStore::SqliteChatStore(const std::filesystem::path& db_path)
    : db_path_(db_path), db_(nullptr) {
}

SqliteChatStore::~SqliteChatStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

CryptoResult SqliteChatStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        return CryptoResult();
    }

    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("Failed to open chat database {}: {}", db_path_.string(), error);
        return CryptoResult(CryptoError::STORAGE_FAILED, "Failed to open database: " + error);
    }

    if (!create_tables()) {
        auto error = last_error();
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("Failed to create chat tables in {}: {}", db_path_.string(), error);
        return CryptoResult(CryptoError::STORAGE_FAILED, "Failed to create tables: " + error);
    }

    LOG_INFO("Chat database opened at {}", db_path_.string());
    return CryptoResult();
}

bool SqliteChatStore::exec(const char* sql) {
    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("SQLite error: {}", error_msg ? error_msg : "unknown");
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

std::string SqliteChatStore::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "database not open";
}

bool SqliteChatStore::create_tables() {
    const char* pragmas = R"(
        PRAGMA secure_delete = ON;
        PRAGMA journal_mode = WAL;
    )";

    const char* create_chats_table = R"(
        CREATE TABLE IF NOT EXISTS chats (
            uuid TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            peer_id TEXT NOT NULL,
            role INTEGER NOT NULL,
            kem_algorithm TEXT NOT NULL,
            symmetric_algorithm TEXT NOT NULL,
            signature_algorithm TEXT NOT NULL,
            status TEXT NOT NULL,
            fingerprint TEXT,
            transcript_hash BLOB,
            public_key_self BLOB,
            private_key_self BLOB,
            public_key_peer BLOB,
            symmetric_key BLOB,
            asymmetric_discarded INTEGER DEFAULT 0,
            created_at INTEGER NOT NULL,
            last_activity INTEGER NOT NULL,
            completed_at INTEGER
        );
    )";

    const char* create_peer_crypto_table = R"(
        CREATE TABLE IF NOT EXISTS peer_crypto (
            chat_uuid TEXT PRIMARY KEY,
            peer_id TEXT NOT NULL,
            kem_algorithm TEXT,
            symmetric_algorithm TEXT,
            signature_algorithm TEXT,
            signature_public_key BLOB,
            signing_algorithm TEXT,
            last_updated INTEGER NOT NULL,
            verified INTEGER DEFAULT 0,
            FOREIGN KEY (chat_uuid) REFERENCES chats(uuid) ON DELETE CASCADE
        );
    )";

    const char* create_indexes = R"(
        CREATE INDEX IF NOT EXISTS idx_chats_peer_id ON chats(peer_id);
        CREATE INDEX IF NOT EXISTS idx_chats_status ON chats(status);
    )";

    return exec(pragmas) && exec(create_chats_table) && exec(create_peer_crypto_table) && exec(create_indexes);
}

CryptoResult SqliteChatStore::save_chat(const Chat& chat) {
    if (chat.uuid.empty()) {
        return CryptoResult(CryptoError::STORAGE_FAILED, "Chat UUID cannot be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return CryptoResult(CryptoError::STORAGE_FAILED, "Database not initialized");
    }

    const char* insert_chat_sql = R"(
        INSERT OR REPLACE INTO chats
        (uuid, name, peer_id, role, kem_algorithm, symmetric_algorithm, signature_algorithm, status,
         fingerprint, transcript_hash, public_key_self, private_key_self, public_key_peer, symmetric_key,
         asymmetric_discarded, created_at, last_activity, completed_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";

    if (!exec("BEGIN IMMEDIATE;")) {
        return CryptoResult(CryptoError::STORAGE_FAILED, "Failed to begin transaction");
    }

    auto stmt = prepare(db_, insert_chat_sql);
    if (!stmt) {
        auto error = last_error();
        exec("ROLLBACK;");
        return CryptoResult(CryptoError::STORAGE_FAILED, "Failed to prepare insert statement: " + error);
    }

    auto kem = crypto::to_string(chat.algorithms.kem);
    auto symmetric = crypto::to_string(chat.algorithms.symmetric);
    auto signature = crypto::to_string(chat.algorithms.signature);
    auto status = handshake::to_string(chat.key_establishment_status);

    sqlite3_bind_text(stmt.get(), 1, chat.uuid.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt.get(), 2, chat.name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt.get(), 3, chat.peer_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt.get(), 4, static_cast<int>(chat.role));
    sqlite3_bind_text(stmt.get(), 5, kem.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt.get(), 6, symmetric.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt.get(), 7, signature.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt.get(), 8, status.c_str(), -1, SQLITE_STATIC);
    bind_optional_text(stmt.get(), 9, chat.fingerprint);
    bind_blob(stmt.get(), 10, chat.transcript_hash);
    bind_blob(stmt.get(), 11, chat.keys.public_key_self);
    bind_blob(stmt.get(), 12, chat.keys.private_key_self.span());
    bind_blob(stmt.get(), 13, chat.keys.public_key_peer);
    bind_blob(stmt.get(), 14, chat.keys.symmetric_key.span());
    sqlite3_bind_int(stmt.get(), 15, chat.keys.asymmetric_discarded ? 1 : 0);
    sqlite3_bind_int64(stmt.get(), 16, TimeUtils::to_unix_millis(chat.created_at));
    sqlite3_bind_int64(stmt.get(), 17, TimeUtils::to_unix_millis(chat.last_activity));
    if (chat.key_establishment_completed_at) {
        sqlite3_bind_int64(stmt.get(), 18, TimeUtils::to_unix_millis(*chat.key_establishment_completed_at));
    } else {
        sqlite3_bind_null(stmt.get(), 18);
    }

    int result = sqlite3_step(stmt.get());
    stmt.reset();
    if (result != SQLITE_DONE) {
        auto error = last_error();
        exec("ROLLBACK;");
        LOG_ERROR("Failed to save chat {}: {}", chat.uuid, error);
        return CryptoResult(CryptoError::STORAGE_FAILED, "Failed to save chat: " + error);
    }

    auto peer_result = write_peer_crypto(chat.uuid, chat.peer_crypto);
    if (!peer_result) {
        exec("ROLLBACK;");
        return peer_result;
    }

    if (!exec("COMMIT;")) {
        exec("ROLLBACK;");
        return CryptoResult(CryptoError::STORAGE_FAILED, "Failed to commit chat " + chat.uuid);
    }

    LOG_DEBUG("Saved chat {} ({})", chat.uuid, status);
    return CryptoResult();
}

CryptoResult SqliteChatStore::write_peer_crypto(const std::string& chat_uuid, const crypto::PeerCryptoInfo& peer_crypto) {
    const char* insert_peer_sql = R"(
        INSERT OR REPLACE INTO peer_crypto
        (chat_uuid, peer_id, kem_algorithm, symmetric_algorithm, signature_algorithm,
         signature_public_key, signing_algorithm, last_updated, verified)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";

    auto stmt = prepare(db_, insert_peer_sql);
    if (!stmt) {
        return CryptoResult(CryptoError::STORAGE_FAILED, "Failed to prepare peer statement: " + last_error());
    }

    std::optional<std::string> kem;
    std::optional<std::string> symmetric;
    std::optional<std::string> signature;
    if (peer_crypto.peer_algorithms) {
        kem = crypto::to_string(peer_crypto.peer_algorithms->kem);
        symmetric = crypto::to_string(peer_crypto.peer_algorithms->symmetric);
        signature = crypto::to_string(peer_crypto.peer_algorithms->signature);
    }

    std::optional<std::string> signing;
    if (peer_crypto.signature_algorithm) {
        signing = crypto::to_string(*peer_crypto.signature_algorithm);
    }

    sqlite3_bind_text(stmt.get(), 1, chat_uuid.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt.get(), 2, peer_crypto.peer_id.c_str(), -1, SQLITE_STATIC);
    bind_optional_text(stmt.get(), 3, kem);
    bind_optional_text(stmt.get(), 4, symmetric);
    bind_optional_text(stmt.get(), 5, signature);
    bind_blob(stmt.get(), 6, peer_crypto.signature_public_key);
    bind_optional_text(stmt.get(), 7, signing);
    sqlite3_bind_int64(stmt.get(), 8, TimeUtils::to_unix_millis(peer_crypto.last_updated));
    sqlite3_bind_int(stmt.get(), 9, peer_crypto.verified ? 1 : 0);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return CryptoResult(CryptoError::STORAGE_FAILED, "Failed to save peer crypto: " + last_error());
    }
    return CryptoResult();
}

bool SqliteChatStore::read_peer_crypto(const std::string& chat_uuid, crypto::PeerCryptoInfo& out_peer_crypto) {
    const char* select_peer_sql = R"(
        SELECT peer_id, kem_algorithm, symmetric_algorithm, signature_algorithm,
               signature_public_key, signing_algorithm, last_updated, verified
        FROM peer_crypto WHERE chat_uuid = ?;
    )";

    auto stmt = prepare(db_, select_peer_sql);
    if (!stmt) {
        return false;
    }

    sqlite3_bind_text(stmt.get(), 1, chat_uuid.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return false;
    }

    out_peer_crypto.peer_id = column_text(stmt.get(), 0).value_or("");
    out_peer_crypto.peer_algorithms = parse_algorithms(
        column_text(stmt.get(), 1), column_text(stmt.get(), 2), column_text(stmt.get(), 3));
    out_peer_crypto.signature_public_key = column_bytes(stmt.get(), 4);

    out_peer_crypto.signature_algorithm.reset();
    if (auto signing = column_text(stmt.get(), 5)) {
        out_peer_crypto.signature_algorithm = crypto::parse_signature_algorithm(*signing);
    }

    out_peer_crypto.last_updated = TimeUtils::from_unix_millis(sqlite3_column_int64(stmt.get(), 6));
    out_peer_crypto.verified = sqlite3_column_int(stmt.get(), 7) != 0;
    return true;
}

std::optional<Chat> SqliteChatStore::get_chat(const std::string& chat_uuid) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return std::nullopt;
    }

    const char* select_sql = R"(
        SELECT name, peer_id, role, kem_algorithm, symmetric_algorithm, signature_algorithm, status,
               fingerprint, transcript_hash, public_key_self, private_key_self, public_key_peer,
               symmetric_key, asymmetric_discarded, created_at, last_activity, completed_at
        FROM chats WHERE uuid = ?;
    )";

    auto stmt = prepare(db_, select_sql);
    if (!stmt) {
        LOG_ERROR("Failed to prepare chat query: {}", last_error());
        return std::nullopt;
    }

    sqlite3_bind_text(stmt.get(), 1, chat_uuid.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    auto algorithms = parse_algorithms(
        column_text(stmt.get(), 3), column_text(stmt.get(), 4), column_text(stmt.get(), 5));
    auto status = handshake::parse_key_establishment_status(column_text(stmt.get(), 6).value_or(""));
    if (!algorithms || !status) {
        LOG_ERROR("Chat {} has an unreadable record", chat_uuid);
        return std::nullopt;
    }

    Chat chat;
    chat.uuid = chat_uuid;
    chat.name = column_text(stmt.get(), 0).value_or("");
    chat.peer_id = column_text(stmt.get(), 1).value_or("");
    chat.role = sqlite3_column_int(stmt.get(), 2) == static_cast<int>(handshake::ChatRole::RESPONDER)
                    ? handshake::ChatRole::RESPONDER
                    : handshake::ChatRole::INITIATOR;
    chat.algorithms = *algorithms;
    chat.key_establishment_status = *status;
    chat.fingerprint = column_text(stmt.get(), 7);
    chat.transcript_hash = column_bytes(stmt.get(), 8);

    chat.keys.algorithm = algorithms->kem;
    chat.keys.public_key_self = column_bytes(stmt.get(), 9);
    chat.keys.private_key_self = crypto::SecureBytes(column_span(stmt.get(), 10));
    chat.keys.public_key_peer = column_bytes(stmt.get(), 11);
    chat.keys.symmetric_key = crypto::SecureBytes(column_span(stmt.get(), 12));
    chat.keys.asymmetric_discarded = sqlite3_column_int(stmt.get(), 13) != 0;

    chat.created_at = TimeUtils::from_unix_millis(sqlite3_column_int64(stmt.get(), 14));
    chat.last_activity = TimeUtils::from_unix_millis(sqlite3_column_int64(stmt.get(), 15));
    if (sqlite3_column_type(stmt.get(), 16) != SQLITE_NULL) {
        chat.key_establishment_completed_at = TimeUtils::from_unix_millis(sqlite3_column_int64(stmt.get(), 16));
    }
    stmt.reset();

    if (!read_peer_crypto(chat_uuid, chat.peer_crypto)) {
        chat.peer_crypto.peer_id = chat.peer_id;
    }

    return chat;
}

CryptoResult SqliteChatStore::update_key_establishment(
    const std::string& chat_uuid,
    KeyEstablishmentStatus status,
    const std::optional<std::string>& fingerprint) {

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return CryptoResult(CryptoError::STORAGE_FAILED, "Database not initialized");
    }

    auto stmt = prepare(db_, "UPDATE chats SET status = ?, fingerprint = ? WHERE uuid = ?;");
    if (!stmt) {
        return CryptoResult(CryptoError::STORAGE_FAILED, "Failed to prepare update statement: " + last_error());
    }

    auto status_name = handshake::to_string(status);
    sqlite3_bind_text(stmt.get(), 1, status_name.c_str(), -1, SQLITE_STATIC);
    bind_optional_text(stmt.get(), 2, fingerprint);
    sqlite3_bind_text(stmt.get(), 3, chat_uuid.c_str(), -1, SQLITE_STATIC);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return CryptoResult(CryptoError::STORAGE_FAILED, "Failed to update chat: " + last_error());
    }

    if (sqlite3_changes(db_) == 0) {
        return CryptoResult(CryptoError::CHAT_NOT_FOUND, "Chat not found: " + chat_uuid);
    }
    return CryptoResult();
}

CryptoResult SqliteChatStore::update_peer_crypto(
    const std::string& chat_uuid,
    const crypto::PeerCryptoInfo& peer_crypto) {

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return CryptoResult(CryptoError::STORAGE_FAILED, "Database not initialized");
    }

    auto stmt = prepare(db_, "SELECT 1 FROM chats WHERE uuid = ?;");
    if (!stmt) {
        return CryptoResult(CryptoError::STORAGE_FAILED, "Failed to prepare lookup: " + last_error());
    }
    sqlite3_bind_text(stmt.get(), 1, chat_uuid.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return CryptoResult(CryptoError::CHAT_NOT_FOUND, "Chat not found: " + chat_uuid);
    }
    stmt.reset();

    return write_peer_crypto(chat_uuid, peer_crypto);
}

CryptoResult SqliteChatStore::delete_chat(const std::string& chat_uuid) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return CryptoResult(CryptoError::STORAGE_FAILED, "Database not initialized");
    }

    if (!exec("BEGIN IMMEDIATE;")) {
        return CryptoResult(CryptoError::STORAGE_FAILED, "Failed to begin transaction");
    }

    auto peer_stmt = prepare(db_, "DELETE FROM peer_crypto WHERE chat_uuid = ?;");
    auto chat_stmt = prepare(db_, "DELETE FROM chats WHERE uuid = ?;");
    if (!peer_stmt || !chat_stmt) {
        auto error = last_error();
        peer_stmt.reset();
        chat_stmt.reset();
        exec("ROLLBACK;");
        return CryptoResult(CryptoError::STORAGE_FAILED, "Failed to prepare delete statement: " + error);
    }

    sqlite3_bind_text(peer_stmt.get(), 1, chat_uuid.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(chat_stmt.get(), 1, chat_uuid.c_str(), -1, SQLITE_STATIC);

    bool ok = sqlite3_step(peer_stmt.get()) == SQLITE_DONE;
    ok = ok && sqlite3_step(chat_stmt.get()) == SQLITE_DONE;
    int removed = ok ? sqlite3_changes(db_) : 0;
    peer_stmt.reset();
    chat_stmt.reset();

    if (!ok) {
        auto error = last_error();
        exec("ROLLBACK;");
        return CryptoResult(CryptoError::STORAGE_FAILED, "Failed to delete chat: " + error);
    }

    if (removed == 0) {
        exec("ROLLBACK;");
        return CryptoResult(CryptoError::CHAT_NOT_FOUND, "Chat not found: " + chat_uuid);
    }

    if (!exec("COMMIT;")) {
        exec("ROLLBACK;");
        return CryptoResult(CryptoError::STORAGE_FAILED, "Failed to commit delete of " + chat_uuid);
    }

    LOG_DEBUG("Deleted chat {}", chat_uuid);
    return CryptoResult();
}

std::vector<std::string> SqliteChatStore::list_chats() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> uuids;
    if (!db_) {
        return uuids;
    }

    auto stmt = prepare(db_, "SELECT uuid FROM chats ORDER BY uuid;");
    if (!stmt) {
        return uuids;
    }

    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        uuids.push_back(column_text(stmt.get(), 0).value_or(""));
    }
    return uuids;
}

size_t SqliteChatStore::chat_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }

    auto stmt = prepare(db_, "SELECT COUNT(*) FROM chats;");
    if (!stmt || sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return 0;
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

bool SqliteChatStore::vacuum_database() {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ && exec("VACUUM;");
}

}
