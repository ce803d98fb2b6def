#pragma once

#include "pqchat/crypto/crypto_types.hpp"
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace pqchat::handshake {

// Holds the responder's KEM secret between message 2 and message 4. At most
// one secret per chat; every removal path zeroes the bytes.
class TransientSecretStore {
public:
    using Clock = std::chrono::steady_clock;

    explicit TransientSecretStore(std::chrono::seconds ttl = std::chrono::seconds(300));
    ~TransientSecretStore();

    TransientSecretStore(const TransientSecretStore&) = delete;
    TransientSecretStore& operator=(const TransientSecretStore&) = delete;

    // Replaces (and wipes) any secret already held for the chat
    void put(const std::string& chat_uuid, crypto::SecureBytes secret);

    // Removes and returns the secret
    std::optional<crypto::SecureBytes> take(const std::string& chat_uuid);

    // Copy of the secret; the stored one and its age are left untouched
    std::optional<crypto::SecureBytes> peek(const std::string& chat_uuid) const;

    bool contains(const std::string& chat_uuid) const;
    bool erase(const std::string& chat_uuid);

    size_t evict_expired();
    size_t evict_expired(Clock::time_point now);

    void clear();
    size_t size() const;
    std::chrono::seconds ttl() const { return ttl_; }

private:
    struct Entry {
        crypto::SecureBytes secret;
        Clock::time_point stored_at;
    };

    std::chrono::seconds ttl_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}
