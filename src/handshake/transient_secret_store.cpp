#include "pqchat/handshake/transient_secret_store.hpp"
#include "pqchat/core/logger.hpp"

namespace pqchat::handshake {

TransientSecretStore::TransientSecretStore(std::chrono::seconds ttl)
    : ttl_(ttl) {
}

TransientSecretStore::~TransientSecretStore() {
    clear();
}

void TransientSecretStore::put(const std::string& chat_uuid, crypto::SecureBytes secret) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entries_[chat_uuid];
    entry.secret = std::move(secret);
    entry.stored_at = Clock::now();
}

std::optional<crypto::SecureBytes> TransientSecretStore::take(const std::string& chat_uuid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(chat_uuid);
    if (it == entries_.end()) {
        return std::nullopt;
    }

    auto secret = std::move(it->second.secret);
    entries_.erase(it);
    return secret;
}

std::optional<crypto::SecureBytes> TransientSecretStore::peek(const std::string& chat_uuid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(chat_uuid);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.secret.clone();
}

bool TransientSecretStore::contains(const std::string& chat_uuid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(chat_uuid) != entries_.end();
}

bool TransientSecretStore::erase(const std::string& chat_uuid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(chat_uuid);
    if (it == entries_.end()) {
        return false;
    }

    it->second.secret.clear();
    entries_.erase(it);
    return true;
}

size_t TransientSecretStore::evict_expired() {
    return evict_expired(Clock::now());
}

size_t TransientSecretStore::evict_expired(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t evicted = 0;

    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now - it->second.stored_at >= ttl_) {
            LOG_DEBUG("Evicting expired transient secret for chat {}", it->first);
            it->second.secret.clear();
            it = entries_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }

    return evicted;
}

void TransientSecretStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [uuid, entry] : entries_) {
        entry.secret.clear();
    }
    entries_.clear();
}

size_t TransientSecretStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}
