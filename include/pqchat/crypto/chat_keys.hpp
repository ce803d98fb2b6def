#pragma once

#include "pqchat/crypto/algorithms.hpp"
#include "pqchat/crypto/crypto_types.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace pqchat::crypto {

// Key material of one chat. Move-only: secret halves live in SecureBytes and
// are zeroed when the instance goes away.
struct ChatKeys {
    Bytes public_key_self;
    SecureBytes private_key_self;
    Bytes public_key_peer;
    SecureBytes symmetric_key;
    KemAlgorithm algorithm = KemAlgorithm::KYBER;

    // Set on the instance produced by cleaned(); the asymmetric halves were
    // present when the symmetric key was derived and have since been wiped
    bool asymmetric_discarded = false;

    ChatKeys() = default;
    ChatKeys(ChatKeys&&) noexcept = default;
    ChatKeys& operator=(ChatKeys&&) noexcept = default;

    bool has_key_pair() const { return !public_key_self.empty() && !private_key_self.empty(); }
    bool has_peer_key() const { return !public_key_peer.empty(); }
    bool has_symmetric_key() const { return !symmetric_key.empty(); }

    bool is_complete() const {
        return has_symmetric_key() && ((has_key_pair() && has_peer_key()) || asymmetric_discarded);
    }

    // Symmetric key and algorithm only; the asymmetric material is not copied
    ChatKeys cleaned() const;

    ChatKeys clone() const;

    void secure_wipe();
};

struct PeerCryptoInfo {
    std::string peer_id;
    std::optional<CryptoAlgorithms> peer_algorithms;
    Bytes signature_public_key;
    std::optional<SignatureAlgorithm> signature_algorithm;
    std::chrono::system_clock::time_point last_updated{};
    bool verified = false;

    bool is_complete() const {
        return !peer_id.empty() && peer_algorithms.has_value() &&
               !signature_public_key.empty() && signature_algorithm.has_value();
    }

    bool is_compatible_with(const PeerCryptoInfo& other) const {
        return signature_algorithm.has_value() && signature_algorithm == other.signature_algorithm;
    }

    bool is_compatible_with(const CryptoAlgorithms& local) const {
        return peer_algorithms.has_value() && *peer_algorithms == local;
    }
};

}
