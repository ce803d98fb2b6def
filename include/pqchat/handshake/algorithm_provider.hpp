#pragma once

#include "pqchat/crypto/algorithms.hpp"

namespace pqchat::core {
class Config;
}

namespace pqchat::handshake {

// Source of the algorithm triple used when a peer does not declare one
class AlgorithmProvider {
public:
    virtual ~AlgorithmProvider() = default;
    virtual crypto::CryptoAlgorithms preferred_algorithms() const = 0;
};

class FixedAlgorithmProvider : public AlgorithmProvider {
public:
    explicit FixedAlgorithmProvider(crypto::CryptoAlgorithms algorithms = crypto::CryptoAlgorithms::defaults())
        : algorithms_(algorithms) {}

    crypto::CryptoAlgorithms preferred_algorithms() const override { return algorithms_; }

private:
    crypto::CryptoAlgorithms algorithms_;
};

// Reads crypto.kem / crypto.symmetric / crypto.signature; unknown names fall
// back to the defaults with a warning
class ConfigAlgorithmProvider : public AlgorithmProvider {
public:
    explicit ConfigAlgorithmProvider(const core::Config& config);

    crypto::CryptoAlgorithms preferred_algorithms() const override;

private:
    const core::Config& config_;
};

}
