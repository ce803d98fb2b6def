#include "pqchat/handshake/algorithm_provider.hpp"
#include "pqchat/core/config.hpp"
#include "pqchat/core/logger.hpp"

namespace pqchat::handshake {

ConfigAlgorithmProvider::ConfigAlgorithmProvider(const core::Config& config)
    : config_(config) {
}

crypto::CryptoAlgorithms ConfigAlgorithmProvider::preferred_algorithms() const {
    auto algorithms = crypto::CryptoAlgorithms::defaults();

    auto kem_name = config_.get_string("crypto.kem", crypto::to_string(algorithms.kem));
    if (auto kem = crypto::parse_kem_algorithm(kem_name)) {
        algorithms.kem = *kem;
    } else {
        LOG_WARN("Unknown crypto.kem '{}', using {}", kem_name, crypto::to_string(algorithms.kem));
    }

    auto symmetric_name = config_.get_string("crypto.symmetric", crypto::to_string(algorithms.symmetric));
    if (auto symmetric = crypto::parse_symmetric_algorithm(symmetric_name)) {
        algorithms.symmetric = *symmetric;
    } else {
        LOG_WARN("Unknown crypto.symmetric '{}', using {}", symmetric_name, crypto::to_string(algorithms.symmetric));
    }

    auto signature_name = config_.get_string("crypto.signature", crypto::to_string(algorithms.signature));
    if (auto signature = crypto::parse_signature_algorithm(signature_name)) {
        algorithms.signature = *signature;
    } else {
        LOG_WARN("Unknown crypto.signature '{}', using {}", signature_name, crypto::to_string(algorithms.signature));
    }

    return algorithms;
}

}
