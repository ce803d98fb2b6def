#include "pqchat/crypto/hash.hpp"
#include "pqchat/core/utils.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <stdexcept>

namespace pqchat::crypto {

struct Sha3Hasher::Impl {
    EVP_MD_CTX* ctx = nullptr;

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("Failed to allocate SHA3 digest context");
        }
    }

    ~Impl() {
        EVP_MD_CTX_free(ctx);
    }
};

Sha3Hasher::Sha3Hasher()
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

Sha3Hasher::~Sha3Hasher() = default;

CryptoResult Sha3Hasher::initialize() {
    if (EVP_DigestInit_ex(impl_->ctx, EVP_sha3_256(), nullptr) != 1) {
        return CryptoResult(CryptoError::NOT_INITIALIZED, "Failed to initialize SHA3-256 digest");
    }

    initialized_ = true;
    return CryptoResult();
}

CryptoResult Sha3Hasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Hasher not initialized");
    }

    if (data.empty()) {
        return CryptoResult();
    }

    if (EVP_DigestUpdate(impl_->ctx, data.data(), data.size()) != 1) {
        return CryptoResult(CryptoError::VERIFICATION_FAILED, "Failed to update hash");
    }

    return CryptoResult();
}

CryptoResult Sha3Hasher::finalize(Sha3Hash& output) {
    if (!initialized_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Hasher not initialized");
    }

    unsigned int length = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, output.data(), &length) != 1 || length != SHA3_256_HASH_SIZE) {
        return CryptoResult(CryptoError::VERIFICATION_FAILED, "Failed to finalize hash");
    }

    initialized_ = false; // Hasher is consumed
    return CryptoResult();
}

void Sha3Hasher::reset() {
    initialized_ = false;
    auto result = initialize();
    if (!result.success()) {
        throw std::runtime_error("Failed to reset hasher: " + result.message);
    }
}

Sha3Hash Sha3Hasher::hash(std::span<const std::uint8_t> data) {
    return hash_multiple({data});
}

Sha3Hash Sha3Hasher::hash_multiple(const std::vector<std::span<const std::uint8_t>>& data_spans) {
    Sha3Hasher hasher;
    auto result = hasher.initialize();
    if (!result.success()) {
        throw std::runtime_error("Failed to hash: " + result.message);
    }

    for (const auto& span : data_spans) {
        result = hasher.update(span);
        if (!result.success()) {
            throw std::runtime_error("Failed to hash multiple spans: " + result.message);
        }
    }

    Sha3Hash output;
    result = hasher.finalize(output);
    if (!result.success()) {
        throw std::runtime_error("Failed to hash: " + result.message);
    }
    return output;
}

CryptoResult Sha3Hasher::hash_file(const std::filesystem::path& file_path, Sha3Hash& output) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return CryptoResult(CryptoError::IO_FAILED, "Cannot open file for hashing");
    }

    Sha3Hasher hasher;
    auto result = hasher.initialize();
    if (!result) {
        return result;
    }

    std::vector<std::uint8_t> buffer(64 * 1024);
    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        auto read = static_cast<size_t>(file.gcount());
        if (read == 0) {
            break;
        }

        result = hasher.update(std::span(buffer.data(), read));
        if (!result) {
            return result;
        }
    }

    return hasher.finalize(output);
}

namespace hash_utils {

std::string hash_to_hex(const Sha3Hash& hash) {
    return core::utils::StringUtils::to_hex(hash);
}

bool hash_from_hex(const std::string& hex, Sha3Hash& output) {
    auto bytes = core::utils::StringUtils::from_hex(hex);
    if (!bytes || bytes->size() != output.size()) {
        return false;
    }
    std::copy(bytes->begin(), bytes->end(), output.begin());
    return true;
}

}

}
