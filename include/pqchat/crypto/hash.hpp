#pragma once

#include "pqchat/crypto/crypto_types.hpp"
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace pqchat::crypto {

// Incremental SHA3-256 over OpenSSL EVP
class Sha3Hasher {
public:
    Sha3Hasher();
    ~Sha3Hasher();

    Sha3Hasher(const Sha3Hasher&) = delete;
    Sha3Hasher& operator=(const Sha3Hasher&) = delete;

    CryptoResult initialize();
    CryptoResult update(std::span<const std::uint8_t> data);
    CryptoResult finalize(Sha3Hash& output);
    void reset();

    static Sha3Hash hash(std::span<const std::uint8_t> data);
    static Sha3Hash hash_multiple(const std::vector<std::span<const std::uint8_t>>& data_spans);
    static CryptoResult hash_file(const std::filesystem::path& file_path, Sha3Hash& output);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {
    std::string hash_to_hex(const Sha3Hash& hash);
    bool hash_from_hex(const std::string& hex, Sha3Hash& output);
}

}
