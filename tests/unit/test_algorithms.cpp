#include <gtest/gtest.h>
#include "pqchat/crypto/algorithms.hpp"
#include <string>

namespace pqchat::crypto::test {

TEST(AlgorithmsTest, CanonicalNames) {
    EXPECT_EQ(to_string(KemAlgorithm::KYBER), "KYBER");
    EXPECT_EQ(to_string(KemAlgorithm::MCELIECE), "MCELIECE");
    EXPECT_EQ(to_string(SymmetricAlgorithm::AES_256), "AES-256");
    EXPECT_EQ(to_string(SymmetricAlgorithm::CHACHA20), "CHACHA20");
    EXPECT_EQ(to_string(SignatureAlgorithm::DILITHIUM), "DILITHIUM");
}

TEST(AlgorithmsTest, ParsingIsCaseInsensitive) {
    EXPECT_EQ(parse_kem_algorithm("kyber"), KemAlgorithm::KYBER);
    EXPECT_EQ(parse_kem_algorithm(" Frodo "), KemAlgorithm::FRODO);
    EXPECT_EQ(parse_symmetric_algorithm("aes-256"), SymmetricAlgorithm::AES_256);
    EXPECT_EQ(parse_symmetric_algorithm("Salsa20"), SymmetricAlgorithm::SALSA20);
    EXPECT_EQ(parse_signature_algorithm("falcon"), SignatureAlgorithm::FALCON);
}

TEST(AlgorithmsTest, UnknownNamesAreRejected) {
    EXPECT_FALSE(parse_kem_algorithm("RSA").has_value());
    EXPECT_FALSE(parse_kem_algorithm("").has_value());
    EXPECT_FALSE(parse_symmetric_algorithm("AES-128").has_value());
    EXPECT_FALSE(parse_signature_algorithm("ED25519").has_value());
}

TEST(AlgorithmsTest, EveryMemberRoundTripsThroughItsName) {
    for (auto algorithm : all_kem_algorithms()) {
        EXPECT_EQ(parse_kem_algorithm(to_string(algorithm)), algorithm);
    }
    for (auto algorithm : all_symmetric_algorithms()) {
        EXPECT_EQ(parse_symmetric_algorithm(to_string(algorithm)), algorithm);
    }
    for (auto algorithm : all_signature_algorithms()) {
        EXPECT_EQ(parse_signature_algorithm(to_string(algorithm)), algorithm);
    }

    EXPECT_EQ(all_kem_algorithms().size(), 7u);
    EXPECT_EQ(all_symmetric_algorithms().size(), 3u);
    EXPECT_EQ(all_signature_algorithms().size(), 3u);
}

TEST(AlgorithmsTest, DefaultsAndWireNames) {
    auto defaults = CryptoAlgorithms::defaults();
    EXPECT_EQ(defaults.kem, KemAlgorithm::KYBER);
    EXPECT_EQ(defaults.symmetric, SymmetricAlgorithm::AES_256);
    EXPECT_EQ(defaults.signature, SignatureAlgorithm::FALCON);

    auto names = AlgorithmNames::from(CryptoAlgorithms{KemAlgorithm::HQC, SymmetricAlgorithm::SALSA20,
                                                       SignatureAlgorithm::DILITHIUM});
    EXPECT_EQ(names.kem, "HQC");
    EXPECT_EQ(names.symmetric, "SALSA20");
    EXPECT_EQ(names.signature, "DILITHIUM");
}

TEST(AlgorithmsTest, CatalogLookup) {
    auto kyber = find_algorithm_info("kyber", AlgorithmType::KEM);
    ASSERT_TRUE(kyber.has_value());
    EXPECT_EQ(kyber->name, "KYBER");
    EXPECT_TRUE(kyber->recommended);

    auto rainbow = find_algorithm_info("RAINBOW", AlgorithmType::SIGNATURE);
    ASSERT_TRUE(rainbow.has_value());
    EXPECT_FALSE(rainbow->recommended);

    // Names are only unique within their family
    EXPECT_FALSE(find_algorithm_info("KYBER", AlgorithmType::SIGNATURE).has_value());
    EXPECT_FALSE(find_algorithm_info("RSA", AlgorithmType::KEM).has_value());

    EXPECT_EQ(algorithm_catalog().size(),
              all_kem_algorithms().size() + all_symmetric_algorithms().size() +
              all_signature_algorithms().size());
}

TEST(AlgorithmsTest, LiboqsCandidatesBelongToTheirFamily) {
    for (const char* name : oqs_candidates(KemAlgorithm::NTRU)) {
        EXPECT_TRUE(std::string(name).starts_with("NTRU-")) << name;
    }
    for (const char* name : oqs_candidates(KemAlgorithm::FRODO)) {
        EXPECT_TRUE(std::string(name).starts_with("FrodoKEM-")) << name;
    }
    for (auto algorithm : all_kem_algorithms()) {
        EXPECT_FALSE(oqs_candidates(algorithm).empty()) << to_string(algorithm);
    }
}

}
