#include <gtest/gtest.h>
#include "pqchat/crypto/signature.hpp"
#include "pqchat/crypto/random.hpp"

namespace pqchat::crypto::test {

class SignatureTest : public ::testing::TestWithParam<SignatureAlgorithm> {
protected:
    void SetUp() override {
        ASSERT_TRUE(SecureRandom::initialize());
        if (!SignatureEngine::is_available(GetParam())) {
            GTEST_SKIP() << to_string(GetParam()) << " is not enabled in the linked liboqs";
        }
        ASSERT_TRUE(engine_.generate_keypair(GetParam(), public_key_, private_key_).success());
    }

    SignatureEngine engine_;
    Bytes public_key_;
    SecureBytes private_key_;
};

TEST_P(SignatureTest, SignAndVerify) {
    Bytes signature;
    ASSERT_TRUE(engine_.sign_string("transcript", private_key_.span(), GetParam(), signature).success());
    EXPECT_FALSE(signature.empty());

    EXPECT_TRUE(engine_.verify_string("transcript", signature, public_key_, GetParam()).success());
}

TEST_P(SignatureTest, ModifiedMessageFails) {
    Bytes signature;
    ASSERT_TRUE(engine_.sign_string("transcript", private_key_.span(), GetParam(), signature).success());

    EXPECT_EQ(engine_.verify_string("transcripT", signature, public_key_, GetParam()).error,
              CryptoError::VERIFICATION_FAILED);
}

TEST_P(SignatureTest, ModifiedSignatureFails) {
    Bytes signature;
    ASSERT_TRUE(engine_.sign_string("transcript", private_key_.span(), GetParam(), signature).success());
    signature[signature.size() / 2] ^= 0x10;

    EXPECT_FALSE(engine_.verify_string("transcript", signature, public_key_, GetParam()).success());
}

TEST_P(SignatureTest, OtherKeyFails) {
    Bytes other_public;
    SecureBytes other_private;
    ASSERT_TRUE(engine_.generate_keypair(GetParam(), other_public, other_private).success());

    Bytes signature;
    ASSERT_TRUE(engine_.sign_string("transcript", private_key_.span(), GetParam(), signature).success());

    EXPECT_EQ(engine_.verify_string("transcript", signature, other_public, GetParam()).error,
              CryptoError::VERIFICATION_FAILED);
}

TEST_P(SignatureTest, RejectsEmptyInputs) {
    Bytes signature;
    EXPECT_EQ(engine_.sign_string("", private_key_.span(), GetParam(), signature).error,
              CryptoError::INVALID_MESSAGE);
    EXPECT_EQ(engine_.verify_string("transcript", Bytes{}, public_key_, GetParam()).error,
              CryptoError::INVALID_MESSAGE);
}

TEST_P(SignatureTest, RejectsWrongKeyLengths) {
    Bytes signature;
    Bytes short_private(private_key_.data.begin(), private_key_.data.end() - 1);
    EXPECT_EQ(engine_.sign_string("transcript", short_private, GetParam(), signature).error,
              CryptoError::INVALID_KEY_MATERIAL);

    ASSERT_TRUE(engine_.sign_string("transcript", private_key_.span(), GetParam(), signature).success());
    Bytes short_public(public_key_.begin(), public_key_.end() - 1);
    EXPECT_EQ(engine_.verify_string("transcript", signature, short_public, GetParam()).error,
              CryptoError::INVALID_KEY_MATERIAL);
}

INSTANTIATE_TEST_SUITE_P(
    PostQuantumSignatures,
    SignatureTest,
    ::testing::Values(SignatureAlgorithm::FALCON, SignatureAlgorithm::DILITHIUM),
    [](const ::testing::TestParamInfo<SignatureAlgorithm>& info) {
        return to_string(info.param);
    });

}
