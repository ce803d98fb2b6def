#include <gtest/gtest.h>
#include "pqchat/crypto/encryption.hpp"
#include "pqchat/crypto/random.hpp"
#include <algorithm>
#include <memory>
#include <string>

namespace pqchat::crypto::test {

class EncryptionTest : public ::testing::TestWithParam<SymmetricAlgorithm> {
protected:
    void SetUp() override {
        ASSERT_TRUE(SecureRandom::initialize());
        encryption_engine_ = std::make_unique<EncryptionEngine>();
        test_key_ = SecureRandom::generate_bytes(SYMMETRIC_KEY_SIZE);
    }

    std::unique_ptr<EncryptionEngine> encryption_engine_;
    SecureBytes test_key_;
};

TEST_P(EncryptionTest, BasicEncryptionDecryption) {
    std::string plaintext = "Hello, quantum-resistant world!";

    Bytes ciphertext;
    auto result = encryption_engine_->encrypt_string(plaintext, test_key_.span(), GetParam(), ciphertext);
    ASSERT_TRUE(result.success()) << result.message;
    EXPECT_EQ(ciphertext.size(), plaintext.size() + EncryptionEngine::overhead(GetParam()));

    std::string decrypted;
    result = encryption_engine_->decrypt_to_string(ciphertext, test_key_.span(), GetParam(), decrypted);
    ASSERT_TRUE(result.success()) << result.message;
    EXPECT_EQ(decrypted, plaintext);
}

TEST_P(EncryptionTest, EmptyPlaintext) {
    Bytes ciphertext;
    ASSERT_TRUE(encryption_engine_->encrypt({}, test_key_.span(), GetParam(), ciphertext).success());
    EXPECT_EQ(ciphertext.size(), EncryptionEngine::overhead(GetParam()));

    Bytes plaintext = {0xff};
    ASSERT_TRUE(encryption_engine_->decrypt(ciphertext, test_key_.span(), GetParam(), plaintext).success());
    EXPECT_TRUE(plaintext.empty());
}

TEST_P(EncryptionTest, FreshNoncePerMessage) {
    std::string plaintext = "same message twice";

    Bytes first;
    Bytes second;
    ASSERT_TRUE(encryption_engine_->encrypt_string(plaintext, test_key_.span(), GetParam(), first).success());
    ASSERT_TRUE(encryption_engine_->encrypt_string(plaintext, test_key_.span(), GetParam(), second).success());

    EXPECT_NE(first, second);
    auto nonce = EncryptionEngine::nonce_size(GetParam());
    EXPECT_FALSE(std::equal(first.begin(), first.begin() + nonce, second.begin()));
}

TEST_P(EncryptionTest, RejectsWrongKeySize) {
    Bytes short_key(16, 0x42);
    Bytes ciphertext;

    auto result = encryption_engine_->encrypt_string("message", short_key, GetParam(), ciphertext);
    EXPECT_EQ(result.error, CryptoError::INVALID_KEY_MATERIAL);

    Bytes plaintext;
    result = encryption_engine_->decrypt(Bytes(64, 0), short_key, GetParam(), plaintext);
    EXPECT_EQ(result.error, CryptoError::INVALID_KEY_MATERIAL);
}

TEST_P(EncryptionTest, RejectsTruncatedCiphertext) {
    Bytes truncated(EncryptionEngine::nonce_size(GetParam()) - 1, 0);
    Bytes plaintext;

    auto result = encryption_engine_->decrypt(truncated, test_key_.span(), GetParam(), plaintext);
    EXPECT_EQ(result.error, CryptoError::DECRYPTION_FAILED);
}

INSTANTIATE_TEST_SUITE_P(
    AllCiphers,
    EncryptionTest,
    ::testing::Values(SymmetricAlgorithm::AES_256, SymmetricAlgorithm::SALSA20, SymmetricAlgorithm::CHACHA20),
    [](const ::testing::TestParamInfo<SymmetricAlgorithm>& info) {
        switch (info.param) {
            case SymmetricAlgorithm::AES_256: return std::string("AES256");
            case SymmetricAlgorithm::SALSA20: return std::string("SALSA20");
            case SymmetricAlgorithm::CHACHA20: return std::string("CHACHA20");
        }
        return std::string("UNKNOWN");
    });

class AesGcmTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(SecureRandom::initialize());
        encryption_engine_ = std::make_unique<EncryptionEngine>();
        test_key_ = SecureRandom::generate_bytes(SYMMETRIC_KEY_SIZE);

        auto result = encryption_engine_->encrypt_string(
            "authenticated payload", test_key_.span(), SymmetricAlgorithm::AES_256, ciphertext_);
        ASSERT_TRUE(result.success());
    }

    std::unique_ptr<EncryptionEngine> encryption_engine_;
    SecureBytes test_key_;
    Bytes ciphertext_;
};

TEST_F(AesGcmTest, FramingIsIvCiphertextTag) {
    EXPECT_EQ(EncryptionEngine::nonce_size(SymmetricAlgorithm::AES_256), AES_GCM_IV_SIZE);
    EXPECT_EQ(EncryptionEngine::overhead(SymmetricAlgorithm::AES_256), AES_GCM_IV_SIZE + AES_GCM_TAG_SIZE);
    EXPECT_EQ(ciphertext_.size(), AES_GCM_IV_SIZE + std::string("authenticated payload").size() + AES_GCM_TAG_SIZE);
}

TEST_F(AesGcmTest, TamperedTagFailsAuthentication) {
    ciphertext_.back() ^= 0x01;

    std::string decrypted = "untouched";
    auto result = encryption_engine_->decrypt_to_string(
        ciphertext_, test_key_.span(), SymmetricAlgorithm::AES_256, decrypted);
    EXPECT_EQ(result.error, CryptoError::AUTHENTICATION_FAILED);
    EXPECT_EQ(decrypted, "untouched");
}

TEST_F(AesGcmTest, TamperedBodyFailsAuthentication) {
    ciphertext_[AES_GCM_IV_SIZE] ^= 0x80;

    Bytes plaintext;
    auto result = encryption_engine_->decrypt(ciphertext_, test_key_.span(), SymmetricAlgorithm::AES_256, plaintext);
    EXPECT_EQ(result.error, CryptoError::AUTHENTICATION_FAILED);
    EXPECT_TRUE(plaintext.empty());
}

TEST_F(AesGcmTest, WrongKeyFailsAuthentication) {
    auto wrong_key = SecureRandom::generate_bytes(SYMMETRIC_KEY_SIZE);

    Bytes plaintext;
    auto result = encryption_engine_->decrypt(ciphertext_, wrong_key.span(), SymmetricAlgorithm::AES_256, plaintext);
    EXPECT_EQ(result.error, CryptoError::AUTHENTICATION_FAILED);
}

TEST(StreamCipherTest, TamperingIsNotDetected) {
    ASSERT_TRUE(SecureRandom::initialize());
    EncryptionEngine engine;
    auto key = SecureRandom::generate_bytes(SYMMETRIC_KEY_SIZE);

    Bytes ciphertext;
    ASSERT_TRUE(engine.encrypt_string("attack at dawn", key.span(), SymmetricAlgorithm::CHACHA20, ciphertext).success());
    ciphertext.back() ^= 0x01;

    std::string decrypted;
    ASSERT_TRUE(engine.decrypt_to_string(ciphertext, key.span(), SymmetricAlgorithm::CHACHA20, decrypted).success());
    EXPECT_NE(decrypted, "attack at dawn");
    EXPECT_EQ(decrypted.size(), std::string("attack at dawn").size());
}

TEST(SecureRandomTest, UuidsAreVersionFour) {
    ASSERT_TRUE(SecureRandom::initialize());

    auto first = SecureRandom::generate_uuid();
    auto second = SecureRandom::generate_uuid();
    ASSERT_EQ(first.size(), 36u);
    EXPECT_NE(first, second);

    EXPECT_EQ(first[8], '-');
    EXPECT_EQ(first[13], '-');
    EXPECT_EQ(first[14], '4');
    EXPECT_EQ(first[18], '-');
    EXPECT_NE(std::string("89ab").find(first[19]), std::string::npos);
    EXPECT_EQ(first[23], '-');
}

TEST(SecureRandomTest, GeneratedBytesDiffer) {
    ASSERT_TRUE(SecureRandom::initialize());

    auto a = SecureRandom::generate_bytes(32);
    auto b = SecureRandom::generate_bytes(32);
    ASSERT_EQ(a.size(), 32u);
    EXPECT_NE(a.data, b.data);
}

}
