#include <gtest/gtest.h>
#include "pqchat/core/cli.hpp"
#include "pqchat/core/command_registry.hpp"
#include "pqchat/core/config.hpp"
#include "pqchat/crypto/crypto_service.hpp"
#include <filesystem>
#include <memory>

using namespace pqchat::core;

class CommandLineParserTest : public ::testing::Test {
protected:
    bool parse(std::vector<std::string> args) {
        args.insert(args.begin(), "pqchat");
        storage_ = std::move(args);
        argv_.clear();
        for (auto& arg : storage_) {
            argv_.push_back(arg.data());
        }
        return parser_.parse(static_cast<int>(argv_.size()), argv_.data());
    }

    CommandLineParser parser_{"pqchat"};
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

TEST_F(CommandLineParserTest, PositionalArguments) {
    ASSERT_TRUE(parse({"handshake", "FRODO", "CHACHA20"}));

    const auto& args = parser_.get_positional_args();
    ASSERT_EQ(args.size(), 3u);
    EXPECT_EQ(args[0], "handshake");
    EXPECT_EQ(args[2], "CHACHA20");
}

TEST_F(CommandLineParserTest, LongAndShortOptions) {
    ASSERT_TRUE(parse({"--log-level=debug", "-s", "--database", "chats.db", "selftest"}));

    EXPECT_EQ(parser_.get_option("log-level"), "debug");
    EXPECT_TRUE(parser_.has_option("signed"));
    EXPECT_TRUE(parser_.has_option("s"));
    EXPECT_EQ(parser_.get_option("database"), "chats.db");
    ASSERT_EQ(parser_.get_positional_args().size(), 1u);
}

TEST_F(CommandLineParserTest, DefaultsApplyWhenOptionMissing) {
    ASSERT_TRUE(parse({}));

    EXPECT_FALSE(parser_.has_option("config"));
    EXPECT_EQ(parser_.get_option("config"), "~/.pqchat.conf");
    EXPECT_EQ(parser_.get_option("log-level", "info"), "info");
    EXPECT_FALSE(parser_.get_bool_option("verbose"));
}

TEST_F(CommandLineParserTest, BoundOptionsOverrideConfig) {
    Config config;
    config.set_defaults();
    config.set("crypto.kem", "KYBER");
    const auto symmetric = config.get_string("crypto.symmetric");

    ASSERT_TRUE(parse({"-d", "alt.db", "--threads=8", "-r", "--kem", "FRODO", "--verbose", "handshake"}));
    EXPECT_EQ(parser_.apply_to(config), 4u);

    EXPECT_EQ(config.get_string("storage.database"), "alt.db");
    EXPECT_EQ(config.get_int("worker.threads"), 8);
    EXPECT_TRUE(config.get_bool("handshake.require_signatures"));
    EXPECT_EQ(config.get_string("crypto.kem"), "FRODO");
    EXPECT_EQ(config.get_string("crypto.symmetric"), symmetric);
}

TEST_F(CommandLineParserTest, UnboundOptionsLeaveConfigAlone) {
    Config config;
    config.set("storage.database", "chats.db");

    ASSERT_TRUE(parse({"--signed", "--verbose", "selftest"}));
    EXPECT_EQ(parser_.apply_to(config), 0u);
    EXPECT_EQ(config.get_string("storage.database"), "chats.db");
}

TEST_F(CommandLineParserTest, Errors) {
    EXPECT_FALSE(parse({"--unknown"}));
    EXPECT_EQ(parser_.get_error(), "Unknown option: --unknown");

    EXPECT_FALSE(parse({"--database"}));
    EXPECT_EQ(parser_.get_error(), "Option --database requires a value");

    EXPECT_FALSE(parse({"-x"}));
}

class CommandRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto_.initialize().success());
        config_.set_defaults();
        config_.set("storage.database", db_file_);
        context_ = std::make_unique<CommandContext>(CommandContext{crypto_, config_, false});
        registry_ = std::make_unique<CommandRegistry>(*context_);
    }

    void TearDown() override {
        registry_.reset();
        for (const auto& suffix : {"", "-wal", "-shm"}) {
            std::filesystem::remove(db_file_ + suffix);
        }
    }

    const std::string db_file_ = "test_cli_chats.db";
    pqchat::crypto::CryptoService crypto_;
    Config config_;
    std::unique_ptr<CommandContext> context_;
    std::unique_ptr<CommandRegistry> registry_;
};

TEST_F(CommandRegistryTest, BuiltInCommands) {
    EXPECT_TRUE(registry_->has_command("algorithms"));
    EXPECT_TRUE(registry_->has_command("handshake"));
    EXPECT_TRUE(registry_->has_command("selftest"));
    EXPECT_FALSE(registry_->has_command("send"));
}

TEST_F(CommandRegistryTest, UnknownCommand) {
    auto result = registry_->execute_command("send", {"send"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.message, "Unknown command: send");
}

TEST_F(CommandRegistryTest, AlgorithmsCommand) {
    EXPECT_TRUE(registry_->execute_command("algorithms", {"algorithms"}).success);
    EXPECT_TRUE(registry_->execute_command("algorithms", {"algorithms", "kem"}).success);
    EXPECT_FALSE(registry_->execute_command("algorithms", {"algorithms", "hash"}).success);
}

TEST_F(CommandRegistryTest, HandshakeRejectsUnknownAlgorithms) {
    auto result = registry_->execute_command("handshake", {"handshake", "RSA"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Unknown KEM algorithm: RSA");

    result = registry_->execute_command("handshake", {"handshake", "KYBER", "DES"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Unknown symmetric algorithm: DES");
}

TEST_F(CommandRegistryTest, HandshakeCommandEstablishesChat) {
    if (!crypto_.validate_algorithms(pqchat::crypto::CryptoAlgorithms::defaults())) {
        GTEST_SKIP() << "KYBER/FALCON are not enabled in the linked liboqs";
    }

    auto result = registry_->execute_command("handshake", {"handshake"});
    EXPECT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.message, "Handshake completed");
    EXPECT_TRUE(std::filesystem::exists(db_file_));
}

TEST_F(CommandRegistryTest, SignedHandshakeCommand) {
    if (!crypto_.validate_algorithms(pqchat::crypto::CryptoAlgorithms::defaults())) {
        GTEST_SKIP() << "KYBER/FALCON are not enabled in the linked liboqs";
    }

    context_->signed_identities = true;
    auto result = registry_->execute_command("handshake", {"handshake"});
    EXPECT_TRUE(result.success) << result.message;
}

TEST_F(CommandRegistryTest, SelftestCommand) {
    auto result = registry_->execute_command("selftest", {"selftest"});
    EXPECT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.message, "Self-test passed");
}
