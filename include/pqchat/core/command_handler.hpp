#pragma once

#include <string>
#include <vector>

namespace pqchat::crypto {
class CryptoService;
}

namespace pqchat::core {

class Config;

struct CommandResult {
    bool success = true;
    std::string message;
    int exit_code = 0;

    static CommandResult ok(const std::string& msg = "") {
        return CommandResult{true, msg, 0};
    }

    static CommandResult error(const std::string& msg, int code = 1) {
        return CommandResult{false, msg, code};
    }
};

// Shared state handed to every command
struct CommandContext {
    crypto::CryptoService& crypto;
    const Config& config;
    bool signed_identities = false;
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Lists the algorithm catalog and what the linked libraries provide
class AlgorithmsCommandHandler : public CommandHandler {
public:
    explicit AlgorithmsCommandHandler(CommandContext& context) : context_(context) {}

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List supported algorithms"; }
    std::string get_usage() const override { return "pqchat algorithms [kem|symmetric|signature]"; }

private:
    CommandContext& context_;
};

// Runs a full key establishment between two in-process parties
class HandshakeCommandHandler : public CommandHandler {
public:
    explicit HandshakeCommandHandler(CommandContext& context) : context_(context) {}

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Run a local two-party key establishment"; }
    std::string get_usage() const override { return "pqchat handshake [KEM] [SYMMETRIC] [SIGNATURE]"; }

private:
    CommandContext& context_;
};

// Round-trips every available algorithm
class SelftestCommandHandler : public CommandHandler {
public:
    explicit SelftestCommandHandler(CommandContext& context) : context_(context) {}

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Self-test every available algorithm"; }
    std::string get_usage() const override { return "pqchat selftest"; }

private:
    CommandContext& context_;
};

}
