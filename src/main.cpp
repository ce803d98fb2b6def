#include <iostream>
#include <string>
#include <vector>
#include "pqchat/core/logger.hpp"
#include "pqchat/core/config.hpp"
#include "pqchat/core/cli.hpp"
#include "pqchat/core/utils.hpp"
#include "pqchat/core/command_registry.hpp"
#include "pqchat/crypto/crypto_service.hpp"

int main(int argc, char* argv[]) {
    pqchat::core::CommandLineParser parser("pqchat");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = pqchat::core::Config::instance();
    config.set_defaults();

    auto config_file = pqchat::core::utils::FileUtils::expand_home(parser.get_option("config", "~/.pqchat.conf"));
    if (pqchat::core::utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file.string())) {
            std::cerr << "Warning: could not read " << config_file.string() << "\n";
        }
    }

    parser.apply_to(config);

    auto log_level = pqchat::core::parse_log_level(config.get_string("log.level", "info"));
    if (parser.has_option("verbose")) {
        log_level = pqchat::core::LogLevel::Debug;
    }
    pqchat::core::Logger::initialize(config.get_string("log.file", "pqchat.log"), log_level);

    LOG_INFO("pqchat starting up");

    pqchat::crypto::CryptoService crypto_service;
    auto init = crypto_service.initialize();
    if (!init) {
        std::cerr << "Error: failed to initialize crypto: " << init.message << "\n";
        pqchat::core::Logger::shutdown();
        return 1;
    }

    pqchat::core::CommandContext context{crypto_service, config, parser.has_option("signed")};
    pqchat::core::CommandRegistry command_registry(context);

    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        pqchat::core::Logger::shutdown();
        return 0;
    }

    std::string command = args[0];

    auto result = command_registry.execute_command(command, args);

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    } else if (!result.message.empty()) {
        std::cout << result.message << "\n";
    }

    crypto_service.cleanup();
    pqchat::core::Logger::shutdown();
    return result.exit_code;
}
