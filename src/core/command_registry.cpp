#include "pqchat/core/command_registry.hpp"
#include <iostream>
#include <iomanip>

namespace pqchat::core {

CommandRegistry::CommandRegistry(CommandContext& context) {
    register_command("algorithms", std::make_unique<AlgorithmsCommandHandler>(context));
    register_command("handshake", std::make_unique<HandshakeCommandHandler>(context));
    register_command("selftest", std::make_unique<SelftestCommandHandler>(context));
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command);
    }

    return it->second->execute(args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(command) != handlers_.end();
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";

    for (const auto& [name, handler] : handlers_) {
        std::cout << "  " << std::left << std::setw(15) << name
                  << handler->get_description() << "\n";
        std::cout << "  " << std::left << std::setw(15) << " "
                  << "Usage: " << handler->get_usage() << "\n\n";
    }
}

}
