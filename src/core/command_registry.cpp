#include "lanshare/core/command_registry.hpp"
#include <iomanip>

namespace lanshare::core {

CommandRegistry::CommandRegistry(const transfer::EngineOptions& options) {
    register_command("send", std::make_unique<SendCommandHandler>(options));
    register_command("receive", std::make_unique<ReceiveCommandHandler>(options));
    register_command("code", std::make_unique<CodeCommandHandler>());
    register_command("info", std::make_unique<InfoCommandHandler>(options));
}

// Replaces any handler already registered under the name
void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_.insert_or_assign(name, std::move(handler));
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    if (auto it = handlers_.find(command); it != handlers_.end()) {
        return it->second->execute(args);
    }
    return CommandResult::error("Unknown command: " + command);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.count(command) > 0;
}

void CommandRegistry::print_help(std::ostream& out) const {
    out << "\nCommands:\n";
    for (const auto& [name, handler] : handlers_) {
        out << "  " << std::left << std::setw(10) << name << handler->get_description() << "\n"
            << "  " << std::setw(10) << "" << "Usage: " << handler->get_usage() << "\n\n";
    }
}

}
