#pragma once

#include "lanshare/core/command_handler.hpp"
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace lanshare::core {

class CommandRegistry {
public:
    explicit CommandRegistry(const transfer::EngineOptions& options);

    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);
    CommandResult execute_command(const std::string& command, const std::vector<std::string>& args);
    bool has_command(const std::string& command) const;
    void print_help(std::ostream& out = std::cout) const;

private:
    std::map<std::string, std::unique_ptr<CommandHandler>> handlers_;
};

}
