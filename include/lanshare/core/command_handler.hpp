#pragma once

#include "lanshare/transfer/transfer_engine.hpp"
#include <string>
#include <vector>

namespace lanshare::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& message = "") {
        return CommandResult{true, message, 0};
    }

    static CommandResult error(const std::string& message, int exit_code = 1) {
        return CommandResult{false, message, exit_code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    // args[0] is the command name itself
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class SendCommandHandler : public CommandHandler {
public:
    explicit SendCommandHandler(transfer::EngineOptions options);

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Share files and wait for a receiver"; }
    std::string get_usage() const override { return "lanshare send <code> <path>..."; }

private:
    transfer::EngineOptions options_;
};

class ReceiveCommandHandler : public CommandHandler {
public:
    explicit ReceiveCommandHandler(transfer::EngineOptions options);

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Fetch files from a waiting sender"; }
    std::string get_usage() const override { return "lanshare receive <address> <port> <code> <save-dir>"; }

private:
    transfer::EngineOptions options_;
};

class CodeCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Print a new pairing code"; }
    std::string get_usage() const override { return "lanshare code"; }
};

class InfoCommandHandler : public CommandHandler {
public:
    explicit InfoCommandHandler(transfer::EngineOptions options);

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show local device information"; }
    std::string get_usage() const override { return "lanshare info"; }

private:
    transfer::EngineOptions options_;
};

}
