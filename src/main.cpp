#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "lanshare/core/logger.hpp"
#include "lanshare/core/config.hpp"
#include "lanshare/core/cli.hpp"
#include "lanshare/core/utils.hpp"
#include "lanshare/core/command_registry.hpp"

using namespace lanshare;

namespace {

// Defaults, then the config file, then command-line overrides
bool load_configuration(const core::CommandLineParser& parser) {
    auto& config = core::Config::instance();
    config.set_defaults();

    auto config_file = core::utils::FileUtils::expand_user(parser.get_option("config"));
    if (core::utils::FileUtils::exists(config_file) && !config.load_from_file(config_file.string())) {
        std::cerr << "Error: failed to read configuration from " << config_file.string() << "\n";
        return false;
    }

    try {
        if (auto port = parser.get_port_option("port")) {
            config.set("server.port", std::to_string(*port));
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return false;
    }

    return true;
}

int run_command(const core::CommandLineParser& parser, const transfer::EngineOptions& options) {
    core::CommandRegistry registry(options);

    const auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        registry.print_help();
        return 0;
    }

    const auto& command = args[0];
    auto result = registry.execute_command(command, args);

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!registry.has_command(command)) {
            registry.print_help(std::cerr);
        }
    } else if (!result.message.empty()) {
        std::cout << result.message << "\n";
    }

    return result.exit_code;
}

}

int main(int argc, char* argv[]) {
    core::CommandLineParser parser("lanshare");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help(std::cerr);
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

    if (!load_configuration(parser)) {
        return 1;
    }

    const auto& config = core::Config::instance();
    auto log_level = parser.has_option("verbose")
        ? core::LogLevel::Debug
        : core::Logger::parse_level(config.get_string("log.level", "info"));
    core::Logger::initialize(config.get_string("log.file", "lanshare.log"), log_level);

    LOG_INFO("LanShare starting up");

    transfer::EngineOptions options;
    try {
        options = transfer::EngineOptions::from_config();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: invalid configuration: " << e.what() << "\n";
        core::Logger::shutdown();
        return 1;
    }

    int exit_code = run_command(parser, options);
    core::Logger::shutdown();
    return exit_code;
}
