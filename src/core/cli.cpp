#include "lanshare/core/cli.hpp"
#include "lanshare/core/utils.hpp"
#include <iomanip>
#include <stdexcept>

namespace lanshare::core {

CommandLineParser::CommandLineParser(std::string program_name)
    : program_name_(std::move(program_name)) {
    add_option({'h', "help", "Show this help message"});
    add_option({'v', "version", "Show version information"});
    add_option({'c', "config", "Configuration file path", true, "~/.lanshare.conf"});
    add_option({'p', "port", "Listening port for the transfer server (0 picks a free one)", true});
    add_option({'\0', "verbose", "Enable debug logging"});
}

void CommandLineParser::add_option(OptionSpec spec) {
    if (spec.long_name.empty()) {
        throw std::invalid_argument("Options need a long name");
    }
    if (find_long(spec.long_name) || (spec.short_name != '\0' && find_short(spec.short_name))) {
        throw std::invalid_argument("Option registered twice: --" + spec.long_name);
    }
    specs_.push_back(std::move(spec));
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

bool CommandLineParser::parse(const std::vector<std::string>& args) {
    values_.clear();
    positional_args_.clear();
    error_.clear();

    bool options_done = false;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (options_done || arg.size() < 2 || arg[0] != '-') {
            positional_args_.push_back(arg);
            continue;
        }

        if (arg == "--") {
            options_done = true;
            continue;
        }

        if (arg[1] == '-') {
            auto eq_pos = arg.find('=');
            auto name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);

            const auto* spec = find_long(name);
            if (!spec) {
                return fail("Unknown option: --" + name);
            }

            if (!spec->takes_value) {
                if (eq_pos != std::string::npos) {
                    return fail("Option --" + name + " does not take a value");
                }
                values_[spec->long_name] = "true";
            } else if (eq_pos != std::string::npos) {
                values_[spec->long_name] = arg.substr(eq_pos + 1);
            } else if (i + 1 < args.size()) {
                values_[spec->long_name] = args[++i];
            } else {
                return fail("Option --" + name + " requires a value");
            }
            continue;
        }

        // One or more bundled short flags; a value-taking flag consumes the
        // rest of the word or the next argument
        for (std::size_t j = 1; j < arg.size(); ++j) {
            const auto* spec = find_short(arg[j]);
            if (!spec) {
                return fail(std::string("Unknown option: -") + arg[j]);
            }

            if (!spec->takes_value) {
                values_[spec->long_name] = "true";
                continue;
            }

            if (j + 1 < arg.size()) {
                values_[spec->long_name] = arg.substr(j + 1);
            } else if (i + 1 < args.size()) {
                values_[spec->long_name] = args[++i];
            } else {
                return fail(std::string("Option -") + arg[j] + " requires a value");
            }
            break;
        }
    }

    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    const auto* spec = find(name);
    return spec && values_.count(spec->long_name) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& fallback) const {
    const auto* spec = find(name);
    if (!spec) {
        return fallback;
    }

    auto it = values_.find(spec->long_name);
    if (it != values_.end()) {
        return it->second;
    }
    return spec->default_value.empty() ? fallback : spec->default_value;
}

std::optional<std::uint16_t> CommandLineParser::get_port_option(const std::string& name) const {
    if (!has_option(name)) {
        return std::nullopt;
    }

    auto value = get_option(name);
    if (!utils::StringUtils::is_digits(value) || value.size() > 5 || std::stoul(value) > 65535) {
        throw std::invalid_argument("Invalid port: " + value);
    }
    return static_cast<std::uint16_t>(std::stoul(value));
}

void CommandLineParser::print_help(std::ostream& out) const {
    out << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    out << "Options:\n";

    for (const auto& spec : specs_) {
        std::string flags = spec.short_name != '\0'
            ? std::string("-") + spec.short_name + ", --" + spec.long_name
            : "    --" + spec.long_name;
        if (spec.takes_value) {
            flags += " <value>";
        }

        out << "  " << std::left << std::setw(24) << flags << spec.description;
        if (!spec.default_value.empty()) {
            out << " (default: " << spec.default_value << ")";
        }
        out << "\n";
    }
}

void CommandLineParser::print_version(std::ostream& out) const {
    out << program_name_ << " " << LANSHARE_VERSION << "\n";
}

const OptionSpec* CommandLineParser::find_long(const std::string& name) const {
    for (const auto& spec : specs_) {
        if (spec.long_name == name) {
            return &spec;
        }
    }
    return nullptr;
}

const OptionSpec* CommandLineParser::find_short(char name) const {
    for (const auto& spec : specs_) {
        if (spec.short_name == name) {
            return &spec;
        }
    }
    return nullptr;
}

const OptionSpec* CommandLineParser::find(const std::string& name) const {
    if (name.size() == 1) {
        return find_short(name[0]);
    }
    return find_long(name);
}

bool CommandLineParser::fail(std::string message) {
    error_ = std::move(message);
    return false;
}

}
