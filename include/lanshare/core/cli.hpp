#pragma once

#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lanshare::core {

struct OptionSpec {
    char short_name = '\0';  // '\0' for long-only options
    std::string long_name;
    std::string description;
    bool takes_value = false;
    std::string default_value;
};

// GNU-style option parser: "--name value", "--name=value", "-p 8080",
// "-p8080" and bundled flags ("-hv"). Everything after a bare "--" is
// positional, so file names that start with '-' can still be sent.
class CommandLineParser {
public:
    explicit CommandLineParser(std::string program_name);

    void add_option(OptionSpec spec);

    bool parse(int argc, char* argv[]);
    bool parse(const std::vector<std::string>& args);

    // name may be either the long or the one-letter form
    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& fallback = "") const;

    // nullopt when absent; throws std::invalid_argument when the value is not
    // a port number
    std::optional<std::uint16_t> get_port_option(const std::string& name) const;

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help(std::ostream& out = std::cout) const;
    void print_version(std::ostream& out = std::cout) const;

private:
    const OptionSpec* find_long(const std::string& name) const;
    const OptionSpec* find_short(char name) const;
    const OptionSpec* find(const std::string& name) const;

    bool fail(std::string message);

    std::string program_name_;
    std::vector<OptionSpec> specs_;
    std::map<std::string, std::string> values_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
