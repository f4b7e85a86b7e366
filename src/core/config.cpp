#include "lanshare/core/config.hpp"
#include "lanshare/core/logger.hpp"
#include "lanshare/core/utils.hpp"
#include <fstream>

namespace lanshare::core {

using utils::StringUtils;

namespace {
    std::string section_of(const std::string& key) {
        auto dot = key.find('.');
        return dot == std::string::npos ? std::string() : key.substr(0, dot);
    }

    bool is_valid_key(const std::string& key) {
        if (key.empty() || key.front() == '.' || key.back() == '.') {
            return false;
        }
        return key.find_first_of(" \t") == std::string::npos;
    }
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_WARN("Cannot open configuration file {}", filename);
        return false;
    }

    std::string section;
    std::string line;
    std::size_t line_number = 0;
    std::size_t loaded = 0;

    while (std::getline(file, line)) {
        ++line_number;
        line = StringUtils::trim(line);

        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']') {
                LOG_WARN("{}:{}: unterminated section header", filename, line_number);
                continue;
            }
            section = StringUtils::trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            LOG_WARN("{}:{}: expected key=value, ignoring '{}'", filename, line_number, line);
            continue;
        }

        auto key = StringUtils::trim(line.substr(0, eq_pos));
        if (!section.empty()) {
            key = section + "." + key;
        }
        if (!is_valid_key(key)) {
            LOG_WARN("{}:{}: invalid key '{}'", filename, line_number, key);
            continue;
        }

        values_[key] = StringUtils::trim(line.substr(eq_pos + 1));
        ++loaded;
    }

    LOG_DEBUG("Loaded {} settings from {}", loaded, filename);
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# LanShare configuration\n";

    // Keys without a section must come before the first header, or a reload
    // would file them under it
    for (const auto& [key, value] : values_) {
        if (section_of(key).empty()) {
            file << key << " = " << value << "\n";
        }
    }

    // values_ is ordered, so keys sharing a section are adjacent
    std::string current_section;
    for (const auto& [key, value] : values_) {
        auto section = section_of(key);
        if (section.empty()) {
            continue;
        }
        if (section != current_section) {
            file << "\n[" << section << "]\n";
            current_section = section;
        }
        file << key.substr(section.size() + 1) << " = " << value << "\n";
    }

    return static_cast<bool>(file);
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    return get_as<std::uint64_t>(key).value_or(default_value);
}

std::chrono::milliseconds Config::get_milliseconds(const std::string& key,
                                                   std::chrono::milliseconds default_value) const {
    auto value = get_as<std::int64_t>(key);
    return value ? std::chrono::milliseconds(*value) : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    values_["server.port"] = "45679";
    values_["network.port_attempts"] = "2";
    values_["transfer.chunk_size"] = "65536";
    values_["transfer.max_frame_size"] = "67108864";
    values_["transfer.chunk_delay_ms"] = "1";
    values_["transfer.file_delay_ms"] = "50";
    values_["device.name"] = utils::SystemUtils::hostname();
    values_["log.level"] = "info";
    values_["log.file"] = "lanshare.log";
}

}
