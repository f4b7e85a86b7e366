#include "lanshare/core/utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <cstdio>
#include <unistd.h>

namespace lanshare::core::utils {

namespace {
    bool is_space(unsigned char c) { return std::isspace(c) != 0; }
}

// Same shape as repeated std::getline: "a,,b" keeps the empty middle field,
// a trailing delimiter does not add one
std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> fields;
    std::string::size_type begin = 0;
    while (begin < str.size()) {
        auto end = str.find(delimiter, begin);
        if (end == std::string::npos) {
            fields.push_back(str.substr(begin));
            break;
        }
        fields.push_back(str.substr(begin, end - begin));
        begin = end + 1;
    }
    return fields;
}

std::string StringUtils::trim(const std::string& str) {
    auto first = std::find_if_not(str.begin(), str.end(), is_space);
    if (first == str.end()) {
        return {};
    }
    auto last = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
    return std::string(first, last);
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string lowered;
    lowered.reserve(str.size());
    for (unsigned char c : str) {
        lowered += static_cast<char>(std::tolower(c));
    }
    return lowered;
}

bool StringUtils::is_digits(const std::string& str) {
    if (str.empty()) {
        return false;
    }
    return std::none_of(str.begin(), str.end(), [](unsigned char c) { return !std::isdigit(c); });
}

std::string StringUtils::format_bytes(std::uint64_t bytes) {
    static constexpr std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};

    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }

    std::size_t unit = 0;
    double scaled = static_cast<double>(bytes);
    while (scaled >= 1024.0 && unit + 1 < units.size()) {
        scaled /= 1024.0;
        ++unit;
    }

    // One decimal below GB, two from GB up
    char text[32];
    std::snprintf(text, sizeof(text), unit >= 3 ? "%.2f %s" : "%.1f %s", scaled, units[unit]);
    return text;
}

std::string StringUtils::format_speed(std::uint64_t bytes_per_second) {
    return format_bytes(bytes_per_second) + "/s";
}

std::string StringUtils::format_duration(std::chrono::milliseconds duration) {
    using namespace std::chrono;

    if (duration < seconds(1)) {
        return std::to_string(duration.count()) + "ms";
    }

    auto total_seconds = duration_cast<seconds>(duration).count();
    auto h = total_seconds / 3600;
    auto m = (total_seconds % 3600) / 60;
    auto s = total_seconds % 60;

    if (h > 0) {
        return std::to_string(h) + "h " + std::to_string(m) + "m";
    }
    if (m > 0) {
        return std::to_string(m) + "m " + std::to_string(s) + "s";
    }
    return std::to_string(s) + "s";
}

bool FileUtils::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec) && !ec;
}

std::filesystem::path FileUtils::get_home_dir() {
    for (const char* variable : {"HOME", "USERPROFILE"}) {
        if (const char* value = std::getenv(variable); value && *value) {
            return value;
        }
    }
    return ".";
}

std::filesystem::path FileUtils::expand_user(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() == 1) {
        return get_home_dir();
    }
    if (path[1] == '/') {
        return get_home_dir() / path.substr(2);
    }
    // "~user" forms are left alone
    return path;
}

std::string SystemUtils::hostname() {
    std::array<char, 256> name{};
    if (gethostname(name.data(), name.size() - 1) != 0 || name[0] == '\0') {
        return "Unknown Device";
    }
    return name.data();
}

}
