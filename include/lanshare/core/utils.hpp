#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>
#include <cstdint>

namespace lanshare::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool is_digits(const std::string& str);

    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_speed(std::uint64_t bytes_per_second);
    static std::string format_duration(std::chrono::milliseconds duration);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::filesystem::path get_home_dir();

    // Expands a leading "~" to the user's home directory
    static std::filesystem::path expand_user(const std::string& path);
};

class SystemUtils {
public:
    static std::string hostname();
};

}
