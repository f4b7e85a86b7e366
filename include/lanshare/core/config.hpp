#pragma once

#include <charconv>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>

namespace lanshare::core {

// Settings as dotted keys ("transfer.chunk_size"). Files hold key=value lines;
// a "[section]" header prefixes the keys below it with "section.". Lines
// starting with '#' or ';' are comments.
class Config {
public:
    Config() = default;

    static Config& instance();

    // False only when the file cannot be opened. Malformed lines are logged
    // and skipped.
    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;

    // Whole-string numeric parse; "12abc", "-1" for unsigned and overflow all
    // yield nullopt
    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>, "integral settings only");

        auto value = get(key);
        if (!value || value->empty()) return std::nullopt;

        T result{};
        const char* first = value->data();
        const char* last = first + value->size();
        auto [ptr, ec] = std::from_chars(first, last, result);
        if (ec != std::errc() || ptr != last) {
            return std::nullopt;
        }
        return result;
    }

    std::uint64_t get_uint64(const std::string& key, std::uint64_t default_value = 0) const;
    std::chrono::milliseconds get_milliseconds(const std::string& key, std::chrono::milliseconds default_value) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    void clear() { values_.clear(); }

    void set_defaults();

private:
    std::map<std::string, std::string> values_;
};

}
