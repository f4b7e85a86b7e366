#pragma once

#include <string>
#include <cstdint>

namespace lanshare::storage {

// One catalog element. relative_path uses '/' separators regardless of platform.
struct FileEntry {
    std::string name;
    std::string relative_path;
    std::uint64_t size = 0;
    bool is_directory = false;

    bool operator==(const FileEntry& other) const = default;
};

}
