#pragma once

#include "lanshare/storage/file_entry.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace lanshare::transfer {

struct Catalog {
    std::vector<storage::FileEntry> entries;
    // sources[i] is the local path entries[i] was read from
    std::vector<std::filesystem::path> sources;
    std::uint64_t total_size = 0;
};

class FileCatalog {
public:
    // Each top-level path contributes its base name; directories are walked
    // depth-first with the directory entry ahead of its contents and siblings
    // sorted by name. Throws TransferError (IO) for a missing path.
    static Catalog build(const std::vector<std::filesystem::path>& paths);

    // True for relative '/'-separated paths with no empty, "." or ".." parts
    static bool is_safe_relative_path(const std::string& relative_path);

private:
    static void add_directory(Catalog& catalog, const std::filesystem::path& dir, const std::string& relative);
    static void add_file(Catalog& catalog, const std::filesystem::path& file, const std::string& relative);
};

}
