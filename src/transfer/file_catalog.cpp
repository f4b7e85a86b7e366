#include "lanshare/transfer/file_catalog.hpp"
#include "lanshare/core/error.hpp"
#include "lanshare/core/logger.hpp"
#include "lanshare/core/utils.hpp"
#include <algorithm>

namespace lanshare::transfer {

namespace fs = std::filesystem;

namespace {
    core::TransferError io_error(const std::string& message) {
        return core::TransferError(core::ErrorKind::IO, message);
    }

    std::string base_name(const fs::path& path) {
        auto name = path.filename().string();
        if (name.empty() || name == ".") {
            // "dir/" or "." name the directory itself
            name = fs::absolute(path).lexically_normal().parent_path().filename().string();
            if (name.empty()) {
                name = fs::absolute(path).lexically_normal().filename().string();
            }
        }
        return name;
    }
}

Catalog FileCatalog::build(const std::vector<fs::path>& paths) {
    Catalog catalog;

    for (const auto& path : paths) {
        std::error_code ec;
        auto status = fs::status(path, ec);
        if (ec || !fs::exists(status)) {
            throw io_error("Path not found: " + path.string());
        }

        auto name = base_name(path);
        if (fs::is_directory(status)) {
            add_directory(catalog, path, name);
        } else if (fs::is_regular_file(status)) {
            add_file(catalog, path, name);
        } else {
            throw io_error("Not a regular file or directory: " + path.string());
        }
    }

    LOG_DEBUG("Catalog built: {} entries, {}", catalog.entries.size(),
              core::utils::StringUtils::format_bytes(catalog.total_size));
    return catalog;
}

void FileCatalog::add_directory(Catalog& catalog, const fs::path& dir, const std::string& relative) {
    storage::FileEntry entry;
    entry.name = relative.substr(relative.find_last_of('/') + 1);
    entry.relative_path = relative;
    entry.size = 0;
    entry.is_directory = true;
    catalog.entries.push_back(std::move(entry));
    catalog.sources.push_back(dir);

    std::vector<fs::directory_entry> children;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        children.push_back(*it);
    }
    if (ec) {
        throw io_error("Failed to read directory " + dir.string() + ": " + ec.message());
    }

    std::sort(children.begin(), children.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename().string() < b.path().filename().string();
              });

    for (const auto& child : children) {
        auto child_relative = relative + "/" + child.path().filename().string();

        std::error_code status_ec;
        auto status = child.status(status_ec);
        if (status_ec) {
            throw io_error("Failed to stat " + child.path().string() + ": " + status_ec.message());
        }

        if (fs::is_directory(status)) {
            add_directory(catalog, child.path(), child_relative);
        } else if (fs::is_regular_file(status)) {
            add_file(catalog, child.path(), child_relative);
        } else {
            LOG_WARN("Skipping special file {}", child.path().string());
        }
    }
}

void FileCatalog::add_file(Catalog& catalog, const fs::path& file, const std::string& relative) {
    std::error_code ec;
    auto size = fs::file_size(file, ec);
    if (ec) {
        throw io_error("Failed to read size of " + file.string() + ": " + ec.message());
    }

    storage::FileEntry entry;
    entry.name = file.filename().string();
    entry.relative_path = relative;
    entry.size = size;
    entry.is_directory = false;
    catalog.entries.push_back(std::move(entry));
    catalog.sources.push_back(file);
    catalog.total_size += size;
}

bool FileCatalog::is_safe_relative_path(const std::string& relative_path) {
    if (relative_path.empty() || relative_path.front() == '/' || relative_path.back() == '/') {
        return false;
    }
    if (relative_path.find('\\') != std::string::npos) {
        return false;
    }
    if (relative_path.find('\0') != std::string::npos) {
        return false;
    }

    for (const auto& part : core::utils::StringUtils::split(relative_path, '/')) {
        if (part.empty() || part == "." || part == "..") {
            return false;
        }
    }
    return true;
}

}
