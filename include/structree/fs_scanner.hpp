#pragma once

#include "structree/entry.hpp"

#include <filesystem>
#include <system_error>
#include <vector>

namespace structree {

class FileSystemScanner {
public:
    FileSystemScanner();

    // Lists the direct children of `path` in directory order. On failure `ec`
    // is set and whatever was read before the failure is returned.
    [[nodiscard]] std::vector<DirEntry> scan(const std::filesystem::path& path, std::error_code& ec) const;

    [[nodiscard]] DirEntry stat_path(const std::filesystem::path& path, std::error_code& ec) const;

private:
    [[nodiscard]] DirEntry make_entry(const std::filesystem::directory_entry& entry, std::error_code& ec) const;
};

// Directories first, then case-insensitive by name. Ties fall back to the raw
// name so the order does not depend on readdir.
void sort_entries(std::vector<DirEntry>& entries);

// Absolute, lexically normal, without a trailing separator.
[[nodiscard]] std::filesystem::path absolute_root(const std::filesystem::path& path);

} // namespace structree
