#pragma once

#include "structree/config.hpp"
#include "structree/entry.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace structree {

enum class Classification {
    Visible,
    IgnoredDefault,
    IgnoredPattern,
    IgnoredSize,
    IgnoredGit,
};

struct Verdict {
    Classification classification{Classification::Visible};
    // Set when the size gate had to measure the directory.
    std::optional<std::uintmax_t> subtree_bytes{};
};

// Build output, caches, VCS metadata, virtualenvs, editor state and
// packaging metadata (any name ending in ".egg-info").
[[nodiscard]] bool is_default_ignored_directory(std::string_view name);

// Compiled artifacts, swap files, package-lock.json and .DS_Store.
[[nodiscard]] bool is_default_ignored_file(std::string_view name);

// Default directory list or custom pattern. Shared by the search descent
// filter and the summary.
[[nodiscard]] bool is_ignored_directory_name(std::string_view name, const std::vector<GlobPattern>& patterns);

// Rules are evaluated in this order and the first match wins:
//   1. git snapshot, when present, decides alone;
//   2. default directory list;
//   3. custom patterns;
//   4. default file list;
//   5. size gate for directories.
[[nodiscard]] Verdict classify(const DirEntry& entry, const WalkConfig& config);

} // namespace structree
