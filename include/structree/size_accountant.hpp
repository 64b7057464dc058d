#pragma once

#include <cstdint>
#include <filesystem>

namespace structree {

struct SubtreeStats {
    std::uintmax_t directories{0}; // excludes the root itself
    std::uintmax_t files{0};
    std::uintmax_t bytes{0};
};

// Unfiltered recursive totals. Symlinks are never followed and count as
// neither files nor directories; unreadable directories contribute zero.
[[nodiscard]] SubtreeStats measure_subtree(const std::filesystem::path& root);

[[nodiscard]] std::uintmax_t subtree_bytes(const std::filesystem::path& root);
[[nodiscard]] std::uintmax_t count_files(const std::filesystem::path& root);

} // namespace structree
