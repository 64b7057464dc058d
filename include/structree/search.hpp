#pragma once

#include "structree/config.hpp"
#include "structree/fs_scanner.hpp"
#include "structree/pattern.hpp"
#include "structree/theme.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace structree {

struct SearchMatch {
    std::filesystem::path path;
    std::uintmax_t size{0}; // 0 for directories
    bool is_directory{false};
};

using KeepSet = std::set<std::filesystem::path>;

class Searcher {
public:
    Searcher(const FileSystemScanner& scanner, const Theme& theme, std::ostream& output, std::ostream& errors);

    // Returns the process exit code.
    int run(const SearchOptions& options, const std::vector<GlobPattern>& ignore_patterns) const;

    // Every entry below `root` (to `max_depth` levels) whose name matches.
    // Descent stops at directories named in the default list or matching an
    // ignore pattern; their own names are still tested.
    [[nodiscard]] std::vector<SearchMatch> collect(const GlobPattern& pattern, const std::filesystem::path& root,
        std::optional<std::size_t> max_depth, const std::vector<GlobPattern>& ignore_patterns) const;

    // Matches plus their ancestors, excluding `root` and anything above it.
    [[nodiscard]] static KeepSet build_keep_set(const std::vector<SearchMatch>& matches,
        const std::filesystem::path& root);

    void render_flat(std::vector<SearchMatch> matches) const;
    void render_tree(const std::filesystem::path& root, const KeepSet& keep) const;

private:
    void collect_directory(const GlobPattern& pattern, const std::filesystem::path& directory, std::size_t depth,
        std::optional<std::size_t> max_depth, const std::vector<GlobPattern>& ignore_patterns,
        std::vector<SearchMatch>& matches) const;
    void render_tree_level(const std::filesystem::path& directory, const KeepSet& keep, const std::string& prefix) const;

    const FileSystemScanner& scanner_;
    const Theme& theme_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace structree
