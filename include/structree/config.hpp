#pragma once

#include "structree/git_status.hpp"
#include "structree/logger.hpp"
#include "structree/pattern.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace structree {

enum class Command {
    Tree,
    Search,
    AddPatterns,
    RemovePattern,
    ListPatterns,
    ClearPatterns,
};

struct SearchOptions {
    std::string pattern{};
    std::filesystem::path root{"."};
    std::optional<std::size_t> max_depth{};
    bool flat{false};
};

// The resolved command line.
struct RunOptions {
    Command command{Command::Tree};

    std::optional<std::size_t> depth{};
    std::filesystem::path root{"."};
    GitRelationship git_relationship{GitRelationship::None};
    bool git_root{false};
    std::vector<std::string> ignore_patterns{};
    std::optional<std::uintmax_t> skip_large_mb{};
    bool show_sizes{false};
    std::optional<std::string> no_ignore{};

    bool enable_color{true};
    LogLevel log_level{LogLevel::Error};

    SearchOptions search{};
    std::vector<std::string> store_patterns{};
};

// Per-walk configuration. Built once before the walk and only ever passed
// down by const reference.
struct WalkConfig {
    std::optional<std::size_t> max_depth{}; // absent: unbounded
    std::vector<GlobPattern> custom_ignore_patterns{};
    std::optional<std::uintmax_t> max_subtree_bytes{};
    std::optional<GitPathSet> git_paths{};
    GitRelationship git_relationship{GitRelationship::None};
    bool show_sizes{false};
    bool ignore_defaults_disabled{false};
    std::optional<std::string> ignore_only_pattern{};
};

class Config {
public:
    static Config& instance();

    void set_options(RunOptions options);
    [[nodiscard]] const RunOptions& options() const noexcept;

private:
    Config() = default;

    RunOptions options_{};
};

// `--no-ignore all` and `--no-ignore config` bypass the pattern store.
[[nodiscard]] bool uses_stored_patterns(const RunOptions& options);

// Stored patterns first, then the ad-hoc `--ignore` ones.
[[nodiscard]] std::vector<std::string> merged_ignore_globs(const RunOptions& options,
                                                           const std::vector<std::string>& stored);

[[nodiscard]] WalkConfig build_walk_config(const RunOptions& options,
                                           const std::vector<std::string>& stored,
                                           std::optional<GitPathSet> git_paths);

} // namespace structree
