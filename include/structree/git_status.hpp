#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace structree {

enum class GitRelationship {
    None,
    Tracked,
    Untracked,
    Staged,
    Changed,
    History, // declared only; never restricts the walk
};

[[nodiscard]] std::string_view to_string(GitRelationship relationship) noexcept;

// Immutable snapshot of absolute paths with some git relationship.
class GitPathSet {
public:
    GitPathSet() = default;
    explicit GitPathSet(const std::vector<std::filesystem::path>& paths);

    [[nodiscard]] bool contains(const std::filesystem::path& path) const;
    // True when some path in the set lies strictly inside `directory`.
    [[nodiscard]] bool has_descendant(const std::filesystem::path& directory) const;

    [[nodiscard]] std::size_t size() const noexcept { return files_.size(); }
    [[nodiscard]] bool empty() const noexcept { return files_.empty(); }

private:
    std::set<std::string> files_;
    std::set<std::string> ancestors_;
};

// `weakly_canonical(parent) / name`: resolves the directories leading to an
// entry without resolving the entry itself.
[[nodiscard]] std::filesystem::path canonical_entry_path(const std::filesystem::path& path);

class GitStatusOracle {
public:
    GitStatusOracle();

    [[nodiscard]] std::optional<std::filesystem::path> repository_root(const std::filesystem::path& path) const;
    [[nodiscard]] std::optional<std::string> current_branch(const std::filesystem::path& path) const;

    // Absent when `path` is not inside a repository, or for History.
    [[nodiscard]] std::optional<GitPathSet> paths(const std::filesystem::path& path, GitRelationship relationship) const;

    [[nodiscard]] static std::vector<std::string> parse_nul_separated(std::string_view data);

private:
    struct CommandResult {
        int status{-1};
        std::string output;
    };

    [[nodiscard]] static CommandResult run_git(const std::filesystem::path& directory, std::string_view arguments);
};

} // namespace structree
