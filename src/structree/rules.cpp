#include "structree/rules.hpp"

#include "structree/git_status.hpp"
#include "structree/size_accountant.hpp"

#include <algorithm>
#include <array>

namespace structree {

namespace {

constexpr std::array<std::string_view, 27> kIgnoredDirectories{
    "__pycache__", ".pytest_cache", ".mypy_cache", ".ruff_cache",
    ".tox", "dist", "build", ".coverage",
    "venv", ".venv", "env", ".env", "virtualenv",
    "node_modules", ".npm", ".yarn",
    ".git", ".svn", ".hg",
    ".vscode", ".idea",
    "target", "bin", "obj", ".next", ".nuxt",
    ".DS_Store",
};

constexpr std::array<std::string_view, 5> kIgnoredExtensions{
    "pyc", "pyo", "pyd", "swp", "swo",
};

constexpr std::string_view kEggInfoSuffix = ".egg-info";

bool default_directory_rule_fires(std::string_view name, const WalkConfig& config) {
    if (config.ignore_defaults_disabled) {
        return false;
    }
    if (config.ignore_only_pattern && name == *config.ignore_only_pattern) {
        return false;
    }
    return is_default_ignored_directory(name);
}

Verdict classify_git(const DirEntry& entry, const GitPathSet& paths) {
    const auto canonical = canonical_entry_path(entry.path);
    const bool visible = entry.is_directory ? paths.has_descendant(canonical) : paths.contains(canonical);
    return Verdict{visible ? Classification::Visible : Classification::IgnoredGit, std::nullopt};
}

} // namespace

bool is_default_ignored_directory(std::string_view name) {
    if (std::find(kIgnoredDirectories.begin(), kIgnoredDirectories.end(), name) != kIgnoredDirectories.end()) {
        return true;
    }
    return name.ends_with(kEggInfoSuffix);
}

bool is_default_ignored_file(std::string_view name) {
    if (name == "package-lock.json" || name == ".DS_Store") {
        return true;
    }
    // Text after the last dot; a name without a dot is its own extension.
    const auto dot = name.rfind('.');
    const auto extension = dot == std::string_view::npos ? name : name.substr(dot + 1);
    return std::find(kIgnoredExtensions.begin(), kIgnoredExtensions.end(), extension) != kIgnoredExtensions.end();
}

bool is_ignored_directory_name(std::string_view name, const std::vector<GlobPattern>& patterns) {
    return is_default_ignored_directory(name) || matches_any(name, patterns);
}

Verdict classify(const DirEntry& entry, const WalkConfig& config) {
    if (config.git_paths) {
        return classify_git(entry, *config.git_paths);
    }

    if (entry.is_directory && default_directory_rule_fires(entry.name, config)) {
        return Verdict{Classification::IgnoredDefault, std::nullopt};
    }

    if (!config.ignore_only_pattern && matches_any(entry.name, config.custom_ignore_patterns)) {
        return Verdict{Classification::IgnoredPattern, std::nullopt};
    }

    if (!entry.is_directory && is_default_ignored_file(entry.name)) {
        return Verdict{Classification::IgnoredDefault, std::nullopt};
    }

    if (entry.is_directory && config.max_subtree_bytes) {
        const auto bytes = subtree_bytes(entry.path);
        if (bytes > *config.max_subtree_bytes) {
            return Verdict{Classification::IgnoredSize, bytes};
        }
        return Verdict{Classification::Visible, bytes};
    }

    return Verdict{Classification::Visible, std::nullopt};
}

} // namespace structree
