#include "structree/git_status.hpp"

#include "structree/logger.hpp"
#include "structree/perf.hpp"
#include "structree/string_utils.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <system_error>

namespace structree {
namespace {

#ifndef _WIN32
using popen_handle = std::unique_ptr<FILE, decltype(&pclose)>;

popen_handle make_pipe(const std::string& command) {
    return popen_handle(::popen(command.c_str(), "r"), pclose);
}

constexpr std::string_view kDiscardStderr = " 2>/dev/null";
#else
using popen_handle = std::unique_ptr<FILE, decltype(&_pclose)>;

popen_handle make_pipe(const std::string& command) {
    return popen_handle(::_popen(command.c_str(), "r"), _pclose);
}

constexpr std::string_view kDiscardStderr = " 2>NUL";
#endif

std::string shell_quote(const std::filesystem::path& path) {
#ifndef _WIN32
    std::string result = "'";
    auto native = path.string();
    for (char ch : native) {
        if (ch == '\'') {
            result += "'\\''";
        } else {
            result += ch;
        }
    }
    result += "'";
    return result;
#else
    std::string result = "\"";
    auto native = path.string();
    for (char ch : native) {
        if (ch == '"') {
            result += "\\\"";
        } else {
            result += ch;
        }
    }
    result += "\"";
    return result;
#endif
}

std::string_view query_arguments(GitRelationship relationship) noexcept {
    switch (relationship) {
    case GitRelationship::Tracked:
        return "ls-files -z";
    case GitRelationship::Untracked:
        return "ls-files --others --exclude-standard -z";
    case GitRelationship::Staged:
        return "diff --cached --name-only -z";
    case GitRelationship::Changed:
        return "diff --name-only -z";
    case GitRelationship::None:
    case GitRelationship::History:
        break;
    }
    return {};
}

} // namespace

std::string_view to_string(GitRelationship relationship) noexcept {
    switch (relationship) {
    case GitRelationship::None:
        return "none";
    case GitRelationship::Tracked:
        return "tracked";
    case GitRelationship::Untracked:
        return "untracked";
    case GitRelationship::Staged:
        return "staged";
    case GitRelationship::Changed:
        return "changed";
    case GitRelationship::History:
        return "history";
    }
    return "none";
}

GitPathSet::GitPathSet(const std::vector<std::filesystem::path>& paths) {
    for (const auto& path : paths) {
        const auto normal = path.lexically_normal();
        files_.insert(normal.string());
        auto parent = normal.parent_path();
        while (!parent.empty()) {
            if (!ancestors_.insert(parent.string()).second) {
                break;
            }
            auto next = parent.parent_path();
            if (next == parent) {
                break;
            }
            parent = std::move(next);
        }
    }
}

bool GitPathSet::contains(const std::filesystem::path& path) const {
    return files_.contains(path.lexically_normal().string());
}

bool GitPathSet::has_descendant(const std::filesystem::path& directory) const {
    return ancestors_.contains(directory.lexically_normal().string());
}

std::filesystem::path canonical_entry_path(const std::filesystem::path& path) {
    std::error_code ec;
    auto parent = std::filesystem::weakly_canonical(path.parent_path(), ec);
    if (ec) {
        return std::filesystem::absolute(path, ec).lexically_normal();
    }
    return parent / path.filename();
}

GitStatusOracle::GitStatusOracle() = default;

GitStatusOracle::CommandResult GitStatusOracle::run_git(const std::filesystem::path& directory, std::string_view arguments) {
    std::string command = "git -C " + shell_quote(directory) + " " + std::string{arguments} + std::string{kDiscardStderr};
    CommandResult result;
    auto pipe = make_pipe(command);
    if (!pipe) {
        Logger::instance().debug("failed to spawn: {}", command);
        return result;
    }

    std::array<char, 4096> buffer{};
    while (true) {
        std::size_t bytes = std::fread(buffer.data(), 1, buffer.size(), pipe.get());
        if (bytes == 0) {
            break;
        }
        result.output.append(buffer.data(), bytes);
    }
    // The deleter discards the exit status, so close by hand on success.
    FILE* raw = pipe.release();
#ifndef _WIN32
    result.status = ::pclose(raw);
#else
    result.status = ::_pclose(raw);
#endif
    if (result.status != 0) {
        Logger::instance().debug("'{}' exited with status {}", command, result.status);
    }
    return result;
}

std::vector<std::string> GitStatusOracle::parse_nul_separated(std::string_view data) {
    std::vector<std::string> paths;
    std::size_t pos = 0;
    while (pos < data.size()) {
        std::size_t end = data.find('\0', pos);
        if (end == std::string_view::npos) {
            end = data.size();
        }
        std::string_view entry = data.substr(pos, end - pos);
        if (!entry.empty()) {
            auto rename_pos = entry.find(" -> ");
            if (rename_pos != std::string_view::npos) {
                entry = entry.substr(rename_pos + 4);
            }
            paths.emplace_back(entry);
        }
        pos = end + 1;
    }
    return paths;
}

std::optional<std::filesystem::path> GitStatusOracle::repository_root(const std::filesystem::path& path) const {
    auto result = run_git(path, "rev-parse --show-toplevel");
    if (result.status != 0) {
        return std::nullopt;
    }
    auto top = string_utils::trim(result.output);
    if (top.empty()) {
        return std::nullopt;
    }
    return std::filesystem::path(std::string{top}).lexically_normal();
}

std::optional<std::string> GitStatusOracle::current_branch(const std::filesystem::path& path) const {
    auto result = run_git(path, "rev-parse --abbrev-ref HEAD");
    if (result.status != 0) {
        return std::nullopt;
    }
    auto branch = string_utils::trim(result.output);
    if (branch.empty()) {
        return std::nullopt;
    }
    return std::string{branch};
}

std::optional<GitPathSet> GitStatusOracle::paths(const std::filesystem::path& path, GitRelationship relationship) const {
    const auto arguments = query_arguments(relationship);
    if (arguments.empty()) {
        return std::nullopt;
    }
    auto top = repository_root(path);
    if (!top) {
        return std::nullopt;
    }

    ScopedTimer timer{std::string{"git "} + std::string{to_string(relationship)}, *top};
    auto result = run_git(*top, arguments);
    if (result.status != 0) {
        Logger::instance().warn("git {} query failed in {}", to_string(relationship), top->string());
    }

    std::vector<std::filesystem::path> absolute;
    for (const auto& relative : parse_nul_separated(result.output)) {
        absolute.push_back(*top / std::filesystem::path(relative));
    }
    timer.set_items(absolute.size());
    Logger::instance().info("git {} snapshot: {} path(s)", to_string(relationship), absolute.size());
    return GitPathSet{absolute};
}

} // namespace structree
