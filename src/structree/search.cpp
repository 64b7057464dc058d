#include "structree/search.hpp"

#include "structree/formatter.hpp"
#include "structree/logger.hpp"
#include "structree/perf.hpp"
#include "structree/renderer.hpp"
#include "structree/rules.hpp"

#include <algorithm>
#include <format>
#include <regex>
#include <system_error>

namespace structree {

Searcher::Searcher(const FileSystemScanner& scanner, const Theme& theme, std::ostream& output, std::ostream& errors)
    : scanner_{scanner}
    , theme_{theme}
    , out_{output}
    , err_{errors} {}

int Searcher::run(const SearchOptions& options, const std::vector<GlobPattern>& ignore_patterns) const {
    std::optional<GlobPattern> pattern;
    try {
        pattern = GlobPattern::compile_or_throw(options.pattern, GlobSyntax::Search);
    } catch (const std::regex_error& e) {
        err_ << "invalid pattern: " << e.what() << '\n';
        return 1;
    }

    const auto root = absolute_root(options.root);
    auto matches = collect(*pattern, root, options.max_depth, ignore_patterns);

    if (matches.empty()) {
        out_ << theme_.paint(Theme::Style::Warning,
                    std::format("no files or directories matching '{}' found", options.pattern))
             << '\n';
        return 0;
    }

    out_ << theme_.paint(Theme::Style::Success, std::format("found {} item(s) matching", matches.size())) << ' '
         << theme_.paint(Theme::Style::Accent, options.pattern) << "\n\n";

    if (options.flat) {
        render_flat(std::move(matches));
    } else {
        render_tree(root, build_keep_set(matches, root));
    }
    return 0;
}

std::vector<SearchMatch> Searcher::collect(const GlobPattern& pattern, const std::filesystem::path& root,
    std::optional<std::size_t> max_depth, const std::vector<GlobPattern>& ignore_patterns) const {
    ScopedTimer timer{"search", root};
    std::vector<SearchMatch> matches;
    collect_directory(pattern, root, 1, max_depth, ignore_patterns, matches);
    timer.set_items(matches.size());
    return matches;
}

void Searcher::collect_directory(const GlobPattern& pattern, const std::filesystem::path& directory,
    std::size_t depth, std::optional<std::size_t> max_depth, const std::vector<GlobPattern>& ignore_patterns,
    std::vector<SearchMatch>& matches) const {
    if (max_depth && depth > *max_depth) {
        return;
    }

    std::error_code ec;
    auto entries = scanner_.scan(directory, ec);
    if (ec) {
        Logger::instance().debug("search cannot list {}: {}", directory.string(), ec.message());
        return;
    }
    sort_entries(entries);

    for (const auto& entry : entries) {
        if (pattern.matches(entry.name)) {
            matches.push_back(SearchMatch{entry.path, entry.is_regular ? entry.size : 0, entry.is_directory});
        }
        if (entry.is_directory && !is_ignored_directory_name(entry.name, ignore_patterns)) {
            collect_directory(pattern, entry.path, depth + 1, max_depth, ignore_patterns, matches);
        }
    }
}

KeepSet Searcher::build_keep_set(const std::vector<SearchMatch>& matches, const std::filesystem::path& root) {
    KeepSet keep;
    for (const auto& match : matches) {
        keep.insert(match.path);
        auto parent = match.path.parent_path();
        while (!parent.empty() && parent != root) {
            if (!keep.insert(parent).second) {
                break;
            }
            auto next = parent.parent_path();
            if (next == parent) {
                break;
            }
            parent = std::move(next);
        }
    }
    return keep;
}

void Searcher::render_flat(std::vector<SearchMatch> matches) const {
    std::sort(matches.begin(), matches.end(), [](const SearchMatch& a, const SearchMatch& b) {
        return a.path < b.path;
    });
    for (const auto& match : matches) {
        out_ << theme_.paint(Theme::Style::Accent, match.path.string())
             << theme_.paint(Theme::Style::Muted, std::format(" ({})", formatter::human_size(match.size))) << '\n';
    }
}

void Searcher::render_tree(const std::filesystem::path& root, const KeepSet& keep) const {
    out_ << theme_.paint(Theme::Style::Accent, root.string()) << '\n';
    render_tree_level(root, keep, "");
}

void Searcher::render_tree_level(const std::filesystem::path& directory, const KeepSet& keep,
    const std::string& prefix) const {
    std::error_code ec;
    auto entries = scanner_.scan(directory, ec);
    if (ec) {
        Logger::instance().debug("search tree cannot list {}: {}", directory.string(), ec.message());
        return;
    }
    entries.erase(std::remove_if(entries.begin(), entries.end(), [&](const DirEntry& entry) {
                      return !keep.contains(entry.path);
                  }),
        entries.end());
    sort_entries(entries);

    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        const bool is_last = i + 1 == entries.size();
        const auto lead = prefix + std::string{Renderer::connector(is_last)};

        if (entry.is_directory) {
            out_ << lead << theme_.paint(Theme::Style::Directory, entry.name + "/") << '\n';
            render_tree_level(entry.path, keep, Renderer::child_prefix(prefix, is_last));
            continue;
        }

        const auto style = entry.is_executable ? Theme::Style::Executable : Theme::Style::Match;
        out_ << lead << theme_.paint(style, entry.name)
             << theme_.paint(Theme::Style::Muted, std::format(" ({})", formatter::human_size(entry.size))) << '\n';
    }
}

} // namespace structree
