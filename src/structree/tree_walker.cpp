#include "structree/tree_walker.hpp"

#include "structree/logger.hpp"
#include "structree/perf.hpp"
#include "structree/rules.hpp"
#include "structree/size_accountant.hpp"

#include <system_error>
#include <utility>

namespace structree {

TreeWalker::TreeWalker(const WalkConfig& config, const FileSystemScanner& scanner, const Renderer& renderer)
    : config_{config}
    , scanner_{scanner}
    , renderer_{renderer} {}

void TreeWalker::walk(const std::filesystem::path& root) const {
    ScopedTimer timer{"tree walk", root};
    renderer_.render_root(root);
    walk_directory(root, 0, "");
}

RenderDecision TreeWalker::decide(const DirEntry& entry) const {
    const auto verdict = classify(entry, config_);
    switch (verdict.classification) {
    case Classification::Visible:
        return ShowEntry{};
    case Classification::IgnoredDefault:
    case Classification::IgnoredPattern:
        if (entry.is_directory) {
            const auto stats = measure_subtree(entry.path);
            return PrunedIgnored{stats.files, stats.bytes};
        }
        return SkipEntry{};
    case Classification::IgnoredSize:
        return PrunedOversized{verdict.subtree_bytes.value_or(0)};
    case Classification::IgnoredGit:
        return SkipEntry{};
    }
    return SkipEntry{};
}

std::vector<TreeWalker::Decided> TreeWalker::decide_all(std::vector<DirEntry> entries) const {
    std::vector<Decided> decided;
    decided.reserve(entries.size());
    for (auto& entry : entries) {
        auto decision = decide(entry);
        if (std::holds_alternative<SkipEntry>(decision)) {
            continue;
        }
        decided.push_back(Decided{std::move(entry), std::move(decision)});
    }
    return decided;
}

void TreeWalker::walk_directory(const std::filesystem::path& directory, std::size_t depth,
    const std::string& prefix) const {
    if (config_.max_depth && depth >= *config_.max_depth) {
        return;
    }

    std::error_code ec;
    auto entries = scanner_.scan(directory, ec);
    if (ec) {
        // An unreadable directory renders as empty.
        Logger::instance().debug("cannot list {}: {}", directory.string(), ec.message());
        return;
    }
    sort_entries(entries);

    // "Last" is decided among the lines actually printed.
    const auto visible = decide_all(std::move(entries));
    for (std::size_t i = 0; i < visible.size(); ++i) {
        const auto& [entry, decision] = visible[i];
        const bool is_last = i + 1 == visible.size();
        renderer_.render(entry, decision, prefix, is_last, config_.show_sizes);

        if (std::holds_alternative<ShowEntry>(decision) && entry.is_directory) {
            walk_directory(entry.path, depth + 1, Renderer::child_prefix(prefix, is_last));
        }
    }
}

} // namespace structree
