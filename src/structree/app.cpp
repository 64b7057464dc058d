#include "structree/app.hpp"

#include "structree/fs_scanner.hpp"
#include "structree/git_status.hpp"
#include "structree/logger.hpp"
#include "structree/pattern.hpp"
#include "structree/pattern_store.hpp"
#include "structree/platform.hpp"
#include "structree/renderer.hpp"
#include "structree/search.hpp"
#include "structree/summary.hpp"
#include "structree/theme.hpp"
#include "structree/tree_walker.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <optional>

namespace structree {

namespace {

std::optional<PatternStore> default_store() {
    auto location = PatternStore::default_location();
    if (!location) {
        return std::nullopt;
    }
    return PatternStore{*location};
}

std::vector<std::string> load_stored_patterns(const RunOptions& options) {
    if (!uses_stored_patterns(options)) {
        Logger::instance().debug("stored ignore patterns bypassed by --no-ignore");
        return {};
    }
    auto store = default_store();
    if (!store) {
        Logger::instance().debug("no configuration directory; stored ignore patterns unavailable");
        return {};
    }
    return store->load();
}

} // namespace

App::App() = default;

int App::run(int argc, char** argv) {
    platform::enable_virtual_terminal_processing();

    Config& config = Config::instance();
    if (auto exit_code = cli_.parse(argc, argv, config)) {
        return *exit_code;
    }

    const RunOptions& options = config.options();
    Logger::instance().set_level(options.log_level);

    const Theme theme{options.enable_color && platform::stdout_is_tty() && !platform::color_disabled_by_environment()};

    try {
        switch (options.command) {
        case Command::Tree:
            return run_tree(options, theme, load_stored_patterns(options));
        case Command::Search:
            return run_search(options, theme, load_stored_patterns(options));
        case Command::AddPatterns:
        case Command::RemovePattern:
        case Command::ListPatterns:
        case Command::ClearPatterns:
            return run_pattern_command(options);
        }
    } catch (const PatternStoreError& e) {
        std::cerr << "structree: " << e.what() << '\n';
        return 1;
    }
    return 0;
}

int App::run_tree(const RunOptions& options, const Theme& theme, const std::vector<std::string>& stored) {
    FileSystemScanner scanner;
    GitStatusOracle oracle;

    // Any git flag requires a repository, whichever view is rendered.
    std::filesystem::path root = options.root;
    if (options.git_relationship != GitRelationship::None) {
        auto top = oracle.repository_root(root);
        if (!top) {
            std::cerr << "structree: not a git repository: " << root.string() << '\n';
            return 1;
        }
        if (options.git_root) {
            root = *top;
        }
    }

    if (options.depth && *options.depth == 0) {
        SummaryReport report{scanner, theme, std::cout, std::cerr};
        const auto patterns = compile_ignore_patterns(merged_ignore_globs(options, stored));
        return report.render(root, patterns, oracle.current_branch(root));
    }

    std::optional<GitPathSet> git_paths;
    if (options.git_relationship != GitRelationship::None) {
        git_paths = oracle.paths(root, options.git_relationship);
    }

    const WalkConfig walk_config = build_walk_config(options, stored, std::move(git_paths));
    Renderer renderer{theme, std::cout};
    TreeWalker walker{walk_config, scanner, renderer};
    walker.walk(root);
    return 0;
}

int App::run_search(const RunOptions& options, const Theme& theme, const std::vector<std::string>& stored) {
    FileSystemScanner scanner;
    Searcher searcher{scanner, theme, std::cout, std::cerr};
    return searcher.run(options.search, compile_ignore_patterns(merged_ignore_globs(options, stored)));
}

int App::run_pattern_command(const RunOptions& options) {
    auto store = default_store();
    if (!store) {
        throw PatternStoreError("cannot determine the configuration directory");
    }

    switch (options.command) {
    case Command::AddPatterns:
        for (const auto& pattern : options.store_patterns) {
            std::cout << (store->add(pattern) ? "added: " : "already present: ") << pattern << '\n';
        }
        break;
    case Command::RemovePattern:
        for (const auto& pattern : options.store_patterns) {
            std::cout << (store->remove(pattern) ? "removed: " : "not found: ") << pattern << '\n';
        }
        break;
    case Command::ListPatterns: {
        const auto patterns = store->load();
        if (patterns.empty()) {
            std::cout << "no stored ignore patterns\n";
            break;
        }
        std::cout << std::format("stored ignore patterns ({}):\n", patterns.size());
        for (const auto& pattern : patterns) {
            std::cout << "  " << pattern << '\n';
        }
        break;
    }
    case Command::ClearPatterns:
        std::cout << std::format("cleared {} pattern(s)\n", store->clear());
        break;
    case Command::Tree:
    case Command::Search:
        break;
    }
    return 0;
}

} // namespace structree
