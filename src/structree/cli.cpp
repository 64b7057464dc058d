#include "structree/cli.hpp"

#include "structree/string_utils.hpp"

#include <CLI/CLI.hpp>

#include <string_view>

#ifndef STRUCTREE_VERSION_STRING
#define STRUCTREE_VERSION_STRING "0.0.0"
#endif

namespace structree {

namespace {
constexpr std::string_view program_description =
    "A smarter tree command with intelligent defaults.\n"
    "DEPTH limits how many directory levels are expanded; 0 prints a summary.\n";
}

Cli::Cli() = default;

std::map<std::string, LogLevel> Cli::log_level_map() {
    return {
        { "error", LogLevel::Error },
        { "warn", LogLevel::Warn },
        { "warning", LogLevel::Warn },
        { "info", LogLevel::Info },
        { "debug", LogLevel::Debug },
        { "trace", LogLevel::Trace },
    };
}

GitRelationship Cli::resolve_git_relationship(const GitFlags& flags) noexcept {
    if (flags.changed) {
        return GitRelationship::Changed;
    }
    if (flags.staged) {
        return GitRelationship::Staged;
    }
    if (flags.untracked) {
        return GitRelationship::Untracked;
    }
    if (flags.tracked) {
        return GitRelationship::Tracked;
    }
    if (flags.history) {
        return GitRelationship::History;
    }
    return GitRelationship::None;
}

std::optional<int> Cli::parse(int argc, const char* const* argv, Config& config) const {
    RunOptions options;
    GitFlags git;
    std::size_t depth = 0;
    std::string root = ".";
    std::string ignore_list;
    std::uintmax_t skip_large_mb = 0;
    std::string no_ignore;

    CLI::App program{ std::string{ program_description }, "structree" };
    program.set_version_flag("-V,--version", STRUCTREE_VERSION_STRING);
    // Subcommands created below inherit this, so top-level options may follow them.
    program.fallthrough();

    auto* depth_option = program.add_option("depth", depth, "maximum depth to display (like tree -L)")
        ->type_name("DEPTH");
    program.add_option("-p,--path", root, "starting directory")
        ->type_name("PATH")
        ->default_str(".");

    auto filtering = program.add_option_group("Filtering options");
    auto* ignore_option = filtering->add_option("-i,--ignore", ignore_list,
        R"(custom ignore patterns, comma-separated
(e.g. "*.log,temp*"))");
    ignore_option->type_name("PATTERNS");
    auto* skip_option = filtering->add_option("-s,--skip-large", skip_large_mb, "skip folders larger than MB megabytes");
    skip_option->type_name("MB");
    auto* no_ignore_option = filtering->add_option("-n,--no-ignore", no_ignore,
        R"(stop ignoring: all, defaults, config, or one
default directory name)");
    no_ignore_option->type_name("WHAT");
    no_ignore_option->check([](const std::string& value) {
        return string_utils::trim(value).empty() ? std::string{"WHAT must not be empty"} : std::string{};
    });

    auto git_group = program.add_option_group("Git options");
    git_group->add_flag("-g,--git", git.tracked, "show git-tracked files only");
    git_group->add_flag("--gu", git.untracked, "show untracked files only");
    git_group->add_flag("--gs", git.staged, "show staged files only");
    git_group->add_flag("--gc", git.changed, "show changed (unstaged) files only");
    git_group->add_flag("--gh", git.history, "show last-commit history mode");
    git_group->add_flag_callback("--gr", [&]() { git.tracked = true; git.root = true; },
        "like --git, starting at the repository root");
    git_group->add_flag_callback("--gur", [&]() { git.untracked = true; git.root = true; },
        "like --gu, starting at the repository root");
    git_group->add_flag_callback("--gsr", [&]() { git.staged = true; git.root = true; },
        "like --gs, starting at the repository root");
    git_group->add_flag_callback("--gcr", [&]() { git.changed = true; git.root = true; },
        "like --gc, starting at the repository root");
    git_group->add_flag_callback("--ghr", [&]() { git.history = true; git.root = true; },
        "like --gh, starting at the repository root");

    auto appearance = program.add_option_group("Appearance options");
    appearance->add_flag_callback("-z,--size", [&]() { options.show_sizes = true; },
        "show file sizes");
    appearance->add_flag_callback("--no-color", [&]() { options.enable_color = false; },
        "disable ANSI colors");
    auto* log_option = appearance->add_option("-v,--log-level", options.log_level,
        "log verbosity: error, warn, info, debug, trace");
    log_option->type_name("LEVEL");
    log_option->transform(CLI::CheckedTransformer(log_level_map(), CLI::ignore_case).description(""));
    log_option->default_str("error");

    auto* search = program.add_subcommand("search", "find files and directories whose name matches PATTERN");
    search->add_option("pattern", options.search.pattern, "glob pattern (* and ? wildcards)")
        ->type_name("PATTERN")
        ->required();
    search->add_option("path", options.search.root, "directory to search")
        ->type_name("PATH");
    auto* search_depth = search->add_option_function<std::size_t>("-d,--depth",
        [&](const std::size_t& value) { options.search.max_depth = value; },
        "maximum search depth");
    search_depth->type_name("N");
    search->add_flag("-f,--flat", options.search.flat, "print full paths instead of a tree");

    std::string add_list;
    auto* add = program.add_subcommand("add", "save ignore patterns for every run");
    add->add_option("patterns", add_list, "comma-separated glob patterns")
        ->type_name("PATTERNS")
        ->required();

    std::string remove_pattern;
    auto* remove = program.add_subcommand("remove", "delete a saved ignore pattern");
    remove->add_option("pattern", remove_pattern, "saved glob pattern")
        ->type_name("PATTERN")
        ->required();

    auto* list = program.add_subcommand("list", "show saved ignore patterns");
    auto* clear = program.add_subcommand("clear", "delete all saved ignore patterns");

    program.require_subcommand(0, 1);

    try {
        program.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return program.exit(e);
    }

    if (*search) {
        options.command = Command::Search;
    } else if (*add) {
        options.command = Command::AddPatterns;
        options.store_patterns = string_utils::split_list(add_list);
    } else if (*remove) {
        options.command = Command::RemovePattern;
        options.store_patterns = { std::string{ string_utils::trim(remove_pattern) } };
    } else if (*list) {
        options.command = Command::ListPatterns;
    } else if (*clear) {
        options.command = Command::ClearPatterns;
    }

    if (depth_option->count() > 0) {
        options.depth = depth;
    }
    options.root = root;
    options.ignore_patterns = string_utils::split_list(ignore_list);
    if (skip_option->count() > 0) {
        options.skip_large_mb = skip_large_mb;
    }
    if (no_ignore_option->count() > 0) {
        options.no_ignore = std::string{ string_utils::trim(no_ignore) };
    }
    options.git_relationship = resolve_git_relationship(git);
    options.git_root = git.root;

    config.set_options(std::move(options));
    return std::nullopt;
}

} // namespace structree
