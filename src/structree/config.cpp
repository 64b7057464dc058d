#include "structree/config.hpp"

#include <utility>

namespace structree {

Config& Config::instance() {
    static Config config;
    return config;
}

void Config::set_options(RunOptions options) {
    options_ = std::move(options);
}

const RunOptions& Config::options() const noexcept {
    return options_;
}

bool uses_stored_patterns(const RunOptions& options) {
    if (!options.no_ignore) {
        return true;
    }
    return *options.no_ignore != "all" && *options.no_ignore != "config";
}

std::vector<std::string> merged_ignore_globs(const RunOptions& options, const std::vector<std::string>& stored) {
    std::vector<std::string> globs;
    if (uses_stored_patterns(options)) {
        globs = stored;
    }
    globs.insert(globs.end(), options.ignore_patterns.begin(), options.ignore_patterns.end());
    return globs;
}

WalkConfig build_walk_config(const RunOptions& options,
                             const std::vector<std::string>& stored,
                             std::optional<GitPathSet> git_paths) {
    constexpr std::uintmax_t kMegabyte = 1024u * 1024u;

    WalkConfig config;
    config.max_depth = options.depth;
    config.custom_ignore_patterns = compile_ignore_patterns(merged_ignore_globs(options, stored));
    if (options.skip_large_mb) {
        config.max_subtree_bytes = *options.skip_large_mb * kMegabyte;
    }
    config.git_paths = std::move(git_paths);
    config.git_relationship = options.git_relationship;
    config.show_sizes = options.show_sizes;
    if (options.no_ignore) {
        config.ignore_only_pattern = *options.no_ignore;
        config.ignore_defaults_disabled = *options.no_ignore == "all" || *options.no_ignore == "defaults";
    }

    Logger::instance().info("walk config: depth={} patterns={} skip_large={} git={} no_ignore={}",
        config.max_depth ? std::to_string(*config.max_depth) : std::string{"unbounded"},
        config.custom_ignore_patterns.size(),
        config.max_subtree_bytes ? std::to_string(*config.max_subtree_bytes) : std::string{"off"},
        to_string(config.git_relationship),
        config.ignore_only_pattern.value_or("-"));
    return config;
}

} // namespace structree
