#pragma once

#include "structree/config.hpp"
#include "structree/entry.hpp"
#include "structree/fs_scanner.hpp"
#include "structree/renderer.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace structree {

class TreeWalker {
public:
    TreeWalker(const WalkConfig& config, const FileSystemScanner& scanner, const Renderer& renderer);

    // Prints the root line, then the filtered tree below it.
    void walk(const std::filesystem::path& root) const;

    [[nodiscard]] RenderDecision decide(const DirEntry& entry) const;

private:
    struct Decided {
        DirEntry entry;
        RenderDecision decision;
    };

    void walk_directory(const std::filesystem::path& directory, std::size_t depth, const std::string& prefix) const;
    [[nodiscard]] std::vector<Decided> decide_all(std::vector<DirEntry> entries) const;

    const WalkConfig& config_;
    const FileSystemScanner& scanner_;
    const Renderer& renderer_;
};

} // namespace structree
