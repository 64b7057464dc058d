#pragma once

#include "structree/entry.hpp"
#include "structree/fs_scanner.hpp"
#include "structree/pattern.hpp"
#include "structree/size_accountant.hpp"
#include "structree/theme.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace structree {

struct DirectoryBreakdown {
    SubtreeStats total{};
    SubtreeStats visible{};
    // Top ten visible extensions, most frequent first.
    std::vector<std::pair<std::string, std::uintmax_t>> extensions{};
    // Ignored immediate subdirectories with their unfiltered file counts.
    std::vector<std::pair<std::string, std::uintmax_t>> ignored_subdirectories{};

    [[nodiscard]] bool has_ignored() const noexcept {
        return visible.directories < total.directories || visible.files < total.files || visible.bytes < total.bytes;
    }
};

// The depth-0 view: one aggregate block per top-level child.
class SummaryReport {
public:
    SummaryReport(const FileSystemScanner& scanner, const Theme& theme, std::ostream& output, std::ostream& errors);

    // Returns the process exit code.
    int render(const std::filesystem::path& root, const std::vector<GlobPattern>& patterns,
        const std::optional<std::string>& branch) const;

    [[nodiscard]] DirectoryBreakdown analyze(const std::filesystem::path& directory,
        const std::vector<GlobPattern>& patterns) const;

    static constexpr std::size_t kTopExtensions = 10;

private:
    void render_directory(const DirEntry& entry, const DirectoryBreakdown& breakdown) const;
    void render_file(const DirEntry& entry) const;
    void accumulate_visible(const std::filesystem::path& directory, const std::vector<GlobPattern>& patterns,
        SubtreeStats& stats, std::vector<std::pair<std::string, std::uintmax_t>>& extensions) const;
    [[nodiscard]] std::string label(std::string_view text) const;

    const FileSystemScanner& scanner_;
    const Theme& theme_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace structree
