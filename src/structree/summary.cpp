#include "structree/summary.hpp"

#include "structree/formatter.hpp"
#include "structree/logger.hpp"
#include "structree/rules.hpp"
#include "structree/string_utils.hpp"

#include <algorithm>
#include <format>
#include <system_error>

namespace structree {

namespace {

std::string canonical_display(const std::filesystem::path& path) {
    std::error_code ec;
    auto canonical = std::filesystem::canonical(path, ec);
    return ec ? path.string() : canonical.string();
}

void count_extension(std::vector<std::pair<std::string, std::uintmax_t>>& extensions, std::string extension) {
    auto it = std::find_if(extensions.begin(), extensions.end(), [&](const auto& item) {
        return item.first == extension;
    });
    if (it == extensions.end()) {
        extensions.emplace_back(std::move(extension), 1);
    } else {
        ++it->second;
    }
}

} // namespace

SummaryReport::SummaryReport(const FileSystemScanner& scanner, const Theme& theme, std::ostream& output,
    std::ostream& errors)
    : scanner_{scanner}
    , theme_{theme}
    , out_{output}
    , err_{errors} {}

int SummaryReport::render(const std::filesystem::path& root, const std::vector<GlobPattern>& patterns,
    const std::optional<std::string>& branch) const {
    std::string header = canonical_display(root);
    if (branch) {
        header += " " + theme_.paint(Theme::Style::Muted, std::format("({})", *branch));
    }
    out_ << theme_.paint(Theme::Style::Match, header) << "\n\n";

    std::error_code ec;
    auto entries = scanner_.scan(root, ec);
    if (ec) {
        err_ << "failed to read directory: " << ec.message() << '\n';
        return 0;
    }
    sort_entries(entries);

    std::uintmax_t ignored_files = 0;
    std::uintmax_t ignored_bytes = 0;
    std::vector<std::string> ignored_names;

    for (const auto& entry : entries) {
        const bool ignored = entry.is_directory
            ? is_ignored_directory_name(entry.name, patterns)
            : is_default_ignored_file(entry.name) || matches_any(entry.name, patterns);

        if (ignored) {
            if (entry.is_directory) {
                const auto stats = measure_subtree(entry.path);
                ignored_files += stats.files;
                ignored_bytes += stats.bytes;
                ignored_names.push_back(std::format("{}({} files)", entry.name, stats.files));
            } else {
                ignored_files += 1;
                ignored_bytes += entry.size;
                ignored_names.push_back(entry.name);
            }
            continue;
        }

        if (entry.is_directory) {
            render_directory(entry, analyze(entry.path, patterns));
        } else {
            render_file(entry);
        }
    }

    if (ignored_files > 0) {
        out_ << theme_.paint(Theme::Style::Muted, "── ignored (top level) ──") << '\n';
        out_ << "  " << theme_.paint(Theme::Style::Muted, string_utils::join(ignored_names, ", ")) << " · "
             << theme_.paint(Theme::Style::Muted, std::format("{} files", ignored_files)) << " · "
             << theme_.paint(Theme::Style::Muted, formatter::human_size(ignored_bytes)) << '\n';
    }
    return 0;
}

DirectoryBreakdown SummaryReport::analyze(const std::filesystem::path& directory,
    const std::vector<GlobPattern>& patterns) const {
    DirectoryBreakdown breakdown;
    breakdown.total = measure_subtree(directory);

    std::vector<std::pair<std::string, std::uintmax_t>> extensions;
    accumulate_visible(directory, patterns, breakdown.visible, extensions);
    std::stable_sort(extensions.begin(), extensions.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) {
            return a.second > b.second;
        }
        return a.first < b.first;
    });
    if (extensions.size() > kTopExtensions) {
        extensions.resize(kTopExtensions);
    }
    breakdown.extensions = std::move(extensions);

    std::error_code ec;
    auto children = scanner_.scan(directory, ec);
    sort_entries(children);
    for (const auto& child : children) {
        if (child.is_directory && is_ignored_directory_name(child.name, patterns)) {
            breakdown.ignored_subdirectories.emplace_back(child.name, count_files(child.path));
        }
    }
    return breakdown;
}

void SummaryReport::accumulate_visible(const std::filesystem::path& directory,
    const std::vector<GlobPattern>& patterns, SubtreeStats& stats,
    std::vector<std::pair<std::string, std::uintmax_t>>& extensions) const {
    std::error_code ec;
    auto entries = scanner_.scan(directory, ec);
    if (ec) {
        Logger::instance().debug("summary cannot list {}: {}", directory.string(), ec.message());
    }

    for (const auto& entry : entries) {
        if (entry.is_directory) {
            if (is_ignored_directory_name(entry.name, patterns)) {
                continue;
            }
            ++stats.directories;
            accumulate_visible(entry.path, patterns, stats, extensions);
        } else if (entry.is_regular) {
            if (is_default_ignored_file(entry.name) || matches_any(entry.name, patterns)) {
                continue;
            }
            ++stats.files;
            stats.bytes += entry.size;
            auto extension = entry.path.extension().string();
            if (!extension.empty()) {
                count_extension(extensions, string_utils::to_lower(extension.substr(1)));
            }
        }
    }
}

std::string SummaryReport::label(std::string_view text) const {
    return theme_.paint(Theme::Style::Muted, std::format("{:<9}", text));
}

void SummaryReport::render_directory(const DirEntry& entry, const DirectoryBreakdown& breakdown) const {
    out_ << theme_.paint(Theme::Style::Directory, entry.name + "/") << '\n';
    out_ << "  " << theme_.paint(Theme::Style::Muted, canonical_display(entry.path)) << '\n';

    const auto& total = breakdown.total;
    const auto& visible = breakdown.visible;

    if (breakdown.has_ignored()) {
        const std::vector<std::string> total_parts{
            std::format("{} dirs", total.directories),
            std::format("{} files", total.files),
            formatter::human_size(total.bytes),
        };
        out_ << "  " << label("total:") << ' '
             << theme_.paint(Theme::Style::Warning, string_utils::join(total_parts, " · ")) << '\n';

        std::vector<std::string> visible_parts;
        if (visible.directories > 0) {
            visible_parts.push_back(std::format("{} dirs", visible.directories));
        }
        if (visible.files > 0) {
            visible_parts.push_back(std::format("{} files", visible.files));
        }
        visible_parts.push_back(formatter::human_size(visible.bytes));
        out_ << "  " << label("visible:") << ' '
             << theme_.paint(Theme::Style::Success, string_utils::join(visible_parts, " · ")) << '\n';
    } else {
        std::vector<std::string> parts;
        if (total.directories > 0) {
            parts.push_back(std::format("{} dirs", total.directories));
        }
        if (total.files > 0) {
            parts.push_back(std::format("{} files", total.files));
        }
        parts.push_back(formatter::human_size(total.bytes));
        out_ << "  " << label("total:") << ' ' << theme_.paint(Theme::Style::Warning, string_utils::join(parts, " · "))
             << '\n';
    }

    if (!breakdown.extensions.empty()) {
        std::vector<std::string> types;
        for (const auto& [extension, count] : breakdown.extensions) {
            types.push_back(std::format("{}({})", extension, count));
        }
        out_ << "  " << label("types:") << ' ' << theme_.paint(Theme::Style::Accent, string_utils::join(types, " "))
             << '\n';
    }

    if (!breakdown.ignored_subdirectories.empty()) {
        std::vector<std::string> ignored;
        for (const auto& [name, count] : breakdown.ignored_subdirectories) {
            ignored.push_back(std::format("{}({} files)", name, count));
        }
        out_ << "  " << label("ignored:") << ' ' << theme_.paint(Theme::Style::Muted, string_utils::join(ignored, ", "))
             << '\n';
    }

    out_ << '\n';
}

void SummaryReport::render_file(const DirEntry& entry) const {
    const auto name = entry.is_executable ? theme_.paint(Theme::Style::Executable, entry.name) : entry.name;
    out_ << name << '\n';
    out_ << "  " << theme_.paint(Theme::Style::Muted, canonical_display(entry.path)) << '\n';
    out_ << "  " << theme_.paint(Theme::Style::Muted, formatter::human_size(entry.size)) << '\n';
    out_ << '\n';
}

} // namespace structree
