#include "structree/renderer.hpp"

#include "structree/formatter.hpp"

#include <format>

namespace structree {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

Renderer::Renderer(const Theme& theme, std::ostream& output)
    : theme_{theme}
    , out_{output} {}

void Renderer::render_root(const std::filesystem::path& root) const {
    out_ << theme_.paint(Theme::Style::Accent, root.string()) << '\n';
}

void Renderer::render(const DirEntry& entry, const RenderDecision& decision, std::string_view prefix, bool is_last,
    bool show_sizes) const {
    auto line = format_line(entry, decision, prefix, is_last, show_sizes);
    if (!line.empty()) {
        out_ << line << '\n';
    }
}

std::string_view Renderer::connector(bool is_last) noexcept {
    return is_last ? "└── " : "├── ";
}

std::string Renderer::child_prefix(std::string_view prefix, bool is_last) {
    std::string next{prefix};
    next += is_last ? "    " : "│   ";
    return next;
}

std::string Renderer::format_name(const DirEntry& entry) const {
    if (entry.is_symlink) {
        if (entry.link_target.empty()) {
            return theme_.paint(Theme::Style::Symlink, entry.name);
        }
        return theme_.paint(Theme::Style::Symlink, std::format("{} -> {}", entry.name, entry.link_target.string()));
    }
    if (entry.is_directory) {
        return theme_.paint(Theme::Style::Directory, entry.name + "/");
    }
    if (entry.is_executable) {
        return theme_.paint(Theme::Style::Executable, entry.name);
    }
    return entry.name;
}

std::string Renderer::format_line(const DirEntry& entry, const RenderDecision& decision, std::string_view prefix,
    bool is_last, bool show_sizes) const {
    const auto lead = std::string{prefix} + std::string{connector(is_last)};
    const auto dir_name = theme_.paint(Theme::Style::Directory, entry.name + "/");

    return std::visit(
        overloaded{
            [&](const ShowEntry&) {
                std::string line = lead + format_name(entry);
                if (show_sizes && entry.is_regular) {
                    line += theme_.paint(Theme::Style::Muted, std::format(" ({})", formatter::human_size(entry.size)));
                }
                return line;
            },
            [&](const PrunedIgnored& pruned) {
                const auto note = show_sizes
                    ? std::format(" ({}, {} files ignored)", formatter::human_size(pruned.bytes), pruned.file_count)
                    : std::format(" ({} files ignored)", pruned.file_count);
                return lead + dir_name + theme_.paint(Theme::Style::Muted, note);
            },
            [&](const PrunedOversized& pruned) {
                const auto note = std::format(" ({}, skipped)", formatter::whole_megabytes(pruned.bytes));
                return lead + dir_name + theme_.paint(Theme::Style::Muted, note);
            },
            [](const SkipEntry&) { return std::string{}; },
        },
        decision);
}

} // namespace structree
