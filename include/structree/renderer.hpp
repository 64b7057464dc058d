#pragma once

#include "structree/entry.hpp"
#include "structree/theme.hpp"

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

namespace structree {

struct ShowEntry {};

struct PrunedIgnored {
    std::uintmax_t file_count{0};
    std::uintmax_t bytes{0};
};

struct PrunedOversized {
    std::uintmax_t bytes{0};
};

struct SkipEntry {};

using RenderDecision = std::variant<ShowEntry, PrunedIgnored, PrunedOversized, SkipEntry>;

class Renderer {
public:
    Renderer(const Theme& theme, std::ostream& output);

    void render_root(const std::filesystem::path& root) const;
    void render(const DirEntry& entry, const RenderDecision& decision, std::string_view prefix, bool is_last,
        bool show_sizes) const;

    // Empty for SkipEntry.
    [[nodiscard]] std::string format_line(const DirEntry& entry, const RenderDecision& decision,
        std::string_view prefix, bool is_last, bool show_sizes) const;

    // `name/`, `name -> target`, or the plain name, styled.
    [[nodiscard]] std::string format_name(const DirEntry& entry) const;

    [[nodiscard]] static std::string_view connector(bool is_last) noexcept;
    [[nodiscard]] static std::string child_prefix(std::string_view prefix, bool is_last);

private:
    const Theme& theme_;
    std::ostream& out_;
};

} // namespace structree
