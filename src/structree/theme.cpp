#include "structree/theme.hpp"

namespace structree {

Theme::Theme(bool use_color)
    : use_color_{use_color} {}

bool Theme::use_color() const noexcept {
    return use_color_;
}

std::string Theme::paint(Style style, std::string_view text) const {
    if (!use_color_ || text.empty()) {
        return std::string{text};
    }
    std::string out;
    out.reserve(text.size() + 16);
    out += code_for(style);
    out += text;
    out += reset_color();
    return out;
}

std::string_view Theme::code_for(Style style) noexcept {
    switch (style) {
    case Style::Directory:
        return "\033[1;34m"; // bold blue
    case Style::Executable:
        return "\033[1;32m"; // bold green
    case Style::Symlink:
        return "\033[36m"; // cyan
    case Style::Muted:
        return "\033[90m"; // bright black
    case Style::Accent:
        return "\033[36m";
    case Style::Match:
        return "\033[1;36m";
    case Style::Warning:
        return "\033[33m";
    case Style::Success:
        return "\033[32m";
    }
    return "";
}

} // namespace structree
