#pragma once

#include <string>
#include <string_view>

namespace structree {

class Theme {
public:
    enum class Style {
        Directory,
        Executable,
        Symlink,
        Muted,
        Accent,
        Match,
        Warning,
        Success,
    };

    explicit Theme(bool use_color);

    [[nodiscard]] bool use_color() const noexcept;
    [[nodiscard]] std::string paint(Style style, std::string_view text) const;

    static constexpr std::string_view reset_color() noexcept { return "\033[0m"; }

private:
    [[nodiscard]] static std::string_view code_for(Style style) noexcept;

    bool use_color_{false};
};

} // namespace structree
