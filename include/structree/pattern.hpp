#pragma once

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace structree {

// Glob-to-regex translation. Only the wildcards listed below are rewritten;
// every other character keeps its regex meaning, and the result is anchored
// to the whole name.
enum class GlobSyntax {
    Ignore, // '*' -> ".*"
    Search, // '*' -> ".*", '?' -> "."
};

class GlobPattern {
public:
    [[nodiscard]] static std::optional<GlobPattern> compile(std::string_view glob, GlobSyntax syntax);

    // Throws std::regex_error when the translated expression is invalid.
    [[nodiscard]] static GlobPattern compile_or_throw(std::string_view glob, GlobSyntax syntax);

    [[nodiscard]] static std::string to_regex(std::string_view glob, GlobSyntax syntax);

    [[nodiscard]] bool matches(std::string_view name) const;
    [[nodiscard]] const std::string& source() const noexcept { return source_; }

private:
    GlobPattern(std::string source, std::regex regex);

    std::string source_;
    std::regex regex_;
};

// Compiles each glob and silently drops the ones that do not compile.
[[nodiscard]] std::vector<GlobPattern> compile_ignore_patterns(const std::vector<std::string>& globs);

[[nodiscard]] bool matches_any(std::string_view name, const std::vector<GlobPattern>& patterns);

} // namespace structree
