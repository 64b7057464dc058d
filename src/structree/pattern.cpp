#include "structree/pattern.hpp"

#include "structree/logger.hpp"

#include <algorithm>
#include <utility>

namespace structree {

GlobPattern::GlobPattern(std::string source, std::regex regex)
    : source_{std::move(source)}
    , regex_{std::move(regex)} {}

std::string GlobPattern::to_regex(std::string_view glob, GlobSyntax syntax) {
    std::string out;
    out.reserve(glob.size() + 8);
    out.push_back('^');
    for (char ch : glob) {
        if (ch == '*') {
            out += ".*";
        } else if (ch == '?' && syntax == GlobSyntax::Search) {
            out.push_back('.');
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('$');
    return out;
}

GlobPattern GlobPattern::compile_or_throw(std::string_view glob, GlobSyntax syntax) {
    std::regex regex{to_regex(glob, syntax), std::regex::ECMAScript};
    return GlobPattern{std::string{glob}, std::move(regex)};
}

std::optional<GlobPattern> GlobPattern::compile(std::string_view glob, GlobSyntax syntax) {
    try {
        return compile_or_throw(glob, syntax);
    } catch (const std::regex_error& e) {
        Logger::instance().debug("dropping pattern '{}': {}", glob, e.what());
        return std::nullopt;
    }
}

bool GlobPattern::matches(std::string_view name) const {
    return std::regex_match(name.begin(), name.end(), regex_);
}

std::vector<GlobPattern> compile_ignore_patterns(const std::vector<std::string>& globs) {
    std::vector<GlobPattern> patterns;
    patterns.reserve(globs.size());
    for (const auto& glob : globs) {
        if (auto pattern = GlobPattern::compile(glob, GlobSyntax::Ignore)) {
            patterns.push_back(std::move(*pattern));
        }
    }
    return patterns;
}

bool matches_any(std::string_view name, const std::vector<GlobPattern>& patterns) {
    return std::any_of(patterns.begin(), patterns.end(), [name](const GlobPattern& pattern) {
        return pattern.matches(name);
    });
}

} // namespace structree
