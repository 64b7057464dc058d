#include <catch2/catch_test_macros.hpp>
#include "structree/pattern.hpp"

#include <regex>

using structree::GlobPattern;
using structree::GlobSyntax;

TEST_CASE("ignore globs rewrite only the star wildcard") {
    CHECK(GlobPattern::to_regex("*.log", GlobSyntax::Ignore) == "^.*.log$");
    CHECK(GlobPattern::to_regex("file?.txt", GlobSyntax::Ignore) == "^file?.txt$");
}

TEST_CASE("search globs rewrite star and question mark") {
    CHECK(GlobPattern::to_regex("*.rs", GlobSyntax::Search) == "^.*.rs$");
    CHECK(GlobPattern::to_regex("a?c", GlobSyntax::Search) == "^a.c$");
}

TEST_CASE("patterns match the whole name") {
    auto pattern = GlobPattern::compile("temp*", GlobSyntax::Ignore);
    REQUIRE(pattern.has_value());
    CHECK(pattern->matches("temp"));
    CHECK(pattern->matches("temporary"));
    CHECK_FALSE(pattern->matches("mytemp"));
    CHECK(pattern->source() == "temp*");
}

TEST_CASE("a dot is a regex wildcard, not a literal") {
    auto pattern = GlobPattern::compile("*.log", GlobSyntax::Ignore);
    REQUIRE(pattern.has_value());
    CHECK(pattern->matches("app.log"));
    CHECK(pattern->matches("applog"));
    CHECK_FALSE(pattern->matches("log"));
}

TEST_CASE("invalid patterns are dropped from the ignore list") {
    auto patterns = structree::compile_ignore_patterns({"[", "*.tmp", "("});
    REQUIRE(patterns.size() == 1);
    CHECK(patterns.front().source() == "*.tmp");
    CHECK(structree::matches_any("cache.tmp", patterns));
    CHECK_FALSE(structree::matches_any("cache.txt", patterns));
}

TEST_CASE("compile_or_throw reports an invalid search pattern") {
    CHECK_THROWS_AS(GlobPattern::compile_or_throw("[", GlobSyntax::Search), std::regex_error);
    CHECK_FALSE(GlobPattern::compile("[", GlobSyntax::Search).has_value());
}

TEST_CASE("matches_any is false for an empty list") {
    CHECK_FALSE(structree::matches_any("anything", {}));
}
