#include <catch2/catch_test_macros.hpp>
#include "structree/fs_scanner.hpp"
#include "structree/pattern.hpp"
#include "structree/summary.hpp"
#include "structree/theme.hpp"
#include "TestHelpers.hpp"

#include <iostream>
#include <sstream>

using namespace structree;

namespace {

void build_project(const std::filesystem::path& root) {
    write_file(root / "src" / "main.cpp", "0123456789");
    write_file(root / "src" / "util.cpp", "0123456789");
    write_file(root / "src" / "notes.md", "abcd");
    write_file(root / "src" / "__pycache__" / "x.pyc", "zzzzzz");
    write_file(root / "node_modules" / "a.js", "a");
    write_file(root / "node_modules" / "b.js", "b");
    write_file(root / "README.md", "hello");
}

} // namespace

TEST_CASE("summary prints one block per top-level child") {
    TempDir temp_dir;
    const auto root = std::filesystem::canonical(temp_dir.path());
    build_project(root);

    Theme theme{false};
    FileSystemScanner scanner;
    std::ostringstream out;
    std::ostringstream err;
    SummaryReport report{scanner, theme, out, err};

    CHECK(report.render(root, {}, std::nullopt) == 0);
    CHECK(err.str().empty());
    CHECK(split_lines(out.str()) == std::vector<std::string>{
        root.string(),
        "",
        "src/",
        "  " + (root / "src").string(),
        "  total:    1 dirs · 4 files · 30B",
        "  visible:  3 files · 24B",
        "  types:    cpp(2) md(1)",
        "  ignored:  __pycache__(1 files)",
        "",
        "README.md",
        "  " + (root / "README.md").string(),
        "  5B",
        "",
        "── ignored (top level) ──",
        "  node_modules(2 files) · 2 files · 2B",
    });
}

TEST_CASE("summary header carries the branch name") {
    TempDir temp_dir;
    const auto root = std::filesystem::canonical(temp_dir.path());
    write_file(root / "main.go", "package main");

    Theme theme{false};
    FileSystemScanner scanner;
    std::ostringstream out;
    std::ostringstream err;
    SummaryReport report{scanner, theme, out, err};
    CHECK(report.render(root, {}, std::string{"main"}) == 0);

    auto lines = split_lines(out.str());
    REQUIRE_FALSE(lines.empty());
    CHECK(lines.front() == root.string() + " (main)");
}

TEST_CASE("a directory without hidden content shows a single total row") {
    TempDir temp_dir;
    const auto root = std::filesystem::canonical(temp_dir.path());
    write_file(root / "docs" / "a.md", "12");
    write_file(root / "docs" / "b.md", "34");

    Theme theme{false};
    FileSystemScanner scanner;
    std::ostringstream out;
    std::ostringstream err;
    SummaryReport report{scanner, theme, out, err};
    CHECK(report.render(root, {}, std::nullopt) == 0);

    CHECK(split_lines(out.str()) == std::vector<std::string>{
        root.string(),
        "",
        "docs/",
        "  " + (root / "docs").string(),
        "  total:    2 files · 4B",
        "  types:    md(2)",
        "",
    });
}

TEST_CASE("custom patterns are applied to the summary") {
    TempDir temp_dir;
    const auto root = std::filesystem::canonical(temp_dir.path());
    write_file(root / "logs" / "today.log", "123");
    write_file(root / "app" / "main.rs", "fn");
    write_file(root / "app" / "debug.log", "x");

    Theme theme{false};
    FileSystemScanner scanner;
    SummaryReport report{scanner, theme, std::cout, std::cerr};
    auto patterns = compile_ignore_patterns({"*.log", "logs"});

    auto breakdown = report.analyze(root / "app", patterns);
    CHECK(breakdown.total.files == 2);
    CHECK(breakdown.visible.files == 1);
    CHECK(breakdown.visible.bytes == 2);
    CHECK(breakdown.has_ignored());
    REQUIRE(breakdown.extensions.size() == 1);
    CHECK(breakdown.extensions.front().first == "rs");
}

TEST_CASE("extensions are ranked by count and capped at ten") {
    TempDir temp_dir;
    const auto root = std::filesystem::canonical(temp_dir.path());
    for (int i = 0; i < 12; ++i) {
        write_file(root / "mixed" / ("f" + std::to_string(i) + ".e" + std::to_string(i)));
    }
    write_file(root / "mixed" / "extra.e5");
    write_file(root / "mixed" / "Upper.E5");

    Theme theme{false};
    FileSystemScanner scanner;
    SummaryReport report{scanner, theme, std::cout, std::cerr};
    auto breakdown = report.analyze(root / "mixed", {});

    REQUIRE(breakdown.extensions.size() == SummaryReport::kTopExtensions);
    CHECK(breakdown.extensions.front() == std::pair<std::string, std::uintmax_t>{"e5", 3});
    CHECK(breakdown.extensions[1].first == "e0");
}

TEST_CASE("an unreadable root is reported on the error stream") {
    TempDir temp_dir;
    Theme theme{false};
    FileSystemScanner scanner;
    std::ostringstream out;
    std::ostringstream err;
    SummaryReport report{scanner, theme, out, err};

    CHECK(report.render(temp_dir.path() / "missing", {}, std::nullopt) == 0);
    CHECK(err.str().starts_with("failed to read directory:"));
}
