#include <catch2/catch_test_macros.hpp>
#include "structree/cli.hpp"
#include "structree/config.hpp"

#include <initializer_list>
#include <string>
#include <vector>

using namespace structree;

namespace {

std::optional<int> parse(std::initializer_list<const char*> args) {
    std::vector<const char*> argv{"structree"};
    argv.insert(argv.end(), args.begin(), args.end());
    Cli cli;
    return cli.parse(static_cast<int>(argv.size()), argv.data(), Config::instance());
}

const RunOptions& options() {
    return Config::instance().options();
}

} // namespace

TEST_CASE("no arguments renders the current directory without limits") {
    REQUIRE_FALSE(parse({}).has_value());
    CHECK(options().command == Command::Tree);
    CHECK_FALSE(options().depth.has_value());
    CHECK(options().root.string() == ".");
    CHECK(options().git_relationship == GitRelationship::None);
    CHECK(options().log_level == LogLevel::Error);
    CHECK(options().enable_color);
}

TEST_CASE("tree options are parsed") {
    REQUIRE_FALSE(parse({"2", "-p", "src", "-i", "*.log, temp*", "-z", "-s", "100", "-n", "node_modules", "--no-color"})
                      .has_value());
    CHECK(options().depth == std::optional<std::size_t>{2});
    CHECK(options().root.string() == "src");
    CHECK(options().ignore_patterns == std::vector<std::string>{"*.log", "temp*"});
    CHECK(options().show_sizes);
    CHECK(options().skip_large_mb == std::optional<std::uintmax_t>{100});
    CHECK(options().no_ignore == std::optional<std::string>{"node_modules"});
    CHECK_FALSE(options().enable_color);
}

TEST_CASE("depth zero selects the summary") {
    REQUIRE_FALSE(parse({"0"}).has_value());
    CHECK(options().depth == std::optional<std::size_t>{0});
}

TEST_CASE("the most specific git flag wins") {
    CHECK(Cli::resolve_git_relationship({}) == GitRelationship::None);

    Cli::GitFlags flags;
    flags.tracked = true;
    flags.staged = true;
    CHECK(Cli::resolve_git_relationship(flags) == GitRelationship::Staged);
    flags.changed = true;
    CHECK(Cli::resolve_git_relationship(flags) == GitRelationship::Changed);

    REQUIRE_FALSE(parse({"-g", "--gu"}).has_value());
    CHECK(options().git_relationship == GitRelationship::Untracked);
    CHECK_FALSE(options().git_root);
}

TEST_CASE("root variants of git flags start at the repository top") {
    REQUIRE_FALSE(parse({"--gsr"}).has_value());
    CHECK(options().git_relationship == GitRelationship::Staged);
    CHECK(options().git_root);

    REQUIRE_FALSE(parse({"--ghr"}).has_value());
    CHECK(options().git_relationship == GitRelationship::History);
    CHECK(options().git_root);
}

TEST_CASE("log level accepts names case-insensitively") {
    REQUIRE_FALSE(parse({"-v", "DEBUG"}).has_value());
    CHECK(options().log_level == LogLevel::Debug);

    REQUIRE_FALSE(parse({"--log-level", "warning"}).has_value());
    CHECK(options().log_level == LogLevel::Warn);
}

TEST_CASE("an unknown log level is rejected") {
    auto code = parse({"-v", "loud"});
    REQUIRE(code.has_value());
    CHECK(*code != 0);
}

TEST_CASE("search subcommand") {
    REQUIRE_FALSE(parse({"search", "*.env", "config", "-d", "3", "-f"}).has_value());
    CHECK(options().command == Command::Search);
    CHECK(options().search.pattern == "*.env");
    CHECK(options().search.root.string() == "config");
    CHECK(options().search.max_depth == std::optional<std::size_t>{3});
    CHECK(options().search.flat);
}

TEST_CASE("search defaults to the current directory") {
    REQUIRE_FALSE(parse({"search", "*.rs"}).has_value());
    CHECK(options().search.root.string() == ".");
    CHECK_FALSE(options().search.max_depth.has_value());
    CHECK_FALSE(options().search.flat);
}

TEST_CASE("search requires a pattern") {
    auto code = parse({"search"});
    REQUIRE(code.has_value());
    CHECK(*code != 0);
}

TEST_CASE("pattern store subcommands") {
    REQUIRE_FALSE(parse({"add", "*.log,tmp*"}).has_value());
    CHECK(options().command == Command::AddPatterns);
    CHECK(options().store_patterns == std::vector<std::string>{"*.log", "tmp*"});

    REQUIRE_FALSE(parse({"remove", "*.log"}).has_value());
    CHECK(options().command == Command::RemovePattern);
    CHECK(options().store_patterns == std::vector<std::string>{"*.log"});

    REQUIRE_FALSE(parse({"list"}).has_value());
    CHECK(options().command == Command::ListPatterns);

    REQUIRE_FALSE(parse({"clear"}).has_value());
    CHECK(options().command == Command::ClearPatterns);
}

TEST_CASE("version flag stops the program successfully") {
    auto code = parse({"--version"});
    REQUIRE(code.has_value());
    CHECK(*code == 0);
}
