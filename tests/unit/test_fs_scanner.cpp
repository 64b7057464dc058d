#include <catch2/catch_test_macros.hpp>
#include "structree/fs_scanner.hpp"
#include "TestHelpers.hpp"

#include <algorithm>

using namespace structree;

namespace {

const DirEntry* find_entry(const std::vector<DirEntry>& entries, std::string_view name) {
    auto it = std::find_if(entries.begin(), entries.end(), [&](const DirEntry& entry) { return entry.name == name; });
    return it == entries.end() ? nullptr : &*it;
}

} // namespace

TEST_CASE("scan lists direct children with their kinds") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "file.txt", "hello");
    write_file(temp_dir.path() / "sub" / "nested.txt");

    FileSystemScanner scanner;
    std::error_code ec;
    auto entries = scanner.scan(temp_dir.path(), ec);
    REQUIRE_FALSE(ec);
    REQUIRE(entries.size() == 2);

    const auto* file = find_entry(entries, "file.txt");
    REQUIRE(file != nullptr);
    CHECK(file->is_regular);
    CHECK_FALSE(file->is_directory);
    CHECK(file->size == 5);

    const auto* sub = find_entry(entries, "sub");
    REQUIRE(sub != nullptr);
    CHECK(sub->is_directory);
    CHECK(sub->size == 0);
}

TEST_CASE("a symlink to a directory is not a directory") {
    TempDir temp_dir;
    std::filesystem::create_directories(temp_dir.path() / "real");
    std::error_code ec;
    std::filesystem::create_directory_symlink("real", temp_dir.path() / "link", ec);
    if (ec) {
        SKIP("symlinks are not supported here");
    }

    FileSystemScanner scanner;
    auto entries = scanner.scan(temp_dir.path(), ec);
    REQUIRE_FALSE(ec);
    const auto* link = find_entry(entries, "link");
    REQUIRE(link != nullptr);
    CHECK(link->is_symlink);
    CHECK_FALSE(link->is_directory);
    CHECK(link->link_target.string() == "real");
}

TEST_CASE("scan reports an error for a missing directory") {
    TempDir temp_dir;
    FileSystemScanner scanner;
    std::error_code ec;
    auto entries = scanner.scan(temp_dir.path() / "missing", ec);
    CHECK(ec);
    CHECK(entries.empty());
}

TEST_CASE("sort puts directories first then orders names case-insensitively") {
    std::vector<DirEntry> entries(5);
    entries[0].name = "zeta.txt";
    entries[1].name = "Alpha.txt";
    entries[2].name = "beta";
    entries[2].is_directory = true;
    entries[3].name = "alpha.md";
    entries[4].name = "Aardvark";
    entries[4].is_directory = true;

    sort_entries(entries);

    std::vector<std::string> names;
    for (const auto& entry : entries) {
        names.push_back(entry.name);
    }
    CHECK(names == std::vector<std::string>{"Aardvark", "beta", "alpha.md", "Alpha.txt", "zeta.txt"});
}

TEST_CASE("sort breaks case-insensitive ties by raw name") {
    std::vector<DirEntry> entries(2);
    entries[0].name = "readme";
    entries[1].name = "README";
    sort_entries(entries);
    CHECK(entries[0].name == "README");
    CHECK(entries[1].name == "readme");
}

TEST_CASE("absolute_root normalizes and strips the trailing separator") {
    TempDir temp_dir;
    auto root = absolute_root(temp_dir.path() / "a" / ".." / "b" / "");
    CHECK(root.string() == (temp_dir.path() / "b").lexically_normal().string());
    CHECK(root.has_filename());
}
