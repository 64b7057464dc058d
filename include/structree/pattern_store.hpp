#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <sqlite3.h>

namespace structree {

class PatternStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// User-saved ignore patterns, kept in a small SQLite database in the user
// configuration directory. Patterns come back in insertion order.
class PatternStore {
public:
    explicit PatternStore(std::filesystem::path database_path);

    // Absent when no configuration directory can be determined.
    [[nodiscard]] static std::optional<std::filesystem::path> default_location();

    // A missing or unreadable database yields an empty list.
    [[nodiscard]] std::vector<std::string> load() const;

    bool add(std::string_view pattern);
    bool remove(std::string_view pattern);
    std::size_t clear();

    [[nodiscard]] const std::filesystem::path& location() const noexcept { return path_; }

    static constexpr const char* kDatabaseFilename = "patterns.sqlite3";

private:
    using DbPtr = std::unique_ptr<sqlite3, void (*)(sqlite3*)>;

    [[nodiscard]] DbPtr open_readonly() const;
    [[nodiscard]] DbPtr open_writable() const;
    [[nodiscard]] std::size_t execute_with_text(sqlite3* db, std::string_view sql, std::string_view value) const;

    std::filesystem::path path_;
};

} // namespace structree
