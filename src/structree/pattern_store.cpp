#include "structree/pattern_store.hpp"

#include "structree/logger.hpp"
#include "structree/platform.hpp"

#include <system_error>
#include <utility>

namespace structree {

namespace {

constexpr std::string_view kSchema =
    "CREATE TABLE IF NOT EXISTS ignore_patterns ("
    "id INTEGER PRIMARY KEY AUTOINCREMENT, "
    "pattern TEXT NOT NULL UNIQUE)";

void close_sqlite(sqlite3* db) {
    if (db) {
        sqlite3_close(db);
    }
}

void finalize_sqlite(sqlite3_stmt* stmt) {
    if (stmt) {
        sqlite3_finalize(stmt);
    }
}

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&finalize_sqlite)>;

std::string error_message(sqlite3* db) {
    return db ? std::string{sqlite3_errmsg(db)} : std::string{"out of memory"};
}

StmtPtr prepare(sqlite3* db, std::string_view sql) {
    sqlite3_stmt* raw = nullptr;
    const int rc = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &raw, nullptr);
    if (rc != SQLITE_OK) {
        finalize_sqlite(raw);
        return StmtPtr{nullptr, &finalize_sqlite};
    }
    return StmtPtr{raw, &finalize_sqlite};
}

} // namespace

PatternStore::PatternStore(std::filesystem::path database_path)
    : path_{std::move(database_path)} {}

std::optional<std::filesystem::path> PatternStore::default_location() {
    auto dir = platform::user_config_dir();
    if (!dir) {
        return std::nullopt;
    }
    return *dir / kDatabaseFilename;
}

PatternStore::DbPtr PatternStore::open_readonly() const {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path_.string().c_str(), &raw, SQLITE_OPEN_READONLY, nullptr);
    DbPtr db{raw, &close_sqlite};
    if (rc != SQLITE_OK) {
        Logger::instance().warn("cannot open pattern store {}: {}", path_.string(), error_message(raw));
        return DbPtr{nullptr, &close_sqlite};
    }
    return db;
}

PatternStore::DbPtr PatternStore::open_writable() const {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw PatternStoreError("cannot create " + path_.parent_path().string() + ": " + ec.message());
        }
    }

    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path_.string().c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    DbPtr db{raw, &close_sqlite};
    if (rc != SQLITE_OK) {
        throw PatternStoreError("cannot open " + path_.string() + ": " + error_message(raw));
    }

    char* message = nullptr;
    if (sqlite3_exec(db.get(), std::string{kSchema}.c_str(), nullptr, nullptr, &message) != SQLITE_OK) {
        std::string reason = message ? message : "unknown error";
        sqlite3_free(message);
        throw PatternStoreError("cannot initialize " + path_.string() + ": " + reason);
    }
    return db;
}

std::size_t PatternStore::execute_with_text(sqlite3* db, std::string_view sql, std::string_view value) const {
    auto stmt = prepare(db, sql);
    if (!stmt) {
        throw PatternStoreError("cannot prepare statement: " + error_message(db));
    }
    sqlite3_bind_text(stmt.get(), 1, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw PatternStoreError("cannot update " + path_.string() + ": " + error_message(db));
    }
    return static_cast<std::size_t>(sqlite3_changes(db));
}

std::vector<std::string> PatternStore::load() const {
    std::vector<std::string> patterns;
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return patterns;
    }

    auto db = open_readonly();
    if (!db) {
        return patterns;
    }
    auto stmt = prepare(db.get(), "SELECT pattern FROM ignore_patterns ORDER BY id");
    if (!stmt) {
        Logger::instance().warn("cannot read pattern store {}: {}", path_.string(), error_message(db.get()));
        return patterns;
    }
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        const auto* text = sqlite3_column_text(stmt.get(), 0);
        if (text != nullptr) {
            patterns.emplace_back(reinterpret_cast<const char*>(text));
        }
    }
    Logger::instance().debug("loaded {} stored pattern(s) from {}", patterns.size(), path_.string());
    return patterns;
}

bool PatternStore::add(std::string_view pattern) {
    auto db = open_writable();
    return execute_with_text(db.get(), "INSERT OR IGNORE INTO ignore_patterns (pattern) VALUES (?1)", pattern) > 0;
}

bool PatternStore::remove(std::string_view pattern) {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return false;
    }
    auto db = open_writable();
    return execute_with_text(db.get(), "DELETE FROM ignore_patterns WHERE pattern = ?1", pattern) > 0;
}

std::size_t PatternStore::clear() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return 0;
    }
    auto db = open_writable();
    char* message = nullptr;
    if (sqlite3_exec(db.get(), "DELETE FROM ignore_patterns", nullptr, nullptr, &message) != SQLITE_OK) {
        std::string reason = message ? message : "unknown error";
        sqlite3_free(message);
        throw PatternStoreError("cannot clear " + path_.string() + ": " + reason);
    }
    return static_cast<std::size_t>(sqlite3_changes(db.get()));
}

} // namespace structree
