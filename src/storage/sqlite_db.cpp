#include "docsort/storage/sqlite_db.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace docsort::storage {
namespace fs = std::filesystem;

SqliteDb::SqliteDb(sqlite3* db, fs::path path) : db_(db), path_(std::move(path)) {}

SqliteDb::~SqliteDb() {
    if (db_) {
        sqlite3_close(db_);
    }
}

Result<std::shared_ptr<SqliteDb>> SqliteDb::open(const fs::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Err<std::shared_ptr<SqliteDb>>(ErrorCode::Storage,
                "cannot create directory for " + path.string() + ": " + ec.message());
        }
    }

    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path.string().c_str(), &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = raw ? sqlite3_errmsg(raw) : "sqlite open failed";
        if (raw) {
            sqlite3_close(raw);
        }
        return Err<std::shared_ptr<SqliteDb>>(ErrorCode::Storage, path.string() + ": " + msg);
    }

    std::shared_ptr<SqliteDb> db(new SqliteDb(raw, path));
    auto configured = db->configure();
    if (configured.is_error()) {
        return Err<std::shared_ptr<SqliteDb>>(configured.error());
    }
    spdlog::debug("[Storage] opened {}", path.string());
    return Ok(std::move(db));
}

Result<void> SqliteDb::exec(const std::string& sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        return Err<void>(ErrorCode::Storage, msg);
    }
    return Ok();
}

Result<Statement> SqliteDb::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Err<Statement>(ErrorCode::Storage, "sqlite prepare: " + last_error());
    }
    return Ok(Statement(stmt));
}

std::string SqliteDb::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "no database";
}

Result<void> SqliteDb::configure() {
    // WAL keeps readers going while a write commits
    if (auto r = exec("PRAGMA journal_mode=WAL;"); r.is_error()) {
        return r;
    }
    // every acknowledged put must survive a crash
    if (auto r = exec("PRAGMA synchronous=FULL;"); r.is_error()) {
        return r;
    }
    if (sqlite3_busy_timeout(db_, 5000) != SQLITE_OK) {
        return Err<void>(ErrorCode::Storage, "busy_timeout: " + last_error());
    }
    return Ok();
}

} // namespace docsort::storage
