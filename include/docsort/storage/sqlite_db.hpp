#pragma once

#include "docsort/core/result.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <memory>
#include <string>

namespace docsort::storage {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Thin RAII wrapper around sqlite3*.
  Every statement outside an explicit transaction commits on its own, and
  synchronous=FULL makes each commit durable before the call returns.
*/
class SqliteDb {
public:
    static Result<std::shared_ptr<SqliteDb>> open(const std::filesystem::path& path);

    ~SqliteDb();

    SqliteDb(const SqliteDb&) = delete;
    SqliteDb& operator=(const SqliteDb&) = delete;

    sqlite3* handle() const { return db_; }
    const std::filesystem::path& path() const { return path_; }

    // Execute a SQL string (pragmas, schema, transaction control)
    Result<void> exec(const std::string& sql);

    Result<Statement> prepare(const std::string& sql);

    std::string last_error() const;

    /*
      Holds the connection mutex. A step and the sqlite3_changes() or
      sqlite3_errmsg() read after it must sit under one Lock, otherwise
      another thread's statement on this connection can land in between.
      The mutex is recursive, so sqlite calls made while holding it are fine.
    */
    class Lock {
    public:
        explicit Lock(const SqliteDb& db) : mutex_(sqlite3_db_mutex(db.db_)) { sqlite3_mutex_enter(mutex_); }
        ~Lock() { sqlite3_mutex_leave(mutex_); }

        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;

    private:
        sqlite3_mutex* mutex_;
    };

private:
    SqliteDb(sqlite3* db, std::filesystem::path path);

    Result<void> configure();

    sqlite3* db_ = nullptr;
    std::filesystem::path path_;
};

} // namespace docsort::storage
