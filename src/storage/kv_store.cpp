#include "docsort/storage/kv_store.hpp"

namespace docsort::storage {
namespace {

void bind_text(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

std::string col_text(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

Result<nlohmann::json> decode(const std::string& key, const std::string& text) {
    auto value = nlohmann::json::parse(text, nullptr, false);
    if (value.is_discarded()) {
        return Err<nlohmann::json>(ErrorCode::Storage, "corrupt value for key " + key);
    }
    return Ok(std::move(value));
}

} // namespace

Result<std::unique_ptr<KvStore>> KvStore::open(const std::filesystem::path& db_path, const std::string& table) {
    auto db = SqliteDb::open(db_path);
    if (db.is_error()) {
        return Err<std::unique_ptr<KvStore>>(db.error());
    }
    auto store = std::make_unique<KvStore>(db.value(), table);
    auto init = store->init();
    if (init.is_error()) {
        return Err<std::unique_ptr<KvStore>>(init.error());
    }
    return Ok(std::move(store));
}

KvStore::KvStore(std::shared_ptr<SqliteDb> db, std::string table)
    : db_(std::move(db)), table_(std::move(table)) {}

Result<void> KvStore::init() {
    return db_->exec("CREATE TABLE IF NOT EXISTS " + table_ +
                     " (key TEXT PRIMARY KEY, value TEXT NOT NULL);");
}

Result<void> KvStore::put(const std::string& key, const nlohmann::json& value) {
    auto stmt = db_->prepare("INSERT OR REPLACE INTO " + table_ + " (key, value) VALUES (?, ?);");
    if (stmt.is_error()) {
        return Err<void>(stmt.error());
    }
    auto* st = stmt.value().get();
    bind_text(st, 1, key);
    bind_text(st, 2, value.dump());
    SqliteDb::Lock lock(*db_);
    if (sqlite3_step(st) != SQLITE_DONE) {
        return Err<void>(ErrorCode::Storage, "put " + table_ + "/" + key + ": " + db_->last_error());
    }
    return Ok();
}

Result<std::optional<nlohmann::json>> KvStore::get(const std::string& key) const {
    using Value = std::optional<nlohmann::json>;
    auto stmt = db_->prepare("SELECT value FROM " + table_ + " WHERE key = ?;");
    if (stmt.is_error()) {
        return Err<Value>(stmt.error());
    }
    auto* st = stmt.value().get();
    bind_text(st, 1, key);
    SqliteDb::Lock lock(*db_);
    const int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) {
        return Ok(Value{});
    }
    if (rc != SQLITE_ROW) {
        return Err<Value>(ErrorCode::Storage, "get " + table_ + "/" + key + ": " + db_->last_error());
    }
    auto decoded = decode(key, col_text(st, 0));
    if (decoded.is_error()) {
        return Err<Value>(decoded.error());
    }
    return Ok(Value{std::move(decoded.value())});
}

Result<bool> KvStore::erase(const std::string& key) {
    auto stmt = db_->prepare("DELETE FROM " + table_ + " WHERE key = ?;");
    if (stmt.is_error()) {
        return Err<bool>(stmt.error());
    }
    auto* st = stmt.value().get();
    bind_text(st, 1, key);
    SqliteDb::Lock lock(*db_);
    if (sqlite3_step(st) != SQLITE_DONE) {
        return Err<bool>(ErrorCode::Storage, "erase " + table_ + "/" + key + ": " + db_->last_error());
    }
    return Ok(sqlite3_changes(db_->handle()) > 0);
}

Result<std::vector<KvStore::Entry>> KvStore::entries() const {
    auto stmt = db_->prepare("SELECT key, value FROM " + table_ + " ORDER BY key;");
    if (stmt.is_error()) {
        return Err<std::vector<Entry>>(stmt.error());
    }
    auto* st = stmt.value().get();

    std::vector<Entry> out;
    SqliteDb::Lock lock(*db_);
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        auto key = col_text(st, 0);
        auto decoded = decode(key, col_text(st, 1));
        if (decoded.is_error()) {
            return Err<std::vector<Entry>>(decoded.error());
        }
        out.emplace_back(std::move(key), std::move(decoded.value()));
    }
    if (rc != SQLITE_DONE) {
        return Err<std::vector<Entry>>(ErrorCode::Storage, "scan " + table_ + ": " + db_->last_error());
    }
    return Ok(std::move(out));
}

Result<std::size_t> KvStore::count() const {
    auto stmt = db_->prepare("SELECT COUNT(*) FROM " + table_ + ";");
    if (stmt.is_error()) {
        return Err<std::size_t>(stmt.error());
    }
    auto* st = stmt.value().get();
    SqliteDb::Lock lock(*db_);
    if (sqlite3_step(st) != SQLITE_ROW) {
        return Err<std::size_t>(ErrorCode::Storage, "count " + table_ + ": " + db_->last_error());
    }
    return Ok(static_cast<std::size_t>(sqlite3_column_int64(st, 0)));
}

} // namespace docsort::storage
