#pragma once

#include "docsort/storage/sqlite_db.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace docsort::storage {

/**
 * @brief Durable key -> JSON document table
 *
 * One table inside a SQLite database. Each put/erase is its own committed
 * transaction, so a crash never leaves a half-written entry.
 */
class KvStore {
public:
    using Entry = std::pair<std::string, nlohmann::json>;

    static Result<std::unique_ptr<KvStore>> open(const std::filesystem::path& db_path,
                                                 const std::string& table);

    KvStore(std::shared_ptr<SqliteDb> db, std::string table);

    // Creates the table when missing.
    Result<void> init();

    Result<void> put(const std::string& key, const nlohmann::json& value);
    Result<std::optional<nlohmann::json>> get(const std::string& key) const;
    // true when a row was removed
    Result<bool> erase(const std::string& key);
    Result<std::vector<Entry>> entries() const;
    Result<std::size_t> count() const;

    const std::string& table() const noexcept { return table_; }

private:
    std::shared_ptr<SqliteDb> db_;
    std::string table_;
};

} // namespace docsort::storage
