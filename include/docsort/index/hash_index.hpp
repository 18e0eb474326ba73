#pragma once

#include "docsort/storage/kv_store.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace docsort::index {

inline constexpr const char* kIndexFileName = "crawler_hash_index.db";

// Where the primary copy of one content digest lives.
struct ContentRecord {
    std::string digest;
    std::filesystem::path path;
    std::uintmax_t size = 0;
    double mtime = 0.0;
    std::string customer_root;
};

nlohmann::json to_json(const ContentRecord& record);
ContentRecord record_from_json(const std::string& digest, const nlohmann::json& value);

/**
 * @brief Persistent digest -> primary location map
 *
 * Reads are served from an in-memory cache filled by load(); every put is
 * written through to SQLite before it becomes visible in the cache.
 */
class HashIndex {
public:
    static Result<std::shared_ptr<HashIndex>> open(const std::filesystem::path& index_store_path);

    explicit HashIndex(std::unique_ptr<storage::KvStore> store);

    // Drops the cache and reloads it from disk; returns the entry count.
    Result<std::size_t> load();

    [[nodiscard]] std::optional<ContentRecord> get(const std::string& digest) const;
    Result<void> put(const ContentRecord& record);

    [[nodiscard]] std::vector<ContentRecord> all() const;
    [[nodiscard]] std::size_t size() const;

private:
    std::unique_ptr<storage::KvStore> store_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, ContentRecord> cache_;
};

} // namespace docsort::index
