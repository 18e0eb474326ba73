#include "docsort/index/hash_index.hpp"

#include <spdlog/spdlog.h>

#include <mutex>

namespace docsort::index {

nlohmann::json to_json(const ContentRecord& record) {
    return nlohmann::json{
        {"path", record.path.string()},
        {"size", record.size},
        {"mtime", record.mtime},
        {"customer", record.customer_root},
    };
}

ContentRecord record_from_json(const std::string& digest, const nlohmann::json& value) {
    ContentRecord record;
    record.digest = digest;
    record.path = value.value("path", std::string());
    record.size = value.value("size", std::uintmax_t{0});
    record.mtime = value.value("mtime", 0.0);
    record.customer_root = value.value("customer", std::string());
    return record;
}

Result<std::shared_ptr<HashIndex>> HashIndex::open(const std::filesystem::path& index_store_path) {
    auto store = storage::KvStore::open(index_store_path / kIndexFileName, "hash_index");
    if (store.is_error()) {
        return Err<std::shared_ptr<HashIndex>>(store.error());
    }
    return Ok(std::make_shared<HashIndex>(std::move(store.value())));
}

HashIndex::HashIndex(std::unique_ptr<storage::KvStore> store) : store_(std::move(store)) {}

Result<std::size_t> HashIndex::load() {
    auto entries = store_->entries();
    if (entries.is_error()) {
        return Err<std::size_t>(entries.error());
    }

    std::unordered_map<std::string, ContentRecord> loaded;
    for (const auto& [digest, value] : entries.value()) {
        loaded.emplace(digest, record_from_json(digest, value));
    }

    std::unique_lock lock(mutex_);
    cache_ = std::move(loaded);
    spdlog::debug("[HashIndex] loaded {} records", cache_.size());
    return Ok(cache_.size());
}

std::optional<ContentRecord> HashIndex::get(const std::string& digest) const {
    std::shared_lock lock(mutex_);
    auto it = cache_.find(digest);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<void> HashIndex::put(const ContentRecord& record) {
    std::unique_lock lock(mutex_);
    auto written = store_->put(record.digest, to_json(record));
    if (written.is_error()) {
        return written;
    }
    cache_[record.digest] = record;
    return Ok();
}

std::vector<ContentRecord> HashIndex::all() const {
    std::shared_lock lock(mutex_);
    std::vector<ContentRecord> out;
    out.reserve(cache_.size());
    for (const auto& [digest, record] : cache_) {
        out.push_back(record);
    }
    return out;
}

std::size_t HashIndex::size() const {
    std::shared_lock lock(mutex_);
    return cache_.size();
}

} // namespace docsort::index
