#include "docsort/snapshot/snapshot_manager.hpp"

#include "docsort/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace docsort::snapshot {
namespace fs = std::filesystem;

namespace {

std::int64_t to_ns(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

} // namespace

Result<std::unique_ptr<SnapshotManager>> SnapshotManager::open(const fs::path& data_dir,
                                                               documents::DocumentStore& documents,
                                                               documents::ObjectStorage& storage,
                                                               events::EventBus* bus) {
    auto kv = storage::KvStore::open(data_dir / kSnapshotDbFileName, "snapshots");
    if (kv.is_error()) {
        return Err<std::unique_ptr<SnapshotManager>>(kv.error());
    }
    return Ok(std::make_unique<SnapshotManager>(std::move(kv.value()), documents, storage, bus));
}

SnapshotManager::SnapshotManager(std::unique_ptr<storage::KvStore> store,
                                 documents::DocumentStore& documents,
                                 documents::ObjectStorage& storage,
                                 events::EventBus* bus)
    : store_(std::move(store)), documents_(documents), storage_(storage), bus_(bus) {}

Result<std::string> SnapshotManager::create_snapshot(const OperationType& operation_type,
                                                     const std::string& description,
                                                     const std::vector<std::string>& file_ids,
                                                     const std::optional<std::string>& batch_id,
                                                     const nlohmann::json& metadata,
                                                     const std::map<std::string, PlannedMove>& planned_moves) {
    if (file_ids.empty()) {
        return Err<std::string>(ErrorCode::InvalidArgument, "snapshot needs at least one file id");
    }

    const auto now = Clock::now();
    Snapshot snapshot;
    snapshot.id = generate_uuid();
    snapshot.operation_type = operation_type;
    snapshot.timestamp = to_iso8601(now);
    snapshot.created_at_ns = to_ns(now);
    snapshot.description = description;
    snapshot.file_ids = file_ids;
    snapshot.batch_id = batch_id;
    snapshot.metadata = metadata.is_object() ? metadata : nlohmann::json::object();

    for (const auto& file_id : file_ids) {
        auto found = documents_.get(file_id);
        if (found.is_error()) {
            return Err<std::string>(found.error());
        }
        const auto& record = found.value();

        DatabaseState db_state;
        db_state.existed = record.has_value();
        if (record) {
            db_state.record = documents::to_json(*record);
        }
        snapshot.database_state[file_id] = db_state;

        fs::path current;
        if (auto planned = planned_moves.find(file_id); planned != planned_moves.end()) {
            snapshot.original_paths[file_id] = planned->second.original.string();
            snapshot.target_paths[file_id] = planned->second.target.string();
            current = planned->second.original;
        } else if (record) {
            snapshot.original_paths[file_id] = record->original_path.string();
            snapshot.target_paths[file_id] = record->target_path.string();
            current = record->target_path.empty() ? record->original_path : record->target_path;
        } else {
            snapshot.original_paths[file_id] = "";
            snapshot.target_paths[file_id] = "";
        }

        StorageState storage_state;
        if (!current.empty()) {
            auto info = storage_.stat(current);
            if (info.is_error()) {
                return Err<std::string>(info.error());
            }
            storage_state.exists = info.value().exists;
            storage_state.metadata = info.value().metadata;
        }
        snapshot.storage_state[file_id] = storage_state;
    }

    if (batch_id) {
        auto batch = documents_.get_batch(*batch_id);
        if (batch.is_error()) {
            return Err<std::string>(batch.error());
        }
        snapshot.batch_state = batch.value();
    }

    if (auto stored = store_->put(snapshot.id, to_json(snapshot)); stored.is_error()) {
        return Err<std::string>(stored.error());
    }

    if (bus_) {
        bus_->emit(events::SnapshotCreatedEvent{snapshot.id, to_string(snapshot.operation_type), file_ids.size()});
    }
    return Ok(snapshot.id);
}

Result<Snapshot> SnapshotManager::get_snapshot(const std::string& id) const {
    auto found = store_->get(id);
    if (found.is_error()) {
        return Err<Snapshot>(found.error());
    }
    if (!found.value()) {
        return Err<Snapshot>(ErrorCode::NotFound, "snapshot not found: " + id);
    }
    return snapshot_from_json(*found.value());
}

Result<std::vector<Snapshot>> SnapshotManager::load_all() const {
    auto entries = store_->entries();
    if (entries.is_error()) {
        return Err<std::vector<Snapshot>>(entries.error());
    }
    std::vector<Snapshot> out;
    out.reserve(entries.value().size());
    for (const auto& [id, value] : entries.value()) {
        auto parsed = snapshot_from_json(value);
        if (parsed.is_error()) {
            spdlog::warn("[Snapshot] skipping unreadable snapshot {}: {}", id, parsed.error().message);
            continue;
        }
        out.push_back(std::move(parsed.value()));
    }
    std::sort(out.begin(), out.end(), [](const Snapshot& a, const Snapshot& b) {
        return a.created_at_ns > b.created_at_ns;
    });
    return Ok(std::move(out));
}

Result<std::vector<Snapshot>> SnapshotManager::list_snapshots(const std::optional<OperationType>& operation_type,
                                                              const std::optional<Clock::time_point>& since,
                                                              std::size_t limit) const {
    auto all = load_all();
    if (all.is_error()) {
        return all;
    }

    std::vector<Snapshot> out;
    for (auto& snapshot : all.value()) {
        if (operation_type && !same_kind(*operation_type, snapshot.operation_type)) {
            continue;
        }
        if (since && snapshot.created_at_ns < to_ns(*since)) {
            continue;
        }
        out.push_back(std::move(snapshot));
        if (limit != 0 && out.size() >= limit) {
            break;
        }
    }
    return Ok(std::move(out));
}

Result<std::size_t> SnapshotManager::cleanup_old_snapshots(int retention_days, Clock::time_point now) {
    auto all = load_all();
    if (all.is_error()) {
        return Err<std::size_t>(all.error());
    }

    const auto cutoff = to_ns(now - std::chrono::hours(24) * retention_days);
    std::size_t removed = 0;
    for (const auto& snapshot : all.value()) {
        if (snapshot.created_at_ns >= cutoff) {
            continue;
        }
        auto erased = store_->erase(snapshot.id);
        if (erased.is_error()) {
            return Err<std::size_t>(erased.error());
        }
        if (erased.value()) {
            ++removed;
        }
    }
    spdlog::info("[Snapshot] cleanup removed={} retention_days={}", removed, retention_days);
    return Ok(removed);
}

} // namespace docsort::snapshot
