#include "docsort/snapshot/rollback_service.hpp"

#include "docsort/core/ids.hpp"
#include "docsort/events/events.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <functional>

namespace docsort::snapshot {
namespace fs = std::filesystem;

namespace {

std::string path_for(const std::map<std::string, std::string>& paths, const std::string& file_id) {
    auto it = paths.find(file_id);
    return it == paths.end() ? std::string() : it->second;
}

// Runs `step` for every file id, collecting failures without stopping.
void for_each_file(const Snapshot& snapshot, RollbackResult& result,
                   const std::function<Result<void>(const std::string&)>& step) {
    for (const auto& file_id : snapshot.file_ids) {
        auto restored = step(file_id);
        if (restored.is_ok()) {
            ++result.files_restored;
        } else {
            ++result.files_failed;
            result.errors.push_back(file_id + ": " + restored.error().message);
        }
    }
}

Result<documents::DocumentRecord> captured_record(const Snapshot& snapshot, const std::string& file_id) {
    auto it = snapshot.database_state.find(file_id);
    if (it == snapshot.database_state.end() || !it->second.existed) {
        return Err<documents::DocumentRecord>(ErrorCode::NotFound, "no document record captured");
    }
    return Ok(documents::document_from_json(it->second.record));
}

} // namespace

struct RollbackService::Dispatch {
    RollbackService& service;
    const Snapshot& snapshot;
    RollbackResult& result;

    void operator()(const op::FileProcessing&) const { service.restore_full(snapshot, result); }
    void operator()(const op::BatchProcessing&) const { service.restore_batch(snapshot, result); }
    void operator()(const op::MetadataUpdate&) const { service.restore_metadata(snapshot, result); }
    void operator()(const op::Classification&) const { service.restore_classification(snapshot, result); }
    void operator()(const op::StorageMove&) const { service.restore_storage(snapshot, result); }
};

RollbackService::RollbackService(SnapshotManager& snapshots,
                                 documents::DocumentStore& documents,
                                 documents::ObjectStorage& storage,
                                 events::EventBus* bus)
    : snapshots_(snapshots), documents_(documents), storage_(storage), bus_(bus) {}

RollbackResult RollbackService::rollback(const std::string& snapshot_id) {
    const auto begin = std::chrono::steady_clock::now();
    RollbackResult result;

    auto snapshot = snapshots_.get_snapshot(snapshot_id);
    if (snapshot.is_error()) {
        result.success = false;
        result.message = "Rollback failed: " + snapshot.error().message;
        result.errors.push_back(snapshot.error().message);
    } else {
        std::visit(Dispatch{*this, snapshot.value(), result}, snapshot.value().operation_type);
        result.success = result.files_failed == 0 && result.errors.empty();
        result.message = result.success
            ? "Rollback completed: " + std::to_string(result.files_restored) + " files restored"
            : "Rollback completed with errors: " + std::to_string(result.files_failed) + " files failed";
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin);
    if (bus_) {
        bus_->emit(events::RollbackCompletedEvent{snapshot_id, result.success, result.files_restored,
                                                  result.files_failed, result.duration});
    }
    return result;
}

void RollbackService::restore_full(const Snapshot& snapshot, RollbackResult& result) {
    for_each_file(snapshot, result, [&](const std::string& file_id) -> Result<void> {
        if (auto moved = restore_location(snapshot, file_id); moved.is_error()) {
            return moved;
        }
        return restore_record(snapshot, file_id);
    });
}

void RollbackService::restore_batch(const Snapshot& snapshot, RollbackResult& result) {
    restore_full(snapshot, result);

    if (!snapshot.batch_id) {
        return;
    }
    if (!snapshot.batch_state) {
        result.errors.push_back("batch " + *snapshot.batch_id + ": no captured batch state");
        return;
    }
    if (auto stored = documents_.put_batch(*snapshot.batch_state); stored.is_error()) {
        result.errors.push_back("batch " + *snapshot.batch_id + ": " + stored.error().message);
    }
}

void RollbackService::restore_metadata(const Snapshot& snapshot, RollbackResult& result) {
    for_each_file(snapshot, result, [&](const std::string& file_id) -> Result<void> {
        auto captured = captured_record(snapshot, file_id);
        if (captured.is_error()) {
            return Err<void>(captured.error());
        }
        auto current = documents_.get(file_id);
        if (current.is_error()) {
            return Err<void>(current.error());
        }
        if (!current.value()) {
            return Err<void>(ErrorCode::NotFound, "no document record to restore metadata into");
        }
        auto record = *current.value();
        record.metadata = captured.value().metadata;
        record.tags = captured.value().tags;
        record.classification = captured.value().classification;
        record.updated_at = to_iso8601(Clock::now());
        return documents_.put(record);
    });
}

void RollbackService::restore_classification(const Snapshot& snapshot, RollbackResult& result) {
    for_each_file(snapshot, result, [&](const std::string& file_id) -> Result<void> {
        auto captured = captured_record(snapshot, file_id);
        if (captured.is_error()) {
            return Err<void>(captured.error());
        }
        auto current = documents_.get(file_id);
        if (current.is_error()) {
            return Err<void>(current.error());
        }
        if (!current.value()) {
            return Err<void>(ErrorCode::NotFound, "no document record to restore classification into");
        }
        auto record = *current.value();
        record.classification = captured.value().classification;
        record.category = captured.value().category;
        record.updated_at = to_iso8601(Clock::now());
        return documents_.put(record);
    });
}

void RollbackService::restore_storage(const Snapshot& snapshot, RollbackResult& result) {
    for_each_file(snapshot, result, [&](const std::string& file_id) {
        return restore_location(snapshot, file_id);
    });
}

Result<void> RollbackService::restore_record(const Snapshot& snapshot, const std::string& file_id) {
    auto it = snapshot.database_state.find(file_id);
    if (it == snapshot.database_state.end()) {
        return Err<void>(ErrorCode::Internal, "snapshot holds no database state");
    }
    if (!it->second.existed) {
        auto erased = documents_.erase(file_id);
        if (erased.is_error()) {
            return Err<void>(erased.error());
        }
        return Ok();
    }
    return documents_.put(documents::document_from_json(it->second.record));
}

Result<void> RollbackService::restore_location(const Snapshot& snapshot, const std::string& file_id) {
    const fs::path original = path_for(snapshot.original_paths, file_id);
    const fs::path target = path_for(snapshot.target_paths, file_id);
    if (original.empty() || target.empty() || original == target) {
        return Ok();
    }

    auto at_target = storage_.stat(target);
    if (at_target.is_error()) {
        return Err<void>(at_target.error());
    }
    if (at_target.value().exists) {
        auto moved = storage_.move(target, original);
        if (moved.is_ok()) {
            spdlog::debug("[Rollback] {} -> {}", target.string(), original.string());
        }
        return moved;
    }

    auto at_original = storage_.stat(original);
    if (at_original.is_error()) {
        return Err<void>(at_original.error());
    }
    if (at_original.value().exists) {
        // the guarded move never happened
        return Ok();
    }
    return Err<void>(ErrorCode::NotFound, "file missing at both " + target.string() + " and " + original.string());
}

} // namespace docsort::snapshot
