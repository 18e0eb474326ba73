#pragma once

#include "docsort/core/ids.hpp"
#include "docsort/core/result.hpp"
#include "docsort/documents/document_store.hpp"
#include "docsort/documents/object_storage.hpp"
#include "docsort/events/event_bus.hpp"
#include "docsort/snapshot/types.hpp"
#include "docsort/storage/kv_store.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docsort::snapshot {

inline constexpr const char* kSnapshotDbFileName = "snapshots.db";

/**
 * @brief Captures pre-mutation state
 *
 * create_snapshot() returns only after the snapshot is durable, so a crash
 * during the guarded mutation can still be rolled back.
 */
class SnapshotManager {
public:
    static Result<std::unique_ptr<SnapshotManager>> open(const std::filesystem::path& data_dir,
                                                         documents::DocumentStore& documents,
                                                         documents::ObjectStorage& storage,
                                                         events::EventBus* bus = nullptr);

    SnapshotManager(std::unique_ptr<storage::KvStore> store,
                    documents::DocumentStore& documents,
                    documents::ObjectStorage& storage,
                    events::EventBus* bus = nullptr);

    // ErrorCode::InvalidArgument when file_ids is empty.
    Result<std::string> create_snapshot(const OperationType& operation_type,
                                        const std::string& description,
                                        const std::vector<std::string>& file_ids,
                                        const std::optional<std::string>& batch_id = std::nullopt,
                                        const nlohmann::json& metadata = nlohmann::json::object(),
                                        const std::map<std::string, PlannedMove>& planned_moves = {});

    Result<Snapshot> get_snapshot(const std::string& id) const;

    // Newest first; `limit` 0 means no limit.
    Result<std::vector<Snapshot>> list_snapshots(const std::optional<OperationType>& operation_type = std::nullopt,
                                                 const std::optional<Clock::time_point>& since = std::nullopt,
                                                 std::size_t limit = 50) const;

    // Deletes snapshots created before `now - retention_days`; returns the count.
    Result<std::size_t> cleanup_old_snapshots(int retention_days, Clock::time_point now = Clock::now());

private:
    Result<std::vector<Snapshot>> load_all() const;

    std::unique_ptr<storage::KvStore> store_;
    documents::DocumentStore& documents_;
    documents::ObjectStorage& storage_;
    events::EventBus* bus_;
};

} // namespace docsort::snapshot
