#pragma once

#include "docsort/core/result.hpp"
#include "docsort/documents/document_store.hpp"
#include "docsort/documents/object_storage.hpp"
#include "docsort/events/event_bus.hpp"
#include "docsort/snapshot/snapshot_manager.hpp"
#include "docsort/snapshot/types.hpp"

#include <string>

namespace docsort::snapshot {

/**
 * @brief Restores the state captured in a snapshot
 *
 * Dispatches on the snapshot's operation type. Failures are per file: each
 * one is recorded in the result and the remaining files are still restored.
 */
class RollbackService {
public:
    RollbackService(SnapshotManager& snapshots,
                    documents::DocumentStore& documents,
                    documents::ObjectStorage& storage,
                    events::EventBus* bus = nullptr);

    RollbackResult rollback(const std::string& snapshot_id);

private:
    struct Dispatch;

    void restore_full(const Snapshot& snapshot, RollbackResult& result);
    void restore_batch(const Snapshot& snapshot, RollbackResult& result);
    void restore_metadata(const Snapshot& snapshot, RollbackResult& result);
    void restore_classification(const Snapshot& snapshot, RollbackResult& result);
    void restore_storage(const Snapshot& snapshot, RollbackResult& result);

    Result<void> restore_record(const Snapshot& snapshot, const std::string& file_id);
    Result<void> restore_location(const Snapshot& snapshot, const std::string& file_id);

    SnapshotManager& snapshots_;
    documents::DocumentStore& documents_;
    documents::ObjectStorage& storage_;
    events::EventBus* bus_;
};

} // namespace docsort::snapshot
