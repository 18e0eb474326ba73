#pragma once

#include "docsort/core/result.hpp"
#include "docsort/crawler/crawler.hpp"
#include "docsort/dedup/quarantine.hpp"
#include "docsort/pipeline/orchestrator.hpp"
#include "docsort/review/review_store.hpp"
#include "docsort/snapshot/rollback_service.hpp"
#include "docsort/snapshot/snapshot_manager.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace docsort::api {

enum class ReplyStatus {
    Ok,
    BadRequest,
    NotFound,
    Conflict,
    InternalError
};

const char* to_string(ReplyStatus status);
int http_status(ReplyStatus status);

struct Reply {
    ReplyStatus status = ReplyStatus::Ok;
    nlohmann::json body = nlohmann::json::object();
};

Reply error_reply(const Error& error);

/**
 * @brief Operator-facing operations with JSON replies
 *
 * Transport-agnostic: a router or the CLI forwards its arguments here and
 * renders the Reply.
 */
class ControlSurface {
public:
    ControlSurface(crawler::Crawler& crawler,
                   dedup::QuarantineService& quarantine,
                   review::ReviewStore& reviews,
                   snapshot::SnapshotManager& snapshots,
                   snapshot::RollbackService& rollback,
                   pipeline::DocumentProcessingOrchestrator& pipeline,
                   int snapshot_retention_days);

    Reply crawler_start();
    Reply crawler_stop();
    Reply crawler_status() const;

    Reply list_duplicates(const std::optional<std::string>& customer, std::size_t limit, std::size_t offset) const;
    Reply promote_duplicate(const std::string& path);
    Reply move_duplicate(const std::string& path, const std::string& target_dir);
    Reply delete_duplicates(const std::vector<std::string>& paths);

    Reply list_pending(const review::ReviewFilter& filter) const;
    Reply confirm_review(const std::string& id, const std::string& category);

    Reply list_snapshots(std::size_t limit, const std::optional<std::string>& operation_type = std::nullopt) const;
    Reply rollback_snapshot(const std::string& id);
    Reply cleanup_snapshots();

    Reply process_files(const std::vector<std::string>& paths, bool batch);

private:
    crawler::Crawler& crawler_;
    dedup::QuarantineService& quarantine_;
    review::ReviewStore& reviews_;
    snapshot::SnapshotManager& snapshots_;
    snapshot::RollbackService& rollback_;
    pipeline::DocumentProcessingOrchestrator& pipeline_;
    int retention_days_;
};

} // namespace docsort::api
