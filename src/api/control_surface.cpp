#include "docsort/api/control_surface.hpp"

namespace docsort::api {
using nlohmann::json;

namespace {

constexpr std::size_t kMaxPageSize = 1000;

Reply ok(json body) {
    return Reply{ReplyStatus::Ok, std::move(body)};
}

Reply bad_request(const std::string& message) {
    return Reply{ReplyStatus::BadRequest, json{{"error", message}, {"code", "invalid_argument"}}};
}

json snapshot_summary(const snapshot::Snapshot& s) {
    return json{
        {"id", s.id},
        {"operation_type", snapshot::to_string(s.operation_type)},
        {"timestamp", s.timestamp},
        {"description", s.description},
        {"file_ids", s.file_ids},
        {"batch_id", s.batch_id ? json(*s.batch_id) : json(nullptr)},
        {"metadata", s.metadata},
    };
}

} // namespace

const char* to_string(ReplyStatus status) {
    switch (status) {
        case ReplyStatus::Ok: return "ok";
        case ReplyStatus::BadRequest: return "bad_request";
        case ReplyStatus::NotFound: return "not_found";
        case ReplyStatus::Conflict: return "conflict";
        case ReplyStatus::InternalError: return "internal_error";
    }
    return "internal_error";
}

int http_status(ReplyStatus status) {
    switch (status) {
        case ReplyStatus::Ok: return 200;
        case ReplyStatus::BadRequest: return 400;
        case ReplyStatus::NotFound: return 404;
        case ReplyStatus::Conflict: return 409;
        case ReplyStatus::InternalError: return 500;
    }
    return 500;
}

Reply error_reply(const Error& error) {
    ReplyStatus status = ReplyStatus::InternalError;
    switch (error.code) {
        case ErrorCode::NotFound: status = ReplyStatus::NotFound; break;
        case ErrorCode::Conflict: status = ReplyStatus::Conflict; break;
        case ErrorCode::InvalidArgument: status = ReplyStatus::BadRequest; break;
        case ErrorCode::Config:
        case ErrorCode::IoError:
        case ErrorCode::Storage:
        case ErrorCode::Internal: status = ReplyStatus::InternalError; break;
    }
    return Reply{status, json{{"error", error.message}, {"code", to_string(error.code)}}};
}

ControlSurface::ControlSurface(crawler::Crawler& crawler,
                               dedup::QuarantineService& quarantine,
                               review::ReviewStore& reviews,
                               snapshot::SnapshotManager& snapshots,
                               snapshot::RollbackService& rollback,
                               pipeline::DocumentProcessingOrchestrator& pipeline,
                               int snapshot_retention_days)
    : crawler_(crawler),
      quarantine_(quarantine),
      reviews_(reviews),
      snapshots_(snapshots),
      rollback_(rollback),
      pipeline_(pipeline),
      retention_days_(snapshot_retention_days) {}

Reply ControlSurface::crawler_start() {
    auto started = crawler_.start();
    if (started.is_error()) {
        return error_reply(started.error());
    }
    return ok({{"status", "started"}});
}

Reply ControlSurface::crawler_stop() {
    return ok({{"status", crawler_.stop()}});
}

Reply ControlSurface::crawler_status() const {
    return ok(crawler::to_json(crawler_.status()));
}

Reply ControlSurface::list_duplicates(const std::optional<std::string>& customer,
                                      std::size_t limit, std::size_t offset) const {
    if (limit == 0 || limit > kMaxPageSize) {
        return bad_request("limit must be within 1.." + std::to_string(kMaxPageSize));
    }
    const auto page = quarantine_.list(customer, limit, offset);
    json items = json::array();
    for (const auto& item : page.items) {
        items.push_back({
            {"customer_root", item.customer_root},
            {"filename", item.filename},
            {"path", item.path.string()},
            {"size", item.size},
            {"mtime", item.mtime},
        });
    }
    return ok({{"items", items}, {"total", page.total}});
}

Reply ControlSurface::promote_duplicate(const std::string& path) {
    if (path.empty()) {
        return bad_request("path is required");
    }
    auto promoted = quarantine_.promote(path);
    if (promoted.is_error()) {
        return error_reply(promoted.error());
    }
    const auto& outcome = promoted.value();
    json body{{"promoted", true}, {"primary", outcome.primary_path.string()}};
    if (outcome.replaced_missing_primary) {
        body["replaced_missing_primary"] = true;
    }
    if (outcome.previous_primary) {
        body["previous_primary"] = outcome.previous_primary->string();
    }
    return ok(std::move(body));
}

Reply ControlSurface::move_duplicate(const std::string& path, const std::string& target_dir) {
    if (path.empty() || target_dir.empty()) {
        return bad_request("path and target_dir are required");
    }
    auto moved = quarantine_.move(path, target_dir);
    if (moved.is_error()) {
        return error_reply(moved.error());
    }
    return ok({{"moved", true}, {"destination", moved.value().string()}});
}

Reply ControlSurface::delete_duplicates(const std::vector<std::string>& paths) {
    const auto outcome = quarantine_.remove(paths);
    json failed = json::array();
    for (const auto& failure : outcome.failed) {
        failed.push_back({{"path", failure.path}, {"error", failure.error}});
    }
    return ok({{"deleted", outcome.deleted}, {"failed", failed}});
}

Reply ControlSurface::list_pending(const review::ReviewFilter& filter) const {
    auto pending = reviews_.list_pending(filter);
    if (pending.is_error()) {
        return error_reply(pending.error());
    }
    json items = json::array();
    for (const auto& item : pending.value()) {
        items.push_back(review::to_json(item));
    }
    return ok({{"items", items}, {"total", pending.value().size()}});
}

Reply ControlSurface::confirm_review(const std::string& id, const std::string& category) {
    if (id.empty() || category.empty()) {
        return bad_request("id and category are required");
    }
    auto confirmed = reviews_.confirm(id, category);
    if (confirmed.is_error()) {
        return error_reply(confirmed.error());
    }
    return ok({{"status", "confirmed"}, {"moved_to", confirmed.value().string()}});
}

Reply ControlSurface::list_snapshots(std::size_t limit, const std::optional<std::string>& operation_type) const {
    std::optional<snapshot::OperationType> kind;
    if (operation_type) {
        kind = snapshot::operation_type_from_string(*operation_type);
        if (!kind) {
            return bad_request("unknown operation_type: " + *operation_type);
        }
    }
    auto listed = snapshots_.list_snapshots(kind, std::nullopt, limit);
    if (listed.is_error()) {
        return error_reply(listed.error());
    }
    json items = json::array();
    for (const auto& s : listed.value()) {
        items.push_back(snapshot_summary(s));
    }
    return ok({{"snapshots", items}, {"total", items.size()}});
}

Reply ControlSurface::rollback_snapshot(const std::string& id) {
    if (auto found = snapshots_.get_snapshot(id); found.is_error()) {
        return error_reply(found.error());
    }
    const auto result = rollback_.rollback(id);
    return ok(snapshot::to_json(result));
}

Reply ControlSurface::cleanup_snapshots() {
    auto removed = snapshots_.cleanup_old_snapshots(retention_days_);
    if (removed.is_error()) {
        return error_reply(removed.error());
    }
    return ok({{"removed", removed.value()}, {"retention_days", retention_days_}});
}

Reply ControlSurface::process_files(const std::vector<std::string>& paths, bool batch) {
    if (paths.empty()) {
        return bad_request("at least one path is required");
    }
    if (!batch) {
        json results = json::array();
        for (const auto& path : paths) {
            results.push_back(pipeline::to_json(pipeline_.process_file(path)));
        }
        return ok({{"results", results}});
    }

    std::vector<std::filesystem::path> inputs(paths.begin(), paths.end());
    auto processed = pipeline_.process_batch(inputs);
    if (processed.is_error()) {
        return error_reply(processed.error());
    }
    return ok(pipeline::to_json(processed.value()));
}

} // namespace docsort::api
