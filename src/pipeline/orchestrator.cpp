#include "docsort/pipeline/orchestrator.hpp"

#include "docsort/classify/path_classifier.hpp"
#include "docsort/core/ids.hpp"
#include "docsort/dedup/file_mover.hpp"
#include "docsort/events/events.hpp"
#include "docsort/hashing/content_hasher.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <system_error>
#include <unordered_map>

namespace docsort::pipeline {
namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr std::size_t kClassifySampleBytes = 4096;

void replace_all(std::string& text, const std::string& token, const std::string& value) {
    for (auto pos = text.find(token); pos != std::string::npos; pos = text.find(token, pos + value.size())) {
        text.replace(pos, token.size(), value);
    }
}

// One directory name: separators become '_', and "", "." and ".." are
// replaced so a classifier value can never climb out of its parent.
std::string path_segment(std::string value) {
    for (auto& c : value) {
        if (c == '/' || c == '\\') {
            c = '_';
        }
    }
    if (value.empty() || value == "." || value == "..") {
        return "_";
    }
    return value;
}

bool is_within(const fs::path& base, const fs::path& candidate) {
    const fs::path relative = candidate.lexically_normal().lexically_relative(base.lexically_normal());
    return !relative.empty() && *relative.begin() != "..";
}

// Next free name in `dir` that is neither on disk nor already handed out.
fs::path reserve_in(const fs::path& dir, const fs::path& filename, std::set<fs::path>& reserved) {
    std::error_code ec;
    fs::path candidate = dir / filename;
    const std::string stem = filename.stem().string();
    const std::string ext = filename.extension().string();
    for (std::size_t counter = 1; fs::exists(candidate, ec) || reserved.count(candidate) > 0; ++counter) {
        candidate = dir / (stem + "_" + std::to_string(counter) + ext);
    }
    reserved.insert(candidate);
    return candidate;
}

std::string backup_stamp() {
    const std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%S", &utc);
    return buffer;
}

json optional_path(const std::optional<fs::path>& value) {
    return value ? json(value->string()) : json(nullptr);
}

json optional_string(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

const char* to_string(ProcessingStatus status) {
    switch (status) {
        case ProcessingStatus::Processed: return "processed";
        case ProcessingStatus::Duplicate: return "duplicate";
        case ProcessingStatus::Review: return "review";
        case ProcessingStatus::Failed: return "failed";
    }
    return "failed";
}

json to_json(const ProcessingResult& result) {
    return json{
        {"source", result.source.string()},
        {"document_id", result.document_id},
        {"status", to_string(result.status)},
        {"message", result.message},
        {"classification", classify::to_json(result.classification)},
        {"target_path", optional_path(result.target_path)},
        {"backup_path", optional_path(result.backup_path)},
        {"snapshot_id", optional_string(result.snapshot_id)},
        {"review_id", optional_string(result.review_id)},
    };
}

json to_json(const BatchResult& result) {
    json results = json::array();
    for (const auto& item : result.results) {
        results.push_back(to_json(item));
    }
    return json{
        {"batch", documents::to_json(result.batch)},
        {"snapshot_id", optional_string(result.snapshot_id)},
        {"results", results},
    };
}

DocumentProcessingOrchestrator::DocumentProcessingOrchestrator(const config::Config& config,
                                                               documents::DocumentStore& documents,
                                                               documents::ObjectStorage& storage,
                                                               review::ReviewStore& reviews,
                                                               snapshot::SnapshotManager* snapshots,
                                                               std::shared_ptr<classify::Classifier> model,
                                                               events::EventBus* bus)
    : config_(config),
      documents_(documents),
      storage_(storage),
      reviews_(reviews),
      snapshots_(snapshots),
      model_(std::move(model)),
      bus_(bus) {}

ProcessingResult DocumentProcessingOrchestrator::process_file(const fs::path& path) {
    Plan planned = plan(path);
    if (planned.settled) {
        return finish(std::move(*planned.settled));
    }
    if (planned.classification.confidence < config_.review.confidence_threshold) {
        return finish(route_to_review(planned));
    }

    std::set<fs::path> reserved;
    planned.target = reserve_in(planned.target.parent_path(), planned.target.filename(), reserved);

    std::optional<std::string> snapshot_id;
    if (snapshots_ && config_.snapshots.enabled) {
        auto created = snapshots_->create_snapshot(
            snapshot::op::FileProcessing{},
            "process " + path.filename().string(),
            {planned.digest},
            std::nullopt,
            json{{"source", path.string()}},
            {{planned.digest, snapshot::PlannedMove{planned.source, planned.target}}});
        if (created.is_error()) {
            ProcessingResult failed;
            failed.source = path;
            failed.document_id = planned.digest;
            failed.classification = planned.classification;
            failed.message = "snapshot failed: " + created.error().message;
            return finish(std::move(failed));
        }
        snapshot_id = created.value();
    }
    return finish(execute(planned, snapshot_id));
}

Result<BatchResult> DocumentProcessingOrchestrator::process_batch(const std::vector<fs::path>& paths) {
    BatchResult out;
    out.batch.id = generate_uuid();
    out.batch.status = documents::BatchStatus::Running;
    out.batch.total_files = paths.size();
    out.batch.started_at = to_iso8601(Clock::now());
    if (auto stored = documents_.put_batch(out.batch); stored.is_error()) {
        return Err<BatchResult>(stored.error());
    }
    spdlog::info("[Pipeline] batch {} started files={}", out.batch.id, paths.size());

    const std::size_t workers = std::max<std::size_t>(1, config_.processing.workers);
    std::vector<Plan> plans(paths.size());
    {
        boost::asio::thread_pool pool(workers);
        for (std::size_t i = 0; i < paths.size(); ++i) {
            boost::asio::post(pool, [this, &plans, &paths, i]() {
                plans[i] = plan(paths[i]);
            });
        }
        pool.join();
    }

    // Same content twice in one batch: the first occurrence is processed.
    std::unordered_map<std::string, fs::path> first_seen;
    std::set<fs::path> reserved;
    std::vector<std::string> moving_ids;
    std::map<std::string, snapshot::PlannedMove> planned_moves;
    for (auto& p : plans) {
        if (p.settled) {
            continue;
        }
        auto [it, inserted] = first_seen.emplace(p.digest, p.source);
        if (!inserted) {
            ProcessingResult duplicate;
            duplicate.source = p.source;
            duplicate.document_id = p.digest;
            duplicate.status = ProcessingStatus::Duplicate;
            duplicate.classification = p.classification;
            duplicate.message = "duplicate of " + it->second.string();
            p.settled = std::move(duplicate);
            continue;
        }
        if (p.classification.confidence < config_.review.confidence_threshold) {
            continue;
        }
        p.target = reserve_in(p.target.parent_path(), p.target.filename(), reserved);
        moving_ids.push_back(p.digest);
        planned_moves[p.digest] = snapshot::PlannedMove{p.source, p.target};
    }

    if (snapshots_ && config_.snapshots.enabled && !moving_ids.empty()) {
        auto created = snapshots_->create_snapshot(
            snapshot::op::BatchProcessing{},
            "batch " + out.batch.id,
            moving_ids,
            out.batch.id,
            json{{"total_files", paths.size()}},
            planned_moves);
        if (created.is_error()) {
            out.batch.status = documents::BatchStatus::Failed;
            out.batch.completed_at = to_iso8601(Clock::now());
            if (auto stored = documents_.put_batch(out.batch); stored.is_error()) {
                spdlog::error("[Pipeline] batch {} status not saved: {}", out.batch.id, stored.error().message);
            }
            return Err<BatchResult>(created.error());
        }
        out.snapshot_id = created.value();
    }

    out.results.resize(plans.size());
    {
        boost::asio::thread_pool pool(workers);
        for (std::size_t i = 0; i < plans.size(); ++i) {
            boost::asio::post(pool, [this, &plans, &out, i]() {
                auto& p = plans[i];
                ProcessingResult result = p.settled ? std::move(*p.settled) : execute(p, out.snapshot_id);
                result = finish(std::move(result));

                const bool failed = result.status == ProcessingStatus::Failed;
                auto progress = documents_.add_batch_progress(out.batch.id, failed ? 0 : 1, failed ? 1 : 0);
                if (progress.is_error()) {
                    spdlog::error("[Pipeline] batch {} progress not saved: {}", out.batch.id, progress.error().message);
                }
                out.results[i] = std::move(result);
            });
        }
        pool.join();
    }

    auto latest = documents_.get_batch(out.batch.id);
    if (latest.is_error()) {
        return Err<BatchResult>(latest.error());
    }
    if (latest.value()) {
        out.batch = *latest.value();
    }
    out.batch.status = out.batch.failed_files == 0 ? documents::BatchStatus::Completed
                                                   : documents::BatchStatus::CompletedWithErrors;
    out.batch.completed_at = to_iso8601(Clock::now());
    if (auto stored = documents_.put_batch(out.batch); stored.is_error()) {
        return Err<BatchResult>(stored.error());
    }

    spdlog::info("[Pipeline] batch {} done processed={} failed={}",
                 out.batch.id, out.batch.processed_files, out.batch.failed_files);
    return Ok(std::move(out));
}

DocumentProcessingOrchestrator::Plan DocumentProcessingOrchestrator::plan(const fs::path& path) const {
    Plan p;
    p.source = path;

    auto fail = [&p](const std::string& message) {
        ProcessingResult failed;
        failed.source = p.source;
        failed.document_id = p.digest;
        failed.message = message;
        p.settled = std::move(failed);
    };

    auto st = stat_file(path);
    if (st.is_error()) {
        fail(st.error().message);
        return p;
    }
    p.stat = st.value();

    auto digest = hashing::ContentHasher().hash(path);
    if (digest.is_error()) {
        fail(digest.error().message);
        return p;
    }
    p.digest = digest.value();

    auto existing = documents_.get(p.digest);
    if (existing.is_error()) {
        fail(existing.error().message);
        return p;
    }
    if (existing.value() && existing.value()->status != documents::DocumentStatus::Failed) {
        const auto& record = *existing.value();
        ProcessingResult duplicate;
        duplicate.source = path;
        duplicate.document_id = p.digest;
        duplicate.status = ProcessingStatus::Duplicate;
        duplicate.classification = classify::classification_from_json(record.classification);
        const auto& known = record.target_path.empty() ? record.original_path : record.target_path;
        duplicate.message = "duplicate of " + known.string();
        p.settled = std::move(duplicate);
        return p;
    }

    p.classification = classify_content(path);
    auto target = render_target(p);
    if (target.is_error()) {
        fail(target.error().message);
        return p;
    }
    p.target = target.value();
    return p;
}

ProcessingResult DocumentProcessingOrchestrator::execute(Plan& p, std::optional<std::string> snapshot_id) {
    if (p.classification.confidence < config_.review.confidence_threshold) {
        return route_to_review(p);
    }

    ProcessingResult result;
    result.source = p.source;
    result.document_id = p.digest;
    result.classification = p.classification;
    result.snapshot_id = std::move(snapshot_id);

    if (config_.processing.backup_enabled) {
        auto backup = make_backup(p);
        if (backup.is_error()) {
            result.message = "backup failed: " + backup.error().message;
            return result;
        }
        result.backup_path = backup.value();
    }

    if (auto moved = storage_.move(p.source, p.target); moved.is_error()) {
        result.message = "move failed: " + moved.error().message;
        return result;
    }

    const std::string now = to_iso8601(Clock::now());
    documents::DocumentRecord record;
    record.id = p.digest;
    record.filename = p.source.filename().string();
    record.original_path = p.source;
    record.target_path = p.target;
    record.category = p.classification.category;
    record.customer = p.classification.customer;
    record.project = p.classification.project;
    record.tags = p.classification.tags;
    record.metadata = json{{"size", p.stat.size}, {"mtime", p.stat.mtime}};
    if (result.backup_path) {
        record.metadata["backup_path"] = result.backup_path->string();
    }
    record.classification = classify::to_json(p.classification);
    record.status = documents::DocumentStatus::Processed;
    record.created_at = now;
    record.updated_at = now;

    if (auto stored = documents_.put(record); stored.is_error()) {
        // keep disk and records in agreement
        if (auto back = storage_.move(p.target, p.source); back.is_error()) {
            spdlog::error("[Pipeline] could not return {} to {}: {}",
                          p.target.string(), p.source.string(), back.error().message);
        }
        result.message = "record not saved: " + stored.error().message;
        return result;
    }

    result.status = ProcessingStatus::Processed;
    result.target_path = p.target;
    result.message = "moved to " + p.target.string();
    return result;
}

ProcessingResult DocumentProcessingOrchestrator::route_to_review(const Plan& p) {
    ProcessingResult result;
    result.source = p.source;
    result.document_id = p.digest;
    result.classification = p.classification;

    review::ReviewItem item;
    item.original_path = p.source;
    item.filename = p.source.filename().string();
    item.size = p.stat.size;
    item.mtime = p.stat.mtime;
    item.suggested_category = p.classification.category;
    item.confidence = p.classification.confidence;
    item.customer = p.classification.customer;
    item.project = p.classification.project;
    item.tags = p.classification.tags;
    item.metadata = json{{"document_id", p.digest}, {"source", p.classification.source}};

    auto added = reviews_.add(item);
    if (added.is_error()) {
        result.message = "review queue failed: " + added.error().message;
        return result;
    }

    const std::string now = to_iso8601(Clock::now());
    documents::DocumentRecord record;
    record.id = p.digest;
    record.filename = item.filename;
    record.original_path = p.source;
    record.category = p.classification.category;
    record.customer = p.classification.customer;
    record.project = p.classification.project;
    record.tags = p.classification.tags;
    record.metadata = json{{"size", p.stat.size}, {"mtime", p.stat.mtime}, {"review_id", added.value()}};
    record.classification = classify::to_json(p.classification);
    record.status = documents::DocumentStatus::Review;
    record.created_at = now;
    record.updated_at = now;
    if (auto stored = documents_.put(record); stored.is_error()) {
        spdlog::warn("[Pipeline] review record for {} not saved: {}", p.digest, stored.error().message);
    }

    result.status = ProcessingStatus::Review;
    result.review_id = added.value();
    result.message = "queued for review";
    return result;
}

ProcessingResult DocumentProcessingOrchestrator::finish(ProcessingResult result) {
    if (result.status == ProcessingStatus::Failed) {
        spdlog::warn("[Pipeline] {} failed: {}", result.source.string(), result.message);
    }
    if (bus_) {
        bus_->emit(events::DocumentProcessedEvent{
            result.document_id,
            result.source.filename().string(),
            to_string(result.status),
            result.classification.category,
            result.target_path ? result.target_path->string() : std::string(),
        });
    }
    return result;
}

classify::ClassificationResult DocumentProcessingOrchestrator::classify_content(const fs::path& path) const {
    std::string sample(kClassifySampleBytes, '\0');
    {
        std::ifstream input(path, std::ios::binary);
        input.read(sample.data(), static_cast<std::streamsize>(sample.size()));
        sample.resize(static_cast<std::size_t>(std::max<std::streamsize>(0, input.gcount())));
    }

    const std::string filename = path.filename().string();
    if (model_) {
        auto classified = model_->classify(sample, filename);
        if (classified.is_ok()) {
            auto result = classified.value();
            if (result.source.empty()) {
                result.source = "model";
            }
            return result;
        }
        spdlog::warn("[Pipeline] model classification failed for {}: {}; using keywords",
                     filename, classified.error().message);
    }
    return fallback_.classify_text(sample, filename);
}

Result<fs::path> DocumentProcessingOrchestrator::render_target(const Plan& p) const {
    const auto& patterns = config_.processing.category_paths;
    auto it = patterns.find(p.classification.category);
    if (it == patterns.end()) {
        it = patterns.find("unsorted");
    }
    std::string pattern = it != patterns.end() ? it->second : "{customer}/Unsorted";

    const std::string customer = p.classification.customer
        ? *p.classification.customer
        : classify::customer_root(p.source, config_.internal_roots);
    const std::string project = p.classification.project ? *p.classification.project : classify::kDefaultSubfolder;

    replace_all(pattern, "{customer}", path_segment(customer));
    replace_all(pattern, "{project}", path_segment(project));
    replace_all(pattern, "{year}", std::to_string(classify::year_of(p.stat.mtime)));

    fs::path target = config_.central_base / fs::path(pattern).relative_path() / p.source.filename();
    if (!is_within(config_.central_base, target.parent_path())) {
        return Err<fs::path>(ErrorCode::InvalidArgument,
                             "target " + target.string() + " is outside " + config_.central_base.string());
    }
    return Ok(std::move(target));
}

Result<fs::path> DocumentProcessingOrchestrator::make_backup(const Plan& p) {
    // batch workers pick backup names from the same directory
    std::lock_guard lock(backup_mutex_);
    std::error_code ec;
    fs::create_directories(config_.processing.backup_dir, ec);
    if (ec) {
        return Err<fs::path>(ErrorCode::IoError,
            "cannot create " + config_.processing.backup_dir.string() + ": " + ec.message());
    }
    const fs::path name = backup_stamp() + "_" + p.source.filename().string();
    const fs::path destination = dedup::unique_destination(config_.processing.backup_dir, name);
    if (auto copied = storage_.copy(p.source, destination); copied.is_error()) {
        return Err<fs::path>(copied.error());
    }
    return Ok(destination);
}

} // namespace docsort::pipeline
