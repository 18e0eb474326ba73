#pragma once

#include "docsort/classify/classifier.hpp"
#include "docsort/config/config.hpp"
#include "docsort/core/file_stat.hpp"
#include "docsort/core/result.hpp"
#include "docsort/documents/document_store.hpp"
#include "docsort/documents/object_storage.hpp"
#include "docsort/events/event_bus.hpp"
#include "docsort/review/review_store.hpp"
#include "docsort/snapshot/snapshot_manager.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace docsort::pipeline {

enum class ProcessingStatus {
    Processed,   // moved to its category destination and recorded
    Duplicate,   // content already known, nothing moved
    Review,      // confidence below threshold, queued for an operator
    Failed
};

const char* to_string(ProcessingStatus status);

struct ProcessingResult {
    std::filesystem::path source;
    std::string document_id;
    ProcessingStatus status = ProcessingStatus::Failed;
    std::string message;
    classify::ClassificationResult classification;
    std::optional<std::filesystem::path> target_path;
    std::optional<std::filesystem::path> backup_path;
    std::optional<std::string> snapshot_id;
    std::optional<std::string> review_id;
};

nlohmann::json to_json(const ProcessingResult& result);

struct BatchResult {
    documents::BatchRecord batch;
    std::optional<std::string> snapshot_id;
    std::vector<ProcessingResult> results;  // one per input, input order
};

nlohmann::json to_json(const BatchResult& result);

/**
 * @brief Hash, classify and file documents one by one or in batches
 *
 * Every move is preceded by a durable snapshot when snapshots are enabled:
 * one FileProcessing snapshot per single file, one BatchProcessing snapshot
 * per batch covering all planned moves.
 */
class DocumentProcessingOrchestrator {
public:
    DocumentProcessingOrchestrator(const config::Config& config,
                                   documents::DocumentStore& documents,
                                   documents::ObjectStorage& storage,
                                   review::ReviewStore& reviews,
                                   snapshot::SnapshotManager* snapshots,
                                   std::shared_ptr<classify::Classifier> model = nullptr,
                                   events::EventBus* bus = nullptr);

    ProcessingResult process_file(const std::filesystem::path& path);

    // Fails only when the batch record or the batch snapshot cannot be
    // written; per-file failures are reported in the results.
    Result<BatchResult> process_batch(const std::vector<std::filesystem::path>& paths);

private:
    struct Plan {
        std::filesystem::path source;
        std::string digest;
        FileStat stat;
        classify::ClassificationResult classification;
        std::filesystem::path target;
        std::optional<ProcessingResult> settled;  // outcome decided during planning
    };

    Plan plan(const std::filesystem::path& path) const;
    ProcessingResult execute(Plan& plan, std::optional<std::string> snapshot_id);
    ProcessingResult route_to_review(const Plan& plan);
    ProcessingResult finish(ProcessingResult result);

    classify::ClassificationResult classify_content(const std::filesystem::path& path) const;
    Result<std::filesystem::path> render_target(const Plan& plan) const;
    Result<std::filesystem::path> make_backup(const Plan& plan);

    config::Config config_;
    documents::DocumentStore& documents_;
    documents::ObjectStorage& storage_;
    review::ReviewStore& reviews_;
    snapshot::SnapshotManager* snapshots_;
    std::shared_ptr<classify::Classifier> model_;
    classify::KeywordClassifier fallback_;
    events::EventBus* bus_;

    std::mutex backup_mutex_;
};

} // namespace docsort::pipeline
