#pragma once

#include "docsort/core/result.hpp"
#include "docsort/storage/kv_store.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace docsort::documents {

inline constexpr const char* kDocumentsDbFileName = "documents.db";

enum class DocumentStatus {
    Pending,
    Processed,
    Review,
    Failed
};

const char* to_string(DocumentStatus status);
DocumentStatus document_status_from_string(const std::string& text);

// Persisted state of one processed document, keyed by content digest.
struct DocumentRecord {
    std::string id;
    std::string filename;
    std::filesystem::path original_path;
    std::filesystem::path target_path;
    std::string category;
    std::optional<std::string> customer;
    std::optional<std::string> project;
    std::vector<std::string> tags;
    nlohmann::json metadata = nlohmann::json::object();
    nlohmann::json classification = nlohmann::json::object();
    DocumentStatus status = DocumentStatus::Pending;
    std::string created_at;
    std::string updated_at;
};

nlohmann::json to_json(const DocumentRecord& record);
DocumentRecord document_from_json(const nlohmann::json& value);

enum class BatchStatus {
    Running,
    Completed,
    CompletedWithErrors,
    Failed
};

const char* to_string(BatchStatus status);
BatchStatus batch_status_from_string(const std::string& text);

struct BatchRecord {
    std::string id;
    BatchStatus status = BatchStatus::Running;
    std::size_t total_files = 0;
    std::size_t processed_files = 0;
    std::size_t failed_files = 0;
    std::string started_at;
    std::optional<std::string> completed_at;
};

nlohmann::json to_json(const BatchRecord& record);
BatchRecord batch_from_json(const nlohmann::json& value);

/**
 * @brief Document and batch records
 *
 * Both tables live in one SQLite file. Writers are serialised here so the
 * batch worker pool can share one store.
 */
class DocumentStore {
public:
    static Result<std::unique_ptr<DocumentStore>> open(const std::filesystem::path& data_dir);

    DocumentStore(std::unique_ptr<storage::KvStore> documents, std::unique_ptr<storage::KvStore> batches);

    Result<void> put(const DocumentRecord& record);
    Result<std::optional<DocumentRecord>> get(const std::string& id) const;
    Result<bool> erase(const std::string& id);
    Result<std::vector<DocumentRecord>> all() const;

    Result<void> put_batch(const BatchRecord& batch);
    Result<std::optional<BatchRecord>> get_batch(const std::string& id) const;

    // Adds to the counters of an existing batch atomically.
    Result<BatchRecord> add_batch_progress(const std::string& id, std::size_t processed, std::size_t failed);

private:
    std::unique_ptr<storage::KvStore> documents_;
    std::unique_ptr<storage::KvStore> batches_;
    mutable std::mutex mutex_;
};

} // namespace docsort::documents
