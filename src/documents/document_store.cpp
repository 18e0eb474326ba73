#include "docsort/documents/document_store.hpp"

namespace docsort::documents {
using nlohmann::json;

namespace {

json optional_string(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> read_optional_string(const json& value, const char* key) {
    auto it = value.find(key);
    if (it == value.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

const char* to_string(DocumentStatus status) {
    switch (status) {
        case DocumentStatus::Pending: return "pending";
        case DocumentStatus::Processed: return "processed";
        case DocumentStatus::Review: return "review";
        case DocumentStatus::Failed: return "failed";
    }
    return "pending";
}

DocumentStatus document_status_from_string(const std::string& text) {
    if (text == "processed") return DocumentStatus::Processed;
    if (text == "review") return DocumentStatus::Review;
    if (text == "failed") return DocumentStatus::Failed;
    return DocumentStatus::Pending;
}

const char* to_string(BatchStatus status) {
    switch (status) {
        case BatchStatus::Running: return "running";
        case BatchStatus::Completed: return "completed";
        case BatchStatus::CompletedWithErrors: return "completed_with_errors";
        case BatchStatus::Failed: return "failed";
    }
    return "running";
}

BatchStatus batch_status_from_string(const std::string& text) {
    if (text == "completed") return BatchStatus::Completed;
    if (text == "completed_with_errors") return BatchStatus::CompletedWithErrors;
    if (text == "failed") return BatchStatus::Failed;
    return BatchStatus::Running;
}

json to_json(const DocumentRecord& record) {
    return json{
        {"id", record.id},
        {"filename", record.filename},
        {"original_path", record.original_path.string()},
        {"target_path", record.target_path.string()},
        {"category", record.category},
        {"customer", optional_string(record.customer)},
        {"project", optional_string(record.project)},
        {"tags", record.tags},
        {"metadata", record.metadata},
        {"classification", record.classification},
        {"status", to_string(record.status)},
        {"created_at", record.created_at},
        {"updated_at", record.updated_at},
    };
}

DocumentRecord document_from_json(const json& value) {
    DocumentRecord record;
    record.id = value.value("id", std::string());
    record.filename = value.value("filename", std::string());
    record.original_path = value.value("original_path", std::string());
    record.target_path = value.value("target_path", std::string());
    record.category = value.value("category", std::string());
    record.customer = read_optional_string(value, "customer");
    record.project = read_optional_string(value, "project");
    if (auto it = value.find("tags"); it != value.end() && it->is_array()) {
        record.tags = it->get<std::vector<std::string>>();
    }
    if (auto it = value.find("metadata"); it != value.end() && it->is_object()) {
        record.metadata = *it;
    }
    if (auto it = value.find("classification"); it != value.end() && it->is_object()) {
        record.classification = *it;
    }
    record.status = document_status_from_string(value.value("status", std::string("pending")));
    record.created_at = value.value("created_at", std::string());
    record.updated_at = value.value("updated_at", std::string());
    return record;
}

json to_json(const BatchRecord& record) {
    return json{
        {"id", record.id},
        {"status", to_string(record.status)},
        {"total_files", record.total_files},
        {"processed_files", record.processed_files},
        {"failed_files", record.failed_files},
        {"started_at", record.started_at},
        {"completed_at", optional_string(record.completed_at)},
    };
}

BatchRecord batch_from_json(const json& value) {
    BatchRecord record;
    record.id = value.value("id", std::string());
    record.status = batch_status_from_string(value.value("status", std::string("running")));
    record.total_files = value.value("total_files", std::size_t{0});
    record.processed_files = value.value("processed_files", std::size_t{0});
    record.failed_files = value.value("failed_files", std::size_t{0});
    record.started_at = value.value("started_at", std::string());
    record.completed_at = read_optional_string(value, "completed_at");
    return record;
}

Result<std::unique_ptr<DocumentStore>> DocumentStore::open(const std::filesystem::path& data_dir) {
    auto db = storage::SqliteDb::open(data_dir / kDocumentsDbFileName);
    if (db.is_error()) {
        return Err<std::unique_ptr<DocumentStore>>(db.error());
    }
    auto documents = std::make_unique<storage::KvStore>(db.value(), "documents");
    auto batches = std::make_unique<storage::KvStore>(db.value(), "batches");
    for (auto* table : {documents.get(), batches.get()}) {
        if (auto init = table->init(); init.is_error()) {
            return Err<std::unique_ptr<DocumentStore>>(init.error());
        }
    }
    return Ok(std::make_unique<DocumentStore>(std::move(documents), std::move(batches)));
}

DocumentStore::DocumentStore(std::unique_ptr<storage::KvStore> documents, std::unique_ptr<storage::KvStore> batches)
    : documents_(std::move(documents)), batches_(std::move(batches)) {}

Result<void> DocumentStore::put(const DocumentRecord& record) {
    std::lock_guard lock(mutex_);
    return documents_->put(record.id, to_json(record));
}

Result<std::optional<DocumentRecord>> DocumentStore::get(const std::string& id) const {
    using Value = std::optional<DocumentRecord>;
    std::lock_guard lock(mutex_);
    auto found = documents_->get(id);
    if (found.is_error()) {
        return Err<Value>(found.error());
    }
    if (!found.value()) {
        return Ok(Value{});
    }
    return Ok(Value{document_from_json(*found.value())});
}

Result<bool> DocumentStore::erase(const std::string& id) {
    std::lock_guard lock(mutex_);
    return documents_->erase(id);
}

Result<std::vector<DocumentRecord>> DocumentStore::all() const {
    std::lock_guard lock(mutex_);
    auto entries = documents_->entries();
    if (entries.is_error()) {
        return Err<std::vector<DocumentRecord>>(entries.error());
    }
    std::vector<DocumentRecord> out;
    out.reserve(entries.value().size());
    for (const auto& [id, value] : entries.value()) {
        out.push_back(document_from_json(value));
    }
    return Ok(std::move(out));
}

Result<void> DocumentStore::put_batch(const BatchRecord& batch) {
    std::lock_guard lock(mutex_);
    return batches_->put(batch.id, to_json(batch));
}

Result<std::optional<BatchRecord>> DocumentStore::get_batch(const std::string& id) const {
    using Value = std::optional<BatchRecord>;
    std::lock_guard lock(mutex_);
    auto found = batches_->get(id);
    if (found.is_error()) {
        return Err<Value>(found.error());
    }
    if (!found.value()) {
        return Ok(Value{});
    }
    return Ok(Value{batch_from_json(*found.value())});
}

Result<BatchRecord> DocumentStore::add_batch_progress(const std::string& id, std::size_t processed, std::size_t failed) {
    std::lock_guard lock(mutex_);
    auto found = batches_->get(id);
    if (found.is_error()) {
        return Err<BatchRecord>(found.error());
    }
    if (!found.value()) {
        return Err<BatchRecord>(ErrorCode::NotFound, "batch not found: " + id);
    }
    auto batch = batch_from_json(*found.value());
    batch.processed_files += processed;
    batch.failed_files += failed;
    if (auto stored = batches_->put(id, to_json(batch)); stored.is_error()) {
        return Err<BatchRecord>(stored.error());
    }
    return Ok(std::move(batch));
}

} // namespace docsort::documents
