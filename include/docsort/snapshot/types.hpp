#pragma once

#include "docsort/core/result.hpp"
#include "docsort/documents/document_store.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace docsort::snapshot {

// Operation kinds a snapshot can guard. Each kind has exactly one rollback
// handler; adding a kind without a handler does not compile.
namespace op {
struct FileProcessing {};
struct BatchProcessing {};
struct MetadataUpdate {};
struct Classification {};
struct StorageMove {};
} // namespace op

using OperationType = std::variant<op::FileProcessing,
                                   op::BatchProcessing,
                                   op::MetadataUpdate,
                                   op::Classification,
                                   op::StorageMove>;

const char* to_string(const OperationType& type);
std::optional<OperationType> operation_type_from_string(const std::string& text);

inline bool same_kind(const OperationType& a, const OperationType& b) noexcept {
    return a.index() == b.index();
}

// Persisted document state at snapshot time.
struct DatabaseState {
    bool existed = false;
    nlohmann::json record = nlohmann::json::object();  // DocumentRecord JSON when existed
};

struct StorageState {
    bool exists = false;
    nlohmann::json metadata = nlohmann::json::object();
};

// A move the caller is about to perform for one file id.
struct PlannedMove {
    std::filesystem::path original;
    std::filesystem::path target;
};

struct Snapshot {
    std::string id;
    OperationType operation_type;
    std::string timestamp;          // ISO-8601 UTC
    std::int64_t created_at_ns = 0; // ordering key
    std::string description;
    std::vector<std::string> file_ids;
    std::optional<std::string> batch_id;
    nlohmann::json metadata = nlohmann::json::object();
    std::map<std::string, std::string> original_paths;
    std::map<std::string, std::string> target_paths;
    std::map<std::string, DatabaseState> database_state;
    std::map<std::string, StorageState> storage_state;
    std::optional<documents::BatchRecord> batch_state;
};

nlohmann::json to_json(const Snapshot& snapshot);
Result<Snapshot> snapshot_from_json(const nlohmann::json& value);

struct RollbackResult {
    bool success = false;
    std::string message;
    std::size_t files_restored = 0;
    std::size_t files_failed = 0;
    std::vector<std::string> errors;
    std::chrono::milliseconds duration{0};
};

nlohmann::json to_json(const RollbackResult& result);

} // namespace docsort::snapshot
