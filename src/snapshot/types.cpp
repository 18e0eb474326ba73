#include "docsort/snapshot/types.hpp"

namespace docsort::snapshot {
using nlohmann::json;

namespace {

struct KindName {
    const char* operator()(const op::FileProcessing&) const { return "file_processing"; }
    const char* operator()(const op::BatchProcessing&) const { return "batch_processing"; }
    const char* operator()(const op::MetadataUpdate&) const { return "metadata_update"; }
    const char* operator()(const op::Classification&) const { return "classification"; }
    const char* operator()(const op::StorageMove&) const { return "storage_move"; }
};

} // namespace

const char* to_string(const OperationType& type) {
    return std::visit(KindName{}, type);
}

std::optional<OperationType> operation_type_from_string(const std::string& text) {
    if (text == "file_processing") return OperationType{op::FileProcessing{}};
    if (text == "batch_processing") return OperationType{op::BatchProcessing{}};
    if (text == "metadata_update") return OperationType{op::MetadataUpdate{}};
    if (text == "classification") return OperationType{op::Classification{}};
    if (text == "storage_move") return OperationType{op::StorageMove{}};
    return std::nullopt;
}

json to_json(const Snapshot& snapshot) {
    json database = json::object();
    for (const auto& [id, state] : snapshot.database_state) {
        database[id] = {{"existed", state.existed}, {"record", state.record}};
    }
    json storage = json::object();
    for (const auto& [id, state] : snapshot.storage_state) {
        storage[id] = {{"exists", state.exists}, {"metadata", state.metadata}};
    }
    return json{
        {"id", snapshot.id},
        {"operation_type", to_string(snapshot.operation_type)},
        {"timestamp", snapshot.timestamp},
        {"created_at_ns", snapshot.created_at_ns},
        {"description", snapshot.description},
        {"file_ids", snapshot.file_ids},
        {"batch_id", snapshot.batch_id ? json(*snapshot.batch_id) : json(nullptr)},
        {"metadata", snapshot.metadata},
        {"original_paths", snapshot.original_paths},
        {"target_paths", snapshot.target_paths},
        {"database_state", database},
        {"storage_state", storage},
        {"batch_state", snapshot.batch_state ? documents::to_json(*snapshot.batch_state) : json(nullptr)},
    };
}

Result<Snapshot> snapshot_from_json(const json& value) {
    if (!value.is_object()) {
        return Err<Snapshot>(ErrorCode::Storage, "snapshot is not a JSON object");
    }
    const auto kind = operation_type_from_string(value.value("operation_type", std::string()));
    if (!kind) {
        return Err<Snapshot>(ErrorCode::Storage, "snapshot has unknown operation type");
    }

    Snapshot snapshot;
    snapshot.operation_type = *kind;
    try {
        snapshot.id = value.value("id", std::string());
        snapshot.timestamp = value.value("timestamp", std::string());
        snapshot.created_at_ns = value.value("created_at_ns", std::int64_t{0});
        snapshot.description = value.value("description", std::string());
        snapshot.file_ids = value.value("file_ids", std::vector<std::string>{});
        if (auto it = value.find("batch_id"); it != value.end() && it->is_string()) {
            snapshot.batch_id = it->get<std::string>();
        }
        if (auto it = value.find("metadata"); it != value.end() && it->is_object()) {
            snapshot.metadata = *it;
        }
        snapshot.original_paths = value.value("original_paths", std::map<std::string, std::string>{});
        snapshot.target_paths = value.value("target_paths", std::map<std::string, std::string>{});
        if (auto it = value.find("database_state"); it != value.end() && it->is_object()) {
            for (const auto& entry : it->items()) {
                const auto& state = entry.value();
                snapshot.database_state[entry.key()] = DatabaseState{state.value("existed", false),
                                                                     state.value("record", json::object())};
            }
        }
        if (auto it = value.find("storage_state"); it != value.end() && it->is_object()) {
            for (const auto& entry : it->items()) {
                const auto& state = entry.value();
                snapshot.storage_state[entry.key()] = StorageState{state.value("exists", false),
                                                                   state.value("metadata", json::object())};
            }
        }
        if (auto it = value.find("batch_state"); it != value.end() && it->is_object()) {
            snapshot.batch_state = documents::batch_from_json(*it);
        }
    } catch (const json::exception& e) {
        return Err<Snapshot>(ErrorCode::Storage, std::string("malformed snapshot: ") + e.what());
    }
    return Ok(std::move(snapshot));
}

json to_json(const RollbackResult& result) {
    return json{
        {"success", result.success},
        {"message", result.message},
        {"files_restored", result.files_restored},
        {"files_failed", result.files_failed},
        {"errors", result.errors},
        {"duration", static_cast<double>(result.duration.count()) / 1000.0},
    };
}

} // namespace docsort::snapshot
