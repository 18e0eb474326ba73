#include "docsort/review/review_store.hpp"

#include "docsort/core/file_stat.hpp"
#include "docsort/core/ids.hpp"
#include "docsort/dedup/file_mover.hpp"
#include "docsort/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <system_error>

namespace docsort::review {
namespace fs = std::filesystem;
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

json to_json(const ReviewItem& item) {
    return json{
        {"id", item.id},
        {"original_path", item.original_path.string()},
        {"filename", item.filename},
        {"size", item.size},
        {"mtime", item.mtime},
        {"suggested_category", item.suggested_category},
        {"confidence", item.confidence},
        {"customer", optional_string(item.customer)},
        {"project", optional_string(item.project)},
        {"tags", item.tags},
        {"metadata", item.metadata},
    };
}

ReviewItem review_item_from_json(const json& value) {
    ReviewItem item;
    item.id = value.value("id", std::string());
    item.original_path = value.value("original_path", std::string());
    item.filename = value.value("filename", std::string());
    item.size = value.value("size", std::uintmax_t{0});
    item.mtime = value.value("mtime", 0.0);
    item.suggested_category = value.value("suggested_category", std::string());
    item.confidence = value.value("confidence", 0.0);
    item.customer = read_optional_string(value, "customer");
    item.project = read_optional_string(value, "project");
    if (auto it = value.find("tags"); it != value.end() && it->is_array()) {
        item.tags = it->get<std::vector<std::string>>();
    }
    if (auto it = value.find("metadata"); it != value.end() && it->is_object()) {
        item.metadata = *it;
    }
    return item;
}

Result<std::unique_ptr<ReviewStore>> ReviewStore::open(const config::Config& config,
                                                       events::EventBus* bus,
                                                       documents::DocumentStore* documents) {
    auto kv = storage::KvStore::open(config.data_dir / kReviewDbFileName, "review_items");
    if (kv.is_error()) {
        return Err<std::unique_ptr<ReviewStore>>(kv.error());
    }
    return Ok(std::make_unique<ReviewStore>(std::move(kv.value()),
                                            config.data_dir / kFeedbackLogFileName,
                                            classify::PathClassifier(config),
                                            bus,
                                            documents));
}

ReviewStore::ReviewStore(std::unique_ptr<storage::KvStore> store,
                         fs::path feedback_log,
                         classify::PathClassifier classifier,
                         events::EventBus* bus,
                         documents::DocumentStore* documents)
    : store_(std::move(store)),
      feedback_log_(std::move(feedback_log)),
      classifier_(std::move(classifier)),
      bus_(bus),
      documents_(documents) {}

Result<std::string> ReviewStore::add(ReviewItem item) {
    if (item.confidence < 0.0 || item.confidence > 1.0) {
        return Err<std::string>(ErrorCode::InvalidArgument, "confidence must be within [0, 1]");
    }
    if (item.id.empty()) {
        item.id = generate_uuid();
    }
    if (item.filename.empty()) {
        item.filename = item.original_path.filename().string();
    }

    auto stored = store_->put(item.id, to_json(item));
    if (stored.is_error()) {
        return Err<std::string>(stored.error());
    }
    if (bus_) {
        bus_->emit(events::ReviewQueuedEvent{item.id, item.filename, item.suggested_category, item.confidence});
    }
    return Ok(item.id);
}

Result<ReviewItem> ReviewStore::get(const std::string& id) const {
    auto found = store_->get(id);
    if (found.is_error()) {
        return Err<ReviewItem>(found.error());
    }
    if (!found.value()) {
        return Err<ReviewItem>(ErrorCode::NotFound, "review item not found: " + id);
    }
    return Ok(review_item_from_json(*found.value()));
}

Result<std::vector<ReviewItem>> ReviewStore::list_pending(const ReviewFilter& filter) const {
    auto entries = store_->entries();
    if (entries.is_error()) {
        return Err<std::vector<ReviewItem>>(entries.error());
    }

    std::vector<ReviewItem> items;
    for (const auto& [id, value] : entries.value()) {
        auto item = review_item_from_json(value);
        if (filter.customer && item.customer != filter.customer) {
            continue;
        }
        if (filter.project && item.project != filter.project) {
            continue;
        }
        if (filter.min_confidence && item.confidence < *filter.min_confidence) {
            continue;
        }
        if (filter.max_confidence && item.confidence > *filter.max_confidence) {
            continue;
        }
        items.push_back(std::move(item));
    }

    std::sort(items.begin(), items.end(), [](const ReviewItem& a, const ReviewItem& b) {
        return a.mtime > b.mtime;
    });
    return Ok(std::move(items));
}

Result<fs::path> ReviewStore::confirm(const std::string& id, const std::string& category) {
    std::lock_guard lock(confirm_mutex_);

    auto found = get(id);
    if (found.is_error()) {
        return Err<fs::path>(found.error());
    }
    const ReviewItem& item = found.value();

    double mtime = item.mtime;
    if (auto st = stat_file(item.original_path); st.is_ok()) {
        mtime = st.value().mtime;
    }

    const auto placement = classifier_.place_with_subfolder(item.original_path,
                                                            classify::subfolder_for_category(category),
                                                            mtime);
    std::error_code ec;
    fs::create_directories(placement.directory, ec);
    if (ec) {
        return Err<fs::path>(ErrorCode::IoError, "cannot create " + placement.directory.string() + ": " + ec.message());
    }
    const fs::path destination = dedup::unique_destination(placement.directory, item.filename);

    auto moved = dedup::move_file(item.original_path, destination);
    if (moved.is_error()) {
        return Err<fs::path>(moved.error());
    }

    std::optional<documents::DocumentRecord> previous;
    bool record_changed = false;
    auto undo = [&](Error error) {
        if (record_changed) {
            if (auto restored = documents_->put(*previous); restored.is_error()) {
                spdlog::error("[Review] could not restore record for {}: {}", item.id, restored.error().message);
            }
        }
        if (auto back = dedup::move_file(destination, item.original_path); back.is_error()) {
            spdlog::error("[Review] could not return {} to {}: {}",
                          destination.string(), item.original_path.string(), back.error().message);
        }
        spdlog::warn("[Review] confirm of {} rolled back: {}", item.id, error.message);
        return Err<fs::path>(std::move(error));
    };

    auto filed = file_document(item, category, destination);
    if (filed.is_error()) {
        return undo(filed.error());
    }
    previous = filed.value();
    record_changed = previous.has_value();

    json feedback{
        {"id", item.id},
        {"chosen_category", category},
        {"suggested_category", item.suggested_category},
        {"confidence", item.confidence},
        {"customer", optional_string(item.customer)},
        {"project", optional_string(item.project)},
        {"filename", item.filename},
        {"moved_to", destination.string()},
    };
    if (auto appended = append_feedback(feedback); appended.is_error()) {
        return undo(appended.error());
    }

    auto erased = store_->erase(id);
    if (erased.is_error()) {
        spdlog::warn("[Review] feedback for {} already logged", item.id);
        return undo(erased.error());
    }

    if (bus_) {
        bus_->emit(events::ReviewConfirmedEvent{id, category, destination.string()});
    }
    return Ok(destination);
}

Result<std::optional<documents::DocumentRecord>> ReviewStore::file_document(const ReviewItem& item,
                                                                           const std::string& category,
                                                                           const fs::path& destination) {
    using Filed = std::optional<documents::DocumentRecord>;
    auto document_id = item.metadata.find("document_id");
    if (!documents_ || document_id == item.metadata.end() || !document_id->is_string()) {
        return Ok(Filed{});
    }

    auto existing = documents_->get(document_id->get<std::string>());
    if (existing.is_error()) {
        return Err<Filed>(existing.error());
    }
    if (!existing.value()) {
        return Ok(Filed{});
    }

    documents::DocumentRecord record = *existing.value();
    record.target_path = destination;
    record.category = category;
    record.status = documents::DocumentStatus::Processed;
    record.metadata["review_confirmed"] = true;
    record.updated_at = to_iso8601(Clock::now());
    if (auto stored = documents_->put(record); stored.is_error()) {
        return Err<Filed>(stored.error());
    }
    return Ok(Filed{std::move(existing.value())});
}

Result<void> ReviewStore::append_feedback(const json& record) {
    std::error_code ec;
    if (feedback_log_.has_parent_path()) {
        fs::create_directories(feedback_log_.parent_path(), ec);
    }

    std::ofstream out(feedback_log_, std::ios::app);
    if (!out) {
        return Err<void>(ErrorCode::IoError, "cannot open feedback log " + feedback_log_.string());
    }
    out << record.dump() << '\n';
    out.flush();
    if (!out) {
        return Err<void>(ErrorCode::IoError, "write failed on feedback log " + feedback_log_.string());
    }
    return Ok();
}

} // namespace docsort::review
