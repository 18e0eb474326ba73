#pragma once

#include "docsort/classify/path_classifier.hpp"
#include "docsort/config/config.hpp"
#include "docsort/core/result.hpp"
#include "docsort/documents/document_store.hpp"
#include "docsort/events/event_bus.hpp"
#include "docsort/storage/kv_store.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace docsort::review {

inline constexpr const char* kReviewDbFileName = "review_store.db";
inline constexpr const char* kFeedbackLogFileName = "classification_feedback.jsonl";

// A file whose automatic classification was not confident enough.
struct ReviewItem {
    std::string id;
    std::filesystem::path original_path;
    std::string filename;
    std::uintmax_t size = 0;
    double mtime = 0.0;
    std::string suggested_category;
    double confidence = 0.0;
    std::optional<std::string> customer;
    std::optional<std::string> project;
    std::vector<std::string> tags;
    nlohmann::json metadata = nlohmann::json::object();
};

nlohmann::json to_json(const ReviewItem& item);
ReviewItem review_item_from_json(const nlohmann::json& value);

struct ReviewFilter {
    std::optional<std::string> customer;
    std::optional<std::string> project;
    std::optional<double> min_confidence;
    std::optional<double> max_confidence;
};

/**
 * @brief Pending low-confidence classifications
 *
 * confirm() moves the file using the same layout rules as the crawler,
 * updates the document record the pipeline left behind, appends one JSON
 * line to the feedback log and only then drops the item. When a later step
 * fails the file and record are put back and the item stays pending.
 */
class ReviewStore {
public:
    static Result<std::unique_ptr<ReviewStore>> open(const config::Config& config,
                                                     events::EventBus* bus = nullptr,
                                                     documents::DocumentStore* documents = nullptr);

    ReviewStore(std::unique_ptr<storage::KvStore> store,
                std::filesystem::path feedback_log,
                classify::PathClassifier classifier,
                events::EventBus* bus = nullptr,
                documents::DocumentStore* documents = nullptr);

    // Assigns a fresh uuid when item.id is empty; returns the id.
    Result<std::string> add(ReviewItem item);

    Result<ReviewItem> get(const std::string& id) const;

    // Newest mtime first.
    Result<std::vector<ReviewItem>> list_pending(const ReviewFilter& filter = {}) const;

    // Returns the destination path. ErrorCode::NotFound for an unknown id.
    Result<std::filesystem::path> confirm(const std::string& id, const std::string& category);

    const std::filesystem::path& feedback_log() const noexcept { return feedback_log_; }

private:
    Result<void> append_feedback(const nlohmann::json& record);

    // Marks the pipeline's record for `item` as filed at `destination`.
    // Returns the record as it was so a failed confirm can restore it.
    Result<std::optional<documents::DocumentRecord>> file_document(const ReviewItem& item,
                                                                   const std::string& category,
                                                                   const std::filesystem::path& destination);

    std::unique_ptr<storage::KvStore> store_;
    std::filesystem::path feedback_log_;
    classify::PathClassifier classifier_;
    events::EventBus* bus_;
    documents::DocumentStore* documents_;

    std::mutex confirm_mutex_;
};

} // namespace docsort::review
