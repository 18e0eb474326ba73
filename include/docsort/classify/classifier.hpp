#pragma once

#include "docsort/core/result.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docsort::classify {

struct ClassificationResult {
    std::string category = "unsorted";
    double confidence = 0.0;
    std::optional<std::string> customer;
    std::optional<std::string> project;
    std::vector<std::string> tags;
    std::string source;  // "model" or "keywords"
};

nlohmann::json to_json(const ClassificationResult& result);
ClassificationResult classification_from_json(const nlohmann::json& value);

/**
 * @brief Content classification collaborator
 *
 * Implementations wrap an external model. Any error makes the caller fall
 * back to KeywordClassifier.
 */
class Classifier {
public:
    virtual ~Classifier() = default;

    virtual Result<ClassificationResult> classify(std::string_view content,
                                                  const std::string& filename) = 0;
};

/**
 * @brief Deterministic keyword classifier
 *
 * Scans content and filename for category keywords. A hit yields
 * confidence 0.6, no hit yields "unsorted" with 0.3 so the item lands in
 * review under the default threshold.
 */
class KeywordClassifier final : public Classifier {
public:
    static constexpr double kMatchConfidence = 0.6;
    static constexpr double kNoMatchConfidence = 0.3;

    Result<ClassificationResult> classify(std::string_view content,
                                          const std::string& filename) override;

    // Never fails; used directly as the fallback path.
    ClassificationResult classify_text(std::string_view content, const std::string& filename) const;
};

} // namespace docsort::classify
