#include "docsort/classify/classifier.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace docsort::classify {
namespace {

struct CategoryKeywords {
    const char* category;
    std::vector<const char*> keywords;
};

const std::vector<CategoryKeywords>& category_keywords() {
    static const std::vector<CategoryKeywords> table{
        {"finanzen", {"rechnung", "invoice", "payment", "zahlung", "betrag", "amount", "total", "bill"}},
        {"personal", {"bewerbung", "gehalt", "salary", "employee", "mitarbeiter", "urlaub", "arbeitsvertrag"}},
        {"projekte", {"projekt", "project", "milestone", "meilenstein", "angebot", "kampagne"}},
        {"footage", {"footage", "video", "filmmaterial", "drehplan"}},
    };
    return table;
}

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

nlohmann::json to_json(const ClassificationResult& result) {
    nlohmann::json value{
        {"category", result.category},
        {"confidence", result.confidence},
        {"customer", nullptr},
        {"project", nullptr},
        {"tags", result.tags},
        {"source", result.source},
    };
    if (result.customer) {
        value["customer"] = *result.customer;
    }
    if (result.project) {
        value["project"] = *result.project;
    }
    return value;
}

ClassificationResult classification_from_json(const nlohmann::json& value) {
    ClassificationResult result;
    if (!value.is_object()) {
        return result;
    }
    result.category = value.value("category", std::string("unsorted"));
    result.confidence = value.value("confidence", 0.0);
    if (value.contains("customer") && value["customer"].is_string()) {
        result.customer = value["customer"].get<std::string>();
    }
    if (value.contains("project") && value["project"].is_string()) {
        result.project = value["project"].get<std::string>();
    }
    if (value.contains("tags") && value["tags"].is_array()) {
        result.tags = value["tags"].get<std::vector<std::string>>();
    }
    result.source = value.value("source", std::string());
    return result;
}

Result<ClassificationResult> KeywordClassifier::classify(std::string_view content, const std::string& filename) {
    return Ok(classify_text(content, filename));
}

ClassificationResult KeywordClassifier::classify_text(std::string_view content, const std::string& filename) const {
    const std::string haystack = to_lower(content) + "\n" + to_lower(filename);

    ClassificationResult result;
    result.source = "keywords";
    for (const auto& entry : category_keywords()) {
        for (const char* keyword : entry.keywords) {
            if (haystack.find(keyword) != std::string::npos) {
                result.category = entry.category;
                result.confidence = kMatchConfidence;
                result.tags.emplace_back(keyword);
                return result;
            }
        }
    }

    result.category = "unsorted";
    result.confidence = kNoMatchConfidence;
    return result;
}

} // namespace docsort::classify
