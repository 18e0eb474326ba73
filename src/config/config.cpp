#include "docsort/config/config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace docsort::config {
namespace fs = std::filesystem;
using nlohmann::json;

namespace {

template<typename T>
void read_if_present(const json& object, const char* key, T& target) {
    auto it = object.find(key);
    if (it != object.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

void read_path_if_present(const json& object, const char* key, fs::path& target) {
    auto it = object.find(key);
    if (it != object.end() && !it->is_null()) {
        target = it->get<std::string>();
    }
}

const json& section(const json& document, const char* key) {
    static const json empty = json::object();
    auto it = document.find(key);
    if (it == document.end() || !it->is_object()) {
        return empty;
    }
    return *it;
}

} // namespace

std::map<std::string, std::string> default_category_paths() {
    return {
        {"finanzen", "{customer}/Finanzen/{year}"},
        {"projekte", "{customer}/Projekte/{project}/{year}"},
        {"personal", "{customer}/Personal/{year}"},
        {"footage", "{customer}/Footage/{project}"},
        {"unsorted", "{customer}/Unsorted"},
    };
}

Result<Config> parse_config(const json& document) {
    if (!document.is_object()) {
        return Err<Config>(ErrorCode::Config, "configuration root must be a JSON object");
    }

    for (const char* key : {"sorting", "review", "snapshots", "processing", "logging"}) {
        auto it = document.find(key);
        if (it != document.end() && !it->is_null() && !it->is_object()) {
            return Err<Config>(ErrorCode::Config, std::string("section '") + key + "' must be an object");
        }
    }

    Config config;
    config.processing.category_paths = default_category_paths();

    try {
        if (auto it = document.find("shares"); it != document.end() && !it->is_null()) {
            for (const auto& share : it->get<std::vector<std::string>>()) {
                config.shares.emplace_back(share);
            }
        }
        read_if_present(document, "internal_roots", config.internal_roots);
        read_path_if_present(document, "central_base", config.central_base);
        read_path_if_present(document, "index_store_path", config.index_store_path);
        read_path_if_present(document, "data_dir", config.data_dir);

        const auto& sorting = section(document, "sorting");
        read_if_present(sorting, "enable_year_subfolders", config.sorting.enable_year_subfolders);
        read_if_present(sorting, "year_folders_under", config.sorting.year_folders_under);

        const auto& review = section(document, "review");
        read_if_present(review, "confidence_threshold", config.review.confidence_threshold);

        const auto& snapshots = section(document, "snapshots");
        read_if_present(snapshots, "enabled", config.snapshots.enabled);
        read_if_present(snapshots, "retention_days", config.snapshots.retention_days);

        const auto& processing = section(document, "processing");
        read_if_present(processing, "workers", config.processing.workers);
        read_if_present(processing, "backup_enabled", config.processing.backup_enabled);
        read_path_if_present(processing, "backup_dir", config.processing.backup_dir);
        if (auto it = processing.find("category_paths"); it != processing.end() && !it->is_null()) {
            for (const auto& [category, pattern] : it->get<std::map<std::string, std::string>>()) {
                config.processing.category_paths[category] = pattern;
            }
        }

        const auto& logging = section(document, "logging");
        read_if_present(logging, "level", config.logging.level);
        read_if_present(logging, "pattern", config.logging.pattern);
    } catch (const json::exception& e) {
        return Err<Config>(ErrorCode::Config, std::string("invalid configuration: ") + e.what());
    }

    if (config.review.confidence_threshold < 0.0 || config.review.confidence_threshold > 1.0) {
        return Err<Config>(ErrorCode::Config, "review.confidence_threshold must be within [0, 1]");
    }
    if (config.snapshots.retention_days < 0) {
        return Err<Config>(ErrorCode::Config, "snapshots.retention_days must not be negative");
    }
    if (config.processing.workers == 0) {
        return Err<Config>(ErrorCode::Config, "processing.workers must be at least 1");
    }

    return Ok(std::move(config));
}

Result<Config> load_config(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Err<Config>(ErrorCode::Config, "configuration file not found: " + path.string());
    }

    std::ifstream input(path);
    if (!input) {
        return Err<Config>(ErrorCode::Config, "cannot open configuration file: " + path.string());
    }

    json document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return Err<Config>(ErrorCode::Config, "configuration file is not valid JSON: " + path.string());
    }

    return parse_config(document);
}

json to_json(const Config& config) {
    json shares = json::array();
    for (const auto& share : config.shares) {
        shares.push_back(share.string());
    }
    return json{
        {"shares", shares},
        {"internal_roots", config.internal_roots},
        {"central_base", config.central_base.string()},
        {"index_store_path", config.index_store_path.string()},
        {"data_dir", config.data_dir.string()},
        {"sorting", {
            {"enable_year_subfolders", config.sorting.enable_year_subfolders},
            {"year_folders_under", config.sorting.year_folders_under},
        }},
        {"review", {{"confidence_threshold", config.review.confidence_threshold}}},
        {"snapshots", {
            {"enabled", config.snapshots.enabled},
            {"retention_days", config.snapshots.retention_days},
        }},
        {"processing", {
            {"workers", config.processing.workers},
            {"backup_enabled", config.processing.backup_enabled},
            {"backup_dir", config.processing.backup_dir.string()},
            {"category_paths", config.processing.category_paths},
        }},
        {"logging", {
            {"level", config.logging.level},
            {"pattern", config.logging.pattern},
        }},
    };
}

Result<void> validate_for_crawl(const Config& config) {
    if (config.shares.empty()) {
        return Err<void>(ErrorCode::Config, "no shares configured");
    }
    return Ok();
}

void apply_logging(const LoggingConfig& logging) {
    spdlog::set_level(spdlog::level::from_str(logging.level));
    if (!logging.pattern.empty()) {
        spdlog::set_pattern(logging.pattern);
    }
}

} // namespace docsort::config
