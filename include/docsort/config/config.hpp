#pragma once

#include "docsort/core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace docsort::config {

struct SortingConfig {
    bool enable_year_subfolders = true;
    std::vector<std::string> year_folders_under{"Projekte", "Archiv"};
};

struct ReviewConfig {
    double confidence_threshold = 0.5;
};

struct SnapshotConfig {
    bool enabled = true;
    int retention_days = 30;
};

struct ProcessingConfig {
    std::size_t workers = 4;
    bool backup_enabled = true;
    std::filesystem::path backup_dir{"data/backups"};
    // category -> path template relative to central_base.
    // Placeholders: {customer}, {project}, {year}
    std::map<std::string, std::string> category_paths;
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%H:%M:%S] [%^%l%$] %v";
};

struct Config {
    std::vector<std::filesystem::path> shares;
    std::vector<std::string> internal_roots{"ORGA", "INFRA", "SALES", "HR"};
    std::filesystem::path central_base{"/data/sorted"};
    std::filesystem::path index_store_path{"data"};
    std::filesystem::path data_dir{"data"};

    SortingConfig sorting;
    ReviewConfig review;
    SnapshotConfig snapshots;
    ProcessingConfig processing;
    LoggingConfig logging;
};

std::map<std::string, std::string> default_category_paths();

/**
 * @brief Read and parse a JSON configuration file
 *
 * Missing keys fall back to the defaults above. A missing file, malformed
 * JSON or a value of the wrong type yields ErrorCode::Config.
 */
Result<Config> load_config(const std::filesystem::path& path);

Result<Config> parse_config(const nlohmann::json& document);

nlohmann::json to_json(const Config& config);

// A crawl needs at least one share to walk.
Result<void> validate_for_crawl(const Config& config);

// Applies level and pattern to the default spdlog logger.
void apply_logging(const LoggingConfig& logging);

} // namespace docsort::config
