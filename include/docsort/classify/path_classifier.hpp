#pragma once

#include "docsort/config/config.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace docsort::classify {

inline constexpr const char* kDefaultCustomerRoot = "ALLGEMEIN";
inline constexpr const char* kDefaultSubfolder = "Allgemein";

// Customer root from the parent directory ("12345_Acme"), else the first
// internal root contained in the path (case-insensitive), else ALLGEMEIN.
std::string customer_root(const std::filesystem::path& path,
                          const std::vector<std::string>& internal_roots);

// First matching entry of the subfolder keyword table, else Allgemein.
std::string subfolder(const std::filesystem::path& path);

// Subfolder used when an operator confirms a review item as `category`.
std::string subfolder_for_category(const std::string& category);

// Local-time calendar year of an epoch-seconds mtime.
int year_of(double mtime);

std::filesystem::path target_directory(const std::filesystem::path& base,
                                       const std::string& customer_root,
                                       const std::string& subfolder,
                                       bool enable_year,
                                       const std::vector<std::string>& year_subfolders_for,
                                       double mtime);

struct Placement {
    std::string customer_root;
    std::string subfolder;
    std::filesystem::path directory;
};

/**
 * @brief Binds the path rules to one configuration
 *
 * Used by the crawler and by review confirmation so both compute
 * destinations identically.
 */
class PathClassifier {
public:
    explicit PathClassifier(const config::Config& config);

    [[nodiscard]] Placement place(const std::filesystem::path& path, double mtime) const;

    // Destination for a file whose subfolder was decided elsewhere.
    [[nodiscard]] Placement place_with_subfolder(const std::filesystem::path& path,
                                                 std::string subfolder_name,
                                                 double mtime) const;

private:
    std::filesystem::path central_base_;
    std::vector<std::string> internal_roots_;
    config::SortingConfig sorting_;
};

} // namespace docsort::classify
