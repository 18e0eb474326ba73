#include "docsort/classify/path_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <optional>
#include <utility>

namespace docsort::classify {
namespace fs = std::filesystem;
namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

struct SubfolderRule {
    const char* name;
    std::vector<const char*> keywords;
};

const std::vector<SubfolderRule>& subfolder_rules() {
    static const std::vector<SubfolderRule> rules{
        {"Projekte", {"projekt", "projects", "proj_"}},
        {"Portale", {"portal", "website", "site"}},
        {"Kampagnen", {"kampagne", "campaign"}},
        {"Angebote", {"angebot", "offer", "quote"}},
        {"Archiv", {"archiv", "archive"}},
    };
    return rules;
}

bool is_digit(unsigned char c) {
    return c >= '0' && c <= '9';
}

// Word characters plus '-' and ' '. Bytes of multi-byte UTF-8 sequences
// count as letters so names like "Müller GmbH" stay whole.
bool is_name_char(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '-' || c == ' ' || c >= 0x80;
}

// Leftmost "<4-6 digits>_<name>" in `text`, longest digit run first.
std::optional<std::string> find_customer_folder(const std::string& text) {
    const std::size_t size = text.size();
    for (std::size_t start = 0; start < size; ++start) {
        for (std::size_t digits = 6; digits >= 4; --digits) {
            const std::size_t underscore = start + digits;
            if (underscore + 1 >= size) {
                continue;
            }
            bool all_digits = true;
            for (std::size_t i = start; i < underscore; ++i) {
                if (!is_digit(static_cast<unsigned char>(text[i]))) {
                    all_digits = false;
                    break;
                }
            }
            if (!all_digits || text[underscore] != '_' ||
                !is_name_char(static_cast<unsigned char>(text[underscore + 1]))) {
                continue;
            }
            std::size_t end = underscore + 1;
            while (end < size && is_name_char(static_cast<unsigned char>(text[end]))) {
                ++end;
            }
            return text.substr(start, end - start);
        }
    }
    return std::nullopt;
}

} // namespace

std::string customer_root(const fs::path& path, const std::vector<std::string>& internal_roots) {
    if (auto folder = find_customer_folder(path.parent_path().string())) {
        return *folder;
    }

    const std::string lowered = to_lower(path.string());
    for (const auto& root : internal_roots) {
        if (!root.empty() && lowered.find(to_lower(root)) != std::string::npos) {
            return root;
        }
    }
    return kDefaultCustomerRoot;
}

std::string subfolder(const fs::path& path) {
    const std::string lowered = to_lower(path.string());
    const std::string filename = to_lower(path.filename().string());
    for (const auto& rule : subfolder_rules()) {
        for (const char* keyword : rule.keywords) {
            if (lowered.find(keyword) != std::string::npos || filename.find(keyword) != std::string::npos) {
                return rule.name;
            }
        }
    }
    return kDefaultSubfolder;
}

std::string subfolder_for_category(const std::string& category) {
    const std::string key = to_lower(category);
    if (key == "finanzen" || key == "personal") {
        return "Archiv";
    }
    if (key == "projekte" || key == "footage") {
        return "Projekte";
    }
    return kDefaultSubfolder;
}

int year_of(double mtime) {
    const std::time_t secs = static_cast<std::time_t>(mtime);
    std::tm local{};
    localtime_r(&secs, &local);
    return local.tm_year + 1900;
}

fs::path target_directory(const fs::path& base,
                          const std::string& customer_root,
                          const std::string& subfolder,
                          bool enable_year,
                          const std::vector<std::string>& year_subfolders_for,
                          double mtime) {
    fs::path dir = base / customer_root / subfolder;
    const bool year_eligible = std::find(year_subfolders_for.begin(), year_subfolders_for.end(), subfolder)
                               != year_subfolders_for.end();
    if (enable_year && year_eligible) {
        dir /= std::to_string(year_of(mtime));
    }
    return dir;
}

PathClassifier::PathClassifier(const config::Config& config)
    : central_base_(config.central_base),
      internal_roots_(config.internal_roots),
      sorting_(config.sorting) {}

Placement PathClassifier::place(const fs::path& path, double mtime) const {
    return place_with_subfolder(path, subfolder(path), mtime);
}

Placement PathClassifier::place_with_subfolder(const fs::path& path, std::string subfolder_name, double mtime) const {
    Placement placement;
    placement.customer_root = customer_root(path, internal_roots_);
    placement.subfolder = std::move(subfolder_name);
    placement.directory = target_directory(central_base_, placement.customer_root, placement.subfolder,
                                           sorting_.enable_year_subfolders, sorting_.year_folders_under, mtime);
    return placement;
}

} // namespace docsort::classify
