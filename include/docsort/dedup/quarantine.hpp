#pragma once

#include "docsort/core/result.hpp"
#include "docsort/hashing/content_hasher.hpp"
#include "docsort/index/hash_index.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docsort::dedup {

struct DuplicateItem {
    std::string customer_root;
    std::string filename;
    std::filesystem::path path;
    std::uintmax_t size = 0;
    double mtime = 0.0;
};

struct DuplicatePage {
    std::vector<DuplicateItem> items;
    std::size_t total = 0;
};

struct PromoteOutcome {
    bool replaced_missing_primary = false;
    std::filesystem::path primary_path;
    std::optional<std::filesystem::path> previous_primary;  // where the demoted primary went
};

struct DeleteFailure {
    std::string path;
    std::string error;
};

struct DeleteOutcome {
    std::size_t deleted = 0;
    std::vector<DeleteFailure> failed;
};

/**
 * @brief Operator actions on quarantined duplicates
 *
 * Promote and move mutate the primary layout, so they are refused with
 * ErrorCode::Conflict while `busy()` reports a running crawl.
 */
class QuarantineService {
public:
    using BusyCheck = std::function<bool()>;

    QuarantineService(std::filesystem::path central_base,
                      std::shared_ptr<index::HashIndex> index,
                      BusyCheck busy = {});

    // Newest first; `customer` restricts the listing to one customer root.
    [[nodiscard]] DuplicatePage list(const std::optional<std::string>& customer,
                                     std::size_t limit, std::size_t offset) const;

    Result<PromoteOutcome> promote(const std::filesystem::path& path);
    Result<std::filesystem::path> move(const std::filesystem::path& path, const std::filesystem::path& target_dir);
    DeleteOutcome remove(const std::vector<std::string>& paths);

private:
    Result<void> check_idle() const;
    void collect_quarantined(const std::filesystem::path& dup_dir,
                             const std::string& customer_root,
                             std::vector<DuplicateItem>& items) const;
    Result<void> check_quarantined(const std::filesystem::path& path) const;

    std::filesystem::path central_base_;
    std::shared_ptr<index::HashIndex> index_;
    BusyCheck busy_;
    hashing::ContentHasher hasher_;
};

} // namespace docsort::dedup
