#include "docsort/dedup/quarantine.hpp"
#include "docsort/core/file_stat.hpp"
#include "docsort/dedup/file_mover.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace docsort::dedup {
namespace fs = std::filesystem;
QuarantineService::QuarantineService(fs::path central_base,
                                     std::shared_ptr<index::HashIndex> index,
                                     BusyCheck busy)
    : central_base_(std::move(central_base)), index_(std::move(index)), busy_(std::move(busy)) {}

DuplicatePage QuarantineService::list(const std::optional<std::string>& customer,
                                      std::size_t limit, std::size_t offset) const {
    DuplicatePage page;
    std::error_code ec;
    if (!fs::is_directory(central_base_, ec)) {
        return page;
    }

    std::vector<DuplicateItem> items;
    const fs::directory_iterator end_customers{};
    for (fs::directory_iterator it(central_base_, ec); !ec && it != end_customers; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_directory(entry_ec)) {
            continue;
        }
        const std::string customer_root = it->path().filename().string();
        if (customer && customer_root != *customer) {
            continue;
        }
        collect_quarantined(it->path() / kQuarantineDirName, customer_root, items);
    }
    if (ec) {
        spdlog::warn("[Quarantine] listing {} stopped early: {}", central_base_.string(), ec.message());
    }

    std::sort(items.begin(), items.end(), [](const DuplicateItem& a, const DuplicateItem& b) {
        return a.mtime > b.mtime;
    });

    page.total = items.size();
    if (offset < items.size()) {
        const auto end = std::min(items.size(), offset + limit);
        page.items.assign(std::make_move_iterator(items.begin() + static_cast<std::ptrdiff_t>(offset)),
                          std::make_move_iterator(items.begin() + static_cast<std::ptrdiff_t>(end)));
    }
    return page;
}

void QuarantineService::collect_quarantined(const fs::path& dup_dir,
                                            const std::string& customer_root,
                                            std::vector<DuplicateItem>& items) const {
    std::error_code ec;
    if (!fs::is_directory(dup_dir, ec)) {
        return;
    }
    const fs::recursive_directory_iterator end{};
    fs::recursive_directory_iterator it(dup_dir, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code file_ec;
        if (!it->is_regular_file(file_ec)) {
            continue;
        }
        auto st = stat_file(it->path());
        if (st.is_error()) {
            continue;
        }
        DuplicateItem item;
        item.customer_root = customer_root;
        item.filename = it->path().filename().string();
        item.path = it->path();
        item.size = st.value().size;
        item.mtime = st.value().mtime;
        items.push_back(std::move(item));
    }
    if (ec) {
        spdlog::warn("[Quarantine] listing {} stopped early: {}", dup_dir.string(), ec.message());
    }
}

Result<PromoteOutcome> QuarantineService::promote(const fs::path& path) {
    if (auto idle = check_idle(); idle.is_error()) {
        return Err<PromoteOutcome>(idle.error());
    }
    if (auto inside = check_quarantined(path); inside.is_error()) {
        return Err<PromoteOutcome>(inside.error());
    }

    auto digest = hasher_.hash(path);
    if (digest.is_error()) {
        return Err<PromoteOutcome>(digest.error());
    }

    // the crawler writes through its own connection; pick up its records
    if (auto reloaded = index_->load(); reloaded.is_error()) {
        return Err<PromoteOutcome>(reloaded.error());
    }
    auto record = index_->get(digest.value());
    if (!record) {
        return Err<PromoteOutcome>(ErrorCode::NotFound, "primary file not found in index for " + path.string());
    }

    auto st = stat_file(path);
    if (st.is_error()) {
        return Err<PromoteOutcome>(st.error());
    }

    PromoteOutcome outcome;
    outcome.primary_path = record->path;

    std::error_code ec;
    if (!fs::exists(record->path, ec)) {
        auto moved = move_file(path, record->path);
        if (moved.is_error()) {
            return Err<PromoteOutcome>(moved.error());
        }
        outcome.replaced_missing_primary = true;
    } else {
        auto demoted = move_into(record->path, quarantine_dir(central_base_, record->customer_root));
        if (demoted.is_error()) {
            return Err<PromoteOutcome>(demoted.error());
        }
        auto moved = move_file(path, record->path);
        if (moved.is_error()) {
            auto restored = move_file(demoted.value(), record->path);
            if (restored.is_error()) {
                spdlog::error("[Quarantine] could not restore primary {}: {}",
                              record->path.string(), restored.error().message);
            }
            return Err<PromoteOutcome>(moved.error());
        }
        outcome.previous_primary = demoted.value();
    }

    index::ContentRecord updated = *record;
    updated.size = st.value().size;
    updated.mtime = st.value().mtime;
    auto stored = index_->put(updated);
    if (stored.is_error()) {
        return Err<PromoteOutcome>(stored.error());
    }

    spdlog::info("[Quarantine] promoted {} -> {}", path.string(), record->path.string());
    return Ok(std::move(outcome));
}

Result<fs::path> QuarantineService::move(const fs::path& path, const fs::path& target_dir) {
    if (auto idle = check_idle(); idle.is_error()) {
        return Err<fs::path>(idle.error());
    }
    if (auto inside = check_quarantined(path); inside.is_error()) {
        return Err<fs::path>(inside.error());
    }
    if (target_dir.empty()) {
        return Err<fs::path>(ErrorCode::InvalidArgument, "target_dir must not be empty");
    }

    auto moved = move_into(path, target_dir);
    if (moved.is_ok()) {
        spdlog::info("[Quarantine] moved {} -> {}", path.string(), moved.value().string());
    }
    return moved;
}

DeleteOutcome QuarantineService::remove(const std::vector<std::string>& paths) {
    DeleteOutcome outcome;
    for (const auto& raw : paths) {
        const fs::path path(raw);
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            outcome.failed.push_back({raw, "not_found"});
            continue;
        }
        if (!is_inside_quarantine(path)) {
            outcome.failed.push_back({raw, "not_in_quarantine"});
            continue;
        }
        if (!fs::remove(path, ec) || ec) {
            outcome.failed.push_back({raw, ec ? ec.message() : "not_found"});
            continue;
        }
        ++outcome.deleted;
    }
    spdlog::info("[Quarantine] deleted={} failed={}", outcome.deleted, outcome.failed.size());
    return outcome;
}

Result<void> QuarantineService::check_idle() const {
    if (busy_ && busy_()) {
        return Err<void>(ErrorCode::Conflict, "crawler is running");
    }
    return Ok();
}

Result<void> QuarantineService::check_quarantined(const fs::path& path) const {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Err<void>(ErrorCode::NotFound, "duplicate file not found: " + path.string());
    }
    if (!is_inside_quarantine(path)) {
        return Err<void>(ErrorCode::InvalidArgument, "not a quarantined file: " + path.string());
    }
    return Ok();
}

} // namespace docsort::dedup
