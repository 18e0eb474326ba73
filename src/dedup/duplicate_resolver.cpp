#include "docsort/dedup/duplicate_resolver.hpp"
#include "docsort/dedup/file_mover.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace docsort::dedup {
namespace fs = std::filesystem;

const char* to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::Placed: return "placed";
        case Outcome::Displaced: return "displaced";
        case Outcome::Quarantined: return "quarantined";
        case Outcome::AlreadyPrimary: return "already_primary";
    }
    return "unknown";
}

DuplicateResolver::DuplicateResolver(fs::path central_base, std::shared_ptr<index::HashIndex> index)
    : central_base_(std::move(central_base)), index_(std::move(index)) {}

bool DuplicateResolver::supersedes(const index::ContentRecord& existing, double mtime, std::uintmax_t size) noexcept {
    if (mtime != existing.mtime) {
        return mtime > existing.mtime;
    }
    return size > existing.size;
}

Result<Resolution> DuplicateResolver::resolve(const Observation& observation) {
    const auto existing = index_->get(observation.digest);

    if (existing && existing->path == observation.path) {
        return Ok(Resolution{Outcome::AlreadyPrimary, observation.path, observation.path, std::nullopt});
    }

    std::error_code ec;
    if (!existing || !fs::exists(existing->path, ec)) {
        if (existing) {
            spdlog::debug("[Resolver] stale primary {} for {}", existing->path.string(), observation.digest);
        }
        return place_new(observation);
    }

    if (supersedes(*existing, observation.mtime, observation.size)) {
        return displace(observation, *existing);
    }
    return quarantine(observation, *existing);
}

Result<Resolution> DuplicateResolver::place_new(const Observation& observation) {
    const fs::path& dir = observation.placement.directory;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Err<Resolution>(ErrorCode::IoError, "cannot create " + dir.string() + ": " + ec.message());
    }

    fs::path destination = dir / observation.path.filename();
    if (destination != observation.path) {
        destination = unique_destination(dir, observation.path.filename());
        auto moved = move_file(observation.path, destination);
        if (moved.is_error()) {
            return Err<Resolution>(moved.error());
        }
    }

    index::ContentRecord record{observation.digest, destination, observation.size,
                                observation.mtime, observation.placement.customer_root};
    auto stored = index_->put(record);
    if (stored.is_error()) {
        return Err<Resolution>(stored.error());
    }
    return Ok(Resolution{Outcome::Placed, destination, destination, std::nullopt});
}

Result<Resolution> DuplicateResolver::displace(const Observation& observation, const index::ContentRecord& existing) {
    const fs::path primary_path = existing.path;

    auto demoted = move_into(primary_path, quarantine_dir(central_base_, existing.customer_root));
    if (demoted.is_error()) {
        return Err<Resolution>(demoted.error());
    }

    auto promoted = move_file(observation.path, primary_path);
    if (promoted.is_error()) {
        // put the old primary back so the index stays truthful
        auto restored = move_file(demoted.value(), primary_path);
        if (restored.is_error()) {
            spdlog::error("[Resolver] could not restore {} from {}: {}",
                          primary_path.string(), demoted.value().string(), restored.error().message);
        }
        return Err<Resolution>(promoted.error());
    }

    index::ContentRecord record{observation.digest, primary_path, observation.size,
                                observation.mtime, existing.customer_root};
    auto stored = index_->put(record);
    if (stored.is_error()) {
        return Err<Resolution>(stored.error());
    }
    return Ok(Resolution{Outcome::Displaced, primary_path, primary_path, demoted.value()});
}

Result<Resolution> DuplicateResolver::quarantine(const Observation& observation, const index::ContentRecord& existing) {
    auto moved = move_into(observation.path, quarantine_dir(central_base_, observation.placement.customer_root));
    if (moved.is_error()) {
        return Err<Resolution>(moved.error());
    }
    return Ok(Resolution{Outcome::Quarantined, moved.value(), existing.path, std::nullopt});
}

} // namespace docsort::dedup
