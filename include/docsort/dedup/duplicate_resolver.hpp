#pragma once

#include "docsort/classify/path_classifier.hpp"
#include "docsort/core/result.hpp"
#include "docsort/index/hash_index.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace docsort::dedup {

// One file found during a crawl, already hashed and classified.
struct Observation {
    std::filesystem::path path;
    std::string digest;
    std::uintmax_t size = 0;
    double mtime = 0.0;
    classify::Placement placement;
};

enum class Outcome {
    Placed,          // first copy of this content, moved to its classified destination
    Displaced,       // newer copy replaced the primary, old primary quarantined
    Quarantined,     // older or equal copy moved to quarantine, primary untouched
    AlreadyPrimary   // the observed file is the primary itself
};

const char* to_string(Outcome outcome);

struct Resolution {
    Outcome outcome = Outcome::Placed;
    std::filesystem::path final_path;                   // where the observed file ended up
    std::filesystem::path primary_path;                 // primary for the digest afterwards
    std::optional<std::filesystem::path> displaced_to;  // old primary's quarantine path
};

/**
 * @brief Decides primary vs duplicate for observed files
 *
 * Keeps at most one primary per digest. Ordering is (mtime, size)
 * lexicographic: newer wins, equal mtime -> larger wins, full tie keeps
 * the existing primary. A recorded primary whose file has vanished is
 * treated as absent.
 */
class DuplicateResolver {
public:
    DuplicateResolver(std::filesystem::path central_base, std::shared_ptr<index::HashIndex> index);

    Result<Resolution> resolve(const Observation& observation);

    // true when the observed copy should replace `existing` as primary
    static bool supersedes(const index::ContentRecord& existing, double mtime, std::uintmax_t size) noexcept;

private:
    Result<Resolution> place_new(const Observation& observation);
    Result<Resolution> displace(const Observation& observation, const index::ContentRecord& existing);
    Result<Resolution> quarantine(const Observation& observation, const index::ContentRecord& existing);

    std::filesystem::path central_base_;
    std::shared_ptr<index::HashIndex> index_;
};

} // namespace docsort::dedup
