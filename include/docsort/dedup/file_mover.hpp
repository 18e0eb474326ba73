#pragma once

#include "docsort/core/result.hpp"

#include <filesystem>

namespace docsort::dedup {

inline constexpr const char* kQuarantineDirName = "_duplicates";

// `dir/name` if free, else `dir/stem_1.ext`, `dir/stem_2.ext`, ...
std::filesystem::path unique_destination(const std::filesystem::path& dir,
                                         const std::filesystem::path& filename);

/**
 * @brief Move a file, creating the destination directory
 *
 * Tries rename first and falls back to copy + remove when the source and
 * destination live on different filesystems. Never overwrites: an existing
 * destination yields ErrorCode::Conflict.
 */
Result<void> move_file(const std::filesystem::path& from, const std::filesystem::path& to);

// Moves `from` into `dir` under a collision-free name; returns the final path.
Result<std::filesystem::path> move_into(const std::filesystem::path& from,
                                        const std::filesystem::path& dir);

// <central_base>/<customer_root>/_duplicates
std::filesystem::path quarantine_dir(const std::filesystem::path& central_base,
                                     const std::string& customer_root);

bool is_inside_quarantine(const std::filesystem::path& path);

} // namespace docsort::dedup
