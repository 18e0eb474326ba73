#pragma once

#include "docsort/core/result.hpp"

#include <cstdint>
#include <filesystem>

namespace docsort {

struct FileStat {
    std::uintmax_t size = 0;
    double mtime = 0.0;  // seconds since the epoch, sub-second precision
};

// ErrorCode::IoError when the path cannot be stat'ed, NotFound when absent.
Result<FileStat> stat_file(const std::filesystem::path& path);

} // namespace docsort
