#include "docsort/dedup/file_mover.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <system_error>

namespace docsort::dedup {
namespace fs = std::filesystem;

fs::path unique_destination(const fs::path& dir, const fs::path& filename) {
    std::error_code ec;
    fs::path candidate = dir / filename;
    if (!fs::exists(candidate, ec)) {
        return candidate;
    }

    const std::string stem = filename.stem().string();
    const std::string ext = filename.extension().string();
    for (std::size_t counter = 1;; ++counter) {
        candidate = dir / (stem + "_" + std::to_string(counter) + ext);
        if (!fs::exists(candidate, ec)) {
            return candidate;
        }
    }
}

Result<void> move_file(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    if (!fs::exists(from, ec)) {
        return Err<void>(ErrorCode::NotFound, "source does not exist: " + from.string());
    }
    if (fs::exists(to, ec)) {
        return Err<void>(ErrorCode::Conflict, "destination already exists: " + to.string());
    }
    if (to.has_parent_path()) {
        fs::create_directories(to.parent_path(), ec);
        if (ec) {
            return Err<void>(ErrorCode::IoError,
                "cannot create " + to.parent_path().string() + ": " + ec.message());
        }
    }

    fs::rename(from, to, ec);
    if (!ec) {
        return Ok();
    }

    // rename(2) cannot cross filesystems
    spdlog::debug("[Move] rename {} -> {} failed ({}), copying", from.string(), to.string(), ec.message());
    ec.clear();
    fs::copy_file(from, to, fs::copy_options::none, ec);
    if (ec) {
        return Err<void>(ErrorCode::IoError,
            "copy " + from.string() + " -> " + to.string() + ": " + ec.message());
    }
    fs::remove(from, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(to, cleanup);
        return Err<void>(ErrorCode::IoError, "remove " + from.string() + ": " + ec.message());
    }
    return Ok();
}

Result<fs::path> move_into(const fs::path& from, const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Err<fs::path>(ErrorCode::IoError, "cannot create " + dir.string() + ": " + ec.message());
    }
    const fs::path destination = unique_destination(dir, from.filename());
    auto moved = move_file(from, destination);
    if (moved.is_error()) {
        return Err<fs::path>(moved.error());
    }
    return Ok(destination);
}

fs::path quarantine_dir(const fs::path& central_base, const std::string& customer_root) {
    return central_base / customer_root / kQuarantineDirName;
}

bool is_inside_quarantine(const fs::path& path) {
    for (const auto& part : path.parent_path()) {
        if (part == kQuarantineDirName) {
            return true;
        }
    }
    return false;
}

} // namespace docsort::dedup
