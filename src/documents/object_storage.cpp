#include "docsort/documents/object_storage.hpp"

#include "docsort/core/file_stat.hpp"
#include "docsort/dedup/file_mover.hpp"

#include <system_error>

namespace docsort::documents {
namespace fs = std::filesystem;

Result<ObjectInfo> LocalObjectStorage::stat(const fs::path& location) const {
    auto st = stat_file(location);
    if (st.is_error()) {
        if (st.error().code == ErrorCode::NotFound) {
            return Ok(ObjectInfo{});
        }
        return Err<ObjectInfo>(st.error());
    }
    ObjectInfo info;
    info.exists = true;
    info.metadata = {{"size", st.value().size}, {"mtime", st.value().mtime}};
    return Ok(std::move(info));
}

Result<void> LocalObjectStorage::move(const fs::path& from, const fs::path& to) {
    return dedup::move_file(from, to);
}

Result<void> LocalObjectStorage::copy(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    if (to.has_parent_path()) {
        fs::create_directories(to.parent_path(), ec);
        if (ec) {
            return Err<void>(ErrorCode::IoError, "cannot create " + to.parent_path().string() + ": " + ec.message());
        }
    }
    fs::copy_file(from, to, fs::copy_options::none, ec);
    if (ec) {
        const auto code = ec == std::errc::file_exists ? ErrorCode::Conflict : ErrorCode::IoError;
        return Err<void>(code, "copy " + from.string() + " -> " + to.string() + ": " + ec.message());
    }
    return Ok();
}

} // namespace docsort::documents
