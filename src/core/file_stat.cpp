#include "docsort/core/file_stat.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <string>

namespace docsort {

Result<FileStat> stat_file(const std::filesystem::path& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        const int err = errno;
        const ErrorCode code = err == ENOENT ? ErrorCode::NotFound : ErrorCode::IoError;
        return Err<FileStat>(code, "stat " + path.string() + ": " + std::strerror(err));
    }
    FileStat out;
    out.size = static_cast<std::uintmax_t>(st.st_size);
    out.mtime = static_cast<double>(st.st_mtim.tv_sec) + static_cast<double>(st.st_mtim.tv_nsec) / 1e9;
    return Ok(out);
}

} // namespace docsort
