#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace docsort::testing {

// Hyphen separators keep the generated name from looking like a
// "12345_Name" customer folder.
inline std::filesystem::path create_temp_dir(const std::string& prefix) {
    namespace fs = std::filesystem;
    static std::atomic<uint64_t> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = fs::temp_directory_path() /
               fs::path(prefix + "-" + std::to_string(stamp) + "-" + std::to_string(counter.fetch_add(1)));
    fs::create_directories(dir);
    return dir;
}

inline std::string write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    return content;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Sets the modification time to `seconds` since the epoch.
inline void set_mtime(const std::filesystem::path& path, long long seconds) {
    namespace fs = std::filesystem;
    using namespace std::chrono;
    const auto now_sys = system_clock::now();
    const auto now_file = fs::file_time_type::clock::now();
    const auto target = system_clock::time_point(std::chrono::seconds(seconds));
    fs::last_write_time(path, now_file + duration_cast<fs::file_time_type::duration>(target - now_sys));
}

} // namespace docsort::testing
