#pragma once

#include "docsort/core/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace docsort::hashing {

/**
 * @brief SHA-256 content digests
 *
 * Files are streamed in fixed blocks so memory use does not depend on file
 * size. Digests are 64 lowercase hex characters.
 */
class ContentHasher {
public:
    static constexpr std::size_t kDefaultBlockSize = 1024 * 1024;

    explicit ContentHasher(std::size_t block_size = kDefaultBlockSize);

    // ErrorCode::IoError when the file cannot be opened or read.
    Result<std::string> hash(const std::filesystem::path& path) const;

    std::string hash_bytes(std::string_view data) const;

    [[nodiscard]] std::size_t block_size() const noexcept { return block_size_; }

private:
    std::size_t block_size_;
};

} // namespace docsort::hashing
