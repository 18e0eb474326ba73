#include "docsort/hashing/content_hasher.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace docsort::hashing {
namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

std::string to_hex(const unsigned char* data, unsigned int length) {
    std::ostringstream oss;
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

EvpMdCtxPtr new_sha256_context() {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

} // namespace

ContentHasher::ContentHasher(std::size_t block_size)
    : block_size_(block_size == 0 ? kDefaultBlockSize : block_size) {}

Result<std::string> ContentHasher::hash(const std::filesystem::path& path) const {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorCode::IoError, "cannot open file for hashing: " + path.string());
    }

    auto ctx = new_sha256_context();
    if (!ctx) {
        return Err<std::string>(ErrorCode::Internal, "failed to initialise SHA-256 context");
    }

    std::vector<char> buffer(block_size_);
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        const auto count = static_cast<std::size_t>(input.gcount());
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), count) != 1) {
            return Err<std::string>(ErrorCode::Internal, "SHA-256 update failed for " + path.string());
        }
    }
    if (input.bad()) {
        return Err<std::string>(ErrorCode::IoError, "read error while hashing: " + path.string());
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        return Err<std::string>(ErrorCode::Internal, "SHA-256 finalisation failed for " + path.string());
    }
    return Ok(to_hex(digest, length));
}

std::string ContentHasher::hash_bytes(std::string_view data) const {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    EVP_Digest(data.data(), data.size(), digest, &length, EVP_sha256(), nullptr);
    return to_hex(digest, length);
}

} // namespace docsort::hashing
