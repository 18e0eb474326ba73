#pragma once

#include "docsort/core/result.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

namespace docsort::documents {

struct ObjectInfo {
    bool exists = false;
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief Where document bytes live
 *
 * The pipeline and rollback only need existence checks, moves and copies,
 * so remote stores can plug in behind this interface.
 */
class ObjectStorage {
public:
    virtual ~ObjectStorage() = default;

    virtual Result<ObjectInfo> stat(const std::filesystem::path& location) const = 0;

    // Fails with ErrorCode::Conflict when `to` is occupied.
    virtual Result<void> move(const std::filesystem::path& from, const std::filesystem::path& to) = 0;

    virtual Result<void> copy(const std::filesystem::path& from, const std::filesystem::path& to) = 0;
};

// Plain local filesystem.
class LocalObjectStorage final : public ObjectStorage {
public:
    Result<ObjectInfo> stat(const std::filesystem::path& location) const override;
    Result<void> move(const std::filesystem::path& from, const std::filesystem::path& to) override;
    Result<void> copy(const std::filesystem::path& from, const std::filesystem::path& to) override;
};

} // namespace docsort::documents
