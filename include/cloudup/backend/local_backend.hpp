#pragma once

#include "cloudup/backend/backend.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace cloudup::backend {

/**
 * @brief Uploads into a folder on the local filesystem
 *
 * Chunks are written at their offsets into a hidden staging file next to
 * the destination; finalize() renames it over the destination and abort()
 * removes it. Chunk sizes are free-form.
 */
class LocalBackend : public Backend {
public:
    static constexpr std::uint64_t kDefaultChunkSize = 4 * 1024 * 1024;

    explicit LocalBackend(std::filesystem::path folder, std::uint64_t chunk_size = kDefaultChunkSize);

    [[nodiscard]] std::string name() const override { return "local"; }

    [[nodiscard]] std::shared_ptr<auth::TokenManager> token_manager() const override { return nullptr; }

    [[nodiscard]] ChunkConstraints chunk_constraints(std::uint64_t total_length) const override;

    Result<SessionHandle> initiate(const upload::UploadTarget& target,
                                   const auth::Credential& credential) override;

    Result<ChunkResult> upload_chunk(const SessionHandle& handle,
                                     const upload::ChunkDescriptor& chunk,
                                     const std::vector<std::uint8_t>& bytes,
                                     const auth::Credential& credential) override;

    Result<std::string> finalize(const SessionHandle& handle, const auth::Credential& credential) override;

    void abort(const SessionHandle& handle, const auth::Credential& credential) override;

    [[nodiscard]] const std::filesystem::path& folder() const noexcept { return folder_; }

    static std::filesystem::path staging_path_for(const std::filesystem::path& destination);

private:
    static Result<void> ensure_parent_exists(const std::filesystem::path& path);

    std::filesystem::path folder_;
    std::uint64_t chunk_size_;
};

} // namespace cloudup::backend
