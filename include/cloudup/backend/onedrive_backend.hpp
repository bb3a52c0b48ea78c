#pragma once

#include "cloudup/backend/backend.hpp"
#include "cloudup/network/http_transport.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace cloudup::backend {

/**
 * @brief Microsoft identity/Graph cloud a OneDrive account lives in
 */
enum class OneDriveApi {
    Common,
    Consumers,
    Organizations,
    China
};

const char* onedrive_token_url(OneDriveApi api) noexcept;
const char* onedrive_graph_url(OneDriveApi api) noexcept;
Result<OneDriveApi> parse_onedrive_api(const std::string& name);

/**
 * @brief OneDrive (Microsoft Graph) upload protocol
 *
 * Files below the chunk size go up in one simple PUT to
 * items/{parent}:/{name}:/content. Larger files use an upload session:
 * createUploadSession, then Content-Range fragments whose non-final lengths
 * are multiples of 320 KiB. The fragment that completes the file returns the
 * created item, so finalize() has nothing left to commit.
 *
 * Remote paths are relative to `root_folder`; missing parent folders are
 * created on the way.
 */
class OneDriveBackend : public Backend {
public:
    static constexpr std::uint64_t kMaxFileSize = 250ULL * 1024 * 1024 * 1024;
    static constexpr std::uint64_t kFragmentAlignment = 320 * 1024;
    static constexpr std::uint64_t kDefaultChunkSize = 10 * 1024 * 1024;

    struct Options {
        OneDriveApi api = OneDriveApi::Common;
        std::string root_folder = "/";
        std::uint64_t chunk_size = kDefaultChunkSize;
        std::chrono::milliseconds request_timeout{std::chrono::seconds(60)};
        std::chrono::milliseconds abort_timeout{std::chrono::seconds(10)};
    };

    OneDriveBackend(std::shared_ptr<network::HttpTransport> transport,
                    std::shared_ptr<auth::TokenManager> tokens,
                    Options options);

    [[nodiscard]] std::string name() const override { return "onedrive"; }

    [[nodiscard]] std::shared_ptr<auth::TokenManager> token_manager() const override { return tokens_; }

    [[nodiscard]] ChunkConstraints chunk_constraints(std::uint64_t total_length) const override;

    Result<SessionHandle> initiate(const upload::UploadTarget& target,
                                   const auth::Credential& credential) override;

    Result<ChunkResult> upload_chunk(const SessionHandle& handle,
                                     const upload::ChunkDescriptor& chunk,
                                     const std::vector<std::uint8_t>& bytes,
                                     const auth::Credential& credential) override;

    Result<std::string> finalize(const SessionHandle& handle, const auth::Credential& credential) override;

    void abort(const SessionHandle& handle, const auth::Credential& credential) override;

    /// Effective fragment size: chunk_size rounded down to the 320 KiB grid
    [[nodiscard]] std::uint64_t fragment_size() const noexcept;

    /// Folder id for an absolute drive path, creating missing folders
    Result<std::string> resolve_folder(const std::string& folder, const auth::Credential& credential);

private:
    Result<std::string> create_folder(const std::string& folder, const auth::Credential& credential);

    Result<SessionHandle> create_upload_session(const std::string& parent_id,
                                                const std::string& file_name,
                                                const upload::UploadTarget& target,
                                                const auth::Credential& credential);

    Result<ChunkResult> put_fragment(const SessionHandle& handle,
                                     const upload::ChunkDescriptor& chunk,
                                     const std::vector<std::uint8_t>& bytes);

    Result<ChunkResult> put_simple(const SessionHandle& handle,
                                   const std::vector<std::uint8_t>& bytes,
                                   const auth::Credential& credential);

    network::HttpRequest make_request(network::HttpMethod method,
                                      std::string url,
                                      const auth::Credential& credential) const;

    std::shared_ptr<network::HttpTransport> transport_;
    std::shared_ptr<auth::TokenManager> tokens_;
    Options options_;
    std::string graph_url_;
};

} // namespace cloudup::backend
