#pragma once

#include "cloudup/backend/backend.hpp"
#include "cloudup/network/http_transport.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace cloudup::backend {

/**
 * @brief WebDAV (RFC 4918) upload with a single whole-file PUT
 *
 * initiate() prepares the destination: missing parent collections are
 * created with MKCOL and an existing resource is deleted first. The only
 * valid plan is one chunk covering the file.
 *
 * With replace_existing off, abort() only deletes the destination once a
 * PUT may have written to it; a file that was never touched is kept.
 */
class WebDavBackend : public Backend {
public:
    struct Options {
        std::string base_url;           ///< e.g. https://dav.example.com/remote.php/dav/files/me
        std::string root;               ///< Folder below base_url that remote paths are relative to
        bool replace_existing = true;
        bool create_collections = true;
        std::chrono::milliseconds request_timeout{std::chrono::seconds(60)};
        std::chrono::milliseconds abort_timeout{std::chrono::seconds(10)};
    };

    WebDavBackend(std::shared_ptr<network::HttpTransport> transport,
                  std::shared_ptr<auth::TokenManager> tokens,
                  Options options);

    [[nodiscard]] std::string name() const override { return "webdav"; }

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

    /// PROPFIND Depth: 0 on the root; checks reachability and credentials
    Result<void> probe(const auth::Credential& credential);

    /// Absolute URL of a path relative to the root
    [[nodiscard]] std::string resource_url(const std::string& relative_path) const;

private:
    Result<void> make_collections(const std::string& relative_dir, const auth::Credential& credential);

    network::HttpRequest make_request(network::HttpMethod method,
                                      std::string url,
                                      const auth::Credential& credential) const;

    std::shared_ptr<network::HttpTransport> transport_;
    std::shared_ptr<auth::TokenManager> tokens_;
    Options options_;

    std::mutex written_mutex_;
    std::unordered_set<std::string> written_;  ///< Locations a PUT may have modified
};

} // namespace cloudup::backend
