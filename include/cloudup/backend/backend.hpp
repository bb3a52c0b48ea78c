#pragma once

#include "cloudup/auth/credential.hpp"
#include "cloudup/auth/token_manager.hpp"
#include "cloudup/core/result.hpp"
#include "cloudup/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cloudup::backend {

/**
 * @brief Chunking rules a backend imposes for a given file size
 *
 * Non-final chunks must be multiples of `alignment` and at most `max_chunk`
 * long; the final chunk only has to fit. alignment == 1 means none.
 */
struct ChunkConstraints {
    std::uint64_t min_chunk = 1;
    std::uint64_t max_chunk = 0;
    std::uint64_t alignment = 1;
};

/**
 * @brief Opaque handle for a remote upload opened by initiate()
 */
struct SessionHandle {
    std::string location;          ///< Upload-session URL, resource URL or staging path
    std::string resource_path;     ///< Final remote path of the file
    std::uint64_t total_length = 0;
    bool remote_allocated = false; ///< Whether abort() has anything to clean up
    std::optional<std::chrono::system_clock::time_point> expires_at;
};

struct ByteRange {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
};

/**
 * @brief Backend acknowledgement of one chunk
 */
struct ChunkResult {
    enum class Status {
        Accepted,   ///< Whole chunk stored, more expected
        Partial,    ///< Only `accepted` was stored; the remainder must be resent
        Completed   ///< Remote resource finished; `resource_id` identifies it
    };

    Status status = Status::Accepted;
    std::optional<ByteRange> accepted;
    std::string resource_id;

    static ChunkResult accepted_all() { return ChunkResult{}; }
    static ChunkResult partial(ByteRange range) { return ChunkResult{Status::Partial, range, {}}; }
    static ChunkResult completed(std::string id) { return ChunkResult{Status::Completed, std::nullopt, std::move(id)}; }
};

/**
 * @brief Wire-level steps of one remote storage service
 *
 * The upload session is written once against this interface; each backend
 * declares its chunking rules through chunk_constraints() so that single-shot,
 * aligned multi-chunk and free-form backends share the same orchestration.
 * Backends report errors and never retry on their own.
 */
class Backend {
public:
    virtual ~Backend() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    /// Token manager supplying credentials, or nullptr if the backend needs none
    [[nodiscard]] virtual std::shared_ptr<auth::TokenManager> token_manager() const = 0;

    [[nodiscard]] virtual ChunkConstraints chunk_constraints(std::uint64_t total_length) const = 0;

    virtual Result<SessionHandle> initiate(const upload::UploadTarget& target,
                                           const auth::Credential& credential) = 0;

    virtual Result<ChunkResult> upload_chunk(const SessionHandle& handle,
                                             const upload::ChunkDescriptor& chunk,
                                             const std::vector<std::uint8_t>& bytes,
                                             const auth::Credential& credential) = 0;

    /// Commit step; returns the resource id when the backend reports one here
    virtual Result<std::string> finalize(const SessionHandle& handle, const auth::Credential& credential) = 0;

    /// Best-effort cleanup. Failures are logged by the backend, not returned.
    virtual void abort(const SessionHandle& handle, const auth::Credential& credential) = 0;
};

} // namespace cloudup::backend
