#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace cloudup {

/**
 * @brief Failure categories shared by every component
 *
 * Components report one of these kinds and never decide whether a failure
 * is worth retrying; only the upload session does that (via RetryPolicy).
 */
enum class ErrorKind {
    Auth,            ///< Credential invalid or expired and not recoverable by the caller
    Network,         ///< Transport failure: timeout, connection reset, DNS
    RateLimited,     ///< Remote asked us to slow down (optional retry_after)
    BackendProtocol, ///< Malformed or unexpected response from the remote service
    Validation,      ///< Caller-supplied input (or a declared constraint) is invalid
    Cancelled        ///< Caller requested cancellation
};

const char* to_string(ErrorKind kind) noexcept;

/**
 * @brief Structured error carried by every cloudup::Result
 */
struct Error {
    ErrorKind kind = ErrorKind::BackendProtocol;
    std::string message;
    std::optional<std::uint32_t> chunk_index;            ///< Chunk being transferred, if any
    std::optional<int> status_code;                      ///< HTTP status, if the remote replied
    std::optional<std::chrono::milliseconds> retry_after;
    std::uint32_t attempts = 0;                          ///< Attempts made when the error became terminal
    std::shared_ptr<const Error> cause;

    static Error auth(std::string message, std::optional<int> status = std::nullopt);
    static Error network(std::string message);
    static Error rate_limited(std::string message,
                              std::optional<std::chrono::milliseconds> retry_after,
                              std::optional<int> status = std::nullopt);
    static Error protocol(std::string message, std::optional<int> status = std::nullopt);
    static Error validation(std::string message);
    static Error cancelled(std::string message = "upload cancelled");

    /**
     * @brief Map a non-success HTTP status to an error kind
     *
     * 401/403 -> Auth, 408 -> Network, 429 -> RateLimited, 503 with a
     * Retry-After hint -> RateLimited, 400/405/411/413/415 -> Validation,
     * everything else -> BackendProtocol.
     */
    static Error from_http_status(int status,
                                  const std::string& context,
                                  std::optional<std::chrono::milliseconds> retry_after = std::nullopt);

    [[nodiscard]] Error at_chunk(std::uint32_t index) const;
    [[nodiscard]] Error caused_by(Error inner) const;

    [[nodiscard]] bool is(ErrorKind k) const noexcept { return kind == k; }

    /// Single-line diagnostic including chunk, status and the cause chain
    [[nodiscard]] std::string describe() const;
};

} // namespace cloudup
