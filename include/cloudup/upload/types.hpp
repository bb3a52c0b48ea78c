#pragma once

#include "cloudup/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace cloudup::upload {

/**
 * @brief Destination of one upload; fixed for the session's lifetime
 */
struct UploadTarget {
    std::string remote_path;   ///< Backend-relative path, e.g. "photos/2024/a.jpg"
    std::uint64_t total_length = 0;
    std::string content_type = "application/octet-stream";
};

/**
 * @brief One contiguous byte range sent in a single backend call
 */
struct ChunkDescriptor {
    std::uint32_t index = 0;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    bool is_final = false;

    [[nodiscard]] std::uint64_t end() const noexcept { return offset + length; }

    bool operator==(const ChunkDescriptor& other) const {
        return index == other.index && offset == other.offset && length == other.length &&
               is_final == other.is_final;
    }
};

enum class SessionState {
    Idle,
    Planning,
    Transferring,
    Finalizing,
    Completed,
    Failed,
    Cancelled
};

const char* to_string(SessionState state) noexcept;

[[nodiscard]] inline bool is_terminal(SessionState state) noexcept {
    return state == SessionState::Completed || state == SessionState::Failed ||
           state == SessionState::Cancelled;
}

/**
 * @brief Terminal result reported to the caller
 *
 * Failed always carries the last concrete error (with its chunk index when
 * the failure happened during transfer).
 */
struct UploadOutcome {
    enum class Status { Completed, Failed, Cancelled };

    Status status = Status::Failed;
    std::string resource_id;        ///< Remote identity when Completed
    std::optional<Error> error;     ///< Set when Failed

    static UploadOutcome completed(std::string resource_id) {
        return UploadOutcome{Status::Completed, std::move(resource_id), std::nullopt};
    }
    static UploadOutcome failed(Error error) {
        return UploadOutcome{Status::Failed, {}, std::move(error)};
    }
    static UploadOutcome cancelled() {
        return UploadOutcome{Status::Cancelled, {}, std::nullopt};
    }

    [[nodiscard]] bool is_completed() const noexcept { return status == Status::Completed; }
};

} // namespace cloudup::upload
