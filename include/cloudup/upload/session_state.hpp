#pragma once

#include "cloudup/core/result.hpp"
#include "cloudup/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace cloudup::upload {

/**
 * @brief Point-in-time view of an upload session
 */
struct UploadSessionInfo {
    std::string session_id;
    std::string remote_path;
    std::string backend;
    std::chrono::system_clock::time_point started_at{};
    SessionState state = SessionState::Idle;
    std::uint32_t total_chunks = 0;
    std::uint32_t chunks_done = 0;
    std::uint64_t bytes_total = 0;
    std::uint64_t bytes_done = 0;
    std::optional<std::uint32_t> current_chunk;
    std::optional<Error> last_error;  ///< Populated when state == Failed
};

/**
 * @brief Legal state transitions of an upload session
 *
 * Idle -> Planning -> Transferring -> Finalizing -> Completed, with Failed
 * and Cancelled reachable from any non-terminal state. Terminal states are
 * never left.
 */
class SessionStateMachine {
public:
    SessionStateMachine(std::string session_id, std::string remote_path, std::string backend);

    [[nodiscard]] const std::string& session_id() const noexcept { return info_.session_id; }
    [[nodiscard]] SessionState state() const noexcept { return info_.state; }
    [[nodiscard]] const UploadSessionInfo& info() const noexcept { return info_; }

    Result<void> start(std::uint64_t bytes_total);
    Result<void> transition_to(SessionState next_state);
    Result<void> mark_failed(Error error);
    Result<void> mark_cancelled();

    void set_plan(std::uint32_t total_chunks);
    void set_current_chunk(std::uint32_t index);
    void record_progress(std::uint64_t bytes);
    void record_chunk_done();

    [[nodiscard]] std::chrono::system_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool can_transition(SessionState target) const noexcept;

    UploadSessionInfo info_;
    std::chrono::system_clock::time_point last_transition_{};
};

} // namespace cloudup::upload
