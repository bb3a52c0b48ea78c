#pragma once

#include "cloudup/backend/backend.hpp"
#include "cloudup/events/event_bus.hpp"
#include "cloudup/io/byte_source.hpp"
#include "cloudup/upload/cancellation.hpp"
#include "cloudup/upload/chunk_planner.hpp"
#include "cloudup/upload/retry_policy.hpp"
#include "cloudup/upload/session_state.hpp"
#include "cloudup/upload/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace cloudup::upload {

struct SessionOptions {
    RetryOptions retry;
    std::chrono::seconds token_margin{120};       ///< Minimum credential lifetime before each call
    std::optional<std::uint32_t> jitter_seed;     ///< Fixed seed for reproducible backoff
};

/**
 * @brief Drives one upload end-to-end
 *
 * Idle -> Planning -> Transferring -> Finalizing -> Completed. Chunks are sent
 * strictly in ascending offset order; a chunk is never issued before the
 * previous one was acknowledged. Every remote call goes through the retry
 * policy with its own attempt counter. cancel() may be called from any
 * thread; it is observed before each remote call and wakes backoff waits.
 *
 * run() executes on the calling thread and returns the terminal outcome.
 * Uploader wraps it in a worker thread for the asynchronous contract.
 */
class UploadSession {
public:
    UploadSession(std::string session_id,
                  UploadTarget target,
                  std::shared_ptr<io::ByteSource> source,
                  std::shared_ptr<backend::Backend> backend,
                  SessionOptions options = {},
                  events::EventBus* bus = nullptr);

    UploadSession(const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;

    UploadOutcome run();

    void cancel();

    [[nodiscard]] bool cancel_requested() const noexcept { return cancel_.is_cancelled(); }

    [[nodiscard]] const std::string& id() const noexcept { return session_id_; }
    [[nodiscard]] const UploadTarget& target() const noexcept { return target_; }

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] UploadSessionInfo info() const;

private:
    template<typename T>
    using RemoteCall = std::function<Result<T>(const auth::Credential&)>;

    /**
     * Run `call` until it succeeds, the retry policy aborts, or the session
     * is cancelled (reported as a Cancelled error). `chunk_index` tags
     * errors and retry events.
     */
    template<typename T>
    Result<T> call_with_retry(std::optional<std::uint32_t> chunk_index, const RemoteCall<T>& call);

    Result<auth::Credential> acquire_credential();

    Result<void> transfer_chunk(const ChunkDescriptor& chunk, std::string& resource_id);

    Result<void> transition(SessionState next);

    UploadOutcome finish_failed(Error error);
    UploadOutcome finish_cancelled();
    void abort_remote();

    template<typename EventType>
    void publish(const EventType& event) {
        if (bus_ != nullptr) {
            bus_->emit(event);
        }
    }

    const std::string session_id_;
    const UploadTarget target_;
    std::shared_ptr<io::ByteSource> source_;
    std::shared_ptr<backend::Backend> backend_;
    SessionOptions options_;
    events::EventBus* bus_;

    RetryPolicy policy_;
    CancellationToken cancel_;
    std::atomic<bool> started_{false};

    mutable std::mutex mutex_;   // guards machine_
    SessionStateMachine machine_;

    std::optional<backend::SessionHandle> handle_;
    std::chrono::steady_clock::time_point started_at_{};
};

} // namespace cloudup::upload
