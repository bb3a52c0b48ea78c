#pragma once

#include "cloudup/backend/backend.hpp"
#include "cloudup/events/event_bus.hpp"
#include "cloudup/io/byte_source.hpp"
#include "cloudup/upload/upload_session.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace cloudup::upload {

/**
 * @brief Caller's handle to an upload running on its own worker thread
 *
 * cancel() returns immediately; await_outcome() blocks until the session is
 * terminal. Destroying the handle waits for the worker, so cancel first if
 * the upload should not run to completion.
 */
class UploadHandle {
public:
    explicit UploadHandle(std::shared_ptr<UploadSession> session);
    ~UploadHandle();

    UploadHandle(const UploadHandle&) = delete;
    UploadHandle& operator=(const UploadHandle&) = delete;

    void cancel();

    UploadOutcome await_outcome();

    /// Wait at most `timeout`; nullopt if the session is still running
    std::optional<UploadOutcome> await_outcome_for(std::chrono::milliseconds timeout);

    [[nodiscard]] const std::string& id() const noexcept { return session_->id(); }
    [[nodiscard]] SessionState state() const { return session_->state(); }
    [[nodiscard]] UploadSessionInfo info() const { return session_->info(); }

private:
    std::shared_ptr<UploadSession> session_;
    std::shared_future<UploadOutcome> outcome_;
    std::thread worker_;
};

/**
 * @brief Entry point for starting uploads
 *
 * Holds the options and event bus shared by every session it starts and
 * hands out session ids.
 */
class Uploader {
public:
    explicit Uploader(SessionOptions options = {}, events::EventBus* bus = nullptr);

    /**
     * @brief Validate the request and start a session in the background
     *
     * Fails synchronously with Validation when the target is empty, has no
     * remote path, or the source holds fewer bytes than the target declares.
     */
    Result<std::shared_ptr<UploadHandle>> start_upload(UploadTarget target,
                                                       std::shared_ptr<io::ByteSource> source,
                                                       std::shared_ptr<backend::Backend> backend);

private:
    std::string next_session_id();

    SessionOptions options_;
    events::EventBus* bus_;
    std::atomic<std::uint64_t> session_counter_{0};
};

} // namespace cloudup::upload
