#include "cloudup/upload/upload_session.hpp"

#include "cloudup/core/format.hpp"
#include "cloudup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace cloudup::upload {
namespace {

RetryPolicy make_policy(const SessionOptions& options) {
    if (options.jitter_seed) {
        return RetryPolicy(options.retry, *options.jitter_seed);
    }
    return RetryPolicy(options.retry);
}

std::int64_t event_chunk_index(const std::optional<std::uint32_t>& index) {
    return index ? static_cast<std::int64_t>(*index) : -1;
}

} // namespace

UploadSession::UploadSession(std::string session_id,
                             UploadTarget target,
                             std::shared_ptr<io::ByteSource> source,
                             std::shared_ptr<backend::Backend> backend,
                             SessionOptions options,
                             events::EventBus* bus)
    : session_id_(std::move(session_id)),
      target_(std::move(target)),
      source_(std::move(source)),
      backend_(std::move(backend)),
      options_(options),
      bus_(bus),
      policy_(make_policy(options_)),
      machine_(session_id_, target_.remote_path, backend_ ? backend_->name() : std::string{}) {}

void UploadSession::cancel() {
    if (!cancel_.is_cancelled()) {
        spdlog::debug("Cancellation requested for session {}", session_id_);
    }
    cancel_.cancel();
}

SessionState UploadSession::state() const {
    std::lock_guard lock(mutex_);
    return machine_.state();
}

UploadSessionInfo UploadSession::info() const {
    std::lock_guard lock(mutex_);
    return machine_.info();
}

Result<void> UploadSession::transition(SessionState next) {
    std::lock_guard lock(mutex_);
    return machine_.transition_to(next);
}

UploadOutcome UploadSession::run() {
    if (started_.exchange(true)) {
        return UploadOutcome::failed(Error::validation("Upload session " + session_id_ + " already ran"));
    }
    if (!backend_ || !source_) {
        return UploadOutcome::failed(Error::validation("Upload session needs a backend and a byte source"));
    }

    started_at_ = std::chrono::steady_clock::now();
    {
        std::lock_guard lock(mutex_);
        if (auto started = machine_.start(target_.total_length); started.is_error()) {
            return UploadOutcome::failed(started.error());
        }
    }

    spdlog::info("Upload {} started: {} ({}) via {}",
                 session_id_, target_.remote_path, format_size(target_.total_length), backend_->name());
    publish(events::UploadStartedEvent{session_id_, target_.remote_path, backend_->name(), target_.total_length});

    if (cancel_.is_cancelled()) {
        return finish_cancelled();
    }

    auto plan = ChunkPlanner::plan(target_.total_length, backend_->chunk_constraints(target_.total_length));
    if (plan.is_error()) {
        return finish_failed(plan.error());
    }
    const auto& chunks = plan.value();
    {
        std::lock_guard lock(mutex_);
        machine_.set_plan(static_cast<std::uint32_t>(chunks.size()));
    }
    spdlog::debug("Upload {} planned {} chunk(s)", session_id_, chunks.size());

    if (auto moved = transition(SessionState::Transferring); moved.is_error()) {
        return finish_failed(moved.error());
    }

    auto handle = call_with_retry<backend::SessionHandle>(std::nullopt, [this](const auth::Credential& credential) {
        return backend_->initiate(target_, credential);
    });
    if (handle.is_error()) {
        return handle.error().is(ErrorKind::Cancelled) ? finish_cancelled() : finish_failed(handle.error());
    }
    handle_ = handle.value();

    std::string resource_id;
    for (const auto& chunk : chunks) {
        auto sent = transfer_chunk(chunk, resource_id);
        if (sent.is_error()) {
            return sent.error().is(ErrorKind::Cancelled) ? finish_cancelled() : finish_failed(sent.error());
        }
    }

    if (cancel_.is_cancelled()) {
        return finish_cancelled();
    }
    if (auto moved = transition(SessionState::Finalizing); moved.is_error()) {
        return finish_failed(moved.error());
    }

    auto finalized = call_with_retry<std::string>(std::nullopt, [this](const auth::Credential& credential) {
        return backend_->finalize(*handle_, credential);
    });
    if (finalized.is_error()) {
        return finalized.error().is(ErrorKind::Cancelled) ? finish_cancelled() : finish_failed(finalized.error());
    }
    if (!finalized.value().empty()) {
        resource_id = finalized.value();
    }

    if (auto moved = transition(SessionState::Completed); moved.is_error()) {
        return finish_failed(moved.error());
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at_);
    spdlog::info("Upload {} completed: {} -> {} in {}ms", session_id_, target_.remote_path, resource_id, elapsed.count());
    publish(events::UploadCompletedEvent{session_id_, target_.remote_path, resource_id, target_.total_length, elapsed});
    return UploadOutcome::completed(std::move(resource_id));
}

Result<void> UploadSession::transfer_chunk(const ChunkDescriptor& chunk, std::string& resource_id) {
    if (cancel_.is_cancelled()) {
        return Err<void>(Error::cancelled());
    }
    {
        std::lock_guard lock(mutex_);
        machine_.set_current_chunk(chunk.index);
    }

    auto read = source_->read_range(chunk.offset, chunk.length);
    if (read.is_error()) {
        return Err<void>(read.error().at_chunk(chunk.index));
    }

    ChunkDescriptor pending = chunk;
    std::vector<std::uint8_t> bytes = std::move(read.value());
    std::uint32_t total_chunks = 0;
    {
        std::lock_guard lock(mutex_);
        total_chunks = machine_.info().total_chunks;
    }

    // A partially accepted chunk is resent as its remainder, same index,
    // with a fresh attempt counter.
    while (true) {
        auto result = call_with_retry<backend::ChunkResult>(
            pending.index, [this, &pending, &bytes](const auth::Credential& credential) {
                return backend_->upload_chunk(*handle_, pending, bytes, credential);
            });
        if (result.is_error()) {
            return Err<void>(result.error());
        }

        const auto& ack = result.value();
        if (ack.status == backend::ChunkResult::Status::Partial) {
            // The acknowledged range has to cover the chunk's first byte, or
            // bytes before it would be counted without ever being accepted
            if (!ack.accepted || ack.accepted->offset > pending.offset ||
                ack.accepted->offset + ack.accepted->length <= pending.offset) {
                return Err<void>(Error::protocol("Backend reported a partial acceptance outside the chunk")
                                     .at_chunk(pending.index));
            }
            const std::uint64_t accepted = ack.accepted->offset + ack.accepted->length - pending.offset;
            auto rest = ChunkPlanner::remainder(pending, accepted);
            if (rest.is_error()) {
                return Err<void>(rest.error().at_chunk(pending.index));
            }
            spdlog::debug("Upload {} chunk {} partially accepted ({} of {} bytes)",
                          session_id_, pending.index, accepted, pending.length);
            {
                std::lock_guard lock(mutex_);
                machine_.record_progress(accepted);
            }
            publish(events::ChunkUploadedEvent{session_id_, pending.index, total_chunks, accepted, true});
            bytes.erase(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(accepted));
            pending = rest.value();
            continue;
        }

        if (ack.status == backend::ChunkResult::Status::Completed) {
            resource_id = ack.resource_id;
        }
        {
            std::lock_guard lock(mutex_);
            machine_.record_progress(pending.length);
            machine_.record_chunk_done();
        }
        spdlog::debug("Upload {} chunk {}/{} sent ({} bytes at offset {})",
                      session_id_, pending.index + 1, total_chunks, pending.length, pending.offset);
        publish(events::ChunkUploadedEvent{session_id_, pending.index, total_chunks, pending.length, false});
        return Ok();
    }
}

Result<auth::Credential> UploadSession::acquire_credential() {
    auto manager = backend_->token_manager();
    if (!manager) {
        return Ok(auth::Credential{});
    }
    return manager->ensure_fresh(options_.token_margin);
}

template<typename T>
Result<T> UploadSession::call_with_retry(std::optional<std::uint32_t> chunk_index, const RemoteCall<T>& call) {
    AttemptCounter counter;
    while (true) {
        if (cancel_.is_cancelled()) {
            return Err<T>(Error::cancelled());
        }

        std::optional<auth::Credential> used;
        auto credential = acquire_credential();
        Result<T> result = credential.is_ok() ? call(credential.value()) : Err<T>(credential.error());
        if (result.is_ok()) {
            return result;
        }
        if (credential.is_ok()) {
            used = credential.value();
        }

        Error failure = chunk_index ? result.error().at_chunk(*chunk_index) : result.error();
        auto decision = policy_.classify(failure, counter);
        if (!decision.is_retry()) {
            return Err<T>(decision.reason);
        }

        spdlog::warn("Upload {}: attempt {} failed ({}), retrying in {}ms",
                     session_id_, counter.failures, failure.describe(), decision.delay.count());
        publish(events::RetryScheduledEvent{session_id_, event_chunk_index(chunk_index), counter.failures,
                                            decision.delay, failure});

        if (decision.refresh_credential && used) {
            if (auto manager = backend_->token_manager()) {
                auto refreshed = manager->force_refresh(*used);
                if (refreshed.is_error()) {
                    // The forced refresh is the one Auth retry; its failure ends the call.
                    Error reason = chunk_index ? refreshed.error().at_chunk(*chunk_index) : refreshed.error();
                    reason.attempts = counter.failures;
                    return Err<T>(reason.caused_by(failure));
                }
            }
        }

        if (cancel_.wait_for(decision.delay)) {
            return Err<T>(Error::cancelled());
        }
    }
}

UploadOutcome UploadSession::finish_failed(Error error) {
    {
        std::lock_guard lock(mutex_);
        if (auto marked = machine_.mark_failed(error); marked.is_error()) {
            spdlog::debug("Upload {}: {}", session_id_, marked.error().message);
        }
    }
    spdlog::error("Upload {} failed: {}", session_id_, error.describe());
    abort_remote();
    publish(events::UploadFailedEvent{session_id_, target_.remote_path, error});
    return UploadOutcome::failed(std::move(error));
}

UploadOutcome UploadSession::finish_cancelled() {
    std::uint64_t bytes_done = 0;
    {
        std::lock_guard lock(mutex_);
        if (auto marked = machine_.mark_cancelled(); marked.is_error()) {
            spdlog::debug("Upload {}: {}", session_id_, marked.error().message);
        }
        bytes_done = machine_.info().bytes_done;
    }
    spdlog::info("Upload {} cancelled after {} bytes", session_id_, bytes_done);
    abort_remote();
    publish(events::UploadCancelledEvent{session_id_, target_.remote_path, bytes_done});
    return UploadOutcome::cancelled();
}

void UploadSession::abort_remote() {
    if (!handle_ || !handle_->remote_allocated) {
        return;
    }

    // Abort never blocks on a token exchange: the last published credential
    // (possibly stale) is good enough for a best-effort cleanup.
    auth::Credential credential;
    if (auto manager = backend_->token_manager()) {
        if (auto snapshot = manager->snapshot()) {
            credential = *snapshot;
        }
    }
    spdlog::debug("Upload {}: aborting remote session {}", session_id_, handle_->location);
    backend_->abort(*handle_, credential);
    handle_.reset();
}

} // namespace cloudup::upload
