/**
 * @file components.hpp
 * @brief Reusable subscribers for upload lifecycle events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Pass &bus to UploadSession / Uploader and the components react
 */

#pragma once

#include "cloudup/events/event_bus.hpp"
#include "cloudup/events/events.hpp"
#include "cloudup/core/format.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>

namespace cloudup::events {

/**
 * @brief Logger component - logs every upload event with spdlog
 *
 * Chunk-level events are logged at debug so a large transfer does not
 * flood the default info output.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent& e) {
            on_upload_started(e);
        });

        bus_.subscribe<ChunkUploadedEvent>([this](const ChunkUploadedEvent& e) {
            on_chunk_uploaded(e);
        });

        bus_.subscribe<RetryScheduledEvent>([this](const RetryScheduledEvent& e) {
            on_retry_scheduled(e);
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            on_upload_completed(e);
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            on_upload_failed(e);
        });

        bus_.subscribe<UploadCancelledEvent>([this](const UploadCancelledEvent& e) {
            on_upload_cancelled(e);
        });
    }

private:
    void on_upload_started(const UploadStartedEvent& e) {
        spdlog::info("[UploadStarted] session={} path={} backend={} size={}",
                     e.session_id, e.remote_path, e.backend, format_size(e.total_bytes));
    }

    void on_chunk_uploaded(const ChunkUploadedEvent& e) {
        spdlog::debug("[ChunkUploaded] session={} chunk={}/{} bytes={}{}",
                      e.session_id, e.chunk_index + 1, e.total_chunks, e.bytes,
                      e.partial ? " (partial)" : "");
    }

    void on_retry_scheduled(const RetryScheduledEvent& e) {
        if (e.chunk_index >= 0) {
            spdlog::warn("[RetryScheduled] session={} chunk={} attempt={} delay={}ms cause={}",
                         e.session_id, e.chunk_index, e.attempt, e.delay.count(), e.cause.describe());
        } else {
            spdlog::warn("[RetryScheduled] session={} attempt={} delay={}ms cause={}",
                         e.session_id, e.attempt, e.delay.count(), e.cause.describe());
        }
    }

    void on_upload_completed(const UploadCompletedEvent& e) {
        spdlog::info("[UploadCompleted] session={} path={} id={} size={} duration={}ms",
                     e.session_id, e.remote_path, e.resource_id,
                     format_size(e.total_bytes), e.duration.count());
    }

    void on_upload_failed(const UploadFailedEvent& e) {
        spdlog::error("[UploadFailed] session={} path={} error={}",
                      e.session_id, e.remote_path, e.error.describe());
    }

    void on_upload_cancelled(const UploadCancelledEvent& e) {
        spdlog::info("[UploadCancelled] session={} path={} bytes_done={}",
                     e.session_id, e.remote_path, e.bytes_done);
    }

    EventBus& bus_;
};

/**
 * @brief Metrics component - counts upload outcomes and transferred bytes
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * auto& stats = metrics.get_stats();
 * spdlog::info("retries: {}", stats.retries_scheduled.load());
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> uploads_started{0};
        std::atomic<std::uint64_t> uploads_completed{0};
        std::atomic<std::uint64_t> uploads_failed{0};
        std::atomic<std::uint64_t> uploads_cancelled{0};
        std::atomic<std::uint64_t> chunks_uploaded{0};
        std::atomic<std::uint64_t> bytes_uploaded{0};
        std::atomic<std::uint64_t> retries_scheduled{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent&) {
            stats_.uploads_started++;
        });

        bus_.subscribe<ChunkUploadedEvent>([this](const ChunkUploadedEvent& e) {
            on_chunk_uploaded(e);
        });

        bus_.subscribe<RetryScheduledEvent>([this](const RetryScheduledEvent&) {
            stats_.retries_scheduled++;
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent&) {
            stats_.uploads_completed++;
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.uploads_failed++;
        });

        bus_.subscribe<UploadCancelledEvent>([this](const UploadCancelledEvent&) {
            stats_.uploads_cancelled++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("Upload statistics:");
        spdlog::info("  Uploads started:   {}", stats_.uploads_started.load());
        spdlog::info("  Uploads completed: {}", stats_.uploads_completed.load());
        spdlog::info("  Uploads failed:    {}", stats_.uploads_failed.load());
        spdlog::info("  Uploads cancelled: {}", stats_.uploads_cancelled.load());
        spdlog::info("  Chunks uploaded:   {}", stats_.chunks_uploaded.load());
        spdlog::info("  Bytes uploaded:    {}", format_size(stats_.bytes_uploaded.load()));
        spdlog::info("  Retries:           {}", stats_.retries_scheduled.load());
    }

private:
    void on_chunk_uploaded(const ChunkUploadedEvent& e) {
        // Partial acknowledgements count bytes but not chunks
        if (!e.partial) {
            stats_.chunks_uploaded++;
        }
        stats_.bytes_uploaded += e.bytes;
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace cloudup::events
