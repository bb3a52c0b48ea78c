/**
 * @file events.hpp
 * @brief Upload lifecycle events published on the EventBus
 *
 * NAMING CONVENTION:
 * - Events are past-tense: UploadStartedEvent, ChunkUploadedEvent
 */

#pragma once

#include "cloudup/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace cloudup::events {

/**
 * @brief Emitted when a session leaves Idle
 *
 * WHO EMITS: UploadSession
 * WHO SUBSCRIBES: LoggerComponent, MetricsComponent
 */
struct UploadStartedEvent {
    std::string session_id;
    std::string remote_path;
    std::string backend;
    std::uint64_t total_bytes = 0;
};

/**
 * @brief Emitted after the backend acknowledged a chunk (or part of one)
 */
struct ChunkUploadedEvent {
    std::string session_id;
    std::uint32_t chunk_index = 0;
    std::uint32_t total_chunks = 0;
    std::uint64_t bytes = 0;
    bool partial = false;
};

/**
 * @brief Emitted when a failed call will be retried after `delay`
 */
struct RetryScheduledEvent {
    std::string session_id;
    std::int64_t chunk_index = -1;   ///< -1 for initiate/finalize
    std::uint32_t attempt = 0;
    std::chrono::milliseconds delay{0};
    Error cause;
};

struct UploadCompletedEvent {
    std::string session_id;
    std::string remote_path;
    std::string resource_id;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds duration{0};
};

struct UploadFailedEvent {
    std::string session_id;
    std::string remote_path;
    Error error;
};

struct UploadCancelledEvent {
    std::string session_id;
    std::string remote_path;
    std::uint64_t bytes_done = 0;
};

} // namespace cloudup::events
