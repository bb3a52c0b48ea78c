#include "cloudup/events/event_bus.hpp"
#include "cloudup/events/components.hpp"
#include "cloudup/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using cloudup::Error;
using cloudup::events::ChunkUploadedEvent;
using cloudup::events::EventBus;
using cloudup::events::LoggerComponent;
using cloudup::events::MetricsComponent;
using cloudup::events::RetryScheduledEvent;
using cloudup::events::UploadCancelledEvent;
using cloudup::events::UploadCompletedEvent;
using cloudup::events::UploadFailedEvent;
using cloudup::events::UploadStartedEvent;

TEST(MetricsComponentTest, TracksUploadOutcomesAndBytes) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(UploadStartedEvent{"upload-1", "a.bin", "onedrive", 1000});
    bus.emit(ChunkUploadedEvent{"upload-1", 0, 2, 600, false});
    bus.emit(RetryScheduledEvent{"upload-1", 1, 1, std::chrono::milliseconds(500), Error::network("reset")});
    bus.emit(ChunkUploadedEvent{"upload-1", 1, 2, 400, false});
    bus.emit(UploadCompletedEvent{"upload-1", "a.bin", "item-1", 1000, std::chrono::milliseconds(200)});

    bus.emit(UploadStartedEvent{"upload-2", "b.bin", "webdav", 10});
    bus.emit(UploadFailedEvent{"upload-2", "b.bin", Error::auth("expired", 401)});

    bus.emit(UploadStartedEvent{"upload-3", "c.bin", "local", 10});
    bus.emit(UploadCancelledEvent{"upload-3", "c.bin", 0});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.uploads_started.load(), 3u);
    EXPECT_EQ(stats.uploads_completed.load(), 1u);
    EXPECT_EQ(stats.uploads_failed.load(), 1u);
    EXPECT_EQ(stats.uploads_cancelled.load(), 1u);
    EXPECT_EQ(stats.chunks_uploaded.load(), 2u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 1000u);
    EXPECT_EQ(stats.retries_scheduled.load(), 1u);
}

TEST(MetricsComponentTest, PartialAcknowledgementCountsBytesOnly) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(ChunkUploadedEvent{"upload-1", 0, 1, 100, true});
    bus.emit(ChunkUploadedEvent{"upload-1", 0, 1, 50, false});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.chunks_uploaded.load(), 1u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 150u);
}

TEST(LoggerComponentTest, HandlesEveryEventType) {
    EventBus bus;
    LoggerComponent logger(bus);

    EXPECT_EQ(bus.subscriber_count<UploadStartedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<RetryScheduledEvent>(), 1u);
    EXPECT_NO_THROW(bus.emit(RetryScheduledEvent{"upload-1", -1, 2, std::chrono::milliseconds(10),
                                                 Error::rate_limited("slow down", std::chrono::milliseconds(10))}));
    EXPECT_NO_THROW(bus.emit(UploadFailedEvent{"upload-1", "a.bin", Error::validation("bad")}));
}
