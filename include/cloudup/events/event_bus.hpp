/**
 * @file event_bus.hpp
 * @brief In-process publish/subscribe for upload lifecycle events
 *
 * Upload sessions publish progress without knowing who listens; the logger
 * and metrics components subscribe without knowing which session emits.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<ChunkUploadedEvent>([](const ChunkUploadedEvent& e) { ... });
 * bus.emit(ChunkUploadedEvent{...});
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace cloudup::events {

/**
 * @brief Event bus keyed by the event's static type
 *
 * THREAD SAFETY:
 * - emit() may run concurrently from every session worker
 * - subscribe()/unsubscribe() may race with emit(); an emit already in
 *   progress keeps calling the handlers it saw when it started
 * - Handlers run synchronously on the emitting thread, so a slow handler
 *   slows down the upload that emitted
 */
class EventBus {
public:
    using SubscriptionId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for one event type
     *
     * RETURNS:
     * Id to pass to unsubscribe<EventType>()
     *
     * EXAMPLE:
     * auto id = bus.subscribe<UploadCompletedEvent>([](const UploadCompletedEvent& e) {
     *     spdlog::info("Uploaded {}", e.remote_path);
     * });
     */
    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        Dispatch dispatch = [fn = std::move(handler)](const void* event) {
            fn(*static_cast<const EventType*>(event));
        };

        std::unique_lock lock(mutex_);
        const SubscriptionId id = next_id_++;
        slots_[std::type_index(typeid(EventType))].push_back(
            Slot{id, std::make_shared<const Dispatch>(std::move(dispatch))});
        return id;
    }

    /// Unknown ids are ignored
    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto it = slots_.find(std::type_index(typeid(EventType)));
        if (it == slots_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const Slot& slot) { return slot.id == id; }),
                   list.end());
    }

    /**
     * @brief Deliver an event to every current subscriber of its type
     *
     * A handler that throws is logged and skipped; the remaining handlers
     * still run and the emitting upload is not affected.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<const Dispatch>> targets;
        {
            std::shared_lock lock(mutex_);
            auto it = slots_.find(std::type_index(typeid(EventType)));
            if (it == slots_.end()) {
                return;
            }
            targets.reserve(it->second.size());
            for (const auto& slot : it->second) {
                targets.push_back(slot.dispatch);
            }
        }

        // Called without the lock so handlers may subscribe or emit themselves
        for (const auto& dispatch : targets) {
            try {
                (*dispatch)(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = slots_.find(std::type_index(typeid(EventType)));
        return it != slots_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

private:
    using Dispatch = std::function<void(const void*)>;

    struct Slot {
        SubscriptionId id;
        std::shared_ptr<const Dispatch> dispatch;
    };

    std::unordered_map<std::type_index, std::vector<Slot>> slots_;
    mutable std::shared_mutex mutex_;
    SubscriptionId next_id_ = 0;
};

} // namespace cloudup::events
