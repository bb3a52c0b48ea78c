#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace cloudup::upload {

/**
 * @brief Cooperative cancellation flag with an interruptible wait
 *
 * cancel() never blocks. Sessions poll is_cancelled() before each remote
 * call and sleep through wait_for() between retries so a cancel wakes them
 * immediately.
 */
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard lock(mutex_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool is_cancelled() const noexcept { return cancelled_.load(); }

    /// Sleep for `duration`; returns true if cancelled before or during the wait
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& duration) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace cloudup::upload
