#include "cloudup/auth/token_refresher.hpp"

#include <spdlog/spdlog.h>

namespace cloudup::auth {

TokenRefresher::TokenRefresher(std::shared_ptr<TokenManager> manager,
                               std::chrono::milliseconds interval,
                               std::chrono::seconds lead)
    : manager_(std::move(manager)), interval_(interval), lead_(lead) {
    worker_ = std::thread([this] { run(); });
}

TokenRefresher::~TokenRefresher() {
    stop();
}

void TokenRefresher::stop() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void TokenRefresher::run() {
    std::unique_lock lock(mutex_);
    while (!stopping_) {
        lock.unlock();
        auto fresh = manager_->ensure_fresh(lead_);
        if (fresh.is_error()) {
            spdlog::warn("Background token refresh failed: {}", fresh.error().describe());
        }
        lock.lock();
        cv_.wait_for(lock, interval_, [this] { return stopping_; });
    }
}

} // namespace cloudup::auth
