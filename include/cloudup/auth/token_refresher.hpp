#pragma once

#include "cloudup/auth/token_manager.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace cloudup::auth {

/**
 * @brief Keeps a TokenManager's credential warm in the background
 *
 * Wakes every `interval` and refreshes when the credential expires within
 * `lead`. Failures are logged and retried on the next tick. The thread stops
 * when the refresher is destroyed.
 */
class TokenRefresher {
public:
    TokenRefresher(std::shared_ptr<TokenManager> manager,
                   std::chrono::milliseconds interval = std::chrono::seconds(60),
                   std::chrono::seconds lead = std::chrono::seconds(120));
    ~TokenRefresher();

    TokenRefresher(const TokenRefresher&) = delete;
    TokenRefresher& operator=(const TokenRefresher&) = delete;

    void stop();

private:
    void run();

    std::shared_ptr<TokenManager> manager_;
    std::chrono::milliseconds interval_;
    std::chrono::seconds lead_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace cloudup::auth
