#pragma once

#include "cloudup/auth/token_exchanger.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cloudup::testing {

/**
 * Counts exchanges and hands out "access-<n>" tokens valid for one hour,
 * rotating the refresh token to "refresh-<n>". Scripted errors are
 * returned first.
 */
class FakeTokenExchanger : public auth::TokenExchanger {
public:
    std::chrono::milliseconds delay{0};
    std::chrono::seconds lifetime{3600};

    void fail_next(Error error) {
        std::lock_guard lock(mutex_);
        failures_.push_back(std::move(error));
    }

    Result<auth::TokenGrant> refresh(const std::string& refresh_token) override {
        const int n = ++calls_;
        {
            std::lock_guard lock(mutex_);
            seen_refresh_tokens_.push_back(refresh_token);
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        {
            std::lock_guard lock(mutex_);
            if (!failures_.empty()) {
                Error error = std::move(failures_.front());
                failures_.pop_front();
                return Err<auth::TokenGrant>(std::move(error));
            }
        }
        auth::TokenGrant grant;
        grant.access_token = "access-" + std::to_string(n);
        grant.expires_at = auth::Clock::now() + lifetime;
        grant.refresh_token = "refresh-" + std::to_string(n);
        return Ok(std::move(grant));
    }

    int calls() const { return calls_.load(); }

    std::vector<std::string> seen_refresh_tokens() const {
        std::lock_guard lock(mutex_);
        return seen_refresh_tokens_;
    }

private:
    std::atomic<int> calls_{0};
    mutable std::mutex mutex_;
    std::deque<Error> failures_;
    std::vector<std::string> seen_refresh_tokens_;
};

} // namespace cloudup::testing
