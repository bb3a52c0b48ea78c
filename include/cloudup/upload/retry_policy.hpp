#pragma once

#include "cloudup/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

namespace cloudup::upload {

struct RetryOptions {
    std::uint32_t max_attempts = 5;                 ///< Attempts per chunk, first try included
    std::chrono::milliseconds base_delay{500};
    std::chrono::milliseconds max_delay{30000};
    double jitter = 0.2;                            ///< +/- fraction applied to backoff delays
};

/**
 * @brief Failure history of the operation currently being retried
 *
 * One instance per chunk (and one for initiate/finalize); the policy updates
 * it on every classify() call.
 */
struct AttemptCounter {
    std::uint32_t failures = 0;
    std::uint32_t consecutive_auth = 0;
};

struct RetryDecision {
    enum class Action { Retry, Abort };

    Action action = Action::Abort;
    std::chrono::milliseconds delay{0};
    bool refresh_credential = false;  ///< Force a token refresh before retrying
    Error reason;                     ///< Error to report when aborting

    [[nodiscard]] bool is_retry() const noexcept { return action == Action::Retry; }

    static RetryDecision retry(std::chrono::milliseconds after, bool refresh = false) {
        RetryDecision d;
        d.action = Action::Retry;
        d.delay = after;
        d.refresh_credential = refresh;
        return d;
    }

    static RetryDecision abort(Error reason) {
        RetryDecision d;
        d.action = Action::Abort;
        d.reason = std::move(reason);
        return d;
    }
};

/**
 * @brief Decides whether a failed operation is retried and how long to wait
 *
 * - Validation and Cancelled abort immediately
 * - Auth is retried once, after a forced token refresh; a second Auth in a
 *   row aborts
 * - Network and BackendProtocol back off exponentially with jitter:
 *   min(base * 2^(n-1), cap) +/- jitter
 * - RateLimited waits the server's retry_after when given, else backs off
 * - Reaching max_attempts aborts with the original error (attempts recorded)
 */
class RetryPolicy {
public:
    explicit RetryPolicy(RetryOptions options = {});
    RetryPolicy(RetryOptions options, std::uint32_t seed);

    RetryDecision classify(const Error& error, AttemptCounter& attempts);

    /// Backoff before retry number `failures` (1-based), jitter applied
    std::chrono::milliseconds backoff(std::uint32_t failures);

    [[nodiscard]] const RetryOptions& options() const noexcept { return options_; }

private:
    RetryOptions options_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

} // namespace cloudup::upload
