#include "cloudup/upload/retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace cloudup::upload {

RetryPolicy::RetryPolicy(RetryOptions options)
    : RetryPolicy(options, std::random_device{}()) {}

RetryPolicy::RetryPolicy(RetryOptions options, std::uint32_t seed)
    : options_(options), rng_(seed) {
    options_.max_attempts = std::max<std::uint32_t>(options_.max_attempts, 1);
    options_.jitter = std::clamp(options_.jitter, 0.0, 1.0);
}

RetryDecision RetryPolicy::classify(const Error& error, AttemptCounter& attempts) {
    ++attempts.failures;

    if (error.is(ErrorKind::Validation) || error.is(ErrorKind::Cancelled)) {
        Error reason = error;
        reason.attempts = attempts.failures;
        return RetryDecision::abort(std::move(reason));
    }

    if (error.is(ErrorKind::Auth)) {
        ++attempts.consecutive_auth;
    } else {
        attempts.consecutive_auth = 0;
    }

    const bool auth_repeated = attempts.consecutive_auth > 1;
    if (auth_repeated || attempts.failures >= options_.max_attempts) {
        Error reason = error;
        reason.attempts = attempts.failures;
        return RetryDecision::abort(std::move(reason));
    }

    switch (error.kind) {
        case ErrorKind::Auth:
            return RetryDecision::retry(std::chrono::milliseconds(0), true);
        case ErrorKind::RateLimited:
            if (error.retry_after) {
                return RetryDecision::retry(*error.retry_after);
            }
            return RetryDecision::retry(backoff(attempts.failures));
        default:
            return RetryDecision::retry(backoff(attempts.failures));
    }
}

std::chrono::milliseconds RetryPolicy::backoff(std::uint32_t failures) {
    const auto exponent = std::min<std::uint32_t>(failures > 0 ? failures - 1 : 0, 30);
    const double base = static_cast<double>(options_.base_delay.count());
    const double cap = static_cast<double>(options_.max_delay.count());
    const double nominal = std::min(base * std::ldexp(1.0, static_cast<int>(exponent)), cap);

    double factor = 1.0;
    if (options_.jitter > 0.0) {
        std::uniform_real_distribution<double> spread(-options_.jitter, options_.jitter);
        std::lock_guard lock(rng_mutex_);
        factor += spread(rng_);
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(nominal * factor)));
}

} // namespace cloudup::upload
