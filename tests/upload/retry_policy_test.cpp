#include "cloudup/upload/retry_policy.hpp"

#include <gtest/gtest.h>

#include <chrono>

using cloudup::Error;
using cloudup::ErrorKind;
using cloudup::upload::AttemptCounter;
using cloudup::upload::RetryOptions;
using cloudup::upload::RetryPolicy;
using std::chrono::milliseconds;

namespace {

RetryOptions no_jitter(std::uint32_t max_attempts) {
    RetryOptions options;
    options.max_attempts = max_attempts;
    options.base_delay = milliseconds(100);
    options.max_delay = milliseconds(1000);
    options.jitter = 0.0;
    return options;
}

} // namespace

TEST(RetryPolicyTest, NetworkErrorsRetryUntilMaxAttempts) {
    RetryPolicy policy(no_jitter(3), 42);
    AttemptCounter counter;
    const Error failure = Error::network("connection reset").at_chunk(1);

    auto first = policy.classify(failure, counter);
    EXPECT_TRUE(first.is_retry());
    EXPECT_EQ(first.delay, milliseconds(100));

    auto second = policy.classify(failure, counter);
    EXPECT_TRUE(second.is_retry());
    EXPECT_EQ(second.delay, milliseconds(200));

    auto third = policy.classify(failure, counter);
    EXPECT_FALSE(third.is_retry());
    EXPECT_EQ(third.reason.kind, ErrorKind::Network);
    EXPECT_EQ(third.reason.message, "connection reset");
    EXPECT_EQ(third.reason.attempts, 3u);
    ASSERT_TRUE(third.reason.chunk_index.has_value());
    EXPECT_EQ(*third.reason.chunk_index, 1u);
}

TEST(RetryPolicyTest, ValidationAndCancelledAbortImmediately) {
    RetryPolicy policy(no_jitter(5), 42);

    AttemptCounter validation;
    auto decision = policy.classify(Error::validation("bad range"), validation);
    EXPECT_FALSE(decision.is_retry());
    EXPECT_EQ(decision.reason.kind, ErrorKind::Validation);
    EXPECT_EQ(decision.reason.attempts, 1u);

    AttemptCounter cancelled;
    EXPECT_FALSE(policy.classify(Error::cancelled(), cancelled).is_retry());
}

TEST(RetryPolicyTest, AuthRetriesOnceWithRefresh) {
    RetryPolicy policy(no_jitter(5), 42);
    AttemptCounter counter;

    auto first = policy.classify(Error::auth("token expired", 401), counter);
    EXPECT_TRUE(first.is_retry());
    EXPECT_TRUE(first.refresh_credential);
    EXPECT_EQ(first.delay, milliseconds(0));

    auto second = policy.classify(Error::auth("token expired", 401), counter);
    EXPECT_FALSE(second.is_retry());
    EXPECT_EQ(second.reason.kind, ErrorKind::Auth);
}

TEST(RetryPolicyTest, AuthAfterOtherFailureIsRetriedAgain) {
    RetryPolicy policy(no_jitter(5), 42);
    AttemptCounter counter;

    EXPECT_TRUE(policy.classify(Error::auth("expired", 401), counter).is_retry());
    EXPECT_TRUE(policy.classify(Error::network("reset"), counter).is_retry());
    auto again = policy.classify(Error::auth("expired", 401), counter);
    EXPECT_TRUE(again.is_retry());
    EXPECT_TRUE(again.refresh_credential);
}

TEST(RetryPolicyTest, RateLimitedHonoursRetryAfter) {
    RetryPolicy policy(no_jitter(5), 42);
    AttemptCounter counter;

    auto hinted = policy.classify(Error::from_http_status(429, "throttled", milliseconds(7000)), counter);
    EXPECT_TRUE(hinted.is_retry());
    EXPECT_EQ(hinted.delay, milliseconds(7000));
    EXPECT_FALSE(hinted.refresh_credential);

    auto unhinted = policy.classify(Error::from_http_status(429, "throttled"), counter);
    EXPECT_TRUE(unhinted.is_retry());
    EXPECT_EQ(unhinted.delay, milliseconds(200));
}

TEST(RetryPolicyTest, BackoffIsCapped) {
    RetryPolicy policy(no_jitter(20), 42);
    EXPECT_EQ(policy.backoff(1), milliseconds(100));
    EXPECT_EQ(policy.backoff(4), milliseconds(800));
    EXPECT_EQ(policy.backoff(5), milliseconds(1000));
    EXPECT_EQ(policy.backoff(40), milliseconds(1000));
}

TEST(RetryPolicyTest, JitterStaysWithinBounds) {
    RetryOptions options = no_jitter(10);
    options.jitter = 0.2;
    RetryPolicy policy(options, 7);

    for (int i = 0; i < 200; ++i) {
        const auto delay = policy.backoff(2);
        EXPECT_GE(delay, milliseconds(160));
        EXPECT_LE(delay, milliseconds(240));
    }
}

TEST(RetryPolicyTest, SameSeedGivesSameDelays) {
    RetryOptions options = no_jitter(10);
    options.jitter = 0.5;
    RetryPolicy a(options, 1234);
    RetryPolicy b(options, 1234);
    for (std::uint32_t n = 1; n <= 5; ++n) {
        EXPECT_EQ(a.backoff(n), b.backoff(n));
    }
}
