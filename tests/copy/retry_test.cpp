#include "dcp/copy/errors.hpp"
#include "dcp/copy/retry.hpp"
#include "dcp/core/result.hpp"

#include <gtest/gtest.h>

#include <vector>

using dcp::copy::CopyError;
using dcp::copy::CopyErrorKind;
using dcp::copy::RetryPolicy;
using dcp::copy::make_copy_error;
using namespace std::chrono_literals;

namespace {

using Attempt = dcp::Result<int, CopyError>;

Attempt failure(CopyErrorKind kind) {
    return dcp::Err<int>(make_copy_error(kind, "test", "injected"));
}

bool retriable(const CopyError& error) {
    return dcp::copy::is_retriable(error);
}

} // namespace

TEST(RetryPolicy, DelayGrowsExponentiallyUpToCap) {
    RetryPolicy policy;
    policy.initial_delay = 100ms;
    policy.backoff_multiplier = 2.0;
    policy.max_delay = 500ms;

    EXPECT_EQ(policy.delay_for(0), 0ms);
    EXPECT_EQ(policy.delay_for(1), 100ms);
    EXPECT_EQ(policy.delay_for(2), 200ms);
    EXPECT_EQ(policy.delay_for(3), 400ms);
    EXPECT_EQ(policy.delay_for(4), 500ms);
    EXPECT_EQ(policy.delay_for(30), 500ms);
}

TEST(RetryPolicy, ZeroInitialDelayNeverSleeps) {
    RetryPolicy policy;
    policy.initial_delay = 0ms;

    EXPECT_EQ(policy.delay_for(5), 0ms);
}

TEST(RetryPolicy, ZeroAttemptsStillRunsOnce) {
    RetryPolicy policy;
    policy.max_attempts = 0;

    EXPECT_EQ(policy.attempt_budget(), 1u);
}

TEST(Retry, SucceedsAfterTransientFailures) {
    RetryPolicy policy;
    policy.max_attempts = 5;
    std::vector<std::chrono::milliseconds> sleeps;
    int calls = 0;

    auto result = dcp::copy::retry(
        [&]() -> Attempt {
            if (++calls < 3) {
                return failure(CopyErrorKind::ReadFailure);
            }
            return dcp::OkValue<int>(42);
        },
        retriable, policy, [&](std::chrono::milliseconds delay) { sleeps.push_back(delay); });

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(calls, 3);
    const std::vector<std::chrono::milliseconds> expected{100ms, 200ms};
    EXPECT_EQ(sleeps, expected);
}

TEST(Retry, StopsOnNonRetriableError) {
    RetryPolicy policy;
    policy.max_attempts = 5;
    int calls = 0;
    int sleeps = 0;

    auto result = dcp::copy::retry(
        [&]() -> Attempt {
            ++calls;
            return failure(CopyErrorKind::ChecksumMismatch);
        },
        retriable, policy, [&](std::chrono::milliseconds) { ++sleeps; });

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, CopyErrorKind::ChecksumMismatch);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(sleeps, 0);
}

TEST(Retry, ReturnsLastErrorWhenBudgetIsExhausted) {
    RetryPolicy policy;
    policy.max_attempts = 3;
    int calls = 0;
    int sleeps = 0;

    auto result = dcp::copy::retry(
        [&]() -> Attempt {
            ++calls;
            return failure(CopyErrorKind::ReadFailure);
        },
        retriable, policy, [&](std::chrono::milliseconds) { ++sleeps; });

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, CopyErrorKind::ReadFailure);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(sleeps, 2);
}

TEST(Retry, DefaultSleeperWaits) {
    RetryPolicy policy;
    policy.max_attempts = 2;
    policy.initial_delay = 20ms;
    int calls = 0;

    const auto start = std::chrono::steady_clock::now();
    auto result = dcp::copy::retry(
        [&]() -> Attempt {
            ++calls;
            return failure(CopyErrorKind::ReadFailure);
        },
        retriable, policy);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(calls, 2);
    EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 20);
}
