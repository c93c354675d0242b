#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include "infra/retry.hpp"

using namespace pagesync::infra;
using namespace std::chrono_literals;

namespace {

auto fast_policy(int max_attempts) -> RetryPolicy {
    RetryPolicy policy;
    policy.max_attempts = max_attempts;
    policy.initial_delay = 1ms;
    policy.max_delay = 5ms;
    return policy;
}

} // namespace

TEST(RetryTest, TransientErrorsAreRetriedUntilSuccess)
{
    int calls = 0;
    auto res = with_retry([&]() -> VoidResult {
        if (++calls < 3) {
            return std::unexpected(make_error(ErrorCode::Transfer, "flaky"));
        }
        return {};
    }, fast_policy(5));

    EXPECT_TRUE(res.has_value());
    EXPECT_EQ(calls, 3);
}

TEST(RetryTest, GivesUpAfterMaxAttempts)
{
    int calls = 0;
    int retries_seen = 0;
    auto res = with_retry([&]() -> VoidResult {
        ++calls;
        return std::unexpected(make_error(ErrorCode::Throttled, "busy"));
    }, fast_policy(4), {}, [&](const Error&, int, std::chrono::milliseconds) { ++retries_seen; });

    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::Throttled);
    EXPECT_EQ(calls, 4);
    EXPECT_EQ(retries_seen, 3);
}

TEST(RetryTest, FatalErrorsAreNotRetried)
{
    int calls = 0;
    auto res = with_retry([&]() -> VoidResult {
        ++calls;
        return std::unexpected(make_error(ErrorCode::InvalidArgument, "bad offset"));
    }, fast_policy(10));

    EXPECT_FALSE(res.has_value());
    EXPECT_EQ(calls, 1);
}

TEST(RetryTest, CustomPredicateDecides)
{
    auto policy = fast_policy(10);
    policy.should_retry = [](const Error&) { return false; };

    int calls = 0;
    auto res = with_retry([&]() -> VoidResult {
        ++calls;
        return std::unexpected(make_error(ErrorCode::Transfer, "flaky"));
    }, policy);

    EXPECT_FALSE(res.has_value());
    EXPECT_EQ(calls, 1);
}

TEST(RetryTest, BackoffIsExponentialAndCapped)
{
    RetryPolicy policy;
    policy.initial_delay = 100ms;
    policy.backoff_factor = 2.0;
    policy.max_delay = 1000ms;

    EXPECT_EQ(policy.delay_for(0), 100ms);
    EXPECT_EQ(policy.delay_for(1), 200ms);
    EXPECT_EQ(policy.delay_for(3), 800ms);
    EXPECT_EQ(policy.delay_for(4), 1000ms);
    EXPECT_EQ(policy.delay_for(20), 1000ms);
}

TEST(RetryTest, ZeroMaxAttemptsNeverExhausts)
{
    RetryPolicy policy;
    policy.max_attempts = 0;
    EXPECT_FALSE(policy.exhausted(1'000'000));
    policy.max_attempts = 2;
    EXPECT_FALSE(policy.exhausted(1));
    EXPECT_TRUE(policy.exhausted(2));
}

TEST(RetryTest, StopRequestCutsBackoffShort)
{
    RetryPolicy policy;
    policy.max_attempts = 0;
    policy.initial_delay = 10s;

    std::stop_source source;
    int calls = 0;
    std::jthread stopper([&] {
        std::this_thread::sleep_for(50ms);
        source.request_stop();
    });

    const auto started = std::chrono::steady_clock::now();
    auto res = with_retry([&]() -> VoidResult {
        ++calls;
        return std::unexpected(make_error(ErrorCode::Transfer, "down"));
    }, policy, source.get_token());

    EXPECT_FALSE(res.has_value());
    EXPECT_EQ(calls, 1);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}
