#include <gtest/gtest.h>

#include "common/errors.hpp"
#include "util/retry.hpp"
#include "support/fake_clock.hpp"

#include <stdexcept>

namespace rock::util {

using namespace std::chrono_literals;
using test::FakeClock;

/* ----------------------------------------------------------------------------
 * RetryPolicy
 * --------------------------------------------------------------------------*/

TEST(RetryPolicy, defaults)
{
    RetryPolicy policy;

    ASSERT_EQ(policy.max_attempts, 3);
    ASSERT_EQ(policy.initial_delay, 1000ms);
    ASSERT_EQ(policy.backoff_multiplier, 1.0);
    ASSERT_FALSE(policy.jitter);
}

TEST(RetryPolicy, rejectsInvalid)
{
    RetryPolicy zero_attempts;
    zero_attempts.max_attempts = 0;
    ASSERT_THROW(zero_attempts.validate(), InvalidParameterError);

    RetryPolicy negative_delay;
    negative_delay.initial_delay = -1ms;
    ASSERT_THROW(negative_delay.validate(), InvalidParameterError);

    RetryPolicy zero_multiplier;
    zero_multiplier.backoff_multiplier = 0.0;
    ASSERT_THROW(zero_multiplier.validate(), InvalidParameterError);
}

TEST(RetryPolicy, delayScheduleIsGeometric)
{
    RetryPolicy policy{4, 100ms, 2.0, false};

    std::vector<std::chrono::milliseconds> expected{100ms, 200ms, 400ms};
    ASSERT_EQ(policy.delay_schedule(), expected);
}

TEST(RetryPolicy, singleAttemptHasNoDelays)
{
    RetryPolicy policy{1, 100ms, 2.0, false};

    ASSERT_TRUE(policy.delay_schedule().empty());
}

/* ----------------------------------------------------------------------------
 * retry_call
 * --------------------------------------------------------------------------*/

TEST(retryCall, returnsFirstSuccess)
{
    FakeClock clock;
    int calls = 0;

    int result = retry_call(RetryPolicy{3, 1000ms, 1.0, false}, clock, [&] {
        ++calls;
        return 42;
    });

    ASSERT_EQ(result, 42);
    ASSERT_EQ(calls, 1);
    ASSERT_TRUE(clock.sleeps().empty());
}

TEST(retryCall, succeedsAfterTransientFailures)
{
    FakeClock clock;
    int calls = 0;

    std::string result = retry_call(RetryPolicy{5, 10ms, 1.0, false}, clock, [&]() -> std::string {
        if (++calls < 3) throw std::runtime_error("transient");
        return "ok";
    });

    ASSERT_EQ(result, "ok");
    ASSERT_EQ(calls, 3);
    ASSERT_EQ(clock.sleeps().size(), 2u);
}

TEST(retryCall, permanentFailureInvokesExactlyMaxAttempts)
{
    FakeClock clock;
    int calls = 0;

    ASSERT_THROW(retry_call(RetryPolicy{4, 100ms, 2.0, false}, clock, [&] {
        ++calls;
        throw std::runtime_error("permanent");
    }), std::runtime_error);

    ASSERT_EQ(calls, 4);
    std::vector<std::chrono::milliseconds> expected{100ms, 200ms, 400ms};
    ASSERT_EQ(clock.sleeps(), expected);
}

TEST(retryCall, rethrowsLastErrorUnchanged)
{
    FakeClock clock;
    int calls = 0;

    try {
        retry_call(RetryPolicy{3, 1ms, 1.0, false}, clock, [&] {
            ++calls;
            throw RemoteCallError("run in session", "http://host/x", "failure " + std::to_string(calls), 5000);
        });
        FAIL() << "expected RemoteCallError";
    } catch (const RemoteCallError& e) {
        ASSERT_EQ(e.detail(), "failure 3");
        ASSERT_EQ(e.code(), 5000);
    }
}

TEST(retryCall, jitterStaysBelowTwiceTheDelay)
{
    FakeClock clock;

    ASSERT_THROW(retry_call(RetryPolicy{20, 100ms, 1.0, true}, clock, [] {
        throw std::runtime_error("always");
    }), std::runtime_error);

    auto sleeps = clock.sleeps();
    ASSERT_EQ(sleeps.size(), 19u);
    for (auto sleep : sleeps) {
        ASSERT_GE(sleep, 0ms);
        ASSERT_LT(sleep, 200ms);
    }
}

TEST(retryCall, invalidPolicyThrowsBeforeCalling)
{
    FakeClock clock;
    int calls = 0;

    ASSERT_THROW(retry_call(RetryPolicy{0, 1ms, 1.0, false}, clock, [&] { ++calls; }),
                 InvalidParameterError);
    ASSERT_EQ(calls, 0);
}

} // namespace rock::util
