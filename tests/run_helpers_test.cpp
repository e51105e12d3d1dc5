#include <gtest/gtest.h>

#include "common/errors.hpp"
#include "runtime/run_helpers.hpp"
#include "support/sandbox_fixture.hpp"

#include <atomic>
#include <stdexcept>

namespace rock::runtime {

using namespace std::chrono_literals;
using test::Request;
using test::observation;

class RunHelpersTest : public test::SandboxFixture {
protected:
    std::atomic<int> runs{0};
    int failures_before_success = 0;

    void SetUp() override {
        SandboxFixture::SetUp();
        transport->on("run_in_session", [this](const Request&) {
            if (++runs <= failures_before_success) {
                return observation("connection refused", 1);
            }
            return observation("ok", 0);
        });
    }

    // Sleeps recorded after the sandbox came up
    std::vector<std::chrono::milliseconds> sleeps_since(size_t offset) const {
        auto sleeps = clock->sleeps();
        return {sleeps.begin() + offset, sleeps.end()};
    }
};

TEST(defaultArunRetryPolicy, threeAttemptsDoubling)
{
    util::RetryPolicy policy = default_arun_retry_policy();

    ASSERT_EQ(policy.max_attempts, 3);
    ASSERT_EQ(policy.delay_schedule(), (std::vector<std::chrono::milliseconds>{5000ms, 10000ms}));
}

TEST_F(RunHelpersTest, arunWithRetryRetriesNonzeroExit)
{
    failures_before_success = 2;
    auto sandbox = started_sandbox();
    auto offset = clock->sleeps().size();

    Observation obs = arun_with_retry(*sandbox, "curl -fsS http://example.com");

    ASSERT_EQ(obs.output, "ok");
    ASSERT_EQ(runs.load(), 3);
    ASSERT_EQ(sleeps_since(offset), (std::vector<std::chrono::milliseconds>{5000ms, 10000ms}));
}

TEST_F(RunHelpersTest, arunWithRetryThrowsCommandErrorWhenExhausted)
{
    failures_before_success = 100;
    auto sandbox = started_sandbox();

    ASSERT_THROW(arun_with_retry(*sandbox, "false"), CommandError);
    ASSERT_EQ(runs.load(), 3);
}

TEST_F(RunHelpersTest, arunWithRetryHonoursPolicy)
{
    failures_before_success = 100;
    auto sandbox = started_sandbox();

    util::RetryPolicy once;
    once.max_attempts = 1;
    ASSERT_THROW(arun_with_retry(*sandbox, "false", ArunOptions{}, once), CommandError);
    ASSERT_EQ(runs.load(), 1);
}

TEST_F(RunHelpersTest, withTimeLoggingReturnsResult)
{
    auto logger = util::get_logger("rock.test.timing");

    int value = with_time_logging(logger, *clock, "sb-1", "compute", [&] {
        clock->advance(1500ms);
        return 7;
    });

    ASSERT_EQ(value, 7);
}

TEST_F(RunHelpersTest, withTimeLoggingRethrows)
{
    auto logger = util::get_logger("rock.test.timing");
    bool ran = false;

    ASSERT_THROW(with_time_logging(logger, *clock, "sb-1", "explode", [&] {
        ran = true;
        throw std::logic_error("boom");
    }), std::logic_error);
    ASSERT_TRUE(ran);
}

} // namespace rock::runtime
