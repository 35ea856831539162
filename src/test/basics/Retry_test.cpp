#include <libstealthpool/basics/Retry.h>

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <stdexcept>
#include <vector>

using namespace stealthpool;
using std::chrono::milliseconds;

namespace {

struct RetryFixture
{
    Journal j{"Retry_test"};
    std::vector<milliseconds> sleeps;
    std::function<void(milliseconds)> sleep = [this](milliseconds d) {
        sleeps.push_back(d);
    };
};

}  // namespace

BOOST_FIXTURE_TEST_SUITE(Retry_test, RetryFixture)

BOOST_AUTO_TEST_CASE(backoff_doubles_and_caps)
{
    RetryPolicy policy;
    policy.baseDelay = milliseconds(250);
    policy.maxDelay = milliseconds(1000);
    BOOST_CHECK(policy.delayAfter(0) == milliseconds(250));
    BOOST_CHECK(policy.delayAfter(1) == milliseconds(500));
    BOOST_CHECK(policy.delayAfter(2) == milliseconds(1000));
    BOOST_CHECK(policy.delayAfter(7) == milliseconds(1000));
}

BOOST_AUTO_TEST_CASE(recovers_from_transient_failures)
{
    RetryPolicy policy;
    int calls = 0;
    auto const result = retryWithBackoff(
        policy,
        j,
        [&] {
            if (++calls < 3)
                throw TransientError("timeout");
            return 42;
        },
        sleep);

    BOOST_CHECK_EQUAL(result, 42);
    BOOST_CHECK_EQUAL(calls, 3);
    BOOST_REQUIRE_EQUAL(sleeps.size(), 2u);
    BOOST_CHECK(sleeps[0] == policy.baseDelay);
    BOOST_CHECK(sleeps[1] == 2 * policy.baseDelay);
}

BOOST_AUTO_TEST_CASE(gives_up_after_max_attempts)
{
    RetryPolicy policy;
    policy.maxAttempts = 3;
    int calls = 0;
    try
    {
        retryWithBackoff(
            policy,
            j,
            [&]() -> int {
                ++calls;
                throw TransientError("connection refused");
            },
            sleep);
        BOOST_FAIL("expected RetryExhausted");
    }
    catch (RetryExhausted const& e)
    {
        BOOST_CHECK_EQUAL(e.attempts(), 3u);
    }
    BOOST_CHECK_EQUAL(calls, 3);
    BOOST_CHECK_EQUAL(sleeps.size(), 2u);
}

BOOST_AUTO_TEST_CASE(other_errors_are_not_retried)
{
    RetryPolicy policy;
    int calls = 0;
    BOOST_CHECK_THROW(
        retryWithBackoff(
            policy,
            j,
            [&]() -> int {
                ++calls;
                throw std::invalid_argument("bad key");
            },
            sleep),
        std::invalid_argument);
    BOOST_CHECK_EQUAL(calls, 1);
    BOOST_CHECK(sleeps.empty());
}

BOOST_AUTO_TEST_SUITE_END()
