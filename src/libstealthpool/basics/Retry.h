#ifndef STEALTHPOOL_BASICS_RETRY_H_INCLUDED
#define STEALTHPOOL_BASICS_RETRY_H_INCLUDED

#include <libstealthpool/basics/Log.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>

namespace stealthpool {

/** Failure of an external call that may succeed if repeated.

    Only this type is retried. Validation and cryptographic failures are
    reported by other exception types and surface immediately.
*/
class TransientError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/** Thrown once every attempt has failed with a TransientError. */
class RetryExhausted : public std::runtime_error
{
public:
    RetryExhausted(std::string const& what, unsigned attempts)
        : std::runtime_error(what), attempts_(attempts)
    {
    }

    unsigned
    attempts() const
    {
        return attempts_;
    }

private:
    unsigned attempts_;
};

struct RetryPolicy
{
    unsigned maxAttempts = 4;
    std::chrono::milliseconds baseDelay{250};
    std::chrono::milliseconds maxDelay{4000};

    /** Delay before the attempt following attempt number `attempt` (0 based). */
    std::chrono::milliseconds
    delayAfter(unsigned attempt) const
    {
        auto delay = baseDelay;
        for (unsigned i = 0; i < attempt && delay < maxDelay; ++i)
            delay *= 2;
        return std::min(delay, maxDelay);
    }
};

/** Call fn until it returns, retrying TransientError with exponential backoff.

    @param sleep Replaceable so tests do not wait.
*/
template <class F>
auto
retryWithBackoff(
    RetryPolicy const& policy,
    Journal const& j,
    F&& fn,
    std::function<void(std::chrono::milliseconds)> const& sleep =
        [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); })
    -> decltype(fn())
{
    unsigned const attempts = std::max(policy.maxAttempts, 1u);
    for (unsigned attempt = 0;; ++attempt)
    {
        try
        {
            return fn();
        }
        catch (TransientError const& e)
        {
            if (attempt + 1 >= attempts)
            {
                JLOG(j.error()) << "giving up after " << attempts
                                << " attempts: " << e.what();
                throw RetryExhausted(e.what(), attempts);
            }
            auto const delay = policy.delayAfter(attempt);
            JLOG(j.warn()) << "attempt " << (attempt + 1) << " failed ("
                           << e.what() << "), retrying in " << delay.count()
                           << "ms";
            sleep(delay);
        }
    }
}

}  // namespace stealthpool

#endif
