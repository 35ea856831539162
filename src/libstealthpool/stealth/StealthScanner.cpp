#include <libstealthpool/stealth/StealthScanner.h>

#include <libstealthpool/basics/Channel.h>
#include <libstealthpool/stealth/StealthAddress.h>

#include <boost/asio/post.hpp>

#include <algorithm>
#include <exception>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>

namespace stealthpool {

namespace {

// Below this many candidates per task the hand-off costs more than the ECDH.
constexpr std::size_t minBatch = 64;

struct BatchResult
{
    std::vector<Announcement> matches;
    std::size_t malformed = 0;
    std::string error;
};

std::size_t
resolveWorkers(std::size_t requested)
{
    if (requested != 0)
        return requested;
    return std::max(1u, std::thread::hardware_concurrency());
}

}  // namespace

StealthScanner::StealthScanner(
    SecretKey const& viewingPrivateKey,
    PublicKey const& spendPublicKey,
    AnnouncementSource& source,
    RetryPolicy const& retry,
    Journal journal,
    std::size_t workers,
    std::uint64_t startBlock)
    : viewingPrivateKey_(viewingPrivateKey)
    , spendPublicKey_(spendPublicKey)
    , source_(source)
    , retry_(retry)
    , j_(std::move(journal))
    , sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); })
    , workers_(resolveWorkers(workers))
    , pool_(workers_)
    , cursor_(startBlock)
{
}

StealthScanner::~StealthScanner()
{
    pool_.join();
}

std::vector<Announcement>
StealthScanner::scan()
{
    // The cursor names the next block to scan, so it must stay representable
    // past the last scanned one.
    auto const latest = std::min(
        retryWithBackoff(retry_, j_, [&] { return source_.latestBlock(); }, sleep_),
        std::numeric_limits<std::uint64_t>::max() - 1);

    std::vector<Announcement> fresh;
    while (cursor_ <= latest)
    {
        auto const from = cursor_;
        auto const to = latest - from < MAX_BLOCK_RANGE
            ? latest
            : from + MAX_BLOCK_RANGE - 1;

        auto const candidates = retryWithBackoff(
            retry_, j_, [&] { return source_.fetch(from, to); }, sleep_);

        for (auto& match : matchChunk(candidates))
        {
            PaymentKey key{match.stealthAddress, match.ephemeralPublicKey, match.k};
            if (!seen_.insert(std::move(key)).second)
                continue;
            found_.push_back(match);
            fresh.push_back(std::move(match));
        }

        JLOG(j_.debug()) << "scanned blocks " << from << "-" << to << ": "
                         << candidates.size() << " announcements";
        cursor_ = to + 1;
    }

    if (!fresh.empty())
    {
        JLOG(j_.info()) << "found " << fresh.size() << " new payment(s), cursor "
                        << cursor_;
    }
    return fresh;
}

std::vector<Announcement>
StealthScanner::matchChunk(std::vector<Announcement> const& candidates)
{
    if (candidates.empty())
        return {};

    auto const batch = std::max(
        minBatch, (candidates.size() + workers_ - 1) / workers_);
    std::size_t const tasks = (candidates.size() + batch - 1) / batch;

    Channel<BatchResult> results;
    for (std::size_t t = 0; t < tasks; ++t)
    {
        auto const begin = t * batch;
        auto const end = std::min(candidates.size(), begin + batch);
        boost::asio::post(pool_, [&, begin, end] {
            BatchResult r;
            try
            {
                for (auto i = begin; i < end; ++i)
                {
                    auto const& a = candidates[i];
                    auto const ephemeral = PublicKey::fromBytes(a.ephemeralPublicKey);
                    if (!ephemeral)
                    {
                        ++r.malformed;
                        continue;
                    }
                    if (!checkViewHint(viewingPrivateKey_, *ephemeral, a.viewHint))
                        continue;
                    if (matchesStealthAddress(
                            viewingPrivateKey_,
                            spendPublicKey_,
                            *ephemeral,
                            a.k,
                            a.stealthAddress))
                        r.matches.push_back(a);
                }
            }
            catch (std::exception const& e)
            {
                r.error = e.what();
            }
            results.send(std::move(r));
        });
    }

    // Every task must report before candidates and results go out of scope.
    std::vector<Announcement> matches;
    std::size_t malformed = 0;
    std::string error;
    for (std::size_t t = 0; t < tasks; ++t)
    {
        auto r = results.receive();
        malformed += r.malformed;
        if (!r.error.empty() && error.empty())
            error = std::move(r.error);
        std::move(r.matches.begin(), r.matches.end(), std::back_inserter(matches));
    }

    if (!error.empty())
        throw std::runtime_error("scan worker failed: " + error);

    if (malformed != 0)
    {
        JLOG(j_.debug()) << "skipped " << malformed
                         << " announcement(s) with a malformed ephemeral key";
    }

    std::sort(
        matches.begin(),
        matches.end(),
        [](Announcement const& a, Announcement const& b) {
            return a.blockNumber < b.blockNumber;
        });
    return matches;
}

}  // namespace stealthpool
