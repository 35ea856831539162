#ifndef STEALTHPOOL_STEALTH_STEALTHSCANNER_H_INCLUDED
#define STEALTHPOOL_STEALTH_STEALTHSCANNER_H_INCLUDED

#include <libstealthpool/basics/AccountID.h>
#include <libstealthpool/basics/Log.h>
#include <libstealthpool/basics/Retry.h>
#include <libstealthpool/basics/strHex.h>
#include <libstealthpool/crypto/Secp256k1.h>

#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <set>
#include <tuple>
#include <vector>

namespace stealthpool {

/** A payment announcement as published on the destination chain. */
struct Announcement
{
    std::uint64_t blockNumber = 0;
    AccountID stealthAddress;
    Blob ephemeralPublicKey;
    std::uint8_t viewHint = 0;
    std::uint32_t k = 0;
};

/** Where announcements come from, typically a chain RPC endpoint.

    Both calls may throw TransientError for failures worth retrying.
*/
class AnnouncementSource
{
public:
    virtual ~AnnouncementSource() = default;

    virtual std::uint64_t
    latestBlock() = 0;

    /** Announcements in blocks [fromBlock, toBlock]. */
    virtual std::vector<Announcement>
    fetch(std::uint64_t fromBlock, std::uint64_t toBlock) = 0;
};

/** Finds the payments addressed to one recipient.

    Holds only the viewing private key and the spend public key, so it can
    detect payments but not spend them. Each block range is fetched in
    chunks of at most MAX_BLOCK_RANGE blocks. Candidates are checked by
    worker tasks on a thread pool; the workers report back over a channel
    and only the calling thread touches the cursor and the result set.
*/
class StealthScanner
{
public:
    static constexpr std::uint64_t MAX_BLOCK_RANGE = 10000;

    using Sleep = std::function<void(std::chrono::milliseconds)>;

    /** @param workers thread count, 0 for the hardware concurrency
        @param startBlock first block to scan
    */
    StealthScanner(
        SecretKey const& viewingPrivateKey,
        PublicKey const& spendPublicKey,
        AnnouncementSource& source,
        RetryPolicy const& retry,
        Journal journal,
        std::size_t workers = 0,
        std::uint64_t startBlock = 0);

    StealthScanner(StealthScanner const&) = delete;
    StealthScanner&
    operator=(StealthScanner const&) = delete;

    ~StealthScanner();

    /** Scan from the cursor through the latest block.

        @return matches not reported by an earlier call
        @throws RetryExhausted if the source keeps failing; the cursor then
                stays at the first unscanned chunk
    */
    std::vector<Announcement>
    scan();

    /** Next block to be scanned. Block 2^64 - 1 itself is never scanned. */
    std::uint64_t
    cursor() const
    {
        return cursor_;
    }

    std::vector<Announcement> const&
    found() const
    {
        return found_;
    }

    /** Replace the backoff sleep. Tests use this to avoid waiting. */
    void
    setSleep(Sleep sleep)
    {
        sleep_ = std::move(sleep);
    }

private:
    using PaymentKey = std::tuple<AccountID, Blob, std::uint32_t>;

    std::vector<Announcement>
    matchChunk(std::vector<Announcement> const& candidates);

    SecretKey viewingPrivateKey_;
    PublicKey spendPublicKey_;
    AnnouncementSource& source_;
    RetryPolicy retry_;
    Journal j_;
    Sleep sleep_;
    std::size_t workers_;
    boost::asio::thread_pool pool_;

    std::uint64_t cursor_;
    std::vector<Announcement> found_;
    std::set<PaymentKey> seen_;
};

}  // namespace stealthpool

#endif
