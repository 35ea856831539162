#ifndef STEALTHPOOL_POOL_BRIDGEDISPATCHER_H_INCLUDED
#define STEALTHPOOL_POOL_BRIDGEDISPATCHER_H_INCLUDED

#include <libstealthpool/basics/AccountID.h>
#include <libstealthpool/basics/TER.h>
#include <libstealthpool/pool/ExtData.h>

#include <stdexcept>
#include <string>

namespace stealthpool {

/** A payout handed to the bridge for delivery to a stealth address. */
struct DispatchRequest
{
    std::string destinationChain;
    AccountID stealthAddress;
    Blob ephemeralPublicKey;
    std::uint8_t viewHint = 0;
    std::uint32_t k = 0;
    TokenIdentifier token;
    uint256 amount;
    // Native value forwarded for the destination chain leg.
    uint256 gasValue;
};

/** Raised by a dispatcher that cannot accept a payout. */
class DispatchError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/** The bridge contract the pool pays out through.

    Before the call the pool approves address() for request.amount; the
    dispatcher pulls the tokens itself. A call either commits the payout to
    the destination leg or fails, in which case the pool undoes the whole
    withdrawal. Failure is a tec result or an exception. A std::exception,
    DispatchError included, becomes tecDISPATCH_FAILED; anything else is
    rethrown after the undo.
*/
class BridgeDispatcher
{
public:
    virtual ~BridgeDispatcher() = default;

    virtual AccountID
    address() const = 0;

    virtual TER
    sendToStealthAddress(DispatchRequest const& request) = 0;
};

}  // namespace stealthpool

#endif
