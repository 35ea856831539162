#ifndef STEALTHPOOL_POOL_EXTDATA_H_INCLUDED
#define STEALTHPOOL_POOL_EXTDATA_H_INCLUDED

#include <libstealthpool/basics/AccountID.h>
#include <libstealthpool/basics/base_uint.h>

#include <cstdint>
#include <string>
#include <variant>

namespace stealthpool {

/** Token routed through the bridge's general message passing by symbol. */
struct GmpToken
{
    std::string symbol;
};

/** Token routed through the interchain token service by id. */
struct ItsToken
{
    uint256 tokenId;
};

/** How a pool's payouts reach the bridge. Fixed when the pool is created. */
using TokenIdentifier = std::variant<GmpToken, ItsToken>;

/** Mutable parameters of a withdrawal, as submitted by the relayer. */
struct WithdrawRequest
{
    uint256 root;
    uint256 nullifierHash;
    uint256 relayerFee;
    std::string destinationChain;
    AccountID stealthAddress;
    Blob ephemeralPublicKey;
    std::uint8_t viewHint = 0;
    std::uint32_t k = 0;
};

/** Tightly packed encoding of everything the proof must commit to.

    string and bytes are raw, addresses are 20 bytes, the view hint is one
    byte, k is 4 bytes big-endian and amounts are 32 bytes big-endian. The
    token is the raw symbol for GMP or the 32 byte id for ITS.
*/
Blob
packExtData(
    WithdrawRequest const& request,
    uint256 const& amountToBridge,
    AccountID const& bridgeAddress,
    TokenIdentifier const& token);

/** Digest of packExtData reduced mod the SNARK scalar field. */
uint256
computeExtDataHash(
    WithdrawRequest const& request,
    uint256 const& amountToBridge,
    AccountID const& bridgeAddress,
    TokenIdentifier const& token);

}  // namespace stealthpool

#endif
