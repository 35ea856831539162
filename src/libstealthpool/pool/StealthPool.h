#ifndef STEALTHPOOL_POOL_STEALTHPOOL_H_INCLUDED
#define STEALTHPOOL_POOL_STEALTHPOOL_H_INCLUDED

#include <libstealthpool/basics/AccountID.h>
#include <libstealthpool/basics/Log.h>
#include <libstealthpool/basics/TER.h>
#include <libstealthpool/pool/BridgeDispatcher.h>
#include <libstealthpool/pool/ExtData.h>
#include <libstealthpool/pool/PoolConfig.h>
#include <libstealthpool/pool/TokenLedger.h>
#include <libstealthpool/zkp/MerkleTreeWithHistory.h>
#include <libstealthpool/zkp/ProofData.h>
#include <libstealthpool/zkp/ProofVerifier.h>

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace stealthpool {

struct DepositEvent
{
    uint256 commitment;
    std::uint64_t leafIndex = 0;
    std::uint64_t timestamp = 0;
};

struct WithdrawalEvent
{
    uint256 nullifierHash;
    AccountID relayer;
    std::string destinationChain;
    AccountID stealthAddress;
    uint256 amountToBridge;
    uint256 relayerFee;
};

/** Fixed denomination shielded pool that pays out to stealth addresses.

    Deposits append a commitment to the MiMC Merkle tree after pulling the
    denomination from the depositor. A withdrawal proves, in zero knowledge,
    that the caller knows the preimage of some leaf under a recent root;
    the pool then marks the nullifier spent, pays the relayer fee and hands
    the rest to the bridge dispatcher for delivery to the stealth address.

    Every entry point runs to completion and either applies all of its
    effects or none of them. The pool is not internally synchronized; the
    host serializes calls. A call made while another entry point is still
    running (from a token or dispatcher callback) fails with
    tecREENTRANT_CALL.
*/
class StealthPool
{
public:
    StealthPool(
        PoolParams const& params,
        TokenLedger& ledger,
        BridgeDispatcher& dispatcher,
        zkp::ProofVerifier const& verifier,
        Journal journal);

    StealthPool(StealthPool const&) = delete;
    StealthPool&
    operator=(StealthPool const&) = delete;

    /** Take the denomination from depositor and insert commitment.

        The depositor must have approved the pool for the denomination.
    */
    TER
    deposit(
        AccountID const& depositor,
        uint256 const& commitment,
        std::uint64_t timestamp);

    /** Withdraw through general message passing. Pool must be in GMP mode. */
    TER
    withdrawAndBridgeGMP(
        AccountID const& caller,
        WithdrawRequest const& request,
        zkp::Groth16Proof const& proof,
        uint256 const& gasValue);

    /** Withdraw through the interchain token service. Pool must be in ITS mode. */
    TER
    withdrawAndBridgeITS(
        AccountID const& caller,
        WithdrawRequest const& request,
        zkp::Groth16Proof const& proof,
        uint256 const& gasValue);

    /** The value a proof for request must carry as its ext data hash. */
    uint256
    extDataHashFor(WithdrawRequest const& request) const;

    uint256 const&
    denomination() const
    {
        return params_.denomination;
    }

    AccountID const&
    address() const
    {
        return params_.poolAddress;
    }

    TokenIdentifier const&
    token() const
    {
        return params_.token;
    }

    uint256
    getLastRoot() const
    {
        return tree_.getLastRoot();
    }

    bool
    isKnownRoot(uint256 const& root) const
    {
        return tree_.isKnownRoot(root);
    }

    zkp::MerkleTreeWithHistory::RootHistory
    rootHistory() const
    {
        return tree_.rootHistory();
    }

    std::uint64_t
    nextIndex() const
    {
        return tree_.nextIndex();
    }

    std::size_t
    levels() const
    {
        return tree_.levels();
    }

    bool
    isSpent(uint256 const& nullifierHash) const
    {
        return nullifierHashes_.count(nullifierHash) != 0;
    }

    std::vector<DepositEvent> const&
    deposits() const
    {
        return deposits_;
    }

    std::vector<WithdrawalEvent> const&
    withdrawals() const
    {
        return withdrawals_;
    }

    /** Commitments in leaf order, as needed by buildMerklePath. */
    std::vector<uint256>
    depositLeaves() const;

private:
    enum class Route { gmp, its };

    class ReentrancyGuard;
    class PendingWithdrawal;

    TER
    withdraw(
        Route route,
        AccountID const& caller,
        WithdrawRequest const& request,
        zkp::Groth16Proof const& proof,
        uint256 const& gasValue);

    TER
    applyWithdrawal(
        AccountID const& caller,
        WithdrawRequest const& request,
        uint256 const& amountToBridge,
        uint256 const& gasValue);

    PoolParams params_;
    TokenLedger& ledger_;
    BridgeDispatcher& dispatcher_;
    zkp::ProofVerifier const& verifier_;
    Journal j_;

    zkp::MerkleTreeWithHistory tree_;
    std::set<uint256> nullifierHashes_;
    std::vector<DepositEvent> deposits_;
    std::vector<WithdrawalEvent> withdrawals_;
    bool entered_ = false;
};

}  // namespace stealthpool

#endif
