#include <libstealthpool/pool/StealthPool.h>

#include <libstealthpool/stealth/StealthAddress.h>
#include <libstealthpool/zkp/Field.h>

#include <exception>

#include <stdexcept>
#include <utility>
#include <variant>

namespace stealthpool {

class StealthPool::ReentrancyGuard
{
public:
    explicit ReentrancyGuard(bool& entered) : entered_(entered)
    {
        entered_ = true;
    }

    ReentrancyGuard(ReentrancyGuard const&) = delete;
    ReentrancyGuard&
    operator=(ReentrancyGuard const&) = delete;

    ~ReentrancyGuard()
    {
        entered_ = false;
    }

private:
    bool& entered_;
};

// Keeps a withdrawal's nullifier marked and its ledger changes in place
// only if commit() is reached. Any other exit, including an exception,
// restores both.
class StealthPool::PendingWithdrawal
{
public:
    PendingWithdrawal(
        TokenLedger& ledger,
        std::set<uint256>& spent,
        uint256 const& nullifierHash)
        : checkpoint_(ledger), spent_(spent), nullifierHash_(nullifierHash)
    {
        spent_.insert(nullifierHash_);
    }

    PendingWithdrawal(PendingWithdrawal const&) = delete;
    PendingWithdrawal&
    operator=(PendingWithdrawal const&) = delete;

    ~PendingWithdrawal()
    {
        if (!committed_)
            spent_.erase(nullifierHash_);
    }

    void
    commit()
    {
        checkpoint_.commit();
        committed_ = true;
    }

private:
    LedgerCheckpoint checkpoint_;
    std::set<uint256>& spent_;
    uint256 nullifierHash_;
    bool committed_ = false;
};

StealthPool::StealthPool(
    PoolParams const& params,
    TokenLedger& ledger,
    BridgeDispatcher& dispatcher,
    zkp::ProofVerifier const& verifier,
    Journal journal)
    : params_(params)
    , ledger_(ledger)
    , dispatcher_(dispatcher)
    , verifier_(verifier)
    , j_(std::move(journal))
    , tree_(params.levels)
{
    if (params_.denomination.isZero())
        throw std::invalid_argument("pool denomination must be positive");

    JLOG(j_.info()) << "pool " << toHexAddress(params_.poolAddress)
                    << " denomination "
                    << zkp::uintToDecimal(params_.denomination) << " levels "
                    << tree_.levels() << " mode "
                    << (std::holds_alternative<GmpToken>(params_.token) ? "gmp"
                                                                        : "its");
}

TER
StealthPool::deposit(
    AccountID const& depositor,
    uint256 const& commitment,
    std::uint64_t timestamp)
{
    if (entered_)
    {
        JLOG(j_.warn()) << "deposit: reentrant call";
        return tecREENTRANT_CALL;
    }
    ReentrancyGuard guard(entered_);

    if (!zkp::isInField(commitment))
    {
        JLOG(j_.debug()) << "deposit: commitment out of field";
        return tecINVALID_FIELD_ELEMENT;
    }

    if (tree_.isFull())
    {
        JLOG(j_.warn()) << "deposit: tree is full at " << tree_.nextIndex()
                        << " leaves";
        return tecTREE_FULL;
    }

    LedgerCheckpoint cp(ledger_);
    TER const pulled = ledger_.transferFrom(
        params_.poolAddress,
        depositor,
        params_.poolAddress,
        params_.denomination);
    if (!isTesSuccess(pulled))
    {
        JLOG(j_.debug()) << "deposit: cannot pull denomination from "
                         << toHexAddress(depositor) << ": " << pulled;
        return pulled;
    }

    auto const leafIndex = tree_.insert(commitment);
    cp.commit();

    deposits_.push_back({commitment, leafIndex, timestamp});

    JLOG(j_.info()) << "deposit: leaf " << leafIndex << " commitment "
                    << commitment << " new root " << tree_.getLastRoot();
    return tesSUCCESS;
}

TER
StealthPool::withdrawAndBridgeGMP(
    AccountID const& caller,
    WithdrawRequest const& request,
    zkp::Groth16Proof const& proof,
    uint256 const& gasValue)
{
    return withdraw(Route::gmp, caller, request, proof, gasValue);
}

TER
StealthPool::withdrawAndBridgeITS(
    AccountID const& caller,
    WithdrawRequest const& request,
    zkp::Groth16Proof const& proof,
    uint256 const& gasValue)
{
    return withdraw(Route::its, caller, request, proof, gasValue);
}

uint256
StealthPool::extDataHashFor(WithdrawRequest const& request) const
{
    return computeExtDataHash(
        request,
        params_.denomination - request.relayerFee,
        dispatcher_.address(),
        params_.token);
}

std::vector<uint256>
StealthPool::depositLeaves() const
{
    std::vector<uint256> leaves;
    leaves.reserve(deposits_.size());
    for (auto const& d : deposits_)
        leaves.push_back(d.commitment);
    return leaves;
}

TER
StealthPool::withdraw(
    Route route,
    AccountID const& caller,
    WithdrawRequest const& request,
    zkp::Groth16Proof const& proof,
    uint256 const& gasValue)
{
    if (entered_)
    {
        JLOG(j_.warn()) << "withdraw: reentrant call";
        return tecREENTRANT_CALL;
    }
    ReentrancyGuard guard(entered_);

    bool const gmpPool = std::holds_alternative<GmpToken>(params_.token);
    if ((route == Route::gmp) != gmpPool)
    {
        JLOG(j_.debug()) << "withdraw: pool is not configured for "
                         << (route == Route::gmp ? "GMP" : "ITS");
        return tecPOOL_MODE_DISABLED;
    }

    if (!zkp::isInField(request.root) || !zkp::isInField(request.nullifierHash))
    {
        JLOG(j_.debug()) << "withdraw: public input out of field";
        return tecINVALID_FIELD_ELEMENT;
    }

    if (!tree_.isKnownRoot(request.root))
    {
        JLOG(j_.debug()) << "withdraw: unknown root " << request.root;
        return tecUNKNOWN_ROOT;
    }

    if (isSpent(request.nullifierHash))
    {
        JLOG(j_.warn()) << "withdraw: nullifier already used "
                        << request.nullifierHash;
        return tecNULLIFIER_ALREADY_USED;
    }

    if (request.relayerFee > params_.denomination)
    {
        JLOG(j_.debug()) << "withdraw: relayer fee "
                         << zkp::uintToDecimal(request.relayerFee)
                         << " exceeds denomination";
        return tecINVALID_RELAYER_FEE;
    }

    auto const keyCheck = validatePublicKey(request.ephemeralPublicKey);
    if (!keyCheck.valid)
    {
        JLOG(j_.debug()) << "withdraw: ephemeral key rejected: "
                         << keyCheck.reason;
        return tecINVALID_EPHEMERAL_KEY;
    }

    uint256 const amountToBridge = params_.denomination - request.relayerFee;
    zkp::WithdrawPublicInputs const inputs{
        request.root, request.nullifierHash, extDataHashFor(request)};

    if (!verifier_.verifyWithdrawalProof(proof, inputs))
    {
        JLOG(j_.warn()) << "withdraw: proof rejected for nullifier "
                        << request.nullifierHash;
        return tecINVALID_PROOF;
    }

    TER const result = applyWithdrawal(caller, request, amountToBridge, gasValue);
    if (!isTesSuccess(result))
        return result;

    withdrawals_.push_back(
        {request.nullifierHash,
         caller,
         request.destinationChain,
         request.stealthAddress,
         amountToBridge,
         request.relayerFee});

    JLOG(j_.info()) << "withdraw: nullifier " << request.nullifierHash
                    << " bridged " << zkp::uintToDecimal(amountToBridge)
                    << " to " << request.destinationChain << " fee "
                    << zkp::uintToDecimal(request.relayerFee);
    return tesSUCCESS;
}

// Effects of an accepted withdrawal. Either all of them stick or none do.
TER
StealthPool::applyWithdrawal(
    AccountID const& caller,
    WithdrawRequest const& request,
    uint256 const& amountToBridge,
    uint256 const& gasValue)
{
    PendingWithdrawal pending(ledger_, nullifierHashes_, request.nullifierHash);

    if (!request.relayerFee.isZero())
    {
        TER const paid =
            ledger_.transfer(params_.poolAddress, caller, request.relayerFee);
        if (!isTesSuccess(paid))
        {
            JLOG(j_.error()) << "withdraw: cannot pay relayer fee: " << paid;
            return paid;
        }
    }

    auto const bridge = dispatcher_.address();
    ledger_.approve(params_.poolAddress, bridge, amountToBridge);

    DispatchRequest dispatch;
    dispatch.destinationChain = request.destinationChain;
    dispatch.stealthAddress = request.stealthAddress;
    dispatch.ephemeralPublicKey = request.ephemeralPublicKey;
    dispatch.viewHint = request.viewHint;
    dispatch.k = request.k;
    dispatch.token = params_.token;
    dispatch.amount = amountToBridge;
    dispatch.gasValue = gasValue;

    TER sent = tecDISPATCH_FAILED;
    try
    {
        sent = dispatcher_.sendToStealthAddress(dispatch);
    }
    catch (std::exception const& e)
    {
        JLOG(j_.error()) << "withdraw: dispatcher threw: " << e.what();
        return tecDISPATCH_FAILED;
    }

    if (!isTesSuccess(sent))
    {
        JLOG(j_.error()) << "withdraw: dispatcher returned " << sent;
        return tecDISPATCH_FAILED;
    }

    // Clear any allowance the dispatcher left unused.
    ledger_.approve(params_.poolAddress, bridge, uint256{});
    pending.commit();
    return tesSUCCESS;
}

}  // namespace stealthpool
