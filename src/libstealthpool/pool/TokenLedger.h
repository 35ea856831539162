#ifndef STEALTHPOOL_POOL_TOKENLEDGER_H_INCLUDED
#define STEALTHPOOL_POOL_TOKENLEDGER_H_INCLUDED

#include <libstealthpool/basics/AccountID.h>
#include <libstealthpool/basics/TER.h>
#include <libstealthpool/basics/base_uint.h>

#include <cstddef>

namespace stealthpool {

/** Balances and allowances of the pool's token on the host chain.

    Changes are journaled: checkpoint() marks a point that rollback() can
    return to, which is how an operation that fails halfway leaves no trace.
*/
class TokenLedger
{
public:
    virtual ~TokenLedger() = default;

    virtual uint256
    balanceOf(AccountID const& account) const = 0;

    virtual uint256
    allowance(AccountID const& owner, AccountID const& spender) const = 0;

    /** Move amount from from to to. tecINSUFFICIENT_FUNDS if short.

        Throws std::overflow_error, leaving balances untouched, if the
        recipient's balance would wrap.
    */
    virtual TER
    transfer(AccountID const& from, AccountID const& to, uint256 const& amount) = 0;

    /** Move amount on behalf of spender, consuming its allowance. */
    virtual TER
    transferFrom(
        AccountID const& spender,
        AccountID const& from,
        AccountID const& to,
        uint256 const& amount) = 0;

    virtual void
    approve(AccountID const& owner, AccountID const& spender, uint256 const& amount) = 0;

    virtual std::size_t
    checkpoint() = 0;

    /** Undo every change made after the checkpoint and drop it. */
    virtual void
    rollback(std::size_t checkpoint) = 0;

    /** Keep the changes and drop the checkpoint. */
    virtual void
    commit(std::size_t checkpoint) = 0;
};

/** Takes a checkpoint and rolls back to it on scope exit unless committed. */
class LedgerCheckpoint
{
public:
    explicit LedgerCheckpoint(TokenLedger& ledger)
        : ledger_(ledger), checkpoint_(ledger.checkpoint())
    {
    }

    LedgerCheckpoint(LedgerCheckpoint const&) = delete;
    LedgerCheckpoint&
    operator=(LedgerCheckpoint const&) = delete;

    ~LedgerCheckpoint()
    {
        if (open_)
            ledger_.rollback(checkpoint_);
    }

    void
    commit()
    {
        ledger_.commit(checkpoint_);
        open_ = false;
    }

private:
    TokenLedger& ledger_;
    std::size_t checkpoint_;
    bool open_ = true;
};

}  // namespace stealthpool

#endif
