#ifndef STEALTHPOOL_POOL_INMEMORYTOKENLEDGER_H_INCLUDED
#define STEALTHPOOL_POOL_INMEMORYTOKENLEDGER_H_INCLUDED

#include <libstealthpool/pool/TokenLedger.h>

#include <functional>
#include <map>
#include <utility>
#include <vector>

namespace stealthpool {

/** TokenLedger kept in process memory.

    Used by the tests and the local simulation. Checkpoints snapshot the
    whole state, which is fine for the handful of accounts involved.
*/
class InMemoryTokenLedger : public TokenLedger
{
public:
    /** Called after every successful transfer, before it returns. */
    using TransferHook = std::function<
        void(AccountID const& from, AccountID const& to, uint256 const& amount)>;

    InMemoryTokenLedger() = default;

    void
    mint(AccountID const& account, uint256 const& amount);

    void
    setTransferHook(TransferHook hook)
    {
        hook_ = std::move(hook);
    }

    uint256
    balanceOf(AccountID const& account) const override;

    uint256
    allowance(AccountID const& owner, AccountID const& spender) const override;

    TER
    transfer(AccountID const& from, AccountID const& to, uint256 const& amount)
        override;

    TER
    transferFrom(
        AccountID const& spender,
        AccountID const& from,
        AccountID const& to,
        uint256 const& amount) override;

    void
    approve(AccountID const& owner, AccountID const& spender, uint256 const& amount)
        override;

    std::size_t
    checkpoint() override;

    void
    rollback(std::size_t checkpoint) override;

    void
    commit(std::size_t checkpoint) override;

private:
    struct State
    {
        std::map<AccountID, uint256> balances;
        std::map<std::pair<AccountID, AccountID>, uint256> allowances;
    };

    // Throws std::overflow_error if crediting to would wrap its balance.
    void
    checkCredit(AccountID const& from, AccountID const& to, uint256 const& amount)
        const;

    TER
    move(AccountID const& from, AccountID const& to, uint256 const& amount);

    State state_;
    std::vector<State> snapshots_;
    TransferHook hook_;
};

}  // namespace stealthpool

#endif
