#include <libstealthpool/pool/InMemoryTokenLedger.h>

#include <stdexcept>

namespace stealthpool {

void
InMemoryTokenLedger::mint(AccountID const& account, uint256 const& amount)
{
    auto& balance = state_.balances[account];
    auto const sum = balance + amount;
    if (sum < balance)
        throw std::overflow_error("mint overflows the balance");
    balance = sum;
}

uint256
InMemoryTokenLedger::balanceOf(AccountID const& account) const
{
    auto const it = state_.balances.find(account);
    return it == state_.balances.end() ? uint256{} : it->second;
}

uint256
InMemoryTokenLedger::allowance(
    AccountID const& owner,
    AccountID const& spender) const
{
    auto const it = state_.allowances.find({owner, spender});
    return it == state_.allowances.end() ? uint256{} : it->second;
}

void
InMemoryTokenLedger::checkCredit(
    AccountID const& from,
    AccountID const& to,
    uint256 const& amount) const
{
    if (from == to)
        return;
    auto const balance = balanceOf(to);
    if (balance + amount < balance)
        throw std::overflow_error("transfer overflows the recipient balance");
}

TER
InMemoryTokenLedger::move(
    AccountID const& from,
    AccountID const& to,
    uint256 const& amount)
{
    auto const available = balanceOf(from);
    if (available < amount)
        return tecINSUFFICIENT_FUNDS;
    checkCredit(from, to, amount);

    state_.balances[from] = available - amount;
    state_.balances[to] = balanceOf(to) + amount;

    if (hook_)
        hook_(from, to, amount);
    return tesSUCCESS;
}

TER
InMemoryTokenLedger::transfer(
    AccountID const& from,
    AccountID const& to,
    uint256 const& amount)
{
    return move(from, to, amount);
}

TER
InMemoryTokenLedger::transferFrom(
    AccountID const& spender,
    AccountID const& from,
    AccountID const& to,
    uint256 const& amount)
{
    auto const allowed = allowance(from, spender);
    if (allowed < amount)
        return tecINSUFFICIENT_FUNDS;
    if (balanceOf(from) < amount)
        return tecINSUFFICIENT_FUNDS;
    checkCredit(from, to, amount);

    state_.allowances[{from, spender}] = allowed - amount;
    return move(from, to, amount);
}

void
InMemoryTokenLedger::approve(
    AccountID const& owner,
    AccountID const& spender,
    uint256 const& amount)
{
    state_.allowances[{owner, spender}] = amount;
}

std::size_t
InMemoryTokenLedger::checkpoint()
{
    snapshots_.push_back(state_);
    return snapshots_.size() - 1;
}

void
InMemoryTokenLedger::rollback(std::size_t checkpoint)
{
    if (checkpoint >= snapshots_.size())
        throw std::logic_error("rollback to an unknown checkpoint");
    state_ = std::move(snapshots_[checkpoint]);
    snapshots_.resize(checkpoint);
}

void
InMemoryTokenLedger::commit(std::size_t checkpoint)
{
    if (checkpoint >= snapshots_.size())
        throw std::logic_error("commit of an unknown checkpoint");
    snapshots_.resize(checkpoint);
}

}  // namespace stealthpool
