// ledger.cpp

#include "ledger.hpp"

namespace merkledrop {

bool InMemoryLedger::mint(const Address& to, Amount amount) {
    return add_amount_checked(balances_[to], amount);
}

bool InMemoryLedger::move(const Address& from, const Address& to, Amount amount) {
    auto it = balances_.find(from);
    const Amount have = (it != balances_.end()) ? it->second : 0;
    if (have < amount) return false;
    if (from == to) return true;

    Amount to_bal = balance_of(to);
    if (!add_amount_checked(to_bal, amount)) return false;

    balances_[from] = have - amount;
    balances_[to] = to_bal;
    return true;
}

bool InMemoryLedger::transfer_as(const Address& from, const Address& to, Amount amount) {
    return move(from, to, amount);
}

void InMemoryLedger::approve(const Address& owner, const Address& spender, Amount amount) {
    allowances_[{owner, spender}] = amount;
}

Amount InMemoryLedger::balance_of(const Address& a) const {
    auto it = balances_.find(a);
    return (it != balances_.end()) ? it->second : 0;
}

Amount InMemoryLedger::allowance(const Address& owner, const Address& spender) const {
    auto it = allowances_.find({owner, spender});
    return (it != allowances_.end()) ? it->second : 0;
}

bool InMemoryLedger::transfer(const Address& recipient, Amount amount) {
    transfer_calls_++;
    if (fail_transfers_) return false;
    if (!move(custodian_, recipient, amount)) return false;
    if (hook_) hook_(recipient, amount);
    return true;
}

bool InMemoryLedger::transfer_from(const Address& source, const Address& recipient, Amount amount) {
    transfer_from_calls_++;
    if (fail_transfers_) return false;

    const Amount allowed = allowance(source, custodian_);
    if (allowed < amount) return false;
    if (!move(source, recipient, amount)) return false;
    allowances_[{source, custodian_}] = allowed - amount;
    return true;
}

} // namespace merkledrop
