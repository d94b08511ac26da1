#pragma once

#include "hash.hpp"

#include <functional>
#include <map>
#include <utility>

namespace merkledrop {

// Token ledger as seen from the distributor's custody account.
// Failures are reported by returning false, never by throwing.
class TokenLedger {
public:
    virtual ~TokenLedger() = default;

    // custody -> recipient
    virtual bool transfer(const Address& recipient, Amount amount) = 0;

    // source -> recipient, spending the allowance source granted to custody
    virtual bool transfer_from(const Address& source, const Address& recipient, Amount amount) = 0;
};

// Balance/allowance ledger kept in memory. Not thread-safe; the distributor
// serializes its own calls into it.
class InMemoryLedger : public TokenLedger {
public:
    // Runs after a successful push transfer, before it returns.
    using TransferHook = std::function<void(const Address& recipient, Amount amount)>;

    explicit InMemoryLedger(const Address& custodian) : custodian_(custodian) {}

    const Address& custodian() const { return custodian_; }

    bool mint(const Address& to, Amount amount);
    bool transfer_as(const Address& from, const Address& to, Amount amount);
    void approve(const Address& owner, const Address& spender, Amount amount);

    Amount balance_of(const Address& a) const;
    Amount allowance(const Address& owner, const Address& spender) const;

    bool transfer(const Address& recipient, Amount amount) override;
    bool transfer_from(const Address& source, const Address& recipient, Amount amount) override;

    void set_fail_transfers(bool on) { fail_transfers_ = on; }
    void set_transfer_hook(TransferHook hook) { hook_ = std::move(hook); }

    size_t transfer_calls() const { return transfer_calls_; }
    size_t transfer_from_calls() const { return transfer_from_calls_; }

private:
    bool move(const Address& from, const Address& to, Amount amount);

    Address custodian_;
    std::map<Address, Amount> balances_;
    std::map<std::pair<Address, Address>, Amount> allowances_;

    bool fail_transfers_{false};
    TransferHook hook_;
    size_t transfer_calls_{0};
    size_t transfer_from_calls_{0};
};

} // namespace merkledrop
