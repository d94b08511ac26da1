#pragma once

#include "hash.hpp"

#include <optional>
#include <string>

namespace merkledrop {

// Single-owner capability gating administrative calls.
class Owned {
public:
    explicit Owned(const Address& owner) : owner_(owner) {}

    const Address& owner() const { return owner_; }
    const std::optional<Address>& nominated_owner() const { return nominated_; }

    bool only_owner(const Address& caller, std::string& err) const;

    // Single step: takes effect immediately, clears any nomination.
    bool transfer_ownership(const Address& caller, const Address& new_owner, std::string& err);

    // Two step: owner nominates, nominee accepts.
    bool nominate_new_owner(const Address& caller, const Address& nominee, std::string& err);
    bool accept_ownership(const Address& caller, std::string& err);

private:
    Address owner_;
    std::optional<Address> nominated_;
};

} // namespace merkledrop
