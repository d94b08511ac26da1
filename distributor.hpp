#pragma once

#include "claim_bitmap.hpp"
#include "config.hpp"
#include "hash.hpp"
#include "ledger.hpp"
#include "merkle_proof.hpp"
#include "owned.hpp"
#include "root_registry.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace merkledrop {

struct ClaimEvent {
    uint64_t period{0};
    uint64_t index{0};
    Address  account{};
    Amount   amount{0};
};

struct RootSeededEvent {
    uint64_t period{0};
    Hash32   root{};
    Amount   total_allocation{0};
};

// Receives notifications for committed operations only. Callbacks run after
// the store's lock is released, unless the operation itself was re-entered
// from a ledger callback; then the outer call still holds it and a callback
// must not wait on another thread that calls into the store.
class DistributorEvents {
public:
    virtual ~DistributorEvents() = default;
    virtual void on_claimed(const ClaimEvent& ev) { (void)ev; }
    virtual void on_root_seeded(const RootSeededEvent& ev) { (void)ev; }
};

// One element of claim_batch; the account is shared by the whole batch.
struct BatchClaim {
    uint64_t    index{0};
    uint64_t    period{0};
    Amount      balance{0};
    MerkleProof proof;
};

// Holds every period's root and claim flags and pays claims out of the
// custody account on `ledger`.
//
// Each public call is one serialized, all-or-nothing operation. The lock is
// recursive so a ledger callback that re-enters (same thread) runs against
// the state the outer call has already written: a claim is marked before the
// transfer that pays it, so re-entering with the same claim fails
// already_claimed.
class Distributor {
public:
    Distributor(const Address& custody, const Address& owner, TokenLedger& ledger,
                DistributorConfig cfg = {});

    Distributor(const Distributor&) = delete;
    Distributor& operator=(const Distributor&) = delete;

    // ---- administration
    // Stores `root` for `period`, then pulls `total_allocation` from
    // `funding_source` into custody. The allocation is not checked against
    // the tree; a short allocation surfaces later as transfer_failed claims.
    // Claims against `period` fail invalid_proof until the pull returns.
    bool seed(const Address& caller, uint64_t period, const Hash32& root,
              Amount total_allocation, const Address& funding_source, std::string& err);

    Address owner() const;
    bool transfer_ownership(const Address& caller, const Address& new_owner, std::string& err);
    bool nominate_new_owner(const Address& caller, const Address& nominee, std::string& err);
    bool accept_ownership(const Address& caller, std::string& err);

    // ---- claims
    bool claim(uint64_t index, const Address& account, uint64_t period, Amount balance,
               const MerkleProof& proof, std::string& err);

    // Errors are prefixed with the failing entry: "entry[2]:invalid_proof".
    bool claim_batch(const Address& account, const std::vector<BatchClaim>& claims, std::string& err);

    // ---- views
    bool is_claimed(uint64_t period, uint64_t index) const;
    Hash32 merkle_root(uint64_t period) const;
    bool verify_claim(uint64_t period, uint64_t index, const Address& account, Amount balance,
                      const MerkleProof& proof) const;

    // out[i] = is_claimed(period_begin + i, indices[i])
    bool claim_status(const std::vector<uint64_t>& indices, uint64_t period_begin, uint64_t period_end,
                      std::vector<bool>& out, std::string& err) const;
    bool merkle_roots(uint64_t period_begin, uint64_t period_end,
                      std::vector<Hash32>& out, std::string& err) const;

    // ---- notifications
    void set_event_sink(DistributorEvents* sink);
    std::vector<ClaimEvent> claim_events() const;
    std::vector<RootSeededEvent> seed_events() const;

    // ---- persistence
    Bytes snapshot() const;
    // Only into a store with no roots and no claims.
    bool restore(const Bytes& blob, std::string& err);

    const Hasher& hasher() const { return hasher_; }
    const DistributorConfig& config() const { return cfg_; }
    const Address& custody() const { return custody_; }

private:
    struct Journal {
        std::vector<BitmapUndo> bitmap_undo;
        std::vector<ClaimEvent> pending;
    };

    bool proof_ok_locked(uint64_t period, uint64_t index, const Address& account, Amount balance,
                         const MerkleProof& proof, std::string& err) const;
    bool claim_step_locked(uint64_t index, const Address& account, uint64_t period, Amount balance,
                           const MerkleProof& proof, const std::string* precheck_err,
                           Journal& j, std::string& err);
    void rollback_locked(const Journal& j);
    void commit_locked(const Journal& j);
    // Unlocks `lk`, then hands the journal's events to the sink.
    void publish(std::unique_lock<std::recursive_mutex>& lk, const Journal& j);

    mutable std::recursive_mutex mu_;

    Address custody_;
    TokenLedger& ledger_;
    DistributorConfig cfg_;
    Hasher hasher_;
    Owned owned_;

    RootRegistry registry_;
    std::unordered_set<uint64_t> seeding_; // periods whose funding pull is in flight
    ClaimBitmap bitmap_;

    DistributorEvents* sink_{nullptr};
    std::vector<ClaimEvent> claim_log_;
    std::vector<RootSeededEvent> seed_log_;
};

} // namespace merkledrop
