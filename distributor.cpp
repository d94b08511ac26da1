// distributor.cpp
// Seeding, claim processing and read-only queries over one store.

#include "distributor.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "parallel.hpp"

namespace merkledrop {

Distributor::Distributor(const Address& custody, const Address& owner, TokenLedger& ledger,
                         DistributorConfig cfg)
    : custody_(custody), ledger_(ledger), cfg_(cfg), hasher_(cfg.hash_algo), owned_(owner) {}

// ============================================================
// Administration
// ============================================================
bool Distributor::seed(const Address& caller, uint64_t period, const Hash32& root,
                       Amount total_allocation, const Address& funding_source, std::string& err) {
    std::unique_lock<std::recursive_mutex> lk(mu_);

    if (!owned_.only_owner(caller, err)) return false;
    if (!registry_.insert(period, root, err)) {
        log_line(LogLevel::debug, "seed_rejected period=", period, " err=", err);
        return false;
    }

    // Not claimable until funded: a re-entrant claim during the pull must not
    // commit against a root that may still be rolled back.
    seeding_.insert(period);
    const bool funded = total_allocation == 0 ||
                        ledger_.transfer_from(funding_source, custody_, total_allocation);
    seeding_.erase(period);

    if (!funded) {
        registry_.rollback_insert(period);
        err = errc::transfer_failed;
        log_line(LogLevel::warn, "seed_funding_failed period=", period,
                 " source=", hex_of(funding_source), " amount=", amount_to_string(total_allocation));
        return false;
    }

    RootSeededEvent ev{period, root, total_allocation};
    seed_log_.push_back(ev);
    log_line(LogLevel::info, "seeded period=", period, " root=", hex_of(root),
             " allocation=", amount_to_string(total_allocation));
    err.clear();

    DistributorEvents* sink = sink_;
    lk.unlock();
    if (sink) sink->on_root_seeded(ev);
    return true;
}

Address Distributor::owner() const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    return owned_.owner();
}

bool Distributor::transfer_ownership(const Address& caller, const Address& new_owner, std::string& err) {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    return owned_.transfer_ownership(caller, new_owner, err);
}

bool Distributor::nominate_new_owner(const Address& caller, const Address& nominee, std::string& err) {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    return owned_.nominate_new_owner(caller, nominee, err);
}

bool Distributor::accept_ownership(const Address& caller, std::string& err) {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    return owned_.accept_ownership(caller, err);
}

// ============================================================
// Claims
// ============================================================
bool Distributor::proof_ok_locked(uint64_t period, uint64_t index, const Address& account, Amount balance,
                                  const MerkleProof& proof, std::string& err) const {
    if (proof.size() > cfg_.max_proof_len) { err = errc::proof_too_long; return false; }
    if (!registry_.has_root(period) || seeding_.count(period)) { err = errc::invalid_proof; return false; }

    const Hash32 leaf = leaf_hash(hasher_, index, account, balance);
    if (!merkle_verify(hasher_, proof, registry_.root_of(period), leaf)) {
        err = errc::invalid_proof;
        return false;
    }
    err.clear();
    return true;
}

bool Distributor::claim_step_locked(uint64_t index, const Address& account, uint64_t period, Amount balance,
                                    const MerkleProof& proof, const std::string* precheck_err,
                                    Journal& j, std::string& err) {
    // 1) duplicates, including earlier entries of the same batch
    if (bitmap_.is_claimed(period, index)) { err = errc::already_claimed; return false; }

    // 2) leaf + proof against the committed root
    if (precheck_err) {
        if (!precheck_err->empty()) { err = *precheck_err; return false; }
    } else if (!proof_ok_locked(period, index, account, balance, proof, err)) {
        return false;
    }

    // 3) mark before any transfer
    bitmap_.mark_claimed(period, index, &j.bitmap_undo);
    j.pending.push_back(ClaimEvent{period, index, account, balance});
    err.clear();
    return true;
}

void Distributor::rollback_locked(const Journal& j) {
    bitmap_.undo_from_log_reverse(j.bitmap_undo);
}

void Distributor::commit_locked(const Journal& j) {
    for (const auto& ev : j.pending) {
        claim_log_.push_back(ev);
        log_line(LogLevel::info, "claimed period=", ev.period, " index=", ev.index,
                 " account=", hex_of(ev.account), " amount=", amount_to_string(ev.amount));
    }
}

void Distributor::publish(std::unique_lock<std::recursive_mutex>& lk, const Journal& j) {
    DistributorEvents* sink = sink_;
    lk.unlock();
    if (!sink) return;
    for (const auto& ev : j.pending) sink->on_claimed(ev);
}

bool Distributor::claim(uint64_t index, const Address& account, uint64_t period, Amount balance,
                        const MerkleProof& proof, std::string& err) {
    std::unique_lock<std::recursive_mutex> lk(mu_);

    Journal j;
    if (!claim_step_locked(index, account, period, balance, proof, nullptr, j, err)) {
        log_line(LogLevel::debug, "claim_rejected period=", period, " index=", index, " err=", err);
        return false;
    }

    if (balance > 0 && !ledger_.transfer(account, balance)) {
        rollback_locked(j);
        err = errc::transfer_failed;
        log_line(LogLevel::warn, "claim_transfer_failed period=", period, " index=", index,
                 " account=", hex_of(account), " amount=", amount_to_string(balance));
        return false;
    }

    commit_locked(j);
    err.clear();
    publish(lk, j);
    return true;
}

bool Distributor::claim_batch(const Address& account, const std::vector<BatchClaim>& claims, std::string& err) {
    std::unique_lock<std::recursive_mutex> lk(mu_);

    if (claims.size() > cfg_.max_batch_entries) { err = errc::batch_too_large; return false; }

    // Proofs are pure; check them up front when the batch is big enough.
    std::vector<std::string> precheck;
    const bool use_precheck = cfg_.parallel_proofs && claims.size() >= cfg_.parallel_threshold;
    if (use_precheck) {
        precheck.resize(claims.size());
        parallel_for(claims.size(), [&](size_t i) -> bool {
            const BatchClaim& c = claims[i];
            proof_ok_locked(c.period, c.index, account, c.balance, c.proof, precheck[i]);
            return true;
        });
    }

    Journal j;
    Amount total = 0;
    for (size_t i = 0; i < claims.size(); i++) {
        const BatchClaim& c = claims[i];
        std::string e;
        const std::string* pre = use_precheck ? &precheck[i] : nullptr;
        if (!claim_step_locked(c.index, account, c.period, c.balance, c.proof, pre, j, e)) {
            rollback_locked(j);
            err = "entry[" + std::to_string(i) + "]:" + e;
            log_line(LogLevel::debug, "batch_rejected account=", hex_of(account), " err=", err);
            return false;
        }
        if (!add_amount_checked(total, c.balance)) {
            rollback_locked(j);
            err = "entry[" + std::to_string(i) + "]:" + errc::amount_overflow;
            return false;
        }
    }

    if (total > 0 && !ledger_.transfer(account, total)) {
        rollback_locked(j);
        err = errc::transfer_failed;
        log_line(LogLevel::warn, "batch_transfer_failed account=", hex_of(account),
                 " entries=", claims.size(), " amount=", amount_to_string(total));
        return false;
    }

    commit_locked(j);
    err.clear();
    publish(lk, j);
    return true;
}

// ============================================================
// Views
// ============================================================
bool Distributor::is_claimed(uint64_t period, uint64_t index) const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    return bitmap_.is_claimed(period, index);
}

Hash32 Distributor::merkle_root(uint64_t period) const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    return registry_.root_of(period);
}

bool Distributor::verify_claim(uint64_t period, uint64_t index, const Address& account, Amount balance,
                               const MerkleProof& proof) const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    std::string e;
    return proof_ok_locked(period, index, account, balance, proof, e);
}

bool Distributor::claim_status(const std::vector<uint64_t>& indices, uint64_t period_begin, uint64_t period_end,
                               std::vector<bool>& out, std::string& err) const {
    if (period_end < period_begin) { err = errc::bad_range; return false; }
    const uint64_t span = period_end - period_begin; // count - 1, no overflow
    if (indices.empty() || (uint64_t)(indices.size() - 1) != span) { err = errc::length_mismatch; return false; }

    std::lock_guard<std::recursive_mutex> lk(mu_);
    out.clear();
    out.reserve(indices.size());
    for (size_t i = 0; i < indices.size(); i++) {
        out.push_back(bitmap_.is_claimed(period_begin + i, indices[i]));
    }
    err.clear();
    return true;
}

bool Distributor::merkle_roots(uint64_t period_begin, uint64_t period_end,
                               std::vector<Hash32>& out, std::string& err) const {
    if (period_end < period_begin) { err = errc::bad_range; return false; }
    if (period_end - period_begin >= params::MAX_QUERY_RANGE) { err = errc::bad_range; return false; }

    std::lock_guard<std::recursive_mutex> lk(mu_);
    out.clear();
    out.reserve((size_t)(period_end - period_begin + 1));
    for (uint64_t p = period_begin;; p++) {
        out.push_back(registry_.root_of(p));
        if (p == period_end) break;
    }
    err.clear();
    return true;
}

// ============================================================
// Notifications
// ============================================================
void Distributor::set_event_sink(DistributorEvents* sink) {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    sink_ = sink;
}

std::vector<ClaimEvent> Distributor::claim_events() const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    return claim_log_;
}

std::vector<RootSeededEvent> Distributor::seed_events() const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    return seed_log_;
}

} // namespace merkledrop
