#pragma once

#include "hash.hpp"

#include <cstdint>
#include <vector>

namespace merkledrop {

// Sibling hashes from leaf to root. No direction bits: each pair is sorted
// before hashing, so tree builders must apply the same rule.
using MerkleProof = std::vector<Hash32>;

// One (index, account, balance) entry of a period's tree.
struct Entitlement {
    uint64_t index{0};
    Address  account{};
    Amount   balance{0};
};

// uint256(index) || address || uint256(balance), 84 bytes, packed.
// Amount is 128 bits, so the top 16 balance bytes are always zero: a tree
// entry with a balance of 2^128 or more has no encodable leaf and cannot be
// claimed.
Bytes encode_leaf(uint64_t index, const Address& account, Amount balance);

Hash32 leaf_hash(const Hasher& h, uint64_t index, const Address& account, Amount balance);
inline Hash32 leaf_hash(const Hasher& h, const Entitlement& e) {
    return leaf_hash(h, e.index, e.account, e.balance);
}

// H(min(a,b) || max(a,b)); commutative.
Hash32 hash_sorted_pair(const Hasher& h, const Hash32& a, const Hash32& b);

// Fold the proof onto the leaf.
Hash32 compute_root(const Hasher& h, const MerkleProof& proof, const Hash32& leaf);

bool merkle_verify(const Hasher& h, const MerkleProof& proof, const Hash32& root, const Hash32& leaf);

} // namespace merkledrop
