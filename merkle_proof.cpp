// merkle_proof.cpp
// Leaf encoding and sorted-pair Merkle inclusion check.

#include "merkle_proof.hpp"

namespace merkledrop {

Bytes encode_leaf(uint64_t index, const Address& account, Amount balance) {
    Bytes b;
    b.reserve(32 + 20 + 32);
    append_u256_be(b, index);
    append_bytes(b, account.data(), account.size());
    append_u256_be(b, balance);
    return b;
}

Hash32 leaf_hash(const Hasher& h, uint64_t index, const Address& account, Amount balance) {
    return h.digest(encode_leaf(index, account, balance));
}

Hash32 hash_sorted_pair(const Hasher& h, const Hash32& a, const Hash32& b) {
    return hash32_le(a, b) ? h.concat(a, b) : h.concat(b, a);
}

Hash32 compute_root(const Hasher& h, const MerkleProof& proof, const Hash32& leaf) {
    Hash32 computed = leaf;
    for (const auto& sibling : proof) computed = hash_sorted_pair(h, computed, sibling);
    return computed;
}

bool merkle_verify(const Hasher& h, const MerkleProof& proof, const Hash32& root, const Hash32& leaf) {
    return hash32_eq(compute_root(h, proof, leaf), root);
}

} // namespace merkledrop
