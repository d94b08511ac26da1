#pragma once

#include "merkle_proof.hpp"

#include <vector>

namespace merkledrop {

// Off-chain tree over a period's leaves, built with the same sorted-pair rule
// the verifier uses. An unpaired node at the end of a level moves up
// unchanged, so its proof simply has no sibling at that level.
class MerkleTree {
public:
    MerkleTree(const Hasher& h, std::vector<Hash32> leaves);

    static MerkleTree from_entitlements(const Hasher& h, const std::vector<Entitlement>& entries);

    size_t leaf_count() const { return levels_.empty() ? 0 : levels_.front().size(); }

    // Zero hash for an empty tree.
    Hash32 root() const;

    // Siblings from leaf `i` upwards. Throws std::out_of_range.
    MerkleProof proof(size_t i) const;

private:
    std::vector<std::vector<Hash32>> levels_; // levels_[0] = leaves
};

} // namespace merkledrop
