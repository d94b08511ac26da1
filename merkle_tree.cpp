// merkle_tree.cpp

#include "merkle_tree.hpp"

#include <stdexcept>
#include <utility>

namespace merkledrop {

MerkleTree::MerkleTree(const Hasher& h, std::vector<Hash32> leaves) {
    if (leaves.empty()) return;
    levels_.push_back(std::move(leaves));

    while (levels_.back().size() > 1) {
        const std::vector<Hash32>& cur = levels_.back();
        std::vector<Hash32> next;
        next.reserve((cur.size() + 1) / 2);
        for (size_t i = 0; i + 1 < cur.size(); i += 2) next.push_back(hash_sorted_pair(h, cur[i], cur[i + 1]));
        if (cur.size() % 2 == 1) next.push_back(cur.back());
        levels_.push_back(std::move(next));
    }
}

MerkleTree MerkleTree::from_entitlements(const Hasher& h, const std::vector<Entitlement>& entries) {
    std::vector<Hash32> leaves;
    leaves.reserve(entries.size());
    for (const auto& e : entries) leaves.push_back(leaf_hash(h, e));
    return MerkleTree(h, std::move(leaves));
}

Hash32 MerkleTree::root() const {
    return levels_.empty() ? Hash32{} : levels_.back().front();
}

MerkleProof MerkleTree::proof(size_t i) const {
    if (i >= leaf_count()) throw std::out_of_range("leaf index out of range");

    MerkleProof p;
    for (size_t d = 0; d + 1 < levels_.size(); d++) {
        const std::vector<Hash32>& lvl = levels_[d];
        const size_t sib = i ^ 1;
        if (sib < lvl.size()) p.push_back(lvl[sib]);
        i >>= 1;
    }
    return p;
}

} // namespace merkledrop
