#include "merkle_proof.hpp"
#include "merkle_tree.hpp"
#include "test_util.hpp"

#include <stdexcept>

using namespace merkledrop;
using namespace merkledrop::test;

static Hash32 hex32(const char* s) {
    Hash32 h{};
    if (!hash32_from_hex(s, h)) throw std::runtime_error("bad hex in test vector");
    return h;
}

static int test_sha256_known_vector() {
    const Hasher h(HashAlgo::sha256);
    const Bytes abc = {'a', 'b', 'c'};
    EXPECT(hash32_eq(h.digest(abc),
                     hex32("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad")));
    return 0;
}

static int test_sha3_known_vector() {
    const Hasher h(HashAlgo::sha3_256);
    const Bytes abc = {'a', 'b', 'c'};
    EXPECT(hash32_eq(h.digest(abc),
                     hex32("3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532")));
    return 0;
}

static int test_keccak_known_vector_when_available() {
    try {
        const Hasher h(HashAlgo::keccak256);
        EXPECT(hash32_eq(h.digest(Bytes{}),
                         hex32("c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470")));
    } catch (const std::runtime_error&) {
        std::printf("(no KECCAK-256 in this OpenSSL) ");
    }
    return 0;
}

static int test_leaf_encoding_layout() {
    Address acct{};
    for (size_t i = 0; i < acct.size(); i++) acct[i] = (uint8_t)(0x10 + i);

    const Bytes b = encode_leaf(0x0102, acct, ((Amount)1 << 64) | 0xFF);
    EXPECT(b.size() == 84);

    // index: uint256 big-endian
    for (size_t i = 0; i < 30; i++) EXPECT(b[i] == 0);
    EXPECT(b[30] == 0x01);
    EXPECT(b[31] == 0x02);
    // account: raw 20 bytes
    for (size_t i = 0; i < 20; i++) EXPECT(b[32 + i] == acct[i]);
    // balance: uint256 big-endian, 2^64 + 255
    for (size_t i = 52; i < 52 + 23; i++) EXPECT(b[i] == 0);
    EXPECT(b[75] == 0x01);
    for (size_t i = 76; i < 83; i++) EXPECT(b[i] == 0);
    EXPECT(b[83] == 0xFF);

    // widest balance fills only the low 16 bytes of its uint256
    const Bytes m = encode_leaf(0, acct, ~(Amount)0);
    for (size_t i = 52; i < 68; i++) EXPECT(m[i] == 0);
    for (size_t i = 68; i < 84; i++) EXPECT(m[i] == 0xFF);
    return 0;
}

static int test_sorted_pair_is_commutative() {
    const Hasher h;
    const Hash32 a = h32(0x01), b = h32(0xFE);
    EXPECT(hash32_eq(hash_sorted_pair(h, a, b), hash_sorted_pair(h, b, a)));
    EXPECT(hash32_eq(hash_sorted_pair(h, a, b), h.concat(a, b)));
    EXPECT(!hash32_eq(h.concat(a, b), h.concat(b, a)));
    return 0;
}

static int test_empty_proof_only_for_single_leaf() {
    const Hasher h;
    const Hash32 leaf = leaf_hash(h, 0, addr(1), 10);
    EXPECT(merkle_verify(h, {}, leaf, leaf));
    EXPECT(!merkle_verify(h, {}, h32(0x77), leaf));

    const MerkleTree single(h, {leaf});
    EXPECT(hash32_eq(single.root(), leaf));
    EXPECT(single.proof(0).empty());
    return 0;
}

static int test_every_leaf_verifies_for_many_sizes() {
    const Hasher h;
    for (size_t n = 1; n <= 17; n++) {
        std::vector<Address> accounts;
        for (size_t i = 0; i < n; i++) accounts.push_back(addr((uint8_t)(0x20 + i)));
        const auto entries = make_entries(accounts);
        const MerkleTree tree = MerkleTree::from_entitlements(h, entries);
        for (size_t i = 0; i < n; i++) {
            EXPECT(merkle_verify(h, tree.proof(i), tree.root(), leaf_hash(h, entries[i])));
        }
    }
    return 0;
}

static int test_single_bit_flips_break_verification() {
    const Hasher h;
    const auto entries = make_entries({addr(1), addr(2), addr(3), addr(4), addr(5), addr(6)});
    const MerkleTree tree = MerkleTree::from_entitlements(h, entries);

    for (size_t li = 0; li < entries.size(); li++) {
        const MerkleProof proof = tree.proof(li);
        const Hash32 leaf = leaf_hash(h, entries[li]);
        const Hash32 root = tree.root();
        EXPECT(merkle_verify(h, proof, root, leaf));

        for (size_t bit = 0; bit < 256; bit++) {
            const uint8_t mask = (uint8_t)(1u << (bit % 8));

            Hash32 bad_leaf = leaf;
            bad_leaf[bit / 8] ^= mask;
            EXPECT(!merkle_verify(h, proof, root, bad_leaf));

            Hash32 bad_root = root;
            bad_root[bit / 8] ^= mask;
            EXPECT(!merkle_verify(h, proof, bad_root, leaf));

            for (size_t s = 0; s < proof.size(); s++) {
                MerkleProof bad = proof;
                bad[s][bit / 8] ^= mask;
                EXPECT(!merkle_verify(h, bad, root, leaf));
            }
        }
    }
    return 0;
}

static int test_tampered_claim_fields_fail() {
    const Hasher h;
    const auto entries = make_entries({addr(1), addr(2), addr(3), addr(4)});
    const MerkleTree tree = MerkleTree::from_entitlements(h, entries);
    const MerkleProof p = tree.proof(2);

    EXPECT(merkle_verify(h, p, tree.root(), leaf_hash(h, 2, addr(3), 300)));
    EXPECT(!merkle_verify(h, p, tree.root(), leaf_hash(h, 1, addr(3), 300)));
    EXPECT(!merkle_verify(h, p, tree.root(), leaf_hash(h, 2, addr(2), 300)));
    EXPECT(!merkle_verify(h, p, tree.root(), leaf_hash(h, 2, addr(3), 301)));
    return 0;
}

static int test_swapped_children_still_verify() {
    const Hasher h;
    const Hash32 a = leaf_hash(h, 0, addr(1), 1);
    const Hash32 b = leaf_hash(h, 1, addr(2), 2);
    const Hash32 c = leaf_hash(h, 2, addr(3), 3);
    const Hash32 d = leaf_hash(h, 3, addr(4), 4);

    // children of the left internal node swapped: (b, a) instead of (a, b)
    const MerkleTree straight(h, {a, b, c, d});
    const MerkleTree swapped(h, {b, a, c, d});
    EXPECT(hash32_eq(straight.root(), swapped.root()));

    // proof for `a` taken from the swapped tree verifies against either root
    EXPECT(merkle_verify(h, swapped.proof(1), straight.root(), a));
    EXPECT(merkle_verify(h, straight.proof(0), swapped.root(), a));
    return 0;
}

static int test_odd_node_is_promoted() {
    const Hasher h;
    const Hash32 a = h32(0x0A), b = h32(0x0B), c = h32(0x0C);
    const MerkleTree tree(h, {a, b, c});
    EXPECT(hash32_eq(tree.root(), hash_sorted_pair(h, hash_sorted_pair(h, a, b), c)));
    EXPECT(tree.proof(2).size() == 1);
    EXPECT(merkle_verify(h, tree.proof(2), tree.root(), c));

    bool threw = false;
    try { (void)tree.proof(3); } catch (const std::out_of_range&) { threw = true; }
    EXPECT(threw);
    return 0;
}

static int test_algorithms_give_distinct_roots() {
    const auto entries = make_entries({addr(1), addr(2), addr(3)});
    const Hasher sha(HashAlgo::sha256);
    const Hasher sha3(HashAlgo::sha3_256);
    const MerkleTree t1 = MerkleTree::from_entitlements(sha, entries);
    const MerkleTree t2 = MerkleTree::from_entitlements(sha3, entries);
    EXPECT(!hash32_eq(t1.root(), t2.root()));
    EXPECT(merkle_verify(sha3, t2.proof(1), t2.root(), leaf_hash(sha3, entries[1])));
    EXPECT(!merkle_verify(sha, t2.proof(1), t2.root(), leaf_hash(sha, entries[1])));
    return 0;
}

int main() {
    RUN(test_sha256_known_vector);
    RUN(test_sha3_known_vector);
    RUN(test_keccak_known_vector_when_available);
    RUN(test_leaf_encoding_layout);
    RUN(test_sorted_pair_is_commutative);
    RUN(test_empty_proof_only_for_single_leaf);
    RUN(test_every_leaf_verifies_for_many_sizes);
    RUN(test_single_bit_flips_break_verification);
    RUN(test_tampered_claim_fields_fail);
    RUN(test_swapped_children_still_verify);
    RUN(test_odd_node_is_promoted);
    RUN(test_algorithms_give_distinct_roots);
    std::printf("All merkle proof tests passed.\n");
    return EXIT_SUCCESS;
}
