#include "test_util.hpp"

using namespace merkledrop;
using namespace merkledrop::test;

static int test_claim_status_pairs_index_with_period() {
    Fixture f;
    std::vector<Address> accounts(8, f.alice);
    const auto entries = make_entries(accounts);
    const MerkleTree t = f.tree(entries);
    EXPECT(f.seed(10, t, 100'000));
    EXPECT(f.seed(11, t, 100'000));

    std::string err;
    EXPECT(f.dist.claim(5, f.alice, 10, 600, t.proof(5), err));
    EXPECT(f.dist.claim(5, f.alice, 11, 600, t.proof(5), err));

    std::vector<bool> out;
    EXPECT(f.dist.claim_status({5, 7}, 10, 11, out, err));
    EXPECT(out.size() == 2);
    EXPECT(out[0] == f.dist.is_claimed(10, 5));
    EXPECT(out[1] == f.dist.is_claimed(11, 7));
    EXPECT(out[0] && !out[1]);

    EXPECT(f.dist.claim_status({7, 5}, 10, 11, out, err));
    EXPECT(!out[0] && out[1]);

    EXPECT(f.dist.claim_status({5}, 11, 11, out, err));
    EXPECT(out.size() == 1 && out[0]);
    return 0;
}

static int test_claim_status_length_mismatch() {
    Fixture f;
    std::vector<bool> out;
    std::string err;
    EXPECT(!f.dist.claim_status({5, 7, 9}, 10, 11, out, err));
    EXPECT(err == errc::length_mismatch);
    EXPECT(!f.dist.claim_status({5}, 10, 11, out, err));
    EXPECT(err == errc::length_mismatch);
    EXPECT(!f.dist.claim_status({}, 10, 10, out, err));
    EXPECT(err == errc::length_mismatch);
    // full u64 range can never match a vector length
    EXPECT(!f.dist.claim_status({1}, 0, UINT64_MAX, out, err));
    EXPECT(err == errc::length_mismatch);

    EXPECT(!f.dist.claim_status({5, 7}, 11, 10, out, err));
    EXPECT(err == errc::bad_range);
    return 0;
}

static int test_merkle_roots_inclusive_range() {
    Fixture f;
    std::string err;
    EXPECT(f.dist.seed(f.admin, 3, h32(0x33), 0, f.admin, err));
    EXPECT(f.dist.seed(f.admin, 5, h32(0x55), 0, f.admin, err));

    std::vector<Hash32> roots;
    EXPECT(f.dist.merkle_roots(2, 6, roots, err));
    EXPECT(roots.size() == 5);
    EXPECT(hash32_is_zero(roots[0]));
    EXPECT(hash32_eq(roots[1], h32(0x33)));
    EXPECT(hash32_is_zero(roots[2]));
    EXPECT(hash32_eq(roots[3], h32(0x55)));
    EXPECT(hash32_is_zero(roots[4]));

    EXPECT(f.dist.merkle_roots(5, 5, roots, err));
    EXPECT(roots.size() == 1 && hash32_eq(roots[0], h32(0x55)));

    EXPECT(f.dist.merkle_roots(UINT64_MAX, UINT64_MAX, roots, err));
    EXPECT(roots.size() == 1 && hash32_is_zero(roots[0]));
    return 0;
}

static int test_merkle_roots_bad_ranges() {
    Fixture f;
    std::vector<Hash32> roots;
    std::string err;
    EXPECT(!f.dist.merkle_roots(6, 2, roots, err));
    EXPECT(err == errc::bad_range);
    EXPECT(!f.dist.merkle_roots(0, UINT64_MAX, roots, err));
    EXPECT(err == errc::bad_range);

    // widest accepted window is MAX_QUERY_RANGE periods
    EXPECT(f.dist.merkle_roots(10, 10 + params::MAX_QUERY_RANGE - 1, roots, err));
    EXPECT(roots.size() == params::MAX_QUERY_RANGE);
    EXPECT(!f.dist.merkle_roots(10, 10 + params::MAX_QUERY_RANGE, roots, err));
    EXPECT(err == errc::bad_range);
    return 0;
}

int main() {
    RUN(test_claim_status_pairs_index_with_period);
    RUN(test_claim_status_length_mismatch);
    RUN(test_merkle_roots_inclusive_range);
    RUN(test_merkle_roots_bad_ranges);
    std::printf("All query tests passed.\n");
    return EXIT_SUCCESS;
}
