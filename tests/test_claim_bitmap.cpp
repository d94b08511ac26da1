#include "claim_bitmap.hpp"
#include "test_util.hpp"

#include <cstdint>

using namespace merkledrop;

static int test_untouched_indices_are_unclaimed() {
    ClaimBitmap bm;
    EXPECT(!bm.is_claimed(0, 0));
    EXPECT(!bm.is_claimed(7, 123456789));
    EXPECT(!bm.is_claimed(UINT64_MAX, UINT64_MAX));
    EXPECT(bm.empty());
    return 0;
}

static int test_mark_sets_exactly_one_bit() {
    ClaimBitmap bm;
    bm.mark_claimed(3, 300);
    EXPECT(bm.is_claimed(3, 300));
    EXPECT(!bm.is_claimed(3, 299));
    EXPECT(!bm.is_claimed(3, 301));
    EXPECT(!bm.is_claimed(4, 300));
    EXPECT(!bm.is_claimed(2, 300));

    // index 300 -> word 1, bit 44 -> lane 0, bit 44
    const ClaimWord w = bm.word(3, 1);
    EXPECT(w[0] == (1ULL << 44));
    EXPECT(w[1] == 0 && w[2] == 0 && w[3] == 0);
    EXPECT(bm.word_count() == 1);
    return 0;
}

static int test_word_packing_boundaries() {
    ClaimBitmap bm;
    for (uint64_t idx : {0ULL, 63ULL, 64ULL, 255ULL, 256ULL}) bm.mark_claimed(1, idx);

    const ClaimWord w0 = bm.word(1, 0);
    EXPECT(w0[0] == ((1ULL << 0) | (1ULL << 63)));
    EXPECT(w0[1] == 1ULL);
    EXPECT(w0[2] == 0);
    EXPECT(w0[3] == (1ULL << 63));
    EXPECT(bm.word(1, 1)[0] == 1ULL);
    EXPECT(bm.word_count() == 2);

    bm.mark_claimed(1, UINT64_MAX);
    EXPECT(bm.is_claimed(1, UINT64_MAX));
    EXPECT(bm.word(1, UINT64_MAX >> 8)[3] == (1ULL << 63));
    return 0;
}

static int test_marking_twice_is_harmless() {
    ClaimBitmap bm;
    std::vector<BitmapUndo> undo;
    bm.mark_claimed(9, 5, &undo);
    bm.mark_claimed(9, 5, &undo);
    EXPECT(bm.is_claimed(9, 5));
    EXPECT(undo.size() == 1);
    return 0;
}

static int test_undo_clears_marks_and_drops_new_words() {
    ClaimBitmap bm;
    bm.mark_claimed(1, 10); // committed earlier

    std::vector<BitmapUndo> undo;
    bm.mark_claimed(1, 11, &undo);
    bm.mark_claimed(1, 1000, &undo);
    bm.mark_claimed(2, 0, &undo);
    EXPECT(bm.word_count() == 3);

    bm.undo_from_log_reverse(undo);
    EXPECT(bm.is_claimed(1, 10));
    EXPECT(!bm.is_claimed(1, 11));
    EXPECT(!bm.is_claimed(1, 1000));
    EXPECT(!bm.is_claimed(2, 0));
    EXPECT(bm.word_count() == 1);
    return 0;
}

static int test_undo_keeps_marks_made_in_between() {
    ClaimBitmap bm;
    std::vector<BitmapUndo> outer;
    bm.mark_claimed(5, 1, &outer);

    // a nested operation commits a neighbour in the same word
    std::vector<BitmapUndo> nested;
    bm.mark_claimed(5, 2, &nested);

    bm.undo_from_log_reverse(outer);
    EXPECT(!bm.is_claimed(5, 1));
    EXPECT(bm.is_claimed(5, 2));
    EXPECT(bm.word_count() == 1);
    return 0;
}

int main() {
    RUN(test_untouched_indices_are_unclaimed);
    RUN(test_mark_sets_exactly_one_bit);
    RUN(test_word_packing_boundaries);
    RUN(test_marking_twice_is_harmless);
    RUN(test_undo_clears_marks_and_drops_new_words);
    RUN(test_undo_keeps_marks_made_in_between);
    std::printf("All claim bitmap tests passed.\n");
    return EXIT_SUCCESS;
}
