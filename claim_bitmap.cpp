// claim_bitmap.cpp
// Sparse per-period claim flags packed 256 to a word.

#include "claim_bitmap.hpp"

namespace merkledrop {

static WordKey key_of(uint64_t period, uint64_t index) { return WordKey{period, index >> 8}; }
static uint64_t lane_mask(uint64_t index) { return 1ULL << (index & 63); }
static size_t lane_of(uint64_t index) { return (size_t)((index & 255) >> 6); }

bool ClaimBitmap::is_claimed(uint64_t period, uint64_t index) const {
    auto it = words_.find(key_of(period, index));
    if (it == words_.end()) return false;
    return (it->second[lane_of(index)] & lane_mask(index)) != 0;
}

static bool word_is_zero(const ClaimWord& w) {
    return (w[0] | w[1] | w[2] | w[3]) == 0;
}

void ClaimBitmap::mark_claimed(uint64_t period, uint64_t index, std::vector<BitmapUndo>* undo) {
    const WordKey k = key_of(period, index);
    auto it = words_.find(k);
    const bool created = (it == words_.end());
    if (created) it = words_.emplace(k, ClaimWord{}).first;

    uint64_t& lane = it->second[lane_of(index)];
    if (lane & lane_mask(index)) return;
    lane |= lane_mask(index);
    if (undo) undo->push_back({k, (uint8_t)(index & 255), created});
}

void ClaimBitmap::undo_from_log_reverse(const std::vector<BitmapUndo>& undo_log) {
    for (auto it = undo_log.rbegin(); it != undo_log.rend(); ++it) {
        const BitmapUndo& u = *it;
        auto w = words_.find(u.key);
        if (w == words_.end()) continue;
        w->second[u.bit >> 6] &= ~(1ULL << (u.bit & 63));
        // drop words this call created unless someone else wrote into them
        if (u.created && word_is_zero(w->second)) words_.erase(w);
    }
}

ClaimWord ClaimBitmap::word(uint64_t period, uint64_t word_index) const {
    auto it = words_.find(WordKey{period, word_index});
    return (it != words_.end()) ? it->second : ClaimWord{};
}

void ClaimBitmap::for_each_word(const std::function<void(const WordKey&, const ClaimWord&)>& fn) const {
    for (const auto& kv : words_) fn(kv.first, kv.second);
}

void ClaimBitmap::put_word(const WordKey& key, const ClaimWord& w) {
    words_[key] = w;
}

} // namespace merkledrop
