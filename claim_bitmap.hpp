#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>

namespace merkledrop {

// 256 claim flags; bit i of the word lives in lanes[i / 64], bit i % 64.
using ClaimWord = std::array<uint64_t, 4>;

struct WordKey {
    uint64_t period{0};
    uint64_t word{0}; // index / 256

    bool operator==(const WordKey& o) const { return period == o.period && word == o.word; }
    bool operator<(const WordKey& o) const {
        return period != o.period ? period < o.period : word < o.word;
    }
};

struct WordKeyHasher {
    size_t operator()(const WordKey& k) const noexcept {
        return (size_t)(k.period * 0x9E3779B97F4A7C15ULL ^ (k.word + 0x632BE59BD9B4E019ULL));
    }
};

// One bit set by a mark; replayed in reverse to roll back. Only the bit is
// cleared, so marks committed in between by nested calls survive.
struct BitmapUndo {
    WordKey key{};
    uint8_t bit{0};        // index % 256
    bool created{false};   // word did not exist before the mark
};

class ClaimBitmap {
public:
    bool is_claimed(uint64_t period, uint64_t index) const;

    // Sets the bit. When `undo` is given and the bit was clear, logs it.
    void mark_claimed(uint64_t period, uint64_t index, std::vector<BitmapUndo>* undo = nullptr);

    void undo_from_log_reverse(const std::vector<BitmapUndo>& undo_log);

    // All-zero for untouched words.
    ClaimWord word(uint64_t period, uint64_t word_index) const;
    size_t word_count() const { return words_.size(); }
    bool empty() const { return words_.empty(); }

    void for_each_word(const std::function<void(const WordKey&, const ClaimWord&)>& fn) const;
    // Restore path only; overwrites.
    void put_word(const WordKey& key, const ClaimWord& w);

private:
    std::unordered_map<WordKey, ClaimWord, WordKeyHasher> words_;
};

} // namespace merkledrop
