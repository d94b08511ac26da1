// snapshot.cpp
// Distributor state blob:
//   "MDRP" | u32 version | u8 hash_algo
//   varint n_roots | n * (u64 period | 32B root)
//   varint n_words | n * (u64 period | u64 word | 4 * u64 lane)
// Integers little-endian, entries sorted by key.

#include "distributor.hpp"

#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace merkledrop {

static const uint8_t kMagic[4] = {'M', 'D', 'R', 'P'};

Bytes Distributor::snapshot() const {
    std::lock_guard<std::recursive_mutex> lk(mu_);

    std::map<uint64_t, Hash32> roots;
    registry_.for_each([&](uint64_t p, const Hash32& r) { roots.emplace(p, r); });

    std::map<WordKey, ClaimWord> words;
    bitmap_.for_each_word([&](const WordKey& k, const ClaimWord& w) {
        if ((w[0] | w[1] | w[2] | w[3]) != 0) words.emplace(k, w);
    });

    Bytes out;
    append_bytes(out, kMagic, sizeof(kMagic));
    append_u32_le(out, params::SNAPSHOT_VERSION);
    out.push_back((uint8_t)cfg_.hash_algo);

    append_varint(out, roots.size());
    for (const auto& kv : roots) {
        append_u64_le(out, kv.first);
        append_bytes(out, kv.second.data(), kv.second.size());
    }
    append_varint(out, words.size());
    for (const auto& kv : words) {
        append_u64_le(out, kv.first.period);
        append_u64_le(out, kv.first.word);
        for (uint64_t lane : kv.second) append_u64_le(out, lane);
    }
    return out;
}

bool Distributor::restore(const Bytes& blob, std::string& err) {
    std::lock_guard<std::recursive_mutex> lk(mu_);

    if (!registry_.empty() || !bitmap_.empty()) { err = errc::store_not_empty; return false; }

    size_t pos = 0;
    // "<where>:bad_snapshot", code last for error_code()
    auto bad = [&](const char* where) {
        err = std::string(where) + ":" + errc::bad_snapshot;
        return false;
    };

    if (blob.size() < sizeof(kMagic) || !std::equal(kMagic, kMagic + 4, blob.begin())) return bad("magic");
    pos = sizeof(kMagic);

    uint32_t version = 0;
    if (!read_u32_le(blob, pos, version) || version != params::SNAPSHOT_VERSION) return bad("version");
    if (pos >= blob.size() || blob[pos] != (uint8_t)cfg_.hash_algo) return bad("hash_algo");
    pos++;

    uint64_t n_roots = 0;
    if (!read_varint(blob, pos, n_roots) || n_roots > (blob.size() - pos) / 40) return bad("root_count");

    RootRegistry roots;
    for (uint64_t i = 0; i < n_roots; i++) {
        uint64_t period = 0;
        Hash32 root{};
        if (!read_u64_le(blob, pos, period) || blob.size() - pos < 32) return bad("root_entry");
        std::copy(blob.begin() + pos, blob.begin() + pos + 32, root.begin());
        pos += 32;
        std::string e;
        if (!roots.insert(period, root, e)) return bad("root_entry");
    }

    uint64_t n_words = 0;
    if (!read_varint(blob, pos, n_words) || n_words > (blob.size() - pos) / 48) return bad("word_count");

    ClaimBitmap bitmap;
    for (uint64_t i = 0; i < n_words; i++) {
        WordKey k{};
        ClaimWord w{};
        if (!read_u64_le(blob, pos, k.period) || !read_u64_le(blob, pos, k.word)) return bad("word_entry");
        for (auto& lane : w) {
            if (!read_u64_le(blob, pos, lane)) return bad("word_entry");
        }
        // writer emits each non-empty word once
        if ((w[0] | w[1] | w[2] | w[3]) == 0) return bad("word_entry");
        const ClaimWord prev = bitmap.word(k.period, k.word);
        if ((prev[0] | prev[1] | prev[2] | prev[3]) != 0) return bad("word_entry");
        bitmap.put_word(k, w);
    }
    if (pos != blob.size()) return bad("trailing_bytes");

    registry_ = std::move(roots);
    bitmap_ = std::move(bitmap);
    log_line(LogLevel::info, "restored roots=", registry_.size(), " words=", bitmap_.word_count());
    err.clear();
    return true;
}

} // namespace merkledrop
