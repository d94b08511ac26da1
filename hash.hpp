#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct evp_md_st;

namespace merkledrop {

// ============================================================
// Bytes / Hashing
// ============================================================
using Bytes   = std::vector<uint8_t>;
using Hash32  = std::array<uint8_t, 32>;
using Address = std::array<uint8_t, 20>;

// Token amounts. Encoded as uint256 on the wire; 128 bits of range in memory.
using Amount = unsigned __int128;

enum class HashAlgo : uint8_t {
    sha256    = 0,
    sha3_256  = 1,
    keccak256 = 2, // EVM tree builders; needs OpenSSL >= 3.2
};

const char* hash_algo_name(HashAlgo a);
bool parse_hash_algo(std::string_view s, HashAlgo& out);

void append_u32_le(Bytes& b, uint32_t v);
void append_u64_le(Bytes& b, uint64_t v);
void append_varint(Bytes& out, uint64_t v);
void append_bytes(Bytes& b, const uint8_t* p, size_t n);
// 32-byte big-endian, the ABI encoding of a uint256.
void append_u256_be(Bytes& b, Amount v);

bool read_u32_le(const Bytes& b, size_t& pos, uint32_t& v);
bool read_u64_le(const Bytes& b, size_t& pos, uint64_t& v);
bool read_varint(const Bytes& b, size_t& pos, uint64_t& v);

// Digest engine for one algorithm. Cheap to copy.
class Hasher {
public:
    explicit Hasher(HashAlgo algo = HashAlgo::sha256);

    HashAlgo algo() const { return algo_; }

    Hash32 digest(const uint8_t* p, size_t n) const;
    Hash32 digest(const Bytes& b) const { return digest(b.data(), b.size()); }

    // H(a || b), order as given.
    Hash32 concat(const Hash32& a, const Hash32& b) const;

private:
    HashAlgo algo_;
    std::shared_ptr<evp_md_st> md_; // null for sha256
};

bool hash32_eq(const Hash32& a, const Hash32& b);
bool hash32_is_zero(const Hash32& h);
// Big-endian integer compare.
bool hash32_le(const Hash32& a, const Hash32& b);

std::string hex_of(const uint8_t* p, size_t n);
inline std::string hex_of(const Hash32& h) { return hex_of(h.data(), h.size()); }
inline std::string hex_of(const Address& a) { return hex_of(a.data(), a.size()); }

// Optional 0x prefix; exact length required.
bool hash32_from_hex(std::string_view s, Hash32& out);
bool address_from_hex(std::string_view s, Address& out);

bool add_amount_checked(Amount& acc, Amount x);
std::string amount_to_string(Amount v);
bool amount_from_string(std::string_view s, Amount& out);

} // namespace merkledrop
