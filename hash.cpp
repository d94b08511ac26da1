// hash.cpp
// Byte encoding helpers and OpenSSL-backed digests.

#include "hash.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace merkledrop {

const char* hash_algo_name(HashAlgo a) {
    switch (a) {
        case HashAlgo::sha256:    return "sha256";
        case HashAlgo::sha3_256:  return "sha3-256";
        case HashAlgo::keccak256: return "keccak256";
    }
    return "unknown";
}

bool parse_hash_algo(std::string_view s, HashAlgo& out) {
    if (s == "sha256")                     { out = HashAlgo::sha256;    return true; }
    if (s == "sha3-256" || s == "sha3_256") { out = HashAlgo::sha3_256;  return true; }
    if (s == "keccak256" || s == "keccak")  { out = HashAlgo::keccak256; return true; }
    return false;
}

void append_u32_le(Bytes& b, uint32_t v) {
    b.push_back((uint8_t)(v));
    b.push_back((uint8_t)(v >> 8));
    b.push_back((uint8_t)(v >> 16));
    b.push_back((uint8_t)(v >> 24));
}
void append_u64_le(Bytes& b, uint64_t v) {
    for (int i = 0; i < 8; i++) b.push_back((uint8_t)(v >> (8 * i)));
}
void append_bytes(Bytes& b, const uint8_t* p, size_t n) { b.insert(b.end(), p, p + n); }

void append_varint(Bytes& out, uint64_t v) {
    if (v < 0xFD) out.push_back((uint8_t)v);
    else if (v <= 0xFFFF) {
        out.push_back(0xFD);
        out.push_back((uint8_t)(v));
        out.push_back((uint8_t)(v >> 8));
    } else if (v <= 0xFFFFFFFFULL) {
        out.push_back(0xFE);
        append_u32_le(out, (uint32_t)v);
    } else {
        out.push_back(0xFF);
        append_u64_le(out, v);
    }
}

void append_u256_be(Bytes& b, Amount v) {
    // upper 16 bytes are always zero for a 128-bit amount
    b.insert(b.end(), 16, 0x00);
    for (int i = 15; i >= 0; i--) b.push_back((uint8_t)(v >> (8 * i)));
}

bool read_u32_le(const Bytes& b, size_t& pos, uint32_t& v) {
    if (pos > b.size() || b.size() - pos < 4) return false;
    v = 0;
    for (int i = 0; i < 4; i++) v |= (uint32_t)b[pos + i] << (8 * i);
    pos += 4;
    return true;
}
bool read_u64_le(const Bytes& b, size_t& pos, uint64_t& v) {
    if (pos > b.size() || b.size() - pos < 8) return false;
    v = 0;
    for (int i = 0; i < 8; i++) v |= (uint64_t)b[pos + i] << (8 * i);
    pos += 8;
    return true;
}
bool read_varint(const Bytes& b, size_t& pos, uint64_t& v) {
    if (pos >= b.size()) return false;
    const uint8_t tag = b[pos++];
    if (tag < 0xFD) { v = tag; return true; }
    if (tag == 0xFD) {
        if (b.size() - pos < 2) return false;
        v = (uint64_t)b[pos] | ((uint64_t)b[pos + 1] << 8);
        pos += 2;
        return true;
    }
    if (tag == 0xFE) {
        uint32_t x = 0;
        if (!read_u32_le(b, pos, x)) return false;
        v = x;
        return true;
    }
    return read_u64_le(b, pos, v);
}

// ============================================================
// Hasher
// ============================================================
namespace {

struct MdFree {
    void operator()(EVP_MD* md) const { EVP_MD_free(md); }
};

std::shared_ptr<EVP_MD> fetch_md(const char* name) {
    EVP_MD* md = EVP_MD_fetch(nullptr, name, nullptr);
    if (!md) throw std::runtime_error(std::string("unsupported_hash: ") + name);
    return std::shared_ptr<EVP_MD>(md, MdFree{});
}

} // namespace

Hasher::Hasher(HashAlgo algo) : algo_(algo) {
    switch (algo) {
        case HashAlgo::sha256:    break;
        case HashAlgo::sha3_256:  md_ = fetch_md("SHA3-256"); break;
        case HashAlgo::keccak256: md_ = fetch_md("KECCAK-256"); break;
        default: throw std::runtime_error("unsupported_hash");
    }
}

Hash32 Hasher::digest(const uint8_t* p, size_t n) const {
    Hash32 out{};
    if (!md_) {
        SHA256(p, n, out.data());
        return out;
    }
    unsigned int len = 0;
    if (EVP_Digest(p, n, out.data(), &len, md_.get(), nullptr) != 1 || len != 32)
        throw std::runtime_error("EVP_Digest failed");
    return out;
}

Hash32 Hasher::concat(const Hash32& a, const Hash32& b) const {
    uint8_t buf[64];
    std::memcpy(buf, a.data(), 32);
    std::memcpy(buf + 32, b.data(), 32);
    return digest(buf, sizeof(buf));
}

// ============================================================
// Hash32 / hex helpers
// ============================================================
bool hash32_eq(const Hash32& a, const Hash32& b) {
    return std::memcmp(a.data(), b.data(), 32) == 0;
}
bool hash32_is_zero(const Hash32& h) {
    return std::all_of(h.begin(), h.end(), [](uint8_t x) { return x == 0; });
}
bool hash32_le(const Hash32& a, const Hash32& b) {
    return std::memcmp(a.data(), b.data(), 32) <= 0;
}

std::string hex_of(const uint8_t* p, size_t n) {
    static const char* d = "0123456789abcdef";
    std::string s; s.resize(2 * n);
    for (size_t i = 0; i < n; i++) {
        s[2*i+0] = d[(p[i] >> 4) & 0xF];
        s[2*i+1] = d[(p[i] >> 0) & 0xF];
    }
    return s;
}

static int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool bytes_from_hex(std::string_view s, uint8_t* out, size_t n) {
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) s.remove_prefix(2);
    if (s.size() != 2 * n) return false;
    for (size_t i = 0; i < n; i++) {
        const int hi = hex_nibble(s[2*i]);
        const int lo = hex_nibble(s[2*i+1]);
        if (hi < 0 || lo < 0) return false;
        out[i] = (uint8_t)((hi << 4) | lo);
    }
    return true;
}

bool hash32_from_hex(std::string_view s, Hash32& out) {
    Hash32 tmp{};
    if (!bytes_from_hex(s, tmp.data(), tmp.size())) return false;
    out = tmp;
    return true;
}
bool address_from_hex(std::string_view s, Address& out) {
    Address tmp{};
    if (!bytes_from_hex(s, tmp.data(), tmp.size())) return false;
    out = tmp;
    return true;
}

// ============================================================
// Amounts
// ============================================================
bool add_amount_checked(Amount& acc, Amount x) {
    if (~(Amount)0 - acc < x) return false;
    acc += x;
    return true;
}

std::string amount_to_string(Amount v) {
    if (v == 0) return "0";
    std::string s;
    while (v > 0) {
        s.push_back((char)('0' + (int)(v % 10)));
        v /= 10;
    }
    std::reverse(s.begin(), s.end());
    return s;
}

bool amount_from_string(std::string_view s, Amount& out) {
    if (s.empty()) return false;
    Amount v = 0;
    const Amount max = ~(Amount)0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        const unsigned d = (unsigned)(c - '0');
        if (v > (max - d) / 10) return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

} // namespace merkledrop
