#pragma once

#include "hash.hpp"
#include "log.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace merkledrop {

// ============================================================
// Distribution parameters
// ============================================================
namespace params {
    constexpr size_t MAX_PROOF_LEN          = 64;    // 2^64 leaves is already absurd
    constexpr size_t MAX_BATCH_ENTRIES      = 1024;
    constexpr size_t PARALLEL_THRESHOLD     = 16;
    constexpr uint64_t MAX_QUERY_RANGE      = 1u << 16; // periods per merkle_roots call

    constexpr uint32_t INDICES_PER_WORD     = 256;
    constexpr uint32_t SNAPSHOT_VERSION     = 1;
}

struct DistributorConfig {
    HashAlgo hash_algo{HashAlgo::sha256};
    size_t   max_proof_len{params::MAX_PROOF_LEN};
    size_t   max_batch_entries{params::MAX_BATCH_ENTRIES};
    bool     parallel_proofs{false};
    size_t   parallel_threshold{params::PARALLEL_THRESHOLD};
    LogLevel log_level{LogLevel::warn};
};

// key = value lines, '#' comments. Unknown keys are errors.
//   hash_algo = keccak256
//   max_proof_len = 32
//   parallel_proofs = true
bool parse_config(std::string_view text, DistributorConfig& cfg, std::string& err);
bool load_config_file(const std::string& path, DistributorConfig& cfg, std::string& err);

} // namespace merkledrop
