#pragma once

#include <string>
#include <string_view>

namespace merkledrop {

// Error codes written to the `std::string& err` out-parameter.
namespace errc {
    constexpr const char* already_claimed  = "already_claimed";
    constexpr const char* invalid_proof    = "invalid_proof";
    constexpr const char* root_already_set = "root_already_set";
    constexpr const char* length_mismatch  = "length_mismatch";
    constexpr const char* transfer_failed  = "transfer_failed";

    constexpr const char* not_owner        = "not_owner";
    constexpr const char* not_nominated    = "not_nominated";
    constexpr const char* zero_root        = "zero_root";
    constexpr const char* proof_too_long   = "proof_too_long";
    constexpr const char* batch_too_large  = "batch_too_large";
    constexpr const char* amount_overflow  = "amount_overflow";
    constexpr const char* bad_range        = "bad_range";
    constexpr const char* bad_snapshot     = "bad_snapshot";
    constexpr const char* store_not_empty  = "store_not_empty";
}

// "entry[3]:invalid_proof" -> "invalid_proof"
inline std::string_view error_code(const std::string& err) {
    const auto p = err.rfind(':');
    if (p == std::string::npos) return err;
    return std::string_view(err).substr(p + 1);
}

} // namespace merkledrop
