// config.cpp

#include "config.hpp"

#include <charconv>
#include <fstream>
#include <sstream>

namespace merkledrop {

static std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

static bool parse_size(std::string_view v, size_t& out) {
    size_t x = 0;
    auto [p, ec] = std::from_chars(v.data(), v.data() + v.size(), x);
    if (ec != std::errc() || p != v.data() + v.size()) return false;
    out = x;
    return true;
}

static bool parse_bool(std::string_view v, bool& out) {
    if (v == "true" || v == "1" || v == "yes")  { out = true;  return true; }
    if (v == "false" || v == "0" || v == "no")  { out = false; return true; }
    return false;
}

bool parse_config(std::string_view text, DistributorConfig& cfg, std::string& err) {
    DistributorConfig next = cfg;
    size_t line_no = 0;

    while (!text.empty()) {
        const size_t nl = text.find('\n');
        std::string_view line = text.substr(0, nl);
        text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);
        line_no++;

        const size_t hash = line.find('#');
        if (hash != std::string_view::npos) line = line.substr(0, hash);
        line = trim(line);
        if (line.empty()) continue;

        const size_t eq = line.find('=');
        if (eq == std::string_view::npos) {
            err = "line " + std::to_string(line_no) + ":missing_equals";
            return false;
        }
        const std::string_view key = trim(line.substr(0, eq));
        const std::string_view val = trim(line.substr(eq + 1));

        bool ok = false;
        if (key == "hash_algo")               ok = parse_hash_algo(val, next.hash_algo);
        else if (key == "max_proof_len")      ok = parse_size(val, next.max_proof_len);
        else if (key == "max_batch_entries")  ok = parse_size(val, next.max_batch_entries);
        else if (key == "parallel_proofs")    ok = parse_bool(val, next.parallel_proofs);
        else if (key == "parallel_threshold") ok = parse_size(val, next.parallel_threshold);
        else if (key == "log_level")          ok = parse_log_level(val, next.log_level);
        else {
            err = "line " + std::to_string(line_no) + ":unknown_key:" + std::string(key);
            return false;
        }
        if (!ok) {
            err = "line " + std::to_string(line_no) + ":bad_value:" + std::string(key);
            return false;
        }
    }

    cfg = next;
    err.clear();
    return true;
}

bool load_config_file(const std::string& path, DistributorConfig& cfg, std::string& err) {
    std::ifstream in(path);
    if (!in) { err = "cannot_open:" + path; return false; }
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_config(ss.str(), cfg, err);
}

} // namespace merkledrop
