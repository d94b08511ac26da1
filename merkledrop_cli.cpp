// merkledrop_cli.cpp
// Harness around the distributor:
//   - build:  entitlement CSV -> root + per-entry proofs
//   - verify: check one claim against a root
//   - demo:   seed an in-memory store, claim, double-claim, batch
//
// No chain, no network. The ledger is InMemoryLedger.

#include "config.hpp"
#include "distributor.hpp"
#include "errors.hpp"
#include "ledger.hpp"
#include "log.hpp"
#include "merkle_proof.hpp"
#include "merkle_tree.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace merkledrop;

static void usage() {
    std::cerr <<
        "usage: merkledrop_cli [--config FILE] [--hash sha256|sha3-256|keccak256] <command>\n"
        "  build  <entitlements.csv>        lines: index,account_hex,balance\n"
        "  verify <root> <index> <account> <balance> [sibling...]\n"
        "  demo\n";
}

static bool parse_u64(const std::string& s, uint64_t& out) {
    Amount a = 0;
    if (!amount_from_string(s, a) || a > UINT64_MAX) return false;
    out = (uint64_t)a;
    return true;
}

static bool parse_entitlement_line(const std::string& line, Entitlement& e, std::string& err) {
    std::vector<std::string> cols;
    std::stringstream ss(line);
    std::string col;
    while (std::getline(ss, col, ',')) cols.push_back(col);
    if (cols.size() != 3) { err = "expected_3_columns"; return false; }
    if (!parse_u64(cols[0], e.index)) { err = "bad_index"; return false; }
    if (!address_from_hex(cols[1], e.account)) { err = "bad_account"; return false; }
    if (!amount_from_string(cols[2], e.balance)) { err = "bad_balance"; return false; }
    return true;
}

static int cmd_build(const DistributorConfig& cfg, const std::string& path) {
    std::ifstream in(path);
    if (!in) { std::cerr << "cannot open " << path << "\n"; return EXIT_FAILURE; }

    std::vector<Entitlement> entries;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        Entitlement e;
        std::string err;
        if (!parse_entitlement_line(line, e, err)) {
            std::cerr << path << ":" << line_no << ": " << err << "\n";
            return EXIT_FAILURE;
        }
        entries.push_back(e);
    }
    if (entries.empty()) { std::cerr << "no entitlements\n"; return EXIT_FAILURE; }

    const Hasher h(cfg.hash_algo);
    const MerkleTree tree = MerkleTree::from_entitlements(h, entries);
    Amount total = 0;
    for (const auto& e : entries) {
        if (!add_amount_checked(total, e.balance)) { std::cerr << "total overflows\n"; return EXIT_FAILURE; }
    }

    std::cout << "hash " << hash_algo_name(cfg.hash_algo) << "\n";
    std::cout << "root 0x" << hex_of(tree.root()) << "\n";
    std::cout << "total " << amount_to_string(total) << "\n";
    for (size_t i = 0; i < entries.size(); i++) {
        const Entitlement& e = entries[i];
        std::cout << e.index << " 0x" << hex_of(e.account) << " " << amount_to_string(e.balance);
        for (const auto& s : tree.proof(i)) std::cout << " 0x" << hex_of(s);
        std::cout << "\n";
    }
    return EXIT_SUCCESS;
}

static int cmd_verify(const DistributorConfig& cfg, const std::vector<std::string>& args) {
    if (args.size() < 4) { usage(); return EXIT_FAILURE; }
    Hash32 root{};
    uint64_t index = 0;
    Address account{};
    Amount balance = 0;
    if (!hash32_from_hex(args[0], root))       { std::cerr << "bad root\n"; return EXIT_FAILURE; }
    if (!parse_u64(args[1], index))            { std::cerr << "bad index\n"; return EXIT_FAILURE; }
    if (!address_from_hex(args[2], account))   { std::cerr << "bad account\n"; return EXIT_FAILURE; }
    if (!amount_from_string(args[3], balance)) { std::cerr << "bad balance\n"; return EXIT_FAILURE; }

    MerkleProof proof;
    for (size_t i = 4; i < args.size(); i++) {
        Hash32 s{};
        if (!hash32_from_hex(args[i], s)) { std::cerr << "bad sibling " << args[i] << "\n"; return EXIT_FAILURE; }
        proof.push_back(s);
    }

    const Hasher h(cfg.hash_algo);
    const bool ok = merkle_verify(h, proof, root, leaf_hash(h, index, account, balance));
    std::cout << (ok ? "valid" : "invalid") << "\n";
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}

static Address demo_address(uint8_t tag) {
    Address a{};
    a.fill(tag);
    return a;
}

static int cmd_demo(DistributorConfig cfg) {
    if (cfg.log_level < LogLevel::info) cfg.log_level = LogLevel::info;

    const Address custody = demo_address(0xC0);
    const Address admin   = demo_address(0xAD);
    const Address alice   = demo_address(0xA1);
    const Address bob     = demo_address(0xB0);

    InMemoryLedger ledger(custody);
    if (!ledger.mint(admin, 1'000'000)) { std::cerr << "mint failed\n"; return EXIT_FAILURE; }
    ledger.approve(admin, custody, 1'000'000);

    Distributor dist(custody, admin, ledger, cfg);
    const Hasher& h = dist.hasher();

    const uint64_t week = 42;
    const std::vector<Entitlement> entries = {
        {0, alice, 1500}, {1, bob, 2500}, {2, alice, 700},
    };
    const MerkleTree tree = MerkleTree::from_entitlements(h, entries);

    std::string err;
    if (!dist.seed(admin, week, tree.root(), 4700, admin, err)) {
        std::cerr << "seed failed: " << err << "\n";
        return EXIT_FAILURE;
    }

    if (!dist.claim(1, bob, week, 2500, tree.proof(1), err)) {
        std::cerr << "bob claim failed: " << err << "\n";
        return EXIT_FAILURE;
    }
    if (dist.claim(1, bob, week, 2500, tree.proof(1), err) || error_code(err) != errc::already_claimed) {
        std::cerr << "double claim was not rejected\n";
        return EXIT_FAILURE;
    }
    std::cout << "double claim rejected: " << err << "\n";

    const std::vector<BatchClaim> batch = {
        {0, week, 1500, tree.proof(0)},
        {2, week, 700, tree.proof(2)},
    };
    if (!dist.claim_batch(alice, batch, err)) {
        std::cerr << "alice batch failed: " << err << "\n";
        return EXIT_FAILURE;
    }

    std::vector<bool> status;
    if (!dist.claim_status({0, 3}, week, week + 1, status, err)) {
        std::cerr << "claim_status failed: " << err << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "alice " << amount_to_string(ledger.balance_of(alice))
              << " bob " << amount_to_string(ledger.balance_of(bob))
              << " custody " << amount_to_string(ledger.balance_of(custody)) << "\n";
    std::cout << "week " << week << " index 0: " << (status[0] ? "claimed" : "unclaimed")
              << ", week " << week + 1 << " index 3: " << (status[1] ? "claimed" : "unclaimed") << "\n";
    std::cout << "events " << dist.claim_events().size() << "\n";
    return EXIT_SUCCESS;
}

int main(int argc, char** argv) {
    DistributorConfig cfg;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        const std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            std::string err;
            if (!load_config_file(argv[++i], cfg, err)) {
                std::cerr << "config: " << err << "\n";
                return EXIT_FAILURE;
            }
        } else if (a == "--hash" && i + 1 < argc) {
            if (!parse_hash_algo(argv[++i], cfg.hash_algo)) {
                std::cerr << "unknown hash " << argv[i] << "\n";
                return EXIT_FAILURE;
            }
        } else if (a == "-h" || a == "--help") {
            usage();
            return EXIT_SUCCESS;
        } else {
            args.push_back(a);
        }
    }
    if (args.empty()) { usage(); return EXIT_FAILURE; }
    set_log_level(cfg.log_level);

    try {
        const std::string cmd = args[0];
        args.erase(args.begin());
        if (cmd == "build" && args.size() == 1) return cmd_build(cfg, args[0]);
        if (cmd == "verify") return cmd_verify(cfg, args);
        if (cmd == "demo") return cmd_demo(cfg);
    } catch (const std::exception& e) {
        log_line(LogLevel::error, e.what());
        return EXIT_FAILURE;
    }
    usage();
    return EXIT_FAILURE;
}
