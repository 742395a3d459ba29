// ============================================================================
// cli.cpp - Command-line interface and main driver
// ============================================================================

#include "smtsym/cli.hpp"
#include "smtsym/case_split.hpp"
#include "smtsym/examples.hpp"
#include "smtsym/query.hpp"
#include "smtsym/result.hpp"
#include "smtsym/test.hpp"
#include "smtsym/utils.hpp"
#include "smtsym/z3_channel.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace smtsym {

// ── parse_args ──────────────────────────────────────────────────────────────

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--selftest") {
            opts.selftest = true;
        } else if (arg == "--z3-handshake") {
            opts.z3_handshake = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--example") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--example requires a name argument");
            }
            opts.example = argv[++i];
        } else if (arg == "--mode") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--mode requires an argument");
            }
            opts.mode = to_lower(argv[++i]);
            if (opts.mode != "proof" && opts.mode != "sat"
                && opts.mode != "codegen" && opts.mode != "concrete") {
                throw std::runtime_error("unknown mode: " + opts.mode);
            }
        } else if (arg == "--seed") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--seed requires a number argument");
            }
            opts.seed = std::stoull(argv[++i]);
        } else if (arg == "--threads" || arg == "-j") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--threads requires a number argument");
            }
            opts.num_threads = std::stoi(argv[++i]);
            if (opts.num_threads < 0) {
                throw std::runtime_error("--threads must be >= 0");
            }
        } else {
            throw std::runtime_error("unknown option: " + arg);
        }
    }

    if (!opts.selftest && !opts.help && !opts.z3_handshake && opts.example.empty()) {
        throw std::runtime_error("nothing to do (use --help for usage)");
    }

    return opts;
}

// ── print_usage ─────────────────────────────────────────────────────────────

void print_usage(const char* program_name) {
    std::cerr
        << "Usage: " << program_name << " --example NAME [--mode M] [--seed N]\n"
        << "       " << program_name << " --z3-handshake [--verbose]\n"
        << "       " << program_name << " --selftest\n"
        << "\n"
        << "Symbolic construction engine for SMT verification.\n"
        << "\n"
        << "Options:\n"
        << "  --example NAME     Run a built-in construction and print its result\n"
        << "                     (" << join(example_names(), ", ") << ")\n"
        << "  --mode M           proof (default), sat, codegen or concrete\n"
        << "  --seed N           Random seed for concrete mode (default 0)\n"
        << "  --threads N, -j N  OpenMP threads for case-split branches (0 = auto)\n"
        << "  --z3-handshake     Open an embedded Z3 channel and run the query handshake\n"
        << "  --verbose          Echo solver traffic to stderr\n"
        << "  --selftest         Run built-in tests\n"
        << "  --help, -h         Show this message\n";
}

// ── run ─────────────────────────────────────────────────────────────────────

static RunMode mode_from_options(const Options& opts) {
    SMTConfig cfg = default_z3_config();
    cfg.verbose = opts.verbose;
    if (opts.mode == "sat")      return RunMode::proof(true, cfg);
    if (opts.mode == "codegen")  return RunMode::codegen();
    if (opts.mode == "concrete") return RunMode::concrete(opts.seed);
    return RunMode::proof(false, cfg);
}

static int run_example(const Options& opts) {
    auto st = new_symbolic_state(mode_from_options(opts));
    build_example(opts.example, *st);
    Result res = extract_symbolic_simulation_state(*st);

    std::cout << "-- " << opts.example << " [" << st->run_mode().to_string() << "]\n"
              << res.to_string() << "\n";

    const auto jobs = collect_case_splits(res.tactics);
    if (!jobs.empty()) {
        CaseSplitOptions cso;
        cso.num_threads = opts.num_threads;
        for (const auto& t : res.tactics) {
            if (is_parallel_case_anywhere(t)) cso.parallel = opts.num_threads != 1;
        }
        cso.aggregate = [](std::vector<CaseSplitOutcome> outcomes) {
            std::vector<SMTResult> all;
            for (auto& o : outcomes) {
                std::cout << "   branch " << o.name << ":";
                for (auto& r : o.results) {
                    std::cout << " " << smt_result_kind_name(r.kind);
                    all.push_back(std::move(r));
                }
                std::cout << "\n";
            }
            return all;
        };
        // There is no back end here: every branch is reported as unknown.
        const SMTConfig cfg = default_z3_config();
        const auto results = dispatch_case_splits(res, jobs,
            [&cfg](const Result&, const CaseSplitJob&) {
                return std::vector<SMTResult>{SMTResult::unknown(cfg, SMTModel{})};
            }, cso);
        std::cout << "   " << results.size() << " branch results\n";
    }
    return 0;
}

static int run_z3_handshake(const Options& opts) {
    SMTConfig cfg = default_z3_config();
    cfg.verbose = opts.verbose;

    auto st = new_symbolic_state(RunMode::proof(true, cfg));
    Z3Channel z3;
    QueryState qs = begin_interactive_session(*st, z3.ask_function(), cfg);

    std::string reply;
    run_query([&reply](QueryState& q) {
        reply = trim(q.send("(check-sat)"));
        return q.default_result(true);
    }, qs);

    std::cout << "handshake: ok\n"
              << "check-sat: " << reply << "\n"
              << "commands sent: " << z3.commands_sent() << "\n";
    return 0;
}

int run(const Options& opts) {
    if (opts.selftest) {
        return run_selftests();
    }
    if (opts.z3_handshake) {
        return run_z3_handshake(opts);
    }
    return run_example(opts);
}

}  // namespace smtsym
