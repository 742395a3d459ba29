// ============================================================================
// smtsym/cli.hpp - Command-line interface handling
// ============================================================================
//
// Parses argv into a structured Options object and provides the driver:
// run a built-in construction and print its Result, open a Z3 channel and
// perform the query handshake, or run the self-tests.
//
// ============================================================================

#ifndef SMTSYM_CLI_HPP
#define SMTSYM_CLI_HPP

#include <cstdint>
#include <string>

namespace smtsym {

// ── Options ─────────────────────────────────────────────────────────────────

struct Options {
    std::string   example;              // built-in construction to run
    std::string   mode = "proof";       // proof | sat | codegen | concrete
    std::uint64_t seed = 0;             // Concrete mode only
    bool          selftest = false;
    bool          z3_handshake = false;
    bool          verbose = false;
    bool          help = false;
    int           num_threads = 0;      // OpenMP threads for case splits (0 = default)
};

/// Parse command-line arguments.  Throws std::runtime_error on bad usage.
Options parse_args(int argc, char* argv[]);

/// Print usage information to stderr.
void print_usage(const char* program_name);

/// Main driver.  Returns the process exit code (0 = ok, 1 = errors).
int run(const Options& opts);

}  // namespace smtsym

#endif  // SMTSYM_CLI_HPP
