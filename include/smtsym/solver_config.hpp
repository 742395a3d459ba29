// ============================================================================
// smtsym/solver_config.hpp - Solver configuration and outcome taxonomy
// ============================================================================
//
// The engine itself only looks at a few capability flags (for legality
// checks); everything else in SMTConfig is carried through untouched for
// the back end that emits scripts and talks to the solver.
//
// ============================================================================

#ifndef SMTSYM_SOLVER_CONFIG_HPP
#define SMTSYM_SOLVER_CONFIG_HPP

#include "smtsym/concrete.hpp"
#include "smtsym/node.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace smtsym {

struct QueryState;
struct SMTResult;

/// A user-guided interaction with the solver, run after the handshake.
using Query = std::function<std::vector<SMTResult>(QueryState&)>;

// ── SMTOption ───────────────────────────────────────────────────────────────

struct SMTOption {
    std::string              keyword;   // without the leading ':'
    std::vector<std::string> values;

    static SMTOption produce_models(bool b) {
        return SMTOption{"produce-models", {b ? "true" : "false"}};
    }
    static SMTOption produce_unsat_cores(bool b) {
        return SMTOption{"produce-unsat-cores", {b ? "true" : "false"}};
    }
    static SMTOption random_seed(int seed) {
        return SMTOption{"random-seed", {std::to_string(seed)}};
    }

    /// "(set-option :keyword v1 v2 ...)"
    std::string to_smtlib() const;
};

// ── SMTLibVersion ───────────────────────────────────────────────────────────

enum class SMTLibVersion : std::uint8_t { SMTLib2 };

/// File extension for scripts of the given version ("smt2").
const char* smt_lib_version_extension(SMTLibVersion v) noexcept;

/// An SMT-Lib program as emitted by the back end, one string per line.
struct SMTLibPgm {
    SMTLibVersion            version = SMTLibVersion::SMTLib2;
    std::vector<std::string> lines;

    std::string to_string() const;
};

// ── SolverCapabilities ──────────────────────────────────────────────────────

struct SolverCapabilities {
    std::string name;
    bool supports_define_fun          = false;
    bool supports_produce_models      = false;
    bool supports_quantifiers         = false;
    bool supports_uninterpreted_sorts = false;
    bool supports_unbounded_ints      = false;
    bool supports_reals               = false;
    bool supports_floats              = false;
    bool supports_doubles             = false;
    bool supports_optimization        = false;
    bool supports_pseudo_booleans     = false;
    bool supports_unsat_cores         = false;
    bool supports_proofs              = false;
    bool supports_custom_queries      = false;
};

// ── Solver / SMTSolver ──────────────────────────────────────────────────────

enum class Solver : std::uint8_t { Z3, Yices, Boolector, CVC4, MathSAT, ABC };

const char* solver_name(Solver s) noexcept;

struct SMTSolver {
    Solver                   name = Solver::Z3;
    std::string              executable;
    std::vector<std::string> options;
    SolverCapabilities       capabilities;
};

// ── Timing ──────────────────────────────────────────────────────────────────

enum class Timing : std::uint8_t { NoTiming, PrintTiming };

// ── SMTConfig ───────────────────────────────────────────────────────────────

struct SMTConfig {
    bool                       verbose = false;
    Timing                     timing = Timing::NoTiming;
    std::optional<int>         sbranch_timeout;   // seconds
    std::optional<int>         timeout;           // seconds
    int                        print_base = 10;
    int                        print_real_prec = 16;
    std::vector<std::string>   solver_tweaks;
    std::vector<std::string>   optimize_args;
    std::string                sat_cmd = "(check-sat)";
    std::optional<std::string> smt_file;
    SMTLibVersion              smt_lib_version = SMTLibVersion::SMTLib2;
    SMTSolver                  solver;
    RoundingMode               rounding_mode = RoundingMode::RoundNearestTiesToEven;
    std::vector<SMTOption>     solver_set_options;
    std::optional<Query>       custom_query;

    // Variables whose names satisfy this predicate are left out of models.
    std::function<bool(const std::string&)> is_non_model_var;

    std::string to_string() const { return solver_name(solver.name); }
};

/// Configuration for Z3, with its capabilities filled in.
SMTConfig default_z3_config();

// ── SMTModel ────────────────────────────────────────────────────────────────

struct SMTModel {
    std::vector<std::pair<std::string, std::string>> objectives;   // name -> value text
    std::vector<std::pair<std::string, CW>>          assocs;
};

// ── SMTResult ───────────────────────────────────────────────────────────────

enum class SMTResultKind : std::uint8_t {
    Unsatisfiable,   // optional unsat core
    Satisfiable,     // model
    SatExtField,     // model in an extension field (infinities/epsilons)
    Unknown,         // best-effort model
    ProofError,      // diagnostic lines
    TimeOut
};

struct SMTResult {
    SMTResultKind                           kind = SMTResultKind::Unknown;
    SMTConfig                               config;
    std::optional<std::vector<std::string>> unsat_core;
    SMTModel                                model;
    std::vector<std::string>                errors;

    static SMTResult unsatisfiable(SMTConfig cfg,
                                   std::optional<std::vector<std::string>> core = std::nullopt);
    static SMTResult satisfiable(SMTConfig cfg, SMTModel m);
    static SMTResult sat_ext_field(SMTConfig cfg, SMTModel m);
    static SMTResult unknown(SMTConfig cfg, SMTModel m);
    static SMTResult proof_error(SMTConfig cfg, std::vector<std::string> lines);
    static SMTResult time_out(SMTConfig cfg);
};

const char* smt_result_kind_name(SMTResultKind k) noexcept;

}  // namespace smtsym

#endif  // SMTSYM_SOLVER_CONFIG_HPP
