// ============================================================================
// solver_config.cpp - Solver configurations and result constructors
// ============================================================================

#include "smtsym/solver_config.hpp"

namespace smtsym {

std::string SMTOption::to_smtlib() const {
    std::string out = "(set-option :" + keyword;
    for (const auto& v : values) {
        out += " " + v;
    }
    out += ")";
    return out;
}

const char* smt_lib_version_extension(SMTLibVersion v) noexcept {
    switch (v) {
        case SMTLibVersion::SMTLib2: return "smt2";
    }
    return "smt2";
}

std::string SMTLibPgm::to_string() const {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i) out += "\n";
        out += lines[i];
    }
    return out;
}

const char* solver_name(Solver s) noexcept {
    switch (s) {
        case Solver::Z3:        return "Z3";
        case Solver::Yices:     return "Yices";
        case Solver::Boolector: return "Boolector";
        case Solver::CVC4:      return "CVC4";
        case Solver::MathSAT:   return "MathSAT";
        case Solver::ABC:       return "ABC";
    }
    return "?";
}

// ── default_z3_config ───────────────────────────────────────────────────────

SMTConfig default_z3_config() {
    SolverCapabilities caps;
    caps.name                         = "z3";
    caps.supports_define_fun          = true;
    caps.supports_produce_models      = true;
    caps.supports_quantifiers         = true;
    caps.supports_uninterpreted_sorts = true;
    caps.supports_unbounded_ints      = true;
    caps.supports_reals               = true;
    caps.supports_floats              = true;
    caps.supports_doubles             = true;
    caps.supports_optimization        = true;
    caps.supports_pseudo_booleans     = true;
    caps.supports_unsat_cores         = true;
    caps.supports_proofs              = true;
    caps.supports_custom_queries      = true;

    SMTConfig cfg;
    cfg.solver.name = Solver::Z3;
    cfg.solver.executable = "z3";
    cfg.solver.options = {"-nw", "-in", "-smt2"};
    cfg.solver.capabilities = caps;
    cfg.is_non_model_var = [](const std::string&) { return false; };
    return cfg;
}

// ── SMTResult ───────────────────────────────────────────────────────────────

SMTResult SMTResult::unsatisfiable(SMTConfig cfg,
                                   std::optional<std::vector<std::string>> core) {
    SMTResult r;
    r.kind = SMTResultKind::Unsatisfiable;
    r.config = std::move(cfg);
    r.unsat_core = std::move(core);
    return r;
}

SMTResult SMTResult::satisfiable(SMTConfig cfg, SMTModel m) {
    SMTResult r;
    r.kind = SMTResultKind::Satisfiable;
    r.config = std::move(cfg);
    r.model = std::move(m);
    return r;
}

SMTResult SMTResult::sat_ext_field(SMTConfig cfg, SMTModel m) {
    SMTResult r;
    r.kind = SMTResultKind::SatExtField;
    r.config = std::move(cfg);
    r.model = std::move(m);
    return r;
}

SMTResult SMTResult::unknown(SMTConfig cfg, SMTModel m) {
    SMTResult r;
    r.kind = SMTResultKind::Unknown;
    r.config = std::move(cfg);
    r.model = std::move(m);
    return r;
}

SMTResult SMTResult::proof_error(SMTConfig cfg, std::vector<std::string> lines) {
    SMTResult r;
    r.kind = SMTResultKind::ProofError;
    r.config = std::move(cfg);
    r.errors = std::move(lines);
    return r;
}

SMTResult SMTResult::time_out(SMTConfig cfg) {
    SMTResult r;
    r.kind = SMTResultKind::TimeOut;
    r.config = std::move(cfg);
    return r;
}

const char* smt_result_kind_name(SMTResultKind k) noexcept {
    switch (k) {
        case SMTResultKind::Unsatisfiable: return "Unsatisfiable";
        case SMTResultKind::Satisfiable:   return "Satisfiable";
        case SMTResultKind::SatExtField:   return "SatExtField";
        case SMTResultKind::Unknown:       return "Unknown";
        case SMTResultKind::ProofError:    return "ProofError";
        case SMTResultKind::TimeOut:       return "TimeOut";
    }
    return "?";
}

}  // namespace smtsym
