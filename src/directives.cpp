// ============================================================================
// directives.cpp - Constraint, assertion, tactic and objective registration
// ============================================================================

#include "smtsym/directives.hpp"
#include "smtsym/errors.hpp"

#include <sstream>

namespace smtsym {

// ── Tactics ─────────────────────────────────────────────────────────────────

static Tactic<SW> resolve_tactic(State& st, const Tactic<SVal>& t) {
    Tactic<SW> r;
    r.kind    = t.kind;
    r.flag    = t.flag;
    r.seconds = t.seconds;
    r.text    = t.text;
    r.solver  = t.solver;
    r.options = t.options;
    r.style   = t.style;
    r.query   = t.query;

    if (t.kind == TacticKind::CaseSplit) {
        r.branches.reserve(t.branches.size());
        for (const auto& b : t.branches) {
            CaseSplitBranch<SW> rb;
            rb.name = b.name;
            for (const auto& sub : b.tactics) {
                rb.tactics.push_back(resolve_tactic(st, sub));
            }
            rb.condition = sv_to_sw(st, b.condition);
            r.branches.push_back(std::move(rb));
        }
    }
    return r;
}

void add_sval_tactic(State& st, const Tactic<SVal>& t) {
    st.add_tactic(resolve_tactic(st, t));
}

// ── Objectives ──────────────────────────────────────────────────────────────

void add_sval_opt_goal(State& st, const Objective<SVal>& obj) {
    if (is_codegen_mode(st)) {
        throw ModeViolation("optimization goal \"" + obj.name
                            + "\" is not allowed in code-generation mode");
    }
    const auto& cfg = st.run_mode().config;
    if (cfg && !cfg->solver.capabilities.supports_optimization) {
        throw ValidationError("optimization goal \"" + obj.name + "\": solver "
                              + cfg->to_string() + " does not support optimization");
    }

    SW orig = sv_to_sw(st, obj.value);
    SVal track = sv_mk_sym_var(st, Quantifier::EX, obj.value.kind, obj.name);
    SW track_sw = sv_to_sw(st, track);

    ResolvedObjective g;
    g.kind = obj.kind;
    g.name = obj.name;
    g.value = {orig, track_sw};
    g.penalty = obj.penalty;
    st.add_goal(std::move(g));
}

// ── Constraints ─────────────────────────────────────────────────────────────

void impose_constraint(State& st, const std::optional<std::string>& name, const SVal& c) {
    if (is_codegen_mode(st)) {
        throw ModeViolation("constraints are not allowed in code-generation");
    }
    if (!c.kind.is_boolean()) {
        throw ValidationError("constraint " + name.value_or("<unnamed>")
                              + " must be of kind SBool, received " + c.kind.to_string());
    }
    if (name) st.register_label(*name);
    st.internal_constraint(name, c);
}

void add_sval_constraint(State& st, const std::optional<std::string>& name,
                         std::optional<double> probability,
                         const SVal& c, const SVal& alt) {
    if (!probability) {
        impose_constraint(st, name, c);
        return;
    }

    const double t = *probability;
    if (!(t >= 0.0 && t <= 1.0)) {
        std::ostringstream oss;
        oss << "pConstrain: invalid probability threshold: " << t << ", must be in [0, 1].";
        throw ValidationError(oss.str());
    }
    if (!is_concrete_mode(st)) {
        throw ModeViolation("pConstrain only allowed in concrete evaluation contexts, not in "
                            + st.run_mode().to_string() + " mode.");
    }

    if (t > 0.0 && t < 1.0) {
        const double d = st.throw_dice();
        impose_constraint(st, name, d <= t ? c : alt);
    } else if (t > 0.0) {
        impose_constraint(st, name, c);
    } else {
        impose_constraint(st, name, alt);
    }
}

// ── Assertions ──────────────────────────────────────────────────────────────

void add_sval_assertion(State& st, const std::optional<SourceLocation>& loc,
                        const std::string& label, const SVal& cond) {
    if (is_codegen_mode(st)) {
        throw ModeViolation("assertion \"" + label + "\" is not allowed in code-generation");
    }
    if (!cond.kind.is_boolean()) {
        throw ValidationError("assertion \"" + label + "\" must be of kind SBool, received "
                              + cond.kind.to_string());
    }
    st.add_assertion(loc, label, sv_to_sw(st, cond));
}

}  // namespace smtsym
