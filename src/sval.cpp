// ============================================================================
// sval.cpp - Symbolic values, variables and outputs
// ============================================================================

#include "smtsym/sval.hpp"
#include "smtsym/errors.hpp"
#include "smtsym/state.hpp"

namespace smtsym {

// ── SVal ────────────────────────────────────────────────────────────────────

std::optional<CW> SVal::as_concrete() const {
    if (const CW* cw = std::get_if<CW>(&val)) return *cw;
    return std::nullopt;
}

std::string SVal::to_string() const {
    if (const CW* cw = std::get_if<CW>(&val)) {
        if (kind.is_boolean()) return cw->to_string();
        return cw->to_string() + " :: " + kind.to_string();
    }
    return "<symbolic> :: " + kind.to_string();
}

SW uncache(const Cached<SW>& c, State& st) {
    return uncache_with(st.sw_cache(), c, st);
}

SW sv_to_sw(State& st, const SVal& v) {
    if (const CW* cw = std::get_if<CW>(&v.val)) return st.new_const(*cw);
    return uncache(std::get<Cached<SW>>(v.val), st);
}

SVal sval_of_sw(const SW& sw) {
    return SVal::symbolic(sw.kind, cache<SW>([sw](State&) { return sw; }));
}

// ── Quantifier defaults ─────────────────────────────────────────────────────

static Quantifier default_quantifier(const RunMode& m) noexcept {
    switch (m.kind) {
        case RunModeKind::Proof:
        case RunModeKind::Interactive:
            return m.is_sat ? Quantifier::EX : Quantifier::ALL;
        case RunModeKind::CodeGen:
        case RunModeKind::Concrete:
            return Quantifier::ALL;
    }
    return Quantifier::ALL;
}

// ── Variables ───────────────────────────────────────────────────────────────

SVal sv_mk_sym_var(State& st, std::optional<Quantifier> q, const Kind& k,
                   const std::optional<std::string>& name) {
    if (k.is_user_sort()) return mk_sval_user_sort(st, k, q, name);

    const Quantifier quant = q ? *q : default_quantifier(st.run_mode());

    if (is_concrete_mode(st)) {
        if (quant == Quantifier::EX) {
            if (name) {
                throw ModeViolation("cannot quick-check in the presence of existential variable "
                                    + *name + " :: " + k.to_string());
            }
            throw ModeViolation("cannot quick-check in the presence of existential variables, type: "
                                + k.to_string());
        }
        CW cw = random_cw(k, st.rng());
        st.add_trace(name.value_or("_"), cw);
        return SVal::constant(cw);
    }

    SW sw = st.new_sw(k);
    return introduce_user_name(st, name.value_or(sw.to_string()), k, quant, sw);
}

SVal mk_sval_user_sort(State& st, const Kind& k, std::optional<Quantifier> q,
                       const std::optional<std::string>& name) {
    st.register_kind(k);

    if (is_codegen_mode(st)) {
        throw ModeViolation("uninterpreted sort " + k.sort_name
                            + " can not be used in code-generation mode.");
    }
    if (is_concrete_mode(st)) {
        throw ModeViolation("uninterpreted sort " + k.sort_name
                            + " can not be used in concrete simulation mode.");
    }

    const Quantifier quant = q ? *q : default_quantifier(st.run_mode());
    SW sw = st.new_sw(k);
    return introduce_user_name(st, name.value_or(sw.to_string()), k, quant, sw);
}

SVal introduce_user_name(State& st, const std::string& name, const Kind& k,
                         Quantifier q, const SW& sw) {
    st.add_input(q, sw, name);
    return SVal::symbolic(k, cache<SW>([sw](State&) { return sw; }));
}

void output_sval(State& st, const SVal& v) {
    st.add_output(sv_to_sw(st, v));
}

}  // namespace smtsym
