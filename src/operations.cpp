// ============================================================================
// operations.cpp - Smart constructors over symbolic values
// ============================================================================

#include "smtsym/operations.hpp"
#include "smtsym/errors.hpp"
#include "smtsym/state.hpp"

namespace smtsym {

// ── Kind checks ─────────────────────────────────────────────────────────────

static void require_same_kind(const char* what, const SVal& a, const SVal& b) {
    if (a.kind != b.kind) {
        throw ValidationError(std::string(what) + ": operand kinds differ: "
                              + a.kind.to_string() + " vs " + b.kind.to_string());
    }
}

static void require_bool(const char* what, const SVal& a) {
    if (!a.kind.is_boolean()) {
        throw ValidationError(std::string(what) + ": expected SBool, received "
                              + a.kind.to_string());
    }
}

static void require_bounded(const char* what, const SVal& a) {
    if (!a.kind.is_bounded()) {
        throw ValidationError(std::string(what) + ": expected a bit-vector, received "
                              + a.kind.to_string());
    }
}

static std::vector<SW> resolve_all(State& st, const std::vector<SVal>& args) {
    std::vector<SW> sws;
    sws.reserve(args.size());
    for (const auto& a : args) {
        sws.push_back(sv_to_sw(st, a));
    }
    return sws;
}

// ── Generic application ─────────────────────────────────────────────────────

SVal sv_apply(const Kind& k, const Op& op, const std::vector<SVal>& args) {
    return SVal::symbolic(k, cache<SW>([k, op, args](State& st) {
        return st.new_expr(k, SBVExpr{op, resolve_all(st, args)});
    }));
}

static SVal binary(const char* what, OpKind ok, const SVal& a, const SVal& b) {
    require_same_kind(what, a, b);
    return sv_apply(a.kind, Op::plain(ok), {a, b});
}

static SVal compare(const char* what, OpKind ok, const SVal& a, const SVal& b) {
    require_same_kind(what, a, b);
    return sv_apply(Kind::boolean(), Op::plain(ok), {a, b});
}

static SVal logical(const char* what, OpKind ok, const SVal& a, const SVal& b) {
    require_bool(what, a);
    require_bool(what, b);
    return sv_apply(Kind::boolean(), Op::plain(ok), {a, b});
}

// ── Arithmetic ──────────────────────────────────────────────────────────────

SVal sv_plus(const SVal& a, const SVal& b)  { return binary("sv_plus", OpKind::Plus, a, b); }
SVal sv_times(const SVal& a, const SVal& b) { return binary("sv_times", OpKind::Times, a, b); }
SVal sv_minus(const SVal& a, const SVal& b) { return binary("sv_minus", OpKind::Minus, a, b); }
SVal sv_quot(const SVal& a, const SVal& b)  { return binary("sv_quot", OpKind::Quot, a, b); }
SVal sv_rem(const SVal& a, const SVal& b)   { return binary("sv_rem", OpKind::Rem, a, b); }

SVal sv_uneg(const SVal& a) { return sv_apply(a.kind, Op::plain(OpKind::UNeg), {a}); }
SVal sv_abs(const SVal& a)  { return sv_apply(a.kind, Op::plain(OpKind::Abs), {a}); }

// ── Comparisons ─────────────────────────────────────────────────────────────

SVal sv_eq(const SVal& a, const SVal& b)  { return compare("sv_eq", OpKind::Equal, a, b); }
SVal sv_neq(const SVal& a, const SVal& b) { return compare("sv_neq", OpKind::NotEqual, a, b); }
SVal sv_lt(const SVal& a, const SVal& b)  { return compare("sv_lt", OpKind::LessThan, a, b); }
SVal sv_gt(const SVal& a, const SVal& b)  { return compare("sv_gt", OpKind::GreaterThan, a, b); }
SVal sv_le(const SVal& a, const SVal& b)  { return compare("sv_le", OpKind::LessEq, a, b); }
SVal sv_ge(const SVal& a, const SVal& b)  { return compare("sv_ge", OpKind::GreaterEq, a, b); }

// ── Boolean ─────────────────────────────────────────────────────────────────

SVal sv_and(const SVal& a, const SVal& b) { return logical("sv_and", OpKind::And, a, b); }
SVal sv_or(const SVal& a, const SVal& b)  { return logical("sv_or", OpKind::Or, a, b); }
SVal sv_xor(const SVal& a, const SVal& b) { return logical("sv_xor", OpKind::XOr, a, b); }

SVal sv_not(const SVal& a) {
    require_bool("sv_not", a);
    return sv_apply(Kind::boolean(), Op::plain(OpKind::Not), {a});
}

SVal sv_ite(const SVal& c, const SVal& t, const SVal& e) {
    require_bool("sv_ite", c);
    require_same_kind("sv_ite", t, e);
    return sv_apply(t.kind, Op::plain(OpKind::Ite), {c, t, e});
}

// ── Bit-level ───────────────────────────────────────────────────────────────

SVal sv_shl(const SVal& a, std::int32_t n) { return sv_apply(a.kind, Op::shl(n), {a}); }
SVal sv_shr(const SVal& a, std::int32_t n) { return sv_apply(a.kind, Op::shr(n), {a}); }
SVal sv_rol(const SVal& a, std::int32_t n) { return sv_apply(a.kind, Op::rol(n), {a}); }
SVal sv_ror(const SVal& a, std::int32_t n) { return sv_apply(a.kind, Op::ror(n), {a}); }

SVal sv_extract(std::int32_t hi, std::int32_t lo, const SVal& a) {
    require_bounded("sv_extract", a);
    if (lo < 0 || hi < lo || hi >= a.kind.width) {
        throw ValidationError("sv_extract: bad range [" + std::to_string(hi) + ":"
                              + std::to_string(lo) + "] for " + a.kind.to_string());
    }
    return sv_apply(Kind::bounded(false, hi - lo + 1), Op::extract(hi, lo), {a});
}

SVal sv_join(const SVal& a, const SVal& b) {
    require_bounded("sv_join", a);
    require_bounded("sv_join", b);
    return sv_apply(Kind::bounded(false, a.kind.width + b.kind.width),
                    Op::plain(OpKind::Join), {a, b});
}

SVal sv_kind_cast(const Kind& to, const SVal& a) {
    return sv_apply(to, Op::kind_cast(a.kind, to), {a});
}

// ── Labels, uninterpreted functions, tables ─────────────────────────────────

SVal sv_label(const std::string& text, const SVal& a) {
    return sv_apply(a.kind, Op::label(text), {a});
}

SVal sv_uninterpreted(const std::string& name, const Kind& result,
                      const std::vector<SVal>& args,
                      const std::optional<std::vector<std::string>>& code) {
    SBVType type;
    for (const auto& a : args) type.kinds.push_back(a.kind);
    type.kinds.push_back(result);

    return SVal::symbolic(result, cache<SW>([name, result, args, code, type](State& st) {
        st.new_uninterpreted(name, type, code);
        return st.new_expr(result, SBVExpr{Op::uninterpreted(name), resolve_all(st, args)});
    }));
}

SVal sv_select(const std::vector<SVal>& elements, const SVal& out_of_bounds,
               const SVal& index) {
    for (const auto& e : elements) {
        require_same_kind("sv_select", e, out_of_bounds);
    }
    if (elements.empty()) return out_of_bounds;

    const Kind rk = out_of_bounds.kind;
    return SVal::symbolic(rk, cache<SW>([elements, out_of_bounds, index, rk](State& st) {
        std::vector<SW> elts = resolve_all(st, elements);
        SW err = sv_to_sw(st, out_of_bounds);
        SW ind = sv_to_sw(st, index);

        LookupInfo info;
        info.table = st.get_table_index(index.kind, rk, elts);
        info.index_kind = index.kind;
        info.result_kind = rk;
        info.length = static_cast<std::int32_t>(elts.size());
        info.index = ind;
        info.out_of_bounds = err;
        return st.new_expr(rk, SBVExpr{Op::lkup(info), {}});
    }));
}

// ── Floating point and pseudo-booleans ──────────────────────────────────────

SVal sv_fp(FPOpKind op, const Kind& k, const std::vector<SVal>& args) {
    return sv_apply(k, Op::fp(op), args);
}

SVal sv_fp_cast(const Kind& to, const SVal& rounding, const SVal& a) {
    const Kind from = a.kind;
    return SVal::symbolic(to, cache<SW>([to, from, rounding, a](State& st) {
        SW rm = sv_to_sw(st, rounding);
        SW v = sv_to_sw(st, a);
        return st.new_expr(to, SBVExpr{Op::fp_cast(from, to, rm), {v}});
    }));
}

SVal sv_fp_reinterpret(const Kind& to, const SVal& a) {
    return sv_apply(to, Op::fp_reinterpret(a.kind, to), {a});
}

SVal sv_pb(PBOpKind op, const std::vector<std::int32_t>& coeffs, std::int32_t bound,
           const std::vector<SVal>& args) {
    for (const auto& a : args) require_bool("sv_pb", a);
    return sv_apply(Kind::boolean(), Op::pseudo_boolean(op, coeffs, bound), args);
}

}  // namespace smtsym
