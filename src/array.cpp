// ============================================================================
// array.cpp - Symbolic array handles
// ============================================================================

#include "smtsym/array.hpp"
#include "smtsym/errors.hpp"

namespace smtsym {

ArrayIndex uncache_ai(const Cached<ArrayIndex>& c, State& st) {
    return uncache_with(st.ai_cache(), c, st);
}

std::string default_array_name(ArrayIndex i) {
    return "array_" + std::to_string(i);
}

static void require_array_mode(const State& st) {
    if (is_concrete_mode(st) || is_codegen_mode(st)) {
        throw ValidationError("symbolic arrays are not supported in "
                              + st.run_mode().to_string() + " mode");
    }
}

// ── new_sarr ────────────────────────────────────────────────────────────────

SArr new_sarr(State& st, const std::pair<Kind, Kind>& kinds,
              const std::function<std::string(ArrayIndex)>& mk_name,
              const std::optional<SVal>& init) {
    require_array_mode(st);

    std::optional<SW> init_sw;
    if (init) init_sw = sv_to_sw(st, *init);

    // The handle is taken after the initialiser has been resolved.
    const ArrayIndex i = st.next_array_index();
    st.new_array(mk_name(i), kinds, ArrayContext::fresh(init_sw));
    return SArr{kinds, cache<ArrayIndex>([i](State&) { return i; })};
}

// ── read_sarr ───────────────────────────────────────────────────────────────

SVal read_sarr(const SArr& a, const SVal& index) {
    const Kind rk = a.kinds.second;
    const Cached<ArrayIndex> src = a.handle;
    return SVal::symbolic(rk, cache<SW>([src, index, rk](State& st) {
        ArrayIndex arr = uncache_ai(src, st);
        SW i = sv_to_sw(st, index);
        return st.new_expr(rk, SBVExpr{Op::arr_read(arr), {i}});
    }));
}

// ── reset / write / merge ───────────────────────────────────────────────────

SArr reset_sarr(const SArr& a, const SVal& v) {
    const auto kinds = a.kinds;
    const Cached<ArrayIndex> src = a.handle;
    return SArr{kinds, cache<ArrayIndex>([kinds, src, v](State& st) {
        require_array_mode(st);
        SW val = sv_to_sw(st, v);
        ArrayIndex i = uncache_ai(src, st);
        const ArrayIndex j = st.next_array_index();
        return st.new_array(default_array_name(j), kinds, ArrayContext::reset(i, val));
    })};
}

SArr write_sarr(const SArr& a, const SVal& index, const SVal& v) {
    const auto kinds = a.kinds;
    const Cached<ArrayIndex> src = a.handle;
    return SArr{kinds, cache<ArrayIndex>([kinds, src, index, v](State& st) {
        require_array_mode(st);
        ArrayIndex arr = uncache_ai(src, st);
        SW addr = sv_to_sw(st, index);
        SW val = sv_to_sw(st, v);
        const ArrayIndex j = st.next_array_index();
        return st.new_array(default_array_name(j), kinds, ArrayContext::mutate(arr, addr, val));
    })};
}

SArr merge_sarr(const SVal& cond, const SArr& a, const SArr& b) {
    const auto kinds = a.kinds;
    const Cached<ArrayIndex> ca = a.handle;
    const Cached<ArrayIndex> cb = b.handle;
    return SArr{kinds, cache<ArrayIndex>([kinds, ca, cb, cond](State& st) {
        require_array_mode(st);
        ArrayIndex ai = uncache_ai(ca, st);
        ArrayIndex bi = uncache_ai(cb, st);
        SW t = sv_to_sw(st, cond);
        const ArrayIndex k = st.next_array_index();
        return st.new_array(default_array_name(k), kinds, ArrayContext::merge(t, ai, bi));
    })};
}

// ── eq_sarr ─────────────────────────────────────────────────────────────────

SVal eq_sarr(const SArr& a, const SArr& b) {
    const Cached<ArrayIndex> ca = a.handle;
    const Cached<ArrayIndex> cb = b.handle;
    return SVal::symbolic(Kind::boolean(), cache<SW>([ca, cb](State& st) {
        ArrayIndex ai = uncache_ai(ca, st);
        ArrayIndex bi = uncache_ai(cb, st);
        return st.new_expr(Kind::boolean(), SBVExpr{Op::arr_eq(ai, bi), {}});
    }));
}

}  // namespace smtsym
