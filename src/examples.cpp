// ============================================================================
// examples.cpp - Built-in symbolic constructions
// ============================================================================

#include "smtsym/examples.hpp"
#include "smtsym/array.hpp"
#include "smtsym/directives.hpp"
#include "smtsym/operations.hpp"
#include "smtsym/sval.hpp"

#include <stdexcept>

namespace smtsym {

namespace {

SVal lit(const Kind& k, std::int64_t v) {
    return SVal::constant(integral_cw(k, v));
}

void example_sum(State& st) {
    const Kind w32 = Kind::bounded(true, 32);
    SVal x = sv_mk_sym_var(st, std::nullopt, w32, std::string("x"));
    SVal y = sv_mk_sym_var(st, std::nullopt, w32, std::string("y"));
    output_sval(st, sv_plus(x, y));

    const SVal zero = lit(w32, 0);
    add_sval_tactic(st, Tactic<SVal>::parallel_case());
    add_sval_tactic(st, Tactic<SVal>::case_split(false, {
        CaseSplitBranch<SVal>{"x_negative", sv_lt(x, zero), {}},
        CaseSplitBranch<SVal>{"x_nonnegative", sv_ge(x, zero), {}},
    }));
}

void example_arrays(State& st) {
    const Kind w8 = Kind::bounded(false, 8);
    SArr mem = new_sarr(st, {w8, w8}, [](ArrayIndex) { return std::string("mem"); });
    SVal addr = sv_mk_sym_var(st, std::nullopt, w8, std::string("addr"));
    SVal val  = sv_mk_sym_var(st, std::nullopt, w8, std::string("val"));

    SArr mem2 = write_sarr(mem, addr, val);
    output_sval(st, sv_eq(read_sarr(mem2, addr), val));
}

void example_tables(State& st) {
    const Kind w8 = Kind::bounded(false, 8);
    SVal i = sv_mk_sym_var(st, std::nullopt, w8, std::string("i"));

    std::vector<SVal> squares;
    for (int k = 0; k < 4; ++k) squares.push_back(lit(w8, k * k));
    SVal sq = sv_select(squares, lit(w8, 0), i);

    impose_constraint(st, std::string("in_range"), sv_lt(i, lit(w8, 4)));
    output_sval(st, sq);
}

void example_goals(State& st) {
    const Kind z = Kind::unbounded();
    SVal x = sv_mk_sym_var(st, Quantifier::EX, z, std::string("x"));
    SVal y = sv_mk_sym_var(st, Quantifier::EX, z, std::string("y"));

    impose_constraint(st, std::nullopt, sv_ge(x, lit(z, 0)));
    impose_constraint(st, std::nullopt, sv_le(sv_plus(x, y), lit(z, 10)));

    add_sval_tactic(st, Tactic<SVal>::optimize_priority(OptimizeStyle::lexicographic()));
    add_sval_opt_goal(st, Objective<SVal>::minimize("min_x", x));
    add_sval_opt_goal(st, Objective<SVal>::maximize("max_sum", sv_plus(x, y)));
    add_sval_opt_goal(st, Objective<SVal>::assert_soft(
        "prefer_y_small", sv_lt(y, lit(z, 3)), Penalty::weighted("5/2", std::string("g1"))));
}

void example_uninterpreted(State& st) {
    const Kind w32 = Kind::bounded(true, 32);
    SVal x = sv_mk_sym_var(st, std::nullopt, w32, std::string("x"));
    SVal fx = sv_uninterpreted("f", w32, {x});

    st.add_axiom("f_positive", {
        "(assert (forall ((a (_ BitVec 32))) (bvsgt (f a) #x00000000)))"
    });
    impose_constraint(st, std::string("f_of_x"), sv_gt(fx, lit(w32, 0)));
    output_sval(st, fx);
}

}  // namespace

const std::vector<std::string>& example_names() {
    static const std::vector<std::string> names = {
        "sum", "arrays", "tables", "goals", "uninterpreted"
    };
    return names;
}

void build_example(const std::string& name, State& st) {
    if (name == "sum")                { example_sum(st); return; }
    if (name == "arrays")             { example_arrays(st); return; }
    if (name == "tables")             { example_tables(st); return; }
    if (name == "goals")              { example_goals(st); return; }
    if (name == "uninterpreted")      { example_uninterpreted(st); return; }
    throw std::runtime_error("unknown example: " + name);
}

}  // namespace smtsym
