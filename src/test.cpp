// ============================================================================
// test.cpp - Self-test suite for the symbolic construction engine
// ============================================================================
//
// Contains tests covering:
//   - Node allocation and the reserved boolean ids
//   - Hash-consing of constants (+0.0 / -0.0 kept apart), expressions
//     (commutative operands canonicalised) and lookup tables
//   - The identity-preserving cache, including colliding buckets
//   - Uninterpreted declarations, inputs, labels and identifiers
//   - Mode policy: quantifier defaults, Concrete / CodeGen restrictions
//   - Symbolic array handles and their provenance
//   - Constraints (plain and probabilistic), assertions, tactics, goals
//   - Interactive mode: guarded mutation and incremental sub-state
//   - Query handshake against a scripted channel and against Z3, and the
//     StopAfter budget sent as a solver timeout
//   - Case-split dispatch
//   - Result extraction and its listing
//
// ============================================================================

#include "smtsym/test.hpp"
#include "smtsym/array.hpp"
#include "smtsym/case_split.hpp"
#include "smtsym/directives.hpp"
#include "smtsym/errors.hpp"
#include "smtsym/examples.hpp"
#include "smtsym/operations.hpp"
#include "smtsym/query.hpp"
#include "smtsym/result.hpp"
#include "smtsym/sval.hpp"
#include "smtsym/utils.hpp"
#include "smtsym/z3_channel.hpp"

#include <chrono>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace smtsym {

// ── TestContext ──────────────────────────────────────────────────────────────

void TestContext::check(bool condition, const std::string& description) {
    ++total_;
    if (!condition) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n";
    }
}

void TestContext::check_eq(const std::string& actual,
                           const std::string& expected,
                           const std::string& description) {
    ++total_;
    if (actual != expected) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << expected << "\n"
                  << "    actual:   " << actual << "\n";
    }
}

// ── TestRunner ──────────────────────────────────────────────────────────────

void TestRunner::run(const std::string& name, TestFunc func) {
    ++tests_run_;
    TestContext ctx;
    ctx.current_test_ = name;

    std::cerr << "TEST: " << name << "\n";
    try {
        func(ctx);
    } catch (const std::exception& e) {
        std::cerr << "  EXCEPTION: " << e.what() << "\n";
        ++ctx.failed_;
    }

    checks_total_ += ctx.total();
    checks_failed_ += ctx.failed();
    if (ctx.failed() > 0) {
        ++tests_failed_;
    } else {
        std::cerr << "  OK (" << ctx.total() << " checks)\n";
    }
}

int TestRunner::summarise() const {
    std::cerr << "\n=== Test Summary ===\n"
              << "Tests:  " << tests_run_ << " run, "
              << (tests_run_ - tests_failed_) << " passed, "
              << tests_failed_ << " failed\n"
              << "Checks: " << checks_total_ << " total, "
              << (checks_total_ - checks_failed_) << " passed, "
              << checks_failed_ << " failed\n";

    if (tests_failed_ == 0) {
        std::cerr << "ALL TESTS PASSED\n";
        return 0;
    } else {
        std::cerr << "SOME TESTS FAILED\n";
        return 1;
    }
}

// ============================================================================
// Helpers
// ============================================================================

template <typename E, typename F>
static bool throws_as(F&& f) {
    try {
        f();
        return false;
    } catch (const E&) {
        return true;
    }
}

static RunMode proof_mode()   { return RunMode::proof(false, default_z3_config()); }
static RunMode sat_mode()     { return RunMode::proof(true, default_z3_config()); }

static const Kind kW8  = Kind::bounded(false, 8);
static const Kind kI32 = Kind::bounded(true, 32);

static SVal lit(const Kind& k, std::int64_t v) {
    return SVal::constant(integral_cw(k, v));
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// ============================================================================
// Nodes and hash-consing
// ============================================================================

static void test_reserved_ids(TestContext& ctx) {
    State st(proof_mode());
    ctx.check(st.next_node_id() == kFirstFreeNode, "fresh context allocates from 3");
    ctx.check(st.new_const(false_cw()).id == kFalseNode, "false is node 1");
    ctx.check(st.new_const(true_cw()).id == kTrueNode, "true is node 2");
    ctx.check(st.constants().size() == 2, "only the booleans are interned");

    SW a = st.new_sw(kW8);
    SW b = st.new_sw(kW8);
    SW c = st.new_sw(kI32);
    ctx.check(a.id == 3 && b.id == 4 && c.id == 5, "ids increase strictly from 3");
    ctx.check(st.used_kinds().count(kI32) == 1, "new_sw registers the kind");
}

static void test_constant_interning(TestContext& ctx) {
    State st(proof_mode());
    SW a = st.new_const(integral_cw(kW8, 5));
    SW b = st.new_const(integral_cw(kW8, 5));
    SW c = st.new_const(integral_cw(kI32, 5));
    ctx.check(a == b, "same value twice gives the same node");
    ctx.check(a != c, "same payload at another kind is a new node");

    SW pz = st.new_const(float_cw(0.0f));
    SW nz = st.new_const(float_cw(-0.0f));
    SW pz2 = st.new_const(float_cw(0.0f));
    ctx.check(pz != nz, "+0.0 and -0.0 are distinct nodes");
    ctx.check(pz == pz2, "+0.0 is shared");
    ctx.check(st.new_const(double_cw(-0.0)) != st.new_const(double_cw(0.0)),
              "double zeros are distinct too");
}

static void test_commutative_sharing(TestContext& ctx) {
    State st(proof_mode());
    SVal x = sv_mk_sym_var(st, std::nullopt, kI32, std::string("x"));
    SVal y = sv_mk_sym_var(st, std::nullopt, kI32, std::string("y"));
    SW xs = sv_to_sw(st, x);
    SW ys = sv_to_sw(st, y);
    ctx.check(xs.id == 3 && ys.id == 4, "x and y are nodes 3 and 4");

    SW s1 = sv_to_sw(st, sv_plus(x, y));
    SW s2 = sv_to_sw(st, sv_plus(y, x));
    ctx.check(s1 == s2, "x + y and y + x share a node");
    ctx.check(s1.id == 5, "the sum is node 5");
    ctx.check(st.program().assignments.size() == 1, "exactly one assignment");
    ctx.check(st.program().assignments.front().second.op.kind == OpKind::Plus,
              "the assignment is an addition");

    SW d1 = sv_to_sw(st, sv_minus(x, y));
    SW d2 = sv_to_sw(st, sv_minus(y, x));
    ctx.check(d1 != d2, "subtraction is not reordered");

    SW e1 = sv_to_sw(st, sv_eq(y, x));
    SW e2 = sv_to_sw(st, sv_eq(x, y));
    ctx.check(e1 == e2, "equality is reordered");
    ctx.check(e1.kind.is_boolean(), "comparison yields a boolean");
}

static void test_expression_kind_checks(TestContext& ctx) {
    State st(proof_mode());
    SVal a = sv_mk_sym_var(st, std::nullopt, kW8, std::string("a"));
    SVal b = sv_mk_sym_var(st, std::nullopt, kI32, std::string("b"));
    ctx.check(throws_as<ValidationError>([&] { sv_plus(a, b); }), "mixed kinds rejected");
    ctx.check(throws_as<ValidationError>([&] { sv_and(a, a); }), "and needs booleans");
    ctx.check(throws_as<ValidationError>([&] { sv_extract(8, 0, a); }), "extract past width");

    SW ex = sv_to_sw(st, sv_extract(7, 4, a));
    ctx.check(ex.kind == Kind::bounded(false, 4), "extract of 4 bits");
    SW j = sv_to_sw(st, sv_join(a, a));
    ctx.check(j.kind == Kind::bounded(false, 16), "join of two bytes");
}

static void test_tables(TestContext& ctx) {
    State st(proof_mode());
    SW a = st.new_const(integral_cw(kW8, 1));
    SW b = st.new_const(integral_cw(kW8, 2));

    ctx.check(st.get_table_index(kW8, kW8, {a, b}) == 0, "first table is 0");
    ctx.check(st.get_table_index(kW8, kW8, {a, b}) == 0, "identical table is shared");
    ctx.check(st.get_table_index(kW8, kW8, {b, a}) == 1, "new table gets the store size");
    ctx.check(st.get_table_index(kI32, kW8, {a, b}) == 2, "index kind is part of the key");
    ctx.check(st.tables().size() == 3, "three tables");

    SVal i = sv_mk_sym_var(st, std::nullopt, kW8, std::string("i"));
    SVal r = sv_select({lit(kW8, 1), lit(kW8, 2)}, lit(kW8, 0), i);
    SW rs = sv_to_sw(st, r);
    const auto& last = st.program().assignments.back();
    ctx.check(last.first == rs, "select is the latest assignment");
    ctx.check(last.second.op.kind == OpKind::LkUp, "select emits a lookup");
    ctx.check(last.second.op.lookup.table == 0, "select reuses table 0");
    ctx.check(last.second.op.lookup.length == 2, "lookup records the length");

    SVal oob = lit(kW8, 9);
    SVal none = sv_select({}, oob, i);
    ctx.check(none.is_concrete(), "empty select is the out-of-bounds value");
}

// ============================================================================
// Identity-preserving cache
// ============================================================================

struct CollidingHash {
    std::size_t operator()(CacheToken) const noexcept { return 7; }
};

static void test_cache_sharing(TestContext& ctx) {
    State st(proof_mode());
    int runs = 0;
    Cached<int> c = cache<int>([&runs](State&) { return ++runs; });
    Cached<int> copy = c;

    CacheTable<int> table;
    ctx.check(uncache_with(table, c, st) == 1, "first observation evaluates");
    ctx.check(uncache_with(table, copy, st) == 1, "a copy shares the memo");
    ctx.check(runs == 1, "evaluated once");

    Cached<int> other = cache<int>([&runs](State&) { return ++runs; });
    ctx.check(other.token() != c.token(), "tokens are unique");
    ctx.check(uncache_with(table, other, st) == 2, "another cell evaluates separately");

    SVal x = sv_mk_sym_var(st, std::nullopt, kW8, std::string("x"));
    SVal sq = sv_times(x, x);
    const std::size_t before = st.program().assignments.size();
    SW a = sv_to_sw(st, sq);
    SW b = sv_to_sw(st, sq);
    ctx.check(a == b, "observing a value twice gives one node");
    ctx.check(st.program().assignments.size() == before + 1, "one assignment added");
}

static void test_cache_collisions(TestContext& ctx) {
    State st(proof_mode());
    CacheTable<int, CollidingHash> table;
    Cached<int> a = cache<int>([](State&) { return 10; });
    Cached<int> b = cache<int>([](State&) { return 20; });
    Cached<int> c = cache<int>([](State&) { return 30; });

    ctx.check(uncache_with(table, a, st) == 10, "a");
    ctx.check(uncache_with(table, b, st) == 20, "b in the same bucket");
    ctx.check(uncache_with(table, c, st) == 30, "c in the same bucket");
    ctx.check(uncache_with(table, a, st) == 10, "a is still found");
    ctx.check(table.bucket_count() == 1, "all entries share one bucket");
    ctx.check(table.size() == 3, "three entries");
    ctx.check(table.find(next_cache_token()) == nullptr, "unknown token misses");

    table.clear();
    ctx.check(table.size() == 0 && table.find(a.token()) == nullptr, "clear empties the table");
}

static void test_nested_uncache(TestContext& ctx) {
    State st(proof_mode());
    SVal x = sv_mk_sym_var(st, std::nullopt, kW8, std::string("x"));
    SVal inner = sv_plus(x, lit(kW8, 1));
    SVal outer = sv_times(inner, inner);
    SW o = sv_to_sw(st, outer);
    SW i = sv_to_sw(st, inner);
    ctx.check(i.id < o.id, "operands are allocated before the application");
    const auto& e = st.program().assignments.back().second;
    ctx.check(e.args.size() == 2 && e.args[0] == i && e.args[1] == i,
              "both operands are the shared inner node");
}

// ============================================================================
// Declarations, inputs and labels
// ============================================================================

static void test_uninterpreted(TestContext& ctx) {
    State st(proof_mode());
    SBVType t1{{kW8, kW8}};
    SBVType t2{{kW8, kI32}};

    st.new_uninterpreted("f", t1);
    st.new_uninterpreted("f", t1);
    ctx.check(st.uninterpreted().size() == 1, "redeclaration with the same type is a no-op");
    ctx.check(throws_as<ValidationError>([&] { st.new_uninterpreted("f", t2); }),
              "redeclaration at another type fails");
    ctx.check(throws_as<ValidationError>([&] { st.new_uninterpreted("1f", t1); }),
              "bad identifier rejected");
    ctx.check(throws_as<ValidationError>([&] { st.new_uninterpreted("", t1); }),
              "empty identifier rejected");
    ctx.check(throws_as<ValidationError>([&] { st.new_uninterpreted("h", SBVType{}); }),
              "empty type rejected");
    ctx.check(st.uninterpreted().count("h") == 0, "nothing declared for an empty type");

    st.new_uninterpreted("|odd name|", t1, std::vector<std::string>{"return 0;"});
    ctx.check(st.code_segments().count("|odd name|") == 1, "code segment recorded");

    SVal x = sv_mk_sym_var(st, std::nullopt, kW8, std::string("x"));
    SW g1 = sv_to_sw(st, sv_uninterpreted("g", kW8, {x}));
    SW g2 = sv_to_sw(st, sv_uninterpreted("g", kW8, {x}));
    ctx.check(g1 == g2, "the same application is shared");
    ctx.check(st.uninterpreted().at("g") == SBVType{{kW8, kW8}}, "g declared lazily");
}

static void test_inputs(TestContext& ctx) {
    State st(proof_mode());
    sv_mk_sym_var(st, std::nullopt, kW8, std::string("a"));
    sv_mk_sym_var(st, std::nullopt, kW8, std::string("b"));
    ctx.check(st.inputs().size() == 2, "distinct names both succeed");
    ctx.check(throws_as<ValidationError>([&] {
        sv_mk_sym_var(st, std::nullopt, kW8, std::string("a"));
    }), "repeated name fails");
    ctx.check(st.inputs().size() == 2, "failed input not recorded");

    {
        State many(proof_mode());
        for (int k = 0; k < 2000; ++k) {
            sv_mk_sym_var(many, std::nullopt, kW8, "v" + std::to_string(k));
        }
        ctx.check(many.inputs().size() == 2000, "many distinct inputs");
        ctx.check(throws_as<ValidationError>([&] {
            sv_mk_sym_var(many, std::nullopt, kW8, std::string("v1234"));
        }), "repeat among many inputs fails");
    }

    SVal anon = sv_mk_sym_var(st, std::nullopt, kW8);
    SW as = sv_to_sw(st, anon);
    ctx.check_eq(st.inputs().back().name, as.to_string(), "anonymous input named after its node");

    SW iv = st.internal_variable(kI32);
    ctx.check_eq(st.inputs().back().name, "__internal_sbv_" + iv.to_string(),
                 "internal variable naming");
    ctx.check(st.inputs().back().quantifier == Quantifier::ALL, "internal is universal in proof");
}

static void test_labels_and_identifiers(TestContext& ctx) {
    State st(proof_mode());
    st.register_label("first");
    ctx.check(throws_as<ValidationError>([&] { st.register_label("first"); }), "duplicate label");
    ctx.check(throws_as<ValidationError>([&] { st.register_label("assert"); }), "reserved label");
    ctx.check(throws_as<ValidationError>([&] { st.register_label("a|b"); }), "pipe in label");
    ctx.check(throws_as<ValidationError>([&] { st.register_label("a\\b"); }), "backslash in label");

    ctx.check(is_valid_identifier("x1_y"), "plain identifier");
    ctx.check(is_valid_identifier("|with space|"), "enclosed identifier");
    ctx.check(!is_valid_identifier("_x"), "leading underscore");
    ctx.check(!is_valid_identifier("||"), "empty enclosure");
    ctx.check(!is_valid_identifier("|a|b|"), "inner pipe");
    ctx.check(is_smtlib_reserved("Int"), "reserved words are case-insensitive");

    ctx.check(throws_as<ValidationError>([&] {
        st.register_kind(Kind::user_sort("Array"));
    }), "reserved sort name");
}

// ============================================================================
// Mode policy
// ============================================================================

static void test_quantifier_defaults(TestContext& ctx) {
    {
        State st(sat_mode());
        sv_mk_sym_var(st, std::nullopt, kW8, std::string("x"));
        ctx.check(st.inputs().back().quantifier == Quantifier::EX, "sat defaults to EX");
    }
    {
        State st(proof_mode());
        sv_mk_sym_var(st, std::nullopt, kW8, std::string("x"));
        ctx.check(st.inputs().back().quantifier == Quantifier::ALL, "proof defaults to ALL");
        sv_mk_sym_var(st, Quantifier::EX, kW8, std::string("y"));
        ctx.check(st.inputs().back().quantifier == Quantifier::EX, "explicit quantifier wins");
    }
    {
        State st(RunMode::interactive(true, default_z3_config()));
        st.allow_in_interactive(Mutation::Input);
        st.allow_in_interactive(Mutation::UsedKind);
        sv_mk_sym_var(st, std::nullopt, kW8, std::string("x"));
        ctx.check(st.inputs().back().quantifier == Quantifier::EX, "interactive sat defaults to EX");
    }
    {
        State st(RunMode::codegen());
        sv_mk_sym_var(st, std::nullopt, kW8, std::string("x"));
        ctx.check(st.inputs().back().quantifier == Quantifier::ALL, "codegen defaults to ALL");
    }
}

static void test_concrete_mode(TestContext& ctx) {
    State st(RunMode::concrete(7));
    ctx.check(throws_as<ModeViolation>([&] {
        sv_mk_sym_var(st, Quantifier::EX, kW8, std::string("e"));
    }), "existential under concrete");

    SVal v = sv_mk_sym_var(st, std::nullopt, kW8, std::string("x"));
    ctx.check(v.is_concrete(), "concrete variables are constants");
    ctx.check(st.inputs().empty(), "no inputs recorded");
    ctx.check(st.trace_info().size() == 1 && st.trace_info().front().first == "x",
              "draw recorded in the trace");

    sv_mk_sym_var(st, std::nullopt, kW8);
    ctx.check(st.trace_info().back().first == "_", "anonymous draw");

    // Same seed, same draws.
    State a(RunMode::concrete(99));
    State b(RunMode::concrete(99));
    SVal va = sv_mk_sym_var(a, std::nullopt, kI32, std::string("v"));
    SVal vb = sv_mk_sym_var(b, std::nullopt, kI32, std::string("v"));
    ctx.check(*va.as_concrete() == *vb.as_concrete(), "draws are reproducible");
}

static void test_user_sorts(TestContext& ctx) {
    const Kind e = Kind::user_sort("Color", std::vector<std::string>{"Red", "Green"});
    {
        State st(proof_mode());
        SVal c = mk_sval_user_sort(st, e, std::nullopt, std::string("c"));
        ctx.check(c.kind == e, "user sort variable");
        ctx.check(st.used_kinds().count(e) == 1, "sort registered");
    }
    {
        State st(RunMode::codegen());
        ctx.check(throws_as<ModeViolation>([&] {
            mk_sval_user_sort(st, e, Quantifier::ALL, std::string("c"));
        }), "user sort under codegen");
    }
    {
        State st(RunMode::concrete(1));
        ctx.check(throws_as<ModeViolation>([&] {
            mk_sval_user_sort(st, e, Quantifier::ALL, std::string("c"));
        }), "user sort under concrete");
    }
    {
        State st(RunMode::codegen());
        ctx.check(throws_as<ModeViolation>([&] {
            sv_mk_sym_var(st, std::nullopt, e, std::string("c"));
        }), "user sort variable under codegen");
        ctx.check(st.inputs().empty(), "no input recorded");
    }
    {
        State st(RunMode::concrete(1));
        ctx.check(throws_as<ModeViolation>([&] {
            sv_mk_sym_var(st, Quantifier::ALL, e, std::string("c"));
        }), "user sort variable under concrete");
        ctx.check(st.trace_info().empty(), "nothing drawn");
    }
    {
        State st(proof_mode());
        SVal c = sv_mk_sym_var(st, std::nullopt, e, std::string("c"));
        ctx.check(c.kind == e && st.used_kinds().count(e) == 1, "plain route registers the sort");
    }
}

static void test_mode_predicates(TestContext& ctx) {
    State p(proof_mode());
    ctx.check(in_proof_mode(p) && in_non_interactive_proof_mode(p), "proof");
    ctx.check(sbranch_run_config(p).has_value(), "proof carries a config");

    p.switch_to_interactive_mode();
    ctx.check(in_proof_mode(p) && is_interactive_mode(p), "interactive counts as proof");
    ctx.check(!in_non_interactive_proof_mode(p), "but not as batch proof");
    ctx.check(!sbranch_run_config(p).has_value(), "no sBranch config interactively");
    ctx.check(throws_as<ModeViolation>([&] { p.switch_to_interactive_mode(); }),
              "switch happens once");

    State g(RunMode::codegen());
    ctx.check(is_codegen_mode(g) && !in_proof_mode(g), "codegen");
    ctx.check(throws_as<ModeViolation>([&] { g.switch_to_interactive_mode(); }),
              "codegen never switches");

    State c(RunMode::concrete(3));
    ctx.check(is_concrete_mode(c), "concrete");
    ctx.check_eq(c.run_mode().to_string(), "Concrete evaluation", "mode name");
}

static void test_randomness(TestContext& ctx) {
    State st(RunMode::concrete(5));
    const double d = st.throw_dice();
    ctx.check(d >= 0.0 && d < 1.0, "dice in [0, 1)");

    st.reseed(11);
    const double a1 = st.throw_dice();
    const double a2 = st.throw_dice();
    st.reseed(11);
    ctx.check(st.throw_dice() == a1 && st.throw_dice() == a2, "reseed replays the draws");

    st.reseed(11);
    std::mt19937_64 f1 = st.fork_rng();
    st.reseed(11);
    std::mt19937_64 f2 = st.fork_rng();
    ctx.check(f1() == f2(), "forks are reproducible");
}

static void test_path_condition(TestContext& ctx) {
    State st(proof_mode());
    ctx.check(st.path_condition().is_concrete(), "initial path condition is true");

    SVal b = sv_mk_sym_var(st, std::nullopt, Kind::boolean(), std::string("b"));
    {
        auto scope = st.extend_path_condition([&b](const SVal& pc) { return sv_and(pc, b); });
        ctx.check(!st.path_condition().is_concrete(), "extended inside the scope");
        {
            State::PathScope inner(st, sv_not(b));
            ctx.check(!st.path_condition().is_concrete(), "nested scope");
        }
    }
    ctx.check(st.path_condition().is_concrete(), "restored after the scope");
}

// ============================================================================
// Arrays
// ============================================================================

static void test_array_handles(TestContext& ctx) {
    State st(proof_mode());
    SVal i = sv_mk_sym_var(st, std::nullopt, kW8, std::string("i"));
    SVal v = sv_mk_sym_var(st, std::nullopt, kW8, std::string("v"));

    SArr a = new_sarr(st, {kW8, kW8});
    ctx.check(uncache_ai(a.handle, st) == 0, "fresh array is handle 0");
    ctx.check(st.arrays().size() == 1, "one array");

    SArr w = write_sarr(a, i, v);
    ctx.check(uncache_ai(w.handle, st) == 1, "write allocates handle 1");
    ctx.check(uncache_ai(w.handle, st) == 1, "observing it again does not reallocate");
    const ArrayInfo& wi = st.arrays()[1];
    ctx.check(wi.context.kind == ArrayContextKind::Mutate, "mutate provenance");
    ctx.check(wi.context.source == 0, "references handle 0");
    ctx.check_eq(wi.name, "array_1", "default name");

    const NodeId before = st.next_node_id();
    SW r = sv_to_sw(st, read_sarr(w, i));
    ctx.check(r.id >= before, "read yields a new node");
    ctx.check(st.program().assignments.back().second.op.kind == OpKind::ArrRead, "read op");
    ctx.check(st.arrays().size() == 2, "a read allocates no array");

    SW r2 = sv_to_sw(st, read_sarr(w, i));
    ctx.check(r == r2, "repeated reads collapse");

    SArr z = reset_sarr(w, lit(kW8, 0));
    ctx.check(uncache_ai(z.handle, st) == 2, "reset gets the store size");
    SVal cond = sv_mk_sym_var(st, std::nullopt, Kind::boolean(), std::string("c"));
    SArr m = merge_sarr(cond, a, z);
    ctx.check(uncache_ai(m.handle, st) == 3, "merge gets the store size");
    ctx.check(st.arrays()[3].context.kind == ArrayContextKind::Merge
              && st.arrays()[3].context.source == 0 && st.arrays()[3].context.other == 2,
              "merge provenance");

    SW eq = sv_to_sw(st, eq_sarr(a, m));
    ctx.check(eq.kind.is_boolean(), "array equality is boolean");
    ctx.check(st.program().assignments.back().second.op.kind == OpKind::ArrEq, "eq op");
    ctx.check(st.arrays().size() == 4, "four arrays in all");
}

static void test_array_initialiser(TestContext& ctx) {
    State st(proof_mode());
    SArr a = new_sarr(st, {kW8, kI32},
                      [](ArrayIndex k) { return "mem" + std::to_string(k); },
                      lit(kI32, 42));
    ctx.check(uncache_ai(a.handle, st) == 0, "handle 0");
    ctx.check_eq(st.arrays()[0].name, "mem0", "custom name");
    ctx.check(st.arrays()[0].context.initial.has_value(), "initialiser recorded");

    State cg(RunMode::codegen());
    ctx.check(throws_as<ValidationError>([&] { new_sarr(cg, {kW8, kW8}); }),
              "arrays rejected under codegen");
    State cc(RunMode::concrete(1));
    ctx.check(throws_as<ValidationError>([&] { new_sarr(cc, {kW8, kW8}); }),
              "arrays rejected under concrete");
}

// ============================================================================
// Constraints, assertions, tactics and goals
// ============================================================================

static void test_constraints(TestContext& ctx) {
    State st(proof_mode());
    SVal x = sv_mk_sym_var(st, std::nullopt, kW8, std::string("x"));
    impose_constraint(st, std::string("small"), sv_lt(x, lit(kW8, 10)));
    impose_constraint(st, std::nullopt, sv_gt(x, lit(kW8, 1)));
    ctx.check(st.constraints().size() == 2, "two constraints");
    ctx.check(st.used_labels().count("small") == 1, "name registered as a label");
    ctx.check(throws_as<ValidationError>([&] {
        impose_constraint(st, std::string("small"), sv_true());
    }), "duplicate constraint name");
    ctx.check(throws_as<ValidationError>([&] { impose_constraint(st, std::nullopt, x); }),
              "non-boolean constraint");

    State cg(RunMode::codegen());
    ctx.check(throws_as<ModeViolation>([&] { impose_constraint(cg, std::nullopt, sv_true()); }),
              "constraints rejected under codegen");
}

static void test_probabilistic_constraints(TestContext& ctx) {
    State st(RunMode::concrete(2024));
    ctx.check(throws_as<ValidationError>([&] {
        add_sval_constraint(st, std::nullopt, -0.1, sv_true(), sv_false());
    }), "threshold -0.1");
    ctx.check(throws_as<ValidationError>([&] {
        add_sval_constraint(st, std::nullopt, 1.1, sv_true(), sv_false());
    }), "threshold 1.1");
    ctx.check(throws_as<ValidationError>([&] {
        add_sval_constraint(st, std::nullopt, std::numeric_limits<double>::quiet_NaN(),
                            sv_true(), sv_false());
    }), "NaN threshold");
    ctx.check(st.constraints().empty(), "rejected thresholds add nothing");

    for (int k = 0; k < 5; ++k) {
        add_sval_constraint(st, std::nullopt, 0.0, sv_true(), sv_false());
        ctx.check(st.constraints().back().sw == false_sw(), "threshold 0 takes the alternative");
        add_sval_constraint(st, std::nullopt, 1.0, sv_true(), sv_false());
        ctx.check(st.constraints().back().sw == true_sw(), "threshold 1 takes the primary");
    }

    add_sval_constraint(st, std::nullopt, std::nullopt, sv_true(), sv_false());
    ctx.check(st.constraints().back().sw == true_sw(), "no threshold imposes the primary");

    auto picks = [](std::uint64_t seed) {
        State s(RunMode::concrete(seed));
        std::vector<NodeId> out;
        for (int k = 0; k < 16; ++k) {
            add_sval_constraint(s, std::nullopt, 0.5, sv_true(), sv_false());
            out.push_back(s.constraints().back().sw.id);
        }
        return out;
    };
    ctx.check(picks(77) == picks(77), "interior thresholds are reproducible");

    State p(proof_mode());
    ctx.check(throws_as<ModeViolation>([&] {
        add_sval_constraint(p, std::nullopt, 0.5, sv_true(), sv_false());
    }), "probabilistic constraints need concrete mode");
}

static void test_assertions(TestContext& ctx) {
    State st(proof_mode());
    SVal x = sv_mk_sym_var(st, std::nullopt, kW8, std::string("x"));
    SourceLocation loc{"demo.cpp", 12, "check"};
    add_sval_assertion(st, loc, "bounded", sv_lt(x, lit(kW8, 200)));
    add_sval_assertion(st, std::nullopt, "bounded", sv_gt(x, lit(kW8, 0)));
    ctx.check(st.assertions().size() == 2, "duplicate labels allowed");
    ctx.check_eq(st.assertions()[0].location->to_string(), "demo.cpp:12 in check", "location");
    ctx.check(throws_as<ValidationError>([&] { add_sval_assertion(st, std::nullopt, "x", x); }),
              "non-boolean assertion");

    State cg(RunMode::codegen());
    ctx.check(throws_as<ModeViolation>([&] {
        add_sval_assertion(cg, std::nullopt, "a", sv_true());
    }), "assertions rejected under codegen");
}

static void test_tactics(TestContext& ctx) {
    State st(proof_mode());
    SVal x = sv_mk_sym_var(st, std::nullopt, kW8, std::string("x"));
    SVal small = sv_lt(x, lit(kW8, 5));

    Tactic<SVal> nested = Tactic<SVal>::case_split(true, {
        CaseSplitBranch<SVal>{"inner", sv_not(small), {Tactic<SVal>::parallel_case()}}
    });
    add_sval_tactic(st, Tactic<SVal>::stop_after(3));
    add_sval_tactic(st, Tactic<SVal>::case_split(false, {
        CaseSplitBranch<SVal>{"small", small, {Tactic<SVal>::stop_after(1), nested}}
    }));
    add_sval_tactic(st, Tactic<SVal>::stop_after(9));

    const auto& ts = st.tactics();
    ctx.check(ts.size() == 3, "three tactics");
    ctx.check(ts[1].branches.size() == 1, "one branch");
    SW small_sw = sv_to_sw(st, small);
    ctx.check(ts[1].branches[0].condition == small_sw, "branch condition resolved");
    ctx.check(ts[1].branches[0].tactics[1].branches[0].condition.kind.is_boolean(),
              "nested branch condition resolved");
    ctx.check(is_parallel_case_anywhere(ts[1]), "nested parallel case found");
    ctx.check(!is_parallel_case_anywhere(ts[0]), "stop-after is not parallel");
    ctx.check(stop_after_seconds(ts) == 9, "last stop-after wins");

    ctx.check_eq(tactic_to_string(ts[0]), "StopAfter 3s", "stop-after listing");
    ctx.check_eq(OptimizeStyle::pareto(3).to_string(), "pareto, at most 3 fronts", "bounded pareto");
    ctx.check_eq(OptimizeStyle::pareto(std::nullopt).to_string(), "pareto", "unbounded pareto");
    ctx.check_eq(Penalty::weighted("5/2", std::string("g1")).to_string(), "penalty 5/2 in group g1",
                 "grouped penalty");
    ctx.check_eq(Penalty::weighted("2").to_string(), "penalty 2", "ungrouped penalty");
    ctx.check_eq(Penalty::default_penalty().to_string(), "default penalty", "default penalty");
}

static void test_goals(TestContext& ctx) {
    State st(sat_mode());
    SVal x = sv_mk_sym_var(st, std::nullopt, Kind::unbounded(), std::string("x"));
    add_sval_opt_goal(st, Objective<SVal>::minimize("cost", x));
    add_sval_opt_goal(st, Objective<SVal>::assert_soft("nice", sv_gt(x, lit(Kind::unbounded(), 3)),
                                                       Penalty::weighted("2")));

    ctx.check(st.goals().size() == 2, "two goals");
    const auto& g = st.goals()[0];
    ctx.check(g.value.first == sv_to_sw(st, x), "original node kept");
    ctx.check(g.value.second != g.value.first, "tracking node is fresh");
    ctx.check(st.inputs().back().name == "nice", "tracking input named after the goal");
    ctx.check(st.inputs()[1].name == "cost" && st.inputs()[1].quantifier == Quantifier::EX,
              "tracking input is existential");

    State cg(RunMode::codegen());
    ctx.check(throws_as<ModeViolation>([&] {
        add_sval_opt_goal(cg, Objective<SVal>::maximize("m", lit(kW8, 1)));
    }), "goals rejected under codegen");

    SMTConfig weak = default_z3_config();
    weak.solver.capabilities.supports_optimization = false;
    State ws(RunMode::proof(true, weak));
    ctx.check(throws_as<ValidationError>([&] {
        add_sval_opt_goal(ws, Objective<SVal>::maximize("m", lit(kW8, 1)));
    }), "goals rejected without optimisation support");
}

// ============================================================================
// Interactive mode
// ============================================================================

static void test_interactive_guard(TestContext& ctx) {
    State st(sat_mode());
    SVal x = sv_mk_sym_var(st, std::nullopt, kW8, std::string("x"));
    sv_to_sw(st, x);
    st.switch_to_interactive_mode();

    ctx.check(throws_as<UnsupportedInInteractiveMode>([&] {
        sv_mk_sym_var(st, std::nullopt, kW8, std::string("y"));
    }), "new input forbidden");
    ctx.check(throws_as<UnsupportedInInteractiveMode>([&] {
        st.new_uninterpreted("h", SBVType{{kW8}});
    }), "new uninterpreted forbidden");
    ctx.check(throws_as<UnsupportedInInteractiveMode>([&] {
        st.add_axiom("ax", {"(assert true)"});
    }), "new axiom forbidden");
    ctx.check(throws_as<UnsupportedInInteractiveMode>([&] {
        st.register_kind(Kind::real());
    }), "new kind forbidden");
    ctx.check(st.uninterpreted().empty() && st.axioms().empty(), "nothing was stored");

    auto [delta, sum] = with_new_inc_state(st, [&x](State& s) {
        return sv_to_sw(s, sv_plus(x, lit(kW8, 3)));
    });
    ctx.check(delta.new_consts.size() == 1, "the new constant is in the delta");
    ctx.check(delta.new_asgns.assignments.size() == 1
              && delta.new_asgns.assignments[0].first == sum, "the new assignment is in the delta");
    ctx.check(st.program().assignments.back().first == sum, "and in the full program");

    st.allow_in_interactive(Mutation::Input);
    sv_mk_sym_var(st, std::nullopt, kW8, std::string("y"));
    ctx.check(st.inputs().size() == 2, "inputs allowed once permitted");
    st.forbid_in_interactive(Mutation::Output);
    ctx.check(throws_as<UnsupportedInInteractiveMode>([&] { output_sval(st, x); }),
              "outputs forbidden on request");

    bool mentions = false;
    try {
        st.new_uninterpreted("h", SBVType{{kW8}});
    } catch (const UnsupportedInInteractiveMode& e) {
        mentions = contains(e.what(), "h");
    }
    ctx.check(mentions, "diagnostic names the offending declaration");
}

static void test_guard_outside_interactive(TestContext& ctx) {
    State st(proof_mode());
    st.forbid_in_interactive(Mutation::Constant);
    st.new_const(integral_cw(kW8, 1));
    st.add_axiom("ax", {"(assert true)"});
    ctx.check(st.axioms().size() == 1, "the guard only applies interactively");
    ctx.check(st.inc_state().new_consts.empty(), "no delta outside interactive mode");
}

// ============================================================================
// Query channel
// ============================================================================

static void test_query_handshake(TestContext& ctx) {
    auto st = new_symbolic_state(sat_mode());
    sv_mk_sym_var(*st, std::nullopt, kW8, std::string("x"));
    sv_mk_sym_var(*st, Quantifier::ALL, kW8, std::string("u"));

    std::vector<std::string> sent;
    std::vector<std::string> replies = {"success\n", "sat"};
    std::size_t next = 0;
    AskFn ask = [&](const std::string& cmd) {
        sent.push_back(cmd);
        return next < replies.size() ? replies[next++] : std::string("unsupported");
    };

    QueryState qs = begin_interactive_session(*st, ask, default_z3_config());
    ctx.check(is_interactive_mode(*st), "session switches to interactive");
    ctx.check(qs.context.skolems.size() == 1 && qs.context.skolems[0] == "x",
              "existential inputs become skolems");

    std::string reply;
    auto results = run_query([&reply](QueryState& q) {
        reply = q.send("(check-sat)");
        return q.default_result(true);
    }, qs);
    ctx.check(sent.size() == 2, "handshake then the query");
    ctx.check_eq(sent[0], kHandshakeCommand, "handshake command first");
    ctx.check_eq(reply, "sat", "query saw the solver reply");
    ctx.check(results.size() == 1 && results[0].kind == SMTResultKind::Unknown,
              "default result is unknown");
}

static void test_query_handshake_failure(TestContext& ctx) {
    auto st = new_symbolic_state(proof_mode());
    bool ran = false;
    QueryState qs = begin_interactive_session(*st, [](const std::string&) {
        return std::string("(error \"unsupported\")");
    }, default_z3_config());

    bool caught = false;
    try {
        run_query([&ran](QueryState& q) { ran = true; return q.default_result(false); }, qs);
    } catch (const ProtocolHandshakeError& e) {
        caught = true;
        ctx.check_eq(e.sent(), kHandshakeCommand, "names the command sent");
        ctx.check_eq(e.received(), "(error \"unsupported\")", "names the reply received");
        ctx.check(contains(e.what(), "success"), "names the expected reply");
    }
    ctx.check(caught, "ProtocolHandshakeError thrown");
    ctx.check(!ran, "user query not run");

    State cg(RunMode::codegen());
    ctx.check(throws_as<ModeViolation>([&] {
        begin_interactive_session(cg, [](const std::string&) { return std::string(); },
                                  default_z3_config());
    }), "sessions need proof mode");
}

static void test_query_tactic(TestContext& ctx) {
    State st(proof_mode());
    query(st, [](QueryState& q) { return q.get_model(); });
    ctx.check(st.tactics().size() == 1, "query installs a tactic");
    ctx.check(st.tactics()[0].kind == TacticKind::QueryUsing, "QueryUsing");
    ctx.check(st.tactics()[0].query.has_value(), "query stored");
}

static void test_stop_after_budget(TestContext& ctx) {
    ctx.check_eq(timeout_command(0), "(set-option :timeout 0)", "zero disables the budget");
    ctx.check_eq(timeout_command(7), "(set-option :timeout 7000)", "seconds become milliseconds");
    ctx.check(throws_as<ValidationError>([] { timeout_command(-1); }), "negative budget");
    ctx.check(throws_as<ValidationError>([] { timeout_command(5000000); }),
              "budget beyond 32-bit milliseconds");

    auto session = [](State& st, std::vector<std::string>& sent) {
        AskFn ask = [&sent](const std::string& cmd) {
            sent.push_back(cmd);
            return std::string("success");
        };
        QueryState qs = begin_interactive_session(st, ask, default_z3_config());
        run_query([](QueryState& q) {
            q.send("(check-sat)");
            return q.default_result(true);
        }, qs);
    };

    {
        auto st = new_symbolic_state(proof_mode());
        add_sval_tactic(*st, Tactic<SVal>::stop_after(2));
        add_sval_tactic(*st, Tactic<SVal>::stop_after(4));
        std::vector<std::string> sent;
        session(*st, sent);
        ctx.check(sent.size() == 3, "handshake, budget, query");
        ctx.check_eq(sent[0], kHandshakeCommand, "handshake first");
        ctx.check_eq(sent[1], "(set-option :timeout 4000)", "last stop-after budget sent");
        ctx.check_eq(sent[2], "(check-sat)", "query runs after the budget");
    }
    {
        auto st = new_symbolic_state(proof_mode());
        std::vector<std::string> sent;
        session(*st, sent);
        ctx.check(sent.size() == 2, "no budget without a stop-after tactic");
    }
    {
        auto st = new_symbolic_state(proof_mode());
        add_sval_tactic(*st, Tactic<SVal>::stop_after(1));
        std::vector<std::string> replies = {"success", "(error \"bad option\")"};
        std::size_t next = 0;
        QueryState qs = begin_interactive_session(*st, [&](const std::string&) {
            return next < replies.size() ? replies[next++] : std::string("sat");
        }, default_z3_config());
        bool ran = false;
        ctx.check(throws_as<ProtocolHandshakeError>([&] {
            run_query([&ran](QueryState& q) { ran = true; return q.default_result(false); }, qs);
        }), "rejected budget aborts the session");
        ctx.check(!ran, "user query not run after a rejected budget");
    }
}

static void test_z3_channel(TestContext& ctx) {
    auto st = new_symbolic_state(sat_mode());
    Z3Channel z3;
    z3.set_timeout(10);
    QueryState qs = begin_interactive_session(*st, z3.ask_function(), default_z3_config());

    std::string decl;
    std::string verdict;
    run_query([&](QueryState& q) {
        decl = trim(q.send("(declare-const a Int)"));
        q.send("(assert (> a 3))");
        verdict = trim(q.send("(check-sat)"));
        return q.default_result(true);
    }, qs);
    ctx.check_eq(decl, "success", "print-success is active after the handshake");
    ctx.check_eq(verdict, "sat", "z3 answers check-sat");
    ctx.check(z3.commands_sent() == 5, "timeout, handshake and three commands");
    ctx.check(throws_as<ValidationError>([&] { z3.set_timeout(-1); }), "negative timeout");
}

static void test_z3_timeout(TestContext& ctx) {
    // No positive solution exists (Fermat, n = 3); nonlinear integer search
    // does not terminate on its own.
    Z3Channel z3;
    z3.set_timeout(1);
    z3.ask("(declare-const x Int) (declare-const y Int) (declare-const w Int)");
    z3.ask("(assert (and (> x 1) (> y 1) (> w 1)))");
    z3.ask("(assert (= (+ (* x x x) (* y y y)) (* w w w)))");

    const auto start = std::chrono::steady_clock::now();
    const std::string verdict = trim(z3.ask("(check-sat)"));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ctx.check_eq(verdict, "unknown", "budget exhausted");
    ctx.check(elapsed < std::chrono::seconds(10), "check-sat returns within the budget");
}

// ============================================================================
// Case splits
// ============================================================================

static void test_case_split_dispatch(TestContext& ctx) {
    Result base = run_symbolic(false, default_z3_config(), [](State& st) {
        SVal x = sv_mk_sym_var(st, std::nullopt, kI32, std::string("x"));
        impose_constraint(st, std::nullopt, sv_neq(x, lit(kI32, 0)));
        add_sval_tactic(st, Tactic<SVal>::parallel_case());
        add_sval_tactic(st, Tactic<SVal>::case_split(false, {
            CaseSplitBranch<SVal>{"neg", sv_lt(x, lit(kI32, 0)), {}},
            CaseSplitBranch<SVal>{"small", sv_lt(x, lit(kI32, 10)), {Tactic<SVal>::stop_after(2)}},
            CaseSplitBranch<SVal>{"big", sv_ge(x, lit(kI32, 10)), {}},
        }));
    });

    const auto jobs = collect_case_splits(base.tactics);
    ctx.check(jobs.size() == 3, "three branch jobs");
    ctx.check(jobs[0].name == "neg" && jobs[2].name == "big", "declaration order");

    Result snap = branch_snapshot(base, jobs[1]);
    ctx.check(snap.constraints.size() == base.constraints.size() + 1, "branch adds its condition");
    ctx.check(snap.constraints.back().sw == jobs[1].condition, "condition appended last");
    ctx.check(snap.tactics.size() == 2, "split consumed, branch tactic added");
    ctx.check(stop_after_seconds(snap.tactics) == 2, "branch tactics apply");
    ctx.check(base.constraints.size() == 1, "the shared snapshot is untouched");

    const SMTConfig cfg = default_z3_config();
    auto solver = [&cfg](const Result& r, const CaseSplitJob& job) {
        return std::vector<SMTResult>{
            SMTResult::proof_error(cfg, {job.name, std::to_string(r.constraints.size())})};
    };

    for (bool parallel : {false, true}) {
        CaseSplitOptions opts;
        opts.parallel = parallel;
        opts.num_threads = 2;
        auto results = dispatch_case_splits(base, jobs, solver, opts);
        ctx.check(results.size() == 3, "one result per branch");
        ctx.check(results[0].errors[0] == "neg" && results[1].errors[0] == "small"
                  && results[2].errors[0] == "big", "outcomes in declaration order");
        ctx.check(results[1].errors[1] == "2", "each branch sees its own snapshot");
    }

    CaseSplitOptions first_only;
    first_only.aggregate = [](std::vector<CaseSplitOutcome> outs) {
        return outs.front().results;
    };
    ctx.check(dispatch_case_splits(base, jobs, solver, first_only).size() == 1,
              "aggregation is pluggable");

    ctx.check(throws_as<std::runtime_error>([&] {
        dispatch_case_splits(base, jobs, [](const Result&, const CaseSplitJob& job) {
            if (job.name == "small") throw std::runtime_error("branch failed");
            return std::vector<SMTResult>{};
        });
    }), "branch failures are rethrown");
}

// ============================================================================
// Result extraction
// ============================================================================

static void test_result_extraction(TestContext& ctx) {
    Result r = run_symbolic(false, default_z3_config(), [](State& st) {
        build_example("sum", st);
    });
    ctx.check(r.inputs.size() == 2, "two inputs");
    ctx.check(r.inputs[0].name == "x" && r.inputs[1].name == "y", "inputs in creation order");
    ctx.check(r.outputs.size() == 1 && r.outputs[0].id == 5, "x + y is node 5");
    ctx.check(r.constants.front().first == false_sw(), "constants sorted, false first");
    ctx.check(r.kinds.count(Kind::boolean()) == 1 && r.kinds.count(kI32) == 1, "used kinds");

    const std::string text = r.to_string();
    ctx.check(contains(text, "INPUTS\n  s3 :: SInt32, aliasing \"x\""), "inputs listed");
    ctx.check(contains(text, "DEFINE\n  s5 :: SInt32 = s3 + s4"), "definition listed");
    ctx.check(contains(text, "OUTPUTS\n  s5"), "outputs listed");

    auto [value, rc] = run_symbolic_prime(proof_mode(), [](State& st) {
        SVal seven = lit(kW8, 7);
        output_sval(st, seven);
        return 7;
    });
    ctx.check(value == 7, "run_symbolic_prime returns the value");
    ctx.check_eq(rc.to_string(), integral_cw(kW8, 7).to_string(),
                 "a constant computation prints as its value");

    auto [st, res] = run_symbolic_with_state(true, default_z3_config(), [](State& s) {
        sv_mk_sym_var(s, std::nullopt, kW8, std::string("z"));
    });
    ctx.check(res.inputs[0].quantifier == Quantifier::EX, "sat run");
    sv_mk_sym_var(*st, std::nullopt, kW8, std::string("w"));
    ctx.check(extract_symbolic_simulation_state(*st).inputs.size() == 2, "context stays usable");
    ctx.check(res.inputs.size() == 1, "earlier Result is unaffected");
}

static void test_examples(TestContext& ctx) {
    for (const auto& name : example_names()) {
        auto st = new_symbolic_state(proof_mode());
        bool ok = true;
        try {
            build_example(name, *st);
        } catch (const std::exception& e) {
            std::cerr << "    " << name << ": " << e.what() << "\n";
            ok = false;
        }
        ctx.check(ok, "example " + name + " builds in proof mode");
    }

    auto cc = new_symbolic_state(RunMode::concrete(1));
    ctx.check(throws_as<ValidationError>([&] { build_example("arrays", *cc); }),
              "arrays example needs symbolic mode");
    auto cg = new_symbolic_state(RunMode::codegen());
    ctx.check(throws_as<ModeViolation>([&] { build_example("goals", *cg); }),
              "goals example rejected under codegen");
    ctx.check(throws_as<std::runtime_error>([&] { build_example("nope", *cg); }),
              "unknown example");

    Result arr = run_symbolic(false, default_z3_config(), [](State& s) {
        build_example("arrays", s);
    });
    ctx.check(arr.arrays.size() == 2, "fresh plus written array");
    ctx.check_eq(arr.arrays[0].second.name, "mem", "user array name");
    ctx.check(contains(arr.to_string(), "cloned from array_0"), "provenance listed");
}

// ============================================================================
// run_selftests
// ============================================================================

int run_selftests() {
    TestRunner runner;

    // Nodes and hash-consing
    runner.run("reserved_ids",               test_reserved_ids);
    runner.run("constant_interning",         test_constant_interning);
    runner.run("commutative_sharing",        test_commutative_sharing);
    runner.run("expression_kind_checks",     test_expression_kind_checks);
    runner.run("tables",                     test_tables);

    // Cache
    runner.run("cache_sharing",              test_cache_sharing);
    runner.run("cache_collisions",           test_cache_collisions);
    runner.run("nested_uncache",             test_nested_uncache);

    // Declarations
    runner.run("uninterpreted",              test_uninterpreted);
    runner.run("inputs",                     test_inputs);
    runner.run("labels_and_identifiers",     test_labels_and_identifiers);

    // Mode policy
    runner.run("quantifier_defaults",        test_quantifier_defaults);
    runner.run("concrete_mode",              test_concrete_mode);
    runner.run("user_sorts",                 test_user_sorts);
    runner.run("mode_predicates",            test_mode_predicates);
    runner.run("randomness",                 test_randomness);
    runner.run("path_condition",             test_path_condition);

    // Arrays
    runner.run("array_handles",              test_array_handles);
    runner.run("array_initialiser",          test_array_initialiser);

    // Directives
    runner.run("constraints",                test_constraints);
    runner.run("probabilistic_constraints",  test_probabilistic_constraints);
    runner.run("assertions",                 test_assertions);
    runner.run("tactics",                    test_tactics);
    runner.run("goals",                      test_goals);

    // Interactive mode and queries
    runner.run("interactive_guard",          test_interactive_guard);
    runner.run("guard_outside_interactive",  test_guard_outside_interactive);
    runner.run("query_handshake",            test_query_handshake);
    runner.run("query_handshake_failure",    test_query_handshake_failure);
    runner.run("query_tactic",               test_query_tactic);
    runner.run("stop_after_budget",          test_stop_after_budget);
    runner.run("z3_channel",                 test_z3_channel);
    runner.run("z3_timeout",                 test_z3_timeout);

    // Case splits and results
    runner.run("case_split_dispatch",        test_case_split_dispatch);
    runner.run("result_extraction",          test_result_extraction);
    runner.run("examples",                   test_examples);

    return runner.summarise();
}

}  // namespace smtsym
