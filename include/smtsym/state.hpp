// ============================================================================
// smtsym/state.hpp - Construction context and mode policy
// ============================================================================
//
// Design notes:
//
//   State is the single mutable aggregate of a symbolic run.  It owns every
//   store (constants, expressions, tables, arrays, uninterpreted names,
//   inputs, constraints, tactics, goals, assertions, ...), the id counter,
//   the random generator and the path condition.  Every builder takes it by
//   reference; it is never shared between threads.
//
//   Run modes:
//
//     Proof(is_sat, cfg)        batch solving; is_sat selects satisfiability
//                               search (existential default) over proving
//     Interactive(is_sat, cfg)  entered from Proof once a query session
//                               starts; additions are mirrored into the
//                               incremental sub-state
//     CodeGen                   code emission; no constraints or sampling
//     Concrete(seed)            random testing; variables get random values
//
//   Guarded mutation: each store update is tagged with a Mutation.  In
//   Interactive mode, updates whose tag is in the forbidden set throw
//   UnsupportedInInteractiveMode before anything changes.
//
// ============================================================================

#ifndef SMTSYM_STATE_HPP
#define SMTSYM_STATE_HPP

#include "smtsym/cache.hpp"
#include "smtsym/concrete.hpp"
#include "smtsym/errors.hpp"
#include "smtsym/node.hpp"
#include "smtsym/solver_config.hpp"
#include "smtsym/sval.hpp"
#include "smtsym/tactic.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace smtsym {

// ── RunMode ─────────────────────────────────────────────────────────────────

enum class RunModeKind : std::uint8_t { Proof, Interactive, CodeGen, Concrete };

struct RunMode {
    RunModeKind              kind = RunModeKind::Proof;
    bool                     is_sat = false;   // Proof / Interactive only
    std::optional<SMTConfig> config;           // Proof / Interactive only
    std::uint64_t            seed = 0;         // Concrete only

    static RunMode proof(bool sat, SMTConfig cfg);
    static RunMode interactive(bool sat, SMTConfig cfg);
    static RunMode codegen();
    static RunMode concrete(std::uint64_t seed);

    /// "Satisfiability", "Proof", "Code generation" or "Concrete evaluation".
    std::string to_string() const;
};

// ── Mutation ────────────────────────────────────────────────────────────────

enum class Mutation : std::uint8_t {
    Constant, Expression, Input, Uninterpreted, CodeSegment, Axiom,
    Constraint, Assertion, Tactic, Goal, UsedKind, Label, Table, Array,
    Output, Trace
};

const char* mutation_name(Mutation m) noexcept;

// ── IncState ────────────────────────────────────────────────────────────────
// Constants and assignments added since the last incremental round.

using ConstMap = std::map<std::pair<bool, CW>, SW>;

struct IncState {
    ConstMap new_consts;
    SBVPgm   new_asgns;
};

// ── SourceLocation ──────────────────────────────────────────────────────────
// Opaque caller-supplied position of an assertion.

struct SourceLocation {
    std::string file;
    int         line = 0;
    std::string function;

    std::string to_string() const;
};

// ── Store records ───────────────────────────────────────────────────────────

struct NamedInput {
    Quantifier  quantifier = Quantifier::ALL;
    SW          sw;
    std::string name;
};

struct NamedConstraint {
    std::optional<std::string> name;
    SW                         sw;
};

struct NamedAssertion {
    std::string                   label;
    std::optional<SourceLocation> location;
    SW                            condition;
};

struct TableKey {
    Kind            index_kind;
    Kind            result_kind;
    std::vector<SW> elements;

    bool operator<(const TableKey& o) const noexcept;
};

using ArrayIndex = std::int32_t;

enum class ArrayContextKind : std::uint8_t { Free, Reset, Mutate, Merge };

/// How an array handle was derived.  Sources always precede the handle.
struct ArrayContext {
    ArrayContextKind  kind = ArrayContextKind::Free;
    std::optional<SW> initial;       // Free
    ArrayIndex        source = -1;   // Reset, Mutate, Merge (then-branch)
    ArrayIndex        other = -1;    // Merge (else-branch)
    SW                address;       // Mutate
    SW                value;         // Reset, Mutate
    SW                condition;     // Merge

    static ArrayContext fresh(std::optional<SW> init);
    static ArrayContext reset(ArrayIndex src, const SW& v);
    static ArrayContext mutate(ArrayIndex src, const SW& addr, const SW& v);
    static ArrayContext merge(const SW& cond, ArrayIndex a, ArrayIndex b);

    std::string to_string() const;
};

struct ArrayInfo {
    std::string          name;
    std::pair<Kind, Kind> kinds;   // index kind, element kind
    ArrayContext         context;
};

// ── State ───────────────────────────────────────────────────────────────────

class State {
public:
    /// A fresh context.  false and true are interned as nodes 1 and 2.
    explicit State(RunMode mode);

    State(const State&) = delete;
    State& operator=(const State&) = delete;

    const RunMode& run_mode() const noexcept { return mode_; }

    /// Proof -> Interactive.  Throws ModeViolation from any other mode.
    void switch_to_interactive_mode();

    // ── Nodes ───────────────────────────────────────────────────────────

    /// Allocate the next node id for kind k and register the kind.
    SW new_sw(const Kind& k);

    /// Intern a constant.  +0.0 and -0.0 get separate nodes.
    SW new_const(const CW& cw);

    /// Intern an application, canonicalising commutative operands first.
    SW new_expr(const Kind& k, const SBVExpr& e);

    /// Intern a lookup table; a new table receives the current store size.
    std::int32_t get_table_index(const Kind& index_kind, const Kind& result_kind,
                                 const std::vector<SW>& elements);

    // ── Declarations ────────────────────────────────────────────────────

    void new_uninterpreted(const std::string& name, const SBVType& type,
                           const std::optional<std::vector<std::string>>& code = std::nullopt);

    void register_kind(const Kind& k);
    void register_label(const std::string& name);

    /// Append a named input.  Throws ValidationError on a repeated name.
    void add_input(Quantifier q, const SW& sw, const std::string& name);

    /// A fresh input hidden from the user, quantified by mode.
    SW internal_variable(const Kind& k);

    void internal_constraint(const std::optional<std::string>& name, const SVal& b);
    void add_assertion(const std::optional<SourceLocation>& loc,
                       const std::string& label, const SW& cond);
    void add_axiom(const std::string& name, const std::vector<std::string>& lines);
    void add_tactic(Tactic<SW> t);
    void add_goal(ResolvedObjective g);
    void add_output(const SW& sw);
    void add_trace(const std::string& name, const CW& cw);

    /// Append an array; its handle is the store size before the call.
    ArrayIndex new_array(const std::string& name, const std::pair<Kind, Kind>& kinds,
                         const ArrayContext& ctx);

    /// Next array handle, i.e. the current array store size.
    ArrayIndex next_array_index() const noexcept {
        return static_cast<ArrayIndex>(arrays_.size());
    }

    // ── Randomness ──────────────────────────────────────────────────────

    /// Uniform draw in [0, 1).
    double throw_dice();
    void reseed(std::uint64_t seed);
    /// An independent generator seeded from this one.
    std::mt19937_64 fork_rng();
    std::mt19937_64& rng() noexcept { return rng_; }

    // ── Path condition ──────────────────────────────────────────────────

    const SVal& path_condition() const noexcept { return path_cond_.back(); }

    class PathScope {
    public:
        PathScope(State& st, SVal cond);
        ~PathScope();
        PathScope(const PathScope&) = delete;
        PathScope& operator=(const PathScope&) = delete;
    private:
        State& st_;
    };

    /// Push f(current path condition) until the returned scope is destroyed.
    PathScope extend_path_condition(const std::function<SVal(const SVal&)>& f);

    // ── Interactive policy ──────────────────────────────────────────────

    void allow_in_interactive(Mutation m) { forbidden_.erase(m); }
    void forbid_in_interactive(Mutation m) { forbidden_.insert(m); }
    bool is_forbidden_in_interactive(Mutation m) const { return forbidden_.count(m) != 0; }

    // ── Caches and incremental state ────────────────────────────────────

    CacheTable<SW>& sw_cache() noexcept { return sw_cache_; }
    CacheTable<ArrayIndex>& ai_cache() noexcept { return ai_cache_; }

    const IncState& inc_state() const noexcept { return inc_state_; }
    /// Install a new incremental sub-state and return the previous one.
    IncState replace_inc_state(IncState is);

    // ── Store accessors ─────────────────────────────────────────────────

    NodeId next_node_id() const noexcept { return next_id_; }
    const std::vector<std::pair<std::string, CW>>& trace_info() const noexcept { return trace_; }
    const std::set<Kind>& used_kinds() const noexcept { return used_kinds_; }
    const std::set<std::string>& used_labels() const noexcept { return used_labels_; }
    const std::vector<NamedInput>& inputs() const noexcept { return inputs_; }
    const std::vector<NamedConstraint>& constraints() const noexcept { return constraints_; }
    const std::vector<SW>& outputs() const noexcept { return outputs_; }
    const std::map<TableKey, std::int32_t>& tables() const noexcept { return tables_; }
    const SBVPgm& program() const noexcept { return program_; }
    const ConstMap& constants() const noexcept { return consts_; }
    std::size_t expression_count() const noexcept { return exprs_.size(); }
    const std::vector<ArrayInfo>& arrays() const noexcept { return arrays_; }
    const std::map<std::string, SBVType>& uninterpreted() const noexcept { return uis_; }
    const std::map<std::string, std::vector<std::string>>& code_segments() const noexcept { return cgs_; }
    const std::vector<std::pair<std::string, std::vector<std::string>>>& axioms() const noexcept { return axioms_; }
    const std::vector<Tactic<SW>>& tactics() const noexcept { return tactics_; }
    const std::vector<ResolvedObjective>& goals() const noexcept { return goals_; }
    const std::vector<NamedAssertion>& assertions() const noexcept { return assertions_; }

private:
    // Throws UnsupportedInInteractiveMode when m is blocked.  details() is
    // only evaluated on failure.
    template <typename Details>
    void guard(Mutation m, Details&& details) const {
        if (mode_.kind == RunModeKind::Interactive && forbidden_.count(m) != 0) {
            throw UnsupportedInInteractiveMode(details());
        }
    }

    bool interactive() const noexcept { return mode_.kind == RunModeKind::Interactive; }

    RunMode         mode_;
    NodeId          next_id_ = kFalseNode;
    std::mt19937_64 rng_;
    std::set<Mutation> forbidden_;

    std::vector<std::pair<std::string, CW>> trace_;
    std::set<Kind>                          used_kinds_;
    std::set<std::string>                   used_labels_;
    std::vector<NamedInput>                 inputs_;
    std::unordered_set<std::string>         input_names_;
    std::vector<NamedConstraint>            constraints_;
    std::vector<SW>                         outputs_;
    std::map<TableKey, std::int32_t>        tables_;
    SBVPgm                                  program_;
    ConstMap                                consts_;
    std::unordered_map<SBVExpr, SW, SBVExprHash> exprs_;
    std::vector<ArrayInfo>                  arrays_;
    std::map<std::string, SBVType>          uis_;
    std::map<std::string, std::vector<std::string>> cgs_;
    std::vector<std::pair<std::string, std::vector<std::string>>> axioms_;
    std::vector<Tactic<SW>>                 tactics_;
    std::vector<ResolvedObjective>          goals_;
    std::vector<NamedAssertion>             assertions_;

    CacheTable<SW>         sw_cache_;
    CacheTable<ArrayIndex> ai_cache_;
    IncState               inc_state_;
    std::vector<SVal>      path_cond_;
};

// ── Mode predicates ─────────────────────────────────────────────────────────

bool in_proof_mode(const State& st) noexcept;                  // Proof or Interactive
bool in_non_interactive_proof_mode(const State& st) noexcept;  // Proof only
bool is_interactive_mode(const State& st) noexcept;
bool is_codegen_mode(const State& st) noexcept;
bool is_concrete_mode(const State& st) noexcept;

/// The solver configuration when running in batch Proof mode.
std::optional<SMTConfig> sbranch_run_config(const State& st);

// ── Incremental rounds ──────────────────────────────────────────────────────

/// Run f against st with a fresh incremental sub-state and return what f
/// added to it together with f's result.
template <typename F>
auto with_new_inc_state(State& st, F&& f) -> std::pair<IncState, decltype(f(st))> {
    st.replace_inc_state(IncState{});
    auto r = f(st);
    return {st.inc_state(), std::move(r)};
}

}  // namespace smtsym

#endif  // SMTSYM_STATE_HPP
