// ============================================================================
// state.cpp - Construction context: stores, guarded mutation, mode policy
// ============================================================================

#include "smtsym/state.hpp"
#include "smtsym/utils.hpp"

#include <tuple>

// #define SMTSYM_DEBUG 1  // Uncomment for debug output
#ifdef SMTSYM_DEBUG
#include <iostream>
#endif

namespace smtsym {

// ── RunMode ─────────────────────────────────────────────────────────────────

RunMode RunMode::proof(bool sat, SMTConfig cfg) {
    RunMode m;
    m.kind = RunModeKind::Proof;
    m.is_sat = sat;
    m.config = std::move(cfg);
    return m;
}

RunMode RunMode::interactive(bool sat, SMTConfig cfg) {
    RunMode m;
    m.kind = RunModeKind::Interactive;
    m.is_sat = sat;
    m.config = std::move(cfg);
    return m;
}

RunMode RunMode::codegen() {
    RunMode m;
    m.kind = RunModeKind::CodeGen;
    return m;
}

RunMode RunMode::concrete(std::uint64_t seed) {
    RunMode m;
    m.kind = RunModeKind::Concrete;
    m.seed = seed;
    return m;
}

std::string RunMode::to_string() const {
    switch (kind) {
        case RunModeKind::Proof:
        case RunModeKind::Interactive:
            return is_sat ? "Satisfiability" : "Proof";
        case RunModeKind::CodeGen:
            return "Code generation";
        case RunModeKind::Concrete:
            return "Concrete evaluation";
    }
    return "?";
}

const char* mutation_name(Mutation m) noexcept {
    switch (m) {
        case Mutation::Constant:      return "constant";
        case Mutation::Expression:    return "expression";
        case Mutation::Input:         return "input";
        case Mutation::Uninterpreted: return "uninterpreted";
        case Mutation::CodeSegment:   return "code-segment";
        case Mutation::Axiom:         return "axiom";
        case Mutation::Constraint:    return "constraint";
        case Mutation::Assertion:     return "assertion";
        case Mutation::Tactic:        return "tactic";
        case Mutation::Goal:          return "goal";
        case Mutation::UsedKind:      return "kind";
        case Mutation::Label:         return "label";
        case Mutation::Table:         return "table";
        case Mutation::Array:         return "array";
        case Mutation::Output:        return "output";
        case Mutation::Trace:         return "trace";
    }
    return "?";
}

// ── Records ─────────────────────────────────────────────────────────────────

std::string SourceLocation::to_string() const {
    std::string out = file + ":" + std::to_string(line);
    if (!function.empty()) out += " in " + function;
    return out;
}

bool TableKey::operator<(const TableKey& o) const noexcept {
    return std::tie(index_kind, result_kind, elements)
         < std::tie(o.index_kind, o.result_kind, o.elements);
}

ArrayContext ArrayContext::fresh(std::optional<SW> init) {
    ArrayContext c;
    c.kind = ArrayContextKind::Free;
    c.initial = std::move(init);
    return c;
}

ArrayContext ArrayContext::reset(ArrayIndex src, const SW& v) {
    ArrayContext c;
    c.kind = ArrayContextKind::Reset;
    c.source = src;
    c.value = v;
    return c;
}

ArrayContext ArrayContext::mutate(ArrayIndex src, const SW& addr, const SW& v) {
    ArrayContext c;
    c.kind = ArrayContextKind::Mutate;
    c.source = src;
    c.address = addr;
    c.value = v;
    return c;
}

ArrayContext ArrayContext::merge(const SW& cond, ArrayIndex a, ArrayIndex b) {
    ArrayContext c;
    c.kind = ArrayContextKind::Merge;
    c.condition = cond;
    c.source = a;
    c.other = b;
    return c;
}

std::string ArrayContext::to_string() const {
    auto typed = [](const SW& s) { return s.to_string() + " :: " + s.kind.to_string(); };
    switch (kind) {
        case ArrayContextKind::Free:
            if (!initial) return " initialized with random elements";
            return " initialized with " + typed(*initial);
        case ArrayContextKind::Reset:
            return " reset array_" + std::to_string(source) + " with " + typed(value);
        case ArrayContextKind::Mutate:
            return " cloned from array_" + std::to_string(source) + " with "
                 + typed(address) + " |-> " + typed(value);
        case ArrayContextKind::Merge:
            return " merged arrays " + std::to_string(source) + " and "
                 + std::to_string(other) + " on condition " + condition.to_string();
    }
    return "?";
}

// ============================================================================
// State
// ============================================================================

static std::uint64_t initial_seed(const RunMode& mode) {
    if (mode.kind == RunModeKind::Concrete) return mode.seed;
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
}

State::State(RunMode mode)
    : mode_(std::move(mode)), rng_(initial_seed(mode_)),
      forbidden_{Mutation::Input, Mutation::Uninterpreted, Mutation::Axiom,
                 Mutation::Constraint, Mutation::Assertion, Mutation::Tactic,
                 Mutation::Goal, Mutation::UsedKind, Mutation::Label,
                 Mutation::Table, Mutation::Array} {
    // The two boolean constants always occupy the lowest ids, whatever the
    // mode, so they bypass the interactive guard.
    used_kinds_.insert(Kind::boolean());
    const CW f = false_cw();
    const CW t = true_cw();
    consts_.emplace(std::make_pair(false, f), false_sw());
    consts_.emplace(std::make_pair(false, t), true_sw());
    next_id_ = kFirstFreeNode;
    path_cond_.push_back(SVal::constant(t));
}

void State::switch_to_interactive_mode() {
    if (mode_.kind != RunModeKind::Proof) {
        throw ModeViolation("cannot switch to interactive mode from mode: " + mode_.to_string());
    }
    mode_.kind = RunModeKind::Interactive;
}

// ── Nodes ───────────────────────────────────────────────────────────────────

SW State::new_sw(const Kind& k) {
    register_kind(k);
    return SW{k, next_id_++};
}

SW State::new_const(const CW& cw) {
    auto key = std::make_pair(cw.is_negative_zero(), cw);
    auto it = consts_.find(key);
    if (it != consts_.end()) return it->second;

    guard(Mutation::Constant, [&] {
        return std::vector<std::string>{"New constant:", "  Value: " + cw.to_string()};
    });
    SW sw = new_sw(cw.kind);
    consts_.emplace(key, sw);
    if (interactive()) inc_state_.new_consts.emplace(key, sw);
    return sw;
}

SW State::new_expr(const Kind& k, const SBVExpr& app) {
    SBVExpr e = reorder(app);
    auto it = exprs_.find(e);
    if (it != exprs_.end()) return it->second;

    guard(Mutation::Expression, [&] {
        return std::vector<std::string>{"New expression:", "  " + e.to_string()};
    });
    SW sw = new_sw(k);
    program_.assignments.emplace_back(sw, e);
    if (interactive()) inc_state_.new_asgns.assignments.emplace_back(sw, e);
    exprs_.emplace(std::move(e), sw);

#ifdef SMTSYM_DEBUG
    std::cerr << "new_expr " << sw.to_string() << " :: " << k.to_string()
              << " = " << program_.assignments.back().second.to_string() << "\n";
#endif
    return sw;
}

std::int32_t State::get_table_index(const Kind& index_kind, const Kind& result_kind,
                                    const std::vector<SW>& elements) {
    TableKey key{index_kind, result_kind, elements};
    auto it = tables_.find(key);
    if (it != tables_.end()) return it->second;

    guard(Mutation::Table, [&] {
        std::string elts;
        for (const auto& e : elements) elts += " " + e.to_string();
        return std::vector<std::string>{
            "Creation of a new table:",
            "   Index kind: " + index_kind.to_string(),
            "   Value kind: " + result_kind.to_string(),
            "   Elements  :" + elts};
    });
    const auto i = static_cast<std::int32_t>(tables_.size());
    tables_.emplace(std::move(key), i);
    return i;
}

// ── Declarations ────────────────────────────────────────────────────────────

void State::new_uninterpreted(const std::string& name, const SBVType& type,
                              const std::optional<std::vector<std::string>>& code) {
    if (type.kinds.empty()) {
        throw ValidationError("uninterpreted constant \"" + name + "\" declared with an empty type");
    }
    if (!is_valid_identifier(name)) {
        throw ValidationError("bad uninterpreted constant name: \"" + name
                              + "\". Must be a valid identifier.");
    }

    auto it = uis_.find(name);
    if (it != uis_.end()) {
        if (it->second != type) {
            throw ValidationError("uninterpreted constant \"" + name
                                  + "\" used at incompatible types\n"
                                  + "      Current type      : " + type.to_string() + "\n"
                                  + "      Previously used at: " + it->second.to_string());
        }
        return;
    }

    guard(Mutation::Uninterpreted, [&] {
        return std::vector<std::string>{"Uninterpreted function introduction:",
                                        "  Named:  " + name,
                                        "  Type :  " + type.to_string()};
    });
    if (code) {
        guard(Mutation::CodeSegment, [&] {
            return std::vector<std::string>{"User code segment:", "  Named:  " + name};
        });
    }
    uis_.emplace(name, type);
    if (code) cgs_[name] = *code;
}

void State::register_kind(const Kind& k) {
    if (k.is_user_sort() && is_smtlib_reserved(k.sort_name)) {
        throw ValidationError("\"" + k.sort_name
                              + "\" is a reserved sort; please use a different name.");
    }
    if (used_kinds_.count(k) != 0) return;

    guard(Mutation::UsedKind, [&] {
        return std::vector<std::string>{"Registering a new kind:", "  Kind: " + k.to_string()};
    });
    used_kinds_.insert(k);
}

void State::register_label(const std::string& name) {
    if (is_smtlib_reserved(name)) {
        throw ValidationError("\"" + name + "\" is a reserved string; please use a different name.");
    }
    if (name.find('|') != std::string::npos) {
        throw ValidationError("\"" + name + "\" contains the character `|', which is not allowed!");
    }
    if (name.find('\\') != std::string::npos) {
        throw ValidationError("\"" + name + "\" contains the character `\\', which is not allowed!");
    }
    if (used_labels_.count(name) != 0) {
        throw ValidationError("\"" + name
                              + "\" is used as a label multiple times. Please do not use duplicate names!");
    }

    guard(Mutation::Label, [&] {
        return std::vector<std::string>{"Registering a label:", "  Label: " + name};
    });
    used_labels_.insert(name);
}

void State::add_input(Quantifier q, const SW& sw, const std::string& name) {
    if (input_names_.count(name) != 0) {
        throw ValidationError("repeated user given name: \"" + name
                              + "\". Please use unique names.");
    }

    guard(Mutation::Input, [&] {
        return std::vector<std::string>{
            "Adding a new named input:",
            "  Name      : \"" + name + "\"",
            "  Kind      : " + sw.kind.to_string(),
            std::string("  Quantifier: ") + (q == Quantifier::EX ? "existential" : "universal"),
            "  Node      : " + sw.to_string()};
    });
    inputs_.push_back(NamedInput{q, sw, name});
    input_names_.insert(name);
}

SW State::internal_variable(const Kind& k) {
    SW sw = new_sw(k);
    Quantifier q = Quantifier::ALL;
    if (in_proof_mode(*this) && mode_.is_sat) q = Quantifier::EX;
    add_input(q, sw, "__internal_sbv_" + sw.to_string());
    return sw;
}

void State::internal_constraint(const std::optional<std::string>& name, const SVal& b) {
    SW v = sv_to_sw(*this, b);
    guard(Mutation::Constraint, [&] {
        return std::vector<std::string>{"Adding an internal constraint:",
                                        "  Named: " + name.value_or("<unnamed>")};
    });
    constraints_.push_back(NamedConstraint{name, v});
}

void State::add_assertion(const std::optional<SourceLocation>& loc,
                          const std::string& label, const SW& cond) {
    guard(Mutation::Assertion, [&] {
        return std::vector<std::string>{
            "Named assertions (sAssert):",
            "  Tag: " + label,
            "  Loc: " + (loc ? loc->to_string() : std::string("Unknown"))};
    });
    assertions_.push_back(NamedAssertion{label, loc, cond});
}

void State::add_axiom(const std::string& name, const std::vector<std::string>& lines) {
    guard(Mutation::Axiom, [&] {
        return std::vector<std::string>{"Adding a new axiom:",
                                        "  Named: \"" + name + "\"",
                                        "  Axiom: " + join(lines, "\n")};
    });
    axioms_.emplace_back(name, lines);
}

void State::add_tactic(Tactic<SW> t) {
    guard(Mutation::Tactic, [&] {
        return std::vector<std::string>{"Adding a new tactic:", "  Tactic: " + tactic_to_string(t)};
    });
    tactics_.push_back(std::move(t));
}

void State::add_goal(ResolvedObjective g) {
    guard(Mutation::Goal, [&] {
        return std::vector<std::string>{"Adding an optimization objective:",
                                        "  Objective: " + objective_to_string(g)};
    });
    goals_.push_back(std::move(g));
}

void State::add_output(const SW& sw) {
    guard(Mutation::Output, [&] {
        return std::vector<std::string>{"Adding an output:", "  Node: " + sw.to_string()};
    });
    outputs_.push_back(sw);
}

void State::add_trace(const std::string& name, const CW& cw) {
    guard(Mutation::Trace, [&] {
        return std::vector<std::string>{"Recording a concrete value:", "  Named: " + name};
    });
    trace_.emplace_back(name, cw);
}

ArrayIndex State::new_array(const std::string& name, const std::pair<Kind, Kind>& kinds,
                            const ArrayContext& ctx) {
    guard(Mutation::Array, [&] {
        return std::vector<std::string>{
            "A new array:",
            "  Array info: " + kinds.first.to_string() + " -> " + kinds.second.to_string(),
            "  Named     : \"" + name + "\""};
    });
    const ArrayIndex i = next_array_index();
    arrays_.push_back(ArrayInfo{name, kinds, ctx});
    return i;
}

// ── Randomness ──────────────────────────────────────────────────────────────

double State::throw_dice() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng_);
}

void State::reseed(std::uint64_t seed) {
    rng_.seed(seed);
}

std::mt19937_64 State::fork_rng() {
    return std::mt19937_64(rng_());
}

// ── Path condition ──────────────────────────────────────────────────────────

State::PathScope::PathScope(State& st, SVal cond) : st_(st) {
    st_.path_cond_.push_back(std::move(cond));
}

State::PathScope::~PathScope() {
    st_.path_cond_.pop_back();
}

State::PathScope State::extend_path_condition(const std::function<SVal(const SVal&)>& f) {
    return PathScope(*this, f(path_condition()));
}

// ── Incremental state ───────────────────────────────────────────────────────

IncState State::replace_inc_state(IncState is) {
    IncState old = std::move(inc_state_);
    inc_state_ = std::move(is);
    return old;
}

// ============================================================================
// Mode predicates
// ============================================================================

bool in_proof_mode(const State& st) noexcept {
    const auto k = st.run_mode().kind;
    return k == RunModeKind::Proof || k == RunModeKind::Interactive;
}

bool in_non_interactive_proof_mode(const State& st) noexcept {
    return st.run_mode().kind == RunModeKind::Proof;
}

bool is_interactive_mode(const State& st) noexcept {
    return st.run_mode().kind == RunModeKind::Interactive;
}

bool is_codegen_mode(const State& st) noexcept {
    return st.run_mode().kind == RunModeKind::CodeGen;
}

bool is_concrete_mode(const State& st) noexcept {
    return st.run_mode().kind == RunModeKind::Concrete;
}

std::optional<SMTConfig> sbranch_run_config(const State& st) {
    if (st.run_mode().kind == RunModeKind::Proof) return st.run_mode().config;
    return std::nullopt;
}

}  // namespace smtsym
