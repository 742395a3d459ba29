// ============================================================================
// smtsym/tactic.hpp - Solver tactics and optimisation objectives
// ============================================================================
//
// Tactics and objectives are parameterised over the value type they carry:
//
//   Tactic<SVal>                  as given by the user
//   Tactic<SW>                    as stored in the context and in a Result
//   Objective<SVal>               as given by the user
//   Objective<std::pair<SW, SW>>  as stored: (original, tracking) nodes
//
// Both are flat tagged records: the tag selects which payload fields are
// meaningful, the others keep their defaults.
//
// ============================================================================

#ifndef SMTSYM_TACTIC_HPP
#define SMTSYM_TACTIC_HPP

#include "smtsym/node.hpp"
#include "smtsym/solver_config.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace smtsym {

// ── OptimizeStyle ───────────────────────────────────────────────────────────

struct OptimizeStyle {
    enum class Kind : std::uint8_t { Lexicographic, Independent, Pareto };

    Kind               kind = Kind::Lexicographic;
    std::optional<int> max_fronts;   // Pareto only

    static OptimizeStyle lexicographic() { return OptimizeStyle{}; }
    static OptimizeStyle independent() {
        return OptimizeStyle{Kind::Independent, std::nullopt};
    }
    static OptimizeStyle pareto(std::optional<int> fronts = std::nullopt) {
        return OptimizeStyle{Kind::Pareto, fronts};
    }

    std::string to_string() const;
};

// ── Penalty ─────────────────────────────────────────────────────────────────
// The default penalty is a weight of 1 in the anonymous group.

struct Penalty {
    bool                       is_default = true;
    std::string                weight;     // rational text, e.g. "5/2"
    std::optional<std::string> group;

    static Penalty default_penalty() { return Penalty{}; }
    static Penalty weighted(std::string w, std::optional<std::string> g = std::nullopt) {
        return Penalty{false, std::move(w), std::move(g)};
    }

    std::string to_string() const;
};

// ── Tactic ──────────────────────────────────────────────────────────────────

enum class TacticKind : std::uint8_t {
    CaseSplit,            // verbose flag + branches
    CheckCaseVacuity,     // flag
    ParallelCase,
    CheckConstrVacuity,   // flag
    StopAfter,            // seconds
    CheckUsing,           // text
    UseSolver,            // solver
    SetOptions,           // options
    OptimizePriority,     // style
    QueryUsing            // query
};

template <typename T> struct Tactic;

template <typename T>
struct CaseSplitBranch {
    std::string            name;
    T                      condition;
    std::vector<Tactic<T>> tactics;
};

template <typename T>
struct Tactic {
    TacticKind                      kind = TacticKind::ParallelCase;
    bool                            flag = false;
    std::vector<CaseSplitBranch<T>> branches;
    int                             seconds = 0;
    std::string                     text;
    std::optional<SMTConfig>        solver;
    std::vector<SMTOption>          options;
    OptimizeStyle                   style;
    std::optional<Query>            query;

    static Tactic case_split(bool verbose, std::vector<CaseSplitBranch<T>> bs) {
        Tactic t;
        t.kind = TacticKind::CaseSplit;
        t.flag = verbose;
        t.branches = std::move(bs);
        return t;
    }
    static Tactic check_case_vacuity(bool b) {
        Tactic t;
        t.kind = TacticKind::CheckCaseVacuity;
        t.flag = b;
        return t;
    }
    static Tactic parallel_case() {
        Tactic t;
        t.kind = TacticKind::ParallelCase;
        return t;
    }
    static Tactic check_constr_vacuity(bool b) {
        Tactic t;
        t.kind = TacticKind::CheckConstrVacuity;
        t.flag = b;
        return t;
    }
    static Tactic stop_after(int secs) {
        Tactic t;
        t.kind = TacticKind::StopAfter;
        t.seconds = secs;
        return t;
    }
    static Tactic check_using(std::string cmd) {
        Tactic t;
        t.kind = TacticKind::CheckUsing;
        t.text = std::move(cmd);
        return t;
    }
    static Tactic use_solver(SMTConfig cfg) {
        Tactic t;
        t.kind = TacticKind::UseSolver;
        t.solver = std::move(cfg);
        return t;
    }
    static Tactic set_options(std::vector<SMTOption> opts) {
        Tactic t;
        t.kind = TacticKind::SetOptions;
        t.options = std::move(opts);
        return t;
    }
    static Tactic optimize_priority(OptimizeStyle s) {
        Tactic t;
        t.kind = TacticKind::OptimizePriority;
        t.style = s;
        return t;
    }
    static Tactic query_using(Query q) {
        Tactic t;
        t.kind = TacticKind::QueryUsing;
        t.query = std::move(q);
        return t;
    }
};

/// Whether a ParallelCase appears at top level or inside any case-split branch.
template <typename T>
bool is_parallel_case_anywhere(const Tactic<T>& t) {
    switch (t.kind) {
        case TacticKind::ParallelCase:
            return true;
        case TacticKind::CaseSplit:
            for (const auto& b : t.branches) {
                for (const auto& sub : b.tactics) {
                    if (is_parallel_case_anywhere(sub)) return true;
                }
            }
            return false;
        default:
            return false;
    }
}

/// The last StopAfter budget among the given tactics, if any.
template <typename T>
std::optional<int> stop_after_seconds(const std::vector<Tactic<T>>& ts) {
    std::optional<int> secs;
    for (const auto& t : ts) {
        if (t.kind == TacticKind::StopAfter) secs = t.seconds;
    }
    return secs;
}

std::string tactic_to_string(const Tactic<SW>& t);

// ── Objective ───────────────────────────────────────────────────────────────

enum class ObjectiveKind : std::uint8_t { Minimize, Maximize, AssertSoft };

template <typename T>
struct Objective {
    ObjectiveKind kind = ObjectiveKind::Minimize;
    std::string   name;
    T             value;
    Penalty       penalty;   // AssertSoft only

    static Objective minimize(std::string nm, T v) {
        return Objective{ObjectiveKind::Minimize, std::move(nm), std::move(v), Penalty{}};
    }
    static Objective maximize(std::string nm, T v) {
        return Objective{ObjectiveKind::Maximize, std::move(nm), std::move(v), Penalty{}};
    }
    static Objective assert_soft(std::string nm, T v, Penalty p = Penalty{}) {
        return Objective{ObjectiveKind::AssertSoft, std::move(nm), std::move(v), std::move(p)};
    }
};

template <typename T>
const std::string& objective_name(const Objective<T>& o) noexcept {
    return o.name;
}

using ResolvedObjective = Objective<std::pair<SW, SW>>;

std::string objective_to_string(const ResolvedObjective& o);

}  // namespace smtsym

#endif  // SMTSYM_TACTIC_HPP
