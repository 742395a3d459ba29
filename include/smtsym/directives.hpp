// ============================================================================
// smtsym/directives.hpp - Constraints, assertions, tactics and objectives
// ============================================================================
//
// User-directed solver guidance.  Every embedded symbolic value is resolved
// into a node of the context before the directive is stored, so a Result
// only ever contains node references.
//
// ============================================================================

#ifndef SMTSYM_DIRECTIVES_HPP
#define SMTSYM_DIRECTIVES_HPP

#include "smtsym/state.hpp"
#include "smtsym/sval.hpp"
#include "smtsym/tactic.hpp"

#include <optional>
#include <string>
#include <vector>

namespace smtsym {

/// Resolve the values inside t (recursively through case-split branches)
/// and append the result to the tactics.
void add_sval_tactic(State& st, const Tactic<SVal>& t);

/// Register an optimisation goal.  A fresh existential tracking input named
/// after the objective is introduced and stored next to the original node.
/// Illegal under CodeGen and with solvers that cannot optimise.
void add_sval_opt_goal(State& st, const Objective<SVal>& obj);

/// Require the boolean c.  A name is registered as a label.
void impose_constraint(State& st, const std::optional<std::string>& name, const SVal& c);

/// With no probability, the same as impose_constraint(c).  Otherwise impose
/// c with the given probability and alt in the remaining cases; only legal
/// in Concrete mode.
void add_sval_constraint(State& st, const std::optional<std::string>& name,
                         std::optional<double> probability,
                         const SVal& c, const SVal& alt);

/// Record a labelled assertion.  Labels need not be unique.
void add_sval_assertion(State& st, const std::optional<SourceLocation>& loc,
                        const std::string& label, const SVal& cond);

}  // namespace smtsym

#endif  // SMTSYM_DIRECTIVES_HPP
