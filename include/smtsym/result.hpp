// ============================================================================
// smtsym/result.hpp - Immutable snapshot of a symbolic run
// ============================================================================
//
// A Result is what the back end consumes: it walks the fields in declaration
// order, which is also the order in which the script is emitted.
//
//   kinds          used kinds
//   traces         concrete values drawn in Concrete mode
//   code_segments  user code for uninterpreted names
//   inputs         in creation order
//   constants      sorted by node
//   tables         sorted by index
//   arrays         ascending handle
//   uninterpreted  sorted by name
//   axioms, program, constraints, tactics, goals, assertions, outputs
//                  in creation order
//
// ============================================================================

#ifndef SMTSYM_RESULT_HPP
#define SMTSYM_RESULT_HPP

#include "smtsym/state.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace smtsym {

struct TableEntry {
    std::int32_t    index = 0;
    Kind            index_kind;
    Kind            result_kind;
    std::vector<SW> elements;
};

struct Result {
    std::set<Kind>                                                kinds;
    std::vector<std::pair<std::string, CW>>                       traces;
    std::vector<std::pair<std::string, std::vector<std::string>>> code_segments;
    std::vector<NamedInput>                                       inputs;
    std::vector<std::pair<SW, CW>>                                constants;
    std::vector<TableEntry>                                       tables;
    std::vector<std::pair<ArrayIndex, ArrayInfo>>                 arrays;
    std::vector<std::pair<std::string, SBVType>>                  uninterpreted;
    std::vector<std::pair<std::string, std::vector<std::string>>> axioms;
    SBVPgm                                                        program;
    std::vector<NamedConstraint>                                  constraints;
    std::vector<Tactic<SW>>                                       tactics;
    std::vector<ResolvedObjective>                                goals;
    std::vector<NamedAssertion>                                   assertions;
    std::vector<SW>                                               outputs;

    /// Sectioned debug listing.  A run whose only content is one constant
    /// output renders as that constant.
    std::string to_string() const;
};

/// Read every store of st once and freeze it.
Result extract_symbolic_simulation_state(const State& st);

/// A fresh context in the given mode, with false and true interned.
std::unique_ptr<State> new_symbolic_state(RunMode mode);

/// Run f in a fresh context and return its value with the extracted Result.
template <typename F>
auto run_symbolic_prime(RunMode mode, F&& f)
    -> std::pair<decltype(f(std::declval<State&>())), Result> {
    auto st = new_symbolic_state(std::move(mode));
    auto r = f(*st);
    Result res = extract_symbolic_simulation_state(*st);
    return {std::move(r), std::move(res)};
}

/// Run f in Proof mode and return the Result.
Result run_symbolic(bool is_sat, const SMTConfig& cfg,
                    const std::function<void(State&)>& f);

/// Run f in Proof mode and keep the context alive for further rounds.
std::pair<std::unique_ptr<State>, Result>
run_symbolic_with_state(bool is_sat, const SMTConfig& cfg,
                        const std::function<void(State&)>& f);

}  // namespace smtsym

#endif  // SMTSYM_RESULT_HPP
