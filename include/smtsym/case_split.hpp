// ============================================================================
// smtsym/case_split.hpp - Case-split branch dispatch
// ============================================================================
//
// A CaseSplit tactic names branches, each with a boolean condition and its
// own tactics.  Branches are independent problems: each one is solved on a
// private copy of the Result snapshot extended with the branch condition as
// a constraint and the branch tactics.
//
// With OpenMP (SMTSYM_USE_OPENMP) and options.parallel, branches are handed
// to a parallel loop.  The outcomes are always presented to the aggregator
// in branch declaration order.
//
// ============================================================================

#ifndef SMTSYM_CASE_SPLIT_HPP
#define SMTSYM_CASE_SPLIT_HPP

#include "smtsym/result.hpp"

#include <functional>
#include <string>
#include <vector>

namespace smtsym {

struct CaseSplitJob {
    std::string             name;
    SW                      condition;
    std::vector<Tactic<SW>> tactics;
    bool                    verbose = false;
};

struct CaseSplitOutcome {
    std::string            name;
    std::vector<SMTResult> results;
};

using BranchSolver = std::function<std::vector<SMTResult>(const Result&, const CaseSplitJob&)>;
using BranchAggregator = std::function<std::vector<SMTResult>(std::vector<CaseSplitOutcome>)>;

struct CaseSplitOptions {
    bool             parallel = false;
    int              num_threads = 0;   // 0 = OpenMP default
    BranchAggregator aggregate;         // empty = concatenate in order
};

/// Flatten the top-level CaseSplit tactics into branch jobs, in order.
std::vector<CaseSplitJob> collect_case_splits(const std::vector<Tactic<SW>>& tactics);

/// The snapshot a branch is solved on.
Result branch_snapshot(const Result& snapshot, const CaseSplitJob& job);

/// Solve every job with solver and aggregate the outcomes.
/// An exception thrown by any branch is rethrown after all branches ran.
std::vector<SMTResult> dispatch_case_splits(const Result& snapshot,
                                            const std::vector<CaseSplitJob>& jobs,
                                            const BranchSolver& solver,
                                            const CaseSplitOptions& options = {});

}  // namespace smtsym

#endif  // SMTSYM_CASE_SPLIT_HPP
