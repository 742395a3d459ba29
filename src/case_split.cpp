// ============================================================================
// case_split.cpp - Case-split branch dispatch
// ============================================================================

#include "smtsym/case_split.hpp"

#include <exception>
#include <iostream>

#ifdef SMTSYM_USE_OPENMP
#include <omp.h>
#endif

namespace smtsym {

std::vector<CaseSplitJob> collect_case_splits(const std::vector<Tactic<SW>>& tactics) {
    std::vector<CaseSplitJob> jobs;
    for (const auto& t : tactics) {
        if (t.kind != TacticKind::CaseSplit) continue;
        for (const auto& b : t.branches) {
            jobs.push_back(CaseSplitJob{b.name, b.condition, b.tactics, t.flag});
        }
    }
    return jobs;
}

Result branch_snapshot(const Result& snapshot, const CaseSplitJob& job) {
    Result r = snapshot;

    // The split itself is consumed here; keep the other tactics.
    std::vector<Tactic<SW>> kept;
    for (const auto& t : r.tactics) {
        if (t.kind != TacticKind::CaseSplit) kept.push_back(t);
    }
    kept.insert(kept.end(), job.tactics.begin(), job.tactics.end());
    r.tactics = std::move(kept);

    r.constraints.push_back(NamedConstraint{job.name, job.condition});
    return r;
}

static std::vector<SMTResult> concatenate(std::vector<CaseSplitOutcome> outcomes) {
    std::vector<SMTResult> all;
    for (auto& o : outcomes) {
        for (auto& r : o.results) all.push_back(std::move(r));
    }
    return all;
}

std::vector<SMTResult> dispatch_case_splits(const Result& snapshot,
                                            const std::vector<CaseSplitJob>& jobs,
                                            const BranchSolver& solver,
                                            const CaseSplitOptions& options) {
    const int n = static_cast<int>(jobs.size());
    std::vector<CaseSplitOutcome>   outcomes(jobs.size());
    std::vector<std::exception_ptr> failures(jobs.size());

    auto solve_one = [&](int i) {
        const CaseSplitJob& job = jobs[i];
        if (job.verbose) {
#ifdef SMTSYM_USE_OPENMP
            #pragma omp critical(smtsym_case_split_log)
#endif
            std::cerr << "[case-split] " << job.name << "\n";
        }
        try {
            outcomes[i].name = job.name;
            outcomes[i].results = solver(branch_snapshot(snapshot, job), job);
        } catch (...) {
            // Exceptions must not leave a parallel region; rethrown below.
            failures[i] = std::current_exception();
        }
    };

#ifdef SMTSYM_USE_OPENMP
    const bool par = options.parallel && n > 1;
    if (par && options.num_threads > 0) omp_set_num_threads(options.num_threads);
    #pragma omp parallel for schedule(dynamic) if(par)
    for (int i = 0; i < n; ++i) solve_one(i);
#else
    for (int i = 0; i < n; ++i) solve_one(i);
#endif

    for (const auto& f : failures) {
        if (f) std::rethrow_exception(f);
    }

    if (options.aggregate) return options.aggregate(std::move(outcomes));
    return concatenate(std::move(outcomes));
}

}  // namespace smtsym
