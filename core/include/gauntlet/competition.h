#pragma once

// Competition execution engine.
//
//   queue      queue_candidate(c, i) for every candidate, in order
//   prepare    prepare_candidates(all) -> {ready, failures};
//              on_preparation_failure for each failure, then
//              on_candidate_prepared for each ready entry
//   execute    ready entries through run_prepared_with_limit
//   finalize   finalize_competition(), always, exactly once
//   aggregate  failures followed by execution results, optionally
//              stable-sorted once
//
// An error in any phase skips the remaining phases except finalize. A
// finalize error is recorded after the earlier one, never instead of it.

#include "config.h"
#include "errors.h"
#include "worker_pool.h"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <vector>

namespace gauntlet {

template <typename Prepared, typename Result>
struct PreparationResult {
    std::vector<Prepared> ready;
    std::vector<Result> failures;
};

template <typename Result>
struct CompetitionOptions {
    int max_parallel{1};
    FailurePolicy failure_policy{FailurePolicy::ABORT};
    // Strict weak "less than". Empty: keep aggregation order.
    std::function<bool(const Result&, const Result&)> sort_results;
};

// Execution hooks (inherited) plus the competition-level phases. Only
// prepare_candidates and execute are mandatory.
template <typename Candidate, typename Prepared, typename Result>
class CompetitionAdapter : public PreparedExecutionHooks<Prepared, Result> {
public:
    virtual void queue_candidate(const Candidate& candidate, size_t index) {
        (void)candidate; (void)index;
    }

    virtual PreparationResult<Prepared, Result> prepare_candidates(
        const std::vector<Candidate>& candidates) = 0;

    virtual void on_preparation_failure(const Result& result, size_t index) {
        (void)result; (void)index;
    }
    virtual void on_candidate_prepared(const Prepared& prepared, size_t index) {
        (void)prepared; (void)index;
    }
    virtual void finalize_competition() {}
};

template <typename Candidate, typename Prepared, typename Result>
std::vector<Result> execute_competition(const std::vector<Candidate>& candidates,
                                        const CompetitionOptions<Result>& options,
                                        CompetitionAdapter<Candidate, Prepared, Result>& adapter) {
    ErrorCollector errors;
    std::vector<Result> results;

    try {
        for (size_t i = 0; i < candidates.size(); i++) {
            adapter.queue_candidate(candidates[i], i);
        }

        PreparationResult<Prepared, Result> prep = adapter.prepare_candidates(candidates);

        for (size_t i = 0; i < prep.failures.size(); i++) {
            adapter.on_preparation_failure(prep.failures[i], i);
        }
        for (size_t i = 0; i < prep.ready.size(); i++) {
            adapter.on_candidate_prepared(prep.ready[i], i);
        }

        std::vector<Result> executed = run_prepared_with_limit<Prepared, Result>(
            prep.ready, options.max_parallel, adapter, options.failure_policy);

        results.reserve(prep.failures.size() + executed.size());
        for (auto& r : prep.failures) results.push_back(std::move(r));
        for (auto& r : executed) results.push_back(std::move(r));

        if (options.sort_results) {
            std::stable_sort(results.begin(), results.end(), options.sort_results);
        }
    } catch (...) {
        errors.push(std::current_exception());
    }

    try {
        adapter.finalize_competition();
    } catch (...) {
        errors.push(std::current_exception());
    }

    if (!errors.empty()) errors.rethrow();
    return results;
}

} // namespace gauntlet
