#pragma once

// Bounded worker pool for prepared competition entries.
//
// max(1, min(max_parallel, n)) symmetric threads claim the next index from
// one atomic counter, so at most max_parallel items are ever in flight and
// items start in input order. Each claimed item runs
//
//   on_running -> execute -> on_completed (result stored at its index)
//
// and is cleaned up exactly once whatever happened. A throw anywhere in
// that chain is offered to on_execution_failure; a returned substitute
// becomes the item's result. Otherwise the error is recorded and, under
// FailurePolicy::ABORT, no further items are claimed (items already
// claimed still finish). After all workers joined, every item that was
// never cleaned (including never-started ones) is cleaned.
//
// Recorded errors are rethrown after the sweep: one error as is, several
// as AggregateError. Results keep input order; slots of items that never
// ran are omitted.

#include "config.h"
#include "errors.h"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace gauntlet {

template <typename Prepared>
struct ExecuteFailureContext {
    const char* stage{"execute"};
    const Prepared& prepared;
    size_t index{0};
    std::exception_ptr error;
};

// Hooks may be called concurrently from several worker threads.
template <typename Prepared, typename Result>
class PreparedExecutionHooks {
public:
    virtual ~PreparedExecutionHooks() = default;

    virtual Result execute(const Prepared& prepared, size_t index) = 0;

    virtual void on_running(const Prepared& prepared, size_t index) {
        (void)prepared; (void)index;
    }
    virtual void on_completed(const Prepared& prepared, const Result& result, size_t index) {
        (void)prepared; (void)result; (void)index;
    }
    // Return a result to record the failure as a normal outcome.
    virtual std::optional<Result> on_execution_failure(const ExecuteFailureContext<Prepared>& ctx) {
        (void)ctx;
        return std::nullopt;
    }
    virtual void cleanup(const Prepared& prepared, size_t index) {
        (void)prepared; (void)index;
    }
};

template <typename Prepared, typename Result>
std::vector<Result> run_prepared_with_limit(const std::vector<Prepared>& prepared,
                                            int max_parallel,
                                            PreparedExecutionHooks<Prepared, Result>& hooks,
                                            FailurePolicy policy = FailurePolicy::ABORT) {
    if (prepared.empty() || max_parallel <= 0) return {};

    const size_t n = prepared.size();
    const size_t workers = std::max<size_t>(1, std::min<size_t>((size_t)max_parallel, n));

    std::vector<std::optional<Result>> slots(n);
    std::atomic<size_t> next{0};
    std::atomic<bool> stop{false};

    std::mutex mu; // guards cleaned + errors + claims
    std::vector<char> cleaned(n, 0);
    ErrorCollector errors;

    auto record = [&](std::exception_ptr ep, bool halt) {
        std::lock_guard<std::mutex> lk(mu);
        errors.push(std::move(ep));
        if (halt) stop.store(true);
    };

    auto run_cleanup = [&](size_t i) {
        {
            std::lock_guard<std::mutex> lk(mu);
            if (cleaned[i]) return;
            cleaned[i] = 1;
        }
        hooks.cleanup(prepared[i], i);
    };

    auto worker = [&]() {
        while (true) {
            size_t cur = 0;
            {
                // Same lock record() holds while setting stop: no claim can
                // slip in between a failure and the admission check.
                std::lock_guard<std::mutex> lk(mu);
                if (policy == FailurePolicy::ABORT && stop.load()) return;
                cur = next.fetch_add(1);
            }
            if (cur >= n) return;
            const Prepared& entry = prepared[cur];

            try {
                hooks.on_running(entry, cur);
                Result r = hooks.execute(entry, cur);
                slots[cur] = std::move(r);
                hooks.on_completed(entry, *slots[cur], cur);
            } catch (...) {
                std::exception_ptr ep = std::current_exception();
                std::optional<Result> captured;
                try {
                    captured = hooks.on_execution_failure(ExecuteFailureContext<Prepared>{"execute", entry, cur, ep});
                } catch (...) {
                    // The capture hook failing is itself an uncaptured failure.
                    ep = std::current_exception();
                }
                if (captured) {
                    slots[cur] = std::move(captured);
                } else {
                    record(ep, policy == FailurePolicy::ABORT);
                }
            }

            try {
                run_cleanup(cur);
            } catch (...) {
                record(std::current_exception(), policy == FailurePolicy::ABORT);
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    try {
        for (size_t w = 0; w < workers; w++) threads.emplace_back(worker);
    } catch (...) {
        // Could not start every worker: stop admission, keep the ones running.
        record(std::current_exception(), true);
    }
    for (auto& t : threads) t.join();
    if (threads.empty()) worker();

    for (size_t i = 0; i < n; i++) {
        try {
            run_cleanup(i);
        } catch (...) {
            record(std::current_exception(), false);
        }
    }

    if (!errors.empty()) errors.rethrow();

    std::vector<Result> out;
    out.reserve(n);
    for (auto& s : slots) {
        if (s) out.push_back(std::move(*s));
    }
    return out;
}

} // namespace gauntlet
