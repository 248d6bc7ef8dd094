#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace gauntlet {

// One-shot cancellation flag shared between the party that decides to
// give up (the watchdog after full escalation) and the party blocked on a
// child process (the spawn wait).
//
// abort() is idempotent: listeners run exactly once, on the aborting
// thread, outside the internal lock.
class AbortSignal {
public:
    using Listener = std::function<void()>;

    AbortSignal() = default;
    AbortSignal(const AbortSignal&) = delete;
    AbortSignal& operator=(const AbortSignal&) = delete;

    bool aborted() const;
    void abort();

    // Registers a listener. If the signal already fired the listener runs
    // immediately on the calling thread and 0 is returned.
    uint64_t add_listener(Listener fn);
    void remove_listener(uint64_t id);

    // Blocks until aborted or timeout_ms elapsed. Returns aborted().
    bool wait_for(int64_t timeout_ms) const;

private:
    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
    bool aborted_{false};
    uint64_t next_id_{1};
    std::map<uint64_t, Listener> listeners_;
};

} // namespace gauntlet
