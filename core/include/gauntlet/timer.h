#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <utility>

namespace gauntlet {

using TimerId = uint64_t;

// One-shot timer source used by the watchdog. Abstract so tests can drive
// time by hand instead of sleeping.
class ITimerService {
public:
    virtual ~ITimerService() = default;

    // Monotonic milliseconds. Only differences are meaningful.
    virtual int64_t now_ms() const = 0;

    // Run fn once after delay_ms. Never returns 0.
    virtual TimerId schedule(int64_t delay_ms, std::function<void()> fn) = 0;

    // Cancel a pending timer. Unknown or already-fired ids are ignored.
    virtual void cancel(TimerId id) = 0;
};

// Production timer service: one background thread, callbacks run on it.
//
// cancel() called from another thread while the very same callback is
// executing blocks until the callback returns, so an owner may cancel and
// then destroy the state the callback touches.
class ThreadTimerService final : public ITimerService {
public:
    ThreadTimerService();
    ~ThreadTimerService() override;

    ThreadTimerService(const ThreadTimerService&) = delete;
    ThreadTimerService& operator=(const ThreadTimerService&) = delete;

    int64_t now_ms() const override;
    TimerId schedule(int64_t delay_ms, std::function<void()> fn) override;
    void cancel(TimerId id) override;

    size_t pending() const;

private:
    struct Entry {
        int64_t deadline_ms{0};
        std::function<void()> fn;
    };

    void loop();

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::condition_variable done_cv_;
    std::set<std::pair<int64_t, TimerId>> queue_;
    std::map<TimerId, Entry> entries_;
    TimerId next_id_{1};
    TimerId running_{0};
    bool stop_{false};
    std::thread thread_;
};

} // namespace gauntlet
