#include "gauntlet/timer.h"

#include <chrono>
#include <exception>
#include <iostream>

namespace gauntlet {

static int64_t steady_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

ThreadTimerService::ThreadTimerService() {
    thread_ = std::thread([this] { loop(); });
}

ThreadTimerService::~ThreadTimerService() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

int64_t ThreadTimerService::now_ms() const {
    return steady_ms();
}

TimerId ThreadTimerService::schedule(int64_t delay_ms, std::function<void()> fn) {
    if (delay_ms < 0) delay_ms = 0;
    std::lock_guard<std::mutex> lk(mu_);
    TimerId id = next_id_++;
    int64_t deadline = steady_ms() + delay_ms;
    queue_.emplace(deadline, id);
    entries_.emplace(id, Entry{deadline, std::move(fn)});
    cv_.notify_all();
    return id;
}

void ThreadTimerService::cancel(TimerId id) {
    if (id == 0) return;
    std::unique_lock<std::mutex> lk(mu_);
    auto it = entries_.find(id);
    if (it != entries_.end()) {
        queue_.erase({it->second.deadline_ms, id});
        entries_.erase(it);
        return;
    }
    // Already fired. If it is running right now on the timer thread, wait
    // for it to finish unless we are that thread.
    if (running_ == id && std::this_thread::get_id() != thread_.get_id()) {
        done_cv_.wait(lk, [&] { return running_ != id; });
    }
}

size_t ThreadTimerService::pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.size();
}

void ThreadTimerService::loop() {
    std::unique_lock<std::mutex> lk(mu_);
    while (!stop_) {
        if (queue_.empty()) {
            cv_.wait(lk);
            continue;
        }
        auto first = *queue_.begin();
        int64_t now = steady_ms();
        if (first.first > now) {
            cv_.wait_for(lk, std::chrono::milliseconds(first.first - now));
            continue;
        }
        queue_.erase(queue_.begin());
        auto it = entries_.find(first.second);
        std::function<void()> fn = std::move(it->second.fn);
        entries_.erase(it);
        running_ = first.second;

        lk.unlock();
        try {
            if (fn) fn();
        } catch (const std::exception& e) {
            std::cerr << "[timer] callback threw: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[timer] callback threw a non-standard exception\n";
        }
        // Captures may own objects whose destructors cancel timers.
        fn = nullptr;
        lk.lock();

        running_ = 0;
        done_cv_.notify_all();
    }
}

} // namespace gauntlet
