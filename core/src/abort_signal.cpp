#include "gauntlet/abort_signal.h"

#include <chrono>
#include <vector>

namespace gauntlet {

bool AbortSignal::aborted() const {
    std::lock_guard<std::mutex> lk(mu_);
    return aborted_;
}

void AbortSignal::abort() {
    std::vector<Listener> fire;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (aborted_) return;
        aborted_ = true;
        fire.reserve(listeners_.size());
        for (auto& kv : listeners_) fire.push_back(std::move(kv.second));
        listeners_.clear();
    }
    cv_.notify_all();
    for (auto& fn : fire) {
        if (fn) fn();
    }
}

uint64_t AbortSignal::add_listener(Listener fn) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!aborted_) {
            uint64_t id = next_id_++;
            listeners_.emplace(id, std::move(fn));
            return id;
        }
    }
    if (fn) fn();
    return 0;
}

void AbortSignal::remove_listener(uint64_t id) {
    if (id == 0) return;
    std::lock_guard<std::mutex> lk(mu_);
    listeners_.erase(id);
}

bool AbortSignal::wait_for(int64_t timeout_ms) const {
    std::unique_lock<std::mutex> lk(mu_);
    if (timeout_ms < 0) timeout_ms = 0;
    cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), [&] { return aborted_; });
    return aborted_;
}

} // namespace gauntlet
