#include "gauntlet/termination.h"

#include <csignal>

namespace gauntlet {

const char* escalation_stage_name(EscalationStage s) {
    switch (s) {
        case EscalationStage::IDLE:      return "idle";
        case EscalationStage::TERM_SENT: return "term-sent";
        case EscalationStage::KILL_SENT: return "kill-sent";
        case EscalationStage::ABORTED:   return "aborted";
        case EscalationStage::SETTLED:   return "settled";
    }
    return "idle";
}

TerminationEscalator::TerminationEscalator(ITimerService& timers,
                                           IProcessSignaler& signaler,
                                           std::shared_ptr<AbortSignal> abort,
                                           EscalationTimings timings)
    : timers_(timers), signaler_(signaler), abort_(std::move(abort)), timings_(timings) {}

TerminationEscalator::~TerminationEscalator() {
    cancel();
}

bool TerminationEscalator::start(const std::shared_ptr<IChildHandle>& child) {
    std::lock_guard<std::mutex> lk(mu_);
    if (cancelled_ || stage_ != EscalationStage::IDLE || !child) return false;
    child_ = child;
    if (child_->exited() || child_->pid() <= 0) {
        stage_ = EscalationStage::SETTLED;
        return false;
    }

    signaler_.signal_tree(child_->pid(), SIGTERM);
    stage_ = EscalationStage::TERM_SENT;
    grace_timer_ = timers_.schedule(timings_.kill_grace_ms, [this] { on_grace_elapsed(); });
    return true;
}

void TerminationEscalator::on_grace_elapsed() {
    std::lock_guard<std::mutex> lk(mu_);
    if (cancelled_ || stage_ != EscalationStage::TERM_SENT) return;
    if (child_->exited()) {
        stage_ = EscalationStage::SETTLED;
        return;
    }
    signaler_.signal_tree(child_->pid(), SIGKILL);
    stage_ = EscalationStage::KILL_SENT;
    hard_timer_ = timers_.schedule(timings_.hard_abort_ms, [this] { on_hard_abort(); });
}

void TerminationEscalator::on_hard_abort() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (cancelled_ || stage_ != EscalationStage::KILL_SENT) return;
        if (child_->exited()) {
            stage_ = EscalationStage::SETTLED;
            return;
        }
        stage_ = EscalationStage::ABORTED;
    }
    // Listeners run outside our lock.
    abort_->abort();
}

void TerminationEscalator::on_child_exit() {
    TimerId g = 0, h = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        g = grace_timer_;
        h = hard_timer_;
        if (stage_ == EscalationStage::TERM_SENT || stage_ == EscalationStage::KILL_SENT) {
            stage_ = EscalationStage::SETTLED;
        }
    }
    timers_.cancel(g);
    timers_.cancel(h);
}

void TerminationEscalator::cancel() {
    TimerId g = 0, h = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        cancelled_ = true;
        g = grace_timer_;
        h = hard_timer_;
        grace_timer_ = hard_timer_ = 0;
    }
    // Outside the lock: a running callback may be waiting for it.
    timers_.cancel(g);
    timers_.cancel(h);
}

EscalationStage TerminationEscalator::stage() const {
    std::lock_guard<std::mutex> lk(mu_);
    return stage_;
}

} // namespace gauntlet
