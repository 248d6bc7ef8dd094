#pragma once

#include "abort_signal.h"
#include "signaler.h"
#include "timer.h"

#include <cstdint>
#include <memory>
#include <mutex>

namespace gauntlet {

// What the supervisor knows about a live child.
class IChildHandle {
public:
    virtual ~IChildHandle() = default;
    virtual int pid() const = 0;
    // True once the child has been reaped.
    virtual bool exited() const = 0;
};

struct EscalationTimings {
    int64_t kill_grace_ms{5 * 1000};
    int64_t hard_abort_ms{10 * 1000};
};

enum class EscalationStage { IDLE, TERM_SENT, KILL_SENT, ABORTED, SETTLED };

const char* escalation_stage_name(EscalationStage s);

// SIGTERM -> kill_grace_ms -> SIGKILL -> hard_abort_ms -> abort signal.
//
// The abort signal exists because a child can be genuinely unkillable
// (stuck in uninterruptible sleep); whoever waits on the child must treat
// it as "stop waiting now". Every step is skipped once the child exited.
class TerminationEscalator {
public:
    TerminationEscalator(ITimerService& timers,
                         IProcessSignaler& signaler,
                         std::shared_ptr<AbortSignal> abort,
                         EscalationTimings timings);
    ~TerminationEscalator();

    TerminationEscalator(const TerminationEscalator&) = delete;
    TerminationEscalator& operator=(const TerminationEscalator&) = delete;

    // Begin escalation. Returns false if the child already exited or
    // escalation was started before.
    bool start(const std::shared_ptr<IChildHandle>& child);

    // The child was reaped: drop pending kill/abort steps.
    void on_child_exit();

    // Teardown: drop pending steps without firing anything.
    void cancel();

    EscalationStage stage() const;

private:
    void on_grace_elapsed();
    void on_hard_abort();

    ITimerService& timers_;
    IProcessSignaler& signaler_;
    std::shared_ptr<AbortSignal> abort_;
    EscalationTimings timings_;

    mutable std::mutex mu_;
    std::shared_ptr<IChildHandle> child_;
    EscalationStage stage_{EscalationStage::IDLE};
    TimerId grace_timer_{0};
    TimerId hard_timer_{0};
    bool cancelled_{false};
};

} // namespace gauntlet
