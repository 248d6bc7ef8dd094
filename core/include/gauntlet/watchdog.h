#pragma once

#include "abort_signal.h"
#include "config.h"
#include "denial_backoff.h"
#include "signaler.h"
#include "sink.h"
#include "termination.h"
#include "timer.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace gauntlet {

enum class WatchdogTrigger { SILENCE, WALL_CLOCK, FATAL_PATTERN, SANDBOX_DENIAL };

// "silence" | "wall-clock" | "fatal-pattern" | "sandbox-denial"
const char* watchdog_trigger_name(WatchdogTrigger t);

// "\n[WATCHDOG: WALL CLOCK] <reason>\n"
std::string format_watchdog_banner(WatchdogTrigger t, const std::string& reason);

// Snapshot of what the controller decided. Set at most once.
struct WatchdogState {
    std::optional<WatchdogTrigger> triggered;
    std::optional<std::string> triggered_reason;
    std::optional<DenialInfo> sandbox_fail_fast;
};

struct FatalPattern {
    std::string source; // reported in the trigger reason
    std::regex re;
};

// Provider specific output that means the agent cannot make progress
// (revoked credentials, exhausted quota). Unknown providers: empty.
const std::vector<FatalPattern>& fatal_patterns_for(const std::string& provider_id);

using WatchdogTriggerCallback = std::function<void(
    WatchdogTrigger, const std::string& reason, const std::optional<DenialInfo>& fail_fast)>;

struct WatchdogOptions {
    std::string provider_id;
    WatchdogConfig limits;
    DenialBackoffConfig denial_backoff;
    // Called synchronously, before termination starts.
    WatchdogTriggerCallback on_trigger;
};

enum class WatchdogPhase { RUNNING, TRIGGERED, TERMINATING, SETTLED };

const char* watchdog_phase_name(WatchdogPhase p);

// Supervises one child process.
//
// Silence and wall-clock timers start at construction. Every output chunk
// goes through handle_output(). The first trigger latches, cancels all
// timers, writes a banner to the error sink, calls on_trigger and hands the
// child to the termination escalator. abort_signal() fires only if the
// child survived SIGKILL for hard_abort_ms.
//
// cleanup() must be called when the execution slot completes; the
// destructor calls it too. After cleanup nothing is scheduled or signalled.
class WatchdogController {
public:
    WatchdogController(std::shared_ptr<IChildHandle> child,
                       OutputSink& err,
                       ITimerService& timers,
                       IProcessSignaler& signaler,
                       WatchdogOptions opt);
    ~WatchdogController();

    WatchdogController(const WatchdogController&) = delete;
    WatchdogController& operator=(const WatchdogController&) = delete;

    void handle_output(const char* data, size_t n);
    void handle_output(const std::string& chunk) { handle_output(chunk.data(), chunk.size()); }

    // Child was reaped.
    void notify_exit();

    void cleanup();

    WatchdogState state() const;
    WatchdogPhase phase() const;
    bool delay_in_progress() const;
    std::shared_ptr<AbortSignal> abort_signal() const { return abort_; }

private:
    struct PendingTrigger {
        WatchdogTrigger trigger{WatchdogTrigger::SILENCE};
        std::string reason;
        std::optional<DenialInfo> fail_fast;
    };

    void arm_silence_locked(std::vector<TimerId>* to_cancel);
    void on_silence(uint64_t generation);
    void on_wall_clock();
    void on_delay_elapsed();

    bool check_fatal_locked(const std::string& text, std::optional<PendingTrigger>* out);
    void scan_denials_locked(const std::string& text, std::optional<PendingTrigger>* out);
    void start_delay_locked();

    void trigger(const PendingTrigger& t);

    std::shared_ptr<IChildHandle> child_;
    OutputSink& err_;
    ITimerService& timers_;
    IProcessSignaler& signaler_;
    WatchdogOptions opt_;
    const std::vector<FatalPattern>& patterns_;
    std::shared_ptr<AbortSignal> abort_;
    TerminationEscalator escalator_;

    mutable std::mutex mu_;
    WatchdogPhase phase_{WatchdogPhase::RUNNING};
    WatchdogState state_;
    DenialBackoffTracker tracker_;
    std::string line_buffer_;
    std::optional<int64_t> fatal_first_seen_ms_;
    TimerId silence_timer_{0};
    uint64_t silence_gen_{0};
    TimerId wall_timer_{0};
    TimerId delay_timer_{0};
    bool delay_in_progress_{false};
    bool torn_down_{false};
};

} // namespace gauntlet
