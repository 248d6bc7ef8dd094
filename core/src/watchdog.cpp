#include "gauntlet/watchdog.h"

#include <csignal>
#include <exception>
#include <iostream>

namespace gauntlet {

namespace {

// Longest partial line kept while waiting for '\n'. Anything longer is not
// a sandbox log line.
constexpr size_t kMaxLineBuffer = 64 * 1024;

std::string plural(int64_t n, const char* unit) {
    std::string s = std::to_string(n) + " " + unit;
    if (n != 1) s += "s";
    return s;
}

// "15 minutes", "30 seconds", "250 ms"
std::string describe_span(int64_t ms) {
    if (ms >= 60 * 1000) return plural((ms + 30 * 1000) / (60 * 1000), "minute");
    if (ms >= 1000) return plural((ms + 500) / 1000, "second");
    return std::to_string(ms) + " ms";
}

// Adjective form: "120 minute", "30 second"
std::string describe_span_adj(int64_t ms) {
    if (ms >= 60 * 1000) return std::to_string((ms + 30 * 1000) / (60 * 1000)) + " minute";
    if (ms >= 1000) return std::to_string((ms + 500) / 1000) + " second";
    return std::to_string(ms) + " ms";
}

FatalPattern make_pattern(const char* src) {
    return FatalPattern{src, std::regex(src, std::regex::ECMAScript | std::regex::icase)};
}

} // namespace

const char* watchdog_trigger_name(WatchdogTrigger t) {
    switch (t) {
        case WatchdogTrigger::SILENCE:        return "silence";
        case WatchdogTrigger::WALL_CLOCK:     return "wall-clock";
        case WatchdogTrigger::FATAL_PATTERN:  return "fatal-pattern";
        case WatchdogTrigger::SANDBOX_DENIAL: return "sandbox-denial";
    }
    return "silence";
}

const char* watchdog_phase_name(WatchdogPhase p) {
    switch (p) {
        case WatchdogPhase::RUNNING:     return "running";
        case WatchdogPhase::TRIGGERED:   return "triggered";
        case WatchdogPhase::TERMINATING: return "terminating";
        case WatchdogPhase::SETTLED:     return "settled";
    }
    return "running";
}

std::string format_watchdog_banner(WatchdogTrigger t, const std::string& reason) {
    std::string label = watchdog_trigger_name(t);
    for (auto& c : label) {
        if (c == '-') c = ' ';
        else if (c >= 'a' && c <= 'z') c = (char)(c - 'a' + 'A');
    }
    return "\n[WATCHDOG: " + label + "] " + reason + "\n";
}

const std::vector<FatalPattern>& fatal_patterns_for(const std::string& provider_id) {
    // Output of a client stuck in a retry loop it never leaves on its own.
    static const std::vector<FatalPattern> gemini = {
        make_pattern("You have exhausted your capacity on this model\\."),
    };
    static const std::vector<FatalPattern> codex = {
        make_pattern("Connection failed: error sending request for url\\."),
    };
    static const std::vector<FatalPattern> none;

    if (provider_id == "gemini") return gemini;
    if (provider_id == "codex") return codex;
    return none;
}

WatchdogController::WatchdogController(std::shared_ptr<IChildHandle> child,
                                       OutputSink& err,
                                       ITimerService& timers,
                                       IProcessSignaler& signaler,
                                       WatchdogOptions opt)
    : child_(std::move(child)),
      err_(err),
      timers_(timers),
      signaler_(signaler),
      opt_(std::move(opt)),
      patterns_(fatal_patterns_for(opt_.provider_id)),
      abort_(std::make_shared<AbortSignal>()),
      escalator_(timers, signaler, abort_,
                 EscalationTimings{opt_.limits.kill_grace_ms, opt_.limits.hard_abort_ms}),
      tracker_(opt_.denial_backoff) {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<TimerId> unused;
    arm_silence_locked(&unused);
    wall_timer_ = timers_.schedule(opt_.limits.wall_clock_cap_ms, [this] { on_wall_clock(); });
}

WatchdogController::~WatchdogController() {
    cleanup();
}

void WatchdogController::arm_silence_locked(std::vector<TimerId>* to_cancel) {
    if (silence_timer_ != 0) to_cancel->push_back(silence_timer_);
    uint64_t gen = ++silence_gen_;
    silence_timer_ = timers_.schedule(opt_.limits.silence_timeout_ms,
                                      [this, gen] { on_silence(gen); });
}

void WatchdogController::on_silence(uint64_t generation) {
    PendingTrigger t;
    {
        std::lock_guard<std::mutex> lk(mu_);
        // A chunk arrived after this timer was due but before it ran.
        if (torn_down_ || state_.triggered || generation != silence_gen_) return;
        t.trigger = WatchdogTrigger::SILENCE;
        t.reason = "Agent produced no output for " + describe_span(opt_.limits.silence_timeout_ms);
    }
    trigger(t);
}

void WatchdogController::on_wall_clock() {
    PendingTrigger t;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (torn_down_ || state_.triggered) return;
        t.trigger = WatchdogTrigger::WALL_CLOCK;
        t.reason = "Agent exceeded " + describe_span_adj(opt_.limits.wall_clock_cap_ms) +
                   " wall-clock limit";
    }
    trigger(t);
}

void WatchdogController::handle_output(const char* data, size_t n) {
    std::optional<PendingTrigger> pending;
    std::vector<TimerId> to_cancel;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (torn_down_ || state_.triggered) return;
        arm_silence_locked(&to_cancel);
        std::string text(data, n);
        if (!check_fatal_locked(text, &pending)) {
            scan_denials_locked(text, &pending);
        }
    }
    for (TimerId id : to_cancel) timers_.cancel(id);
    if (pending) trigger(*pending);
}

bool WatchdogController::check_fatal_locked(const std::string& text,
                                            std::optional<PendingTrigger>* out) {
    for (const auto& p : patterns_) {
        if (!std::regex_search(text, p.re)) continue;
        int64_t now = timers_.now_ms();
        if (!fatal_first_seen_ms_ || now - *fatal_first_seen_ms_ > opt_.limits.fatal_retry_window_ms) {
            // First sighting, or the previous one is too old to pair with.
            fatal_first_seen_ms_ = now;
            return false;
        }
        PendingTrigger t;
        t.trigger = WatchdogTrigger::FATAL_PATTERN;
        t.reason = "Fatal error pattern detected: " + p.source;
        *out = std::move(t);
        return true;
    }
    return false;
}

void WatchdogController::scan_denials_locked(const std::string& text,
                                             std::optional<PendingTrigger>* out) {
    if (!opt_.denial_backoff.enabled) return;

    line_buffer_ += text;
    size_t start = 0;
    for (;;) {
        size_t nl = line_buffer_.find('\n', start);
        if (nl == std::string::npos) break;
        std::string line = line_buffer_.substr(start, nl - start);
        start = nl + 1;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (line.compare(0, 9, "Running: ") == 0) {
            tracker_.reset_all();
            continue;
        }

        auto denial = parse_sandbox_denial_line(line);
        if (!denial) continue;

        DenialBackoffDecision d = tracker_.record(*denial, timers_.now_ms());
        switch (d.action) {
            case BackoffAction::NONE:
                break;
            case BackoffAction::WARN:
                err_.write("\n[SandboxBackoff: WARN] Repeated denial to " + denial->target +
                           " (count=" + std::to_string(d.count) + ").\n");
                break;
            case BackoffAction::DELAY:
                err_.write("\n[SandboxBackoff: ERROR] Repeated denial to " + denial->target +
                           " (count=" + std::to_string(d.count) + "); delaying " +
                           std::to_string(opt_.denial_backoff.delay_ms) + "ms.\n");
                start_delay_locked();
                break;
            case BackoffAction::FAIL_FAST: {
                PendingTrigger t;
                t.trigger = WatchdogTrigger::SANDBOX_DENIAL;
                t.reason = "Sandbox: repeated denial to " + denial->target +
                           ", aborting to prevent resource exhaustion";
                t.fail_fast = *denial;
                *out = std::move(t);
                line_buffer_.clear();
                return;
            }
        }
    }
    line_buffer_.erase(0, start);
    if (line_buffer_.size() > kMaxLineBuffer) line_buffer_.clear();
}

void WatchdogController::start_delay_locked() {
    if (delay_in_progress_ || state_.triggered || torn_down_) return;
    int pid = child_ ? child_->pid() : 0;
    if (pid <= 0) return;
    delay_in_progress_ = true;
    signaler_.signal_tree(pid, SIGSTOP);
    delay_timer_ = timers_.schedule(opt_.denial_backoff.delay_ms, [this] { on_delay_elapsed(); });
}

void WatchdogController::on_delay_elapsed() {
    std::lock_guard<std::mutex> lk(mu_);
    if (torn_down_) return;
    if (!state_.triggered && child_ && !child_->exited()) {
        signaler_.signal_tree(child_->pid(), SIGCONT);
    }
    delay_in_progress_ = false;
}

void WatchdogController::trigger(const PendingTrigger& t) {
    std::vector<TimerId> ids;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (torn_down_ || state_.triggered) return;
        state_.triggered = t.trigger;
        state_.triggered_reason = t.reason;
        if (t.fail_fast) state_.sandbox_fail_fast = t.fail_fast;
        phase_ = WatchdogPhase::TRIGGERED;
        // Ids stay set: cleanup() must still wait for this very callback.
        ids.push_back(silence_timer_);
        ids.push_back(wall_timer_);
        ++silence_gen_;
    }
    for (TimerId id : ids) timers_.cancel(id);

    std::cerr << "[watchdog] " << opt_.provider_id << " pid=" << (child_ ? child_->pid() : 0)
              << " trigger=" << watchdog_trigger_name(t.trigger) << "\n";
    err_.write(format_watchdog_banner(t.trigger, t.reason));

    if (opt_.on_trigger) {
        try {
            opt_.on_trigger(t.trigger, t.reason, t.fail_fast);
        } catch (const std::exception& e) {
            std::cerr << "[watchdog] trigger callback threw: " << e.what() << "\n";
        }
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        if (torn_down_) return;
        phase_ = WatchdogPhase::TERMINATING;
    }
    if (!escalator_.start(child_)) {
        std::lock_guard<std::mutex> lk(mu_);
        phase_ = WatchdogPhase::SETTLED;
    }
}

void WatchdogController::notify_exit() {
    escalator_.on_child_exit();
    std::lock_guard<std::mutex> lk(mu_);
    if (phase_ != WatchdogPhase::RUNNING) phase_ = WatchdogPhase::SETTLED;
}

void WatchdogController::cleanup() {
    std::vector<TimerId> ids;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (torn_down_) return;
        torn_down_ = true;
        ids = {silence_timer_, wall_timer_, delay_timer_};
        silence_timer_ = wall_timer_ = delay_timer_ = 0;
        ++silence_gen_;
        delay_in_progress_ = false;
        if (phase_ != WatchdogPhase::RUNNING) phase_ = WatchdogPhase::SETTLED;
    }
    for (TimerId id : ids) timers_.cancel(id);
    escalator_.cancel();
}

WatchdogState WatchdogController::state() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

WatchdogPhase WatchdogController::phase() const {
    std::lock_guard<std::mutex> lk(mu_);
    return phase_;
}

bool WatchdogController::delay_in_progress() const {
    std::lock_guard<std::mutex> lk(mu_);
    return delay_in_progress_;
}

} // namespace gauntlet
