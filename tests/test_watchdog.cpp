#include "test_common.h"
#include "fakes.h"
#include "gauntlet/watchdog.h"

#include <csignal>
#include <memory>

using gauntlet::WatchdogController;
using gauntlet::WatchdogOptions;
using gauntlet::WatchdogPhase;
using gauntlet::WatchdogTrigger;

static const char* DENIED_WRITE = "Sandbox: node(812) deny(1) file-write-create /etc/passwd\n";

static WatchdogOptions make_options(const std::string& provider, int64_t silence_ms, int64_t wall_ms) {
    WatchdogOptions o;
    o.provider_id = provider;
    o.limits.silence_timeout_ms = silence_ms;
    o.limits.wall_clock_cap_ms = wall_ms;
    o.limits.kill_grace_ms = 10000;
    o.limits.hard_abort_ms = 10000;
    o.limits.fatal_retry_window_ms = 60000;
    return o;
}

static bool contains(const std::string& hay, const std::string& needle) {
    return hay.find(needle) != std::string::npos;
}

static bool has_signal(const RecordingSignaler& s, int sig) {
    for (int x : s.signals()) {
        if (x == sig) return true;
    }
    return false;
}

int main() {
    const int64_t HOURS = 10LL * 60 * 60 * 1000;

    // Test 1: Steady output keeps the silence timer from firing
    {
        ManualTimerService timers;
        RecordingSignaler sig;
        gauntlet::StringSink err;
        auto child = std::make_shared<FakeChild>(321);
        WatchdogController wd(child, err, timers, sig, make_options("claude", 100, HOURS));

        wd.handle_output("a");
        timers.advance(50);
        wd.handle_output("b");
        timers.advance(49);
        wd.handle_output("c");
        timers.advance(51); // t=150, well past one silence period since start
        expect_true(!wd.state().triggered, "no silence trigger while output flows");

        timers.advance(48); // t=198
        expect_true(!wd.state().triggered, "not yet silent for 100ms");
        timers.advance(1);  // t=199
        auto st = wd.state();
        expect_true(st.triggered == WatchdogTrigger::SILENCE, "silence trigger");
        expect_eq_str(*st.triggered_reason, "Agent produced no output for 100 ms", "silence reason");
        expect_true(sig.signals() == std::vector<int>({SIGTERM}), "escalation started");
        expect_true(wd.phase() == WatchdogPhase::TERMINATING, "terminating");
        expect_true(contains(err.str(), "\n[WATCHDOG: SILENCE] Agent produced no output for 100 ms\n"), "banner");

        // The latch holds: the wall clock never overrides the first trigger.
        timers.advance(HOURS);
        expect_true(wd.state().triggered == WatchdogTrigger::SILENCE, "first trigger wins");
    }

    // Test 2: Wall clock fires at the cap regardless of activity
    {
        ManualTimerService timers;
        RecordingSignaler sig;
        gauntlet::StringSink err;
        auto child = std::make_shared<FakeChild>(321);
        WatchdogController wd(child, err, timers, sig, make_options("claude", 1000, 300));
        for (int i = 0; i < 5; i++) {
            wd.handle_output("tick\n");
            timers.advance(50);
        }
        expect_true(!wd.state().triggered, "before the cap");
        timers.advance(49);
        expect_true(!wd.state().triggered, "1ms before the cap");
        wd.handle_output("tick\n");
        timers.advance(1);
        expect_true(wd.state().triggered == WatchdogTrigger::WALL_CLOCK, "wall-clock trigger");
        expect_eq_str(*wd.state().triggered_reason, "Agent exceeded 300 ms wall-clock limit", "wall reason");
        expect_true(contains(err.str(), "[WATCHDOG: WALL CLOCK]"), "wall banner");
    }

    // Test 3: Reason wording for realistic limits
    {
        ManualTimerService timers;
        RecordingSignaler sig;
        gauntlet::StringSink err;
        WatchdogController wd(std::make_shared<FakeChild>(1), err, timers, sig,
                              make_options("codex", 15 * 60 * 1000, 120 * 60 * 1000));
        timers.advance(15 * 60 * 1000);
        expect_eq_str(*wd.state().triggered_reason, "Agent produced no output for 15 minutes", "minutes");

        ManualTimerService t2;
        WatchdogController wd2(std::make_shared<FakeChild>(1), err, t2, sig,
                               make_options("codex", HOURS, 120 * 60 * 1000));
        t2.advance(120 * 60 * 1000);
        expect_eq_str(*wd2.state().triggered_reason, "Agent exceeded 120 minute wall-clock limit", "minute adj");
    }

    // Test 4: A fatal pattern needs a second sighting inside the retry window
    {
        ManualTimerService timers;
        RecordingSignaler sig;
        gauntlet::StringSink err;
        WatchdogController wd(std::make_shared<FakeChild>(5), err, timers, sig, make_options("gemini", HOURS, HOURS));
        wd.handle_output("Error: You have exhausted your capacity on this model. Retrying...\n");
        expect_true(!wd.state().triggered, "single sighting only arms");
        timers.advance(30000);
        wd.handle_output("you have EXHAUSTED your capacity on this model.\n");
        auto st = wd.state();
        expect_true(st.triggered == WatchdogTrigger::FATAL_PATTERN, "second sighting triggers");
        expect_eq_str(*st.triggered_reason,
                      "Fatal error pattern detected: You have exhausted your capacity on this model\\.",
                      "fatal reason");
        expect_true(contains(err.str(), "[WATCHDOG: FATAL PATTERN]"), "fatal banner");
    }

    // Test 5: A sighting outside the window re-arms instead of triggering
    {
        ManualTimerService timers;
        RecordingSignaler sig;
        gauntlet::StringSink err;
        WatchdogController wd(std::make_shared<FakeChild>(5), err, timers, sig, make_options("codex", HOURS, HOURS));
        const char* line = "ERROR: Connection failed: error sending request for url. (https://api.openai.com/v1/responses)\n";
        wd.handle_output(line);
        timers.advance(90000);
        wd.handle_output(line);
        expect_true(!wd.state().triggered, "pair split by more than the window");
        timers.advance(30000);
        wd.handle_output(line);
        expect_true(wd.state().triggered == WatchdogTrigger::FATAL_PATTERN, "re-armed sighting pairs");
    }

    // Test 6: Only gemini and codex have fatal patterns, and they match literally
    {
        expect_true(gauntlet::fatal_patterns_for("aider").empty(), "no patterns for unknown provider");
        expect_true(gauntlet::fatal_patterns_for("claude").empty(), "no patterns for claude");
        expect_eq_ll((long long)gauntlet::fatal_patterns_for("gemini").size(), 1, "one gemini pattern");
        expect_eq_ll((long long)gauntlet::fatal_patterns_for("codex").size(), 1, "one codex pattern");

        ManualTimerService timers;
        RecordingSignaler sig;
        gauntlet::StringSink err;
        WatchdogController wd(std::make_shared<FakeChild>(5), err, timers, sig, make_options("codex", HOURS, HOURS));
        wd.handle_output("{\"error\":{\"type\":\"invalid_request_error\",\"code\":\"unsupported_value\"}}\n");
        timers.advance(30000);
        wd.handle_output("{\"error\":{\"type\":\"invalid_request_error\",\"code\":\"unsupported_value\"}}\n");
        wd.handle_output("thread 'main' panicked at src/x.rs\n");
        wd.handle_output("Connection failed: error sending request for urlX\n");
        expect_true(!wd.state().triggered, "recoverable codex output never pattern-triggers");

        ManualTimerService t2;
        WatchdogController wd2(std::make_shared<FakeChild>(6), err, t2, sig, make_options("claude", HOURS, HOURS));
        wd2.handle_output("Please run /login\n");
        wd2.handle_output("Please run /login\n");
        expect_true(!wd2.state().triggered, "claude never pattern-triggers");
    }

    // Test 7: Repeated sandbox denials escalate to fail-fast
    {
        ManualTimerService timers;
        RecordingSignaler sig;
        gauntlet::StringSink err;
        auto child = std::make_shared<FakeChild>(77);
        auto opt = make_options("codex", HOURS, HOURS);
        bool callback_ran = false;
        opt.on_trigger = [&](WatchdogTrigger t, const std::string& reason,
                             const std::optional<gauntlet::DenialInfo>& ff) {
            callback_ran = true;
            expect_true(t == WatchdogTrigger::SANDBOX_DENIAL, "callback trigger");
            expect_true(contains(reason, "/etc/passwd"), "callback reason names the target");
            expect_true(ff.has_value() && ff->operation == gauntlet::DenialOperation::FILE_WRITE,
                        "callback fail-fast info");
            expect_true(!has_signal(sig, SIGTERM), "callback runs before SIGTERM");
            expect_true(contains(err.str(), "[WATCHDOG: SANDBOX DENIAL]"), "banner before callback");
        };
        WatchdogController wd(child, err, timers, sig, opt);

        std::string four;
        for (int i = 0; i < 4; i++) four += DENIED_WRITE;
        wd.handle_output(four);

        expect_true(callback_ran, "callback ran");
        auto st = wd.state();
        expect_true(st.triggered == WatchdogTrigger::SANDBOX_DENIAL, "sandbox trigger");
        expect_true(st.sandbox_fail_fast.has_value(), "fail-fast info kept");
        expect_eq_str(st.sandbox_fail_fast->target, "/etc/passwd", "fail-fast target");
        expect_eq_str(*st.triggered_reason,
                      "Sandbox: repeated denial to /etc/passwd, aborting to prevent resource exhaustion",
                      "sandbox reason");
        expect_true(contains(err.str(), "[SandboxBackoff: WARN]"), "warn notice");
        expect_true(contains(err.str(), "[SandboxBackoff: ERROR]"), "delay notice");
        expect_true(sig.signals() == std::vector<int>({SIGSTOP, SIGTERM}), "stopped, then terminated");

        timers.advance(6000);
        expect_true(!has_signal(sig, SIGCONT), "no resume after trigger");
    }

    // Test 8: Delay suspends and resumes; lines may span chunks
    {
        ManualTimerService timers;
        RecordingSignaler sig;
        gauntlet::StringSink err;
        auto opt = make_options("codex", HOURS, HOURS);
        opt.denial_backoff.delay_ms = 2000;
        WatchdogController wd(std::make_shared<FakeChild>(78), err, timers, sig, opt);

        wd.handle_output("[SandboxDebug] Denied by config rule: registry.npmjs.org:443\n");
        wd.handle_output("[SandboxDebug] Denied by config ru");
        wd.handle_output("le: registry.npmjs.org:443\r\n[SandboxDebug] Denied by config rule: registry.npmjs.org:443\n");
        expect_true(wd.delay_in_progress(), "delay in progress");
        expect_true(sig.signals() == std::vector<int>({SIGSTOP}), "SIGSTOP sent");
        expect_true(sig.sent()[0].first == 78, "stopped the child");

        timers.advance(1999);
        expect_true(wd.delay_in_progress(), "still delayed");
        timers.advance(1);
        expect_true(!wd.delay_in_progress(), "delay over");
        expect_true(sig.signals() == std::vector<int>({SIGSTOP, SIGCONT}), "SIGCONT sent");
        expect_true(!wd.state().triggered, "delay is not a trigger");
    }

    // Test 9: "Running: " resets the backoff history
    {
        ManualTimerService timers;
        RecordingSignaler sig;
        gauntlet::StringSink err;
        WatchdogController wd(std::make_shared<FakeChild>(79), err, timers, sig, make_options("codex", HOURS, HOURS));
        wd.handle_output(std::string(DENIED_WRITE) + DENIED_WRITE);
        wd.handle_output("Running: npm test\n");
        wd.handle_output(std::string(DENIED_WRITE) + DENIED_WRITE);
        expect_true(sig.signals().empty(), "never reached delay");
        expect_true(!wd.state().triggered, "never reached fail-fast");
    }

    // Test 10: Disabled backoff ignores denials
    {
        ManualTimerService timers;
        RecordingSignaler sig;
        gauntlet::StringSink err;
        auto opt = make_options("codex", HOURS, HOURS);
        opt.denial_backoff.enabled = false;
        WatchdogController wd(std::make_shared<FakeChild>(80), err, timers, sig, opt);
        for (int i = 0; i < 10; i++) wd.handle_output(DENIED_WRITE);
        expect_true(!wd.state().triggered, "disabled backoff never triggers");
        expect_true(err.str().empty(), "no notices");
    }

    // Test 11: Exit after trigger settles the escalation
    {
        ManualTimerService timers;
        RecordingSignaler sig;
        gauntlet::StringSink err;
        auto child = std::make_shared<FakeChild>(81);
        WatchdogController wd(child, err, timers, sig, make_options("claude", 100, HOURS));
        timers.advance(100);
        expect_true(wd.phase() == WatchdogPhase::TERMINATING, "terminating");
        child->set_exited();
        wd.notify_exit();
        expect_true(wd.phase() == WatchdogPhase::SETTLED, "settled");
        timers.advance(60000);
        expect_true(sig.signals() == std::vector<int>({SIGTERM}), "no SIGKILL after exit");
        expect_true(!wd.abort_signal()->aborted(), "no abort after exit");
    }

    // Test 12: Trigger on an already-exited child settles at once
    {
        ManualTimerService timers;
        RecordingSignaler sig;
        gauntlet::StringSink err;
        auto child = std::make_shared<FakeChild>(82);
        child->set_exited();
        WatchdogController wd(child, err, timers, sig, make_options("claude", 100, HOURS));
        timers.advance(100);
        expect_true(wd.state().triggered == WatchdogTrigger::SILENCE, "still records the trigger");
        expect_true(wd.phase() == WatchdogPhase::SETTLED, "settled without signals");
        expect_true(sig.signals().empty(), "no signals");
    }

    // Test 13: Full escalation fires the abort signal
    {
        ManualTimerService timers;
        RecordingSignaler sig;
        gauntlet::StringSink err;
        WatchdogController wd(std::make_shared<FakeChild>(83), err, timers, sig, make_options("claude", 100, HOURS));
        timers.advance(100);
        timers.advance(10000);
        expect_true(sig.signals() == std::vector<int>({SIGTERM, SIGKILL}), "TERM then KILL");
        expect_true(!wd.abort_signal()->aborted(), "abort waits for hard abort");
        timers.advance(10000);
        expect_true(wd.abort_signal()->aborted(), "abort fired");
    }

    // Test 14: cleanup cancels everything and ignores further output
    {
        ManualTimerService timers;
        RecordingSignaler sig;
        gauntlet::StringSink err;
        WatchdogController wd(std::make_shared<FakeChild>(84), err, timers, sig, make_options("claude", 100, 200));
        expect_eq_ll((long long)timers.pending(), 2, "silence and wall timers armed");
        wd.cleanup();
        wd.cleanup();
        expect_eq_ll((long long)timers.pending(), 0, "timers cancelled");
        wd.handle_output("Please run /login\nPlease run /login\n");
        timers.advance(HOURS);
        expect_true(!wd.state().triggered, "nothing after cleanup");
        expect_true(sig.signals().empty(), "no signals after cleanup");
    }

    expect_eq_str(gauntlet::format_watchdog_banner(WatchdogTrigger::WALL_CLOCK, "x"),
                  "\n[WATCHDOG: WALL CLOCK] x\n", "banner format");

    std::cerr << "test_watchdog: ALL PASSED" << std::endl;
    return 0;
}
