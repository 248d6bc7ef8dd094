#pragma once

#include "config.h"
#include "denial_backoff.h"
#include "run_record.h"
#include "signaler.h"
#include "timer.h"
#include "watchdog.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gauntlet {

struct AgentProcessOptions {
    std::string provider_id;
    std::vector<std::string> argv;
    std::string cwd;
    std::map<std::string, std::string> env;

    // Truncated and rewritten for every run. Watchdog banners and backoff
    // notices are appended to the stderr log.
    std::string stdout_path;
    std::string stderr_path;

    WatchdogConfig limits;
    DenialBackoffConfig denial_backoff;
    WatchdogTriggerCallback on_trigger;

    // Not owned. Null: a private ThreadTimerService / PosixProcessSignaler.
    ITimerService* timers{nullptr};
    IProcessSignaler* signaler{nullptr};
};

struct AgentProcessResult {
    int exit_code{0};
    std::optional<std::string> signal;
    // Set whenever the run did not end in a clean zero exit.
    std::optional<std::string> error_message;
    WatchdogMetadata watchdog;
    std::optional<DenialInfo> fail_fast;
    bool aborted{false};
};

// Run one agent to completion under a watchdog.
//
// Watchdog triggers are reported through the result (error_message,
// watchdog.trigger, fail_fast), never thrown. AgentRuntimeError is thrown
// only if the child could not be started at all.
AgentProcessResult run_agent_process(const AgentProcessOptions& opt);

// Shown for claude runs whose logs indicate an expired or revoked login.
extern const char* const kClaudeReloginHint;

// Short human-readable cause for a failed run, extracted from its logs:
// the first JSON "message" value, else the first line matching a known
// provider failure. Providers other than claude/codex/gemini: nullopt.
std::optional<std::string> detect_agent_failure_detail(const std::string& provider,
                                                       const std::string& stdout_path,
                                                       const std::string& stderr_path);

// Same, on already-combined log text.
std::optional<std::string> detect_agent_failure_detail_text(const std::string& provider,
                                                            const std::string& logs);

} // namespace gauntlet
