#include "gauntlet/agent_launcher.h"
#include "gauntlet/errors.h"
#include "gauntlet/json_mini.h"
#include "gauntlet/proc.h"
#include "gauntlet/sink.h"

#include <fstream>
#include <iostream>
#include <memory>
#include <regex>
#include <sstream>

namespace gauntlet {

const char* const kClaudeReloginHint =
    "Claude authentication failed. Authenticate directly via Claude before continuing.";

AgentProcessResult run_agent_process(const AgentProcessOptions& opt) {
    if (opt.argv.empty() || opt.argv[0].empty()) {
        throw AgentRuntimeError(AgentRuntimeErrorKind::MANIFEST, "Agent command is empty");
    }
    // Relative paths with a slash resolve against the child's cwd.
    std::string exe = opt.argv[0];
    if (!opt.cwd.empty() && exe[0] != '/' && exe.find('/') != std::string::npos) {
        exe = opt.cwd + "/" + exe;
    }
    if (find_executable(exe).empty()) {
        throw AgentRuntimeError(AgentRuntimeErrorKind::PROCESS,
                                "Agent executable not found or not executable: " + opt.argv[0]);
    }

    FileSink out(opt.stdout_path);
    FileSink err(opt.stderr_path);
    if (!out.is_open()) {
        throw AgentRuntimeError(AgentRuntimeErrorKind::PROCESS,
                                "Failed to open stdout log at " + opt.stdout_path);
    }
    if (!err.is_open()) {
        throw AgentRuntimeError(AgentRuntimeErrorKind::PROCESS,
                                "Failed to open stderr log at " + opt.stderr_path);
    }

    std::unique_ptr<ThreadTimerService> own_timers;
    ITimerService* timers = opt.timers;
    if (!timers) {
        own_timers = std::make_unique<ThreadTimerService>();
        timers = own_timers.get();
    }
    PosixProcessSignaler posix_signaler;
    IProcessSignaler* signaler = opt.signaler ? opt.signaler : &posix_signaler;

    // The spawn wait listens on this one; the watchdog's abort signal is
    // bridged into it once the watchdog exists.
    auto force_abort = std::make_shared<AbortSignal>();

    std::unique_ptr<WatchdogController> watchdog;
    uint64_t bridge = 0;

    SpawnOptions so;
    so.argv = opt.argv;
    so.cwd = opt.cwd;
    so.env = opt.env;
    so.stdout_sink = &out;
    so.stderr_sink = &err;
    so.on_spawn = [&](const std::shared_ptr<IChildHandle>& child) {
        WatchdogOptions wo;
        wo.provider_id = opt.provider_id;
        wo.limits = opt.limits;
        wo.denial_backoff = opt.denial_backoff;
        wo.on_trigger = opt.on_trigger;
        watchdog = std::make_unique<WatchdogController>(child, err, *timers, *signaler, std::move(wo));
        bridge = watchdog->abort_signal()->add_listener([force_abort] { force_abort->abort(); });
    };
    so.on_data = [&](StreamId, const char* data, size_t n) {
        if (watchdog) watchdog->handle_output(data, n);
    };
    so.on_exit = [&] {
        if (watchdog) watchdog->notify_exit();
    };

    SpawnResult sr;
    std::string spawn_err;
    bool started = spawn_streaming_process(so, force_abort, &sr, &spawn_err);

    if (watchdog) {
        if (bridge != 0) watchdog->abort_signal()->remove_listener(bridge);
        watchdog->cleanup();
    }
    out.close();
    err.close();

    if (!started) {
        throw AgentRuntimeError(AgentRuntimeErrorKind::PROCESS, spawn_err);
    }

    AgentProcessResult res;
    res.exit_code = sr.exit_code;
    res.signal = sr.signal;
    res.aborted = sr.aborted;
    res.watchdog.silence_timeout_ms = opt.limits.silence_timeout_ms;
    res.watchdog.wall_clock_cap_ms = opt.limits.wall_clock_cap_ms;

    WatchdogState st;
    if (watchdog) st = watchdog->state();
    res.watchdog.trigger = st.triggered;
    res.fail_fast = st.sandbox_fail_fast;

    if (st.triggered && st.triggered_reason) {
        res.error_message = sr.aborted
            ? *st.triggered_reason + " (force-aborted after unresponsive to signals)"
            : *st.triggered_reason;
    } else if (sr.signal) {
        res.error_message = "Agent terminated by signal " + *sr.signal;
    } else if (sr.exit_code != 0) {
        res.error_message = "Agent exited with code " + std::to_string(sr.exit_code);
    }
    return res;
}

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool meaningful(const std::string& msg) {
    std::string t = trim(msg);
    return !t.empty() && t != "[object Object]";
}

std::optional<std::string> first_json_message(const std::string& text) {
    static const std::regex re("\"message\"\\s*:\\s*\"((?:\\\\.|[^\"\\\\])*)\"");
    std::smatch m;
    if (!std::regex_search(text, m, re)) return std::nullopt;
    std::string raw = trim(m[1].str());
    if (raw.empty()) return std::nullopt;

    // Decode JSON string escapes.
    json_mini::Doc doc = json_mini::parse("\"" + raw + "\"");
    if (doc && json_object_is_type(doc.root, json_type_string)) {
        std::string decoded = json_object_get_string(doc.root);
        if (meaningful(decoded)) return decoded;
        return std::nullopt;
    }
    if (meaningful(raw)) return raw;
    return std::nullopt;
}

std::optional<std::string> first_matching_line(const std::string& text,
                                               const std::vector<std::regex>& matchers) {
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (t.empty()) continue;
        for (const auto& re : matchers) {
            std::smatch m;
            if (std::regex_search(t, m, re)) {
                return trim(t.substr((size_t)m.position(0)));
            }
        }
    }
    return std::nullopt;
}

std::string read_file_or_empty(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return "";
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace

std::optional<std::string> detect_agent_failure_detail_text(const std::string& provider,
                                                            const std::string& logs) {
    if (logs.empty()) return std::nullopt;

    if (provider == "claude") {
        static const std::vector<std::regex> claude = {
            std::regex("Please run /login", std::regex::icase),
            std::regex("OAuth token has expired", std::regex::icase),
        };
        for (const auto& re : claude) {
            if (std::regex_search(logs, re)) return std::string(kClaudeReloginHint);
        }
        return std::nullopt;
    }

    if (provider == "gemini") {
        static const std::vector<std::regex> gemini = {
            std::regex("TerminalQuotaError:"),
            std::regex("PERMISSION_DENIED"),
            std::regex("RESOURCE_EXHAUSTED"),
            std::regex("No capacity available", std::regex::icase),
            std::regex("exhausted your capacity", std::regex::icase),
        };
        if (auto m = first_json_message(logs)) return m;
        return first_matching_line(logs, gemini);
    }

    if (provider == "codex") {
        static const std::vector<std::regex> codex = {
            std::regex("invalid_request_error"),
            std::regex("unsupported_value"),
            std::regex("thread .* panicked", std::regex::icase),
        };
        if (auto m = first_json_message(logs)) return m;
        return first_matching_line(logs, codex);
    }

    return std::nullopt;
}

std::optional<std::string> detect_agent_failure_detail(const std::string& provider,
                                                       const std::string& stdout_path,
                                                       const std::string& stderr_path) {
    if (provider != "claude" && provider != "gemini" && provider != "codex") return std::nullopt;
    std::string combined = read_file_or_empty(stdout_path) + "\n" + read_file_or_empty(stderr_path);
    if (trim(combined).empty()) return std::nullopt;
    return detect_agent_failure_detail_text(provider, combined);
}

} // namespace gauntlet
