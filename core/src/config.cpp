#include "gauntlet/config.h"
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>

namespace gauntlet {

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

Profile detect_profile() {
    const char* env = std::getenv("GAUNTLET_PROFILE");
    if (!env) return Profile::DEV;

    std::string val = lower(env);
    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("GAUNTLET_MAX_PARALLEL",          "4",        NO_OVERWRITE);
            setenv("GAUNTLET_FAILURE_POLICY",        "continue", NO_OVERWRITE);
            setenv("GAUNTLET_SILENCE_TIMEOUT_MS",    "900000",   NO_OVERWRITE);
            setenv("GAUNTLET_WALL_CLOCK_CAP_MS",     "7200000",  NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("GAUNTLET_MAX_PARALLEL",          "2",        NO_OVERWRITE);
            setenv("GAUNTLET_FAILURE_POLICY",        "abort",    NO_OVERWRITE);
            setenv("GAUNTLET_SILENCE_TIMEOUT_MS",    "900000",   NO_OVERWRITE);
            setenv("GAUNTLET_WALL_CLOCK_CAP_MS",     "7200000",  NO_OVERWRITE);
            setenv("GAUNTLET_KILL_GRACE_MS",         "5000",     NO_OVERWRITE);
            setenv("GAUNTLET_HARD_ABORT_MS",         "10000",    NO_OVERWRITE);
            break;
    }
}

int64_t getenv_i64(const char* key, int64_t defv) {
    if (const char* e = std::getenv(key)) {
        try { return std::stoll(e); } catch (const std::exception&) { return defv; }
    }
    return defv;
}

WatchdogConfig watchdog_config_from_env() {
    WatchdogConfig cfg;
    auto pick = [](const char* key, int64_t defv) {
        int64_t v = getenv_i64(key, defv);
        return v > 0 ? v : defv;
    };
    cfg.silence_timeout_ms    = pick("GAUNTLET_SILENCE_TIMEOUT_MS", cfg.silence_timeout_ms);
    cfg.wall_clock_cap_ms     = pick("GAUNTLET_WALL_CLOCK_CAP_MS", cfg.wall_clock_cap_ms);
    cfg.kill_grace_ms         = pick("GAUNTLET_KILL_GRACE_MS", cfg.kill_grace_ms);
    cfg.fatal_retry_window_ms = pick("GAUNTLET_FATAL_RETRY_WINDOW_MS", cfg.fatal_retry_window_ms);
    cfg.hard_abort_ms         = pick("GAUNTLET_HARD_ABORT_MS", cfg.hard_abort_ms);
    return cfg;
}

const char* failure_policy_name(FailurePolicy p) {
    switch (p) {
        case FailurePolicy::ABORT:    return "abort";
        case FailurePolicy::CONTINUE: return "continue";
    }
    return "abort";
}

bool parse_failure_policy(const std::string& s, FailurePolicy* out) {
    std::string v = lower(s);
    if (v == "abort") {
        if (out) *out = FailurePolicy::ABORT;
        return true;
    }
    if (v == "continue") {
        if (out) *out = FailurePolicy::CONTINUE;
        return true;
    }
    return false;
}

CompetitionDefaults competition_defaults_from_env() {
    CompetitionDefaults d;
    int64_t mp = getenv_i64("GAUNTLET_MAX_PARALLEL", d.max_parallel);
    if (mp > 0 && mp < 1024) d.max_parallel = (int)mp;
    if (const char* fp = std::getenv("GAUNTLET_FAILURE_POLICY")) {
        if (!parse_failure_policy(fp, &d.failure_policy)) {
            std::cerr << "[warn] ignoring GAUNTLET_FAILURE_POLICY='" << fp << "' (expected abort|continue), using "
                      << failure_policy_name(d.failure_policy) << "\n";
        }
    }
    return d;
}

} // namespace gauntlet
