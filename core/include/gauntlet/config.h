#pragma once
#include <cstdint>
#include <string>

namespace gauntlet {

enum class Profile { DEV, PROD };

// Detect profile from GAUNTLET_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: generous parallelism, keep running other agents after a failure.
// PROD: narrow parallelism, abort admission on the first uncaptured failure.
void apply_profile_defaults(Profile p);

// Integer env lookup. Unset or unparsable values fall back to defv.
int64_t getenv_i64(const char* key, int64_t defv);

// Timing limits enforced on every supervised agent process.
struct WatchdogConfig {
    int64_t silence_timeout_ms{15 * 60 * 1000};
    int64_t wall_clock_cap_ms{120 * 60 * 1000};
    int64_t kill_grace_ms{5 * 1000};
    int64_t fatal_retry_window_ms{60 * 1000};
    // After SIGKILL: how long to wait before force-resolving the process wait.
    int64_t hard_abort_ms{10 * 1000};
};

// Built-in defaults overridden by GAUNTLET_*_MS variables.
// Non-positive overrides are ignored.
WatchdogConfig watchdog_config_from_env();

enum class FailurePolicy { ABORT, CONTINUE };

const char* failure_policy_name(FailurePolicy p);

// Accepts "abort" / "continue" (case-insensitive). Returns false otherwise.
bool parse_failure_policy(const std::string& s, FailurePolicy* out);

struct CompetitionDefaults {
    int max_parallel{4};
    FailurePolicy failure_policy{FailurePolicy::ABORT};
};

// Reads GAUNTLET_MAX_PARALLEL and GAUNTLET_FAILURE_POLICY.
CompetitionDefaults competition_defaults_from_env();

} // namespace gauntlet
