#include "test_common.h"
#include "gauntlet/config.h"
#include <cstdlib>
#include <iostream>
#include <sstream>

int main() {
    // Test 1: Default profile is DEV
    unsetenv("GAUNTLET_PROFILE");
    auto p = gauntlet::detect_profile();
    expect_true(p == gauntlet::Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("GAUNTLET_PROFILE", "PROD", 1);
    p = gauntlet::detect_profile();
    expect_true(p == gauntlet::Profile::PROD, "should detect PROD case-insensitive");
    setenv("GAUNTLET_PROFILE", "production", 1);
    expect_true(gauntlet::detect_profile() == gauntlet::Profile::PROD, "production is PROD");

    // Test 3: Apply defaults (won't override existing)
    setenv("GAUNTLET_MAX_PARALLEL", "7", 1);
    unsetenv("GAUNTLET_FAILURE_POLICY");
    gauntlet::apply_profile_defaults(gauntlet::Profile::PROD);
    std::string val = std::getenv("GAUNTLET_MAX_PARALLEL") ? std::getenv("GAUNTLET_MAX_PARALLEL") : "";
    expect_true(val == "7", "should NOT override pre-existing env var");
    val = std::getenv("GAUNTLET_FAILURE_POLICY") ? std::getenv("GAUNTLET_FAILURE_POLICY") : "";
    expect_true(val == "abort", "PROD should set FAILURE_POLICY=abort");

    auto d = gauntlet::competition_defaults_from_env();
    expect_eq_ll(d.max_parallel, 7, "max_parallel from env");
    expect_true(d.failure_policy == gauntlet::FailurePolicy::ABORT, "policy from env");

    // Test 4: DEV defaults
    unsetenv("GAUNTLET_MAX_PARALLEL");
    unsetenv("GAUNTLET_FAILURE_POLICY");
    gauntlet::apply_profile_defaults(gauntlet::Profile::DEV);
    d = gauntlet::competition_defaults_from_env();
    expect_eq_ll(d.max_parallel, 4, "DEV max_parallel");
    expect_true(d.failure_policy == gauntlet::FailurePolicy::CONTINUE, "DEV continues after failures");

    // Test 5: Out-of-range and unparsable overrides fall back
    setenv("GAUNTLET_MAX_PARALLEL", "0", 1);
    setenv("GAUNTLET_FAILURE_POLICY", "retry", 1);
    {
        std::ostringstream captured;
        std::streambuf* saved = std::cerr.rdbuf(captured.rdbuf());
        d = gauntlet::competition_defaults_from_env();
        std::cerr.rdbuf(saved);
        expect_true(captured.str().find("[warn] ignoring GAUNTLET_FAILURE_POLICY='retry'") != std::string::npos,
                    "unknown policy is reported: " + captured.str());
    }
    expect_eq_ll(d.max_parallel, 4, "zero parallelism ignored");
    expect_true(d.failure_policy == gauntlet::FailurePolicy::ABORT, "unknown policy ignored");
    setenv("GAUNTLET_MAX_PARALLEL", "lots", 1);
    expect_eq_ll(gauntlet::getenv_i64("GAUNTLET_MAX_PARALLEL", 9), 9, "unparsable falls back");

    // Test 6: Watchdog limits
    unsetenv("GAUNTLET_SILENCE_TIMEOUT_MS");
    unsetenv("GAUNTLET_WALL_CLOCK_CAP_MS");
    unsetenv("GAUNTLET_KILL_GRACE_MS");
    unsetenv("GAUNTLET_FATAL_RETRY_WINDOW_MS");
    unsetenv("GAUNTLET_HARD_ABORT_MS");
    auto w = gauntlet::watchdog_config_from_env();
    expect_eq_ll(w.silence_timeout_ms, 15 * 60 * 1000, "silence default");
    expect_eq_ll(w.wall_clock_cap_ms, 120 * 60 * 1000, "wall-clock default");
    expect_eq_ll(w.kill_grace_ms, 5000, "kill grace default");
    expect_eq_ll(w.fatal_retry_window_ms, 60000, "fatal window default");
    expect_eq_ll(w.hard_abort_ms, 10000, "hard abort default");

    setenv("GAUNTLET_SILENCE_TIMEOUT_MS", "250", 1);
    setenv("GAUNTLET_KILL_GRACE_MS", "-5", 1);
    w = gauntlet::watchdog_config_from_env();
    expect_eq_ll(w.silence_timeout_ms, 250, "silence override");
    expect_eq_ll(w.kill_grace_ms, 5000, "negative override ignored");

    // Test 7: Names and policy parsing
    expect_true(std::string(gauntlet::profile_name(gauntlet::Profile::DEV)) == "dev", "dev name");
    expect_true(std::string(gauntlet::profile_name(gauntlet::Profile::PROD)) == "prod", "prod name");
    gauntlet::FailurePolicy fp = gauntlet::FailurePolicy::ABORT;
    expect_true(gauntlet::parse_failure_policy("Continue", &fp), "parse Continue");
    expect_true(fp == gauntlet::FailurePolicy::CONTINUE, "Continue -> CONTINUE");
    expect_true(!gauntlet::parse_failure_policy("", &fp), "empty policy rejected");
    expect_eq_str(gauntlet::failure_policy_name(gauntlet::FailurePolicy::ABORT), "abort", "abort name");

    // Cleanup
    unsetenv("GAUNTLET_PROFILE");
    unsetenv("GAUNTLET_MAX_PARALLEL");
    unsetenv("GAUNTLET_FAILURE_POLICY");
    unsetenv("GAUNTLET_SILENCE_TIMEOUT_MS");
    unsetenv("GAUNTLET_KILL_GRACE_MS");

    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
