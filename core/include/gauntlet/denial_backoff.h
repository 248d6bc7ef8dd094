#pragma once

// Gauntlet sandbox denial backoff.
//
// The sandbox runtime logs every operation it refuses. An agent that keeps
// hammering the same denied resource (e.g. a package registry that is not
// on the network allowlist) gets escalating treatment per (operation,
// target) key:
//
//   none -> warn -> delay (SIGSTOP for delay_ms, then SIGCONT) -> fail-fast
//
// The tracker itself is pure bookkeeping: callers pass the clock in.

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>

namespace gauntlet {

enum class DenialOperation { NETWORK_CONNECT, FILE_READ, FILE_WRITE };

// "network-connect" | "file-read" | "file-write"
const char* denial_operation_name(DenialOperation op);

struct DenialInfo {
    DenialOperation operation{DenialOperation::NETWORK_CONNECT};
    std::string target;

    bool operator==(const DenialInfo& o) const {
        return operation == o.operation && target == o.target;
    }
    bool operator!=(const DenialInfo& o) const { return !(*this == o); }
};

enum class BackoffAction { NONE, WARN, DELAY, FAIL_FAST };

// "none" | "warn" | "delay" | "fail-fast"
const char* backoff_action_name(BackoffAction a);

struct DenialBackoffDecision {
    BackoffAction action{BackoffAction::NONE};
    int count{0}; // occurrences of this key within the window
};

struct DenialBackoffConfig {
    bool enabled{true};
    int warning_threshold{2};    // exact count within 30s
    int delay_threshold{3};      // exact count within 60s
    int64_t delay_ms{5000};
    int fail_fast_threshold{4};  // count within window_ms
    int64_t window_ms{120000};
};

// Parse one sandbox log line. Understood forms:
//   [SandboxDebug] Denied by config rule: registry.npmjs.org:443
//   Sandbox: node(812) deny(1) file-write-create /etc/passwd
//   Sandbox: node(812) deny(1) file-read-data /Users/x/.ssh/id_rsa
//   Sandbox: curl(77) deny(1) network-outbound 10.0.0.1:80
std::optional<DenialInfo> parse_sandbox_denial_line(const std::string& line);

class DenialBackoffTracker {
public:
    explicit DenialBackoffTracker(const DenialBackoffConfig& cfg);

    // Record one denial at now_ms and classify the key's current window.
    DenialBackoffDecision record(const DenialInfo& info, int64_t now_ms);

    // Forget every key (the agent started an unrelated operation).
    void reset_all();

    size_t tracked_keys() const { return history_.size(); }
    const DenialBackoffConfig& config() const { return cfg_; }

private:
    DenialBackoffConfig cfg_;
    std::unordered_map<std::string, std::deque<int64_t>> history_;
};

} // namespace gauntlet
