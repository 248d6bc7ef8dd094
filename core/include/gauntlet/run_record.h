#pragma once

#include "denial_backoff.h"
#include "log.h"
#include "watchdog.h"

#include <cstdint>
#include <optional>
#include <string>

namespace gauntlet {

enum class AgentStatus { QUEUED, RUNNING, SUCCEEDED, FAILED, ERRORED };

// "queued" | "running" | "succeeded" | "failed" | "errored"
const char* agent_status_name(AgentStatus s);

// Limits the watchdog enforced on a run, and what fired (if anything).
struct WatchdogMetadata {
    int64_t silence_timeout_ms{0};
    int64_t wall_clock_cap_ms{0};
    std::optional<WatchdogTrigger> trigger;
};

struct AgentSnapshot {
    std::string agent_id;
    std::string provider;
    AgentStatus status{AgentStatus::QUEUED};
    std::optional<int> exit_code;
    std::optional<std::string> signal;
    std::optional<std::string> error_message;
    std::optional<WatchdogMetadata> watchdog;
    std::optional<DenialInfo> fail_fast;
    std::string stdout_path;
    std::string stderr_path;
};

// Canonical JSON object for a snapshot. Optional fields are omitted.
std::string agent_snapshot_to_json(const AgentSnapshot& s);

// Sink for agent lifecycle transitions. Implementations must tolerate
// concurrent calls from pool workers.
class IRunRecorder {
public:
    virtual ~IRunRecorder() = default;
    virtual void record_agent_queued(const std::string& agent_id, const std::string& provider) = 0;
    virtual void record_agent_snapshot(const AgentSnapshot& snapshot) = 0;
};

// Writes "agent_queued" / "agent_snapshot" events to a JsonlLogger.
// Write failures are reported on stderr and otherwise ignored.
class JsonlRunRecorder final : public IRunRecorder {
public:
    explicit JsonlRunRecorder(JsonlLogger& log) : log_(log) {}

    void record_agent_queued(const std::string& agent_id, const std::string& provider) override;
    void record_agent_snapshot(const AgentSnapshot& snapshot) override;

private:
    JsonlLogger& log_;
};

} // namespace gauntlet
