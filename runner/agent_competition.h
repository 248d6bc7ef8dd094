#pragma once

#include "gauntlet/competition.h"
#include "gauntlet/config.h"
#include "gauntlet/log.h"
#include "gauntlet/run_record.h"
#include "gauntlet/sandbox_config.h"
#include "gauntlet/signaler.h"
#include "gauntlet/timer.h"

#include <atomic>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gauntlet {

struct AgentCandidate {
    std::string id;
    std::string provider;
    std::vector<std::string> command;
    std::string cwd;
    std::map<std::string, std::string> env;
};

struct PreparedAgent {
    AgentCandidate agent;
    std::filesystem::path agent_dir;   // <output_dir>/agents/<id>
    std::filesystem::path scratch_dir; // TMPDIR for the child, removed on cleanup
    std::string stdout_path;
    std::string stderr_path;
    DenialBackoffConfig denial_backoff;
};

struct AgentRunResult {
    AgentSnapshot snapshot;
    std::optional<std::string> failure_detail;
};

// Orders results by agent id.
bool agent_result_less(const AgentRunResult& a, const AgentRunResult& b);

struct AgentCompetitionSettings {
    std::filesystem::path output_dir;
    WatchdogConfig limits;
    SandboxConfig sandbox;
};

// Runs each agent through run_agent_process and records every lifecycle
// transition. Setup failures of a single agent become "errored" results;
// anything else propagates to the engine's failure policy.
class AgentCompetitionAdapter final
    : public CompetitionAdapter<AgentCandidate, PreparedAgent, AgentRunResult> {
public:
    AgentCompetitionAdapter(AgentCompetitionSettings settings,
                            IRunRecorder& recorder,
                            JsonlLogger& log,
                            ITimerService& timers,
                            IProcessSignaler& signaler);

    void queue_candidate(const AgentCandidate& candidate, size_t index) override;
    PreparationResult<PreparedAgent, AgentRunResult> prepare_candidates(
        const std::vector<AgentCandidate>& candidates) override;
    void on_preparation_failure(const AgentRunResult& result, size_t index) override;
    void on_candidate_prepared(const PreparedAgent& prepared, size_t index) override;

    void on_running(const PreparedAgent& prepared, size_t index) override;
    AgentRunResult execute(const PreparedAgent& prepared, size_t index) override;
    void on_completed(const PreparedAgent& prepared, const AgentRunResult& result, size_t index) override;
    std::optional<AgentRunResult> on_execution_failure(
        const ExecuteFailureContext<PreparedAgent>& ctx) override;
    void cleanup(const PreparedAgent& prepared, size_t index) override;

    void finalize_competition() override;

private:
    std::optional<std::string> validate(const AgentCandidate& c, PreparedAgent* out);
    void record(const AgentSnapshot& s);

    AgentCompetitionSettings settings_;
    IRunRecorder& recorder_;
    JsonlLogger& log_;
    ITimerService& timers_;
    IProcessSignaler& signaler_;

    std::atomic<int> executed_{0};
    std::atomic<int> captured_{0};
    std::atomic<int> cleaned_{0};
};

} // namespace gauntlet
