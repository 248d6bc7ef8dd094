#include "agent_competition.h"
#include "runner_utils.h"

#include "gauntlet/agent_launcher.h"
#include "gauntlet/errors.h"
#include "gauntlet/proc.h"

#include <json-c/json.h>

#include <iostream>
#include <set>
#include <stdexcept>
#include <system_error>

namespace gauntlet {

bool agent_result_less(const AgentRunResult& a, const AgentRunResult& b) {
    return a.snapshot.agent_id < b.snapshot.agent_id;
}

AgentCompetitionAdapter::AgentCompetitionAdapter(AgentCompetitionSettings settings,
                                                 IRunRecorder& recorder,
                                                 JsonlLogger& log,
                                                 ITimerService& timers,
                                                 IProcessSignaler& signaler)
    : settings_(std::move(settings)),
      recorder_(recorder),
      log_(log),
      timers_(timers),
      signaler_(signaler) {}

void AgentCompetitionAdapter::record(const AgentSnapshot& s) {
    // telemetry only: a failed write never fails the run
    try {
        recorder_.record_agent_snapshot(s);
    } catch (const std::exception& e) {
        std::cerr << "[warn] recording " << s.agent_id << " failed: " << e.what() << "\n";
    }
}

void AgentCompetitionAdapter::queue_candidate(const AgentCandidate& candidate, size_t index) {
    (void)index;
    try {
        recorder_.record_agent_queued(candidate.id, candidate.provider);
    } catch (const std::exception& e) {
        std::cerr << "[warn] recording " << candidate.id << " failed: " << e.what() << "\n";
    }
}

std::optional<std::string> AgentCompetitionAdapter::validate(const AgentCandidate& c, PreparedAgent* out) {
    if (c.command.empty() || c.command[0].empty()) return std::string("Agent command is empty");

    std::string exe = c.command[0];
    if (!c.cwd.empty() && exe[0] != '/' && exe.find('/') != std::string::npos) {
        exe = c.cwd + "/" + exe;
    }
    if (find_executable(exe).empty()) {
        return "Agent executable not found or not executable: " + c.command[0];
    }

    std::error_code ec;
    if (!c.cwd.empty() && !std::filesystem::is_directory(c.cwd, ec)) {
        return "Agent working directory does not exist: " + c.cwd;
    }

    out->agent = c;
    out->agent_dir = settings_.output_dir / "agents" / sanitize_path_component(c.id);
    out->scratch_dir = out->agent_dir / "tmp";
    std::filesystem::create_directories(out->scratch_dir, ec);
    if (ec) {
        return "Failed to create agent directory " + out->agent_dir.string() + ": " + ec.message();
    }
    out->stdout_path = (out->agent_dir / "stdout.log").string();
    out->stderr_path = (out->agent_dir / "stderr.log").string();
    out->denial_backoff = resolve_denial_backoff(settings_.sandbox, c.provider);
    return std::nullopt;
}

PreparationResult<PreparedAgent, AgentRunResult> AgentCompetitionAdapter::prepare_candidates(
    const std::vector<AgentCandidate>& candidates) {
    PreparationResult<PreparedAgent, AgentRunResult> out;
    std::set<std::string> seen;

    for (const auto& c : candidates) {
        std::optional<std::string> problem;
        PreparedAgent p;
        if (c.id.empty()) {
            problem = "Agent id is empty";
        } else if (!seen.insert(c.id).second) {
            problem = "Duplicate agent id: " + c.id;
        } else {
            problem = validate(c, &p);
        }

        if (problem) {
            AgentRunResult r;
            r.snapshot.agent_id = c.id;
            r.snapshot.provider = c.provider;
            r.snapshot.status = AgentStatus::ERRORED;
            r.snapshot.error_message = *problem;
            out.failures.push_back(std::move(r));
            continue;
        }
        out.ready.push_back(std::move(p));
    }
    return out;
}

void AgentCompetitionAdapter::on_preparation_failure(const AgentRunResult& result, size_t index) {
    (void)index;
    std::cerr << "[gauntlet] agent " << result.snapshot.agent_id << " not started: "
              << result.snapshot.error_message.value_or("") << "\n";
    record(result.snapshot);
}

void AgentCompetitionAdapter::on_candidate_prepared(const PreparedAgent& prepared, size_t index) {
    (void)index;
    std::cerr << "[gauntlet] agent " << prepared.agent.id << " prepared at " << prepared.agent_dir.string() << "\n";
}

void AgentCompetitionAdapter::on_running(const PreparedAgent& prepared, size_t index) {
    (void)index;
    AgentSnapshot s;
    s.agent_id = prepared.agent.id;
    s.provider = prepared.agent.provider;
    s.status = AgentStatus::RUNNING;
    s.stdout_path = prepared.stdout_path;
    s.stderr_path = prepared.stderr_path;
    record(s);
}

AgentRunResult AgentCompetitionAdapter::execute(const PreparedAgent& prepared, size_t index) {
    (void)index;
    const std::string agent_id = prepared.agent.id;

    AgentProcessOptions opt;
    opt.provider_id = prepared.agent.provider;
    opt.argv = prepared.agent.command;
    opt.cwd = prepared.agent.cwd;
    opt.env = prepared.agent.env;
    opt.env["TMPDIR"] = prepared.scratch_dir.string();
    opt.stdout_path = prepared.stdout_path;
    opt.stderr_path = prepared.stderr_path;
    opt.limits = settings_.limits;
    opt.denial_backoff = prepared.denial_backoff;
    opt.timers = &timers_;
    opt.signaler = &signaler_;
    opt.on_trigger = [this, agent_id](WatchdogTrigger t, const std::string& reason,
                                      const std::optional<DenialInfo>& fail_fast) {
        std::cerr << "[watchdog] agent " << agent_id << ": " << reason << "\n";
        json_object* p = json_object_new_object();
        json_object_object_add(p, "agent_id", json_object_new_string(agent_id.c_str()));
        json_object_object_add(p, "trigger", json_object_new_string(watchdog_trigger_name(t)));
        json_object_object_add(p, "reason", json_object_new_string(reason.c_str()));
        if (fail_fast) {
            json_object_object_add(p, "operation", json_object_new_string(denial_operation_name(fail_fast->operation)));
            json_object_object_add(p, "target", json_object_new_string(fail_fast->target.c_str()));
        }
        std::string payload = json_object_to_json_string_ext(p, JSON_C_TO_STRING_PLAIN);
        json_object_put(p);
        if (!log_.event("watchdog_triggered", payload)) {
            std::cerr << "[warn] failed to log watchdog trigger for " << agent_id << "\n";
        }
    };

    AgentProcessResult pr = run_agent_process(opt);
    executed_++;

    AgentRunResult r;
    r.snapshot.agent_id = agent_id;
    r.snapshot.provider = prepared.agent.provider;
    r.snapshot.status = pr.error_message ? AgentStatus::FAILED : AgentStatus::SUCCEEDED;
    r.snapshot.exit_code = pr.exit_code;
    r.snapshot.signal = pr.signal;
    r.snapshot.error_message = pr.error_message;
    r.snapshot.watchdog = pr.watchdog;
    r.snapshot.fail_fast = pr.fail_fast;
    r.snapshot.stdout_path = prepared.stdout_path;
    r.snapshot.stderr_path = prepared.stderr_path;
    if (pr.error_message) {
        r.failure_detail = detect_agent_failure_detail(prepared.agent.provider,
                                                       prepared.stdout_path, prepared.stderr_path);
    }
    return r;
}

void AgentCompetitionAdapter::on_completed(const PreparedAgent& prepared,
                                           const AgentRunResult& result, size_t index) {
    (void)index;
    std::cerr << "[gauntlet] agent " << prepared.agent.id << " "
              << agent_status_name(result.snapshot.status);
    if (result.snapshot.error_message) std::cerr << ": " << *result.snapshot.error_message;
    std::cerr << "\n";
    record(result.snapshot);
}

std::optional<AgentRunResult> AgentCompetitionAdapter::on_execution_failure(
    const ExecuteFailureContext<PreparedAgent>& ctx) {
    // Only agent setup failures are expected outcomes.
    try {
        std::rethrow_exception(ctx.error);
    } catch (const AgentRuntimeError& e) {
        AgentRunResult r;
        r.snapshot.agent_id = ctx.prepared.agent.id;
        r.snapshot.provider = ctx.prepared.agent.provider;
        r.snapshot.status = AgentStatus::ERRORED;
        r.snapshot.error_message = e.what();
        r.snapshot.stdout_path = ctx.prepared.stdout_path;
        r.snapshot.stderr_path = ctx.prepared.stderr_path;
        std::cerr << "[gauntlet] agent " << r.snapshot.agent_id << " errored ("
                  << agent_runtime_error_kind_name(e.kind()) << "): " << e.what() << "\n";
        record(r.snapshot);
        captured_++;
        return r;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void AgentCompetitionAdapter::cleanup(const PreparedAgent& prepared, size_t index) {
    (void)index;
    cleaned_++;
    std::error_code ec;
    std::filesystem::remove_all(prepared.scratch_dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to remove scratch directory " +
                                 prepared.scratch_dir.string() + ": " + ec.message());
    }
}

void AgentCompetitionAdapter::finalize_competition() {
    json_object* p = json_object_new_object();
    json_object_object_add(p, "executed", json_object_new_int(executed_.load()));
    json_object_object_add(p, "captured_failures", json_object_new_int(captured_.load()));
    json_object_object_add(p, "cleaned", json_object_new_int(cleaned_.load()));
    std::string payload = json_object_to_json_string_ext(p, JSON_C_TO_STRING_PLAIN);
    json_object_put(p);
    if (!log_.event("competition_finalized", payload)) {
        throw std::runtime_error("failed to write competition_finalized to " + log_.path());
    }
}

} // namespace gauntlet
