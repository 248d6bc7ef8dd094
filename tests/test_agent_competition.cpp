#include "test_common.h"
#include "agent_competition.h"
#include "runner_utils.h"

#include "gauntlet/competition.h"
#include "gauntlet/log.h"
#include "gauntlet/run_record.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace gauntlet;

static std::string read_file(const fs::path& p) {
    std::ifstream f(p);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static size_t count_of(const std::string& hay, const std::string& needle) {
    size_t n = 0;
    for (size_t p = hay.find(needle); p != std::string::npos; p = hay.find(needle, p + needle.size())) n++;
    return n;
}

static AgentCandidate agent(const std::string& id, const std::string& script, const fs::path& cwd) {
    AgentCandidate c;
    c.id = id;
    c.provider = "codex";
    c.command = {"/bin/sh", "-c", script};
    c.cwd = cwd.string();
    return c;
}

int main() {
    fs::path dir = fs::temp_directory_path() / ("gauntlet_competition_" + std::to_string(getpid()));
    fs::create_directories(dir);

    // Test 1: Mixed outcomes, sorted by agent id
    {
        AgentCompetitionSettings settings;
        settings.output_dir = dir / "out";
        settings.limits.silence_timeout_ms = 60 * 1000;
        settings.limits.wall_clock_cap_ms = 60 * 1000;
        std::string err;
        expect_true(parse_sandbox_config("{}", &settings.sandbox, &err), "sandbox defaults: " + err);

        fs::create_directories(settings.output_dir);
        RunHeader hdr;
        hdr.run_id = "competition-test";
        JsonlLogger log(hdr, (settings.output_dir / "events.jsonl").string());
        JsonlRunRecorder recorder(log);
        ThreadTimerService timers;
        PosixProcessSignaler signaler;
        AgentCompetitionAdapter adapter(settings, recorder, log, timers, signaler);

        std::vector<AgentCandidate> cands = {
            agent("zeta", "echo \"$TMPDIR\"", dir),
            agent("alpha", "echo 'error: invalid_request_error bad model' 1>&2; exit 1", dir),
            agent("zeta", "true", dir),
            agent("", "true", dir),
        };
        AgentCandidate missing = agent("mid", "true", dir);
        missing.command = {"no-such-agent-binary"};
        cands.push_back(missing);
        AgentCandidate bad_cwd = agent("nowhere", "true", dir / "does-not-exist");
        cands.push_back(bad_cwd);

        CompetitionOptions<AgentRunResult> opt;
        opt.max_parallel = 2;
        opt.failure_policy = FailurePolicy::CONTINUE;
        opt.sort_results = agent_result_less;
        auto results = execute_competition<AgentCandidate, PreparedAgent, AgentRunResult>(cands, opt, adapter);

        expect_eq_ll((long long)results.size(), 6, "every candidate has a result");
        expect_eq_str(results[0].snapshot.agent_id, "", "empty id sorts first");
        expect_eq_str(results[0].snapshot.error_message.value_or(""), "Agent id is empty", "empty id");
        expect_eq_str(results[1].snapshot.agent_id, "alpha", "alpha");
        expect_true(results[1].snapshot.status == AgentStatus::FAILED, "alpha failed");
        expect_eq_str(results[1].snapshot.error_message.value_or(""), "Agent exited with code 1", "alpha message");
        expect_eq_str(results[1].failure_detail.value_or(""), "invalid_request_error bad model", "alpha detail");
        expect_eq_str(results[2].snapshot.agent_id, "mid", "mid");
        expect_true(results[2].snapshot.status == AgentStatus::ERRORED, "mid errored");
        expect_eq_str(results[2].snapshot.error_message.value_or(""),
                      "Agent executable not found or not executable: no-such-agent-binary", "mid message");
        expect_eq_str(results[3].snapshot.agent_id, "nowhere", "nowhere");
        expect_true(results[3].snapshot.error_message.value_or("").find("Agent working directory does not exist") == 0,
                    "bad cwd");
        // Duplicate rejected at preparation sorts before the executed one.
        expect_eq_str(results[4].snapshot.agent_id, "zeta", "duplicate zeta");
        expect_eq_str(results[4].snapshot.error_message.value_or(""), "Duplicate agent id: zeta", "duplicate message");
        expect_eq_str(results[5].snapshot.agent_id, "zeta", "zeta");
        expect_true(results[5].snapshot.status == AgentStatus::SUCCEEDED, "zeta succeeded");

        fs::path zeta_dir = settings.output_dir / "agents" / "zeta";
        expect_eq_str(read_file(zeta_dir / "stdout.log"), (zeta_dir / "tmp").string() + "\n", "TMPDIR is the scratch dir");
        expect_true(!fs::exists(zeta_dir / "tmp"), "scratch dir removed on cleanup");

        std::string events = read_file(settings.output_dir / "events.jsonl");
        expect_eq_ll((long long)count_of(events, "\"event\":\"agent_queued\""), 6, "queued per candidate");
        expect_eq_ll((long long)count_of(events, "\"status\":\"running\""), 2, "two agents started");
        expect_eq_ll((long long)count_of(events, "\"status\":\"errored\""), 4, "four not started");
        expect_true(events.find("\"event\":\"competition_finalized\",\"format_version\":\"gauntlet.events.v1\","
                                "\"payload\":{\"captured_failures\":0,\"cleaned\":2,\"executed\":2}") != std::string::npos,
                    "finalize counts: " + events);
    }

    // Test 2: Path helpers
    {
        expect_eq_str(sanitize_path_component("agent/../x y"), "agent_.._x_y", "sanitized");
        expect_true(!sanitize_path_component("").empty(), "never empty");
        expect_eq_str(resolve_against("/base", "/abs").string(), "/abs", "absolute kept");
        expect_eq_str(resolve_against("/base", "rel/../x").string(), "/base/x", "relative resolved");
        setenv("GAUNTLET_DETERMINISTIC_RUN_ID", "1", 1);
        expect_eq_str(gen_run_id(), gen_run_id(), "deterministic run id");
        expect_eq_ll((long long)gen_run_id().size(), 32, "32 hex chars");
        unsetenv("GAUNTLET_DETERMINISTIC_RUN_ID");
    }

    fs::remove_all(dir);
    std::cerr << "test_agent_competition: ALL PASSED" << std::endl;
    return 0;
}
