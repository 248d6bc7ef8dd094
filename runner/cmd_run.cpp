#include "cmd_run.h"
#include "agent_competition.h"
#include "runner_utils.h"

#include "gauntlet/competition.h"
#include "gauntlet/config.h"
#include "gauntlet/errors.h"
#include "gauntlet/json_mini.h"
#include "gauntlet/log.h"
#include "gauntlet/proc.h"
#include "gauntlet/run_record.h"
#include "gauntlet/sandbox_config.h"
#include "gauntlet/signaler.h"
#include "gauntlet/timer.h"

#include <json-c/json.h>

#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

using namespace gauntlet;

namespace {

// Request-level problems. Printed and mapped to exit code 2.
bool parse_agents(json_object* root,
                  const std::filesystem::path& request_dir,
                  std::vector<AgentCandidate>* out,
                  std::string* err) {
    json_object* arr = json_mini::field(root, "agents");
    if (!arr || !json_object_is_type(arr, json_type_array) || json_object_array_length(arr) == 0) {
        *err = "\"agents\" must be a non-empty array";
        return false;
    }
    const size_t n = json_object_array_length(arr);
    for (size_t i = 0; i < n; i++) {
        json_object* a = json_object_array_get_idx(arr, i);
        if (!a || !json_object_is_type(a, json_type_object)) {
            *err = "agents[" + std::to_string(i) + "] is not an object";
            return false;
        }
        AgentCandidate c;
        c.id = json_mini::get_string(a, "id").value_or("");
        c.provider = json_mini::get_string(a, "provider").value_or("");

        json_object* cmd = json_mini::field(a, "command");
        if (cmd && json_object_is_type(cmd, json_type_string)) {
            c.command = split_argv_quoted(json_object_get_string(cmd));
        } else if (cmd) {
            c.command = json_mini::get_string_array(a, "command").value_or(std::vector<std::string>{});
        }

        c.cwd = resolve_against(request_dir, json_mini::get_string(a, "cwd").value_or(".")).string();

        if (json_object* env = json_mini::field(a, "env")) {
            if (!json_object_is_type(env, json_type_object)) {
                *err = "agents[" + std::to_string(i) + "].env must be an object";
                return false;
            }
            json_object_object_foreach(env, k, v) {
                if (!json_object_is_type(v, json_type_string)) {
                    *err = "agents[" + std::to_string(i) + "].env." + k + " must be a string";
                    return false;
                }
                c.env[k] = json_object_get_string(v);
            }
        }
        out->push_back(std::move(c));
    }
    return true;
}

std::string summary_json(const std::string& run_id,
                         const std::string& events_path,
                         const std::vector<AgentRunResult>& results,
                         bool all_ok) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "run_id", json_object_new_string(run_id.c_str()));
    json_object_object_add(o, "events", json_object_new_string(events_path.c_str()));
    json_object_object_add(o, "ok", json_object_new_boolean(all_ok ? 1 : 0));

    json_object* agents = json_object_new_array();
    for (const auto& r : results) {
        json_mini::Doc snap = json_mini::parse(agent_snapshot_to_json(r.snapshot));
        json_object* a = snap.root ? snap.root : json_object_new_object();
        snap.root = nullptr;
        if (r.failure_detail) {
            json_object_object_add(a, "failure_detail", json_object_new_string(r.failure_detail->c_str()));
        }
        json_object_array_add(agents, a);
    }
    json_object_object_add(o, "agents", agents);

    std::string s = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_NOSLASHESCAPE);
    json_object_put(o);
    return s;
}

} // namespace

int cmd_run(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: gauntlet_cli run <competition.json>\n";
        std::cerr << "env: GAUNTLET_PROFILE=dev|prod, GAUNTLET_MAX_PARALLEL, GAUNTLET_FAILURE_POLICY=abort|continue\n";
        return 2;
    }

    Profile profile = detect_profile();
    apply_profile_defaults(profile);

    std::filesystem::path req_path = std::filesystem::absolute(argv[2]);
    std::filesystem::path request_dir = req_path.parent_path();

    std::string req;
    try {
        req = slurp(req_path.string());
    } catch (const std::exception& e) {
        std::cerr << "[gauntlet] " << e.what() << "\n";
        return 2;
    }

    std::string perr;
    json_mini::Doc doc = json_mini::parse(req, &perr);
    if (!doc || !json_object_is_type(doc.root, json_type_object)) {
        std::cerr << "[gauntlet] invalid request JSON in " << req_path.string()
                  << (perr.empty() ? "" : ": " + perr) << "\n";
        return 2;
    }

    CompetitionDefaults defaults = competition_defaults_from_env();
    CompetitionOptions<AgentRunResult> options;
    options.max_parallel = defaults.max_parallel;
    options.failure_policy = defaults.failure_policy;
    options.sort_results = agent_result_less;

    if (json_mini::field(doc.root, "max_parallel")) {
        auto mp = json_mini::get_int(doc.root, "max_parallel");
        if (!mp || *mp <= 0 || *mp > 1024) {
            std::cerr << "[gauntlet] \"max_parallel\" must be an integer in [1, 1024]\n";
            return 2;
        }
        options.max_parallel = (int)*mp;
    }
    if (json_mini::field(doc.root, "failure_policy")) {
        auto fp = json_mini::get_string(doc.root, "failure_policy");
        if (!fp || !parse_failure_policy(*fp, &options.failure_policy)) {
            std::cerr << "[gauntlet] \"failure_policy\" must be \"abort\" or \"continue\"\n";
            return 2;
        }
    }

    std::vector<AgentCandidate> candidates;
    std::string aerr;
    if (!parse_agents(doc.root, request_dir, &candidates, &aerr)) {
        std::cerr << "[gauntlet] " << aerr << "\n";
        return 2;
    }

    AgentCompetitionSettings settings;
    settings.output_dir = resolve_against(request_dir, json_mini::get_string(doc.root, "output_dir").value_or("gauntlet-out"));
    settings.limits = watchdog_config_from_env();

    std::string serr;
    if (auto sc = json_mini::get_string(doc.root, "sandbox_config")) {
        std::string sc_path = resolve_against(request_dir, *sc).string();
        if (!load_sandbox_config(sc_path, &settings.sandbox, &serr)) {
            std::cerr << "[gauntlet] sandbox config: " << serr << "\n";
            return 2;
        }
    } else if (!parse_sandbox_config("{}", &settings.sandbox, &serr)) {
        std::cerr << "[gauntlet] sandbox config: " << serr << "\n";
        return 2;
    }

    std::error_code ec;
    std::filesystem::create_directories(settings.output_dir, ec);
    if (ec) {
        std::cerr << "[gauntlet] cannot create output dir " << settings.output_dir.string() << ": " << ec.message() << "\n";
        return 2;
    }

    RunHeader hdr;
    hdr.run_id = json_mini::get_string(doc.root, "run_id").value_or("");
    if (hdr.run_id.empty()) hdr.run_id = gen_run_id();
    const std::string events_path = (settings.output_dir / "events.jsonl").string();
    JsonlLogger log(hdr, events_path);
    if (!log.is_open()) {
        std::cerr << "[gauntlet] cannot open event log " << events_path << "\n";
        return 2;
    }

    std::cerr << "[gauntlet] run " << hdr.run_id << " profile=" << profile_name(profile)
              << " agents=" << candidates.size() << " max_parallel=" << options.max_parallel
              << " failure_policy=" << failure_policy_name(options.failure_policy) << "\n";
    {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "profile", json_object_new_string(profile_name(profile)));
        json_object_object_add(p, "agents", json_object_new_int((int)candidates.size()));
        json_object_object_add(p, "max_parallel", json_object_new_int(options.max_parallel));
        json_object_object_add(p, "failure_policy", json_object_new_string(failure_policy_name(options.failure_policy)));
        json_object_object_add(p, "silence_timeout_ms", json_object_new_int64(settings.limits.silence_timeout_ms));
        json_object_object_add(p, "wall_clock_cap_ms", json_object_new_int64(settings.limits.wall_clock_cap_ms));
        std::string payload = json_object_to_json_string_ext(p, JSON_C_TO_STRING_PLAIN);
        json_object_put(p);
        if (!log.event("competition_started", payload)) {
            std::cerr << "[warn] failed to write competition_started to " << events_path << "\n";
        }
    }

    ThreadTimerService timers;
    PosixProcessSignaler signaler;
    JsonlRunRecorder recorder(log);
    AgentCompetitionAdapter adapter(settings, recorder, log, timers, signaler);

    std::vector<AgentRunResult> results;
    try {
        results = execute_competition<AgentCandidate, PreparedAgent, AgentRunResult>(candidates, options, adapter);
    } catch (const AggregateError& e) {
        std::cerr << "[gauntlet] competition failed with " << e.causes().size() << " errors\n";
        for (const auto& c : e.causes()) std::cerr << "  - " << describe_exception(c) << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[gauntlet] competition failed: " << e.what() << "\n";
        return 1;
    }

    bool all_ok = results.size() == candidates.size();
    for (const auto& r : results) {
        if (r.snapshot.status != AgentStatus::SUCCEEDED) all_ok = false;
    }
    std::cout << summary_json(hdr.run_id, events_path, results, all_ok) << "\n";
    return all_ok ? 0 : 1;
}
