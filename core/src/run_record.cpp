#include "gauntlet/run_record.h"

#include <json-c/json.h>

#include <iostream>

namespace gauntlet {

const char* agent_status_name(AgentStatus s) {
    switch (s) {
        case AgentStatus::QUEUED:    return "queued";
        case AgentStatus::RUNNING:   return "running";
        case AgentStatus::SUCCEEDED: return "succeeded";
        case AgentStatus::FAILED:    return "failed";
        case AgentStatus::ERRORED:   return "errored";
    }
    return "queued";
}

std::string agent_snapshot_to_json(const AgentSnapshot& s) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "agent_id", json_object_new_string(s.agent_id.c_str()));
    json_object_object_add(o, "provider", json_object_new_string(s.provider.c_str()));
    json_object_object_add(o, "status", json_object_new_string(agent_status_name(s.status)));
    if (s.exit_code) json_object_object_add(o, "exit_code", json_object_new_int(*s.exit_code));
    if (s.signal) json_object_object_add(o, "signal", json_object_new_string(s.signal->c_str()));
    if (s.error_message) {
        json_object_object_add(o, "error_message", json_object_new_string(s.error_message->c_str()));
    }
    if (s.watchdog) {
        json_object* w = json_object_new_object();
        json_object_object_add(w, "silence_timeout_ms", json_object_new_int64(s.watchdog->silence_timeout_ms));
        json_object_object_add(w, "wall_clock_cap_ms", json_object_new_int64(s.watchdog->wall_clock_cap_ms));
        if (s.watchdog->trigger) {
            json_object_object_add(w, "trigger",
                                   json_object_new_string(watchdog_trigger_name(*s.watchdog->trigger)));
        }
        json_object_object_add(o, "watchdog", w);
    }
    if (s.fail_fast) {
        json_object* f = json_object_new_object();
        json_object_object_add(f, "operation",
                               json_object_new_string(denial_operation_name(s.fail_fast->operation)));
        json_object_object_add(f, "target", json_object_new_string(s.fail_fast->target.c_str()));
        json_object_object_add(o, "fail_fast", f);
    }
    if (!s.stdout_path.empty()) json_object_object_add(o, "stdout_path", json_object_new_string(s.stdout_path.c_str()));
    if (!s.stderr_path.empty()) json_object_object_add(o, "stderr_path", json_object_new_string(s.stderr_path.c_str()));

    std::string out = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
    json_object_put(o);
    return canonicalize_json(out);
}

void JsonlRunRecorder::record_agent_queued(const std::string& agent_id, const std::string& provider) {
    AgentSnapshot s;
    s.agent_id = agent_id;
    s.provider = provider;
    s.status = AgentStatus::QUEUED;
    if (!log_.event("agent_queued", agent_snapshot_to_json(s))) {
        std::cerr << "[warn] failed to record queued agent " << agent_id << " to " << log_.path() << "\n";
    }
}

void JsonlRunRecorder::record_agent_snapshot(const AgentSnapshot& snapshot) {
    if (!log_.event("agent_snapshot", agent_snapshot_to_json(snapshot))) {
        std::cerr << "[warn] failed to record " << agent_status_name(snapshot.status)
                  << " snapshot for " << snapshot.agent_id << " to " << log_.path() << "\n";
    }
}

} // namespace gauntlet
