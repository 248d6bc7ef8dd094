#include "gauntlet/sandbox_config.h"
#include "gauntlet/json_mini.h"

#include <climits>
#include <cstdint>
#include <fstream>
#include <set>
#include <sstream>

namespace gauntlet {

namespace {

const std::set<std::string> BACKOFF_KEYS = {
    "enabled", "warningThreshold", "delayThreshold", "delayMs", "failFastThreshold", "windowMs",
};

bool read_positive(json_object* obj, const char* key, const std::string& where,
                   int64_t* out, bool allow_zero, int64_t max, std::string* err) {
    json_object* v = json_mini::field(obj, key);
    if (!v) return true;
    if (!json_object_is_type(v, json_type_int)) {
        if (err) *err = where + "." + key + " must be an integer";
        return false;
    }
    int64_t n = json_object_get_int64(v);
    if (n < 0 || (!allow_zero && n == 0)) {
        if (err) *err = where + "." + key + (allow_zero ? " must be non-negative" : " must be positive");
        return false;
    }
    if (n > max) {
        if (err) *err = where + "." + key + " must be at most " + std::to_string(max);
        return false;
    }
    *out = n;
    return true;
}

bool apply_backoff_override(json_object* obj, const std::string& where,
                            DenialBackoffConfig* cfg, std::string* err) {
    if (!json_object_is_type(obj, json_type_object)) {
        if (err) *err = where + " must be an object";
        return false;
    }
    json_object_object_foreach(obj, key, val) {
        (void)val;
        if (BACKOFF_KEYS.count(key) == 0) {
            if (err) *err = where + ": unknown key '" + key + "'";
            return false;
        }
    }

    if (json_object* v = json_mini::field(obj, "enabled")) {
        if (!json_object_is_type(v, json_type_boolean)) {
            if (err) *err = where + ".enabled must be a boolean";
            return false;
        }
        cfg->enabled = json_object_get_boolean(v) != 0;
    }

    int64_t warn = cfg->warning_threshold;
    int64_t delay = cfg->delay_threshold;
    int64_t fail = cfg->fail_fast_threshold;
    int64_t delay_ms = cfg->delay_ms;
    int64_t window = cfg->window_ms;
    if (!read_positive(obj, "warningThreshold", where, &warn, false, INT_MAX, err)) return false;
    if (!read_positive(obj, "delayThreshold", where, &delay, false, INT_MAX, err)) return false;
    if (!read_positive(obj, "failFastThreshold", where, &fail, false, INT_MAX, err)) return false;
    if (!read_positive(obj, "delayMs", where, &delay_ms, true, INT64_MAX, err)) return false;
    if (!read_positive(obj, "windowMs", where, &window, false, INT64_MAX, err)) return false;

    cfg->warning_threshold = (int)warn;
    cfg->delay_threshold = (int)delay;
    cfg->fail_fast_threshold = (int)fail;
    cfg->delay_ms = delay_ms;
    cfg->window_ms = window;
    return true;
}

} // namespace

const std::vector<std::string>& default_sandbox_provider_ids() {
    static const std::vector<std::string> ids = {"claude", "codex", "gemini"};
    return ids;
}

bool parse_sandbox_config(const std::string& json, SandboxConfig* out, std::string* err) {
    if (!out) return false;
    SandboxConfig cfg;
    cfg.file_path = out->file_path;
    for (const auto& id : default_sandbox_provider_ids()) {
        cfg.providers[id] = SandboxProviderConfig{id, DenialBackoffConfig{}};
    }

    std::string perr;
    json_mini::Doc doc = json_mini::parse(json, &perr);
    if (!doc) {
        if (err) *err = "invalid JSON: " + perr;
        return false;
    }
    if (!json_object_is_type(doc.root, json_type_object)) {
        if (err) *err = "sandbox config must be a JSON object";
        return false;
    }

    json_object* providers = json_mini::field(doc.root, "providers");
    if (!providers) {
        *out = std::move(cfg);
        return true;
    }
    if (!json_object_is_type(providers, json_type_object)) {
        if (err) *err = "sandbox config 'providers' must be an object";
        return false;
    }

    json_object_object_foreach(providers, pid, pobj) {
        const std::string where = std::string("providers.") + pid;
        if (!pobj || !json_object_is_type(pobj, json_type_object)) {
            if (err) *err = where + " must be an object";
            return false;
        }
        auto& entry = cfg.providers[pid];
        entry.provider_id = pid;
        if (json_object* db = json_mini::field(pobj, "denialBackoff")) {
            if (!apply_backoff_override(db, where + ".denialBackoff", &entry.denial_backoff, err)) {
                return false;
            }
        }
    }

    *out = std::move(cfg);
    return true;
}

bool load_sandbox_config(const std::string& path, SandboxConfig* out, std::string* err) {
    if (!out) return false;
    std::ifstream f(path);
    if (!f) {
        if (err) *err = "cannot open sandbox config: " + path;
        return false;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    out->file_path = path;
    std::string perr;
    if (!parse_sandbox_config(ss.str(), out, &perr)) {
        if (err) *err = path + ": " + perr;
        return false;
    }
    return true;
}

DenialBackoffConfig resolve_denial_backoff(const SandboxConfig& cfg, const std::string& provider_id) {
    auto it = cfg.providers.find(provider_id);
    if (it == cfg.providers.end()) return DenialBackoffConfig{};
    return it->second.denial_backoff;
}

} // namespace gauntlet
