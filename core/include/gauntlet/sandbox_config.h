#pragma once

#include "denial_backoff.h"

#include <map>
#include <string>
#include <vector>

namespace gauntlet {

struct SandboxProviderConfig {
    std::string provider_id;
    DenialBackoffConfig denial_backoff;
};

// Per-provider sandbox settings that affect supervision.
// Network/filesystem policy is enforced by the external sandbox runtime and
// never reaches the watchdog; only its denial log lines do.
struct SandboxConfig {
    std::string file_path;
    std::map<std::string, SandboxProviderConfig> providers;
};

// Providers known out of the box. Always present in a parsed config.
const std::vector<std::string>& default_sandbox_provider_ids();

// Parse a config document:
//   {"providers": {"codex": {"denialBackoff": {"enabled": false, "delayMs": 1234}}}}
// A missing "providers" object yields defaults only. Fields absent from an
// override keep their defaults. Returns false and
// sets err on malformed JSON, wrong types, out-of-range values or unknown
// denialBackoff keys.
bool parse_sandbox_config(const std::string& json, SandboxConfig* out, std::string* err);

// Reads the file then parse_sandbox_config(). A missing file is an error.
bool load_sandbox_config(const std::string& path, SandboxConfig* out, std::string* err);

// Effective denial backoff for a provider (defaults if not configured).
DenialBackoffConfig resolve_denial_backoff(const SandboxConfig& cfg, const std::string& provider_id);

} // namespace gauntlet
