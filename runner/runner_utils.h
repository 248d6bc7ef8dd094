#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace gauntlet {

// Whole file as a string. Throws std::runtime_error if unreadable.
std::string slurp(const std::string& path);

// 32 hex chars. GAUNTLET_DETERMINISTIC_RUN_ID=1 makes it reproducible.
std::string gen_run_id();

// Wall clock, milliseconds since the epoch.
int64_t now_ms_i64();

// p if absolute, else base / p (lexically normalized).
std::filesystem::path resolve_against(const std::filesystem::path& base, const std::string& p);

// Keeps [A-Za-z0-9._-]; anything else becomes '_'. Never empty.
std::string sanitize_path_component(const std::string& s);

} // namespace gauntlet
