#pragma once

#include "abort_signal.h"
#include "sink.h"
#include "termination.h"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gauntlet {

enum class StreamId { STDOUT, STDERR };

struct SpawnOptions {
    std::vector<std::string> argv; // argv[0] resolved through PATH
    std::string cwd;

    // Added on top of the restricted base environment.
    std::map<std::string, std::string> env;

    // Raw child output goes here (may be null; may be the same sink).
    OutputSink* stdout_sink{nullptr};
    OutputSink* stderr_sink{nullptr};

    // Every chunk from either stream, after it was written to its sink.
    std::function<void(StreamId, const char*, size_t)> on_data;

    // Runs once the child exec'd, before any output is read.
    std::function<void(const std::shared_ptr<IChildHandle>&)> on_spawn;

    // Runs right after the child was reaped. Not called when aborted.
    std::function<void()> on_exit;
};

struct SpawnResult {
    int exit_code{127};                // 128+N when killed by signal N
    std::optional<std::string> signal; // "SIGKILL" etc.
    bool aborted{false};               // wait force-resolved by the abort signal
};

// Fork/exec argv in its own process group with stdin on /dev/null and
// stdout/stderr streamed through separate pipes until the child exits.
//
// If abort fires first the wait ends immediately with
// {exit_code=1, signal="SIGKILL", aborted=true}; the child is left to
// whoever signalled it.
//
// Returns false (with *err) only if the child could not be started.
bool spawn_streaming_process(const SpawnOptions& opt,
                             const std::shared_ptr<AbortSignal>& abort,
                             SpawnResult* res,
                             std::string* err);

// Environment handed to children: an allowlist of the parent's variables
// (PATH, HOME, locale, proxies, provider API keys, GAUNTLET_* ...) plus
// overrides. Loader variables are never passed.
std::map<std::string, std::string> compose_restricted_environment(
    const std::map<std::string, std::string>& overrides);

// Small helper: split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

// Resolve an executable through PATH the way execvp would. Empty if none.
std::string find_executable(const std::string& name);

} // namespace gauntlet
