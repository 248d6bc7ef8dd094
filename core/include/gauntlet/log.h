#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace gauntlet {

struct RunHeader {
    std::string format_version{"gauntlet.events.v1"};
    std::string run_id;
};

// Append-only JSONL event log. One canonical (sorted-key) object per line:
//   {"event":..,"format_version":..,"payload":{..},"run_id":..,"seq":N,"ts":..}
// Safe to call from several worker threads.
class JsonlLogger {
public:
    JsonlLogger(const RunHeader& hdr, const std::string& path);

    bool is_open() const { return out_.is_open(); }

    // payload_json that fails to parse is recorded as a JSON string.
    // Returns false if the line could not be written.
    bool event(const std::string& name, const std::string& payload_json);

    const std::string& path() const { return path_; }
    uint64_t seq() const;

private:
    mutable std::mutex mu_;
    RunHeader hdr_;
    std::string path_;
    std::ofstream out_;
    uint64_t seq_{0};
};

// Re-serialize a JSON document with sorted object keys. Input that fails
// to parse is returned unchanged.
std::string canonicalize_json(const std::string& raw);

// UTC "YYYY-MM-DDTHH:MM:SSZ"
std::string iso_now();

} // namespace gauntlet
