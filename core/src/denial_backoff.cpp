#include "gauntlet/denial_backoff.h"

#include <algorithm>
#include <cctype>

namespace gauntlet {

namespace {

constexpr int64_t DELAY_SPAN_MS = 60 * 1000;
constexpr int64_t WARN_SPAN_MS = 30 * 1000;

const std::string NETWORK_RULE_MARKER = "Denied by config rule:";
const std::string SEATBELT_MARKER = "deny(";

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

const char* denial_operation_name(DenialOperation op) {
    switch (op) {
        case DenialOperation::NETWORK_CONNECT: return "network-connect";
        case DenialOperation::FILE_READ:       return "file-read";
        case DenialOperation::FILE_WRITE:      return "file-write";
    }
    return "network-connect";
}

const char* backoff_action_name(BackoffAction a) {
    switch (a) {
        case BackoffAction::NONE:      return "none";
        case BackoffAction::WARN:      return "warn";
        case BackoffAction::DELAY:     return "delay";
        case BackoffAction::FAIL_FAST: return "fail-fast";
    }
    return "none";
}

std::optional<DenialInfo> parse_sandbox_denial_line(const std::string& raw) {
    std::string line = raw;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t p = line.find(NETWORK_RULE_MARKER);
    if (p != std::string::npos) {
        std::string target = trim(line.substr(p + NETWORK_RULE_MARKER.size()));
        if (target.empty()) return std::nullopt;
        return DenialInfo{DenialOperation::NETWORK_CONNECT, target};
    }

    p = line.find(SEATBELT_MARKER);
    if (p == std::string::npos) return std::nullopt;
    size_t close = line.find(')', p);
    if (close == std::string::npos) return std::nullopt;

    std::string rest = trim(line.substr(close + 1));
    size_t sp = rest.find_first_of(" \t");
    if (sp == std::string::npos) return std::nullopt;
    std::string op = rest.substr(0, sp);
    std::string target = trim(rest.substr(sp + 1));
    if (target.empty()) return std::nullopt;

    if (starts_with(op, "file-write")) return DenialInfo{DenialOperation::FILE_WRITE, target};
    if (starts_with(op, "file-read")) return DenialInfo{DenialOperation::FILE_READ, target};
    if (starts_with(op, "network")) return DenialInfo{DenialOperation::NETWORK_CONNECT, target};
    return std::nullopt;
}

DenialBackoffTracker::DenialBackoffTracker(const DenialBackoffConfig& cfg) : cfg_(cfg) {}

DenialBackoffDecision DenialBackoffTracker::record(const DenialInfo& info, int64_t now_ms) {
    const std::string key = std::string(denial_operation_name(info.operation)) + ":" + info.target;
    auto& hist = history_[key];

    // The window restarts instead of decaying: a quiet gap longer than the
    // window forgets everything seen before it.
    if (!hist.empty() && now_ms - hist.back() > cfg_.window_ms) {
        hist.clear();
    }
    hist.push_back(now_ms);

    const size_t cap = (size_t)std::max(1, cfg_.fail_fast_threshold);
    while (hist.size() > cap) hist.pop_front();

    int in_window = 0, in_delay_span = 0, in_warn_span = 0;
    for (int64_t ts : hist) {
        int64_t age = now_ms - ts;
        if (age <= cfg_.window_ms) in_window++;
        if (age <= DELAY_SPAN_MS) in_delay_span++;
        if (age <= WARN_SPAN_MS) in_warn_span++;
    }

    DenialBackoffDecision d;
    d.count = in_window;
    if (in_window >= cfg_.fail_fast_threshold) {
        d.action = BackoffAction::FAIL_FAST;
    } else if (in_delay_span == cfg_.delay_threshold) {
        d.action = BackoffAction::DELAY;
    } else if (in_warn_span == cfg_.warning_threshold) {
        d.action = BackoffAction::WARN;
    }
    return d;
}

void DenialBackoffTracker::reset_all() {
    history_.clear();
}

} // namespace gauntlet
