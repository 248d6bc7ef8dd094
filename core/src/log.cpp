#include "gauntlet/log.h"
#include "gauntlet/json_mini.h"

#include <json-c/json.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace gauntlet {

std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Recursively serialize with sorted keys so two runs that did the same
// thing produce byte-identical event lines (modulo ts).
static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = json_object_new_string(keys[i].c_str());
            out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN);
            json_object_put(ks);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

std::string canonicalize_json(const std::string& raw) {
    json_mini::Doc doc = json_mini::parse(raw);
    if (!doc) return raw;
    std::ostringstream out;
    canonical_serialize(doc.root, out);
    return out.str();
}

JsonlLogger::JsonlLogger(const RunHeader& hdr, const std::string& path)
    : hdr_(hdr), path_(path), out_(path, std::ios::out | std::ios::app) {}

bool JsonlLogger::event(const std::string& name, const std::string& payload_json) {
    std::string ts = iso_now();
    json_mini::Doc payload = json_mini::parse(payload_json);

    std::lock_guard<std::mutex> lk(mu_);
    if (!out_.is_open()) return false;

    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_object_new_string(name.c_str()));
    json_object_object_add(rec, "format_version", json_object_new_string(hdr_.format_version.c_str()));
    if (payload) {
        // rec takes the reference
        json_object_object_add(rec, "payload", payload.root);
        payload.root = nullptr;
    } else {
        json_object_object_add(rec, "payload", json_object_new_string(payload_json.c_str()));
    }
    json_object_object_add(rec, "run_id", json_object_new_string(hdr_.run_id.c_str()));
    json_object_object_add(rec, "seq", json_object_new_int64((int64_t)++seq_));
    json_object_object_add(rec, "ts", json_object_new_string(ts.c_str()));

    std::ostringstream line;
    canonical_serialize(rec, line);
    json_object_put(rec);

    out_ << line.str() << "\n";
    out_.flush();
    return out_.good();
}

uint64_t JsonlLogger::seq() const {
    std::lock_guard<std::mutex> lk(mu_);
    return seq_;
}

} // namespace gauntlet
