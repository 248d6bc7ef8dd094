#include "runner_utils.h"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace gauntlet {

std::string slurp(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + path);
    std::stringstream ss; ss << f.rdbuf();
    return ss.str();
}

std::string gen_run_id() {
    const char* det = std::getenv("GAUNTLET_DETERMINISTIC_RUN_ID");

    uint64_t seed = 0;
    if (det && std::string(det) == "1") {
        seed = 1234567ULL;
    } else {
        uint64_t t = (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count();
        uint64_t r = 0;
        try {
            std::random_device rd;
            r = ((uint64_t)rd() << 32) ^ (uint64_t)rd();
        } catch (const std::exception&) {
            r = 0x9e3779b97f4a7c15ULL;
        }
        seed = t ^ r;
    }

    std::mt19937_64 rng{seed};
    uint64_t a = rng();
    uint64_t b = rng();
    std::ostringstream oss;
    oss << std::hex;
    oss.width(16); oss.fill('0'); oss << a;
    oss.width(16); oss.fill('0'); oss << b;
    return oss.str();
}

int64_t now_ms_i64() {
    using namespace std::chrono;
    return (int64_t)duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::filesystem::path resolve_against(const std::filesystem::path& base, const std::string& p) {
    std::filesystem::path path(p);
    if (path.is_absolute()) return path.lexically_normal();
    return (base / path).lexically_normal();
}

std::string sanitize_path_component(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '.' || c == '_' || c == '-';
        out.push_back(ok ? c : '_');
    }
    if (out.empty() || out == "." || out == "..") out = "_" + out;
    return out;
}

} // namespace gauntlet
