#include "test_common.h"
#include "gauntlet/sandbox_config.h"

#include <filesystem>
#include <fstream>
#include <unistd.h>

int main() {
    std::string err;

    // Test 1: Empty document gives every known provider the defaults
    {
        gauntlet::SandboxConfig cfg;
        expect_true(gauntlet::parse_sandbox_config("{}", &cfg, &err), "empty config parses: " + err);
        for (const auto& id : gauntlet::default_sandbox_provider_ids()) {
            expect_true(cfg.providers.count(id) == 1, "default provider " + id);
        }
        auto b = gauntlet::resolve_denial_backoff(cfg, "claude");
        expect_true(b.enabled, "enabled by default");
        expect_eq_ll(b.warning_threshold, 2, "warn default");
        expect_eq_ll(b.delay_threshold, 3, "delay default");
        expect_eq_ll(b.fail_fast_threshold, 4, "fail-fast default");
        expect_eq_ll(b.delay_ms, 5000, "delay ms default");
        expect_eq_ll(b.window_ms, 120000, "window default");
    }

    // Test 2: Partial override keeps the other defaults
    {
        gauntlet::SandboxConfig cfg;
        const char* doc = R"({"providers":{"codex":{"denialBackoff":{"enabled":false,"delayMs":1234}},
                              "custom":{"denialBackoff":{"failFastThreshold":9}}}})";
        expect_true(gauntlet::parse_sandbox_config(doc, &cfg, &err), "override parses: " + err);
        auto codex = gauntlet::resolve_denial_backoff(cfg, "codex");
        expect_true(!codex.enabled, "codex disabled");
        expect_eq_ll(codex.delay_ms, 1234, "codex delay");
        expect_eq_ll(codex.fail_fast_threshold, 4, "codex keeps fail-fast default");
        expect_eq_ll(gauntlet::resolve_denial_backoff(cfg, "custom").fail_fast_threshold, 9, "custom provider");
        expect_true(gauntlet::resolve_denial_backoff(cfg, "gemini").enabled, "gemini untouched");
        expect_eq_ll(gauntlet::resolve_denial_backoff(cfg, "unknown").window_ms, 120000, "unknown gets defaults");
    }

    // Test 3: Validation errors
    {
        gauntlet::SandboxConfig cfg;
        expect_true(!gauntlet::parse_sandbox_config("{\"providers\":", &cfg, &err), "truncated JSON rejected");
        expect_true(!gauntlet::parse_sandbox_config("[]", &cfg, &err), "array rejected");
        expect_true(!gauntlet::parse_sandbox_config(R"({"providers":[]})", &cfg, &err), "providers array rejected");
        expect_true(!gauntlet::parse_sandbox_config(R"({"providers":{"codex":{"denialBackoff":{"delayMS":1}}}})", &cfg, &err),
                    "unknown key rejected");
        expect_true(err.find("delayMS") != std::string::npos, "error names the key: " + err);
        expect_true(!gauntlet::parse_sandbox_config(R"({"providers":{"codex":{"denialBackoff":{"windowMs":0}}}})", &cfg, &err),
                    "zero window rejected");
        expect_true(!gauntlet::parse_sandbox_config(R"({"providers":{"codex":{"denialBackoff":{"enabled":"no"}}}})", &cfg, &err),
                    "non-boolean enabled rejected");
        expect_true(gauntlet::parse_sandbox_config(R"({"providers":{"codex":{"denialBackoff":{"delayMs":0}}}})", &cfg, &err),
                    "zero delay allowed");
        expect_true(!gauntlet::parse_sandbox_config(R"({"providers":{"codex":{"denialBackoff":{"failFastThreshold":4294967297}}}})", &cfg, &err),
                    "threshold past int range rejected");
        expect_true(err.find("failFastThreshold must be at most") != std::string::npos, "range error names the key: " + err);
        expect_true(gauntlet::parse_sandbox_config(R"({"providers":{"codex":{"denialBackoff":{"warningThreshold":2147483647}}}})", &cfg, &err),
                    "largest int threshold allowed");
        expect_eq_ll(gauntlet::resolve_denial_backoff(cfg, "codex").warning_threshold, 2147483647, "threshold kept exactly");
    }

    // Test 4: Load from file
    {
        auto path = std::filesystem::temp_directory_path() /
                    ("gauntlet_sandbox_" + std::to_string(getpid()) + ".json");
        {
            std::ofstream f(path);
            f << R"({"providers":{"gemini":{"denialBackoff":{"warningThreshold":5}}}})";
        }
        gauntlet::SandboxConfig cfg;
        expect_true(gauntlet::load_sandbox_config(path.string(), &cfg, &err), "load: " + err);
        expect_eq_str(cfg.file_path, path.string(), "file path recorded");
        expect_eq_ll(gauntlet::resolve_denial_backoff(cfg, "gemini").warning_threshold, 5, "loaded override");
        std::filesystem::remove(path);
        expect_true(!gauntlet::load_sandbox_config(path.string(), &cfg, &err), "missing file is an error");
    }

    std::cerr << "test_sandbox_config: ALL PASSED" << std::endl;
    return 0;
}
