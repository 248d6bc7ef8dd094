#include "cmd_run.h"

#include "gauntlet/watchdog.h"

#include <iostream>
#include <string>

static int cmd_patterns(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: gauntlet_cli patterns <provider>\n";
        return 2;
    }
    const auto& patterns = gauntlet::fatal_patterns_for(argv[2]);
    if (patterns.empty()) {
        std::cout << "no fatal patterns for provider '" << argv[2] << "'\n";
        return 0;
    }
    for (const auto& p : patterns) std::cout << p.source << "\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "gauntlet_cli <run|patterns> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "run") return cmd_run(argc, argv);
    if (cmd == "patterns") return cmd_patterns(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
