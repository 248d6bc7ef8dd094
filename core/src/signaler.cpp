#include "gauntlet/signaler.h"

#include <csignal>
#include <sys/types.h>
#include <signal.h>

namespace gauntlet {

bool PosixProcessSignaler::signal_tree(int pid, int sig) {
    if (pid <= 0) return false;
    // negative pid addresses the whole process group
    if (kill(-(pid_t)pid, sig) == 0) return true;
    return kill((pid_t)pid, sig) == 0;
}

std::string signal_name(int sig) {
    switch (sig) {
        case SIGHUP:  return "SIGHUP";
        case SIGINT:  return "SIGINT";
        case SIGQUIT: return "SIGQUIT";
        case SIGABRT: return "SIGABRT";
        case SIGKILL: return "SIGKILL";
        case SIGSEGV: return "SIGSEGV";
        case SIGPIPE: return "SIGPIPE";
        case SIGALRM: return "SIGALRM";
        case SIGTERM: return "SIGTERM";
        case SIGSTOP: return "SIGSTOP";
        case SIGCONT: return "SIGCONT";
        case SIGXCPU: return "SIGXCPU";
        case SIGXFSZ: return "SIGXFSZ";
        case SIGBUS:  return "SIGBUS";
        case SIGSYS:  return "SIGSYS";
        default: break;
    }
    return "SIG" + std::to_string(sig);
}

} // namespace gauntlet
