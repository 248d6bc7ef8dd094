#pragma once

#include <string>

namespace gauntlet {

// Delivers signals to a supervised process tree.
//
// Supervised children are spawned as leaders of their own process group,
// so the tree is addressed by the group. POSIX only: there is no process
// group equivalent on Windows and the supervisor is not built there.
class IProcessSignaler {
public:
    virtual ~IProcessSignaler() = default;

    // Signal the process group led by pid. If the group signal fails (the
    // child was not spawned detached, or the group is gone) fall back to
    // signalling pid alone. Returns true if either delivery succeeded.
    virtual bool signal_tree(int pid, int sig) = 0;
};

class PosixProcessSignaler final : public IProcessSignaler {
public:
    bool signal_tree(int pid, int sig) override;
};

// "SIGTERM", "SIGKILL", ... or "SIG<n>" for unnamed values.
std::string signal_name(int sig);

} // namespace gauntlet
