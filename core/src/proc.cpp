#include "gauntlet/proc.h"
#include "gauntlet/signaler.h"

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <exception>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

extern char** environ;

namespace gauntlet {

namespace {

class PosixChild final : public IChildHandle {
public:
    explicit PosixChild(pid_t pid) : pid_(pid) {}
    int pid() const override { return (int)pid_; }
    bool exited() const override { return exited_.load(); }
    void mark_exited() { exited_.store(true); }

private:
    pid_t pid_;
    std::atomic<bool> exited_{false};
};

// Self-pipe the abort listener writes to. Shared with the listener so the
// fds outlive a listener that is still running when the wait returns.
struct WakePipe {
    int fds[2]{-1, -1};
    ~WakePipe() {
        if (fds[0] >= 0) close(fds[0]);
        if (fds[1] >= 0) close(fds[1]);
    }
};

void set_flags(int fd, bool nonblock) {
    int fl = fcntl(fd, F_GETFD, 0);
    if (fl >= 0) (void)fcntl(fd, F_SETFD, fl | FD_CLOEXEC);
    if (nonblock) {
        int st = fcntl(fd, F_GETFL, 0);
        if (st >= 0) (void)fcntl(fd, F_SETFL, st | O_NONBLOCK);
    }
}

void close_pair(int p[2]) {
    if (p[0] >= 0) close(p[0]);
    if (p[1] >= 0) close(p[1]);
    p[0] = p[1] = -1;
}

struct Stream {
    StreamId id;
    int fd{-1};
    OutputSink* sink{nullptr};
};

// Read everything currently available. Returns false once EOF was seen
// (the fd is closed then).
bool pump(Stream& s, const SpawnOptions& opt) {
    char buf[8192];
    while (s.fd >= 0) {
        ssize_t n = read(s.fd, buf, sizeof(buf));
        if (n > 0) {
            if (s.sink) s.sink->write(buf, (size_t)n);
            if (opt.on_data) {
                try {
                    opt.on_data(s.id, buf, (size_t)n);
                } catch (const std::exception& e) {
                    std::cerr << "[proc] output handler threw: " << e.what() << "\n";
                }
            }
            continue;
        }
        if (n == -1 && errno == EINTR) continue;
        if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        // EOF or hard error
        close(s.fd);
        s.fd = -1;
        return false;
    }
    return false;
}

const char* const kAllowedEnv[] = {
    "CI", "COLUMNS", "HOME", "HOSTNAME", "LANG", "LC_ALL", "LC_CTYPE", "LC_MESSAGES",
    "PATH", "PWD", "SHELL", "HTTP_PROXY", "HTTPS_PROXY", "ALL_PROXY", "NO_PROXY",
    "SSL_CERT_FILE", "TERM", "TMP", "TMPDIR", "TEMP", "TZ", "USER", "USERNAME",
    "ANTHROPIC_API_KEY", "OPENAI_API_KEY", "GEMINI_API_KEY", "GOOGLE_API_KEY",
};

const char* const kAllowedEnvPrefixes[] = {"LC_", "GAUNTLET_", "SRT_"};

bool env_allowed(const std::string& key) {
    for (const char* k : kAllowedEnv) {
        if (key == k) return true;
    }
    for (const char* p : kAllowedEnvPrefixes) {
        if (key.compare(0, std::strlen(p), p) == 0) return true;
    }
    return false;
}

} // namespace

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;
    bool have = false; // "" is a valid (empty) token

    auto flush = [&]() {
        if (have) {
            out.push_back(cur);
            cur.clear();
            have = false;
        }
    };

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            if (c == '\'') { st = SQ; have = true; continue; }
            if (c == '"') { st = DQ; esc = false; have = true; continue; }
            cur.push_back(c);
            have = true;
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else { // DQ
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

std::string find_executable(const std::string& name) {
    if (name.empty()) return "";
    auto runnable = [](const std::string& p) {
        struct stat sb;
        return stat(p.c_str(), &sb) == 0 && S_ISREG(sb.st_mode) && access(p.c_str(), X_OK) == 0;
    };
    if (name.find('/') != std::string::npos) {
        return runnable(name) ? name : "";
    }
    const char* path = std::getenv("PATH");
    std::string dirs = path ? path : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= dirs.size()) {
        size_t colon = dirs.find(':', start);
        if (colon == std::string::npos) colon = dirs.size();
        std::string dir = dirs.substr(start, colon - start);
        if (dir.empty()) dir = ".";
        std::string cand = dir + "/" + name;
        if (runnable(cand)) return cand;
        start = colon + 1;
    }
    return "";
}

std::map<std::string, std::string> compose_restricted_environment(
    const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string kv = *e;
        size_t eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        std::string key = kv.substr(0, eq);
        if (env_allowed(key)) env[key] = kv.substr(eq + 1);
    }
    for (const auto& kv : overrides) env[kv.first] = kv.second;
    env.erase("LD_PRELOAD");
    env.erase("LD_LIBRARY_PATH");
    return env;
}

bool spawn_streaming_process(const SpawnOptions& opt,
                             const std::shared_ptr<AbortSignal>& abort,
                             SpawnResult* res,
                             std::string* err) {
    if (!res) return false;
    *res = SpawnResult{};
    auto fail = [&](const std::string& msg) {
        if (err) *err = msg;
        return false;
    };

    if (opt.argv.empty() || opt.argv[0].empty()) return fail("empty argv");
    if (abort && abort->aborted()) {
        res->exit_code = 1;
        res->signal = "SIGKILL";
        res->aborted = true;
        return true;
    }

    // Everything the child needs is built before fork.
    std::vector<char*> cargv;
    cargv.reserve(opt.argv.size() + 1);
    for (const auto& s : opt.argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    std::vector<std::string> env_kv;
    for (const auto& kv : compose_restricted_environment(opt.env)) {
        env_kv.push_back(kv.first + "=" + kv.second);
    }
    std::vector<char*> cenv;
    cenv.reserve(env_kv.size() + 1);
    for (auto& s : env_kv) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1}; // child reports exec errno here
    if (pipe(out_pipe) != 0) {
        return fail(std::string("pipe(stdout) failed: ") + std::strerror(errno));
    }
    if (pipe(err_pipe) != 0) {
        int e = errno;
        close_pair(out_pipe);
        return fail(std::string("pipe(stderr) failed: ") + std::strerror(e));
    }
    if (pipe(exec_pipe) != 0) {
        int e = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        return fail(std::string("pipe(exec) failed: ") + std::strerror(e));
    }
    set_flags(out_pipe[0], true);
    set_flags(err_pipe[0], true);
    set_flags(exec_pipe[0], false);
    set_flags(exec_pipe[1], false);

    pid_t pid = fork();
    if (pid < 0) {
        int e = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        return fail(std::string("fork failed: ") + std::strerror(e));
    }

    if (pid == 0) {
        // child
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) (void)dup2(devnull, STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);

        // own process group so the supervisor can signal the whole subtree
        (void)setpgid(0, 0);

        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        for (int fd = 3; fd < maxfd; fd++) {
            if (fd != exec_pipe[1]) (void)close(fd);
        }

        if (!opt.cwd.empty() && chdir(opt.cwd.c_str()) != 0) {
            int e = errno;
            (void)!write(exec_pipe[1], &e, sizeof(e));
            _exit(127);
        }

#ifdef __linux__
        (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        environ = cenv.data();
        execvp(cargv[0], cargv.data());
        int e = errno;
        (void)!write(exec_pipe[1], &e, sizeof(e));
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(exec_pipe[1]);

    // exec_pipe closes on successful exec (CLOEXEC) or carries the errno.
    int child_errno = 0;
    ssize_t got;
    do {
        got = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (got == -1 && errno == EINTR);
    close(exec_pipe[0]);
    if (got == (ssize_t)sizeof(child_errno)) {
        int status = 0;
        (void)waitpid(pid, &status, 0);
        close(out_pipe[0]);
        close(err_pipe[0]);
        return fail("failed to start " + opt.argv[0] + ": " + std::strerror(child_errno));
    }

    auto child = std::make_shared<PosixChild>(pid);

    auto wake = std::make_shared<WakePipe>();
    uint64_t listener = 0;
    if (abort && pipe(wake->fds) == 0) {
        set_flags(wake->fds[0], true);
        set_flags(wake->fds[1], true);
        listener = abort->add_listener([wake] {
            char b = 1;
            (void)!write(wake->fds[1], &b, 1);
        });
    }

    if (opt.on_spawn) opt.on_spawn(child);

    Stream streams[2] = {
        Stream{StreamId::STDOUT, out_pipe[0], opt.stdout_sink},
        Stream{StreamId::STDERR, err_pipe[0], opt.stderr_sink},
    };

    bool reaped = false;
    bool aborted = false;
    int status = 0;

    while (true) {
        struct pollfd fds[3];
        Stream* owners[3] = {nullptr, nullptr, nullptr};
        nfds_t n = 0;
        for (auto& s : streams) {
            if (s.fd < 0) continue;
            fds[n].fd = s.fd;
            fds[n].events = POLLIN;
            fds[n].revents = 0;
            owners[n] = &s;
            n++;
        }
        int wake_idx = -1;
        if (wake->fds[0] >= 0) {
            wake_idx = (int)n;
            fds[n].fd = wake->fds[0];
            fds[n].events = POLLIN;
            fds[n].revents = 0;
            n++;
        }

        // Bounded slice: grandchildren may hold the pipes open after the
        // child itself is gone, so exit is checked independently of EOF.
        int pr = poll(fds, n, 100);
        if (pr < 0 && errno != EINTR) {
            std::cerr << "[proc] poll failed: " << std::strerror(errno) << "\n";
        }

        for (nfds_t i = 0; i < n; i++) {
            if (owners[i] && (fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                (void)pump(*owners[i], opt);
            }
        }

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            child->mark_exited();
            reaped = true;
            break;
        }

        if ((wake_idx >= 0 && (fds[wake_idx].revents & POLLIN)) || (abort && abort->aborted())) {
            aborted = true;
            break;
        }
    }

    if (abort && listener != 0) abort->remove_listener(listener);

    if (aborted) {
        for (auto& s : streams) {
            if (s.fd >= 0) close(s.fd);
        }
        // Reap if it finally went away; an unkillable child stays a zombie.
        if (waitpid(pid, &status, WNOHANG) == pid) child->mark_exited();
        res->exit_code = 1;
        res->signal = "SIGKILL";
        res->aborted = true;
        return true;
    }

    // Whatever the child wrote before exiting is already in the pipes.
    for (auto& s : streams) {
        (void)pump(s, opt);
        if (s.fd >= 0) {
            close(s.fd);
            s.fd = -1;
        }
    }

    if (reaped && opt.on_exit) opt.on_exit();

    if (WIFEXITED(status)) {
        res->exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res->exit_code = 128 + WTERMSIG(status);
        res->signal = signal_name(WTERMSIG(status));
    } else {
        res->exit_code = 128;
    }
    return true;
}

} // namespace gauntlet
