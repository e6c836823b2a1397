#include "furnace/proc.h"
#include "furnace/seccomp.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sched.h>
  #include <sys/prctl.h>
#endif

extern char** environ;

namespace furnace {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    auto flush = [&]() {
        if (!cur.empty()) {
            out.push_back(cur);
            cur.clear();
        }
    };

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            if (c == '\'') { st = SQ; continue; }
            if (c == '"') { st = DQ; esc = false; continue; }
            cur.push_back(c);
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

std::string resolve_executable(const std::string& name) {
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }
    const char* path = std::getenv("PATH");
    if (!path) return "";
    std::string p(path);
    size_t start = 0;
    while (start <= p.size()) {
        size_t end = p.find(':', start);
        if (end == std::string::npos) end = p.size();
        std::string dir = p.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string cand = dir + "/" + name;
        if (access(cand.c_str(), X_OK) == 0) return cand;
        start = end + 1;
    }
    return "";
}

namespace {

// Stages reported through the status pipe.
enum SetupStage : int {
    STAGE_CHDIR = 1,
    STAGE_NETNS = 2,
    STAGE_SECCOMP = 3,
    STAGE_EXEC = 4,
};

struct SetupReport {
    int stage;
    int err;
};

const char* stage_name(int s) {
    switch (s) {
        case STAGE_CHDIR: return "chdir";
        case STAGE_NETNS: return "network namespace";
        case STAGE_SECCOMP: return "seccomp";
        case STAGE_EXEC: return "exec";
    }
    return "setup";
}

void set_rlimit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    (void)setrlimit(resource, &rl);
}

[[noreturn]] void child_fail(int status_fd, int stage, int err) {
    SetupReport r{stage, err};
    ssize_t n = write(status_fd, &r, sizeof(r));
    (void)n;
    _exit(127);
}

#ifdef __linux__
// New empty network namespace: loopback only, down. Unprivileged callers go
// through a user namespace first.
bool enter_private_netns() {
    if (unshare(CLONE_NEWNET) == 0) return true;
    if (unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0) return true;
    return false;
}
#endif

void append_capped(std::string& out, const char* buf, size_t n, size_t cap, bool* truncated) {
    size_t can = cap > out.size() ? (cap - out.size()) : 0;
    if (can == 0) {
        *truncated = true;
        return;
    }
    size_t take = n;
    if (take > can) {
        take = can;
        *truncated = true;
    }
    out.append(buf, buf + take);
}

} // namespace

bool proc_run(const ProcSpec& spec, const ProcLimits& lim, ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (spec.argv.empty() || spec.argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    std::vector<std::string> eff_argv;
    eff_argv.reserve(spec.wrapper.size() + spec.argv.size());
    eff_argv.insert(eff_argv.end(), spec.wrapper.begin(), spec.wrapper.end());
    eff_argv.insert(eff_argv.end(), spec.argv.begin(), spec.argv.end());

    // everything the child touches is prepared before fork
    std::vector<char*> cargv;
    cargv.reserve(eff_argv.size() + 1);
    for (const auto& s : eff_argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    std::vector<char*> cenv;
    if (spec.clear_env) {
        cenv.reserve(spec.env.size() + 1);
        for (const auto& s : spec.env) cenv.push_back(const_cast<char*>(s.c_str()));
        cenv.push_back(nullptr);
    }

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }
    int statusfd[2];
    if (pipe2(statusfd, O_CLOEXEC) != 0) {
        close(pipefd[0]); close(pipefd[1]);
        res->error = std::string("status pipe failed: ") + std::strerror(errno);
        return false;
    }

    int flags = fcntl(pipefd[0], F_GETFL, 0);
    if (flags >= 0) (void)fcntl(pipefd[0], F_SETFL, flags | O_NONBLOCK);

    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]); close(pipefd[1]);
        close(statusfd[0]); close(statusfd[1]);
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        // child
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            (void)dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        (void)dup2(pipefd[1], STDOUT_FILENO);
        (void)dup2(pipefd[1], STDERR_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);
        close(statusfd[0]);
        const int status_w = statusfd[1];

        // isolate process group so timeout can kill the whole subtree
        (void)setpgid(0, 0);

        // tighten default file permissions for any files created by the child
        (void)umask(077);

        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        for (int fd = 3; fd < maxfd; fd++) {
            if (fd != status_w) (void)close(fd);
        }

        if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) {
            child_fail(status_w, STAGE_CHDIR, errno);
        }

#ifdef __linux__
        if (lim.net != NetIsolation::NONE) {
            if (!enter_private_netns() && lim.net == NetIsolation::REQUIRED) {
                child_fail(status_w, STAGE_NETNS, errno);
            }
        }
        if (lim.no_new_privs || lim.enable_seccomp) {
            (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        }
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        if (lim.rlimit_cpu_sec > 0) {
            // soft limit delivers SIGXCPU, hard limit one second later SIGKILL
            set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec, (rlim_t)lim.rlimit_cpu_sec + 1);
        }
        if (lim.rlimit_as_mb > 0) {
            rlim_t bytes = (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL;
            set_rlimit(RLIMIT_AS, bytes, bytes);
        }
        if (lim.rlimit_fsize_mb > 0) {
            rlim_t bytes = (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL;
            set_rlimit(RLIMIT_FSIZE, bytes, bytes);
        }
        if (lim.rlimit_nofile > 0) {
            set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile, (rlim_t)lim.rlimit_nofile);
        }
#ifdef RLIMIT_NPROC
        if (lim.rlimit_nproc > 0) {
            set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc, (rlim_t)lim.rlimit_nproc);
        }
#endif

        if (spec.clear_env) {
            environ = cenv.data();
        } else {
            unsetenv("LD_PRELOAD");
            unsetenv("LD_LIBRARY_PATH");
        }

        // seccomp-BPF: install syscall allowlist (must come after no_new_privs)
        if (lim.enable_seccomp) {
            std::string serr = install_seccomp_filter();
            if (!serr.empty()) child_fail(status_w, STAGE_SECCOMP, EPERM);
        }

        execvp(cargv[0], cargv.data());
        child_fail(status_w, STAGE_EXEC, errno);
    }

    // parent
    (void)setpgid(pid, pid);
    close(pipefd[1]);
    close(statusfd[1]);

    // EOF on the status pipe means exec succeeded (O_CLOEXEC closed it).
    SetupReport rep{0, 0};
    ssize_t got = 0;
    while (true) {
        got = read(statusfd[0], &rep, sizeof(rep));
        if (got < 0 && errno == EINTR) continue;
        break;
    }
    close(statusfd[0]);

    if (got == (ssize_t)sizeof(rep)) {
        int status = 0;
        (void)waitpid(pid, &status, 0);
        close(pipefd[0]);
        res->exit_code = 127;
        res->error = std::string(stage_name(rep.stage)) + " failed: " + std::strerror(rep.err);
        res->elapsed_ms = (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        return false;
    }
    res->started = true;

    std::string out;
    out.reserve(std::min<size_t>(lim.output_max_bytes, 64 * 1024));

    bool child_exited = false;
    int status = 0;

    auto drain = [&]() {
        char buf[4096];
        while (true) {
            ssize_t n = read(pipefd[0], buf, sizeof(buf));
            if (n > 0) {
                append_capped(out, buf, (size_t)n, lim.output_max_bytes, &res->output_truncated);
                continue;
            }
            if (n == -1 && errno == EINTR) continue;
            break; // EAGAIN or EOF
        }
    };

    auto kill_group = [&]() {
        // process group first (best-effort), then the direct pid
        (void)kill(-pid, SIGKILL);
        (void)kill(pid, SIGKILL);
        (void)waitpid(pid, &status, 0);
        child_exited = true;
    };

    while (true) {
        drain();

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            child_exited = true;
            break;
        }

        if (is_cancelled(spec.cancel)) {
            res->cancelled = true;
            kill_group();
            break;
        }

        auto now = std::chrono::steady_clock::now();
        int64_t elapsed = (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(now - start).count();
        if (lim.timeout_ms > 0 && elapsed > lim.timeout_ms) {
            res->timed_out = true;
            kill_group();
            break;
        }

        struct pollfd pfd;
        pfd.fd = pipefd[0];
        pfd.events = POLLIN;
        pfd.revents = 0;
        int64_t slice = 50;
        if (lim.timeout_ms > 0) {
            int64_t remaining = lim.timeout_ms - elapsed;
            if (remaining < slice) slice = std::max<int64_t>(1, remaining);
        }
        int pr = poll(&pfd, 1, (int)slice);
        if (pr > 0 && (pfd.revents & POLLHUP) && !(pfd.revents & POLLIN)) {
            // output closed but the child lingers; avoid spinning on HUP
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    // the group may still hold the pipe open
    (void)kill(-pid, SIGKILL);
    drain();
    close(pipefd[0]);

    res->elapsed_ms = (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    res->output = std::move(out);
    if (!child_exited) {
        res->exit_code = 128;
        res->error = "child did not exit";
        return true;
    }

    if (WIFEXITED(status)) {
        res->exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res->term_signal = WTERMSIG(status);
        res->exit_code = 128 + res->term_signal;
    } else {
        res->exit_code = 128;
    }
    return true;
}

bool proc_run_capture_sandboxed(const std::vector<std::string>& argv,
                                const std::string& cwd,
                                const ProcLimits& lim,
                                ProcResult* res) {
    ProcSpec spec;
    spec.argv = argv;
    spec.cwd = cwd;
    return proc_run(spec, lim, res);
}

} // namespace furnace
