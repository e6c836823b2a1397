#pragma once

#include "furnace/cancel.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace furnace {

enum class NetIsolation {
    NONE,        // inherit the host network namespace
    BEST_EFFORT, // new netns if the kernel lets us, else continue
    REQUIRED,    // new netns or the child never execs
};

struct ProcLimits {
    int64_t timeout_ms{2000};
    size_t output_max_bytes{64 * 1024};

    int rlimit_cpu_sec{2};          // CPU time seconds
    size_t rlimit_as_mb{512};       // virtual memory MB
    size_t rlimit_fsize_mb{10};     // max file size MB
    int rlimit_nofile{64};          // max open fds
    int rlimit_nproc{0};            // max processes (0 = leave alone)

    bool no_new_privs{true};

    // seccomp-BPF syscall allowlist (Linux only, requires no_new_privs).
    // When set, a failed install stops the child before exec.
    bool enable_seccomp{false};

    NetIsolation net{NetIsolation::NONE};
};

struct ProcSpec {
    std::vector<std::string> argv;     // argv[0] resolved via PATH
    std::string cwd;

    // When clear_env is set the child sees exactly `env` ("KEY=VALUE").
    // Otherwise it inherits the parent environment minus LD_PRELOAD/LD_LIBRARY_PATH.
    bool clear_env{false};
    std::vector<std::string> env;

    // Operator wrapper (bwrap, nsjail, ...) prepended to argv.
    std::vector<std::string> wrapper;

    const CancelToken* cancel{nullptr};
};

struct ProcResult {
    bool started{false};        // exec succeeded
    int exit_code{127};         // 128+sig when signaled
    int term_signal{0};
    bool timed_out{false};
    bool cancelled{false};
    bool output_truncated{false};
    int64_t elapsed_ms{0};
    std::string output; // stdout+stderr merged
    std::string error;  // internal runner / child-setup error, not child stderr
};

// Run a process, capture stdout+stderr (merged), enforce timeout, rlimits,
// cancellation and optional network isolation. Child setup failures (chdir,
// netns, seccomp, exec) come back through a close-on-exec status pipe as
// res->error with started=false. Returns true if the process was exec'd.
bool proc_run(const ProcSpec& spec, const ProcLimits& lim, ProcResult* res);

// Convenience for host-side helpers (unzip, compile checks): inherited
// scrubbed env, no wrapper, no isolation.
bool proc_run_capture_sandboxed(const std::vector<std::string>& argv,
                                const std::string& cwd,
                                const ProcLimits& lim,
                                ProcResult* res);

// Small helper: split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

// Absolute path of `name` via PATH (or `name` itself when it contains '/').
// Empty when not found or not executable.
std::string resolve_executable(const std::string& name);

} // namespace furnace
