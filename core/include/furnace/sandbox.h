#pragma once

// Sandbox Runner: one disposable, bounded environment per artifact invocation.
//
// An instance owns a private directory:
//   <root>/app    read-only copy of the package
//   <root>/home   HOME for the child
//   <root>/tmp    TMPDIR for the child (request/result files live here)
// and permits exactly one run(). The child inherits nothing from the harness
// environment; isolation comes from ProcLimits (rlimits, netns, seccomp,
// optional operator wrapper).
//
// Teardown: proc_run() never returns while the child's process group is
// alive, and ~SandboxInstance removes the directory. The runner counts
// created/destroyed instances so leaks are measurable.

#include "furnace/cancel.h"
#include "furnace/proc.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace furnace {

struct SandboxLimits {
    int64_t timeout_ms{300000};
    int cpu_sec{120};
    size_t mem_mb{1024};
    size_t fsize_mb{32};
    int nofile{256};
    int nproc{0};
    int64_t workspace_limit_bytes{16LL * 1024 * 1024};
    size_t output_max_bytes{64 * 1024};

    bool enable_seccomp{false};
    NetIsolation net{NetIsolation::BEST_EFFORT};
    std::vector<std::string> wrapper;
};

enum class SandboxStatus {
    EXITED,      // child exited on its own (see exit_code)
    TIMEOUT,     // hard wall-clock timeout; process group killed
    RESOURCE,    // SIGXCPU / SIGXFSZ / MemoryError / workspace over limit
    SIGNALED,    // killed by another signal
    CANCELLED,   // external cancellation
    SETUP_ERROR, // harness-side failure (dir, exec, namespace, reuse)
};

const char* sandbox_status_str(SandboxStatus s);

struct SandboxOutcome {
    SandboxStatus status{SandboxStatus::SETUP_ERROR};
    int exit_code{127};
    int term_signal{0};
    int64_t elapsed_ms{0};
    int64_t workspace_bytes{0};
    std::string output; // internal only (run log), never public
    std::string error;  // internal only

    bool ok() const { return status == SandboxStatus::EXITED && exit_code == 0; }
};

// Total size of regular files under dir (0 if missing).
int64_t dir_size_bytes(const std::filesystem::path& dir);

struct SandboxCounters {
    std::atomic<int64_t> created{0};
    std::atomic<int64_t> destroyed{0};
};

class SandboxRunner;

class SandboxInstance {
public:
    ~SandboxInstance();
    SandboxInstance(const SandboxInstance&) = delete;
    SandboxInstance& operator=(const SandboxInstance&) = delete;

    const std::string& label() const { return label_; }
    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path app_dir() const { return root_ / "app"; }
    std::filesystem::path home_dir() const { return root_ / "home"; }
    std::filesystem::path tmp_dir() const { return root_ / "tmp"; }

    // Run argv with `cwd` as working directory. `workspace` (may be empty) is
    // the directory whose size is enforced after the run. Second call fails.
    SandboxOutcome run(const std::vector<std::string>& argv,
                       const std::filesystem::path& cwd,
                       const std::filesystem::path& workspace);

private:
    friend class SandboxRunner;
    SandboxInstance(std::string label,
                    std::filesystem::path root,
                    const SandboxLimits& lim,
                    std::string runtime_dir,
                    const CancelToken* cancel,
                    std::shared_ptr<SandboxCounters> counters);

    std::vector<std::string> child_env() const;

    std::string label_;
    std::filesystem::path root_;
    SandboxLimits lim_;
    std::string runtime_dir_;
    const CancelToken* cancel_{nullptr};
    std::shared_ptr<SandboxCounters> counters_;
    bool used_{false};
};

class SandboxRunner {
public:
    // base_dir: where instance directories are created.
    // package_dir: validated package copied into every instance.
    // runtime: interpreter name or path; resolved once against the host PATH.
    SandboxRunner(std::filesystem::path base_dir,
                  std::filesystem::path package_dir,
                  SandboxLimits lim,
                  std::string runtime,
                  const CancelToken* cancel = nullptr);

    // Empty string when the runtime cannot be resolved on the host.
    const std::string& runtime_path() const { return runtime_path_; }
    const SandboxLimits& limits() const { return lim_; }
    const CancelToken* cancel_token() const { return cancel_; }

    // New instance with a fresh copy of the package. nullptr + *err on failure.
    std::unique_ptr<SandboxInstance> create(const std::string& label, std::string* err);

    int64_t created() const { return counters_->created.load(); }
    int64_t destroyed() const { return counters_->destroyed.load(); }
    int64_t live() const { return created() - destroyed(); }

private:
    std::filesystem::path base_dir_;
    std::filesystem::path package_dir_;
    SandboxLimits lim_;
    std::string runtime_path_;
    const CancelToken* cancel_{nullptr};
    std::shared_ptr<SandboxCounters> counters_;
    std::atomic<uint64_t> seq_{0};
};

} // namespace furnace
