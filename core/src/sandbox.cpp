#include "furnace/sandbox.h"

#include <csignal>
#include <system_error>

namespace fs = std::filesystem;

namespace furnace {

const char* sandbox_status_str(SandboxStatus s) {
    switch (s) {
        case SandboxStatus::EXITED: return "EXITED";
        case SandboxStatus::TIMEOUT: return "TIMEOUT";
        case SandboxStatus::RESOURCE: return "RESOURCE";
        case SandboxStatus::SIGNALED: return "SIGNALED";
        case SandboxStatus::CANCELLED: return "CANCELLED";
        case SandboxStatus::SETUP_ERROR: return "SETUP_ERROR";
    }
    return "SETUP_ERROR";
}

int64_t dir_size_bytes(const fs::path& dir) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) return 0;
    int64_t total = 0;
    for (fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        std::error_code fec;
        if (it->is_regular_file(fec)) {
            auto sz = it->file_size(fec);
            if (!fec) total += (int64_t)sz;
        }
    }
    return total;
}

// ---------------- SandboxInstance ----------------

SandboxInstance::SandboxInstance(std::string label,
                                 fs::path root,
                                 const SandboxLimits& lim,
                                 std::string runtime_dir,
                                 const CancelToken* cancel,
                                 std::shared_ptr<SandboxCounters> counters)
    : label_(std::move(label)),
      root_(std::move(root)),
      lim_(lim),
      runtime_dir_(std::move(runtime_dir)),
      cancel_(cancel),
      counters_(std::move(counters)) {
    counters_->created.fetch_add(1);
}

SandboxInstance::~SandboxInstance() {
    std::error_code ec;
    // app/ is read-only; restore write permission so it can be removed
    if (fs::exists(app_dir(), ec)) {
        fs::permissions(app_dir(), fs::perms::owner_all, fs::perm_options::replace, ec);
        for (const auto& e : fs::directory_iterator(app_dir(), ec)) {
            std::error_code pec;
            fs::permissions(e.path(), fs::perms::owner_read | fs::perms::owner_write,
                            fs::perm_options::replace, pec);
        }
    }
    fs::remove_all(root_, ec);
    counters_->destroyed.fetch_add(1);
}

std::vector<std::string> SandboxInstance::child_env() const {
    std::string path = "/usr/local/bin:/usr/bin:/bin";
    if (!runtime_dir_.empty()) path = runtime_dir_ + ":" + path;
    return {
        "PATH=" + path,
        "HOME=" + home_dir().string(),
        "TMPDIR=" + tmp_dir().string(),
        "LANG=C.UTF-8",
        "LC_ALL=C.UTF-8",
        "PYTHONHASHSEED=0",
        "PYTHONDONTWRITEBYTECODE=1",
        "PYTHONNOUSERSITE=1",
        "PYTHONIOENCODING=utf-8",
    };
}

SandboxOutcome SandboxInstance::run(const std::vector<std::string>& argv,
                                    const fs::path& cwd,
                                    const fs::path& workspace) {
    SandboxOutcome out;
    if (used_) {
        out.error = "sandbox instance already used";
        return out;
    }
    used_ = true;

    if (is_cancelled(cancel_)) {
        out.status = SandboxStatus::CANCELLED;
        out.error = "cancelled before start";
        return out;
    }

    ProcSpec spec;
    spec.argv = argv;
    spec.cwd = cwd.string();
    spec.clear_env = true;
    spec.env = child_env();
    spec.wrapper = lim_.wrapper;
    spec.cancel = cancel_;

    ProcLimits pl;
    pl.timeout_ms = lim_.timeout_ms;
    pl.output_max_bytes = lim_.output_max_bytes;
    pl.rlimit_cpu_sec = lim_.cpu_sec;
    pl.rlimit_as_mb = lim_.mem_mb;
    pl.rlimit_fsize_mb = lim_.fsize_mb;
    pl.rlimit_nofile = lim_.nofile;
    pl.rlimit_nproc = lim_.nproc;
    pl.no_new_privs = true;
    pl.enable_seccomp = lim_.enable_seccomp;
    pl.net = lim_.net;

    ProcResult pr;
    bool started = proc_run(spec, pl, &pr);

    out.exit_code = pr.exit_code;
    out.term_signal = pr.term_signal;
    out.elapsed_ms = pr.elapsed_ms;
    out.output = std::move(pr.output);
    out.error = pr.error;

    if (!started) {
        out.status = SandboxStatus::SETUP_ERROR;
        if (out.error.empty()) out.error = "sandbox process did not start";
        return out;
    }

    if (pr.cancelled) {
        out.status = SandboxStatus::CANCELLED;
    } else if (pr.timed_out) {
        out.status = SandboxStatus::TIMEOUT;
    } else if (pr.term_signal == SIGXCPU || pr.term_signal == SIGXFSZ) {
        out.status = SandboxStatus::RESOURCE;
    } else if (pr.term_signal != 0) {
        out.status = SandboxStatus::SIGNALED;
    } else {
        out.status = SandboxStatus::EXITED;
        // interpreter died on an uncaught MemoryError
        if (out.exit_code != 0 && out.output.find("MemoryError") != std::string::npos) {
            out.status = SandboxStatus::RESOURCE;
        }
    }

    if (!workspace.empty()) {
        out.workspace_bytes = dir_size_bytes(workspace);
        if (out.workspace_bytes > lim_.workspace_limit_bytes &&
            out.status != SandboxStatus::CANCELLED && out.status != SandboxStatus::TIMEOUT) {
            out.status = SandboxStatus::RESOURCE;
            out.error = "workspace exceeds " + std::to_string(lim_.workspace_limit_bytes) + " bytes";
        }
    }
    return out;
}

// ---------------- SandboxRunner ----------------

SandboxRunner::SandboxRunner(fs::path base_dir,
                             fs::path package_dir,
                             SandboxLimits lim,
                             std::string runtime,
                             const CancelToken* cancel)
    : base_dir_(std::move(base_dir)),
      package_dir_(std::move(package_dir)),
      lim_(std::move(lim)),
      cancel_(cancel),
      counters_(std::make_shared<SandboxCounters>()) {
    runtime_path_ = resolve_executable(runtime);
}

std::unique_ptr<SandboxInstance> SandboxRunner::create(const std::string& label, std::string* err) {
    uint64_t n = seq_.fetch_add(1) + 1;
    fs::path root = base_dir_ / ("sbx_" + std::to_string(n) + "_" + label);

    std::string runtime_dir;
    if (!runtime_path_.empty()) runtime_dir = fs::path(runtime_path_).parent_path().string();

    std::unique_ptr<SandboxInstance> inst(
        new SandboxInstance(label, root, lim_, runtime_dir, cancel_, counters_));

    auto fail = [&](const std::string& msg) -> std::unique_ptr<SandboxInstance> {
        if (err) *err = msg;
        return nullptr; // inst destructor removes the partial tree
    };

    std::error_code ec;
    fs::create_directories(inst->app_dir(), ec);
    if (ec) return fail("create sandbox dir: " + ec.message());
    fs::create_directories(inst->home_dir(), ec);
    if (ec) return fail("create sandbox home: " + ec.message());
    fs::create_directories(inst->tmp_dir(), ec);
    if (ec) return fail("create sandbox tmp: " + ec.message());
    fs::permissions(root, fs::perms::owner_all, fs::perm_options::replace, ec);

    for (const auto& e : fs::directory_iterator(package_dir_, ec)) {
        std::error_code cec;
        if (!e.is_regular_file(cec)) continue;
        fs::path dst = inst->app_dir() / e.path().filename();
        fs::copy_file(e.path(), dst, fs::copy_options::overwrite_existing, cec);
        if (cec) return fail("copy package: " + cec.message());
        fs::permissions(dst, fs::perms::owner_read, fs::perm_options::replace, cec);
    }
    if (ec) return fail("read package dir: " + ec.message());

    fs::permissions(inst->app_dir(), fs::perms::owner_read | fs::perms::owner_exec,
                    fs::perm_options::replace, ec);
    if (ec) return fail("seal app dir: " + ec.message());

    return inst;
}

} // namespace furnace
