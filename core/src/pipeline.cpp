#include "furnace/pipeline.h"
#include "furnace/json_mini.h"
#include "furnace/outcome_log.h"
#include "furnace/package.h"
#include "furnace/sandboxed_artifact.h"

#include <algorithm>
#include <exception>
#include <system_error>

namespace fs = std::filesystem;

namespace furnace {

SandboxLimits sandbox_limits_from(const HarnessConfig& cfg) {
    SandboxLimits lim;
    lim.timeout_ms = cfg.sandbox_timeout_ms;
    lim.cpu_sec = (int)cfg.sandbox_cpu_sec;
    lim.mem_mb = (size_t)cfg.sandbox_mem_mb;
    lim.workspace_limit_bytes = cfg.workspace_limit_bytes;
    // a single write may not exceed the whole workspace budget
    lim.fsize_mb = (size_t)std::max<int64_t>(1, cfg.workspace_limit_bytes / (1024 * 1024));
    lim.enable_seccomp = cfg.seccomp;
    lim.net = cfg.net_isolation_required ? NetIsolation::REQUIRED : NetIsolation::BEST_EFFORT;
    if (!cfg.wrapper.empty()) lim.wrapper = split_argv_quoted(cfg.wrapper);
    return lim;
}

Furnace::Furnace(HarnessConfig cfg) : cfg_(std::move(cfg)), sched_(frozen_schedules()) {}

Verdict Furnace::run_tiers(const fs::path& artifact, RunHeader& hdr, JsonlLogger& log,
                           PipelineResult& out, fs::path* survivor_src, std::unique_ptr<Arena>* arena) {
    const std::string sched_digest = schedule_digest(sched_);
    const std::string fallback_name = artifact.filename().string();

    auto intake_fail = [&](ReasonCode reason, const std::string& stage, const std::string& name) {
        Detail d;
        d.set("stage", stage);
        return intake_verdict(hdr, name, reason, d, sched_digest);
    };

    std::string err;
    *arena = Arena::create(cfg_.home / "arena", hdr.run_id, cfg_.keep_arena, &err);
    if (!*arena) {
        log.event("arena_failed", "{\"error\":\"" + json_mini::json_escape(err) + "\"}");
        return intake_fail(ReasonCode::INTERNAL_ERROR, "arena", fallback_name);
    }

    LoadResult lr = load_package(artifact, (*arena)->staging_dir());
    if (!lr.pkg.artifact_id.empty()) {
        hdr.artifact_id = lr.pkg.artifact_id;
        log.set_artifact_id(hdr.artifact_id);
    }
    const std::string name = lr.pkg.name.empty() ? fallback_name : lr.pkg.name;
    log.event("intake", std::string("{\"ok\":") + (lr.ok ? "true" : "false") + ",\"reason\":\"" +
                            reason_to_str(lr.reason) + "\",\"detail\":" + lr.detail.to_json() +
                            ",\"internal\":\"" + json_mini::json_escape(lr.internal) + "\"}");
    if (!lr.ok) {
        return intake_verdict(hdr, name, lr.reason, lr.detail, sched_digest);
    }
    const ArtifactPackage& pkg = lr.pkg;

    SandboxRunner runner((*arena)->sandboxes_dir(), pkg.root, sandbox_limits_from(cfg_), cfg_.runtime, cancel_);
    SandboxedArtifact art(pkg, runner, &log);

    Verdict v;
    if (runner.runtime_path().empty()) {
        log.event("runtime_missing", "{\"runtime\":\"" + json_mini::json_escape(cfg_.runtime) + "\"}");
        v = intake_fail(ReasonCode::INTERNAL_ERROR, "runtime", name);
    } else {
        bool pinned_ok = true;
        if (!cfg_.runtime_pin.empty()) {
            std::string version;
            CallResult r = art.runtime_version(&version);
            pinned_ok = r.ok() && runtime_matches_pin(version, cfg_.runtime_pin);
            log.event("runtime_pin", "{\"pin\":\"" + json_mini::json_escape(cfg_.runtime_pin) + "\",\"actual\":\"" +
                                         json_mini::json_escape(version) + "\",\"status\":\"" +
                                         callstatus_to_str(r.status) + "\"}");
        }
        if (!pinned_ok) {
            v = intake_fail(ReasonCode::INTERNAL_ERROR, "runtime_pin", name);
        } else {
            RunContext ctx;
            ctx.sched = &sched_;
            ctx.arena = arena->get();
            ctx.contract = &art;
            ctx.probe = &art;
            ctx.log = &log;
            ctx.cancel = cancel_;

            TierController ctl(ctx);
            ctl.set_progress(progress_);
            v = build_verdict(hdr, name, ctl.run(), sched_digest);
        }
    }

    out.sandboxes_created = runner.created();
    out.sandboxes_destroyed = runner.destroyed();
    if (v.survivor) *survivor_src = pkg.root;
    return v;
}

void Furnace::finalize(PipelineResult& out, JsonlLogger& log, const fs::path& survivor_src) {
    const Verdict& v = out.verdict;
    auto note = [&](const std::string& what, const std::string& err) {
        log.event("persist_failed",
                  "{\"what\":\"" + what + "\",\"error\":\"" + json_mini::json_escape(err) + "\"}");
        if (!out.error.empty()) out.error += "; ";
        out.error += what + ": " + err;
    };

    OutcomeLog olog(cfg_.outcome_log_path());
    olog.set_fsync(cfg_.outcome_fsync);
    std::string err = olog.open();
    if (err.empty()) err = olog.append(v.to_json(), &out.outcome_seq, &out.outcome_head);
    if (!err.empty()) note("outcome_log", err);

    if (!artifact_hex(v.artifact_id).empty()) {
        err = write_outcome_record(v, cfg_.results_dir(), &out.outcome_record);
        if (!err.empty()) note("outcome_record", err);
    }

    if (v.survivor) {
        err = promote_survivor(v, survivor_src, cfg_.survivors_dir(), &out.survivor_path);
        if (!err.empty()) note("survivor", err);
    }

    log.event("verdict", "{\"verdict\":\"" + v.label() + "\",\"reason\":\"" + reason_to_str(v.reason) +
                             "\",\"outcome_seq\":" + std::to_string(out.outcome_seq) +
                             ",\"sandboxes_created\":" + std::to_string(out.sandboxes_created) +
                             ",\"sandboxes_destroyed\":" + std::to_string(out.sandboxes_destroyed) + "}");
}

PipelineResult Furnace::execute(const fs::path& artifact) {
    PipelineResult out;
    RunHeader hdr;
    hdr.run_id = gen_run_id();

    std::error_code ec;
    fs::create_directories(cfg_.logs_dir(), ec);
    out.run_log = cfg_.logs_dir() / ("run_" + hdr.run_id + ".jsonl");
    JsonlLogger log(hdr, out.run_log.string());
    log.event("run_start", "{\"artifact\":\"" + json_mini::json_escape(artifact.string()) + "\",\"profile\":\"" +
                               profile_name(cfg_.profile) + "\",\"runtime\":\"" +
                               json_mini::json_escape(cfg_.runtime) + "\"}");

    fs::path survivor_src;
    std::unique_ptr<Arena> arena;
    auto fault = [&](const std::string& what) {
        log.event("exception", "{\"what\":\"" + json_mini::json_escape(what) + "\"}");
        Detail d;
        d.set("stage", std::string("pipeline"));
        out.verdict = intake_verdict(hdr, artifact.filename().string(), ReasonCode::INTERNAL_ERROR, d,
                                     schedule_digest(sched_));
        survivor_src.clear();
    };
    try {
        out.verdict = run_tiers(artifact, hdr, log, out, &survivor_src, &arena);
    } catch (const std::exception& e) {
        fault(e.what());
    } catch (...) {
        fault("non-standard exception");
    }

    // arena (and the staged package) lives until the survivor copy is made
    try {
        finalize(out, log, survivor_src);
    } catch (const std::exception& e) {
        log.event("persist_failed", "{\"what\":\"finalize\",\"error\":\"" + json_mini::json_escape(e.what()) + "\"}");
        if (!out.error.empty()) out.error += "; ";
        out.error += std::string("finalize: ") + e.what();
    }
    return out;
}

} // namespace furnace
