#include "furnace/restart.h"
#include "furnace/events.h"
#include "furnace/json_mini.h"

#include <algorithm>

namespace furnace {

namespace {

struct AuditSnapshot {
    AuditVerdict verdict{AuditVerdict::NONE};
    std::string reason;

    bool operator==(const AuditSnapshot& o) const { return verdict == o.verdict && reason == o.reason; }
    bool operator!=(const AuditSnapshot& o) const { return !(*this == o); }
};

bool lineage_prefix_matches(const std::vector<std::string>& live,
                            const std::vector<std::string>& reference,
                            size_t n) {
    if (live.size() != n || reference.size() < n) return false;
    return std::equal(live.begin(), live.end(), reference.begin());
}

} // namespace

TierResult run_restart(RunContext& ctx) {
    const Tier T = Tier::T4;
    const Schedules& s = *ctx.sched;
    const int64_t total = s.baseline_events + (int64_t)s.restart_cycles * s.restart_probe_events;

    std::string err;

    // Reference: one uninterrupted sandbox over every event, state captured
    // after the baseline and after each probe batch.
    Workspace ref = ctx.arena->new_workspace("t4_reference", &err);
    if (!err.empty()) return internal_failure(ctx, T, "workspace", err);

    IngestOptions ref_opt;
    for (int c = 0; c <= s.restart_cycles; c++) {
        ref_opt.checkpoints.push_back(s.baseline_events + (int64_t)c * s.restart_probe_events);
    }
    CallResult r = ctx.contract->ingest(ref, synthetic_events(0, total), ref_opt);
    if (!r.ok()) {
        Detail d;
        d.set("stage", std::string("reference"));
        return call_failure(ctx, T, r, d);
    }
    std::vector<std::string> checkpoints = r.checkpoint_states;
    std::vector<std::string> ref_lineage;
    err = ref.read_lineage(&ref_lineage);
    if (!err.empty()) return internal_failure(ctx, T, "reference", err);

    // Cycle 0: live workspace ingests the baseline and audits before teardown.
    Detail at0;
    at0.set("cycle", (int64_t)0);

    Workspace live = ctx.arena->new_workspace("t4_live", &err);
    if (!err.empty()) return internal_failure(ctx, T, "workspace", err);

    IngestOptions live_opt;
    live_opt.audit_after = true;
    r = ctx.contract->ingest(live, synthetic_events(0, s.baseline_events), live_opt);
    if (!r.ok()) return call_failure(ctx, T, r, at0);

    StateMeasure m;
    err = live.measure_state(&m);
    if (!err.empty()) return state_failure(ctx, T, err, at0);
    if (checkpoints.empty() || m.digest != state_digest(checkpoints[0])) {
        at0.set("stage", std::string("state"));
        return TierResult::fail(T, ReasonCode::DETERMINISM_FAIL, at0);
    }

    std::vector<std::string> lineage;
    err = live.read_lineage(&lineage);
    if (!err.empty()) return internal_failure(ctx, T, "lineage", err);
    if (!lineage_prefix_matches(lineage, ref_lineage, (size_t)s.baseline_events)) {
        at0.set("stage", std::string("lineage"));
        return TierResult::fail(T, ReasonCode::INVARIANT_FAIL, at0);
    }

    AuditSnapshot prev_audit{r.verdict, r.halt_reason};
    std::string prev_digest = m.digest;
    log_step(ctx, T, "cycle", at0);

    for (int c = 1; c <= s.restart_cycles; c++) {
        if (is_cancelled(ctx.cancel)) return cancelled_result(T);

        Detail at;
        at.set("cycle", (int64_t)c);

        // restore: the persisted state must be exactly what was left behind
        StateMeasure persisted;
        err = live.measure_state(&persisted);
        if (!err.empty()) {
            at.set("stage", std::string("restore"));
            return state_failure(ctx, T, err, at);
        }
        if (persisted.digest != prev_digest) {
            at.set("stage", std::string("restore"));
            return TierResult::fail(T, ReasonCode::INVARIANT_FAIL, at);
        }

        r = ctx.contract->audit(live);
        if (!r.ok()) return call_failure(ctx, T, r, at);
        AuditSnapshot restored{r.verdict, r.halt_reason};
        if (restored != prev_audit) {
            log_event(ctx.log, "audit_diverged",
                      "{\"cycle\":" + std::to_string(c) + ",\"before\":\"" + audit_verdict_str(prev_audit.verdict) +
                          "\",\"after\":\"" + audit_verdict_str(restored.verdict) + "\"}");
            at.set("stage", std::string("audit"));
            return TierResult::fail(T, ReasonCode::INVARIANT_FAIL, at);
        }

        const int64_t first = s.baseline_events + (int64_t)(c - 1) * s.restart_probe_events;
        r = ctx.contract->ingest(live, synthetic_events(first, s.restart_probe_events), live_opt);
        if (!r.ok()) return call_failure(ctx, T, r, at);

        err = live.measure_state(&m);
        if (!err.empty()) return state_failure(ctx, T, err, at);
        if ((size_t)c >= checkpoints.size() || m.digest != state_digest(checkpoints[(size_t)c])) {
            log_event(ctx.log, "determinism_mismatch",
                      "{\"tier\":\"T4\",\"cycle\":" + std::to_string(c) + ",\"actual\":\"" + m.digest + "\"}");
            at.set("stage", std::string("state"));
            return TierResult::fail(T, ReasonCode::DETERMINISM_FAIL, at);
        }

        std::vector<std::string> next;
        err = live.read_lineage(&next);
        if (!err.empty()) return internal_failure(ctx, T, "lineage", err);
        // `lineage` already equals the reference prefix, so this also checks
        // that history was kept and exactly the new items were appended
        const size_t want = lineage.size() + (size_t)s.restart_probe_events;
        if (!lineage_prefix_matches(next, ref_lineage, want)) {
            at.set("stage", std::string("lineage"));
            return TierResult::fail(T, ReasonCode::INVARIANT_FAIL, at);
        }

        lineage.swap(next);
        prev_audit = AuditSnapshot{r.verdict, r.halt_reason};
        prev_digest = m.digest;
        log_step(ctx, T, "cycle", at);
    }
    return TierResult::pass(T);
}

} // namespace furnace
