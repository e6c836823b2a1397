#include "furnace/degradation.h"
#include "furnace/events.h"

namespace furnace {

TierResult run_degradation(RunContext& ctx) {
    const Tier T = Tier::T2;
    const Schedules& s = *ctx.sched;

    std::string err;
    Workspace base = ctx.arena->new_workspace("t2_baseline", &err);
    if (!err.empty()) return internal_failure(ctx, T, "workspace", err);

    CallResult r = ctx.contract->ingest(base, synthetic_events(0, s.baseline_events), IngestOptions());
    if (!r.ok()) {
        Detail d;
        d.set("stage", std::string("baseline"));
        return call_failure(ctx, T, r, d);
    }

    StateMeasure m;
    err = base.measure_state(&m);
    if (!err.empty()) {
        Detail d;
        d.set("stage", std::string("baseline"));
        return state_failure(ctx, T, err, d);
    }
    ctx.baseline_digest = m.digest;
    {
        Detail d;
        d.set("events", s.baseline_events);
        d.set("state_bytes", m.size);
        log_step(ctx, T, "baseline", d);
    }

    for (int64_t level : s.degradation_levels) {
        if (is_cancelled(ctx.cancel)) return cancelled_result(T);

        Detail at;
        at.set("truncation_level", level);

        Workspace ws = ctx.arena->new_workspace("t2_level_" + std::to_string(level), &err);
        if (err.empty()) err = ws.copy_truncated_from(base, (size_t)level);
        if (!err.empty()) return internal_failure(ctx, T, "workspace", err);

        r = ctx.contract->audit(ws);
        if (!r.ok()) return call_failure(ctx, T, r, at);

        // HALT is a legitimate answer to missing history
        at.set("verdict", std::string(audit_verdict_str(r.verdict)));
        log_step(ctx, T, "audit", at);
    }
    return TierResult::pass(T);
}

} // namespace furnace
