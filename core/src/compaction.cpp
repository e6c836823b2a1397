#include "furnace/compaction.h"
#include "furnace/events.h"
#include "furnace/json_mini.h"

namespace furnace {

TierResult run_compaction(RunContext& ctx) {
    const Tier T = Tier::T3;
    const Schedules& s = *ctx.sched;

    std::string err;
    Workspace base = ctx.arena->new_workspace("t3_baseline", &err);
    if (!err.empty()) return internal_failure(ctx, T, "workspace", err);

    Detail at_base;
    at_base.set("stage", std::string("baseline"));

    CallResult r = ctx.contract->ingest(base, synthetic_events(0, s.baseline_events), IngestOptions());
    if (!r.ok()) return call_failure(ctx, T, r, at_base);

    StateMeasure m;
    err = base.measure_state(&m);
    if (!err.empty()) return state_failure(ctx, T, err, at_base);

    // same events, same code: the state must be bit-identical to T2's
    if (ctx.baseline_digest.empty()) {
        ctx.baseline_digest = m.digest;
    } else if (m.digest != ctx.baseline_digest) {
        log_event(ctx.log, "determinism_mismatch",
                  "{\"tier\":\"T3\",\"expected\":\"" + ctx.baseline_digest + "\",\"actual\":\"" + m.digest + "\"}");
        return TierResult::fail(T, ReasonCode::DETERMINISM_FAIL, at_base);
    }

    for (int64_t budget : s.compaction_budgets) {
        if (is_cancelled(ctx.cancel)) return cancelled_result(T);

        Detail at;
        at.set("budget", budget);

        Workspace ws = ctx.arena->new_workspace("t3_budget_" + std::to_string(budget), &err);
        if (err.empty()) err = ws.copy_from(base);
        if (!err.empty()) return internal_failure(ctx, T, "workspace", err);

        r = ctx.contract->compact(ws, budget);
        if (!r.ok()) return call_failure(ctx, T, r, at);

        StateMeasure cm;
        err = ws.measure_state(&cm);
        if (!err.empty()) return state_failure(ctx, T, err, at);
        at.set("size", cm.size);
        if (cm.size > budget) {
            log_step(ctx, T, "over_budget", at);
            return TierResult::fail(T, ReasonCode::HARNESS_FAIL_T3, at);
        }

        r = ctx.contract->audit(ws);
        if (!r.ok()) return call_failure(ctx, T, r, at);
        if (r.verdict == AuditVerdict::HALT) {
            log_event(ctx.log, "compaction_halt",
                      "{\"budget\":" + std::to_string(budget) + ",\"reason\":\"" +
                          json_mini::json_escape(r.halt_reason) + "\"}");
            at.set("stage", std::string("audit"));
            return TierResult::fail(T, ReasonCode::INVARIANT_FAIL, at);
        }
        log_step(ctx, T, "compact", at);
    }
    return TierResult::pass(T);
}

} // namespace furnace
