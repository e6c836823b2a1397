#include "furnace/engine.h"
#include "furnace/json_mini.h"

namespace furnace {

TierResult TierResult::pass(Tier t) {
    TierResult r;
    r.tier = t;
    r.passed = true;
    r.reason = ReasonCode::OK;
    return r;
}

TierResult TierResult::fail(Tier t, ReasonCode reason, Detail d) {
    TierResult r;
    r.tier = t;
    r.passed = false;
    r.reason = reason;
    r.detail = std::move(d);
    return r;
}

TierResult call_failure(RunContext& ctx, Tier t, const CallResult& r, Detail d) {
    log_event(ctx.log, "call_failed",
              std::string("{\"tier\":\"") + tier_label(t) + "\",\"status\":\"" + callstatus_to_str(r.status) +
                  "\",\"exit_code\":" + std::to_string(r.exit_code) +
                  ",\"detail\":\"" + json_mini::json_escape(r.detail) + "\",\"at\":" + d.to_json() + "}");
    if (r.status == CallStatus::CANCELLED) d.set("stage", std::string("cancelled"));
    return TierResult::fail(t, classify_call(r.status, t), std::move(d));
}

TierResult internal_failure(RunContext& ctx, Tier t, const std::string& stage, const std::string& err) {
    log_event(ctx.log, "internal_error",
              std::string("{\"tier\":\"") + tier_label(t) + "\",\"stage\":\"" + json_mini::json_escape(stage) +
                  "\",\"error\":\"" + json_mini::json_escape(err) + "\"}");
    Detail d;
    d.set("stage", stage);
    return TierResult::fail(t, ReasonCode::INTERNAL_ERROR, std::move(d));
}

TierResult state_failure(RunContext& ctx, Tier t, const std::string& err, Detail d) {
    log_event(ctx.log, "state_unreadable",
              std::string("{\"tier\":\"") + tier_label(t) + "\",\"error\":\"" + json_mini::json_escape(err) +
                  "\",\"at\":" + d.to_json() + "}");
    return TierResult::fail(t, ReasonCode::INVARIANT_FAIL, std::move(d));
}

TierResult cancelled_result(Tier t) {
    Detail d;
    d.set("stage", std::string("cancelled"));
    return TierResult::fail(t, ReasonCode::INTERNAL_ERROR, std::move(d));
}

void log_step(RunContext& ctx, Tier t, const std::string& step, const Detail& d) {
    log_event(ctx.log, "tier_step",
              std::string("{\"tier\":\"") + tier_label(t) + "\",\"step\":\"" + json_mini::json_escape(step) +
                  "\",\"at\":" + d.to_json() + "}");
}

} // namespace furnace
