#include "furnace/tier_controller.h"
#include "furnace/compaction.h"
#include "furnace/degradation.h"
#include "furnace/restart.h"

#include <chrono>
#include <exception>

namespace furnace {

namespace {

constexpr Tier kOrder[] = {Tier::T0, Tier::T1, Tier::T2, Tier::T3, Tier::T4};

} // namespace

TierResult TierController::selftest() {
    CallResult r = ctx_.probe->selftest();
    if (!r.ok()) return call_failure(ctx_, Tier::T0, r, Detail());
    return TierResult::pass(Tier::T0);
}

TierResult TierController::syntax_isolation() {
    const Tier T = Tier::T1;
    CallResult r = ctx_.probe->syntax_check();
    if (!r.ok()) {
        Detail d;
        d.set("stage", std::string("compile"));
        return call_failure(ctx_, T, r, d);
    }
    if (is_cancelled(ctx_.cancel)) return cancelled_result(T);
    r = ctx_.probe->import_check();
    if (!r.ok()) {
        Detail d;
        d.set("stage", std::string("import"));
        return call_failure(ctx_, T, r, d);
    }
    return TierResult::pass(T);
}

TierResult TierController::dispatch(Tier t) {
    switch (t) {
        case Tier::T0: return selftest();
        case Tier::T1: return syntax_isolation();
        case Tier::T2: return run_degradation(ctx_);
        case Tier::T3: return run_compaction(ctx_);
        case Tier::T4: return run_restart(ctx_);
        case Tier::INTAKE: break;
    }
    return internal_failure(ctx_, t, "dispatch", "no such tier");
}

TierResult TierController::run_tier(Tier t) {
    auto t0 = std::chrono::steady_clock::now();
    log_event(ctx_.log, "tier_start", std::string("{\"tier\":\"") + tier_label(t) + "\"}");

    TierResult r;
    if (is_cancelled(ctx_.cancel)) {
        r = cancelled_result(t);
    } else {
        try {
            r = dispatch(t);
        } catch (const std::exception& e) {
            r = internal_failure(ctx_, t, "exception", e.what());
        }
    }
    // a failure observed after cancellation is reported as the cancellation
    if (!r.passed && r.reason != ReasonCode::INTERNAL_ERROR && is_cancelled(ctx_.cancel)) {
        r = cancelled_result(t);
    }
    r.tier = t;
    r.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();

    log_event(ctx_.log, "tier_end",
              std::string("{\"tier\":\"") + tier_label(t) + "\",\"passed\":" + (r.passed ? "true" : "false") +
                  ",\"reason\":\"" + reason_to_str(r.reason) + "\",\"elapsed_ms\":" + std::to_string(r.elapsed_ms) +
                  ",\"detail\":" + r.detail.to_json() + "}");
    return r;
}

std::vector<TierResult> TierController::run() {
    std::vector<TierResult> trail;
    for (Tier t : kOrder) {
        trail.push_back(run_tier(t));
        if (progress_) progress_(trail.back());
        if (!trail.back().passed) break;
    }
    return trail;
}

} // namespace furnace
