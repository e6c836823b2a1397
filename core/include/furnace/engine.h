#pragma once

// Shared plumbing for the tier engines: the per-run context handed from tier
// to tier and the result each tier reports.

#include "furnace/cancel.h"
#include "furnace/contract.h"
#include "furnace/log.h"
#include "furnace/schedule.h"
#include "furnace/types.h"
#include "furnace/workspace.h"

#include <cstdint>
#include <string>

namespace furnace {

struct TierResult {
    Tier tier{Tier::T0};
    bool passed{false};
    ReasonCode reason{ReasonCode::OK};
    int64_t elapsed_ms{0};
    Detail detail; // public-safe

    static TierResult pass(Tier t);
    static TierResult fail(Tier t, ReasonCode r, Detail d = Detail());
};

// Everything a tier needs. Owned by the pipeline; nothing here is global.
struct RunContext {
    const Schedules* sched{nullptr};
    Arena* arena{nullptr};
    ISaifContract* contract{nullptr};
    IArtifactProbe* probe{nullptr};
    JsonlLogger* log{nullptr};
    const CancelToken* cancel{nullptr};

    // Published by T2, checked by T3.
    std::string baseline_digest;
};

// Failed call -> terminal result (classify_call), internal detail to the run log.
TierResult call_failure(RunContext& ctx, Tier t, const CallResult& r, Detail d);

// Harness-side failure (workspace I/O, ...): INTERNAL_ERROR with `stage`.
TierResult internal_failure(RunContext& ctx, Tier t, const std::string& stage, const std::string& err);

// Persisted state that cannot be measured: INVARIANT_FAIL.
TierResult state_failure(RunContext& ctx, Tier t, const std::string& err, Detail d);

TierResult cancelled_result(Tier t);

// Log one engine step to the run log.
void log_step(RunContext& ctx, Tier t, const std::string& step, const Detail& d);

} // namespace furnace
