#pragma once

// Tier Controller: T0 -> T1 -> T2 -> T3 -> T4, strictly in order, stopping at
// the first failure. No retries, no skips.

#include "furnace/engine.h"

#include <functional>
#include <vector>

namespace furnace {

using TierProgressFn = std::function<void(const TierResult&)>;

class TierController {
public:
    explicit TierController(RunContext& ctx) : ctx_(ctx) {}

    // Called with every completed tier result, pass or fail.
    void set_progress(TierProgressFn fn) { progress_ = std::move(fn); }

    // Executed tiers in order. Every entry but the last passed; the last one
    // passed only when the artifact survived all tiers.
    std::vector<TierResult> run();

    // One tier, with timing and the exception boundary applied.
    TierResult run_tier(Tier t);

private:
    TierResult dispatch(Tier t);
    TierResult selftest();
    TierResult syntax_isolation();

    RunContext& ctx_;
    TierProgressFn progress_;
};

} // namespace furnace
