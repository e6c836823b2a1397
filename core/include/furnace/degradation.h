#pragma once

#include "furnace/engine.h"

namespace furnace {

// T2 DEGRADATION.
// Baseline ingest, then audit against the baseline state paired with the last
// n lineage items for every n in the degradation schedule. A well-formed HALT
// passes; any raise or malformed answer fails with truncation_level = n.
// Publishes the baseline state digest into ctx.baseline_digest.
TierResult run_degradation(RunContext& ctx);

} // namespace furnace
