#pragma once

#include "furnace/engine.h"

namespace furnace {

// T3 COMPACTION.
// Re-ingests the baseline (digest must match T2's), then for each budget
// compacts a copy, measures the canonical state size and audits it.
TierResult run_compaction(RunContext& ctx);

} // namespace furnace
