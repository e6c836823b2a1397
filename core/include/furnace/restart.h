#pragma once

#include "furnace/engine.h"

namespace furnace {

// T4 RESTART.
// Compares a live workspace, torn down and restored between every probe
// batch, against a reference that ingested the same events in one sandbox.
// Every failure records the cycle.
TierResult run_restart(RunContext& ctx);

} // namespace furnace
