#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace furnace {

// Adversarial parameters for T2-T4. Frozen: every run uses the same values,
// and the verdict records their digest.
struct Schedules {
    int64_t baseline_events{1000};
    std::vector<int64_t> degradation_levels{1000, 500, 250, 100, 50, 10};
    std::vector<int64_t> compaction_budgets{8000, 5000, 3000, 1000};
    int restart_cycles{5};
    int64_t restart_probe_events{10}; // fresh events ingested per restart cycle
};

const Schedules& frozen_schedules();

// Canonical JSON form (sorted keys).
std::string schedules_to_json(const Schedules& s);

// "sha256:<hex>" of schedules_to_json(s).
std::string schedule_digest(const Schedules& s);

} // namespace furnace
