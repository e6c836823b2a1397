#include "furnace/schedule.h"
#include "furnace/hash.h"

#include <sstream>

namespace furnace {

const Schedules& frozen_schedules() {
    static const Schedules s{};
    return s;
}

static std::string int_array(const std::vector<int64_t>& v) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < v.size(); i++) {
        if (i) oss << ",";
        oss << v[i];
    }
    oss << "]";
    return oss.str();
}

std::string schedules_to_json(const Schedules& s) {
    std::ostringstream oss;
    oss << "{\"baseline_events\":" << s.baseline_events
        << ",\"compaction_budgets\":" << int_array(s.compaction_budgets)
        << ",\"degradation_levels\":" << int_array(s.degradation_levels)
        << ",\"restart_cycles\":" << s.restart_cycles
        << ",\"restart_probe_events\":" << s.restart_probe_events
        << "}";
    return oss.str();
}

std::string schedule_digest(const Schedules& s) {
    return "sha256:" + hash::sha256_hex(schedules_to_json(s));
}

} // namespace furnace
