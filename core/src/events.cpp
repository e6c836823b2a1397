#include "furnace/events.h"

namespace furnace {

std::string synthetic_event(int64_t i) {
    return "{\"key\":\"key_" + std::to_string(i % kEventKeyModulus) +
           "\",\"value\":\"value_" + std::to_string(i) + "\"}";
}

std::vector<std::string> synthetic_events(int64_t first, int64_t count) {
    std::vector<std::string> out;
    if (count <= 0) return out;
    out.reserve((size_t)count);
    for (int64_t i = first; i < first + count; i++) out.push_back(synthetic_event(i));
    return out;
}

} // namespace furnace
