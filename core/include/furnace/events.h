#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace furnace {

constexpr int64_t kEventKeyModulus = 10;

// Deterministic synthetic event for global index i:
//   {"key":"key_<i mod 10>","value":"value_<i>"}
std::string synthetic_event(int64_t i);

// Events [first, first + count).
std::vector<std::string> synthetic_events(int64_t first, int64_t count);

} // namespace furnace
