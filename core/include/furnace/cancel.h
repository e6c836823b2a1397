#pragma once
#include <atomic>

namespace furnace {

// Cooperative cancellation flag. Safe to set from a signal handler.
class CancelToken {
public:
    void cancel() noexcept { flag_.store(true, std::memory_order_relaxed); }
    bool cancelled() const noexcept { return flag_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> flag_{false};
};

inline bool is_cancelled(const CancelToken* t) { return t && t->cancelled(); }

} // namespace furnace
