#include "runtime/idle_watchdog.hpp"

#include <algorithm>

namespace toolsrv::runtime {

IdleWatchdog::IdleWatchdog(const std::uint32_t timeout_ms)
    : timeout_ms_(timeout_ms), deadline_(Clock::now() + std::chrono::milliseconds(timeout_ms)) {}

void IdleWatchdog::reset() {
    deadline_ = Clock::now() + std::chrono::milliseconds(timeout_ms_);
}

std::int64_t IdleWatchdog::remaining_ms() const {
    const auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - Clock::now());
    return std::max<std::int64_t>(0, left.count());
}

bool IdleWatchdog::expired() const {
    return Clock::now() >= deadline_;
}

}  // namespace toolsrv::runtime
