#pragma once

#include <chrono>
#include <cstdint>

namespace toolsrv::runtime {

// Deadline that every successfully decoded request pushes forward.
class IdleWatchdog {
public:
    using Clock = std::chrono::steady_clock;

    explicit IdleWatchdog(std::uint32_t timeout_ms);

    void reset();
    // Milliseconds until expiry, 0 once expired.
    std::int64_t remaining_ms() const;
    bool expired() const;
    std::uint32_t timeout_ms() const { return timeout_ms_; }

private:
    std::uint32_t timeout_ms_;
    Clock::time_point deadline_;
};

}  // namespace toolsrv::runtime
