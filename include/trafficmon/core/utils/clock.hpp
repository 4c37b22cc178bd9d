// ============================================================================
// WALL CLOCK

#pragma once

#include <chrono>

namespace TrafficMon {

class Clock {
public:
    // Wall-clock time in seconds since the epoch, sub-second precision.
    // Event timestamps and report "now" values use this clock.
    static inline double wall_seconds() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration<double>(now.time_since_epoch()).count();
    }
};

} // namespace TrafficMon
