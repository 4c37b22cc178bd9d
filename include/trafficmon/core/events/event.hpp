#pragma once

#include <cstdint>
#include <string>

namespace TrafficMon {

/**
 * @brief One observed bus message, reduced to what the aggregator needs.
 *
 * Produced by the ingest path, consumed once by SnapshotTable and
 * SlidingWindowAggregator, not retained afterwards.
 */
struct Event {
    std::string display_key;
    uint64_t size = 0;
    double timestamp = 0.0;   // wall-clock seconds
};

} // namespace TrafficMon
