#pragma once

#include <trafficmon/core/metrics/traffic_aggregator.hpp>
#include <cstddef>

namespace TrafficMon {

/**
 * @brief Rendering collaborator of the report driver
 *
 * render() is called from the report thread only.
 */
class ReportSink {
public:
    virtual ~ReportSink() = default;

    virtual void render(const ReportData& report, double now, double start_time) = 0;

    // Rows the sink can show given how many rate lines it will print; 0 = all
    virtual size_t maxRows(size_t interval_count) const = 0;
};

} // namespace TrafficMon
