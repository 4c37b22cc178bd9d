#pragma once

#include <trafficmon/core/render/report_sink.hpp>

namespace TrafficMon {

// Headless sink: writes each report through spdlog instead of redrawing a terminal
class LogReporter : public ReportSink {
public:
    explicit LogReporter(size_t max_rows = 20);

    void render(const ReportData& report, double now, double start_time) override;
    size_t maxRows(size_t interval_count) const override;

private:
    size_t max_rows_;
};

} // namespace TrafficMon
