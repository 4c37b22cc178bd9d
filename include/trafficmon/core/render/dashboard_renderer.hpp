#pragma once

#include <trafficmon/core/render/report_sink.hpp>
#include <ostream>
#include <string>
#include <utility>

namespace TrafficMon {

/**
 * @brief Full-screen text dashboard
 *
 * Layout: title, totals line, one line per rate interval, a separator, the
 * column header, another separator, then as many device rows as fit.
 */
class DashboardRenderer : public ReportSink {
public:
    struct Options {
        std::string title = "MQTT Network Monitor";
        bool clear_screen = true;
        size_t fixed_rows = 0;      // 0 = derive from terminal height
    };

    static constexpr size_t kKeyWidth = 40;
    static constexpr size_t kFallbackColumns = 80;
    static constexpr size_t kFallbackLines = 24;

    DashboardRenderer(std::ostream& out, Options options);

    void render(const ReportData& report, double now, double start_time) override;
    size_t maxRows(size_t interval_count) const override;

    // Text of one frame, without the clear-screen sequence
    std::string compose(const ReportData& report, double now, double start_time,
                        size_t columns) const;

    // (columns, lines) of the controlling terminal, 80x24 when unknown
    static std::pair<size_t, size_t> terminalSize();

private:
    std::ostream& out_;
    Options options_;
};

} // namespace TrafficMon
