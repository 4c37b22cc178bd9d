#include <trafficmon/core/render/log_reporter.hpp>
#include <trafficmon/core/render/rate_formatter.hpp>
#include <spdlog/spdlog.h>

namespace TrafficMon {

LogReporter::LogReporter(size_t max_rows)
    : max_rows_(max_rows) {
}

size_t LogReporter::maxRows(size_t /*interval_count*/) const {
    return max_rows_;
}

void LogReporter::render(const ReportData& report, double now, double start_time) {
    // Quiet cycles are logged at debug so an idle bus does not flood the log
    auto level = report.totals.count > 0 ? spdlog::level::info : spdlog::level::debug;
    double elapsed = now - start_time;

    spdlog::log(level, "╔════════════════════════════════════════════════════════════╗");
    spdlog::log(level, "║              TRAFFIC REPORT                                ║");
    spdlog::log(level, "╠════════════════════════════════════════════════════════════╣");
    spdlog::log(level, "║ Elapsed: {:.1f}s │ Msgs: {} │ Data: {} │ Keys: {} │ Ignored: {}",
                elapsed, report.totals.count, formatBytes(report.totals.total_bytes),
                report.distinct_keys, report.ignored);

    for (const auto& r : report.rates) {
        spdlog::log(level, "║ Last {:>5} │ {:>10} │ {}", formatInterval(r.interval_seconds),
                    formatMessageRate(r.messages_per_sec), formatRate(r.bytes_per_sec));
    }

    spdlog::log(level, "╠════════════════════════════════════════════════════════════╣");
    for (const auto& [key, c] : report.rows) {
        spdlog::log(level, "║ {:30} │ Msgs: {:8} │ {} │ {:.1f}s ago",
                    key, c.count, formatBytes(c.total_bytes), now - c.last_seen);
    }
    spdlog::log(level, "╚════════════════════════════════════════════════════════════╝");
}

} // namespace TrafficMon
