#include <trafficmon/core/render/dashboard_renderer.hpp>
#include <trafficmon/core/render/rate_formatter.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/chrono.h>
#include <algorithm>
#include <ctime>
#include <sys/ioctl.h>
#include <unistd.h>

namespace TrafficMon {

namespace {

// Title + totals + separator + column header + separator + footer
constexpr size_t kFixedLines = 6;

constexpr const char* kClearScreen = "\033[2J\033[H";

// First max_chars code points of a UTF-8 string; never splits a sequence
std::string truncateUtf8(const std::string& s, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        // Continuation bytes (10xxxxxx) belong to the preceding code point
        if ((static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) continue;
        if (chars == max_chars) return s.substr(0, i);
        ++chars;
    }
    return s;
}

} // anonymous namespace

DashboardRenderer::DashboardRenderer(std::ostream& out, Options options)
    : out_(out), options_(std::move(options)) {
}

std::pair<size_t, size_t> DashboardRenderer::terminalSize() {
    winsize ws{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        return {ws.ws_col, ws.ws_row};
    }
    return {kFallbackColumns, kFallbackLines};
}

size_t DashboardRenderer::maxRows(size_t interval_count) const {
    if (options_.fixed_rows > 0) return options_.fixed_rows;

    const size_t lines = terminalSize().second;
    size_t reserved = kFixedLines + interval_count;
    if (lines <= reserved) return 1;
    return lines - reserved;
}

void DashboardRenderer::render(const ReportData& report, double now, double start_time) {
    const size_t columns = terminalSize().first;
    if (options_.clear_screen) {
        out_ << kClearScreen;
    }
    out_ << compose(report, now, start_time, columns);
    out_.flush();
}

std::string DashboardRenderer::compose(const ReportData& report, double now, double start_time,
                                       size_t columns) const {
    std::string text;
    auto line = [&text](const std::string& s) {
        text += s;
        text += '\n';
    };

    const double elapsed = now - start_time;
    const double avg_msgs = elapsed > 0.0 ? static_cast<double>(report.totals.count) / elapsed : 0.0;
    const double avg_bytes = elapsed > 0.0 ? static_cast<double>(report.totals.total_bytes) / elapsed : 0.0;

    std::time_t wall = static_cast<std::time_t>(now);
    line(fmt::format("{} - {:%Y-%m-%d %H:%M:%S}", options_.title, fmt::localtime(wall)));

    std::string totals = fmt::format("Elapsed: {:.1f}s | Total Msg: {} ({:.2f}/s) | Total Data: {} | Rate: {}",
                                     elapsed, report.totals.count, avg_msgs,
                                     formatBytes(report.totals.total_bytes), formatRate(avg_bytes));
    if (report.ignored > 0) {
        totals += fmt::format(" | Ignored: {}", report.ignored);
    }
    line(totals);

    for (const auto& r : report.rates) {
        line(fmt::format("Last {:>5}: {:>10} | {}", formatInterval(r.interval_seconds),
                         formatMessageRate(r.messages_per_sec), formatRate(r.bytes_per_sec)));
    }

    const std::string separator(std::max<size_t>(columns, 1), '-');
    line(separator);
    line(fmt::format("{:<40} | {:<10} | {:<12} | {}", "Device/Topic", "Messages", "Data Volume", "Last Seen"));
    line(separator);

    for (const auto& [key, counters] : report.rows) {
        std::string shown = truncateUtf8(key, kKeyWidth);
        line(fmt::format("{:<40} | {:<10} | {:<12} | {:.1f}s ago", shown, counters.count,
                         formatBytes(counters.total_bytes), now - counters.last_seen));
    }

    if (report.rows.empty()) {
        line("Waiting for messages...");
    }
    return text;
}

} // namespace TrafficMon
