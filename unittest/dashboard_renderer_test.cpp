// ============================================================================
// DASHBOARD RENDERER UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>
#include <trafficmon/core/render/dashboard_renderer.hpp>
#include <trafficmon/core/render/log_reporter.hpp>

using namespace TrafficMon;

namespace {

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

ReportData sampleReport() {
    ReportData report;
    report.rows.push_back({"living_room_lamp", TopicCounters{12, 2048, 95.0}});
    report.rows.push_back({"kitchen_sensor", TopicCounters{3, 300, 99.5}});
    report.distinct_keys = 2;
    report.totals = TrafficTotals{15, 2348};
    report.rates.push_back(WindowRate{60, 0.25, 39.0});
    report.rates.push_back(WindowRate{300, 0.05, 7.8});
    return report;
}

DashboardRenderer::Options plainOptions() {
    DashboardRenderer::Options options;
    options.title = "zigbee2mqtt Network Monitor";
    options.clear_screen = false;
    return options;
}

} // anonymous namespace

TEST(DashboardRenderer, ComposeLayout) {
    std::ostringstream out;
    DashboardRenderer renderer(out, plainOptions());

    auto lines = splitLines(renderer.compose(sampleReport(), 100.0, 50.0, 60));
    ASSERT_EQ(lines.size(), 9u);

    EXPECT_EQ(lines[0].rfind("zigbee2mqtt Network Monitor - ", 0), 0u);
    EXPECT_EQ(lines[1].rfind("Elapsed: 50.0s | Total Msg: 15 (0.30/s) | Total Data: ", 0), 0u);
    EXPECT_EQ(lines[1].find("Ignored"), std::string::npos);
    EXPECT_EQ(lines[2].rfind("Last    1m:", 0), 0u);
    EXPECT_EQ(lines[3].rfind("Last    5m:", 0), 0u);
    EXPECT_EQ(lines[4], std::string(60, '-'));
    EXPECT_EQ(lines[5].rfind("Device/Topic", 0), 0u);
    EXPECT_NE(lines[5].find("| Messages   | Data Volume  | Last Seen"), std::string::npos);
    EXPECT_EQ(lines[6], std::string(60, '-'));
    EXPECT_EQ(lines[7].rfind("living_room_lamp", 0), 0u);
    EXPECT_NE(lines[7].find("| 12         |"), std::string::npos);
    EXPECT_NE(lines[7].find("5.0s ago"), std::string::npos);
    EXPECT_NE(lines[8].find("0.5s ago"), std::string::npos);
}

TEST(DashboardRenderer, EmptyReportShowsWaitingLine) {
    std::ostringstream out;
    DashboardRenderer renderer(out, plainOptions());

    ReportData report;
    report.rates.push_back(WindowRate{60, 0.0, 0.0});
    auto lines = splitLines(renderer.compose(report, 10.0, 10.0, 40));

    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines.back(), "Waiting for messages...");
    EXPECT_NE(lines[1].find("(0.00/s)"), std::string::npos);
}

TEST(DashboardRenderer, LongKeysAreTruncated) {
    std::ostringstream out;
    DashboardRenderer renderer(out, plainOptions());

    ReportData report;
    std::string key(55, 'k');
    report.rows.push_back({key, TopicCounters{1, 1, 1.0}});
    auto lines = splitLines(renderer.compose(report, 1.0, 0.0, 80));

    const std::string& row = lines.back();
    EXPECT_EQ(row.substr(0, 43), std::string(40, 'k') + " | ");
}

TEST(DashboardRenderer, TruncationKeepsMultiByteCharactersWhole) {
    std::ostringstream out;
    DashboardRenderer renderer(out, plainOptions());

    // "\xC3\xBC" (u-umlaut) occupies bytes 39 and 40, the 40th character
    const std::string kept = std::string(39, 'a') + "\xC3\xBC";
    ReportData report;
    report.rows.push_back({kept + "x", TopicCounters{1, 1, 1.0}});
    auto lines = splitLines(renderer.compose(report, 1.0, 0.0, 80));

    const std::string& row = lines.back();
    ASSERT_GT(row.size(), kept.size());
    EXPECT_EQ(row.substr(0, kept.size()), kept);
    EXPECT_EQ(row[kept.size()], ' ');
    EXPECT_EQ(row.find('x'), std::string::npos);
}

TEST(DashboardRenderer, ShortMultiByteKeyIsUntouched) {
    std::ostringstream out;
    DashboardRenderer renderer(out, plainOptions());

    const std::string key = "K\xC3\xBC" "che/\xE6\xB8\xA9\xE5\xBA\xA6";
    ReportData report;
    report.rows.push_back({key, TopicCounters{2, 10, 1.0}});
    auto lines = splitLines(renderer.compose(report, 1.0, 0.0, 80));
    EXPECT_EQ(lines.back().rfind(key, 0), 0u);
}

TEST(DashboardRenderer, IgnoredCountShownWhenNonZero) {
    std::ostringstream out;
    DashboardRenderer renderer(out, plainOptions());

    auto report = sampleReport();
    report.ignored = 7;
    auto lines = splitLines(renderer.compose(report, 100.0, 50.0, 80));
    EXPECT_NE(lines[1].find(" | Ignored: 7"), std::string::npos);
}

TEST(DashboardRenderer, RenderClearsScreenOnlyWhenEnabled) {
    std::ostringstream plain;
    DashboardRenderer quiet(plain, plainOptions());
    quiet.render(sampleReport(), 100.0, 50.0);
    EXPECT_EQ(plain.str().find("\033[2J"), std::string::npos);
    EXPECT_EQ(plain.str().rfind("zigbee2mqtt Network Monitor", 0), 0u);

    std::ostringstream cleared;
    auto options = plainOptions();
    options.clear_screen = true;
    DashboardRenderer full(cleared, options);
    full.render(sampleReport(), 100.0, 50.0);
    EXPECT_EQ(cleared.str().rfind("\033[2J\033[H", 0), 0u);
}

TEST(DashboardRenderer, MaxRowsFollowsTerminalOrFixedSetting) {
    std::ostringstream out;
    auto options = plainOptions();
    DashboardRenderer sized(out, options);

    auto [columns, lines] = DashboardRenderer::terminalSize();
    EXPECT_GT(columns, 0u);
    size_t expected = lines > 9 ? lines - 9 : 1;
    EXPECT_EQ(sized.maxRows(3), expected);

    options.fixed_rows = 4;
    DashboardRenderer fixed(out, options);
    EXPECT_EQ(fixed.maxRows(3), 4u);
}

TEST(LogReporter, RowLimitIsFixed) {
    LogReporter reporter(7);
    EXPECT_EQ(reporter.maxRows(3), 7u);
    EXPECT_NO_THROW(reporter.render(sampleReport(), 100.0, 50.0));
    EXPECT_NO_THROW(reporter.render(ReportData{}, 100.0, 50.0));
}
