#pragma once

#include <trafficmon/core/events/topic_filter.hpp>
#include <trafficmon/core/metrics/snapshot_table.hpp>
#include <trafficmon/core/metrics/sliding_window.hpp>

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace TrafficMon {

/**
 * @brief Everything one dashboard frame needs, copied out of the aggregator
 */
struct ReportData {
    std::vector<SnapshotRow> rows;      // top-N by message count
    size_t distinct_keys = 0;
    TrafficTotals totals;
    std::vector<WindowRate> rates;      // one per requested interval
    uint64_t ignored = 0;               // events rejected by the topic filter
};

/**
 * @brief Shared traffic state for one monitor process
 *
 * Constructed once at startup and handed by reference to the ingest path
 * (onEvent) and the report path (buildReport). Holds no static state.
 */
class TrafficAggregator {
public:
    struct Options {
        int detail_depth = 1;
        int64_t retention_seconds = SlidingWindowAggregator::kDefaultRetentionSeconds;
        TopicFilter filter;
    };

    TrafficAggregator();
    explicit TrafficAggregator(Options options);
    TrafficAggregator(const TrafficAggregator&) = delete;
    TrafficAggregator& operator=(const TrafficAggregator&) = delete;

    // Ingest entry point. Never fails; filtered topics are only counted.
    void onEvent(const std::string& topic, uint64_t payload_size, double timestamp);

    // max_display_rows == 0 keeps every row
    ReportData buildReport(double now, const std::vector<int64_t>& intervals,
                           size_t max_display_rows);

    SnapshotTable& table() { return table_; }
    SlidingWindowAggregator& window() { return window_; }
    uint64_t ignoredCount() const { return ignored_.load(std::memory_order_relaxed); }
    int detailDepth() const { return options_.detail_depth; }

private:
    Options options_;
    SnapshotTable table_;
    SlidingWindowAggregator window_;
    std::atomic<uint64_t> ignored_{0};
};

} // namespace TrafficMon
