#include <trafficmon/core/metrics/traffic_aggregator.hpp>
#include <trafficmon/core/events/event.hpp>
#include <trafficmon/core/events/topic_key.hpp>
#include <utility>

namespace TrafficMon {

TrafficAggregator::TrafficAggregator()
    : TrafficAggregator(Options{}) {
}

TrafficAggregator::TrafficAggregator(Options options)
    : options_(std::move(options)),
      window_(options_.retention_seconds) {
}

void TrafficAggregator::onEvent(const std::string& topic, uint64_t payload_size, double timestamp) {
    if (!options_.filter.accepts(topic)) {
        ignored_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    Event event{extractDisplayKey(topic, options_.detail_depth), payload_size, timestamp};
    table_.record(event.display_key, event.size, event.timestamp);
    window_.record(event.timestamp, event.size);
}

ReportData TrafficAggregator::buildReport(double now, const std::vector<int64_t>& intervals,
                                          size_t max_display_rows) {
    ReportData report;

    auto view = table_.view(max_display_rows);
    report.rows = std::move(view.rows);
    report.totals = view.totals;
    report.distinct_keys = view.key_count;

    report.rates = window_.rates(now, intervals);
    report.ignored = ignored_.load(std::memory_order_relaxed);
    return report;
}

} // namespace TrafficMon
