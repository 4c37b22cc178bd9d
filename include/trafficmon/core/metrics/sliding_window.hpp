#pragma once

#include <cstdint>
#include <deque>
#include <limits>
#include <mutex>
#include <optional>
#include <vector>

namespace TrafficMon {

/**
 * @brief All events whose timestamp truncates to the same integer second
 */
struct Bucket {
    int64_t second_index = 0;
    uint64_t message_count = 0;
    uint64_t byte_count = 0;

    bool operator==(const Bucket& o) const {
        return second_index == o.second_index && message_count == o.message_count
            && byte_count == o.byte_count;
    }
};

struct WindowRate {
    int64_t interval_seconds = 0;
    double messages_per_sec = 0.0;
    double bytes_per_sec = 0.0;
};

/**
 * @brief Coalesced, pruning log of per-second buckets
 *
 * record() folds every event of the current second into the tail bucket and
 * evicts buckets older than the retention window from the head, so memory is
 * bounded by retention_seconds + 1 buckets for a non-decreasing timestamp
 * stream, independent of the event rate.
 *
 * Ordering: the ingest path is expected to deliver non-decreasing timestamps.
 * An earlier second is appended as its own bucket (coalescing is lost for that
 * second, nothing is corrupted). An event already older than the retention
 * window relative to the newest second seen is discarded, since eviction would
 * remove it immediately.
 *
 * rates() reports sum / interval for each requested interval. Intervals longer
 * than retention_seconds silently under-count because the older buckets are
 * gone; callers keep intervals <= retention (the config loader enforces it).
 */
class SlidingWindowAggregator {
public:
    static constexpr int64_t kDefaultRetentionSeconds = 900;

    explicit SlidingWindowAggregator(int64_t retention_seconds = kDefaultRetentionSeconds);
    SlidingWindowAggregator(const SlidingWindowAggregator&) = delete;
    SlidingWindowAggregator& operator=(const SlidingWindowAggregator&) = delete;

    // A non-finite timestamp is ignored
    void record(double timestamp, uint64_t size);

    // One WindowRate per requested interval, in request order.
    // A non-positive interval, or a non-finite now, reports zero rates.
    std::vector<WindowRate> rates(double now, const std::vector<int64_t>& intervals);

    size_t bucketCount() const;
    std::vector<Bucket> buckets() const;
    int64_t retentionSeconds() const noexcept { return retention_seconds_; }

private:
    static std::optional<int64_t> toSecond(double timestamp);
    void evictBefore(int64_t cutoff);   // caller holds mtx_

    const int64_t retention_seconds_;
    mutable std::mutex mtx_;
    std::deque<Bucket> buckets_;
    int64_t newest_second_ = std::numeric_limits<int64_t>::min();
};

} // namespace TrafficMon
