#include <trafficmon/core/metrics/sliding_window.hpp>
#include <algorithm>
#include <cmath>

namespace TrafficMon {

SlidingWindowAggregator::SlidingWindowAggregator(int64_t retention_seconds)
    : retention_seconds_(std::max<int64_t>(retention_seconds, 1)) {
}

std::optional<int64_t> SlidingWindowAggregator::toSecond(double timestamp) {
    // NaN, infinities and values beyond the int64 range have no bucket
    constexpr double kLimit = 9.0e18;
    if (!std::isfinite(timestamp) || timestamp < -kLimit || timestamp > kLimit) {
        return std::nullopt;
    }
    return static_cast<int64_t>(std::floor(timestamp));
}

void SlidingWindowAggregator::record(double timestamp, uint64_t size) {
    const auto second = toSecond(timestamp);
    if (!second) return;
    const int64_t s = *second;

    std::lock_guard<std::mutex> lock(mtx_);

    if (newest_second_ != std::numeric_limits<int64_t>::min()
        && s < newest_second_ - retention_seconds_) {
        return;  // already outside the retention window
    }

    if (!buckets_.empty() && buckets_.back().second_index == s) {
        auto& tail = buckets_.back();
        tail.message_count += 1;
        tail.byte_count += size;
    } else {
        buckets_.push_back(Bucket{s, 1, size});
    }

    newest_second_ = std::max(newest_second_, s);
    evictBefore(newest_second_ - retention_seconds_);
}

std::vector<WindowRate> SlidingWindowAggregator::rates(double now,
                                                       const std::vector<int64_t>& intervals) {
    const auto now_second = toSecond(now);

    std::vector<WindowRate> out;
    out.reserve(intervals.size());
    if (!now_second) {
        for (int64_t w : intervals) {
            WindowRate r;
            r.interval_seconds = w;
            out.push_back(r);
        }
        return out;
    }

    std::lock_guard<std::mutex> lock(mtx_);
    evictBefore(*now_second - retention_seconds_);

    for (int64_t w : intervals) {
        WindowRate r;
        r.interval_seconds = w;
        if (w <= 0) {
            out.push_back(r);
            continue;
        }

        const int64_t cutoff = *now_second - w;
        uint64_t messages = 0;
        uint64_t bytes = 0;
        for (const auto& b : buckets_) {
            if (b.second_index > cutoff) {
                messages += b.message_count;
                bytes += b.byte_count;
            }
        }
        r.messages_per_sec = static_cast<double>(messages) / static_cast<double>(w);
        r.bytes_per_sec = static_cast<double>(bytes) / static_cast<double>(w);
        out.push_back(r);
    }
    return out;
}

size_t SlidingWindowAggregator::bucketCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return buckets_.size();
}

std::vector<Bucket> SlidingWindowAggregator::buckets() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return std::vector<Bucket>(buckets_.begin(), buckets_.end());
}

void SlidingWindowAggregator::evictBefore(int64_t cutoff) {
    while (!buckets_.empty() && buckets_.front().second_index < cutoff) {
        buckets_.pop_front();
    }
}

} // namespace TrafficMon
