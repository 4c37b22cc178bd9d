#include <trafficmon/core/metrics/snapshot_table.hpp>
#include <algorithm>

namespace TrafficMon {

void SnapshotTable::record(const std::string& key, uint64_t size, double timestamp) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto [it, inserted] = counters_.try_emplace(key);
    auto& c = it->second;
    c.count += 1;
    c.total_bytes += size;
    if (inserted || timestamp > c.last_seen) {
        c.last_seen = timestamp;
    }
    totals_.count += 1;
    totals_.total_bytes += size;
}

std::vector<SnapshotRow> SnapshotTable::snapshot(size_t limit) const {
    std::vector<SnapshotRow> rows;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        rows.reserve(counters_.size());
        for (const auto& [key, c] : counters_) {
            rows.emplace_back(key, c);
        }
    }
    // Sorting happens outside the critical section
    return sortedRows(std::move(rows), limit);
}

TrafficTotals SnapshotTable::totals() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return totals_;
}

size_t SnapshotTable::keyCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return counters_.size();
}

SnapshotTable::View SnapshotTable::view(size_t limit) const {
    View v;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        v.rows.reserve(counters_.size());
        for (const auto& [key, c] : counters_) {
            v.rows.emplace_back(key, c);
        }
        v.totals = totals_;
        v.key_count = counters_.size();
    }
    v.rows = sortedRows(std::move(v.rows), limit);
    return v;
}

std::vector<SnapshotRow> SnapshotTable::sortedRows(std::vector<SnapshotRow> rows, size_t limit) {
    auto byCountThenKey = [](const SnapshotRow& a, const SnapshotRow& b) {
        if (a.second.count != b.second.count) return a.second.count > b.second.count;
        return a.first < b.first;
    };

    if (limit > 0 && limit < rows.size()) {
        std::partial_sort(rows.begin(), rows.begin() + limit, rows.end(), byCountThenKey);
        rows.resize(limit);
    } else {
        std::sort(rows.begin(), rows.end(), byCountThenKey);
    }
    return rows;
}

} // namespace TrafficMon
