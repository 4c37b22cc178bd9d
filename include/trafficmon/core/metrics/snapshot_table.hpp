#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace TrafficMon {

/**
 * @brief Cumulative counters for one display key
 *
 * count and total_bytes only grow; last_seen is the newest timestamp observed.
 */
struct TopicCounters {
    uint64_t count = 0;
    uint64_t total_bytes = 0;
    double last_seen = 0.0;

    bool operator==(const TopicCounters& o) const {
        return count == o.count && total_bytes == o.total_bytes && last_seen == o.last_seen;
    }
};

struct TrafficTotals {
    uint64_t count = 0;
    uint64_t total_bytes = 0;
};

using SnapshotRow = std::pair<std::string, TopicCounters>;

/**
 * @brief Per-key counters behind a single mutex
 *
 * Keys are created lazily and never removed during a run. Grand totals are kept
 * alongside the map so totals() does not sum over keys.
 *
 * DATA PLANE: record() from the ingest thread
 * CONTROL PLANE: snapshot()/totals() from the report thread
 */
class SnapshotTable {
public:
    SnapshotTable() = default;
    SnapshotTable(const SnapshotTable&) = delete;
    SnapshotTable& operator=(const SnapshotTable&) = delete;

    void record(const std::string& key, uint64_t size, double timestamp);

    // Point-in-time copy sorted by descending count, ties by key.
    // limit == 0 returns every row.
    std::vector<SnapshotRow> snapshot(size_t limit = 0) const;

    TrafficTotals totals() const;
    size_t keyCount() const;

    // Rows, totals and key count taken under one lock acquisition
    struct View {
        std::vector<SnapshotRow> rows;
        TrafficTotals totals;
        size_t key_count = 0;
    };
    View view(size_t limit = 0) const;

private:
    static std::vector<SnapshotRow> sortedRows(std::vector<SnapshotRow> rows, size_t limit);

    mutable std::mutex mtx_;
    std::unordered_map<std::string, TopicCounters> counters_;
    TrafficTotals totals_;
};

} // namespace TrafficMon
