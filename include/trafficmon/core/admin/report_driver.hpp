#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include <trafficmon/core/metrics/traffic_aggregator.hpp>
#include <trafficmon/core/render/report_sink.hpp>

namespace TrafficMon {

/**
 * @brief Periodic snapshot + render cycle on its own thread
 *
 * Each cycle asks the sink how many rows it can show, builds a report from the
 * aggregator and hands it to the sink together with the process start time.
 * The first cycle runs immediately on start(). The wait between cycles is a
 * condition-variable wait, so stop() returns without finishing the period.
 */
class ReportDriver {
public:
    struct Config {
        std::chrono::milliseconds period{5000};
        std::vector<int64_t> intervals{60, 300, 900};
    };

    using ClockFn = std::function<double()>;

    ReportDriver(TrafficAggregator& aggregator, ReportSink& sink, Config config,
                 double start_time, ClockFn clock = {});
    ~ReportDriver() noexcept;

    ReportDriver(const ReportDriver&) = delete;
    ReportDriver& operator=(const ReportDriver&) = delete;

    void start();
    void stop();

    // One synchronous cycle on the caller's thread
    void runOnce();

    bool isRunning() const { return running_.load(std::memory_order_acquire); }
    uint64_t cycles() const { return cycles_.load(std::memory_order_relaxed); }

private:
    void loop();

    TrafficAggregator& aggregator_;
    ReportSink& sink_;
    Config config_;
    double start_time_;
    ClockFn clock_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> cycles_{0};
    std::thread worker_thread_;

    // For interruptible sleep during shutdown
    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
};

} // namespace TrafficMon
