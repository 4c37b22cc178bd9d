#include <trafficmon/core/admin/report_driver.hpp>
#include <trafficmon/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <utility>

namespace TrafficMon {

ReportDriver::ReportDriver(TrafficAggregator& aggregator, ReportSink& sink, Config config,
                           double start_time, ClockFn clock)
    : aggregator_(aggregator),
      sink_(sink),
      config_(std::move(config)),
      start_time_(start_time),
      clock_(clock ? std::move(clock) : ClockFn(&Clock::wall_seconds)) {
}

ReportDriver::~ReportDriver() noexcept {
    stop();
}

void ReportDriver::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    worker_thread_ = std::thread(&ReportDriver::loop, this);
    spdlog::info("[ReportDriver] Started (interval: {}ms, windows: {})",
                 config_.period.count(), config_.intervals.size());
}

void ReportDriver::stop() {
    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        running_.store(false, std::memory_order_release);
    }
    sleep_cv_.notify_all();  // Wake up sleeping thread immediately
    if (worker_thread_.joinable()) {
        worker_thread_.join();
        spdlog::info("[ReportDriver] Stopped after {} cycles", cycles_.load());
    }
}

void ReportDriver::runOnce() {
    const double now = clock_();
    size_t rows = sink_.maxRows(config_.intervals.size());
    auto report = aggregator_.buildReport(now, config_.intervals, rows);
    sink_.render(report, now, start_time_);
    cycles_.fetch_add(1, std::memory_order_relaxed);
}

void ReportDriver::loop() {
    while (running_.load(std::memory_order_acquire)) {
        try {
            runOnce();
        } catch (const std::exception& e) {
            spdlog::error("[ReportDriver] Report cycle failed: {}", e.what());
        }

        // Interruptible sleep: wait for one period OR until stop() is called
        std::unique_lock<std::mutex> lock(sleep_mutex_);
        sleep_cv_.wait_for(lock, config_.period, [this]() {
            return !running_.load(std::memory_order_acquire);
        });
    }
}

} // namespace TrafficMon
