#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <trafficmon/core/config/command_line.hpp>
#include <trafficmon/core/config/loader.hpp>
#include <trafficmon/core/events/topic_filter.hpp>
#include <trafficmon/core/metrics/traffic_aggregator.hpp>
#include <trafficmon/core/render/dashboard_renderer.hpp>
#include <trafficmon/core/render/log_reporter.hpp>
#include <trafficmon/core/admin/report_driver.hpp>
#include <trafficmon/core/ingest/mqtt_subscriber.hpp>
#include <trafficmon/core/utils/clock.hpp>

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};

static void signalHandler(int /*signum*/) {
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging() {
    // stdout belongs to the dashboard
    auto logger = spdlog::stderr_color_mt("trafficmon");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

// ============================================================================
// Component Lifecycle
// ============================================================================

struct Components {
    // Order matters for destruction: ingest and driver reference the aggregator
    std::unique_ptr<TrafficMon::TrafficAggregator> aggregator;
    std::unique_ptr<TrafficMon::ReportSink> sink;
    std::unique_ptr<TrafficMon::ReportDriver> driver;
    std::unique_ptr<TrafficMon::MqttSubscriber> subscriber;
};

static Components initializeComponents(const AppConfig::AppConfiguration& config, double startTime) {
    using namespace TrafficMon;
    Components c;

    TrafficAggregator::Options options;
    options.detail_depth = config.report.detail_depth;
    options.retention_seconds = config.report.retention_seconds;
    options.filter = TopicFilter(config.mqtt.base_topic, config.filter.ignore_bridge,
                                 config.filter.ignore_prefixes);
    c.aggregator = std::make_unique<TrafficAggregator>(std::move(options));

    if (config.report.output == AppConfig::OutputMode::DASHBOARD) {
        DashboardRenderer::Options dashboard;
        dashboard.title = config.mqtt.base_topic + " Network Monitor";
        dashboard.clear_screen = config.report.clear_screen;
        dashboard.fixed_rows = static_cast<size_t>(config.report.max_rows);
        c.sink = std::make_unique<DashboardRenderer>(std::cout, dashboard);
    } else {
        size_t rows = config.report.max_rows > 0 ? static_cast<size_t>(config.report.max_rows) : 20;
        c.sink = std::make_unique<LogReporter>(rows);
    }

    ReportDriver::Config driverConfig;
    driverConfig.period = std::chrono::seconds(config.report.interval_seconds);
    driverConfig.intervals = config.report.rate_intervals;
    c.driver = std::make_unique<ReportDriver>(*c.aggregator, *c.sink, driverConfig, startTime);

    MqttSubscriber::Config mqtt;
    mqtt.host = config.mqtt.host;
    mqtt.port = config.mqtt.port;
    mqtt.client_id = config.mqtt.client_id;
    mqtt.username = config.mqtt.username;
    mqtt.password = config.mqtt.password;
    mqtt.keepalive_seconds = static_cast<uint16_t>(config.mqtt.keepalive_seconds);
    mqtt.topic_filter = config.mqtt.base_topic + "/#";

    TrafficAggregator* aggregator = c.aggregator.get();
    c.subscriber = std::make_unique<MqttSubscriber>(
        mqtt,
        [aggregator](const std::string& topic, uint64_t size, double ts) {
            aggregator->onEvent(topic, size, ts);
        });

    return c;
}

static void startComponents(Components& c) {
    spdlog::info("Starting components...");
    c.subscriber->start();
    c.driver->start();
    spdlog::info("All components started successfully");
}

static void stopComponents(Components& c) {
    spdlog::info("=== SHUTDOWN SEQUENCE ===");

    // Stop in reverse order of start
    if (c.driver) c.driver->stop();
    if (c.subscriber) c.subscriber->stop();

    spdlog::info("=== SHUTDOWN COMPLETE ===");
}

int main(int argc, char* argv[]) {
    setupLogging();
    setupSignalHandlers();

    const std::string program = argc > 0 ? argv[0] : "trafficmon";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    try {
        // Load configuration
        auto resolved = CommandLine::resolve(args);
        if (resolved.show_help) {
            std::cout << CommandLine::usage(program);
            return EXIT_SUCCESS;
        }
        const auto& config = resolved.config;

        spdlog::set_level(spdlog::level::from_str(config.logging.level));
        spdlog::info("{} v{} starting...", config.app_name, config.version);
        if (resolved.config_path.empty()) {
            spdlog::info("No config file found, using defaults and command line");
        } else {
            spdlog::info("Configuration loaded from: {}", resolved.config_path);
        }

        // Initialize all components
        const double startTime = TrafficMon::Clock::wall_seconds();
        auto components = initializeComponents(config, startTime);

        // Start all components
        startComponents(components);

        // Main loop
        while (g_running.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        std::cout << "\nStopping monitor..." << std::endl;

        // Graceful shutdown
        stopComponents(components);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("Monitor terminated gracefully");
    return EXIT_SUCCESS;
}
