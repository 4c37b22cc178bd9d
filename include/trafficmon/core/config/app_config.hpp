#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace AppConfig {

struct MqttConfig {
    std::string host = "127.0.0.1";
    int port = 1883;
    std::string username;
    std::string password;
    std::string client_id = "trafficmon";
    int keepalive_seconds = 60;
    std::string base_topic = "zigbee2mqtt";
};

struct FilterConfig {
    bool ignore_bridge = false;
    std::vector<std::string> ignore_prefixes;
};

enum class OutputMode { DASHBOARD, LOG };

struct ReportConfig {
    int interval_seconds = 5;
    int detail_depth = 1;
    int64_t retention_seconds = 900;
    std::vector<int64_t> rate_intervals{60, 300, 900};
    OutputMode output = OutputMode::DASHBOARD;
    bool clear_screen = true;
    int max_rows = 0;           // 0 = fit the terminal
};

struct LoggingConfig {
    std::string level = "info";
};

struct AppConfiguration {
    std::string app_name = "TrafficMon";
    std::string version = "1.0.0";
    MqttConfig mqtt;
    FilterConfig filter;
    ReportConfig report;
    LoggingConfig logging;
};

} // namespace AppConfig
