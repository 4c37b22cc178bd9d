#include <trafficmon/core/config/loader.hpp>

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace {

template <typename T>
T readField(const YAML::Node& node, const std::string& name) {
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        throw std::runtime_error("Invalid type for field '" + name + "'");
    }
}

template <typename T>
T readRequired(const YAML::Node& parent, const char* key, const std::string& section) {
    const std::string name = section.empty() ? key : section + "." + key;
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        throw std::runtime_error("Missing required field '" + name + "'");
    }
    return readField<T>(node, name);
}

template <typename T>
void readOptional(const YAML::Node& parent, const char* key, const std::string& section, T& out) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) return;
    out = readField<T>(node, section + "." + key);
}

YAML::Node section(const YAML::Node& root, const char* key, bool required) {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        if (required) throw std::runtime_error(std::string("Missing required section '") + key + "'");
        return YAML::Node();
    }
    if (!node.IsMap()) {
        throw std::runtime_error(std::string("Section '") + key + "' must be a mapping");
    }
    return node;
}

} // anonymous namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Config file not found: " + filepath);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error("Config file " + filepath + " is not valid YAML: " + e.what());
    }

    if (!root.IsMap()) {
        throw std::runtime_error("Config file " + filepath + " must contain a mapping");
    }

    AppConfig::AppConfiguration config;
    config.app_name = readRequired<std::string>(root, "app_name", "");
    config.version = readRequired<std::string>(root, "version", "");

    YAML::Node mqtt = section(root, "mqtt", true);
    config.mqtt.host = readRequired<std::string>(mqtt, "host", "mqtt");
    config.mqtt.port = readRequired<int>(mqtt, "port", "mqtt");
    readOptional(mqtt, "username", "mqtt", config.mqtt.username);
    readOptional(mqtt, "password", "mqtt", config.mqtt.password);
    readOptional(mqtt, "client_id", "mqtt", config.mqtt.client_id);
    readOptional(mqtt, "keepalive_seconds", "mqtt", config.mqtt.keepalive_seconds);
    readOptional(mqtt, "base_topic", "mqtt", config.mqtt.base_topic);

    YAML::Node filter = section(root, "filter", false);
    if (filter.IsMap()) {
        readOptional(filter, "ignore_bridge", "filter", config.filter.ignore_bridge);
        readOptional(filter, "ignore_prefixes", "filter", config.filter.ignore_prefixes);
    }

    YAML::Node report = section(root, "report", false);
    if (report.IsMap()) {
        readOptional(report, "interval_seconds", "report", config.report.interval_seconds);
        readOptional(report, "detail_depth", "report", config.report.detail_depth);
        readOptional(report, "retention_seconds", "report", config.report.retention_seconds);
        readOptional(report, "rate_intervals", "report", config.report.rate_intervals);
        readOptional(report, "clear_screen", "report", config.report.clear_screen);
        readOptional(report, "max_rows", "report", config.report.max_rows);

        std::string output;
        readOptional(report, "output", "report", output);
        if (!output.empty()) {
            config.report.output = parseOutputMode(output);
        }
    }

    YAML::Node logging = section(root, "logging", false);
    if (logging.IsMap()) {
        readOptional(logging, "level", "logging", config.logging.level);
    }

    validate(config);
    spdlog::debug("[ConfigLoader] Loaded {} v{} from {}", config.app_name, config.version, filepath);
    return config;
}

void ConfigLoader::validate(const AppConfig::AppConfiguration& config) {
    const auto& mqtt = config.mqtt;
    if (mqtt.host.empty())
        throw std::runtime_error("mqtt.host cannot be empty");
    if (mqtt.port < 1 || mqtt.port > 65535)
        throw std::runtime_error("mqtt.port must be between 1 and 65535");
    if (mqtt.keepalive_seconds < 0 || mqtt.keepalive_seconds > 65535)
        throw std::runtime_error("mqtt.keepalive_seconds must be between 0 and 65535");
    if (mqtt.base_topic.empty())
        throw std::runtime_error("mqtt.base_topic cannot be empty");

    const auto& report = config.report;
    if (report.interval_seconds <= 0)
        throw std::runtime_error("report.interval_seconds must be positive");
    if (report.detail_depth < 0)
        throw std::runtime_error("report.detail_depth cannot be negative");
    if (report.retention_seconds <= 0)
        throw std::runtime_error("report.retention_seconds must be positive");
    if (report.max_rows < 0)
        throw std::runtime_error("report.max_rows cannot be negative");
    if (report.rate_intervals.empty())
        throw std::runtime_error("report.rate_intervals cannot be empty");
    for (int64_t w : report.rate_intervals) {
        if (w <= 0)
            throw std::runtime_error("report.rate_intervals entries must be positive");
        // Longer windows would silently under-count: older buckets are already evicted
        if (w > report.retention_seconds)
            throw std::runtime_error("report.rate_intervals entry " + std::to_string(w) +
                                     "s exceeds retention_seconds " +
                                     std::to_string(report.retention_seconds) + "s");
    }

    static const char* kLevels[] = {"trace", "debug", "info", "warn", "warning", "error", "critical", "off"};
    const auto& level = config.logging.level;
    if (std::none_of(std::begin(kLevels), std::end(kLevels),
                     [&level](const char* l) { return level == l; }))
        throw std::runtime_error("logging.level '" + level + "' is not a known level");
}

void ConfigLoader::applyEnvironment(AppConfig::AppConfiguration& config) {
    if (const char* host = std::getenv("MQTT_SERVER")) {
        if (*host) config.mqtt.host = host;
    }
    if (const char* port = std::getenv("MQTT_PORT")) {
        if (*port) {
            try {
                size_t used = 0;
                int value = std::stoi(port, &used);
                if (port[used] != '\0') throw std::invalid_argument(port);
                config.mqtt.port = value;
            } catch (const std::exception&) {
                throw std::runtime_error(std::string("MQTT_PORT is not a number: ") + port);
            }
        }
    }
    if (const char* user = std::getenv("MQTT_USER")) {
        config.mqtt.username = user;
    }
    if (const char* password = std::getenv("MQTT_PASSWORD")) {
        config.mqtt.password = password;
    }
}

AppConfig::OutputMode ConfigLoader::parseOutputMode(const std::string& value) {
    if (value == "dashboard") return AppConfig::OutputMode::DASHBOARD;
    if (value == "log") return AppConfig::OutputMode::LOG;
    throw std::runtime_error("Unknown output mode '" + value + "' (expected dashboard or log)");
}
