#pragma once
#include <trafficmon/core/config/app_config.hpp>
#include <string>

class ConfigLoader {
public:
    // Throws std::runtime_error on a missing file, wrong field type or invalid value
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);

    // Throws std::runtime_error describing the first invalid field
    static void validate(const AppConfig::AppConfiguration& config);

    // MQTT_SERVER, MQTT_PORT, MQTT_USER, MQTT_PASSWORD
    static void applyEnvironment(AppConfig::AppConfiguration& config);

    static AppConfig::OutputMode parseOutputMode(const std::string& value);
};
