#pragma once
#include <trafficmon/core/config/app_config.hpp>
#include <string>
#include <vector>

/**
 * @brief Resolves the effective configuration for one run
 *
 * Precedence: built-in defaults < YAML file < MQTT_* environment < flags.
 * The YAML file is the --config value (or a leading positional argument); when
 * neither is given, config/config.yaml is used if it exists.
 */
class CommandLine {
public:
    static constexpr const char* kDefaultConfigPath = "config/config.yaml";

    struct Result {
        AppConfig::AppConfiguration config;
        std::string config_path;    // empty when running on defaults
        bool show_help = false;
    };

    // args excludes the program name. Throws std::runtime_error on bad input.
    static Result resolve(const std::vector<std::string>& args);

    // Applies flag overrides only; returns false if --help was requested
    static bool applyFlags(const std::vector<std::string>& args, AppConfig::AppConfiguration& config);

    static std::string configPath(const std::vector<std::string>& args);
    static std::string usage(const std::string& program);
};
