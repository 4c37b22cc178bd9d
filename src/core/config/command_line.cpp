#include <trafficmon/core/config/command_line.hpp>
#include <trafficmon/core/config/loader.hpp>

#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace {

int parseInt(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + flag + ": '" + value + "'");
    }
}

// Splits "--flag=value" and reports whether a value was attached
bool splitInline(const std::string& arg, std::string& flag, std::string& value) {
    auto eq = arg.find('=');
    if (arg.rfind("--", 0) != 0 || eq == std::string::npos) {
        flag = arg;
        return false;
    }
    flag = arg.substr(0, eq);
    value = arg.substr(eq + 1);
    return true;
}

} // anonymous namespace

std::string CommandLine::configPath(const std::vector<std::string>& args) {
    for (size_t i = 0; i < args.size(); ++i) {
        std::string flag, value;
        if (splitInline(args[i], flag, value) && flag == "--config") return value;
        if (args[i] == "--config" && i + 1 < args.size()) return args[i + 1];
    }
    // Positional form: trafficmon config.yaml [flags]
    if (!args.empty() && args[0].rfind("-", 0) != 0) return args[0];
    return "";
}

bool CommandLine::applyFlags(const std::vector<std::string>& args, AppConfig::AppConfiguration& config) {
    for (size_t i = 0; i < args.size(); ++i) {
        std::string flag, value;
        bool hasInline = splitInline(args[i], flag, value);

        auto next = [&]() -> std::string {
            if (hasInline) return value;
            if (i + 1 >= args.size()) throw std::runtime_error("Missing value for " + flag);
            return args[++i];
        };

        if (flag == "--help" || flag == "-h") {
            return false;
        } else if (flag == "--config") {
            next();  // consumed by configPath()
        } else if (flag == "--host") {
            config.mqtt.host = next();
        } else if (flag == "--port") {
            config.mqtt.port = parseInt(flag, next());
        } else if (flag == "--user") {
            config.mqtt.username = next();
        } else if (flag == "--password") {
            config.mqtt.password = next();
        } else if (flag == "--client-id") {
            config.mqtt.client_id = next();
        } else if (flag == "--base-topic") {
            config.mqtt.base_topic = next();
        } else if (flag == "--interval") {
            config.report.interval_seconds = parseInt(flag, next());
        } else if (flag == "--detail") {
            config.report.detail_depth = parseInt(flag, next());
        } else if (flag == "--retention") {
            config.report.retention_seconds = parseInt(flag, next());
        } else if (flag == "--max-rows") {
            config.report.max_rows = parseInt(flag, next());
        } else if (flag == "--ignore-bridge") {
            config.filter.ignore_bridge = true;
        } else if (flag == "--ignore") {
            config.filter.ignore_prefixes.push_back(next());
        } else if (flag == "--output") {
            config.report.output = ConfigLoader::parseOutputMode(next());
        } else if (flag == "--no-clear") {
            config.report.clear_screen = false;
        } else if (flag == "--log-level") {
            config.logging.level = next();
        } else if (i == 0 && flag.rfind("-", 0) != 0) {
            // positional config path
        } else {
            throw std::runtime_error("Unknown argument: " + args[i]);
        }
    }
    return true;
}

CommandLine::Result CommandLine::resolve(const std::vector<std::string>& args) {
    Result result;
    result.config_path = configPath(args);

    if (!result.config_path.empty()) {
        result.config = ConfigLoader::loadConfig(result.config_path);
    } else if (std::filesystem::exists(kDefaultConfigPath)) {
        result.config_path = kDefaultConfigPath;
        result.config = ConfigLoader::loadConfig(result.config_path);
    }

    ConfigLoader::applyEnvironment(result.config);

    if (!applyFlags(args, result.config)) {
        result.show_help = true;
        return result;
    }

    ConfigLoader::validate(result.config);
    return result;
}

std::string CommandLine::usage(const std::string& program) {
    std::ostringstream os;
    os << "Usage: " << program << " [config.yaml] [options]\n"
       << "\n"
       << "Live MQTT traffic monitor\n"
       << "\n"
       << "Options:\n"
       << "  --config <path>       YAML configuration file (default: " << kDefaultConfigPath << " if present)\n"
       << "  --host <host>         MQTT server (env MQTT_SERVER, default 127.0.0.1)\n"
       << "  --port <port>         MQTT port (env MQTT_PORT, default 1883)\n"
       << "  --user <name>         MQTT user (env MQTT_USER)\n"
       << "  --password <secret>   MQTT password (env MQTT_PASSWORD)\n"
       << "  --client-id <id>      MQTT client identifier\n"
       << "  --base-topic <topic>  Base topic to monitor (default: zigbee2mqtt)\n"
       << "  --interval <sec>      Reporting interval in seconds (default: 5)\n"
       << "  --detail <depth>      Topic depth to show (default: 1)\n"
       << "  --retention <sec>     Rate window retention in seconds (default: 900)\n"
       << "  --ignore-bridge       Ignore <base-topic>/bridge topics\n"
       << "  --ignore <prefix>     Ignore topics at or below prefix (repeatable)\n"
       << "  --output <mode>       dashboard | log (default: dashboard)\n"
       << "  --max-rows <n>        Fixed number of rows instead of fitting the terminal\n"
       << "  --no-clear            Do not clear the screen between reports\n"
       << "  --log-level <level>   trace | debug | info | warn | error | critical | off\n"
       << "  -h, --help            Show this help\n";
    return os.str();
}
