#include <trafficmon/core/render/rate_formatter.hpp>
#include <spdlog/fmt/fmt.h>

namespace TrafficMon {

std::string formatBytes(uint64_t size) {
    static constexpr const char* kUnits[] = {"B", "KB", "MB"};
    double value = static_cast<double>(size);
    for (const char* unit : kUnits) {
        if (value < 1024.0) {
            return fmt::format("{:7.2f} {}", value, unit);
        }
        value /= 1024.0;
    }
    return fmt::format("{:7.2f} GB", value);
}

std::string formatRate(double bytes_per_sec) {
    double bytes = bytes_per_sec;
    const char* byte_unit = "B/s";
    if (bytes >= 1024.0) {
        bytes /= 1024.0;
        byte_unit = "KB/s";
    }
    if (bytes >= 1024.0) {
        bytes /= 1024.0;
        byte_unit = "MB/s";
    }

    double bits = bytes_per_sec * 8.0;
    const char* bit_unit = "bps";
    if (bits >= 1000.0) {
        bits /= 1000.0;
        bit_unit = "kbps";
    }
    if (bits >= 1000.0) {
        bits /= 1000.0;
        bit_unit = "Mbps";
    }

    return fmt::format("{:7.2f} {} ({:7.2f} {})", bytes, byte_unit, bits, bit_unit);
}

std::string formatMessageRate(double messages_per_sec) {
    return fmt::format("{:.2f}/s", messages_per_sec);
}

std::string formatInterval(int64_t seconds) {
    if (seconds < 60 || seconds % 60 != 0) {
        return fmt::format("{}s", seconds);
    }
    int64_t minutes = seconds / 60;
    if (minutes < 60) {
        return fmt::format("{}m", minutes);
    }
    int64_t hours = minutes / 60;
    int64_t rest = minutes % 60;
    if (rest == 0) return fmt::format("{}h", hours);
    return fmt::format("{}h{}m", hours, rest);
}

} // namespace TrafficMon
