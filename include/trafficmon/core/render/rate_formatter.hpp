#pragma once

#include <cstdint>
#include <string>

namespace TrafficMon {

// "   1.50 KB" style, 1024 divisor, B/KB/MB/GB
std::string formatBytes(uint64_t size);

// "   1.50 KB/s (  12.29 kbps)": bytes use 1024, bits use 1000
std::string formatRate(double bytes_per_sec);

// Messages per second, two decimals
std::string formatMessageRate(double messages_per_sec);

// "60s", "5m", "15m", "1h30m"
std::string formatInterval(int64_t seconds);

} // namespace TrafficMon
