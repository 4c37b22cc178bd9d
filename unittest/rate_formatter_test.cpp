#include <gtest/gtest.h>
#include <trafficmon/core/render/rate_formatter.hpp>

using namespace TrafficMon;

TEST(RateFormatter, FormatBytesPicksUnit) {
    EXPECT_EQ(formatBytes(0), "   0.00 B");
    EXPECT_EQ(formatBytes(512), " 512.00 B");
    EXPECT_EQ(formatBytes(1536), "   1.50 KB");
    EXPECT_EQ(formatBytes(1024ull * 1024), "   1.00 MB");
    EXPECT_EQ(formatBytes(2ull * 1024 * 1024 * 1024), "   2.00 GB");
}

TEST(RateFormatter, FormatRateUsesBinaryBytesAndDecimalBits) {
    EXPECT_EQ(formatRate(0.0), "   0.00 B/s (   0.00 bps)");
    EXPECT_EQ(formatRate(100.0), " 100.00 B/s ( 800.00 bps)");
    EXPECT_EQ(formatRate(1536.0), "   1.50 KB/s (  12.29 kbps)");
    EXPECT_EQ(formatRate(2000000.0), "   1.91 MB/s (  16.00 Mbps)");
}

TEST(RateFormatter, FormatMessageRate) {
    EXPECT_EQ(formatMessageRate(0.0), "0.00/s");
    EXPECT_EQ(formatMessageRate(1.0 / 3.0), "0.33/s");
    EXPECT_EQ(formatMessageRate(12.5), "12.50/s");
}

TEST(RateFormatter, FormatInterval) {
    EXPECT_EQ(formatInterval(30), "30s");
    EXPECT_EQ(formatInterval(90), "90s");
    EXPECT_EQ(formatInterval(60), "1m");
    EXPECT_EQ(formatInterval(300), "5m");
    EXPECT_EQ(formatInterval(900), "15m");
    EXPECT_EQ(formatInterval(3600), "1h");
    EXPECT_EQ(formatInterval(5400), "1h30m");
}
