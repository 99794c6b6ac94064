#include <gtest/gtest.h>
#include "../common/logger.hpp"
#include "../common/utils.hpp"

TEST(FormatTest, Bytes) {
    EXPECT_EQ(utils::format_bytes(0), "0 B");
    EXPECT_EQ(utils::format_bytes(1023), "1023 B");
    EXPECT_EQ(utils::format_bytes(1536), "1.50 KB");
    EXPECT_EQ(utils::format_bytes(3ULL * 1024 * 1024), "3.00 MB");
}

TEST(FormatTest, Durations) {
    EXPECT_EQ(utils::format_duration_ms(420), "0.42s");
    EXPECT_EQ(utils::format_duration_ms(45000), "45s");
    EXPECT_EQ(utils::format_duration_ms(125000), "2m 5s");
    EXPECT_EQ(utils::format_duration_ms(3723000), "1h 2m 3s");
}

TEST(FormatTest, Summary) {
    EXPECT_EQ(utils::format_summary(12, 2048, 1000), "12 entries, 2.00 KB in 1.00s (2.00 KB/s)");
}

TEST(FormatTest, HostPortSplit) {
    std::string host;
    u16 port = 0;
    EXPECT_TRUE(utils::split_host_port("example.org:6969", host, port));
    EXPECT_EQ(host, "example.org");
    EXPECT_EQ(port, 6969);
    EXPECT_FALSE(utils::split_host_port("no-port", host, port));
    EXPECT_FALSE(utils::split_host_port("h:123456", host, port));
}

TEST(LoggerTest, ParseLevel) {
    LogLevel lvl = LogLevel::INFO;
    EXPECT_TRUE(Logger::parse_level("debug", lvl));
    EXPECT_EQ(lvl, LogLevel::DEBUG);
    EXPECT_TRUE(Logger::parse_level("warning", lvl));
    EXPECT_EQ(lvl, LogLevel::WARN);
    EXPECT_TRUE(Logger::parse_level("error", lvl));
    EXPECT_EQ(lvl, LogLevel::ERR);
    EXPECT_FALSE(Logger::parse_level("loud", lvl));
    EXPECT_EQ(lvl, LogLevel::ERR);
}
