#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>

#include "ksuid/format.hpp"

TEST(FormatTest, HexEncodeIsLowercase) {
    const std::uint8_t bytes[] = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(ksuid::format::HexEncode(bytes, sizeof(bytes)), "000fabff");
    EXPECT_EQ(ksuid::format::HexEncode(bytes, 0), "");
}

TEST(FormatTest, BigEndianWords) {
    std::uint8_t buffer[6] = {0xAA, 0, 0, 0, 0, 0xBB};
    ksuid::format::WriteU32BE(0x0C7C1800u, buffer + 1);
    EXPECT_EQ(buffer[0], 0xAA);
    EXPECT_EQ(buffer[1], 0x0C);
    EXPECT_EQ(buffer[4], 0x00);
    EXPECT_EQ(buffer[5], 0xBB);
    EXPECT_EQ(ksuid::format::ReadU32BE(buffer, sizeof(buffer), 1), 0x0C7C1800u);
    EXPECT_THROW(ksuid::format::ReadU32BE(buffer, sizeof(buffer), 3), std::runtime_error);
}

TEST(FormatTest, UtcTimestamps) {
    EXPECT_EQ(ksuid::format::FormatUtc(1400000000), "2014-05-13 16:53:20+00:00");
    EXPECT_EQ(ksuid::format::FormatUtc(1609459200), "2021-01-01 00:00:00+00:00");
}

TEST(FormatTest, Durations) {
    EXPECT_EQ(ksuid::format::FormatDuration(0), "0:00:00");
    EXPECT_EQ(ksuid::format::FormatDuration(65), "0:01:05");
    EXPECT_EQ(ksuid::format::FormatDuration(3 * 3600 + 7), "3:00:07");
    EXPECT_EQ(ksuid::format::FormatDuration(86400 + 3661), "1 day, 1:01:01");
    EXPECT_EQ(ksuid::format::FormatDuration(2 * 86400), "2 days, 0:00:00");
    EXPECT_EQ(ksuid::format::FormatDuration(-5), "-0:00:05");
}
