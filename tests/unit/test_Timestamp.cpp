#include <gtest/gtest.h>
#include "util/timestamp.hpp"

using namespace mcs::util;

TEST(TimestampTest, ParsesMdtmAsUtc) {
    EXPECT_EQ(parseMdtmTimestamp("20240102030405"), 1704164645);
    EXPECT_EQ(parseMdtmTimestamp("19700101000000"), 0);
}

TEST(TimestampTest, DiscardsFractionalSeconds) {
    EXPECT_EQ(parseMdtmTimestamp("20240102030405.123"), 1704164645);
    EXPECT_EQ(parseMdtmTimestamp("20240102030405.9"), 1704164645);
}

TEST(TimestampTest, RejectsMalformedValues) {
    for (const auto* bad : {"", "2024010203040", "202401020304056", "2024010203040a", "2024-01-02 03:04",
                            "20240102030405.", "20240102030405.12x", "20241302030405", "20240132030405",
                            "20240102250405", "20240102036005"}) {
        EXPECT_THROW((void)parseMdtmTimestamp(bad), std::runtime_error) << bad;
    }
}

TEST(TimestampTest, RejectsImpossibleCalendarDates) {
    for (const auto* bad : {"20240231000000", "20230229120000", "20240431000000", "20241131235959"}) {
        EXPECT_THROW((void)parseMdtmTimestamp(bad), std::runtime_error) << bad;
    }
    EXPECT_EQ(parseMdtmTimestamp("20240229000000"), 1709164800);
    EXPECT_EQ(parseMdtmTimestamp("20240131000000"), 1706659200);
}

TEST(TimestampTest, FormatsUtc) {
    EXPECT_EQ(timestampToString(1704164645), "2024-01-02T03:04:05Z");
    EXPECT_EQ(toMdtmTimestamp(1704164645), "20240102030405");
    EXPECT_EQ(parseMdtmTimestamp(toMdtmTimestamp(1700000000)), 1700000000);
}
