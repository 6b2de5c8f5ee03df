#include <gtest/gtest.h>
#include "util/timestamp.hpp"

using namespace mg::util;
using namespace std::chrono;

TEST(TimestampTest, IsoStringHasMillisecondsAndZulu) {
    const SysTime tp{milliseconds(1'700'000'000'123)};
    EXPECT_EQ(toIsoString(tp), "2023-11-14T22:13:20.123Z");
}

TEST(TimestampTest, ParseIsoStringRoundTripsMilliseconds) {
    const SysTime tp{milliseconds(1'700'000'000'007)};
    const auto parsed = parseIsoString(toIsoString(tp));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, tp);
}

TEST(TimestampTest, ParseIsoStringWithoutFraction) {
    const auto parsed = parseIsoString("2023-11-14T22:13:20Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(duration_cast<seconds>(parsed->time_since_epoch()).count(), 1'700'000'000);
}

TEST(TimestampTest, ParseIsoStringRejectsGarbage) {
    EXPECT_FALSE(parseIsoString("yesterday").has_value());
}

TEST(TimestampTest, ParseHttpDate) {
    const auto parsed = parseHttpDate("Tue, 14 Nov 2023 22:13:20 GMT");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(duration_cast<seconds>(parsed->time_since_epoch()).count(), 1'700'000'000);
}
