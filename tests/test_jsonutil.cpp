#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/JsonUtil.h"
#include <chrono>
#include <ctime>
#include <string>

namespace daily_dash {
namespace jsonutil {

class JsonUtilTest : public ::testing::Test {
protected:
    static TimePoint utc(int y, int mo, int d, int h = 0, int mi = 0, int s = 0) {
        std::tm tm_struct = {};
        tm_struct.tm_year = y - 1900;
        tm_struct.tm_mon = mo - 1;
        tm_struct.tm_mday = d;
        tm_struct.tm_hour = h;
        tm_struct.tm_min = mi;
        tm_struct.tm_sec = s;
        return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
    }
};

TEST_F(JsonUtilTest, TimeToIsoValidTime) {
    EXPECT_EQ(time_to_iso(utc(2023, 12, 25, 12, 30, 45)), "2023-12-25T12:30:45.000Z");
    EXPECT_EQ(time_to_iso(utc(2024, 2, 29)), "2024-02-29T00:00:00.000Z");
}

TEST_F(JsonUtilTest, TimeToIsoMilliseconds) {
    auto tp = utc(2024, 5, 1, 8, 30) + std::chrono::milliseconds(250);
    EXPECT_EQ(time_to_iso(tp), "2024-05-01T08:30:00.250Z");
}

TEST_F(JsonUtilTest, TimeToIsoCurrentTime) {
    std::string result = time_to_iso(std::chrono::system_clock::now());
    EXPECT_EQ(result.length(), 24u);
    EXPECT_EQ(result[10], 'T');
    EXPECT_EQ(result[19], '.');
    EXPECT_EQ(result.back(), 'Z');
}

TEST_F(JsonUtilTest, IsoRoundTripKeepsMilliseconds) {
    auto tp = from_epoch_ms(1714552200123);
    auto back = parse_iso8601(time_to_iso(tp));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(to_epoch_ms(*back), 1714552200123);
}

TEST_F(JsonUtilTest, ParseIsoVariants) {
    auto base = utc(2024, 5, 1, 8, 30);
    EXPECT_EQ(parse_iso8601("2024-05-01T08:30:00Z"), base);
    EXPECT_EQ(parse_iso8601("2024-05-01T08:30Z"), base);
    EXPECT_EQ(parse_iso8601("2024-05-01T10:30:00+02:00"), base);
    EXPECT_EQ(parse_iso8601("2024-05-01T03:30:00-0500"), base);
    EXPECT_EQ(parse_iso8601("2024-05-01 08:30:00"), base);
    EXPECT_EQ(parse_iso8601("2024-05-01"), utc(2024, 5, 1));
}

TEST_F(JsonUtilTest, ParseIsoRejectsGarbage) {
    EXPECT_FALSE(parse_iso8601("").has_value());
    EXPECT_FALSE(parse_iso8601("yesterday").has_value());
    EXPECT_FALSE(parse_iso8601("2024-13-01").has_value());
    EXPECT_FALSE(parse_iso8601("2024-05-01Tnoon").has_value());
}

TEST_F(JsonUtilTest, ParseRfc822) {
    auto base = utc(2024, 5, 1, 8, 30);
    EXPECT_EQ(parse_rfc822("Wed, 01 May 2024 08:30:00 GMT"), base);
    EXPECT_EQ(parse_rfc822("01 May 2024 08:30:00 +0000"), base);
    EXPECT_EQ(parse_rfc822("Wed, 01 May 2024 10:30:00 +0200"), base);
    EXPECT_EQ(parse_rfc822("Wed, 01 May 2024 04:30:00 EDT"), base);
    EXPECT_EQ(parse_rfc822("Wed, 01 May 2024 03:30 EST"), base);
    EXPECT_FALSE(parse_rfc822("Wed, 01 Foo 2024 08:30:00 GMT").has_value());
    EXPECT_FALSE(parse_rfc822("not a date").has_value());
}

TEST_F(JsonUtilTest, ParseAnyDateTriesBoth) {
    auto base = utc(2024, 5, 1, 8, 30);
    EXPECT_EQ(parse_any_date("2024-05-01T08:30:00Z"), base);
    EXPECT_EQ(parse_any_date("Wed, 01 May 2024 08:30:00 GMT"), base);
    EXPECT_FALSE(parse_any_date("").has_value());
}

TEST_F(JsonUtilTest, EpochConversions) {
    EXPECT_EQ(to_epoch_ms(from_epoch_ms(0)), 0);
    EXPECT_EQ(to_epoch_ms(utc(1970, 1, 2)), 86400000);
}

} // namespace jsonutil
} // namespace daily_dash

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
