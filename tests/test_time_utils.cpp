#include <gtest/gtest.h>
#include "diyanet/errors.h"
#include "diyanet/time_utils.h"

using namespace diyanet;

TEST(TimeUtilsTest, ParsesHoursAndMinutes) {
    TimeOfDay t = parse_time_of_day("05:12");
    EXPECT_EQ(t.hour, 5);
    EXPECT_EQ(t.minute, 12);
    EXPECT_EQ(t.to_string(), "05:12");
}

TEST(TimeUtilsTest, AcceptsSecondsAndSurroundingWhitespace) {
    EXPECT_EQ(parse_time_of_day(" 23:59:30\n"), (TimeOfDay{23, 59}));
    EXPECT_EQ(parse_time_of_day("00:00"), (TimeOfDay{0, 0}));
}

TEST(TimeUtilsTest, RejectsOutOfRangeValues) {
    EXPECT_THROW(parse_time_of_day("24:00"), TimeFormatError);
    EXPECT_THROW(parse_time_of_day("12:60"), TimeFormatError);
    EXPECT_THROW(parse_time_of_day("12:00:60"), TimeFormatError);
}

TEST(TimeUtilsTest, RejectsMalformedText) {
    EXPECT_THROW(parse_time_of_day(""), TimeFormatError);
    EXPECT_THROW(parse_time_of_day("5:12"), TimeFormatError);
    EXPECT_THROW(parse_time_of_day("05.12"), TimeFormatError);
    EXPECT_THROW(parse_time_of_day("ab:cd"), TimeFormatError);
    EXPECT_THROW(parse_time_of_day("05:12pm"), TimeFormatError);
}

TEST(TimeUtilsTest, ErrorCarriesOffendingValue) {
    try {
        parse_time_of_day("noon");
        FAIL() << "expected TimeFormatError";
    } catch (const TimeFormatError& e) {
        EXPECT_EQ(e.value(), "noon");
    }
}
