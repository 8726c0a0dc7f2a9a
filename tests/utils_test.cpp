#include <gtest/gtest.h>

#include "load_controller.hpp"
#include "utils.h"

using namespace std::chrono_literals;

TEST(ParseDurationTest, AcceptsSupportedUnits) {
    EXPECT_EQ(parse_duration("250ms"), 250ms);
    EXPECT_EQ(parse_duration("30s"), 30s);
    EXPECT_EQ(parse_duration("2m"), 120s);
    EXPECT_EQ(parse_duration("45"), 45s);
    EXPECT_EQ(parse_duration("0s"), 0ms);
}

TEST(ParseDurationTest, RejectsMalformedInput) {
    for (const std::string bad : {"", "s", "-5s", "1.5s", "10h", "5 s", "abc", "10sec"}) {
        EXPECT_THROW(parse_duration(bad), std::invalid_argument) << bad;
    }
}

TEST(ParseDurationTest, RejectsValuesTooLargeForTheClock) {
    EXPECT_THROW(parse_duration("999999999999s"), std::invalid_argument);
    EXPECT_THROW(parse_duration("999999999999m"), std::invalid_argument);
    EXPECT_THROW(parse_duration("9999999999999ms"), std::invalid_argument);
    EXPECT_EQ(parse_duration("999999999999ms"), std::chrono::milliseconds(999999999999LL));
}

TEST(ParseLoadPatternTest, KnownNamesOnly) {
    EXPECT_EQ(parse_load_pattern("constant"), LoadPattern::Constant);
    EXPECT_EQ(parse_load_pattern("ramp-up"), LoadPattern::RampUp);
    EXPECT_EQ(parse_load_pattern("spike"), LoadPattern::Spike);

    try {
        parse_load_pattern("burst");
        FAIL();
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "Invalid load pattern 'burst'. Use: constant, ramp-up, spike");
    }
}

TEST(FormatDurationTest, PicksAReadableUnit) {
    EXPECT_EQ(format_duration(850us), "850us");
    EXPECT_EQ(format_duration(12340us), "12.34ms");
    EXPECT_EQ(format_duration(3210ms), "3.21s");
}
