/// @file tests/temporal/test_temporal_resolver.cpp
/// @brief Unit tests for TemporalResolver.

#include "natal/temporal.hpp"
#include "natal/constants.hpp"

#include <gtest/gtest.h>

using namespace natal;
using namespace natal::temporal;

// ─── parse_date ───────────────────────────────────────────────────────────────

TEST(ParseDate, AcceptsIsoDate) {
    const auto d = TemporalResolver::parse_date("1990-03-15");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->year, 1990);
    EXPECT_EQ(d->month, 3);
    EXPECT_EQ(d->day, 15);
}

TEST(ParseDate, ToleratesSurroundingWhitespace) {
    EXPECT_TRUE(TemporalResolver::parse_date("  2001-12-31\n").has_value());
}

TEST(ParseDate, LeapDayOnlyInLeapYears) {
    EXPECT_TRUE(TemporalResolver::parse_date("2024-02-29").has_value());
    EXPECT_TRUE(TemporalResolver::parse_date("2000-02-29").has_value());
    EXPECT_FALSE(TemporalResolver::parse_date("2023-02-29").has_value());
    EXPECT_FALSE(TemporalResolver::parse_date("1900-02-29").has_value());
}

TEST(ParseDate, RejectsMalformedInput) {
    EXPECT_FALSE(TemporalResolver::parse_date("").has_value());
    EXPECT_FALSE(TemporalResolver::parse_date("1990/03/15").has_value());
    EXPECT_FALSE(TemporalResolver::parse_date("1990-3-15").has_value());
    EXPECT_FALSE(TemporalResolver::parse_date("1990-13-01").has_value());
    EXPECT_FALSE(TemporalResolver::parse_date("1990-00-10").has_value());
    EXPECT_FALSE(TemporalResolver::parse_date("1990-04-31").has_value());
    EXPECT_FALSE(TemporalResolver::parse_date("19a0-04-01").has_value());
    EXPECT_FALSE(TemporalResolver::parse_date("not a date").has_value());
}

// ─── parse_time ───────────────────────────────────────────────────────────────

TEST(ParseTime, TwelveHourAfternoon) {
    const auto t = TemporalResolver::parse_time("2:30 pm");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->hour, 14);
    EXPECT_EQ(t->minute, 30);
    EXPECT_DOUBLE_EQ(t->decimal_hours(), 14.5);
}

TEST(ParseTime, MidnightAndNoon) {
    const auto midnight = TemporalResolver::parse_time("12:00 am");
    ASSERT_TRUE(midnight.has_value());
    EXPECT_EQ(midnight->hour, 0);

    const auto noon = TemporalResolver::parse_time("12:15 PM");
    ASSERT_TRUE(noon.has_value());
    EXPECT_EQ(noon->hour, 12);
    EXPECT_EQ(noon->minute, 15);
}

TEST(ParseTime, BareHourWithMeridiem) {
    const auto t = TemporalResolver::parse_time("7pm");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->hour, 19);
    EXPECT_EQ(t->minute, 0);
}

TEST(ParseTime, TwentyFourHourClock) {
    const auto t = TemporalResolver::parse_time("23:59");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->hour, 23);
    EXPECT_EQ(t->minute, 59);

    const auto early = TemporalResolver::parse_time("00:05");
    ASSERT_TRUE(early.has_value());
    EXPECT_EQ(early->hour, 0);
}

TEST(ParseTime, RejectsOutOfRangeAndMalformed) {
    EXPECT_FALSE(TemporalResolver::parse_time("24:00").has_value());
    EXPECT_FALSE(TemporalResolver::parse_time("13:00 pm").has_value());
    EXPECT_FALSE(TemporalResolver::parse_time("0:30 am").has_value());
    EXPECT_FALSE(TemporalResolver::parse_time("10:60").has_value());
    EXPECT_FALSE(TemporalResolver::parse_time("10:5").has_value());
    EXPECT_FALSE(TemporalResolver::parse_time("14").has_value());
    EXPECT_FALSE(TemporalResolver::parse_time("pm").has_value());
    EXPECT_FALSE(TemporalResolver::parse_time("").has_value());
}

// ─── Julian Day ───────────────────────────────────────────────────────────────

TEST(JulianDay, J2000Epoch) {
    const CivilDate date{.year = 2000, .month = 1, .day = 1};
    EXPECT_EQ(TemporalResolver::julian_day_number(date), 2451545L);
    EXPECT_DOUBLE_EQ(TemporalResolver::julian_day(date, {.hour = 12, .minute = 0}),
                     constants::J2000_JD);
}

TEST(JulianDay, MidnightIsHalfDayEarlier) {
    const CivilDate date{.year = 2000, .month = 1, .day = 1};
    EXPECT_DOUBLE_EQ(TemporalResolver::julian_day(date, {.hour = 0, .minute = 0}),
                     2451544.5);
}

TEST(JulianDay, KnownHistoricalDates) {
    // 1990-03-15 and the Gregorian reform date.
    EXPECT_EQ(TemporalResolver::julian_day_number({.year = 1990, .month = 3, .day = 15}),
              2447966L);
    EXPECT_EQ(TemporalResolver::julian_day_number({.year = 1582, .month = 10, .day = 15}),
              2299161L);
}

TEST(JulianDay, ConsecutiveDaysDifferByOne) {
    const long feb28 = TemporalResolver::julian_day_number({.year = 2024, .month = 2, .day = 28});
    const long feb29 = TemporalResolver::julian_day_number({.year = 2024, .month = 2, .day = 29});
    const long mar01 = TemporalResolver::julian_day_number({.year = 2024, .month = 3, .day = 1});
    EXPECT_EQ(feb29 - feb28, 1);
    EXPECT_EQ(mar01 - feb29, 1);
}

TEST(DayOfYear, CountsLeapDay) {
    EXPECT_EQ(TemporalResolver::day_of_year({.year = 2023, .month = 1, .day = 1}), 1);
    EXPECT_EQ(TemporalResolver::day_of_year({.year = 2023, .month = 3, .day = 1}), 60);
    EXPECT_EQ(TemporalResolver::day_of_year({.year = 2024, .month = 3, .day = 1}), 61);
    EXPECT_EQ(TemporalResolver::day_of_year({.year = 2024, .month = 12, .day = 31}), 366);
}

// ─── Locations ────────────────────────────────────────────────────────────────

TEST(LookupLocation, CaseInsensitiveSubstring) {
    const auto fix = TemporalResolver::lookup_location("New York, USA");
    EXPECT_TRUE(fix.known);
    EXPECT_DOUBLE_EQ(fix.latitude, 40.7128);
    EXPECT_DOUBLE_EQ(fix.longitude, -74.0060);

    EXPECT_TRUE(TemporalResolver::lookup_location("central LONDON").known);
}

TEST(LookupLocation, UnknownPlaceUsesDefault) {
    const auto fix = TemporalResolver::lookup_location("Atlantis");
    EXPECT_FALSE(fix.known);
    EXPECT_DOUBLE_EQ(fix.latitude, constants::DEFAULT_LATITUDE);
    EXPECT_DOUBLE_EQ(fix.longitude, constants::DEFAULT_LONGITUDE);
}

// ─── resolve ──────────────────────────────────────────────────────────────────

TEST(Resolve, FullBirthMoment) {
    const auto m = TemporalResolver::resolve({"1990-03-15", "2:30 pm", "New York, USA"});
    ASSERT_TRUE(m.has_value());
    EXPECT_TRUE(m->location_known);
    EXPECT_EQ(m->day_of_year, 74);
    EXPECT_NEAR(m->julian_day, 2447966.0 + 2.5 / 24.0, 1e-9);
    EXPECT_EQ(m->source.location_name, "New York, USA");
}

TEST(Resolve, UnknownLocationStillResolves) {
    const auto m = TemporalResolver::resolve({"1990-03-15", "14:30", "Nowhere"});
    ASSERT_TRUE(m.has_value());
    EXPECT_FALSE(m->location_known);
    EXPECT_DOUBLE_EQ(m->latitude, constants::DEFAULT_LATITUDE);
}

TEST(Resolve, FormatErrorsYieldNullopt) {
    EXPECT_FALSE(TemporalResolver::resolve({"1990-02-30", "2:30 pm", "Paris"}).has_value());
    EXPECT_FALSE(TemporalResolver::resolve({"1990-03-15", "half past two", "Paris"}).has_value());
}

TEST(Resolve, Deterministic) {
    const BirthMoment birth{"1985-07-04", "08:15", "Toronto"};
    EXPECT_EQ(TemporalResolver::resolve(birth), TemporalResolver::resolve(birth));
}
