///////////////////////////////////////////////////////////////////////////////
///
///	\file    test_time.cpp
///	\author  WaveMatchup developers
///	\version March 4, 2024
///
///	<remarks>
///		Copyright 2024 WaveMatchup developers
///
///		This file is distributed as part of the WaveMatchup source code
///		package.  Permission is granted to use, copy, modify and distribute
///		this source code and its documentation under the terms of the GNU
///		General Public License.  This software is provided "as is" without
///		express or implied warranty.
///	</remarks>

#include <gtest/gtest.h>

#include "TimeObj.h"
#include "Exception.h"

///////////////////////////////////////////////////////////////////////////////

TEST(TimeTest, DaysSinceEpoch) {
	EXPECT_EQ(Time::DaysSinceEpoch(1970, 1, 1), 0);
	EXPECT_EQ(Time::DaysSinceEpoch(1970, 1, 2), 1);
	EXPECT_EQ(Time::DaysSinceEpoch(2000, 1, 1), 10957);
	EXPECT_EQ(Time::DaysSinceEpoch(2000, 3, 1), 11017);
	EXPECT_EQ(Time::DaysSinceEpoch(1969, 12, 31), -1);
}

TEST(TimeTest, NormalizeAcrossLeapDay) {
	Time time(2024, 2, 28, 86400.0 + 3600.0);
	EXPECT_EQ(time.GetYear(), 2024);
	EXPECT_EQ(time.GetMonth(), 2);
	EXPECT_EQ(time.GetDay(), 29);
	EXPECT_EQ(time.GetHour(), 1);

	time.AddSeconds(86400.0);
	EXPECT_EQ(time.GetMonth(), 3);
	EXPECT_EQ(time.GetDay(), 1);
}

TEST(TimeTest, EpochSecondsRoundTrip) {
	Time time;
	time.FromEpochSeconds(1577836800.0 + 13.0 * 3600.0);
	EXPECT_EQ(time.GetYear(), 2020);
	EXPECT_EQ(time.GetMonth(), 1);
	EXPECT_EQ(time.GetDay(), 1);
	EXPECT_EQ(time.GetHour(), 13);
	EXPECT_DOUBLE_EQ(time.GetSecond(), 13.0 * 3600.0);
	EXPECT_EQ(time.GetCalendarType(), Time::CalendarStandard);
	EXPECT_DOUBLE_EQ(time.GetEpochSeconds(), 1577836800.0 + 13.0 * 3600.0);
}

TEST(TimeTest, CFUnits) {
	Time time;

	time.FromCFCompliantUnitsOffsetDouble("hours since 1970-01-01 00:00:00", 24.0);
	EXPECT_DOUBLE_EQ(time.GetEpochSeconds(), 86400.0);

	time.FromCFCompliantUnitsOffsetDouble("days since 1950-01-01T00:00:00Z", 0.0);
	EXPECT_DOUBLE_EQ(time.GetEpochSeconds(), -631152000.0);

	time.FromCFCompliantUnitsOffsetDouble("seconds since 2020-01-01 00:00:00+01:00", 0.0);
	EXPECT_DOUBLE_EQ(time.GetEpochSeconds(), 1577836800.0 - 3600.0);

	time.FromCFCompliantUnitsOffsetDouble("minutes since 2020-01-01", 90.0);
	EXPECT_DOUBLE_EQ(time.GetEpochSeconds(), 1577836800.0 + 5400.0);

	time.FromCFCompliantUnitsOffsetDouble("day since 2020-01-01 12:00", 0.5);
	EXPECT_DOUBLE_EQ(time.GetEpochSeconds(), 1577836800.0 + 86400.0);
}

TEST(TimeTest, MalformedUnitsThrow) {
	Time time;
	EXPECT_THROW(
		time.FromCFCompliantUnitsOffsetDouble("fortnights since 2020-01-01", 1.0),
		Exception);
	EXPECT_THROW(
		time.FromCFCompliantUnitsOffsetDouble("hours after 2020-01-01", 1.0),
		Exception);
	EXPECT_THROW(
		time.FromFormattedString("2020/01/01"),
		Exception);
}

TEST(TimeTest, CalendarTypes) {
	EXPECT_EQ(Time::CalendarTypeFromString("standard"), Time::CalendarStandard);
	EXPECT_EQ(Time::CalendarTypeFromString("Gregorian"), Time::CalendarGregorian);
	EXPECT_EQ(Time::CalendarTypeFromString(" proleptic_gregorian "),
		Time::CalendarProlepticGregorian);
	EXPECT_EQ(Time::CalendarTypeFromString("noleap"), Time::CalendarUnknown);
	EXPECT_EQ(Time::CalendarTypeFromString("360_day"), Time::CalendarUnknown);
}

TEST(TimeTest, Formatting) {
	EXPECT_EQ(EpochSecondsToDateHourString(1577836800.0 + 47.0 * 3600.0),
		"2020010223");

	Time time;
	EXPECT_EQ(time.ToString(), "1970-01-01 00:00:00");

	time.FromEpochSeconds(1577836800.0 + 3723.0);
	EXPECT_EQ(time.ToString(), "2020-01-01 01:02:03");
}

TEST(TimeTest, MonthOfEpochSeconds) {
	// 2020-02-29 12:00:00
	double dTime = 1577836800.0 + (31.0 + 28.0) * 86400.0 + 43200.0;
	EXPECT_EQ(EpochSecondsToMonth(dTime), 2);
	EXPECT_EQ(EpochSecondsToMonth(dTime + 86400.0), 3);
	EXPECT_EQ(EpochSecondsToMonth(0.0), 1);
}

///////////////////////////////////////////////////////////////////////////////

