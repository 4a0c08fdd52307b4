///////////////////////////////////////////////////////////////////////////////
///
///	\file    TimeObj.h
///	\author  Paul Ullrich
///	\version March 4, 2024
///
///	<remarks>
///		Copyright 2000-2024 Paul Ullrich
///
///		This file is distributed as part of the WaveMatchup source code
///		package.  Permission is granted to use, copy, modify and distribute
///		this source code and its documentation under the terms of the GNU
///		General Public License.  This software is provided "as is" without
///		express or implied warranty.
///	</remarks>

#ifndef _TIMEOBJ_H_
#define _TIMEOBJ_H_

#include "Exception.h"

#include <string>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A calendar time on the standard (proleptic Gregorian) calendar,
///		stored as year, month, day and seconds since midnight.  Engine
///		timestamps are seconds since 1970-01-01 00:00:00 UTC; this class
///		converts between those and CF-compliant time axes.
///	</summary>
class Time {

public:
	///	<summary>
	///		Type of calendar.
	///	</summary>
	enum CalendarType {
		CalendarUnknown,
		CalendarStandard,
		CalendarGregorian,
		CalendarProlepticGregorian
	};

public:
	///	<summary>
	///		Constructor (1970-01-01 00:00:00).
	///	</summary>
	Time(
		CalendarType eCalendarType = CalendarStandard
	) :
		m_iYear(1970),
		m_iMonth(1),
		m_iDay(1),
		m_dSecond(0.0),
		m_eCalendarType(eCalendarType)
	{
		if (m_eCalendarType == CalendarUnknown) {
			_EXCEPTIONT("Invalid CalendarType");
		}
	}

	///	<summary>
	///		Constructor.  Month and day are one-based.
	///	</summary>
	Time(
		int iYear,
		int iMonth,
		int iDay,
		double dSecond = 0.0,
		CalendarType eCalendarType = CalendarStandard
	) :
		m_iYear(iYear),
		m_iMonth(iMonth),
		m_iDay(iDay),
		m_dSecond(dSecond),
		m_eCalendarType(eCalendarType)
	{
		if (m_eCalendarType == CalendarUnknown) {
			_EXCEPTIONT("Invalid CalendarType");
		}
		NormalizeTime();
	}

public:
	///	<summary>
	///		Returns the CalendarType associated with the given string, or
	///		CalendarUnknown if the calendar is not supported.
	///	</summary>
	static CalendarType CalendarTypeFromString(
		const std::string & strCalendar
	);

	///	<summary>
	///		Number of days since 1970-01-01 of the given date.
	///	</summary>
	static long DaysSinceEpoch(
		int iYear,
		int iMonth,
		int iDay
	);

public:
	///	<summary>
	///		Bring the day and seconds fields back into range.
	///	</summary>
	void NormalizeTime();

	///	<summary>
	///		Parse a date of the form YYYY-MM-DD[ T]hh:mm:ss[.s][Z|+hh:mm].
	///		Omitted time fields are zero.
	///	</summary>
	void FromFormattedString(
		const std::string & strFormattedTime
	);

	///	<summary>
	///		Set this time from CF-compliant units ("<unit> since <date>")
	///		and an offset in those units.
	///	</summary>
	void FromCFCompliantUnitsOffsetDouble(
		const std::string & strFormattedTime,
		double dOffset
	);

	///	<summary>
	///		Set this time from seconds since 1970-01-01 00:00:00.
	///	</summary>
	void FromEpochSeconds(
		double dEpochSeconds
	);

	///	<summary>
	///		Get the number of seconds since 1970-01-01 00:00:00.
	///	</summary>
	double GetEpochSeconds() const;

	///	<summary>
	///		Add a number of seconds to this time.
	///	</summary>
	void AddSeconds(
		double dSeconds
	);

public:
	inline int GetYear() const {
		return m_iYear;
	}

	inline int GetMonth() const {
		return m_iMonth;
	}

	inline int GetDay() const {
		return m_iDay;
	}

	inline double GetSecond() const {
		return m_dSecond;
	}

	inline CalendarType GetCalendarType() const {
		return m_eCalendarType;
	}

	///	<summary>
	///		Hour of day, truncated.
	///	</summary>
	inline int GetHour() const {
		return static_cast<int>(m_dSecond / 3600.0);
	}

public:
	///	<summary>
	///		Format as YYYYMMDDHH.
	///	</summary>
	std::string ToDateHourString() const;

	///	<summary>
	///		Format as YYYY-MM-DD hh:mm:ss.
	///	</summary>
	std::string ToString() const;

private:
	///	<summary>
	///		Year.
	///	</summary>
	int m_iYear;

	///	<summary>
	///		Month (1-12).
	///	</summary>
	int m_iMonth;

	///	<summary>
	///		Day of month (1-31).
	///	</summary>
	int m_iDay;

	///	<summary>
	///		Seconds since midnight.
	///	</summary>
	double m_dSecond;

	///	<summary>
	///		Calendar.
	///	</summary>
	CalendarType m_eCalendarType;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Convert seconds since 1970-01-01 to a YYYYMMDDHH string.
///	</summary>
std::string EpochSecondsToDateHourString(
	double dEpochSeconds
);

///	<summary>
///		Calendar month (1-12) of a time in seconds since 1970-01-01.
///	</summary>
int EpochSecondsToMonth(
	double dEpochSeconds
);

///////////////////////////////////////////////////////////////////////////////

#endif

