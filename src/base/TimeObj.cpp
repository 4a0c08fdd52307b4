///////////////////////////////////////////////////////////////////////////////
///
///	\file    TimeObj.cpp
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

#include "TimeObj.h"
#include "STLStringHelper.h"
#include "Defines.h"

#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <cmath>

///////////////////////////////////////////////////////////////////////////////

Time::CalendarType Time::CalendarTypeFromString(
	const std::string & strCalendar
) {
	std::string strCalendarTemp = strCalendar;
	STLStringHelper::ToLower(strCalendarTemp);
	STLStringHelper::RemoveWhitespaceInPlace(strCalendarTemp);

	if (strCalendarTemp == "standard") {
		return CalendarStandard;
	} else if (strCalendarTemp == "gregorian") {
		return CalendarGregorian;
	} else if (strCalendarTemp == "proleptic_gregorian") {
		return CalendarProlepticGregorian;
	}
	return CalendarUnknown;
}

///////////////////////////////////////////////////////////////////////////////

long Time::DaysSinceEpoch(
	int iYear,
	int iMonth,
	int iDay
) {
	// Shift the year to begin in March so the leap day is last
	long lYear = iYear - ((iMonth <= 2)?(1):(0));
	long lEra = ((lYear >= 0)?(lYear):(lYear - 399)) / 400;
	long lYearOfEra = lYear - lEra * 400;
	long lMonthShifted = (iMonth > 2)?(iMonth - 3):(iMonth + 9);
	long lDayOfYear = (153 * lMonthShifted + 2) / 5 + iDay - 1;
	long lDayOfEra =
		lYearOfEra * 365 + lYearOfEra / 4 - lYearOfEra / 100 + lDayOfYear;

	return lEra * 146097 + lDayOfEra - 719468;
}

///////////////////////////////////////////////////////////////////////////////

void Time::NormalizeTime() {
	if ((m_iMonth < 1) || (m_iMonth > 12)) {
		_EXCEPTION1("Invalid month %i", m_iMonth);
	}
	long lDays = DaysSinceEpoch(m_iYear, m_iMonth, m_iDay);
	double dExtraDays = floor(m_dSecond / SecondsPerDay);
	lDays += static_cast<long>(dExtraDays);
	m_dSecond -= dExtraDays * SecondsPerDay;

	// Convert the day count back to a civil date
	long lShifted = lDays + 719468;
	long lEra = ((lShifted >= 0)?(lShifted):(lShifted - 146096)) / 146097;
	long lDayOfEra = lShifted - lEra * 146097;
	long lYearOfEra =
		(lDayOfEra - lDayOfEra / 1460 + lDayOfEra / 36524
			- lDayOfEra / 146096) / 365;
	long lDayOfYear =
		lDayOfEra - (365 * lYearOfEra + lYearOfEra / 4 - lYearOfEra / 100);
	long lMonthShifted = (5 * lDayOfYear + 2) / 153;

	m_iDay = static_cast<int>(lDayOfYear - (153 * lMonthShifted + 2) / 5 + 1);
	m_iMonth = static_cast<int>(
		(lMonthShifted < 10)?(lMonthShifted + 3):(lMonthShifted - 9));
	m_iYear = static_cast<int>(
		lYearOfEra + lEra * 400 + ((m_iMonth <= 2)?(1):(0)));
}

///////////////////////////////////////////////////////////////////////////////

void Time::FromFormattedString(
	const std::string & strFormattedTime
) {
	std::string strTime = strFormattedTime;
	STLStringHelper::RemoveWhitespaceInPlace(strTime);

	int iYear = 0;
	int iMonth = 1;
	int iDay = 1;
	int nConsumed = 0;

	int nFields =
		sscanf(strTime.c_str(), "%d-%d-%d%n",
			&iYear, &iMonth, &iDay, &nConsumed);

	if (nFields != 3) {
		_EXCEPTION1("Malformed date string \"%s\"", strFormattedTime.c_str());
	}

	// Time of day
	int iHour = 0;
	int iMinute = 0;
	double dSecond = 0.0;
	std::string strRemainder = strTime.substr(nConsumed);

	if ((strRemainder.length() > 0) &&
	    ((strRemainder[0] == ' ') || (strRemainder[0] == 'T'))
	) {
		strRemainder = strRemainder.substr(1);
		int nTimeConsumed = 0;
		int nTimeFields =
			sscanf(strRemainder.c_str(), "%d:%d%n",
				&iHour, &iMinute, &nTimeConsumed);

		if (nTimeFields != 2) {
			_EXCEPTION1("Malformed time string \"%s\"",
				strFormattedTime.c_str());
		}
		strRemainder = strRemainder.substr(nTimeConsumed);

		if ((strRemainder.length() > 0) && (strRemainder[0] == ':')) {
			char * szEnd = NULL;
			dSecond = strtod(strRemainder.c_str() + 1, &szEnd);
			strRemainder = std::string(szEnd);
		}
	}

	// Time zone designator
	STLStringHelper::RemoveWhitespaceInPlace(strRemainder);
	double dZoneOffset = 0.0;
	if ((strRemainder == "") || (strRemainder == "Z") || (strRemainder == "UTC")) {

	} else if ((strRemainder[0] == '+') || (strRemainder[0] == '-')) {
		int iZoneHour = 0;
		int iZoneMinute = 0;
		if (sscanf(strRemainder.c_str() + 1, "%d:%d", &iZoneHour, &iZoneMinute) < 1) {
			_EXCEPTION1("Malformed time zone in \"%s\"",
				strFormattedTime.c_str());
		}
		dZoneOffset = static_cast<double>(iZoneHour * 3600 + iZoneMinute * 60);
		if (strRemainder[0] == '-') {
			dZoneOffset = -dZoneOffset;
		}

	} else {
		_EXCEPTION1("Malformed time string \"%s\"", strFormattedTime.c_str());
	}

	m_iYear = iYear;
	m_iMonth = iMonth;
	m_iDay = iDay;
	m_dSecond =
		static_cast<double>(iHour * 3600 + iMinute * 60) + dSecond - dZoneOffset;

	NormalizeTime();
}

///////////////////////////////////////////////////////////////////////////////

void Time::FromCFCompliantUnitsOffsetDouble(
	const std::string & strFormattedTime,
	double dOffset
) {
	size_t sSince = strFormattedTime.find(" since ");
	if (sSince == std::string::npos) {
		_EXCEPTION1("Unknown \"time::units\" format \"%s\"",
			strFormattedTime.c_str());
	}

	std::string strUnit = strFormattedTime.substr(0, sSince);
	STLStringHelper::RemoveWhitespaceInPlace(strUnit);
	STLStringHelper::ToLower(strUnit);

	double dUnitSeconds = 0.0;
	if ((strUnit == "days") || (strUnit == "day")) {
		dUnitSeconds = SecondsPerDay;
	} else if ((strUnit == "hours") || (strUnit == "hour")) {
		dUnitSeconds = SecondsPerHour;
	} else if ((strUnit == "minutes") || (strUnit == "minute")) {
		dUnitSeconds = 60.0;
	} else if ((strUnit == "seconds") || (strUnit == "second")) {
		dUnitSeconds = 1.0;
	} else {
		_EXCEPTION1("Unknown \"time::units\" format \"%s\"",
			strFormattedTime.c_str());
	}

	FromFormattedString(strFormattedTime.substr(sSince + 7));
	AddSeconds(dOffset * dUnitSeconds);
}

///////////////////////////////////////////////////////////////////////////////

void Time::FromEpochSeconds(
	double dEpochSeconds
) {
	m_iYear = 1970;
	m_iMonth = 1;
	m_iDay = 1;
	m_dSecond = dEpochSeconds;
	NormalizeTime();
}

///////////////////////////////////////////////////////////////////////////////

double Time::GetEpochSeconds() const {
	return static_cast<double>(DaysSinceEpoch(m_iYear, m_iMonth, m_iDay))
		* SecondsPerDay + m_dSecond;
}

///////////////////////////////////////////////////////////////////////////////

void Time::AddSeconds(
	double dSeconds
) {
	m_dSecond += dSeconds;
	NormalizeTime();
}

///////////////////////////////////////////////////////////////////////////////

std::string Time::ToDateHourString() const {
	char szBuffer[32];
	snprintf(szBuffer, 32, "%04i%02i%02i%02i",
		m_iYear, m_iMonth, m_iDay, GetHour());
	return std::string(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

std::string Time::ToString() const {
	int iSecond = static_cast<int>(m_dSecond);
	char szBuffer[64];
	snprintf(szBuffer, 64, "%04i-%02i-%02i %02i:%02i:%02i",
		m_iYear, m_iMonth, m_iDay,
		iSecond / 3600, (iSecond % 3600) / 60, iSecond % 60);
	return std::string(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

std::string EpochSecondsToDateHourString(
	double dEpochSeconds
) {
	Time time;
	time.FromEpochSeconds(dEpochSeconds);
	return time.ToDateHourString();
}

///////////////////////////////////////////////////////////////////////////////

int EpochSecondsToMonth(
	double dEpochSeconds
) {
	Time time;
	time.FromEpochSeconds(dEpochSeconds);
	return time.GetMonth();
}

///////////////////////////////////////////////////////////////////////////////

