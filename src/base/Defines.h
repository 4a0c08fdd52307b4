///////////////////////////////////////////////////////////////////////////////
///
///	\file    Defines.h
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

#ifndef _DEFINES_H_
#define _DEFINES_H_

#include <cmath>
#include <limits>

///////////////////////////////////////////////////////////////////////////////
//
// Missing values are represented by a quiet NaN throughout the engine.
// Fill values from input files are translated to this on read.
//
static const double MissingValue = std::numeric_limits<double>::quiet_NaN();

inline bool IsMissing(double d) {
	return std::isnan(d);
}

///////////////////////////////////////////////////////////////////////////////
//
// Seconds per hour and per day.
//
static const double SecondsPerHour = 3600.0;
static const double SecondsPerDay = 86400.0;

///////////////////////////////////////////////////////////////////////////////
//
// Round input time vectors to the nearest second when loaded from a file.
// Times stored as float/double offsets in hours or days otherwise pick up
// round-off that breaks exact timestamp intersection.
//
#define ROUND_TIMES_TO_NEAREST_SECOND

///////////////////////////////////////////////////////////////////////////////

#endif

