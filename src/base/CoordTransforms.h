///////////////////////////////////////////////////////////////////////////////
///
///	\file    CoordTransforms.h
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

#ifndef _COORDTRANSFORMS_H_
#define _COORDTRANSFORMS_H_

///////////////////////////////////////////////////////////////////////////////
//
// All grid lookups are performed with longitudes in the [0,360) convention.
// Longitudes are translated into it when data is ingested and translated
// back to the signed [-180,180) convention when matchups are emitted.
//
///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Translate a longitude in degrees from the signed convention to the
///		[0,360) grid convention.  Non-negative values are unchanged.
///	</summary>
inline double LonDegToGridRange(
	double dLonDeg
) {
	if (dLonDeg < 0.0) {
		return dLonDeg + 360.0;
	}
	return dLonDeg;
}

///	<summary>
///		Translate a longitude in degrees from the [0,360) grid convention
///		to the signed [-180,180) convention.  Values below 180 are
///		unchanged.
///	</summary>
inline double LonDegToSignedRange(
	double dLonDeg
) {
	if (dLonDeg >= 180.0) {
		return dLonDeg - 360.0;
	}
	return dLonDeg;
}

///////////////////////////////////////////////////////////////////////////////

#endif

