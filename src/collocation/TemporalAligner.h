///////////////////////////////////////////////////////////////////////////////
///
///	\file    TemporalAligner.h
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

#ifndef _TEMPORALALIGNER_H_
#define _TEMPORALALIGNER_H_

#include <vector>
#include <cstddef>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A pair of indices into two time sequences.
///	</summary>
struct TimeIndexPair {
	TimeIndexPair(size_t a_ixA, size_t a_ixB) :
		ixA(a_ixA),
		ixB(a_ixB)
	{ }

	size_t ixA;
	size_t ixB;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Matching of time sequences given in seconds since the epoch.
///		Missing (NaN) times never match.
///	</summary>
class TemporalAligner {

private:
	TemporalAligner() { }

public:
	///	<summary>
	///		All pairs (a, b) with |vecTimesA[a] - vecTimesB[b]| strictly less
	///		than dTolerance, ordered by a and then by b.
	///	</summary>
	static void Align(
		const std::vector<double> & vecTimesA,
		const std::vector<double> & vecTimesB,
		double dTolerance,
		std::vector<TimeIndexPair> & vecPairs
	);

	///	<summary>
	///		Exact intersection.  Each distinct time of A that also occurs in
	///		B yields one pair of first occurrences, ordered by a.
	///	</summary>
	static void IntersectExact(
		const std::vector<double> & vecTimesA,
		const std::vector<double> & vecTimesB,
		std::vector<TimeIndexPair> & vecPairs
	);

	///	<summary>
	///		Find the element of vecTimes closest to dTime with distance
	///		strictly less than dTolerance.  Ties resolve to the lowest index.
	///	</summary>
	///	<returns>
	///		false if no element is within tolerance.
	///	</returns>
	static bool FindClosestWithin(
		const std::vector<double> & vecTimes,
		double dTime,
		double dTolerance,
		size_t & ixFound
	);
};

///////////////////////////////////////////////////////////////////////////////

#endif

