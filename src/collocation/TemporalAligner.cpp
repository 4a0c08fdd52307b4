///////////////////////////////////////////////////////////////////////////////
///
///	\file    TemporalAligner.cpp
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

#include "TemporalAligner.h"
#include "Defines.h"

#include <algorithm>
#include <utility>
#include <set>
#include <cmath>

///////////////////////////////////////////////////////////////////////////////

typedef std::pair<double, size_t> TimeAndIndex;

///	<summary>
///		Non-missing times of a sequence with their indices, sorted by time
///		and then by index.
///	</summary>
static void SortedNonMissingTimes(
	const std::vector<double> & vecTimes,
	std::vector<TimeAndIndex> & vecSorted
) {
	vecSorted.clear();
	vecSorted.reserve(vecTimes.size());
	for (size_t i = 0; i < vecTimes.size(); i++) {
		if (!IsMissing(vecTimes[i])) {
			vecSorted.push_back(TimeAndIndex(vecTimes[i], i));
		}
	}
	std::sort(vecSorted.begin(), vecSorted.end());
}

///////////////////////////////////////////////////////////////////////////////

void TemporalAligner::Align(
	const std::vector<double> & vecTimesA,
	const std::vector<double> & vecTimesB,
	double dTolerance,
	std::vector<TimeIndexPair> & vecPairs
) {
	vecPairs.clear();

	std::vector<TimeAndIndex> vecSortedB;
	SortedNonMissingTimes(vecTimesB, vecSortedB);

	std::vector<size_t> vecMatchB;
	for (size_t a = 0; a < vecTimesA.size(); a++) {
		double dTimeA = vecTimesA[a];
		if (IsMissing(dTimeA)) {
			continue;
		}

		std::vector<TimeAndIndex>::const_iterator iter =
			std::lower_bound(
				vecSortedB.begin(),
				vecSortedB.end(),
				TimeAndIndex(dTimeA - dTolerance, 0));

		vecMatchB.clear();
		for (; iter != vecSortedB.end(); iter++) {
			if (iter->first >= dTimeA + dTolerance) {
				break;
			}
			if (fabs(iter->first - dTimeA) < dTolerance) {
				vecMatchB.push_back(iter->second);
			}
		}

		std::sort(vecMatchB.begin(), vecMatchB.end());
		for (size_t m = 0; m < vecMatchB.size(); m++) {
			vecPairs.push_back(TimeIndexPair(a, vecMatchB[m]));
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void TemporalAligner::IntersectExact(
	const std::vector<double> & vecTimesA,
	const std::vector<double> & vecTimesB,
	std::vector<TimeIndexPair> & vecPairs
) {
	vecPairs.clear();

	std::vector<TimeAndIndex> vecSortedB;
	SortedNonMissingTimes(vecTimesB, vecSortedB);

	std::set<double> setMatchedTimes;
	for (size_t a = 0; a < vecTimesA.size(); a++) {
		double dTimeA = vecTimesA[a];
		if (IsMissing(dTimeA)) {
			continue;
		}
		if (setMatchedTimes.find(dTimeA) != setMatchedTimes.end()) {
			continue;
		}

		std::vector<TimeAndIndex>::const_iterator iter =
			std::lower_bound(
				vecSortedB.begin(),
				vecSortedB.end(),
				TimeAndIndex(dTimeA, 0));

		if ((iter != vecSortedB.end()) && (iter->first == dTimeA)) {
			vecPairs.push_back(TimeIndexPair(a, iter->second));
			setMatchedTimes.insert(dTimeA);
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

bool TemporalAligner::FindClosestWithin(
	const std::vector<double> & vecTimes,
	double dTime,
	double dTolerance,
	size_t & ixFound
) {
	if (IsMissing(dTime)) {
		return false;
	}

	bool fFound = false;
	double dBestDist = dTolerance;
	for (size_t i = 0; i < vecTimes.size(); i++) {
		if (IsMissing(vecTimes[i])) {
			continue;
		}
		double dDist = fabs(vecTimes[i] - dTime);
		if (dDist < dBestDist) {
			dBestDist = dDist;
			ixFound = i;
			fFound = true;
		}
	}
	return fFound;
}

///////////////////////////////////////////////////////////////////////////////

