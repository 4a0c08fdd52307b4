///////////////////////////////////////////////////////////////////////////////
///
///	\file    NearestPointLocator.cpp
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

#include "NearestPointLocator.h"
#include "GridDomain.h"
#include "CoordTransforms.h"
#include "Exception.h"

#include <cmath>

///////////////////////////////////////////////////////////////////////////////

NearestPointLocator::NearestPointLocator(
	const std::vector<double> & vecLat,
	const std::vector<double> & vecLon
) :
	m_vecLat(vecLat),
	m_vecLon(vecLon)
{
	if ((m_vecLat.size() == 0) || (m_vecLon.size() == 0)) {
		_EXCEPTIONT("NearestPointLocator requires non-empty coordinate axes");
	}
}

///////////////////////////////////////////////////////////////////////////////

NearestPointLocator::NearestPointLocator(
	const GridDomain & grid
) :
	m_vecLat(grid.GetLatitudes()),
	m_vecLon(grid.GetLongitudes())
{
	if ((m_vecLat.size() == 0) || (m_vecLon.size() == 0)) {
		_EXCEPTIONT("NearestPointLocator requires non-empty coordinate axes");
	}
}

///////////////////////////////////////////////////////////////////////////////

size_t NearestPointLocator::NearestIndex(
	const std::vector<double> & vecAxis,
	double dValue
) {
	size_t ixBest = 0;
	double dBestDist = fabs(vecAxis[0] - dValue);
	for (size_t i = 1; i < vecAxis.size(); i++) {
		double dDist = fabs(vecAxis[i] - dValue);
		if (dDist < dBestDist) {
			dBestDist = dDist;
			ixBest = i;
		}
	}
	return ixBest;
}

///////////////////////////////////////////////////////////////////////////////

GridIndex NearestPointLocator::Locate(
	double dLat,
	double dLon
) const {
	return GridIndex(
		NearestIndex(m_vecLat, dLat),
		NearestIndex(m_vecLon, LonDegToGridRange(dLon)));
}

///////////////////////////////////////////////////////////////////////////////

