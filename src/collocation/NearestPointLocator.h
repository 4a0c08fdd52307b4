///////////////////////////////////////////////////////////////////////////////
///
///	\file    NearestPointLocator.h
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

#ifndef _NEARESTPOINTLOCATOR_H_
#define _NEARESTPOINTLOCATOR_H_

#include <vector>
#include <cstddef>

class GridDomain;

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A (latitude, longitude) index pair into a GridDomain.
///	</summary>
struct GridIndex {
	GridIndex() :
		iLat(0),
		iLon(0)
	{ }

	GridIndex(size_t a_iLat, size_t a_iLon) :
		iLat(a_iLat),
		iLon(a_iLon)
	{ }

	size_t iLat;
	size_t iLon;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Locates the grid node closest to a query position.
///	</summary>
///	<remarks>
///		The latitude and longitude indices are chosen independently, each
///		minimizing the absolute coordinate difference on its own axis.  This
///		is exact for regular latitude-longitude grids away from the poles but
///		is not a geodesic nearest neighbour, and it does not wrap across the
///		0/360 seam.  Ties resolve to the lowest index.
///	</remarks>
class NearestPointLocator {

public:
	///	<summary>
	///		Constructor from coordinate axes (longitudes in [0,360)).
	///	</summary>
	NearestPointLocator(
		const std::vector<double> & vecLat,
		const std::vector<double> & vecLon
	);

	///	<summary>
	///		Constructor from a GridDomain.
	///	</summary>
	explicit NearestPointLocator(
		const GridDomain & grid
	);

public:
	///	<summary>
	///		Locate the grid node nearest to (dLat, dLon).  The longitude may
	///		be given in either convention.
	///	</summary>
	GridIndex Locate(
		double dLat,
		double dLon
	) const;

	///	<summary>
	///		Index of the axis value closest to dValue (first on ties).
	///	</summary>
	static size_t NearestIndex(
		const std::vector<double> & vecAxis,
		double dValue
	);

protected:
	///	<summary>
	///		Latitude axis.
	///	</summary>
	std::vector<double> m_vecLat;

	///	<summary>
	///		Longitude axis.
	///	</summary>
	std::vector<double> m_vecLon;
};

///////////////////////////////////////////////////////////////////////////////

#endif

