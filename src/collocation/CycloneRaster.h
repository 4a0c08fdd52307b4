///////////////////////////////////////////////////////////////////////////////
///
///	\file    CycloneRaster.h
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

#ifndef _CYCLONERASTER_H_
#define _CYCLONERASTER_H_

#include "DataArray2D.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A time-indexed sequence of storm presence grids on the model grid.
///		Negative codes mean no storm.
///	</summary>
class CycloneRaster {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	CycloneRaster() { }

public:
	///	<summary>
	///		Set the coordinate axes (longitudes translated to [0,360)).
	///	</summary>
	void SetCoordinates(
		const std::vector<double> & vecLat,
		const std::vector<double> & vecLon
	);

	///	<summary>
	///		Append a slice.  The slice must have shape [lat,lon].
	///	</summary>
	void AddSlice(
		double dTime,
		const DataArray2D<double> & dataCodes
	);

	///	<summary>
	///		Set the legend describing the codes.
	///	</summary>
	void SetLegend(
		const std::vector<std::string> & vecLegend
	) {
		m_vecLegend = vecLegend;
	}

	///	<summary>
	///		Parse a legend from the "info" text: the part after the first
	///		':' split on ';'.  Entries are trimmed.
	///	</summary>
	static void ParseLegend(
		const std::string & strInfo,
		std::vector<std::string> & vecLegend
	);

public:
	const std::vector<double> & GetLatitudes() const {
		return m_vecLat;
	}

	const std::vector<double> & GetLongitudes() const {
		return m_vecLon;
	}

	const std::vector<double> & GetTimes() const {
		return m_vecTimes;
	}

	const std::vector<std::string> & GetLegend() const {
		return m_vecLegend;
	}

	size_t GetSliceCount() const {
		return m_vecSlices.size();
	}

	const DataArray2D<double> & GetSlice(size_t ix) const {
		return m_vecSlices[ix];
	}

protected:
	///	<summary>
	///		Latitudes.
	///	</summary>
	std::vector<double> m_vecLat;

	///	<summary>
	///		Longitudes.
	///	</summary>
	std::vector<double> m_vecLon;

	///	<summary>
	///		Time of each slice (s since epoch).
	///	</summary>
	std::vector<double> m_vecTimes;

	///	<summary>
	///		Storm codes of each slice.
	///	</summary>
	std::vector< DataArray2D<double> > m_vecSlices;

	///	<summary>
	///		Legend.
	///	</summary>
	std::vector<std::string> m_vecLegend;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Samples a CycloneRaster at model timesteps.
///	</summary>
class CycloneRasterSampler {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	CycloneRasterSampler(
		const CycloneRaster & raster,
		double dTolerance
	) :
		m_raster(raster),
		m_dTolerance(dTolerance)
	{ }

public:
	///	<summary>
	///		Find the slice closest in time to dTime, within tolerance.
	///	</summary>
	///	<returns>
	///		false if no slice is within tolerance.
	///	</returns>
	bool FindSlice(
		double dTime,
		size_t & ixSlice
	) const;

	///	<summary>
	///		Code of a slice at a grid cell, with negative codes mapped to
	///		MissingValue.
	///	</summary>
	double SampleSlice(
		size_t ixSlice,
		size_t iLat,
		size_t iLon
	) const;

	///	<summary>
	///		Code at a time and grid cell, or MissingValue when no slice is
	///		within tolerance.
	///	</summary>
	double Sample(
		double dTime,
		size_t iLat,
		size_t iLon
	) const;

	///	<summary>
	///		Map negative codes to MissingValue.
	///	</summary>
	static double NormalizeCode(
		double dCode
	);

protected:
	///	<summary>
	///		Raster.
	///	</summary>
	const CycloneRaster & m_raster;

	///	<summary>
	///		Time tolerance (s).
	///	</summary>
	double m_dTolerance;
};

///////////////////////////////////////////////////////////////////////////////

#endif

