///////////////////////////////////////////////////////////////////////////////
///
///	\file    CycloneRaster.cpp
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

#include "CycloneRaster.h"
#include "TemporalAligner.h"
#include "CoordTransforms.h"
#include "STLStringHelper.h"
#include "Defines.h"
#include "Exception.h"

///////////////////////////////////////////////////////////////////////////////
// CycloneRaster
///////////////////////////////////////////////////////////////////////////////

void CycloneRaster::SetCoordinates(
	const std::vector<double> & vecLat,
	const std::vector<double> & vecLon
) {
	if (m_vecSlices.size() != 0) {
		_EXCEPTIONT("Cyclone raster coordinates must be set before slices are added");
	}
	m_vecLat = vecLat;
	m_vecLon.resize(vecLon.size());
	for (size_t i = 0; i < vecLon.size(); i++) {
		m_vecLon[i] = LonDegToGridRange(vecLon[i]);
	}
}

///////////////////////////////////////////////////////////////////////////////

void CycloneRaster::AddSlice(
	double dTime,
	const DataArray2D<double> & dataCodes
) {
	if ((dataCodes.GetRows() != m_vecLat.size()) ||
	    (dataCodes.GetColumns() != m_vecLon.size())
	) {
		_EXCEPTION4("Cyclone slice has shape [%lu,%lu] (expected [%lu,%lu])",
			dataCodes.GetRows(), dataCodes.GetColumns(),
			m_vecLat.size(), m_vecLon.size());
	}
	m_vecTimes.push_back(dTime);
	m_vecSlices.push_back(dataCodes);
}

///////////////////////////////////////////////////////////////////////////////

void CycloneRaster::ParseLegend(
	const std::string & strInfo,
	std::vector<std::string> & vecLegend
) {
	vecLegend.clear();

	size_t sColon = strInfo.find(':');
	if (sColon == std::string::npos) {
		return;
	}

	STLStringHelper::Split(strInfo.substr(sColon + 1), ';', vecLegend);
	for (size_t i = 0; i < vecLegend.size(); i++) {
		STLStringHelper::RemoveWhitespaceInPlace(vecLegend[i]);
	}
}

///////////////////////////////////////////////////////////////////////////////
// CycloneRasterSampler
///////////////////////////////////////////////////////////////////////////////

bool CycloneRasterSampler::FindSlice(
	double dTime,
	size_t & ixSlice
) const {
	return TemporalAligner::FindClosestWithin(
		m_raster.GetTimes(), dTime, m_dTolerance, ixSlice);
}

///////////////////////////////////////////////////////////////////////////////

double CycloneRasterSampler::NormalizeCode(
	double dCode
) {
	if (IsMissing(dCode) || (dCode < 0.0)) {
		return MissingValue;
	}
	return dCode;
}

///////////////////////////////////////////////////////////////////////////////

double CycloneRasterSampler::SampleSlice(
	size_t ixSlice,
	size_t iLat,
	size_t iLon
) const {
	return NormalizeCode(m_raster.GetSlice(ixSlice)(iLat, iLon));
}

///////////////////////////////////////////////////////////////////////////////

double CycloneRasterSampler::Sample(
	double dTime,
	size_t iLat,
	size_t iLon
) const {
	size_t ixSlice;
	if (!FindSlice(dTime, ixSlice)) {
		return MissingValue;
	}
	return SampleSlice(ixSlice, iLat, iLon);
}

///////////////////////////////////////////////////////////////////////////////

