///////////////////////////////////////////////////////////////////////////////
///
///	\file    GridDomain.cpp
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

#include "GridDomain.h"
#include "CoordTransforms.h"
#include "Exception.h"

///////////////////////////////////////////////////////////////////////////////

const double GridDomain::ValidOceanMaskValue = 1.0;

///////////////////////////////////////////////////////////////////////////////

void GridDomain::SetCoordinates(
	const std::vector<double> & vecLat,
	const std::vector<double> & vecLon
) {
	if ((vecLat.size() == 0) || (vecLon.size() == 0)) {
		_EXCEPTIONT("Grid coordinates must be non-empty");
	}
	for (size_t j = 1; j < vecLat.size(); j++) {
		if (vecLat[j] <= vecLat[j-1]) {
			_EXCEPTION1("Grid latitudes must be strictly ascending (index %lu)", j);
		}
	}

	m_vecLat = vecLat;
	m_vecLon.resize(vecLon.size());
	for (size_t i = 0; i < vecLon.size(); i++) {
		m_vecLon[i] = LonDegToGridRange(vecLon[i]);
	}
}

///////////////////////////////////////////////////////////////////////////////

void GridDomain::CheckShape(
	const DataArray2D<double> & data,
	const char * szName
) const {
	if ((data.GetRows() != m_vecLat.size()) ||
	    (data.GetColumns() != m_vecLon.size())
	) {
		_EXCEPTION5("Grid field \"%s\" has shape [%lu,%lu] (expected [%lu,%lu])",
			szName, data.GetRows(), data.GetColumns(),
			m_vecLat.size(), m_vecLon.size());
	}
}

///////////////////////////////////////////////////////////////////////////////

void GridDomain::SetMask(const DataArray2D<double> & dataMask) {
	CheckShape(dataMask, "mask");
	m_dataMask = dataMask;
}

///////////////////////////////////////////////////////////////////////////////

void GridDomain::SetDepth(const DataArray2D<double> & dataDepth) {
	CheckShape(dataDepth, "depth");
	m_dataDepth = dataDepth;
}

///////////////////////////////////////////////////////////////////////////////

void GridDomain::SetDistanceToCoast(const DataArray2D<double> & dataDistCoast) {
	CheckShape(dataDistCoast, "distcoast");
	m_dataDistCoast = dataDistCoast;
}

///////////////////////////////////////////////////////////////////////////////

void GridDomain::AddRegionField(
	const std::string & strName,
	const DataArray2D<double> & dataIds,
	const std::vector<std::string> & vecNames
) {
	CheckShape(dataIds, strName.c_str());

	m_vecRegionFields.push_back(GridRegionField());
	GridRegionField & field = m_vecRegionFields.back();
	field.m_strName = strName;
	field.m_data = dataIds;
	field.m_vecNames = vecNames;
}

///////////////////////////////////////////////////////////////////////////////

void GridDomain::Validate() const {
	if (!IsInitialized()) {
		_EXCEPTIONT("Grid coordinates have not been set");
	}
	if (m_dataMask.IsAttached()) {
		CheckShape(m_dataMask, "mask");
	}
	if (m_dataDepth.IsAttached()) {
		CheckShape(m_dataDepth, "depth");
	}
	if (m_dataDistCoast.IsAttached()) {
		CheckShape(m_dataDistCoast, "distcoast");
	}
	for (size_t r = 0; r < m_vecRegionFields.size(); r++) {
		CheckShape(m_vecRegionFields[r].m_data,
			m_vecRegionFields[r].m_strName.c_str());
	}
}

///////////////////////////////////////////////////////////////////////////////

bool GridDomain::IsValidCell(
	size_t iLat,
	size_t iLon
) const {
	if (!m_dataMask.IsAttached()) {
		return true;
	}
	return (m_dataMask(iLat, iLon) == ValidOceanMaskValue);
}

///////////////////////////////////////////////////////////////////////////////

bool GridDomain::MatchesGrid(
	const std::vector<double> & vecLat,
	const std::vector<double> & vecLon
) const {
	if ((vecLat.size() != m_vecLat.size()) ||
	    (vecLon.size() != m_vecLon.size())
	) {
		return false;
	}
	for (size_t j = 0; j < vecLat.size(); j++) {
		if (vecLat[j] != m_vecLat[j]) {
			return false;
		}
	}
	for (size_t i = 0; i < vecLon.size(); i++) {
		if (LonDegToGridRange(vecLon[i]) != m_vecLon[i]) {
			return false;
		}
	}
	return true;
}

///////////////////////////////////////////////////////////////////////////////

