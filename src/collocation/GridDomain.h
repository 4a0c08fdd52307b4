///////////////////////////////////////////////////////////////////////////////
///
///	\file    GridDomain.h
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

#ifndef _GRIDDOMAIN_H_
#define _GRIDDOMAIN_H_

#include "DataArray2D.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A region identifier field on the grid with its name table.
///	</summary>
class GridRegionField {

public:
	///	<summary>
	///		Name of the field (e.g. GlobalOceansSeas).
	///	</summary>
	std::string m_strName;

	///	<summary>
	///		Region id of each cell.
	///	</summary>
	DataArray2D<double> m_data;

	///	<summary>
	///		Region names, indexed by region id.
	///	</summary>
	std::vector<std::string> m_vecNames;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Static description of a regular latitude-longitude model grid and
///		its auxiliary fields.  Latitudes are ascending and longitudes use
///		the [0,360) convention.  All auxiliary fields are [lat,lon].
///	</summary>
class GridDomain {

public:
	///	<summary>
	///		Mask value of a cell usable for matching.  Land is missing and
	///		excluded ocean is zero.
	///	</summary>
	static const double ValidOceanMaskValue;

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	GridDomain() { }

public:
	///	<summary>
	///		Set the coordinate axes.  Longitudes are translated to [0,360)
	///		and latitudes must be ascending.
	///	</summary>
	void SetCoordinates(
		const std::vector<double> & vecLat,
		const std::vector<double> & vecLon
	);

	///	<summary>
	///		Set the mask.
	///	</summary>
	void SetMask(const DataArray2D<double> & dataMask);

	///	<summary>
	///		Set the depth (m).
	///	</summary>
	void SetDepth(const DataArray2D<double> & dataDepth);

	///	<summary>
	///		Set the distance to coast (km).
	///	</summary>
	void SetDistanceToCoast(const DataArray2D<double> & dataDistCoast);

	///	<summary>
	///		Add a region id field.
	///	</summary>
	void AddRegionField(
		const std::string & strName,
		const DataArray2D<double> & dataIds,
		const std::vector<std::string> & vecNames
	);

	///	<summary>
	///		Verify that all fields have shape [lat,lon]; throws otherwise.
	///	</summary>
	void Validate() const;

public:
	///	<summary>
	///		Check whether coordinates have been set.
	///	</summary>
	bool IsInitialized() const {
		return ((m_vecLat.size() != 0) && (m_vecLon.size() != 0));
	}

	///	<summary>
	///		Latitudes (ascending).
	///	</summary>
	const std::vector<double> & GetLatitudes() const {
		return m_vecLat;
	}

	///	<summary>
	///		Longitudes ([0,360) convention).
	///	</summary>
	const std::vector<double> & GetLongitudes() const {
		return m_vecLon;
	}

	///	<summary>
	///		Check whether the given cell is valid ocean.  When no mask has
	///		been supplied every cell is valid.
	///	</summary>
	bool IsValidCell(
		size_t iLat,
		size_t iLon
	) const;

	///	<summary>
	///		Check whether depth and distance to coast are available.
	///	</summary>
	bool HasStaticFields() const {
		return (m_dataDepth.IsAttached() && m_dataDistCoast.IsAttached());
	}

	///	<summary>
	///		Depth at the given cell.
	///	</summary>
	double GetDepth(size_t iLat, size_t iLon) const {
		return m_dataDepth(iLat, iLon);
	}

	///	<summary>
	///		Distance to coast at the given cell.
	///	</summary>
	double GetDistanceToCoast(size_t iLat, size_t iLon) const {
		return m_dataDistCoast(iLat, iLon);
	}

	///	<summary>
	///		Number of region id fields.
	///	</summary>
	size_t GetRegionFieldCount() const {
		return m_vecRegionFields.size();
	}

	///	<summary>
	///		Region id field.
	///	</summary>
	const GridRegionField & GetRegionField(size_t ix) const {
		return m_vecRegionFields[ix];
	}

	///	<summary>
	///		Check whether another grid has exactly the same coordinates.
	///		The longitudes of the other grid are translated to [0,360)
	///		before comparison.
	///	</summary>
	bool MatchesGrid(
		const std::vector<double> & vecLat,
		const std::vector<double> & vecLon
	) const;

protected:
	///	<summary>
	///		Throw if the field does not have shape [lat,lon].
	///	</summary>
	void CheckShape(
		const DataArray2D<double> & data,
		const char * szName
	) const;

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
	///		Mask.
	///	</summary>
	DataArray2D<double> m_dataMask;

	///	<summary>
	///		Depth.
	///	</summary>
	DataArray2D<double> m_dataDepth;

	///	<summary>
	///		Distance to coast.
	///	</summary>
	DataArray2D<double> m_dataDistCoast;

	///	<summary>
	///		Region id fields.
	///	</summary>
	std::vector<GridRegionField> m_vecRegionFields;
};

///////////////////////////////////////////////////////////////////////////////

#endif

