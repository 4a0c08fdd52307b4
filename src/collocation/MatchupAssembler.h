///////////////////////////////////////////////////////////////////////////////
///
///	\file    MatchupAssembler.h
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

#ifndef _MATCHUPASSEMBLER_H_
#define _MATCHUPASSEMBLER_H_

#include "CollocationParameters.h"
#include "WaveSample.h"
#include "Observations.h"
#include "SeriesAggregator.h"
#include "NearestPointLocator.h"

#include <string>
#include <vector>

class GridDomain;
class CycloneRaster;

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		One matched pair of model and observation values.
///	</summary>
struct MatchupRecord {
	MatchupRecord() :
		dTime(MissingValue),
		dCycleTime(MissingValue),
		iMonth(0),
		dLat(MissingValue),
		dLon(MissingValue),
		sSource(0),
		dDepth(MissingValue),
		dDistCoast(MissingValue),
		dCyclone(MissingValue)
	{ }

	///	<summary>
	///		Time of the model step (s since epoch).
	///	</summary>
	double dTime;

	///	<summary>
	///		Reference time of the forecast cycle, or missing.
	///	</summary>
	double dCycleTime;

	///	<summary>
	///		Calendar month of dTime (1-12).
	///	</summary>
	int iMonth;

	///	<summary>
	///		Position.  Longitude uses the signed [-180,180) convention.
	///	</summary>
	double dLat;
	double dLon;

	///	<summary>
	///		Resolved grid cell.
	///	</summary>
	GridIndex ixGrid;

	///	<summary>
	///		Index of the station or mission in MatchupSet::m_vecSourceNames.
	///	</summary>
	size_t sSource;

	///	<summary>
	///		Model values.
	///	</summary>
	WaveSample model;

	///	<summary>
	///		Observed values.
	///	</summary>
	WaveSample obs;

	///	<summary>
	///		Static attributes.
	///	</summary>
	double dDepth;
	double dDistCoast;
	std::vector<double> vecRegionIds;

	///	<summary>
	///		Cyclone code, or missing.
	///	</summary>
	double dCyclone;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		The matchups of one run, with the metadata needed to persist them.
///	</summary>
class MatchupSet {

public:
	///	<summary>
	///		Kind of observations.
	///	</summary>
	enum SourceType {
		SourceType_Buoy,
		SourceType_Satellite
	};

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	MatchupSet(
		SourceType eSourceType = SourceType_Buoy
	) :
		m_eSourceType(eSourceType),
		m_fForecast(false),
		m_fHasStatic(false),
		m_fHasCyclone(false)
	{ }

public:
	///	<summary>
	///		Stable sort of the records by time, cycle time and source.
	///	</summary>
	void SortRecords();

	///	<summary>
	///		Number of records.
	///	</summary>
	size_t size() const {
		return m_vecRecords.size();
	}

	///	<summary>
	///		Earliest record time.
	///	</summary>
	double GetMinTime() const;

	///	<summary>
	///		Latest record time.
	///	</summary>
	double GetMaxTime() const;

	///	<summary>
	///		Output file name WW3.<Buoy|Altimeter><tag>_<first>to<last>.nc.
	///	</summary>
	std::string GetOutputFilename(
		const std::string & strTag
	) const;

public:
	SourceType m_eSourceType;

	///	<summary>
	///		Station names (buoy) or mission names (satellite).
	///	</summary>
	std::vector<std::string> m_vecSourceNames;

	///	<summary>
	///		Records carry cycle times.
	///	</summary>
	bool m_fForecast;

	///	<summary>
	///		Records carry depth, distance to coast and region ids.
	///	</summary>
	bool m_fHasStatic;

	///	<summary>
	///		Records carry cyclone codes.
	///	</summary>
	bool m_fHasCyclone;

	///	<summary>
	///		Region field names and name tables, parallel to
	///		MatchupRecord::vecRegionIds.
	///	</summary>
	std::vector<std::string> m_vecRegionFieldNames;
	std::vector< std::vector<std::string> > m_vecRegionNameTables;

	///	<summary>
	///		Cyclone legend.
	///	</summary>
	std::vector<std::string> m_vecCycloneLegend;

	///	<summary>
	///		Records.
	///	</summary>
	std::vector<MatchupRecord> m_vecRecords;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Buoy observations resampled onto the model steps of one station.
///	</summary>
struct ResampledBuoy {
	ResampledBuoy() :
		sStation(0),
		dLat(MissingValue),
		dLon(MissingValue)
	{ }

	///	<summary>
	///		Index of the station in ModelPointSeries::m_vecStations.
	///	</summary>
	size_t sStation;

	///	<summary>
	///		Buoy position.
	///	</summary>
	double dLat;
	double dLon;

	///	<summary>
	///		Observations, parallel to ModelPointSeries::m_vecSteps.
	///	</summary>
	std::vector<WaveSample> vecObs;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Combines model series, observations and auxiliary fields into
///		matchup records.  A record is emitted only if the model and
///		observed wave heights (and, for altimeters, wind speeds) are present
///		after quality control, the grid cell is valid ocean and, when static
///		attributes are joined, depth and distance to coast are present.
///	</summary>
class MatchupAssembler {

public:
	///	<summary>
	///		Constructor.  pgrid and pcyclone may be NULL; static and cyclone
	///		attributes are joined only when requested and available.
	///	</summary>
	MatchupAssembler(
		const CollocationParameters & param,
		const GridDomain * pgrid,
		const CycloneRaster * pcyclone
	);

public:
	///	<summary>
	///		Assemble buoy matchups.
	///	</summary>
	void AssembleBuoy(
		const ModelPointSeries & series,
		const std::vector<ResampledBuoy> & vecBuoys,
		MatchupSet & matchups
	) const;

	///	<summary>
	///		Assemble altimeter matchups.  A grid is required.
	///	</summary>
	void AssembleSatellite(
		const ModelFieldSeries & series,
		ModelFieldFileReader & reader,
		const std::vector<SatelliteSample> & vecSamples,
		MatchupSet & matchups
	) const;

	///	<summary>
	///		Sort the records and announce the summary.  Throws if there are
	///		no records.
	///	</summary>
	void Finalize(
		MatchupSet & matchups
	) const;

protected:
	///	<summary>
	///		Initialize the metadata of a MatchupSet.
	///	</summary>
	void InitializeSet(
		MatchupSet & matchups
	) const;

	///	<summary>
	///		Check the grid cell and fill in the static attributes.
	///	</summary>
	///	<returns>
	///		false if the cell is excluded.
	///	</returns>
	bool JoinGridAttributes(
		const GridIndex & ix,
		MatchupRecord & record
	) const;

	///	<summary>
	///		Slice of the cyclone raster for each time, or -1 where there is
	///		none.  A warning is announced for each time without a slice.
	///	</summary>
	void FindCycloneSlices(
		const std::vector<double> & vecTimes,
		std::vector<long> & vecSlices
	) const;

protected:
	CollocationParameters m_param;
	const GridDomain * m_pgrid;
	const CycloneRaster * m_pcyclone;
	bool m_fJoinStatic;
	bool m_fJoinCyclone;
};

///////////////////////////////////////////////////////////////////////////////

#endif

