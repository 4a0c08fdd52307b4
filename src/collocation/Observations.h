///////////////////////////////////////////////////////////////////////////////
///
///	\file    Observations.h
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

#ifndef _OBSERVATIONS_H_
#define _OBSERVATIONS_H_

#include "WaveSample.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////
// Satellite altimeter tracks
///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Known altimeter missions.  The enumeration order is persisted as
///		the satellite id.
///	</summary>
enum SatelliteMission {
	SatelliteMission_JASON3,
	SatelliteMission_JASON2,
	SatelliteMission_CRYOSAT2,
	SatelliteMission_JASON1,
	SatelliteMission_HY2,
	SatelliteMission_SARAL,
	SatelliteMission_SENTINEL3A,
	SatelliteMission_ENVISAT,
	SatelliteMission_ERS1,
	SatelliteMission_ERS2,
	SatelliteMission_GEOSAT,
	SatelliteMission_GFO,
	SatelliteMission_TOPEX,
	SatelliteMission_SENTINEL3B,
	SatelliteMission_Count
};

///	<summary>
///		Names of all missions, in enumeration order.
///	</summary>
void GetSatelliteMissionNames(
	std::vector<std::string> & vecNames
);

///	<summary>
///		Name of a mission.
///	</summary>
std::string SatelliteMissionName(
	SatelliteMission eMission
);

///	<summary>
///		Mission of a gridded altimeter file named <prefix>_<MISSION>.<ext>.
///		Any directory part is ignored.  Throws if the mission is unknown.
///	</summary>
SatelliteMission SatelliteMissionFromFilename(
	const std::string & strFilename
);

///	<summary>
///		One altimeter observation.  Longitude uses the [0,360) convention.
///	</summary>
struct SatelliteSample {
	SatelliteSample() :
		dTime(MissingValue),
		dLat(MissingValue),
		dLon(MissingValue),
		eMission(SatelliteMission_JASON3)
	{ }

	double dTime;
	double dLat;
	double dLon;
	WaveSample sample;
	SatelliteMission eMission;
};

///	<summary>
///		Check whether a set of satellite times overlaps the model interval.
///		A file entirely at or after the last model time, or entirely before
///		the first, does not overlap.
///	</summary>
bool SatelliteTimesOverlapModel(
	const std::vector<double> & vecSatTimes,
	double dModelMinTime,
	double dModelMaxTime
);

///	<summary>
///		Retain the samples with time in [dModelMinTime - dMargin,
///		dModelMaxTime + dMargin].  Throws if none remain.
///	</summary>
void SelectSatelliteSamplesInWindow(
	std::vector<SatelliteSample> & vecSamples,
	double dModelMinTime,
	double dModelMaxTime,
	double dMargin
);

///////////////////////////////////////////////////////////////////////////////
// Moored buoys
///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Observed time series of one moored buoy.
///	</summary>
struct BuoyObservationSeries {
	BuoyObservationSeries() :
		dLat(MissingValue),
		dLon(MissingValue)
	{ }

	///	<summary>
	///		Remove all samples and reset the position.
	///	</summary>
	void Clear() {
		strSource = "";
		dLat = MissingValue;
		dLon = MissingValue;
		vecTime.clear();
		vecSamples.clear();
	}

	///	<summary>
	///		Name of the source the series was loaded from.
	///	</summary>
	std::string strSource;

	///	<summary>
	///		Position of the buoy.
	///	</summary>
	double dLat;
	double dLon;

	///	<summary>
	///		Sample times (s since epoch) and values.
	///	</summary>
	std::vector<double> vecTime;
	std::vector<WaveSample> vecSamples;
};

///	<summary>
///		A source of buoy observations.
///	</summary>
class BuoyObservationSource {

public:
	///	<summary>
	///		Virtual destructor.
	///	</summary>
	virtual ~BuoyObservationSource() { }

	///	<summary>
	///		Name of this source for diagnostics.
	///	</summary>
	virtual std::string GetName() const = 0;

	///	<summary>
	///		Load the observations of a station covering the given years.
	///	</summary>
	///	<returns>
	///		false if this source has no data for the station.
	///	</returns>
	virtual bool Load(
		const std::string & strStation,
		const std::vector<int> & vecYears,
		BuoyObservationSeries & series
	) = 0;
};

///	<summary>
///		An ordered list of buoy sources tried in turn.  Sources are not
///		owned by the chain.
///	</summary>
class BuoySourceChain {

public:
	///	<summary>
	///		Append a source to the end of the chain.
	///	</summary>
	void AddSource(
		BuoyObservationSource * pSource
	);

	///	<summary>
	///		Number of sources.
	///	</summary>
	size_t GetSourceCount() const {
		return m_vecSources.size();
	}

	///	<summary>
	///		Load a station from the first source that has it.
	///	</summary>
	///	<returns>
	///		false if no source has the station.
	///	</returns>
	bool Load(
		const std::string & strStation,
		const std::vector<int> & vecYears,
		BuoyObservationSeries & series
	) const;

protected:
	///	<summary>
	///		Sources in priority order.
	///	</summary>
	std::vector<BuoyObservationSource *> m_vecSources;
};

///	<summary>
///		Calendar years spanned by a set of times (s since epoch).
///	</summary>
void YearsSpannedByTimes(
	const std::vector<double> & vecTimes,
	std::vector<int> & vecYears
);

///	<summary>
///		Resample a buoy series onto target times.  Each sample is quality
///		controlled and each output field is the mean of the non-missing
///		values with |t_obs - t_target| < dTolerance, or missing.
///	</summary>
void ResampleBuoyOntoTimes(
	const BuoyObservationSeries & series,
	const std::vector<double> & vecTargetTimes,
	double dTolerance,
	std::vector<WaveSample> & vecResampled
);

///////////////////////////////////////////////////////////////////////////////

#endif

