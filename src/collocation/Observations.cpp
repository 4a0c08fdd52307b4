///////////////////////////////////////////////////////////////////////////////
///
///	\file    Observations.cpp
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

#include "Observations.h"
#include "QualityControlFilter.h"
#include "TemporalAligner.h"
#include "TimeObj.h"
#include "Announce.h"
#include "Exception.h"

#include <set>

///////////////////////////////////////////////////////////////////////////////

static const char * SatelliteMissionNames[SatelliteMission_Count] = {
	"JASON3",
	"JASON2",
	"CRYOSAT2",
	"JASON1",
	"HY2",
	"SARAL",
	"SENTINEL3A",
	"ENVISAT",
	"ERS1",
	"ERS2",
	"GEOSAT",
	"GFO",
	"TOPEX",
	"SENTINEL3B"
};

///////////////////////////////////////////////////////////////////////////////

void GetSatelliteMissionNames(
	std::vector<std::string> & vecNames
) {
	vecNames.clear();
	for (int m = 0; m < SatelliteMission_Count; m++) {
		vecNames.push_back(SatelliteMissionNames[m]);
	}
}

///////////////////////////////////////////////////////////////////////////////

std::string SatelliteMissionName(
	SatelliteMission eMission
) {
	if ((eMission < 0) || (eMission >= SatelliteMission_Count)) {
		_EXCEPTION1("Invalid satellite mission %i", static_cast<int>(eMission));
	}
	return std::string(SatelliteMissionNames[eMission]);
}

///////////////////////////////////////////////////////////////////////////////

SatelliteMission SatelliteMissionFromFilename(
	const std::string & strFilename
) {
	std::string strBase = strFilename;
	size_t sSlash = strBase.rfind('/');
	if (sSlash != std::string::npos) {
		strBase = strBase.substr(sSlash + 1);
	}

	size_t sUnderscore = strBase.find('_');
	if (sUnderscore == std::string::npos) {
		_EXCEPTION1("Problem identifying satellite mission from file name \"%s\"",
			strFilename.c_str());
	}

	std::string strMission = strBase.substr(sUnderscore + 1);
	size_t sDot = strMission.find('.');
	if (sDot != std::string::npos) {
		strMission = strMission.substr(0, sDot);
	}

	for (int m = 0; m < SatelliteMission_Count; m++) {
		if (strMission == SatelliteMissionNames[m]) {
			return static_cast<SatelliteMission>(m);
		}
	}

	_EXCEPTION2("Unknown satellite mission \"%s\" in file name \"%s\"",
		strMission.c_str(), strFilename.c_str());
}

///////////////////////////////////////////////////////////////////////////////

bool SatelliteTimesOverlapModel(
	const std::vector<double> & vecSatTimes,
	double dModelMinTime,
	double dModelMaxTime
) {
	bool fAnyTime = false;
	double dSatMinTime = 0.0;
	double dSatMaxTime = 0.0;
	for (size_t i = 0; i < vecSatTimes.size(); i++) {
		if (IsMissing(vecSatTimes[i])) {
			continue;
		}
		if (!fAnyTime) {
			dSatMinTime = vecSatTimes[i];
			dSatMaxTime = vecSatTimes[i];
			fAnyTime = true;
		} else if (vecSatTimes[i] < dSatMinTime) {
			dSatMinTime = vecSatTimes[i];
		} else if (vecSatTimes[i] > dSatMaxTime) {
			dSatMaxTime = vecSatTimes[i];
		}
	}
	if (!fAnyTime) {
		return false;
	}
	if ((dSatMinTime >= dModelMaxTime) || (dSatMaxTime < dModelMinTime)) {
		return false;
	}
	return true;
}

///////////////////////////////////////////////////////////////////////////////

void SelectSatelliteSamplesInWindow(
	std::vector<SatelliteSample> & vecSamples,
	double dModelMinTime,
	double dModelMaxTime,
	double dMargin
) {
	std::vector<SatelliteSample> vecSelected;
	for (size_t i = 0; i < vecSamples.size(); i++) {
		double dTime = vecSamples[i].dTime;
		if (IsMissing(dTime)) {
			continue;
		}
		if ((dTime >= dModelMinTime - dMargin) &&
		    (dTime <= dModelMaxTime + dMargin)
		) {
			vecSelected.push_back(vecSamples[i]);
		}
	}
	if (vecSelected.size() == 0) {
		_EXCEPTIONT("Insufficient amount of matchups model/satellite: "
			"no satellite samples within the model time window");
	}
	vecSamples.swap(vecSelected);
}

///////////////////////////////////////////////////////////////////////////////

void BuoySourceChain::AddSource(
	BuoyObservationSource * pSource
) {
	if (pSource == NULL) {
		_EXCEPTIONT("Invalid buoy observation source");
	}
	m_vecSources.push_back(pSource);
}

///////////////////////////////////////////////////////////////////////////////

bool BuoySourceChain::Load(
	const std::string & strStation,
	const std::vector<int> & vecYears,
	BuoyObservationSeries & series
) const {
	for (size_t s = 0; s < m_vecSources.size(); s++) {
		series.Clear();
		if (m_vecSources[s]->Load(strStation, vecYears, series)) {
			series.strSource = m_vecSources[s]->GetName();
			return true;
		}
		Announce(1, "WARNING: Station %s not available from %s",
			strStation.c_str(), m_vecSources[s]->GetName().c_str());
	}
	series.Clear();
	return false;
}

///////////////////////////////////////////////////////////////////////////////

void YearsSpannedByTimes(
	const std::vector<double> & vecTimes,
	std::vector<int> & vecYears
) {
	vecYears.clear();

	bool fAnyTime = false;
	double dMinTime = 0.0;
	double dMaxTime = 0.0;
	for (size_t i = 0; i < vecTimes.size(); i++) {
		if (IsMissing(vecTimes[i])) {
			continue;
		}
		if ((!fAnyTime) || (vecTimes[i] < dMinTime)) {
			dMinTime = vecTimes[i];
		}
		if ((!fAnyTime) || (vecTimes[i] > dMaxTime)) {
			dMaxTime = vecTimes[i];
		}
		fAnyTime = true;
	}
	if (!fAnyTime) {
		return;
	}

	Time timeMin;
	timeMin.FromEpochSeconds(dMinTime);
	Time timeMax;
	timeMax.FromEpochSeconds(dMaxTime);

	for (int iYear = timeMin.GetYear(); iYear <= timeMax.GetYear(); iYear++) {
		vecYears.push_back(iYear);
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Running mean of the non-missing values of one field.
///	</summary>
class MissingAwareMean {
public:
	MissingAwareMean() :
		m_dSum(0.0),
		m_nCount(0)
	{ }

	void Add(double dValue) {
		if (!IsMissing(dValue)) {
			m_dSum += dValue;
			m_nCount++;
		}
	}

	double Get() const {
		if (m_nCount == 0) {
			return MissingValue;
		}
		return m_dSum / static_cast<double>(m_nCount);
	}

protected:
	double m_dSum;
	int m_nCount;
};

///////////////////////////////////////////////////////////////////////////////

void ResampleBuoyOntoTimes(
	const BuoyObservationSeries & series,
	const std::vector<double> & vecTargetTimes,
	double dTolerance,
	std::vector<WaveSample> & vecResampled
) {
	if (series.vecTime.size() != series.vecSamples.size()) {
		_EXCEPTION2("Buoy series has %lu times but %lu samples",
			series.vecTime.size(), series.vecSamples.size());
	}

	vecResampled.clear();
	vecResampled.resize(vecTargetTimes.size());

	std::vector<WaveSample> vecChecked = series.vecSamples;
	QualityControlFilter qc(QualityControlFilter::Context_Buoy);
	qc.Apply(vecChecked);

	std::vector<TimeIndexPair> vecPairs;
	TemporalAligner::Align(vecTargetTimes, series.vecTime, dTolerance, vecPairs);

	size_t p = 0;
	while (p < vecPairs.size()) {
		size_t ixTarget = vecPairs[p].ixA;

		MissingAwareMean meanHs;
		MissingAwareMean meanTm;
		MissingAwareMean meanDm;
		for (; (p < vecPairs.size()) && (vecPairs[p].ixA == ixTarget); p++) {
			const WaveSample & sample = vecChecked[vecPairs[p].ixB];
			meanHs.Add(sample.dHs);
			meanTm.Add(sample.dTm);
			meanDm.Add(sample.dDm);
		}

		vecResampled[ixTarget].dHs = meanHs.Get();
		vecResampled[ixTarget].dTm = meanTm.Get();
		vecResampled[ixTarget].dDm = meanDm.Get();
	}
}

///////////////////////////////////////////////////////////////////////////////

