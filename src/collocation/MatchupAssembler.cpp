///////////////////////////////////////////////////////////////////////////////
///
///	\file    MatchupAssembler.cpp
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

#include "MatchupAssembler.h"
#include "GridDomain.h"
#include "CycloneRaster.h"
#include "QualityControlFilter.h"
#include "TemporalAligner.h"
#include "CoordTransforms.h"
#include "TimeObj.h"
#include "Announce.h"
#include "Exception.h"

#include <algorithm>

///////////////////////////////////////////////////////////////////////////////
// MatchupSet
///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Record order: time, then cycle time (missing first), then source.
///	</summary>
static bool MatchupRecordLess(
	const MatchupRecord & a,
	const MatchupRecord & b
) {
	if (a.dTime != b.dTime) {
		return (a.dTime < b.dTime);
	}

	bool fMissingA = IsMissing(a.dCycleTime);
	bool fMissingB = IsMissing(b.dCycleTime);
	if (fMissingA != fMissingB) {
		return fMissingA;
	}
	if ((!fMissingA) && (a.dCycleTime != b.dCycleTime)) {
		return (a.dCycleTime < b.dCycleTime);
	}

	return (a.sSource < b.sSource);
}

///////////////////////////////////////////////////////////////////////////////

void MatchupSet::SortRecords() {
	std::stable_sort(m_vecRecords.begin(), m_vecRecords.end(), MatchupRecordLess);
}

///////////////////////////////////////////////////////////////////////////////

double MatchupSet::GetMinTime() const {
	if (m_vecRecords.size() == 0) {
		_EXCEPTIONT("MatchupSet is empty");
	}
	double dMinTime = m_vecRecords[0].dTime;
	for (size_t r = 1; r < m_vecRecords.size(); r++) {
		if (m_vecRecords[r].dTime < dMinTime) {
			dMinTime = m_vecRecords[r].dTime;
		}
	}
	return dMinTime;
}

///////////////////////////////////////////////////////////////////////////////

double MatchupSet::GetMaxTime() const {
	if (m_vecRecords.size() == 0) {
		_EXCEPTIONT("MatchupSet is empty");
	}
	double dMaxTime = m_vecRecords[0].dTime;
	for (size_t r = 1; r < m_vecRecords.size(); r++) {
		if (m_vecRecords[r].dTime > dMaxTime) {
			dMaxTime = m_vecRecords[r].dTime;
		}
	}
	return dMaxTime;
}

///////////////////////////////////////////////////////////////////////////////

std::string MatchupSet::GetOutputFilename(
	const std::string & strTag
) const {
	std::string strKind =
		(m_eSourceType == SourceType_Satellite)?("Altimeter"):("Buoy");

	return std::string("WW3.") + strKind + strTag + "_"
		+ EpochSecondsToDateHourString(GetMinTime()) + "to"
		+ EpochSecondsToDateHourString(GetMaxTime()) + ".nc";
}

///////////////////////////////////////////////////////////////////////////////
// MatchupAssembler
///////////////////////////////////////////////////////////////////////////////

MatchupAssembler::MatchupAssembler(
	const CollocationParameters & param,
	const GridDomain * pgrid,
	const CycloneRaster * pcyclone
) :
	m_param(param),
	m_pgrid(pgrid),
	m_pcyclone(pcyclone),
	m_fJoinStatic(false),
	m_fJoinCyclone(false)
{
	if (m_pgrid != NULL) {
		m_pgrid->Validate();
		m_fJoinStatic = (m_param.fJoinStatic && m_pgrid->HasStaticFields());
	}

	// Cyclone codes are sampled at grid indices
	if ((m_pcyclone != NULL) && m_param.fJoinCyclone) {
		if (m_pgrid == NULL) {
			_EXCEPTIONT("Cyclone attributes require a GridDomain");
		}
		if (!m_pgrid->MatchesGrid(
				m_pcyclone->GetLatitudes(),
				m_pcyclone->GetLongitudes())
		) {
			_EXCEPTIONT("Cyclone grid and GridDomain grid are different");
		}
		m_fJoinCyclone = true;
	}
}

///////////////////////////////////////////////////////////////////////////////

void MatchupAssembler::InitializeSet(
	MatchupSet & matchups
) const {
	matchups.m_vecRecords.clear();
	matchups.m_vecSourceNames.clear();
	matchups.m_fForecast = m_param.fForecast;
	matchups.m_fHasStatic = m_fJoinStatic;
	matchups.m_fHasCyclone = m_fJoinCyclone;

	matchups.m_vecRegionFieldNames.clear();
	matchups.m_vecRegionNameTables.clear();
	if (m_fJoinStatic) {
		for (size_t r = 0; r < m_pgrid->GetRegionFieldCount(); r++) {
			const GridRegionField & field = m_pgrid->GetRegionField(r);
			matchups.m_vecRegionFieldNames.push_back(field.m_strName);
			matchups.m_vecRegionNameTables.push_back(field.m_vecNames);
		}
	}

	matchups.m_vecCycloneLegend.clear();
	if (m_fJoinCyclone) {
		matchups.m_vecCycloneLegend = m_pcyclone->GetLegend();
	}
}

///////////////////////////////////////////////////////////////////////////////

bool MatchupAssembler::JoinGridAttributes(
	const GridIndex & ix,
	MatchupRecord & record
) const {
	record.ixGrid = ix;

	if (m_pgrid == NULL) {
		return true;
	}
	if (!m_pgrid->IsValidCell(ix.iLat, ix.iLon)) {
		return false;
	}

	if (m_fJoinStatic) {
		record.dDepth = m_pgrid->GetDepth(ix.iLat, ix.iLon);
		record.dDistCoast = m_pgrid->GetDistanceToCoast(ix.iLat, ix.iLon);
		if (IsMissing(record.dDepth) || IsMissing(record.dDistCoast)) {
			return false;
		}

		record.vecRegionIds.resize(m_pgrid->GetRegionFieldCount());
		for (size_t r = 0; r < m_pgrid->GetRegionFieldCount(); r++) {
			record.vecRegionIds[r] =
				m_pgrid->GetRegionField(r).m_data(ix.iLat, ix.iLon);
		}
	}
	return true;
}

///////////////////////////////////////////////////////////////////////////////

void MatchupAssembler::FindCycloneSlices(
	const std::vector<double> & vecTimes,
	std::vector<long> & vecSlices
) const {
	vecSlices.assign(vecTimes.size(), -1);
	if (!m_fJoinCyclone) {
		return;
	}

	CycloneRasterSampler sampler(*m_pcyclone, m_param.dCycloneTimeTolerance);
	for (size_t t = 0; t < vecTimes.size(); t++) {
		size_t ixSlice;
		if (sampler.FindSlice(vecTimes[t], ixSlice)) {
			vecSlices[t] = static_cast<long>(ixSlice);
		} else {
			Announce("WARNING: No cyclone information for time step %lu (%s)",
				t, EpochSecondsToDateHourString(vecTimes[t]).c_str());
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void MatchupAssembler::AssembleBuoy(
	const ModelPointSeries & series,
	const std::vector<ResampledBuoy> & vecBuoys,
	MatchupSet & matchups
) const {
	AnnounceStartBlock("Assembling buoy matchups");

	matchups.m_eSourceType = MatchupSet::SourceType_Buoy;
	InitializeSet(matchups);
	matchups.m_vecSourceNames = series.m_vecStations;

	QualityControlFilter qc(QualityControlFilter::Context_Buoy);

	std::vector<double> vecTimes;
	series.GetTimes(vecTimes);

	std::vector<long> vecSlices;
	FindCycloneSlices(vecTimes, vecSlices);

	// Resolve the grid cell of each buoy
	std::vector<GridIndex> vecGridIx(vecBuoys.size());
	if (m_pgrid != NULL) {
		NearestPointLocator locator(*m_pgrid);
		for (size_t b = 0; b < vecBuoys.size(); b++) {
			if (IsMissing(vecBuoys[b].dLat) || IsMissing(vecBuoys[b].dLon)) {
				continue;
			}
			vecGridIx[b] = locator.Locate(vecBuoys[b].dLat, vecBuoys[b].dLon);
		}
	}

	for (size_t b = 0; b < vecBuoys.size(); b++) {
		const ResampledBuoy & buoy = vecBuoys[b];

		if (buoy.sStation >= series.m_vecStations.size()) {
			_EXCEPTION1("Invalid station index %lu", buoy.sStation);
		}
		const std::string & strStation = series.m_vecStations[buoy.sStation];

		if (buoy.vecObs.size() != series.m_vecSteps.size()) {
			_EXCEPTION3("Station %s has %lu observations (expected %lu)",
				strStation.c_str(), buoy.vecObs.size(), series.m_vecSteps.size());
		}
		if (IsMissing(buoy.dLat) || IsMissing(buoy.dLon)) {
			Announce("WARNING: Station %s has no position; skipping",
				strStation.c_str());
			continue;
		}

		MatchupRecord recordStation;
		if (!JoinGridAttributes(vecGridIx[b], recordStation)) {
			Announce(1, "WARNING: Station %s excluded by grid information",
				strStation.c_str());
			continue;
		}
		recordStation.sSource = buoy.sStation;
		recordStation.dLat = buoy.dLat;
		recordStation.dLon = LonDegToSignedRange(LonDegToGridRange(buoy.dLon));

		size_t sStationRecords = 0;
		for (size_t t = 0; t < series.m_vecSteps.size(); t++) {
			WaveSample sampleModel = series.m_vecSamples[buoy.sStation][t];
			qc.Apply(sampleModel);

			WaveSample sampleObs = buoy.vecObs[t];
			qc.Apply(sampleObs);

			if (IsMissing(sampleModel.dHs) || IsMissing(sampleObs.dHs)) {
				continue;
			}

			MatchupRecord record = recordStation;
			record.dTime = series.m_vecSteps[t].dTime;
			record.dCycleTime = series.m_vecSteps[t].dCycleTime;
			record.iMonth = EpochSecondsToMonth(record.dTime);
			record.model = sampleModel;
			record.obs = sampleObs;

			if (vecSlices[t] >= 0) {
				CycloneRasterSampler sampler(
					*m_pcyclone, m_param.dCycloneTimeTolerance);
				record.dCyclone =
					sampler.SampleSlice(
						static_cast<size_t>(vecSlices[t]),
						record.ixGrid.iLat,
						record.ixGrid.iLon);
			}

			matchups.m_vecRecords.push_back(record);
			sStationRecords++;
		}

		Announce(1, "%s: %lu matchups", strStation.c_str(), sStationRecords);
	}

	AnnounceEndBlock("%lu matchups", matchups.m_vecRecords.size());
}

///////////////////////////////////////////////////////////////////////////////

void MatchupAssembler::AssembleSatellite(
	const ModelFieldSeries & series,
	ModelFieldFileReader & reader,
	const std::vector<SatelliteSample> & vecSamples,
	MatchupSet & matchups
) const {
	if (m_pgrid == NULL) {
		_EXCEPTIONT("Altimeter matchups require a GridDomain");
	}
	if (!m_pgrid->MatchesGrid(series.m_vecLat, series.m_vecLon)) {
		_EXCEPTIONT("Model grid and GridDomain grid are different");
	}

	AnnounceStartBlock("Assembling altimeter matchups");

	matchups.m_eSourceType = MatchupSet::SourceType_Satellite;
	InitializeSet(matchups);
	GetSatelliteMissionNames(matchups.m_vecSourceNames);

	QualityControlFilter qc(QualityControlFilter::Context_Satellite);

	std::vector<double> vecSatTimes(vecSamples.size());
	for (size_t s = 0; s < vecSamples.size(); s++) {
		vecSatTimes[s] = vecSamples[s].dTime;
	}

	// Model steps whose time occurs exactly among the satellite times,
	// intersected file by file so every forecast cycle is considered
	std::vector<size_t> vecMatchedSteps;
	size_t sGroupBegin = 0;
	while (sGroupBegin < series.m_vecSteps.size()) {
		size_t sGroupEnd = sGroupBegin;
		std::vector<double> vecGroupTimes;
		while ((sGroupEnd < series.m_vecSteps.size()) &&
		       (series.m_vecSteps[sGroupEnd].sFile
		          == series.m_vecSteps[sGroupBegin].sFile)
		) {
			vecGroupTimes.push_back(series.m_vecSteps[sGroupEnd].dTime);
			sGroupEnd++;
		}

		std::vector<TimeIndexPair> vecExact;
		TemporalAligner::IntersectExact(vecGroupTimes, vecSatTimes, vecExact);
		for (size_t p = 0; p < vecExact.size(); p++) {
			vecMatchedSteps.push_back(sGroupBegin + vecExact[p].ixA);
		}

		sGroupBegin = sGroupEnd;
	}

	std::vector<double> vecMatchedTimes(vecMatchedSteps.size());
	for (size_t m = 0; m < vecMatchedSteps.size(); m++) {
		vecMatchedTimes[m] = series.m_vecSteps[vecMatchedSteps[m]].dTime;
	}

	// Satellite samples within tolerance of each matched step
	std::vector<TimeIndexPair> vecCandidates;
	TemporalAligner::Align(
		vecMatchedTimes, vecSatTimes, m_param.dTimeTolerance, vecCandidates);

	std::vector<long> vecSlices;
	FindCycloneSlices(vecMatchedTimes, vecSlices);

	NearestPointLocator locator(*m_pgrid);
	ModelFieldCursor cursor(series, reader);
	DataArray2D<double> dataHs;
	DataArray2D<double> dataWnd;

	const std::vector<double> & vecGridLat = m_pgrid->GetLatitudes();
	const std::vector<double> & vecGridLon = m_pgrid->GetLongitudes();

	size_t p = 0;
	while (p < vecCandidates.size()) {
		size_t m = vecCandidates[p].ixA;
		const ModelFieldStep & step = series.m_vecSteps[vecMatchedSteps[m]];

		cursor.Read(vecMatchedSteps[m], dataHs, dataWnd);
		if ((dataHs.GetRows() != vecGridLat.size()) ||
		    (dataHs.GetColumns() != vecGridLon.size()) ||
		    (!dataWnd.HasSameShape(dataHs))
		) {
			_EXCEPTION1("Model fields at %s do not match the grid",
				EpochSecondsToDateHourString(step.dTime).c_str());
		}

		size_t sStepRecords = 0;
		for (; (p < vecCandidates.size()) && (vecCandidates[p].ixA == m); p++) {
			const SatelliteSample & sat = vecSamples[vecCandidates[p].ixB];
			if (IsMissing(sat.dLat) || IsMissing(sat.dLon)) {
				continue;
			}

			GridIndex ix = locator.Locate(sat.dLat, sat.dLon);

			MatchupRecord record;
			if (!JoinGridAttributes(ix, record)) {
				continue;
			}

			record.model.dHs = dataHs(ix.iLat, ix.iLon);
			record.model.dWnd = dataWnd(ix.iLat, ix.iLon);
			qc.Apply(record.model);

			record.obs = sat.sample;
			qc.Apply(record.obs);

			if (IsMissing(record.model.dHs) || IsMissing(record.obs.dHs) ||
			    IsMissing(record.model.dWnd) || IsMissing(record.obs.dWnd)
			) {
				continue;
			}

			record.dTime = step.dTime;
			record.dCycleTime = step.dCycleTime;
			record.iMonth = EpochSecondsToMonth(step.dTime);
			record.dLat = vecGridLat[ix.iLat];
			record.dLon = LonDegToSignedRange(vecGridLon[ix.iLon]);
			record.sSource = static_cast<size_t>(sat.eMission);

			if (vecSlices[m] >= 0) {
				CycloneRasterSampler sampler(
					*m_pcyclone, m_param.dCycloneTimeTolerance);
				record.dCyclone =
					sampler.SampleSlice(
						static_cast<size_t>(vecSlices[m]), ix.iLat, ix.iLon);
			}

			matchups.m_vecRecords.push_back(record);
			sStepRecords++;
		}

		Announce(1, "%s: %lu matchups",
			EpochSecondsToDateHourString(step.dTime).c_str(), sStepRecords);
	}

	AnnounceEndBlock("%lu matchups", matchups.m_vecRecords.size());
}

///////////////////////////////////////////////////////////////////////////////

void MatchupAssembler::Finalize(
	MatchupSet & matchups
) const {
	if (matchups.size() == 0) {
		_EXCEPTIONT("No matchups model/observation available");
	}

	matchups.SortRecords();

	Announce("Total of %lu matchups from %s to %s",
		matchups.size(),
		EpochSecondsToDateHourString(matchups.GetMinTime()).c_str(),
		EpochSecondsToDateHourString(matchups.GetMaxTime()).c_str());
}

///////////////////////////////////////////////////////////////////////////////

