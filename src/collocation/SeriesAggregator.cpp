///////////////////////////////////////////////////////////////////////////////
///
///	\file    SeriesAggregator.cpp
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

#include "SeriesAggregator.h"
#include "GridDomain.h"
#include "CoordTransforms.h"
#include "Announce.h"
#include "Exception.h"

#include <cmath>

///////////////////////////////////////////////////////////////////////////////

void ModelPointSeries::GetTimes(std::vector<double> & vecTimes) const {
	vecTimes.resize(m_vecSteps.size());
	for (size_t t = 0; t < m_vecSteps.size(); t++) {
		vecTimes[t] = m_vecSteps[t].dTime;
	}
}

///////////////////////////////////////////////////////////////////////////////

void ModelFieldSeries::GetTimes(std::vector<double> & vecTimes) const {
	vecTimes.resize(m_vecSteps.size());
	for (size_t t = 0; t < m_vecSteps.size(); t++) {
		vecTimes[t] = m_vecSteps[t].dTime;
	}
}

///////////////////////////////////////////////////////////////////////////////

ModelFieldCursor::~ModelFieldCursor() {
	if (m_fOpen) {
		m_reader.Close();
	}
}

///////////////////////////////////////////////////////////////////////////////

void ModelFieldCursor::Read(
	size_t sStep,
	DataArray2D<double> & dataHs,
	DataArray2D<double> & dataWnd
) {
	if (sStep >= m_series.m_vecSteps.size()) {
		_EXCEPTION2("Model step %lu out of range (%lu steps)",
			sStep, m_series.m_vecSteps.size());
	}

	const ModelFieldStep & step = m_series.m_vecSteps[sStep];

	if ((!m_fOpen) || (m_sOpenFile != step.sFile)) {
		if (m_fOpen) {
			m_reader.Close();
			m_fOpen = false;
		}
		const std::string & strFile = m_series.m_vecFiles[step.sFile];
		if (!m_reader.Open(strFile)) {
			_EXCEPTION1("Unable to reopen model file \"%s\"", strFile.c_str());
		}
		m_fOpen = true;
		m_sOpenFile = step.sFile;
	}

	m_reader.ReadFields(step.lTimeIx, dataHs, dataWnd);
}

///////////////////////////////////////////////////////////////////////////////

bool ModelStepSequenceBuilder::Append(
	const ModelStep & step
) {
	if (IsMissing(step.dTime)) {
		return false;
	}

	if (m_ePolicy == AggregationPolicy_Hindcast) {
		if (!m_setTimes.insert(step.dTime).second) {
			return false;
		}

	} else {
		std::pair<double, double> prTimeCycle(step.dTime, step.dCycleTime);
		if (!m_setTimeCycles.insert(prTimeCycle).second) {
			return false;
		}
	}

	m_vecSteps.push_back(step);
	return true;
}

///////////////////////////////////////////////////////////////////////////////

bool SeriesAggregator::GetTimeRange(
	const std::vector<double> & vecTimes,
	double & dMinTime,
	double & dMaxTime
) {
	bool fAnyTime = false;
	for (size_t t = 0; t < vecTimes.size(); t++) {
		if (IsMissing(vecTimes[t])) {
			continue;
		}
		if ((!fAnyTime) || (vecTimes[t] < dMinTime)) {
			dMinTime = vecTimes[t];
		}
		if ((!fAnyTime) || (vecTimes[t] > dMaxTime)) {
			dMaxTime = vecTimes[t];
		}
		fAnyTime = true;
	}
	return fAnyTime;
}

///////////////////////////////////////////////////////////////////////////////

int SeriesAggregator::DeriveCycleCount(
	double dCycleSpan,
	double dCycleSpacing,
	int nRequested
) {
	if (dCycleSpacing <= 0.0) {
		Announce("WARNING: Forecast cycles are not in increasing order; "
			"cycle count not derived");
		return (nRequested > 0)?(nRequested):(1);
	}

	int nDerived = static_cast<int>(ceil(fabs(dCycleSpan) / dCycleSpacing)) + 1;
	if (nRequested < nDerived) {
		return nDerived;
	}
	return nRequested;
}

///////////////////////////////////////////////////////////////////////////////

double SeriesAggregator::CycleTimeOfFile(
	const std::vector<double> & vecTimes
) const {
	if (m_ePolicy != AggregationPolicy_Forecast) {
		return MissingValue;
	}
	double dMinTime;
	double dMaxTime;
	if (!GetTimeRange(vecTimes, dMinTime, dMaxTime)) {
		return MissingValue;
	}
	return dMinTime;
}

///////////////////////////////////////////////////////////////////////////////

void SeriesAggregator::UpdateCycleCount(
	const std::vector< std::pair<double, double> > & vecFileRanges
) {
	if (m_ePolicy != AggregationPolicy_Forecast) {
		m_nCycleCount = 0;
		return;
	}

	if (vecFileRanges.size() < 2) {
		m_nCycleCount = (m_nRequestedCycleCount > 0)?(m_nRequestedCycleCount):(1);
		return;
	}

	m_nCycleCount =
		DeriveCycleCount(
			vecFileRanges[0].second - vecFileRanges[0].first,
			vecFileRanges[1].first - vecFileRanges[0].first,
			m_nRequestedCycleCount);

	if (m_nCycleCount != m_nRequestedCycleCount) {
		Announce("Forecast cycle count updated to %i", m_nCycleCount);
	}
}

///////////////////////////////////////////////////////////////////////////////

void SeriesAggregator::AggregatePoints(
	const std::vector<std::string> & vecFiles,
	ModelPointFileReader & reader,
	ModelPointSeries & series
) {
	series = ModelPointSeries();

	ModelStepSequenceBuilder builder(m_ePolicy);
	std::vector< std::pair<double, double> > vecFileRanges;
	bool fHaveStations = false;

	AnnounceStartBlock("Aggregating %lu model point files", vecFiles.size());
	for (size_t f = 0; f < vecFiles.size(); f++) {
		ModelPointFileContents contents;
		if (!reader.Read(vecFiles[f], contents)) {
			Announce("WARNING: Cannot open \"%s\"; skipping", vecFiles[f].c_str());
			continue;
		}

		if (contents.vecSamples.size() != contents.vecStations.size()) {
			_EXCEPTION3("Model file \"%s\" has %lu stations but %lu sample rows",
				vecFiles[f].c_str(),
				contents.vecStations.size(),
				contents.vecSamples.size());
		}
		for (size_t s = 0; s < contents.vecSamples.size(); s++) {
			if (contents.vecSamples[s].size() != contents.vecTime.size()) {
				_EXCEPTION1("Model file \"%s\" has inconsistent time dimension",
					vecFiles[f].c_str());
			}
		}

		// Station identity comes from the first file read
		if (!fHaveStations) {
			series.m_vecStations = contents.vecStations;
			series.m_vecSamples.resize(contents.vecStations.size());
			fHaveStations = true;

		} else if (contents.vecStations.size() != series.m_vecStations.size()) {
			_EXCEPTION3("Model file \"%s\" has %lu stations (expected %lu)",
				vecFiles[f].c_str(),
				contents.vecStations.size(),
				series.m_vecStations.size());

		} else {
			for (size_t s = 0; s < contents.vecStations.size(); s++) {
				if (contents.vecStations[s] != series.m_vecStations[s]) {
					_EXCEPTION4("Model file \"%s\" station %lu is \"%s\" (expected \"%s\")",
						vecFiles[f].c_str(),
						s,
						contents.vecStations[s].c_str(),
						series.m_vecStations[s].c_str());
				}
			}
		}

		std::pair<double, double> prRange;
		if (!GetTimeRange(contents.vecTime, prRange.first, prRange.second)) {
			Announce("WARNING: No valid times in \"%s\"; skipping",
				vecFiles[f].c_str());
			continue;
		}
		vecFileRanges.push_back(prRange);

		double dCycleTime = CycleTimeOfFile(contents.vecTime);

		size_t sDropped = 0;
		for (size_t t = 0; t < contents.vecTime.size(); t++) {
			if (!builder.Append(ModelStep(contents.vecTime[t], dCycleTime))) {
				sDropped++;
				continue;
			}
			for (size_t s = 0; s < series.m_vecSamples.size(); s++) {
				series.m_vecSamples[s].push_back(contents.vecSamples[s][t]);
			}
		}

		if (sDropped != 0) {
			Announce("WARNING: Dropped %lu duplicate or invalid times from \"%s\"",
				sDropped, vecFiles[f].c_str());
		}
		Announce(1, "%s (%lu times)",
			vecFiles[f].c_str(), contents.vecTime.size());
	}

	if (!fHaveStations) {
		_EXCEPTIONT("No model point files could be read");
	}

	series.m_vecSteps = builder.GetSteps();
	UpdateCycleCount(vecFileRanges);

	AnnounceEndBlock("%lu stations, %lu steps",
		series.m_vecStations.size(), series.m_vecSteps.size());
}

///////////////////////////////////////////////////////////////////////////////

void SeriesAggregator::AggregateFields(
	const std::vector<std::string> & vecFiles,
	ModelFieldFileReader & reader,
	const GridDomain * pgrid,
	ModelFieldSeries & series
) {
	series = ModelFieldSeries();

	ModelStepSequenceBuilder builder(m_ePolicy);
	std::vector< std::pair<double, double> > vecFileRanges;

	AnnounceStartBlock("Aggregating %lu model field files", vecFiles.size());
	for (size_t f = 0; f < vecFiles.size(); f++) {
		if (!reader.Open(vecFiles[f])) {
			Announce("WARNING: Cannot open \"%s\"; skipping", vecFiles[f].c_str());
			continue;
		}

		const std::vector<double> & vecLat = reader.GetLatitudes();
		const std::vector<double> & vecLon = reader.GetLongitudes();

		// Verify the grid
		bool fGridMatches = true;
		if (pgrid != NULL) {
			fGridMatches = pgrid->MatchesGrid(vecLat, vecLon);

		} else if (series.m_vecFiles.size() != 0) {
			fGridMatches = (vecLat == series.m_vecLat);
			if (vecLon.size() != series.m_vecLon.size()) {
				fGridMatches = false;
			}
			for (size_t i = 0; fGridMatches && (i < vecLon.size()); i++) {
				if (LonDegToGridRange(vecLon[i]) != series.m_vecLon[i]) {
					fGridMatches = false;
				}
			}
		}
		if (!fGridMatches) {
			reader.Close();
			_EXCEPTION1("Grid of model file \"%s\" does not match the reference grid",
				vecFiles[f].c_str());
		}

		if (series.m_vecFiles.size() == 0) {
			series.m_vecLat = vecLat;
			series.m_vecLon.resize(vecLon.size());
			for (size_t i = 0; i < vecLon.size(); i++) {
				series.m_vecLon[i] = LonDegToGridRange(vecLon[i]);
			}
		}

		const std::vector<double> & vecTimes = reader.GetTimes();

		std::pair<double, double> prRange;
		if (!GetTimeRange(vecTimes, prRange.first, prRange.second)) {
			Announce("WARNING: No valid times in \"%s\"; skipping",
				vecFiles[f].c_str());
			reader.Close();
			continue;
		}
		vecFileRanges.push_back(prRange);

		double dCycleTime = CycleTimeOfFile(vecTimes);
		size_t sFile = series.m_vecFiles.size();
		series.m_vecFiles.push_back(vecFiles[f]);

		size_t sDropped = 0;
		for (size_t t = 0; t < vecTimes.size(); t++) {
			if (!builder.Append(ModelStep(vecTimes[t], dCycleTime))) {
				sDropped++;
				continue;
			}
			ModelFieldStep step;
			step.dTime = vecTimes[t];
			step.dCycleTime = dCycleTime;
			step.sFile = sFile;
			step.lTimeIx = static_cast<long>(t);
			series.m_vecSteps.push_back(step);
		}

		if (sDropped != 0) {
			Announce("WARNING: Dropped %lu duplicate or invalid times from \"%s\"",
				sDropped, vecFiles[f].c_str());
		}
		Announce(1, "%s (%lu times)", vecFiles[f].c_str(), vecTimes.size());

		reader.Close();
	}

	if (series.m_vecFiles.size() == 0) {
		_EXCEPTIONT("No model field files could be read");
	}

	UpdateCycleCount(vecFileRanges);

	AnnounceEndBlock("%lu files, %lu steps",
		series.m_vecFiles.size(), series.m_vecSteps.size());
}

///////////////////////////////////////////////////////////////////////////////

