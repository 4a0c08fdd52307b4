///////////////////////////////////////////////////////////////////////////////
///
///	\file    test_collocation_scenarios.cpp
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

#include <gtest/gtest.h>

#include "CollocationTestFixtures.h"
#include "SeriesAggregator.h"
#include "Observations.h"
#include "MatchupAssembler.h"
#include "GridDomain.h"
#include "Exception.h"

#include <cstdio>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Buoy pipeline from model point files to a finalized MatchupSet.
///	</summary>
static void RunBuoyPipeline(
	const std::vector<std::string> & vecFiles,
	ModelPointFileReader & reader,
	const BuoySourceChain & chain,
	const GridDomain * pgrid,
	const CollocationParameters & param,
	MatchupSet & matchups,
	int & nCycleCount
) {
	SeriesAggregator aggregator(
		(param.fForecast)?(AggregationPolicy_Forecast):(AggregationPolicy_Hindcast),
		param.nCycleCount);

	ModelPointSeries series;
	aggregator.AggregatePoints(vecFiles, reader, series);
	nCycleCount = aggregator.GetCycleCount();

	std::vector<double> vecTimes;
	series.GetTimes(vecTimes);

	std::vector<int> vecYears;
	YearsSpannedByTimes(vecTimes, vecYears);

	std::vector<ResampledBuoy> vecBuoys;
	for (size_t s = 0; s < series.m_vecStations.size(); s++) {
		BuoyObservationSeries obs;
		if (!chain.Load(series.m_vecStations[s], vecYears, obs)) {
			continue;
		}
		ResampledBuoy buoy;
		buoy.sStation = s;
		buoy.dLat = obs.dLat;
		buoy.dLon = obs.dLon;
		ResampleBuoyOntoTimes(obs, vecTimes, param.dTimeTolerance, buoy.vecObs);
		vecBuoys.push_back(buoy);
	}

	MatchupAssembler assembler(param, pgrid, NULL);
	assembler.AssembleBuoy(series, vecBuoys, matchups);
	assembler.Finalize(matchups);
}

///////////////////////////////////////////////////////////////////////////////

class BuoyScenarioTest : public ::testing::Test {
protected:
	virtual void SetUp() {
		MakeOceanGrid(MakeAxis(30.0, 0.5, 11), MakeAxis(0.0, 0.5, 720), m_grid);

		std::vector<std::string> vecStations(1, "41001");
		WaveSample sampleModel(1.5, 7.0, 180.0, MissingValue);
		m_reader.AddFile("ww3.20200101.nc",
			MakePointFile(vecStations, MakeTimes(TestEpoch2020, 3600.0, 24), sampleModel));
		m_reader.AddFile("ww3.20200102.nc",
			MakePointFile(vecStations, MakeTimes(TestEpoch2020 + 86400.0, 3600.0, 24), sampleModel));

		m_vecFiles.push_back("ww3.20200101.nc");
		m_vecFiles.push_back("ww3.20200102.nc");

		// Hourly observations on the hour, starting an hour early
		m_obs = MakeBuoySeries(34.7, -72.7,
			MakeTimes(TestEpoch2020 - 3600.0, 3600.0, 51),
			WaveSample(1.6, 8.0, 190.0, MissingValue));
	}

	void RunHindcast(MatchupSet & matchups) {
		MemoryBuoySource sourceNdbc("NDBC");
		sourceNdbc.AddStation("41001", m_obs);
		MemoryBuoySource sourceCopernicus("Copernicus");

		BuoySourceChain chain;
		chain.AddSource(&sourceCopernicus);
		chain.AddSource(&sourceNdbc);

		int nCycleCount = 0;
		RunBuoyPipeline(m_vecFiles, m_reader, chain, &m_grid, m_param, matchups, nCycleCount);
		EXPECT_EQ(nCycleCount, 0);
	}

	GridDomain m_grid;
	MemoryModelPointFileReader m_reader;
	std::vector<std::string> m_vecFiles;
	BuoyObservationSeries m_obs;
	CollocationParameters m_param;
};

///////////////////////////////////////////////////////////////////////////////

TEST_F(BuoyScenarioTest, TwoDayHindcast) {
	MatchupSet matchups;
	RunHindcast(matchups);

	ASSERT_EQ(matchups.size(), 48u);
	for (size_t r = 0; r < matchups.size(); r++) {
		const MatchupRecord & record = matchups.m_vecRecords[r];
		EXPECT_DOUBLE_EQ(record.dTime, TestEpoch2020 + 3600.0 * static_cast<double>(r));
		EXPECT_DOUBLE_EQ(record.model.dHs, 1.5);
		EXPECT_DOUBLE_EQ(record.obs.dHs, 1.6);
		EXPECT_DOUBLE_EQ(record.obs.dTm, 8.0);
		EXPECT_DOUBLE_EQ(record.dLat, 34.7);
		EXPECT_NEAR(record.dLon, -72.7, 1.0e-10);
		EXPECT_TRUE(IsMissing(record.dCycleTime));
		EXPECT_EQ(record.sSource, 0u);
	}
	EXPECT_EQ(matchups.GetOutputFilename(""),
		"WW3.Buoy_2020010100to2020010223.nc");
}

TEST_F(BuoyScenarioTest, OutOfRangeObservationDropsStep) {
	// Observation at 10:00 on the first day
	m_obs.vecSamples[11].dHs = 35.0;

	MatchupSet matchups;
	RunHindcast(matchups);

	ASSERT_EQ(matchups.size(), 47u);
	for (size_t r = 0; r < matchups.size(); r++) {
		EXPECT_NE(matchups.m_vecRecords[r].dTime, TestEpoch2020 + 36000.0);
		EXPECT_LT(matchups.m_vecRecords[r].obs.dHs, 30.0);
	}
}

TEST_F(BuoyScenarioTest, StationOnLandIsExcluded) {
	DataArray2D<double> dataMask(11, 720, 1.0);
	for (size_t i = 0; i < 720; i++) {
		dataMask(9, i) = 0.0;
	}
	m_grid.SetMask(dataMask);

	MatchupSet matchups;
	EXPECT_THROW(RunHindcast(matchups), Exception);
	EXPECT_EQ(matchups.size(), 0u);
}

///////////////////////////////////////////////////////////////////////////////

class SatelliteScenarioTest : public ::testing::Test {
protected:
	virtual void SetUp() {
		m_vecLat = MakeAxis(-1.0, 1.0, 3);
		m_vecLon = MakeAxis(0.0, 1.0, 4);
		MakeOceanGrid(m_vecLat, m_vecLon, m_grid);

		// Land at (0, 1)
		DataArray2D<double> dataMask(3, 4, 1.0);
		dataMask(1, 1) = 0.0;
		m_grid.SetMask(dataMask);
	}

	SatelliteSample MakeSample(double dTime, double dLat, double dLon) {
		SatelliteSample sat;
		sat.dTime = dTime;
		sat.dLat = dLat;
		sat.dLon = dLon;
		sat.eMission = SatelliteMission_JASON3;
		sat.sample = WaveSample(2.4, MissingValue, MissingValue, 9.0);
		return sat;
	}

	std::vector<double> m_vecLat;
	std::vector<double> m_vecLon;
	GridDomain m_grid;
	MemoryModelFieldFileReader m_reader;
	CollocationParameters m_param;
};

///////////////////////////////////////////////////////////////////////////////

TEST_F(SatelliteScenarioTest, LandCellIsExcluded) {
	m_reader.AddFile("ww3.nc",
		MakeFieldFile(m_vecLat, m_vecLon, MakeTimes(TestEpoch2020, 3600.0, 24), 2.0, 8.0));
	std::vector<std::string> vecFiles(1, "ww3.nc");

	SeriesAggregator aggregator(AggregationPolicy_Hindcast);
	ModelFieldSeries series;
	aggregator.AggregateFields(vecFiles, m_reader, &m_grid, series);

	std::vector<SatelliteSample> vecSamples;
	vecSamples.push_back(MakeSample(TestEpoch2020 + 7200.0, 0.1, 1.1));
	vecSamples.push_back(MakeSample(TestEpoch2020 + 7200.0, 0.9, 2.2));
	vecSamples.push_back(MakeSample(TestEpoch2020 + 100000.0, 0.9, 2.2));

	double dMinTime = 0.0;
	double dMaxTime = 0.0;
	std::vector<double> vecTimes;
	series.GetTimes(vecTimes);
	ASSERT_TRUE(SeriesAggregator::GetTimeRange(vecTimes, dMinTime, dMaxTime));
	SelectSatelliteSamplesInWindow(vecSamples, dMinTime, dMaxTime, 10800.0);
	ASSERT_EQ(vecSamples.size(), 2u);

	MatchupAssembler assembler(m_param, &m_grid, NULL);
	MatchupSet matchups;
	assembler.AssembleSatellite(series, m_reader, vecSamples, matchups);
	assembler.Finalize(matchups);

	ASSERT_EQ(matchups.size(), 1u);
	const MatchupRecord & record = matchups.m_vecRecords[0];
	EXPECT_DOUBLE_EQ(record.dLat, 1.0);
	EXPECT_DOUBLE_EQ(record.dLon, 2.0);
	EXPECT_DOUBLE_EQ(record.model.dHs, 2.0);
	EXPECT_DOUBLE_EQ(record.obs.dWnd, 9.0);
	EXPECT_EQ(record.sSource, static_cast<size_t>(SatelliteMission_JASON3));
	EXPECT_EQ(matchups.GetOutputFilename("_JASON3"),
		"WW3.Altimeter_JASON3_2020010102to2020010102.nc");
}

TEST_F(SatelliteScenarioTest, ForecastCyclesOverlap) {
	// Three 24 h forecasts at 6 h output, issued 12 h apart
	std::vector<std::string> vecFiles;
	for (int c = 0; c < 3; c++) {
		char szName[32];
		snprintf(szName, 32, "ww3.cycle%i.nc", c);
		vecFiles.push_back(szName);
		m_reader.AddFile(szName,
			MakeFieldFile(m_vecLat, m_vecLon,
				MakeTimes(TestEpoch2020 + 43200.0 * static_cast<double>(c), 21600.0, 4),
				1.0 + static_cast<double>(c), 8.0));
	}

	SeriesAggregator aggregator(AggregationPolicy_Forecast, 1);
	ModelFieldSeries series;
	aggregator.AggregateFields(vecFiles, m_reader, &m_grid, series);
	EXPECT_EQ(aggregator.GetCycleCount(), 3);
	ASSERT_EQ(series.m_vecSteps.size(), 12u);

	for (size_t t = 0; t < series.m_vecSteps.size(); t++) {
		const ModelFieldStep & step = series.m_vecSteps[t];
		EXPECT_DOUBLE_EQ(step.dCycleTime,
			TestEpoch2020 + 43200.0 * static_cast<double>(step.sFile));
		EXPECT_GE(step.dTime - step.dCycleTime, 0.0);
		EXPECT_LE(step.dTime - step.dCycleTime, 86400.0);
	}

	// One altimeter sample every 6 h over the whole period
	std::vector<SatelliteSample> vecSamples;
	std::vector<double> vecSatTimes = MakeTimes(TestEpoch2020, 21600.0, 8);
	for (size_t s = 0; s < vecSatTimes.size(); s++) {
		vecSamples.push_back(MakeSample(vecSatTimes[s], -1.0, 3.0));
	}

	m_param.fForecast = true;
	m_param.nCycleCount = aggregator.GetCycleCount();

	MatchupAssembler assembler(m_param, &m_grid, NULL);
	MatchupSet matchups;
	assembler.AssembleSatellite(series, m_reader, vecSamples, matchups);
	assembler.Finalize(matchups);

	EXPECT_TRUE(matchups.m_fForecast);
	ASSERT_EQ(matchups.size(), 12u);

	// 12 h after the first cycle is valid in the first two forecasts
	size_t sAtNoon = 0;
	for (size_t r = 0; r < matchups.size(); r++) {
		const MatchupRecord & record = matchups.m_vecRecords[r];
		EXPECT_FALSE(IsMissing(record.dCycleTime));
		if (record.dTime == TestEpoch2020 + 43200.0) {
			if (sAtNoon == 0) {
				EXPECT_DOUBLE_EQ(record.dCycleTime, TestEpoch2020);
				EXPECT_DOUBLE_EQ(record.model.dHs, 1.0);
			} else {
				EXPECT_DOUBLE_EQ(record.dCycleTime, TestEpoch2020 + 43200.0);
				EXPECT_DOUBLE_EQ(record.model.dHs, 2.0);
			}
			sAtNoon++;
		}
	}
	EXPECT_EQ(sAtNoon, 2u);
}

///////////////////////////////////////////////////////////////////////////////

TEST(BuoyForecastScenarioTest, CyclesKeptPerStep) {
	std::vector<std::string> vecStations(1, "46042");
	WaveSample sampleModel(1.2, 9.0, 270.0, MissingValue);

	MemoryModelPointFileReader reader;
	std::vector<std::string> vecFiles;
	for (int c = 0; c < 3; c++) {
		char szName[32];
		snprintf(szName, 32, "ww3.points%i.nc", c);
		vecFiles.push_back(szName);
		reader.AddFile(szName,
			MakePointFile(vecStations,
				MakeTimes(TestEpoch2020 + 43200.0 * static_cast<double>(c), 21600.0, 4),
				sampleModel));
	}

	MemoryBuoySource source("NDBC");
	source.AddStation("46042",
		MakeBuoySeries(36.8, -122.4,
			MakeTimes(TestEpoch2020, 1800.0, 100),
			WaveSample(1.3, 10.0, 280.0, MissingValue)));
	BuoySourceChain chain;
	chain.AddSource(&source);

	CollocationParameters param;
	param.fForecast = true;

	MatchupSet matchups;
	int nCycleCount = 0;
	RunBuoyPipeline(vecFiles, reader, chain, NULL, param, matchups, nCycleCount);

	EXPECT_EQ(nCycleCount, 3);
	ASSERT_EQ(matchups.size(), 12u);
	for (size_t r = 1; r < matchups.size(); r++) {
		const MatchupRecord & recPrev = matchups.m_vecRecords[r-1];
		const MatchupRecord & rec = matchups.m_vecRecords[r];
		EXPECT_TRUE((recPrev.dTime < rec.dTime) ||
			((recPrev.dTime == rec.dTime) && (recPrev.dCycleTime < rec.dCycleTime)));
		EXPECT_LE(rec.dTime - rec.dCycleTime, 86400.0);
	}
	EXPECT_DOUBLE_EQ(matchups.m_vecRecords[0].obs.dHs, 1.3);
}

///////////////////////////////////////////////////////////////////////////////

