///////////////////////////////////////////////////////////////////////////////
///
///	\file    test_series_aggregator.cpp
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
#include "GridDomain.h"
#include "Exception.h"

///////////////////////////////////////////////////////////////////////////////

class SeriesAggregatorPointTest : public ::testing::Test {
protected:
	virtual void SetUp() {
		m_vecStations.push_back("41001");
		m_vecStations.push_back("41002");
		m_vecStations.push_back("46042");

		WaveSample sample(1.5, 7.0, 180.0, MissingValue);

		// Two consecutive daily hourly files
		m_reader.AddFile("day1.nc",
			MakePointFile(m_vecStations, MakeTimes(TestEpoch2020, 3600.0, 24), sample));
		m_reader.AddFile("day2.nc",
			MakePointFile(m_vecStations, MakeTimes(TestEpoch2020 + 86400.0, 3600.0, 24), sample));

		// Overlaps the last hour of day1
		m_reader.AddFile("overlap.nc",
			MakePointFile(m_vecStations, MakeTimes(TestEpoch2020 + 82800.0, 3600.0, 3), sample));

		std::vector<std::string> vecTwoStations(m_vecStations.begin(), m_vecStations.begin() + 2);
		m_reader.AddFile("twostations.nc",
			MakePointFile(vecTwoStations, MakeTimes(TestEpoch2020 + 172800.0, 3600.0, 2), sample));

		// Same station count as day1 but in a different order
		std::vector<std::string> vecReordered;
		vecReordered.push_back("41002");
		vecReordered.push_back("41001");
		vecReordered.push_back("46042");
		m_reader.AddFile("reordered.nc",
			MakePointFile(vecReordered, MakeTimes(TestEpoch2020 + 86400.0, 3600.0, 24), sample));
	}

	std::vector<std::string> m_vecStations;
	MemoryModelPointFileReader m_reader;
};

///////////////////////////////////////////////////////////////////////////////

TEST_F(SeriesAggregatorPointTest, HindcastConcatenatesFiles) {
	std::vector<std::string> vecFiles;
	vecFiles.push_back("day1.nc");
	vecFiles.push_back("day2.nc");

	SeriesAggregator aggregator(AggregationPolicy_Hindcast);
	ModelPointSeries series;
	aggregator.AggregatePoints(vecFiles, m_reader, series);

	ASSERT_EQ(series.m_vecStations.size(), 3u);
	ASSERT_EQ(series.m_vecSteps.size(), 48u);
	ASSERT_EQ(series.m_vecSamples.size(), 3u);
	for (size_t s = 0; s < series.m_vecSamples.size(); s++) {
		EXPECT_EQ(series.m_vecSamples[s].size(), 48u);
	}
	for (size_t t = 1; t < series.m_vecSteps.size(); t++) {
		EXPECT_GT(series.m_vecSteps[t].dTime, series.m_vecSteps[t-1].dTime);
		EXPECT_TRUE(IsMissing(series.m_vecSteps[t].dCycleTime));
	}
	EXPECT_EQ(aggregator.GetCycleCount(), 0);
}

TEST_F(SeriesAggregatorPointTest, HindcastDropsDuplicateTimes) {
	std::vector<std::string> vecFiles;
	vecFiles.push_back("day1.nc");
	vecFiles.push_back("overlap.nc");

	SeriesAggregator aggregator(AggregationPolicy_Hindcast);
	ModelPointSeries series;
	aggregator.AggregatePoints(vecFiles, m_reader, series);

	ASSERT_EQ(series.m_vecSteps.size(), 26u);
	EXPECT_DOUBLE_EQ(series.m_vecSteps[23].dTime, TestEpoch2020 + 82800.0);
	EXPECT_DOUBLE_EQ(series.m_vecSteps[24].dTime, TestEpoch2020 + 86400.0);
	EXPECT_EQ(series.m_vecSamples[0].size(), 26u);
}

TEST_F(SeriesAggregatorPointTest, UnreadableFileIsSkipped) {
	std::vector<std::string> vecFiles;
	vecFiles.push_back("missing.nc");
	vecFiles.push_back("day2.nc");

	SeriesAggregator aggregator(AggregationPolicy_Hindcast);
	ModelPointSeries series;
	aggregator.AggregatePoints(vecFiles, m_reader, series);
	EXPECT_EQ(series.m_vecSteps.size(), 24u);

	std::vector<std::string> vecMissing(1, "missing.nc");
	EXPECT_THROW(aggregator.AggregatePoints(vecMissing, m_reader, series), Exception);
}

TEST_F(SeriesAggregatorPointTest, StationCountMismatchThrows) {
	std::vector<std::string> vecFiles;
	vecFiles.push_back("day1.nc");
	vecFiles.push_back("twostations.nc");

	SeriesAggregator aggregator(AggregationPolicy_Hindcast);
	ModelPointSeries series;
	EXPECT_THROW(aggregator.AggregatePoints(vecFiles, m_reader, series), Exception);
}

TEST_F(SeriesAggregatorPointTest, StationNameMismatchThrows) {
	std::vector<std::string> vecFiles;
	vecFiles.push_back("day1.nc");
	vecFiles.push_back("reordered.nc");

	SeriesAggregator aggregator(AggregationPolicy_Hindcast);
	ModelPointSeries series;
	EXPECT_THROW(aggregator.AggregatePoints(vecFiles, m_reader, series), Exception);

	SeriesAggregator aggregatorForecast(AggregationPolicy_Forecast);
	EXPECT_THROW(aggregatorForecast.AggregatePoints(vecFiles, m_reader, series), Exception);
}

TEST_F(SeriesAggregatorPointTest, ForecastKeepsOverlappingCycles) {
	std::vector<std::string> vecFiles;
	vecFiles.push_back("day1.nc");
	vecFiles.push_back("overlap.nc");

	SeriesAggregator aggregator(AggregationPolicy_Forecast);
	ModelPointSeries series;
	aggregator.AggregatePoints(vecFiles, m_reader, series);

	ASSERT_EQ(series.m_vecSteps.size(), 27u);
	for (size_t t = 0; t < 24; t++) {
		EXPECT_DOUBLE_EQ(series.m_vecSteps[t].dCycleTime, TestEpoch2020);
	}
	for (size_t t = 24; t < 27; t++) {
		EXPECT_DOUBLE_EQ(series.m_vecSteps[t].dCycleTime, TestEpoch2020 + 82800.0);
	}

	// Span 23 h with cycles 23 h apart
	EXPECT_EQ(aggregator.GetCycleCount(), 2);
}

TEST_F(SeriesAggregatorPointTest, RequestedCycleCountDoesNotLimitSteps) {
	std::vector<std::string> vecFiles;
	vecFiles.push_back("day1.nc");
	vecFiles.push_back("overlap.nc");

	ModelPointSeries series;

	SeriesAggregator aggregatorOne(AggregationPolicy_Forecast, 1);
	aggregatorOne.AggregatePoints(vecFiles, m_reader, series);
	EXPECT_EQ(series.m_vecSteps.size(), 27u);
	EXPECT_EQ(aggregatorOne.GetCycleCount(), 2);

	SeriesAggregator aggregatorFive(AggregationPolicy_Forecast, 5);
	aggregatorFive.AggregatePoints(vecFiles, m_reader, series);
	EXPECT_EQ(series.m_vecSteps.size(), 27u);
	EXPECT_EQ(aggregatorFive.GetCycleCount(), 5);
}

///////////////////////////////////////////////////////////////////////////////

TEST(SeriesAggregatorCycleTest, DeriveCycleCount) {
	EXPECT_EQ(SeriesAggregator::DeriveCycleCount(86400.0, 43200.0, 0), 3);
	EXPECT_EQ(SeriesAggregator::DeriveCycleCount(86400.0, 43200.0, 5), 5);
	EXPECT_EQ(SeriesAggregator::DeriveCycleCount(64800.0, 43200.0, 1), 3);
	EXPECT_EQ(SeriesAggregator::DeriveCycleCount(86400.0, 0.0, 0), 1);
	EXPECT_EQ(SeriesAggregator::DeriveCycleCount(86400.0, -3600.0, 4), 4);
}

TEST(SeriesAggregatorCycleTest, TimeRangeIgnoresMissing) {
	std::vector<double> vecTimes;
	vecTimes.push_back(MissingValue);
	vecTimes.push_back(30.0);
	vecTimes.push_back(10.0);
	vecTimes.push_back(20.0);

	double dMin = 0.0;
	double dMax = 0.0;
	ASSERT_TRUE(SeriesAggregator::GetTimeRange(vecTimes, dMin, dMax));
	EXPECT_DOUBLE_EQ(dMin, 10.0);
	EXPECT_DOUBLE_EQ(dMax, 30.0);

	std::vector<double> vecMissing(2, MissingValue);
	EXPECT_FALSE(SeriesAggregator::GetTimeRange(vecMissing, dMin, dMax));
}

///////////////////////////////////////////////////////////////////////////////

TEST(ModelStepSequenceBuilderTest, Policies) {
	ModelStepSequenceBuilder builderHindcast(AggregationPolicy_Hindcast);
	EXPECT_TRUE(builderHindcast.Append(ModelStep(0.0, MissingValue)));
	EXPECT_FALSE(builderHindcast.Append(ModelStep(0.0, MissingValue)));
	EXPECT_FALSE(builderHindcast.Append(ModelStep(MissingValue, MissingValue)));
	EXPECT_TRUE(builderHindcast.Append(ModelStep(3600.0, MissingValue)));
	EXPECT_EQ(builderHindcast.GetCount(), 2u);

	ModelStepSequenceBuilder builderForecast(AggregationPolicy_Forecast);
	EXPECT_TRUE(builderForecast.Append(ModelStep(43200.0, 0.0)));
	EXPECT_TRUE(builderForecast.Append(ModelStep(43200.0, 43200.0)));
	EXPECT_FALSE(builderForecast.Append(ModelStep(43200.0, 0.0)));
	EXPECT_EQ(builderForecast.GetCount(), 2u);
}

///////////////////////////////////////////////////////////////////////////////

class SeriesAggregatorFieldTest : public ::testing::Test {
protected:
	virtual void SetUp() {
		m_vecLat = MakeAxis(-1.0, 1.0, 3);
		m_vecLon = MakeAxis(0.0, 90.0, 4);
		MakeOceanGrid(m_vecLat, m_vecLon, m_grid);

		m_reader.AddFile("f1.nc",
			MakeFieldFile(m_vecLat, m_vecLon, MakeTimes(TestEpoch2020, 10800.0, 8), 2.0, 8.0));
		m_reader.AddFile("f2.nc",
			MakeFieldFile(m_vecLat, m_vecLon, MakeTimes(TestEpoch2020 + 86400.0, 10800.0, 8), 2.5, 9.0));

		// Same grid in the signed longitude convention
		std::vector<double> vecSignedLon;
		vecSignedLon.push_back(0.0);
		vecSignedLon.push_back(90.0);
		vecSignedLon.push_back(-180.0);
		vecSignedLon.push_back(-90.0);
		m_reader.AddFile("signed.nc",
			MakeFieldFile(m_vecLat, vecSignedLon, MakeTimes(TestEpoch2020 + 172800.0, 10800.0, 2), 1.0, 5.0));

		m_reader.AddFile("coarse.nc",
			MakeFieldFile(MakeAxis(-1.0, 2.0, 2), m_vecLon, MakeTimes(TestEpoch2020, 10800.0, 2), 1.0, 5.0));
	}

	std::vector<double> m_vecLat;
	std::vector<double> m_vecLon;
	GridDomain m_grid;
	MemoryModelFieldFileReader m_reader;
};

///////////////////////////////////////////////////////////////////////////////

TEST_F(SeriesAggregatorFieldTest, IndexesStepsByFile) {
	std::vector<std::string> vecFiles;
	vecFiles.push_back("f1.nc");
	vecFiles.push_back("f2.nc");
	vecFiles.push_back("signed.nc");

	SeriesAggregator aggregator(AggregationPolicy_Hindcast);
	ModelFieldSeries series;
	aggregator.AggregateFields(vecFiles, m_reader, &m_grid, series);

	ASSERT_EQ(series.m_vecFiles.size(), 3u);
	ASSERT_EQ(series.m_vecSteps.size(), 18u);
	EXPECT_EQ(series.m_vecSteps[0].sFile, 0u);
	EXPECT_EQ(series.m_vecSteps[9].sFile, 1u);
	EXPECT_EQ(series.m_vecSteps[9].lTimeIx, 1);
	EXPECT_EQ(series.m_vecSteps[17].sFile, 2u);
	EXPECT_DOUBLE_EQ(series.m_vecLon[3], 270.0);
}

TEST_F(SeriesAggregatorFieldTest, GridMismatchThrows) {
	std::vector<std::string> vecFiles;
	vecFiles.push_back("f1.nc");
	vecFiles.push_back("coarse.nc");

	SeriesAggregator aggregator(AggregationPolicy_Hindcast);
	ModelFieldSeries series;
	EXPECT_THROW(aggregator.AggregateFields(vecFiles, m_reader, &m_grid, series), Exception);
	EXPECT_THROW(aggregator.AggregateFields(vecFiles, m_reader, NULL, series), Exception);
}

TEST_F(SeriesAggregatorFieldTest, CursorReopensOnlyOnFileChange) {
	std::vector<std::string> vecFiles;
	vecFiles.push_back("f1.nc");
	vecFiles.push_back("f2.nc");

	SeriesAggregator aggregator(AggregationPolicy_Hindcast);
	ModelFieldSeries series;
	aggregator.AggregateFields(vecFiles, m_reader, &m_grid, series);
	int nOpenAfterAggregation = m_reader.GetOpenCount();
	EXPECT_EQ(nOpenAfterAggregation, 2);

	DataArray2D<double> dataHs;
	DataArray2D<double> dataWnd;
	{
		ModelFieldCursor cursor(series, m_reader);
		for (size_t t = 0; t < series.m_vecSteps.size(); t++) {
			cursor.Read(t, dataHs, dataWnd);
		}
		EXPECT_DOUBLE_EQ(dataHs(2, 3), 2.5);
		EXPECT_DOUBLE_EQ(dataWnd(0, 0), 9.0);
		EXPECT_THROW(cursor.Read(series.m_vecSteps.size(), dataHs, dataWnd), Exception);
	}
	EXPECT_EQ(m_reader.GetOpenCount(), nOpenAfterAggregation + 2);
	EXPECT_TRUE(m_reader.GetTimes().empty());
}

TEST_F(SeriesAggregatorFieldTest, ForecastCycleIsFileStart) {
	std::vector<std::string> vecFiles;
	vecFiles.push_back("f1.nc");
	vecFiles.push_back("f2.nc");

	SeriesAggregator aggregator(AggregationPolicy_Forecast, 1);
	ModelFieldSeries series;
	aggregator.AggregateFields(vecFiles, m_reader, &m_grid, series);

	ASSERT_EQ(series.m_vecSteps.size(), 16u);
	EXPECT_DOUBLE_EQ(series.m_vecSteps[7].dCycleTime, TestEpoch2020);
	EXPECT_DOUBLE_EQ(series.m_vecSteps[8].dCycleTime, TestEpoch2020 + 86400.0);

	// Span 21 h with cycles 24 h apart
	EXPECT_EQ(aggregator.GetCycleCount(), 2);
}

///////////////////////////////////////////////////////////////////////////////

