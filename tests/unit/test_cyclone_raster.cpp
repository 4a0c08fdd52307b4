///////////////////////////////////////////////////////////////////////////////
///
///	\file    test_cyclone_raster.cpp
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
#include "CycloneRaster.h"
#include "Exception.h"

///////////////////////////////////////////////////////////////////////////////

TEST(CycloneRasterTest, ParseLegend) {
	std::vector<std::string> vecLegend;
	CycloneRaster::ParseLegend(
		"Cyclone category: 0 none; 1 tropical storm ;2 hurricane", vecLegend);
	ASSERT_EQ(vecLegend.size(), 3u);
	EXPECT_EQ(vecLegend[0], "0 none");
	EXPECT_EQ(vecLegend[1], "1 tropical storm");
	EXPECT_EQ(vecLegend[2], "2 hurricane");

	CycloneRaster::ParseLegend("no legend here", vecLegend);
	EXPECT_TRUE(vecLegend.empty());
}

///////////////////////////////////////////////////////////////////////////////

class CycloneRasterSamplerTest : public ::testing::Test {
protected:
	virtual void SetUp() {
		m_raster.SetCoordinates(MakeAxis(0.0, 1.0, 2), MakeAxis(-1.0, 1.0, 3));

		// 3-hourly slices with the slice index as the code at (1,2)
		for (size_t t = 0; t < 3; t++) {
			DataArray2D<double> dataCodes(2, 3, 0.0);
			dataCodes(1, 2) = static_cast<double>(t + 1);
			dataCodes(0, 0) = -1.0;
			m_raster.AddSlice(TestEpoch2020 + 10800.0 * static_cast<double>(t), dataCodes);
		}
	}

	CycloneRaster m_raster;
};

///////////////////////////////////////////////////////////////////////////////

TEST_F(CycloneRasterSamplerTest, CoordinatesInGridRange) {
	ASSERT_EQ(m_raster.GetLongitudes().size(), 3u);
	EXPECT_DOUBLE_EQ(m_raster.GetLongitudes()[0], 359.0);
	EXPECT_EQ(m_raster.GetSliceCount(), 3u);
}

TEST_F(CycloneRasterSamplerTest, SlicesMustMatchShape) {
	DataArray2D<double> dataWrong(3, 2, 0.0);
	EXPECT_THROW(m_raster.AddSlice(TestEpoch2020, dataWrong), Exception);
	EXPECT_EQ(m_raster.GetSliceCount(), 3u);

	EXPECT_THROW(
		m_raster.SetCoordinates(MakeAxis(0.0, 1.0, 2), MakeAxis(0.0, 1.0, 3)),
		Exception);
}

TEST_F(CycloneRasterSamplerTest, ClosestSliceWithinTolerance) {
	CycloneRasterSampler sampler(m_raster, 5400.0);

	EXPECT_DOUBLE_EQ(sampler.Sample(TestEpoch2020 + 3600.0, 1, 2), 1.0);
	EXPECT_DOUBLE_EQ(sampler.Sample(TestEpoch2020 + 9000.0, 1, 2), 2.0);
	EXPECT_DOUBLE_EQ(sampler.Sample(TestEpoch2020 + 21600.0, 1, 1), 0.0);

	// Exactly halfway is outside a strict tolerance of half the spacing
	EXPECT_TRUE(IsMissing(sampler.Sample(TestEpoch2020 + 5400.0, 1, 2)));

	// After the last slice
	EXPECT_TRUE(IsMissing(sampler.Sample(TestEpoch2020 + 30000.0, 1, 2)));
}

TEST_F(CycloneRasterSamplerTest, EquidistantResolvesToEarlierSlice) {
	CycloneRasterSampler sampler(m_raster, 10800.0);

	size_t ixSlice = 99;
	ASSERT_TRUE(sampler.FindSlice(TestEpoch2020 + 5400.0, ixSlice));
	EXPECT_EQ(ixSlice, 0u);
	EXPECT_DOUBLE_EQ(sampler.SampleSlice(ixSlice, 1, 2), 1.0);
}

TEST_F(CycloneRasterSamplerTest, NegativeCodesAreMissing) {
	CycloneRasterSampler sampler(m_raster, 5400.0);
	EXPECT_TRUE(IsMissing(sampler.Sample(TestEpoch2020, 0, 0)));

	EXPECT_TRUE(IsMissing(CycloneRasterSampler::NormalizeCode(-999.0)));
	EXPECT_TRUE(IsMissing(CycloneRasterSampler::NormalizeCode(MissingValue)));
	EXPECT_DOUBLE_EQ(CycloneRasterSampler::NormalizeCode(0.0), 0.0);
	EXPECT_DOUBLE_EQ(CycloneRasterSampler::NormalizeCode(4.0), 4.0);
}

///////////////////////////////////////////////////////////////////////////////

