///////////////////////////////////////////////////////////////////////////////
///
///	\file    test_quality_control_filter.cpp
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

#include "QualityControlFilter.h"

///////////////////////////////////////////////////////////////////////////////

static bool SameValue(double a, double b) {
	if (IsMissing(a) || IsMissing(b)) {
		return (IsMissing(a) && IsMissing(b));
	}
	return (a == b);
}

///////////////////////////////////////////////////////////////////////////////

TEST(QualityControlFilterTest, WaveHeightLimitDependsOnContext) {
	QualityControlFilter qcBuoy(QualityControlFilter::Context_Buoy);
	QualityControlFilter qcSat(QualityControlFilter::Context_Satellite);

	WaveSample sample(25.0, 10.0, 90.0, 10.0);

	WaveSample sampleBuoy = sample;
	qcBuoy.Apply(sampleBuoy);
	EXPECT_DOUBLE_EQ(sampleBuoy.dHs, 25.0);

	WaveSample sampleSat = sample;
	qcSat.Apply(sampleSat);
	EXPECT_TRUE(IsMissing(sampleSat.dHs));
	EXPECT_DOUBLE_EQ(sampleSat.dWnd, 10.0);
}

TEST(QualityControlFilterTest, RangeBounds) {
	QualityControlFilter qc(QualityControlFilter::Context_Buoy);

	WaveSample sampleLow(0.0, 0.0, -180.0, 0.0);
	qc.Apply(sampleLow);
	EXPECT_DOUBLE_EQ(sampleLow.dHs, 0.0);
	EXPECT_DOUBLE_EQ(sampleLow.dTm, 0.0);
	EXPECT_DOUBLE_EQ(sampleLow.dDm, -180.0);
	EXPECT_DOUBLE_EQ(sampleLow.dWnd, 0.0);

	WaveSample sampleHigh(30.0, 40.0, 360.0, 60.0);
	qc.Apply(sampleHigh);
	EXPECT_TRUE(IsMissing(sampleHigh.dHs));
	EXPECT_TRUE(IsMissing(sampleHigh.dTm));
	EXPECT_TRUE(IsMissing(sampleHigh.dDm));
	EXPECT_TRUE(IsMissing(sampleHigh.dWnd));

	WaveSample sampleNegative(-0.1, -1.0, -180.5, -2.0);
	qc.Apply(sampleNegative);
	EXPECT_TRUE(IsMissing(sampleNegative.dHs));
	EXPECT_TRUE(IsMissing(sampleNegative.dTm));
	EXPECT_TRUE(IsMissing(sampleNegative.dDm));
	EXPECT_TRUE(IsMissing(sampleNegative.dWnd));
}

TEST(QualityControlFilterTest, FailingFieldsOnlyAreMarked) {
	QualityControlFilter qc(QualityControlFilter::Context_Buoy);

	std::vector<WaveSample> vecSamples;
	vecSamples.push_back(WaveSample(1.6, 8.0, 200.0, MissingValue));
	vecSamples.push_back(WaveSample(35.0, 8.0, 200.0, MissingValue));
	vecSamples.push_back(WaveSample(1.6, 45.0, 200.0, MissingValue));
	qc.Apply(vecSamples);

	ASSERT_EQ(vecSamples.size(), 3u);
	EXPECT_DOUBLE_EQ(vecSamples[0].dHs, 1.6);
	EXPECT_TRUE(IsMissing(vecSamples[1].dHs));
	EXPECT_DOUBLE_EQ(vecSamples[1].dTm, 8.0);
	EXPECT_DOUBLE_EQ(vecSamples[2].dHs, 1.6);
	EXPECT_TRUE(IsMissing(vecSamples[2].dTm));
}

TEST(QualityControlFilterTest, Idempotent) {
	QualityControlFilter qc(QualityControlFilter::Context_Satellite);

	std::vector<WaveSample> vecSamples;
	for (int i = -5; i < 70; i += 3) {
		double d = static_cast<double>(i);
		vecSamples.push_back(WaveSample(d * 0.5, d, d * 6.0 - 200.0, d));
	}
	vecSamples.push_back(WaveSample());

	std::vector<WaveSample> vecOnce = vecSamples;
	qc.Apply(vecOnce);
	std::vector<WaveSample> vecTwice = vecOnce;
	qc.Apply(vecTwice);

	ASSERT_EQ(vecOnce.size(), vecTwice.size());
	for (size_t i = 0; i < vecOnce.size(); i++) {
		EXPECT_TRUE(SameValue(vecOnce[i].dHs, vecTwice[i].dHs));
		EXPECT_TRUE(SameValue(vecOnce[i].dTm, vecTwice[i].dTm));
		EXPECT_TRUE(SameValue(vecOnce[i].dDm, vecTwice[i].dDm));
		EXPECT_TRUE(SameValue(vecOnce[i].dWnd, vecTwice[i].dWnd));
	}
}

TEST(QualityControlFilterTest, MissingIsNeverInRange) {
	EXPECT_FALSE(QualityControlFilter::InRange(MissingValue, -1.0e30, 1.0e30));
	EXPECT_TRUE(QualityControlFilter::InRange(0.0, 0.0, 1.0));
	EXPECT_FALSE(QualityControlFilter::InRange(1.0, 0.0, 1.0));
}

///////////////////////////////////////////////////////////////////////////////

