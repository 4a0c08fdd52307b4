///////////////////////////////////////////////////////////////////////////////
///
///	\file    QualityControlFilter.cpp
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

#include "QualityControlFilter.h"

///////////////////////////////////////////////////////////////////////////////

const double QualityControlFilter::MinWaveHeight = 0.0;
const double QualityControlFilter::MaxWaveHeightBuoy = 30.0;
const double QualityControlFilter::MaxWaveHeightSatellite = 20.0;
const double QualityControlFilter::MinWavePeriod = 0.0;
const double QualityControlFilter::MaxWavePeriod = 40.0;
const double QualityControlFilter::MinWaveDirection = -180.0;
const double QualityControlFilter::MaxWaveDirection = 360.0;
const double QualityControlFilter::MinWindSpeed = 0.0;
const double QualityControlFilter::MaxWindSpeed = 60.0;

///////////////////////////////////////////////////////////////////////////////

bool QualityControlFilter::InRange(
	double dValue,
	double dMin,
	double dMax
) {
	if (IsMissing(dValue)) {
		return false;
	}
	return ((dValue >= dMin) && (dValue < dMax));
}

///////////////////////////////////////////////////////////////////////////////

double QualityControlFilter::GetMaxWaveHeight() const {
	if (m_eContext == Context_Satellite) {
		return MaxWaveHeightSatellite;
	}
	return MaxWaveHeightBuoy;
}

///////////////////////////////////////////////////////////////////////////////

void QualityControlFilter::Apply(
	WaveSample & sample
) const {
	if (!InRange(sample.dHs, MinWaveHeight, GetMaxWaveHeight())) {
		sample.dHs = MissingValue;
	}
	if (!InRange(sample.dTm, MinWavePeriod, MaxWavePeriod)) {
		sample.dTm = MissingValue;
	}
	if (!InRange(sample.dDm, MinWaveDirection, MaxWaveDirection)) {
		sample.dDm = MissingValue;
	}
	if (!InRange(sample.dWnd, MinWindSpeed, MaxWindSpeed)) {
		sample.dWnd = MissingValue;
	}
}

///////////////////////////////////////////////////////////////////////////////

void QualityControlFilter::Apply(
	std::vector<WaveSample> & vecSamples
) const {
	for (size_t i = 0; i < vecSamples.size(); i++) {
		Apply(vecSamples[i]);
	}
}

///////////////////////////////////////////////////////////////////////////////

