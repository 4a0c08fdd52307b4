///////////////////////////////////////////////////////////////////////////////
///
///	\file    QualityControlFilter.h
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

#ifndef _QUALITYCONTROLFILTER_H_
#define _QUALITYCONTROLFILTER_H_

#include "WaveSample.h"

#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Physical range checks on wave samples.  Values outside their valid
///		range are replaced by MissingValue; samples are never removed.
///	</summary>
class QualityControlFilter {

public:
	///	<summary>
	///		Observation context, which sets the wave height limit.
	///	</summary>
	enum Context {
		Context_Buoy,
		Context_Satellite
	};

	///	<summary>
	///		Valid ranges [min, max).
	///	</summary>
	static const double MinWaveHeight;
	static const double MaxWaveHeightBuoy;
	static const double MaxWaveHeightSatellite;
	static const double MinWavePeriod;
	static const double MaxWavePeriod;
	static const double MinWaveDirection;
	static const double MaxWaveDirection;
	static const double MinWindSpeed;
	static const double MaxWindSpeed;

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	QualityControlFilter(
		Context eContext
	) :
		m_eContext(eContext)
	{ }

public:
	///	<summary>
	///		Check whether a value lies in [dMin, dMax).  Missing values are
	///		never in range.
	///	</summary>
	static bool InRange(
		double dValue,
		double dMin,
		double dMax
	);

	///	<summary>
	///		Upper wave height limit for this context.
	///	</summary>
	double GetMaxWaveHeight() const;

	///	<summary>
	///		Apply the range checks to one sample.
	///	</summary>
	void Apply(
		WaveSample & sample
	) const;

	///	<summary>
	///		Apply the range checks to each sample.
	///	</summary>
	void Apply(
		std::vector<WaveSample> & vecSamples
	) const;

protected:
	///	<summary>
	///		Context.
	///	</summary>
	Context m_eContext;
};

///////////////////////////////////////////////////////////////////////////////

#endif

