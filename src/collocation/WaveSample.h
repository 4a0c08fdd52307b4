///////////////////////////////////////////////////////////////////////////////
///
///	\file    WaveSample.h
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

#ifndef _WAVESAMPLE_H_
#define _WAVESAMPLE_H_

#include "Defines.h"

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Wave parameters at one place and time.  Any field may be missing.
///	</summary>
struct WaveSample {

	///	<summary>
	///		Constructor (all fields missing).
	///	</summary>
	WaveSample() :
		dHs(MissingValue),
		dTm(MissingValue),
		dDm(MissingValue),
		dWnd(MissingValue)
	{ }

	///	<summary>
	///		Constructor.
	///	</summary>
	WaveSample(
		double a_dHs,
		double a_dTm,
		double a_dDm,
		double a_dWnd
	) :
		dHs(a_dHs),
		dTm(a_dTm),
		dDm(a_dDm),
		dWnd(a_dWnd)
	{ }

	///	<summary>
	///		Significant wave height (m).
	///	</summary>
	double dHs;

	///	<summary>
	///		Mean wave period (s).
	///	</summary>
	double dTm;

	///	<summary>
	///		Mean wave direction (degrees).
	///	</summary>
	double dDm;

	///	<summary>
	///		Wind speed (m/s).
	///	</summary>
	double dWnd;
};

///////////////////////////////////////////////////////////////////////////////

#endif

