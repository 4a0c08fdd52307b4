///////////////////////////////////////////////////////////////////////////////
///
///	\file    CollocationParameters.h
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

#ifndef _COLLOCATIONPARAMETERS_H_
#define _COLLOCATIONPARAMETERS_H_

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Settings shared by all stages of a collocation run.
///	</summary>
struct CollocationParameters {

	///	<summary>
	///		Default constructor.
	///	</summary>
	CollocationParameters() :
		dTimeTolerance(1800.0),
		dCycloneTimeTolerance(5400.0),
		fForecast(false),
		nCycleCount(0),
		fJoinStatic(true),
		fJoinCyclone(true)
	{ }

	///	<summary>
	///		Half-width of the model/observation time window (s).
	///	</summary>
	double dTimeTolerance;

	///	<summary>
	///		Half-width of the model/cyclone raster time window (s).
	///	</summary>
	double dCycloneTimeTolerance;

	///	<summary>
	///		Each model file is a forecast cycle.
	///	</summary>
	bool fForecast;

	///	<summary>
	///		Requested number of forecast cycles (0 = derive from the files).
	///	</summary>
	int nCycleCount;

	///	<summary>
	///		Join depth, distance to coast and region ids onto matchups.
	///	</summary>
	bool fJoinStatic;

	///	<summary>
	///		Join cyclone raster codes onto matchups.
	///	</summary>
	bool fJoinCyclone;
};

///////////////////////////////////////////////////////////////////////////////

#endif

