///////////////////////////////////////////////////////////////////////////////
///
///	\file    SatelliteCollocation.cpp
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

#include "CommandLine.h"
#include "Exception.h"
#include "Announce.h"
#include "FilenameList.h"
#include "TimeObj.h"

#include "CollocationParameters.h"
#include "GridDomain.h"
#include "CycloneRaster.h"
#include "Observations.h"
#include "SeriesAggregator.h"
#include "MatchupAssembler.h"
#include "CollocationNcReaders.h"
#include "MatchupWriter.h"

#include "netcdfcpp.h"

#include <string>
#include <vector>

#if defined(WAVEMATCHUP_MPIOMP)
#include <mpi.h>
#endif

///////////////////////////////////////////////////////////////////////////////

int main(int argc, char** argv) {

#if defined(WAVEMATCHUP_MPIOMP)
	// Initialize MPI
	int result = MPI_Init(&argc, &argv);
	if (result != MPI_SUCCESS) {
		_EXCEPTION1("The MPI routine MPI_Init failed (code %i)", result);
	}
#endif

	NcError error(NcError::silent_nonfatal);

	// Enable output only on rank zero
	AnnounceOnlyOutputOnRankZero();

	int iExitStatus = 0;

try {

#if defined(WAVEMATCHUP_MPIOMP)
	int nMPISize;
	MPI_Comm_size(MPI_COMM_WORLD, &nMPISize);
	if (nMPISize > 1) {
		_EXCEPTIONT("SatelliteCollocation runs serially; use a single MPI rank");
	}
#endif

	// List of gridded model output files
	std::string strModelFileList;

	// List of altimeter files
	std::string strSatFileList;

	// Grid information file
	std::string strGridInfoFile;

	// List of cyclone raster files
	std::string strCycloneFileList;

	// Output directory
	std::string strOutputDir;

	// Tag added to the output file name
	std::string strTag;

	// Model/observation time tolerance
	double dTimeTolerance;

	// Model/cyclone time tolerance
	double dCycloneTimeTolerance;

	// Margin around the model interval for altimeter samples
	double dSatMargin;

	// Model files are forecast cycles
	bool fForecast;

	// Number of forecast cycles
	int nCycleCount;

	// Do not join static grid attributes
	bool fNoStatic;

	// Do not join cyclone attributes
	bool fNoCyclone;

	// Verbosity level
	int iVerbosityLevel;

	// Parse the command line
	BeginCommandLine()
		CommandLineString(strModelFileList, "in_model_list", "");
		CommandLineString(strSatFileList, "in_sat_list", "");
		CommandLineString(strGridInfoFile, "in_grid_info", "");
		CommandLineString(strCycloneFileList, "in_cyclone_list", "");
		CommandLineString(strOutputDir, "out_dir", ".");
		CommandLineString(strTag, "tag", "");
		CommandLineDoubleD(dTimeTolerance, "timetol", 1800.0, "(s)");
		CommandLineDoubleD(dCycloneTimeTolerance, "cyclonetimetol", 5400.0, "(s)");
		CommandLineDoubleD(dSatMargin, "sat_margin", 10800.0, "(s)");
		CommandLineBool(fForecast, "forecast");
		CommandLineIntD(nCycleCount, "cycles", 0, "(informational only, does not limit aggregation; 0 = derive)");
		CommandLineBool(fNoStatic, "nostatic");
		CommandLineBool(fNoCyclone, "nocyclone");
		CommandLineInt(iVerbosityLevel, "verbosity", 0);

		ParseCommandLine(argc, argv);
	EndCommandLine(argv)

	AnnounceBanner();

	AnnounceSetVerbosityLevel(iVerbosityLevel);

	// Validate arguments
	if (strModelFileList == "") {
		_EXCEPTIONT("No model file list (--in_model_list) specified");
	}
	if (strSatFileList == "") {
		_EXCEPTIONT("No altimeter file list (--in_sat_list) specified");
	}
	if (strGridInfoFile == "") {
		_EXCEPTIONT("No grid information file (--in_grid_info) specified");
	}
	if (nCycleCount < 0) {
		_EXCEPTIONT("--cycles must be nonnegative");
	}
	if (dTimeTolerance <= 0.0) {
		_EXCEPTIONT("--timetol must be positive");
	}
	if (dSatMargin < 0.0) {
		_EXCEPTIONT("--sat_margin must be nonnegative");
	}

	CollocationParameters param;
	param.dTimeTolerance = dTimeTolerance;
	param.dCycloneTimeTolerance = dCycloneTimeTolerance;
	param.fForecast = fForecast;
	param.nCycleCount = nCycleCount;
	param.fJoinStatic = (!fNoStatic);
	param.fJoinCyclone = (!fNoCyclone);

	// Grid information
	GridDomain grid;
	ReadGridDomainFromNcFile(strGridInfoFile, grid);

	// Model series
	FilenameList vecModelFiles;
	vecModelFiles.FromFile(strModelFileList);

	AnnounceStartBlock("Aggregating %lu model files (%s)",
		vecModelFiles.size(), (fForecast)?("forecast"):("hindcast"));

	SeriesAggregator aggregator(
		(fForecast)?(AggregationPolicy_Forecast):(AggregationPolicy_Hindcast),
		param.nCycleCount);

	NcModelFieldFileReader readerModel;
	ModelFieldSeries series;
	aggregator.AggregateFields(vecModelFiles, readerModel, &grid, series);

	std::vector<double> vecModelTimes;
	series.GetTimes(vecModelTimes);

	double dModelMinTime;
	double dModelMaxTime;
	if (!SeriesAggregator::GetTimeRange(vecModelTimes, dModelMinTime, dModelMaxTime)) {
		_EXCEPTIONT("Model files contain no valid times");
	}

	AnnounceEndBlock("%lu steps in %lu files (%s to %s)",
		series.m_vecSteps.size(),
		series.m_vecFiles.size(),
		EpochSecondsToDateHourString(dModelMinTime).c_str(),
		EpochSecondsToDateHourString(dModelMaxTime).c_str());

	// Altimeter samples
	FilenameList vecSatFiles;
	vecSatFiles.FromFile(strSatFileList);

	std::vector<SatelliteSample> vecSamples;
	ReadSatelliteFiles(
		vecSatFiles, dModelMinTime, dModelMaxTime, dSatMargin, vecSamples);

	// Cyclone raster
	CycloneRaster cyclone;
	const CycloneRaster * pcyclone = NULL;
	if ((strCycloneFileList != "") && (!fNoCyclone)) {
		FilenameList vecCycloneFiles;
		vecCycloneFiles.FromFile(strCycloneFileList);

		ReadCycloneRasterFromNcFiles(
			vecCycloneFiles, grid,
			dModelMinTime, dModelMaxTime,
			param.dCycloneTimeTolerance,
			cyclone);

		pcyclone = &cyclone;
	}

	// Matchups
	MatchupAssembler assembler(param, &grid, pcyclone);

	MatchupSet matchups(MatchupSet::SourceType_Satellite);
	assembler.AssembleSatellite(series, readerModel, vecSamples, matchups);
	assembler.Finalize(matchups);

	WriteMatchupSetToNcFile(matchups, strOutputDir, strTag);

	AnnounceBanner();

} catch(Exception & e) {
	Announce(e.ToString().c_str());
	iExitStatus = 1;

#if defined(WAVEMATCHUP_MPIOMP)
	MPI_Abort(MPI_COMM_WORLD, 1);
#endif
}

#if defined(WAVEMATCHUP_MPIOMP)
	// Deinitialize MPI
	MPI_Finalize();
#endif

	return iExitStatus;
}

///////////////////////////////////////////////////////////////////////////////

