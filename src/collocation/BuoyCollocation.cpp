///////////////////////////////////////////////////////////////////////////////
///
///	\file    BuoyCollocation.cpp
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
		_EXCEPTIONT("BuoyCollocation runs serially; use a single MPI rank");
	}
#endif

	// List of model point output files
	std::string strModelFileList;

	// Grid information file
	std::string strGridInfoFile;

	// List of cyclone raster files
	std::string strCycloneFileList;

	// NDBC buoy directory
	std::string strNdbcDir;

	// Copernicus buoy directory
	std::string strCopernicusDir;

	// Output directory
	std::string strOutputDir;

	// Tag added to the output file name
	std::string strTag;

	// Model/observation time tolerance
	double dTimeTolerance;

	// Model/cyclone time tolerance
	double dCycloneTimeTolerance;

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
		CommandLineString(strGridInfoFile, "in_grid_info", "");
		CommandLineString(strCycloneFileList, "in_cyclone_list", "");
		CommandLineString(strNdbcDir, "ndbc_dir", "");
		CommandLineString(strCopernicusDir, "copernicus_dir", "");
		CommandLineString(strOutputDir, "out_dir", ".");
		CommandLineString(strTag, "tag", "");
		CommandLineDoubleD(dTimeTolerance, "timetol", 1800.0, "(s)");
		CommandLineDoubleD(dCycloneTimeTolerance, "cyclonetimetol", 5400.0, "(s)");
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
	if ((strNdbcDir == "") && (strCopernicusDir == "")) {
		_EXCEPTIONT("At least one of --ndbc_dir or --copernicus_dir must be specified");
	}
	if ((strCycloneFileList != "") && (strGridInfoFile == "") && (!fNoCyclone)) {
		_EXCEPTIONT("--in_cyclone_list requires --in_grid_info");
	}
	if (nCycleCount < 0) {
		_EXCEPTIONT("--cycles must be nonnegative");
	}
	if (dTimeTolerance <= 0.0) {
		_EXCEPTIONT("--timetol must be positive");
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
	if (strGridInfoFile != "") {
		ReadGridDomainFromNcFile(strGridInfoFile, grid);
	}
	const GridDomain * pgrid = (grid.IsInitialized())?(&grid):(NULL);

	// Model series
	FilenameList vecModelFiles;
	vecModelFiles.FromFile(strModelFileList);

	AnnounceStartBlock("Aggregating %lu model files (%s)",
		vecModelFiles.size(), (fForecast)?("forecast"):("hindcast"));

	SeriesAggregator aggregator(
		(fForecast)?(AggregationPolicy_Forecast):(AggregationPolicy_Hindcast),
		param.nCycleCount);

	NcModelPointFileReader readerModel;
	ModelPointSeries series;
	aggregator.AggregatePoints(vecModelFiles, readerModel, series);

	std::vector<double> vecModelTimes;
	series.GetTimes(vecModelTimes);

	double dModelMinTime;
	double dModelMaxTime;
	if (!SeriesAggregator::GetTimeRange(vecModelTimes, dModelMinTime, dModelMaxTime)) {
		_EXCEPTIONT("Model files contain no valid times");
	}

	AnnounceEndBlock("%lu stations, %lu steps (%s to %s)",
		series.m_vecStations.size(),
		series.m_vecSteps.size(),
		EpochSecondsToDateHourString(dModelMinTime).c_str(),
		EpochSecondsToDateHourString(dModelMaxTime).c_str());

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

	// Buoy observations
	std::vector<int> vecYears;
	YearsSpannedByTimes(vecModelTimes, vecYears);

	NcNdbcBuoySource sourceNdbc(strNdbcDir);
	NcCopernicusBuoySource sourceCopernicus(strCopernicusDir);

	BuoySourceChain chain;
	if (strNdbcDir != "") {
		chain.AddSource(&sourceNdbc);
	}
	if (strCopernicusDir != "") {
		chain.AddSource(&sourceCopernicus);
	}

	AnnounceStartBlock("Reading buoy observations");

	std::vector<ResampledBuoy> vecBuoys;
	for (size_t s = 0; s < series.m_vecStations.size(); s++) {
		const std::string & strStation = series.m_vecStations[s];

		BuoyObservationSeries obs;
		if (!chain.Load(strStation, vecYears, obs)) {
			Announce("WARNING: Station %s not available; skipping",
				strStation.c_str());
			continue;
		}

		ResampledBuoy buoy;
		buoy.sStation = s;
		buoy.dLat = obs.dLat;
		buoy.dLon = obs.dLon;
		ResampleBuoyOntoTimes(obs, vecModelTimes, param.dTimeTolerance, buoy.vecObs);
		vecBuoys.push_back(buoy);

		Announce(1, "%s: %lu samples from %s",
			strStation.c_str(), obs.vecTime.size(), obs.strSource.c_str());
	}

	AnnounceEndBlock("%lu of %lu stations available",
		vecBuoys.size(), series.m_vecStations.size());

	// Matchups
	MatchupAssembler assembler(param, pgrid, pcyclone);

	MatchupSet matchups(MatchupSet::SourceType_Buoy);
	assembler.AssembleBuoy(series, vecBuoys, matchups);
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

