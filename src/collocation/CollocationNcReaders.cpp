///////////////////////////////////////////////////////////////////////////////
///
///	\file    CollocationNcReaders.cpp
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

#include "CollocationNcReaders.h"
#include "GridDomain.h"
#include "CycloneRaster.h"
#include "NetCDFUtilities.h"
#include "CoordTransforms.h"
#include "STLStringHelper.h"
#include "Announce.h"
#include "Exception.h"
#include "netcdfcpp.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Read a one dimensional coordinate variable.
///	</summary>
static void ReadCoordinate(
	NcFile & ncfile,
	const std::string & strFilename,
	const std::string & strVarName,
	std::vector<double> & vecValues
) {
	NcVar * var = NcGetRequiredVar(ncfile, strFilename, strVarName);
	if (var->num_dims() != 1) {
		_EXCEPTION2("Variable \"%s\" in file \"%s\" must be one dimensional",
			strVarName.c_str(), strFilename.c_str());
	}
	NcReadVarAsDouble(var, vecValues);
}

///	<summary>
///		Reverse a latitude axis stored in descending order.
///	</summary>
///	<returns>
///		true if the axis was reversed.
///	</returns>
static bool MakeLatitudeAscending(
	std::vector<double> & vecLat
) {
	if ((vecLat.size() > 1) && (vecLat[0] > vecLat[vecLat.size()-1])) {
		std::reverse(vecLat.begin(), vecLat.end());
		return true;
	}
	return false;
}

///	<summary>
///		Read a time variable as seconds since 1970-01-01.  A variable with a
///		units attribute is decoded as CF time; a variable without one
///		already holds seconds since 1970-01-01.
///	</summary>
static void ReadTimeAsEpochSeconds(
	NcVar * varTime,
	const std::string & strFilename,
	std::vector<double> & vecTimes
) {
	NcAtt * attUnits = varTime->get_att("units");
	if (attUnits != NULL) {
		delete attUnits;
		ReadCFTimeDataFromNcVar(varTime, strFilename, vecTimes);
	} else {
		NcReadVarAsDouble(varTime, vecTimes);
	}
}

///	<summary>
///		Mean of the non-missing values.
///	</summary>
static double MeanIgnoringMissing(
	const std::vector<double> & vecValues
) {
	double dSum = 0.0;
	int nCount = 0;
	for (size_t i = 0; i < vecValues.size(); i++) {
		if (!IsMissing(vecValues[i])) {
			dSum += vecValues[i];
			nCount++;
		}
	}
	if (nCount == 0) {
		return MissingValue;
	}
	return dSum / static_cast<double>(nCount);
}

///////////////////////////////////////////////////////////////////////////////

void ReadGridDomainFromNcFile(
	const std::string & strFilename,
	GridDomain & grid
) {
	AnnounceStartBlock("Reading grid information \"%s\"", strFilename.c_str());

	NcFile ncfile(strFilename.c_str());
	if (!ncfile.is_valid()) {
		_EXCEPTION1("Unable to open grid information file \"%s\"",
			strFilename.c_str());
	}

	std::vector<double> vecLat;
	std::vector<double> vecLon;
	ReadCoordinate(ncfile, strFilename, "latitude", vecLat);
	ReadCoordinate(ncfile, strFilename, "longitude", vecLon);

	bool fFlip = MakeLatitudeAscending(vecLat);
	grid.SetCoordinates(vecLat, vecLon);

	DataArray2D<double> dataMask;
	NcReadVar2DAsDouble(NcGetRequiredVar(ncfile, strFilename, "mask"), dataMask);
	DataArray2D<double> dataDepth;
	NcReadVar2DAsDouble(NcGetRequiredVar(ncfile, strFilename, "depth"), dataDepth);
	DataArray2D<double> dataDistCoast;
	NcReadVar2DAsDouble(
		NcGetRequiredVar(ncfile, strFilename, "distcoast"), dataDistCoast);

	if (fFlip) {
		dataMask.FlipRows();
		dataDepth.FlipRows();
		dataDistCoast.FlipRows();
	}
	grid.SetMask(dataMask);
	grid.SetDepth(dataDepth);
	grid.SetDistanceToCoast(dataDistCoast);

	// Region fields X with name tables names_X
	const std::string strNamesPrefix("names_");
	for (int v = 0; v < ncfile.num_vars(); v++) {
		NcVar * varNames = ncfile.get_var(v);
		if (varNames == NULL) {
			continue;
		}
		std::string strVarName(varNames->name());
		if (strVarName.compare(0, strNamesPrefix.length(), strNamesPrefix) != 0) {
			continue;
		}

		std::string strField = strVarName.substr(strNamesPrefix.length());
		NcVar * varField = ncfile.get_var(strField.c_str());
		if (varField == NULL) {
			Announce("WARNING: Name table \"%s\" has no region field \"%s\"",
				strVarName.c_str(), strField.c_str());
			continue;
		}

		DataArray2D<double> dataIds;
		NcReadVar2DAsDouble(varField, dataIds);
		if (fFlip) {
			dataIds.FlipRows();
		}

		std::vector<std::string> vecNames;
		NcReadStringTable(varNames, vecNames);

		grid.AddRegionField(strField, dataIds, vecNames);
		Announce("Region field \"%s\" (%lu names)",
			strField.c_str(), vecNames.size());
	}

	grid.Validate();

	AnnounceEndBlock("Grid has %lu x %lu points",
		grid.GetLatitudes().size(), grid.GetLongitudes().size());
}

///////////////////////////////////////////////////////////////////////////////

void ReadCycloneRasterFromNcFiles(
	const std::vector<std::string> & vecFiles,
	const GridDomain & grid,
	double dMinTime,
	double dMaxTime,
	double dTolerance,
	CycloneRaster & raster
) {
	AnnounceStartBlock("Reading cyclone information");

	raster.SetCoordinates(grid.GetLatitudes(), grid.GetLongitudes());

	bool fHasLegend = false;

	for (size_t f = 0; f < vecFiles.size(); f++) {
		const std::string & strFilename = vecFiles[f];

		NcFile ncfile(strFilename.c_str());
		if (!ncfile.is_valid()) {
			_EXCEPTION1("Unable to open cyclone file \"%s\"",
				strFilename.c_str());
		}

		std::vector<double> vecLat;
		std::vector<double> vecLon;
		ReadCoordinate(ncfile, strFilename, "lat", vecLat);
		ReadCoordinate(ncfile, strFilename, "lon", vecLon);
		bool fFlip = MakeLatitudeAscending(vecLat);

		if (!grid.MatchesGrid(vecLat, vecLon)) {
			_EXCEPTION1("Grid of cyclone file \"%s\" differs from the grid "
				"information file", strFilename.c_str());
		}

		if (!fHasLegend) {
			NcAtt * attInfo = ncfile.get_att("info");
			if (attInfo != NULL) {
				char * szInfo = attInfo->as_string(0);
				std::vector<std::string> vecLegend;
				CycloneRaster::ParseLegend(
					std::string((szInfo == NULL)?(""):(szInfo)), vecLegend);
				delete[] szInfo;
				delete attInfo;

				raster.SetLegend(vecLegend);
				fHasLegend = true;
			}
		}

		NcVar * varTime = NcGetTimeVariable(ncfile);
		if (varTime == NULL) {
			_EXCEPTION1("Variable \"time\" not found in file \"%s\"",
				strFilename.c_str());
		}
		std::vector<double> vecTimes;
		ReadTimeAsEpochSeconds(varTime, strFilename, vecTimes);

		NcVar * varCmap = NcGetRequiredVar(ncfile, strFilename, "cmap");

		size_t sLoaded = 0;
		for (size_t t = 0; t < vecTimes.size(); t++) {
			if (IsMissing(vecTimes[t])) {
				continue;
			}
			if ((vecTimes[t] < dMinTime - dTolerance) ||
			    (vecTimes[t] > dMaxTime + dTolerance)
			) {
				continue;
			}

			DataArray2D<double> dataCodes;
			NcReadTimeSliceAsDouble(varCmap, static_cast<long>(t), dataCodes);
			if (fFlip) {
				dataCodes.FlipRows();
			}
			raster.AddSlice(vecTimes[t], dataCodes);
			sLoaded++;
		}

		Announce("%s: %lu of %lu slices",
			strFilename.c_str(), sLoaded, vecTimes.size());
	}

	if (!fHasLegend) {
		Announce("WARNING: No \"info\" attribute found in cyclone files");
	}

	AnnounceEndBlock("%lu slices loaded", raster.GetSliceCount());
}

///////////////////////////////////////////////////////////////////////////////
// NcModelPointFileReader
///////////////////////////////////////////////////////////////////////////////

bool NcModelPointFileReader::Read(
	const std::string & strFilename,
	ModelPointFileContents & contents
) {
	NcFile ncfile(strFilename.c_str());
	if (!ncfile.is_valid()) {
		return false;
	}

	NcReadStringTable(
		NcGetRequiredVar(ncfile, strFilename, "station_name"),
		contents.vecStations);

	ReadCFTimeDataFromNcFile(&ncfile, strFilename, contents.vecTime);

	size_t sStations = contents.vecStations.size();
	size_t sTimes = contents.vecTime.size();

	contents.vecSamples.clear();
	contents.vecSamples.resize(sStations, std::vector<WaveSample>(sTimes));

	// Variables stored as [time,station]
	const char * szVarNames[3] = {"hs", "tr", "th1m"};
	for (int iVar = 0; iVar < 3; iVar++) {
		NcVar * var = ncfile.get_var(szVarNames[iVar]);
		if (var == NULL) {
			if (iVar == 0) {
				_EXCEPTION1("Variable \"hs\" not found in file \"%s\"",
					strFilename.c_str());
			}
			Announce(1, "Variable \"%s\" not found in file \"%s\"",
				szVarNames[iVar], strFilename.c_str());
			continue;
		}

		std::vector<double> vecValues;
		NcReadVarAsDouble(var, vecValues);
		if (vecValues.size() != sTimes * sStations) {
			_EXCEPTION3("Variable \"%s\" in file \"%s\" must have dimensions "
				"[time,station] (%lu values)",
				szVarNames[iVar], strFilename.c_str(), vecValues.size());
		}

		for (size_t t = 0; t < sTimes; t++) {
		for (size_t s = 0; s < sStations; s++) {
			double dValue = vecValues[t * sStations + s];
			WaveSample & sample = contents.vecSamples[s][t];
			if (iVar == 0) {
				sample.dHs = dValue;
			} else if (iVar == 1) {
				sample.dTm = dValue;
			} else {
				sample.dDm = dValue;
			}
		}
		}
	}

	return true;
}

///////////////////////////////////////////////////////////////////////////////
// NcModelFieldFileReader
///////////////////////////////////////////////////////////////////////////////

NcModelFieldFileReader::NcModelFieldFileReader() :
	m_pncfile(NULL),
	m_varHs(NULL),
	m_varU(NULL),
	m_varV(NULL),
	m_fFlipLatitude(false)
{ }

///////////////////////////////////////////////////////////////////////////////

NcModelFieldFileReader::~NcModelFieldFileReader() {
	Close();
}

///////////////////////////////////////////////////////////////////////////////

bool NcModelFieldFileReader::Open(
	const std::string & strFilename
) {
	Close();

	m_pncfile = new NcFile(strFilename.c_str());
	if (!m_pncfile->is_valid()) {
		Close();
		return false;
	}
	m_strFilename = strFilename;

	ReadCoordinate(*m_pncfile, strFilename, "latitude", m_vecLat);
	ReadCoordinate(*m_pncfile, strFilename, "longitude", m_vecLon);
	m_fFlipLatitude = MakeLatitudeAscending(m_vecLat);
	for (size_t i = 0; i < m_vecLon.size(); i++) {
		m_vecLon[i] = LonDegToGridRange(m_vecLon[i]);
	}

	ReadCFTimeDataFromNcFile(m_pncfile, strFilename, m_vecTime);

	std::vector<std::string> vecHsNames;
	vecHsNames.push_back("hs");
	vecHsNames.push_back("HTSGW_surface");

	std::vector<std::string> vecUNames;
	vecUNames.push_back("uwnd");
	vecUNames.push_back("UGRD_surface");

	std::vector<std::string> vecVNames;
	vecVNames.push_back("vwnd");
	vecVNames.push_back("VGRD_surface");

	if (NcGetVarFromList(*m_pncfile, vecHsNames, &m_varHs) == vecHsNames.size()) {
		_EXCEPTION1("No wave height variable (hs, HTSGW_surface) in file \"%s\"",
			strFilename.c_str());
	}
	if (NcGetVarFromList(*m_pncfile, vecUNames, &m_varU) == vecUNames.size()) {
		_EXCEPTION1("No zonal wind variable (uwnd, UGRD_surface) in file \"%s\"",
			strFilename.c_str());
	}
	if (NcGetVarFromList(*m_pncfile, vecVNames, &m_varV) == vecVNames.size()) {
		_EXCEPTION1("No meridional wind variable (vwnd, VGRD_surface) in file \"%s\"",
			strFilename.c_str());
	}

	return true;
}

///////////////////////////////////////////////////////////////////////////////

void NcModelFieldFileReader::Close() {
	if (m_pncfile != NULL) {
		delete m_pncfile;
		m_pncfile = NULL;
	}
	m_strFilename = "";
	m_varHs = NULL;
	m_varU = NULL;
	m_varV = NULL;
	m_fFlipLatitude = false;
	m_vecLat.clear();
	m_vecLon.clear();
	m_vecTime.clear();
}

///////////////////////////////////////////////////////////////////////////////

void NcModelFieldFileReader::ReadFields(
	long lTimeIx,
	DataArray2D<double> & dataHs,
	DataArray2D<double> & dataWnd
) {
	if (m_pncfile == NULL) {
		_EXCEPTIONT("No model file is open");
	}

	NcReadTimeSliceAsDouble(m_varHs, lTimeIx, dataHs);

	DataArray2D<double> dataU;
	DataArray2D<double> dataV;
	NcReadTimeSliceAsDouble(m_varU, lTimeIx, dataU);
	NcReadTimeSliceAsDouble(m_varV, lTimeIx, dataV);

	if (!dataU.HasSameShape(dataHs) || !dataV.HasSameShape(dataHs)) {
		_EXCEPTION1("Wind and wave height fields differ in shape in file \"%s\"",
			m_strFilename.c_str());
	}

	dataWnd.Allocate(dataHs.GetRows(), dataHs.GetColumns());
	for (size_t i = 0; i < dataWnd.GetRows(); i++) {
	for (size_t j = 0; j < dataWnd.GetColumns(); j++) {
		if (IsMissing(dataU(i,j)) || IsMissing(dataV(i,j))) {
			dataWnd(i,j) = MissingValue;
		} else {
			dataWnd(i,j) = sqrt(dataU(i,j) * dataU(i,j) + dataV(i,j) * dataV(i,j));
		}
	}
	}

	if (m_fFlipLatitude) {
		dataHs.FlipRows();
		dataWnd.FlipRows();
	}
}

///////////////////////////////////////////////////////////////////////////////
// NcNdbcBuoySource
///////////////////////////////////////////////////////////////////////////////

bool NcNdbcBuoySource::Load(
	const std::string & strStation,
	const std::vector<int> & vecYears,
	BuoyObservationSeries & series
) {
	series.Clear();

	std::vector<double> vecLat;
	std::vector<double> vecLon;

	for (size_t y = 0; y < vecYears.size(); y++) {
		char szYear[16];
		snprintf(szYear, 16, "%i", vecYears[y]);
		std::string strFilename =
			m_strDirectory + "/" + strStation + "h" + szYear + ".nc";

		NcFile ncfile(strFilename.c_str());
		if (!ncfile.is_valid()) {
			Announce(1, "NDBC file \"%s\" not available", strFilename.c_str());
			continue;
		}

		std::vector<double> vecTime;
		ReadTimeAsEpochSeconds(
			NcGetRequiredVar(ncfile, strFilename, "time"), strFilename, vecTime);

		// Variables stored as [time,1,1]
		std::vector<double> vecValues[3];
		const char * szVarNames[3] = {"wave_height", "average_wpd", "mean_wave_dir"};
		for (int iVar = 0; iVar < 3; iVar++) {
			NcVar * var = ncfile.get_var(szVarNames[iVar]);
			if (var == NULL) {
				vecValues[iVar].assign(vecTime.size(), MissingValue);
				continue;
			}
			NcReadVarAsDouble(var, vecValues[iVar]);
			if (vecValues[iVar].size() != vecTime.size()) {
				_EXCEPTION2("Variable \"%s\" in file \"%s\" must have "
					"dimensions [time,1,1]", szVarNames[iVar], strFilename.c_str());
			}
		}

		for (size_t t = 0; t < vecTime.size(); t++) {
			series.vecTime.push_back(vecTime[t]);
			series.vecSamples.push_back(
				WaveSample(vecValues[0][t], vecValues[1][t], vecValues[2][t],
					MissingValue));
		}

		std::vector<double> vecFileLat;
		std::vector<double> vecFileLon;
		NcReadVarAsDouble(
			NcGetRequiredVar(ncfile, strFilename, "latitude"), vecFileLat);
		NcReadVarAsDouble(
			NcGetRequiredVar(ncfile, strFilename, "longitude"), vecFileLon);
		vecLat.insert(vecLat.end(), vecFileLat.begin(), vecFileLat.end());
		vecLon.insert(vecLon.end(), vecFileLon.begin(), vecFileLon.end());
	}

	if (series.vecTime.size() == 0) {
		series.Clear();
		return false;
	}

	series.dLat = MeanIgnoringMissing(vecLat);
	series.dLon = MeanIgnoringMissing(vecLon);
	return true;
}

///////////////////////////////////////////////////////////////////////////////
// NcCopernicusBuoySource
///////////////////////////////////////////////////////////////////////////////

bool NcCopernicusBuoySource::Load(
	const std::string & strStation,
	const std::vector<int> & vecYears,
	BuoyObservationSeries & series
) {
	series.Clear();

	std::string strFilename =
		m_strDirectory + "/GL_TS_MO_" + strStation + ".nc";

	NcFile ncfile(strFilename.c_str());
	if (!ncfile.is_valid()) {
		return false;
	}

	NcVar * varTime = NcGetRequiredVar(ncfile, strFilename, "TIME");
	ReadCFTimeDataFromNcVar(varTime, strFilename, series.vecTime);

	size_t sTimes = series.vecTime.size();
	series.vecSamples.resize(sTimes);

	// Variables stored as [TIME,DEPTH], averaged over depth
	const char * szVarNames[3] = {"VHM0", "VTM02", "VMDR"};
	for (int iVar = 0; iVar < 3; iVar++) {
		NcVar * var = ncfile.get_var(szVarNames[iVar]);
		if (var == NULL) {
			continue;
		}

		std::vector<double> vecValues;
		NcReadVarAsDouble(var, vecValues);
		if ((sTimes == 0) || (vecValues.size() % sTimes != 0)) {
			_EXCEPTION2("Variable \"%s\" in file \"%s\" must have dimensions "
				"[TIME,DEPTH]", szVarNames[iVar], strFilename.c_str());
		}
		size_t sDepths = vecValues.size() / sTimes;

		for (size_t t = 0; t < sTimes; t++) {
			std::vector<double> vecLevels(
				vecValues.begin() + t * sDepths,
				vecValues.begin() + (t + 1) * sDepths);
			double dMean = MeanIgnoringMissing(vecLevels);

			WaveSample & sample = series.vecSamples[t];
			if (iVar == 0) {
				sample.dHs = dMean;
			} else if (iVar == 1) {
				sample.dTm = dMean;
			} else {
				sample.dDm = dMean;
			}
		}
	}

	std::vector<double> vecLat;
	std::vector<double> vecLon;
	NcReadVarAsDouble(NcGetRequiredVar(ncfile, strFilename, "LATITUDE"), vecLat);
	NcReadVarAsDouble(NcGetRequiredVar(ncfile, strFilename, "LONGITUDE"), vecLon);
	series.dLat = MeanIgnoringMissing(vecLat);
	series.dLon = MeanIgnoringMissing(vecLon);

	return (sTimes != 0);
}

///////////////////////////////////////////////////////////////////////////////

void ReadSatelliteFiles(
	const std::vector<std::string> & vecFiles,
	double dModelMinTime,
	double dModelMaxTime,
	double dMargin,
	std::vector<SatelliteSample> & vecSamples
) {
	AnnounceStartBlock("Reading altimeter data");

	vecSamples.clear();

	std::vector<std::string> vecWndNames;
	vecWndNames.push_back("wndcal");
	vecWndNames.push_back("wnd");

	std::vector<std::string> vecHsNames;
	vecHsNames.push_back("hskcal");
	vecHsNames.push_back("hskucal");
	vecHsNames.push_back("hs");

	for (size_t f = 0; f < vecFiles.size(); f++) {
		const std::string & strFilename = vecFiles[f];

		SatelliteMission eMission = SatelliteMissionFromFilename(strFilename);

		NcFile ncfile(strFilename.c_str());
		if (!ncfile.is_valid()) {
			Announce("WARNING: Cannot open satellite file \"%s\"; skipping",
				strFilename.c_str());
			continue;
		}

		std::vector<double> vecTime;
		ReadTimeAsEpochSeconds(
			NcGetRequiredVar(ncfile, strFilename, "stime"), strFilename, vecTime);

		if (!SatelliteTimesOverlapModel(vecTime, dModelMinTime, dModelMaxTime)) {
			Announce("WARNING: Satellite file \"%s\" time range outside the "
				"model time interval; skipping", strFilename.c_str());
			continue;
		}

		std::vector<double> vecLat;
		std::vector<double> vecLon;
		NcReadVarAsDouble(
			NcGetRequiredVar(ncfile, strFilename, "latitude"), vecLat);
		NcReadVarAsDouble(
			NcGetRequiredVar(ncfile, strFilename, "longitude"), vecLon);

		NcVar * varWnd = NULL;
		if (NcGetVarFromList(ncfile, vecWndNames, &varWnd) == vecWndNames.size()) {
			_EXCEPTION1("No wind speed variable (wndcal, wnd) in file \"%s\"",
				strFilename.c_str());
		}
		NcVar * varHs = NULL;
		if (NcGetVarFromList(ncfile, vecHsNames, &varHs) == vecHsNames.size()) {
			_EXCEPTION1("No wave height variable (hskcal, hskucal, hs) in file \"%s\"",
				strFilename.c_str());
		}

		std::vector<double> vecWnd;
		std::vector<double> vecHs;
		NcReadVarAsDouble(varWnd, vecWnd);
		NcReadVarAsDouble(varHs, vecHs);

		size_t sCount = vecTime.size();
		if ((vecLat.size() != sCount) || (vecLon.size() != sCount) ||
		    (vecWnd.size() != sCount) || (vecHs.size() != sCount)
		) {
			_EXCEPTION1("Satellite variables differ in length in file \"%s\"",
				strFilename.c_str());
		}

		for (size_t i = 0; i < sCount; i++) {
			SatelliteSample sample;
			sample.dTime = vecTime[i];
			sample.dLat = vecLat[i];
			sample.dLon =
				(IsMissing(vecLon[i]))?(MissingValue):(LonDegToGridRange(vecLon[i]));
			sample.sample.dHs = vecHs[i];
			sample.sample.dWnd = vecWnd[i];
			sample.eMission = eMission;
			vecSamples.push_back(sample);
		}

		Announce("%s: %lu samples (%s)", strFilename.c_str(), sCount,
			SatelliteMissionName(eMission).c_str());
	}

	SelectSatelliteSamplesInWindow(
		vecSamples, dModelMinTime, dModelMaxTime, dMargin);

	AnnounceEndBlock("%lu samples within the model time window",
		vecSamples.size());
}

///////////////////////////////////////////////////////////////////////////////

