///////////////////////////////////////////////////////////////////////////////
///
///	\file    MatchupWriter.cpp
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

#include "MatchupWriter.h"
#include "MatchupAssembler.h"
#include "NetCDFUtilities.h"
#include "Announce.h"
#include "Exception.h"
#include "netcdfcpp.h"

#include <cstdio>
#include <cmath>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Write a per-record floating point variable.
///	</summary>
static NcVar * PutRecordVariable(
	NcFile & ncfile,
	NcDim * dimIndex,
	const char * szName,
	NcType nctype,
	const std::vector<double> & vecValues,
	const char * szUnits
) {
	NcVar * var = ncfile.add_var(szName, nctype, dimIndex);
	if (var == NULL) {
		_EXCEPTION1("Unable to add variable \"%s\"", szName);
	}
	if (szUnits != NULL) {
		var->add_att("units", szUnits);
	}

	if (nctype == ncDouble) {
		var->put(&(vecValues[0]), dimIndex->size());

	} else {
		std::vector<float> vecFloat(vecValues.size());
		for (size_t i = 0; i < vecValues.size(); i++) {
			vecFloat[i] = static_cast<float>(vecValues[i]);
		}
		var->put(&(vecFloat[0]), dimIndex->size());
	}
	return var;
}

///	<summary>
///		Write a per-record integer variable.  Missing values are written
///		as MatchupShortFillValue.
///	</summary>
static NcVar * PutRecordShortVariable(
	NcFile & ncfile,
	NcDim * dimIndex,
	const char * szName,
	const std::vector<double> & vecValues
) {
	NcVar * var = ncfile.add_var(szName, ncShort, dimIndex);
	if (var == NULL) {
		_EXCEPTION1("Unable to add variable \"%s\"", szName);
	}
	var->add_att("_FillValue", MatchupShortFillValue);

	std::vector<short> vecShort(vecValues.size());
	for (size_t i = 0; i < vecValues.size(); i++) {
		if (IsMissing(vecValues[i])) {
			vecShort[i] = MatchupShortFillValue;
		} else {
			vecShort[i] = static_cast<short>(floor(vecValues[i] + 0.5));
		}
	}
	var->put(&(vecShort[0]), dimIndex->size());
	return var;
}

///////////////////////////////////////////////////////////////////////////////

std::string WriteMatchupSetToNcFile(
	const MatchupSet & matchups,
	const std::string & strOutputDir,
	const std::string & strTag
) {
	if (matchups.size() == 0) {
		_EXCEPTIONT("No matchups model/observation available");
	}

	std::string strOutputFile = matchups.GetOutputFilename(strTag);
	if (strOutputDir != "") {
		strOutputFile = strOutputDir + "/" + strOutputFile;
	}

	AnnounceStartBlock("Writing \"%s\"", strOutputFile.c_str());

	const std::vector<MatchupRecord> & vecRecords = matchups.m_vecRecords;
	const bool fBuoy = (matchups.m_eSourceType == MatchupSet::SourceType_Buoy);
	const size_t sCount = vecRecords.size();

	NcFile ncfile(strOutputFile.c_str(), NcFile::Replace);
	if (!ncfile.is_valid()) {
		_EXCEPTION1("Unable to open output file \"%s\"", strOutputFile.c_str());
	}

	char szHistory[256];
	snprintf(szHistory, 256,
		"Matchups of WAVEWATCHIII %s and %s. Total of %lu observations "
		"or pairs model/observation.",
		(fBuoy)?("point output (table)"):("gridded output"),
		(fBuoy)?("buoy data"):("altimeter data"),
		sCount);
	ncfile.add_att("history", szHistory);

	NcDim * dimIndex = ncfile.add_dim("index", static_cast<long>(sCount));
	if (dimIndex == NULL) {
		_EXCEPTIONT("Unable to add dimension \"index\"");
	}

	std::vector<double> vecValues(sCount);

	// Time and position
	for (size_t r = 0; r < sCount; r++) {
		vecValues[r] = vecRecords[r].dTime;
	}
	PutRecordVariable(ncfile, dimIndex, "time", ncDouble, vecValues,
		"seconds since 1970-01-01T00:00:00+00:00");

	for (size_t r = 0; r < sCount; r++) {
		vecValues[r] = static_cast<double>(vecRecords[r].iMonth);
	}
	PutRecordShortVariable(ncfile, dimIndex, "month", vecValues);

	for (size_t r = 0; r < sCount; r++) {
		vecValues[r] = vecRecords[r].dLat;
	}
	PutRecordVariable(ncfile, dimIndex, "latitude", ncFloat, vecValues,
		"degrees_north");

	for (size_t r = 0; r < sCount; r++) {
		vecValues[r] = vecRecords[r].dLon;
	}
	PutRecordVariable(ncfile, dimIndex, "longitude", ncFloat, vecValues,
		"degrees_east");

	if (matchups.m_fForecast) {
		for (size_t r = 0; r < sCount; r++) {
			vecValues[r] = vecRecords[r].dCycleTime;
		}
		PutRecordVariable(ncfile, dimIndex, "cycle", ncDouble, vecValues,
			"seconds since 1970-01-01T00:00:00+00:00");
	}

	// Source identity
	for (size_t r = 0; r < sCount; r++) {
		vecValues[r] = static_cast<double>(vecRecords[r].sSource);
	}
	if (fBuoy) {
		PutRecordShortVariable(ncfile, dimIndex, "buoyID", vecValues);
		NcWriteStringTable(ncfile, "names_buoy", matchups.m_vecSourceNames);
	} else {
		PutRecordShortVariable(ncfile, dimIndex, "satelliteID", vecValues);
		NcWriteStringTable(ncfile, "names_satellite", matchups.m_vecSourceNames);
	}

	// Static attributes
	if (matchups.m_fHasStatic) {
		for (size_t r = 0; r < sCount; r++) {
			vecValues[r] = vecRecords[r].dDepth;
		}
		PutRecordVariable(ncfile, dimIndex, "depth", ncFloat, vecValues, "m");

		for (size_t r = 0; r < sCount; r++) {
			vecValues[r] = vecRecords[r].dDistCoast;
		}
		PutRecordVariable(ncfile, dimIndex, "distcoast", ncFloat, vecValues, "km");

		for (size_t f = 0; f < matchups.m_vecRegionFieldNames.size(); f++) {
			for (size_t r = 0; r < sCount; r++) {
				if (f < vecRecords[r].vecRegionIds.size()) {
					vecValues[r] = vecRecords[r].vecRegionIds[f];
				} else {
					vecValues[r] = MissingValue;
				}
			}
			const std::string & strField = matchups.m_vecRegionFieldNames[f];
			PutRecordShortVariable(ncfile, dimIndex, strField.c_str(), vecValues);
			NcWriteStringTable(ncfile,
				std::string("names_") + strField,
				matchups.m_vecRegionNameTables[f]);
		}
	}

	// Cyclone attributes
	if (matchups.m_fHasCyclone) {
		for (size_t r = 0; r < sCount; r++) {
			vecValues[r] = vecRecords[r].dCyclone;
		}
		PutRecordShortVariable(ncfile, dimIndex, "cyclone", vecValues);
		NcWriteStringTable(ncfile, "cycloneinfo", matchups.m_vecCycloneLegend);
	}

	// Model and observed values
	for (size_t r = 0; r < sCount; r++) {
		vecValues[r] = vecRecords[r].model.dHs;
	}
	PutRecordVariable(ncfile, dimIndex, "model_hs", ncFloat, vecValues, "m");

	for (size_t r = 0; r < sCount; r++) {
		vecValues[r] = vecRecords[r].obs.dHs;
	}
	PutRecordVariable(ncfile, dimIndex, "obs_hs", ncFloat, vecValues, "m");

	if (fBuoy) {
		for (size_t r = 0; r < sCount; r++) {
			vecValues[r] = vecRecords[r].model.dTm;
		}
		PutRecordVariable(ncfile, dimIndex, "model_tm", ncFloat, vecValues, "s");

		for (size_t r = 0; r < sCount; r++) {
			vecValues[r] = vecRecords[r].obs.dTm;
		}
		PutRecordVariable(ncfile, dimIndex, "obs_tm", ncFloat, vecValues, "s");

		for (size_t r = 0; r < sCount; r++) {
			vecValues[r] = vecRecords[r].model.dDm;
		}
		PutRecordVariable(ncfile, dimIndex, "model_dm", ncFloat, vecValues, "degrees");

		for (size_t r = 0; r < sCount; r++) {
			vecValues[r] = vecRecords[r].obs.dDm;
		}
		PutRecordVariable(ncfile, dimIndex, "obs_dm", ncFloat, vecValues, "degrees");

	} else {
		for (size_t r = 0; r < sCount; r++) {
			vecValues[r] = vecRecords[r].model.dWnd;
		}
		PutRecordVariable(ncfile, dimIndex, "model_wnd", ncFloat, vecValues, "m/s");

		for (size_t r = 0; r < sCount; r++) {
			vecValues[r] = vecRecords[r].obs.dWnd;
		}
		PutRecordVariable(ncfile, dimIndex, "obs_wnd", ncFloat, vecValues, "m/s");
	}

	AnnounceEndBlock("%lu records written", sCount);

	return strOutputFile;
}

///////////////////////////////////////////////////////////////////////////////

