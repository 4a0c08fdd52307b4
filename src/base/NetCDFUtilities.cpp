///////////////////////////////////////////////////////////////////////////////
///
///	\file    NetCDFUtilities.cpp
///	\author  Paul Ullrich
///	\version March 4, 2024
///
///	<remarks>
///		Copyright 2000-2024 Paul Ullrich
///
///		This file is distributed as part of the WaveMatchup source code
///		package.  Permission is granted to use, copy, modify and distribute
///		this source code and its documentation under the terms of the GNU
///		General Public License.  This software is provided "as is" without
///		express or implied warranty.
///	</remarks>

#include "Defines.h"
#include "NetCDFUtilities.h"
#include "Exception.h"
#include "Announce.h"
#include "STLStringHelper.h"
#include "TimeObj.h"
#include "netcdfcpp.h"

#include <cstring>
#include <cmath>
#include <vector>

////////////////////////////////////////////////////////////////////////////////

size_t NcGetVarFromList(
	NcFile & ncFile,
	const std::vector<std::string> & vecVarNames,
	NcVar ** pvar,
	NcDim ** pdim
) {
	for (size_t v = 0; v < vecVarNames.size(); v++) {
		NcVar * var = ncFile.get_var(vecVarNames[v].c_str());
		if (var != NULL) {
			if (pvar != NULL) {
				(*pvar) = var;
			}

			if (pdim != NULL) {
				NcDim * dim = ncFile.get_dim(vecVarNames[v].c_str());
				if (dim != NULL) {
					(*pdim) = dim;
				} else {
					(*pdim) = NULL;
				}
			}
			return v;
		}
	}
	return vecVarNames.size();
}

////////////////////////////////////////////////////////////////////////////////

NcVar * NcGetRequiredVar(
	NcFile & ncFile,
	const std::string & strFilename,
	const std::string & strVarName
) {
	NcVar * var = ncFile.get_var(strVarName.c_str());
	if (var == NULL) {
		_EXCEPTION2("Variable \"%s\" not found in file \"%s\"",
			strVarName.c_str(), strFilename.c_str());
	}
	return var;
}

////////////////////////////////////////////////////////////////////////////////

NcVar * NcGetTimeVariable(
	NcFile & ncFile
) {
	NcVar * var = ncFile.get_var("time");
	if (var != NULL) {
		return var;
	}

	var = ncFile.get_var("Time");
	if (var != NULL) {
		return var;
	}

	var = ncFile.get_var("TIME");
	if (var != NULL) {
		return var;
	}

	return NULL;
}

////////////////////////////////////////////////////////////////////////////////

NcDim * AddNcDimOrUseExisting(
	NcFile & ncFile,
	const std::string & strDimName,
	long lDimSize
) {
	NcDim * dim = ncFile.get_dim(strDimName.c_str());
	if (dim == NULL) {
		dim = ncFile.add_dim(strDimName.c_str(), lDimSize);
		if (dim == NULL) {
			_EXCEPTION2("Error adding dimension \"%s\" (%li) to file",
				strDimName.c_str(), lDimSize);
		}
	} else if (dim->size() != lDimSize) {
		_EXCEPTION3("Attempting to redefine dimension \"%s\" from size %li to %li",
			strDimName.c_str(), dim->size(), lDimSize);
	}
	return dim;
}

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get a string attribute of a variable, or an empty string if absent.
///	</summary>
static std::string NcGetVarAttAsString(
	NcVar * var,
	const char * szAttName
) {
	NcAtt * att = var->get_att(szAttName);
	if (att == NULL) {
		return std::string("");
	}
	char * szValue = att->as_string(0);
	std::string strValue((szValue == NULL)?(""):(szValue));
	delete[] szValue;
	delete att;
	return strValue;
}

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get a numeric attribute of a variable.
///	</summary>
static bool NcGetVarAttAsDouble(
	NcVar * var,
	const char * szAttName,
	double & dValue
) {
	NcAtt * att = var->get_att(szAttName);
	if (att == NULL) {
		return false;
	}
	if (att->type() == ncChar) {
		delete att;
		return false;
	}
	dValue = att->as_double(0);
	delete att;
	return true;
}

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Packing and fill attributes applied to raw variable values.
///	</summary>
struct NcValueDecoder {
	NcValueDecoder(NcVar * var) :
		fHasFillValue(false),
		fHasMissingValue(false),
		dFillValue(0.0),
		dMissingValue(0.0),
		dScaleFactor(1.0),
		dAddOffset(0.0)
	{
		fHasFillValue = NcGetVarAttAsDouble(var, "_FillValue", dFillValue);
		fHasMissingValue = NcGetVarAttAsDouble(var, "missing_value", dMissingValue);
		NcGetVarAttAsDouble(var, "scale_factor", dScaleFactor);
		NcGetVarAttAsDouble(var, "add_offset", dAddOffset);
	}

	double Decode(double dRaw) const {
		if (fHasFillValue && (dRaw == dFillValue)) {
			return MissingValue;
		}
		if (fHasMissingValue && (dRaw == dMissingValue)) {
			return MissingValue;
		}
		return dRaw * dScaleFactor + dAddOffset;
	}

	bool fHasFillValue;
	bool fHasMissingValue;
	double dFillValue;
	double dMissingValue;
	double dScaleFactor;
	double dAddOffset;
};

////////////////////////////////////////////////////////////////////////////////

void ReadCFTimeDataFromNcVar(
	NcVar * varTime,
	const std::string & strFilename,
	std::vector<double> & vecEpochSeconds
) {
	_ASSERT(varTime != NULL);

	vecEpochSeconds.clear();

	if (varTime->num_dims() > 1) {
		_EXCEPTION2("Variable \"%s\" has more than one dimension in file \"%s\"",
			varTime->name(), strFilename.c_str());
	}

	// Calendar attribute
	std::string strCalendar = NcGetVarAttAsString(varTime, "calendar");
	if (strCalendar != "") {
		if (Time::CalendarTypeFromString(strCalendar) == Time::CalendarUnknown) {
			_EXCEPTION3("Variable \"%s\" has unsupported calendar \"%s\" in file \"%s\"",
				varTime->name(), strCalendar.c_str(), strFilename.c_str());
		}
	}

	// Units attribute
	std::string strUnits = NcGetVarAttAsString(varTime, "units");
	if (strUnits == "") {
		_EXCEPTION2("Variable \"%s\" is missing \"units\" attribute in file \"%s\"",
			varTime->name(), strFilename.c_str());
	}

	std::vector<double> vecOffsets;
	NcReadVarAsDouble(varTime, vecOffsets);

	vecEpochSeconds.resize(vecOffsets.size());
	for (size_t t = 0; t < vecOffsets.size(); t++) {
		if (IsMissing(vecOffsets[t])) {
			vecEpochSeconds[t] = MissingValue;
			continue;
		}

		Time time;
		time.FromCFCompliantUnitsOffsetDouble(strUnits, vecOffsets[t]);
		vecEpochSeconds[t] = time.GetEpochSeconds();

#if defined(ROUND_TIMES_TO_NEAREST_SECOND)
		vecEpochSeconds[t] = floor(vecEpochSeconds[t] + 0.5);
#endif
	}
}

////////////////////////////////////////////////////////////////////////////////

void ReadCFTimeDataFromNcFile(
	NcFile * ncfile,
	const std::string & strFilename,
	std::vector<double> & vecEpochSeconds
) {
	_ASSERT(ncfile != NULL);

	NcVar * varTime = NcGetTimeVariable(*ncfile);
	if (varTime == NULL) {
		_EXCEPTION1("Variable \"time\" not found in file \"%s\"",
			strFilename.c_str());
	}

	ReadCFTimeDataFromNcVar(varTime, strFilename, vecEpochSeconds);
}

////////////////////////////////////////////////////////////////////////////////

void NcReadVarAsDouble(
	NcVar * var,
	std::vector<double> & vecValues
) {
	_ASSERT(var != NULL);

	NcValueDecoder decoder(var);

	long lCount = var->num_vals();
	vecValues.resize(lCount);
	if (lCount == 0) {
		return;
	}

	NcValues * pValues = var->values();
	if (pValues == NULL) {
		_EXCEPTION1("Unable to read values of variable \"%s\"", var->name());
	}
	for (long i = 0; i < lCount; i++) {
		vecValues[i] = decoder.Decode(pValues->as_double(i));
	}
	delete pValues;
}

////////////////////////////////////////////////////////////////////////////////

void NcReadTimeSliceAsDouble(
	NcVar * var,
	long lTime,
	DataArray2D<double> & data
) {
	_ASSERT(var != NULL);

	if (var->num_dims() != 3) {
		_EXCEPTION1("Variable \"%s\" must have dimensions [time,lat,lon]",
			var->name());
	}

	long lRows = var->get_dim(1)->size();
	long lColumns = var->get_dim(2)->size();

	if ((lTime < 0) || (lTime >= var->get_dim(0)->size())) {
		_EXCEPTION2("Time index %li out of range for variable \"%s\"",
			lTime, var->name());
	}

	data.Allocate(lRows, lColumns);

	var->set_cur(lTime, 0, 0);
	if (!var->get(data.data(), 1, lRows, lColumns)) {
		_EXCEPTION2("Unable to read time slice %li of variable \"%s\"",
			lTime, var->name());
	}

	NcValueDecoder decoder(var);
	for (size_t i = 0; i < data.GetRows(); i++) {
	for (size_t j = 0; j < data.GetColumns(); j++) {
		data(i,j) = decoder.Decode(data(i,j));
	}
	}
}

////////////////////////////////////////////////////////////////////////////////

void NcReadVar2DAsDouble(
	NcVar * var,
	DataArray2D<double> & data
) {
	_ASSERT(var != NULL);

	if (var->num_dims() != 2) {
		_EXCEPTION1("Variable \"%s\" must have dimensions [lat,lon]",
			var->name());
	}

	long lRows = var->get_dim(0)->size();
	long lColumns = var->get_dim(1)->size();

	data.Allocate(lRows, lColumns);

	var->set_cur(0, 0);
	if (!var->get(data.data(), lRows, lColumns)) {
		_EXCEPTION1("Unable to read variable \"%s\"", var->name());
	}

	NcValueDecoder decoder(var);
	for (size_t i = 0; i < data.GetRows(); i++) {
	for (size_t j = 0; j < data.GetColumns(); j++) {
		data(i,j) = decoder.Decode(data(i,j));
	}
	}
}

////////////////////////////////////////////////////////////////////////////////

void NcReadStringTable(
	NcVar * var,
	std::vector<std::string> & vecStrings
) {
	_ASSERT(var != NULL);

	vecStrings.clear();

	if ((var->type() != ncChar) || (var->num_dims() != 2)) {
		_EXCEPTION1("Variable \"%s\" must be a [count,length] character array",
			var->name());
	}

	long lCount = var->get_dim(0)->size();
	long lLength = var->get_dim(1)->size();
	if ((lCount == 0) || (lLength == 0)) {
		return;
	}

	std::vector<char> vecChars(lCount * lLength, '\0');
	var->set_cur(0, 0);
	if (!var->get(&(vecChars[0]), lCount, lLength)) {
		_EXCEPTION1("Unable to read variable \"%s\"", var->name());
	}

	for (long s = 0; s < lCount; s++) {
		const char * szBegin = &(vecChars[s * lLength]);
		size_t sLength = 0;
		while ((sLength < static_cast<size_t>(lLength)) && (szBegin[sLength] != '\0')) {
			sLength++;
		}
		std::string strValue(szBegin, sLength);
		STLStringHelper::RemoveWhitespaceInPlace(strValue);
		vecStrings.push_back(strValue);
	}
}

////////////////////////////////////////////////////////////////////////////////

NcVar * NcWriteStringTable(
	NcFile & ncFile,
	const std::string & strVarName,
	const std::vector<std::string> & vecStrings
) {
	size_t sMaxLength = 1;
	for (size_t s = 0; s < vecStrings.size(); s++) {
		if (vecStrings[s].length() > sMaxLength) {
			sMaxLength = vecStrings[s].length();
		}
	}
	long lCount = static_cast<long>((vecStrings.size() == 0)?(1):(vecStrings.size()));
	long lLength = static_cast<long>(sMaxLength);

	NcDim * dimCount =
		AddNcDimOrUseExisting(ncFile, strVarName + "_count", lCount);
	NcDim * dimLength =
		AddNcDimOrUseExisting(ncFile, strVarName + "_length", lLength);

	NcVar * var = ncFile.add_var(strVarName.c_str(), ncChar, dimCount, dimLength);
	if (var == NULL) {
		_EXCEPTION1("Unable to add variable \"%s\"", strVarName.c_str());
	}

	std::vector<char> vecChars(lCount * lLength, '\0');
	for (size_t s = 0; s < vecStrings.size(); s++) {
		memcpy(&(vecChars[s * lLength]),
			vecStrings[s].c_str(), vecStrings[s].length());
	}

	var->set_cur(0, 0);
	if (!var->put(&(vecChars[0]), lCount, lLength)) {
		_EXCEPTION1("Unable to write variable \"%s\"", strVarName.c_str());
	}
	return var;
}

////////////////////////////////////////////////////////////////////////////////

