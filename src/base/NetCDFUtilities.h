///////////////////////////////////////////////////////////////////////////////
///
///	\file    NetCDFUtilities.h
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

#ifndef _NETCDFUTILITIES_H_
#define _NETCDFUTILITIES_H_

#include "netcdfcpp.h"
#include "DataArray2D.h"

#include <string>
#include <vector>

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Load one of several possible names for a given variable.
///	</summary>
///	<returns>
///		The index in the vecVarNames array of the variable found, or
///		vecVarNames.size() if not found.
///	</returns>
size_t NcGetVarFromList(
	NcFile & ncFile,
	const std::vector<std::string> & vecVarNames,
	NcVar ** pvar = NULL,
	NcDim ** pdim = NULL
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get a variable from the NetCDF file, or throw if it is not present.
///	</summary>
NcVar * NcGetRequiredVar(
	NcFile & ncFile,
	const std::string & strFilename,
	const std::string & strVarName
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get the time variable from the NetCDF file.
///	</summary>
NcVar * NcGetTimeVariable(
	NcFile & ncFile
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Insert a new dimension into the NcFile, or use existing.
///	</summary>
NcDim * AddNcDimOrUseExisting(
	NcFile & ncFile,
	const std::string & strDimName,
	long lDimSize
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Read a CF-compliant time variable and convert each value to seconds
///		since 1970-01-01.  The "calendar" attribute must be absent or one of
///		the standard Gregorian calendars.
///	</summary>
void ReadCFTimeDataFromNcVar(
	NcVar * varTime,
	const std::string & strFilename,
	std::vector<double> & vecEpochSeconds
);

///	<summary>
///		Read the time axis of a file (see NcGetTimeVariable) as seconds
///		since 1970-01-01.
///	</summary>
void ReadCFTimeDataFromNcFile(
	NcFile * ncfile,
	const std::string & strFilename,
	std::vector<double> & vecEpochSeconds
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Read all values of a variable as doubles.  Values equal to the
///		_FillValue or missing_value attribute are replaced by MissingValue
///		and scale_factor / add_offset are applied.
///	</summary>
void NcReadVarAsDouble(
	NcVar * var,
	std::vector<double> & vecValues
);

///	<summary>
///		Read one time slice var[lTime,:,:] of a three dimensional variable,
///		with missing values handled as in NcReadVarAsDouble.
///	</summary>
void NcReadTimeSliceAsDouble(
	NcVar * var,
	long lTime,
	DataArray2D<double> & data
);

///	<summary>
///		Read a two dimensional variable var[:,:] with missing values handled
///		as in NcReadVarAsDouble.
///	</summary>
void NcReadVar2DAsDouble(
	NcVar * var,
	DataArray2D<double> & data
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Read a [count,length] character variable as a list of strings.
///		Trailing NUL and whitespace characters are removed.
///	</summary>
void NcReadStringTable(
	NcVar * var,
	std::vector<std::string> & vecStrings
);

///	<summary>
///		Write a list of strings as a [count,length] character variable.
///	</summary>
NcVar * NcWriteStringTable(
	NcFile & ncFile,
	const std::string & strVarName,
	const std::vector<std::string> & vecStrings
);

////////////////////////////////////////////////////////////////////////////////

#endif

