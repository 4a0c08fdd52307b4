///////////////////////////////////////////////////////////////////////////////
///
///	\file    MatchupWriter.h
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

#ifndef _MATCHUPWRITER_H_
#define _MATCHUPWRITER_H_

#include <string>

class MatchupSet;

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Fill value of integer output variables.
///	</summary>
static const short MatchupShortFillValue = -999;

///	<summary>
///		Write a MatchupSet as a NetCDF file in strOutputDir, named after
///		MatchupSet::GetOutputFilename.  Records are written along the
///		"index" dimension.
///	</summary>
///	<returns>
///		The path of the file written.
///	</returns>
std::string WriteMatchupSetToNcFile(
	const MatchupSet & matchups,
	const std::string & strOutputDir,
	const std::string & strTag
);

///////////////////////////////////////////////////////////////////////////////

#endif

