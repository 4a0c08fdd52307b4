///////////////////////////////////////////////////////////////////////////////
///
///	\file    FilenameList.h
///	\author  Paul Ullrich
///	\version March 4, 2024
///
///	<remarks>
///		Copyright 2020-2024 Paul Ullrich
///
///		This file is distributed as part of the WaveMatchup source code
///		package.  Permission is granted to use, copy, modify and distribute
///		this source code and its documentation under the terms of the GNU
///		General Public License.  This software is provided "as is" without
///		express or implied warranty.
///	</remarks>

#ifndef _FILENAMELIST_H_
#define _FILENAMELIST_H_

#include "Exception.h"
#include "STLStringHelper.h"

#include <string>
#include <fstream>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		An ordered list of filenames.  Order is significant: model files
///		are aggregated in list order.
///	</summary>
class FilenameList : public std::vector<std::string> {

public:
	///	<summary>
	///		Parse the filename list from a text file with one filename per
	///		line.  Blank lines and lines starting with '#' are ignored.
	///	</summary>
	void FromFile(
		const std::string & strFileListFile
	) {
		std::ifstream ifFileList(strFileListFile.c_str());
		if (!ifFileList.is_open()) {
			_EXCEPTION1("Unable to open file \"%s\"",
				strFileListFile.c_str());
		}
		std::string strFileLine;
		while (std::getline(ifFileList, strFileLine)) {
			STLStringHelper::RemoveWhitespaceInPlace(strFileLine);
			if (strFileLine.length() == 0) {
				continue;
			}
			if (strFileLine[0] == '#') {
				continue;
			}
			push_back(strFileLine);
		}
		if (size() == 0) {
			_EXCEPTION1("No filenames found in \"%s\"",
				strFileListFile.c_str());
		}
	}
};

///////////////////////////////////////////////////////////////////////////////

#endif

