///////////////////////////////////////////////////////////////////////////////
///
///	\file    STLStringHelper.h
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

#ifndef _STLSTRINGHELPER_H_
#define _STLSTRINGHELPER_H_

#include <string>
#include <vector>

#include <cctype>

///	<summary>
///		This class exposes additional functionality which can be used to
///		supplement the STL string class.
///	</summary>
class STLStringHelper {

///////////////////////////////////////////////////////////////////////////////

private:
STLStringHelper() { }

public:

///////////////////////////////////////////////////////////////////////////////

inline static void ToLower(std::string &str) {
	for (size_t i = 0; i < str.length(); i++) {
		str[i] = static_cast<char>(tolower(static_cast<unsigned char>(str[i])));
	}
}

///////////////////////////////////////////////////////////////////////////////

inline static void ToUpper(std::string &str) {
	for (size_t i = 0; i < str.length(); i++) {
		str[i] = static_cast<char>(toupper(static_cast<unsigned char>(str[i])));
	}
}

///////////////////////////////////////////////////////////////////////////////

inline static bool IsWhitespace(char c) {
	return ((c == ' ') || (c == '\t') || (c == '\r') || (c == '\n'));
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Strip leading and trailing whitespace.
///	</summary>
static void RemoveWhitespaceInPlace(
	std::string & strString
) {
	size_t sBegin = 0;
	while ((sBegin < strString.length()) && IsWhitespace(strString[sBegin])) {
		sBegin++;
	}
	size_t sEnd = strString.length();
	while ((sEnd > sBegin) && IsWhitespace(strString[sEnd-1])) {
		sEnd--;
	}
	strString = strString.substr(sBegin, sEnd - sBegin);
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Split a string on a delimiter.  Empty tokens are retained.
///	</summary>
static void Split(
	const std::string & strString,
	char cDelimiter,
	std::vector<std::string> & vecTokens
) {
	vecTokens.clear();
	size_t sBegin = 0;
	for (;;) {
		size_t sPos = strString.find(cDelimiter, sBegin);
		if (sPos == std::string::npos) {
			vecTokens.push_back(strString.substr(sBegin));
			break;
		}
		vecTokens.push_back(strString.substr(sBegin, sPos - sBegin));
		sBegin = sPos + 1;
	}
}

///////////////////////////////////////////////////////////////////////////////

static std::string ConcatenateStringVector(
	const std::vector< std::string > & vecStrings,
	const std::string & strDelimiter
) {
	std::string strConcat;
	for (size_t v = 0; v < vecStrings.size(); v++) {
		strConcat += vecStrings[v];
		if (v != vecStrings.size() - 1) {
			strConcat += strDelimiter;
		}
	}
	return strConcat;
}

///////////////////////////////////////////////////////////////////////////////

};

#endif

