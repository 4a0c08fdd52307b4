///////////////////////////////////////////////////////////////////////////////
///
///	\file    test_string_helpers.cpp
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

#include <gtest/gtest.h>

#include "STLStringHelper.h"
#include "FilenameList.h"
#include "CoordTransforms.h"
#include "Exception.h"

#include <cstdio>
#include <fstream>

///////////////////////////////////////////////////////////////////////////////

TEST(STLStringHelperTest, RemoveWhitespace) {
	std::string str("  \tHurricane\r\n");
	STLStringHelper::RemoveWhitespaceInPlace(str);
	EXPECT_EQ(str, "Hurricane");

	std::string strBlank(" \t ");
	STLStringHelper::RemoveWhitespaceInPlace(strBlank);
	EXPECT_EQ(strBlank, "");
}

TEST(STLStringHelperTest, SplitKeepsEmptyTokens) {
	std::vector<std::string> vecTokens;
	STLStringHelper::Split("a;;b;", ';', vecTokens);
	ASSERT_EQ(vecTokens.size(), 4u);
	EXPECT_EQ(vecTokens[0], "a");
	EXPECT_EQ(vecTokens[1], "");
	EXPECT_EQ(vecTokens[2], "b");
	EXPECT_EQ(vecTokens[3], "");
}

TEST(STLStringHelperTest, CaseAndConcatenate) {
	std::string str("Jason3");
	STLStringHelper::ToUpper(str);
	EXPECT_EQ(str, "JASON3");
	STLStringHelper::ToLower(str);
	EXPECT_EQ(str, "jason3");

	std::vector<std::string> vecStrings;
	vecStrings.push_back("hs");
	vecStrings.push_back("tm");
	EXPECT_EQ(STLStringHelper::ConcatenateStringVector(vecStrings, ","), "hs,tm");
}

TEST(STLStringHelperTest, CaseConversionLeavesHighBytes) {
	// Latin-1 "Cap Ferr\xe9" as stored in some station attributes
	std::string str("Cap Ferr\xe9");
	STLStringHelper::ToUpper(str);
	ASSERT_EQ(str.length(), 9u);
	EXPECT_EQ(str.substr(0, 8), "CAP FERR");
	EXPECT_EQ(static_cast<unsigned char>(str[8]), 0xe9);

	STLStringHelper::ToLower(str);
	EXPECT_EQ(str.substr(0, 8), "cap ferr");
	EXPECT_EQ(static_cast<unsigned char>(str[8]), 0xe9);
}

///////////////////////////////////////////////////////////////////////////////

TEST(CoordTransformsTest, LongitudeConventions) {
	EXPECT_DOUBLE_EQ(LonDegToGridRange(-90.0), 270.0);
	EXPECT_DOUBLE_EQ(LonDegToGridRange(90.0), 90.0);
	EXPECT_DOUBLE_EQ(LonDegToGridRange(LonDegToGridRange(-0.5)), 359.5);

	EXPECT_DOUBLE_EQ(LonDegToSignedRange(270.0), -90.0);
	EXPECT_DOUBLE_EQ(LonDegToSignedRange(180.0), -180.0);
	EXPECT_DOUBLE_EQ(LonDegToSignedRange(179.5), 179.5);
	EXPECT_DOUBLE_EQ(LonDegToSignedRange(LonDegToGridRange(-75.25)), -75.25);
}

///////////////////////////////////////////////////////////////////////////////

TEST(FilenameListTest, SkipsCommentsAndBlankLines) {
	std::string strListFile = ::testing::TempDir() + "wavematchup_filelist.txt";
	{
		std::ofstream ofList(strListFile.c_str());
		ofList << "# model files" << std::endl;
		ofList << "ww3.20200101.nc" << std::endl;
		ofList << std::endl;
		ofList << "  ww3.20200102.nc  " << std::endl;
	}

	FilenameList vecFiles;
	vecFiles.FromFile(strListFile);
	ASSERT_EQ(vecFiles.size(), 2u);
	EXPECT_EQ(vecFiles[0], "ww3.20200101.nc");
	EXPECT_EQ(vecFiles[1], "ww3.20200102.nc");

	remove(strListFile.c_str());
}

TEST(FilenameListTest, MissingFileThrows) {
	FilenameList vecFiles;
	EXPECT_THROW(
		vecFiles.FromFile(::testing::TempDir() + "wavematchup_no_such_list.txt"),
		Exception);
}

///////////////////////////////////////////////////////////////////////////////

