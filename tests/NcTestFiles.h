///////////////////////////////////////////////////////////////////////////////
///
///	\file    NcTestFiles.h
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

#ifndef _NCTESTFILES_H_
#define _NCTESTFILES_H_

#include <gtest/gtest.h>

#include "Exception.h"
#include "netcdfcpp.h"

#include <sys/stat.h>
#include <cstdio>
#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Fixture owning a scratch directory for NetCDF files.  Every file
///		obtained through TestFile is removed on teardown.
///	</summary>
class NcTestDirectoryTest : public ::testing::Test {
protected:
	NcTestDirectoryTest() :
		m_ncerror(NcError::silent_nonfatal)
	{ }

	virtual void SetUp() {
		const ::testing::TestInfo * pinfo =
			::testing::UnitTest::GetInstance()->current_test_info();

		m_strDir = ::testing::TempDir() + "wavematchup."
			+ pinfo->test_suite_name() + "." + pinfo->name();
		mkdir(m_strDir.c_str(), 0755);
	}

	virtual void TearDown() {
		for (size_t f = 0; f < m_vecFiles.size(); f++) {
			std::remove(m_vecFiles[f].c_str());
		}
		std::remove(m_strDir.c_str());
	}

	///	<summary>
	///		Path of a file in the scratch directory.
	///	</summary>
	std::string TestFile(
		const std::string & strName
	) {
		std::string strPath = m_strDir + "/" + strName;
		m_vecFiles.push_back(strPath);
		return strPath;
	}

	NcError m_ncerror;
	std::string m_strDir;
	std::vector<std::string> m_vecFiles;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Add a variable of up to three dimensions.
///	</summary>
inline NcVar * NcTestAddVar(
	NcFile & ncfile,
	const char * szName,
	NcType nctype,
	NcDim * dim0,
	NcDim * dim1 = NULL,
	NcDim * dim2 = NULL
) {
	NcVar * var = ncfile.add_var(szName, nctype, dim0, dim1, dim2);
	if (var == NULL) {
		_EXCEPTION1("Unable to add variable \"%s\"", szName);
	}
	return var;
}

///	<summary>
///		Write all values of a variable from a flat row-major array.
///	</summary>
inline void NcTestPutValues(
	NcVar * var,
	const std::vector<double> & vecValues
) {
	long lCount[3] = {0, 0, 0};
	long lTotal = 1;
	for (int d = 0; d < var->num_dims(); d++) {
		lCount[d] = var->get_dim(d)->size();
		lTotal *= lCount[d];
	}
	if (lTotal != static_cast<long>(vecValues.size())) {
		_EXCEPTION3("Variable \"%s\" holds %li values (%lu given)",
			var->name(), lTotal, vecValues.size());
	}
	if (!var->put(&(vecValues[0]), lCount[0], lCount[1], lCount[2])) {
		_EXCEPTION1("Unable to write variable \"%s\"", var->name());
	}
}

///	<summary>
///		Add a variable and write its values.
///	</summary>
inline NcVar * NcTestPutVar(
	NcFile & ncfile,
	const char * szName,
	NcType nctype,
	const std::vector<double> & vecValues,
	NcDim * dim0,
	NcDim * dim1 = NULL,
	NcDim * dim2 = NULL
) {
	NcVar * var = NcTestAddVar(ncfile, szName, nctype, dim0, dim1, dim2);
	NcTestPutValues(var, vecValues);
	return var;
}

///////////////////////////////////////////////////////////////////////////////

#endif

