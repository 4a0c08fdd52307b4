///////////////////////////////////////////////////////////////////////////////
///
///	\file    CollocationNcReaders.h
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

#ifndef _COLLOCATIONNCREADERS_H_
#define _COLLOCATIONNCREADERS_H_

#include "SeriesAggregator.h"
#include "Observations.h"

#include <string>
#include <vector>

class NcFile;
class NcVar;
class GridDomain;
class CycloneRaster;

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Read a GridDomain from a grid information file.  Variables
///		latitude, longitude, mask, depth and distcoast are required; every
///		variable X with a name table names_X is loaded as a region field.
///	</summary>
void ReadGridDomainFromNcFile(
	const std::string & strFilename,
	GridDomain & grid
);

///	<summary>
///		Read the cyclone raster slices within [dMinTime - dTolerance,
///		dMaxTime + dTolerance] from a list of files.  The grid of each file
///		must equal the grid of the GridDomain.
///	</summary>
void ReadCycloneRasterFromNcFiles(
	const std::vector<std::string> & vecFiles,
	const GridDomain & grid,
	double dMinTime,
	double dMaxTime,
	double dTolerance,
	CycloneRaster & raster
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Reader of WAVEWATCH III point output tables.
///	</summary>
class NcModelPointFileReader : public ModelPointFileReader {

public:
	///	<summary>
	///		Read a file.
	///	</summary>
	virtual bool Read(
		const std::string & strFilename,
		ModelPointFileContents & contents
	);
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Reader of gridded wave model output (native or GRIB-converted
///		variable names).
///	</summary>
class NcModelFieldFileReader : public ModelFieldFileReader {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	NcModelFieldFileReader();

	///	<summary>
	///		Destructor.
	///	</summary>
	virtual ~NcModelFieldFileReader();

public:
	///	<summary>
	///		Open a file.
	///	</summary>
	virtual bool Open(
		const std::string & strFilename
	);

	///	<summary>
	///		Close the open file.
	///	</summary>
	virtual void Close();

	virtual const std::vector<double> & GetLatitudes() const {
		return m_vecLat;
	}

	virtual const std::vector<double> & GetLongitudes() const {
		return m_vecLon;
	}

	virtual const std::vector<double> & GetTimes() const {
		return m_vecTime;
	}

	///	<summary>
	///		Read wave height and wind speed at one time index.
	///	</summary>
	virtual void ReadFields(
		long lTimeIx,
		DataArray2D<double> & dataHs,
		DataArray2D<double> & dataWnd
	);

protected:
	///	<summary>
	///		Active file.
	///	</summary>
	NcFile * m_pncfile;

	///	<summary>
	///		Name of the active file.
	///	</summary>
	std::string m_strFilename;

	///	<summary>
	///		Field variables.
	///	</summary>
	NcVar * m_varHs;
	NcVar * m_varU;
	NcVar * m_varV;

	///	<summary>
	///		Latitude axis is stored in descending order.
	///	</summary>
	bool m_fFlipLatitude;

	std::vector<double> m_vecLat;
	std::vector<double> m_vecLon;
	std::vector<double> m_vecTime;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		NDBC buoy archive: one file per station and year.
///	</summary>
class NcNdbcBuoySource : public BuoyObservationSource {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	NcNdbcBuoySource(
		const std::string & strDirectory
	) :
		m_strDirectory(strDirectory)
	{ }

	virtual std::string GetName() const {
		return std::string("NDBC");
	}

	///	<summary>
	///		Load every available year; fails if no year could be read.
	///	</summary>
	virtual bool Load(
		const std::string & strStation,
		const std::vector<int> & vecYears,
		BuoyObservationSeries & series
	);

protected:
	std::string m_strDirectory;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Copernicus marine in-situ archive: one file per station.
///	</summary>
class NcCopernicusBuoySource : public BuoyObservationSource {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	NcCopernicusBuoySource(
		const std::string & strDirectory
	) :
		m_strDirectory(strDirectory)
	{ }

	virtual std::string GetName() const {
		return std::string("Copernicus");
	}

	virtual bool Load(
		const std::string & strStation,
		const std::vector<int> & vecYears,
		BuoyObservationSeries & series
	);

protected:
	std::string m_strDirectory;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Read gridded altimeter files.  Files that cannot be opened or whose
///		time range lies outside the model interval are skipped; the samples
///		kept are those within [dModelMinTime - dMargin, dModelMaxTime +
///		dMargin].
///	</summary>
void ReadSatelliteFiles(
	const std::vector<std::string> & vecFiles,
	double dModelMinTime,
	double dModelMaxTime,
	double dMargin,
	std::vector<SatelliteSample> & vecSamples
);

///////////////////////////////////////////////////////////////////////////////

#endif

