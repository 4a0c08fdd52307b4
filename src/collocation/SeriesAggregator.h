///////////////////////////////////////////////////////////////////////////////
///
///	\file    SeriesAggregator.h
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

#ifndef _SERIESAGGREGATOR_H_
#define _SERIESAGGREGATOR_H_

#include "WaveSample.h"
#include "DataArray2D.h"

#include <string>
#include <vector>
#include <set>
#include <utility>

class GridDomain;

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		One model timestep.  The cycle time is the reference time of the
///		forecast cycle the step came from, or missing for a hindcast.
///	</summary>
struct ModelStep {
	ModelStep() :
		dTime(MissingValue),
		dCycleTime(MissingValue)
	{ }

	ModelStep(double a_dTime, double a_dCycleTime) :
		dTime(a_dTime),
		dCycleTime(a_dCycleTime)
	{ }

	double dTime;
	double dCycleTime;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Contents of one model point-output file.
///	</summary>
struct ModelPointFileContents {

	///	<summary>
	///		Station names.
	///	</summary>
	std::vector<std::string> vecStations;

	///	<summary>
	///		Times (s since epoch).
	///	</summary>
	std::vector<double> vecTime;

	///	<summary>
	///		Samples indexed [station][time].
	///	</summary>
	std::vector< std::vector<WaveSample> > vecSamples;
};

///	<summary>
///		Reader of model point-output files.
///	</summary>
class ModelPointFileReader {

public:
	virtual ~ModelPointFileReader() { }

	///	<summary>
	///		Read a file.
	///	</summary>
	///	<returns>
	///		false if the file cannot be opened.
	///	</returns>
	virtual bool Read(
		const std::string & strFilename,
		ModelPointFileContents & contents
	) = 0;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Reader of gridded model output files.  Fields are read one timestep
///		at a time.
///	</summary>
class ModelFieldFileReader {

public:
	virtual ~ModelFieldFileReader() { }

	///	<summary>
	///		Open a file, closing any open file.
	///	</summary>
	///	<returns>
	///		false if the file cannot be opened.
	///	</returns>
	virtual bool Open(
		const std::string & strFilename
	) = 0;

	///	<summary>
	///		Close the open file.
	///	</summary>
	virtual void Close() = 0;

	///	<summary>
	///		Latitudes of the open file (ascending).
	///	</summary>
	virtual const std::vector<double> & GetLatitudes() const = 0;

	///	<summary>
	///		Longitudes of the open file.
	///	</summary>
	virtual const std::vector<double> & GetLongitudes() const = 0;

	///	<summary>
	///		Times of the open file (s since epoch).
	///	</summary>
	virtual const std::vector<double> & GetTimes() const = 0;

	///	<summary>
	///		Read wave height and wind speed at one time index, as [lat,lon].
	///	</summary>
	virtual void ReadFields(
		long lTimeIx,
		DataArray2D<double> & dataHs,
		DataArray2D<double> & dataWnd
	) = 0;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Aggregated model point output for a set of stations.
///	</summary>
class ModelPointSeries {

public:
	///	<summary>
	///		Times of all steps.
	///	</summary>
	void GetTimes(std::vector<double> & vecTimes) const;

public:
	///	<summary>
	///		Station names.
	///	</summary>
	std::vector<std::string> m_vecStations;

	///	<summary>
	///		Steps.
	///	</summary>
	std::vector<ModelStep> m_vecSteps;

	///	<summary>
	///		Samples indexed [station][step].
	///	</summary>
	std::vector< std::vector<WaveSample> > m_vecSamples;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A gridded model step and where to read it.
///	</summary>
struct ModelFieldStep : public ModelStep {
	ModelFieldStep() :
		sFile(0),
		lTimeIx(0)
	{ }

	///	<summary>
	///		Index into ModelFieldSeries::m_vecFiles.
	///	</summary>
	size_t sFile;

	///	<summary>
	///		Time index within the file.
	///	</summary>
	long lTimeIx;
};

///	<summary>
///		Aggregated gridded model output.  Field values stay on disk.
///	</summary>
class ModelFieldSeries {

public:
	///	<summary>
	///		Times of all steps.
	///	</summary>
	void GetTimes(std::vector<double> & vecTimes) const;

public:
	///	<summary>
	///		Files that were opened successfully.
	///	</summary>
	std::vector<std::string> m_vecFiles;

	///	<summary>
	///		Grid latitudes.
	///	</summary>
	std::vector<double> m_vecLat;

	///	<summary>
	///		Grid longitudes ([0,360) convention).
	///	</summary>
	std::vector<double> m_vecLon;

	///	<summary>
	///		Steps.
	///	</summary>
	std::vector<ModelFieldStep> m_vecSteps;
};

///	<summary>
///		Reads the fields of a ModelFieldSeries step by step, reopening
///		files only when the step moves to a different file.
///	</summary>
class ModelFieldCursor {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	ModelFieldCursor(
		const ModelFieldSeries & series,
		ModelFieldFileReader & reader
	) :
		m_series(series),
		m_reader(reader),
		m_fOpen(false),
		m_sOpenFile(0)
	{ }

	///	<summary>
	///		Destructor.
	///	</summary>
	~ModelFieldCursor();

	///	<summary>
	///		Read the fields of a step.
	///	</summary>
	void Read(
		size_t sStep,
		DataArray2D<double> & dataHs,
		DataArray2D<double> & dataWnd
	);

protected:
	const ModelFieldSeries & m_series;
	ModelFieldFileReader & m_reader;
	bool m_fOpen;
	size_t m_sOpenFile;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Model time axis aggregation policy.
///	</summary>
enum AggregationPolicy {

	///	<summary>
	///		Files are consecutive pieces of one simulation.
	///	</summary>
	AggregationPolicy_Hindcast,

	///	<summary>
	///		Each file is one forecast cycle.
	///	</summary>
	AggregationPolicy_Forecast
};

///	<summary>
///		Ordered builder of a step sequence.  Under the hindcast policy a
///		step whose time was already appended is rejected; under the
///		forecast policy a step is rejected only if the same (time, cycle)
///		pair was already appended.
///	</summary>
class ModelStepSequenceBuilder {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	ModelStepSequenceBuilder(
		AggregationPolicy ePolicy
	) :
		m_ePolicy(ePolicy)
	{ }

	///	<summary>
	///		Append a step.
	///	</summary>
	///	<returns>
	///		false if the step was rejected.
	///	</returns>
	bool Append(
		const ModelStep & step
	);

	///	<summary>
	///		Number of accepted steps.
	///	</summary>
	size_t GetCount() const {
		return m_vecSteps.size();
	}

	///	<summary>
	///		Accepted steps in append order.
	///	</summary>
	const std::vector<ModelStep> & GetSteps() const {
		return m_vecSteps;
	}

protected:
	AggregationPolicy m_ePolicy;
	std::vector<ModelStep> m_vecSteps;
	std::set<double> m_setTimes;
	std::set< std::pair<double, double> > m_setTimeCycles;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Merges per-file model series into one logical series.  Files are
///		processed in list order; a file that cannot be opened is skipped
///		with a warning.
///	</summary>
class SeriesAggregator {

public:
	///	<summary>
	///		Constructor.  nCycleCount is the requested number of forecast
	///		cycles (0 to derive it from the files).  The count is reported
	///		only; every cycle found in the files is aggregated.
	///	</summary>
	SeriesAggregator(
		AggregationPolicy ePolicy,
		int nCycleCount = 0
	) :
		m_ePolicy(ePolicy),
		m_nRequestedCycleCount(nCycleCount),
		m_nCycleCount(nCycleCount)
	{ }

public:
	///	<summary>
	///		Aggregate point-output files.  Stations are taken from the first
	///		file that can be read; later files must list the same stations.
	///	</summary>
	void AggregatePoints(
		const std::vector<std::string> & vecFiles,
		ModelPointFileReader & reader,
		ModelPointSeries & series
	);

	///	<summary>
	///		Aggregate gridded files.  Every file must share the grid of
	///		pgrid (or of the first file when pgrid is NULL); a mismatch is
	///		fatal.
	///	</summary>
	void AggregateFields(
		const std::vector<std::string> & vecFiles,
		ModelFieldFileReader & reader,
		const GridDomain * pgrid,
		ModelFieldSeries & series
	);

	///	<summary>
	///		Number of forecast cycles after aggregation.
	///	</summary>
	int GetCycleCount() const {
		return m_nCycleCount;
	}

public:
	///	<summary>
	///		Cycle count needed to hold every lead time: the span of one cycle
	///		divided by the spacing between cycles, rounded up, plus one.  The
	///		requested count is kept if it is at least as large.
	///	</summary>
	static int DeriveCycleCount(
		double dCycleSpan,
		double dCycleSpacing,
		int nRequested
	);

	///	<summary>
	///		Minimum and maximum non-missing time.
	///	</summary>
	///	<returns>
	///		false if there are no non-missing times.
	///	</returns>
	static bool GetTimeRange(
		const std::vector<double> & vecTimes,
		double & dMinTime,
		double & dMaxTime
	);

protected:
	///	<summary>
	///		Cycle time of a file with the given times.
	///	</summary>
	double CycleTimeOfFile(
		const std::vector<double> & vecTimes
	) const;

	///	<summary>
	///		Update the cycle count from the time ranges of the first two
	///		files read.
	///	</summary>
	void UpdateCycleCount(
		const std::vector< std::pair<double, double> > & vecFileRanges
	);

protected:
	AggregationPolicy m_ePolicy;
	int m_nRequestedCycleCount;
	int m_nCycleCount;
};

///////////////////////////////////////////////////////////////////////////////

#endif

