///////////////////////////////////////////////////////////////////////////////
///
///	\file    BinnedStatsBuilder.h
///	\author  BLStats developers
///	\version October 19, 2026
///
///	<remarks>
///		Copyright 2026 BLStats developers
///
///		This file is distributed as part of the BLStats source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _BINNEDSTATSBUILDER_H_
#define _BINNEDSTATSBUILDER_H_

#include "BinSpecification.h"
#include "StatisticsAccumulator.h"
#include "DataArray1D.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Name and descriptive metadata of one accumulator variable.
///	</summary>
struct StatsVariableInfo {

	///	<summary>
	///		Short name (Q0, QE, Q1, Q2, P0, PE, P1, P2).
	///	</summary>
	std::string strName;

	///	<summary>
	///		Long name.
	///	</summary>
	std::string strLongName;

	///	<summary>
	///		Units.
	///	</summary>
	std::string strUnits;

	///	<summary>
	///		True for variables on the 2D (subsat, cape) axis.
	///	</summary>
	bool fJoint;

	///	<summary>
	///		True for count variables, false for sums.
	///	</summary>
	bool fCount;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Binned statistics of precipitation for one subset of points,
///		with the bin specifications of the bl, subsat and cape axes and
///		the metadata of each accumulator.
///	</summary>
class StatsRecord {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	StatsRecord(
		const BinSpecification & specBL,
		const BinSpecification & specSubsat,
		const BinSpecification & specCape,
		const StatisticsAccumulator & accum,
		const std::string & strPrecipUnits,
		size_t sPointCount
	);

	///	<summary>
	///		Build the variable metadata for the given precipitation units.
	///	</summary>
	static void BuildVariableInfo(
		const std::string & strPrecipUnits,
		bool fSumOfSquares,
		std::vector<StatsVariableInfo> & vecInfo
	);

public:
	const BinSpecification & GetBLBins() const {
		return m_specBL;
	}

	const BinSpecification & GetSubsatBins() const {
		return m_specSubsat;
	}

	const BinSpecification & GetCapeBins() const {
		return m_specCape;
	}

	const StatisticsAccumulator & GetAccumulator() const {
		return m_accum;
	}

	const std::string & GetPrecipUnits() const {
		return m_strPrecipUnits;
	}

	///	<summary>
	///		Number of points offered to the accumulator, including points
	///		that were excluded.
	///	</summary>
	size_t GetPointCount() const {
		return m_sPointCount;
	}

	const std::vector<StatsVariableInfo> & GetVariableInfo() const {
		return m_vecVariableInfo;
	}

	///	<summary>
	///		Metadata for the named accumulator.
	///	</summary>
	const StatsVariableInfo & GetVariableInfo(
		const std::string & strName
	) const;

private:
	BinSpecification m_specBL;

	BinSpecification m_specSubsat;

	BinSpecification m_specCape;

	StatisticsAccumulator m_accum;

	std::string m_strPrecipUnits;

	size_t m_sPointCount;

	std::vector<StatsVariableInfo> m_vecVariableInfo;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Computes bin indices of the BL, subsat and cape values of a set of
///		points and accumulates their precipitation into a StatsRecord.
///		The bl axis uses round-to-nearest indexing; the subsat and cape
///		axes use half-bin-down indexing.
///	</summary>
class BinnedStatsBuilder {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	BinnedStatsBuilder(
		const BinSpecification & specBL,
		const BinSpecification & specSubsat,
		const BinSpecification & specCape,
		double dThreshold,
		bool fSumOfSquares = true
	);

	///	<summary>
	///		Build statistics from nPoints parallel values.
	///	</summary>
	StatsRecord Build(
		size_t nPoints,
		const double * dBL,
		const double * dSubsat,
		const double * dCape,
		const double * dPrecip,
		const std::string & strPrecipUnits
	) const;

	///	<summary>
	///		Build statistics from parallel arrays, which must all have the
	///		same length.
	///	</summary>
	StatsRecord Build(
		const DataArray1D<double> & dataBL,
		const DataArray1D<double> & dataSubsat,
		const DataArray1D<double> & dataCape,
		const DataArray1D<double> & dataPrecip,
		const std::string & strPrecipUnits
	) const;

	///	<summary>
	///		Compute the bin index of every value under the given policy.
	///	</summary>
	static void ComputeIndices(
		const BinSpecification & spec,
		BinSpecification::IndexPolicy ePolicy,
		size_t nPoints,
		const double * dValues,
		DataArray1D<int> & iIndices
	);

public:
	double GetThreshold() const {
		return m_dThreshold;
	}

	bool HasSumOfSquares() const {
		return m_fSumOfSquares;
	}

private:
	BinSpecification m_specBL;

	BinSpecification m_specSubsat;

	BinSpecification m_specCape;

	///	<summary>
	///		Exceedance threshold.
	///	</summary>
	double m_dThreshold;

	///	<summary>
	///		Flag indicating sums of squares are accumulated.
	///	</summary>
	bool m_fSumOfSquares;
};

///////////////////////////////////////////////////////////////////////////////

#endif

