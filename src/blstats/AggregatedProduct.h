///////////////////////////////////////////////////////////////////////////////
///
///	\file    AggregatedProduct.h
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

#ifndef _AGGREGATEDPRODUCT_H_
#define _AGGREGATEDPRODUCT_H_

#include "BLStatsConfig.h"
#include "BinnedStatsBuilder.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Binned statistics arranged along region x month, all sharing the
///		bin specifications of one run, together with region and month
///		coordinates and provenance attributes.
///	</summary>
class AggregatedProduct {

public:
	///	<summary>
	///		Constructor; every (region, month) slice starts as all zeros.
	///	</summary>
	AggregatedProduct(
		const BLStatsConfig & config,
		const std::string & strPrecipUnits
	);

	///	<summary>
	///		Store the statistics of one (region, month) slice.  The record
	///		must share the bin specifications of this product.
	///	</summary>
	void SetRecord(
		size_t iRegion,
		size_t iMonth,
		const StatsRecord & record
	);

	///	<summary>
	///		Sum the product elementwise across all MPI ranks onto rank 0.
	///		Has no effect when MPI is not in use.
	///	</summary>
	void ReduceToRootRank();

	///	<summary>
	///		Set provenance attributes.  The creation time is set to now.
	///	</summary>
	void SetProvenance(
		const std::string & strAuthor,
		const std::string & strHistory
	);

public:
	size_t GetRegionCount() const {
		return m_vecRegions.size();
	}

	size_t GetMonthCount() const {
		return m_vecMonths.size();
	}

	const std::vector<RegionSpec> & GetRegions() const {
		return m_vecRegions;
	}

	const std::vector<int> & GetMonths() const {
		return m_vecMonths;
	}

	const BinSpecification & GetBLBins() const {
		return m_specBL;
	}

	const BinSpecification & GetSubsatBins() const {
		return m_specSubsat;
	}

	const BinSpecification & GetCapeBins() const {
		return m_specCape;
	}

	double GetThreshold() const {
		return m_dThreshold;
	}

	bool HasSumOfSquares() const {
		return m_fSumOfSquares;
	}

	const std::string & GetPrecipUnits() const {
		return m_strPrecipUnits;
	}

	const std::vector<StatsVariableInfo> & GetVariableInfo() const {
		return m_vecVariableInfo;
	}

	///	<summary>
	///		Accumulators of one (region, month) slice.
	///	</summary>
	const StatisticsAccumulator & GetAccumulator(
		size_t iRegion,
		size_t iMonth
	) const;

	///	<summary>
	///		Number of points in one (region, month) subset.
	///	</summary>
	size_t GetPointCount(
		size_t iRegion,
		size_t iMonth
	) const;

	const std::string & GetAuthor() const {
		return m_strAuthor;
	}

	const std::string & GetCreated() const {
		return m_strCreated;
	}

	const std::string & GetHistory() const {
		return m_strHistory;
	}

private:
	std::vector<RegionSpec> m_vecRegions;

	std::vector<int> m_vecMonths;

	BinSpecification m_specBL;

	BinSpecification m_specSubsat;

	BinSpecification m_specCape;

	double m_dThreshold;

	bool m_fSumOfSquares;

	std::string m_strPrecipUnits;

	std::vector<StatsVariableInfo> m_vecVariableInfo;

	///	<summary>
	///		Accumulators indexed by iRegion * nMonths + iMonth.
	///	</summary>
	std::vector<StatisticsAccumulator> m_vecAccum;

	///	<summary>
	///		Subset point counts indexed by iRegion * nMonths + iMonth.
	///	</summary>
	std::vector<long long> m_vecPointCount;

	std::string m_strAuthor;

	std::string m_strCreated;

	std::string m_strHistory;
};

///////////////////////////////////////////////////////////////////////////////

#endif

