///////////////////////////////////////////////////////////////////////////////
///
///	\file    StatisticsAccumulator.h
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

#ifndef _STATISTICSACCUMULATOR_H_
#define _STATISTICSACCUMULATOR_H_

#include "DataArray1D.h"
#include "DataArray2D.h"

#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Type used for bin counts.
///	</summary>
typedef long long BinCount;

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Count, exceedance count, sum and (optionally) sum of squares of a
///		value, binned along one 1D axis and one 2D joint axis.
///	</summary>
///	<remarks>
///		Updates from different points commute, so partial accumulators
///		over disjoint sets of points may be merged with Add().
///	</remarks>
class StatisticsAccumulator {

public:
	///	<summary>
	///		Minimum number of points handled by each OpenMP partition.
	///	</summary>
	static const size_t MinimumPointsPerPartition;

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	StatisticsAccumulator() :
		m_fSumOfSquares(false)
	{ }

	///	<summary>
	///		Constructor; allocates zeroed accumulators.
	///	</summary>
	StatisticsAccumulator(
		size_t nBins1D,
		size_t nBinsA,
		size_t nBinsB,
		bool fSumOfSquares = true
	);

	///	<summary>
	///		Allocate zeroed accumulators.
	///	</summary>
	void Initialize(
		size_t nBins1D,
		size_t nBinsA,
		size_t nBinsB,
		bool fSumOfSquares = true
	);

	///	<summary>
	///		Accumulate nPoints points in a single pass.  Point i contributes
	///		to the 1D accumulators if its value is finite and iIndex1D[i] is
	///		in range, and to the 2D accumulators if its value is finite and
	///		both iIndexA[i] and iIndexB[i] are in range.  Exceedance counts
	///		use a strict comparison (value > dThreshold).
	///	</summary>
	void Accumulate(
		size_t nPoints,
		const int * iIndex1D,
		const int * iIndexA,
		const int * iIndexB,
		const double * dValue,
		double dThreshold
	);

	///	<summary>
	///		Add another accumulator elementwise.
	///	</summary>
	void Add(const StatisticsAccumulator & accum);

	///	<summary>
	///		Append all counts and all sums to contiguous buffers.
	///	</summary>
	void Pack(
		std::vector<BinCount> & vecCounts,
		std::vector<double> & vecSums
	) const;

	///	<summary>
	///		Overwrite all counts and sums from contiguous buffers written
	///		by Pack(), advancing the read positions.
	///	</summary>
	void Unpack(
		const std::vector<BinCount> & vecCounts,
		size_t & iCount,
		const std::vector<double> & vecSums,
		size_t & iSum
	);

public:
	inline bool HasSumOfSquares() const {
		return m_fSumOfSquares;
	}

	inline size_t GetBinCount1D() const {
		return m_nQ0.GetRows();
	}

	inline size_t GetBinCountA() const {
		return m_nP0.GetRows();
	}

	inline size_t GetBinCountB() const {
		return m_nP0.GetColumns();
	}

	const DataArray1D<BinCount> & Q0() const { return m_nQ0; }
	const DataArray1D<BinCount> & QE() const { return m_nQE; }
	const DataArray1D<double> & Q1() const { return m_dQ1; }
	const DataArray1D<double> & Q2() const { return m_dQ2; }

	const DataArray2D<BinCount> & P0() const { return m_nP0; }
	const DataArray2D<BinCount> & PE() const { return m_nPE; }
	const DataArray2D<double> & P1() const { return m_dP1; }
	const DataArray2D<double> & P2() const { return m_dP2; }

protected:
	///	<summary>
	///		Serial kernel over the points [sBegin, sEnd).
	///	</summary>
	void AccumulateRange(
		size_t sBegin,
		size_t sEnd,
		const int * iIndex1D,
		const int * iIndexA,
		const int * iIndexB,
		const double * dValue,
		double dThreshold
	);

private:
	///	<summary>
	///		Flag indicating sums of squares are accumulated.
	///	</summary>
	bool m_fSumOfSquares;

	///	<summary>
	///		1D count, exceedance count, sum and sum of squares.
	///	</summary>
	DataArray1D<BinCount> m_nQ0;
	DataArray1D<BinCount> m_nQE;
	DataArray1D<double> m_dQ1;
	DataArray1D<double> m_dQ2;

	///	<summary>
	///		2D count, exceedance count, sum and sum of squares.
	///	</summary>
	DataArray2D<BinCount> m_nP0;
	DataArray2D<BinCount> m_nPE;
	DataArray2D<double> m_dP1;
	DataArray2D<double> m_dP2;
};

///////////////////////////////////////////////////////////////////////////////

#endif

