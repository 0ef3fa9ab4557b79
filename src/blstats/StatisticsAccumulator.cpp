///////////////////////////////////////////////////////////////////////////////
///
///	\file    StatisticsAccumulator.cpp
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

#include "StatisticsAccumulator.h"

#include "Exception.h"

#include <cmath>
#include <vector>

#if defined(_OPENMP)
#include <omp.h>
#endif

///////////////////////////////////////////////////////////////////////////////

const size_t StatisticsAccumulator::MinimumPointsPerPartition = 100000;

///////////////////////////////////////////////////////////////////////////////

StatisticsAccumulator::StatisticsAccumulator(
	size_t nBins1D,
	size_t nBinsA,
	size_t nBinsB,
	bool fSumOfSquares
) :
	m_fSumOfSquares(false)
{
	Initialize(nBins1D, nBinsA, nBinsB, fSumOfSquares);
}

///////////////////////////////////////////////////////////////////////////////

void StatisticsAccumulator::Initialize(
	size_t nBins1D,
	size_t nBinsA,
	size_t nBinsB,
	bool fSumOfSquares
) {
	m_fSumOfSquares = fSumOfSquares;

	m_nQ0.Allocate(nBins1D);
	m_nQE.Allocate(nBins1D);
	m_dQ1.Allocate(nBins1D);

	m_nP0.Allocate(nBinsA, nBinsB);
	m_nPE.Allocate(nBinsA, nBinsB);
	m_dP1.Allocate(nBinsA, nBinsB);

	if (m_fSumOfSquares) {
		m_dQ2.Allocate(nBins1D);
		m_dP2.Allocate(nBinsA, nBinsB);
	} else {
		m_dQ2.Deallocate();
		m_dP2.Deallocate();
	}
}

///////////////////////////////////////////////////////////////////////////////

void StatisticsAccumulator::AccumulateRange(
	size_t sBegin,
	size_t sEnd,
	const int * iIndex1D,
	const int * iIndexA,
	const int * iIndexB,
	const double * dValue,
	double dThreshold
) {
	const int nBins1D = static_cast<int>(m_nQ0.GetRows());
	const int nBinsA = static_cast<int>(m_nP0.GetRows());
	const int nBinsB = static_cast<int>(m_nP0.GetColumns());

	BinCount * pQ0 = m_nQ0;
	BinCount * pQE = m_nQE;
	double * pQ1 = m_dQ1;
	double * pQ2 = m_dQ2;

	BinCount * pP0 = m_nP0.data();
	BinCount * pPE = m_nPE.data();
	double * pP1 = m_dP1.data();
	double * pP2 = m_dP2.data();

	for (size_t s = sBegin; s < sEnd; s++) {
		const double dV = dValue[s];
		if (!std::isfinite(dV)) {
			continue;
		}

		const BinCount nExceeds = (dV > dThreshold)?(1):(0);

		const int i = iIndex1D[s];
		if ((i >= 0) && (i < nBins1D)) {
			pQ0[i]++;
			pQE[i] += nExceeds;
			pQ1[i] += dV;
			if (m_fSumOfSquares) {
				pQ2[i] += dV * dV;
			}
		}

		const int a = iIndexA[s];
		const int b = iIndexB[s];
		if ((a >= 0) && (a < nBinsA) && (b >= 0) && (b < nBinsB)) {
			const size_t ix = static_cast<size_t>(a) * nBinsB + b;
			pP0[ix]++;
			pPE[ix] += nExceeds;
			pP1[ix] += dV;
			if (m_fSumOfSquares) {
				pP2[ix] += dV * dV;
			}
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void StatisticsAccumulator::Accumulate(
	size_t nPoints,
	const int * iIndex1D,
	const int * iIndexA,
	const int * iIndexB,
	const double * dValue,
	double dThreshold
) {
	if (nPoints == 0) {
		return;
	}
	if ((iIndex1D == NULL) || (iIndexA == NULL) ||
	    (iIndexB == NULL) || (dValue == NULL)
	) {
		_EXCEPTIONT("NULL input array passed to StatisticsAccumulator");
	}

#if defined(_OPENMP)
	// Partition the points; each partition owns private accumulators
	size_t nPartitions = static_cast<size_t>(omp_get_max_threads());
	if (nPartitions > nPoints / MinimumPointsPerPartition) {
		nPartitions = nPoints / MinimumPointsPerPartition;
	}

	if (nPartitions > 1) {
		std::vector<StatisticsAccumulator> vecPartitions(
			nPartitions,
			StatisticsAccumulator(
				GetBinCount1D(),
				GetBinCountA(),
				GetBinCountB(),
				m_fSumOfSquares));

		const long lPartitions = static_cast<long>(nPartitions);

#pragma omp parallel for schedule(static,1)
		for (long p = 0; p < lPartitions; p++) {
			size_t sBegin = nPoints * static_cast<size_t>(p) / nPartitions;
			size_t sEnd = nPoints * static_cast<size_t>(p+1) / nPartitions;

			vecPartitions[p].AccumulateRange(
				sBegin, sEnd,
				iIndex1D, iIndexA, iIndexB, dValue, dThreshold);
		}

		// Consolidate partitions in a fixed order
		for (size_t p = 0; p < nPartitions; p++) {
			Add(vecPartitions[p]);
		}
		return;
	}
#endif

	AccumulateRange(
		0, nPoints,
		iIndex1D, iIndexA, iIndexB, dValue, dThreshold);
}

///////////////////////////////////////////////////////////////////////////////

void StatisticsAccumulator::Add(
	const StatisticsAccumulator & accum
) {
	if (accum.m_fSumOfSquares != m_fSumOfSquares) {
		_EXCEPTIONT("Sum of squares mismatch in StatisticsAccumulator");
	}

	m_nQ0.Add(accum.m_nQ0);
	m_nQE.Add(accum.m_nQE);
	m_dQ1.Add(accum.m_dQ1);

	m_nP0.Add(accum.m_nP0);
	m_nPE.Add(accum.m_nPE);
	m_dP1.Add(accum.m_dP1);

	if (m_fSumOfSquares) {
		m_dQ2.Add(accum.m_dQ2);
		m_dP2.Add(accum.m_dP2);
	}
}

///////////////////////////////////////////////////////////////////////////////

void StatisticsAccumulator::Pack(
	std::vector<BinCount> & vecCounts,
	std::vector<double> & vecSums
) const {
	const size_t nBins1D = m_nQ0.GetRows();
	const size_t nBins2D = m_nP0.GetTotalSize();

	vecCounts.insert(vecCounts.end(), &(m_nQ0[0]), &(m_nQ0[0]) + nBins1D);
	vecCounts.insert(vecCounts.end(), &(m_nQE[0]), &(m_nQE[0]) + nBins1D);
	vecCounts.insert(vecCounts.end(), m_nP0.data(), m_nP0.data() + nBins2D);
	vecCounts.insert(vecCounts.end(), m_nPE.data(), m_nPE.data() + nBins2D);

	vecSums.insert(vecSums.end(), &(m_dQ1[0]), &(m_dQ1[0]) + nBins1D);
	vecSums.insert(vecSums.end(), m_dP1.data(), m_dP1.data() + nBins2D);

	if (m_fSumOfSquares) {
		vecSums.insert(vecSums.end(), &(m_dQ2[0]), &(m_dQ2[0]) + nBins1D);
		vecSums.insert(vecSums.end(), m_dP2.data(), m_dP2.data() + nBins2D);
	}
}

///////////////////////////////////////////////////////////////////////////////

void StatisticsAccumulator::Unpack(
	const std::vector<BinCount> & vecCounts,
	size_t & iCount,
	const std::vector<double> & vecSums,
	size_t & iSum
) {
	const size_t nBins1D = m_nQ0.GetRows();
	const size_t nBins2D = m_nP0.GetTotalSize();

	size_t nSumArrays = (m_fSumOfSquares)?(2):(1);

	if ((iCount + 2 * (nBins1D + nBins2D) > vecCounts.size()) ||
	    (iSum + nSumArrays * (nBins1D + nBins2D) > vecSums.size())
	) {
		_EXCEPTIONT("Buffer too short in StatisticsAccumulator::Unpack");
	}

	for (size_t i = 0; i < nBins1D; i++) m_nQ0[i] = vecCounts[iCount++];
	for (size_t i = 0; i < nBins1D; i++) m_nQE[i] = vecCounts[iCount++];
	for (size_t i = 0; i < nBins2D; i++) m_nP0.data()[i] = vecCounts[iCount++];
	for (size_t i = 0; i < nBins2D; i++) m_nPE.data()[i] = vecCounts[iCount++];

	for (size_t i = 0; i < nBins1D; i++) m_dQ1[i] = vecSums[iSum++];
	for (size_t i = 0; i < nBins2D; i++) m_dP1.data()[i] = vecSums[iSum++];

	if (m_fSumOfSquares) {
		for (size_t i = 0; i < nBins1D; i++) m_dQ2[i] = vecSums[iSum++];
		for (size_t i = 0; i < nBins2D; i++) m_dP2.data()[i] = vecSums[iSum++];
	}
}

///////////////////////////////////////////////////////////////////////////////

