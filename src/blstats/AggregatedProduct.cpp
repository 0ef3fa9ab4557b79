///////////////////////////////////////////////////////////////////////////////
///
///	\file    AggregatedProduct.cpp
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

#include "AggregatedProduct.h"

#include "Exception.h"

#include <ctime>

#if defined(BLSTATS_MPIOMP)
#include <mpi.h>
#endif

///////////////////////////////////////////////////////////////////////////////

AggregatedProduct::AggregatedProduct(
	const BLStatsConfig & config,
	const std::string & strPrecipUnits
) :
	m_vecRegions(config.vecRegions),
	m_vecMonths(config.vecMonths),
	m_specBL(config.specBL),
	m_specSubsat(config.specSubsat),
	m_specCape(config.specCape),
	m_dThreshold(config.dPrecipThreshold),
	m_fSumOfSquares(config.fSumOfSquares),
	m_strPrecipUnits(strPrecipUnits)
{
	StatsRecord::BuildVariableInfo(
		m_strPrecipUnits, m_fSumOfSquares, m_vecVariableInfo);

	size_t nSlices = m_vecRegions.size() * m_vecMonths.size();

	m_vecAccum.resize(nSlices);
	for (size_t s = 0; s < nSlices; s++) {
		m_vecAccum[s].Initialize(
			m_specBL.GetBinCount(),
			m_specSubsat.GetBinCount(),
			m_specCape.GetBinCount(),
			m_fSumOfSquares);
	}

	m_vecPointCount.resize(nSlices, 0);
}

///////////////////////////////////////////////////////////////////////////////

void AggregatedProduct::SetRecord(
	size_t iRegion,
	size_t iMonth,
	const StatsRecord & record
) {
	if ((iRegion >= m_vecRegions.size()) || (iMonth >= m_vecMonths.size())) {
		_EXCEPTION2("Slice (%lu, %lu) out of range in AggregatedProduct",
			iRegion, iMonth);
	}
	if (!(record.GetBLBins() == m_specBL) ||
	    !(record.GetSubsatBins() == m_specSubsat) ||
	    !(record.GetCapeBins() == m_specCape)
	) {
		_EXCEPTIONT("StatsRecord bin specifications differ from AggregatedProduct");
	}
	if (record.GetAccumulator().HasSumOfSquares() != m_fSumOfSquares) {
		_EXCEPTIONT("StatsRecord sum of squares flag differs from AggregatedProduct");
	}

	size_t ix = iRegion * m_vecMonths.size() + iMonth;

	m_vecAccum[ix] = record.GetAccumulator();
	m_vecPointCount[ix] = static_cast<long long>(record.GetPointCount());
}

///////////////////////////////////////////////////////////////////////////////

const StatisticsAccumulator & AggregatedProduct::GetAccumulator(
	size_t iRegion,
	size_t iMonth
) const {
	if ((iRegion >= m_vecRegions.size()) || (iMonth >= m_vecMonths.size())) {
		_EXCEPTION2("Slice (%lu, %lu) out of range in AggregatedProduct",
			iRegion, iMonth);
	}
	return m_vecAccum[iRegion * m_vecMonths.size() + iMonth];
}

///////////////////////////////////////////////////////////////////////////////

size_t AggregatedProduct::GetPointCount(
	size_t iRegion,
	size_t iMonth
) const {
	if ((iRegion >= m_vecRegions.size()) || (iMonth >= m_vecMonths.size())) {
		_EXCEPTION2("Slice (%lu, %lu) out of range in AggregatedProduct",
			iRegion, iMonth);
	}
	return static_cast<size_t>(
		m_vecPointCount[iRegion * m_vecMonths.size() + iMonth]);
}

///////////////////////////////////////////////////////////////////////////////

void AggregatedProduct::ReduceToRootRank() {
#if defined(BLSTATS_MPIOMP)
	int fMPIInitialized = 0;
	MPI_Initialized(&fMPIInitialized);
	if (!fMPIInitialized) {
		return;
	}

	int nMPISize;
	MPI_Comm_size(MPI_COMM_WORLD, &nMPISize);
	if (nMPISize == 1) {
		return;
	}

	int nRank;
	MPI_Comm_rank(MPI_COMM_WORLD, &nRank);

	// Pack counts and sums of every slice into contiguous buffers
	std::vector<BinCount> vecCounts;
	std::vector<double> vecSums;

	for (size_t s = 0; s < m_vecAccum.size(); s++) {
		m_vecAccum[s].Pack(vecCounts, vecSums);
	}
	vecCounts.insert(vecCounts.end(), m_vecPointCount.begin(), m_vecPointCount.end());

	std::vector<BinCount> vecCountsReduced(vecCounts.size(), 0);
	std::vector<double> vecSumsReduced(vecSums.size(), 0.0);

	int iErrorCounts =
		MPI_Reduce(
			&(vecCounts[0]), &(vecCountsReduced[0]),
			static_cast<int>(vecCounts.size()),
			MPI_LONG_LONG, MPI_SUM, 0, MPI_COMM_WORLD);

	int iErrorSums =
		MPI_Reduce(
			&(vecSums[0]), &(vecSumsReduced[0]),
			static_cast<int>(vecSums.size()),
			MPI_DOUBLE, MPI_SUM, 0, MPI_COMM_WORLD);

	if ((iErrorCounts != MPI_SUCCESS) || (iErrorSums != MPI_SUCCESS)) {
		_EXCEPTIONT("MPI_Reduce of AggregatedProduct failed");
	}

	if (nRank != 0) {
		return;
	}

	// Unpack onto rank 0
	size_t iCount = 0;
	size_t iSum = 0;
	for (size_t s = 0; s < m_vecAccum.size(); s++) {
		m_vecAccum[s].Unpack(vecCountsReduced, iCount, vecSumsReduced, iSum);
	}
	for (size_t s = 0; s < m_vecPointCount.size(); s++) {
		m_vecPointCount[s] = vecCountsReduced[iCount++];
	}

	_ASSERT(iCount == vecCountsReduced.size());
	_ASSERT(iSum == vecSumsReduced.size());
#endif
}

///////////////////////////////////////////////////////////////////////////////

void AggregatedProduct::SetProvenance(
	const std::string & strAuthor,
	const std::string & strHistory
) {
	m_strAuthor = strAuthor;
	m_strHistory = strHistory;

	time_t rawtime;
	struct tm * timeinfo;
	char szBuffer[64];

	time(&rawtime);
	timeinfo = localtime(&rawtime);
	strftime(szBuffer, 64, "%Y-%m-%d %H:%M:%S", timeinfo);

	m_strCreated = szBuffer;
}

///////////////////////////////////////////////////////////////////////////////

