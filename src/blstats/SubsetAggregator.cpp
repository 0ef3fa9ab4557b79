///////////////////////////////////////////////////////////////////////////////
///
///	\file    SubsetAggregator.cpp
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

#include "SubsetAggregator.h"

#include "BinnedStatsBuilder.h"
#include "Announce.h"
#include "Exception.h"
#include "FunctionTimer.h"

#include <vector>

#if defined(BLSTATS_MPIOMP)
#include <mpi.h>
#endif

///////////////////////////////////////////////////////////////////////////////

SubsetAggregator::SubsetAggregator(
	const BLStatsConfig & config
) :
	m_config(config)
{
	m_config.Validate();
}

///////////////////////////////////////////////////////////////////////////////

void SubsetAggregator::GatherSubset(
	const GridDataset & data,
	const RegionSpec & region,
	int iMonth,
	SubsetPoints & points
) {
	// Indices of times, latitudes and longitudes in the subset
	std::vector<size_t> vecTimeIx;
	for (size_t t = 0; t < data.vecMonths.size(); t++) {
		if (data.vecMonths[t] == iMonth) {
			vecTimeIx.push_back(t);
		}
	}

	std::vector<size_t> vecLatIx;
	for (size_t j = 0; j < data.vecLat.size(); j++) {
		if (region.box.contains_lat(data.vecLat[j])) {
			vecLatIx.push_back(j);
		}
	}

	std::vector<size_t> vecLonIx;
	for (size_t i = 0; i < data.vecLon.size(); i++) {
		if (region.box.contains_lon(data.vecLon[i])) {
			vecLonIx.push_back(i);
		}
	}

	size_t nPoints = vecTimeIx.size() * vecLatIx.size() * vecLonIx.size();

	points.dataBL.Allocate(nPoints);
	points.dataSubsat.Allocate(nPoints);
	points.dataCape.Allocate(nPoints);
	points.dataPrecip.Allocate(nPoints);

	size_t s = 0;
	for (size_t t = 0; t < vecTimeIx.size(); t++) {
	for (size_t j = 0; j < vecLatIx.size(); j++) {
	for (size_t i = 0; i < vecLonIx.size(); i++) {
		const size_t ti = vecTimeIx[t];
		const size_t lj = vecLatIx[j];
		const size_t li = vecLonIx[i];

		points.dataBL[s] = static_cast<double>(data.dataBL(ti, lj, li));
		points.dataSubsat[s] = static_cast<double>(data.dataSubsat(ti, lj, li));
		points.dataCape[s] = static_cast<double>(data.dataCape(ti, lj, li));
		points.dataPrecip[s] = static_cast<double>(data.dataPrecip(ti, lj, li));
		s++;
	}
	}
	}

	_ASSERT(s == nPoints);
}

///////////////////////////////////////////////////////////////////////////////

AggregatedProduct SubsetAggregator::Run(
	const GridDataset & data
) const {
	data.Validate();

	AggregatedProduct product(m_config, data.strPrecipUnits);

	BinnedStatsBuilder builder(
		m_config.specBL,
		m_config.specSubsat,
		m_config.specCape,
		m_config.dPrecipThreshold,
		m_config.fSumOfSquares);

	// Subsets are assigned round-robin to ranks
	int nRank = 0;
	int nSize = 1;
#if defined(BLSTATS_MPIOMP)
	int fMPIInitialized = 0;
	MPI_Initialized(&fMPIInitialized);
	if (fMPIInitialized) {
		MPI_Comm_rank(MPI_COMM_WORLD, &nRank);
		MPI_Comm_size(MPI_COMM_WORLD, &nSize);
	}
#endif

	const size_t nRegions = m_config.vecRegions.size();
	const size_t nMonths = m_config.vecMonths.size();

	for (size_t r = 0; r < nRegions; r++) {
		const RegionSpec & region = m_config.vecRegions[r];

		AnnounceStartBlock("Region \"%s\"", region.strName.c_str());

		for (size_t m = 0; m < nMonths; m++) {
			size_t sSubset = r * nMonths + m;
			if (static_cast<int>(sSubset % static_cast<size_t>(nSize)) != nRank) {
				continue;
			}

			const int iMonth = m_config.vecMonths[m];

			SubsetPoints points;
			GatherSubset(data, region, iMonth, points);

			FunctionTimer timer("Accumulate");

			StatsRecord record =
				builder.Build(
					points.dataBL,
					points.dataSubsat,
					points.dataCape,
					points.dataPrecip,
					data.strPrecipUnits);

			unsigned long long iTime = timer.StopTime();

			Announce(1, "Month %2i: %lu points (%llu us)",
				iMonth, points.dataPrecip.GetRows(), iTime);

			product.SetRecord(r, m, record);
		}

		AnnounceEndBlock("Done");
	}

	product.ReduceToRootRank();

	return product;
}

///////////////////////////////////////////////////////////////////////////////

