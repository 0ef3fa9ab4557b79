///////////////////////////////////////////////////////////////////////////////
///
///	\file    SubsetAggregator.h
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

#ifndef _SUBSETAGGREGATOR_H_
#define _SUBSETAGGREGATOR_H_

#include "AggregatedProduct.h"
#include "BLStatsConfig.h"
#include "GridDataset.h"
#include "DataArray1D.h"

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Points of one (region, month) subset gathered into contiguous
///		parallel arrays.
///	</summary>
struct SubsetPoints {
	DataArray1D<double> dataBL;
	DataArray1D<double> dataSubsat;
	DataArray1D<double> dataCape;
	DataArray1D<double> dataPrecip;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Runs BinnedStatsBuilder on every (region, month) subset of a
///		GridDataset and assembles the results into an AggregatedProduct.
///		Under MPI, subsets are distributed round-robin across ranks and
///		the complete product is assembled on rank 0.
///	</summary>
class SubsetAggregator {

public:
	///	<summary>
	///		Constructor.  The configuration is validated.
	///	</summary>
	SubsetAggregator(
		const BLStatsConfig & config
	);

	///	<summary>
	///		Compute the AggregatedProduct of the given dataset.
	///	</summary>
	AggregatedProduct Run(
		const GridDataset & data
	) const;

	///	<summary>
	///		Gather the points of the dataset lying in the given region with
	///		calendar month iMonth.  Latitude and longitude bounds are
	///		inclusive.
	///	</summary>
	static void GatherSubset(
		const GridDataset & data,
		const RegionSpec & region,
		int iMonth,
		SubsetPoints & points
	);

	///	<summary>
	///		Get the configuration.
	///	</summary>
	const BLStatsConfig & GetConfig() const {
		return m_config;
	}

private:
	///	<summary>
	///		Run configuration.
	///	</summary>
	BLStatsConfig m_config;
};

///////////////////////////////////////////////////////////////////////////////

#endif

