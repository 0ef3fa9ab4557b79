///////////////////////////////////////////////////////////////////////////////
///
///	\file    TestSubsetAggregator.cpp
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
#include "Exception.h"

#include <cmath>
#include <iostream>
#include <limits>
#include <string>

///////////////////////////////////////////////////////////////////////////////

namespace {

int ExpectTrue(bool fCondition, const std::string & strMessage) {
	if (!fCondition) {
		std::cerr << "[subset-aggregator] FAIL: " << strMessage << std::endl;
		return 1;
	}
	return 0;
}

bool NearlyEqual(double a, double b, double dTol = 1.0e-9) {
	return (std::fabs(a - b) <= dTol * (1.0 + std::fabs(a) + std::fabs(b)));
}

bool SameStatistics(
	const StatisticsAccumulator & accum1,
	const StatisticsAccumulator & accum2
) {
	if ((accum1.GetBinCount1D() != accum2.GetBinCount1D()) ||
	    (accum1.GetBinCountA() != accum2.GetBinCountA()) ||
	    (accum1.GetBinCountB() != accum2.GetBinCountB())
	) {
		return false;
	}
	for (size_t i = 0; i < accum1.GetBinCount1D(); i++) {
		if (accum1.Q0()[i] != accum2.Q0()[i]) return false;
		if (accum1.QE()[i] != accum2.QE()[i]) return false;
		if (!NearlyEqual(accum1.Q1()[i], accum2.Q1()[i])) return false;
		if (!NearlyEqual(accum1.Q2()[i], accum2.Q2()[i])) return false;
	}
	for (size_t a = 0; a < accum1.GetBinCountA(); a++) {
	for (size_t b = 0; b < accum1.GetBinCountB(); b++) {
		if (accum1.P0()(a,b) != accum2.P0()(a,b)) return false;
		if (accum1.PE()(a,b) != accum2.PE()(a,b)) return false;
		if (!NearlyEqual(accum1.P1()(a,b), accum2.P1()(a,b))) return false;
		if (!NearlyEqual(accum1.P2()(a,b), accum2.P2()(a,b))) return false;
	}
	}
	return true;
}

BinCount TotalCount1D(const StatisticsAccumulator & accum) {
	BinCount nTotal = 0;
	for (size_t i = 0; i < accum.GetBinCount1D(); i++) {
		nTotal += accum.Q0()[i];
	}
	return nTotal;
}

///	<summary>
///		Six times cycling through January to March on a 5 x 8 grid.
///	</summary>
void BuildSyntheticDataset(GridDataset & data) {
	const size_t nTimes = 6;
	const size_t nLat = 5;
	const size_t nLon = 8;

	data.Allocate(nTimes, nLat, nLon);

	for (size_t t = 0; t < nTimes; t++) {
		data.vecMonths[t] = static_cast<int>(t % 3) + 1;
	}
	for (size_t j = 0; j < nLat; j++) {
		data.vecLat[j] = -20.0 + 10.0 * static_cast<double>(j);
	}
	for (size_t i = 0; i < nLon; i++) {
		data.vecLon[i] = 45.0 * static_cast<double>(i);
	}

	for (size_t t = 0; t < nTimes; t++) {
	for (size_t j = 0; j < nLat; j++) {
	for (size_t i = 0; i < nLon; i++) {
		size_t k = t * 31 + j * 7 + i * 3;
		data.dataBL(t,j,i) = static_cast<float>(-0.6 + 0.0025 * static_cast<double>(k % 290));
		data.dataSubsat(t,j,i) = static_cast<float>(-0.1 + 0.01 * static_cast<double>(k % 115));
		data.dataCape(t,j,i) = static_cast<float>(-0.6 + 0.01 * static_cast<double>(k % 93));
		data.dataPrecip(t,j,i) = static_cast<float>(0.1 * static_cast<double>(k % 11));
		if ((k % 13) == 0) {
			data.dataPrecip(t,j,i) = std::numeric_limits<float>::quiet_NaN();
		}
	}
	}
	}
}

///////////////////////////////////////////////////////////////////////////////

int TestAggregationMatchesIsolatedBuilds() {
	int nFailures = 0;

	GridDataset data;
	BuildSyntheticDataset(data);

	BLStatsConfig config;
	BLStatsConfig::ParseRegions(
		"South:-20,0,0,180;North:0,20,90,315",
		config.vecRegions);
	BLStatsConfig::ParseMonths("1,2,3", config.vecMonths);

	SubsetAggregator aggregator(config);
	AggregatedProduct product = aggregator.Run(data);

	nFailures += ExpectTrue(product.GetRegionCount() == 2,
		"product must have two regions");
	nFailures += ExpectTrue(product.GetMonthCount() == 3,
		"product must have three months");

	BinnedStatsBuilder builder(
		config.specBL, config.specSubsat, config.specCape,
		config.dPrecipThreshold, config.fSumOfSquares);

	for (size_t r = 0; r < config.vecRegions.size(); r++) {
	for (size_t m = 0; m < config.vecMonths.size(); m++) {
		SubsetPoints points;
		SubsetAggregator::GatherSubset(
			data, config.vecRegions[r], config.vecMonths[m], points);

		StatsRecord record = builder.Build(
			points.dataBL, points.dataSubsat,
			points.dataCape, points.dataPrecip,
			data.strPrecipUnits);

		std::string strSlice =
			config.vecRegions[r].strName + " month "
			+ std::to_string(config.vecMonths[m]);

		nFailures += ExpectTrue(
			SameStatistics(product.GetAccumulator(r, m), record.GetAccumulator()),
			"aggregated slice must equal isolated build for " + strSlice);
		nFailures += ExpectTrue(
			product.GetPointCount(r, m) == points.dataPrecip.GetRows(),
			"point count must match gathered subset for " + strSlice);
	}
	}

	// South spans three latitudes and five longitudes; two times per month
	nFailures += ExpectTrue(product.GetPointCount(0, 0) == 2 * 3 * 5,
		"South subset must contain 30 points");

	// North spans three latitudes and six longitudes
	nFailures += ExpectTrue(product.GetPointCount(1, 2) == 2 * 3 * 6,
		"North subset must contain 36 points");

	return nFailures;
}

///////////////////////////////////////////////////////////////////////////////

int TestHandSelectedSlice() {
	int nFailures = 0;

	// Times in January, February and January; lats -10..10; lons 0..270
	GridDataset data;
	data.Allocate(3, 3, 4);
	data.vecMonths[0] = 1;
	data.vecMonths[1] = 2;
	data.vecMonths[2] = 1;
	for (size_t j = 0; j < 3; j++) {
		data.vecLat[j] = -10.0 + 10.0 * static_cast<double>(j);
	}
	for (size_t i = 0; i < 4; i++) {
		data.vecLon[i] = 90.0 * static_cast<double>(i);
	}

	// Every point sits in bl bin 0 with precip 5
	for (size_t t = 0; t < 3; t++) {
	for (size_t j = 0; j < 3; j++) {
	for (size_t i = 0; i < 4; i++) {
		data.dataBL(t,j,i) = -0.6f;
		data.dataSubsat(t,j,i) = 0.0f;
		data.dataCape(t,j,i) = 0.0f;
		data.dataPrecip(t,j,i) = 5.0f;
	}
	}
	}

	// January points of the box lat [0,10], lon [90,180] move to bl bin 2
	// with precip 1: times 0 and 2, lats 1 and 2, lons 1 and 2
	const size_t iTimes[2] = {0, 2};
	for (int t = 0; t < 2; t++) {
	for (size_t j = 1; j <= 2; j++) {
	for (size_t i = 1; i <= 2; i++) {
		data.dataBL(iTimes[t],j,i) = -0.595f;
		data.dataPrecip(iTimes[t],j,i) = 1.0f;
	}
	}
	}
	data.dataPrecip(2,2,2) = std::numeric_limits<float>::quiet_NaN();

	BLStatsConfig config;
	BLStatsConfig::ParseRegions("Box:0,10,90,180", config.vecRegions);
	BLStatsConfig::ParseMonths("1,2", config.vecMonths);

	AggregatedProduct product = SubsetAggregator(config).Run(data);
	const StatisticsAccumulator & accumJan = product.GetAccumulator(0, 0);
	const StatisticsAccumulator & accumFeb = product.GetAccumulator(0, 1);

	nFailures += ExpectTrue(product.GetPointCount(0, 0) == 8,
		"January box must gather 8 points");
	nFailures += ExpectTrue(accumJan.Q0()[2] == 7,
		"January box must have 7 valid points in bl bin 2");
	nFailures += ExpectTrue(accumJan.Q0()[0] == 0,
		"January box must not reach bl bin 0");
	nFailures += ExpectTrue(NearlyEqual(accumJan.Q1()[2], 7.0),
		"January box precip sum must be 7");
	nFailures += ExpectTrue(TotalCount1D(accumJan) == 7,
		"January box must hold no other points");

	nFailures += ExpectTrue(product.GetPointCount(0, 1) == 4,
		"February box must gather 4 points");
	nFailures += ExpectTrue(accumFeb.Q0()[0] == 4,
		"February box points must be in bl bin 0");
	nFailures += ExpectTrue(NearlyEqual(accumFeb.Q1()[0], 20.0),
		"February box precip sum must be 20");
	nFailures += ExpectTrue(TotalCount1D(accumFeb) == 4,
		"February box must hold no other points");

	return nFailures;
}

///////////////////////////////////////////////////////////////////////////////

int TestEmptySubset() {
	int nFailures = 0;

	GridDataset data;
	BuildSyntheticDataset(data);

	BLStatsConfig config;
	BLStatsConfig::ParseRegions(
		"Polar:60,90,0,360;Tropics:-10,10,0,360",
		config.vecRegions);
	BLStatsConfig::ParseMonths("1,7", config.vecMonths);

	AggregatedProduct product = SubsetAggregator(config).Run(data);

	nFailures += ExpectTrue(product.GetPointCount(0, 0) == 0,
		"region without grid points must be empty");
	nFailures += ExpectTrue(TotalCount1D(product.GetAccumulator(0, 0)) == 0,
		"empty region must have zero counts");
	nFailures += ExpectTrue(product.GetPointCount(1, 1) == 0,
		"month without times must be empty");
	nFailures += ExpectTrue(TotalCount1D(product.GetAccumulator(1, 1)) == 0,
		"empty month must have zero counts");
	nFailures += ExpectTrue(
		product.GetAccumulator(1, 1).GetBinCount1D() == config.specBL.GetBinCount(),
		"empty slice must keep full bin shape");
	nFailures += ExpectTrue(product.GetPointCount(1, 0) == 2 * 3 * 8,
		"tropical January subset must contain 48 points");

	return nFailures;
}

///////////////////////////////////////////////////////////////////////////////

int TestLongitudeWrap() {
	int nFailures = 0;

	GridDataset data;
	BuildSyntheticDataset(data);

	// Longitudes 270, 315, 0, 45 and 90
	RegionSpec region("Wrap", -20.0, 20.0, 270.0, 90.0);

	SubsetPoints points;
	SubsetAggregator::GatherSubset(data, region, 2, points);

	nFailures += ExpectTrue(points.dataPrecip.GetRows() == 2 * 5 * 5,
		"wrapping region must gather five longitudes");

	RegionSpec regionEdge("Edge", -20.0, -20.0, 45.0, 45.0);
	SubsetAggregator::GatherSubset(data, regionEdge, 1, points);

	nFailures += ExpectTrue(points.dataPrecip.GetRows() == 2,
		"bounds must be inclusive");
	nFailures += ExpectTrue(
		points.dataPrecip[0] == static_cast<double>(data.dataPrecip(0,0,1)),
		"gathered value must come from the selected grid point");

	return nFailures;
}

///////////////////////////////////////////////////////////////////////////////

int TestInvalidDataset() {
	int nFailures = 0;

	GridDataset data;
	BuildSyntheticDataset(data);
	data.vecMonths[0] = 13;

	BLStatsConfig config;
	BLStatsConfig::ParseRegions("Box:-10,10,0,90", config.vecRegions);

	bool fThrew = false;
	try {
		SubsetAggregator(config).Run(data);
	} catch(Exception &) {
		fThrew = true;
	}
	nFailures += ExpectTrue(fThrew, "month outside [1, 12] must be rejected");

	fThrew = false;
	try {
		BLStatsConfig configEmpty;
		SubsetAggregator aggregator(configEmpty);
	} catch(Exception &) {
		fThrew = true;
	}
	nFailures += ExpectTrue(fThrew, "configuration without regions must be rejected");

	return nFailures;
}

} // namespace

///////////////////////////////////////////////////////////////////////////////

int main() {
	int nFailures = 0;

	try {
		nFailures += TestAggregationMatchesIsolatedBuilds();
		nFailures += TestEmptySubset();
		nFailures += TestHandSelectedSlice();
		nFailures += TestLongitudeWrap();
		nFailures += TestInvalidDataset();

	} catch(Exception & e) {
		std::cerr << "[subset-aggregator] " << e.ToString() << std::endl;
		return 1;
	}

	if (nFailures > 0) {
		std::cerr << "[subset-aggregator] FAILED with "
			<< nFailures << " check(s)." << std::endl;
		return 1;
	}

	std::cout << "[subset-aggregator] all checks passed" << std::endl;
	return 0;
}

///////////////////////////////////////////////////////////////////////////////

