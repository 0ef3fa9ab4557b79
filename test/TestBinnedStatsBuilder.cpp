///////////////////////////////////////////////////////////////////////////////
///
///	\file    TestBinnedStatsBuilder.cpp
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

#include "BinnedStatsBuilder.h"
#include "BLStatsConfig.h"
#include "Exception.h"

#include <cmath>
#include <iostream>
#include <limits>
#include <string>

///////////////////////////////////////////////////////////////////////////////

namespace {

int ExpectTrue(bool fCondition, const std::string & strMessage) {
	if (!fCondition) {
		std::cerr << "[binned-stats-builder] FAIL: " << strMessage << std::endl;
		return 1;
	}
	return 0;
}

bool NearlyEqual(double a, double b, double dTol = 1.0e-12) {
	return (std::fabs(a - b) <= dTol);
}

BinCount TotalCount1D(const StatisticsAccumulator & accum) {
	BinCount nTotal = 0;
	for (size_t i = 0; i < accum.GetBinCount1D(); i++) {
		nTotal += accum.Q0()[i];
	}
	return nTotal;
}

BinCount TotalCount2D(const StatisticsAccumulator & accum) {
	BinCount nTotal = 0;
	for (size_t a = 0; a < accum.GetBinCountA(); a++) {
	for (size_t b = 0; b < accum.GetBinCountB(); b++) {
		nTotal += accum.P0()(a,b);
	}
	}
	return nTotal;
}

///////////////////////////////////////////////////////////////////////////////

int TestIndexPolicyPerAxis() {
	int nFailures = 0;

	const double dNaN = std::numeric_limits<double>::quiet_NaN();

	BinSpecification spec(0.0, 1.0, 0.1);
	BinnedStatsBuilder builder(spec, spec, spec, 0.25, true);

	DataArray1D<double> dataBL(4);
	DataArray1D<double> dataSubsat(4);
	DataArray1D<double> dataCape(4);
	DataArray1D<double> dataPrecip(4);

	dataBL[0] = 0.0;  dataSubsat[0] = 0.16; dataCape[0] = 0.27; dataPrecip[0] = 1.0;
	dataBL[1] = 0.3;  dataSubsat[1] = 0.16; dataCape[1] = 0.27; dataPrecip[1] = 0.25;
	dataBL[2] = dNaN; dataSubsat[2] = 0.06; dataCape[2] = 0.0;  dataPrecip[2] = 2.0;
	dataBL[3] = 0.5;  dataSubsat[3] = 0.06; dataCape[3] = 0.16; dataPrecip[3] = dNaN;

	StatsRecord record =
		builder.Build(dataBL, dataSubsat, dataCape, dataPrecip, "mm/day");

	const StatisticsAccumulator & accum = record.GetAccumulator();

	nFailures += ExpectTrue(record.GetPointCount() == 4,
		"point count must include missing values");
	nFailures += ExpectTrue(accum.Q0()[0] == 1,
		"bl at min must round to index 0");
	nFailures += ExpectTrue(accum.Q0()[3] == 1,
		"bl 0.3 must round to index 3");
	nFailures += ExpectTrue(TotalCount1D(accum) == 2,
		"missing bl and missing precip must not be counted");
	nFailures += ExpectTrue(accum.QE()[3] == 0,
		"precip equal to threshold must not exceed it");

	nFailures += ExpectTrue(accum.P0()(1,2) == 2,
		"subsat 0.16 and cape 0.27 must map to (1,2)");
	nFailures += ExpectTrue(NearlyEqual(accum.P1()(1,2), 1.25),
		"P1(1,2) must be 1.25");
	nFailures += ExpectTrue(NearlyEqual(accum.P2()(1,2), 1.0625),
		"P2(1,2) must be 1.0625");
	nFailures += ExpectTrue(accum.PE()(1,2) == 1,
		"PE(1,2) must be 1");
	nFailures += ExpectTrue(TotalCount2D(accum) == 2,
		"cape at min must be out of range under half-bin-down");

	return nFailures;
}

///////////////////////////////////////////////////////////////////////////////

int TestDefaultBLAxis() {
	int nFailures = 0;

	BLStatsConfig config;
	BinnedStatsBuilder builder(
		config.specBL, config.specSubsat, config.specCape,
		config.dPrecipThreshold);

	nFailures += ExpectTrue(config.specBL.GetBinCount() == 281,
		"default bl axis must have 281 edges");

	const double dBL[] = {-0.6, -0.59875, 0.1, 0.2};
	const double dSubsat[] = {0.5, 0.5, 0.5, 0.5};
	const double dCape[] = {0.0, 0.0, 0.0, 0.0};
	const double dPrecip[] = {1.0, 2.0, 3.0, 4.0};

	StatsRecord record =
		builder.Build(4, dBL, dSubsat, dCape, dPrecip, "mm/day");

	const StatisticsAccumulator & accum = record.GetAccumulator();

	nFailures += ExpectTrue(accum.Q0()[0] == 2,
		"-0.6 and -0.59875 must both map to bl index 0");
	nFailures += ExpectTrue(accum.Q0()[280] == 1,
		"bl max must map to the last index");
	nFailures += ExpectTrue(TotalCount1D(accum) == 3,
		"bl above max must be excluded");
	nFailures += ExpectTrue(TotalCount2D(accum) == 4,
		"all points must be counted in 2D");

	return nFailures;
}

///////////////////////////////////////////////////////////////////////////////

int TestHalfMissingPrecipitation() {
	int nFailures = 0;

	const double dNaN = std::numeric_limits<double>::quiet_NaN();

	BLStatsConfig config;
	BinnedStatsBuilder builder(
		config.specBL, config.specSubsat, config.specCape,
		config.dPrecipThreshold);

	const size_t nPoints = 100;
	DataArray1D<double> dataBL(nPoints);
	DataArray1D<double> dataSubsat(nPoints);
	DataArray1D<double> dataCape(nPoints);
	DataArray1D<double> dataPrecip(nPoints);

	for (size_t i = 0; i < nPoints; i++) {
		dataBL[i] = -0.3;
		dataSubsat[i] = 0.5;
		dataCape[i] = 0.0;
		dataPrecip[i] = ((i % 2) == 0)?(dNaN):(1.0);
	}

	StatsRecord record =
		builder.Build(dataBL, dataSubsat, dataCape, dataPrecip, "mm/day");

	nFailures += ExpectTrue(TotalCount1D(record.GetAccumulator()) == 50,
		"half-missing precipitation must yield 50 samples");
	nFailures += ExpectTrue(TotalCount2D(record.GetAccumulator()) == 50,
		"half-missing precipitation must yield 50 joint samples");

	return nFailures;
}

///////////////////////////////////////////////////////////////////////////////

int TestEmptyInput() {
	int nFailures = 0;

	BinSpecification spec(0.0, 1.0, 0.1);
	BinnedStatsBuilder builder(spec, spec, spec, 0.25, false);

	StatsRecord record = builder.Build(0, NULL, NULL, NULL, NULL, "mm/day");

	nFailures += ExpectTrue(record.GetPointCount() == 0,
		"empty input must have zero points");
	nFailures += ExpectTrue(TotalCount1D(record.GetAccumulator()) == 0,
		"empty input must have zero counts");
	nFailures += ExpectTrue(record.GetAccumulator().GetBinCount1D() == 11,
		"empty input must keep full bin shape");

	return nFailures;
}

///////////////////////////////////////////////////////////////////////////////

int TestVariableInfo() {
	int nFailures = 0;

	BinSpecification spec(0.0, 1.0, 0.1);

	StatsRecord recordFull =
		BinnedStatsBuilder(spec, spec, spec, 0.25, true).Build(
			0, NULL, NULL, NULL, NULL, "mm/day");

	nFailures += ExpectTrue(recordFull.GetVariableInfo().size() == 8,
		"eight variables must be described with sums of squares");
	nFailures += ExpectTrue(recordFull.GetVariableInfo("Q2").strUnits == "(mm/day)^2",
		"Q2 must carry squared units");
	nFailures += ExpectTrue(recordFull.GetVariableInfo("PE").strUnits == "1",
		"PE must be dimensionless");
	nFailures += ExpectTrue(recordFull.GetVariableInfo("P1").fJoint,
		"P1 must be a joint variable");
	nFailures += ExpectTrue(!recordFull.GetVariableInfo("Q1").fCount,
		"Q1 must not be a count");

	StatsRecord recordNoSq =
		BinnedStatsBuilder(spec, spec, spec, 0.25, false).Build(
			0, NULL, NULL, NULL, NULL, "mm/day");

	nFailures += ExpectTrue(recordNoSq.GetVariableInfo().size() == 6,
		"six variables must be described without sums of squares");

	return nFailures;
}

///////////////////////////////////////////////////////////////////////////////

int TestInvalidInput() {
	int nFailures = 0;

	BinSpecification spec(0.0, 1.0, 0.1);

	bool fThrew = false;
	try {
		BinnedStatsBuilder builder(spec, spec, spec,
			std::numeric_limits<double>::quiet_NaN());
	} catch(Exception &) {
		fThrew = true;
	}
	nFailures += ExpectTrue(fThrew, "non-finite threshold must be rejected");

	fThrew = false;
	try {
		BinnedStatsBuilder builder(spec, spec, spec, 0.25);
		DataArray1D<double> data3(3);
		DataArray1D<double> data4(4);
		builder.Build(data3, data3, data3, data4, "mm/day");
	} catch(Exception &) {
		fThrew = true;
	}
	nFailures += ExpectTrue(fThrew, "mismatched input lengths must be rejected");

	return nFailures;
}

} // namespace

///////////////////////////////////////////////////////////////////////////////

int main() {
	int nFailures = 0;

	try {
		nFailures += TestIndexPolicyPerAxis();
		nFailures += TestDefaultBLAxis();
		nFailures += TestHalfMissingPrecipitation();
		nFailures += TestEmptyInput();
		nFailures += TestVariableInfo();
		nFailures += TestInvalidInput();

	} catch(Exception & e) {
		std::cerr << "[binned-stats-builder] " << e.ToString() << std::endl;
		return 1;
	}

	if (nFailures > 0) {
		std::cerr << "[binned-stats-builder] FAILED with "
			<< nFailures << " check(s)." << std::endl;
		return 1;
	}

	std::cout << "[binned-stats-builder] all checks passed" << std::endl;
	return 0;
}

///////////////////////////////////////////////////////////////////////////////

