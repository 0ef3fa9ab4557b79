///////////////////////////////////////////////////////////////////////////////
///
///	\file    TestStatisticsAccumulator.cpp
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

#if defined(_OPENMP)
#include <omp.h>
#endif

#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

namespace {

int ExpectTrue(bool fCondition, const std::string & strMessage) {
	if (!fCondition) {
		std::cerr << "[statistics-accumulator] FAIL: " << strMessage << std::endl;
		return 1;
	}
	return 0;
}

bool NearlyEqual(double a, double b, double dTol = 1.0e-9) {
	return (std::fabs(a - b) <= dTol * (1.0 + std::fabs(a) + std::fabs(b)));
}

///	<summary>
///		Compare two accumulators: counts exactly, sums with a tolerance.
///	</summary>
bool SameStatistics(
	const StatisticsAccumulator & accum1,
	const StatisticsAccumulator & accum2
) {
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

///////////////////////////////////////////////////////////////////////////////

int TestBasicAccumulation() {
	int nFailures = 0;

	const int iIndex1D[] = {0, 1, 1, 2, 5, -1};
	const int iIndexA[]  = {0, 0, 1, 1, 1, 0};
	const int iIndexB[]  = {1, 1, 0, 0, 2, 1};
	const double dValue[] = {1.0, 2.0, 3.0, 0.25, 4.0, 5.0};

	StatisticsAccumulator accum(3, 2, 2, true);
	accum.Accumulate(6, iIndex1D, iIndexA, iIndexB, dValue, 0.25);

	nFailures += ExpectTrue(accum.Q0()[0] == 1, "Q0[0] must be 1");
	nFailures += ExpectTrue(accum.Q0()[1] == 2, "Q0[1] must be 2");
	nFailures += ExpectTrue(accum.Q0()[2] == 1, "Q0[2] must be 1");
	nFailures += ExpectTrue(NearlyEqual(accum.Q1()[1], 5.0), "Q1[1] must be 5");
	nFailures += ExpectTrue(NearlyEqual(accum.Q2()[1], 13.0), "Q2[1] must be 13");

	// Value equal to the threshold does not exceed it
	nFailures += ExpectTrue(accum.QE()[2] == 0,
		"value equal to threshold must not count as exceedance");
	nFailures += ExpectTrue(accum.QE()[1] == 2, "QE[1] must be 2");

	// 2D: (0,1) receives points 0, 1 and 5; point 4 has b out of range
	nFailures += ExpectTrue(accum.P0()(0,1) == 3, "P0(0,1) must be 3");
	nFailures += ExpectTrue(accum.P0()(1,0) == 2, "P0(1,0) must be 2");
	nFailures += ExpectTrue(accum.P0()(0,0) == 0, "P0(0,0) must be 0");
	nFailures += ExpectTrue(accum.P0()(1,1) == 0, "P0(1,1) must be 0");
	nFailures += ExpectTrue(NearlyEqual(accum.P1()(0,1), 8.0), "P1(0,1) must be 8");
	nFailures += ExpectTrue(accum.PE()(1,0) == 1, "PE(1,0) must be 1");

	return nFailures;
}

///////////////////////////////////////////////////////////////////////////////

int TestMissingValuesSkipped() {
	int nFailures = 0;

	const double dNaN = std::numeric_limits<double>::quiet_NaN();

	const size_t nPoints = 100;
	std::vector<int> vecIndex(nPoints, 0);
	std::vector<double> vecValue(nPoints, 1.0);
	for (size_t i = 0; i < nPoints; i += 2) {
		vecValue[i] = dNaN;
	}

	StatisticsAccumulator accum(1, 1, 1, true);
	accum.Accumulate(nPoints,
		&(vecIndex[0]), &(vecIndex[0]), &(vecIndex[0]),
		&(vecValue[0]), 0.5);

	nFailures += ExpectTrue(accum.Q0()[0] == 50, "only finite values must be counted");
	nFailures += ExpectTrue(accum.P0()(0,0) == 50, "only finite values must be counted in 2D");
	nFailures += ExpectTrue(std::isfinite(accum.Q1()[0]), "sums must remain finite");
	nFailures += ExpectTrue(NearlyEqual(accum.Q1()[0], 50.0), "Q1 must be 50");

	return nFailures;
}

///////////////////////////////////////////////////////////////////////////////

int TestOrderIndependenceAndMerge() {
	int nFailures = 0;

	// Enough points for several OpenMP partitions
	const size_t nPoints = 450000;
	const int nBins1D = 7;
	const int nBinsA = 5;
	const int nBinsB = 4;

	std::vector<int> vecIndex1D(nPoints);
	std::vector<int> vecIndexA(nPoints);
	std::vector<int> vecIndexB(nPoints);
	std::vector<double> vecValue(nPoints);

	for (size_t s = 0; s < nPoints; s++) {
		vecIndex1D[s] = static_cast<int>((s * 7919) % (nBins1D + 2)) - 1;
		vecIndexA[s] = static_cast<int>((s * 104729) % nBinsA);
		vecIndexB[s] = static_cast<int>((s * 31) % (nBinsB + 1));
		vecValue[s] = static_cast<double>((s * 37) % 1000) / 100.0;
	}

	StatisticsAccumulator accumForward(nBins1D, nBinsA, nBinsB, true);
	accumForward.Accumulate(nPoints,
		&(vecIndex1D[0]), &(vecIndexA[0]), &(vecIndexB[0]),
		&(vecValue[0]), 2.5);

	// Reverse the point order
	std::vector<int> vecRevIndex1D(vecIndex1D.rbegin(), vecIndex1D.rend());
	std::vector<int> vecRevIndexA(vecIndexA.rbegin(), vecIndexA.rend());
	std::vector<int> vecRevIndexB(vecIndexB.rbegin(), vecIndexB.rend());
	std::vector<double> vecRevValue(vecValue.rbegin(), vecValue.rend());

	StatisticsAccumulator accumReverse(nBins1D, nBinsA, nBinsB, true);
	accumReverse.Accumulate(nPoints,
		&(vecRevIndex1D[0]), &(vecRevIndexA[0]), &(vecRevIndexB[0]),
		&(vecRevValue[0]), 2.5);

	nFailures += ExpectTrue(SameStatistics(accumForward, accumReverse),
		"statistics must not depend on point order");

	// Two disjoint halves merged by Add
	const size_t nHalf = nPoints / 2;
	StatisticsAccumulator accumMerged(nBins1D, nBinsA, nBinsB, true);
	StatisticsAccumulator accumSecond(nBins1D, nBinsA, nBinsB, true);
	accumMerged.Accumulate(nHalf,
		&(vecIndex1D[0]), &(vecIndexA[0]), &(vecIndexB[0]),
		&(vecValue[0]), 2.5);
	accumSecond.Accumulate(nPoints - nHalf,
		&(vecIndex1D[nHalf]), &(vecIndexA[nHalf]), &(vecIndexB[nHalf]),
		&(vecValue[nHalf]), 2.5);
	accumMerged.Add(accumSecond);

	nFailures += ExpectTrue(SameStatistics(accumForward, accumMerged),
		"merged halves must equal a single pass");

	// Conservation: every point with an in-range index is counted once
	BinCount nExpected1D = 0;
	BinCount nExpected2D = 0;
	for (size_t s = 0; s < nPoints; s++) {
		if ((vecIndex1D[s] >= 0) && (vecIndex1D[s] < nBins1D)) {
			nExpected1D++;
		}
		if (vecIndexB[s] < nBinsB) {
			nExpected2D++;
		}
	}

	BinCount nTotal1D = 0;
	bool fExceedanceBounded = true;
	for (int i = 0; i < nBins1D; i++) {
		nTotal1D += accumForward.Q0()[i];
		if (accumForward.QE()[i] > accumForward.Q0()[i]) {
			fExceedanceBounded = false;
		}
	}

	BinCount nTotal2D = 0;
	for (int a = 0; a < nBinsA; a++) {
	for (int b = 0; b < nBinsB; b++) {
		nTotal2D += accumForward.P0()(a,b);
		if (accumForward.PE()(a,b) > accumForward.P0()(a,b)) {
			fExceedanceBounded = false;
		}
	}
	}

	nFailures += ExpectTrue(nTotal1D == nExpected1D,
		"1D counts must equal the number of in-range points");
	nFailures += ExpectTrue(nTotal2D == nExpected2D,
		"2D counts must equal the number of in-range points");
	nFailures += ExpectTrue(fExceedanceBounded,
		"exceedance counts must not exceed sample counts");

	return nFailures;
}

///////////////////////////////////////////////////////////////////////////////

int TestPartitionedAccumulation() {
	int nFailures = 0;

	// Several times MinimumPointsPerPartition so every thread gets a range
	const size_t nPoints = 1000003;
	const int nBins1D = 11;
	const int nBinsA = 6;
	const int nBinsB = 9;
	const double dThreshold = 3.0;
	const double dNaN = std::numeric_limits<double>::quiet_NaN();

	std::vector<int> vecIndex1D(nPoints);
	std::vector<int> vecIndexA(nPoints);
	std::vector<int> vecIndexB(nPoints);
	std::vector<double> vecValue(nPoints);

	for (size_t s = 0; s < nPoints; s++) {
		vecIndex1D[s] = static_cast<int>((s * 7919) % (nBins1D + 3)) - 1;
		vecIndexA[s] = static_cast<int>((s * 104729) % (nBinsA + 2)) - 1;
		vecIndexB[s] = static_cast<int>((s * 31) % (nBinsB + 1));
		if ((s % 13) == 0) {
			vecValue[s] = dNaN;
		} else {
			vecValue[s] = static_cast<double>((s * 37) % 1000) / 100.0;
		}
	}

	// Reference counts from a plain loop over the points
	std::vector<BinCount> vecQ0(nBins1D, 0);
	std::vector<BinCount> vecQE(nBins1D, 0);
	std::vector<BinCount> vecP0(nBinsA * nBinsB, 0);
	for (size_t s = 0; s < nPoints; s++) {
		if (std::isnan(vecValue[s])) {
			continue;
		}
		const int i = vecIndex1D[s];
		if ((i >= 0) && (i < nBins1D)) {
			vecQ0[i]++;
			if (vecValue[s] > dThreshold) {
				vecQE[i]++;
			}
		}
		const int a = vecIndexA[s];
		const int b = vecIndexB[s];
		if ((a >= 0) && (a < nBinsA) && (b >= 0) && (b < nBinsB)) {
			vecP0[a * nBinsB + b]++;
		}
	}

	StatisticsAccumulator accum(nBins1D, nBinsA, nBinsB, true);
	accum.Accumulate(nPoints,
		&(vecIndex1D[0]), &(vecIndexA[0]), &(vecIndexB[0]),
		&(vecValue[0]), dThreshold);

	bool fCountsMatch = true;
	for (int i = 0; i < nBins1D; i++) {
		if ((accum.Q0()[i] != vecQ0[i]) || (accum.QE()[i] != vecQE[i])) {
			fCountsMatch = false;
		}
	}
	for (int a = 0; a < nBinsA; a++) {
	for (int b = 0; b < nBinsB; b++) {
		if (accum.P0()(a,b) != vecP0[a * nBinsB + b]) {
			fCountsMatch = false;
		}
	}
	}
	nFailures += ExpectTrue(fCountsMatch,
		"partitioned counts must equal a direct count of the points");

#if defined(_OPENMP)
	const int nMaxThreads = omp_get_max_threads();

	omp_set_num_threads(8);
	StatisticsAccumulator accumThreaded(nBins1D, nBinsA, nBinsB, true);
	accumThreaded.Accumulate(nPoints,
		&(vecIndex1D[0]), &(vecIndexA[0]), &(vecIndexB[0]),
		&(vecValue[0]), dThreshold);

	omp_set_num_threads(1);
	StatisticsAccumulator accumSingle(nBins1D, nBinsA, nBinsB, true);
	accumSingle.Accumulate(nPoints,
		&(vecIndex1D[0]), &(vecIndexA[0]), &(vecIndexB[0]),
		&(vecValue[0]), dThreshold);

	omp_set_num_threads(nMaxThreads);

	nFailures += ExpectTrue(SameStatistics(accumThreaded, accumSingle),
		"8-thread and 1-thread accumulation must agree");
	nFailures += ExpectTrue(SameStatistics(accum, accumSingle),
		"default-thread and 1-thread accumulation must agree");
#endif

	return nFailures;
}

///////////////////////////////////////////////////////////////////////////////

int TestPackUnpack() {
	int nFailures = 0;

	const int iIndex[] = {0, 1, 1};
	const double dValue[] = {1.0, 2.0, 3.0};

	StatisticsAccumulator accum(2, 2, 2, true);
	accum.Accumulate(3, iIndex, iIndex, iIndex, dValue, 1.5);

	std::vector<BinCount> vecCounts;
	std::vector<double> vecSums;
	accum.Pack(vecCounts, vecSums);

	StatisticsAccumulator accumCopy(2, 2, 2, true);
	size_t iCount = 0;
	size_t iSum = 0;
	accumCopy.Unpack(vecCounts, iCount, vecSums, iSum);

	nFailures += ExpectTrue(iCount == vecCounts.size(), "all counts must be read");
	nFailures += ExpectTrue(iSum == vecSums.size(), "all sums must be read");
	nFailures += ExpectTrue(SameStatistics(accum, accumCopy),
		"unpacked accumulator must equal the original");

	return nFailures;
}

///////////////////////////////////////////////////////////////////////////////

int TestInvalidInput() {
	int nFailures = 0;

	StatisticsAccumulator accum(2, 2, 2, false);
	nFailures += ExpectTrue(!accum.HasSumOfSquares(),
		"sum of squares must be disabled");

	const int iIndex[] = {0};
	bool fThrew = false;
	try {
		accum.Accumulate(1, iIndex, iIndex, iIndex, NULL, 0.0);
	} catch(Exception &) {
		fThrew = true;
	}
	nFailures += ExpectTrue(fThrew, "NULL values must be rejected");

	fThrew = false;
	try {
		StatisticsAccumulator accumOther(2, 2, 2, true);
		accum.Add(accumOther);
	} catch(Exception &) {
		fThrew = true;
	}
	nFailures += ExpectTrue(fThrew, "mismatched accumulators must not be added");

	return nFailures;
}

} // namespace

///////////////////////////////////////////////////////////////////////////////

int main() {
	int nFailures = 0;

	try {
		nFailures += TestBasicAccumulation();
		nFailures += TestMissingValuesSkipped();
		nFailures += TestOrderIndependenceAndMerge();
		nFailures += TestPartitionedAccumulation();
		nFailures += TestPackUnpack();
		nFailures += TestInvalidInput();

	} catch(Exception & e) {
		std::cerr << "[statistics-accumulator] " << e.ToString() << std::endl;
		return 1;
	}

	if (nFailures > 0) {
		std::cerr << "[statistics-accumulator] FAILED with "
			<< nFailures << " check(s)." << std::endl;
		return 1;
	}

	std::cout << "[statistics-accumulator] all checks passed" << std::endl;
	return 0;
}

///////////////////////////////////////////////////////////////////////////////

