///////////////////////////////////////////////////////////////////////////////
///
///	\file    BinnedStatsBuilder.cpp
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

#include "Exception.h"

#include <cmath>

///////////////////////////////////////////////////////////////////////////////
// StatsRecord
///////////////////////////////////////////////////////////////////////////////

StatsRecord::StatsRecord(
	const BinSpecification & specBL,
	const BinSpecification & specSubsat,
	const BinSpecification & specCape,
	const StatisticsAccumulator & accum,
	const std::string & strPrecipUnits,
	size_t sPointCount
) :
	m_specBL(specBL),
	m_specSubsat(specSubsat),
	m_specCape(specCape),
	m_accum(accum),
	m_strPrecipUnits(strPrecipUnits),
	m_sPointCount(sPointCount)
{
	if ((accum.GetBinCount1D() != specBL.GetBinCount()) ||
	    (accum.GetBinCountA() != specSubsat.GetBinCount()) ||
	    (accum.GetBinCountB() != specCape.GetBinCount())
	) {
		_EXCEPTIONT("Accumulator shape does not match bin specifications");
	}

	BuildVariableInfo(
		strPrecipUnits,
		accum.HasSumOfSquares(),
		m_vecVariableInfo);
}

///////////////////////////////////////////////////////////////////////////////

void StatsRecord::BuildVariableInfo(
	const std::string & strPrecipUnits,
	bool fSumOfSquares,
	std::vector<StatsVariableInfo> & vecInfo
) {
	std::string strSquaredUnits = "(" + strPrecipUnits + ")^2";
	if (strPrecipUnits == "") {
		strSquaredUnits = "";
	}

	static const char * szAxis[2] = {"Q", "P"};

	vecInfo.clear();
	for (int iJoint = 0; iJoint < 2; iJoint++) {
		StatsVariableInfo info;
		info.fJoint = (iJoint == 1);

		info.strName = std::string(szAxis[iJoint]) + "0";
		info.strLongName = "number of samples in bin";
		info.strUnits = "1";
		info.fCount = true;
		vecInfo.push_back(info);

		info.strName = std::string(szAxis[iJoint]) + "E";
		info.strLongName =
			"number of samples in bin with precipitation above threshold";
		info.strUnits = "1";
		info.fCount = true;
		vecInfo.push_back(info);

		info.strName = std::string(szAxis[iJoint]) + "1";
		info.strLongName = "sum of precipitation in bin";
		info.strUnits = strPrecipUnits;
		info.fCount = false;
		vecInfo.push_back(info);

		if (fSumOfSquares) {
			info.strName = std::string(szAxis[iJoint]) + "2";
			info.strLongName = "sum of squared precipitation in bin";
			info.strUnits = strSquaredUnits;
			info.fCount = false;
			vecInfo.push_back(info);
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

const StatsVariableInfo & StatsRecord::GetVariableInfo(
	const std::string & strName
) const {
	for (size_t i = 0; i < m_vecVariableInfo.size(); i++) {
		if (m_vecVariableInfo[i].strName == strName) {
			return m_vecVariableInfo[i];
		}
	}
	_EXCEPTION1("Unknown statistics variable \"%s\"", strName.c_str());
}

///////////////////////////////////////////////////////////////////////////////
// BinnedStatsBuilder
///////////////////////////////////////////////////////////////////////////////

BinnedStatsBuilder::BinnedStatsBuilder(
	const BinSpecification & specBL,
	const BinSpecification & specSubsat,
	const BinSpecification & specCape,
	double dThreshold,
	bool fSumOfSquares
) :
	m_specBL(specBL),
	m_specSubsat(specSubsat),
	m_specCape(specCape),
	m_dThreshold(dThreshold),
	m_fSumOfSquares(fSumOfSquares)
{
	if (!std::isfinite(dThreshold)) {
		_EXCEPTIONT("Precipitation threshold must be finite");
	}
}

///////////////////////////////////////////////////////////////////////////////

void BinnedStatsBuilder::ComputeIndices(
	const BinSpecification & spec,
	BinSpecification::IndexPolicy ePolicy,
	size_t nPoints,
	const double * dValues,
	DataArray1D<int> & iIndices
) {
	iIndices.Allocate(nPoints);

	const long lPoints = static_cast<long>(nPoints);

#pragma omp parallel for schedule(static)
	for (long i = 0; i < lPoints; i++) {
		iIndices[i] = spec.ComputeBinIndex(dValues[i], ePolicy);
	}
}

///////////////////////////////////////////////////////////////////////////////

StatsRecord BinnedStatsBuilder::Build(
	size_t nPoints,
	const double * dBL,
	const double * dSubsat,
	const double * dCape,
	const double * dPrecip,
	const std::string & strPrecipUnits
) const {
	if ((nPoints != 0) &&
	    ((dBL == NULL) || (dSubsat == NULL) || (dCape == NULL) || (dPrecip == NULL))
	) {
		_EXCEPTIONT("NULL input array passed to BinnedStatsBuilder");
	}

	DataArray1D<int> iIndexBL;
	DataArray1D<int> iIndexSubsat;
	DataArray1D<int> iIndexCape;

	ComputeIndices(m_specBL,
		BinSpecification::IndexPolicy_RoundToNearest,
		nPoints, dBL, iIndexBL);
	ComputeIndices(m_specSubsat,
		BinSpecification::IndexPolicy_HalfBinDown,
		nPoints, dSubsat, iIndexSubsat);
	ComputeIndices(m_specCape,
		BinSpecification::IndexPolicy_HalfBinDown,
		nPoints, dCape, iIndexCape);

	StatisticsAccumulator accum(
		m_specBL.GetBinCount(),
		m_specSubsat.GetBinCount(),
		m_specCape.GetBinCount(),
		m_fSumOfSquares);

	accum.Accumulate(
		nPoints,
		iIndexBL,
		iIndexSubsat,
		iIndexCape,
		dPrecip,
		m_dThreshold);

	return StatsRecord(
		m_specBL,
		m_specSubsat,
		m_specCape,
		accum,
		strPrecipUnits,
		nPoints);
}

///////////////////////////////////////////////////////////////////////////////

StatsRecord BinnedStatsBuilder::Build(
	const DataArray1D<double> & dataBL,
	const DataArray1D<double> & dataSubsat,
	const DataArray1D<double> & dataCape,
	const DataArray1D<double> & dataPrecip,
	const std::string & strPrecipUnits
) const {
	size_t nPoints = dataPrecip.GetRows();

	if ((dataBL.GetRows() != nPoints) ||
	    (dataSubsat.GetRows() != nPoints) ||
	    (dataCape.GetRows() != nPoints)
	) {
		_EXCEPTION4("Input array length mismatch "
			"(BL %lu, subsat %lu, cape %lu, precip %lu)",
			dataBL.GetRows(), dataSubsat.GetRows(),
			dataCape.GetRows(), nPoints);
	}

	return Build(
		nPoints,
		dataBL,
		dataSubsat,
		dataCape,
		dataPrecip,
		strPrecipUnits);
}

///////////////////////////////////////////////////////////////////////////////

