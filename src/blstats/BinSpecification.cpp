///////////////////////////////////////////////////////////////////////////////
///
///	\file    BinSpecification.cpp
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

#include "BinSpecification.h"

#include "Exception.h"
#include "STLStringHelper.h"

#include <cmath>
#include <cstdio>

///////////////////////////////////////////////////////////////////////////////

const double BinSpecification::EdgeCountTolerance = 1.0e-9;

///////////////////////////////////////////////////////////////////////////////

BinSpecification::BinSpecification() :
	m_dMin(0.0),
	m_dMax(1.0),
	m_dWidth(1.0)
{
	DeriveEdges(m_dMin, m_dMax, m_dWidth, m_vecEdges);
}

///////////////////////////////////////////////////////////////////////////////

BinSpecification::BinSpecification(
	double dMin,
	double dMax,
	double dWidth
) :
	m_dMin(dMin),
	m_dMax(dMax),
	m_dWidth(dWidth)
{
	DeriveEdges(m_dMin, m_dMax, m_dWidth, m_vecEdges);
}

///////////////////////////////////////////////////////////////////////////////

BinSpecification BinSpecification::FromString(
	const std::string & strSpec,
	const std::string & strName
) {
	std::vector<std::string> vecValues;
	STLStringHelper::ParseVariableList(strSpec, vecValues, ",");

	if (vecValues.size() != 3) {
		_EXCEPTION2("Bin specification for \"%s\" must be of the form "
			"\"min,max,width\" (found \"%s\")",
			strName.c_str(), strSpec.c_str());
	}

	std::string strContext = std::string("bin specification for ") + strName;

	double dMin = STLStringHelper::ToDouble(vecValues[0], strContext.c_str());
	double dMax = STLStringHelper::ToDouble(vecValues[1], strContext.c_str());
	double dWidth = STLStringHelper::ToDouble(vecValues[2], strContext.c_str());

	return BinSpecification(dMin, dMax, dWidth);
}

///////////////////////////////////////////////////////////////////////////////

void BinSpecification::DeriveEdges(
	double dMin,
	double dMax,
	double dWidth,
	std::vector<double> & vecEdges
) {
	if (!std::isfinite(dMin) || !std::isfinite(dMax) || !std::isfinite(dWidth)) {
		_EXCEPTION3("Non-finite bin specification (%g, %g, %g)",
			dMin, dMax, dWidth);
	}
	if (dWidth <= 0.0) {
		_EXCEPTION1("Bin width must be positive (found %g)", dWidth);
	}
	if (dMax <= dMin) {
		_EXCEPTION2("Bin maximum (%g) must be larger than bin minimum (%g)",
			dMax, dMin);
	}

	// The last edge is max whenever (max - min) is a whole number of widths
	double dSteps = floor((dMax - dMin) / dWidth + EdgeCountTolerance);
	if (dSteps >= 1.0e8) {
		_EXCEPTION3("Bin specification (%g, %g, %g) has too many bins",
			dMin, dMax, dWidth);
	}

	size_t nEdges = static_cast<size_t>(dSteps) + 1;

	vecEdges.resize(nEdges);
	for (size_t k = 0; k < nEdges; k++) {
		vecEdges[k] = dMin + static_cast<double>(k) * dWidth;
	}
}

///////////////////////////////////////////////////////////////////////////////

int BinSpecification::ComputeBinIndex(
	double dValue,
	IndexPolicy ePolicy
) const {
	if (!std::isfinite(dValue)) {
		return (-1);
	}

	double dOffset;
	if (ePolicy == IndexPolicy_RoundToNearest) {
		dOffset = 0.5;
	} else if (ePolicy == IndexPolicy_HalfBinDown) {
		dOffset = -0.5;
	} else {
		_EXCEPTION1("Invalid IndexPolicy (%i)", static_cast<int>(ePolicy));
	}

	double dIndex = floor((dValue - m_dMin) / m_dWidth + dOffset);

	// Values far outside the range remain out of range without overflow
	static const double dIndexLimit = 1.0e9;
	if (dIndex < -dIndexLimit) {
		return static_cast<int>(-dIndexLimit);
	}
	if (dIndex > dIndexLimit) {
		return static_cast<int>(dIndexLimit);
	}

	return static_cast<int>(dIndex);
}

///////////////////////////////////////////////////////////////////////////////

std::string BinSpecification::ToString() const {
	char szBuffer[128];
	snprintf(szBuffer, 128, "%g,%g,%g (%lu bins)",
		m_dMin, m_dMax, m_dWidth,
		static_cast<unsigned long>(m_vecEdges.size()));
	return std::string(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

