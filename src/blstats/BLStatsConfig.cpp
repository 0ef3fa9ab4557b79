///////////////////////////////////////////////////////////////////////////////
///
///	\file    BLStatsConfig.cpp
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

#include "BLStatsConfig.h"

#include "Exception.h"
#include "STLStringHelper.h"

#include <cmath>
#include <fstream>
#include <sstream>

///////////////////////////////////////////////////////////////////////////////

const char * BLStatsConfig::DefaultBLBins = "-0.6,0.1,0.0025";
const char * BLStatsConfig::DefaultSubsatBins = "-0.1,1.0,0.01";
const char * BLStatsConfig::DefaultCapeBins = "-0.6,0.3,0.01";

const double BLStatsConfig::DefaultPrecipThreshold = 0.25;

///////////////////////////////////////////////////////////////////////////////

BLStatsConfig::BLStatsConfig() :
	specBL(BinSpecification::FromString(DefaultBLBins, "bl")),
	specSubsat(BinSpecification::FromString(DefaultSubsatBins, "subsat")),
	specCape(BinSpecification::FromString(DefaultCapeBins, "cape")),
	dPrecipThreshold(DefaultPrecipThreshold),
	fSumOfSquares(true)
{
	for (int m = 1; m <= 12; m++) {
		vecMonths.push_back(m);
	}
}

///////////////////////////////////////////////////////////////////////////////

void BLStatsConfig::ParseRegions(
	const std::string & strRegions,
	std::vector<RegionSpec> & vecRegions
) {
	std::vector<std::string> vecRegionStrings;
	STLStringHelper::ParseVariableList(strRegions, vecRegionStrings, ";");

	for (size_t r = 0; r < vecRegionStrings.size(); r++) {
		const std::string & strRegion = vecRegionStrings[r];

		size_t sColon = strRegion.find(':');
		if (sColon == std::string::npos) {
			_EXCEPTION1("Region \"%s\" must be of the form "
				"\"name:latmin,latmax,lonmin,lonmax\"",
				strRegion.c_str());
		}

		std::string strName = strRegion.substr(0, sColon);
		STLStringHelper::RemoveWhitespaceInPlace(strName);
		if (strName.length() == 0) {
			_EXCEPTION1("Region \"%s\" has an empty name", strRegion.c_str());
		}

		std::vector<std::string> vecBounds;
		STLStringHelper::ParseVariableList(
			strRegion.substr(sColon+1), vecBounds, ",");

		if (vecBounds.size() != 4) {
			_EXCEPTION2("Region \"%s\" requires exactly four bounds "
				"latmin,latmax,lonmin,lonmax (found %lu)",
				strName.c_str(), vecBounds.size());
		}

		std::string strContext = "bounds of region " + strName;

		double dBounds[4];
		for (int i = 0; i < 4; i++) {
			dBounds[i] = STLStringHelper::ToDouble(
				vecBounds[i], strContext.c_str());
		}

		vecRegions.push_back(
			RegionSpec(strName, dBounds[0], dBounds[1], dBounds[2], dBounds[3]));
	}
}

///////////////////////////////////////////////////////////////////////////////

void BLStatsConfig::ParseRegionFile(
	const std::string & strRegionFile,
	std::vector<RegionSpec> & vecRegions
) {
	std::ifstream ifRegions(strRegionFile.c_str());
	if (!ifRegions.is_open()) {
		_EXCEPTION1("Unable to open region file \"%s\"",
			strRegionFile.c_str());
	}

	int iLine = 0;
	std::string strLine;
	while (std::getline(ifRegions, strLine)) {
		iLine++;

		size_t sComment = strLine.find('#');
		if (sComment != std::string::npos) {
			strLine = strLine.substr(0, sComment);
		}

		std::istringstream issLine(strLine);
		std::vector<std::string> vecTokens;
		std::string strToken;
		while (issLine >> strToken) {
			vecTokens.push_back(strToken);
		}

		if (vecTokens.size() == 0) {
			continue;
		}
		if (vecTokens.size() != 5) {
			_EXCEPTION2("Malformed region on line %i of \"%s\": expected "
				"\"name latmin latmax lonmin lonmax\"",
				iLine, strRegionFile.c_str());
		}

		std::string strContext = "bounds of region " + vecTokens[0];

		vecRegions.push_back(
			RegionSpec(
				vecTokens[0],
				STLStringHelper::ToDouble(vecTokens[1], strContext.c_str()),
				STLStringHelper::ToDouble(vecTokens[2], strContext.c_str()),
				STLStringHelper::ToDouble(vecTokens[3], strContext.c_str()),
				STLStringHelper::ToDouble(vecTokens[4], strContext.c_str())));
	}
}

///////////////////////////////////////////////////////////////////////////////

void BLStatsConfig::ParseMonths(
	const std::string & strMonths,
	std::vector<int> & vecMonths
) {
	vecMonths.clear();

	if (strMonths.length() == 0) {
		for (int m = 1; m <= 12; m++) {
			vecMonths.push_back(m);
		}
		return;
	}

	std::vector<std::string> vecMonthStrings;
	STLStringHelper::ParseVariableList(strMonths, vecMonthStrings, ",");

	for (size_t m = 0; m < vecMonthStrings.size(); m++) {
		vecMonths.push_back(
			STLStringHelper::ToInteger(vecMonthStrings[m], "month list"));
	}
}

///////////////////////////////////////////////////////////////////////////////

void BLStatsConfig::Validate() const {

	// Regions
	if (vecRegions.size() == 0) {
		_EXCEPTIONT("No regions specified (use --regions or --regionfile)");
	}
	for (size_t r = 0; r < vecRegions.size(); r++) {
		if (vecRegions[r].strName.length() == 0) {
			_EXCEPTION1("Region %lu has an empty name", r);
		}
		for (size_t s = 0; s < r; s++) {
			if (vecRegions[r].strName == vecRegions[s].strName) {
				_EXCEPTION1("Region \"%s\" specified more than once",
					vecRegions[r].strName.c_str());
			}
		}

		// Bounds are checked on construction; re-check in case of assignment
		const LatLonBox<double> & box = vecRegions[r].box;
		LatLonBox<double> boxCheck;
		boxCheck.set(box.lat[0], box.lat[1], box.lon[0], box.lon[1]);
	}

	// Months
	if (vecMonths.size() == 0) {
		_EXCEPTIONT("No months specified");
	}
	for (size_t m = 0; m < vecMonths.size(); m++) {
		if ((vecMonths[m] < 1) || (vecMonths[m] > 12)) {
			_EXCEPTION1("Month %i out of range [1, 12]", vecMonths[m]);
		}
		for (size_t n = 0; n < m; n++) {
			if (vecMonths[m] == vecMonths[n]) {
				_EXCEPTION1("Month %i specified more than once", vecMonths[m]);
			}
		}
	}

	// Threshold
	if (!std::isfinite(dPrecipThreshold)) {
		_EXCEPTIONT("Precipitation threshold must be finite");
	}
}

///////////////////////////////////////////////////////////////////////////////

int BLStatsConfig::FindRegion(const std::string & strName) const {
	for (size_t r = 0; r < vecRegions.size(); r++) {
		if (vecRegions[r].strName == strName) {
			return static_cast<int>(r);
		}
	}
	return (-1);
}

///////////////////////////////////////////////////////////////////////////////

int BLStatsConfig::FindMonth(int iMonth) const {
	for (size_t m = 0; m < vecMonths.size(); m++) {
		if (vecMonths[m] == iMonth) {
			return static_cast<int>(m);
		}
	}
	return (-1);
}

///////////////////////////////////////////////////////////////////////////////

