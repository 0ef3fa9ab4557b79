///////////////////////////////////////////////////////////////////////////////
///
///	\file    BLStatsConfig.h
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

#ifndef _BLSTATSCONFIG_H_
#define _BLSTATSCONFIG_H_

#include "BinSpecification.h"
#include "LatLonBox.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A named latitude-longitude region.
///	</summary>
struct RegionSpec {

	///	<summary>
	///		Constructor.
	///	</summary>
	RegionSpec() { }

	///	<summary>
	///		Constructor.
	///	</summary>
	RegionSpec(
		const std::string & a_strName,
		double dLatMin,
		double dLatMax,
		double dLonMin,
		double dLonMax
	) :
		strName(a_strName),
		box(dLatMin, dLatMax, dLonMin, dLonMax)
	{ }

	///	<summary>
	///		Name of the region.
	///	</summary>
	std::string strName;

	///	<summary>
	///		Bounds of the region.
	///	</summary>
	LatLonBox<double> box;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Configuration of one run: the regions and months to aggregate over,
///		the bin specifications of the three diagnostic axes, the
///		precipitation exceedance threshold and whether sums of squares are
///		accumulated.
///	</summary>
class BLStatsConfig {

public:
	///	<summary>
	///		Default bin specifications.
	///	</summary>
	static const char * DefaultBLBins;
	static const char * DefaultSubsatBins;
	static const char * DefaultCapeBins;

	///	<summary>
	///		Default precipitation exceedance threshold.
	///	</summary>
	static const double DefaultPrecipThreshold;

public:
	///	<summary>
	///		Constructor with default bins, threshold and all twelve months.
	///		The region list is empty.
	///	</summary>
	BLStatsConfig();

	///	<summary>
	///		Parse regions of the form "name:latmin,latmax,lonmin,lonmax"
	///		separated by semicolons, appending them to vecRegions.
	///	</summary>
	static void ParseRegions(
		const std::string & strRegions,
		std::vector<RegionSpec> & vecRegions
	);

	///	<summary>
	///		Parse a region file with one "name latmin latmax lonmin lonmax"
	///		entry per line, appending them to vecRegions.  Blank lines and
	///		text following '#' are ignored.
	///	</summary>
	static void ParseRegionFile(
		const std::string & strRegionFile,
		std::vector<RegionSpec> & vecRegions
	);

	///	<summary>
	///		Parse a comma separated list of months (1-12).  An empty string
	///		selects all twelve months.
	///	</summary>
	static void ParseMonths(
		const std::string & strMonths,
		std::vector<int> & vecMonths
	);

	///	<summary>
	///		Verify the configuration is complete and consistent.
	///	</summary>
	void Validate() const;

	///	<summary>
	///		Index of the region with the given name, or -1.
	///	</summary>
	int FindRegion(const std::string & strName) const;

	///	<summary>
	///		Index of the given month in the month list, or -1.
	///	</summary>
	int FindMonth(int iMonth) const;

public:
	///	<summary>
	///		Regions, in output order.
	///	</summary>
	std::vector<RegionSpec> vecRegions;

	///	<summary>
	///		Months (1-12), in output order.
	///	</summary>
	std::vector<int> vecMonths;

	///	<summary>
	///		Bin specification of the 1D BL axis.
	///	</summary>
	BinSpecification specBL;

	///	<summary>
	///		Bin specification of the first axis of the 2D joint scheme.
	///	</summary>
	BinSpecification specSubsat;

	///	<summary>
	///		Bin specification of the second axis of the 2D joint scheme.
	///	</summary>
	BinSpecification specCape;

	///	<summary>
	///		Precipitation exceedance threshold.
	///	</summary>
	double dPrecipThreshold;

	///	<summary>
	///		Accumulate sums of squares.
	///	</summary>
	bool fSumOfSquares;
};

///////////////////////////////////////////////////////////////////////////////

#endif

