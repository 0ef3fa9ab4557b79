///////////////////////////////////////////////////////////////////////////////
///
///	\file    ProductWriter.cpp
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

#include "ProductWriter.h"

#include "Exception.h"
#include "DataArray1D.h"

#include "netcdfcpp.h"

#include <cstring>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

namespace {

///	<summary>
///		Add an edge coordinate variable.
///	</summary>
void WriteEdgeCoordinate(
	NcFile & ncOutput,
	NcDim * dim,
	const BinSpecification & spec,
	const char * szLongName,
	const char * szIndexPolicy
) {
	NcVar * var = ncOutput.add_var(dim->name(), ncDouble, dim);
	if (var == NULL) {
		_EXCEPTION1("Unable to create variable \"%s\"", dim->name());
	}

	var->add_att("long_name", szLongName);
	var->add_att("units", "1");
	var->add_att("bin_min", spec.GetMin());
	var->add_att("bin_max", spec.GetMax());
	var->add_att("bin_width", spec.GetWidth());
	var->add_att("index_policy", szIndexPolicy);

	const std::vector<double> & vecEdges = spec.GetEdges();
	var->put(&(vecEdges[0]), static_cast<long>(vecEdges.size()));
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Add a statistics variable with its metadata.
///	</summary>
NcVar * AddStatsVariable(
	NcFile & ncOutput,
	const StatsVariableInfo & info,
	NcDim * dimRegion,
	NcDim * dimMonth,
	NcDim * dimBL,
	NcDim * dimSubsat,
	NcDim * dimCape
) {
	NcVar * var = NULL;
	if (info.fJoint) {
		var = ncOutput.add_var(info.strName.c_str(), ncDouble,
			dimRegion, dimMonth, dimSubsat, dimCape);
	} else {
		var = ncOutput.add_var(info.strName.c_str(), ncDouble,
			dimRegion, dimMonth, dimBL);
	}
	if (var == NULL) {
		_EXCEPTION1("Unable to create variable \"%s\"", info.strName.c_str());
	}

	var->add_att("long_name", info.strLongName.c_str());
	var->add_att("units", info.strUnits.c_str());

	return var;
}

}

///////////////////////////////////////////////////////////////////////////////

void WriteAggregatedProduct(
	const AggregatedProduct & product,
	const std::string & strOutputFile
) {
	NcFile ncOutput(strOutputFile.c_str(), NcFile::Replace);
	if (!ncOutput.is_valid()) {
		_EXCEPTION1("Unable to open output file \"%s\"",
			strOutputFile.c_str());
	}

	const long nRegions = static_cast<long>(product.GetRegionCount());
	const long nMonths = static_cast<long>(product.GetMonthCount());
	const long nBL = static_cast<long>(product.GetBLBins().GetBinCount());
	const long nSubsat = static_cast<long>(product.GetSubsatBins().GetBinCount());
	const long nCape = static_cast<long>(product.GetCapeBins().GetBinCount());

	const std::vector<RegionSpec> & vecRegions = product.GetRegions();

	long nStrLen = 1;
	for (size_t r = 0; r < vecRegions.size(); r++) {
		long nLen = static_cast<long>(vecRegions[r].strName.length()) + 1;
		if (nLen > nStrLen) {
			nStrLen = nLen;
		}
	}

	// Dimensions
	NcDim * dimRegion = ncOutput.add_dim("region", nRegions);
	NcDim * dimMonth = ncOutput.add_dim("month", nMonths);
	NcDim * dimBL = ncOutput.add_dim("bl", nBL);
	NcDim * dimSubsat = ncOutput.add_dim("subsat", nSubsat);
	NcDim * dimCape = ncOutput.add_dim("cape", nCape);
	NcDim * dimBounds = ncOutput.add_dim("bounds", 4);
	NcDim * dimStrLen = ncOutput.add_dim("strlen", nStrLen);

	if ((dimRegion == NULL) || (dimMonth == NULL) || (dimBL == NULL) ||
	    (dimSubsat == NULL) || (dimCape == NULL) || (dimBounds == NULL) ||
	    (dimStrLen == NULL)
	) {
		_EXCEPTION1("Unable to create dimensions in \"%s\"",
			strOutputFile.c_str());
	}

	// Edge coordinates
	WriteEdgeCoordinate(ncOutput, dimBL, product.GetBLBins(),
		"bin edge of buoyancy in the lower troposphere", "round_to_nearest");
	WriteEdgeCoordinate(ncOutput, dimSubsat, product.GetSubsatBins(),
		"bin edge of subsaturation component", "half_bin_down");
	WriteEdgeCoordinate(ncOutput, dimCape, product.GetCapeBins(),
		"bin edge of CAPE-like component", "half_bin_down");

	// Months
	NcVar * varMonth = ncOutput.add_var("month", ncInt, dimMonth);
	if (varMonth == NULL) {
		_EXCEPTIONT("Unable to create variable \"month\"");
	}
	varMonth->add_att("long_name", "calendar month");
	varMonth->add_att("units", "1");
	varMonth->put(&(product.GetMonths()[0]), nMonths);

	// Regions
	NcVar * varRegionName = ncOutput.add_var("region_name", ncChar, dimRegion, dimStrLen);
	NcVar * varRegionBounds = ncOutput.add_var("region_bounds", ncDouble, dimRegion, dimBounds);
	if ((varRegionName == NULL) || (varRegionBounds == NULL)) {
		_EXCEPTIONT("Unable to create region variables");
	}
	varRegionName->add_att("long_name", "region name");
	varRegionBounds->add_att("long_name", "region bounds");
	varRegionBounds->add_att("description", "latmin, latmax, lonmin, lonmax");
	varRegionBounds->add_att("units", "degrees");

	std::vector<char> vecNames(nRegions * nStrLen, '\0');
	std::vector<double> vecBounds(nRegions * 4);
	for (long r = 0; r < nRegions; r++) {
		const RegionSpec & region = vecRegions[r];
		memcpy(&(vecNames[r * nStrLen]),
			region.strName.c_str(),
			region.strName.length());

		vecBounds[r * 4 + 0] = region.box.lat[0];
		vecBounds[r * 4 + 1] = region.box.lat[1];
		vecBounds[r * 4 + 2] = region.box.lon[0];
		vecBounds[r * 4 + 3] = region.box.lon[1];
	}
	varRegionName->put(&(vecNames[0]), nRegions, nStrLen);
	varRegionBounds->put(&(vecBounds[0]), nRegions, 4);

	// Subset point counts
	NcVar * varPoints = ncOutput.add_var("npoints", ncDouble, dimRegion, dimMonth);
	if (varPoints == NULL) {
		_EXCEPTIONT("Unable to create variable \"npoints\"");
	}
	varPoints->add_att("long_name", "number of grid points in region and month");
	varPoints->add_att("units", "1");

	DataArray1D<double> dPointCount(nRegions * nMonths);
	for (long r = 0; r < nRegions; r++) {
	for (long m = 0; m < nMonths; m++) {
		dPointCount[r * nMonths + m] =
			static_cast<double>(product.GetPointCount(r, m));
	}
	}
	varPoints->put(&(dPointCount[0]), nRegions, nMonths);

	// Statistics
	const std::vector<StatsVariableInfo> & vecInfo = product.GetVariableInfo();

	DataArray1D<double> dBuffer(nSubsat * nCape > nBL ? nSubsat * nCape : nBL);

	for (size_t v = 0; v < vecInfo.size(); v++) {
		const StatsVariableInfo & info = vecInfo[v];

		NcVar * var =
			AddStatsVariable(
				ncOutput, info,
				dimRegion, dimMonth, dimBL, dimSubsat, dimCape);

		for (long r = 0; r < nRegions; r++) {
		for (long m = 0; m < nMonths; m++) {
			const StatisticsAccumulator & accum = product.GetAccumulator(r, m);

			if (!info.fJoint) {
				const BinCount * pCount = NULL;
				const double * pSum = NULL;
				if (info.strName == "Q0") {
					pCount = accum.Q0();
				} else if (info.strName == "QE") {
					pCount = accum.QE();
				} else if (info.strName == "Q1") {
					pSum = accum.Q1();
				} else if (info.strName == "Q2") {
					pSum = accum.Q2();
				} else {
					_EXCEPTION1("Unknown variable \"%s\"", info.strName.c_str());
				}

				for (long i = 0; i < nBL; i++) {
					dBuffer[i] = (pCount != NULL)?
						(static_cast<double>(pCount[i])):(pSum[i]);
				}

				var->set_cur(r, m, 0);
				var->put(&(dBuffer[0]), 1, 1, nBL);

			} else {
				const BinCount * pCount = NULL;
				const double * pSum = NULL;
				if (info.strName == "P0") {
					pCount = accum.P0().data();
				} else if (info.strName == "PE") {
					pCount = accum.PE().data();
				} else if (info.strName == "P1") {
					pSum = accum.P1().data();
				} else if (info.strName == "P2") {
					pSum = accum.P2().data();
				} else {
					_EXCEPTION1("Unknown variable \"%s\"", info.strName.c_str());
				}

				for (long i = 0; i < nSubsat * nCape; i++) {
					dBuffer[i] = (pCount != NULL)?
						(static_cast<double>(pCount[i])):(pSum[i]);
				}

				var->set_cur(r, m, 0, 0);
				var->put(&(dBuffer[0]), 1, 1, nSubsat, nCape);
			}
		}
		}
	}

	// Global attributes
	ncOutput.add_att("threshold", product.GetThreshold());
	ncOutput.add_att("threshold_units", product.GetPrecipUnits().c_str());
	ncOutput.add_att("created", product.GetCreated().c_str());
	ncOutput.add_att("author", product.GetAuthor().c_str());
	ncOutput.add_att("history", product.GetHistory().c_str());

	ncOutput.close();
}

///////////////////////////////////////////////////////////////////////////////

