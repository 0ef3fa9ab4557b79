///////////////////////////////////////////////////////////////////////////////
///
///	\file    BLBinnedStats.cpp
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

#if defined(BLSTATS_MPIOMP)
#include <mpi.h>
#endif

#include "Announce.h"
#include "CommandLine.h"
#include "Exception.h"
#include "FilenameList.h"
#include "FunctionTimer.h"

#include "BLStatsConfig.h"
#include "GridDataset.h"
#include "GridDatasetReader.h"
#include "ProductWriter.h"
#include "SubsetAggregator.h"

#include "netcdfcpp.h"

#include <ctime>
#include <string>

///////////////////////////////////////////////////////////////////////////////

int main(int argc, char** argv) {

#if defined(BLSTATS_MPIOMP)
	// Initialize MPI
	MPI_Init(&argc, &argv);
#endif

	// Turn off fatal errors in NetCDF
	NcError error(NcError::silent_nonfatal);

	// Enable output only on rank zero
	AnnounceOnlyOutputOnRankZero();

	int iReturn = 0;

try {

	// Input data files (semi-colon delimited)
	std::string strInputData;

	// File containing a list of input data files
	std::string strInputDataList;

	// Output data file
	std::string strOutputData;

	// Variable names
	GridVariableNames varnames;

	// Regions
	std::string strRegions;

	// Region file
	std::string strRegionFile;

	// Months
	std::string strMonths;

	// Bin specifications
	std::string strBLBins;
	std::string strSubsatBins;
	std::string strCapeBins;

	// Precipitation threshold
	double dPrecipThreshold;

	// Do not accumulate sums of squares
	bool fNoSumOfSquares;

	// Author
	std::string strAuthor;

	// Verbose output
	bool fVerbose;

	// Parse the command line
	BeginCommandLine()
		CommandLineString(strInputData, "in_data", "");
		CommandLineString(strInputDataList, "in_data_list", "");
		CommandLineString(strOutputData, "out_data", "");
		CommandLineString(varnames.strBL, "var_bl", "BL");
		CommandLineString(varnames.strSubsat, "var_subsat", "subsat");
		CommandLineString(varnames.strCape, "var_cape", "cape");
		CommandLineString(varnames.strPrecip, "var_precip", "precip");
		CommandLineString(varnames.strLatitude, "latname", "[auto]");
		CommandLineString(varnames.strLongitude, "lonname", "[auto]");
		CommandLineStringD(strRegions, "regions", "", "[name:latmin,latmax,lonmin,lonmax;...]");
		CommandLineString(strRegionFile, "regionfile", "");
		CommandLineStringD(strMonths, "months", "", "[m1,m2,...] (default all)");
		CommandLineStringD(strBLBins, "bl_bins", BLStatsConfig::DefaultBLBins, "[min,max,width]");
		CommandLineStringD(strSubsatBins, "subsat_bins", BLStatsConfig::DefaultSubsatBins, "[min,max,width]");
		CommandLineStringD(strCapeBins, "cape_bins", BLStatsConfig::DefaultCapeBins, "[min,max,width]");
		CommandLineDouble(dPrecipThreshold, "precip_thresh", BLStatsConfig::DefaultPrecipThreshold);
		CommandLineBool(fNoSumOfSquares, "no_sumsq");
		CommandLineString(strAuthor, "author", "");
		CommandLineBool(fVerbose, "verbose");

		ParseCommandLine(argc, argv);
	EndCommandLine(argv)

	AnnounceBanner();

	if (fVerbose) {
		AnnounceSetVerbosityLevel(1);
	}

	// Check input
	if ((strInputData == "") && (strInputDataList == "")) {
		_EXCEPTIONT("No input data file (--in_data) or (--in_data_list) specified");
	}
	if ((strInputData != "") && (strInputDataList != "")) {
		_EXCEPTIONT("Only one of (--in_data) or (--in_data_list) allowed");
	}

	// Check output
	if (strOutputData == "") {
		_EXCEPTIONT("No output file (--out_data) specified");
	}

	// Build the configuration
	AnnounceStartBlock("Configuration");

	BLStatsConfig config;

	if ((strRegions == "") && (strRegionFile == "")) {
		_EXCEPTIONT("No regions (--regions) or (--regionfile) specified");
	}
	if (strRegions != "") {
		BLStatsConfig::ParseRegions(strRegions, config.vecRegions);
	}
	if (strRegionFile != "") {
		BLStatsConfig::ParseRegionFile(strRegionFile, config.vecRegions);
	}

	BLStatsConfig::ParseMonths(strMonths, config.vecMonths);

	config.specBL = BinSpecification::FromString(strBLBins, "bl");
	config.specSubsat = BinSpecification::FromString(strSubsatBins, "subsat");
	config.specCape = BinSpecification::FromString(strCapeBins, "cape");
	config.dPrecipThreshold = dPrecipThreshold;
	config.fSumOfSquares = !fNoSumOfSquares;

	config.Validate();

	for (size_t r = 0; r < config.vecRegions.size(); r++) {
		const RegionSpec & region = config.vecRegions[r];
		Announce("Region %s: lat [%g, %g], lon [%g, %g]",
			region.strName.c_str(),
			region.box.lat[0], region.box.lat[1],
			region.box.lon[0], region.box.lon[1]);
	}

	std::string strMonthList;
	for (size_t m = 0; m < config.vecMonths.size(); m++) {
		if (m != 0) {
			strMonthList += ",";
		}
		strMonthList += std::to_string(config.vecMonths[m]);
	}
	Announce("Months: %s", strMonthList.c_str());
	Announce("BL bins: %s", config.specBL.ToString().c_str());
	Announce("Subsat bins: %s", config.specSubsat.ToString().c_str());
	Announce("CAPE bins: %s", config.specCape.ToString().c_str());
	Announce("Precipitation threshold: %g", config.dPrecipThreshold);

	AnnounceEndBlock("Done");

	// Load input data
	FilenameList vecInputFiles;
	if (strInputData != "") {
		vecInputFiles.push_back(strInputData);
	}
	if (strInputDataList != "") {
		vecInputFiles.FromFile(strInputDataList);
	}

	AnnounceStartBlock("Loading data");
	GridDataset data;
	ReadGridDataset(vecInputFiles, varnames, data);
	AnnounceEndBlock("Done");

	// Compute statistics
	AnnounceStartBlock("Computing binned statistics");
	SubsetAggregator aggregator(config);
	AggregatedProduct product = aggregator.Run(data);
	AnnounceEndBlock("Done");

	FunctionTimer::TimerGroupData tgdAccumulate =
		FunctionTimer::GetGroupData("Accumulate");
	Announce(1, "Accumulation: %llu subsets in %llu us (longest %llu us)",
		tgdAccumulate.nEntries,
		tgdAccumulate.iTotalTime,
		tgdAccumulate.iMaxTime);

	// Write output on rank 0
	int nRank = 0;
#if defined(BLSTATS_MPIOMP)
	MPI_Comm_rank(MPI_COMM_WORLD, &nRank);
#endif

	if (nRank == 0) {
		std::time_t timetNow = std::time(nullptr);
		std::string strProvenance = std::asctime(std::localtime(&timetNow));
		if ((strProvenance.length() != 0) &&
		    (strProvenance[strProvenance.length()-1] == '\n')
		) {
			strProvenance.erase(strProvenance.length()-1);
		}
		strProvenance += ": " + GetCommandLineAsString(argc, argv);

		product.SetProvenance(strAuthor, strProvenance);

		AnnounceStartBlock("Writing \"%s\"", strOutputData.c_str());
		WriteAggregatedProduct(product, strOutputData);
		AnnounceEndBlock("Done");
	}

	AnnounceBanner();

} catch(Exception & e) {
	AnnounceOutputOnAllRanks();
	AnnounceSetOutputBuffer(stdout);
	Announce(e.ToString().c_str());
	iReturn = 1;

#if defined(BLSTATS_MPIOMP)
	MPI_Abort(MPI_COMM_WORLD, -1);
#endif
}

#if defined(BLSTATS_MPIOMP)
	// Deinitialize MPI
	MPI_Finalize();
#endif

	return iReturn;
}

///////////////////////////////////////////////////////////////////////////////

