///////////////////////////////////////////////////////////////////////////////
///
///	\file    GridDatasetReader.h
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

#ifndef _GRIDDATASETREADER_H_
#define _GRIDDATASETREADER_H_

#include "GridDataset.h"
#include "FilenameList.h"

#include <string>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Names of the variables read from the input files.  Latitude and
///		longitude names of "[auto]" are detected from the file.
///	</summary>
struct GridVariableNames {

	///	<summary>
	///		Constructor with default names.
	///	</summary>
	GridVariableNames() :
		strBL("BL"),
		strSubsat("subsat"),
		strCape("cape"),
		strPrecip("precip"),
		strLatitude("[auto]"),
		strLongitude("[auto]")
	{ }

	std::string strBL;
	std::string strSubsat;
	std::string strCape;
	std::string strPrecip;
	std::string strLatitude;
	std::string strLongitude;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Read a GridDataset from NetCDF.  Each entry of vecInputFiles is a
///		semi-colon separated list of files holding the variables of one
///		chunk of time; chunks are concatenated along time and must share
///		latitude and longitude coordinates.  Variables must have
///		dimensions (time, lat, lon).  _FillValue and missing_value
///		entries are stored as NaN.
///	</summary>
void ReadGridDataset(
	const FilenameList & vecInputFiles,
	const GridVariableNames & varnames,
	GridDataset & data
);

///////////////////////////////////////////////////////////////////////////////

#endif

