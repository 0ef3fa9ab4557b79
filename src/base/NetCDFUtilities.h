///////////////////////////////////////////////////////////////////////////////
///
///	\file    NetCDFUtilities.h
///	\author  Paul Ullrich
///	\version October 19, 2026
///
///	<remarks>
///		Copyright 2000-2026 Paul Ullrich
///
///		This file is distributed as part of the BLStats source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _NETCDFUTILITIES_H_
#define _NETCDFUTILITIES_H_

///////////////////////////////////////////////////////////////////////////////

#include "TimeObj.h"

#include "netcdfcpp.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Identify the names of the latitude and longitude coordinate
///		variables in the given file.  A name of "[auto]" is replaced by the
///		first matching candidate ("lat", "latitude", ...).
///	</summary>
void NcGetLatitudeLongitudeName(
	NcFile & ncFile,
	std::string & strLatitudeName,
	std::string & strLongitudeName
);

///	<summary>
///		Check if the given dimension is a time dimension.
///	</summary>
bool NcIsTimeDimension(
	NcDim * dim
);

///	<summary>
///		Get the time dimension from the given file, or NULL if none exists.
///	</summary>
NcDim * NcGetTimeDimension(
	NcFile & ncFile
);

///	<summary>
///		Get the time variable from the given file, or NULL if none exists.
///	</summary>
NcVar * NcGetTimeVariable(
	NcFile & ncFile
);

///	<summary>
///		Read the value of a string attribute of a variable, or return
///		the given default if the attribute does not exist.
///	</summary>
std::string NcGetStringAttribute(
	NcVar * var,
	const char * szAttName,
	const std::string & strDefault = std::string("")
);

///	<summary>
///		Read the _FillValue (or missing_value) attribute of a variable.
///		Returns false if neither attribute exists.
///	</summary>
bool NcGetFillValue(
	NcVar * var,
	float & flFillValue
);

///	<summary>
///		Read a one dimensional coordinate variable as double.
///	</summary>
void NcReadCoordinate(
	NcFile & ncFile,
	const std::string & strFilename,
	const std::string & strVariable,
	std::vector<double> & vecValues
);

///	<summary>
///		Read the CF-compliant time variable from the given file, converting
///		each entry to a Time on the calendar named by the "calendar"
///		attribute.
///	</summary>
void ReadCFTimeDataFromNcFile(
	NcFile * ncfile,
	const std::string & strFilename,
	std::vector<Time> & vecTimes,
	bool fWarnOnMissingCalendar = true
);

///////////////////////////////////////////////////////////////////////////////

#endif

