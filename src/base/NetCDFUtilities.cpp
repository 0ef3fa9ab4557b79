///////////////////////////////////////////////////////////////////////////////
///
///	\file    NetCDFUtilities.cpp
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

#include "NetCDFUtilities.h"
#include "Announce.h"
#include "Exception.h"
#include "DataArray1D.h"

#include <cstring>

////////////////////////////////////////////////////////////////////////////////

void NcGetLatitudeLongitudeName(
	NcFile & ncFile,
	std::string & strLatitudeName,
	std::string & strLongitudeName
) {
	static const char * szLatitudeNames[] =
		{"lat", "latitude", "LAT", "latitude0", "Latitude", "XLAT"};
	static const char * szLongitudeNames[] =
		{"lon", "longitude", "LON", "longitude0", "Longitude", "XLONG"};
	static const size_t nCandidates =
		sizeof(szLatitudeNames) / sizeof(szLatitudeNames[0]);

	// Check possible latitude names
	if (strLatitudeName == std::string("[auto]")) {
		for (size_t i = 0; i < nCandidates; i++) {
			if (ncFile.get_var(szLatitudeNames[i]) != NULL) {
				strLatitudeName = szLatitudeNames[i];
				break;
			}
		}
		if (strLatitudeName == std::string("[auto]")) {
			_EXCEPTIONT("Unable to identify latitude variable; "
				"specify a name with --latname");
		}
	}

	// Check possible longitude names
	if (strLongitudeName == std::string("[auto]")) {
		for (size_t i = 0; i < nCandidates; i++) {
			if (ncFile.get_var(szLongitudeNames[i]) != NULL) {
				strLongitudeName = szLongitudeNames[i];
				break;
			}
		}
		if (strLongitudeName == std::string("[auto]")) {
			_EXCEPTIONT("Unable to identify longitude variable; "
				"specify a name with --lonname");
		}
	}
}

////////////////////////////////////////////////////////////////////////////////

bool NcIsTimeDimension(
	NcDim * dim
) {
	if (strcmp(dim->name(), "time") == 0) {
		return true;
	}
	if (strcmp(dim->name(), "Time") == 0) {
		return true;
	}
	if (strcmp(dim->name(), "valid_time") == 0) {
		return true;
	}
	return false;
}

////////////////////////////////////////////////////////////////////////////////

NcDim * NcGetTimeDimension(
	NcFile & ncFile
) {
	NcDim * dim = ncFile.get_dim("time");
	if (dim != NULL) {
		return dim;
	}

	dim = ncFile.get_dim("Time");
	if (dim != NULL) {
		return dim;
	}

	return ncFile.get_dim("valid_time");
}

////////////////////////////////////////////////////////////////////////////////

NcVar * NcGetTimeVariable(
	NcFile & ncFile
) {
	NcVar * var = ncFile.get_var("time");
	if (var != NULL) {
		return var;
	}

	var = ncFile.get_var("Time");
	if (var != NULL) {
		return var;
	}

	return ncFile.get_var("valid_time");
}

////////////////////////////////////////////////////////////////////////////////

std::string NcGetStringAttribute(
	NcVar * var,
	const char * szAttName,
	const std::string & strDefault
) {
	_ASSERT(var != NULL);

	NcAtt * att = var->get_att(szAttName);
	if (att == NULL) {
		return strDefault;
	}

	char * szValue = att->as_string(0);
	std::string strValue;
	if (szValue != NULL) {
		strValue = szValue;
		delete[] szValue;
	}
	delete att;

	return strValue;
}

////////////////////////////////////////////////////////////////////////////////

bool NcGetFillValue(
	NcVar * var,
	float & flFillValue
) {
	_ASSERT(var != NULL);

	NcAtt * attFill = var->get_att("_FillValue");
	if (attFill == NULL) {
		attFill = var->get_att("missing_value");
	}
	if (attFill == NULL) {
		return false;
	}

	flFillValue = attFill->as_float(0);
	delete attFill;

	return true;
}

////////////////////////////////////////////////////////////////////////////////

void NcReadCoordinate(
	NcFile & ncFile,
	const std::string & strFilename,
	const std::string & strVariable,
	std::vector<double> & vecValues
) {
	NcVar * var = ncFile.get_var(strVariable.c_str());
	if (var == NULL) {
		_EXCEPTION2("Unable to load variable \"%s\" from file \"%s\"",
			strVariable.c_str(), strFilename.c_str());
	}
	if (var->num_dims() != 1) {
		_EXCEPTION2("Coordinate variable \"%s\" in file \"%s\" must have "
			"exactly one dimension",
			strVariable.c_str(), strFilename.c_str());
	}

	long lSize = var->get_dim(0)->size();
	vecValues.resize(lSize);
	if (lSize == 0) {
		return;
	}

	var->set_cur((long)0);
	if (!var->get(&(vecValues[0]), lSize)) {
		_EXCEPTION2("Unable to read variable \"%s\" from file \"%s\"",
			strVariable.c_str(), strFilename.c_str());
	}
}

////////////////////////////////////////////////////////////////////////////////

void ReadCFTimeDataFromNcFile(
	NcFile * ncfile,
	const std::string & strFilename,
	std::vector<Time> & vecTimes,
	bool fWarnOnMissingCalendar
) {
	_ASSERT(ncfile != NULL);

	// Empty existing Time vector
	vecTimes.clear();

	// Get time dimension and variable
	NcDim * dimTime = NcGetTimeDimension(*ncfile);
	NcVar * varTime = NcGetTimeVariable(*ncfile);

	if (varTime == NULL) {
		_EXCEPTION1("Variable \"time\" not found in file \"%s\"",
			strFilename.c_str());
	}
	if (dimTime == NULL) {
		_EXCEPTION1("Dimension \"time\" not found in file \"%s\"",
			strFilename.c_str());
	}
	if (varTime->num_dims() != 1) {
		_EXCEPTION1("Variable \"time\" has more than one dimension in file \"%s\"",
			strFilename.c_str());
	}
	if (!NcIsTimeDimension(varTime->get_dim(0))) {
		_EXCEPTION1("Variable \"time\" does not have time dimension in file \"%s\"",
			strFilename.c_str());
	}

	long lTimeCount = dimTime->size();

	// Calendar attribute
	std::string strCalendar = NcGetStringAttribute(varTime, "calendar");
	if (strCalendar == "") {
		if (fWarnOnMissingCalendar) {
			Announce("WARNING: Variable \"time\" is missing \"calendar\" attribute; assuming \"standard\"");
		}
		strCalendar = "standard";
	}

	Time::CalendarType eCalendarType =
		Time::CalendarTypeFromString(strCalendar);

	if (eCalendarType == Time::CalendarUnknown) {
		_EXCEPTION2("Unknown calendar \"%s\" in file \"%s\"",
			strCalendar.c_str(), strFilename.c_str());
	}

	// Units attribute
	std::string strTimeUnits = NcGetStringAttribute(varTime, "units");
	if (strTimeUnits == "") {
		_EXCEPTION1("Variable \"time\" is missing \"units\" attribute in file \"%s\"",
			strFilename.c_str());
	}

	if (lTimeCount == 0) {
		return;
	}

	// Load in time data; the library converts integer and float types
	DataArray1D<double> vecTimeDouble(lTimeCount);
	varTime->set_cur((long)0);
	if (!varTime->get(&(vecTimeDouble[0]), lTimeCount)) {
		_EXCEPTION1("Unable to read variable \"time\" from file \"%s\"",
			strFilename.c_str());
	}

	for (long t = 0; t < lTimeCount; t++) {
		Time time(eCalendarType);
		time.FromCFCompliantUnitsOffsetDouble(
			strTimeUnits,
			vecTimeDouble[t]);

		vecTimes.push_back(time);
	}
}

////////////////////////////////////////////////////////////////////////////////

