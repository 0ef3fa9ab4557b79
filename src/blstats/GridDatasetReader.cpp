///////////////////////////////////////////////////////////////////////////////
///
///	\file    GridDatasetReader.cpp
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

#include "GridDatasetReader.h"

#include "Announce.h"
#include "Exception.h"
#include "NcFileVector.h"
#include "NetCDFUtilities.h"
#include "TimeObj.h"

#include "netcdfcpp.h"

#include <cmath>
#include <limits>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

namespace {

///	<summary>
///		Check two coordinate arrays agree.
///	</summary>
void VerifyCoordinate(
	const std::vector<double> & vecExpected,
	const std::vector<double> & vecFound,
	const std::string & strName,
	const std::string & strFiles
) {
	if (vecExpected.size() != vecFound.size()) {
		_EXCEPTION4("Coordinate \"%s\" has length %lu in \"%s\" (expected %lu)",
			strName.c_str(), vecFound.size(), strFiles.c_str(),
			vecExpected.size());
	}
	for (size_t i = 0; i < vecExpected.size(); i++) {
		if (fabs(vecExpected[i] - vecFound[i]) > 1.0e-6) {
			_EXCEPTION2("Coordinate \"%s\" differs from earlier files in \"%s\"",
				strName.c_str(), strFiles.c_str());
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Name of the dimension of a one dimensional coordinate variable.
///	</summary>
std::string CoordinateDimensionName(
	const NcFileVector & vecFiles,
	const std::string & strCoordinate
) {
	NcVar * var = vecFiles.GetVariable(strCoordinate);
	if (var->num_dims() != 1) {
		_EXCEPTION1("Coordinate variable \"%s\" must have exactly one dimension",
			strCoordinate.c_str());
	}
	return std::string(var->get_dim(0)->name());
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Read one (time, lat, lon) variable into the slab of data starting
///		at time index lTimeOffset.
///	</summary>
void ReadField(
	const NcFileVector & vecFiles,
	const std::string & strVariable,
	const std::string & strLatitudeName,
	const std::string & strLongitudeName,
	long lTimeOffset,
	long lTimes,
	long lLat,
	long lLon,
	DataArray3D<float> & data
) {
	size_t sFile = 0;
	NcVar * var = vecFiles.GetVariable(strVariable, &sFile);

	const std::string & strFile = vecFiles.GetFilename(sFile);

	if (var->num_dims() != 3) {
		_EXCEPTION2("Variable \"%s\" in \"%s\" must have dimensions (time, lat, lon)",
			strVariable.c_str(), strFile.c_str());
	}
	if (!NcIsTimeDimension(var->get_dim(0))) {
		_EXCEPTION2("First dimension of variable \"%s\" in \"%s\" must be time",
			strVariable.c_str(), strFile.c_str());
	}

	// Square grids cannot be checked by size alone
	const std::string strLatDim =
		CoordinateDimensionName(vecFiles, strLatitudeName);
	const std::string strLonDim =
		CoordinateDimensionName(vecFiles, strLongitudeName);

	if ((strLatDim != var->get_dim(1)->name()) ||
	    (strLonDim != var->get_dim(2)->name())
	) {
		_EXCEPTION5("Variable \"%s\" in \"%s\" has dimensions (%s, %s, %s); "
			"expected (time, lat, lon) ordering",
			strVariable.c_str(), strFile.c_str(),
			var->get_dim(0)->name(),
			var->get_dim(1)->name(),
			var->get_dim(2)->name());
	}

	if ((var->get_dim(0)->size() != lTimes) ||
	    (var->get_dim(1)->size() != lLat) ||
	    (var->get_dim(2)->size() != lLon)
	) {
		_EXCEPTION5("Variable \"%s\" in \"%s\" has shape (%li, %li, %li) "
			"which does not match the time, lat and lon coordinates",
			strVariable.c_str(), strFile.c_str(),
			var->get_dim(0)->size(),
			var->get_dim(1)->size(),
			var->get_dim(2)->size());
	}

	if (lTimes == 0) {
		return;
	}

	float * pData = data.slice(lTimeOffset);

	var->set_cur(0, 0, 0);
	if (!var->get(pData, lTimes, lLat, lLon)) {
		_EXCEPTION2("Unable to read variable \"%s\" from \"%s\"",
			strVariable.c_str(), strFile.c_str());
	}

	// Replace missing values with NaN and unpack scaled data
	float flFillValue;
	bool fHasFillValue = NcGetFillValue(var, flFillValue);

	double dScaleFactor = 1.0;
	double dAddOffset = 0.0;
	NcAtt * attScale = var->get_att("scale_factor");
	if (attScale != NULL) {
		dScaleFactor = attScale->as_double(0);
		delete attScale;
	}
	NcAtt * attOffset = var->get_att("add_offset");
	if (attOffset != NULL) {
		dAddOffset = attOffset->as_double(0);
		delete attOffset;
	}
	bool fScaled = ((dScaleFactor != 1.0) || (dAddOffset != 0.0));

	const size_t sSize =
		static_cast<size_t>(lTimes) * static_cast<size_t>(lLat) * static_cast<size_t>(lLon);

	for (size_t s = 0; s < sSize; s++) {
		if (fHasFillValue && (pData[s] == flFillValue)) {
			pData[s] = std::numeric_limits<float>::quiet_NaN();
		} else if (fScaled) {
			pData[s] = static_cast<float>(
				static_cast<double>(pData[s]) * dScaleFactor + dAddOffset);
		}
	}
}

}

///////////////////////////////////////////////////////////////////////////////

void ReadGridDataset(
	const FilenameList & vecInputFiles,
	const GridVariableNames & varnames,
	GridDataset & data
) {
	if (vecInputFiles.size() == 0) {
		_EXCEPTIONT("No input files specified");
	}

	std::string strLatitudeName = varnames.strLatitude;
	std::string strLongitudeName = varnames.strLongitude;

	std::vector<double> vecLat;
	std::vector<double> vecLon;
	std::vector<int> vecMonths;
	std::vector<long> vecTimeCount;
	std::string strPrecipUnits;

	// Read coordinates and times of each chunk
	AnnounceStartBlock("Reading coordinates");
	for (size_t f = 0; f < vecInputFiles.size(); f++) {
		NcFileVector vecFiles(vecInputFiles[f]);

		size_t sPrecipFile = 0;
		NcVar * varPrecip =
			vecFiles.GetVariable(varnames.strPrecip, &sPrecipFile);

		NcFile & ncPrecip = *(vecFiles[sPrecipFile]);
		const std::string & strPrecipFile = vecFiles.GetFilename(sPrecipFile);

		NcGetLatitudeLongitudeName(ncPrecip, strLatitudeName, strLongitudeName);

		std::vector<double> vecLatFile;
		std::vector<double> vecLonFile;
		NcReadCoordinate(ncPrecip, strPrecipFile, strLatitudeName, vecLatFile);
		NcReadCoordinate(ncPrecip, strPrecipFile, strLongitudeName, vecLonFile);

		if (f == 0) {
			vecLat = vecLatFile;
			vecLon = vecLonFile;
			strPrecipUnits = NcGetStringAttribute(varPrecip, "units", "mm/day");
		} else {
			VerifyCoordinate(vecLat, vecLatFile, strLatitudeName, vecInputFiles[f]);
			VerifyCoordinate(vecLon, vecLonFile, strLongitudeName, vecInputFiles[f]);
		}

		std::vector<Time> vecTimes;
		ReadCFTimeDataFromNcFile(&ncPrecip, strPrecipFile, vecTimes, (f == 0));

		for (size_t t = 0; t < vecTimes.size(); t++) {
			vecMonths.push_back(vecTimes[t].GetMonth());
		}
		vecTimeCount.push_back(static_cast<long>(vecTimes.size()));

		if (vecTimes.size() != 0) {
			Announce(1, "%s: %lu times (%s to %s)",
				vecInputFiles[f].c_str(),
				vecTimes.size(),
				vecTimes[0].ToDateString().c_str(),
				vecTimes[vecTimes.size()-1].ToDateString().c_str());
		}
	}
	AnnounceEndBlock("Done");

	Announce("Grid has %lu times, %lu latitudes, %lu longitudes",
		vecMonths.size(), vecLat.size(), vecLon.size());

	data.Allocate(vecMonths.size(), vecLat.size(), vecLon.size());
	data.vecMonths = vecMonths;
	data.vecLat = vecLat;
	data.vecLon = vecLon;
	data.strPrecipUnits = strPrecipUnits;

	// Read fields
	AnnounceStartBlock("Reading fields");
	long lTimeOffset = 0;
	const long lLat = static_cast<long>(vecLat.size());
	const long lLon = static_cast<long>(vecLon.size());

	for (size_t f = 0; f < vecInputFiles.size(); f++) {
		NcFileVector vecFiles(vecInputFiles[f]);

		const long lTimes = vecTimeCount[f];

		ReadField(vecFiles, varnames.strBL,
			strLatitudeName, strLongitudeName,
			lTimeOffset, lTimes, lLat, lLon, data.dataBL);
		ReadField(vecFiles, varnames.strSubsat,
			strLatitudeName, strLongitudeName,
			lTimeOffset, lTimes, lLat, lLon, data.dataSubsat);
		ReadField(vecFiles, varnames.strCape,
			strLatitudeName, strLongitudeName,
			lTimeOffset, lTimes, lLat, lLon, data.dataCape);
		ReadField(vecFiles, varnames.strPrecip,
			strLatitudeName, strLongitudeName,
			lTimeOffset, lTimes, lLat, lLon, data.dataPrecip);

		lTimeOffset += lTimes;
	}
	AnnounceEndBlock("Done");

	data.Validate();
}

///////////////////////////////////////////////////////////////////////////////

