///////////////////////////////////////////////////////////////////////////////
///
///	\file    GridDataset.h
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

#ifndef _GRIDDATASET_H_
#define _GRIDDATASET_H_

#include "DataArray3D.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Aligned gridded input fields on a (time, lat, lon) grid: the BL
///		diagnostic, its subsaturation-like and CAPE-like components and
///		precipitation.  Missing values are stored as NaN.
///	</summary>
class GridDataset {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	GridDataset() :
		strPrecipUnits("mm/day")
	{ }

	///	<summary>
	///		Allocate the four fields and coordinate arrays.  Fields are
	///		zeroed and months are set to zero.
	///	</summary>
	void Allocate(
		size_t nTimes,
		size_t nLat,
		size_t nLon
	);

	///	<summary>
	///		Verify coordinate arrays and fields share one shape and that
	///		every month lies in [1, 12].
	///	</summary>
	void Validate() const;

public:
	size_t GetTimeCount() const {
		return vecMonths.size();
	}

	size_t GetLatitudeCount() const {
		return vecLat.size();
	}

	size_t GetLongitudeCount() const {
		return vecLon.size();
	}

public:
	///	<summary>
	///		Calendar month (1-12) of each time.
	///	</summary>
	std::vector<int> vecMonths;

	///	<summary>
	///		Latitudes (degrees).
	///	</summary>
	std::vector<double> vecLat;

	///	<summary>
	///		Longitudes (degrees).
	///	</summary>
	std::vector<double> vecLon;

	///	<summary>
	///		Buoyancy in the lower troposphere.
	///	</summary>
	DataArray3D<float> dataBL;

	///	<summary>
	///		Subsaturation-like component.
	///	</summary>
	DataArray3D<float> dataSubsat;

	///	<summary>
	///		CAPE-like component.
	///	</summary>
	DataArray3D<float> dataCape;

	///	<summary>
	///		Precipitation.
	///	</summary>
	DataArray3D<float> dataPrecip;

	///	<summary>
	///		Units of precipitation.
	///	</summary>
	std::string strPrecipUnits;
};

///////////////////////////////////////////////////////////////////////////////

#endif

