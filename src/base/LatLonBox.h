///////////////////////////////////////////////////////////////////////////////
///
///	\file    LatLonBox.h
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

#ifndef _LATLONBOX_H_
#define _LATLONBOX_H_

#include "Exception.h"

#include <cmath>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A bounding box in latitude / longitude space with inclusive
///		endpoints.  Longitudes are compared in the convention of the data
///		(0 to 360 or -180 to 180).  A box with lon[0] > lon[1] is taken to
///		cross the periodic boundary.
///	</summary>
template <typename Type>
class LatLonBox {

public:
	///	<summary>
	///		Bounding longitudes (endpoints are included).
	///	</summary>
	Type lon[2];

	///	<summary>
	///		Bounding latitudes (endpoints are included).
	///	</summary>
	Type lat[2];

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	LatLonBox() {
		lon[0] = static_cast<Type>(0);
		lon[1] = static_cast<Type>(0);
		lat[0] = static_cast<Type>(0);
		lat[1] = static_cast<Type>(0);
	}

	///	<summary>
	///		Constructor with latitude-longitude bounds.
	///	</summary>
	LatLonBox(
		Type a_lat0,
		Type a_lat1,
		Type a_lon0,
		Type a_lon1
	) {
		set(a_lat0, a_lat1, a_lon0, a_lon1);
	}

	///	<summary>
	///		Set the bounds, verifying they are well formed.
	///	</summary>
	void set(
		Type a_lat0,
		Type a_lat1,
		Type a_lon0,
		Type a_lon1
	) {
		if (!std::isfinite(a_lat0) || !std::isfinite(a_lat1) ||
		    !std::isfinite(a_lon0) || !std::isfinite(a_lon1)
		) {
			_EXCEPTIONT("Non-finite LatLonBox bounds");
		}
		if (a_lat0 > a_lat1) {
			_EXCEPTION2("Minimum latitude (%1.5f) is larger than maximum latitude (%1.5f) in LatLonBox",
				static_cast<double>(a_lat0), static_cast<double>(a_lat1));
		}
		if ((a_lat0 < static_cast<Type>(-90)) || (a_lat1 > static_cast<Type>(90))) {
			_EXCEPTION2("Latitude range [%1.5f, %1.5f] out of range [-90, 90] in LatLonBox",
				static_cast<double>(a_lat0), static_cast<double>(a_lat1));
		}
		if ((a_lon0 < static_cast<Type>(-360)) || (a_lon0 > static_cast<Type>(360)) ||
		    (a_lon1 < static_cast<Type>(-360)) || (a_lon1 > static_cast<Type>(360))
		) {
			_EXCEPTION2("Longitude range [%1.5f, %1.5f] out of range [-360, 360] in LatLonBox",
				static_cast<double>(a_lon0), static_cast<double>(a_lon1));
		}

		lat[0] = a_lat0;
		lat[1] = a_lat1;
		lon[0] = a_lon0;
		lon[1] = a_lon1;
	}

	///	<summary>
	///		True if this box crosses the periodic longitude boundary.
	///	</summary>
	bool crosses_periodic() const {
		return (lon[0] > lon[1]);
	}

	///	<summary>
	///		Determine if the given latitude lies within this box.
	///	</summary>
	bool contains_lat(
		const Type & lat_pt
	) const {
		return ((lat_pt >= lat[0]) && (lat_pt <= lat[1]));
	}

	///	<summary>
	///		Determine if the given longitude lies within this box.
	///	</summary>
	bool contains_lon(
		const Type & lon_pt
	) const {

		// This box crosses the periodic boundary
		if (lon[0] > lon[1]) {
			return ((lon_pt >= lon[0]) || (lon_pt <= lon[1]));
		}

		return ((lon_pt >= lon[0]) && (lon_pt <= lon[1]));
	}

	///	<summary>
	///		Determine if this LatLonBox contains the given point.
	///	</summary>
	bool contains(
		const Type & lat_pt,
		const Type & lon_pt
	) const {
		return (contains_lat(lat_pt) && contains_lon(lon_pt));
	}
};

///////////////////////////////////////////////////////////////////////////////

#endif // _LATLONBOX_H_

