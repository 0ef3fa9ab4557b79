///////////////////////////////////////////////////////////////////////////////
///
///	\file    GridDataset.cpp
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

#include "GridDataset.h"

#include "Exception.h"

///////////////////////////////////////////////////////////////////////////////

void GridDataset::Allocate(
	size_t nTimes,
	size_t nLat,
	size_t nLon
) {
	vecMonths.assign(nTimes, 0);
	vecLat.assign(nLat, 0.0);
	vecLon.assign(nLon, 0.0);

	dataBL.Allocate(nTimes, nLat, nLon);
	dataSubsat.Allocate(nTimes, nLat, nLon);
	dataCape.Allocate(nTimes, nLat, nLon);
	dataPrecip.Allocate(nTimes, nLat, nLon);
}

///////////////////////////////////////////////////////////////////////////////

void GridDataset::Validate() const {
	const DataArray3D<float> * pdata[4] =
		{&dataBL, &dataSubsat, &dataCape, &dataPrecip};
	const char * szName[4] =
		{"BL", "subsat", "cape", "precip"};

	for (int v = 0; v < 4; v++) {
		if ((pdata[v]->GetSize(0) != vecMonths.size()) ||
		    (pdata[v]->GetSize(1) != vecLat.size()) ||
		    (pdata[v]->GetSize(2) != vecLon.size())
		) {
			_EXCEPTION4("Field \"%s\" shape (%lu, %lu, %lu) does not match "
				"the time, lat and lon coordinates",
				szName[v],
				pdata[v]->GetSize(0),
				pdata[v]->GetSize(1),
				pdata[v]->GetSize(2));
		}
	}

	for (size_t t = 0; t < vecMonths.size(); t++) {
		if ((vecMonths[t] < 1) || (vecMonths[t] > 12)) {
			_EXCEPTION2("Month of time index %lu out of range (%i)",
				t, vecMonths[t]);
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

