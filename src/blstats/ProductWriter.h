///////////////////////////////////////////////////////////////////////////////
///
///	\file    ProductWriter.h
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

#ifndef _PRODUCTWRITER_H_
#define _PRODUCTWRITER_H_

#include "AggregatedProduct.h"

#include <string>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Write an AggregatedProduct to a NetCDF file with dimensions
///		region, month, bl, subsat, cape, bounds and strlen.  Counts are
///		written as doubles.
///	</summary>
void WriteAggregatedProduct(
	const AggregatedProduct & product,
	const std::string & strOutputFile
);

///////////////////////////////////////////////////////////////////////////////

#endif

