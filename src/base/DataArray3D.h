///////////////////////////////////////////////////////////////////////////////
///
///	\file    DataArray3D.h
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


#ifndef _DATAARRAY3D_H_
#define _DATAARRAY3D_H_

///////////////////////////////////////////////////////////////////////////////

#include "Exception.h"

#include <cstdlib>
#include <cstring>

///	<summary>
///		A row-major three dimensional field held in one block, indexed
///		as (time, lat, lon).  Each time slice is contiguous so it can be
///		filled directly from a NetCDF record.
///	</summary>
template <typename T>
class DataArray3D {

public:
	typedef T ValueType;

	DataArray3D() :
		m_data(NULL)
	{
		m_sSize[0] = 0;
		m_sSize[1] = 0;
		m_sSize[2] = 0;
	}

	DataArray3D(size_t sSize0, size_t sSize1, size_t sSize2) :
		m_data(NULL)
	{
		m_sSize[0] = 0;
		m_sSize[1] = 0;
		m_sSize[2] = 0;
		Allocate(sSize0, sSize1, sSize2);
	}

	DataArray3D(const DataArray3D<T> & da) :
		m_data(NULL)
	{
		m_sSize[0] = 0;
		m_sSize[1] = 0;
		m_sSize[2] = 0;
		(*this) = da;
	}

	~DataArray3D() {
		Deallocate();
	}

	///	<summary>
	///		Resize to sSize0 x sSize1 x sSize2, all zero.
	///	</summary>
	void Allocate(size_t sSize0, size_t sSize1, size_t sSize2) {
		if ((m_data != NULL) &&
		    (sSize0 == m_sSize[0]) &&
		    (sSize1 == m_sSize[1]) &&
		    (sSize2 == m_sSize[2])
		) {
			Zero();
			return;
		}

		Deallocate();
		m_sSize[0] = sSize0;
		m_sSize[1] = sSize1;
		m_sSize[2] = sSize2;

		const size_t sTotal = GetTotalSize();
		if (sTotal == 0) {
			return;
		}

		m_data = static_cast<T *>(calloc(sTotal, sizeof(T)));
		if (m_data == NULL) {
			_EXCEPTION3("Unable to allocate %lu x %lu x %lu field",
				static_cast<unsigned long>(sSize0),
				static_cast<unsigned long>(sSize1),
				static_cast<unsigned long>(sSize2));
		}
	}

	void Deallocate() {
		free(m_data);
		m_data = NULL;
		m_sSize[0] = 0;
		m_sSize[1] = 0;
		m_sSize[2] = 0;
	}

	DataArray3D<T> & operator=(const DataArray3D<T> & da) {
		if (&da != this) {
			Allocate(da.m_sSize[0], da.m_sSize[1], da.m_sSize[2]);
			if (GetTotalSize() != 0) {
				memcpy(m_data, da.m_data, GetTotalSize() * sizeof(T));
			}
		}
		return (*this);
	}

	void Zero() {
		if (GetTotalSize() != 0) {
			memset(m_data, 0, GetTotalSize() * sizeof(T));
		}
	}

public:
	size_t GetSize(int iDim) const {
		return m_sSize[iDim];
	}

	size_t GetTotalSize() const {
		return (m_sSize[0] * m_sSize[1] * m_sSize[2]);
	}

	T * data() {
		return m_data;
	}

	const T * data() const {
		return m_data;
	}

	///	<summary>
	///		Pointer to the contiguous (lat, lon) slice at time index i.
	///	</summary>
	T * slice(size_t i) {
		return m_data + i * m_sSize[1] * m_sSize[2];
	}

	const T * slice(size_t i) const {
		return m_data + i * m_sSize[1] * m_sSize[2];
	}

	T & operator()(size_t i, size_t j, size_t k) {
		return m_data[(i * m_sSize[1] + j) * m_sSize[2] + k];
	}

	const T & operator()(size_t i, size_t j, size_t k) const {
		return m_data[(i * m_sSize[1] + j) * m_sSize[2] + k];
	}

private:
	///	<summary>
	///		Extent of each dimension.
	///	</summary>
	size_t m_sSize[3];

	///	<summary>
	///		Row-major element storage, or NULL when empty.
	///	</summary>
	T * m_data;
};

///////////////////////////////////////////////////////////////////////////////

#endif

