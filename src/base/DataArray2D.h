///////////////////////////////////////////////////////////////////////////////
///
///	\file    DataArray2D.h
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


#ifndef _DATAARRAY2D_H_
#define _DATAARRAY2D_H_

///////////////////////////////////////////////////////////////////////////////

#include "Exception.h"

#include <cstdlib>
#include <cstring>

///	<summary>
///		A row-major matrix of plain-old-data values held in one block.
///		Element (i,j) lives at offset i * columns + j.
///	</summary>
template <typename T>
class DataArray2D {

public:
	typedef T ValueType;

	DataArray2D() :
		m_sRows(0),
		m_sColumns(0),
		m_data(NULL)
	{ }

	DataArray2D(size_t sRows, size_t sColumns) :
		m_sRows(0),
		m_sColumns(0),
		m_data(NULL)
	{
		Allocate(sRows, sColumns);
	}

	DataArray2D(const DataArray2D<T> & da) :
		m_sRows(0),
		m_sColumns(0),
		m_data(NULL)
	{
		(*this) = da;
	}

	~DataArray2D() {
		Deallocate();
	}

	///	<summary>
	///		Resize to sRows x sColumns, all zero.
	///	</summary>
	void Allocate(size_t sRows, size_t sColumns) {
		if ((m_data != NULL) && (sRows == m_sRows) && (sColumns == m_sColumns)) {
			Zero();
			return;
		}

		Deallocate();
		m_sRows = sRows;
		m_sColumns = sColumns;

		const size_t sTotal = sRows * sColumns;
		if (sTotal == 0) {
			return;
		}

		m_data = static_cast<T *>(calloc(sTotal, sizeof(T)));
		if (m_data == NULL) {
			_EXCEPTION2("Unable to allocate %lu x %lu matrix",
				static_cast<unsigned long>(sRows),
				static_cast<unsigned long>(sColumns));
		}
	}

	void Deallocate() {
		free(m_data);
		m_data = NULL;
		m_sRows = 0;
		m_sColumns = 0;
	}

	///	<summary>
	///		Deep copy.
	///	</summary>
	DataArray2D<T> & operator=(const DataArray2D<T> & da) {
		if (&da != this) {
			Allocate(da.m_sRows, da.m_sColumns);
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

	///	<summary>
	///		Elementwise sum with a matrix of identical shape.
	///	</summary>
	void Add(const DataArray2D<T> & da) {
		if ((da.m_sRows != m_sRows) || (da.m_sColumns != m_sColumns)) {
			_EXCEPTION4("DataArray2D shape mismatch in Add (%lu x %lu vs %lu x %lu)",
				static_cast<unsigned long>(m_sRows),
				static_cast<unsigned long>(m_sColumns),
				static_cast<unsigned long>(da.m_sRows),
				static_cast<unsigned long>(da.m_sColumns));
		}
		const size_t sTotal = GetTotalSize();
		for (size_t i = 0; i < sTotal; i++) {
			m_data[i] += da.m_data[i];
		}
	}

public:
	size_t GetRows() const {
		return m_sRows;
	}

	size_t GetColumns() const {
		return m_sColumns;
	}

	size_t GetTotalSize() const {
		return (m_sRows * m_sColumns);
	}

	T * data() {
		return m_data;
	}

	const T * data() const {
		return m_data;
	}

	///	<summary>
	///		Pointer to the start of row i.
	///	</summary>
	T * operator[](size_t i) {
		return (m_data + i * m_sColumns);
	}

	const T * operator[](size_t i) const {
		return (m_data + i * m_sColumns);
	}

	T & operator()(size_t i, size_t j) {
		return m_data[i * m_sColumns + j];
	}

	const T & operator()(size_t i, size_t j) const {
		return m_data[i * m_sColumns + j];
	}

private:
	size_t m_sRows;

	size_t m_sColumns;

	///	<summary>
	///		Row-major element storage, or NULL when empty.
	///	</summary>
	T * m_data;
};

///////////////////////////////////////////////////////////////////////////////

#endif

