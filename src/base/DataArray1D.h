///////////////////////////////////////////////////////////////////////////////
///
///	\file    DataArray1D.h
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


#ifndef _DATAARRAY1D_H_
#define _DATAARRAY1D_H_

///////////////////////////////////////////////////////////////////////////////

#include "Exception.h"

#include <cstdlib>
#include <cstring>

///	<summary>
///		A contiguous vector of plain-old-data values.  Storage is always
///		zero-initialized on allocation so that accumulators start empty.
///	</summary>
template <typename T>
class DataArray1D {

public:
	typedef T ValueType;

	///	<summary>
	///		Constructor.
	///	</summary>
	DataArray1D() :
		m_sSize(0),
		m_data(NULL)
	{ }

	///	<summary>
	///		Constructor with an initial size.
	///	</summary>
	explicit DataArray1D(size_t sSize) :
		m_sSize(0),
		m_data(NULL)
	{
		Allocate(sSize);
	}

	///	<summary>
	///		Copy constructor.
	///	</summary>
	DataArray1D(const DataArray1D<T> & da) :
		m_sSize(0),
		m_data(NULL)
	{
		(*this) = da;
	}

	///	<summary>
	///		Destructor.
	///	</summary>
	~DataArray1D() {
		Deallocate();
	}

	///	<summary>
	///		Resize to sSize elements, all zero.
	///	</summary>
	void Allocate(size_t sSize) {
		if ((m_data != NULL) && (sSize == m_sSize)) {
			Zero();
			return;
		}

		Deallocate();
		m_sSize = sSize;
		if (sSize == 0) {
			return;
		}

		m_data = static_cast<T *>(calloc(sSize, sizeof(T)));
		if (m_data == NULL) {
			_EXCEPTION1("Unable to allocate %lu elements",
				static_cast<unsigned long>(sSize));
		}
	}

	///	<summary>
	///		Release storage.
	///	</summary>
	void Deallocate() {
		free(m_data);
		m_data = NULL;
		m_sSize = 0;
	}

	///	<summary>
	///		Deep copy.
	///	</summary>
	DataArray1D<T> & operator=(const DataArray1D<T> & da) {
		if (&da != this) {
			Allocate(da.m_sSize);
			if (m_sSize != 0) {
				memcpy(m_data, da.m_data, m_sSize * sizeof(T));
			}
		}
		return (*this);
	}

	///	<summary>
	///		Set every element to zero.
	///	</summary>
	void Zero() {
		if (m_sSize != 0) {
			memset(m_data, 0, m_sSize * sizeof(T));
		}
	}

	///	<summary>
	///		Elementwise sum with an array of identical length.
	///	</summary>
	void Add(const DataArray1D<T> & da) {
		if (da.m_sSize != m_sSize) {
			_EXCEPTION2("DataArray1D length mismatch in Add (%lu vs %lu)",
				static_cast<unsigned long>(m_sSize),
				static_cast<unsigned long>(da.m_sSize));
		}
		for (size_t i = 0; i < m_sSize; i++) {
			m_data[i] += da.m_data[i];
		}
	}

public:
	size_t GetRows() const {
		return m_sSize;
	}

	size_t GetTotalSize() const {
		return m_sSize;
	}

	T * data() {
		return m_data;
	}

	const T * data() const {
		return m_data;
	}

	operator T*() {
		return m_data;
	}

	operator T const*() const {
		return m_data;
	}

private:
	///	<summary>
	///		Number of elements.
	///	</summary>
	size_t m_sSize;

	///	<summary>
	///		Element storage, or NULL when empty.
	///	</summary>
	T * m_data;
};

///////////////////////////////////////////////////////////////////////////////

#endif

