///////////////////////////////////////////////////////////////////////////////
///
///	\file    NcFileVector.h
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
#ifndef _NCFILEVECTOR_H_
#define _NCFILEVECTOR_H_

#include "netcdfcpp.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		The NetCDF files that together hold one chunk of time.  Different
///		variables of the chunk may live in different files; all files are
///		closed when the vector goes out of scope.
///	</summary>
class NcFileVector {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	NcFileVector()
	{ }

	///	<summary>
	///		Constructor from a semi-colon delimited list of file names.
	///	</summary>
	explicit NcFileVector(const std::string & strFiles) {
		try {
			Open(strFiles);
		} catch(...) {
			Close();
			throw;
		}
	}

	///	<summary>
	///		Destructor.
	///	</summary>
	~NcFileVector() {
		Close();
	}

	///	<summary>
	///		Open every file of a semi-colon delimited list and append it.
	///		Throws if any file cannot be opened or the list is empty.
	///	</summary>
	void Open(const std::string & strFiles);

	///	<summary>
	///		Close every file.
	///	</summary>
	void Close();

	size_t size() const {
		return m_vecNcFile.size();
	}

	///	<summary>
	///		First variable with the given name across all files, or NULL.
	///		On success the index of its file is written to psFile.
	///	</summary>
	NcVar * FindVariable(
		const std::string & strVariable,
		size_t * psFile = NULL
	) const;

	///	<summary>
	///		As FindVariable, but a missing variable is an error.
	///	</summary>
	NcVar * GetVariable(
		const std::string & strVariable,
		size_t * psFile = NULL
	) const;

	NcFile * operator[](size_t sFile) const {
		return m_vecNcFile.at(sFile);
	}

	const std::string & GetFilename(size_t sFile) const {
		return m_vecFilenames.at(sFile);
	}

private:
	NcFileVector(const NcFileVector &);
	NcFileVector & operator=(const NcFileVector &);

	std::vector<NcFile *> m_vecNcFile;

	std::vector<std::string> m_vecFilenames;
};

///////////////////////////////////////////////////////////////////////////////

#endif

