///////////////////////////////////////////////////////////////////////////////
///
///	\file    NcFileVector.cpp
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
#include "NcFileVector.h"
#include "Exception.h"
#include "STLStringHelper.h"

///////////////////////////////////////////////////////////////////////////////

void NcFileVector::Open(const std::string & strFiles) {
	std::vector<std::string> vecFiles;
	STLStringHelper::ParseVariableList(strFiles, vecFiles, ";");

	if (vecFiles.size() == 0) {
		_EXCEPTION1("No input files found in \"%s\"", strFiles.c_str());
	}

	for (size_t f = 0; f < vecFiles.size(); f++) {
		NcFile * pfile = new NcFile(vecFiles[f].c_str());
		if (!pfile->is_valid()) {
			delete pfile;
			_EXCEPTION1("Cannot open input file \"%s\"", vecFiles[f].c_str());
		}
		m_vecNcFile.push_back(pfile);
		m_vecFilenames.push_back(vecFiles[f]);
	}
}

///////////////////////////////////////////////////////////////////////////////

void NcFileVector::Close() {
	for (size_t f = 0; f < m_vecNcFile.size(); f++) {
		m_vecNcFile[f]->close();
		delete m_vecNcFile[f];
	}
	m_vecNcFile.clear();
	m_vecFilenames.clear();
}

///////////////////////////////////////////////////////////////////////////////

NcVar * NcFileVector::FindVariable(
	const std::string & strVariable,
	size_t * psFile
) const {
	for (size_t f = 0; f < m_vecNcFile.size(); f++) {
		NcVar * var = m_vecNcFile[f]->get_var(strVariable.c_str());
		if (var != NULL) {
			if (psFile != NULL) {
				*psFile = f;
			}
			return var;
		}
	}
	return NULL;
}

///////////////////////////////////////////////////////////////////////////////

NcVar * NcFileVector::GetVariable(
	const std::string & strVariable,
	size_t * psFile
) const {
	NcVar * var = FindVariable(strVariable, psFile);
	if (var == NULL) {
		std::string strFiles;
		for (size_t f = 0; f < m_vecFilenames.size(); f++) {
			if (f != 0) {
				strFiles += ";";
			}
			strFiles += m_vecFilenames[f];
		}
		_EXCEPTION2("Unable to find variable \"%s\" in \"%s\"",
			strVariable.c_str(), strFiles.c_str());
	}
	return var;
}

///////////////////////////////////////////////////////////////////////////////

