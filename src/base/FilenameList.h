///////////////////////////////////////////////////////////////////////////////
///
///	\file    FilenameList.h
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

#ifndef _FILENAMELIST_H_
#define _FILENAMELIST_H_

#include "Exception.h"
#include "STLStringHelper.h"

#include <string>
#include <fstream>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A list of input file lines.  Each line names one chunk of time and
///		may hold several semi-colon separated files for that chunk.
///	</summary>
class FilenameList : public std::vector<std::string> {

public:
	///	<summary>
	///		Parse the filename list from a file containing a list of filenames.
	///		Blank lines and lines beginning with '#' are skipped.
	///	</summary>
	void FromFile(
		const std::string & strFileListFile
	) {
		std::ifstream ifFileList(strFileListFile.c_str());
		if (!ifFileList.is_open()) {
			_EXCEPTION1("Unable to open file \"%s\"",
				strFileListFile.c_str());
		}

		std::string strFileLine;
		while (std::getline(ifFileList, strFileLine)) {

			// Strip carriage returns from files written on Windows
			if ((strFileLine.length() != 0) &&
			    (strFileLine[strFileLine.length()-1] == '\r')
			) {
				strFileLine.erase(strFileLine.length()-1);
			}

			STLStringHelper::RemoveWhitespaceInPlace(strFileLine);
			if (strFileLine.length() == 0) {
				continue;
			}
			if (strFileLine[0] == '#') {
				continue;
			}
			push_back(strFileLine);
		}
		if (size() == 0) {
			_EXCEPTION1("No filenames found in \"%s\"",
				strFileListFile.c_str());
		}
	}
};

///////////////////////////////////////////////////////////////////////////////

#endif

