///////////////////////////////////////////////////////////////////////////////
///
///	\file    STLStringHelper.h
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

#ifndef _STLSTRINGHELPER_H_
#define _STLSTRINGHELPER_H_

#include "Exception.h"

#include <string>
#include <vector>

#include <cstdlib>
#include <cstring>
#include <cctype>

///	<summary>
///		This class exposes additional functionality which can be used to
///		supplement the STL string class.
///	</summary>
class STLStringHelper {

///////////////////////////////////////////////////////////////////////////////

private:
STLStringHelper() { }

public:

///////////////////////////////////////////////////////////////////////////////

inline static void ToLower(std::string &str) {
	for(size_t i = 0; i < str.length(); i++) {
		str[i] = tolower(str[i]);
	}
}

///////////////////////////////////////////////////////////////////////////////

inline static bool IsInteger(const std::string &str) {
	if (str.length() == 0) {
		return false;
	}
	for(size_t i = 0; i < str.length(); i++) {
		if ((i == 0) && ((str[i] == '-') || (str[i] == '+'))) {
			if (str.length() == 1) {
				return false;
			}
			continue;
		}
		if ((str[i] < '0') || (str[i] > '9')) {
			return false;
		}
	}
	return true;
}

///////////////////////////////////////////////////////////////////////////////

inline static bool IsFloat(const std::string &str) {
	bool fHasDigit = false;
	bool fHasExponent = false;
	bool fHasDecimal = false;
	for(size_t i = 0; i < str.length(); i++) {
		if ((str[i] >= '0') && (str[i] <= '9')) {
			fHasDigit = true;
			continue;
		}
		if (str[i] == '.') {
			if (fHasDecimal || fHasExponent) {
				return false;
			}
			fHasDecimal = true;
			continue;
		}
		if ((str[i] == 'e') || (str[i] == 'E')) {
			if (fHasExponent || !fHasDigit) {
				return false;
			}
			if (i == str.length()-1) {
				return false;
			}
			fHasExponent = true;
			continue;
		}
		if ((str[i] == '-') || (str[i] == '+')) {
			if ((i == 0) || (str[i-1] == 'e') || (str[i-1] == 'E')) {
				continue;
			}
			return false;
		}
		return false;
	}
	return fHasDigit;
}

///////////////////////////////////////////////////////////////////////////////

static void RemoveWhitespaceInPlace(
	std::string & strString
) {
	size_t sBegin = strString.length();
	for (size_t s = 0; s < strString.length(); s++) {
		if ((strString[s] != ' ') && (strString[s] != '\t')) {
			sBegin = s;
			break;
		}
	}
	if (sBegin == strString.length()) {
		strString = "";
		return;
	}

	size_t sEnd = strString.length();
	for (size_t s = sEnd-1; s > sBegin; s--) {
		if ((strString[s] != ' ') && (strString[s] != '\t')) {
			sEnd = s+1;
			break;
		}
	}

	strString = strString.substr(sBegin, sEnd - sBegin);
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Split a delimited list into its whitespace-trimmed components.
///		Empty components are an error.
///	</summary>
static void ParseVariableList(
	const std::string & strVariables,
	std::vector< std::string > & vecVariableStrings,
	const std::string & strDelimiters = std::string(" ,;")
) {
	if (strVariables.length() == 0) {
		return;
	}

	size_t sBegin = 0;
	bool fLastWhitespace = true;
	for (size_t s = 0; s <= strVariables.length(); s++) {
		if ((s != strVariables.length()) &&
		    (strDelimiters.find(strVariables[s]) == std::string::npos)
		) {
			continue;
		}

		bool fWhitespace =
			(s == strVariables.length()) ||
			(strVariables[s] == ' ') ||
			(strVariables[s] == '\t');

		std::string strItem = strVariables.substr(sBegin, s - sBegin);
		RemoveWhitespaceInPlace(strItem);

		// Whitespace delimiters may legitimately repeat
		if (strItem.length() == 0) {
			if (!fWhitespace && !fLastWhitespace) {
				_EXCEPTION1("Zero length entry in list \"%s\"",
					strVariables.c_str());
			}
			if (!fWhitespace) {
				fLastWhitespace = false;
			}
			sBegin = s+1;
			continue;
		}

		vecVariableStrings.push_back(strItem);
		fLastWhitespace = fWhitespace;
		sBegin = s+1;
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Convert a string to a double, throwing on malformed input.
///	</summary>
static double ToDouble(
	const std::string & strValue,
	const char * szContext
) {
	std::string strTrimmed = strValue;
	RemoveWhitespaceInPlace(strTrimmed);
	if (!IsFloat(strTrimmed)) {
		_EXCEPTION2("Invalid floating point value \"%s\" in %s",
			strValue.c_str(), szContext);
	}
	return atof(strTrimmed.c_str());
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Convert a string to an integer, throwing on malformed input.
///	</summary>
static int ToInteger(
	const std::string & strValue,
	const char * szContext
) {
	std::string strTrimmed = strValue;
	RemoveWhitespaceInPlace(strTrimmed);
	if (!IsInteger(strTrimmed)) {
		_EXCEPTION2("Invalid integer value \"%s\" in %s",
			strValue.c_str(), szContext);
	}
	return atoi(strTrimmed.c_str());
}

///////////////////////////////////////////////////////////////////////////////

};

#endif

