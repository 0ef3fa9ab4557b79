///////////////////////////////////////////////////////////////////////////////
///
///	\file    TimeObj.cpp
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

#include "TimeObj.h"

#include <cmath>
#include <cstdio>
#include <cstring>

///////////////////////////////////////////////////////////////////////////////

int Time::DaysInMonth(
	CalendarType eCalendarType,
	int iYear,
	int iZeroIndexedMonth
) {
	static const int nDaysPerMonth[]
		= {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

	_ASSERT((iZeroIndexedMonth >= 0) && (iZeroIndexedMonth < 12));

	if (eCalendarType == Calendar360Day) {
		return 30;
	}

	if ((iZeroIndexedMonth == 1) &&
	    ((eCalendarType == CalendarStandard) ||
	     (eCalendarType == CalendarGregorian))
	) {
		if ((iYear % 4) == 0) {
			if (((iYear % 100) == 0) && ((iYear % 400) != 0)) {
				return 28;
			}
			return 29;
		}
	}

	return nDaysPerMonth[iZeroIndexedMonth];
}

///////////////////////////////////////////////////////////////////////////////

void Time::NormalizeTime() {

	// Carry seconds into days
	if ((m_iSecond >= 86400) || (m_iSecond < 0)) {
		int nAddedDays = m_iSecond / 86400;
		if (m_iSecond < 0) {
			nAddedDays = - ((86399 - m_iSecond) / 86400);
		}
		m_iSecond -= nAddedDays * 86400;
		m_iDay += nAddedDays;
	}

	// Carry months into years
	if ((m_iMonth >= 12) || (m_iMonth < 0)) {
		int nAddedYears = m_iMonth / 12;
		if (m_iMonth < 0) {
			nAddedYears = - ((11 - m_iMonth) / 12);
		}
		m_iMonth -= nAddedYears * 12;
		m_iYear += nAddedYears;
	}

	// Borrow days from previous months
	while (m_iDay < 0) {
		m_iMonth--;
		if (m_iMonth < 0) {
			m_iMonth = 11;
			m_iYear--;
		}
		m_iDay += DaysInMonth(m_eCalendarType, m_iYear, m_iMonth);
	}

	// Carry days into subsequent months
	for (;;) {
		int nDays = DaysInMonth(m_eCalendarType, m_iYear, m_iMonth);
		if (m_iDay < nDays) {
			break;
		}
		m_iDay -= nDays;
		m_iMonth++;
		if (m_iMonth > 11) {
			m_iMonth = 0;
			m_iYear++;
		}
	}

	if ((m_iMonth < 0) || (m_iMonth >= 12) ||
	    (m_iDay < 0) || (m_iSecond < 0) || (m_iSecond >= 86400)
	) {
		_EXCEPTION4("Logic error: %i %i %i %i",
			m_iYear, m_iMonth, m_iDay, m_iSecond);
	}
}

///////////////////////////////////////////////////////////////////////////////

void Time::AddFractionalDays(double dDays) {
	double dWholeDays = floor(dDays);

	int nSeconds =
		static_cast<int>(floor((dDays - dWholeDays) * 86400.0 + 0.5));

	m_iDay += static_cast<int>(dWholeDays);
	m_iSecond += nSeconds;

	NormalizeTime();
}

///////////////////////////////////////////////////////////////////////////////

std::string Time::ToDateString() const {
	char szBuffer[100];

	snprintf(szBuffer, 100, "%04i-%02i-%02i",
		m_iYear, m_iMonth+1, m_iDay+1);

	return std::string(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

std::string Time::ToString() const {
	char szBuffer[100];

	snprintf(szBuffer, 100, "%04i-%02i-%02i %02i:%02i:%02i",
		m_iYear, m_iMonth+1, m_iDay+1,
		m_iSecond / 3600,
		(m_iSecond % 3600) / 60,
		m_iSecond % 60);

	return std::string(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

void Time::FromFormattedString(
	const std::string & strFormattedTime
) {
	std::string strTime = strFormattedTime;
	STLStringHelper::RemoveWhitespaceInPlace(strTime);

	if (strTime.length() == 0) {
		_EXCEPTIONT("Empty Time string");
	}

	// Date and time separated by ' ' or 'T'
	int iYear = 0;
	int iMonth = 1;
	int iDay = 1;
	int iHour = 0;
	int iMinute = 0;
	double dSecond = 0.0;

	std::string strDate = strTime;
	std::string strClock;

	size_t sSeparator = strTime.find_first_of(" T");
	if (sSeparator != std::string::npos) {
		strDate = strTime.substr(0, sSeparator);
		strClock = strTime.substr(sSeparator+1);
		STLStringHelper::RemoveWhitespaceInPlace(strClock);
	}

	// Year may carry a sign; find the month separator after it
	size_t sDash1 = strDate.find('-', 1);
	if (sDash1 == std::string::npos) {
		_EXCEPTION1("Malformed Time string (%s): expected yyyy-mm-dd",
			strFormattedTime.c_str());
	}
	size_t sDash2 = strDate.find('-', sDash1+1);

	iYear = STLStringHelper::ToInteger(
		strDate.substr(0, sDash1), "Time string year");

	if (sDash2 == std::string::npos) {
		iMonth = STLStringHelper::ToInteger(
			strDate.substr(sDash1+1), "Time string month");
	} else {
		iMonth = STLStringHelper::ToInteger(
			strDate.substr(sDash1+1, sDash2-sDash1-1), "Time string month");
		iDay = STLStringHelper::ToInteger(
			strDate.substr(sDash2+1), "Time string day");
	}

	// Time of day; timezone suffixes other than "Z" / "UTC" are not handled
	if (strClock.length() != 0) {
		size_t sZone = strClock.find_first_of(" Z");
		if (sZone != std::string::npos) {
			strClock = strClock.substr(0, sZone);
		}

		std::vector<std::string> vecClock;
		STLStringHelper::ParseVariableList(strClock, vecClock, ":");

		if (vecClock.size() > 3) {
			_EXCEPTION1("Malformed Time string (%s): too many fields",
				strFormattedTime.c_str());
		}
		if (vecClock.size() > 0) {
			iHour = STLStringHelper::ToInteger(vecClock[0], "Time string hour");
		}
		if (vecClock.size() > 1) {
			iMinute = STLStringHelper::ToInteger(vecClock[1], "Time string minute");
		}
		if (vecClock.size() > 2) {
			dSecond = STLStringHelper::ToDouble(vecClock[2], "Time string second");
		}
	}

	if ((iMonth < 1) || (iMonth > 12)) {
		_EXCEPTION1("Malformed Time string (%s): month out of range",
			strFormattedTime.c_str());
	}
	if ((iDay < 1) || (iDay > 31)) {
		_EXCEPTION1("Malformed Time string (%s): day out of range",
			strFormattedTime.c_str());
	}

	m_iYear = iYear;
	m_iMonth = iMonth - 1;
	m_iDay = iDay - 1;
	m_iSecond =
		iHour * 3600 + iMinute * 60
		+ static_cast<int>(floor(dSecond + 0.5));

	NormalizeTime();
}

///////////////////////////////////////////////////////////////////////////////

void Time::FromCFCompliantUnitsOffsetDouble(
	const std::string & strFormattedTime,
	double dOffset
) {
	if (std::isnan(dOffset)) {
		_EXCEPTIONT("Invalid (NaN) time offset");
	}

	// Time format is "<unit> since <date>"
	size_t sSince = strFormattedTime.find(" since ");
	if (sSince == std::string::npos) {
		_EXCEPTION1("Unknown \"time::units\" format \"%s\"",
			strFormattedTime.c_str());
	}

	std::string strUnit = strFormattedTime.substr(0, sSince);
	STLStringHelper::RemoveWhitespaceInPlace(strUnit);
	STLStringHelper::ToLower(strUnit);

	FromFormattedString(strFormattedTime.substr(sSince + 7));

	if ((strUnit == "days") || (strUnit == "day") || (strUnit == "d")) {
		AddFractionalDays(dOffset);

	} else if (
	    (strUnit == "hours") || (strUnit == "hour") || (strUnit == "h")
	) {
		AddFractionalDays(dOffset / 24.0);

	} else if (
	    (strUnit == "minutes") || (strUnit == "minute") || (strUnit == "min")
	) {
		AddFractionalDays(dOffset / 1440.0);

	} else if (
	    (strUnit == "seconds") || (strUnit == "second") || (strUnit == "s")
	) {
		AddFractionalDays(dOffset / 86400.0);

	} else {
		_EXCEPTION1("Unknown \"time::units\" format \"%s\"",
			strFormattedTime.c_str());
	}
}

///////////////////////////////////////////////////////////////////////////////

