///////////////////////////////////////////////////////////////////////////////
///
///	\file    TimeObj.h
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

#ifndef _TIMEOBJ_H_
#define _TIMEOBJ_H_

#include "Exception.h"
#include "STLStringHelper.h"

#include <string>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A fixed point in time stored as year, month, day and seconds on a
///		given CF calendar.  Month and day are stored zero-indexed.
///	</summary>
class Time {

public:
	///	<summary>
	///		Type of calendar.
	///	</summary>
	enum CalendarType {
		CalendarUnknown,
		CalendarNoLeap,
		CalendarStandard,
		CalendarGregorian,
		Calendar360Day
	};

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	Time(
		CalendarType eCalendarType = CalendarStandard
	) :
		m_iYear(0),
		m_iMonth(0),
		m_iDay(0),
		m_iSecond(0),
		m_eCalendarType(eCalendarType)
	{
		if (m_eCalendarType == CalendarUnknown) {
			_EXCEPTIONT("Invalid CalendarType");
		}
	}

	///	<summary>
	///		Constructor from a calendar date.  Month and day are
	///		one-indexed here, as written in a date string.
	///	</summary>
	Time(
		int iYear,
		int iMonth,
		int iDay,
		int iSecond,
		CalendarType eCalendarType = CalendarStandard
	) :
		m_iYear(iYear),
		m_iMonth(iMonth - 1),
		m_iDay(iDay - 1),
		m_iSecond(iSecond),
		m_eCalendarType(eCalendarType)
	{
		if (m_eCalendarType == CalendarUnknown) {
			_EXCEPTIONT("Invalid CalendarType");
		}
		NormalizeTime();
	}

public:
	///	<summary>
	///		Returns the CalendarType associated with the given string.
	///	</summary>
	static CalendarType CalendarTypeFromString(
		const std::string & strCalendar
	) {
		std::string strCalendarTemp = strCalendar;
		STLStringHelper::ToLower(strCalendarTemp);

		if (strCalendarTemp == "noleap") {
			return CalendarNoLeap;
		} else if (strCalendarTemp == "365_day"){
			return CalendarNoLeap;
		} else if (strCalendarTemp == "standard") {
			return CalendarStandard;
		} else if (strCalendarTemp == "gregorian") {
			return CalendarGregorian;
		} else if (strCalendarTemp == "proleptic_gregorian") {
			return CalendarGregorian;
		} else if (strCalendarTemp == "360_day") {
			return Calendar360Day;
		} else {
			return CalendarUnknown;
		}
	}

	///	<summary>
	///		Number of days in the given zero-indexed month of the given year.
	///	</summary>
	static int DaysInMonth(
		CalendarType eCalendarType,
		int iYear,
		int iZeroIndexedMonth
	);

protected:
	///	<summary>
	///		Carry seconds into days and days into months so that every
	///		field lies within its natural range.
	///	</summary>
	void NormalizeTime();

	///	<summary>
	///		Add a (possibly fractional) offset in days.  Fractions are
	///		rounded to the nearest second.
	///	</summary>
	void AddFractionalDays(double dDays);

public:
	inline int GetYear() const {
		return m_iYear;
	}

	///	<summary>
	///		Get the one-indexed month.
	///	</summary>
	inline int GetMonth() const {
		return m_iMonth + 1;
	}

	///	<summary>
	///		Get the one-indexed day.
	///	</summary>
	inline int GetDay() const {
		return m_iDay + 1;
	}

	inline int GetSecond() const {
		return m_iSecond;
	}

public:
	///	<summary>
	///		Output as a date string (yyyy-mm-dd).
	///	</summary>
	std::string ToDateString() const;

	///	<summary>
	///		Output as a date and time string (yyyy-mm-dd hh:mm:ss).
	///	</summary>
	std::string ToString() const;

	///	<summary>
	///		Parse a time of the form "yyyy-mm-dd[ hh[:mm[:ss[.f]]]]",
	///		where the date and time may also be separated by 'T'.
	///	</summary>
	void FromFormattedString(const std::string & strFormattedTime);

	///	<summary>
	///		Set this Time from a CF-compliant "<unit> since <date>" units
	///		string and an offset in those units.
	///	</summary>
	void FromCFCompliantUnitsOffsetDouble(
		const std::string & strFormattedTime,
		double dOffset
	);

private:
	int m_iYear;

	int m_iMonth;

	int m_iDay;

	int m_iSecond;

	///	<summary>
	///		The type of calendar.
	///	</summary>
	CalendarType m_eCalendarType;
};

///////////////////////////////////////////////////////////////////////////////

#endif

