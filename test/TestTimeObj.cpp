///////////////////////////////////////////////////////////////////////////////
///
///	\file    TestTimeObj.cpp
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

#include "TimeObj.h"
#include "Exception.h"

#include <iostream>
#include <string>

///////////////////////////////////////////////////////////////////////////////

namespace {

int ExpectTrue(bool fCondition, const std::string & strMessage) {
	if (!fCondition) {
		std::cerr << "[time-obj] FAIL: " << strMessage << std::endl;
		return 1;
	}
	return 0;
}

Time DecodeOffset(
	Time::CalendarType eCalendarType,
	const std::string & strUnits,
	double dOffset
) {
	Time time(eCalendarType);
	time.FromCFCompliantUnitsOffsetDouble(strUnits, dOffset);
	return time;
}

///////////////////////////////////////////////////////////////////////////////

int TestCalendarNames() {
	int nFailures = 0;

	nFailures += ExpectTrue(
		Time::CalendarTypeFromString("noleap") == Time::CalendarNoLeap,
		"noleap must be recognized");
	nFailures += ExpectTrue(
		Time::CalendarTypeFromString("365_day") == Time::CalendarNoLeap,
		"365_day must map to noleap");
	nFailures += ExpectTrue(
		Time::CalendarTypeFromString("Gregorian") == Time::CalendarGregorian,
		"calendar names must be case insensitive");
	nFailures += ExpectTrue(
		Time::CalendarTypeFromString("julian") == Time::CalendarUnknown,
		"unsupported calendar must be unknown");

	return nFailures;
}

///////////////////////////////////////////////////////////////////////////////

int TestCFOffsets() {
	int nFailures = 0;

	Time timeDays = DecodeOffset(Time::CalendarStandard,
		"days since 2000-01-01", 31.0);
	nFailures += ExpectTrue(timeDays.ToDateString() == "2000-02-01",
		"31 days after 2000-01-01 must be 2000-02-01");

	Time timeLeap = DecodeOffset(Time::CalendarStandard,
		"days since 2000-01-01 00:00:00", 59.0);
	nFailures += ExpectTrue(timeLeap.GetMonth() == 2 && timeLeap.GetDay() == 29,
		"standard calendar must include 2000-02-29");

	Time timeNoLeap = DecodeOffset(Time::CalendarNoLeap,
		"days since 2000-01-01 00:00:00", 59.0);
	nFailures += ExpectTrue(timeNoLeap.GetMonth() == 3 && timeNoLeap.GetDay() == 1,
		"noleap calendar must skip 2000-02-29");

	Time timeCentury = DecodeOffset(Time::CalendarStandard,
		"days since 1900-02-28", 1.0);
	nFailures += ExpectTrue(timeCentury.GetMonth() == 3,
		"1900 must not be a leap year");

	Time time360 = DecodeOffset(Time::Calendar360Day,
		"days since 1980-01-01", 30.0);
	nFailures += ExpectTrue(time360.GetMonth() == 2 && time360.GetDay() == 1,
		"360_day calendar must have 30 day months");

	Time timeHours = DecodeOffset(Time::CalendarStandard,
		"hours since 1979-01-01 00:00:00", 1416.0 + 6.0);
	nFailures += ExpectTrue(timeHours.ToString() == "1979-03-01 06:00:00",
		"hour offsets must be decoded");

	Time timeFraction = DecodeOffset(Time::CalendarStandard,
		"days since 1979-12-31T12:00:00", 0.75);
	nFailures += ExpectTrue(timeFraction.GetYear() == 1980 && timeFraction.GetMonth() == 1,
		"fractional days must carry into the next year");
	nFailures += ExpectTrue(timeFraction.GetSecond() == 6 * 3600,
		"fractional days must be rounded to seconds");

	return nFailures;
}

///////////////////////////////////////////////////////////////////////////////

int TestMalformedUnits() {
	int nFailures = 0;

	bool fThrew = false;
	try {
		DecodeOffset(Time::CalendarStandard, "fortnights since 2000-01-01", 1.0);
	} catch(Exception &) {
		fThrew = true;
	}
	nFailures += ExpectTrue(fThrew, "unknown time unit must be rejected");

	fThrew = false;
	try {
		DecodeOffset(Time::CalendarStandard, "days after 2000-01-01", 1.0);
	} catch(Exception &) {
		fThrew = true;
	}
	nFailures += ExpectTrue(fThrew, "units without \"since\" must be rejected");

	fThrew = false;
	try {
		DecodeOffset(Time::CalendarStandard, "days since 2000-14-01", 1.0);
	} catch(Exception &) {
		fThrew = true;
	}
	nFailures += ExpectTrue(fThrew, "reference month out of range must be rejected");

	return nFailures;
}

} // namespace

///////////////////////////////////////////////////////////////////////////////

int main() {
	int nFailures = 0;

	try {
		nFailures += TestCalendarNames();
		nFailures += TestCFOffsets();
		nFailures += TestMalformedUnits();

	} catch(Exception & e) {
		std::cerr << "[time-obj] " << e.ToString() << std::endl;
		return 1;
	}

	if (nFailures > 0) {
		std::cerr << "[time-obj] FAILED with "
			<< nFailures << " check(s)." << std::endl;
		return 1;
	}

	std::cout << "[time-obj] all checks passed" << std::endl;
	return 0;
}

///////////////////////////////////////////////////////////////////////////////

