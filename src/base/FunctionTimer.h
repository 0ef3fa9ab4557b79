///////////////////////////////////////////////////////////////////////////////
///
///	\file    FunctionTimer.h
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
#ifndef _FUNCTIONTIMER_H_
#define _FUNCTIONTIMER_H_

///////////////////////////////////////////////////////////////////////////////

#include <string>
#include <map>

#include <sys/time.h>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A wall-clock stopwatch with microsecond resolution.  A timer with a
///		group name adds its elapsed time to a process-wide record for that
///		group when it is stopped.  Group records are not thread safe; stop
///		grouped timers outside of parallel regions.
///	</summary>
class FunctionTimer {

public:
	static const unsigned long long MICROSECONDS_PER_SECOND = 1000000;

	///	<summary>
	///		Timings recorded for one group.
	///	</summary>
	struct TimerGroupData {
		unsigned long long iTotalTime;
		unsigned long long iMaxTime;
		unsigned long long nEntries;
	};

public:
	///	<summary>
	///		Constructor; starts the timer.
	///	</summary>
	explicit FunctionTimer(const char * szGroup = NULL);

	///	<summary>
	///		Destructor; stops the timer if still running.
	///	</summary>
	~FunctionTimer() {
		StopTime();
	}

	///	<summary>
	///		Microseconds since the timer started, or until it was stopped.
	///	</summary>
	unsigned long long Elapsed() const;

	///	<summary>
	///		Stop the timer, record it in its group and return the elapsed
	///		time.  Later calls return the same value without recording.
	///	</summary>
	unsigned long long StopTime();

public:
	///	<summary>
	///		Record for the given group; all fields are zero if no timer of
	///		that group has stopped.
	///	</summary>
	static TimerGroupData GetGroupData(const char * szName);

	static unsigned long long GetTotalGroupTime(const char * szName) {
		return GetGroupData(szName).iTotalTime;
	}

	static unsigned long long GetNumberOfEntries(const char * szName) {
		return GetGroupData(szName).nEntries;
	}

private:
	static std::map<std::string, TimerGroupData> m_mapGroupData;

private:
	bool m_fStopped;

	timeval m_tvStartTime;

	timeval m_tvStopTime;

	///	<summary>
	///		Group name, or empty for an anonymous timer.
	///	</summary>
	std::string m_strGroup;
};

///////////////////////////////////////////////////////////////////////////////

#endif

