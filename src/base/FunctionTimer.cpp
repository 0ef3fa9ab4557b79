///////////////////////////////////////////////////////////////////////////////
///
///	\file    FunctionTimer.cpp
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
#include "FunctionTimer.h"

///////////////////////////////////////////////////////////////////////////////

std::map<std::string, FunctionTimer::TimerGroupData> FunctionTimer::m_mapGroupData;

///////////////////////////////////////////////////////////////////////////////

FunctionTimer::FunctionTimer(const char * szGroup) :
	m_fStopped(false)
{
	if (szGroup != NULL) {
		m_strGroup = szGroup;
	}

	gettimeofday(&m_tvStartTime, NULL);
	m_tvStopTime = m_tvStartTime;
}

///////////////////////////////////////////////////////////////////////////////

unsigned long long FunctionTimer::Elapsed() const {
	timeval tvEnd = m_tvStopTime;
	if (!m_fStopped) {
		gettimeofday(&tvEnd, NULL);
	}

	long long iTime =
		static_cast<long long>(MICROSECONDS_PER_SECOND)
			* static_cast<long long>(tvEnd.tv_sec - m_tvStartTime.tv_sec)
		+ static_cast<long long>(tvEnd.tv_usec - m_tvStartTime.tv_usec);

	// Clock adjustments can step backwards
	if (iTime < 0) {
		return 0;
	}
	return static_cast<unsigned long long>(iTime);
}

///////////////////////////////////////////////////////////////////////////////

unsigned long long FunctionTimer::StopTime() {
	if (m_fStopped) {
		return Elapsed();
	}

	gettimeofday(&m_tvStopTime, NULL);
	m_fStopped = true;

	unsigned long long iTime = Elapsed();

	if (m_strGroup.length() == 0) {
		return iTime;
	}

	TimerGroupData & tgd = m_mapGroupData[m_strGroup];
	tgd.iTotalTime += iTime;
	tgd.nEntries++;
	if (iTime > tgd.iMaxTime) {
		tgd.iMaxTime = iTime;
	}

	return iTime;
}

///////////////////////////////////////////////////////////////////////////////

FunctionTimer::TimerGroupData FunctionTimer::GetGroupData(const char * szName) {
	std::map<std::string, TimerGroupData>::const_iterator iter =
		m_mapGroupData.find(szName);
	if (iter != m_mapGroupData.end()) {
		return iter->second;
	}

	TimerGroupData tgdEmpty;
	tgdEmpty.iTotalTime = 0;
	tgdEmpty.iMaxTime = 0;
	tgdEmpty.nEntries = 0;
	return tgdEmpty;
}

///////////////////////////////////////////////////////////////////////////////

