///////////////////////////////////////////////////////////////////////////////
///
///	\file    Announce.cpp
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
#if defined(BLSTATS_MPIOMP)
#include <mpi.h>
#endif

#include "Announce.h"

#include <cstdio>
#include <cstring>
#include <cstdarg>

///////////////////////////////////////////////////////////////////////////////

namespace {

///	<summary>
///		Longest single announcement; longer text is truncated with "...".
///	</summary>
const int AnnouncementBufferSize = 1024;

///	<summary>
///		Blocks nested deeper than this are not indented further.
///	</summary>
const int MaximumIndentationLevel = 16;

const int BannerSize = 60;

///	<summary>
///		Logging state shared by all announcement functions.
///	</summary>
struct AnnounceState {
	FILE * fpOutput;
	int iVerbosityLevel;
	bool fOnlyOutputOnRankZero;
	int nIndentationLevel;

	///	<summary>
	///		A block was started and its text is awaiting "Done" on the
	///		same line.
	///	</summary>
	bool fBlockOpen;
};

AnnounceState s_state = { stdout, 0, false, 0, false };

///////////////////////////////////////////////////////////////////////////////

bool IsSilentRank() {
#if defined(BLSTATS_MPIOMP)
	if (!s_state.fOnlyOutputOnRankZero) {
		return false;
	}

	int fInitialized;
	MPI_Initialized(&fInitialized);
	if (!fInitialized) {
		return false;
	}

	int nRank;
	MPI_Comm_rank(MPI_COMM_WORLD, &nRank);
	return (nRank > 0);
#else
	return false;
#endif
}

///////////////////////////////////////////////////////////////////////////////

void FormatText(
	char * szBuffer,
	const char * szText,
	va_list arguments
) {
	int nc = vsnprintf(szBuffer, AnnouncementBufferSize, szText, arguments);
	if (nc >= AnnouncementBufferSize - 1) {
		strcpy(szBuffer + AnnouncementBufferSize - 4, "...");
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Terminate the line of an open block so new output starts fresh.
///	</summary>
void CloseOpenBlockLine() {
	if (s_state.fBlockOpen) {
		fputc('\n', s_state.fpOutput);
		s_state.fBlockOpen = false;
	}
}

///////////////////////////////////////////////////////////////////////////////

void WriteIndent() {
	for (int i = 0; i < s_state.nIndentationLevel; i++) {
		fputs("..", s_state.fpOutput);
	}
}

///////////////////////////////////////////////////////////////////////////////

void WriteLine(const char * szBuffer) {
	CloseOpenBlockLine();
	WriteIndent();
	fprintf(s_state.fpOutput, "%s\n", szBuffer);
	fflush(s_state.fpOutput);
}

}

///////////////////////////////////////////////////////////////////////////////

void AnnounceSetOutputBuffer(FILE * fpAnnounceOutput) {
	s_state.fpOutput = fpAnnounceOutput;
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceSetVerbosityLevel(int iVerbosityLevel) {
	s_state.iVerbosityLevel = iVerbosityLevel;
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceOnlyOutputOnRankZero() {
	s_state.fOnlyOutputOnRankZero = true;
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceOutputOnAllRanks() {
	s_state.fOnlyOutputOnRankZero = false;
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceStartBlock(
	const char * szText,
	...
) {
	if ((szText == NULL) || IsSilentRank()) {
		return;
	}
	if (s_state.nIndentationLevel == MaximumIndentationLevel) {
		return;
	}

	char szBuffer[AnnouncementBufferSize];
	va_list arguments;
	va_start(arguments, szText);
	FormatText(szBuffer, szText, arguments);
	va_end(arguments);

	CloseOpenBlockLine();
	WriteIndent();
	fputs(szBuffer, s_state.fpOutput);
	fflush(s_state.fpOutput);

	s_state.fBlockOpen = true;
	s_state.nIndentationLevel++;
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceEndBlock(
	const char * szText,
	...
) {
	if ((s_state.nIndentationLevel == 0) || IsSilentRank()) {
		return;
	}

	if (szText == NULL) {
		CloseOpenBlockLine();

	} else {
		char szBuffer[AnnouncementBufferSize];
		va_list arguments;
		va_start(arguments, szText);
		FormatText(szBuffer, szText, arguments);
		va_end(arguments);

		// Nothing was printed inside the block; finish its line
		if (s_state.fBlockOpen) {
			fprintf(s_state.fpOutput, ".. %s\n", szBuffer);
			s_state.fBlockOpen = false;
		} else {
			WriteLine(szBuffer);
		}
	}

	s_state.nIndentationLevel--;
	fflush(s_state.fpOutput);
}

///////////////////////////////////////////////////////////////////////////////

void Announce(const char * szText, ...) {
	if (IsSilentRank()) {
		return;
	}
	if (szText == NULL) {
		CloseOpenBlockLine();
		return;
	}

	char szBuffer[AnnouncementBufferSize];
	va_list arguments;
	va_start(arguments, szText);
	FormatText(szBuffer, szText, arguments);
	va_end(arguments);

	WriteLine(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

void Announce(
	int iVerbosity,
	const char * szText,
	...
) {
	if ((iVerbosity > s_state.iVerbosityLevel) || (szText == NULL)) {
		return;
	}
	if (IsSilentRank()) {
		return;
	}

	char szBuffer[AnnouncementBufferSize];
	va_list arguments;
	va_start(arguments, szText);
	FormatText(szBuffer, szText, arguments);
	va_end(arguments);

	WriteLine(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceBanner(const char * szText) {
	if (IsSilentRank()) {
		return;
	}

	CloseOpenBlockLine();

	int nWritten = 0;
	if (szText != NULL) {
		nWritten = fprintf(s_state.fpOutput, "-- %s ", szText);
	}
	for (int i = nWritten; i < BannerSize; i++) {
		fputc('-', s_state.fpOutput);
	}
	fputc('\n', s_state.fpOutput);
	fflush(s_state.fpOutput);
}

///////////////////////////////////////////////////////////////////////////////

