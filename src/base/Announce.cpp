///////////////////////////////////////////////////////////////////////////////
///
///	\file    Announce.cpp
///	\author  Paul Ullrich
///	\version March 4, 2024
///
///	<remarks>
///		Copyright 2000-2024 Paul Ullrich
///
///		This file is distributed as part of the WaveMatchup source code
///		package.  Permission is granted to use, copy, modify and distribute
///		this source code and its documentation under the terms of the GNU
///		General Public License.  This software is provided "as is" without
///		express or implied warranty.
///	</remarks>

#ifdef WAVEMATCHUP_MPIOMP
#include <mpi.h>
#endif

#include "Announce.h"

#include <cstdio>
#include <cstring>
#include <cstdarg>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Verbosity level.
///	</summary>
static int s_iVerbosityLevel = 0;

///	<summary>
///		Only output on rank 0.
///	</summary>
static bool s_fOnlyOutputOnRankZero = false;

///	<summary>
///		Maximum announcement buffer size.
///	</summary>
static const int AnnouncementBufferSize = 1024;

///	<summary>
///		Maximum indentation level.
///	</summary>
static const int MaximumIndentationLevel = 16;

///	<summary>
///		Banner size.
///	</summary>
static const int BannerSize = 60;

///	<summary>
///		Current indentation level.
///	</summary>
static int s_nIndentationLevel = 0;

///	<summary>
///		Flag indicating whether a start block is still dangling.
///	</summary>
static bool s_fBlockFlag = false;

///////////////////////////////////////////////////////////////////////////////

static bool AnnounceSuppressedOnThisRank() {
#ifdef WAVEMATCHUP_MPIOMP
	if (s_fOnlyOutputOnRankZero) {
		int nInitialized = 0;
		int nFinalized = 0;
		MPI_Initialized(&nInitialized);
		MPI_Finalized(&nFinalized);
		if (nInitialized && !nFinalized) {
			int nRank;
			MPI_Comm_rank(MPI_COMM_WORLD, &nRank);
			return (nRank > 0);
		}
	}
#endif
	return false;
}

///////////////////////////////////////////////////////////////////////////////

static void AnnounceFormat(
	char * szBuffer,
	const char * szText,
	va_list arguments
) {
	int nc = vsnprintf(szBuffer, AnnouncementBufferSize, szText, arguments);
	if (nc > AnnouncementBufferSize-2) {
		szBuffer[AnnouncementBufferSize-4] = '.';
		szBuffer[AnnouncementBufferSize-3] = '.';
		szBuffer[AnnouncementBufferSize-2] = '.';
		szBuffer[AnnouncementBufferSize-1] = '\0';
	}
}

///////////////////////////////////////////////////////////////////////////////

static void AnnounceIndent(FILE * fp) {
	for (int i = 0; i < s_nIndentationLevel; i++) {
		fprintf(fp, "..");
	}
}

///////////////////////////////////////////////////////////////////////////////

static void AnnounceCloseDanglingBlock(FILE * fp) {
	if (s_fBlockFlag) {
		fprintf(fp, "\n");
		s_fBlockFlag = false;
	}
}

///////////////////////////////////////////////////////////////////////////////

static void AnnounceLine(const char * szBuffer) {
	FILE * fp = stdout;

	AnnounceCloseDanglingBlock(fp);
	AnnounceIndent(fp);
	fprintf(fp, "%s\n", szBuffer);
	fflush(fp);
}

///////////////////////////////////////////////////////////////////////////////

static void AnnounceOpenBlock(const char * szBuffer) {
	if (s_nIndentationLevel == MaximumIndentationLevel) {
		return;
	}

	FILE * fp = stdout;

	AnnounceCloseDanglingBlock(fp);
	AnnounceIndent(fp);
	fprintf(fp, "%s", szBuffer);

	s_fBlockFlag = true;
	s_nIndentationLevel++;

	fflush(fp);
}

///////////////////////////////////////////////////////////////////////////////

static void AnnounceCloseBlock(const char * szBuffer) {
	if (s_nIndentationLevel == 0) {
		return;
	}

	FILE * fp = stdout;

	if (szBuffer == NULL) {
		AnnounceCloseDanglingBlock(fp);
		s_nIndentationLevel--;

	} else if (s_fBlockFlag) {
		s_fBlockFlag = false;
		fprintf(fp, ".. %s\n", szBuffer);
		s_nIndentationLevel--;

	} else {
		AnnounceLine(szBuffer);
		s_nIndentationLevel--;
	}

	fflush(fp);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceSetVerbosityLevel(int iVerbosityLevel) {
	s_iVerbosityLevel = iVerbosityLevel;
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceOnlyOutputOnRankZero() {
	s_fOnlyOutputOnRankZero = true;
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceStartBlock(
	const char * szText,
	...
) {
	if ((szText == NULL) || AnnounceSuppressedOnThisRank()) {
		return;
	}

	char szBuffer[AnnouncementBufferSize];
	va_list arguments;
	va_start(arguments, szText);
	AnnounceFormat(szBuffer, szText, arguments);
	va_end(arguments);

	AnnounceOpenBlock(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceStartBlock(
	int iVerbosity,
	const char * szText
) {
	if (iVerbosity > s_iVerbosityLevel) {
		return;
	}
	AnnounceStartBlock("%s", szText);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceEndBlock(
	const char * szText,
	...
) {
	if (AnnounceSuppressedOnThisRank()) {
		return;
	}

	if (szText == NULL) {
		AnnounceCloseBlock(NULL);
		return;
	}

	char szBuffer[AnnouncementBufferSize];
	va_list arguments;
	va_start(arguments, szText);
	AnnounceFormat(szBuffer, szText, arguments);
	va_end(arguments);

	AnnounceCloseBlock(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceEndBlock(
	int iVerbosity,
	const char * szText
) {
	if (iVerbosity > s_iVerbosityLevel) {
		return;
	}
	if (szText == NULL) {
		AnnounceEndBlock(NULL);
	} else {
		AnnounceEndBlock("%s", szText);
	}
}

///////////////////////////////////////////////////////////////////////////////

void Announce(const char * szText, ...) {

	if (AnnounceSuppressedOnThisRank()) {
		return;
	}
	if (szText == NULL) {
		AnnounceCloseDanglingBlock(stdout);
		return;
	}

	char szBuffer[AnnouncementBufferSize];
	va_list arguments;
	va_start(arguments, szText);
	AnnounceFormat(szBuffer, szText, arguments);
	va_end(arguments);

	AnnounceLine(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

void Announce(
	int iVerbosity,
	const char * szText,
	...
) {
	if (iVerbosity > s_iVerbosityLevel) {
		return;
	}
	if (AnnounceSuppressedOnThisRank()) {
		return;
	}
	if (szText == NULL) {
		AnnounceCloseDanglingBlock(stdout);
		return;
	}

	char szBuffer[AnnouncementBufferSize];
	va_list arguments;
	va_start(arguments, szText);
	AnnounceFormat(szBuffer, szText, arguments);
	va_end(arguments);

	AnnounceLine(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceBanner(const char * szText) {

	if (AnnounceSuppressedOnThisRank()) {
		return;
	}

	FILE * fp = stdout;
	AnnounceCloseDanglingBlock(fp);

	// No text in banner
	if (szText == NULL) {
		for (int i = 0; i < BannerSize; i++) {
			fprintf(fp, "-");
		}
		fprintf(fp, "\n");
		fflush(fp);
		return;
	}

	int nTextLength = static_cast<int>(strlen(szText));
	if (nTextLength > BannerSize - 6) {
		fprintf(fp, "-- %s --\n", szText);
		fflush(fp);
		return;
	}

	int nLeft = (BannerSize - nTextLength - 2) / 2;
	int nRight = BannerSize - nTextLength - 2 - nLeft;
	for (int i = 0; i < nLeft; i++) {
		fprintf(fp, "-");
	}
	fprintf(fp, " %s ", szText);
	for (int i = 0; i < nRight; i++) {
		fprintf(fp, "-");
	}
	fprintf(fp, "\n");
	fflush(fp);
}

///////////////////////////////////////////////////////////////////////////////

