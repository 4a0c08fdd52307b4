///////////////////////////////////////////////////////////////////////////////
///
///	\file    Announce.h
///	\author  Paul Ullrich
///	\version March 4, 2024
///
///	<summary>
///		Functions for making nested progress announcements, safely when
///		running under MPI.
///	</summary>
///	<remarks>
///		Copyright 2000-2024 Paul Ullrich
///
///		This file is distributed as part of the WaveMatchup source code
///		package.  Permission is granted to use, copy, modify and distribute
///		this source code and its documentation under the terms of the GNU
///		General Public License.  This software is provided "as is" without
///		express or implied warranty.
///	</remarks>

#ifndef _ANNOUNCE_H_
#define _ANNOUNCE_H_

#include <cstdio>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Announcements with a verbosity above this level are suppressed.
///	</summary>
void AnnounceSetVerbosityLevel(int iVerbosityLevel);

///	<summary>
///		Only output announcements on MPI rank zero.
///	</summary>
void AnnounceOnlyOutputOnRankZero();

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Begin a new announcement block.
///	</summary>
void AnnounceStartBlock(const char * szText, ...);

///	<summary>
///		Begin a new announcement block at the given verbosity.
///	</summary>
void AnnounceStartBlock(int iVerbosity, const char * szText);

///	<summary>
///		End an announcement block.
///	</summary>
void AnnounceEndBlock(const char * szText, ...);

///	<summary>
///		End an announcement block at the given verbosity.
///	</summary>
void AnnounceEndBlock(int iVerbosity, const char * szText);

///	<summary>
///		Make an announcement.
///	</summary>
void Announce(const char * szText, ...);

///	<summary>
///		Make an announcement at the given verbosity.
///	</summary>
void Announce(int iVerbosity, const char * szText, ...);

///	<summary>
///		Create a banner / separator containing the specified text.
///	</summary>
void AnnounceBanner(const char * szText = NULL);

///////////////////////////////////////////////////////////////////////////////

#endif

