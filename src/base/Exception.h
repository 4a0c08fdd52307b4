///////////////////////////////////////////////////////////////////////////////
///
///	\file    Exception.h
///	\author  Paul Ullrich
///	\version March 4, 2024
///
///	<summary>
///		Formatted exceptions carrying the source location of the throw.
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

#ifndef _EXCEPTION_H_
#define _EXCEPTION_H_

#include <string>
#include <cstdio>
#include <cstdarg>

///////////////////////////////////////////////////////////////////////////////

#define _EXCEPTION() \
throw Exception(__FILE__, __LINE__)

#define _EXCEPTIONT(text) \
throw Exception(__FILE__, __LINE__, "%s", text)

#define _EXCEPTION1(text, var1) \
throw Exception(__FILE__, __LINE__, text, var1)

#define _EXCEPTION2(text, var1, var2) \
throw Exception(__FILE__, __LINE__, text, var1, var2)

#define _EXCEPTION3(text, var1, var2, var3) \
throw Exception(__FILE__, __LINE__, text, var1, var2, var3)

#define _EXCEPTION4(text, var1, var2, var3, var4) \
throw Exception(__FILE__, __LINE__, text, var1, var2, var3, var4)

#define _EXCEPTION5(text, var1, var2, var3, var4, var5) \
throw Exception(__FILE__, __LINE__, text, var1, var2, var3, var4, var5)

///	<summary>
///		Internal consistency check, compiled out in release builds.
///	</summary>
#ifdef NDEBUG
#define _ASSERT(x)
#else
#define _ASSERT(x) \
if (!(x)) { throw Exception(__FILE__, __LINE__, "Assertion failure: %s", #x); }
#endif

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		An Exception is a formatted error message that is generated from a
///		throw directive.  Use the _EXCEPTION macros to construct it.
///	</summary>
class Exception {

public:
	///	<summary>
	///		Maximum buffer size for exception strings.
	///	</summary>
	static const int ExceptionBufferSize = 1024;

public:
	///	<summary>
	///		Generic constructor.
	///	</summary>
	Exception(
		const char * szFile,
		unsigned int uiLine
	) :
		m_strText("General exception"),
		m_strFile(szFile),
		m_uiLine(uiLine)
	{ }

	///	<summary>
	///		Constructor with printf-style text and arguments.
	///	</summary>
	Exception(
		const char * szFile,
		unsigned int uiLine,
		const char * szText,
		...
	) :
		m_strFile(szFile),
		m_uiLine(uiLine)
	{
		char szBuffer[ExceptionBufferSize];

		va_list arguments;
		va_start(arguments, szText);
		vsnprintf(szBuffer, ExceptionBufferSize, szText, arguments);
		va_end(arguments);

		m_strText = szBuffer;
	}

public:
	///	<summary>
	///		Message without location information.
	///	</summary>
	const std::string & GetText() const {
		return m_strText;
	}

	///	<summary>
	///		Get a string representation of this exception.
	///	</summary>
	std::string ToString() const {
		char szLine[32];
		snprintf(szLine, 32, ", Line %u) ", m_uiLine);

		std::string strReturn("EXCEPTION (");
		strReturn += m_strFile;
		strReturn += szLine;
		strReturn += m_strText;
		return strReturn;
	}

private:
	///	<summary>
	///		A string denoting the error in question.
	///	</summary>
	std::string m_strText;

	///	<summary>
	///		The file where the exception occurred.
	///	</summary>
	std::string m_strFile;

	///	<summary>
	///		The line number where the exception occurred.
	///	</summary>
	unsigned int m_uiLine;
};

///////////////////////////////////////////////////////////////////////////////

#endif

