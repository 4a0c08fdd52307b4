///////////////////////////////////////////////////////////////////////////////
///
///	\file    CommandLine.h
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

#ifndef _COMMANDLINE_H_
#define _COMMANDLINE_H_

#include "Announce.h"
#include "Exception.h"

#include <vector>
#include <string>
#include <cmath>
#include <cstdlib>
#include <cstring>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A command line parameter of the form --name [value].
///	</summary>
class CommandLineArgument {
public:
	///	<summary>
	///		Constructor.  Names beginning with '*' are hidden from usage.
	///	</summary>
	CommandLineArgument(
		const std::string & strName,
		const std::string & strDescription
	) :
		m_strName(std::string("--") + strName),
		m_strDescription(strDescription),
		m_fHidden(false)
	{
		if ((strName.length() > 0) && (strName[0] == '*')) {
			m_strName = std::string("--") + strName.substr(1);
			m_fHidden = true;
		}
	}

	///	<summary>
	///		Virtual destructor.
	///	</summary>
	virtual ~CommandLineArgument() {
	}

	///	<summary>
	///		Number of values that follow the flag.
	///	</summary>
	virtual int GetValueCount() const = 0;

	///	<summary>
	///		String describing the type and the current value.
	///	</summary>
	virtual std::string GetUsageValue() const = 0;

	///	<summary>
	///		Activate this parameter (the flag was present).
	///	</summary>
	virtual void Activate() {
	}

	///	<summary>
	///		Set the value from a string.
	///	</summary>
	virtual void SetValue(
		int ix,
		const std::string & strValue
	) {
		_EXCEPTION1("Option %s does not take a value", m_strName.c_str());
	}

	///	<summary>
	///		Print the usage information of this parameter.
	///	</summary>
	void PrintUsage() const {
		if (!m_fHidden) {
			Announce("  %s %s %s",
				m_strName.c_str(),
				GetUsageValue().c_str(),
				m_strDescription.c_str());
		}
	}

public:
	///	<summary>
	///		Name of this parameter, including the leading dashes.
	///	</summary>
	std::string m_strName;

	///	<summary>
	///		Description of this parameter.
	///	</summary>
	std::string m_strDescription;

	///	<summary>
	///		Flag indicating this argument is hidden.
	///	</summary>
	bool m_fHidden;
};

///////////////////////////////////////////////////////////////////////////////

class CommandLineArgumentBool : public CommandLineArgument {
public:
	CommandLineArgumentBool(
		bool & ref,
		const std::string & strName,
		const std::string & strDescription
	) :
		CommandLineArgument(strName, strDescription),
		m_fValue(ref)
	{
		m_fValue = false;
	}

	virtual int GetValueCount() const {
		return 0;
	}

	virtual std::string GetUsageValue() const {
		return (m_fValue)?("<bool> [true]"):("<bool> [false]");
	}

	virtual void Activate() {
		m_fValue = true;
	}

public:
	bool & m_fValue;
};

///////////////////////////////////////////////////////////////////////////////

class CommandLineArgumentString : public CommandLineArgument {
public:
	CommandLineArgumentString(
		std::string & ref,
		const std::string & strName,
		const std::string & strDefaultValue,
		const std::string & strDescription
	) :
		CommandLineArgument(strName, strDescription),
		m_strValue(ref)
	{
		m_strValue = strDefaultValue;
	}

	virtual int GetValueCount() const {
		return 1;
	}

	virtual std::string GetUsageValue() const {
		return std::string("<string> [\"") + m_strValue + std::string("\"]");
	}

	virtual void SetValue(
		int ix,
		const std::string & strValue
	) {
		if (ix != 0) {
			_EXCEPTIONT("Invalid value index.");
		}
		m_strValue = strValue;
	}

public:
	std::string & m_strValue;
};

///////////////////////////////////////////////////////////////////////////////

class CommandLineArgumentInt : public CommandLineArgument {
public:
	CommandLineArgumentInt(
		int & ref,
		const std::string & strName,
		int nDefaultValue,
		const std::string & strDescription
	) :
		CommandLineArgument(strName, strDescription),
		m_nValue(ref)
	{
		m_nValue = nDefaultValue;
	}

	virtual int GetValueCount() const {
		return 1;
	}

	virtual std::string GetUsageValue() const {
		char szBuffer[64];
		snprintf(szBuffer, 64, "<integer> [%i]", m_nValue);
		return std::string(szBuffer);
	}

	virtual void SetValue(
		int ix,
		const std::string & strValue
	) {
		if (ix != 0) {
			_EXCEPTIONT("Invalid value index.");
		}
		char * szEnd = NULL;
		long lValue = strtol(strValue.c_str(), &szEnd, 10);
		if ((szEnd == strValue.c_str()) || (*szEnd != '\0')) {
			_EXCEPTION2("Option %s expects an integer (got \"%s\")",
				m_strName.c_str(), strValue.c_str());
		}
		m_nValue = static_cast<int>(lValue);
	}

public:
	int & m_nValue;
};

///////////////////////////////////////////////////////////////////////////////

class CommandLineArgumentDouble : public CommandLineArgument {
public:
	CommandLineArgumentDouble(
		double & ref,
		const std::string & strName,
		double dDefaultValue,
		const std::string & strDescription
	) :
		CommandLineArgument(strName, strDescription),
		m_dValue(ref)
	{
		m_dValue = dDefaultValue;
	}

	virtual int GetValueCount() const {
		return 1;
	}

	virtual std::string GetUsageValue() const {
		char szBuffer[64];
		if (fabs(m_dValue) < 1.0e6) {
			snprintf(szBuffer, 64, "<double> [%f]", m_dValue);
		} else {
			snprintf(szBuffer, 64, "<double> [%e]", m_dValue);
		}
		return std::string(szBuffer);
	}

	virtual void SetValue(
		int ix,
		const std::string & strValue
	) {
		if (ix != 0) {
			_EXCEPTIONT("Invalid value index.");
		}
		char * szEnd = NULL;
		double dValue = strtod(strValue.c_str(), &szEnd);
		if ((szEnd == strValue.c_str()) || (*szEnd != '\0')) {
			_EXCEPTION2("Option %s expects a floating point value (got \"%s\")",
				m_strName.c_str(), strValue.c_str());
		}
		m_dValue = dValue;
	}

public:
	double & m_dValue;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Begin the definition of command line parameters.
///	</summary>
#define BeginCommandLine() \
	{ bool _errorCommandLine = false; \
	  bool _invalidArgument = false; \
	  std::vector<CommandLineArgument*> _vecArguments;

#define CommandLineBool(ref, name) \
	_vecArguments.push_back( \
		new CommandLineArgumentBool(ref, name, ""));

#define CommandLineBoolD(ref, name, desc) \
	_vecArguments.push_back( \
		new CommandLineArgumentBool(ref, name, desc));

#define CommandLineString(ref, name, value) \
	_vecArguments.push_back( \
		new CommandLineArgumentString(ref, name, value, ""));

#define CommandLineStringD(ref, name, value, desc) \
	_vecArguments.push_back( \
		new CommandLineArgumentString(ref, name, value, desc));

#define CommandLineInt(ref, name, value) \
	_vecArguments.push_back( \
		new CommandLineArgumentInt(ref, name, value, ""));

#define CommandLineIntD(ref, name, value, desc) \
	_vecArguments.push_back( \
		new CommandLineArgumentInt(ref, name, value, desc));

#define CommandLineDouble(ref, name, value) \
	_vecArguments.push_back( \
		new CommandLineArgumentDouble(ref, name, value, ""));

#define CommandLineDoubleD(ref, name, value, desc) \
	_vecArguments.push_back( \
		new CommandLineArgumentDouble(ref, name, value, desc));

///	<summary>
///		Match each argv entry against the declared parameters.
///	</summary>
#define ParseCommandLine(argc, argv) \
	for (int _command = 1; _command < argc; _command++) { \
		bool _found = false; \
		for (size_t _p = 0; _p < _vecArguments.size(); _p++) { \
			if (_vecArguments[_p]->m_strName != argv[_command]) { \
				continue; \
			} \
			_found = true; \
			_vecArguments[_p]->Activate(); \
			int _nValues = _vecArguments[_p]->GetValueCount(); \
			if (_nValues >= argc - _command) { \
				Announce("Error: Insufficient values for option %s", \
					argv[_command]); \
				_errorCommandLine = true; \
				_command = argc; \
				break; \
			} \
			for (int _z = 0; _z < _nValues; _z++) { \
				_command++; \
				_vecArguments[_p]->SetValue(_z, argv[_command]); \
			} \
			break; \
		} \
		if (!_found && (_command < argc)) { \
			_invalidArgument = true; \
			Announce("ERROR: Invalid argument \"%s\"", argv[_command]); \
		} \
	}

///	<summary>
///		Print usage information; exit on error.
///	</summary>
#define PrintCommandLineUsage(argv) \
	if ((_errorCommandLine) || (_invalidArgument)) \
		Announce("\nUsage: %s <Argument List>", argv[0]); \
	Announce("Arguments:"); \
	for (size_t _p = 0; _p < _vecArguments.size(); _p++) \
		_vecArguments[_p]->PrintUsage(); \
	if ((_errorCommandLine) || (_invalidArgument)) { \
		for (size_t _p = 0; _p < _vecArguments.size(); _p++) \
			delete _vecArguments[_p]; \
		exit(-1); \
	}

///	<summary>
///		End the definition of command line parameters.
///	</summary>
#define EndCommandLine(argv) \
		PrintCommandLineUsage(argv); \
		for (size_t _p = 0; _p < _vecArguments.size(); _p++) { \
			delete _vecArguments[_p]; \
		} \
	}

///	<summary>
///		Concatenate the command line into a string.
///	</summary>
inline std::string GetCommandLineAsString(int argc, char ** argv) {
	std::string strCommandLine;
	for (int i = 0; i < argc; i++) {
		strCommandLine += argv[i];
		if (i != argc-1) {
			strCommandLine += " ";
		}
	}
	return strCommandLine;
}

///////////////////////////////////////////////////////////////////////////////

#endif

