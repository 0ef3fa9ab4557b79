///////////////////////////////////////////////////////////////////////////////
///
///	\file    CommandLine.h
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

#ifndef _COMMANDLINE_H_
#define _COMMANDLINE_H_

#include "Announce.h"
#include "Exception.h"
#include "STLStringHelper.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		An option of the form "--name [value]" bound to a variable of the
///		caller.  Options are registered between BeginCommandLine() and
///		EndCommandLine(), which owns and deletes them.
///	</summary>
class CommandLineArgument {
public:
	///	<summary>
	///		Constructor.
	///	</summary>
	CommandLineArgument(
		const std::string & strName,
		const std::string & strDescription
	) :
		m_strName(std::string("--") + strName),
		m_strDescription(strDescription)
	{ }

	///	<summary>
	///		Virtual destructor.
	///	</summary>
	virtual ~CommandLineArgument() {
	}

	///	<summary>
	///		Number of values following the option name (0 or 1).
	///	</summary>
	virtual int GetValueCount() const = 0;

	///	<summary>
	///		Type name and current value, as shown in the usage listing.
	///	</summary>
	virtual std::string GetUsageValue() const = 0;

	///	<summary>
	///		Called when the option name appears on the command line.
	///	</summary>
	virtual void Activate() {
	}

	///	<summary>
	///		Assign the value following the option name.
	///	</summary>
	virtual void SetValue(const std::string & strValue) {
		_EXCEPTION1("Option %s does not take a value", m_strName.c_str());
	}

	///	<summary>
	///		Print one line of the usage listing.
	///	</summary>
	void PrintUsage() const {
		Announce("  %-16s %s %s",
			m_strName.c_str(),
			GetUsageValue().c_str(),
			m_strDescription.c_str());
	}

public:
	///	<summary>
	///		Option name, including the leading "--".
	///	</summary>
	std::string m_strName;

	///	<summary>
	///		Description shown in the usage listing.
	///	</summary>
	std::string m_strDescription;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A flag; false unless it appears on the command line.
///	</summary>
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
		return std::string("<flag>");
	}

	virtual void Activate() {
		m_fValue = true;
	}

public:
	bool & m_fValue;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A string option.
///	</summary>
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

	virtual void SetValue(const std::string & strValue) {
		m_strValue = strValue;
	}

public:
	std::string & m_strValue;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A floating point option.  Values that are not numbers are
///		rejected with an Exception.
///	</summary>
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
		snprintf(szBuffer, 64, "<double> [%g]", m_dValue);
		return std::string(szBuffer);
	}

	virtual void SetValue(const std::string & strValue) {
		m_dValue = STLStringHelper::ToDouble(strValue, m_strName.c_str());
	}

public:
	double & m_dValue;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Begin the definition of command line options.
///	</summary>
#define BeginCommandLine() \
	{ bool _errorCommandLine = false; \
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

#define CommandLineDouble(ref, name, value) \
	_vecArguments.push_back( \
		new CommandLineArgumentDouble(ref, name, value, ""));

#define CommandLineDoubleD(ref, name, value, desc) \
	_vecArguments.push_back( \
		new CommandLineArgumentDouble(ref, name, value, desc));

///	<summary>
///		Match argv against the registered options.  A value may not begin
///		with "--"; negative numbers such as "-0.6" are accepted.
///	</summary>
#define ParseCommandLine(argc, argv) \
	for (int _command = 1; _command < argc; _command++) { \
		CommandLineArgument * _arg = NULL; \
		for (size_t _p = 0; _p < _vecArguments.size(); _p++) { \
			if (_vecArguments[_p]->m_strName == argv[_command]) { \
				_arg = _vecArguments[_p]; \
				break; \
			} \
		} \
		if (_arg == NULL) { \
			Announce("ERROR: Invalid argument \"%s\"", argv[_command]); \
			_errorCommandLine = true; \
			continue; \
		} \
		_arg->Activate(); \
		if (_arg->GetValueCount() == 0) { \
			continue; \
		} \
		if ((_command + 1 >= argc) || \
		    (strncmp(argv[_command + 1], "--", 2) == 0) \
		) { \
			Announce("ERROR: Missing value for option %s", argv[_command]); \
			_errorCommandLine = true; \
			continue; \
		} \
		_command++; \
		_arg->SetValue(argv[_command]); \
	}

///	<summary>
///		Print the usage listing; on error also free the options and exit.
///	</summary>
#define PrintCommandLineUsage(argv) \
	if (_errorCommandLine) { \
		Announce("\nUsage: %s <Argument List>", argv[0]); \
	} \
	Announce("Arguments:"); \
	for (size_t _p = 0; _p < _vecArguments.size(); _p++) { \
		_vecArguments[_p]->PrintUsage(); \
	} \
	if (_errorCommandLine) { \
		for (size_t _p = 0; _p < _vecArguments.size(); _p++) { \
			delete _vecArguments[_p]; \
		} \
		exit(-1); \
	}

///	<summary>
///		End the definition of command line options.
///	</summary>
#define EndCommandLine(argv) \
		PrintCommandLineUsage(argv); \
		for (size_t _p = 0; _p < _vecArguments.size(); _p++) { \
			delete _vecArguments[_p]; \
		} \
	}

///	<summary>
///		Concatenate the command line into a single string.
///	</summary>
inline std::string GetCommandLineAsString(int argc, char ** argv) {
	std::string strCommandLine;
	for (int i = 0; i < argc; i++) {
		if (i != 0) {
			strCommandLine += " ";
		}
		strCommandLine += argv[i];
	}
	return strCommandLine;
}

///////////////////////////////////////////////////////////////////////////////

#endif

