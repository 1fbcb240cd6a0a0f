/*
 * This file is part of pxeproxy.
 * Copyright -- pxeproxy contributors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of version 2 of the GNU General Public License as
 * published by the Free Software Foundation.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */
#pragma once
#include <map>
#include <string>

#include "misc.hh"
#include "pxeexception.hh"
#include "namespaces.hh"

using ArgException = PXEProxyException;

/** Settings, from the command line and from a configuration file.

    Every setting is declared with its help text and default before
    anything is parsed:
    \code
    ::arg().set("tftp-port", "Port to listen on for TFTP read requests") = "69";
    ::arg().setSwitch("disable-syslog", "Disable logging to syslog") = "no";
    \endcode

    The command line takes --name=value, --name+=value to append to a
    comma separated list, and --name for switches. "--name value" is not
    supported. Configuration files hold name=value lines, '#' starts a
    comment and a trailing backslash continues a line. */
class ArgvMap
{
public:
  ArgvMap();
  //! Unknown settings throw ArgException unless 'lax'
  void parse(int& argc, char** argv, bool lax = false);
  void laxParse(int& argc, char** argv)
  {
    parse(argc, argv, true);
  }

  //! false if the file can't be opened
  bool file(const string& fname, bool lax = false);
  bool parmIsset(const string& var); //!< Checks if a parameter is declared
  bool mustDo(const string& var); //!< true unless a switch is "no" or "off"
  int asNum(const string& arg, int def = 0); //!< a setting as a number, 'def' if it is empty
  string& set(const string&); //!< Gives a writable reference and allocates space for it
  string& set(const string&, const string&); //!< Declares a setting with its help text
  string& setSwitch(const string&, const string&); //!< Declares a yes/no switch
  string helpstring(string prefix = ""); //!< generates the --help
  bool isEmpty(const string& arg); //!< true for settings without a value

  const string& operator[](const string&); //!< the value of a declared setting, throws ArgException otherwise

private:
  void parseOne(const string& arg, bool lax = false);
  map<string, string> d_params;
  map<string, string> helpmap;
  map<string, string> d_typeMap;
};

extern ArgvMap& arg();
