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
#ifdef HAVE_CONFIG_H
#include "config.h"
#endif
#include <cctype>
#include <boost/algorithm/string.hpp>

#include "arguments.hh"

string& ArgvMap::set(const string& var)
{
  return d_params[var];
}

bool ArgvMap::mustDo(const string& var)
{
  return ((*this)[var] != "no") && ((*this)[var] != "off");
}

string& ArgvMap::set(const string& var, const string& help)
{
  helpmap[var] = help;
  d_typeMap[var] = "Parameter";
  return set(var);
}

string& ArgvMap::setSwitch(const string& var, const string& help)
{
  helpmap[var] = help;
  d_typeMap[var] = "Switch";
  return set(var);
}

bool ArgvMap::isEmpty(const string& arg)
{
  if (!parmIsset(arg))
    return true;
  return d_params[arg].empty();
}

string ArgvMap::helpstring(string prefix)
{
  if (prefix == "no")
    prefix = "";

  string help;

  for (const auto& helpitem : helpmap) {
    if (!prefix.empty() && helpitem.first.find(prefix) != 0) // only print items with prefix
      continue;

    help += "  --";
    help += helpitem.first;

    string type = d_typeMap[helpitem.first];

    if (type == "Parameter")
      help += "=...";
    else if (type == "Switch") {
      help += " | --" + helpitem.first + "=yes";
      help += " | --" + helpitem.first + "=no";
    }

    help += "\n\t";
    help += helpitem.second;
    help += "\n";
  }
  return help;
}

bool ArgvMap::parmIsset(const string& var)
{
  return d_params.find(var) != d_params.end();
}

void ArgvMap::parseOne(const string& arg, bool lax)
{
  string var;
  string val;
  string::size_type pos = 0;
  bool incremental = false;

  if (arg.find("--") == 0 && (pos = arg.find("+=")) != string::npos) // this is a --port+=25 case
  {
    var = arg.substr(2, pos - 2);
    val = arg.substr(pos + 2);
    incremental = true;
  }
  else if (arg.find("--") == 0 && (pos = arg.find('=')) != string::npos) // this is a --port=25 case
  {
    var = arg.substr(2, pos - 2);
    val = arg.substr(pos + 1);
  }
  else if (arg.find("--") == 0 && (arg.find('=') == string::npos)) // this is a --daemon case
  {
    var = arg.substr(2);
    val = "";
  }
  else if (arg[0] == '-' && arg.length() > 1) {
    var = arg.substr(1);
    val = "";
  }
  else // command
    return;

  boost::trim(var);
  boost::trim(val);

  if (!var.empty() && parmIsset(var)) {
    if (incremental) {
      if (d_params[var].empty()) {
        d_params[var] = val;
      }
      else {
        d_params[var] += ", " + val;
      }
    }
    else {
      d_params[var] = val;
    }
  }
  else if (!lax) {
    throw ArgException("Trying to set unknown parameter '" + var + "'");
  }
}

const string& ArgvMap::operator[](const string& arg)
{
  if (!parmIsset(arg))
    throw ArgException(string("Undefined but needed argument: '") + arg + "'");

  return d_params[arg];
}

int ArgvMap::asNum(const string& arg, int def)
{
  int retval = 0;
  const char* cptr_orig;
  char* cptr_ret = nullptr;

  if (!parmIsset(arg))
    throw ArgException(string("Undefined but needed argument: '") + arg + "'");

  // use default for empty values
  if (d_params[arg].empty())
    return def;

  cptr_orig = d_params[arg].c_str();
  retval = static_cast<int>(strtol(cptr_orig, &cptr_ret, 0));
  if (!retval && cptr_ret == cptr_orig)
    throw ArgException("'" + arg + "' value '" + string(cptr_orig) + string("' is not a valid number"));

  return retval;
}

ArgvMap::ArgvMap() = default;

void ArgvMap::parse(int& argc, char** argv, bool lax)
{
  for (int i = 1; i < argc; i++) {
    parseOne(argv[i], lax);
  }
}

bool ArgvMap::file(const string& fname, bool lax)
{
  ifstream configFileStream(fname);
  if (!configFileStream) {
    return false;
  }

  // we'll take the previous line and glue it to the next line if it ends with a backslash
  string line;
  string pline;

  while (getline(configFileStream, pline)) {
    boost::trim_right(pline);

    if (!pline.empty() && pline[pline.size() - 1] == '\\') {
      line += pline.substr(0, pline.length() - 1);
      continue;
    }

    line += pline;

    // strip everything after a #
    string::size_type pos = line.find('#');
    if (pos != string::npos) {
      // make sure it's either first char or has whitespace before
      if (pos == 0 || (std::isspace(line[pos - 1]) != 0)) {
        line = line.substr(0, pos);
      }
    }

    // strip trailing spaces
    boost::trim_right(line);

    // strip leading spaces
    pos = line.find_first_not_of(" \t\r\n");
    if (pos != string::npos) {
      line = line.substr(pos);
    }

    if (!line.empty()) {
      parseOne(string("--") + line, lax);
    }
    line = "";
  }

  return true;
}
