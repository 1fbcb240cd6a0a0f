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

#include <optional>
#include <string>
#include <iostream>
#include <sstream>
#include <syslog.h>

#include "namespaces.hh"
#include "iputils.hh"

class MACAddress;

/** The Logger class can be used to log messages to the console and to
    syslog. Every thread assembles its own line, so the DHCP, PXE and TFTP
    threads don't garble each other's output. */
class Logger
{
public:
  Logger(string, int facility = LOG_DAEMON); //!< pass the identification you wish to appear in the log

  //! The urgency of a log message
  enum Urgency
  {
    All = 32767,
    Alert = LOG_ALERT,
    Critical = LOG_CRIT,
    Error = LOG_ERR,
    Warning = LOG_WARNING,
    Notice = LOG_NOTICE,
    Info = LOG_INFO,
    Debug = LOG_DEBUG,
    None = -1
  };

  static string toString(Urgency u);
  //! Accepts a syslog priority number or a name like "info", std::nullopt for anything else
  static std::optional<Urgency> parseUrgency(const string& str);

  /** Log a message.
      \param msg Message you wish to log
      \param u Urgency of the message you wish to log
  */
  void log(const string& msg, Urgency u = Notice) noexcept;

  void setName(const string&);

  //! set lower limit of urgency needed for console display. Messages of this urgency, and higher, will be displayed
  void toConsole(Urgency);
  void setLoglevel(Urgency);

  void disableSyslog(bool d)
  {
    d_disableSyslog = d;
  }

  void setTimestamps(bool t)
  {
    d_timestamps = t;
  }

  //! msg="..." prio="..." comp="..." console lines, for log collectors
  void setPrefixed(bool p)
  {
    d_prefixed = p;
  }

  //! Tags every line the calling thread logs from now on, e.g. "pxe/tftp"
  void setThreadComponent(const string& component);

  /** Use this to stream to your log, like this:
      \code
      g_log<<"Offering to boot "<<mac<<endl; // logged at default loglevel (Info)
      g_log<<Logger::Warning<<"No iPXE images configured"<<endl; // Logged as a warning
      \endcode
  */
  Logger& operator<<(const char* s);
  Logger& operator<<(const string& s); //!< log a string
  Logger& operator<<(const ComboAddress&); //!< log an address
  Logger& operator<<(const MACAddress&); //!< log a hardware address
  Logger& operator<<(Urgency); //!< set the urgency, << style

  // Using const & since otherwise values induce (illegal) copies
  template <typename T>
  Logger& operator<<(const T& i)
  {
    ostringstream tmp;
    tmp << i;
    *this << tmp.str();
    return *this;
  }

  Logger& operator<<(std::ostream& (&)(std::ostream&)); //!< this is to recognise the endl, and to commit the log

private:
  struct PerThread
  {
    string d_output;
    string d_component;
    Urgency d_urgency{Info};
  };
  PerThread& getPerThread();
  void open();
  string makeConsoleLine(const string& msg, Urgency u, const string& component) const;

  static thread_local PerThread t_perThread;
  string name;
  int flags;
  int d_facility;
  Urgency d_loglevel{Logger::None};
  Urgency consoleUrgency{Error};
  bool opened{false};
  bool d_disableSyslog{false};
  bool d_timestamps{true};
  bool d_prefixed{false};
};

Logger& getLogger();

#define g_log getLogger()

#ifdef VERBOSELOG
#define DLOG(x) x
#else
#define DLOG(x) ((void)0)
#endif
