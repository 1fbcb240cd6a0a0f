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

#include <array>
#include <iomanip>
#include <mutex>
#include <time.h>

#include "logger.hh"
#include "macaddress.hh"
#include "misc.hh"
#include "namespaces.hh"

thread_local Logger::PerThread Logger::t_perThread;

Logger& getLogger()
{
  /* The servers log from the moment their threads start, and the first
     log line can come from any of them. A function-level static is
     initialized exactly once, by whoever gets here first. */
  static Logger log("", LOG_DAEMON);
  return log;
}

static const std::array<std::pair<Logger::Urgency, const char*>, 9> s_urgencyNames = {{
  {Logger::All, "all"},
  {Logger::Alert, "alert"},
  {Logger::Critical, "critical"},
  {Logger::Error, "error"},
  {Logger::Warning, "warning"},
  {Logger::Notice, "notice"},
  {Logger::Info, "info"},
  {Logger::Debug, "debug"},
  {Logger::None, "none"},
}};

string Logger::toString(Urgency u)
{
  for (const auto& entry : s_urgencyNames) {
    if (entry.first == u) {
      return entry.second;
    }
  }
  return std::to_string(static_cast<int>(u));
}

std::optional<Logger::Urgency> Logger::parseUrgency(const string& str)
{
  const string lower = toLower(str);
  for (const auto& entry : s_urgencyNames) {
    if (lower == entry.second) {
      return entry.first;
    }
  }
  if (lower.empty() || lower.find_first_not_of("0123456789") != string::npos || lower.size() > 5) {
    return std::nullopt;
  }
  auto level = std::stoi(lower);
  if (level > LOG_DEBUG && level != All) {
    return std::nullopt;
  }
  return static_cast<Urgency>(level);
}

string Logger::makeConsoleLine(const string& msg, Urgency u, const string& component) const
{
  ostringstream line;
  if (d_timestamps) {
    std::array<char, 50> buffer{};
    struct tm tm;
    time_t t = time(nullptr);
    localtime_r(&t, &tm);
    if (strftime(buffer.data(), buffer.size(), "%b %d %H:%M:%S ", &tm) != 0) {
      line << buffer.data();
    }
  }

  if (d_prefixed) {
    line << "msg=" << std::quoted(msg) << " prio=" << std::quoted(toString(u));
    if (!component.empty()) {
      line << " comp=" << std::quoted(component);
    }
  }
  else {
    if (!component.empty()) {
      line << "[" << component << "] ";
    }
    line << msg;
  }
  line << endl;
  return line.str();
}

void Logger::log(const string& msg, Urgency u) noexcept
{
  const string& component = getPerThread().d_component;

  if (u <= consoleUrgency) {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    // one << for the whole line, so it ends up in a single write
    clog << makeConsoleLine(msg, u, component) << std::flush;
  }
  if (u <= d_loglevel && !d_disableSyslog) {
    if (component.empty()) {
      syslog(u, "%s", msg.c_str());
    }
    else {
      syslog(u, "[%s] %s", component.c_str(), msg.c_str());
    }
  }
}

void Logger::setLoglevel(Urgency u)
{
  d_loglevel = u;
}

void Logger::toConsole(Urgency u)
{
  consoleUrgency = u;
}

void Logger::setThreadComponent(const string& component)
{
  getPerThread().d_component = component;
}

void Logger::open()
{
  if (opened)
    closelog();
  openlog(name.c_str(), flags, d_facility);
  opened = true;
}

void Logger::setName(const string& _name)
{
  name = _name;
  open();
}

Logger::Logger(string n, int facility) :
  name(std::move(n)), flags(LOG_PID | LOG_NDELAY), d_facility(facility)
{
  open();
}

Logger& Logger::operator<<(Urgency u)
{
  getPerThread().d_urgency = u;
  return *this;
}

Logger::PerThread& Logger::getPerThread()
{
  return t_perThread;
}

Logger& Logger::operator<<(const string& s)
{
  getPerThread().d_output.append(s);
  return *this;
}

Logger& Logger::operator<<(const char* s)
{
  *this << string(s);
  return *this;
}

Logger& Logger::operator<<(ostream& (&)(ostream&))
{
  PerThread& pt = getPerThread();

  log(pt.d_output, pt.d_urgency);
  pt.d_output.clear();
  pt.d_urgency = Info;
  return *this;
}

Logger& Logger::operator<<(const ComboAddress& ca)
{
  *this << ca.toLogString();
  return *this;
}

Logger& Logger::operator<<(const MACAddress& mac)
{
  *this << mac.toString();
  return *this;
}
