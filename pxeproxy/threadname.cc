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
#include <string.h>

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include <pthread.h>

#include "logger.hh"
#include "misc.hh"
#include "threadname.hh"

void setThreadName(const std::string& threadName)
{
  g_log.setThreadComponent(threadName);

  // the kernel keeps 15 characters plus the terminator, and refuses longer names
  const std::string kernelName = threadName.substr(0, 15);
  int retval = 0;

#ifdef HAVE_PTHREAD_SETNAME_NP_2
  retval = pthread_setname_np(pthread_self(), kernelName.c_str());
#endif
#ifdef HAVE_PTHREAD_SETNAME_NP_1
  retval = pthread_setname_np(kernelName.c_str());
#endif

  if (retval != 0) {
    g_log << Logger::Warning << "Could not set thread name " << kernelName << ": " << stringerror(retval) << endl;
  }
}
