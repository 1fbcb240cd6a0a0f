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
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>

#include "misc.hh"
#include "pxeexception.hh"

auto pxeproxy::getMessageFromErrno(const int errnum) -> std::string
{
  const size_t errLen = 2048;
  std::string errMsgData{};
  errMsgData.resize(errLen);

  const char* errMsg = nullptr;
#ifdef STRERROR_R_CHAR_P
  errMsg = strerror_r(errnum, errMsgData.data(), errMsgData.length());
#else
  // This can fail, and when it does, it sets errno. We ignore that and
  // set our own error message instead.
  int res = strerror_r(errnum, errMsgData.data(), errMsgData.length());
  errMsg = errMsgData.c_str();
  if (res != 0) {
    errMsg = "Unknown (the exact error could not be retrieved)";
  }
#endif

  // We make a copy here because `strerror_r()` might return a static
  // immutable buffer for an error message.
  std::string message{errMsg};
  return message;
}

string readFileToString(const string& fname)
{
  std::ifstream ifs(fname, std::ios::binary);
  if (!ifs) {
    throw PXEProxyException("Unable to open '" + fname + "': " + stringerror());
  }
  std::ostringstream contents;
  contents << ifs.rdbuf();
  if (ifs.bad()) {
    throw PXEProxyException("Error reading '" + fname + "': " + stringerror());
  }
  return contents.str();
}

void toLowerInPlace(string& str)
{
  for (auto& chr : str) {
    chr = static_cast<char>(tolower(static_cast<unsigned char>(chr)));
  }
}

const string toLower(const string& upper)
{
  string reply(upper);
  toLowerInPlace(reply);
  return reply;
}

bool setBroadcast(int sock)
{
  int tmp = 1;
  return setsockopt(sock, SOL_SOCKET, SO_BROADCAST, (char*)&tmp, static_cast<unsigned>(sizeof tmp)) == 0;
}

bool setReceiveTimeout(int sock, const struct timeval& timeout)
{
  return setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) == 0;
}

bool setCloseOnExec(int sock)
{
  int flags = fcntl(sock, F_GETFD, 0);
  if (flags < 0 || fcntl(sock, F_SETFD, flags | FD_CLOEXEC) < 0)
    return false;
  return true;
}
