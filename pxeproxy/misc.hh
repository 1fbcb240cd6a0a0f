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
#include <cerrno>
#include <cinttypes>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <sys/time.h>
#include <sys/types.h>

#include "namespaces.hh"

namespace pxeproxy
{
//! strerror_r() text for errnum, whichever strerror_r flavour libc has
auto getMessageFromErrno(int errnum) -> std::string;
}

string readFileToString(const string& fname);

template <typename Container>
void stringtok(Container& container, string const& in,
               const char* const delimiters = " \t\n")
{
  const string::size_type len = in.length();
  string::size_type i = 0;

  while (i < len) {
    // eat leading whitespace
    i = in.find_first_not_of(delimiters, i);
    if (i == string::npos)
      return; // nothing left but white space

    // find the end of the token
    string::size_type j = in.find_first_of(delimiters, i);

    // push token
    if (j == string::npos) {
      container.push_back(in.substr(i));
      return;
    }
    else
      container.push_back(in.substr(i, j - i));

    // set up for next loop
    i = j + 1;
  }
}

void toLowerInPlace(string& str);
const string toLower(const string& upper);

inline string stringerror(int err = errno)
{
  return pxeproxy::getMessageFromErrno(err);
}

[[noreturn]] inline void unixDie(const string& why)
{
  throw runtime_error(why + ": " + stringerror(errno));
}

//! Allows sending to 255.255.255.255
bool setBroadcast(int sock);
//! Makes blocking reads on sock give up after timeout
bool setReceiveTimeout(int sock, const struct timeval& timeout);
bool setCloseOnExec(int sock);

namespace pxeproxy
{
/** Converts between integer types of the same signedness, throwing
    std::out_of_range when the value does not fit. */
template <typename T, typename F>
auto checked_conv(F from) -> T
{
  static_assert(std::numeric_limits<F>::is_integer, "checked_conv: The `F` type must be an integer");
  static_assert(std::numeric_limits<T>::is_integer, "checked_conv: The `T` type must be an integer");
  static_assert((std::numeric_limits<F>::is_signed && std::numeric_limits<T>::is_signed) || (!std::numeric_limits<F>::is_signed && !std::numeric_limits<T>::is_signed),
                "checked_conv: The `T` and `F` types must either both be signed or unsigned");

  constexpr auto tMin = std::numeric_limits<T>::min();
  if constexpr (std::numeric_limits<F>::min() != tMin) {
    if (from < tMin) {
      throw std::out_of_range(std::to_string(from) + " is below " + std::to_string(tMin));
    }
  }

  constexpr auto tMax = std::numeric_limits<T>::max();
  if constexpr (std::numeric_limits<F>::max() != tMax) {
    if (from > tMax) {
      throw std::out_of_range(std::to_string(from) + " is above " + std::to_string(tMax));
    }
  }

  return static_cast<T>(from);
}

/** std::stoll()/std::stoull() followed by checked_conv<T>(). Throws what
    they throw, so std::invalid_argument and std::out_of_range. An empty
    string converts to 0. */
template <typename T>
auto checked_stoi(const std::string& str, size_t* idx = nullptr, int base = 10) -> T
{
  static_assert(std::numeric_limits<T>::is_integer, "checked_stoi: The `T` type must be an integer");

  if (str.empty()) {
    if (idx != nullptr) {
      *idx = 0;
    }

    return 0;
  }

  if constexpr (std::is_unsigned_v<T>) {
    return pxeproxy::checked_conv<T>(std::stoull(str, idx, base));
  }
  else {
    return pxeproxy::checked_conv<T>(std::stoll(str, idx, base));
  }
}
}
