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

#include "macaddress.hh"
#include "pxeexception.hh"

static int hexValue(char chr)
{
  if (chr >= '0' && chr <= '9') {
    return chr - '0';
  }
  if (chr >= 'a' && chr <= 'f') {
    return chr - 'a' + 10;
  }
  if (chr >= 'A' && chr <= 'F') {
    return chr - 'A' + 10;
  }
  return -1;
}

// reads two hex digits at pos
static bool readHexByte(const string& str, size_t pos, uint8_t& out)
{
  if (pos + 2 > str.size()) {
    return false;
  }
  int high = hexValue(str.at(pos));
  int low = hexValue(str.at(pos + 1));
  if (high < 0 || low < 0) {
    return false;
  }
  out = static_cast<uint8_t>((high << 4) | low);
  return true;
}

MACAddress MACAddress::parse(const string& str)
{
  auto invalid = [&str]() {
    return PXEProxyException("invalid MAC address '" + str + "'");
  };

  if (str.size() < 14) {
    throw invalid();
  }

  string raw;
  if (str.at(2) == ':' || str.at(2) == '-') {
    // xx:xx:xx:xx:xx:xx, every group is 3 chars but the last one
    if ((str.size() + 1) % 3 != 0) {
      throw invalid();
    }
    size_t count = (str.size() + 1) / 3;
    if (count != 6 && count != 8 && count != 20) {
      throw invalid();
    }
    const char sep = str.at(2);
    for (size_t idx = 0; idx < count; idx++) {
      size_t pos = idx * 3;
      uint8_t byte = 0;
      if (!readHexByte(str, pos, byte)) {
        throw invalid();
      }
      if (idx + 1 < count && str.at(pos + 2) != sep) {
        throw invalid();
      }
      raw.push_back(static_cast<char>(byte));
    }
  }
  else if (str.at(4) == '.') {
    // xxxx.xxxx.xxxx, every group is 5 chars but the last one
    if ((str.size() + 1) % 5 != 0) {
      throw invalid();
    }
    size_t count = 2 * (str.size() + 1) / 5;
    if (count != 6 && count != 8 && count != 20) {
      throw invalid();
    }
    for (size_t group = 0; group < count / 2; group++) {
      size_t pos = group * 5;
      uint8_t first = 0;
      uint8_t second = 0;
      if (!readHexByte(str, pos, first) || !readHexByte(str, pos + 2, second)) {
        throw invalid();
      }
      if (group + 1 < count / 2 && str.at(pos + 4) != '.') {
        throw invalid();
      }
      raw.push_back(static_cast<char>(first));
      raw.push_back(static_cast<char>(second));
    }
  }
  else {
    throw invalid();
  }

  return MACAddress(raw);
}

string MACAddress::toString() const
{
  static const char* hexDigits = "0123456789abcdef";
  string ret;
  ret.reserve(d_raw.size() * 3);
  for (size_t idx = 0; idx < d_raw.size(); idx++) {
    if (idx > 0) {
      ret.push_back(':');
    }
    auto byte = static_cast<uint8_t>(d_raw.at(idx));
    ret.push_back(hexDigits[byte >> 4]);
    ret.push_back(hexDigits[byte & 0x0f]);
  }
  return ret;
}
