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
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

#include "namespaces.hh"

/** A link-layer hardware address, as carried in the chaddr field of a BOOTP
    packet. Ethernet addresses are 6 bytes, but InfiniBand and friends use
    up to 20, so the length is explicit. */
class MACAddress
{
public:
  MACAddress() = default;
  //! raw bytes, no textual parsing
  explicit MACAddress(string raw) :
    d_raw(std::move(raw))
  {
  }

  /** Parses the usual textual notations:
      \code
      00:00:5e:00:53:01
      00-00-5e-00-53-01
      0000.5e00.5301
      \endcode
      for 6, 8 and 20 byte addresses. Throws PXEProxyException on anything else. */
  static MACAddress parse(const string& str);

  //! lower case hex bytes separated by ':'
  [[nodiscard]] string toString() const;

  [[nodiscard]] bool hasPrefix(const string& textPrefix) const
  {
    return toString().compare(0, textPrefix.size(), textPrefix) == 0;
  }

  [[nodiscard]] const string& getRaw() const
  {
    return d_raw;
  }
  [[nodiscard]] size_t size() const
  {
    return d_raw.size();
  }
  [[nodiscard]] bool empty() const
  {
    return d_raw.empty();
  }

  bool operator==(const MACAddress& rhs) const
  {
    return d_raw == rhs.d_raw;
  }
  bool operator!=(const MACAddress& rhs) const
  {
    return d_raw != rhs.d_raw;
  }
  bool operator<(const MACAddress& rhs) const
  {
    return d_raw < rhs.d_raw;
  }

private:
  string d_raw;
};

inline std::ostream& operator<<(std::ostream& ostr, const MACAddress& mac)
{
  ostr << mac.toString();
  return ostr;
}
