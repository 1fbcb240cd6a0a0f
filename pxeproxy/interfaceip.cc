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

#include "interfaceip.hh"
#include "pxeexception.hh"

ComboAddress pickInterfaceAddress(const std::vector<ComboAddress>& addresses)
{
  const std::vector<std::function<bool(const ComboAddress&)>> tiers = {
    [](const ComboAddress& addr) { return addr.isGlobalUnicast(); },
    [](const ComboAddress& addr) { return addr.isLinkLocal(); },
    [](const ComboAddress& addr) { return addr.isLoopback(); },
  };

  for (const auto& tier : tiers) {
    for (const auto& addr : addresses) {
      if (addr.isIPv4() && tier(addr)) {
        ComboAddress ret(addr);
        ret.setPort(0);
        return ret;
      }
    }
  }
  throw NoAddressError("no usable unicast address configured");
}

ComboAddress resolveInterfaceAddress(const NetworkInterface& itf)
{
  try {
    return pickInterfaceAddress(getListOfAddressesOfNetworkInterface(itf.name));
  }
  catch (const NoAddressError& e) {
    throw NoAddressError(e.reason + " on interface " + itf.name);
  }
}
