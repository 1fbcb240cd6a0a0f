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
#include <functional>
#include <vector>

#include "iputils.hh"

/** Picks the address we advertise as the server identity from the
    addresses of an interface. Global unicast first, then link-local, then
    loopback. Only IPv4 is considered. Throws NoAddressError. */
ComboAddress pickInterfaceAddress(const std::vector<ComboAddress>& addresses);

//! pickInterfaceAddress() on what getifaddrs(3) reports for the interface
ComboAddress resolveInterfaceAddress(const NetworkInterface& itf);

using InterfaceResolver = std::function<ComboAddress(const NetworkInterface&)>;
