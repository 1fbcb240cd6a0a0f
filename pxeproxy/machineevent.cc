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

#include "logger.hh"
#include "machineevent.hh"

string toString(MachineState state)
{
  switch (state) {
  case MachineState::Ignored:
    return "ignored";
  case MachineState::ProxyDHCP:
    return "proxydhcp";
  case MachineState::ProxyDHCPiPXE:
    return "proxydhcp-ipxe";
  case MachineState::PXE:
    return "pxe";
  case MachineState::TFTP:
    return "tftp";
  }
  return "unknown";
}

void LoggerEventSink::machineEvent(const MACAddress& mac, MachineState state, const string& message)
{
  g_log << Logger::Info << "Machine " << mac << " [" << toString(state) << "]: " << message << endl;
}

void LoggerEventSink::transferFailed(const ComboAddress& peer, const string& path, const string& error)
{
  g_log << Logger::Info << "Transfer of \"" << path << "\" to " << peer << " failed: " << error << endl;
}
