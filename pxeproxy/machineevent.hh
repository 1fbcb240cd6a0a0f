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
#include <string>

#include "iputils.hh"
#include "macaddress.hh"
#include "namespaces.hh"

//! Where a machine is in the boot process
enum class MachineState
{
  Ignored, // the boot policy said no
  ProxyDHCP, // offer about to be sent
  ProxyDHCPiPXE, // offer to our own iPXE
  PXE, // boot server ACK sent
  TFTP // second stage transferred
};

string toString(MachineState state);

//! Receives machine progress events, must be safe to call from several threads
class EventSink
{
public:
  virtual ~EventSink() = default;
  virtual void machineEvent(const MACAddress& mac, MachineState state, const string& message) = 0;
  //! A TFTP transfer that did not complete, 'path' is what the client asked for and need not name a machine
  virtual void transferFailed(const ComboAddress& peer, const string& path, const string& error) = 0;
};

//! Sends events to g_log
class LoggerEventSink : public EventSink
{
public:
  void machineEvent(const MACAddress& mac, MachineState state, const string& message) override;
  void transferFailed(const ComboAddress& peer, const string& path, const string& error) override;
};
