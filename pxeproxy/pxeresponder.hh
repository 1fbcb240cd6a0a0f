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
#include <atomic>
#include <memory>
#include <string>
#include <sys/time.h>
#include <boost/noncopyable.hpp>

#include "dhcpconn.hh"
#include "firmware.hh"
#include "interfaceip.hh"
#include "machineevent.hh"
#include "proxydhcp.hh"

/** The PXE boot server on port 4011. EFI firmwares that got an offer
    without option 43 come back here with a DHCPREQUEST, and get the boot
    file name again in a DHCPACK sent straight back to them. */
class PXEResponder : public boost::noncopyable
{
public:
  PXEResponder(std::unique_ptr<DHCPConn> conn, std::shared_ptr<EventSink> events, InterfaceResolver resolver, const struct timeval& readTimeout = {1, 0});

  /** Throws NotApplicable for packets that are not PXE boot server
      requests, ValidationError for requests from firmwares we don't
      serve here */
  static Firmware validateRequest(const DHCPPacket& packet);
  [[nodiscard]] static DHCPPacket buildAck(const DHCPPacket& request, const ComboAddress& serverAddress, Firmware firmware);

  LoopOutcome handleOne();
  //! Runs until stop() or a receive failure, the latter throws NetworkError
  void serve();
  void stop()
  {
    d_stopped = true;
  }

private:
  std::unique_ptr<DHCPConn> d_conn;
  std::shared_ptr<EventSink> d_events;
  InterfaceResolver d_resolver;
  string d_fatalError;
  std::atomic<bool> d_stopped{false};
};
