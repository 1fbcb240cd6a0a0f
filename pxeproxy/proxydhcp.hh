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
#include <utility>
#include <sys/time.h>
#include <boost/noncopyable.hpp>

#include "bootpolicy.hh"
#include "dhcpconn.hh"
#include "firmware.hh"
#include "interfaceip.hh"
#include "machineevent.hh"

//! What the receive loop does after one packet
enum class LoopOutcome
{
  Continue,
  Fatal
};

static const char* const PXE_VENDOR_CLASS = "PXEClient";

/** Option 97 must be absent, empty, or 17 bytes starting with a zero type
    byte. Throws ValidationError. */
void validateClientGUID(const DHCPPacket& packet);

/** Answers PXE DHCPDISCOVERs with a ProxyDHCP offer telling the client
    where to find its second stage loader. Never hands out addresses.

    Packets are handled one at a time. Everything that goes wrong with a
    single packet is logged and the packet dropped, only a failing socket
    ends serve(). */
class ProxyDHCPServer : public boost::noncopyable
{
public:
  ProxyDHCPServer(std::unique_ptr<DHCPConn> conn, std::shared_ptr<BootPolicy> policy, std::shared_ptr<EventSink> events, InterfaceResolver resolver, uint16_t httpPort, const struct timeval& readTimeout = {1, 0});

  //! Throws NotApplicable unless this is a DHCPDISCOVER with option 93
  static void isBootRequest(const DHCPPacket& packet);
  //! Throws ValidationError for clients we can't boot
  static std::pair<Machine, Firmware> classifyClient(const DHCPPacket& packet);
  //! Throws DHCPEncodeError when 'firmware' is not something we offer for
  [[nodiscard]] DHCPPacket buildOffer(const DHCPPacket& request, const Machine& machine, const ComboAddress& serverAddress, Firmware firmware) const;

  //! Receives and answers a single packet
  LoopOutcome handleOne();
  //! Runs until stop() or a receive failure, the latter throws NetworkError
  void serve();
  //! Makes serve() return within one read timeout, may be called from any thread
  void stop()
  {
    d_stopped = true;
  }

private:
  std::unique_ptr<DHCPConn> d_conn;
  std::shared_ptr<BootPolicy> d_policy;
  std::shared_ptr<EventSink> d_events;
  InterfaceResolver d_resolver;
  string d_fatalError;
  std::atomic<bool> d_stopped{false};
  const uint16_t d_httpPort;
};
