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
#include <memory>
#include <utility>
#include <sys/time.h>

#include "dhcp4packet.hh"
#include "iputils.hh"
#include "sstuff.hh"

/** A socket speaking DHCP. Implementations must make a blocked recv()
    return a TimeoutException once the read timeout expires, this is how
    the servers notice they have been stopped. */
class DHCPConn
{
public:
  virtual ~DHCPConn() = default;

  /** Blocks until a packet that decodes arrives, datagrams that do not
      decode are skipped. Throws NetworkError when the socket fails or the
      arrival interface can't be determined, TimeoutException on read
      timeout. */
  std::pair<DHCPPacket, NetworkInterface> recv()
  {
    ComboAddress remote;
    return recv(remote);
  }
  //! Same as recv(), also reporting where the packet came from
  virtual std::pair<DHCPPacket, NetworkInterface> recv(ComboAddress& remote) = 0;

  //! Sends to where getTransmissionStrategy() says, out of 'itf'
  virtual void send(const DHCPPacket& packet, const NetworkInterface& itf);
  //! Throws DHCPEncodeError or NetworkError
  virtual void sendTo(const DHCPPacket& packet, const ComboAddress& dest, const NetworkInterface& itf) = 0;

  virtual void setReadTimeout(const struct timeval& timeout) = 0;
  virtual void close() = 0;
};

//! Where a reply has to go given the way it has to be transmitted
ComboAddress getSendDestination(const DHCPPacket& packet);

/** Plain UDP socket with IP_PKTINFO. Replies the RFC wants unicast to the
    hardware address are broadcast instead, this needs no raw sockets and
    every PXE ROM accepts broadcast offers. */
class UDPDHCPConn : public DHCPConn
{
public:
  explicit UDPDHCPConn(const ComboAddress& local);

  using DHCPConn::recv;
  std::pair<DHCPPacket, NetworkInterface> recv(ComboAddress& remote) override;
  void sendTo(const DHCPPacket& packet, const ComboAddress& dest, const NetworkInterface& itf) override;
  void setReadTimeout(const struct timeval& timeout) override;
  void close() override;

private:
  Socket d_socket;
  ComboAddress d_local;
};

//! Builds a connection bound to the given address and port
using DHCPConnFactory = std::function<std::unique_ptr<DHCPConn>(const ComboAddress& local)>;

std::unique_ptr<DHCPConn> makeUDPDHCPConn(const ComboAddress& local);
