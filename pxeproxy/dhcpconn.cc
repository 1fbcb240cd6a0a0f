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

#include "dhcpconn.hh"
#include "logger.hh"

ComboAddress getSendDestination(const DHCPPacket& packet)
{
  switch (packet.getTransmissionStrategy()) {
  case TransmissionStrategy::RelayAddress: {
    ComboAddress dest(packet.giaddr);
    dest.setPort(BOOTP_SERVER_PORT);
    return dest;
  }
  case TransmissionStrategy::ClientAddress: {
    ComboAddress dest(packet.ciaddr);
    dest.setPort(BOOTP_CLIENT_PORT);
    return dest;
  }
  case TransmissionStrategy::Broadcast:
  case TransmissionStrategy::HardwareAddress:
    break;
  }
  return ComboAddress("255.255.255.255", BOOTP_CLIENT_PORT);
}

void DHCPConn::send(const DHCPPacket& packet, const NetworkInterface& itf)
{
  sendTo(packet, getSendDestination(packet), itf);
}

UDPDHCPConn::UDPDHCPConn(const ComboAddress& local) :
  d_socket(AF_INET, SOCK_DGRAM, 0), d_local(local)
{
  if (!local.isIPv4()) {
    throw NetworkError("DHCP needs an IPv4 listen address, not " + local.toString());
  }
  d_socket.enableBroadcast();
  d_socket.enablePacketInfo();
  d_socket.bind(local, true);
}

std::pair<DHCPPacket, NetworkInterface> UDPDHCPConn::recv(ComboAddress& remote)
{
  string dgram;
  for (;;) {
    unsigned int itfIndex = 0;
    d_socket.recvFromWithInterface(dgram, remote, itfIndex);

    DHCPPacket packet;
    try {
      packet = DHCPPacket::decode(dgram);
    }
    catch (const DHCPDecodeError& e) {
      DLOG(g_log << Logger::Debug << "Skipping datagram from " << remote << " on " << d_local << ": " << e.what() << endl);
      continue;
    }

    if (itfIndex == 0) {
      throw NetworkError("Unable to find the interface a packet from " + remote.toStringWithPort() + " arrived on");
    }
    return {packet, getNetworkInterfaceByIndex(itfIndex)};
  }
}

void UDPDHCPConn::sendTo(const DHCPPacket& packet, const ComboAddress& dest, const NetworkInterface& itf)
{
  d_socket.sendToVia(packet.encode(), dest, itf.index);
}

void UDPDHCPConn::setReadTimeout(const struct timeval& timeout)
{
  d_socket.setReadTimeout(timeout);
}

void UDPDHCPConn::close()
{
  d_socket.close();
}

std::unique_ptr<DHCPConn> makeUDPDHCPConn(const ComboAddress& local)
{
  return std::make_unique<UDPDHCPConn>(local);
}
