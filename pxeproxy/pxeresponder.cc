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
#include <boost/format.hpp>

#include "logger.hh"
#include "pxeexception.hh"
#include "pxeresponder.hh"

PXEResponder::PXEResponder(std::unique_ptr<DHCPConn> conn, std::shared_ptr<EventSink> events, InterfaceResolver resolver, const struct timeval& readTimeout) :
  d_conn(std::move(conn)), d_events(std::move(events)), d_resolver(std::move(resolver))
{
  d_conn->setReadTimeout(readTimeout);
}

Firmware PXEResponder::validateRequest(const DHCPPacket& packet)
{
  if (packet.type != DHCPMessageType::Request) {
    throw NotApplicable("packet is " + toString(packet.type) + ", not " + toString(DHCPMessageType::Request));
  }
  if (!packet.options.has(DHCP_OPTION_CLIENT_ARCH)) {
    throw NotApplicable("not a PXE boot request (missing option 93)");
  }

  uint16_t code = 0;
  try {
    code = packet.options.getUint16(DHCP_OPTION_CLIENT_ARCH);
  }
  catch (const DHCPOptionError& e) {
    throw ValidationError(string("malformed DHCP option 93 (required for PXE): ") + e.what());
  }

  Firmware firmware{Firmware::EFI64};
  switch (code) {
  case 6:
    firmware = Firmware::EFI32;
    break;
  case 7:
    firmware = Firmware::EFI64;
    break;
  case 9:
    firmware = Firmware::EFIBC;
    break;
  case 11:
    firmware = Firmware::EFIArm64;
    break;
  default:
    throw ValidationError("unsupported client firmware type '" + std::to_string(code) + "'");
  }

  validateClientGUID(packet);
  return firmware;
}

DHCPPacket PXEResponder::buildAck(const DHCPPacket& request, const ComboAddress& serverAddress, Firmware firmware)
{
  DHCPPacket ack;
  ack.type = DHCPMessageType::Ack;
  ack.xid = request.xid;
  ack.htype = request.htype;
  ack.chaddr = request.chaddr;
  ack.ciaddr = request.ciaddr;
  ack.giaddr = request.giaddr;
  ack.siaddr = serverAddress;
  ack.sname = serverAddress.toString();
  ack.file = (boost::format("%s/%d") % request.chaddr.toString() % getFirmwareCode(firmware)).str();
  ack.options.setIP(DHCP_OPTION_SERVER, serverAddress);
  ack.options.set(DHCP_OPTION_CLASS_IDENTIFIER, PXE_VENDOR_CLASS);
  if (request.options.has(DHCP_OPTION_CLIENT_GUID)) {
    ack.options.set(DHCP_OPTION_CLIENT_GUID, request.options.getBytes(DHCP_OPTION_CLIENT_GUID));
  }
  return ack;
}

LoopOutcome PXEResponder::handleOne()
{
  ComboAddress remote;
  std::pair<DHCPPacket, NetworkInterface> received;
  try {
    received = d_conn->recv(remote);
  }
  catch (const TimeoutException&) {
    return LoopOutcome::Continue;
  }
  catch (const NetworkError& e) {
    d_fatalError = string("receiving PXE packet: ") + e.what();
    g_log << Logger::Error << "Error " << d_fatalError << endl;
    return LoopOutcome::Fatal;
  }
  const auto& packet = received.first;
  const auto& itf = received.second;

  Firmware firmware{Firmware::EFI64};
  try {
    firmware = validateRequest(packet);
  }
  catch (const NotApplicable& e) {
    g_log << Logger::Debug << "Ignoring PXE packet from " << remote << " (" << packet.chaddr << "): " << e.reason << endl;
    return LoopOutcome::Continue;
  }
  catch (const ValidationError& e) {
    g_log << Logger::Warning << "Unusable PXE packet from " << remote << " (" << packet.chaddr << "): " << e.reason << endl;
    return LoopOutcome::Continue;
  }

  ComboAddress serverAddress;
  try {
    serverAddress = d_resolver(itf);
  }
  catch (const PXEProxyException& e) {
    g_log << Logger::Error << "Want to boot " << packet.chaddr << " on " << itf.name << ", but couldn't get a source address: " << e.reason << endl;
    return LoopOutcome::Continue;
  }

  d_events->machineEvent(packet.chaddr, MachineState::PXE, "Sent PXE configuration");

  try {
    d_conn->sendTo(buildAck(packet, serverAddress, firmware), remote, itf);
  }
  catch (const DHCPEncodeError& e) {
    g_log << Logger::Error << "Failed to build PXE response for " << packet.chaddr << ": " << e.what() << endl;
  }
  catch (const NetworkError& e) {
    g_log << Logger::Error << "Failed to send PXE response to " << remote << " (" << packet.chaddr << "): " << e.what() << endl;
  }
  return LoopOutcome::Continue;
}

void PXEResponder::serve()
{
  while (!d_stopped) {
    if (handleOne() == LoopOutcome::Fatal) {
      d_conn->close();
      throw NetworkError(d_fatalError);
    }
  }
  d_conn->close();
}
