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
#include <array>
#include <boost/format.hpp>

#include "logger.hh"
#include "proxydhcp.hh"
#include "pxeexception.hh"

// Raspberry Pi boards announce themselves as x86 BIOS
static const std::array<const char*, 5> s_vendorPrefixes = {"28:cd:c1:", "b8:27:eb:", "d8:3a:dd:", "dc:a6:32:", "e4:5f:01:"};

void validateClientGUID(const DHCPPacket& packet)
{
  if (!packet.options.has(DHCP_OPTION_CLIENT_GUID)) {
    return;
  }
  const auto& guid = packet.options.getBytes(DHCP_OPTION_CLIENT_GUID);
  switch (guid.size()) {
  case 0:
    // against the PXE spec, but there are ROMs out there doing this
    break;
  case 17:
    if (guid.at(0) != 0) {
      throw ValidationError("malformed client GUID (option 97), leading byte must be zero");
    }
    break;
  default:
    throw ValidationError("malformed client GUID (option 97), wrong size");
  }
}

ProxyDHCPServer::ProxyDHCPServer(std::unique_ptr<DHCPConn> conn, std::shared_ptr<BootPolicy> policy, std::shared_ptr<EventSink> events, InterfaceResolver resolver, uint16_t httpPort, const struct timeval& readTimeout) :
  d_conn(std::move(conn)), d_policy(std::move(policy)), d_events(std::move(events)), d_resolver(std::move(resolver)), d_httpPort(httpPort)
{
  d_conn->setReadTimeout(readTimeout);
}

void ProxyDHCPServer::isBootRequest(const DHCPPacket& packet)
{
  if (packet.type != DHCPMessageType::Discover) {
    throw NotApplicable("packet is " + toString(packet.type) + ", not " + toString(DHCPMessageType::Discover));
  }
  if (!packet.options.has(DHCP_OPTION_CLIENT_ARCH)) {
    throw NotApplicable("not a PXE boot request (missing option 93)");
  }
}

std::pair<Machine, Firmware> ProxyDHCPServer::classifyClient(const DHCPPacket& packet)
{
  uint16_t code = 0;
  try {
    code = packet.options.getUint16(DHCP_OPTION_CLIENT_ARCH);
  }
  catch (const DHCPOptionError& e) {
    throw ValidationError(string("malformed DHCP option 93 (required for PXE): ") + e.what());
  }

  if (code == 0) {
    for (const auto* prefix : s_vendorPrefixes) {
      if (packet.chaddr.hasPrefix(prefix)) {
        g_log << Logger::Debug << "Client " << packet.chaddr << " looks like a Raspberry Pi" << endl;
        throw ValidationError("unsupported client firmware type '0'");
      }
    }
  }

  Machine machine;
  machine.mac = packet.chaddr;
  Firmware firmware{Firmware::X86PC};
  switch (code) {
  case 0:
    machine.arch = Architecture::IA32;
    firmware = Firmware::X86PC;
    break;
  case 6:
    machine.arch = Architecture::IA32;
    firmware = Firmware::EFI32;
    break;
  case 7:
    machine.arch = Architecture::X64;
    firmware = Firmware::EFI64;
    break;
  case 9:
    machine.arch = Architecture::X64;
    firmware = Firmware::EFIBC;
    break;
  case 11:
    machine.arch = Architecture::ARM64;
    firmware = Firmware::EFIArm64;
    break;
  case 16:
    throw ValidationError("unsupported client firmware type (probably http4 x64 efi boot)");
  case 19:
    throw ValidationError("unsupported client firmware type (probably http4 arm64 efi boot)");
  default:
    g_log << Logger::Debug << packet.toDebugString() << endl;
    throw ValidationError("unsupported client firmware type '" + std::to_string(code) + "'");
  }

  // the user class only refines the firmware type, never the architecture
  if (packet.options.has(DHCP_OPTION_USER_CLASS)) {
    string userClass = packet.options.getString(DHCP_OPTION_USER_CLASS);
    // iPXE in ROM uses its own drivers, chainloading an UNDI stack won't work
    if (userClass == "iPXE" && firmware == Firmware::X86PC) {
      firmware = Firmware::X86iPXE;
    }
    // already chainloaded into our iPXE, don't loop
    if (userClass == "pixiecore") {
      firmware = Firmware::PixiecoreiPXE;
    }
  }

  validateClientGUID(packet);

  return {machine, firmware};
}

DHCPPacket ProxyDHCPServer::buildOffer(const DHCPPacket& request, const Machine& machine, const ComboAddress& serverAddress, Firmware firmware) const
{
  DHCPPacket offer;
  offer.type = DHCPMessageType::Offer;
  offer.xid = request.xid;
  offer.broadcast = true;
  offer.htype = request.htype;
  offer.chaddr = machine.mac;
  offer.giaddr = request.giaddr;
  offer.siaddr = serverAddress;
  offer.options.setIP(DHCP_OPTION_SERVER, serverAddress);
  offer.options.set(DHCP_OPTION_CLASS_IDENTIFIER, PXE_VENDOR_CLASS);
  if (request.options.has(DHCP_OPTION_CLIENT_GUID)) {
    offer.options.set(DHCP_OPTION_CLIENT_GUID, request.options.getBytes(DHCP_OPTION_CLIENT_GUID));
  }

  const string server = serverAddress.toString();
  const string mac = machine.mac.toString();
  const int code = getFirmwareCode(firmware);

  switch (firmware) {
  case Firmware::X86PC: {
    DHCPOptions pxe;
    pxe.setUint8(PXE_SUBOPTION_DISCOVERY_CONTROL, PXE_DISCOVERY_BYPASS);
    offer.options.set(DHCP_OPTION_VENDOR_SPECIFIC, pxe.encode(true));
    offer.sname = server;
    offer.file = (boost::format("%s/%d") % mac % code).str();
    break;
  }
  case Firmware::X86iPXE: {
    DHCPOptions pxe;
    pxe.setUint8(PXE_SUBOPTION_DISCOVERY_CONTROL, PXE_DISCOVERY_BYPASS);
    offer.options.set(DHCP_OPTION_VENDOR_SPECIFIC, pxe.encode(true));
    offer.file = (boost::format("tftp://%s/%s/%d") % server % mac % code).str();
    break;
  }
  case Firmware::EFI32:
  case Firmware::EFI64:
  case Firmware::EFIBC:
  case Firmware::EFIArm64:
    // Plenty of EFI firmwares ignore offers that bypass boot server
    // discovery. Without option 43 they all come back to us on port 4011.
    offer.sname = server;
    offer.file = (boost::format("%s/%d") % mac % code).str();
    break;
  case Firmware::PixiecoreiPXE:
    offer.file = (boost::format("http://%s:%d/_/ipxe?arch=%d&mac=%s") % server % d_httpPort % static_cast<int>(machine.arch) % mac).str();
    break;
  default:
    throw DHCPEncodeError("unknown firmware type " + std::to_string(code));
  }

  return offer;
}

LoopOutcome ProxyDHCPServer::handleOne()
{
  std::pair<DHCPPacket, NetworkInterface> received;
  try {
    received = d_conn->recv();
  }
  catch (const TimeoutException&) {
    return LoopOutcome::Continue;
  }
  catch (const NetworkError& e) {
    d_fatalError = string("receiving DHCP packet: ") + e.what();
    g_log << Logger::Error << "Error " << d_fatalError << endl;
    return LoopOutcome::Fatal;
  }
  const auto& packet = received.first;
  const auto& itf = received.second;

  try {
    isBootRequest(packet);
  }
  catch (const NotApplicable& e) {
    g_log << Logger::Debug << "Ignoring packet from " << packet.chaddr << ": " << e.reason << endl;
    return LoopOutcome::Continue;
  }

  Machine machine;
  Firmware firmware{Firmware::X86PC};
  try {
    std::tie(machine, firmware) = classifyClient(packet);
  }
  catch (const ValidationError& e) {
    g_log << Logger::Warning << "Unusable packet from " << packet.chaddr << ": " << e.reason << endl;
    return LoopOutcome::Continue;
  }

  g_log << Logger::Debug << "Got valid request to boot " << machine.mac << " (" << toString(machine.arch) << ", " << toString(firmware) << ")" << endl;

  std::optional<BootSpec> spec;
  try {
    spec = d_policy->getBootSpec(machine);
  }
  catch (const PXEProxyException& e) {
    g_log << Logger::Error << "Couldn't get boot spec for " << machine.mac << ": " << e.reason << endl;
    return LoopOutcome::Continue;
  }
  catch (const std::exception& e) {
    g_log << Logger::Error << "Couldn't get boot spec for " << machine.mac << ": " << e.what() << endl;
    return LoopOutcome::Continue;
  }
  if (!spec) {
    g_log << Logger::Debug << "No boot spec for " << machine.mac << ", ignoring boot request" << endl;
    d_events->machineEvent(machine.mac, MachineState::Ignored, "Machine should not netboot");
    return LoopOutcome::Continue;
  }

  g_log << Logger::Info << "Offering to boot " << machine.mac << endl;
  if (firmware == Firmware::PixiecoreiPXE) {
    d_events->machineEvent(machine.mac, MachineState::ProxyDHCPiPXE, "Offering to boot iPXE");
  }
  else {
    d_events->machineEvent(machine.mac, MachineState::ProxyDHCP, "Offering to boot");
  }

  ComboAddress serverAddress;
  try {
    serverAddress = d_resolver(itf);
  }
  catch (const PXEProxyException& e) {
    g_log << Logger::Error << "Want to boot " << machine.mac << " on " << itf.name << ", but couldn't get a source address: " << e.reason << endl;
    return LoopOutcome::Continue;
  }

  DHCPPacket offer;
  try {
    offer = buildOffer(packet, machine, serverAddress, firmware);
  }
  catch (const DHCPEncodeError& e) {
    g_log << Logger::Error << "Failed to construct ProxyDHCP offer for " << machine.mac << ": " << e.what() << endl;
    return LoopOutcome::Continue;
  }

  try {
    d_conn->send(offer, itf);
  }
  catch (const DHCPEncodeError& e) {
    g_log << Logger::Error << "Failed to send ProxyDHCP offer for " << machine.mac << ": " << e.what() << endl;
  }
  catch (const NetworkError& e) {
    g_log << Logger::Error << "Failed to send ProxyDHCP offer for " << machine.mac << ": " << e.what() << endl;
  }
  return LoopOutcome::Continue;
}

void ProxyDHCPServer::serve()
{
  while (!d_stopped) {
    if (handleOne() == LoopOutcome::Fatal) {
      d_conn->close();
      throw NetworkError(d_fatalError);
    }
  }
  d_conn->close();
}
