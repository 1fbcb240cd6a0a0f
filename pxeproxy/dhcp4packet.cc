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
#include <sstream>
#include <boost/format.hpp>

#include "dhcp4packet.hh"

static const unsigned char vendcookie[] = {99, 130, 83, 99};

string toString(DHCPMessageType type)
{
  switch (type) {
  case DHCPMessageType::Discover:
    return "DHCPDISCOVER";
  case DHCPMessageType::Offer:
    return "DHCPOFFER";
  case DHCPMessageType::Request:
    return "DHCPREQUEST";
  case DHCPMessageType::Decline:
    return "DHCPDECLINE";
  case DHCPMessageType::Ack:
    return "DHCPACK";
  case DHCPMessageType::Nak:
    return "DHCPNAK";
  case DHCPMessageType::Release:
    return "DHCPRELEASE";
  case DHCPMessageType::Inform:
    return "DHCPINFORM";
  }
  return "DHCP type " + std::to_string(static_cast<unsigned int>(type));
}

string toString(TransmissionStrategy strategy)
{
  switch (strategy) {
  case TransmissionStrategy::Broadcast:
    return "broadcast";
  case TransmissionStrategy::RelayAddress:
    return "relay";
  case TransmissionStrategy::ClientAddress:
    return "client";
  case TransmissionStrategy::HardwareAddress:
    return "hardware";
  }
  return "unknown";
}

DHCPOptions DHCPOptions::decode(const string& raw, size_t pos)
{
  DHCPOptions ret;
  while (pos < raw.size()) {
    auto code = static_cast<uint8_t>(raw.at(pos));
    if (code == DHCP_OPTION_PAD) {
      pos++;
      continue;
    }
    if (code == DHCP_OPTION_END) {
      break;
    }
    if (pos + 1 >= raw.size()) {
      break;
    }
    auto len = static_cast<uint8_t>(raw.at(pos + 1));
    if (pos + 2 + len > raw.size()) {
      break;
    }
    // emplace does not overwrite, so the first one wins
    ret.d_options.emplace(code, raw.substr(pos + 2, len));
    pos += 2 + len;
  }
  return ret;
}

string DHCPOptions::encode(bool terminate) const
{
  string ret;
  for (const auto& option : d_options) {
    if (option.second.size() > 255) {
      throw DHCPEncodeError("value of option " + std::to_string(option.first) + " is " + std::to_string(option.second.size()) + " bytes long, the maximum is 255");
    }
    ret.push_back(static_cast<char>(option.first));
    ret.push_back(static_cast<char>(option.second.size()));
    ret.append(option.second);
  }
  if (terminate) {
    ret.push_back(static_cast<char>(DHCP_OPTION_END));
  }
  return ret;
}

void DHCPOptions::set(uint8_t code, const string& value)
{
  if (code == DHCP_OPTION_PAD || code == DHCP_OPTION_END) {
    throw DHCPEncodeError("option " + std::to_string(code) + " can't carry a value");
  }
  d_options[code] = value;
}

void DHCPOptions::setUint8(uint8_t code, uint8_t value)
{
  set(code, string(1, static_cast<char>(value)));
}

void DHCPOptions::setUint16(uint8_t code, uint16_t value)
{
  string raw;
  raw.push_back(static_cast<char>(value >> 8));
  raw.push_back(static_cast<char>(value & 0xff));
  set(code, raw);
}

void DHCPOptions::setIP(uint8_t code, const ComboAddress& addr)
{
  if (!addr.isIPv4()) {
    throw DHCPEncodeError("option " + std::to_string(code) + " needs an IPv4 address, got " + addr.toString());
  }
  set(code, addr.toByteString());
}

const string& DHCPOptions::getBytes(uint8_t code) const
{
  auto iter = d_options.find(code);
  if (iter == d_options.end()) {
    throw DHCPOptionError("option " + std::to_string(code) + " is not present");
  }
  return iter->second;
}

static const string& getSized(const DHCPOptions& options, uint8_t code, size_t expected)
{
  const auto& raw = options.getBytes(code);
  if (raw.size() != expected) {
    throw DHCPOptionError("option " + std::to_string(code) + " has length " + std::to_string(raw.size()) + ", expected " + std::to_string(expected));
  }
  return raw;
}

uint8_t DHCPOptions::getUint8(uint8_t code) const
{
  return static_cast<uint8_t>(getSized(*this, code, 1).at(0));
}

uint16_t DHCPOptions::getUint16(uint8_t code) const
{
  const auto& raw = getSized(*this, code, 2);
  return static_cast<uint16_t>((static_cast<uint8_t>(raw.at(0)) << 8) | static_cast<uint8_t>(raw.at(1)));
}

string DHCPOptions::getString(uint8_t code) const
{
  const auto& raw = getBytes(code);
  // some clients NUL terminate their strings
  auto pos = raw.find('\0');
  if (pos != string::npos) {
    return raw.substr(0, pos);
  }
  return raw;
}

ComboAddress DHCPOptions::getIP(uint8_t code) const
{
  const auto& raw = getSized(*this, code, 4);
  return ComboAddress::fromIPv4Bytes(reinterpret_cast<const uint8_t*>(raw.data()));
}

static uint16_t get16(const string& raw, size_t pos)
{
  return static_cast<uint16_t>((static_cast<uint8_t>(raw.at(pos)) << 8) | static_cast<uint8_t>(raw.at(pos + 1)));
}

static void put16(string& raw, size_t pos, uint16_t val)
{
  raw.at(pos) = static_cast<char>(val >> 8);
  raw.at(pos + 1) = static_cast<char>(val & 0xff);
}

static ComboAddress getAddress(const string& raw, size_t pos)
{
  return ComboAddress::fromIPv4Bytes(reinterpret_cast<const uint8_t*>(raw.data() + pos));
}

static void putAddress(string& raw, size_t pos, const ComboAddress& addr, const char* field)
{
  if (!addr.isIPv4()) {
    throw DHCPEncodeError(string(field) + " is not an IPv4 address: " + addr.toString());
  }
  raw.replace(pos, 4, addr.toByteString());
}

// a NUL padded, possibly NUL terminated, string field
static string getField(const string& raw, size_t pos, size_t len)
{
  string ret = raw.substr(pos, len);
  auto end = ret.find('\0');
  if (end != string::npos) {
    ret.resize(end);
  }
  return ret;
}

DHCPPacket DHCPPacket::decode(const string& raw)
{
  if (raw.size() < BOOTP_HEADER_SIZE + sizeof(vendcookie)) {
    throw DHCPDecodeError("packet too short, " + std::to_string(raw.size()) + " bytes");
  }
  if (memcmp(raw.data() + BOOTP_HEADER_SIZE, vendcookie, sizeof(vendcookie)) != 0) {
    throw DHCPDecodeError("packet does not carry the DHCP magic cookie");
  }

  DHCPPacket ret;
  ret.htype = static_cast<uint8_t>(raw.at(1));
  auto hlen = static_cast<uint8_t>(raw.at(2));
  if (hlen > BOOTP_CHADDR_SIZE) {
    throw DHCPDecodeError("hardware address length " + std::to_string(hlen) + " is larger than " + std::to_string(BOOTP_CHADDR_SIZE));
  }
  ret.hops = static_cast<uint8_t>(raw.at(3));
  ret.xid = (static_cast<uint32_t>(get16(raw, 4)) << 16) | get16(raw, 6);
  ret.secs = get16(raw, 8);
  ret.broadcast = (get16(raw, 10) & 0x8000) != 0;
  ret.ciaddr = getAddress(raw, 12);
  ret.yiaddr = getAddress(raw, 16);
  ret.siaddr = getAddress(raw, 20);
  ret.giaddr = getAddress(raw, 24);
  ret.chaddr = MACAddress(raw.substr(28, hlen));
  ret.sname = getField(raw, 44, BOOTP_SNAME_SIZE);
  ret.file = getField(raw, 108, BOOTP_FILE_SIZE);

  ret.options = DHCPOptions::decode(raw, BOOTP_HEADER_SIZE + sizeof(vendcookie));
  uint8_t type = 0;
  try {
    type = ret.options.getUint8(DHCP_OPTION_TYPE);
  }
  catch (const DHCPOptionError& e) {
    throw DHCPDecodeError(string("no usable DHCP message type: ") + e.what());
  }
  if (type < static_cast<uint8_t>(DHCPMessageType::Discover) || type > static_cast<uint8_t>(DHCPMessageType::Inform)) {
    throw DHCPDecodeError("unknown DHCP message type " + std::to_string(type));
  }
  ret.type = static_cast<DHCPMessageType>(type);
  ret.options.erase(DHCP_OPTION_TYPE);

  return ret;
}

string DHCPPacket::encode() const
{
  if (chaddr.size() > BOOTP_CHADDR_SIZE) {
    throw DHCPEncodeError("hardware address is " + std::to_string(chaddr.size()) + " bytes long, the maximum is " + std::to_string(BOOTP_CHADDR_SIZE));
  }
  if (sname.size() > BOOTP_SNAME_SIZE) {
    throw DHCPEncodeError("server name is " + std::to_string(sname.size()) + " bytes long, the maximum is " + std::to_string(BOOTP_SNAME_SIZE));
  }
  if (file.size() > BOOTP_FILE_SIZE) {
    throw DHCPEncodeError("boot file name is " + std::to_string(file.size()) + " bytes long, the maximum is " + std::to_string(BOOTP_FILE_SIZE));
  }

  string raw(BOOTP_HEADER_SIZE, '\0');
  switch (type) {
  case DHCPMessageType::Offer:
  case DHCPMessageType::Ack:
  case DHCPMessageType::Nak:
    raw.at(0) = static_cast<char>(BOOTP_OPCODE_REPLY);
    break;
  default:
    raw.at(0) = static_cast<char>(BOOTP_OPCODE_REQUEST);
  }
  raw.at(1) = static_cast<char>(htype);
  raw.at(2) = static_cast<char>(chaddr.size());
  raw.at(3) = static_cast<char>(hops);
  put16(raw, 4, static_cast<uint16_t>(xid >> 16));
  put16(raw, 6, static_cast<uint16_t>(xid & 0xffff));
  put16(raw, 8, secs);
  put16(raw, 10, broadcast ? 0x8000 : 0);
  putAddress(raw, 12, ciaddr, "client address");
  putAddress(raw, 16, yiaddr, "your address");
  putAddress(raw, 20, siaddr, "server address");
  putAddress(raw, 24, giaddr, "relay address");
  raw.replace(28, chaddr.size(), chaddr.getRaw());
  raw.replace(44, sname.size(), sname);
  raw.replace(108, file.size(), file);

  raw.append(reinterpret_cast<const char*>(vendcookie), sizeof(vendcookie));
  raw.push_back(static_cast<char>(DHCP_OPTION_TYPE));
  raw.push_back(1);
  raw.push_back(static_cast<char>(type));

  if (options.has(DHCP_OPTION_TYPE)) {
    throw DHCPEncodeError("the message type is set through the packet, not as an option");
  }
  raw.append(options.encode(true));
  return raw;
}

TransmissionStrategy DHCPPacket::getTransmissionStrategy() const
{
  if (!giaddr.isUnspecified()) {
    return TransmissionStrategy::RelayAddress;
  }
  if (type == DHCPMessageType::Nak) {
    return TransmissionStrategy::Broadcast;
  }
  if (!ciaddr.isUnspecified()) {
    return TransmissionStrategy::ClientAddress;
  }
  if (broadcast || yiaddr.isUnspecified()) {
    return TransmissionStrategy::Broadcast;
  }
  return TransmissionStrategy::HardwareAddress;
}

string DHCPPacket::toDebugString() const
{
  ostringstream str;
  str << toString(type) << " xid " << boost::format("%08x") % xid << (broadcast ? " broadcast" : "") << endl;
  str << "  chaddr " << chaddr.toString() << " htype " << static_cast<unsigned int>(htype) << " hops " << static_cast<unsigned int>(hops) << " secs " << secs << endl;
  str << "  ciaddr " << ciaddr.toString() << " yiaddr " << yiaddr.toString() << " siaddr " << siaddr.toString() << " giaddr " << giaddr.toString() << endl;
  if (!sname.empty()) {
    str << "  sname \"" << sname << "\"" << endl;
  }
  if (!file.empty()) {
    str << "  file \"" << file << "\"" << endl;
  }
  for (const auto& option : options) {
    str << "  option " << static_cast<unsigned int>(option.first) << ":";
    for (const auto chr : option.second) {
      str << boost::format(" %02x") % static_cast<unsigned int>(static_cast<uint8_t>(chr));
    }
    str << endl;
  }
  return str.str();
}
