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
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

#include "iputils.hh"
#include "macaddress.hh"
#include "namespaces.hh"

// RFC 2131, 4.1
static const uint16_t BOOTP_SERVER_PORT = 67;
static const uint16_t BOOTP_CLIENT_PORT = 68;
// PXE 2.1, the boot server ("BINL") port
static const uint16_t PXE_SERVER_PORT = 4011;

static const uint8_t BOOTP_OPCODE_REQUEST = 1;
static const uint8_t BOOTP_OPCODE_REPLY = 2;

// op, htype, hlen, hops, xid, secs, flags, 4 addresses, chaddr, sname, file
static const size_t BOOTP_HEADER_SIZE = 236;
static const size_t BOOTP_SNAME_SIZE = 64;
static const size_t BOOTP_FILE_SIZE = 128;
static const size_t BOOTP_CHADDR_SIZE = 16;

enum DHCPOptionCode : uint8_t
{
  DHCP_OPTION_PAD = 0,
  // RFC 2132, 8.4
  DHCP_OPTION_VENDOR_SPECIFIC = 43,
  // RFC 2132, 9.6
  DHCP_OPTION_TYPE = 53,
  // RFC 2132, 9.7
  DHCP_OPTION_SERVER = 54,
  // RFC 2132, 9.13
  DHCP_OPTION_CLASS_IDENTIFIER = 60,
  // RFC 3004
  DHCP_OPTION_USER_CLASS = 77,
  // RFC 4578, 2.1
  DHCP_OPTION_CLIENT_ARCH = 93,
  // RFC 4578, 2.2
  DHCP_OPTION_CLIENT_NDI = 94,
  // RFC 4578, 2.3
  DHCP_OPTION_CLIENT_GUID = 97,
  DHCP_OPTION_END = 255
};

// PXE 2.1, sub-options of the vendor specific option
static const uint8_t PXE_SUBOPTION_DISCOVERY_CONTROL = 6;
// bit 3: download the boot file named in the packet, skip boot server discovery
static const uint8_t PXE_DISCOVERY_BYPASS = 0x08;

enum class DHCPMessageType : uint8_t
{
  Discover = 1,
  Offer = 2,
  Request = 3,
  Decline = 4,
  Ack = 5,
  Nak = 6,
  Release = 7,
  Inform = 8
};

string toString(DHCPMessageType type);

//! How a reply has to be put on the wire, RFC 2131 4.1
enum class TransmissionStrategy
{
  Broadcast,
  RelayAddress,
  ClientAddress,
  HardwareAddress
};

string toString(TransmissionStrategy strategy);

class DHCPDecodeError : public runtime_error
{
public:
  DHCPDecodeError(const string& str) :
    runtime_error(str)
  {}
};

class DHCPEncodeError : public runtime_error
{
public:
  DHCPEncodeError(const string& str) :
    runtime_error(str)
  {}
};

//! An option is missing, or its value does not have the expected shape
class DHCPOptionError : public runtime_error
{
public:
  DHCPOptionError(const string& str) :
    runtime_error(str)
  {}
};

/** The options of a DHCP packet, code -> raw value. The wire layer does not
    interpret values, the typed getters do that when asked. Pad and end are
    never stored. */
class DHCPOptions
{
public:
  using map_t = std::map<uint8_t, string>;

  /** Parses a TLV stream starting at pos, until an end option or the end
      of the input. A value running past the input ends parsing. When a code
      appears more than once, the first occurrence is kept. */
  static DHCPOptions decode(const string& raw, size_t pos = 0);
  /** Serializes in code order, optionally followed by an end option.
      Throws DHCPEncodeError if a value is longer than 255 bytes. */
  [[nodiscard]] string encode(bool terminate = true) const;

  [[nodiscard]] bool has(uint8_t code) const
  {
    return d_options.count(code) != 0;
  }
  void set(uint8_t code, const string& value);
  void setUint8(uint8_t code, uint8_t value);
  void setUint16(uint8_t code, uint16_t value);
  void setIP(uint8_t code, const ComboAddress& addr);
  void erase(uint8_t code)
  {
    d_options.erase(code);
  }

  // these throw DHCPOptionError when the option is absent or malformed
  [[nodiscard]] uint8_t getUint8(uint8_t code) const;
  [[nodiscard]] uint16_t getUint16(uint8_t code) const;
  [[nodiscard]] string getString(uint8_t code) const;
  [[nodiscard]] ComboAddress getIP(uint8_t code) const;
  [[nodiscard]] const string& getBytes(uint8_t code) const;

  [[nodiscard]] size_t size() const
  {
    return d_options.size();
  }
  [[nodiscard]] bool empty() const
  {
    return d_options.empty();
  }
  map_t::const_iterator begin() const
  {
    return d_options.begin();
  }
  map_t::const_iterator end() const
  {
    return d_options.end();
  }
  bool operator==(const DHCPOptions& rhs) const
  {
    return d_options == rhs.d_options;
  }

private:
  map_t d_options;
};

/** A BOOTP/DHCPv4 packet. The message type lives in 'type', never in the
    options. Unset addresses are 0.0.0.0. */
struct DHCPPacket
{
  //! Throws DHCPDecodeError
  static DHCPPacket decode(const string& raw);
  //! Throws DHCPEncodeError
  [[nodiscard]] string encode() const;

  [[nodiscard]] TransmissionStrategy getTransmissionStrategy() const;
  [[nodiscard]] string toDebugString() const;

  DHCPMessageType type{DHCPMessageType::Discover};
  uint32_t xid{0};
  bool broadcast{false};
  uint8_t htype{1}; // ethernet
  uint8_t hops{0};
  uint16_t secs{0};
  ComboAddress ciaddr;
  ComboAddress yiaddr;
  ComboAddress siaddr;
  ComboAddress giaddr;
  MACAddress chaddr;
  string sname;
  string file;
  DHCPOptions options;
};
