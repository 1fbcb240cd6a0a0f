#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#ifdef HAVE_CONFIG_H
#include "config.h"
#endif
#include <boost/test/unit_test.hpp>

#include "dhcp4packet.hh"

// a DHCPDISCOVER the way a BIOS PXE ROM sends it, options appended by the caller
static string makeRawDiscover(const string& options)
{
  string raw(BOOTP_HEADER_SIZE, '\0');
  raw.at(0) = 1; // BOOTREQUEST
  raw.at(1) = 1; // ethernet
  raw.at(2) = 6;
  raw.replace(4, 4, string("\xde\xad\xbe\xef", 4)); // xid
  raw.replace(10, 2, string("\x80\x00", 2)); // broadcast
  raw.replace(28, 6, string("\x00\x11\x22\x33\x44\x55", 6));
  raw.append(string("\x63\x82\x53\x63", 4));
  raw.append(string("\x35\x01\x01", 3)); // DHCPDISCOVER
  raw.append(options);
  raw.push_back('\xff');
  return raw;
}

BOOST_AUTO_TEST_SUITE(test_dhcp4packet_cc)

BOOST_AUTO_TEST_CASE(test_decode)
{
  // option 93 = 7, a pad, option 60
  auto packet = DHCPPacket::decode(makeRawDiscover(string("\x5d\x02\x00\x07\x00\x3c\x09PXEClient", 16)));

  BOOST_CHECK(packet.type == DHCPMessageType::Discover);
  BOOST_CHECK_EQUAL(packet.xid, 0xdeadbeefU);
  BOOST_CHECK(packet.broadcast);
  BOOST_CHECK_EQUAL(packet.htype, 1);
  BOOST_CHECK_EQUAL(packet.chaddr.toString(), "00:11:22:33:44:55");
  BOOST_CHECK(packet.ciaddr.isUnspecified());
  BOOST_CHECK(packet.giaddr.isUnspecified());
  BOOST_CHECK_EQUAL(packet.sname, "");
  BOOST_CHECK_EQUAL(packet.file, "");

  BOOST_CHECK_EQUAL(packet.options.size(), 2U);
  BOOST_CHECK(!packet.options.has(DHCP_OPTION_TYPE));
  BOOST_CHECK_EQUAL(packet.options.getUint16(DHCP_OPTION_CLIENT_ARCH), 7);
  BOOST_CHECK_EQUAL(packet.options.getString(DHCP_OPTION_CLASS_IDENTIFIER), "PXEClient");
}

BOOST_AUTO_TEST_CASE(test_decode_rejects)
{
  // too short to hold the header and cookie
  BOOST_CHECK_THROW(DHCPPacket::decode(string(239, '\0')), DHCPDecodeError);

  auto raw = makeRawDiscover("");
  auto noCookie = raw;
  noCookie.at(BOOTP_HEADER_SIZE) = 0;
  BOOST_CHECK_THROW(DHCPPacket::decode(noCookie), DHCPDecodeError);

  auto longHardware = raw;
  longHardware.at(2) = 17;
  BOOST_CHECK_THROW(DHCPPacket::decode(longHardware), DHCPDecodeError);

  // header and cookie, but no message type
  string noType(raw, 0, BOOTP_HEADER_SIZE + 4);
  noType.push_back('\xff');
  BOOST_CHECK_THROW(DHCPPacket::decode(noType), DHCPDecodeError);

  auto badType = raw;
  badType.at(BOOTP_HEADER_SIZE + 6) = 9;
  BOOST_CHECK_THROW(DHCPPacket::decode(badType), DHCPDecodeError);
}

BOOST_AUTO_TEST_CASE(test_decode_options_edges)
{
  // duplicates: the first one counts
  auto packet = DHCPPacket::decode(makeRawDiscover(string("\x4d\x04iPXE\x4d\x09pixiecore", 17)));
  BOOST_CHECK_EQUAL(packet.options.getString(DHCP_OPTION_USER_CLASS), "iPXE");

  // a value running past the end stops parsing, what came before stays
  string raw = makeRawDiscover(string("\x5d\x02\x00\x00", 4));
  raw.pop_back();
  raw.append(string("\x61\x11\x00\x01", 4));
  packet = DHCPPacket::decode(raw);
  BOOST_CHECK(packet.options.has(DHCP_OPTION_CLIENT_ARCH));
  BOOST_CHECK(!packet.options.has(DHCP_OPTION_CLIENT_GUID));

  // no end option at all is fine too
  raw = makeRawDiscover(string("\x5d\x02\x00\x06", 4));
  raw.pop_back();
  packet = DHCPPacket::decode(raw);
  BOOST_CHECK_EQUAL(packet.options.getUint16(DHCP_OPTION_CLIENT_ARCH), 6);

  // unknown options are kept as they are
  packet = DHCPPacket::decode(makeRawDiscover(string("\xe0\x03\x01\x02\x03", 5)));
  BOOST_CHECK(packet.options.getBytes(224) == string("\x01\x02\x03", 3));
}

BOOST_AUTO_TEST_CASE(test_decode_encode)
{
  auto fillHeader = [](string& raw) {
    raw.at(3) = 2; // hops
    raw.replace(8, 2, string("\x00\x04", 2)); // secs
    raw.replace(24, 4, string("\x0a\x00\x01\x01", 4)); // giaddr
    raw.replace(44, 8, "pxe-host");
    raw.replace(108, 12, "undionly.kpx");
  };

  // options in code order, no padding: what we decoded encodes to the same bytes
  auto canonical = makeRawDiscover(string("\x3c\x09PXEClient\x5d\x02\x00\x07\xe0\x02\xca\xfe", 19));
  fillHeader(canonical);
  auto packet = DHCPPacket::decode(canonical);
  BOOST_CHECK_EQUAL(packet.hops, 2);
  BOOST_CHECK_EQUAL(packet.secs, 4);
  BOOST_CHECK_EQUAL(packet.sname, "pxe-host");
  BOOST_CHECK_EQUAL(packet.file, "undionly.kpx");
  BOOST_CHECK(packet.encode() == canonical);

  // pads go, a repeated option keeps its first value, the rest survives
  auto messy = makeRawDiscover(string("\x00\x00\x5d\x02\x00\x07\x3c\x09PXEClient\x00\x5d\x02\x00\x0b\xe0\x02\xca\xfe", 26));
  fillHeader(messy);
  packet = DHCPPacket::decode(messy);
  BOOST_CHECK_EQUAL(packet.options.size(), 3U);
  BOOST_CHECK_EQUAL(packet.options.getUint16(DHCP_OPTION_CLIENT_ARCH), 7);
  BOOST_CHECK(packet.options.getBytes(224) == string("\xca\xfe", 2));

  auto reencoded = packet.encode();
  BOOST_CHECK(reencoded == canonical);
  auto again = DHCPPacket::decode(reencoded);
  BOOST_CHECK(again.type == packet.type);
  BOOST_CHECK_EQUAL(again.xid, packet.xid);
  BOOST_CHECK_EQUAL(again.broadcast, packet.broadcast);
  BOOST_CHECK(again.giaddr == packet.giaddr);
  BOOST_CHECK(again.chaddr == packet.chaddr);
  BOOST_CHECK_EQUAL(again.sname, packet.sname);
  BOOST_CHECK_EQUAL(again.file, packet.file);
  BOOST_CHECK(again.options == packet.options);
}

BOOST_AUTO_TEST_CASE(test_typed_accessors)
{
  DHCPOptions options;
  options.setUint8(1, 42);
  options.setUint16(DHCP_OPTION_CLIENT_ARCH, 0x0b);
  options.setIP(DHCP_OPTION_SERVER, ComboAddress("10.0.0.1"));
  options.set(DHCP_OPTION_USER_CLASS, string("iPXE\0", 5));

  BOOST_CHECK_EQUAL(options.getUint8(1), 42);
  BOOST_CHECK_EQUAL(options.getUint16(DHCP_OPTION_CLIENT_ARCH), 11);
  BOOST_CHECK(options.getBytes(DHCP_OPTION_CLIENT_ARCH) == string("\x00\x0b", 2));
  BOOST_CHECK_EQUAL(options.getIP(DHCP_OPTION_SERVER).toString(), "10.0.0.1");
  BOOST_CHECK_EQUAL(options.getString(DHCP_OPTION_USER_CLASS), "iPXE");

  BOOST_CHECK_THROW(options.getUint8(DHCP_OPTION_CLIENT_ARCH), DHCPOptionError);
  BOOST_CHECK_THROW(options.getUint16(1), DHCPOptionError);
  BOOST_CHECK_THROW(options.getIP(DHCP_OPTION_CLIENT_ARCH), DHCPOptionError);
  BOOST_CHECK_THROW(options.getBytes(DHCP_OPTION_CLIENT_GUID), DHCPOptionError);
  BOOST_CHECK_THROW(options.set(DHCP_OPTION_END, "x"), DHCPEncodeError);
}

BOOST_AUTO_TEST_CASE(test_options_encode)
{
  DHCPOptions pxe;
  pxe.setUint8(PXE_SUBOPTION_DISCOVERY_CONTROL, PXE_DISCOVERY_BYPASS);
  BOOST_CHECK(pxe.encode(true) == string("\x06\x01\x08\xff", 4));
  BOOST_CHECK(pxe.encode(false) == string("\x06\x01\x08", 3));

  // code order, whatever the insertion order was
  DHCPOptions options;
  options.set(97, "b");
  options.set(60, "a");
  BOOST_CHECK(options.encode(false) == string("\x3c\x01" "a" "\x61\x01" "b", 6));

  options.set(60, string(256, 'x'));
  BOOST_CHECK_THROW(options.encode(true), DHCPEncodeError);
  options.set(60, string(255, 'x'));
  BOOST_CHECK_EQUAL(options.encode(true).size(), 2U + 255U + 3U + 1U);
}

BOOST_AUTO_TEST_CASE(test_encode)
{
  DHCPPacket offer;
  offer.type = DHCPMessageType::Offer;
  offer.xid = 0x01020304;
  offer.broadcast = true;
  offer.chaddr = MACAddress::parse("de:ad:be:ef:00:01");
  offer.siaddr = ComboAddress("10.0.0.1");
  offer.giaddr = ComboAddress("10.0.1.1");
  offer.sname = "10.0.0.1";
  offer.file = "de:ad:be:ef:00:01/0";
  offer.options.setIP(DHCP_OPTION_SERVER, offer.siaddr);

  auto raw = offer.encode();
  BOOST_REQUIRE_EQUAL(raw.size(), BOOTP_HEADER_SIZE + 4U + 3U + 6U + 1U);
  BOOST_CHECK_EQUAL(raw.at(0), BOOTP_OPCODE_REPLY);
  BOOST_CHECK_EQUAL(raw.at(2), 6);
  BOOST_CHECK(raw.substr(4, 4) == string("\x01\x02\x03\x04", 4));
  BOOST_CHECK(raw.substr(10, 2) == string("\x80\x00", 2));
  BOOST_CHECK(raw.substr(20, 4) == string("\x0a\x00\x00\x01", 4));
  BOOST_CHECK(raw.substr(24, 4) == string("\x0a\x00\x01\x01", 4));
  BOOST_CHECK(raw.substr(28, 6) == string("\xde\xad\xbe\xef\x00\x01", 6));
  BOOST_CHECK_EQUAL(raw.substr(44, 9), string("10.0.0.1") + '\0');
  BOOST_CHECK_EQUAL(raw.substr(108, 19), "de:ad:be:ef:00:01/0");
  BOOST_CHECK(raw.substr(BOOTP_HEADER_SIZE) == string("\x63\x82\x53\x63\x35\x01\x02\x36\x04\x0a\x00\x00\x01\xff", 14));

  auto decoded = DHCPPacket::decode(raw);
  BOOST_CHECK(decoded.type == DHCPMessageType::Offer);
  BOOST_CHECK_EQUAL(decoded.xid, offer.xid);
  BOOST_CHECK_EQUAL(decoded.sname, offer.sname);
  BOOST_CHECK_EQUAL(decoded.file, offer.file);
  BOOST_CHECK(decoded.chaddr == offer.chaddr);
  BOOST_CHECK(decoded.giaddr == offer.giaddr);
  BOOST_CHECK(decoded.options == offer.options);

  DHCPPacket request;
  request.type = DHCPMessageType::Request;
  BOOST_CHECK_EQUAL(request.encode().at(0), BOOTP_OPCODE_REQUEST);
}

BOOST_AUTO_TEST_CASE(test_encode_bounds)
{
  DHCPPacket packet;
  packet.sname = string(64, 's');
  packet.file = string(128, 'f');
  BOOST_CHECK_NO_THROW(packet.encode());

  packet.sname = string(65, 's');
  BOOST_CHECK_THROW(packet.encode(), DHCPEncodeError);
  packet.sname.clear();

  packet.file = string(129, 'f');
  BOOST_CHECK_THROW(packet.encode(), DHCPEncodeError);
  packet.file.clear();

  packet.chaddr = MACAddress(string(17, '\x01'));
  BOOST_CHECK_THROW(packet.encode(), DHCPEncodeError);
  packet.chaddr = MACAddress(string(16, '\x01'));
  BOOST_CHECK_NO_THROW(packet.encode());

  packet.options.set(DHCP_OPTION_USER_CLASS, string(300, 'u'));
  BOOST_CHECK_THROW(packet.encode(), DHCPEncodeError);
}

BOOST_AUTO_TEST_CASE(test_transmission_strategy)
{
  DHCPPacket packet;
  packet.type = DHCPMessageType::Offer;
  // nothing set: no address to send to
  BOOST_CHECK(packet.getTransmissionStrategy() == TransmissionStrategy::Broadcast);

  packet.yiaddr = ComboAddress("10.0.0.50");
  BOOST_CHECK(packet.getTransmissionStrategy() == TransmissionStrategy::HardwareAddress);

  packet.broadcast = true;
  BOOST_CHECK(packet.getTransmissionStrategy() == TransmissionStrategy::Broadcast);

  packet.ciaddr = ComboAddress("10.0.0.51");
  BOOST_CHECK(packet.getTransmissionStrategy() == TransmissionStrategy::ClientAddress);

  packet.type = DHCPMessageType::Nak;
  BOOST_CHECK(packet.getTransmissionStrategy() == TransmissionStrategy::Broadcast);

  // a relay trumps everything
  packet.giaddr = ComboAddress("10.0.1.1");
  BOOST_CHECK(packet.getTransmissionStrategy() == TransmissionStrategy::RelayAddress);
}

BOOST_AUTO_TEST_CASE(test_debug_string)
{
  auto packet = DHCPPacket::decode(makeRawDiscover(string("\x5d\x02\x00\x07", 4)));
  auto str = packet.toDebugString();
  BOOST_CHECK(str.find("DHCPDISCOVER xid deadbeef broadcast") == 0);
  BOOST_CHECK(str.find("00:11:22:33:44:55") != string::npos);
  BOOST_CHECK(str.find("option 93: 00 07") != string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
